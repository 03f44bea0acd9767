/**
 * jumphash — Jump Consistent Hash
 *
 * From "A Fast, Minimal Memory, Consistent Hash Algorithm"
 * by John Lamping and Eric Veach (2014), https://arxiv.org/abs/1406.2294
 *
 * Properties:
 * - Output in [0, num_buckets)
 * - Growing N to N+1 buckets moves ~1/(N+1) of keys, all into bucket N
 * - O(ln N) expected iterations, no tables, no allocation
 * - Bit-for-bit reproducible: wrapping 64-bit LCG + IEEE-754 double division
 */

#ifndef JUMPHASH_JUMP_HASH_HPP
#define JUMPHASH_JUMP_HASH_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include "lcg64.hpp"
#include "fnv1a.hpp"

namespace jumphash {

namespace detail {

inline void check_num_buckets(int32_t num_buckets) {
    if (num_buckets < 1) {
        throw std::invalid_argument(
            "jumphash: num_buckets must be >= 1, got " + std::to_string(num_buckets));
    }
}

} // namespace detail

/**
 * Map a 64-bit key to one of `num_buckets` buckets
 *
 * @param key Arbitrary 64-bit key (usually already a hash of the identifier)
 * @param num_buckets Bucket count, >= 1
 * @return Bucket index in [0, num_buckets)
 * @throws std::invalid_argument if num_buckets < 1
 */
inline int32_t jump_hash(uint64_t key, int32_t num_buckets) {
    detail::check_num_buckets(num_buckets);

    Lcg64 stream(key);
    int64_t b = -1;
    int64_t j = 0;

    while (j < num_buckets) {
        b = j;
        uint64_t r = stream.next();
        j = static_cast<int64_t>(
            (b + 1) * (static_cast<double>(1LL << 31) / static_cast<double>((r >> 33) + 1)));
    }

    return static_cast<int32_t>(b);
}

/**
 * Map a string identifier to one of `num_buckets` buckets
 *
 * The key is fnv1a_64(key).
 */
inline int32_t jump_hash(std::string_view key, int32_t num_buckets) {
    return jump_hash(fnv1a_64(key), num_buckets);
}

} // namespace jumphash

#endif // JUMPHASH_JUMP_HASH_HPP
