/**
 * jumphash — Jump Consistent Hash
 *
 * Main header that includes all jumphash components and provides
 * convenience classes.
 *
 * Usage:
 *   #include <jumphash/jumphash.hpp>
 */

#ifndef JUMPHASH_JUMPHASH_HPP
#define JUMPHASH_JUMPHASH_HPP

// Version
#define JUMPHASH_VERSION_MAJOR 0
#define JUMPHASH_VERSION_MINOR 1
#define JUMPHASH_VERSION_PATCH 0
#define JUMPHASH_VERSION_STRING "0.1.0"

// Core components
#include "lcg64.hpp"
#include "fnv1a.hpp"
#include "jump_hash.hpp"

#include <vector>

namespace jumphash {

// ============================================================================
// JumpBuckets — fixed bucket set
// ============================================================================

/**
 * Routes keys onto a bucket set of a given size.
 *
 * Holds only the count; every lookup is a fresh jump_hash call, so one
 * instance can be shared read-only across threads.
 */
class JumpBuckets {
private:
    int32_t num_buckets_;

public:
    /**
     * @param num_buckets Bucket count, >= 1
     * @throws std::invalid_argument if num_buckets < 1
     */
    explicit JumpBuckets(int32_t num_buckets)
        : num_buckets_(num_buckets)
    {
        detail::check_num_buckets(num_buckets);
    }

    int32_t bucket(uint64_t key) const { return jump_hash(key, num_buckets_); }
    int32_t bucket(std::string_view key) const { return jump_hash(key, num_buckets_); }
    int32_t operator[](uint64_t key) const { return bucket(key); }

    /** Bucket of every key, in input order */
    std::vector<int32_t> assign(const std::vector<uint64_t>& keys) const {
        std::vector<int32_t> out;
        out.reserve(keys.size());
        for (uint64_t key : keys)
            out.push_back(jump_hash(key, num_buckets_));
        return out;
    }

    /** Change the bucket count; the old count is kept if validation fails */
    void resize(int32_t num_buckets) {
        detail::check_num_buckets(num_buckets);
        num_buckets_ = num_buckets;
    }

    int32_t size() const noexcept { return num_buckets_; }

    // ========================================================================
    // Growth history (for testing/debugging)
    // ========================================================================

    /**
     * Bucket of `key` for every count 1..max_buckets.
     * Element i is jump_hash(key, i + 1).
     */
    static std::vector<int32_t> bucket_sequence(uint64_t key, int32_t max_buckets) {
        detail::check_num_buckets(max_buckets);
        std::vector<int32_t> seq;
        seq.reserve(static_cast<size_t>(max_buckets));
        for (int32_t n = 1; n <= max_buckets; ++n)
            seq.push_back(jump_hash(key, n));
        return seq;
    }
};

} // namespace jumphash

#endif // JUMPHASH_JUMPHASH_HPP
