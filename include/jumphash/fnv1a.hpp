/**
 * jumphash — Jump Consistent Hash
 *
 * FNV-1a 64-bit
 *
 * Turns string identifiers into 64-bit jump hash keys. Byte-oriented and
 * endian independent, so every language binding derives the same key.
 */

#ifndef JUMPHASH_FNV1A_HPP
#define JUMPHASH_FNV1A_HPP

#include <cstdint>
#include <string_view>

namespace jumphash {

inline constexpr uint64_t fnv1a_64_offset_basis = 0xcbf29ce484222325ULL;
inline constexpr uint64_t fnv1a_64_prime = 0x100000001b3ULL;

/**
 * FNV-1a over the raw bytes of `data`
 * @return 64-bit digest; the offset basis for an empty string
 */
constexpr uint64_t fnv1a_64(std::string_view data) noexcept {
    uint64_t hash = fnv1a_64_offset_basis;
    for (char c : data) {
        hash ^= static_cast<uint8_t>(c);
        hash *= fnv1a_64_prime;
    }
    return hash;
}

} // namespace jumphash

#endif // JUMPHASH_FNV1A_HPP
