/**
 * jumphash — Jump Consistent Hash
 *
 * 64-bit Linear Congruential Generator
 *
 * The pseudo-random stream embedded in jump hash. Same multiplier as the
 * 64-bit LCG listed in the paper by Lamping and Veach (2014).
 *
 * Properties:
 * - State: 64 bits (8 bytes)
 * - Output: 64 bits (the new state)
 * - Arithmetic wraps modulo 2^64
 */

#ifndef JUMPHASH_LCG64_HPP
#define JUMPHASH_LCG64_HPP

#include <cstdint>

namespace jumphash {

/**
 * Lcg64 PRNG class
 *
 * state = state * multiplier + increment (mod 2^64)
 */
class Lcg64 {
private:
    uint64_t state_;

public:
    static constexpr uint64_t multiplier = 2862933555777941757ULL;
    static constexpr uint64_t increment = 1ULL;

    /**
     * Construct with initial seed
     * @param seed Initial state value
     */
    explicit constexpr Lcg64(uint64_t seed) noexcept : state_(seed) {}

    /**
     * Generate next random value (advances state)
     * @return The new state, used directly as the sample
     */
    constexpr uint64_t next() noexcept {
        state_ = step(state_);
        return state_;
    }

    /** Current state, without advancing */
    constexpr uint64_t state() const noexcept { return state_; }

    /**
     * Stateless single step of the recurrence
     *
     * Unsigned overflow is the modulo 2^64 reduction.
     */
    static constexpr uint64_t step(uint64_t state) noexcept {
        return state * multiplier + increment;
    }
};

} // namespace jumphash

#endif // JUMPHASH_LCG64_HPP
