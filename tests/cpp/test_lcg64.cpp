/**
 * jumphash C++ Tests — Stream Generator and Key Derivation
 *
 * Pins the LCG recurrence and FNV-1a digests to fixed values, since
 * every jump hash result depends on them bit for bit.
 */

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <jumphash/jumphash.hpp>
#include <cassert>
#include <cstdint>
#include <cstdio>
#include <limits>

// Compile-time use must keep working
static_assert(jumphash::Lcg64::step(0) == 1, "step(0)");
static_assert(jumphash::fnv1a_64("") == 0xcbf29ce484222325ULL, "empty digest");

void test_lcg_known_outputs() {
    jumphash::Lcg64 zero(0);
    assert(zero.next() == 1ULL);
    assert(zero.next() == 2862933555777941758ULL);
    assert(zero.next() == 7520437575244155655ULL);

    jumphash::Lcg64 one(1);
    assert(one.next() == 0x27bb2ee687b0b0feULL);
    assert(one.next() == 0x685df62133ed8b07ULL);
    assert(one.next() == 0x6ccc346de72735ecULL);
    assert(one.state() == 0x6ccc346de72735ecULL);
}

void test_lcg_wraparound() {
    // (2^64 - 1) * A + 1 == 1 - A (mod 2^64)
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    assert(jumphash::Lcg64::step(max) == 15583810517931609860ULL);
    assert(jumphash::Lcg64::step(max) == 1ULL - jumphash::Lcg64::multiplier);
}

void test_lcg_step_matches_next(uint64_t seed) {
    jumphash::Lcg64 gen(seed);
    uint64_t state = seed;
    for (int i = 0; i < 1000; ++i) {
        state = jumphash::Lcg64::step(state);
        assert(gen.next() == state && "step/next diverged");
    }
}

void test_lcg_state_does_not_advance() {
    jumphash::Lcg64 gen(99);
    assert(gen.state() == 99);
    assert(gen.state() == 99);
    gen.next();
    assert(gen.state() == jumphash::Lcg64::step(99));
}

void test_fnv1a_known_digests() {
    assert(jumphash::fnv1a_64("") == 0xcbf29ce484222325ULL);
    assert(jumphash::fnv1a_64("a") == 0xaf63dc4c8601ec8cULL);
    assert(jumphash::fnv1a_64("foobar") == 0x85944171f73967e8ULL);
    assert(jumphash::fnv1a_64("user:42") == 0x6c151ea4dcd221c2ULL);
}

int main() {
    printf("Testing Lcg64...\n");

    test_lcg_known_outputs();
    printf("  known outputs: PASS\n");

    test_lcg_wraparound();
    printf("  wraparound: PASS\n");

    uint64_t seeds[] = {0, 1, 0xdeadbeef, std::numeric_limits<uint64_t>::max()};
    for (uint64_t seed : seeds) {
        test_lcg_step_matches_next(seed);
        printf("  step == next, seed=%llu: PASS\n", static_cast<unsigned long long>(seed));
    }

    test_lcg_state_does_not_advance();
    printf("  state(): PASS\n");

    printf("\nTesting fnv1a_64...\n");
    test_fnv1a_known_digests();
    printf("  known digests: PASS\n");

    printf("\nAll C++ tests passed!\n");
    return 0;
}
