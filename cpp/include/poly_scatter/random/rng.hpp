#pragma once

#include <cstddef>
#include <cstdint>

namespace poly_scatter {

// PCG32 random number generator (permuted congruential generator).
// Same seed, same stream: a scene is reproducible from its seed.
class RNG {
public:
    RNG() : state_(0x853c49e6748fea9bULL), inc_(0xda3e39cb94b95bdbULL) {}
    explicit RNG(uint64_t seed) : state_(0), inc_((seed << 1u) | 1u) {
        (void)next();
        state_ += seed;
        (void)next();
    }

    // Next 32 random bits
    [[nodiscard]] uint64_t next() {
        uint64_t oldstate = state_;
        state_ = oldstate * 6364136223846793005ULL + inc_;
        uint32_t xorshifted = static_cast<uint32_t>(((oldstate >> 18u) ^ oldstate) >> 27u);
        uint32_t rot = static_cast<uint32_t>(oldstate >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-rot) & 31));
    }

    // Uniform double in [0, 1) with 53 bits of resolution
    [[nodiscard]] double uniform() {
        const uint64_t hi = next();
        const uint64_t lo = next();
        const uint64_t bits = ((hi << 21u) ^ lo) & ((1ULL << 53u) - 1u);
        return static_cast<double>(bits) * 0x1.0p-53;
    }

    // Uniform double in [min, max)
    [[nodiscard]] double uniform(double min, double max) {
        return min + uniform() * (max - min);
    }

    // Uniform index in [0, n); n must be positive
    [[nodiscard]] size_t index(size_t n) {
        return static_cast<size_t>(next() % static_cast<uint64_t>(n));
    }

private:
    uint64_t state_;
    uint64_t inc_;
};

}  // namespace poly_scatter
