// include/landforge/terrain/DeterministicRNG.hpp
#pragma once
#include <bit>
#include <cstdint>

namespace landforge::terrain {

// -----------------------------------------------------------------------------
// PCG32 (Melissa O'Neill), used wherever terrain tools need reproducible
// randomness: droplet spawns, scatter jitter, instance rotation/scale.
struct PCG32 {
    std::uint64_t state{ UINT64_C(0x853c49e6748fea9b) };
    std::uint64_t inc  { UINT64_C(0xda3e39cb94b95bdb) }; // always odd

    PCG32() = default;
    explicit PCG32(std::uint64_t initstate,
                   std::uint64_t initseq = UINT64_C(0xda3e39cb94b95bdb)) noexcept {
        seed(initstate, initseq);
    }

    void seed(std::uint64_t initstate,
              std::uint64_t initseq = UINT64_C(0xda3e39cb94b95bdb)) noexcept {
        state = 0u;
        inc   = (initseq << 1u) | 1u;
        (void)next();
        state += initstate;
        (void)next();
    }

    [[nodiscard]] std::uint32_t next() noexcept {
        const std::uint64_t old = state;
        state = old * UINT64_C(6364136223846793005) + inc;
        const auto xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
        const auto rot        = static_cast<int>(old >> 59u);
        return std::rotr(xorshifted, rot);
    }

    // [0,1) from the top 24 bits.
    [[nodiscard]] float nextFloat01() noexcept {
        return (next() >> 8) * (1.0f / 16777216.0f);
    }

    // [lo,hi); returns lo when the range is empty.
    [[nodiscard]] float uniform(float lo, float hi) noexcept {
        return lo + (hi - lo) * nextFloat01();
    }
};

// Seed used when a caller did not ask for a reproducible run.
[[nodiscard]] std::uint64_t entropySeed() noexcept;

} // namespace landforge::terrain
