// include/landforge/terrain/SimplexNoise.hpp
#pragma once
#include <array>
#include <cstdint>

namespace landforge::terrain {

// Seeded 2D simplex noise. Output is roughly in [-1, 1] and is a pure function
// of (x, y) for a given seed.
class SimplexNoise {
public:
    explicit SimplexNoise(std::uint64_t seed = 0);

    // Rebuilds the permutation table from scratch.
    void reseed(std::uint64_t seed);

    [[nodiscard]] std::uint64_t seed() const noexcept { return seed_; }

    [[nodiscard]] float noise2D(float x, float y) const noexcept;

private:
    std::uint64_t seed_ = 0;
    std::array<std::uint8_t, 512> perm_{};  // 256 entries, duplicated
};

} // namespace landforge::terrain
