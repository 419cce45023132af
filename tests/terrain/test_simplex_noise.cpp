// tests/terrain/test_simplex_noise.cpp

#include <doctest/doctest.h>

#include "landforge/terrain/SimplexNoise.hpp"

#include <cmath>

namespace lt = landforge::terrain;

TEST_CASE("SimplexNoise: same seed, same field")
{
    const lt::SimplexNoise a(1234);
    const lt::SimplexNoise b(1234);

    for (int i = 0; i < 64; ++i) {
        const float x = float(i) * 0.37f - 7.0f;
        const float y = float(i) * 0.91f + 3.0f;
        CHECK(a.noise2D(x, y) == b.noise2D(x, y));
    }
}

TEST_CASE("SimplexNoise: different seeds give different fields")
{
    const lt::SimplexNoise a(1);
    const lt::SimplexNoise b(2);

    int differing = 0;
    for (int i = 0; i < 64; ++i) {
        const float x = float(i) * 0.53f + 0.1f;
        const float y = float(i) * 0.29f + 0.7f;
        if (a.noise2D(x, y) != b.noise2D(x, y)) ++differing;
    }
    CHECK(differing > 0);
}

TEST_CASE("SimplexNoise: reseed rebuilds the permutation table")
{
    lt::SimplexNoise n(5);
    const lt::SimplexNoise fresh(99);
    n.reseed(99);
    CHECK(n.seed() == 99);

    for (int i = 0; i < 32; ++i) {
        const float x = float(i) * 1.3f;
        const float y = float(i) * -0.7f;
        CHECK(n.noise2D(x, y) == fresh.noise2D(x, y));
    }
}

TEST_CASE("SimplexNoise: output stays within [-1, 1] and is finite")
{
    const lt::SimplexNoise n(42);
    float lo = 1.0f, hi = -1.0f;
    for (int y = 0; y < 100; ++y) {
        for (int x = 0; x < 100; ++x) {
            const float v = n.noise2D(float(x) * 0.173f, float(y) * 0.137f);
            REQUIRE(std::isfinite(v));
            lo = std::fmin(lo, v);
            hi = std::fmax(hi, v);
        }
    }
    CHECK(lo >= -1.0f);
    CHECK(hi <= 1.0f);
    CHECK(hi > lo); // not constant
}

TEST_CASE("SimplexNoise: lattice origin contributes nothing")
{
    const lt::SimplexNoise n(7);
    CHECK(n.noise2D(0.0f, 0.0f) == doctest::Approx(0.0f));
}
