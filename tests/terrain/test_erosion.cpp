// tests/terrain/test_erosion.cpp

#include <doctest/doctest.h>

#include "landforge/terrain/ErosionSimulator.hpp"
#include "landforge/terrain/HeightmapGenerator.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace lt = landforge::terrain;

namespace {

lt::Heightmap hillyTerrain(int size, std::uint64_t seed)
{
    lt::Heightmap hm(size, size);
    lt::SimplexNoise noise;
    lt::GeneratorParams p;
    p.scale     = 16.0f;
    p.octaves   = 4;
    p.amplitude = 40.0f;
    p.seed      = seed;
    lt::generateHeightmap(hm, lt::GeneratorKind::Fbm, p, noise);
    return hm;
}

double total(const lt::Heightmap& hm)
{
    return std::accumulate(hm.values().begin(), hm.values().end(), 0.0);
}

} // namespace

TEST_CASE("Zero droplets leave the heightmap bit-identical")
{
    lt::Heightmap hm = hillyTerrain(32, 4);
    const std::vector<float> before = hm.values();

    lt::ErosionSettings s;
    s.iterations = 0;
    s.seed = 1;
    const lt::ErosionStats stats = lt::simulateHydraulic(hm, s);

    CHECK(stats.droplets == 0);
    CHECK(hm.values() == before);
}

TEST_CASE("Hydraulic erosion is reproducible for a fixed seed")
{
    lt::Heightmap a = hillyTerrain(48, 8);
    lt::Heightmap b = a;

    lt::ErosionSettings s;
    s.iterations = 400;
    s.seed = 2024;
    lt::simulateHydraulic(a, s);
    lt::simulateHydraulic(b, s);

    CHECK(a.values() == b.values());
}

TEST_CASE("Hydraulic erosion reshapes terrain and keeps exact, finite bounds")
{
    lt::Heightmap hm = hillyTerrain(48, 12);
    const std::vector<float> before = hm.values();

    lt::ErosionSettings s;
    s.iterations = 500;
    s.seed = 99;
    const lt::ErosionStats stats = lt::simulateHydraulic(hm, s);

    CHECK(stats.droplets == 500);
    CHECK(stats.steps > 0);
    CHECK(hm.values() != before);

    for (float v : hm.values()) REQUIRE(std::isfinite(v));
    const auto [lo, hi] = std::minmax_element(hm.values().begin(), hm.values().end());
    CHECK(hm.minHeight() == *lo);
    CHECK(hm.maxHeight() == *hi);
}

TEST_CASE("Droplets on flat ground stop on the degenerate gradient")
{
    lt::Heightmap hm(16, 16, 2.0f);

    lt::ErosionSettings s;
    s.iterations = 25;
    s.seed = 3;
    const lt::ErosionStats stats = lt::simulateHydraulic(hm, s);

    CHECK(stats.droplets == 25);
    // droplets spawned on the border ring exit before sampling a gradient
    CHECK(stats.degenerateStops > 0);
    CHECK(stats.degenerateStops <= 25);
    CHECK(stats.steps == 0);
    for (float v : hm.values()) CHECK(v == 2.0f);
}

TEST_CASE("Grids without an interior are left alone")
{
    lt::Heightmap hm(2, 2, 1.0f);
    hm.at(1, 1) = 5.0f;
    hm.recomputeBounds();

    lt::ErosionSettings s;
    s.iterations = 10;
    s.seed = 1;
    const lt::ErosionStats stats = lt::simulateHydraulic(hm, s);

    CHECK(stats.droplets == 0);
    CHECK(hm.at(1, 1) == 5.0f);
}

TEST_CASE("Thermal pass moves material off a spike and conserves mass")
{
    lt::Heightmap hm(5, 5);
    hm.at(2, 2) = 10.0f;
    const double before = total(hm);

    const int moves = lt::applyThermalErosion(hm, 0.5f, 30.0f);

    const float tanTalus = std::tan(30.0f * 3.14159265358979323846f / 180.0f);
    const float transfer = (10.0f - tanTalus) * 0.5f * 0.5f;

    CHECK(moves == 1);
    CHECK(hm.at(2, 2) == doctest::Approx(10.0f - transfer));
    CHECK(hm.at(1, 2) == doctest::Approx(transfer)); // first steepest neighbour
    CHECK(total(hm) == doctest::Approx(before));
}

TEST_CASE("Thermal pass ignores slopes below the talus angle")
{
    lt::Heightmap hm(8, 8);
    for (int y = 0; y < 8; ++y)
        for (int x = 0; x < 8; ++x)
            hm.at(x, y) = 0.1f * float(x);
    const std::vector<float> before = hm.values();

    CHECK(lt::applyThermalErosion(hm, 1.0f, 30.0f) == 0);
    CHECK(hm.values() == before);
}

TEST_CASE("Thermal erosion runs after the droplets when enabled")
{
    lt::Heightmap hm(9, 9);
    hm.at(4, 4) = 20.0f;
    hm.recomputeBounds();

    lt::ErosionSettings s;
    s.iterations     = 0;
    s.thermalErosion = true;
    s.seed           = 1;
    const lt::ErosionStats stats = lt::simulateHydraulic(hm, s);

    CHECK(stats.thermalMoves >= 1);
    CHECK(hm.at(4, 4) < 20.0f);
    CHECK(hm.maxHeight() == doctest::Approx(hm.at(4, 4)));
}
