// tests/terrain/test_heightmap_generator.cpp

#include <doctest/doctest.h>

#include "landforge/terrain/HeightmapGenerator.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace lt = landforge::terrain;

namespace {

void checkBoundsExact(const lt::Heightmap& hm)
{
    const auto [lo, hi] = std::minmax_element(hm.values().begin(), hm.values().end());
    CHECK(hm.minHeight() == *lo);
    CHECK(hm.maxHeight() == *hi);
}

lt::GeneratorParams seeded(std::uint64_t seed)
{
    lt::GeneratorParams p;
    p.seed = seed;
    return p;
}

} // namespace

TEST_CASE("Layered noise with a small amplitude stays within [-amplitude, amplitude]")
{
    lt::Heightmap hm(17, 17);
    lt::SimplexNoise noise;
    lt::GeneratorParams p = seeded(11);
    p.scale       = 100.0f;
    p.octaves     = 2;
    p.persistence = 0.3f;
    p.amplitude   = 5.0f;

    lt::generateHeightmap(hm, lt::GeneratorKind::Perlin, p, noise);

    for (float v : hm.values()) {
        CHECK(v >= -5.0f);
        CHECK(v <= 5.0f);
    }
    checkBoundsExact(hm);
}

TEST_CASE("Every generator kind leaves exact bounds and finite samples")
{
    for (auto kind : { lt::GeneratorKind::Perlin, lt::GeneratorKind::Fbm, lt::GeneratorKind::Ridged,
                       lt::GeneratorKind::Voronoi, lt::GeneratorKind::Hydraulic }) {
        const char* name = lt::toString(kind);
        CAPTURE(name);
        lt::Heightmap hm(33, 33);
        lt::SimplexNoise noise;
        lt::GeneratorParams p = seeded(3);
        p.scale = 8.0f;
        if (kind == lt::GeneratorKind::Hydraulic) p.erosionIterations = 50;

        lt::generateHeightmap(hm, kind, p, noise);
        for (float v : hm.values()) REQUIRE(std::isfinite(v));
        checkBoundsExact(hm);
        CHECK(hm.maxHeight() > hm.minHeight());
    }
}

TEST_CASE("A fixed seed reproduces the same heightmap")
{
    lt::Heightmap a(24, 24), b(24, 24);
    lt::SimplexNoise na, nb;
    lt::generateHeightmap(a, lt::GeneratorKind::Fbm, seeded(77), na);
    lt::generateHeightmap(b, lt::GeneratorKind::Fbm, seeded(77), nb);
    CHECK(a.values() == b.values());
    CHECK(na.seed() == 77);
}

TEST_CASE("Zero amplitude yields a flat heightmap at 0")
{
    lt::Heightmap hm(9, 9, 3.0f);
    lt::SimplexNoise noise;
    lt::GeneratorParams p = seeded(1);
    p.amplitude = 0.0f;

    lt::generateHeightmap(hm, lt::GeneratorKind::Ridged, p, noise);
    for (float v : hm.values()) CHECK(v == 0.0f);
    CHECK(hm.minHeight() == 0.0f);
    CHECK(hm.maxHeight() == 0.0f);
}

TEST_CASE("Invalid generator parameters throw")
{
    lt::Heightmap hm(4, 4);
    lt::SimplexNoise noise;

    lt::GeneratorParams p = seeded(1);
    p.octaves = 0;
    CHECK_THROWS_AS(lt::generateHeightmap(hm, lt::GeneratorKind::Fbm, p, noise), std::invalid_argument);

    p = seeded(1);
    p.scale = 0.0f;
    CHECK_THROWS_AS(lt::generateHeightmap(hm, lt::GeneratorKind::Voronoi, p, noise), std::invalid_argument);
}

TEST_CASE("Noise primitives: ranges")
{
    const lt::SimplexNoise n(5);
    for (int i = 0; i < 50; ++i) {
        const float x = float(i) * 3.1f, y = float(i) * 1.7f;

        const float layered = lt::layeredNoise(n, x, y, 20.0f, 4, 0.5f);
        CHECK(layered >= 0.0f);
        CHECK(layered <= 1.0f);

        const float ridged = lt::ridgedNoise(n, x, y, 20.0f, 4, 0.5f, 2.0f);
        CHECK(ridged >= 0.0f);
        CHECK(ridged <= 1.0f);

        const float cell = lt::voronoiNoise(x, y, 10.0f, 2.0f);
        CHECK(cell >= 0.0f);
        CHECK(cell <= 1.0f);
    }
}

TEST_CASE("Generator names round-trip through parseGeneratorKind")
{
    for (auto kind : { lt::GeneratorKind::Perlin, lt::GeneratorKind::Fbm, lt::GeneratorKind::Ridged,
                       lt::GeneratorKind::Voronoi, lt::GeneratorKind::Hydraulic }) {
        const auto parsed = lt::parseGeneratorKind(lt::toString(kind));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == kind);
    }
    CHECK_FALSE(lt::parseGeneratorKind("plasma").has_value());
}
