// tests/terrain/test_vegetation_scatter.cpp

#include <doctest/doctest.h>

#include "landforge/terrain/VegetationScatter.hpp"

#include <limits>
#include <stdexcept>

namespace lt = landforge::terrain;

namespace {

lt::TerrainConfig squareConfig(float size, int resolution)
{
    lt::TerrainConfig cfg;
    cfg.width      = size;
    cfg.depth      = size;
    cfg.resolution = resolution;
    return cfg;
}

lt::ScatterFilters acceptAll(std::uint64_t seed)
{
    lt::ScatterFilters f;
    f.slopeLimit     = 30.0f;
    f.noiseThreshold = -1.0f;
    f.seed           = seed;
    return f;
}

} // namespace

TEST_CASE("Flat terrain: one tree per probe, all inside the terrain footprint")
{
    const lt::TerrainConfig cfg = squareConfig(100.0f, 64);
    const lt::Heightmap hm(64, 64);
    const lt::SimplexNoise noise(1);
    lt::TreePrototype oak;
    oak.id = "tree_1";

    std::vector<lt::PlacedInstance> out;
    const int placed = lt::autoPlaceTrees(hm, cfg, noise, oak, 1.0f / 64.0f, acceptAll(7), out);

    // spacing 8 -> 8 x 8 probes
    CHECK(placed == 64);
    REQUIRE(out.size() == 64);
    for (const auto& inst : out) {
        CHECK(inst.prototypeId == "tree_1");
        CHECK(inst.position[0] >= -50.0f);
        CHECK(inst.position[0] <= 50.0f);
        CHECK(inst.position[2] >= -50.0f);
        CHECK(inst.position[2] <= 50.0f);
        CHECK(inst.position[1] == 0.0f);
        CHECK(inst.rotation >= 0.0f);
        CHECK(inst.rotation < 6.2832f);
    }
}

TEST_CASE("Tree placement is reproducible for a fixed seed and follows the terrain origin")
{
    lt::TerrainConfig cfg = squareConfig(64.0f, 32);
    cfg.position = { 1000.0f, 12.0f, -500.0f };
    const lt::Heightmap hm(32, 32, 3.0f);
    const lt::SimplexNoise noise(3);
    lt::TreePrototype pine;
    pine.id = "tree_7";

    std::vector<lt::PlacedInstance> a, b;
    lt::autoPlaceTrees(hm, cfg, noise, pine, 0.05f, acceptAll(99), a);
    lt::autoPlaceTrees(hm, cfg, noise, pine, 0.05f, acceptAll(99), b);

    REQUIRE(a.size() == b.size());
    REQUIRE_FALSE(a.empty());
    for (size_t i = 0; i < a.size(); ++i) {
        CHECK(a[i].position == b[i].position);
        CHECK(a[i].rotation == b[i].rotation);
        CHECK(a[i].position[0] >= 968.0f);
        CHECK(a[i].position[0] <= 1032.0f);
        CHECK(a[i].position[1] == doctest::Approx(15.0f));
    }
}

TEST_CASE("Tree scale comes from the prototype's width and height ranges")
{
    const lt::TerrainConfig cfg = squareConfig(32.0f, 32);
    const lt::Heightmap hm(32, 32);
    const lt::SimplexNoise noise(1);
    lt::TreePrototype birch;
    birch.id        = "tree_2";
    birch.minWidth  = 2.0f;
    birch.maxWidth  = 3.0f;
    birch.minHeight = 5.0f;
    birch.maxHeight = 6.0f;

    std::vector<lt::PlacedInstance> out;
    lt::autoPlaceTrees(hm, cfg, noise, birch, 0.1f, acceptAll(5), out);
    REQUIRE_FALSE(out.empty());
    for (const auto& inst : out) {
        CHECK(inst.scale[0] == inst.scale[2]);
        CHECK(inst.scale[0] >= 2.0f);
        CHECK(inst.scale[0] <= 3.0f);
        CHECK(inst.scale[1] >= 5.0f);
        CHECK(inst.scale[1] <= 6.0f);
    }
}

TEST_CASE("Height and noise filters reject probes")
{
    const lt::TerrainConfig cfg = squareConfig(32.0f, 32);
    const lt::Heightmap hm(32, 32);
    const lt::SimplexNoise noise(1);
    lt::TreePrototype proto;
    proto.id = "tree_3";
    std::vector<lt::PlacedInstance> out;

    lt::ScatterFilters high = acceptAll(1);
    high.heightRange = { 50.0f, 100.0f }; // flat terrain sits at 0%
    CHECK(lt::autoPlaceTrees(hm, cfg, noise, proto, 0.1f, high, out) == 0);

    lt::ScatterFilters masked = acceptAll(1);
    masked.noiseThreshold = 2.0f; // above any noise value
    CHECK(lt::autoPlaceTrees(hm, cfg, noise, proto, 0.1f, masked, out) == 0);
    CHECK(out.empty());
}

TEST_CASE("Slope filter rejects steep interior probes")
{
    const lt::TerrainConfig cfg = squareConfig(20.0f, 21);
    lt::Heightmap hm(21, 21);
    for (int y = 0; y < 21; ++y)
        for (int x = 0; x < 21; ++x)
            hm.at(x, y) = 0.8f * float(x); // ~53 degrees inside
    hm.recomputeBounds();
    const lt::SimplexNoise noise(1);
    lt::TreePrototype proto;
    proto.id = "tree_4";

    std::vector<lt::PlacedInstance> steep, gentle;
    lt::ScatterFilters f = acceptAll(2);
    const int onSteep = lt::autoPlaceTrees(hm, cfg, noise, proto, 1.0f, f, steep);

    f.slopeLimit = 60.0f;
    const int anywhere = lt::autoPlaceTrees(hm, cfg, noise, proto, 1.0f, f, gentle);

    CHECK(anywhere == 21 * 21);
    // only the border ring (slope 0) survives a 30 degree limit
    CHECK(onSteep == 21 * 4 - 4);
}

TEST_CASE("Non-positive density is rejected")
{
    const lt::TerrainConfig cfg = squareConfig(16.0f, 16);
    const lt::Heightmap hm(16, 16);
    const lt::SimplexNoise noise(1);
    lt::TreePrototype proto;
    std::vector<lt::PlacedInstance> out;

    CHECK_THROWS_AS(lt::autoPlaceTrees(hm, cfg, noise, proto, 0.0f, acceptAll(1), out), std::invalid_argument);
    CHECK_THROWS_AS(lt::autoPlaceTrees(hm, cfg, noise, proto, -1.0f, acceptAll(1), out), std::invalid_argument);

    lt::DetailLayer layer;
    layer.density = 0.0f;
    CHECK_THROWS_AS(lt::autoPlaceDetails(hm, cfg, noise, layer, 1, out), std::invalid_argument);
}

TEST_CASE("Non-finite and oversized densities are rejected before scattering")
{
    const lt::TerrainConfig cfg = squareConfig(16.0f, 16);
    const lt::Heightmap hm(16, 16);
    const lt::SimplexNoise noise(1);
    lt::TreePrototype proto;
    std::vector<lt::PlacedInstance> out;

    const float inf = std::numeric_limits<float>::infinity();
    CHECK_THROWS_AS(lt::autoPlaceTrees(hm, cfg, noise, proto, inf, acceptAll(1), out), std::invalid_argument);
    CHECK_THROWS_AS(lt::autoPlaceTrees(hm, cfg, noise, proto, std::numeric_limits<float>::quiet_NaN(),
                                       acceptAll(1), out), std::invalid_argument);
    CHECK_THROWS_AS(lt::autoPlaceTrees(hm, cfg, noise, proto, std::numeric_limits<float>::max(),
                                       acceptAll(1), out), std::invalid_argument);
    CHECK(out.empty());

    lt::DetailLayer layer;
    layer.density = inf;
    CHECK_THROWS_AS(lt::autoPlaceDetails(hm, cfg, noise, layer, 1, out), std::invalid_argument);

    // dense but bounded grids still scatter: spacing 0.25 gives 64 x 64 samples
    CHECK(lt::autoPlaceTrees(hm, cfg, noise, proto, 16.0f, acceptAll(1), out) == 4096);
}

TEST_CASE("Detail layers use their own filters and a uniform scale")
{
    const lt::TerrainConfig cfg = squareConfig(40.0f, 40);
    const lt::Heightmap hm(40, 40);
    const lt::SimplexNoise noise(1);

    lt::DetailLayer rocks;
    rocks.id             = "detail_1";
    rocks.prototype      = "grass_1";
    rocks.density        = 0.0625f; // spacing 4 -> 10 x 10 probes
    rocks.minScale       = 0.5f;
    rocks.maxScale       = 1.5f;
    rocks.randomRotation = false;
    rocks.noiseThreshold = -1.0f;

    std::vector<lt::PlacedInstance> out;
    const int placed = lt::autoPlaceDetails(hm, cfg, noise, rocks, 11, out);

    CHECK(placed == 100);
    for (const auto& inst : out) {
        CHECK(inst.prototypeId == "grass_1");
        CHECK(inst.rotation == 0.0f);
        CHECK(inst.scale[0] == inst.scale[1]);
        CHECK(inst.scale[1] == inst.scale[2]);
        CHECK(inst.scale[0] >= 0.5f);
        CHECK(inst.scale[0] <= 1.5f);
    }
}
