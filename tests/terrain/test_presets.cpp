// tests/terrain/test_presets.cpp

#include <doctest/doctest.h>

#include "landforge/terrain/TerrainPresets.hpp"

#include <string>
#include <vector>

namespace lt = landforge::terrain;

TEST_CASE("Built-in catalog carries the six named recipes in order")
{
    const lt::PresetCatalog catalog;
    const auto& all = catalog.all();
    REQUIRE(all.size() == 6);

    const char* ids[] = { "flat", "rolling-hills", "mountains", "desert-dunes", "islands", "canyon" };
    for (size_t i = 0; i < 6; ++i) {
        CHECK(all[i].id == ids[i]);
        CHECK_FALSE(all[i].name.empty());
        CHECK_FALSE(all[i].defaultLayers.empty());
        CHECK(all[i].params.octaves >= 1);
        CHECK(all[i].params.scale > 0.0f);
    }
}

TEST_CASE("Preset parameters")
{
    const lt::PresetCatalog catalog;

    const lt::TerrainPreset* mountains = catalog.find("mountains");
    REQUIRE(mountains != nullptr);
    CHECK(mountains->generator == lt::GeneratorKind::Ridged);
    CHECK(mountains->params.octaves == 6);
    CHECK(mountains->params.amplitude == doctest::Approx(100.0f));
    REQUIRE(mountains->defaultLayers.size() == 3);
    CHECK(mountains->defaultLayers[2].name == "Snow");
    REQUIRE(mountains->defaultLayers[2].heightBlend.has_value());
    CHECK(mountains->defaultLayers[2].heightBlend->min == doctest::Approx(60.0f));

    const lt::TerrainPreset* canyon = catalog.find("canyon");
    REQUIRE(canyon != nullptr);
    CHECK(canyon->generator == lt::GeneratorKind::Hydraulic);
    CHECK(canyon->params.erosionIterations == 1000);
    CHECK(canyon->defaultLayers.size() == 2);

    const lt::TerrainPreset* islands = catalog.find("islands");
    REQUIRE(islands != nullptr);
    CHECK(islands->generator == lt::GeneratorKind::Voronoi);
    CHECK(islands->params.waterLevel == doctest::Approx(0.3f));

    // presets never pin a seed
    for (const auto& p : catalog.all()) CHECK_FALSE(p.params.seed.has_value());
}

TEST_CASE("Unknown ids and categories come back empty")
{
    const lt::PresetCatalog catalog;
    CHECK(catalog.find("volcano") == nullptr);
    CHECK(catalog.byCategory("volcanic").empty());

    const auto hills = catalog.byCategory("hills");
    REQUIRE(hills.size() == 1);
    CHECK(hills[0].id == "rolling-hills");
}

TEST_CASE("add replaces a preset with the same id and appends new ones")
{
    lt::PresetCatalog catalog;

    lt::TerrainPreset flatter;
    flatter.id        = "flat";
    flatter.name      = "Flatter Plains";
    flatter.category  = "flat";
    flatter.generator = lt::GeneratorKind::Perlin;
    catalog.add(flatter);

    CHECK(catalog.all().size() == 6);
    REQUIRE(catalog.find("flat") != nullptr);
    CHECK(catalog.find("flat")->name == "Flatter Plains");
    CHECK(catalog.all().front().id == "flat");

    lt::TerrainPreset mesa;
    mesa.id       = "mesa";
    mesa.category = "canyon";
    catalog.add(mesa);

    CHECK(catalog.all().size() == 7);
    CHECK(catalog.all().back().id == "mesa");
    CHECK(catalog.byCategory("canyon").size() == 2);
}

TEST_CASE("An explicit preset list replaces the built-ins")
{
    lt::TerrainPreset only;
    only.id = "only";
    const lt::PresetCatalog catalog(std::vector<lt::TerrainPreset>{ only });

    CHECK(catalog.all().size() == 1);
    CHECK(catalog.find("flat") == nullptr);
}
