#include "landforge/terrain/TerrainPresets.hpp"

#include <algorithm>

namespace landforge::terrain {

namespace {

TerrainLayer slopeLayer(const char* name, const char* texture, float lo, float hi, float falloff,
                        float tiling, float metallic = 0.0f, float smoothness = 0.0f)
{
    TerrainLayer L;
    L.name       = name;
    L.texture    = texture;
    L.tiling     = { tiling, tiling };
    L.metallic   = metallic;
    L.smoothness = smoothness;
    L.blend      = BlendMode::Slope;
    L.slopeBlend = BlendBand{ lo, hi, falloff };
    return L;
}

TerrainLayer heightLayer(const char* name, const char* texture, float lo, float hi, float falloff,
                         float tiling, float metallic = 0.0f, float smoothness = 0.0f)
{
    TerrainLayer L;
    L.name        = name;
    L.texture     = texture;
    L.tiling      = { tiling, tiling };
    L.metallic    = metallic;
    L.smoothness  = smoothness;
    L.blend       = BlendMode::Height;
    L.heightBlend = BlendBand{ lo, hi, falloff };
    return L;
}

GeneratorParams fractal(float scale, int octaves, float persistence, float amplitude)
{
    GeneratorParams p;
    p.scale       = scale;
    p.octaves     = octaves;
    p.persistence = persistence;
    p.amplitude   = amplitude;
    return p;
}

} // namespace

std::vector<TerrainPreset> builtinPresets()
{
    std::vector<TerrainPreset> out;

    {
        TerrainPreset p{ "flat", "Flat Plains", "flat", "Mostly flat terrain with gentle variations",
                         GeneratorKind::Perlin, fractal(100.0f, 2, 0.3f, 5.0f), {} };
        p.defaultLayers.push_back(slopeLayer("Grass", "grass_diffuse", 0.0f, 30.0f, 5.0f, 10.0f, 0.0f, 0.3f));
        out.push_back(std::move(p));
    }
    {
        TerrainPreset p{ "rolling-hills", "Rolling Hills", "hills", "Gentle rolling hills",
                         GeneratorKind::Fbm, fractal(50.0f, 4, 0.5f, 30.0f), {} };
        p.defaultLayers.push_back(slopeLayer("Grass", "grass_diffuse", 0.0f, 45.0f, 10.0f, 15.0f, 0.0f, 0.3f));
        p.defaultLayers.push_back(slopeLayer("Rock", "rock_diffuse", 35.0f, 90.0f, 10.0f, 8.0f, 0.1f, 0.4f));
        out.push_back(std::move(p));
    }
    {
        GeneratorParams gp = fractal(30.0f, 6, 0.6f, 100.0f);
        gp.ridgePower = 2.0f;
        TerrainPreset p{ "mountains", "Mountain Range", "mountains", "Dramatic mountain peaks",
                         GeneratorKind::Ridged, gp, {} };
        p.defaultLayers.push_back(heightLayer("Grass", "grass_diffuse", 0.0f, 40.0f, 10.0f, 20.0f, 0.0f, 0.3f));
        p.defaultLayers.push_back(heightLayer("Rock", "rock_diffuse", 30.0f, 70.0f, 15.0f, 10.0f, 0.1f, 0.4f));
        p.defaultLayers.push_back(heightLayer("Snow", "snow_diffuse", 60.0f, 100.0f, 10.0f, 15.0f, 0.0f, 0.6f));
        out.push_back(std::move(p));
    }
    {
        TerrainPreset p{ "desert-dunes", "Desert Dunes", "desert", "Sandy desert with dunes",
                         GeneratorKind::Fbm, fractal(40.0f, 3, 0.4f, 20.0f), {} };
        p.defaultLayers.push_back(slopeLayer("Sand", "sand_diffuse", 0.0f, 90.0f, 5.0f, 20.0f, 0.0f, 0.1f));
        out.push_back(std::move(p));
    }
    {
        GeneratorParams gp;
        gp.scale      = 20.0f;
        gp.amplitude  = 50.0f;
        gp.falloff    = 2.0f;
        gp.waterLevel = 0.3f;
        TerrainPreset p{ "islands", "Island Archipelago", "islands", "Islands rising from water",
                         GeneratorKind::Voronoi, gp, {} };
        p.defaultLayers.push_back(heightLayer("Sand", "sand_diffuse", 0.0f, 20.0f, 5.0f, 20.0f, 0.0f, 0.2f));
        p.defaultLayers.push_back(heightLayer("Grass", "grass_diffuse", 15.0f, 80.0f, 10.0f, 15.0f, 0.0f, 0.3f));
        out.push_back(std::move(p));
    }
    {
        GeneratorParams gp = fractal(35.0f, 5, 0.55f, 60.0f);
        gp.erosionIterations = 1000;
        TerrainPreset p{ "canyon", "Canyon Lands", "canyon", "Deep canyons and plateaus",
                         GeneratorKind::Hydraulic, gp, {} };
        p.defaultLayers.push_back(slopeLayer("Red Rock", "redrock_diffuse", 0.0f, 60.0f, 15.0f, 12.0f, 0.0f, 0.3f));
        p.defaultLayers.push_back(slopeLayer("Cliff", "cliff_diffuse", 50.0f, 90.0f, 10.0f, 8.0f, 0.1f, 0.4f));
        out.push_back(std::move(p));
    }

    return out;
}

void PresetCatalog::add(TerrainPreset preset)
{
    auto it = std::find_if(presets_.begin(), presets_.end(),
                           [&](const TerrainPreset& p) { return p.id == preset.id; });
    if (it != presets_.end())
        *it = std::move(preset);
    else
        presets_.push_back(std::move(preset));
}

const TerrainPreset* PresetCatalog::find(std::string_view id) const noexcept
{
    for (const auto& p : presets_)
        if (p.id == id) return &p;
    return nullptr;
}

std::vector<TerrainPreset> PresetCatalog::byCategory(std::string_view category) const
{
    std::vector<TerrainPreset> out;
    for (const auto& p : presets_)
        if (p.category == category) out.push_back(p);
    return out;
}

} // namespace landforge::terrain
