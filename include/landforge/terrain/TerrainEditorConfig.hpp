#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "landforge/terrain/ErosionSimulator.hpp"
#include "landforge/terrain/Heightmap.hpp"
#include "landforge/terrain/SplatMap.hpp"
#include "landforge/terrain/TerrainPresets.hpp"
#include "landforge/terrain/VegetationScatter.hpp"

namespace landforge::terrain {

struct LodSettings
{
    std::vector<float> distances{ 0.0f, 100.0f, 200.0f, 400.0f, 800.0f };
    std::vector<int>   levels{ 1, 2, 4, 8, 16 };
};

struct TerrainEditorConfig
{
    TerrainConfig    terrain;      // defaults for createTerrain
    ErosionSettings  erosion;
    ScatterFilters   scatter;
    LodSettings      lod;
    ZeroWeightPolicy zeroWeightPolicy = ZeroWeightPolicy::LeaveEmpty;
    std::vector<TerrainPreset> extraPresets;  // appended to the built-in catalog

    /// Load from a given path; falls back to defaults on error (logged).
    static TerrainEditorConfig LoadFromFile(const std::string& path);

    /// Same parsing rules for an in-memory JSON document.
    static TerrainEditorConfig LoadFromString(std::string_view text);

    /// LoadFromFile(GetDefaultConfigPath()).
    static TerrainEditorConfig LoadDefault();

    ///   assets/config/terrain_editor.json
    static std::string GetDefaultConfigPath();
};

} // namespace landforge::terrain
