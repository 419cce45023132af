#pragma once
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "landforge/terrain/HeightmapGenerator.hpp"
#include "landforge/terrain/SplatMap.hpp"

namespace landforge::terrain {

// Named one-click recipe: a generator, its parameters and the layers attached
// to the new terrain.
struct TerrainPreset {
    std::string id;
    std::string name;
    std::string category;
    std::string description;
    GeneratorKind   generator = GeneratorKind::Fbm;
    GeneratorParams params;
    std::vector<TerrainLayer> defaultLayers;  // ids assigned on use
};

// flat, rolling-hills, mountains, desert-dunes, islands, canyon.
[[nodiscard]] std::vector<TerrainPreset> builtinPresets();

class PresetCatalog {
public:
    PresetCatalog() : presets_(builtinPresets()) {}
    explicit PresetCatalog(std::vector<TerrainPreset> presets) : presets_(std::move(presets)) {}

    // Replaces an existing preset with the same id, otherwise appends.
    void add(TerrainPreset preset);

    [[nodiscard]] const std::vector<TerrainPreset>& all() const noexcept { return presets_; }
    [[nodiscard]] const TerrainPreset* find(std::string_view id) const noexcept;
    [[nodiscard]] std::vector<TerrainPreset> byCategory(std::string_view category) const;

private:
    std::vector<TerrainPreset> presets_;
};

} // namespace landforge::terrain
