#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "landforge/terrain/BrushEngine.hpp"
#include "landforge/terrain/ErosionSimulator.hpp"
#include "landforge/terrain/Heightmap.hpp"
#include "landforge/terrain/HeightmapGenerator.hpp"
#include "landforge/terrain/SimplexNoise.hpp"
#include "landforge/terrain/SplatMap.hpp"
#include "landforge/terrain/TerrainEditorConfig.hpp"
#include "landforge/terrain/TerrainMesh.hpp"
#include "landforge/terrain/TerrainPresets.hpp"
#include "landforge/terrain/VegetationScatter.hpp"

namespace landforge::terrain {

// Everything one editable terrain owns.
struct TerrainInstance {
    TerrainConfig               config;
    Heightmap                   heightmap;
    std::vector<TerrainLayer>   layers;
    std::vector<SplatMap>       splatMaps;
    std::vector<TreePrototype>  treePrototypes;
    std::vector<GrassPrototype> grassPrototypes;
    std::vector<DetailLayer>    detailLayers;
    std::vector<PlacedInstance> trees;
    std::vector<PlacedInstance> details;
    SimplexNoise                noise;   // brush noise and scatter masks

    [[nodiscard]] const std::string& id() const noexcept { return config.id; }
};

struct LodMesh {
    int         level = 1;
    TerrainMesh mesh;
};

// Owns every terrain of an editing session, keyed by id. Lookups that miss
// return nullptr/false/0/empty/nullopt; invalid arguments throw
// std::invalid_argument. Not thread-safe.
class TerrainService {
public:
    TerrainService();
    explicit TerrainService(TerrainEditorConfig config);

    [[nodiscard]] const TerrainEditorConfig& config() const noexcept { return config_; }

    // Config defaults for new terrains, with an empty id.
    [[nodiscard]] TerrainConfig defaultTerrainConfig() const { return config_.terrain; }

    // Flat terrain. An empty id becomes "terrain_<n>"; an empty name "New Terrain".
    // Throws for an invalid config or an id that is already in use.
    TerrainInstance& createTerrain(std::optional<TerrainConfig> cfg = std::nullopt);

    // nullptr when presetId is unknown.
    TerrainInstance* generateFromPreset(std::string_view presetId,
                                        std::optional<TerrainConfig> cfg = std::nullopt);

    bool generateHeightmap(std::string_view id, GeneratorKind kind, const GeneratorParams& params);

    [[nodiscard]] TerrainInstance*       getTerrain(std::string_view id) noexcept;
    [[nodiscard]] const TerrainInstance* getTerrain(std::string_view id) const noexcept;
    [[nodiscard]] std::vector<const TerrainInstance*> getAllTerrains() const;
    bool deleteTerrain(std::string_view id);

    // ---- Sculpting ----
    bool applyBrush(std::string_view id, float worldX, float worldZ, const BrushSettings& brush);
    // Uses the configured erosion defaults when settings are omitted.
    std::optional<ErosionStats> applyHydraulicErosion(std::string_view id,
                                                      std::optional<ErosionSettings> settings = std::nullopt);

    // ---- Texturing ----
    // Stores the layer (empty id -> "layer_<index>") and grows the splat maps
    // when the layer count exceeds their channels. nullptr on unknown terrain.
    const TerrainLayer* addLayer(std::string_view id, TerrainLayer layer);
    bool paintLayer(std::string_view id, float worldX, float worldZ, int layerIndex,
                    const BrushSettings& brush);
    std::optional<SplatGenerationStats> autoGenerateSplatMaps(std::string_view id);

    // ---- Vegetation ----
    const TreePrototype*  addTreePrototype(std::string_view id, TreePrototype prototype);
    const GrassPrototype* addGrassPrototype(std::string_view id, GrassPrototype prototype);
    const DetailLayer*    addDetailLayer(std::string_view id, DetailLayer layer);

    // 0 on unknown terrain or prototype. Filters default to the configured ones.
    int autoPlaceTrees(std::string_view id, std::string_view prototypeId, float density,
                       std::optional<ScatterFilters> filters = std::nullopt);
    int autoPlaceDetails(std::string_view id, std::string_view detailLayerId);

    // ---- Queries and raster exchange ----
    [[nodiscard]] std::optional<float> getHeightAtPosition(std::string_view id, float worldX, float worldZ) const;

    // One byte per cell, (h - min) / range * 255. Empty on unknown terrain.
    [[nodiscard]] std::vector<std::uint8_t> exportHeightmapImage(std::string_view id) const;

    // Resamples the first channel of a w x h raster (nearest neighbour) into
    // [0, config.height]. Throws when the buffer is smaller than w*h*channels.
    bool importHeightmapImage(std::string_view id, std::span<const std::uint8_t> pixels,
                              int w, int h, int channels);

    // ---- LOD and geometry ----
    [[nodiscard]] std::optional<Heightmap>   generateLODHeightmap(std::string_view id, int lodLevel) const;
    [[nodiscard]] std::optional<TerrainMesh> generateTerrainMesh(std::string_view id, int lodLevel = 1) const;
    // Levels default to the configured ones; levels below a 2x2 grid are skipped.
    [[nodiscard]] std::vector<LodMesh> generateAllLODLevels(std::string_view id,
                                                            std::optional<std::vector<int>> levels = std::nullopt) const;
    [[nodiscard]] std::optional<TerrainMesh> getTerrainChunk(std::string_view id, int chunkX, int chunkZ,
                                                             int chunkSize, int lodLevel) const;
    [[nodiscard]] int calculateLODLevel(float distance) const noexcept;

    // ---- Presets ----
    [[nodiscard]] const std::vector<TerrainPreset>& getPresets() const noexcept { return presets_.all(); }
    [[nodiscard]] const TerrainPreset* findPreset(std::string_view id) const noexcept { return presets_.find(id); }
    [[nodiscard]] std::vector<TerrainPreset> getPresetsByCategory(std::string_view category) const;

private:
    std::string nextId(const char* prefix, std::uint64_t& counter);

    TerrainEditorConfig config_;
    PresetCatalog       presets_;
    std::vector<std::unique_ptr<TerrainInstance>> terrains_;  // creation order

    std::uint64_t terrainCounter_ = 0;
    std::uint64_t treeCounter_    = 0;
    std::uint64_t grassCounter_   = 0;
    std::uint64_t detailCounter_  = 0;
};

} // namespace landforge::terrain
