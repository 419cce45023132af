#include "landforge/terrain/TerrainService.hpp"
#include "landforge/terrain/DeterministicRNG.hpp"
#include "landforge/logging/Log.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace landforge::terrain {

TerrainService::TerrainService()
    : TerrainService(TerrainEditorConfig{})
{}

TerrainService::TerrainService(TerrainEditorConfig config)
    : config_(std::move(config))
{
    for (const auto& preset : config_.extraPresets)
        presets_.add(preset);
}

std::string TerrainService::nextId(const char* prefix, std::uint64_t& counter)
{
    return std::string(prefix) + "_" + std::to_string(++counter);
}

// ---- Terrain lifetime ------------------------------------------------------

TerrainInstance& TerrainService::createTerrain(std::optional<TerrainConfig> cfg)
{
    TerrainConfig c = cfg.value_or(config_.terrain);
    if (c.id.empty()) {
        do {
            c.id = nextId("terrain", terrainCounter_);
        } while (getTerrain(c.id) != nullptr);
    } else if (getTerrain(c.id) != nullptr) {
        throw std::invalid_argument("Terrain id '" + c.id + "' is already in use");
    }
    if (c.name.empty()) c.name = "New Terrain";
    validateConfig(c);

    auto inst = std::make_unique<TerrainInstance>();
    inst->config = std::move(c);
    inst->heightmap.resize(inst->config.resolution, inst->config.resolution);
    inst->noise.reseed(entropySeed());

    terrains_.push_back(std::move(inst));
    TerrainInstance& t = *terrains_.back();
    logsys::get()->info("Created terrain '{}' ({}x{} samples, {}x{} world units)",
                        t.id(), t.heightmap.width(), t.heightmap.height(),
                        t.config.width, t.config.depth);
    return t;
}

TerrainInstance* TerrainService::generateFromPreset(std::string_view presetId,
                                                    std::optional<TerrainConfig> cfg)
{
    const TerrainPreset* preset = presets_.find(presetId);
    if (!preset) {
        logsys::get()->warn("Unknown terrain preset '{}'", presetId);
        return nullptr;
    }

    TerrainInstance& t = createTerrain(std::move(cfg));
    generateHeightmap(t.id(), preset->generator, preset->params);

    for (size_t i = 0; i < preset->defaultLayers.size(); ++i) {
        TerrainLayer layer = preset->defaultLayers[i];
        layer.id = "layer_" + std::to_string(i);
        addLayer(t.id(), std::move(layer));
    }

    logsys::get()->info("Generated terrain '{}' from preset '{}'", t.id(), preset->id);
    return &t;
}

bool TerrainService::generateHeightmap(std::string_view id, GeneratorKind kind, const GeneratorParams& params)
{
    TerrainInstance* t = getTerrain(id);
    if (!t) return false;
    terrain::generateHeightmap(t->heightmap, kind, params, t->noise);
    return true;
}

TerrainInstance* TerrainService::getTerrain(std::string_view id) noexcept
{
    for (auto& t : terrains_)
        if (t->id() == id) return t.get();
    return nullptr;
}

const TerrainInstance* TerrainService::getTerrain(std::string_view id) const noexcept
{
    for (const auto& t : terrains_)
        if (t->id() == id) return t.get();
    return nullptr;
}

std::vector<const TerrainInstance*> TerrainService::getAllTerrains() const
{
    std::vector<const TerrainInstance*> out;
    out.reserve(terrains_.size());
    for (const auto& t : terrains_) out.push_back(t.get());
    return out;
}

bool TerrainService::deleteTerrain(std::string_view id)
{
    auto it = std::find_if(terrains_.begin(), terrains_.end(),
                           [&](const auto& t) { return t->id() == id; });
    if (it == terrains_.end()) return false;
    logsys::get()->info("Deleted terrain '{}'", (*it)->id());
    terrains_.erase(it);
    return true;
}

// ---- Sculpting -------------------------------------------------------------

bool TerrainService::applyBrush(std::string_view id, float worldX, float worldZ, const BrushSettings& brush)
{
    TerrainInstance* t = getTerrain(id);
    if (!t) return false;
    terrain::applyBrush(t->heightmap, t->config, worldX, worldZ, brush, t->noise);
    return true;
}

std::optional<ErosionStats> TerrainService::applyHydraulicErosion(std::string_view id,
                                                                  std::optional<ErosionSettings> settings)
{
    TerrainInstance* t = getTerrain(id);
    if (!t) return std::nullopt;
    return simulateHydraulic(t->heightmap, settings.value_or(config_.erosion));
}

// ---- Texturing -------------------------------------------------------------

const TerrainLayer* TerrainService::addLayer(std::string_view id, TerrainLayer layer)
{
    TerrainInstance* t = getTerrain(id);
    if (!t) return nullptr;

    if (layer.id.empty()) layer.id = "layer_" + std::to_string(t->layers.size());
    t->layers.push_back(std::move(layer));

    while (t->layers.size() > t->splatMaps.size() * size_t(kSplatChannels))
        t->splatMaps.emplace_back(t->heightmap.width(), t->heightmap.height());
    return &t->layers.back();
}

bool TerrainService::paintLayer(std::string_view id, float worldX, float worldZ, int layerIndex,
                                const BrushSettings& brush)
{
    TerrainInstance* t = getTerrain(id);
    if (!t) return false;
    if (layerIndex < 0 || size_t(layerIndex) >= t->layers.size()) return false;
    return terrain::paintLayer(t->splatMaps, t->config, worldX, worldZ, layerIndex, brush);
}

std::optional<SplatGenerationStats> TerrainService::autoGenerateSplatMaps(std::string_view id)
{
    TerrainInstance* t = getTerrain(id);
    if (!t) return std::nullopt;
    return terrain::autoGenerateSplatMaps(t->heightmap, t->layers, t->splatMaps,
                                          cellSpacing(t->config, t->heightmap.width()),
                                          config_.zeroWeightPolicy);
}

// ---- Vegetation ------------------------------------------------------------

const TreePrototype* TerrainService::addTreePrototype(std::string_view id, TreePrototype prototype)
{
    TerrainInstance* t = getTerrain(id);
    if (!t) return nullptr;
    prototype.id = nextId("tree", treeCounter_);
    t->treePrototypes.push_back(std::move(prototype));
    return &t->treePrototypes.back();
}

const GrassPrototype* TerrainService::addGrassPrototype(std::string_view id, GrassPrototype prototype)
{
    TerrainInstance* t = getTerrain(id);
    if (!t) return nullptr;
    prototype.id = nextId("grass", grassCounter_);
    t->grassPrototypes.push_back(std::move(prototype));
    return &t->grassPrototypes.back();
}

const DetailLayer* TerrainService::addDetailLayer(std::string_view id, DetailLayer layer)
{
    TerrainInstance* t = getTerrain(id);
    if (!t) return nullptr;
    layer.id = nextId("detail", detailCounter_);
    t->detailLayers.push_back(std::move(layer));
    return &t->detailLayers.back();
}

int TerrainService::autoPlaceTrees(std::string_view id, std::string_view prototypeId, float density,
                                   std::optional<ScatterFilters> filters)
{
    TerrainInstance* t = getTerrain(id);
    if (!t) return 0;
    auto proto = std::find_if(t->treePrototypes.begin(), t->treePrototypes.end(),
                              [&](const TreePrototype& p) { return p.id == prototypeId; });
    if (proto == t->treePrototypes.end()) return 0;

    return terrain::autoPlaceTrees(t->heightmap, t->config, t->noise, *proto, density,
                                   filters.value_or(config_.scatter), t->trees);
}

int TerrainService::autoPlaceDetails(std::string_view id, std::string_view detailLayerId)
{
    TerrainInstance* t = getTerrain(id);
    if (!t) return 0;
    auto layer = std::find_if(t->detailLayers.begin(), t->detailLayers.end(),
                              [&](const DetailLayer& d) { return d.id == detailLayerId; });
    if (layer == t->detailLayers.end()) return 0;

    return terrain::autoPlaceDetails(t->heightmap, t->config, t->noise, *layer,
                                     config_.scatter.seed, t->details);
}

// ---- Queries and raster exchange ------------------------------------------

std::optional<float> TerrainService::getHeightAtPosition(std::string_view id, float worldX, float worldZ) const
{
    const TerrainInstance* t = getTerrain(id);
    if (!t) return std::nullopt;
    return sampleHeightAt(t->heightmap, t->config, worldX, worldZ);
}

std::vector<std::uint8_t> TerrainService::exportHeightmapImage(std::string_view id) const
{
    const TerrainInstance* t = getTerrain(id);
    if (!t) return {};

    const Heightmap& hm = t->heightmap;
    const float minH  = hm.minHeight();
    const float range = hm.heightRange();

    std::vector<std::uint8_t> out(hm.size());
    for (size_t i = 0; i < hm.size(); ++i) {
        const float v = (hm.values()[i] - minH) / range * 255.0f;
        out[i] = std::uint8_t(std::clamp(std::lround(v), 0L, 255L));
    }
    return out;
}

bool TerrainService::importHeightmapImage(std::string_view id, std::span<const std::uint8_t> pixels,
                                          int w, int h, int channels)
{
    if (w <= 0 || h <= 0 || channels <= 0) {
        std::ostringstream oss;
        oss << "Raster dimensions must be positive (got " << w << "x" << h << "x" << channels << ")";
        throw std::invalid_argument(oss.str());
    }
    const size_t needed = size_t(w) * size_t(h) * size_t(channels);
    if (pixels.size() < needed) {
        std::ostringstream oss;
        oss << "Raster buffer holds " << pixels.size() << " bytes, " << needed << " expected";
        throw std::invalid_argument(oss.str());
    }

    TerrainInstance* t = getTerrain(id);
    if (!t) return false;

    Heightmap& hm = t->heightmap;
    const int W = hm.width(), H = hm.height();
    for (int y = 0; y < H; ++y) {
        const int sy = int((long long)y * h / H);
        for (int x = 0; x < W; ++x) {
            const int sx = int((long long)x * w / W);
            const std::uint8_t red = pixels[(size_t(sy) * size_t(w) + size_t(sx)) * size_t(channels)];
            hm.at(x, y) = float(red) / 255.0f * t->config.height;
        }
    }
    hm.recomputeBounds();
    logsys::get()->debug("Imported {}x{} raster into terrain '{}'", w, h, t->id());
    return true;
}

// ---- LOD and geometry ------------------------------------------------------

std::optional<Heightmap> TerrainService::generateLODHeightmap(std::string_view id, int lodLevel) const
{
    const TerrainInstance* t = getTerrain(id);
    if (!t) return std::nullopt;
    return downsample(t->heightmap, lodLevel);
}

std::optional<TerrainMesh> TerrainService::generateTerrainMesh(std::string_view id, int lodLevel) const
{
    const TerrainInstance* t = getTerrain(id);
    if (!t) return std::nullopt;
    if (lodLevel == 1) return buildMesh(t->heightmap, t->config);
    return buildMesh(downsample(t->heightmap, lodLevel), t->config);
}

std::vector<LodMesh> TerrainService::generateAllLODLevels(std::string_view id,
                                                          std::optional<std::vector<int>> levels) const
{
    std::vector<LodMesh> out;
    const TerrainInstance* t = getTerrain(id);
    if (!t) return out;

    for (int level : levels.value_or(config_.lod.levels)) {
        Heightmap lod = downsample(t->heightmap, level);
        if (lod.width() < 2 || lod.height() < 2) {
            logsys::get()->debug("Skipping LOD {} for terrain '{}': {}x{} grid",
                                 level, t->id(), lod.width(), lod.height());
            continue;
        }
        out.push_back(LodMesh{ level, buildMesh(lod, t->config) });
    }
    return out;
}

std::optional<TerrainMesh> TerrainService::getTerrainChunk(std::string_view id, int chunkX, int chunkZ,
                                                           int chunkSize, int lodLevel) const
{
    const TerrainInstance* t = getTerrain(id);
    if (!t) return std::nullopt;
    return getChunk(t->heightmap, t->config, chunkX, chunkZ, chunkSize, lodLevel);
}

int TerrainService::calculateLODLevel(float distance) const noexcept
{
    // Configured levels map 1:1 onto the distance thresholds.
    const auto& distances = config_.lod.distances;
    const auto& levels    = config_.lod.levels;
    if (levels.size() != distances.size())
        return lodForDistance(distance, distances);
    for (size_t i = distances.size(); i-- > 0;) {
        if (distance >= distances[i]) return levels[i];
    }
    return 1;
}

std::vector<TerrainPreset> TerrainService::getPresetsByCategory(std::string_view category) const
{
    return presets_.byCategory(category);
}

} // namespace landforge::terrain
