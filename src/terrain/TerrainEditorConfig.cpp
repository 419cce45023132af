#include "landforge/terrain/TerrainEditorConfig.hpp"
#include "landforge/logging/Log.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <fstream>
#include <optional>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace landforge::terrain {

namespace
{
    template <typename T>
    T GetOr(const json& j, const char* key, const T& fallback)
    {
        if (!j.is_object())
            return fallback;
        auto it = j.find(key);
        if (it == j.end())
            return fallback;
        try
        {
            return it->get<T>();
        }
        catch (const json::exception& e)
        {
            logsys::get()->warn("TerrainEditorConfig: key '{}' has the wrong type ({}), using default",
                                key, e.what());
            return fallback;
        }
    }

    std::optional<std::uint64_t> GetSeed(const json& j, const std::optional<std::uint64_t>& fallback)
    {
        if (!j.is_object())
            return fallback;
        auto it = j.find("seed");
        if (it == j.end())
            return fallback;
        if (it->is_null())
            return std::nullopt;
        if (!it->is_number_unsigned())
        {
            logsys::get()->warn("TerrainEditorConfig: 'seed' must be a non-negative integer");
            return fallback;
        }
        return it->get<std::uint64_t>();
    }

    std::optional<BlendBand> ParseBand(const json& j)
    {
        if (!j.is_object())
            return std::nullopt;
        BlendBand band;
        band.min     = GetOr<float>(j, "min",     band.min);
        band.max     = GetOr<float>(j, "max",     band.max);
        band.falloff = GetOr<float>(j, "falloff", band.falloff);
        return band;
    }

    std::optional<TerrainLayer> ParseLayer(const json& j)
    {
        if (!j.is_object())
            return std::nullopt;

        TerrainLayer L;
        L.name       = GetOr<std::string>(j, "name",       L.name);
        L.texture    = GetOr<std::string>(j, "texture",    L.texture);
        L.normalMap  = GetOr<std::string>(j, "normal_map", L.normalMap);
        L.tiling     = GetOr<std::array<float, 2>>(j, "tiling", L.tiling);
        L.metallic   = GetOr<float>(j, "metallic",   L.metallic);
        L.smoothness = GetOr<float>(j, "smoothness", L.smoothness);

        const auto blend = parseBlendMode(GetOr<std::string>(j, "blend", "height"));
        if (!blend)
            return std::nullopt;
        L.blend = *blend;
        if (auto it = j.find("height_blend"); it != j.end()) L.heightBlend = ParseBand(*it);
        if (auto it = j.find("slope_blend");  it != j.end()) L.slopeBlend  = ParseBand(*it);
        return L;
    }

    std::optional<TerrainPreset> ParsePreset(const json& j)
    {
        if (!j.is_object())
            return std::nullopt;

        TerrainPreset p;
        p.id = GetOr<std::string>(j, "id", "");
        if (p.id.empty())
            return std::nullopt;
        p.name        = GetOr<std::string>(j, "name", p.id);
        p.category    = GetOr<std::string>(j, "category", "custom");
        p.description = GetOr<std::string>(j, "description", "");

        const auto kind = parseGeneratorKind(GetOr<std::string>(j, "generator", ""));
        if (!kind)
            return std::nullopt;
        p.generator = *kind;

        const json params = j.value("params", json::object());
        p.params.scale             = GetOr<float>(params, "scale",              p.params.scale);
        p.params.octaves           = GetOr<int>  (params, "octaves",            p.params.octaves);
        p.params.persistence       = GetOr<float>(params, "persistence",        p.params.persistence);
        p.params.amplitude         = GetOr<float>(params, "amplitude",          p.params.amplitude);
        p.params.ridgePower        = GetOr<float>(params, "ridge_power",        p.params.ridgePower);
        p.params.falloff           = GetOr<float>(params, "falloff",            p.params.falloff);
        p.params.waterLevel        = GetOr<float>(params, "water_level",        p.params.waterLevel);
        p.params.erosionIterations = GetOr<int>  (params, "erosion_iterations", p.params.erosionIterations);
        p.params.seed              = GetSeed(params, p.params.seed);
        if (p.params.octaves < 1 || !(p.params.scale > 0.0f))
            return std::nullopt;

        const json layers = j.value("layers", json::array());
        if (!layers.is_array())
            return std::nullopt;
        for (const auto& lj : layers)
        {
            auto layer = ParseLayer(lj);
            if (!layer)
                return std::nullopt;
            p.defaultLayers.push_back(std::move(*layer));
        }
        return p;
    }

    void Apply(const json& root, TerrainEditorConfig& cfg)
    {
        // Terrain defaults
        const json terrain = root.value("terrain", json::object());
        cfg.terrain.width      = GetOr<float>(terrain, "width",      cfg.terrain.width);
        cfg.terrain.depth      = GetOr<float>(terrain, "depth",      cfg.terrain.depth);
        cfg.terrain.height     = GetOr<float>(terrain, "height",     cfg.terrain.height);
        cfg.terrain.resolution = GetOr<int>  (terrain, "resolution", cfg.terrain.resolution);
        {
            const TerrainConfig defaults;
            if (!(cfg.terrain.width > 0.0f) || !(cfg.terrain.depth > 0.0f))
            {
                logsys::get()->warn("TerrainEditorConfig: terrain width/depth must be > 0 (got {}x{}), using defaults",
                                    cfg.terrain.width, cfg.terrain.depth);
                cfg.terrain.width = defaults.width;
                cfg.terrain.depth = defaults.depth;
            }
            if (cfg.terrain.resolution < 1)
            {
                logsys::get()->warn("TerrainEditorConfig: terrain resolution must be >= 1 (got {}), using {}",
                                    cfg.terrain.resolution, defaults.resolution);
                cfg.terrain.resolution = defaults.resolution;
            }
        }

        // Erosion
        const json erosion = root.value("erosion", json::object());
        ErosionSettings& e = cfg.erosion;
        e.iterations         = GetOr<int>  (erosion, "iterations",          e.iterations);
        e.erosionStrength    = GetOr<float>(erosion, "erosion_strength",    e.erosionStrength);
        e.depositionStrength = GetOr<float>(erosion, "deposition_strength", e.depositionStrength);
        e.sedimentCapacity   = GetOr<float>(erosion, "sediment_capacity",   e.sedimentCapacity);
        e.evaporationRate    = GetOr<float>(erosion, "evaporation_rate",    e.evaporationRate);
        e.minSlope           = GetOr<float>(erosion, "min_slope",           e.minSlope);
        e.gravity            = GetOr<float>(erosion, "gravity",             e.gravity);
        e.rainAmount         = GetOr<float>(erosion, "rain_amount",         e.rainAmount);
        e.thermalErosion     = GetOr<bool> (erosion, "thermal",             e.thermalErosion);
        e.thermalStrength    = GetOr<float>(erosion, "thermal_strength",    e.thermalStrength);
        e.thermalAngle       = GetOr<float>(erosion, "thermal_angle",       e.thermalAngle);
        e.seed               = GetSeed(erosion, e.seed);

        // Scatter
        const json scatter = root.value("scatter", json::object());
        ScatterFilters& s = cfg.scatter;
        s.slopeLimit     = GetOr<float>(scatter, "slope_limit",     s.slopeLimit);
        s.heightRange    = GetOr<std::array<float, 2>>(scatter, "height_range", s.heightRange);
        s.noiseScale     = GetOr<float>(scatter, "noise_scale",     s.noiseScale);
        s.noiseThreshold = GetOr<float>(scatter, "noise_threshold", s.noiseThreshold);
        s.seed           = GetSeed(scatter, s.seed);

        // LOD
        const json lod = root.value("lod", json::object());
        cfg.lod.distances = GetOr<std::vector<float>>(lod, "distances", cfg.lod.distances);
        cfg.lod.levels    = GetOr<std::vector<int>>  (lod, "levels",    cfg.lod.levels);
        if (std::any_of(cfg.lod.levels.begin(), cfg.lod.levels.end(), [](int l) { return l < 1; }))
        {
            logsys::get()->warn("TerrainEditorConfig: lod levels must all be >= 1, using defaults");
            cfg.lod.levels = LodSettings{}.levels;
        }

        // Splat
        const json splat = root.value("splat", json::object());
        const std::string policy = GetOr<std::string>(splat, "zero_weight_policy", "leave_empty");
        if (auto parsed = parseZeroWeightPolicy(policy))
            cfg.zeroWeightPolicy = *parsed;
        else
            logsys::get()->warn("TerrainEditorConfig: unknown zero_weight_policy '{}'", policy);

        // Extra presets
        const json presets = root.value("presets", json::array());
        if (!presets.is_array())
            return;
        for (size_t i = 0; i < presets.size(); ++i)
        {
            if (auto preset = ParsePreset(presets[i]))
                cfg.extraPresets.push_back(std::move(*preset));
            else
                logsys::get()->warn("TerrainEditorConfig: skipping invalid preset #{}", i);
        }
    }

    TerrainEditorConfig FromJson(const json& root, std::string_view source)
    {
        TerrainEditorConfig cfg;
        if (root.is_discarded() || !root.is_object())
        {
            logsys::get()->warn("TerrainEditorConfig: parse error in '{}', using defaults", source);
            return cfg;
        }
        Apply(root, cfg);
        return cfg;
    }
}

TerrainEditorConfig TerrainEditorConfig::LoadFromFile(const std::string& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f)
    {
        logsys::get()->warn("TerrainEditorConfig: could not open '{}', using defaults", path);
        return TerrainEditorConfig{};
    }
    return FromJson(json::parse(f, nullptr, /*allow_exceptions=*/false), path);
}

TerrainEditorConfig TerrainEditorConfig::LoadFromString(std::string_view text)
{
    return FromJson(json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false),
                    "<string>");
}

TerrainEditorConfig TerrainEditorConfig::LoadDefault()
{
    return LoadFromFile(GetDefaultConfigPath());
}

std::string TerrainEditorConfig::GetDefaultConfigPath()
{
    return "assets/config/terrain_editor.json";
}

} // namespace landforge::terrain
