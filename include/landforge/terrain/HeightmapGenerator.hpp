// include/landforge/terrain/HeightmapGenerator.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

#include "landforge/terrain/Heightmap.hpp"
#include "landforge/terrain/SimplexNoise.hpp"

namespace landforge::terrain {

enum class GeneratorKind : std::uint8_t {
    Perlin,     // layered simplex octaves, remapped to [0,1]
    Fbm,        // same series as Perlin
    Ridged,     // 1 - |noise| per octave, raised to ridgePower
    Voronoi,    // distance to jittered cell points
    Hydraulic,  // Fbm base, then droplet erosion when erosionIterations > 0
};

[[nodiscard]] const char* toString(GeneratorKind kind) noexcept;
[[nodiscard]] std::optional<GeneratorKind> parseGeneratorKind(std::string_view name) noexcept;

struct GeneratorParams {
    float scale             = 50.0f;
    int   octaves           = 4;
    float persistence       = 0.5f;
    float amplitude         = 50.0f;
    float ridgePower        = 2.0f;
    float falloff           = 2.0f;   // voronoi exponent
    float waterLevel        = 0.0f;   // carried by presets, informational
    int   erosionIterations = 0;      // hydraulic only
    std::optional<std::uint64_t> seed; // random when unset
};

// Noise primitives. Each returns an unscaled value (amplitude not applied).
[[nodiscard]] float layeredNoise(const SimplexNoise& n, float x, float y,
                                 float scale, int octaves, float persistence) noexcept;
[[nodiscard]] float ridgedNoise(const SimplexNoise& n, float x, float y,
                                float scale, int octaves, float persistence, float power) noexcept;
[[nodiscard]] float voronoiNoise(float x, float y, float scale, float falloff) noexcept;

// Fills every cell of `hm` with the chosen generator, reseeding `noise` from
// params.seed (or a fresh random seed). Hydraulic runs erosion afterwards.
// Bounds are recomputed before returning.
// Throws std::invalid_argument for octaves < 1 or a non-positive scale.
void generateHeightmap(Heightmap& hm, GeneratorKind kind, const GeneratorParams& params,
                       SimplexNoise& noise);

} // namespace landforge::terrain
