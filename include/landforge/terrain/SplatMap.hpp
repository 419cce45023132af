#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "landforge/terrain/BrushEngine.hpp"
#include "landforge/terrain/Heightmap.hpp"

namespace landforge::terrain {

enum class BlendMode : std::uint8_t { Height, Slope, Custom };

[[nodiscard]] std::optional<BlendMode> parseBlendMode(std::string_view name) noexcept;

// Full weight inside [min,max], linear falloff to zero over `falloff` units
// outside either edge. Units: percent of height range, or slope degrees.
struct BlendBand {
    float min     = 0.0f;
    float max     = 100.0f;
    float falloff = 10.0f;
};

[[nodiscard]] float bandWeight(const BlendBand& band, float value) noexcept;
// Distance from value to the band, 0 when inside.
[[nodiscard]] float bandDistance(const BlendBand& band, float value) noexcept;

struct TerrainLayer {
    std::string id;
    std::string name;
    std::string texture;
    std::string normalMap;
    std::array<float, 2> tiling{ 1.0f, 1.0f };
    float metallic   = 0.0f;
    float smoothness = 0.0f;
    BlendMode blend  = BlendMode::Height;
    std::optional<BlendBand> heightBlend;
    std::optional<BlendBand> slopeBlend;
};

inline constexpr int kSplatChannels = 4;

struct SplatMap {
    int width    = 0;
    int height   = 0;
    int channels = kSplatChannels;
    std::vector<float> data;  // (y*width + x) * channels + c

    SplatMap() = default;
    SplatMap(int w, int h);

    float& at(int x, int y, int c)       noexcept { return data[(size_t(y) * width + x) * channels + c]; }
    float  at(int x, int y, int c) const noexcept { return data[(size_t(y) * width + x) * channels + c]; }
};

// Number of 4-channel maps needed for layerCount layers.
[[nodiscard]] int splatMapsNeeded(int layerCount) noexcept;

// Texel policy when no layer band matches (total weight 0).
enum class ZeroWeightPolicy : std::uint8_t { LeaveEmpty, Uniform, NearestBand };

[[nodiscard]] std::optional<ZeroWeightPolicy> parseZeroWeightPolicy(std::string_view name) noexcept;

// Adds strength*falloff to channel layerIndex%4 of map layerIndex/4 and
// renormalizes that texel's channels. Returns false when the map does not exist.
bool paintLayer(std::vector<SplatMap>& maps, const TerrainConfig& cfg, float worldX, float worldZ,
                int layerIndex, const BrushSettings& brush);

struct SplatGenerationStats {
    int texels          = 0;
    int zeroWeightTexels = 0;
};

// Rebuilds every splat channel from the layers' height/slope bands.
// `spacing` scales the slope gradient (world units between samples).
SplatGenerationStats autoGenerateSplatMaps(const Heightmap& hm, const std::vector<TerrainLayer>& layers,
                                           std::vector<SplatMap>& maps, float spacing = 1.0f,
                                           ZeroWeightPolicy policy = ZeroWeightPolicy::LeaveEmpty);

} // namespace landforge::terrain
