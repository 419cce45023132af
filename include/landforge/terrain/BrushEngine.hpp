#pragma once
#include <cmath>
#include <cstdint>
#include <optional>
#include <string_view>

#include "landforge/terrain/Heightmap.hpp"
#include "landforge/terrain/SimplexNoise.hpp"

namespace landforge::terrain {

enum class BrushType : std::uint8_t { Raise, Lower, Smooth, Flatten, Noise, Paint };
enum class FalloffType : std::uint8_t { Linear, Smooth, Sphere, Tip };

[[nodiscard]] std::optional<BrushType>   parseBrushType(std::string_view name) noexcept;
[[nodiscard]] std::optional<FalloffType> parseFalloffType(std::string_view name) noexcept;

struct BrushSettings {
    BrushType   type     = BrushType::Raise;
    float       size     = 10.0f;   // world-space radius
    float       strength = 0.5f;
    FalloffType falloff  = FalloffType::Smooth;
    float       noiseScale = 0.1f;              // Noise
    std::optional<float> targetHeight;          // Flatten; stroke centre height when unset
};

// Intensity multiplier for a normalized distance d in [0,1].
[[nodiscard]] float falloffWeight(float d, FalloffType type) noexcept;

// Brush footprint on a W x H grid: centre cell and pixel radius.
struct BrushFootprint {
    GridPoint center;
    int       radius = 0;
};

// Throws std::invalid_argument when the pixel radius rounds down to zero.
[[nodiscard]] BrushFootprint brushFootprint(const TerrainConfig& cfg, int gridW, int gridH,
                                            float worldX, float worldZ, float size);

// Visits every in-grid cell of the footprint with distance ratio <= 1,
// passing (x, y, falloff weight).
template <class Fn>
void forEachBrushCell(const BrushFootprint& fp, int gridW, int gridH, FalloffType falloff, Fn&& fn)
{
    const int r = fp.radius;
    for (int dy = -r; dy <= r; ++dy) {
        for (int dx = -r; dx <= r; ++dx) {
            const int px = fp.center.x + dx;
            const int py = fp.center.y + dy;
            if (px < 0 || px >= gridW || py < 0 || py >= gridH) continue;

            const float dist = std::sqrt(float(dx * dx + dy * dy)) / float(r);
            if (dist > 1.0f) continue;
            fn(px, py, falloffWeight(dist, falloff));
        }
    }
}

// Box average over a (2*radius+1)^2 window clipped to the grid.
[[nodiscard]] float averageHeight(const Heightmap& hm, int x, int y, int radius) noexcept;

// Sculpts `hm` around a world position. BrushType::Paint is ignored here
// (see paintLayer). Bounds are recomputed after the stroke.
void applyBrush(Heightmap& hm, const TerrainConfig& cfg, float worldX, float worldZ,
                const BrushSettings& brush, const SimplexNoise& noise);

} // namespace landforge::terrain
