#include "landforge/terrain/BrushEngine.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace landforge::terrain {

std::optional<BrushType> parseBrushType(std::string_view name) noexcept
{
    if (name == "raise")   return BrushType::Raise;
    if (name == "lower")   return BrushType::Lower;
    if (name == "smooth")  return BrushType::Smooth;
    if (name == "flatten") return BrushType::Flatten;
    if (name == "noise")   return BrushType::Noise;
    if (name == "paint")   return BrushType::Paint;
    return std::nullopt;
}

std::optional<FalloffType> parseFalloffType(std::string_view name) noexcept
{
    if (name == "linear") return FalloffType::Linear;
    if (name == "smooth") return FalloffType::Smooth;
    if (name == "sphere") return FalloffType::Sphere;
    if (name == "tip")    return FalloffType::Tip;
    return std::nullopt;
}

float falloffWeight(float d, FalloffType type) noexcept
{
    d = std::clamp(d, 0.0f, 1.0f);
    switch (type) {
        case FalloffType::Linear: return 1.0f - d;
        case FalloffType::Smooth: return 1.0f - d * d * (3.0f - 2.0f * d);
        case FalloffType::Sphere: return std::sqrt(1.0f - d * d);
        case FalloffType::Tip:    return (1.0f - d) * (1.0f - d);
    }
    return 1.0f - d;
}

BrushFootprint brushFootprint(const TerrainConfig& cfg, int gridW, int gridH,
                              float worldX, float worldZ, float size)
{
    BrushFootprint fp;
    fp.center = worldToCell(cfg, gridW, gridH, worldX, worldZ);
    // size * cells / extent keeps whole-number ratios exact
    fp.radius = int(std::floor(double(size) * gridW / cfg.width));
    if (fp.radius <= 0) {
        std::ostringstream oss;
        oss << "Brush size " << size << " covers less than one cell on a " << gridW
            << "-cell terrain of width " << cfg.width;
        throw std::invalid_argument(oss.str());
    }
    return fp;
}

float averageHeight(const Heightmap& hm, int x, int y, int radius) noexcept
{
    float sum = 0.0f;
    int count = 0;
    for (int dy = -radius; dy <= radius; ++dy) {
        for (int dx = -radius; dx <= radius; ++dx) {
            if (!hm.inBounds(x + dx, y + dy)) continue;
            sum += hm.at(x + dx, y + dy);
            ++count;
        }
    }
    return count > 0 ? sum / float(count) : 0.0f;
}

void applyBrush(Heightmap& hm, const TerrainConfig& cfg, float worldX, float worldZ,
                const BrushSettings& brush, const SimplexNoise& noise)
{
    constexpr int kSmoothRadius = 3;

    const int W = hm.width(), H = hm.height();
    const BrushFootprint fp = brushFootprint(cfg, W, H, worldX, worldZ, brush.size);

    const float flattenTarget = brush.targetHeight.value_or(
        hm.atClamped(fp.center.x, fp.center.y));

    forEachBrushCell(fp, W, H, brush.falloff, [&](int px, int py, float falloff) {
        const float weight = brush.strength * falloff;
        float& h = hm.at(px, py);
        switch (brush.type) {
            case BrushType::Raise:
                h += weight;
                break;
            case BrushType::Lower:
                h -= weight;
                break;
            case BrushType::Smooth: {
                const float avg = averageHeight(hm, px, py, kSmoothRadius);
                h += (avg - h) * weight;
                break;
            }
            case BrushType::Flatten:
                h += (flattenTarget - h) * weight;
                break;
            case BrushType::Noise:
                h += noise.noise2D(float(px) * brush.noiseScale, float(py) * brush.noiseScale) * weight;
                break;
            case BrushType::Paint:
                break;
        }
    });

    hm.recomputeBounds();
}

} // namespace landforge::terrain
