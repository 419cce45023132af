#include "landforge/terrain/HeightmapGenerator.hpp"
#include "landforge/terrain/DeterministicRNG.hpp"
#include "landforge/terrain/ErosionSimulator.hpp"
#include "landforge/logging/Log.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace landforge::terrain {

namespace {

inline std::uint32_t mix32(std::uint32_t v) {
    v ^= v >> 16; v *= 0x7feb352dU;
    v ^= v >> 15; v *= 0x846ca68bU;
    v ^= v >> 16;
    return v;
}

// Stable [0,1) value per integer cell.
inline float cellHash01(int a, int b) {
    const std::uint32_t h = mix32(std::uint32_t(a) * 73856093u ^ std::uint32_t(b) * 19349663u);
    return float(h & 0xFFFFFFu) / float(0x1000000u);
}

} // namespace

const char* toString(GeneratorKind kind) noexcept
{
    switch (kind) {
        case GeneratorKind::Perlin:    return "perlin";
        case GeneratorKind::Fbm:       return "fbm";
        case GeneratorKind::Ridged:    return "ridged";
        case GeneratorKind::Voronoi:   return "voronoi";
        case GeneratorKind::Hydraulic: return "hydraulic";
    }
    return "unknown";
}

std::optional<GeneratorKind> parseGeneratorKind(std::string_view name) noexcept
{
    if (name == "perlin")    return GeneratorKind::Perlin;
    if (name == "fbm")       return GeneratorKind::Fbm;
    if (name == "ridged")    return GeneratorKind::Ridged;
    if (name == "voronoi")   return GeneratorKind::Voronoi;
    if (name == "hydraulic") return GeneratorKind::Hydraulic;
    return std::nullopt;
}

float layeredNoise(const SimplexNoise& n, float x, float y,
                   float scale, int octaves, float persistence) noexcept
{
    float total = 0.0f, frequency = 1.0f, amplitude = 1.0f, maxValue = 0.0f;
    for (int i = 0; i < octaves; ++i) {
        total    += n.noise2D(x * frequency / scale, y * frequency / scale) * amplitude;
        maxValue += amplitude;
        amplitude *= persistence;
        frequency *= 2.0f;
    }
    if (maxValue <= 0.0f) return 0.5f;
    return (total / maxValue + 1.0f) * 0.5f;
}

float ridgedNoise(const SimplexNoise& n, float x, float y,
                  float scale, int octaves, float persistence, float power) noexcept
{
    float total = 0.0f, frequency = 1.0f, amplitude = 1.0f, maxValue = 0.0f;
    for (int i = 0; i < octaves; ++i) {
        const float ridged = 1.0f - std::abs(n.noise2D(x * frequency / scale, y * frequency / scale));
        total    += std::pow(std::max(ridged, 0.0f), power) * amplitude;
        maxValue += amplitude;
        amplitude *= persistence;
        frequency *= 2.0f;
    }
    return maxValue > 0.0f ? total / maxValue : 0.0f;
}

float voronoiNoise(float x, float y, float scale, float falloff) noexcept
{
    const float sx = x / scale;
    const float sy = y / scale;
    const int   ix = int(std::floor(sx));
    const int   iy = int(std::floor(sy));

    float minDist = std::numeric_limits<float>::infinity();
    for (int dy = -1; dy <= 1; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
            const int cx = ix + dx;
            const int cy = iy + dy;
            // keep the feature point away from the cell border
            const float px = float(cx) + cellHash01(cx, cy) * 0.9f + 0.05f;
            const float py = float(cy) + cellHash01(cy, cx) * 0.9f + 0.05f;
            minDist = std::min(minDist, std::hypot(sx - px, sy - py));
        }
    }
    return std::pow(1.0f - std::min(minDist, 1.0f), falloff);
}

void generateHeightmap(Heightmap& hm, GeneratorKind kind, const GeneratorParams& p, SimplexNoise& noise)
{
    if (p.octaves < 1) {
        std::ostringstream oss;
        oss << "Heightmap generator '" << toString(kind) << "' needs octaves >= 1 (got " << p.octaves << ")";
        throw std::invalid_argument(oss.str());
    }
    if (!(p.scale > 0.0f)) {
        std::ostringstream oss;
        oss << "Heightmap generator '" << toString(kind) << "' needs a positive scale (got " << p.scale << ")";
        throw std::invalid_argument(oss.str());
    }

    noise.reseed(p.seed.value_or(entropySeed()));

    const int W = hm.width(), H = hm.height();
    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            const float fx = float(x), fy = float(y);
            float v = 0.0f;
            switch (kind) {
                case GeneratorKind::Perlin:
                case GeneratorKind::Fbm:
                case GeneratorKind::Hydraulic:
                    v = layeredNoise(noise, fx, fy, p.scale, p.octaves, p.persistence);
                    break;
                case GeneratorKind::Ridged:
                    v = ridgedNoise(noise, fx, fy, p.scale, p.octaves, p.persistence, p.ridgePower);
                    break;
                case GeneratorKind::Voronoi:
                    v = voronoiNoise(fx, fy, p.scale, p.falloff);
                    break;
            }
            hm.at(x, y) = v * p.amplitude;
        }
    }
    hm.recomputeBounds();

    if (kind == GeneratorKind::Hydraulic && p.erosionIterations > 0) {
        ErosionSettings erosion;
        erosion.iterations         = p.erosionIterations;
        erosion.erosionStrength    = 0.3f;
        erosion.depositionStrength = 0.3f;
        erosion.sedimentCapacity   = 4.0f;
        erosion.evaporationRate    = 0.02f;
        erosion.minSlope           = 0.01f;
        erosion.gravity            = 4.0f;
        erosion.rainAmount         = 1.0f;
        erosion.thermalErosion     = false;
        erosion.seed               = noise.seed();
        simulateHydraulic(hm, erosion);
    }

    logsys::get()->debug("Generated {}x{} heightmap ({}), range [{}, {}]",
                         W, H, toString(kind), hm.minHeight(), hm.maxHeight());
}

} // namespace landforge::terrain
