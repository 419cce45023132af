#include "landforge/terrain/SplatMap.hpp"
#include "landforge/logging/Log.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace landforge::terrain {

std::optional<BlendMode> parseBlendMode(std::string_view name) noexcept
{
    if (name == "height") return BlendMode::Height;
    if (name == "slope")  return BlendMode::Slope;
    if (name == "custom") return BlendMode::Custom;
    return std::nullopt;
}

std::optional<ZeroWeightPolicy> parseZeroWeightPolicy(std::string_view name) noexcept
{
    if (name == "leave_empty")  return ZeroWeightPolicy::LeaveEmpty;
    if (name == "uniform")      return ZeroWeightPolicy::Uniform;
    if (name == "nearest_band") return ZeroWeightPolicy::NearestBand;
    return std::nullopt;
}

float bandDistance(const BlendBand& band, float value) noexcept
{
    if (value < band.min) return band.min - value;
    if (value > band.max) return value - band.max;
    return 0.0f;
}

float bandWeight(const BlendBand& band, float value) noexcept
{
    const float d = bandDistance(band, value);
    if (d <= 0.0f) return 1.0f;
    if (band.falloff <= 0.0f) return 0.0f;
    return std::max(0.0f, 1.0f - d / band.falloff);
}

SplatMap::SplatMap(int w, int h)
    : width(w), height(h), channels(kSplatChannels),
      data(size_t(w) * size_t(h) * kSplatChannels, 0.0f)
{}

int splatMapsNeeded(int layerCount) noexcept
{
    return layerCount <= 0 ? 0 : (layerCount + kSplatChannels - 1) / kSplatChannels;
}

bool paintLayer(std::vector<SplatMap>& maps, const TerrainConfig& cfg, float worldX, float worldZ,
                int layerIndex, const BrushSettings& brush)
{
    if (layerIndex < 0) return false;
    const size_t mapIndex = size_t(layerIndex / kSplatChannels);
    const int    channel  = layerIndex % kSplatChannels;
    if (mapIndex >= maps.size()) return false;

    SplatMap& map = maps[mapIndex];
    const BrushFootprint fp = brushFootprint(cfg, map.width, map.height, worldX, worldZ, brush.size);

    forEachBrushCell(fp, map.width, map.height, brush.falloff, [&](int px, int py, float falloff) {
        float* texel = &map.at(px, py, 0);
        texel[channel] += brush.strength * falloff;

        float total = 0.0f;
        for (int c = 0; c < map.channels; ++c) total += texel[c];
        if (total > 0.0f)
            for (int c = 0; c < map.channels; ++c) texel[c] /= total;
    });
    return true;
}

SplatGenerationStats autoGenerateSplatMaps(const Heightmap& hm, const std::vector<TerrainLayer>& layers,
                                           std::vector<SplatMap>& maps, float spacing,
                                           ZeroWeightPolicy policy)
{
    SplatGenerationStats stats;
    if (layers.empty()) return stats;

    const int W = hm.width(), H = hm.height();
    const size_t needed = size_t(splatMapsNeeded(int(layers.size())));
    while (maps.size() < needed) maps.emplace_back(W, H);
    for (auto& m : maps) {
        if (m.width != W || m.height != H || m.channels != kSplatChannels)
            m = SplatMap(W, H);
        else
            std::fill(m.data.begin(), m.data.end(), 0.0f);
    }

    const float minH  = hm.minHeight();
    const float range = hm.heightRange();

    std::vector<float> weights(layers.size(), 0.0f);
    std::vector<float> distances(layers.size(), 0.0f);

    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            const float heightPct = (hm.at(x, y) - minH) / range * 100.0f;
            const float slopeDeg  = slopeDegreesAt(hm, x, y, spacing);

            float total = 0.0f;
            for (size_t i = 0; i < layers.size(); ++i) {
                const TerrainLayer& L = layers[i];
                float w = 0.0f;
                float d = std::numeric_limits<float>::infinity();
                if (L.blend == BlendMode::Height && L.heightBlend) {
                    w = bandWeight(*L.heightBlend, heightPct);
                    d = bandDistance(*L.heightBlend, heightPct);
                } else if (L.blend == BlendMode::Slope && L.slopeBlend) {
                    w = bandWeight(*L.slopeBlend, slopeDeg);
                    d = bandDistance(*L.slopeBlend, slopeDeg);
                }
                weights[i]   = w;
                distances[i] = d;
                total += w;
            }
            ++stats.texels;

            if (total <= 0.0f) {
                ++stats.zeroWeightTexels;
                if (policy == ZeroWeightPolicy::LeaveEmpty) continue;
                if (policy == ZeroWeightPolicy::Uniform) {
                    std::fill(weights.begin(), weights.end(), 1.0f);
                    total = float(layers.size());
                } else {
                    const auto nearest = std::min_element(distances.begin(), distances.end());
                    // layers with no usable band report infinite distance
                    if (!std::isfinite(*nearest)) continue;
                    weights[size_t(nearest - distances.begin())] = 1.0f;
                    total = 1.0f;
                }
            }

            for (size_t i = 0; i < layers.size(); ++i)
                maps[i / kSplatChannels].at(x, y, int(i % kSplatChannels)) = weights[i] / total;
        }
    }

    if (stats.zeroWeightTexels > 0) {
        logsys::get()->warn("Splat generation: {} of {} texels matched no layer band",
                            stats.zeroWeightTexels, stats.texels);
    }
    return stats;
}

} // namespace landforge::terrain
