#include "landforge/terrain/VegetationScatter.hpp"
#include "landforge/terrain/DeterministicRNG.hpp"
#include "landforge/logging/Log.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>

namespace landforge::terrain {

namespace {

constexpr float kTwoPi = 6.28318530717958647692f;
constexpr std::int64_t kMaxProbes = std::int64_t(1) << 26;

struct ProbeFilter {
    float slopeLimit;
    float heightMin, heightMax;
    float noiseScale;
    float noiseThreshold;
};

// Accepted probe, already in world space.
struct Probe {
    std::array<float, 3> position;
};

void requirePositiveDensity(float density)
{
    if (!(density > 0.0f) || !std::isfinite(density)) {
        std::ostringstream oss;
        oss << "Scatter density must be finite and > 0 (got " << density << ")";
        throw std::invalid_argument(oss.str());
    }
}

// Walks the probe grid, applies the filters, and calls emit(probe) for every
// accepted probe. Jitter is drawn from `rng` and kept on the grid.
template <class Emit>
void scatterProbes(const Heightmap& hm, const TerrainConfig& cfg, const SimplexNoise& noise,
                   float density, const ProbeFilter& f, PCG32& rng, Emit&& emit)
{
    requirePositiveDensity(density);

    const int W = hm.width(), H = hm.height();
    if (W < 1 || H < 1) return;

    const float spacing   = std::sqrt(1.0f / density);
    const double probes = std::ceil(double(W) / spacing) * std::ceil(double(H) / spacing);
    if (!(spacing > 0.0f) || probes > double(kMaxProbes)) {
        std::ostringstream oss;
        oss << "Scatter density " << density << " needs " << probes << " probes on a "
            << W << "x" << H << " grid (limit " << kMaxProbes << ")";
        throw std::invalid_argument(oss.str());
    }
    const float cellWorld = cellSpacing(cfg, W);
    const float minH      = hm.minHeight();
    const float range     = hm.heightRange();
    const float maxX      = float(std::max(W - 1, 1));
    const float maxY      = float(std::max(H - 1, 1));

    // Probe j sits at j * spacing, so rows and columns never drift.
    for (int j = 0; float(j) * spacing < float(H); ++j) {
        const float py = float(j) * spacing;
        for (int i = 0; float(i) * spacing < float(W); ++i) {
            const float px = float(i) * spacing;
            const int cx = int(px), cy = int(py);
            const float h = hm.at(cx, cy);

            const float heightPct = (h - minH) / range * 100.0f;
            if (heightPct < f.heightMin || heightPct > f.heightMax) continue;

            if (slopeDegreesAt(hm, cx, cy, cellWorld) > f.slopeLimit) continue;

            if (noise.noise2D(px * f.noiseScale, py * f.noiseScale) < f.noiseThreshold) continue;

            const float jx = std::clamp(px + rng.uniform(-0.5f, 0.5f) * spacing, 0.0f, maxX);
            const float jy = std::clamp(py + rng.uniform(-0.5f, 0.5f) * spacing, 0.0f, maxY);

            Probe probe;
            probe.position = { gridToWorldX(cfg, jx / maxX),
                               h + cfg.position[1],
                               gridToWorldZ(cfg, jy / maxY) };
            emit(probe);
        }
    }
}

} // namespace

int autoPlaceTrees(const Heightmap& hm, const TerrainConfig& cfg, const SimplexNoise& noise,
                   const TreePrototype& prototype, float density, const ScatterFilters& filters,
                   std::vector<PlacedInstance>& out)
{
    const ProbeFilter f{ filters.slopeLimit, filters.heightRange[0], filters.heightRange[1],
                         filters.noiseScale, filters.noiseThreshold };
    PCG32 rng(filters.seed.value_or(entropySeed()));

    int placed = 0;
    scatterProbes(hm, cfg, noise, density, f, rng, [&](const Probe& probe) {
        PlacedInstance inst;
        inst.prototypeId = prototype.id;
        inst.position    = probe.position;
        inst.rotation    = rng.uniform(0.0f, kTwoPi);
        const float w    = rng.uniform(prototype.minWidth, prototype.maxWidth);
        const float h    = rng.uniform(prototype.minHeight, prototype.maxHeight);
        inst.scale       = { w, h, w };
        out.push_back(std::move(inst));
        ++placed;
    });

    logsys::get()->debug("Scattered {} '{}' trees (density {})", placed, prototype.id, density);
    return placed;
}

int autoPlaceDetails(const Heightmap& hm, const TerrainConfig& cfg, const SimplexNoise& noise,
                     const DetailLayer& layer, std::optional<std::uint64_t> seed,
                     std::vector<PlacedInstance>& out)
{
    const ProbeFilter f{ layer.slopeLimit, layer.heightRange[0], layer.heightRange[1],
                         layer.noiseScale, layer.noiseThreshold };
    PCG32 rng(seed.value_or(entropySeed()));

    int placed = 0;
    scatterProbes(hm, cfg, noise, layer.density, f, rng, [&](const Probe& probe) {
        PlacedInstance inst;
        inst.prototypeId = layer.prototype;
        inst.position    = probe.position;
        inst.rotation    = layer.randomRotation ? rng.uniform(0.0f, kTwoPi) : 0.0f;
        const float s    = rng.uniform(layer.minScale, layer.maxScale);
        inst.scale       = { s, s, s };
        out.push_back(std::move(inst));
        ++placed;
    });

    logsys::get()->debug("Scattered {} details for layer '{}'", placed, layer.id);
    return placed;
}

} // namespace landforge::terrain
