#include "landforge/terrain/ErosionSimulator.hpp"
#include "landforge/terrain/DeterministicRNG.hpp"
#include "landforge/logging/Log.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace landforge::terrain {

static constexpr int   kMaxDropletSteps = 100;
static constexpr float kMinDirection    = 0.01f;
static constexpr float kMinWater        = 0.01f;

ErosionStats simulateHydraulic(Heightmap& H, const ErosionSettings& s)
{
    ErosionStats stats;
    const int W = H.width(), Hh = H.height();

    // Droplets need a full 4-neighbourhood, so grids under 3x3 have no interior.
    if (s.iterations > 0 && W >= 3 && Hh >= 3) {
        PCG32 rng(s.seed.value_or(entropySeed()));
        float* data = H.data();

        for (int it = 0; it < s.iterations; ++it) {
            float x = rng.uniform(0.0f, float(W - 1));
            float y = rng.uniform(0.0f, float(Hh - 1));
            float dirX = 0.0f, dirY = 0.0f;
            float speed = 1.0f;
            float water = s.rainAmount;
            float sediment = 0.0f;
            ++stats.droplets;

            for (int step = 0; step < kMaxDropletSteps; ++step) {
                const int ix = int(std::floor(x));
                const int iy = int(std::floor(y));
                if (ix < 1 || ix >= W - 1 || iy < 1 || iy >= Hh - 1) break;

                const size_t i = H.idx(ix, iy);
                const float gradX = H.at(ix + 1, iy) - H.at(ix - 1, iy);
                const float gradY = H.at(ix, iy + 1) - H.at(ix, iy - 1);

                dirX = dirX * 0.5f - gradX * 0.5f;
                dirY = dirY * 0.5f - gradY * 0.5f;

                const float len = std::sqrt(dirX * dirX + dirY * dirY);
                if (len < kMinDirection) { ++stats.degenerateStops; break; }
                dirX /= len;
                dirY /= len;

                const float nx = x + dirX;
                const float ny = y + dirY;
                const int nix = int(std::floor(nx));
                const int niy = int(std::floor(ny));
                if (!H.inBounds(nix, niy)) break;

                const float deltaHeight = H.at(nix, niy) - data[i];
                const float capacity = std::max(-deltaHeight * speed * water * s.sedimentCapacity, s.minSlope);

                if (sediment > capacity || deltaHeight > 0.0f) {
                    const float deposit = deltaHeight > 0.0f
                        ? std::min(deltaHeight, sediment)
                        : (sediment - capacity) * s.depositionStrength;
                    sediment -= deposit;
                    data[i]  += deposit;
                } else {
                    const float erode = std::min((capacity - sediment) * s.erosionStrength, -deltaHeight);
                    sediment += erode;
                    data[i]  -= erode;
                }

                speed = std::sqrt(std::max(0.0f, speed * speed + deltaHeight * s.gravity));
                water *= (1.0f - s.evaporationRate);
                x = nx;
                y = ny;
                ++stats.steps;

                if (water < kMinWater) break;
            }
        }
    }

    if (s.thermalErosion)
        stats.thermalMoves = applyThermalErosion(H, s.thermalStrength, s.thermalAngle);

    H.recomputeBounds();

    auto log = logsys::get();
    log->debug("Hydraulic erosion: {} droplets, {} steps, thermal moves {}",
               stats.droplets, stats.steps, stats.thermalMoves);
    if (stats.droplets > 0 && stats.degenerateStops == stats.droplets)
        log->warn("Hydraulic erosion: all {} droplets stopped on a flat gradient, heightmap unchanged",
                  stats.droplets);
    return stats;
}

int applyThermalErosion(Heightmap& H, float strength, float talusAngleDeg)
{
    const int W = H.width(), Hh = H.height();
    if (W < 3 || Hh < 3) return 0;

    const float tanAngle = std::tan(talusAngleDeg * 3.14159265358979323846f / 180.0f);
    std::vector<float> delta(H.size(), 0.0f);
    int moves = 0;

    for (int y = 1; y < Hh - 1; ++y) {
        for (int x = 1; x < W - 1; ++x) {
            const size_t i = H.idx(x, y);
            const float  h = H.at(x, y);
            const size_t n[4] = { H.idx(x - 1, y), H.idx(x + 1, y), H.idx(x, y - 1), H.idx(x, y + 1) };

            float  maxDelta = 0.0f;
            size_t target   = i;
            for (size_t k : n) {
                const float d = h - H.data()[k];
                if (d > tanAngle && d > maxDelta) {
                    maxDelta = d;
                    target   = k;
                }
            }
            if (target == i) continue;

            const float transfer = (maxDelta - tanAngle) * strength * 0.5f;
            delta[i]      -= transfer;
            delta[target] += transfer;
            ++moves;
        }
    }

    float* data = H.data();
    for (size_t i = 0; i < delta.size(); ++i) data[i] += delta[i];
    return moves;
}

} // namespace landforge::terrain
