#pragma once
#include "landforge/terrain/Heightmap.hpp"
#include <cstdint>
#include <optional>

namespace landforge::terrain {

struct ErosionSettings {
    int   iterations         = 1000;   // droplets
    float erosionStrength    = 0.3f;
    float depositionStrength = 0.3f;
    float sedimentCapacity   = 4.0f;
    float evaporationRate    = 0.02f;  // water *= (1 - rate) per step
    float minSlope           = 0.01f;  // capacity floor
    float gravity            = 4.0f;
    float rainAmount         = 1.0f;   // initial water per droplet

    bool  thermalErosion     = false;
    float thermalStrength    = 0.5f;
    float thermalAngle       = 30.0f;  // talus angle, degrees

    std::optional<std::uint64_t> seed; // droplet spawns; random when unset
};

struct ErosionStats {
    int droplets        = 0;
    int steps           = 0;
    int degenerateStops = 0;  // droplets ended on a near-zero flow direction
    int thermalMoves    = 0;
};

// Droplet hydraulic erosion followed, when settings.thermalErosion is set, by
// one thermal pass. Droplets only sample interior cells so every neighbour read
// stays on the grid. Bounds are recomputed before returning.
ErosionStats simulateHydraulic(Heightmap& hm, const ErosionSettings& settings);

// One talus relaxation pass over interior cells, accumulated in a delta buffer.
// Returns the number of cells that shed material. Does not touch the bounds.
int applyThermalErosion(Heightmap& hm, float strength, float talusAngleDeg);

} // namespace landforge::terrain
