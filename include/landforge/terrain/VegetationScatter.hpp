#pragma once
// ============================================================================
// VegetationScatter.hpp - grid-probe scatterer for trees, grass and details
//
// Probes are laid on a regular grid whose spacing is sqrt(1/density) cells.
// Each probe is rejected by normalized height (percent of the heightmap range),
// slope angle (degrees) and a simplex-noise mask; survivors are jittered inside
// their probe cell and recorded in world space.
//
// `density` is a target average; the noise mask makes the count approximate.
// ============================================================================

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "landforge/terrain/Heightmap.hpp"
#include "landforge/terrain/SimplexNoise.hpp"

namespace landforge::terrain {

struct TreePrototype {
    std::string id;
    std::string name;
    std::string prefab;
    float bendFactor = 0.0f;
    float minWidth   = 1.0f, maxWidth  = 1.0f;
    float minHeight  = 1.0f, maxHeight = 1.0f;
    std::array<float, 3> color{ 1.0f, 1.0f, 1.0f };
    std::array<float, 3> lightmapColor{ 1.0f, 1.0f, 1.0f };
};

enum class GrassRenderMode : std::uint8_t { Billboard, Cross, Mesh };

struct GrassPrototype {
    std::string id;
    std::string name;
    std::string texture;
    float minWidth  = 1.0f, maxWidth  = 1.0f;
    float minHeight = 1.0f, maxHeight = 1.0f;
    float noiseSpread = 0.1f;
    std::array<float, 3> healthyColor{ 0.3f, 0.6f, 0.2f };
    std::array<float, 3> dryColor{ 0.6f, 0.5f, 0.2f };
    GrassRenderMode renderMode = GrassRenderMode::Billboard;
};

struct DetailLayer {
    std::string id;
    std::string prototype;            // tree or grass prototype id
    float density        = 0.01f;     // probes per cell
    float minScale       = 1.0f;
    float maxScale       = 1.0f;
    bool  alignToGround  = true;
    bool  randomRotation = true;
    float slopeLimit     = 30.0f;
    std::array<float, 2> heightRange{ 0.0f, 100.0f };
    float noiseScale     = 0.1f;
    float noiseThreshold = 0.5f;
};

struct ScatterFilters {
    float slopeLimit     = 30.0f;                // degrees
    std::array<float, 2> heightRange{ 0.0f, 100.0f }; // percent of height range
    float noiseScale     = 0.1f;
    float noiseThreshold = 0.5f;                 // reject when noise < threshold
    std::optional<std::uint64_t> seed;           // jitter/rotation/scale draws
};

struct PlacedInstance {
    std::string prototypeId;
    std::array<float, 3> position{};
    float rotation = 0.0f;                       // yaw, radians
    std::array<float, 3> scale{ 1.0f, 1.0f, 1.0f };
};

// Width/height ranges come from the tree prototype; xz share the width draw.
// Appends to `out` and returns the number placed.
// Throws std::invalid_argument when density is not finite and > 0, or when the
// probe grid would exceed 2^26 probes.
int autoPlaceTrees(const Heightmap& hm, const TerrainConfig& cfg, const SimplexNoise& noise,
                   const TreePrototype& prototype, float density, const ScatterFilters& filters,
                   std::vector<PlacedInstance>& out);

// Uses the detail layer's own filters; uniform scale in [minScale, maxScale].
// Same density rules as autoPlaceTrees.
int autoPlaceDetails(const Heightmap& hm, const TerrainConfig& cfg, const SimplexNoise& noise,
                     const DetailLayer& layer, std::optional<std::uint64_t> seed,
                     std::vector<PlacedInstance>& out);

} // namespace landforge::terrain
