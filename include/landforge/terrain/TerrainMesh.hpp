#pragma once
#include <cstdint>
#include <optional>
#include <vector>

#include "landforge/terrain/Heightmap.hpp"

namespace landforge::terrain {

// Flat, API-neutral geometry buffers handed to a renderer.
struct TerrainMesh {
    std::vector<float>         positions;  // xyz per vertex (world space, Y up)
    std::vector<float>         normals;    // xyz per vertex, unit length
    std::vector<float>         uvs;        // uv per vertex, full-terrain space
    std::vector<std::uint32_t> indices;    // 3 per triangle

    [[nodiscard]] size_t vertexCount()   const noexcept { return positions.size() / 3; }
    [[nodiscard]] size_t triangleCount() const noexcept { return indices.size() / 3; }
};

// Box-averaged copy at 1/lodLevel resolution: ceil(W/L) x ceil(H/L) cells.
// Edge blocks average only the samples that exist. lodLevel 1 returns a copy.
// Throws std::invalid_argument for lodLevel < 1.
[[nodiscard]] Heightmap downsample(const Heightmap& hm, int lodLevel);

// One vertex per sample, two triangles per cell, spanning the terrain's world
// extent. Throws std::invalid_argument for grids smaller than 2x2.
[[nodiscard]] TerrainMesh buildMesh(const Heightmap& hm, const TerrainConfig& cfg);

// Sub-mesh for the chunk covering samples [c*size, c*size + size] on each axis,
// point-sampled every lodLevel samples. The chunk's last row/column is always
// included so neighbouring chunks share edge vertices. UVs stay in
// full-terrain space. nullopt when the chunk has no cells on the grid.
// Throws std::invalid_argument for chunkSize < 1 or lodLevel < 1.
[[nodiscard]] std::optional<TerrainMesh> getChunk(const Heightmap& hm, const TerrainConfig& cfg,
                                                  int chunkX, int chunkZ, int chunkSize, int lodLevel);

// 2^i for the largest i with distance >= thresholds[i]; 1 when none match.
// thresholds must be sorted ascending.
[[nodiscard]] int lodForDistance(float distance, const std::vector<float>& thresholds) noexcept;

} // namespace landforge::terrain
