#include "landforge/terrain/TerrainMesh.hpp"
#include "landforge/logging/Log.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace landforge::terrain {

static void requireAtLeastOne(const char* what, int value)
{
    if (value < 1) {
        std::ostringstream oss;
        oss << what << " must be >= 1 (got " << value << ")";
        throw std::invalid_argument(oss.str());
    }
}

// Emits vertices for the sample columns `xs` x rows `zs` (full-grid indices)
// and tessellates them. `step` is the sample distance used for normals.
static void emitGrid(const Heightmap& hm, const TerrainConfig& cfg,
                     const std::vector<int>& xs, const std::vector<int>& zs, int step,
                     TerrainMesh& mesh)
{
    const int W = hm.width(), H = hm.height();
    const float invW = 1.0f / float(std::max(W - 1, 1));
    const float invH = 1.0f / float(std::max(H - 1, 1));
    const float sx = cellSpacing(cfg, W) * float(step);
    const float sz = (H > 1 ? cfg.depth / float(H - 1) : cfg.depth) * float(step);
    // Offsets past the grid read the same clamped edge sample.
    const int reach = std::min(step, std::max(W, H));

    const size_t nx = xs.size(), nz = zs.size();
    mesh.positions.reserve(nx * nz * 3);
    mesh.normals.reserve(nx * nz * 3);
    mesh.uvs.reserve(nx * nz * 2);

    // ---- 1) Vertices (position, normal, uv) ----
    for (int gz : zs) {
        for (int gx : xs) {
            const float u = float(gx) * invW;
            const float v = float(gz) * invH;

            mesh.positions.push_back(gridToWorldX(cfg, u));
            mesh.positions.push_back(hm.at(gx, gz) + cfg.position[1]);
            mesh.positions.push_back(gridToWorldZ(cfg, v));

            // Central differences, clamped at the heightmap edge.
            const float hL = hm.atClamped(gx - reach, gz);
            const float hR = hm.atClamped(gx + reach, gz);
            const float hD = hm.atClamped(gx, gz - reach);
            const float hU = hm.atClamped(gx, gz + reach);

            float n[3] = { (hL - hR) / (2.0f * sx), 1.0f, (hD - hU) / (2.0f * sz) };
            const float len = std::sqrt(n[0] * n[0] + n[1] * n[1] + n[2] * n[2]);
            mesh.normals.push_back(n[0] / len);
            mesh.normals.push_back(n[1] / len);
            mesh.normals.push_back(n[2] / len);

            mesh.uvs.push_back(u);
            mesh.uvs.push_back(v);
        }
    }

    // ---- 2) Indices (two triangles per cell) ----
    if (nx < 2 || nz < 2) return;
    mesh.indices.reserve((nx - 1) * (nz - 1) * 6);
    for (size_t z = 0; z + 1 < nz; ++z) {
        for (size_t x = 0; x + 1 < nx; ++x) {
            const auto topLeft     = std::uint32_t(z * nx + x);
            const auto topRight    = topLeft + 1;
            const auto bottomLeft  = std::uint32_t((z + 1) * nx + x);
            const auto bottomRight = bottomLeft + 1;

            mesh.indices.push_back(topLeft);
            mesh.indices.push_back(bottomLeft);
            mesh.indices.push_back(topRight);

            mesh.indices.push_back(topRight);
            mesh.indices.push_back(bottomLeft);
            mesh.indices.push_back(bottomRight);
        }
    }
}

// Sample indices start, start+lod, ... up to and including last.
static std::vector<int> strideSamples(int start, int last, int lod)
{
    std::vector<int> out;
    for (long long i = start; i < last; i += lod) out.push_back(int(i));
    out.push_back(last);
    return out;
}

Heightmap downsample(const Heightmap& hm, int lodLevel)
{
    requireAtLeastOne("LOD level", lodLevel);
    if (hm.empty()) return hm;

    const int W = hm.width(), H = hm.height();
    const int outW = (W - 1) / lodLevel + 1;
    const int outH = (H - 1) / lodLevel + 1;

    Heightmap out(outW, outH);
    for (int y = 0; y < outH; ++y) {
        for (int x = 0; x < outW; ++x) {
            float sum = 0.0f;
            int count = 0;
            const int x1 = int(std::min<long long>((long long)(x + 1) * lodLevel, W));
            const int y1 = int(std::min<long long>((long long)(y + 1) * lodLevel, H));
            for (int sy = y * lodLevel; sy < y1; ++sy)
                for (int sx = x * lodLevel; sx < x1; ++sx) {
                    sum += hm.at(sx, sy);
                    ++count;
                }
            out.at(x, y) = sum / float(count);
        }
    }
    out.recomputeBounds();
    return out;
}

TerrainMesh buildMesh(const Heightmap& hm, const TerrainConfig& cfg)
{
    const int W = hm.width(), H = hm.height();
    if (W < 2 || H < 2) {
        std::ostringstream oss;
        oss << "Mesh grid must be at least 2x2 (got " << W << "x" << H << ")";
        throw std::invalid_argument(oss.str());
    }

    std::vector<int> xs(static_cast<size_t>(W)), zs(static_cast<size_t>(H));
    for (int i = 0; i < W; ++i) xs[size_t(i)] = i;
    for (int i = 0; i < H; ++i) zs[size_t(i)] = i;

    TerrainMesh mesh;
    emitGrid(hm, cfg, xs, zs, 1, mesh);

    logsys::get()->debug("Built terrain mesh {}x{}: {} vertices, {} triangles",
                         W, H, mesh.vertexCount(), mesh.triangleCount());
    return mesh;
}

std::optional<TerrainMesh> getChunk(const Heightmap& hm, const TerrainConfig& cfg,
                                    int chunkX, int chunkZ, int chunkSize, int lodLevel)
{
    requireAtLeastOne("Chunk size", chunkSize);
    requireAtLeastOne("LOD level", lodLevel);

    const int W = hm.width(), H = hm.height();
    if (chunkX < 0 || chunkZ < 0) return std::nullopt;

    const long long startX = (long long)chunkX * chunkSize;
    const long long startZ = (long long)chunkZ * chunkSize;
    if (startX >= W - 1 || startZ >= H - 1) return std::nullopt;

    const int lastX = int(std::min<long long>(startX + chunkSize, W - 1));
    const int lastZ = int(std::min<long long>(startZ + chunkSize, H - 1));

    TerrainMesh mesh;
    emitGrid(hm, cfg, strideSamples(int(startX), lastX, lodLevel),
             strideSamples(int(startZ), lastZ, lodLevel), lodLevel, mesh);
    return mesh;
}

int lodForDistance(float distance, const std::vector<float>& thresholds) noexcept
{
    for (size_t i = thresholds.size(); i-- > 0;) {
        if (distance >= thresholds[i]) return 1 << std::min<size_t>(i, 30);
    }
    return 1;
}

} // namespace landforge::terrain
