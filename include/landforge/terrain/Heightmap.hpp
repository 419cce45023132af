#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace landforge::terrain {

// Row-major elevation grid (y*W + x) with cached bounds.
// minHeight/maxHeight are only trustworthy after recomputeBounds(); every
// mutating operation in this library calls it before returning.
class Heightmap {
public:
    Heightmap() = default;
    Heightmap(int w, int h, float init = 0.0f);

    void resize(int w, int h, float init = 0.0f);

    [[nodiscard]] int    width()  const noexcept { return w_; }
    [[nodiscard]] int    height() const noexcept { return h_; }
    [[nodiscard]] size_t size()   const noexcept { return data_.size(); }
    [[nodiscard]] bool   empty()  const noexcept { return data_.empty(); }

    [[nodiscard]] size_t idx(int x, int y) const noexcept {
        return size_t(y) * size_t(w_) + size_t(x);
    }
    [[nodiscard]] bool inBounds(int x, int y) const noexcept {
        return x >= 0 && y >= 0 && x < w_ && y < h_;
    }

    float& at(int x, int y)       noexcept { return data_[idx(x, y)]; }
    float  at(int x, int y) const noexcept { return data_[idx(x, y)]; }

    // Edge-clamped read, used by normal and slope estimation.
    [[nodiscard]] float atClamped(int x, int y) const noexcept;

    float*       data()       noexcept { return data_.data(); }
    const float* data() const noexcept { return data_.data(); }
    std::vector<float>&       values()       noexcept { return data_; }
    const std::vector<float>& values() const noexcept { return data_; }

    void fill(float v);

    // Full O(W*H) scan; empty grids get (0, 0).
    void recomputeBounds() noexcept;

    [[nodiscard]] float minHeight() const noexcept { return min_; }
    [[nodiscard]] float maxHeight() const noexcept { return max_; }
    // max - min, or 1 when the grid is flat (avoids dividing by zero).
    [[nodiscard]] float heightRange() const noexcept;

private:
    int w_ = 0, h_ = 0;
    std::vector<float> data_;
    float min_ = 0.0f, max_ = 0.0f;
};

using Vec3 = std::array<float, 3>;

struct TerrainConfig {
    std::string id;
    std::string name       = "New Terrain";
    float       width      = 256.0f;  // world X extent
    float       depth      = 256.0f;  // world Z extent
    float       height     = 100.0f;  // max elevation scale (raster import)
    int         resolution = 257;     // heightmap is resolution x resolution
    Vec3        position   { 0.0f, 0.0f, 0.0f };
};

// Throws std::invalid_argument for non-positive extents or resolution.
void validateConfig(const TerrainConfig& cfg);

struct GridPoint { int x = 0; int y = 0; };

// World -> cell used by brushes and painting: floor(((p - origin)/extent + 0.5) * cells).
[[nodiscard]] GridPoint worldToCell(const TerrainConfig& cfg, int gridW, int gridH,
                                    float worldX, float worldZ) noexcept;

// Normalized grid (u,v) in [0,1]^2 -> world X/Z.
[[nodiscard]] float gridToWorldX(const TerrainConfig& cfg, float u) noexcept;
[[nodiscard]] float gridToWorldZ(const TerrainConfig& cfg, float v) noexcept;

// Horizontal spacing between adjacent samples along X.
[[nodiscard]] float cellSpacing(const TerrainConfig& cfg, int gridW) noexcept;

// Bilinear elevation (plus position.y) at a world position; nullopt off-grid.
[[nodiscard]] std::optional<float> sampleHeightAt(const Heightmap& hm, const TerrainConfig& cfg,
                                                  float worldX, float worldZ);

// Slope magnitude from central differences, 0 on the border ring.
[[nodiscard]] float slopeAt(const Heightmap& hm, int x, int y, float spacing = 1.0f) noexcept;

// Slope angle in degrees: asin(clamp(slope, 0, 1)).
[[nodiscard]] float slopeDegreesAt(const Heightmap& hm, int x, int y, float spacing = 1.0f) noexcept;

} // namespace landforge::terrain
