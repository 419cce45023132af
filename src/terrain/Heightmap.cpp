#include "landforge/terrain/Heightmap.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace landforge::terrain {

Heightmap::Heightmap(int w, int h, float init)
{
    resize(w, h, init);
}

void Heightmap::resize(int w, int h, float init)
{
    if (w <= 0 || h <= 0) {
        std::ostringstream oss;
        oss << "Heightmap dimensions must be positive (got " << w << "x" << h << ")";
        throw std::invalid_argument(oss.str());
    }
    w_ = w; h_ = h;
    data_.assign(size_t(w) * size_t(h), init);
    min_ = max_ = init;
}

float Heightmap::atClamped(int x, int y) const noexcept
{
    x = std::clamp(x, 0, w_ - 1);
    y = std::clamp(y, 0, h_ - 1);
    return data_[idx(x, y)];
}

void Heightmap::fill(float v)
{
    std::fill(data_.begin(), data_.end(), v);
    min_ = max_ = v;
}

void Heightmap::recomputeBounds() noexcept
{
    if (data_.empty()) {
        min_ = max_ = 0.0f;
        return;
    }
    float lo = std::numeric_limits<float>::infinity();
    float hi = -std::numeric_limits<float>::infinity();
    for (float v : data_) {
        lo = std::min(lo, v);
        hi = std::max(hi, v);
    }
    min_ = lo;
    max_ = hi;
}

float Heightmap::heightRange() const noexcept
{
    const float r = max_ - min_;
    return r > 0.0f ? r : 1.0f;
}

void validateConfig(const TerrainConfig& cfg)
{
    if (!(cfg.width > 0.0f) || !(cfg.depth > 0.0f)) {
        std::ostringstream oss;
        oss << "Terrain '" << cfg.id << "' must have positive width/depth (got "
            << cfg.width << "x" << cfg.depth << ")";
        throw std::invalid_argument(oss.str());
    }
    if (cfg.resolution <= 0) {
        std::ostringstream oss;
        oss << "Terrain '" << cfg.id << "' must have a positive resolution (got " << cfg.resolution << ")";
        throw std::invalid_argument(oss.str());
    }
}

GridPoint worldToCell(const TerrainConfig& cfg, int gridW, int gridH, float worldX, float worldZ) noexcept
{
    const double u = (double(worldX) - cfg.position[0]) / cfg.width + 0.5;
    const double v = (double(worldZ) - cfg.position[2]) / cfg.depth + 0.5;
    return GridPoint{ int(std::floor(u * gridW)), int(std::floor(v * gridH)) };
}

float gridToWorldX(const TerrainConfig& cfg, float u) noexcept
{
    return (u - 0.5f) * cfg.width + cfg.position[0];
}

float gridToWorldZ(const TerrainConfig& cfg, float v) noexcept
{
    return (v - 0.5f) * cfg.depth + cfg.position[2];
}

float cellSpacing(const TerrainConfig& cfg, int gridW) noexcept
{
    return gridW > 1 ? cfg.width / float(gridW - 1) : cfg.width;
}

std::optional<float> sampleHeightAt(const Heightmap& hm, const TerrainConfig& cfg, float worldX, float worldZ)
{
    const int W = hm.width(), H = hm.height();
    if (W < 2 || H < 2) return std::nullopt;

    const float hx = ((worldX - cfg.position[0]) / cfg.width + 0.5f) * float(W - 1);
    const float hz = ((worldZ - cfg.position[2]) / cfg.depth + 0.5f) * float(H - 1);
    if (hx < 0.0f || hx >= float(W - 1) || hz < 0.0f || hz >= float(H - 1))
        return std::nullopt;

    const int   x0 = int(std::floor(hx));
    const int   z0 = int(std::floor(hz));
    const float fx = hx - float(x0);
    const float fz = hz - float(z0);

    const float h00 = hm.at(x0,     z0);
    const float h10 = hm.at(x0 + 1, z0);
    const float h01 = hm.at(x0,     z0 + 1);
    const float h11 = hm.at(x0 + 1, z0 + 1);

    const float h0 = h00 * (1.0f - fx) + h10 * fx;
    const float h1 = h01 * (1.0f - fx) + h11 * fx;
    return h0 * (1.0f - fz) + h1 * fz + cfg.position[1];
}

float slopeAt(const Heightmap& hm, int x, int y, float spacing) noexcept
{
    const int W = hm.width(), H = hm.height();
    if (x <= 0 || x >= W - 1 || y <= 0 || y >= H - 1) return 0.0f;
    if (!(spacing > 0.0f)) spacing = 1.0f;

    const float dx = hm.at(x + 1, y) - hm.at(x - 1, y);
    const float dy = hm.at(x, y + 1) - hm.at(x, y - 1);
    return std::sqrt(dx * dx + dy * dy) / (2.0f * spacing);
}

float slopeDegreesAt(const Heightmap& hm, int x, int y, float spacing) noexcept
{
    constexpr float kRadToDeg = 57.29577951308232f;
    const float s = std::clamp(slopeAt(hm, x, y, spacing), 0.0f, 1.0f);
    return std::asin(s) * kRadToDeg;
}

} // namespace landforge::terrain
