#include "landforge/terrain/SimplexNoise.hpp"

#include <cmath>
#include <numeric>
#include <utility>

namespace landforge::terrain {

namespace {

constexpr int kGrad3[12][3] = {
    { 1, 1, 0}, {-1, 1, 0}, { 1,-1, 0}, {-1,-1, 0},
    { 1, 0, 1}, {-1, 0, 1}, { 1, 0,-1}, {-1, 0,-1},
    { 0, 1, 1}, { 0,-1, 1}, { 0, 1,-1}, { 0,-1,-1},
};

// Classic "9301/49297/233280" LCG; only used to shuffle the permutation table.
struct ShuffleLcg {
    std::uint64_t s;
    explicit ShuffleLcg(std::uint64_t seed) : s(seed % 233280u) {}
    double next() {
        s = (s * 9301u + 49297u) % 233280u;
        return double(s) / 233280.0;
    }
};

inline float corner(int gi, double x, double y) {
    double t = 0.5 - x * x - y * y;
    if (t < 0.0) return 0.0f;
    t *= t;
    return float(t * t * (kGrad3[gi][0] * x + kGrad3[gi][1] * y));
}

} // namespace

SimplexNoise::SimplexNoise(std::uint64_t seed)
{
    reseed(seed);
}

void SimplexNoise::reseed(std::uint64_t seed)
{
    seed_ = seed;

    std::array<std::uint8_t, 256> p{};
    std::iota(p.begin(), p.end(), std::uint8_t{0});

    // Fisher-Yates
    ShuffleLcg rng(seed);
    for (int i = 255; i > 0; --i) {
        const int j = int(std::floor(rng.next() * (i + 1)));
        std::swap(p[size_t(i)], p[size_t(j)]);
    }
    for (size_t i = 0; i < perm_.size(); ++i) perm_[i] = p[i & 255u];
}

float SimplexNoise::noise2D(float xin, float yin) const noexcept
{
    static const double F2 = 0.5 * (std::sqrt(3.0) - 1.0);
    static const double G2 = (3.0 - std::sqrt(3.0)) / 6.0;

    const double x = xin, y = yin;
    const double s = (x + y) * F2;
    const int i = int(std::floor(x + s));
    const int j = int(std::floor(y + s));

    const double t  = (i + j) * G2;
    const double x0 = x - (i - t);
    const double y0 = y - (j - t);

    const int i1 = x0 > y0 ? 1 : 0;
    const int j1 = x0 > y0 ? 0 : 1;

    const double x1 = x0 - i1 + G2;
    const double y1 = y0 - j1 + G2;
    const double x2 = x0 - 1.0 + 2.0 * G2;
    const double y2 = y0 - 1.0 + 2.0 * G2;

    const int ii = i & 255;
    const int jj = j & 255;

    const int gi0 = perm_[size_t(ii      + perm_[size_t(jj)])]      % 12;
    const int gi1 = perm_[size_t(ii + i1 + perm_[size_t(jj + j1)])] % 12;
    const int gi2 = perm_[size_t(ii + 1  + perm_[size_t(jj + 1)])]  % 12;

    return 70.0f * (corner(gi0, x0, y0) + corner(gi1, x1, y1) + corner(gi2, x2, y2));
}

} // namespace landforge::terrain
