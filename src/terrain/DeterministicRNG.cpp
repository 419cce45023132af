#include "landforge/terrain/DeterministicRNG.hpp"

#include <chrono>

namespace landforge::terrain {

std::uint64_t entropySeed() noexcept
{
    // splitmix64 finalizer over the clock so consecutive calls diverge quickly
    std::uint64_t z = static_cast<std::uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    z += UINT64_C(0x9E3779B97F4A7C15);
    z = (z ^ (z >> 30)) * UINT64_C(0xBF58476D1CE4E5B9);
    z = (z ^ (z >> 27)) * UINT64_C(0x94D049BB133111EB);
    return z ^ (z >> 31);
}

} // namespace landforge::terrain
