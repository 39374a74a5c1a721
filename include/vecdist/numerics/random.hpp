#pragma once

#include <EigenRand/EigenRand>
#include <cstdint>

namespace vecdist::numerics {

using Engine = Eigen::Rand::Vmt19937_64;

/// Ambient random engine used by generate(). Seeded from std::random_device
/// until set_seed() is called.
[[nodiscard]] Engine& engine();

/// Reseed the ambient engine.
void set_seed(std::uint64_t seed);

} // namespace vecdist::numerics
