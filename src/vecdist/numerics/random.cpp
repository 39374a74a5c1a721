#include "vecdist/numerics/random.hpp"
#include <memory>
#include <random>

namespace vecdist::numerics {

namespace {

std::unique_ptr<Engine>& state() {
    static std::unique_ptr<Engine> urng = [] {
        std::random_device rd;
        const std::uint64_t seed = (static_cast<std::uint64_t>(rd()) << 32) | rd();
        return std::make_unique<Engine>(seed);
    }();
    return urng;
}

} // anonymous namespace

Engine& engine() {
    return *state();
}

void set_seed(std::uint64_t seed) {
    state() = std::make_unique<Engine>(seed);
}

} // namespace vecdist::numerics
