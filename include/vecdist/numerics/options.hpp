#pragma once

#include <cstdint>

namespace vecdist::numerics {

/// Tuning knobs passed through to the numerics provider.
struct ProviderOptions {
    /// Bracket width at which the equicoordinate quantile search stops.
    double quantile_tol = 1e-6;
    std::uintmax_t quantile_maxiter = 500;
};

} // namespace vecdist::numerics
