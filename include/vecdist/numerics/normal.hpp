#pragma once

#include <boost/math/distributions/normal.hpp>
#include <cmath>
#include <limits>

namespace vecdist::numerics {

/// Boost.Math policy that reports domain errors as NaN and overflow as +/-inf
/// instead of throwing.
using SentinelPolicy = boost::math::policies::policy<
    boost::math::policies::domain_error<boost::math::policies::errno_on_error>,
    boost::math::policies::overflow_error<boost::math::policies::errno_on_error>>;

using StandardNormal = boost::math::normal_distribution<double, SentinelPolicy>;

/// Standard normal CDF. Handles +/-inf; NaN in, NaN out.
[[nodiscard]] inline double standard_normal_cdf(double x) {
    if (std::isnan(x)) return std::numeric_limits<double>::quiet_NaN();
    return boost::math::cdf(StandardNormal{}, x);
}

/// Standard normal quantile. p = 0 gives -inf, p = 1 gives +inf,
/// p outside [0, 1] gives NaN.
[[nodiscard]] inline double standard_normal_quantile(double p) {
    if (std::isnan(p) || p < 0.0 || p > 1.0) return std::numeric_limits<double>::quiet_NaN();
    if (p == 0.0) return -std::numeric_limits<double>::infinity();
    if (p == 1.0) return std::numeric_limits<double>::infinity();
    return boost::math::quantile(StandardNormal{}, p);
}

/// Normal quantile with mean mu and standard deviation sd.
/// A zero sd collapses every interior probability onto mu.
[[nodiscard]] inline double normal_quantile(double p, double mu, double sd) {
    const double z = standard_normal_quantile(p);
    if (std::isnan(z) || std::isinf(z)) return z;
    if (std::isnan(mu) || std::isnan(sd) || sd < 0.0) return std::numeric_limits<double>::quiet_NaN();
    if (sd == 0.0) return mu;
    return mu + sd * z;
}

} // namespace vecdist::numerics
