#pragma once

#include "vecdist/numerics/options.hpp"
#include "vecdist/numerics/random.hpp"
#include <Eigen/Dense>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace vecdist::numerics {

/// Joint CDF value together with an error estimate, NaN when the method
/// does not provide one.
struct CdfResult {
    double value = 0.0;
    double error = std::numeric_limits<double>::quiet_NaN();
    std::string message;
};

struct QuantileResult {
    double quantile = 0.0;
    /// cdf(quantile) - p at the returned point.
    double f_quantile = 0.0;
    std::uintmax_t iterations = 0;
    double estimated_precision = 0.0;
};

/// Multivariate normal numerics: joint density, joint CDF, equicoordinate
/// quantile and sampling. Implementations report shape problems as
/// vecdist::ShapeMismatch and bad covariances as vecdist::InvalidCovariance.
class MvnProvider {
public:
    virtual ~MvnProvider() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;

    /// Density (or log density) at each row of x.
    [[nodiscard]] virtual Eigen::VectorXd density(
        const Eigen::MatrixXd& x,
        const Eigen::VectorXd& mean,
        const Eigen::MatrixXd& sigma,
        bool log) const = 0;

    /// P(X <= upper), componentwise. A length-1 bound applies to every
    /// coordinate; NaN bounds throw std::invalid_argument.
    [[nodiscard]] virtual CdfResult cdf(
        const Eigen::VectorXd& upper,
        const Eigen::VectorXd& mean,
        const Eigen::MatrixXd& sigma,
        const ProviderOptions& options) const = 0;

    /// Scalar c with P(X_1 <= c, ..., X_d <= c) = p.
    [[nodiscard]] virtual QuantileResult equicoordinate_quantile(
        double p,
        const Eigen::VectorXd& mean,
        const Eigen::MatrixXd& sigma,
        const ProviderOptions& options) const = 0;

    /// n draws, one per row (n x d).
    [[nodiscard]] virtual Eigen::MatrixXd sample(
        Eigen::Index n,
        const Eigen::VectorXd& mean,
        const Eigen::MatrixXd& sigma,
        Engine& urng) const = 0;
};

} // namespace vecdist::numerics
