#pragma once

#include "vecdist/numerics/mvn_provider.hpp"

namespace vecdist::numerics {

/// Default provider.
/// Density uses the Cholesky factor of sigma. The joint CDF comes from
/// approxcdf; singular covariances are first reduced by folding perfectly
/// correlated coordinates together.
/// Equicoordinate quantiles are found with TOMS 748 on the joint CDF, and
/// sampling uses EigenRand's MvNormalGen.
class EigenMvnProvider : public MvnProvider {
public:
    [[nodiscard]] std::string_view name() const override { return "eigen"; }

    [[nodiscard]] Eigen::VectorXd density(
        const Eigen::MatrixXd& x,
        const Eigen::VectorXd& mean,
        const Eigen::MatrixXd& sigma,
        bool log) const override;

    [[nodiscard]] CdfResult cdf(
        const Eigen::VectorXd& upper,
        const Eigen::VectorXd& mean,
        const Eigen::MatrixXd& sigma,
        const ProviderOptions& options) const override;

    [[nodiscard]] QuantileResult equicoordinate_quantile(
        double p,
        const Eigen::VectorXd& mean,
        const Eigen::MatrixXd& sigma,
        const ProviderOptions& options) const override;

    [[nodiscard]] Eigen::MatrixXd sample(
        Eigen::Index n,
        const Eigen::VectorXd& mean,
        const Eigen::MatrixXd& sigma,
        Engine& urng) const override;
};

} // namespace vecdist::numerics
