#pragma once

#include "vecdist/distributions/dist_vector.hpp"
#include "vecdist/distributions/distribution.hpp"
#include "vecdist/numerics/mvn_provider.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

namespace vecdist::distributions {

/// Multivariate normal distribution with mean vector mu and covariance sigma.
/// Holds parameters only; density, CDF, equicoordinate quantiles and sampling
/// are delegated to the registered numerics::MvnProvider. Shapes and the
/// covariance are checked by the provider at query time, not here.
class MultivariateNormal : public Distribution {
public:
    /// Standard normal in one dimension.
    MultivariateNormal();

    MultivariateNormal(Eigen::VectorXd mu, Eigen::MatrixXd sigma,
                       std::vector<std::string> dimnames = {});

    [[nodiscard]] std::unique_ptr<Distribution> clone() const override {
        return std::make_unique<MultivariateNormal>(*this);
    }

    [[nodiscard]] std::string_view variant() const override { return "mvnorm"; }

    /// "MVN[d]"
    [[nodiscard]] std::string format() const override;

    [[nodiscard]] Eigen::VectorXd density(
        const Eigen::MatrixXd& at, const QueryOptions& options = {}) const override;
    [[nodiscard]] Eigen::VectorXd density(
        const ObservationList& at, const QueryOptions& options = {}) const override;

    [[nodiscard]] Eigen::VectorXd log_density(
        const Eigen::MatrixXd& at, const QueryOptions& options = {}) const override;
    [[nodiscard]] Eigen::VectorXd log_density(
        const ObservationList& at, const QueryOptions& options = {}) const override;

    /// q is flattened column-major into the vector of upper bounds.
    [[nodiscard]] double cdf(
        const Eigen::MatrixXd& q, const QueryOptions& options = {}) const override;
    [[nodiscard]] Eigen::VectorXd cdf(
        const ObservationList& q, const QueryOptions& options = {}) const override;

    /// Marginal: per-dimension normal quantiles from mu and diag(sigma),
    /// closed form. Equicoordinate: the joint quantile from the provider,
    /// repeated across columns; p = 0 and p = 1 map to -inf and +inf.
    [[nodiscard]] Eigen::MatrixXd quantile(
        const std::vector<double>& p,
        QuantileType type = QuantileType::Marginal,
        const QueryOptions& options = {}) const override;

    /// Uses the ambient engine from numerics::engine().
    [[nodiscard]] Eigen::MatrixXd generate(
        Eigen::Index n, const QueryOptions& options = {}) const override;

    [[nodiscard]] Eigen::RowVectorXd mean() const override { return mu_.transpose(); }
    [[nodiscard]] Eigen::MatrixXd covariance() const override { return sigma_; }
    [[nodiscard]] Eigen::RowVectorXd variance() const override { return sigma_.diagonal().transpose(); }
    [[nodiscard]] Support support() const override;
    [[nodiscard]] Eigen::Index dimension() const override { return mu_.size(); }

    // ---- Data access ----
    [[nodiscard]] const Eigen::VectorXd& mu() const { return mu_; }
    [[nodiscard]] const Eigen::MatrixXd& sigma() const { return sigma_; }

private:
    [[nodiscard]] Eigen::VectorXd evaluate_density(
        const numerics::MvnProvider& provider, const Eigen::MatrixXd& at, bool log) const;

    [[nodiscard]] double evaluate_cdf(
        const numerics::MvnProvider& provider, const Eigen::MatrixXd& q,
        const QueryOptions& options) const;

    [[nodiscard]] Eigen::MatrixXd marginal_quantile(const std::vector<double>& p) const;

    [[nodiscard]] Eigen::MatrixXd equicoordinate_quantile(
        const std::vector<double>& p, const QueryOptions& options) const;

    Eigen::VectorXd mu_;
    Eigen::MatrixXd sigma_;
};

/// Vector of multivariate normals. mus and sigmas are recycled to a common
/// length; every instance gets the same dimnames.
[[nodiscard]] DistVector dist_multivariate_normal(
    const std::vector<Eigen::VectorXd>& mus = {Eigen::VectorXd::Zero(1)},
    const std::vector<Eigen::MatrixXd>& sigmas = {Eigen::MatrixXd::Identity(1, 1)},
    const std::vector<std::string>& dimnames = {});

} // namespace vecdist::distributions
