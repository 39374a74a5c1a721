#pragma once

#include "vecdist/numerics/options.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace vecdist::distributions {

/// List of observations. Each element is evaluated on its own and must
/// produce exactly one value.
using ObservationList = std::vector<Eigen::MatrixXd>;

enum class QuantileType {
    Marginal,
    Equicoordinate,
};

/// Extra arguments accepted by every query.
struct QueryOptions {
    /// Accepted for interface uniformity; no variant drops missing values.
    bool na_rm = false;
    numerics::ProviderOptions provider{};
};

/// Per-dimension range of the distribution.
struct Support {
    Eigen::RowVectorXd lower;
    Eigen::RowVectorXd upper;
    std::vector<std::string> dimnames;
};

/// Abstract base class of every distribution variant.
/// DistVector dispatches through this interface; each variant answers the
/// queries for a single parameterization.
class Distribution {
public:
    virtual ~Distribution() = default;

    [[nodiscard]] virtual std::unique_ptr<Distribution> clone() const = 0;

    /// Variant tag, e.g. "mvnorm".
    [[nodiscard]] virtual std::string_view variant() const = 0;

    /// Short display label.
    [[nodiscard]] virtual std::string format() const = 0;

    // ---- Evaluation ----

    /// Density at each row of at.
    [[nodiscard]] virtual Eigen::VectorXd density(
        const Eigen::MatrixXd& at, const QueryOptions& options = {}) const = 0;

    /// Density at each element of at, in input order.
    [[nodiscard]] virtual Eigen::VectorXd density(
        const ObservationList& at, const QueryOptions& options = {}) const;

    [[nodiscard]] virtual Eigen::VectorXd log_density(
        const Eigen::MatrixXd& at, const QueryOptions& options = {}) const = 0;

    [[nodiscard]] virtual Eigen::VectorXd log_density(
        const ObservationList& at, const QueryOptions& options = {}) const;

    /// Cumulative probability below q.
    [[nodiscard]] virtual double cdf(
        const Eigen::MatrixXd& q, const QueryOptions& options = {}) const = 0;

    [[nodiscard]] virtual Eigen::VectorXd cdf(
        const ObservationList& q, const QueryOptions& options = {}) const;

    /// One row per probability, one column per dimension.
    [[nodiscard]] virtual Eigen::MatrixXd quantile(
        const std::vector<double>& p,
        QuantileType type = QuantileType::Marginal,
        const QueryOptions& options = {}) const = 0;

    /// n draws, one per row.
    [[nodiscard]] virtual Eigen::MatrixXd generate(
        Eigen::Index n, const QueryOptions& options = {}) const = 0;

    // ---- Moments and shape ----

    [[nodiscard]] virtual Eigen::RowVectorXd mean() const = 0;
    [[nodiscard]] virtual Eigen::MatrixXd covariance() const = 0;
    [[nodiscard]] virtual Eigen::RowVectorXd variance() const = 0;
    [[nodiscard]] virtual Support support() const = 0;
    [[nodiscard]] virtual Eigen::Index dimension() const = 0;

    // ---- Labels ----

    [[nodiscard]] const std::vector<std::string>& dimnames() const { return dimnames_; }

    /// Attach dimension labels. An empty list clears them.
    void set_dimnames(std::vector<std::string> names);

protected:
    std::vector<std::string> dimnames_;
};

} // namespace vecdist::distributions
