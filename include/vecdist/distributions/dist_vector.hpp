#pragma once

#include "vecdist/distributions/distribution.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

namespace vecdist::distributions {

/// Vectorized collection of distributions.
/// Each query is dispatched to every instance independently. List arguments
/// are broadcast: one element per instance, or a single element shared by
/// all instances.
class DistVector {
public:
    DistVector() = default;

    [[nodiscard]] std::unique_ptr<DistVector> clone() const;

    // ---- Element access ----

    [[nodiscard]] std::size_t size() const { return items_.size(); }
    [[nodiscard]] bool empty() const { return items_.empty(); }

    [[nodiscard]] Distribution& operator[](std::size_t i) { return *items_[i]; }
    [[nodiscard]] const Distribution& operator[](std::size_t i) const { return *items_[i]; }

    void reserve(std::size_t n) { items_.reserve(n); }
    void push_back(std::unique_ptr<Distribution> dist) { items_.push_back(std::move(dist)); }

    // ---- Queries ----

    [[nodiscard]] std::vector<std::string> format() const;

    /// at is shared by every instance.
    [[nodiscard]] std::vector<Eigen::VectorXd> density(
        const Eigen::MatrixXd& at, const QueryOptions& options = {}) const;
    /// Element i of at goes to instance i (or element 0 to all).
    [[nodiscard]] std::vector<Eigen::VectorXd> density(
        const ObservationList& at, const QueryOptions& options = {}) const;

    [[nodiscard]] std::vector<Eigen::VectorXd> log_density(
        const Eigen::MatrixXd& at, const QueryOptions& options = {}) const;
    [[nodiscard]] std::vector<Eigen::VectorXd> log_density(
        const ObservationList& at, const QueryOptions& options = {}) const;

    [[nodiscard]] Eigen::VectorXd cdf(
        const Eigen::MatrixXd& q, const QueryOptions& options = {}) const;
    [[nodiscard]] Eigen::VectorXd cdf(
        const ObservationList& q, const QueryOptions& options = {}) const;

    [[nodiscard]] std::vector<Eigen::MatrixXd> quantile(
        const std::vector<double>& p,
        QuantileType type = QuantileType::Marginal,
        const QueryOptions& options = {}) const;

    [[nodiscard]] std::vector<Eigen::MatrixXd> generate(
        Eigen::Index n, const QueryOptions& options = {}) const;

    [[nodiscard]] std::vector<Eigen::RowVectorXd> mean() const;
    /// One matrix per instance.
    [[nodiscard]] std::vector<Eigen::MatrixXd> covariance() const;
    [[nodiscard]] std::vector<Eigen::RowVectorXd> variance() const;
    [[nodiscard]] std::vector<Support> support() const;
    [[nodiscard]] std::vector<Eigen::Index> dimension() const;

    /// Attach the same labels to every instance.
    void set_dimnames(const std::vector<std::string>& names);

    [[nodiscard]] const std::vector<std::unique_ptr<Distribution>>& items() const { return items_; }

private:
    std::vector<std::unique_ptr<Distribution>> items_;
};

} // namespace vecdist::distributions
