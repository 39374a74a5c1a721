#include "vecdist/distributions/dist_vector.hpp"
#include "vecdist/distributions/broadcast.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace vecdist::distributions {

namespace {

/// Check that a list argument can be broadcast over n instances.
void check_broadcast(std::size_t n, std::size_t args, std::string_view what) {
    if (args == n || args == 1) return;
    throw std::invalid_argument(fmt::format(
        "{}: expected 1 or {} arguments, got {}", what, n, args));
}

} // anonymous namespace

std::unique_ptr<DistVector> DistVector::clone() const {
    auto result = std::make_unique<DistVector>();
    result->items_.reserve(items_.size());
    for (const auto& d : items_) {
        result->items_.push_back(d->clone());
    }
    return result;
}

std::vector<std::string> DistVector::format() const {
    std::vector<std::string> out;
    out.reserve(items_.size());
    for (const auto& d : items_) {
        out.push_back(d->format());
    }
    return out;
}

// ---- Density ----

std::vector<Eigen::VectorXd> DistVector::density(const Eigen::MatrixXd& at, const QueryOptions& options) const {
    std::vector<Eigen::VectorXd> out;
    out.reserve(items_.size());
    for (const auto& d : items_) {
        out.push_back(d->density(at, options));
    }
    return out;
}

std::vector<Eigen::VectorXd> DistVector::density(const ObservationList& at, const QueryOptions& options) const {
    check_broadcast(items_.size(), at.size(), "density");
    std::vector<Eigen::VectorXd> out;
    out.reserve(items_.size());
    for (std::size_t i = 0; i < items_.size(); ++i) {
        out.push_back(items_[i]->density(recycled_at(at, i), options));
    }
    return out;
}

std::vector<Eigen::VectorXd> DistVector::log_density(const Eigen::MatrixXd& at, const QueryOptions& options) const {
    std::vector<Eigen::VectorXd> out;
    out.reserve(items_.size());
    for (const auto& d : items_) {
        out.push_back(d->log_density(at, options));
    }
    return out;
}

std::vector<Eigen::VectorXd> DistVector::log_density(const ObservationList& at, const QueryOptions& options) const {
    check_broadcast(items_.size(), at.size(), "log_density");
    std::vector<Eigen::VectorXd> out;
    out.reserve(items_.size());
    for (std::size_t i = 0; i < items_.size(); ++i) {
        out.push_back(items_[i]->log_density(recycled_at(at, i), options));
    }
    return out;
}

// ---- CDF ----

Eigen::VectorXd DistVector::cdf(const Eigen::MatrixXd& q, const QueryOptions& options) const {
    Eigen::VectorXd out(static_cast<Eigen::Index>(items_.size()));
    for (std::size_t i = 0; i < items_.size(); ++i) {
        out(static_cast<Eigen::Index>(i)) = items_[i]->cdf(q, options);
    }
    return out;
}

Eigen::VectorXd DistVector::cdf(const ObservationList& q, const QueryOptions& options) const {
    check_broadcast(items_.size(), q.size(), "cdf");
    Eigen::VectorXd out(static_cast<Eigen::Index>(items_.size()));
    for (std::size_t i = 0; i < items_.size(); ++i) {
        out(static_cast<Eigen::Index>(i)) = items_[i]->cdf(recycled_at(q, i), options);
    }
    return out;
}

// ---- Quantile / generation ----

std::vector<Eigen::MatrixXd> DistVector::quantile(
    const std::vector<double>& p, QuantileType type, const QueryOptions& options) const {
    std::vector<Eigen::MatrixXd> out;
    out.reserve(items_.size());
    for (const auto& d : items_) {
        out.push_back(d->quantile(p, type, options));
    }
    return out;
}

std::vector<Eigen::MatrixXd> DistVector::generate(Eigen::Index n, const QueryOptions& options) const {
    std::vector<Eigen::MatrixXd> out;
    out.reserve(items_.size());
    for (const auto& d : items_) {
        out.push_back(d->generate(n, options));
    }
    return out;
}

// ---- Moments and shape ----

std::vector<Eigen::RowVectorXd> DistVector::mean() const {
    std::vector<Eigen::RowVectorXd> out;
    out.reserve(items_.size());
    for (const auto& d : items_) {
        out.push_back(d->mean());
    }
    return out;
}

std::vector<Eigen::MatrixXd> DistVector::covariance() const {
    std::vector<Eigen::MatrixXd> out;
    out.reserve(items_.size());
    for (const auto& d : items_) {
        out.push_back(d->covariance());
    }
    return out;
}

std::vector<Eigen::RowVectorXd> DistVector::variance() const {
    std::vector<Eigen::RowVectorXd> out;
    out.reserve(items_.size());
    for (const auto& d : items_) {
        out.push_back(d->variance());
    }
    return out;
}

std::vector<Support> DistVector::support() const {
    std::vector<Support> out;
    out.reserve(items_.size());
    for (const auto& d : items_) {
        out.push_back(d->support());
    }
    return out;
}

std::vector<Eigen::Index> DistVector::dimension() const {
    std::vector<Eigen::Index> out;
    out.reserve(items_.size());
    for (const auto& d : items_) {
        out.push_back(d->dimension());
    }
    return out;
}

void DistVector::set_dimnames(const std::vector<std::string>& names) {
    for (auto& d : items_) {
        d->set_dimnames(names);
    }
}

} // namespace vecdist::distributions
