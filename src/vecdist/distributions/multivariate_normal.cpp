#include "vecdist/distributions/multivariate_normal.hpp"
#include "vecdist/distributions/broadcast.hpp"
#include "vecdist/errors.hpp"
#include "vecdist/numerics/normal.hpp"
#include "vecdist/numerics/provider_registry.hpp"
#include "vecdist/numerics/random.hpp"
#include <fmt/format.h>
#include <cmath>
#include <limits>

namespace vecdist::distributions {

MultivariateNormal::MultivariateNormal()
    : mu_(Eigen::VectorXd::Zero(1)), sigma_(Eigen::MatrixXd::Identity(1, 1)) {}

MultivariateNormal::MultivariateNormal(Eigen::VectorXd mu, Eigen::MatrixXd sigma,
                                       std::vector<std::string> dimnames)
    : mu_(std::move(mu)), sigma_(std::move(sigma)) {
    set_dimnames(std::move(dimnames));
}

std::string MultivariateNormal::format() const {
    return fmt::format("MVN[{}]", dimension());
}

// ---- Density ----

Eigen::VectorXd MultivariateNormal::evaluate_density(
    const numerics::MvnProvider& provider, const Eigen::MatrixXd& at, bool log) const {
    return provider.density(at, mu_, sigma_, log);
}

Eigen::VectorXd MultivariateNormal::density(const Eigen::MatrixXd& at, const QueryOptions&) const {
    const auto provider = numerics::require_mvn_provider();
    return evaluate_density(*provider, at, false);
}

Eigen::VectorXd MultivariateNormal::density(const ObservationList& at, const QueryOptions&) const {
    const auto provider = numerics::require_mvn_provider();
    return map_observations(at, [&](const Eigen::MatrixXd& x) {
        return evaluate_density(*provider, x, false);
    });
}

Eigen::VectorXd MultivariateNormal::log_density(const Eigen::MatrixXd& at, const QueryOptions&) const {
    const auto provider = numerics::require_mvn_provider();
    return evaluate_density(*provider, at, true);
}

Eigen::VectorXd MultivariateNormal::log_density(const ObservationList& at, const QueryOptions&) const {
    const auto provider = numerics::require_mvn_provider();
    return map_observations(at, [&](const Eigen::MatrixXd& x) {
        return evaluate_density(*provider, x, true);
    });
}

// ---- CDF ----

double MultivariateNormal::evaluate_cdf(
    const numerics::MvnProvider& provider, const Eigen::MatrixXd& q,
    const QueryOptions& options) const {
    const Eigen::VectorXd upper = Eigen::Map<const Eigen::VectorXd>(q.data(), q.size());
    return provider.cdf(upper, mu_, sigma_, options.provider).value;
}

double MultivariateNormal::cdf(const Eigen::MatrixXd& q, const QueryOptions& options) const {
    const auto provider = numerics::require_mvn_provider();
    return evaluate_cdf(*provider, q, options);
}

Eigen::VectorXd MultivariateNormal::cdf(const ObservationList& q, const QueryOptions& options) const {
    const auto provider = numerics::require_mvn_provider();
    return map_observations(q, [&](const Eigen::MatrixXd& x) {
        return evaluate_cdf(*provider, x, options);
    });
}

// ---- Quantile ----

Eigen::MatrixXd MultivariateNormal::quantile(
    const std::vector<double>& p, QuantileType type, const QueryOptions& options) const {
    if (type == QuantileType::Equicoordinate) {
        return equicoordinate_quantile(p, options);
    }
    return marginal_quantile(p);
}

Eigen::MatrixXd MultivariateNormal::marginal_quantile(const std::vector<double>& p) const {
    const Eigen::Index d = dimension();
    if (sigma_.rows() != d || sigma_.cols() != d) {
        throw ShapeMismatch(fmt::format(
            "mean has length {} but covariance is {}x{}", d, sigma_.rows(), sigma_.cols()));
    }

    Eigen::MatrixXd q(static_cast<Eigen::Index>(p.size()), d);
    for (Eigen::Index j = 0; j < d; ++j) {
        const double sd = std::sqrt(sigma_(j, j));
        for (std::size_t i = 0; i < p.size(); ++i) {
            q(static_cast<Eigen::Index>(i), j) = numerics::normal_quantile(p[i], mu_(j), sd);
        }
    }
    return q;
}

Eigen::MatrixXd MultivariateNormal::equicoordinate_quantile(
    const std::vector<double>& p, const QueryOptions& options) const {
    const auto provider = numerics::require_mvn_provider();

    Eigen::MatrixXd q(static_cast<Eigen::Index>(p.size()), dimension());
    for (std::size_t i = 0; i < p.size(); ++i) {
        double c;
        if (p[i] == 0.0) {
            c = -std::numeric_limits<double>::infinity();
        } else if (p[i] == 1.0) {
            c = std::numeric_limits<double>::infinity();
        } else {
            c = provider->equicoordinate_quantile(p[i], mu_, sigma_, options.provider).quantile;
        }
        q.row(static_cast<Eigen::Index>(i)).setConstant(c);
    }
    return q;
}

// ---- Generation ----

Eigen::MatrixXd MultivariateNormal::generate(Eigen::Index n, const QueryOptions&) const {
    const auto provider = numerics::require_mvn_provider();
    return provider->sample(n, mu_, sigma_, numerics::engine());
}

Support MultivariateNormal::support() const {
    const Eigen::MatrixXd bounds = marginal_quantile({0.0, 1.0});
    return {bounds.row(0), bounds.row(1), dimnames_};
}

// ---- Factory ----

DistVector dist_multivariate_normal(
    const std::vector<Eigen::VectorXd>& mus,
    const std::vector<Eigen::MatrixXd>& sigmas,
    const std::vector<std::string>& dimnames) {
    const std::size_t n = recycled_size(mus.size(), sigmas.size(), "dist_multivariate_normal");

    DistVector result;
    result.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        result.push_back(std::make_unique<MultivariateNormal>(
            recycled_at(mus, i), recycled_at(sigmas, i), dimnames));
    }
    return result;
}

} // namespace vecdist::distributions
