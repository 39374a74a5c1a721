#include "vecdist/distributions/distribution.hpp"
#include "vecdist/distributions/broadcast.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace vecdist::distributions {

Eigen::VectorXd Distribution::density(const ObservationList& at, const QueryOptions& options) const {
    return map_observations(at, [&](const Eigen::MatrixXd& x) { return density(x, options); });
}

Eigen::VectorXd Distribution::log_density(const ObservationList& at, const QueryOptions& options) const {
    return map_observations(at, [&](const Eigen::MatrixXd& x) { return log_density(x, options); });
}

Eigen::VectorXd Distribution::cdf(const ObservationList& q, const QueryOptions& options) const {
    return map_observations(q, [&](const Eigen::MatrixXd& x) { return cdf(x, options); });
}

void Distribution::set_dimnames(std::vector<std::string> names) {
    if (!names.empty() && static_cast<Eigen::Index>(names.size()) != dimension()) {
        throw std::invalid_argument(fmt::format(
            "set_dimnames: expected {} names, got {}", dimension(), names.size()));
    }
    dimnames_ = std::move(names);
}

} // namespace vecdist::distributions
