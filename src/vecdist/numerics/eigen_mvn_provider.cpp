#include "vecdist/numerics/eigen_mvn_provider.hpp"
#include "vecdist/errors.hpp"
#include "vecdist/logging.hpp"
#include "vecdist/numerics/normal.hpp"
#include <EigenRand/EigenRand>
#include <approxcdf/approxcdf.h>
#include <boost/math/tools/toms748_solve.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <optional>
#include <stdexcept>
#include <vector>

namespace vecdist::numerics {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Correlations within this distance of +/-1 are treated as exact.
constexpr double kCollinearTol = 1e-12;
// Relative diagonal loading for dependencies the collinear reduction misses.
constexpr double kSingularJitter = 1e-10;
// Inclusion-exclusion expands into 2^k orthant terms.
constexpr std::size_t kMaxTwoSided = 16;

void check_parameters(const Eigen::VectorXd& mean, const Eigen::MatrixXd& sigma) {
    if (sigma.rows() != sigma.cols()) {
        throw ShapeMismatch(fmt::format(
            "covariance must be square, got {}x{}", sigma.rows(), sigma.cols()));
    }
    if (sigma.rows() != mean.size()) {
        throw ShapeMismatch(fmt::format(
            "mean has length {} but covariance is {}x{}", mean.size(), sigma.rows(), sigma.cols()));
    }
}

double coefficient_scale(const Eigen::MatrixXd& sigma) {
    return sigma.size() == 0 ? 1.0 : std::max(1.0, sigma.cwiseAbs().maxCoeff());
}

void check_symmetric(const Eigen::MatrixXd& sigma) {
    const double tol = 100.0 * std::numeric_limits<double>::epsilon() * coefficient_scale(sigma);
    if (((sigma - sigma.transpose()).cwiseAbs().array() > tol).any()) {
        throw InvalidCovariance("covariance must be a symmetric matrix");
    }
}

/// Lower Cholesky factor of sigma, or std::nullopt when sigma is singular
/// positive semidefinite. Throws on a clearly negative eigenvalue.
std::optional<Eigen::MatrixXd> lower_cholesky(const Eigen::MatrixXd& sigma) {
    Eigen::LLT<Eigen::MatrixXd> llt(sigma);
    if (llt.info() == Eigen::Success) {
        return Eigen::MatrixXd(llt.matrixL());
    }
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eig(sigma, Eigen::EigenvaluesOnly);
    const double tol = 100.0 * std::numeric_limits<double>::epsilon()
        * static_cast<double>(sigma.rows()) * coefficient_scale(sigma);
    if (eig.info() != Eigen::Success || eig.eigenvalues().minCoeff() < -tol) {
        throw InvalidCovariance("covariance is not positive semidefinite");
    }
    return std::nullopt;
}

/// P(Y <= b) for Y ~ N(0, sigma). Coordinates at +inf are dropped.
double orthant_probability(const Eigen::MatrixXd& sigma, const Eigen::VectorXd& b) {
    std::vector<Eigen::Index> kept;
    for (Eigen::Index j = 0; j < b.size(); ++j) {
        if (b(j) == -kInf) return 0.0;
        if (b(j) < kInf) kept.push_back(j);
    }
    if (kept.empty()) return 1.0;

    const auto n = static_cast<Eigen::Index>(kept.size());
    Eigen::MatrixXd cov = sigma(kept, kept);
    const Eigen::VectorXd upper = b(kept);
    const Eigen::VectorXd mean = Eigen::VectorXd::Zero(n);

    // Dependencies that survive the collinear reduction
    if (n > 1 && Eigen::LLT<Eigen::MatrixXd>(cov).info() != Eigen::Success) {
        const double jitter = kSingularJitter * cov.diagonal().maxCoeff();
        logging::logger()->debug("mvn cdf: rank-deficient covariance, adding {:.3g} to the diagonal", jitter);
        cov.diagonal().array() += jitter;
    }

    constexpr bool is_standardized = false;
    constexpr bool log_p = false;
    return norm_cdf(upper.data(), cov.data(), static_cast<int>(n), mean.data(), static_cast<int>(n),
                    is_standardized, log_p, nullptr);
}

/// One representative coordinate with the interval (lower, upper] it must lie in.
struct Constraint {
    Eigen::Index index;
    double lower;
    double upper;
};

/// Fold perfectly correlated coordinates into a single representative and
/// drop degenerate ones. Returns std::nullopt when the event is empty.
std::optional<std::vector<Constraint>> collapse_collinear(const Eigen::MatrixXd& sigma,
                                                          const Eigen::VectorXd& b) {
    const Eigen::Index d = b.size();
    const double var_tol = 100.0 * std::numeric_limits<double>::epsilon() * coefficient_scale(sigma);
    std::vector<bool> folded(static_cast<std::size_t>(d), false);
    std::vector<Constraint> constraints;

    for (Eigen::Index r = 0; r < d; ++r) {
        if (folded[static_cast<std::size_t>(r)]) continue;
        if (sigma(r, r) <= var_tol) {
            // Point mass at the mean
            if (b(r) < 0.0) return std::nullopt;
            continue;
        }
        Constraint c{r, -kInf, b(r)};
        for (Eigen::Index j = r + 1; j < d; ++j) {
            if (folded[static_cast<std::size_t>(j)] || sigma(j, j) <= var_tol) continue;
            const double bound = std::sqrt(sigma(r, r) * sigma(j, j));
            if (std::abs(sigma(r, j)) < (1.0 - kCollinearTol) * bound) continue;

            // Y_j = slope * Y_r
            const double slope = sigma(r, j) / sigma(r, r);
            if (slope > 0.0) {
                c.upper = std::min(c.upper, b(j) / slope);
            } else {
                c.lower = std::max(c.lower, b(j) / slope);
            }
            folded[static_cast<std::size_t>(j)] = true;
        }
        if (c.lower >= c.upper) return std::nullopt;
        constraints.push_back(c);
    }
    return constraints;
}

/// P(Y <= b) for Y ~ N(0, sigma) with sigma singular positive semidefinite.
/// Lower bounds introduced by negatively collinear pairs are removed by
/// inclusion-exclusion over the affected coordinates.
double singular_orthant_probability(const Eigen::MatrixXd& sigma, const Eigen::VectorXd& b) {
    const auto constraints = collapse_collinear(sigma, b);
    if (!constraints) return 0.0;
    if (constraints->empty()) return 1.0;

    std::vector<Eigen::Index> index;
    std::vector<std::size_t> two_sided;
    for (std::size_t k = 0; k < constraints->size(); ++k) {
        index.push_back((*constraints)[k].index);
        if ((*constraints)[k].lower > -kInf) two_sided.push_back(k);
    }
    if (two_sided.size() > kMaxTwoSided) {
        throw std::invalid_argument(fmt::format(
            "covariance has {} anti-correlated coordinate groups, at most {} are supported",
            two_sided.size(), kMaxTwoSided));
    }

    const Eigen::MatrixXd reduced = sigma(index, index);
    Eigen::VectorXd bounds(static_cast<Eigen::Index>(constraints->size()));
    double total = 0.0;
    for (std::size_t mask = 0; mask < (std::size_t{1} << two_sided.size()); ++mask) {
        for (std::size_t k = 0; k < constraints->size(); ++k) {
            bounds(static_cast<Eigen::Index>(k)) = (*constraints)[k].upper;
        }
        int sign = 1;
        for (std::size_t t = 0; t < two_sided.size(); ++t) {
            if (mask & (std::size_t{1} << t)) {
                bounds(static_cast<Eigen::Index>(two_sided[t])) = (*constraints)[two_sided[t]].lower;
                sign = -sign;
            }
        }
        total += sign * orthant_probability(reduced, bounds);
    }
    return std::clamp(total, 0.0, 1.0);
}

} // anonymous namespace

Eigen::VectorXd EigenMvnProvider::density(
    const Eigen::MatrixXd& x,
    const Eigen::VectorXd& mean,
    const Eigen::MatrixXd& sigma,
    bool log) const {

    check_parameters(mean, sigma);
    const Eigen::Index d = mean.size();
    if (x.cols() != d) {
        throw ShapeMismatch(fmt::format(
            "x has {} columns but the distribution has dimension {}", x.cols(), d));
    }
    check_symmetric(sigma);
    const auto L = lower_cholesky(sigma);

    if (!L) {
        // Degenerate distribution: all mass on a lower-dimensional subspace
        Eigen::VectorXd logd(x.rows());
        for (Eigen::Index i = 0; i < x.rows(); ++i) {
            logd(i) = x.row(i).transpose() == mean ? kInf : -kInf;
        }
        return log ? logd : Eigen::VectorXd(logd.array().exp().matrix());
    }

    // Mahalanobis distances via the triangular solve
    const Eigen::MatrixXd centered = (x.rowwise() - mean.transpose()).transpose();
    const Eigen::MatrixXd z = L->triangularView<Eigen::Lower>().solve(centered);
    const Eigen::VectorXd maha = z.colwise().squaredNorm().transpose();

    const double log_det_half = L->diagonal().array().log().sum();
    const double log_norm = 0.5 * static_cast<double>(d) * std::log(2.0 * std::numbers::pi);

    Eigen::VectorXd logd = (-0.5 * maha.array() - log_norm - log_det_half).matrix();
    if (log) {
        return logd;
    }
    return logd.array().exp().matrix();
}

CdfResult EigenMvnProvider::cdf(
    const Eigen::VectorXd& upper,
    const Eigen::VectorXd& mean,
    const Eigen::MatrixXd& sigma,
    const ProviderOptions&) const {

    check_parameters(mean, sigma);
    const Eigen::Index d = mean.size();
    // A single bound applies to every coordinate
    const Eigen::VectorXd q = upper.size() == 1 && d > 1
        ? Eigen::VectorXd::Constant(d, upper(0))
        : upper;
    if (q.size() != d) {
        throw ShapeMismatch(fmt::format(
            "upper bound has length {} but the distribution has dimension {}", upper.size(), d));
    }
    if (q.hasNaN()) {
        throw std::invalid_argument("cdf: upper bound contains NaN");
    }
    check_symmetric(sigma);
    const bool singular = !lower_cholesky(sigma);
    const Eigen::VectorXd b = q - mean;

    const double value = singular
        ? singular_orthant_probability(sigma, b)
        : orthant_probability(sigma, b);
    if (std::isnan(value)) {
        logging::logger()->warn("mvn cdf: approximation failed in dimension {}", d);
        return {value, kNaN, "Approximation failed"};
    }
    return {value, kNaN, singular ? "Singular covariance reduced" : "Normal Completion"};
}

QuantileResult EigenMvnProvider::equicoordinate_quantile(
    double p,
    const Eigen::VectorXd& mean,
    const Eigen::MatrixXd& sigma,
    const ProviderOptions& options) const {

    check_parameters(mean, sigma);
    if (std::isnan(p) || p < 0.0 || p > 1.0) {
        return {kNaN, kNaN, 0, kNaN};
    }
    if (p == 0.0) return {-kInf, 0.0, 0, 0.0};
    if (p == 1.0) return {kInf, 0.0, 0, 0.0};

    const Eigen::Index d = mean.size();
    const Eigen::VectorXd sd = sigma.diagonal().cwiseSqrt();

    auto largest_marginal_quantile = [&](double prob) {
        double q = -kInf;
        for (Eigen::Index j = 0; j < d; ++j) {
            const double qj = normal_quantile(prob, mean(j), sd(j));
            if (std::isnan(qj)) return kNaN;
            q = std::max(q, qj);
        }
        return q;
    };

    // P(all <= c) <= min_j P(X_j <= c) and >= 1 - sum_j P(X_j > c)
    double lo = largest_marginal_quantile(p);
    double hi = largest_marginal_quantile(1.0 - (1.0 - p) / static_cast<double>(d));
    if (std::isnan(lo) || std::isnan(hi)) {
        return {kNaN, kNaN, 0, kNaN};
    }
    if (lo == hi) {
        return {lo, 0.0, 0, 0.0};
    }

    auto f = [&](double c) {
        return cdf(Eigen::VectorXd::Constant(d, c), mean, sigma, options).value - p;
    };

    // The approximation error can push the bounds to the wrong side of p.
    double flo = f(lo);
    double fhi = f(hi);
    double step = std::max(sd.maxCoeff(), options.quantile_tol);
    for (int i = 0; i < 64 && flo > 0.0; ++i) {
        lo -= step;
        step *= 2.0;
        flo = f(lo);
    }
    step = std::max(sd.maxCoeff(), options.quantile_tol);
    for (int i = 0; i < 64 && fhi < 0.0; ++i) {
        hi += step;
        step *= 2.0;
        fhi = f(hi);
    }

    if (flo > 0.0 || fhi < 0.0) {
        logging::logger()->warn("mvn quantile: could not bracket p = {} in [{}, {}]", p, lo, hi);
        const double best = std::abs(flo) < std::abs(fhi) ? lo : hi;
        return {best, std::min(std::abs(flo), std::abs(fhi)), 0, kNaN};
    }
    if (flo == 0.0) return {lo, 0.0, 0, 0.0};
    if (fhi == 0.0) return {hi, 0.0, 0, 0.0};

    std::uintmax_t iterations = options.quantile_maxiter;
    const double tol = options.quantile_tol;
    const auto bracket = boost::math::tools::toms748_solve(
        f, lo, hi, flo, fhi,
        [tol](double a, double b) { return std::abs(b - a) <= tol; },
        iterations);

    if (iterations >= options.quantile_maxiter) {
        logging::logger()->warn(
            "mvn quantile: no convergence for p = {} after {} iterations", p, iterations);
    }

    const double root = 0.5 * (bracket.first + bracket.second);
    return {root, f(root), iterations, 0.5 * std::abs(bracket.second - bracket.first)};
}

Eigen::MatrixXd EigenMvnProvider::sample(
    Eigen::Index n,
    const Eigen::VectorXd& mean,
    const Eigen::MatrixXd& sigma,
    Engine& urng) const {

    check_parameters(mean, sigma);
    if (n < 0) {
        throw std::invalid_argument(fmt::format("sample: n must be non-negative, got {}", n));
    }
    check_symmetric(sigma);
    lower_cholesky(sigma);
    if (n == 0) {
        return Eigen::MatrixXd(0, mean.size());
    }

    auto gen = Eigen::Rand::makeMvNormalGen(mean, sigma);
    const Eigen::MatrixXd draws = gen.generate(urng, n);
    return draws.transpose();
}

} // namespace vecdist::numerics
