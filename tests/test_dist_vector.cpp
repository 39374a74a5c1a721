#include <gtest/gtest.h>
#include "vecdist/distributions/dist_vector.hpp"
#include "vecdist/distributions/multivariate_normal.hpp"
#include "vecdist/errors.hpp"
#include "mvn_test_utils.hpp"
#include <cmath>
#include <limits>
#include <numbers>

using namespace vecdist;
using namespace vecdist::distributions;
using vecdist::test::example_covariance;
using vecdist::test::example_mean;
using vecdist::test::ProviderOverride;
using vecdist::test::row;

namespace {

/// Two bivariate normals and one trivariate normal.
DistVector mixed_vector() {
    return dist_multivariate_normal(
        {example_mean(), Eigen::Vector2d(0.0, 0.0), Eigen::Vector3d(1.0, 1.0, 1.0)},
        {example_covariance(), Eigen::MatrixXd::Identity(2, 2), Eigen::MatrixXd::Identity(3, 3)});
}

} // anonymous namespace

// ---- Factory ----

TEST(DistMultivariateNormal, DefaultIsSingleStandardNormal) {
    const DistVector dist = dist_multivariate_normal();
    ASSERT_EQ(dist.size(), 1u);
    EXPECT_EQ(dist[0].dimension(), 1);
    EXPECT_DOUBLE_EQ(dist[0].mean()(0), 0.0);
    EXPECT_DOUBLE_EQ(dist[0].covariance()(0, 0), 1.0);
    EXPECT_EQ(dist.format(), std::vector<std::string>{"MVN[1]"});
}

TEST(DistMultivariateNormal, RecyclesSingleCovariance) {
    const DistVector dist = dist_multivariate_normal(
        {Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(5.0, -5.0)},
        {example_covariance()});
    ASSERT_EQ(dist.size(), 2u);
    EXPECT_TRUE(dist[1].covariance().isApprox(example_covariance()));
    EXPECT_DOUBLE_EQ(dist[1].mean()(0), 5.0);
}

TEST(DistMultivariateNormal, RecyclesSingleMean) {
    const DistVector dist = dist_multivariate_normal(
        {example_mean()},
        {example_covariance(), Eigen::MatrixXd::Identity(2, 2)});
    ASSERT_EQ(dist.size(), 2u);
    EXPECT_DOUBLE_EQ(dist[1].mean()(1), 2.0);
    EXPECT_DOUBLE_EQ(dist[1].covariance()(0, 1), 0.0);
}

TEST(DistMultivariateNormal, IncompatibleLengthsThrow) {
    EXPECT_THROW((void)dist_multivariate_normal(
                     {example_mean(), example_mean()},
                     {example_covariance(), example_covariance(), example_covariance()}),
                 std::invalid_argument);
}

TEST(DistMultivariateNormal, DimnamesAttachedToEveryInstance) {
    const DistVector dist = dist_multivariate_normal(
        {example_mean(), Eigen::Vector2d(0.0, 0.0)}, {example_covariance()}, {"x", "y"});
    for (std::size_t i = 0; i < dist.size(); ++i) {
        ASSERT_EQ(dist[i].dimnames().size(), 2u);
        EXPECT_EQ(dist[i].dimnames()[1], "y");
    }
}

// ---- Per-instance queries ----

TEST(DistVector, FormatDimensionMeanCovariance) {
    const DistVector dist = mixed_vector();
    EXPECT_EQ(dist.format(), (std::vector<std::string>{"MVN[2]", "MVN[2]", "MVN[3]"}));
    EXPECT_EQ(dist.dimension(), (std::vector<Eigen::Index>{2, 2, 3}));

    const auto means = dist.mean();
    ASSERT_EQ(means.size(), 3u);
    EXPECT_EQ(means[2].size(), 3);

    const auto covs = dist.covariance();
    ASSERT_EQ(covs.size(), 3u);
    EXPECT_EQ(covs[0].rows(), 2);
    EXPECT_EQ(covs[0].cols(), 2);
    EXPECT_EQ(covs[2].rows(), 3);
    EXPECT_DOUBLE_EQ(covs[0](1, 0), 2.0);

    const auto vars = dist.variance();
    EXPECT_DOUBLE_EQ(vars[0](0), 4.0);
}

TEST(DistVector, DensityBroadcastsSharedPoint) {
    const DistVector dist = dist_multivariate_normal(
        {example_mean(), Eigen::Vector2d(0.0, 0.0)}, {example_covariance()});
    const auto d = dist.density(row({1.0, 2.0}));
    ASSERT_EQ(d.size(), 2u);
    EXPECT_GT(d[0](0), d[1](0));
}

TEST(DistVector, DensityOnePointPerInstance) {
    const DistVector dist = mixed_vector();
    const ObservationList at = {row({1.0, 2.0}), row({0.0, 0.0}), row({1.0, 1.0, 1.0})};

    const auto d = dist.density(at);
    const auto logd = dist.log_density(at);
    ASSERT_EQ(d.size(), 3u);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_DOUBLE_EQ(d[i](0), dist[i].density(at[i])(0));
        EXPECT_NEAR(logd[i](0), std::log(d[i](0)), 1e-10);
    }
    // Standard trivariate normal at its mean
    EXPECT_NEAR(d[2](0), std::pow(2.0 * std::numbers::pi, -1.5), 1e-12);
}

TEST(DistVector, BroadcastLengthMismatchThrows) {
    const DistVector dist = mixed_vector();
    const ObservationList at = {row({1.0, 2.0}), row({0.0, 0.0})};
    EXPECT_THROW((void)dist.density(at), std::invalid_argument);
    EXPECT_THROW((void)dist.cdf(at), std::invalid_argument);
}

TEST(DistVector, CdfPerInstance) {
    const DistVector dist = dist_multivariate_normal(
        {Eigen::Vector2d(0.0, 0.0)},
        {Eigen::MatrixXd::Identity(2, 2), example_covariance()});
    const Eigen::VectorXd p = dist.cdf(ObservationList{row({0.0, 0.0}), row({0.0, std::numeric_limits<double>::infinity()})});
    ASSERT_EQ(p.size(), 2);
    EXPECT_NEAR(p(0), 0.25, 1e-8);
    EXPECT_NEAR(p(1), 0.5, 1e-8);
}

TEST(DistVector, QuantileAndGenerate) {
    const DistVector dist = mixed_vector();

    const auto q = dist.quantile({0.5});
    ASSERT_EQ(q.size(), 3u);
    EXPECT_NEAR(q[0](0, 1), 2.0, 1e-12);
    EXPECT_EQ(q[2].cols(), 3);

    const auto draws = dist.generate(4);
    ASSERT_EQ(draws.size(), 3u);
    EXPECT_EQ(draws[0].rows(), 4);
    EXPECT_EQ(draws[2].cols(), 3);
}

TEST(DistVector, MissingProviderPropagates) {
    ProviderOverride none(nullptr);
    const DistVector dist = mixed_vector();
    EXPECT_THROW((void)dist.density(row({0.0, 0.0})), MissingDependency);
    EXPECT_THROW((void)dist.generate(2), MissingDependency);
    EXPECT_NO_THROW((void)dist.quantile({0.5}));
}

TEST(DistVector, CloneIsIndependent) {
    DistVector dist = dist_multivariate_normal({example_mean()}, {example_covariance()});
    auto copy = dist.clone();
    dist.set_dimnames({"a", "b"});
    EXPECT_TRUE((*copy)[0].dimnames().empty());
    EXPECT_EQ(dist[0].dimnames()[0], "a");
}

TEST(DistVector, SupportPerInstance) {
    const DistVector dist = mixed_vector();
    const auto s = dist.support();
    ASSERT_EQ(s.size(), 3u);
    EXPECT_EQ(s[2].upper.size(), 3);
    EXPECT_EQ(s[0].lower(0), -std::numeric_limits<double>::infinity());
}
