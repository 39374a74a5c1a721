#include <gtest/gtest.h>
#include "vecdist/numerics/normal.hpp"
#include <cmath>
#include <limits>

using namespace vecdist::numerics;

TEST(StandardNormalQuantile, KnownValues) {
    EXPECT_NEAR(standard_normal_quantile(0.975), 1.959963984540054, 1e-12);
    EXPECT_NEAR(standard_normal_quantile(0.025), -1.959963984540054, 1e-12);
    EXPECT_NEAR(standard_normal_quantile(0.5), 0.0, 1e-15);
}

TEST(StandardNormalQuantile, Boundaries) {
    EXPECT_EQ(standard_normal_quantile(0.0), -std::numeric_limits<double>::infinity());
    EXPECT_EQ(standard_normal_quantile(1.0), std::numeric_limits<double>::infinity());
}

TEST(StandardNormalQuantile, OutOfRangeIsNaN) {
    EXPECT_TRUE(std::isnan(standard_normal_quantile(-0.1)));
    EXPECT_TRUE(std::isnan(standard_normal_quantile(1.5)));
    EXPECT_TRUE(std::isnan(standard_normal_quantile(std::numeric_limits<double>::quiet_NaN())));
}

TEST(StandardNormalCdf, KnownValuesAndInfinity) {
    EXPECT_NEAR(standard_normal_cdf(1.959963984540054), 0.975, 1e-12);
    EXPECT_DOUBLE_EQ(standard_normal_cdf(0.0), 0.5);
    EXPECT_DOUBLE_EQ(standard_normal_cdf(std::numeric_limits<double>::infinity()), 1.0);
    EXPECT_DOUBLE_EQ(standard_normal_cdf(-std::numeric_limits<double>::infinity()), 0.0);
    EXPECT_TRUE(std::isnan(standard_normal_cdf(std::numeric_limits<double>::quiet_NaN())));
}

TEST(NormalQuantile, LocationScale) {
    EXPECT_NEAR(normal_quantile(0.975, 1.0, 2.0), 1.0 + 2.0 * 1.959963984540054, 1e-12);
    EXPECT_NEAR(normal_quantile(0.5, -3.0, 5.0), -3.0, 1e-14);
}

TEST(NormalQuantile, ZeroSdCollapsesToMean) {
    EXPECT_DOUBLE_EQ(normal_quantile(0.3, 4.0, 0.0), 4.0);
    EXPECT_EQ(normal_quantile(0.0, 4.0, 0.0), -std::numeric_limits<double>::infinity());
    EXPECT_EQ(normal_quantile(1.0, 4.0, 0.0), std::numeric_limits<double>::infinity());
}

TEST(NormalQuantile, NegativeSdIsNaN) {
    EXPECT_TRUE(std::isnan(normal_quantile(0.3, 0.0, -1.0)));
}
