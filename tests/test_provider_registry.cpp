#include <gtest/gtest.h>
#include "vecdist/errors.hpp"
#include "vecdist/logging.hpp"
#include "vecdist/numerics/provider_registry.hpp"
#include "mvn_test_utils.hpp"
#include <memory>

using namespace vecdist;
using namespace vecdist::numerics;
using vecdist::test::ProviderOverride;
using vecdist::test::RecordingProvider;

TEST(ProviderRegistry, DefaultProviderIsRegistered) {
    const auto provider = find_mvn_provider();
    ASSERT_NE(provider, nullptr);
    EXPECT_EQ(provider->name(), "eigen");
    EXPECT_EQ(require_mvn_provider(), provider);
}

TEST(ProviderRegistry, MissingProviderThrows) {
    ProviderOverride none(nullptr);
    EXPECT_EQ(find_mvn_provider(), nullptr);
    try {
        (void)require_mvn_provider();
        FAIL() << "expected MissingDependency";
    } catch (const MissingDependency& e) {
        EXPECT_EQ(e.dependency(), "mvn");
        EXPECT_NE(std::string(e.what()).find("mvn"), std::string::npos);
    }
}

TEST(ProviderRegistry, RegisterReplacesProvider) {
    auto recording = std::make_shared<RecordingProvider>();
    {
        ProviderOverride guard(recording);
        EXPECT_EQ(require_mvn_provider()->name(), "recording");
    }
    EXPECT_EQ(require_mvn_provider()->name(), "eigen");
}

TEST(ProviderRegistry, UnregisterThenRestore) {
    const auto previous = find_mvn_provider();
    unregister_mvn_provider();
    EXPECT_THROW((void)require_mvn_provider(), MissingDependency);
    register_mvn_provider(previous);
    EXPECT_EQ(find_mvn_provider(), previous);
}

TEST(ProviderRegistry, HeldProviderOutlivesUnregister) {
    auto held = require_mvn_provider();
    ProviderOverride none(nullptr);
    Eigen::MatrixXd x(1, 1);
    x << 0.0;
    const Eigen::VectorXd d = held->density(x, Eigen::VectorXd::Zero(1), Eigen::MatrixXd::Identity(1, 1), false);
    EXPECT_NEAR(d(0), 0.3989422804014327, 1e-12);
}

TEST(Logging, SetLevelAppliesToLibraryLogger) {
    const auto lg = vecdist::logging::logger();
    ASSERT_NE(lg, nullptr);
    EXPECT_EQ(lg->name(), "vecdist");

    const auto previous = lg->level();
    vecdist::logging::set_level(spdlog::level::debug);
    EXPECT_EQ(vecdist::logging::logger()->level(), spdlog::level::debug);
    vecdist::logging::set_level(previous);
}
