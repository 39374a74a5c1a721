#pragma once

#include "vecdist/numerics/mvn_provider.hpp"
#include <memory>
#include <string_view>

namespace vecdist::numerics {

/// Dependency name reported by MissingDependency.
inline constexpr std::string_view kMvnProviderName = "mvn";

/// Install the process-wide MVN provider. Passing nullptr unregisters it.
/// An EigenMvnProvider is registered at startup.
void register_mvn_provider(std::shared_ptr<const MvnProvider> provider);

void unregister_mvn_provider();

/// Currently registered provider, or nullptr.
[[nodiscard]] std::shared_ptr<const MvnProvider> find_mvn_provider();

/// Currently registered provider; throws vecdist::MissingDependency if none.
[[nodiscard]] std::shared_ptr<const MvnProvider> require_mvn_provider();

} // namespace vecdist::numerics
