#include "vecdist/numerics/provider_registry.hpp"
#include "vecdist/errors.hpp"
#include "vecdist/logging.hpp"
#include "vecdist/numerics/eigen_mvn_provider.hpp"
#include <mutex>
#include <string>

namespace vecdist::numerics {

namespace {

struct Slot {
    std::mutex mutex;
    std::shared_ptr<const MvnProvider> provider = std::make_shared<EigenMvnProvider>();
};

Slot& slot() {
    static Slot instance;
    return instance;
}

} // anonymous namespace

void register_mvn_provider(std::shared_ptr<const MvnProvider> provider) {
    auto& s = slot();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (provider) {
        logging::logger()->info("registered '{}' provider for {}", provider->name(), kMvnProviderName);
    } else {
        logging::logger()->info("unregistered {} provider", kMvnProviderName);
    }
    s.provider = std::move(provider);
}

void unregister_mvn_provider() {
    register_mvn_provider(nullptr);
}

std::shared_ptr<const MvnProvider> find_mvn_provider() {
    auto& s = slot();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.provider;
}

std::shared_ptr<const MvnProvider> require_mvn_provider() {
    auto provider = find_mvn_provider();
    if (!provider) {
        logging::logger()->warn("no {} provider registered", kMvnProviderName);
        throw MissingDependency(std::string(kMvnProviderName));
    }
    return provider;
}

} // namespace vecdist::numerics
