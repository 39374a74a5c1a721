#include "vecdist/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace vecdist::logging {

namespace {

constexpr auto kLoggerName = "vecdist";

std::shared_ptr<spdlog::logger> make_logger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto lg = spdlog::stderr_color_mt(kLoggerName);
    lg->set_level(spdlog::level::warn);
    return lg;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return instance;
}

void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace vecdist::logging
