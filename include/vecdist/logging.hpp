#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace vecdist::logging {

/// Library logger, named "vecdist". Writes to stderr, level warn by default.
/// An existing logger registered under the same name is reused.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

void set_level(spdlog::level::level_enum level);

} // namespace vecdist::logging
