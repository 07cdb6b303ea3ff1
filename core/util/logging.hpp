#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace vibescore {

/// The process-wide "vibescore" logger (stderr, colored). Created on
/// first use at info level.
std::shared_ptr<spdlog::logger> logger();

/// Adjust the level of the shared logger.
void setLogLevel(spdlog::level::level_enum level);

} // namespace vibescore
