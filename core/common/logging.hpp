#pragma once

#include <memory>
#include <string>

namespace spdlog { class logger; }

namespace arena {

inline constexpr const char* kLoggerName = "agentarena";

/// Install the `agentarena` stderr logger as spdlog's default logger.
/// Safe to call more than once; later calls only change the level.
std::shared_ptr<spdlog::logger> initLogging(bool verbose = false);

} // namespace arena
