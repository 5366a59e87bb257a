#include "common/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace arena {

std::shared_ptr<spdlog::logger> initLogging(bool verbose) {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        // stdout is reserved for exports
        logger = spdlog::stderr_color_mt(kLoggerName);
        logger->set_pattern("[%H:%M:%S] [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    return logger;
}

} // namespace arena
