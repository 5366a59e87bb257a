#pragma once

#include "metrics/run_metrics.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace arena {

/// "45s" below a minute, "2m5s" above.
std::string formatTime(double seconds);

/// "4.2K" from 1000 up, "500" below, "-" if unknown.
std::string formatTokens(std::optional<int64_t> count);

/// "$0.08", or "-" if unknown.
std::string formatCost(std::optional<double> cost);

/// "3/4 75%"
std::string formatPassRate(const TaskSummary& summary);

/// "PASS", "FAIL", "TIMEOUT" or "ERROR".
std::string resultLabel(const RunMetrics& run);

} // namespace arena
