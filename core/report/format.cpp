#include "report/format.hpp"

#include <cstdio>

namespace arena {

std::string formatTime(double seconds) {
    char buf[32];
    if (seconds < 60) {
        std::snprintf(buf, sizeof(buf), "%.0fs", seconds);
    } else {
        long total = static_cast<long>(seconds);
        std::snprintf(buf, sizeof(buf), "%ldm%lds", total / 60, total % 60);
    }
    return buf;
}

std::string formatTokens(std::optional<int64_t> count) {
    if (!count) return "-";
    if (*count >= 1000) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1fK", static_cast<double>(*count) / 1000.0);
        return buf;
    }
    return std::to_string(*count);
}

std::string formatCost(std::optional<double> cost) {
    if (!cost) return "-";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "$%.2f", *cost);
    return buf;
}

std::string formatPassRate(const TaskSummary& summary) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%d/%d %.0f%%", summary.passCount(), summary.totalCount(),
                  summary.passRate() * 100.0);
    return buf;
}

std::string resultLabel(const RunMetrics& run) {
    if (run.timed_out) return "TIMEOUT";
    if (run.passed) return "PASS";
    if (run.error) return "ERROR";
    return "FAIL";
}

} // namespace arena
