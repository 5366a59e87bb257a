#include "metrics/run_metrics.hpp"
#include "process/process_executor.hpp"

namespace arena {

int TaskSummary::passCount() const {
    int passed = 0;
    for (const auto& r : runs) {
        if (r.passed) passed++;
    }
    return passed;
}

double TaskSummary::passRate() const {
    if (runs.empty()) return 0.0;
    return static_cast<double>(passCount()) / runs.size();
}

double TaskSummary::avgTime() const {
    if (runs.empty()) return 0.0;
    double total = 0.0;
    for (const auto& r : runs) total += r.wall_time_seconds;
    return total / runs.size();
}

std::optional<double> TaskSummary::avgCost() const {
    double total = 0.0;
    int count = 0;
    for (const auto& r : runs) {
        if (r.cost_usd) {
            total += *r.cost_usd;
            count++;
        }
    }
    if (count == 0) return std::nullopt;
    return total / count;
}

std::optional<int64_t> TaskSummary::totalTokens() const {
    std::optional<int64_t> sum;
    for (const auto& r : runs) {
        if (auto t = r.totalTokens()) {
            sum = sum.value_or(0) + *t;
        }
    }
    return sum;
}

double Timer::elapsed() const {
    auto now = std::chrono::steady_clock::now();
    return roundSeconds(std::chrono::duration<double>(now - start_).count());
}

} // namespace arena
