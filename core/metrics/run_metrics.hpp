#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arena {

// ─── Run Metrics ──────────────────────────────────────────────
// Everything measured for one (agent, task) pair. Exactly one record
// exists per pair; failures set `error` instead of dropping the record.

struct RunMetrics {
    std::string agent_name;
    std::string task_name;
    bool passed = false;
    double wall_time_seconds = 0.0;     // agent invocation only
    std::optional<int64_t> tokens_in;
    std::optional<int64_t> tokens_out;
    std::optional<double> cost_usd;
    std::optional<int64_t> llm_calls;
    bool timed_out = false;
    std::optional<std::string> error;
    std::optional<int> exit_code;       // validation exit code, if validation ran

    /// tokens_in + tokens_out, or nothing unless both are known.
    std::optional<int64_t> totalTokens() const {
        if (tokens_in && tokens_out) return *tokens_in + *tokens_out;
        return std::nullopt;
    }
};

// ─── Task Summary ─────────────────────────────────────────────
// One agent's runs across every task. All figures are derived on
// demand from the run list.

struct TaskSummary {
    std::string agent_name;
    std::vector<RunMetrics> runs;

    int passCount() const;
    int totalCount() const { return static_cast<int>(runs.size()); }
    double passRate() const;
    double avgTime() const;

    /// Mean over runs that reported a cost; nothing if none did.
    std::optional<double> avgCost() const;

    /// Sum of known token totals; nothing if no run had both counts.
    std::optional<int64_t> totalTokens() const;
};

/// Wall-clock stopwatch on the monotonic clock.
class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    void restart() { start_ = std::chrono::steady_clock::now(); }

    /// Seconds since construction or restart, rounded to 0.01.
    double elapsed() const;

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace arena
