#pragma once

#include "runner/benchmark_runner.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace arena {

// ─── Console Reporter ─────────────────────────────────────────
// Scoreboard printed while the benchmark runs: a banner, one table per
// task as it completes, then the summary table and the winner.

class ConsoleReporter : public RunObserver {
public:
    explicit ConsoleReporter(std::ostream& out) : out_(out) {}

    void onBenchmarkStart(const BenchConfig& config) override;
    void onPairStart(const AgentConfig& agent, const TaskConfig& task) override;
    void onTaskComplete(const TaskConfig& task, size_t index, size_t total,
                        const std::vector<RunMetrics>& runs) override;
    void onBenchmarkComplete(const std::vector<TaskSummary>& summaries) override;

    void printHeader(const std::string& project, size_t num_agents, size_t num_tasks);
    void printTaskResult(const TaskConfig& task, size_t index, size_t total,
                         const std::vector<RunMetrics>& runs);
    void printSummary(const std::vector<TaskSummary>& summaries);

private:
    void rule(const std::string& title);

    std::ostream& out_;
};

} // namespace arena
