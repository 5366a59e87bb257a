#pragma once

#include "config/bench_config.hpp"
#include "metrics/run_metrics.hpp"

#include <vector>

namespace arena {

/// Group runs by agent, one summary per agent in declaration order.
/// Agents without runs get an empty summary.
std::vector<TaskSummary> summarize(const std::vector<RunMetrics>& runs,
                                   const std::vector<AgentConfig>& agents);

/// Full ranking, best first:
///   1. pass rate, descending
///   2. average cost, ascending (no cost data ranks as infinite cost)
///   3. average wall time, ascending
/// Stable: remaining ties keep declaration order.
std::vector<const TaskSummary*> rankSummaries(const std::vector<TaskSummary>& summaries);

/// First entry of rankSummaries(), or nullptr for no summaries.
const TaskSummary* pickWinner(const std::vector<TaskSummary>& summaries);

} // namespace arena
