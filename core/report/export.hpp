#pragma once

#include "metrics/run_metrics.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace arena {

/// Plain record form of a run; absent values become null.
nlohmann::json runToJson(const RunMetrics& run);

/// Inverse of runToJson. Missing keys fall back to defaults.
RunMetrics runFromJson(const nlohmann::json& j);

/// Aggregate row for one agent (rates and times rounded to 0.01).
nlohmann::json summaryToJson(const TaskSummary& summary);

/// Pretty-printed JSON array of all runs.
std::string toJson(const std::vector<RunMetrics>& runs);

/// CSV with a header row; absent values are empty fields.
/// No runs gives an empty string.
std::string toCsv(const std::vector<RunMetrics>& runs);

/// Markdown summary table, one row per agent.
std::string toMarkdown(const std::vector<TaskSummary>& summaries);

} // namespace arena
