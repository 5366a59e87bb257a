#pragma once

#include "metrics/run_metrics.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace arena {

/// Directory, relative to the project root, holding saved runs.
inline constexpr const char* kHistoryDir = ".agentarena/runs";

/// One saved run as listed by `agentarena history`. Fields of files that
/// could not be read are "?".
struct HistoryEntry {
    std::string file;
    std::string timestamp = "?";
    std::string num_tasks = "?";
    std::string num_agents = "?";
    std::string winner = "?";
};

/// Write <project>/.agentarena/runs/<YYYY-MM-DD_HH-MM-SS>.json with the
/// per-agent summary, the winner and every run. Returns the file path.
/// Throws std::filesystem::filesystem_error or std::runtime_error on I/O failure.
std::filesystem::path saveRun(const std::filesystem::path& project_root,
                              const std::string& project,
                              const std::vector<RunMetrics>& runs,
                              const std::vector<TaskSummary>& summaries);

/// Saved runs, newest first. Empty if nothing was saved yet.
std::vector<HistoryEntry> listRuns(const std::filesystem::path& project_root);

/// Plain-text table of past runs.
std::string formatHistory(const std::vector<HistoryEntry>& entries);

} // namespace arena
