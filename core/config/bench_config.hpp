#pragma once

#include "metrics/metric_extractor.hpp"

#include <optional>
#include <string>
#include <vector>

namespace arena {

inline constexpr const char* kPromptPlaceholder = "{prompt}";

/// A single benchmark task.
struct TaskConfig {
    std::string name;
    std::string prompt;
    std::string validate;               // shell command; exit 0 = pass
    std::optional<int> timeout;         // overrides BenchConfig::timeout

    int effectiveTimeout(int global_timeout) const { return timeout.value_or(global_timeout); }
};

/// A single agent. Agents are pure data: a command template with a
/// {prompt} placeholder plus optional extraction patterns.
struct AgentConfig {
    std::string name;
    std::string command;
    std::optional<MetricPatterns> patterns;
};

/// Top-level benchmark definition.
struct BenchConfig {
    std::string project = "default";
    std::string base = "HEAD";
    int timeout = 120;                  // seconds, per command
    std::vector<TaskConfig> tasks;
    std::vector<AgentConfig> agents;
};

/// Check a config before anything runs. Throws ConfigError on:
/// - timeout < 1 (global or per task)
/// - no tasks / no agents, empty or duplicate names
/// - an agent command without {prompt}
/// - a pattern that does not compile or lacks exactly one capture group
void validateConfig(const BenchConfig& config);

/// Validate one agent on its own (used for --agent name:command).
void validateAgent(const AgentConfig& agent);

/// Parse "name:shell command with {prompt}". Splits on the first colon.
AgentConfig parseAgentFlag(const std::string& flag);

/// Starter bench.json written by `agentarena init`.
const std::string& sampleConfig();

} // namespace arena
