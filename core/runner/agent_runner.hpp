#pragma once

#include "config/bench_config.hpp"
#include "metrics/metric_extractor.hpp"
#include "process/process_executor.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace arena {

/// What comes back from one agent invocation.
struct AgentResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;              // informational only
    bool timed_out = false;
    double duration_seconds = 0.0;
    ExtractedMetrics metrics;       // empty unless the agent declares patterns
};

// ─── Agent Runner ─────────────────────────────────────────────
// Drives any agent CLI from its config record: substitutes the prompt
// into the command template, runs it, and applies the agent's
// extraction patterns to the output. New agents need configuration
// only, never a subclass.

class AgentRunner {
public:
    /// Compiles the agent's patterns. Throws ConfigError on a bad pattern.
    AgentRunner(AgentConfig config, const ProcessExecutor& executor);

    const std::string& name() const { return config_.name; }
    const AgentConfig& config() const { return config_; }

    /// Replace every "{prompt}" in the template with `prompt`.
    std::string buildCommand(const std::string& prompt) const;

    /// Run the agent in `cwd`. Metrics are extracted only from runs that
    /// finished within the timeout.
    AgentResult run(const std::string& prompt, const std::filesystem::path& cwd,
                    int timeout_seconds) const;

private:
    AgentConfig config_;
    const ProcessExecutor& executor_;
    std::optional<MetricExtractor> extractor_;
};

} // namespace arena
