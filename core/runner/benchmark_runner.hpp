#pragma once

#include "config/bench_config.hpp"
#include "metrics/run_metrics.hpp"
#include "process/process_executor.hpp"
#include "runner/agent_runner.hpp"
#include "runner/validator.hpp"
#include "sandbox/sandbox_manager.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace arena {

// ─── Run Observer ─────────────────────────────────────────────
// Progress hooks for reporters. All callbacks run on the benchmark
// thread, in matrix order.

class RunObserver {
public:
    virtual ~RunObserver() = default;

    virtual void onBenchmarkStart(const BenchConfig& /*config*/) {}
    virtual void onPairStart(const AgentConfig& /*agent*/, const TaskConfig& /*task*/) {}
    virtual void onPairFinished(const RunMetrics& /*metrics*/) {}

    /// `index` is 1-based; `runs` holds this task's records only.
    virtual void onTaskComplete(const TaskConfig& /*task*/, size_t /*index*/, size_t /*total*/,
                                const std::vector<RunMetrics>& /*runs*/) {}

    virtual void onBenchmarkComplete(const std::vector<TaskSummary>& /*summaries*/) {}
};

// ─── Run Metrics Builder ──────────────────────────────────────
// Folds the outcome of each pair stage into the final record:
//   sandbox failure  -> error, not passed
//   agent result     -> wall time, extracted metrics, timeout flag
//   validation       -> exit code, pass iff exit 0, timeout flag
//   exception        -> error text, not passed
// An agent timeout is terminal: later validation outcomes are ignored.

class RunMetricsBuilder {
public:
    RunMetricsBuilder(std::string agent_name, std::string task_name);

    RunMetricsBuilder& agentFinished(const AgentResult& result, double wall_time_seconds);
    RunMetricsBuilder& validationFinished(const ValidationResult& result);
    RunMetricsBuilder& failed(const std::string& error);

    bool agentTimedOut() const { return agent_timed_out_; }
    RunMetrics build() const { return metrics_; }

private:
    RunMetrics metrics_;
    bool agent_timed_out_ = false;
};

// ─── Benchmark Runner ─────────────────────────────────────────
// Runs the task x agent matrix, tasks outer and agents inner, one pair
// at a time:
//   1. create sandbox      (failure -> record error, return)
//   2. run agent           (wall time + extracted metrics)
//   3. agent timed out?    -> failed + timed out, skip validation
//   4. run validation      (pass iff exit 0; timeout -> timed out)
//   5. exceptions in 2-4   -> recorded as the pair's error
//   6. destroy sandbox     (always)
// A single pair never aborts the benchmark.

class BenchmarkRunner {
public:
    BenchmarkRunner(SandboxManager& sandboxes, const ProcessExecutor& executor,
                    RunObserver* observer = nullptr)
        : sandboxes_(sandboxes), executor_(executor), observer_(observer) {}

    /// One RunMetrics per (task, agent), task-major order.
    /// Throws ConfigError for an empty task or agent list or a bad
    /// pattern, and std::filesystem::filesystem_error if the sandbox
    /// root cannot be created. Nothing else escapes.
    std::vector<RunMetrics> runBenchmark(const BenchConfig& config,
                                         const std::filesystem::path& project_root);

    /// Run one pair start to finish. Never throws.
    RunMetrics runSingle(const AgentRunner& agent, const TaskConfig& task,
                         const std::filesystem::path& project_root,
                         int global_timeout, const std::string& base_ref);

private:
    SandboxManager& sandboxes_;
    const ProcessExecutor& executor_;
    RunObserver* observer_;  // non-owning, may be null
};

} // namespace arena
