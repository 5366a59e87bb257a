#include "runner/benchmark_runner.hpp"
#include "common/errors.hpp"
#include "scoring/scoring.hpp"

#include <spdlog/spdlog.h>

#include <optional>

namespace arena {

// ─── Run Metrics Builder ──────────────────────────────────────

RunMetricsBuilder::RunMetricsBuilder(std::string agent_name, std::string task_name) {
    metrics_.agent_name = std::move(agent_name);
    metrics_.task_name = std::move(task_name);
}

RunMetricsBuilder& RunMetricsBuilder::agentFinished(const AgentResult& result,
                                                    double wall_time_seconds) {
    metrics_.wall_time_seconds = wall_time_seconds;
    metrics_.tokens_in = result.metrics.tokens_in;
    metrics_.tokens_out = result.metrics.tokens_out;
    metrics_.cost_usd = result.metrics.cost_usd;
    metrics_.llm_calls = result.metrics.llm_calls;
    if (result.timed_out) {
        agent_timed_out_ = true;
        metrics_.timed_out = true;
        metrics_.passed = false;
    }
    return *this;
}

RunMetricsBuilder& RunMetricsBuilder::validationFinished(const ValidationResult& result) {
    if (agent_timed_out_) return *this;
    metrics_.exit_code = result.exit_code;
    metrics_.passed = result.passed && !result.timed_out;
    if (result.timed_out) metrics_.timed_out = true;
    return *this;
}

RunMetricsBuilder& RunMetricsBuilder::failed(const std::string& error) {
    metrics_.error = error;
    metrics_.passed = false;
    return *this;
}

// ─── Benchmark Runner ─────────────────────────────────────────

RunMetrics BenchmarkRunner::runSingle(const AgentRunner& agent, const TaskConfig& task,
                                      const std::filesystem::path& project_root,
                                      int global_timeout, const std::string& base_ref) {
    const int timeout = task.effectiveTimeout(global_timeout);
    RunMetricsBuilder record(agent.name(), task.name);

    // 1. Sandbox
    std::optional<ScopedSandbox> sandbox;
    try {
        sandbox.emplace(sandboxes_, project_root, sandboxes_.create(project_root, base_ref));
    } catch (const std::exception& e) {
        spdlog::error("{} / {}: sandbox creation failed: {}", agent.name(), task.name, e.what());
        return record.failed(std::string("Sandbox creation failed: ") + e.what()).build();
    }

    try {
        // 2. Agent
        Timer timer;
        AgentResult result = agent.run(task.prompt, sandbox->path(), timeout);
        record.agentFinished(result, timer.elapsed());

        // 3. Agent timeout skips validation
        if (result.timed_out) {
            spdlog::warn("{} / {}: agent timed out after {}s", agent.name(), task.name, timeout);
            return record.build();
        }

        // 4. Validation
        ValidationResult validation = runValidation(executor_, task.validate, sandbox->path(), timeout);
        record.validationFinished(validation);
        if (validation.timed_out) {
            spdlog::warn("{} / {}: validation timed out after {}s", agent.name(), task.name, timeout);
        }
    } catch (const std::exception& e) {
        spdlog::error("{} / {}: {}", agent.name(), task.name, e.what());
        record.failed(e.what());
    }

    // 6. `sandbox` is destroyed on every return path
    return record.build();
}

std::vector<RunMetrics> BenchmarkRunner::runBenchmark(const BenchConfig& config,
                                                      const std::filesystem::path& project_root) {
    if (config.tasks.empty()) throw ConfigError("at least one task is required");
    if (config.agents.empty()) throw ConfigError("at least one agent is required");

    std::vector<AgentRunner> agents;
    agents.reserve(config.agents.size());
    for (const auto& agent_config : config.agents) {
        agents.emplace_back(agent_config, executor_);
    }

    sandboxes_.prepareRoot(project_root);

    spdlog::info("racing {} agent(s) on {} task(s) in {}", agents.size(), config.tasks.size(),
                 project_root.string());
    if (observer_) observer_->onBenchmarkStart(config);

    std::vector<RunMetrics> all_runs;
    all_runs.reserve(config.tasks.size() * agents.size());

    for (size_t t = 0; t < config.tasks.size(); t++) {
        const TaskConfig& task = config.tasks[t];
        std::vector<RunMetrics> task_runs;

        for (const auto& agent : agents) {
            spdlog::info("running {} on {}", agent.name(), task.name);
            if (observer_) observer_->onPairStart(agent.config(), task);

            RunMetrics metrics = runSingle(agent, task, project_root, config.timeout, config.base);

            spdlog::info("{} on {}: {} in {:.2f}s", agent.name(), task.name,
                         metrics.passed ? "PASS" : (metrics.timed_out ? "TIMEOUT" : "FAIL"),
                         metrics.wall_time_seconds);
            if (observer_) observer_->onPairFinished(metrics);
            task_runs.push_back(metrics);
            all_runs.push_back(std::move(metrics));
        }

        if (observer_) observer_->onTaskComplete(task, t + 1, config.tasks.size(), task_runs);
    }

    if (observer_) observer_->onBenchmarkComplete(summarize(all_runs, config.agents));
    return all_runs;
}

} // namespace arena
