// PyBind11 bindings for the agentarena C++ core.
// Exposes config, metrics, scoring and the benchmark runner to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

#include "common/errors.hpp"
#include "config/bench_config.hpp"
#include "config/config_loader.hpp"
#include "metrics/metric_extractor.hpp"
#include "metrics/run_metrics.hpp"
#include "process/process_executor.hpp"
#include "report/export.hpp"
#include "runner/benchmark_runner.hpp"
#include "sandbox/sandbox_manager.hpp"
#include "scoring/scoring.hpp"

namespace py = pybind11;

PYBIND11_MODULE(agentarena_bindings, m) {
    m.doc() = "agentarena C++ Core Bindings";

    py::register_exception<arena::ConfigError>(m, "ConfigError", PyExc_ValueError);
    py::register_exception<arena::SandboxCreationError>(m, "SandboxCreationError");

    // ── MetricPatterns ──
    py::class_<arena::MetricPatterns>(m, "MetricPatterns")
        .def(py::init<>())
        .def_readwrite("tokens_in", &arena::MetricPatterns::tokens_in)
        .def_readwrite("tokens_out", &arena::MetricPatterns::tokens_out)
        .def_readwrite("cost", &arena::MetricPatterns::cost)
        .def_readwrite("llm_calls", &arena::MetricPatterns::llm_calls)
        .def("empty", &arena::MetricPatterns::empty);

    py::class_<arena::ExtractedMetrics>(m, "ExtractedMetrics")
        .def(py::init<>())
        .def_readwrite("tokens_in", &arena::ExtractedMetrics::tokens_in)
        .def_readwrite("tokens_out", &arena::ExtractedMetrics::tokens_out)
        .def_readwrite("cost_usd", &arena::ExtractedMetrics::cost_usd)
        .def_readwrite("llm_calls", &arena::ExtractedMetrics::llm_calls);

    // ── Config ──
    py::class_<arena::TaskConfig>(m, "TaskConfig")
        .def(py::init<>())
        .def_readwrite("name", &arena::TaskConfig::name)
        .def_readwrite("prompt", &arena::TaskConfig::prompt)
        .def_readwrite("validate", &arena::TaskConfig::validate)
        .def_readwrite("timeout", &arena::TaskConfig::timeout)
        .def("effective_timeout", &arena::TaskConfig::effectiveTimeout);

    py::class_<arena::AgentConfig>(m, "AgentConfig")
        .def(py::init<>())
        .def_readwrite("name", &arena::AgentConfig::name)
        .def_readwrite("command", &arena::AgentConfig::command)
        .def_readwrite("patterns", &arena::AgentConfig::patterns);

    py::class_<arena::BenchConfig>(m, "BenchConfig")
        .def(py::init<>())
        .def_readwrite("project", &arena::BenchConfig::project)
        .def_readwrite("base", &arena::BenchConfig::base)
        .def_readwrite("timeout", &arena::BenchConfig::timeout)
        .def_readwrite("tasks", &arena::BenchConfig::tasks)
        .def_readwrite("agents", &arena::BenchConfig::agents);

    m.def("validate_config", &arena::validateConfig);
    m.def("parse_agent_flag", &arena::parseAgentFlag);
    m.def("load_config", &arena::loadConfig);
    m.def("parse_config", &arena::parseConfig);

    // ── Metrics ──
    py::class_<arena::RunMetrics>(m, "RunMetrics")
        .def(py::init<>())
        .def_readwrite("agent_name", &arena::RunMetrics::agent_name)
        .def_readwrite("task_name", &arena::RunMetrics::task_name)
        .def_readwrite("passed", &arena::RunMetrics::passed)
        .def_readwrite("wall_time_seconds", &arena::RunMetrics::wall_time_seconds)
        .def_readwrite("tokens_in", &arena::RunMetrics::tokens_in)
        .def_readwrite("tokens_out", &arena::RunMetrics::tokens_out)
        .def_readwrite("cost_usd", &arena::RunMetrics::cost_usd)
        .def_readwrite("llm_calls", &arena::RunMetrics::llm_calls)
        .def_readwrite("timed_out", &arena::RunMetrics::timed_out)
        .def_readwrite("error", &arena::RunMetrics::error)
        .def_readwrite("exit_code", &arena::RunMetrics::exit_code)
        .def_property_readonly("total_tokens", &arena::RunMetrics::totalTokens);

    py::class_<arena::TaskSummary>(m, "TaskSummary")
        .def(py::init<>())
        .def_readwrite("agent_name", &arena::TaskSummary::agent_name)
        .def_readwrite("runs", &arena::TaskSummary::runs)
        .def_property_readonly("pass_count", &arena::TaskSummary::passCount)
        .def_property_readonly("total_count", &arena::TaskSummary::totalCount)
        .def_property_readonly("pass_rate", &arena::TaskSummary::passRate)
        .def_property_readonly("avg_time", &arena::TaskSummary::avgTime)
        .def_property_readonly("avg_cost", &arena::TaskSummary::avgCost)
        .def_property_readonly("total_tokens", &arena::TaskSummary::totalTokens);

    m.def("extract_metrics", &arena::extractMetrics,
          py::arg("combined_output"), py::arg("patterns"));

    // ── Scoring ──
    m.def("summarize", &arena::summarize, py::arg("runs"), py::arg("agents"));
    m.def("pick_winner",
          [](const std::vector<arena::TaskSummary>& summaries) -> std::optional<arena::TaskSummary> {
              const arena::TaskSummary* winner = arena::pickWinner(summaries);
              if (!winner) return std::nullopt;
              return *winner;
          });

    // ── Runner ──
    m.def("run_benchmark",
          [](const arena::BenchConfig& config, const std::filesystem::path& project_root) {
              arena::ProcessExecutor executor;
              arena::SandboxManager sandboxes(executor);
              arena::BenchmarkRunner runner(sandboxes, executor);
              py::gil_scoped_release release;
              return runner.runBenchmark(config, project_root);
          },
          py::arg("config"), py::arg("project_root"));

    // ── Export ──
    m.def("to_json", &arena::toJson);
    m.def("to_csv", &arena::toCsv);
    m.def("to_markdown", &arena::toMarkdown);
}
