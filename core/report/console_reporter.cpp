#include "report/console_reporter.hpp"
#include "report/format.hpp"
#include "scoring/scoring.hpp"

#include <iomanip>

namespace arena {

namespace {

constexpr size_t kRuleWidth = 72;

std::string llmCalls(const RunMetrics& run) {
    return run.llm_calls ? std::to_string(*run.llm_calls) : "-";
}

} // namespace

void ConsoleReporter::rule(const std::string& title) {
    std::string line = "── " + title + " ";
    // the box-drawing glyph is three bytes but one column
    size_t columns = title.size() + 4;
    while (columns < kRuleWidth) {
        line += "─";
        columns++;
    }
    out_ << line << "\n";
}

void ConsoleReporter::onBenchmarkStart(const BenchConfig& config) {
    printHeader(config.project, config.agents.size(), config.tasks.size());
}

void ConsoleReporter::onPairStart(const AgentConfig& agent, const TaskConfig& task) {
    out_ << "  Running " << agent.name << " on " << task.name << "...\n" << std::flush;
}

void ConsoleReporter::onTaskComplete(const TaskConfig& task, size_t index, size_t total,
                                     const std::vector<RunMetrics>& runs) {
    printTaskResult(task, index, total, runs);
}

void ConsoleReporter::onBenchmarkComplete(const std::vector<TaskSummary>& summaries) {
    printSummary(summaries);
}

void ConsoleReporter::printHeader(const std::string& project, size_t num_agents, size_t num_tasks) {
    out_ << "\n";
    rule("agentarena");
    out_ << "  racing " << num_agents << " agents on " << num_tasks << " tasks\n"
         << "  project: " << project << "\n\n";
}

void ConsoleReporter::printTaskResult(const TaskConfig& task, size_t index, size_t total,
                                      const std::vector<RunMetrics>& runs) {
    out_ << "\n";
    rule("Task " + std::to_string(index) + "/" + std::to_string(total) + ": " + task.name);
    out_ << "  " << task.prompt << "\n\n";

    out_ << std::left
         << "  " << std::setw(16) << "Agent"
         << std::setw(9) << "Result"
         << std::right
         << std::setw(8) << "Time"
         << std::setw(9) << "Cost"
         << std::setw(10) << "Tokens"
         << std::setw(11) << "LLM Calls" << "\n";

    for (const auto& run : runs) {
        out_ << std::left
             << "  " << std::setw(16) << run.agent_name
             << std::setw(9) << resultLabel(run)
             << std::right
             << std::setw(8) << formatTime(run.wall_time_seconds)
             << std::setw(9) << formatCost(run.cost_usd)
             << std::setw(10) << formatTokens(run.totalTokens())
             << std::setw(11) << llmCalls(run) << "\n";
        if (run.error) {
            out_ << "    error: " << *run.error << "\n";
        }
    }
    out_ << std::flush;
}

void ConsoleReporter::printSummary(const std::vector<TaskSummary>& summaries) {
    out_ << "\n";
    rule("RESULTS");
    out_ << "\n";

    out_ << std::left
         << "  " << std::setw(16) << "Agent"
         << std::setw(13) << "Pass Rate"
         << std::right
         << std::setw(10) << "Avg Time"
         << std::setw(10) << "Avg Cost"
         << std::setw(14) << "Total Tokens" << "\n";

    for (const auto& s : summaries) {
        out_ << std::left
             << "  " << std::setw(16) << s.agent_name
             << std::setw(13) << formatPassRate(s)
             << std::right
             << std::setw(10) << formatTime(s.avgTime())
             << std::setw(10) << formatCost(s.avgCost())
             << std::setw(14) << formatTokens(s.totalTokens()) << "\n";
    }

    if (const TaskSummary* winner = pickWinner(summaries)) {
        out_ << "\n  Winner: " << winner->agent_name
             << " (" << winner->passCount() << "/" << winner->totalCount() << " passed, "
             << formatCost(winner->avgCost()) << " avg cost)\n";
    }
    out_ << std::flush;
}

} // namespace arena
