#include "report/export.hpp"
#include "report/format.hpp"

#include <cmath>
#include <cstdint>
#include <sstream>

using json = nlohmann::json;

namespace arena {

namespace {

template <class T>
json orNull(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

template <class T>
std::optional<T> optionalField(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<T>();
}

double round2(double v) { return std::round(v * 100.0) / 100.0; }

std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) return value;
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

// Shortest text that reads back to the same double, as in the JSON export.
std::string csvNumber(double value) { return json(value).dump(); }

std::string csvOptional(const std::optional<int64_t>& value) {
    return value ? std::to_string(*value) : "";
}

std::string csvOptional(const std::optional<double>& value) {
    return value ? csvNumber(*value) : "";
}

} // namespace

json runToJson(const RunMetrics& run) {
    return json{
        {"agent_name", run.agent_name},
        {"task_name", run.task_name},
        {"passed", run.passed},
        {"wall_time_seconds", run.wall_time_seconds},
        {"tokens_in", orNull(run.tokens_in)},
        {"tokens_out", orNull(run.tokens_out)},
        {"cost_usd", orNull(run.cost_usd)},
        {"llm_calls", orNull(run.llm_calls)},
        {"timed_out", run.timed_out},
        {"error", orNull(run.error)},
        {"exit_code", orNull(run.exit_code)},
    };
}

RunMetrics runFromJson(const json& j) {
    RunMetrics run;
    run.agent_name = j.value("agent_name", std::string());
    run.task_name = j.value("task_name", std::string());
    run.passed = j.value("passed", false);
    run.wall_time_seconds = j.value("wall_time_seconds", 0.0);
    run.tokens_in = optionalField<int64_t>(j, "tokens_in");
    run.tokens_out = optionalField<int64_t>(j, "tokens_out");
    run.cost_usd = optionalField<double>(j, "cost_usd");
    run.llm_calls = optionalField<int64_t>(j, "llm_calls");
    run.timed_out = j.value("timed_out", false);
    run.error = optionalField<std::string>(j, "error");
    run.exit_code = optionalField<int>(j, "exit_code");
    return run;
}

json summaryToJson(const TaskSummary& summary) {
    auto cost = summary.avgCost();
    return json{
        {"agent", summary.agent_name},
        {"pass_count", summary.passCount()},
        {"total_count", summary.totalCount()},
        {"pass_rate", round2(summary.passRate())},
        {"avg_time", round2(summary.avgTime())},
        {"avg_cost", cost ? json(round2(*cost)) : json(nullptr)},
        {"total_tokens", orNull(summary.totalTokens())},
    };
}

std::string toJson(const std::vector<RunMetrics>& runs) {
    json data = json::array();
    for (const auto& run : runs) data.push_back(runToJson(run));
    return data.dump(2);
}

std::string toCsv(const std::vector<RunMetrics>& runs) {
    if (runs.empty()) return "";

    std::ostringstream out;
    out << "agent_name,task_name,passed,wall_time_seconds,tokens_in,tokens_out,"
           "cost_usd,llm_calls,timed_out\n";
    for (const auto& run : runs) {
        out << csvField(run.agent_name) << ','
            << csvField(run.task_name) << ','
            << (run.passed ? "true" : "false") << ','
            << csvNumber(run.wall_time_seconds) << ','
            << csvOptional(run.tokens_in) << ','
            << csvOptional(run.tokens_out) << ','
            << csvOptional(run.cost_usd) << ','
            << csvOptional(run.llm_calls) << ','
            << (run.timed_out ? "true" : "false") << '\n';
    }
    return out.str();
}

std::string toMarkdown(const std::vector<TaskSummary>& summaries) {
    std::ostringstream out;
    out << "| Agent | Pass Rate | Avg Time | Avg Cost | Total Tokens |\n"
        << "|-------|-----------|----------|----------|--------------|";
    for (const auto& s : summaries) {
        out << "\n| " << s.agent_name
            << " | " << formatPassRate(s)
            << " | " << formatTime(s.avgTime())
            << " | " << formatCost(s.avgCost())
            << " | " << formatTokens(s.totalTokens()) << " |";
    }
    return out.str();
}

} // namespace arena
