#include <gtest/gtest.h>
#include "report/console_reporter.hpp"
#include "report/export.hpp"
#include "report/format.hpp"

#include <nlohmann/json.hpp>

#include <sstream>

using namespace arena;
using json = nlohmann::json;

namespace {

RunMetrics fullRun() {
    RunMetrics r;
    r.agent_name = "claude";
    r.task_name = "fix-bug";
    r.passed = true;
    r.wall_time_seconds = 12.5;
    r.tokens_in = 4200;
    r.tokens_out = 800;
    r.cost_usd = 0.08;
    r.llm_calls = 3;
    r.exit_code = 0;
    return r;
}

RunMetrics bareRun() {
    RunMetrics r;
    r.agent_name = "tool";
    r.task_name = "fix-bug";
    r.wall_time_seconds = 30.0;
    r.timed_out = true;
    return r;
}

} // namespace

// ─── Format Tests ─────────────────────────────────────────────

TEST(ReportTest, FormatTime) {
    EXPECT_EQ(formatTime(0.4), "0s");
    EXPECT_EQ(formatTime(45.0), "45s");
    EXPECT_EQ(formatTime(125.0), "2m5s");
    EXPECT_EQ(formatTime(60.0), "1m0s");
}

TEST(ReportTest, FormatTokens) {
    EXPECT_EQ(formatTokens(std::nullopt), "-");
    EXPECT_EQ(formatTokens(500), "500");
    EXPECT_EQ(formatTokens(1000), "1.0K");
    EXPECT_EQ(formatTokens(4200), "4.2K");
}

TEST(ReportTest, FormatCost) {
    EXPECT_EQ(formatCost(std::nullopt), "-");
    EXPECT_EQ(formatCost(0.08), "$0.08");
    EXPECT_EQ(formatCost(1.0), "$1.00");
}

TEST(ReportTest, ResultLabel) {
    RunMetrics r;
    EXPECT_EQ(resultLabel(r), "FAIL");
    r.error = "boom";
    EXPECT_EQ(resultLabel(r), "ERROR");
    r.timed_out = true;
    EXPECT_EQ(resultLabel(r), "TIMEOUT");
    EXPECT_EQ(resultLabel(fullRun()), "PASS");
}

TEST(ReportTest, FormatPassRate) {
    TaskSummary s;
    s.agent_name = "a";
    s.runs = {fullRun(), bareRun(), fullRun(), fullRun()};
    EXPECT_EQ(formatPassRate(s), "3/4 75%");
}

// ─── JSON Export Tests ────────────────────────────────────────

TEST(ReportTest, JsonHasEveryField) {
    json data = json::parse(toJson({fullRun(), bareRun()}));
    ASSERT_TRUE(data.is_array());
    ASSERT_EQ(data.size(), 2u);

    EXPECT_EQ(data[0]["agent_name"].get<std::string>(), "claude");
    EXPECT_EQ(data[0]["tokens_in"].get<int64_t>(), 4200);
    EXPECT_TRUE(data[0]["passed"].get<bool>());
    EXPECT_TRUE(data[1]["tokens_in"].is_null());
    EXPECT_TRUE(data[1]["cost_usd"].is_null());
    EXPECT_TRUE(data[1]["error"].is_null());
    EXPECT_TRUE(data[1]["timed_out"].get<bool>());
}

TEST(ReportTest, JsonRecordRoundTrips) {
    RunMetrics back = runFromJson(runToJson(fullRun()));
    EXPECT_EQ(back.agent_name, "claude");
    EXPECT_EQ(back.tokens_out, 800);
    EXPECT_EQ(back.llm_calls, 3);
    EXPECT_EQ(back.exit_code, 0);
    EXPECT_FALSE(runFromJson(runToJson(bareRun())).cost_usd.has_value());
}

TEST(ReportTest, EmptyJsonIsEmptyArray) {
    json empty = json::parse(toJson({}));
    EXPECT_TRUE(empty.is_array());
    EXPECT_TRUE(empty.empty());
}

TEST(ReportTest, SummaryJsonRounds) {
    TaskSummary s;
    s.agent_name = "a";
    s.runs = {fullRun(), bareRun(), fullRun()};
    json j = summaryToJson(s);
    EXPECT_EQ(j["agent"].get<std::string>(), "a");
    EXPECT_EQ(j["pass_count"].get<int>(), 2);
    EXPECT_EQ(j["total_count"].get<int>(), 3);
    EXPECT_DOUBLE_EQ(j["pass_rate"].get<double>(), 0.67);
    EXPECT_DOUBLE_EQ(j["avg_time"].get<double>(), 18.33);
    EXPECT_DOUBLE_EQ(j["avg_cost"].get<double>(), 0.08);
    EXPECT_EQ(j["total_tokens"].get<int64_t>(), 10000);
}

// ─── CSV Export Tests ─────────────────────────────────────────

TEST(ReportTest, CsvRows) {
    std::string csv = toCsv({fullRun(), bareRun()});
    std::istringstream lines(csv);
    std::string header, first, second;
    std::getline(lines, header);
    std::getline(lines, first);
    std::getline(lines, second);

    EXPECT_EQ(header, "agent_name,task_name,passed,wall_time_seconds,tokens_in,tokens_out,"
                      "cost_usd,llm_calls,timed_out");
    EXPECT_EQ(first, "claude,fix-bug,true,12.5,4200,800,0.08,3,false");
    EXPECT_EQ(second, "tool,fix-bug,false,30.0,,,,,true");
}

TEST(ReportTest, CsvKeepsFullPrecision) {
    RunMetrics r = fullRun();
    r.wall_time_seconds = 12345.67;
    r.cost_usd = 0.1234567;
    std::string csv = toCsv({r});
    EXPECT_NE(csv.find("claude,fix-bug,true,12345.67,4200,800,0.1234567,3,false"),
              std::string::npos) << csv;
}

TEST(ReportTest, CsvQuotesSpecialCharacters) {
    RunMetrics r = bareRun();
    r.agent_name = "a,b";
    r.task_name = "say \"hi\"";
    std::string csv = toCsv({r});
    EXPECT_NE(csv.find("\"a,b\",\"say \"\"hi\"\"\","), std::string::npos) << csv;
}

TEST(ReportTest, CsvEmpty) {
    EXPECT_EQ(toCsv({}), "");
}

// ─── Markdown Export Tests ────────────────────────────────────

TEST(ReportTest, MarkdownTable) {
    TaskSummary s;
    s.agent_name = "claude";
    s.runs = {fullRun()};
    std::string md = toMarkdown({s});

    EXPECT_EQ(md,
              "| Agent | Pass Rate | Avg Time | Avg Cost | Total Tokens |\n"
              "|-------|-----------|----------|----------|--------------|\n"
              "| claude | 1/1 100% | 12s | $0.08 | 5.0K |");
}

// ─── Console Reporter Tests ───────────────────────────────────

TEST(ReportTest, ConsoleTaskTable) {
    std::ostringstream out;
    ConsoleReporter reporter(out);
    TaskConfig task{"fix-bug", "Fix the bug", "pytest", std::nullopt};
    RunMetrics err = bareRun();
    err.timed_out = false;
    err.error = "Sandbox creation failed: disk full";

    reporter.printTaskResult(task, 1, 2, {fullRun(), err});
    std::string text = out.str();

    EXPECT_NE(text.find("Task 1/2: fix-bug"), std::string::npos);
    EXPECT_NE(text.find("Fix the bug"), std::string::npos);
    EXPECT_NE(text.find("PASS"), std::string::npos);
    EXPECT_NE(text.find("ERROR"), std::string::npos);
    EXPECT_NE(text.find("5.0K"), std::string::npos);
    EXPECT_NE(text.find("error: Sandbox creation failed: disk full"), std::string::npos);
}

TEST(ReportTest, ConsoleSummaryNamesWinner) {
    std::ostringstream out;
    ConsoleReporter reporter(out);

    TaskSummary good;
    good.agent_name = "claude";
    good.runs = {fullRun()};
    TaskSummary bad;
    bad.agent_name = "tool";
    bad.runs = {bareRun()};

    reporter.printSummary({bad, good});
    std::string text = out.str();
    EXPECT_NE(text.find("RESULTS"), std::string::npos);
    EXPECT_NE(text.find("Winner: claude (1/1 passed, $0.08 avg cost)"), std::string::npos);
}

TEST(ReportTest, ConsoleSummaryWithoutAgents) {
    std::ostringstream out;
    ConsoleReporter reporter(out);
    reporter.printSummary({});
    EXPECT_EQ(out.str().find("Winner"), std::string::npos);
}
