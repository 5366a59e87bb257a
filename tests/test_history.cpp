#include <gtest/gtest.h>
#include "history/history_store.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

using namespace arena;
using arena::test::TempDir;
using json = nlohmann::json;

namespace fs = std::filesystem;

namespace {

RunMetrics run(const std::string& agent, const std::string& task, bool passed) {
    RunMetrics r;
    r.agent_name = agent;
    r.task_name = task;
    r.passed = passed;
    r.wall_time_seconds = 1.0;
    return r;
}

std::vector<TaskSummary> summariesFor(const std::vector<RunMetrics>& runs) {
    TaskSummary a{"alpha", {}};
    TaskSummary b{"beta", {}};
    for (const auto& r : runs) (r.agent_name == "alpha" ? a : b).runs.push_back(r);
    return {a, b};
}

} // namespace

// ─── Save Tests ───────────────────────────────────────────────

TEST(HistoryTest, SaveWritesRunFile) {
    TempDir project;
    std::vector<RunMetrics> runs = {run("alpha", "t1", true), run("beta", "t1", false),
                                    run("alpha", "t2", true), run("beta", "t2", true)};

    fs::path file = saveRun(project.path(), "demo", runs, summariesFor(runs));
    ASSERT_TRUE(fs::exists(file));
    EXPECT_EQ(file.parent_path(), project.path() / kHistoryDir);
    EXPECT_EQ(file.extension(), ".json");

    json data = json::parse(arena::test::readFile(file));
    EXPECT_EQ(data["project"].get<std::string>(), "demo");
    EXPECT_EQ(data["num_tasks"].get<int>(), 2);
    EXPECT_EQ(data["num_agents"].get<int>(), 2);
    EXPECT_EQ(data["winner"].get<std::string>(), "alpha");
    EXPECT_EQ(data["summary"].size(), 2u);
    EXPECT_EQ(data["runs"].size(), 4u);
    EXPECT_EQ(data["summary"][0]["agent"].get<std::string>(), "alpha");
}

TEST(HistoryTest, SameSecondSavesDoNotCollide) {
    TempDir project;
    std::vector<RunMetrics> runs = {run("alpha", "t1", true)};
    fs::path first = saveRun(project.path(), "demo", runs, summariesFor(runs));
    fs::path second = saveRun(project.path(), "demo", runs, summariesFor(runs));
    EXPECT_NE(first, second);
    EXPECT_TRUE(fs::exists(first));
    EXPECT_TRUE(fs::exists(second));
}

TEST(HistoryTest, NoSummariesMeansNullWinner) {
    TempDir project;
    fs::path file = saveRun(project.path(), "demo", {}, {});
    json data = json::parse(arena::test::readFile(file));
    EXPECT_TRUE(data["winner"].is_null());
}

// ─── List Tests ───────────────────────────────────────────────

TEST(HistoryTest, ListWithoutHistoryIsEmpty) {
    TempDir project;
    EXPECT_TRUE(listRuns(project.path()).empty());
    EXPECT_EQ(formatHistory({}), "No runs yet. Run `agentarena run` first.\n");
}

TEST(HistoryTest, ListNewestFirst) {
    TempDir project;
    project.write(std::string(kHistoryDir) + "/2024-01-01_10-00-00.json",
                  R"({"timestamp": "2024-01-01_10-00-00", "num_tasks": 1, "num_agents": 2, "winner": "old"})");
    project.write(std::string(kHistoryDir) + "/2024-03-05_09-30-00.json",
                  R"({"timestamp": "2024-03-05_09-30-00", "num_tasks": 3, "num_agents": 1, "winner": null})");
    project.write(std::string(kHistoryDir) + "/notes.txt", "ignored");

    auto entries = listRuns(project.path());
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].file, "2024-03-05_09-30-00.json");
    EXPECT_EQ(entries[0].num_tasks, "3");
    EXPECT_EQ(entries[0].winner, "-");
    EXPECT_EQ(entries[1].winner, "old");
    EXPECT_EQ(entries[1].num_agents, "2");
}

TEST(HistoryTest, UnreadableFileShowsPlaceholders) {
    TempDir project;
    project.write(std::string(kHistoryDir) + "/2024-01-01_10-00-00.json", "{ broken");

    auto entries = listRuns(project.path());
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].file, "2024-01-01_10-00-00.json");
    EXPECT_EQ(entries[0].timestamp, "?");
    EXPECT_EQ(entries[0].winner, "?");
}

TEST(HistoryTest, SavedRunIsListed) {
    TempDir project;
    std::vector<RunMetrics> runs = {run("alpha", "t1", true), run("beta", "t1", false)};
    fs::path file = saveRun(project.path(), "demo", runs, summariesFor(runs));

    auto entries = listRuns(project.path());
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].file, file.filename().string());
    EXPECT_EQ(entries[0].winner, "alpha");
    EXPECT_EQ(entries[0].num_tasks, "1");

    std::string table = formatHistory(entries);
    EXPECT_NE(table.find("Winner"), std::string::npos);
    EXPECT_NE(table.find(file.filename().string()), std::string::npos);
}
