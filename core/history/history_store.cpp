#include "history/history_store.hpp"
#include "report/export.hpp"
#include "scoring/scoring.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <functional>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace arena {

namespace {

std::string timestampNow() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d_%H-%M-%S", &local);
    return buf;
}

/// <stem>.json, or <stem>_2.json, <stem>_3.json ... if taken.
fs::path uniqueFile(const fs::path& dir, const std::string& stem) {
    fs::path candidate = dir / (stem + ".json");
    for (int n = 2; fs::exists(candidate); n++) {
        candidate = dir / (stem + "_" + std::to_string(n) + ".json");
    }
    return candidate;
}

std::string fieldText(const json& j, const char* key) {
    if (!j.contains(key)) return "?";
    const json& v = j.at(key);
    if (v.is_null()) return "-";
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

} // namespace

fs::path saveRun(const fs::path& project_root, const std::string& project,
                 const std::vector<RunMetrics>& runs,
                 const std::vector<TaskSummary>& summaries) {
    fs::path dir = project_root / kHistoryDir;
    fs::create_directories(dir);

    std::string timestamp = timestampNow();
    fs::path file = uniqueFile(dir, timestamp);

    std::set<std::string> tasks;
    std::set<std::string> agents;
    for (const auto& r : runs) {
        tasks.insert(r.task_name);
        agents.insert(r.agent_name);
    }

    const TaskSummary* winner = pickWinner(summaries);

    json data = {
        {"timestamp", timestamp},
        {"project", project},
        {"num_tasks", tasks.size()},
        {"num_agents", agents.size()},
        {"winner", winner ? json(winner->agent_name) : json(nullptr)},
        {"summary", json::array()},
        {"runs", json::array()},
    };
    for (const auto& s : summaries) data["summary"].push_back(summaryToJson(s));
    for (const auto& r : runs) data["runs"].push_back(runToJson(r));

    std::ofstream out(file);
    out << data.dump(2);
    if (!out) {
        throw std::runtime_error("could not write " + file.string());
    }
    spdlog::debug("saved run history to {}", file.string());
    return file;
}

std::vector<HistoryEntry> listRuns(const fs::path& project_root) {
    std::vector<HistoryEntry> entries;
    fs::path dir = project_root / kHistoryDir;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return entries;

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    // timestamped names sort chronologically
    std::sort(files.begin(), files.end(), std::greater<fs::path>());

    for (const auto& path : files) {
        HistoryEntry e;
        e.file = path.filename().string();
        try {
            std::ifstream in(path);
            json data = json::parse(in);
            e.timestamp = fieldText(data, "timestamp");
            e.num_tasks = fieldText(data, "num_tasks");
            e.num_agents = fieldText(data, "num_agents");
            e.winner = fieldText(data, "winner");
        } catch (const json::exception& ex) {
            spdlog::warn("unreadable history file {}: {}", path.string(), ex.what());
        }
        entries.push_back(std::move(e));
    }
    return entries;
}

std::string formatHistory(const std::vector<HistoryEntry>& entries) {
    if (entries.empty()) {
        return "No runs yet. Run `agentarena run` first.\n";
    }

    std::ostringstream out;
    out << std::left
        << std::setw(5) << "#"
        << std::setw(22) << "Date"
        << std::setw(7) << "Tasks"
        << std::setw(8) << "Agents"
        << std::setw(18) << "Winner"
        << "File\n";
    for (size_t i = 0; i < entries.size(); i++) {
        const HistoryEntry& e = entries[i];
        out << std::setw(5) << (i + 1)
            << std::setw(22) << e.timestamp
            << std::setw(7) << e.num_tasks
            << std::setw(8) << e.num_agents
            << std::setw(18) << e.winner
            << e.file << "\n";
    }
    return out.str();
}

} // namespace arena
