#include "config/config_loader.hpp"
#include "common/errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace arena {

namespace {

std::optional<std::string> optionalString(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<std::string>();
}

std::optional<int> optionalInt(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<int>();
}

TaskConfig parseTask(const json& j) {
    if (!j.is_object()) throw ConfigError("each task must be an object");
    TaskConfig task;
    task.name = j.at("name").get<std::string>();
    task.prompt = j.at("prompt").get<std::string>();
    task.validate = j.at("validate").get<std::string>();
    task.timeout = optionalInt(j, "timeout");
    return task;
}

AgentConfig parseAgent(const json& j) {
    if (!j.is_object()) throw ConfigError("each agent must be an object");
    AgentConfig agent;
    agent.name = j.at("name").get<std::string>();
    agent.command = j.at("command").get<std::string>();

    if (j.contains("patterns") && !j.at("patterns").is_null()) {
        const json& p = j.at("patterns");
        if (!p.is_object()) throw ConfigError("Agent '" + agent.name + "': patterns must be an object");
        MetricPatterns patterns;
        patterns.tokens_in = optionalString(p, "tokens_in");
        patterns.tokens_out = optionalString(p, "tokens_out");
        patterns.cost = optionalString(p, "cost");
        patterns.llm_calls = optionalString(p, "llm_calls");
        agent.patterns = patterns;
    }
    return agent;
}

template <class T, class Parse>
std::vector<T> parseList(const json& root, const char* key, Parse parse) {
    std::vector<T> items;
    if (!root.contains(key)) return items;
    const json& list = root.at(key);
    if (!list.is_array()) throw ConfigError(std::string("'") + key + "' must be a list");
    for (const auto& item : list) items.push_back(parse(item));
    return items;
}

} // namespace

BenchConfig parseConfig(const std::string& text) {
    BenchConfig config;
    try {
        json root = json::parse(text);
        if (!root.is_object()) {
            throw ConfigError(std::string("Invalid config: expected a mapping, got ") + root.type_name());
        }
        config.project = root.value("project", config.project);
        config.base = root.value("base", config.base);
        config.timeout = root.value("timeout", config.timeout);
        config.tasks = parseList<TaskConfig>(root, "tasks", parseTask);
        config.agents = parseList<AgentConfig>(root, "agents", parseAgent);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid config: ") + e.what());
    }

    validateConfig(config);
    return config;
}

BenchConfig loadConfig(const std::filesystem::path& path) {
    const std::string ext = path.extension().string();
    if (ext == ".yaml" || ext == ".yml") {
        throw ConfigError("YAML configs are not supported: " + path.string() +
                          "\nConvert it to JSON with the same keys, or run `agentarena init` for a starter bench.json.");
    }

    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Config file not found: " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();

    BenchConfig config = parseConfig(buf.str());
    spdlog::debug("loaded {} task(s) and {} agent(s) from {}", config.tasks.size(),
                  config.agents.size(), path.string());
    return config;
}

} // namespace arena
