#include "config/bench_config.hpp"
#include "common/errors.hpp"
#include "common/strings.hpp"

#include <set>

namespace arena {

namespace {

void checkPattern(const std::string& agent, const char* metric,
                  const std::optional<std::string>& pattern) {
    if (!pattern) return;
    size_t groups = MetricExtractor::captureGroups(*pattern);
    if (groups != 1) {
        throw ConfigError("Agent '" + agent + "': pattern for " + metric +
                          " must have exactly one capture group, found " +
                          std::to_string(groups));
    }
}

template <class T>
void checkUnique(const std::vector<T>& items, const char* what) {
    std::set<std::string> seen;
    std::set<std::string> dupes;
    for (const auto& item : items) {
        if (item.name.empty()) {
            throw ConfigError(std::string(what) + " name must not be empty");
        }
        if (!seen.insert(item.name).second) dupes.insert(item.name);
    }
    if (!dupes.empty()) {
        std::string list;
        for (const auto& d : dupes) {
            if (!list.empty()) list += ", ";
            list += d;
        }
        throw ConfigError(std::string("Duplicate ") + what + " names: " + list);
    }
}

} // namespace

void validateAgent(const AgentConfig& agent) {
    if (agent.name.empty()) {
        throw ConfigError("agent name must not be empty");
    }
    if (agent.command.find(kPromptPlaceholder) == std::string::npos) {
        throw ConfigError("Agent '" + agent.name + "': command must contain '{prompt}' placeholder");
    }
    if (agent.patterns) {
        checkPattern(agent.name, "tokens_in", agent.patterns->tokens_in);
        checkPattern(agent.name, "tokens_out", agent.patterns->tokens_out);
        checkPattern(agent.name, "cost", agent.patterns->cost);
        checkPattern(agent.name, "llm_calls", agent.patterns->llm_calls);
    }
}

void validateConfig(const BenchConfig& config) {
    if (config.timeout < 1) {
        throw ConfigError("timeout must be at least 1 second");
    }
    if (config.tasks.empty()) {
        throw ConfigError("at least one task is required");
    }
    if (config.agents.empty()) {
        throw ConfigError("at least one agent is required");
    }
    checkUnique(config.tasks, "task");
    checkUnique(config.agents, "agent");

    for (const auto& task : config.tasks) {
        if (task.timeout && *task.timeout < 1) {
            throw ConfigError("Task '" + task.name + "': timeout must be at least 1 second");
        }
    }
    for (const auto& agent : config.agents) {
        validateAgent(agent);
    }
}

AgentConfig parseAgentFlag(const std::string& flag) {
    auto colon = flag.find(':');
    if (colon == std::string::npos) {
        throw ConfigError("Invalid --agent format: '" + flag + "'. Expected 'name:command'");
    }
    AgentConfig agent;
    agent.name = trim(flag.substr(0, colon));
    agent.command = trim(flag.substr(colon + 1));
    validateAgent(agent);
    return agent;
}

const std::string& sampleConfig() {
    static const std::string text = R"json({
  "project": "my-project",
  "timeout": 120,
  "tasks": [
    {
      "name": "example-task",
      "prompt": "Fix the bug in main.py",
      "validate": "python -m pytest tests/"
    }
  ],
  "agents": [
    {
      "name": "claude-code",
      "command": "claude --print '{prompt}'",
      "patterns": {
        "tokens_in": "input tokens:\\s*([\\d,]+)",
        "tokens_out": "output tokens:\\s*([\\d,]+)",
        "cost": "cost:\\s*\\$?([\\d.]+)"
      }
    },
    {
      "name": "my-tool",
      "command": "my-tool run '{prompt}'"
    }
  ]
}
)json";
    return text;
}

} // namespace arena
