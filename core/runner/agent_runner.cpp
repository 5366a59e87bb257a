#include "runner/agent_runner.hpp"
#include "common/strings.hpp"

#include <spdlog/spdlog.h>

namespace arena {

AgentRunner::AgentRunner(AgentConfig config, const ProcessExecutor& executor)
    : config_(std::move(config)), executor_(executor) {
    if (config_.patterns && !config_.patterns->empty()) {
        extractor_.emplace(*config_.patterns);
    }
}

std::string AgentRunner::buildCommand(const std::string& prompt) const {
    return replaceAll(config_.command, kPromptPlaceholder, prompt);
}

AgentResult AgentRunner::run(const std::string& prompt, const std::filesystem::path& cwd,
                             int timeout_seconds) const {
    ExecResult exec = executor_.execute(buildCommand(prompt), cwd, timeout_seconds);

    AgentResult result;
    result.stdout_text = std::move(exec.stdout_text);
    result.stderr_text = std::move(exec.stderr_text);
    result.exit_code = exec.exit_code;
    result.timed_out = exec.timed_out;
    result.duration_seconds = exec.duration_seconds;

    if (result.timed_out) {
        spdlog::debug("agent {} timed out after {}s", config_.name, timeout_seconds);
        return result;
    }
    if (result.exit_code != 0) {
        spdlog::debug("agent {} exited with {}", config_.name, result.exit_code);
    }

    if (extractor_) {
        result.metrics = extractor_->extract(result.stdout_text, result.stderr_text);
    }
    return result;
}

} // namespace arena
