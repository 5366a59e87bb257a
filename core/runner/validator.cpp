#include "runner/validator.hpp"

#include <spdlog/spdlog.h>

namespace arena {

ValidationResult runValidation(const ProcessExecutor& executor,
                               const std::string& command,
                               const std::filesystem::path& cwd,
                               int timeout_seconds) {
    ExecResult exec = executor.execute(command, cwd, timeout_seconds);

    ValidationResult result;
    result.passed = exec.succeeded();
    result.exit_code = exec.exit_code;
    result.stdout_text = std::move(exec.stdout_text);
    result.stderr_text = std::move(exec.stderr_text);
    result.duration_seconds = exec.duration_seconds;
    result.timed_out = exec.timed_out;

    spdlog::debug("validation [{}] -> {} (exit {}, {:.2f}s)", command,
                  result.passed ? "pass" : "fail", result.exit_code, result.duration_seconds);
    return result;
}

} // namespace arena
