#pragma once

#include "process/process_executor.hpp"

#include <filesystem>
#include <string>

namespace arena {

/// Result of a task's validation command. Pass means exit code 0.
struct ValidationResult {
    bool passed = false;
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
    double duration_seconds = 0.0;
    bool timed_out = false;         // always a failure
};

/// Run a validation command (e.g. "pytest tests/") in a sandbox.
ValidationResult runValidation(const ProcessExecutor& executor,
                               const std::string& command,
                               const std::filesystem::path& cwd,
                               int timeout_seconds);

} // namespace arena
