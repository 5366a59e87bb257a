#pragma once

#include <filesystem>
#include <string>

namespace arena {

// ─── Exec Result ──────────────────────────────────────────────
// Outcome of one shell command. A timeout is a regular result:
// timed_out = true, exit_code = -1, stderr holds the message.

struct ExecResult {
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
    double duration_seconds = 0.0;  // monotonic, rounded to 0.01
    bool timed_out = false;

    bool succeeded() const { return !timed_out && exit_code == 0; }
};

// ─── Process Executor ─────────────────────────────────────────
// Runs `/bin/sh -c <command>` in its own process group and collects
// both output streams. On timeout the whole group gets SIGKILL, so
// commands that spawn children or ignore SIGTERM still stop.
//
// Shared by agent invocation (exit code informational) and
// validation (exit code 0 = pass).

class ProcessExecutor {
public:
    virtual ~ProcessExecutor() = default;

    /// Run a command and block until it exits or the timeout expires.
    /// Throws std::runtime_error if `cwd` is not a directory and
    /// std::system_error if the process cannot be spawned.
    virtual ExecResult execute(const std::string& command,
                               const std::filesystem::path& cwd,
                               int timeout_seconds) const;
};

/// Quote a single argument for /bin/sh.
std::string shellQuote(const std::string& arg);

/// Round to two decimal places.
double roundSeconds(double seconds);

} // namespace arena
