#pragma once

#include "process/process_executor.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace arena {

/// Hidden directory, relative to the project root, holding all sandboxes.
inline constexpr const char* kSandboxDir = ".agentarena/worktrees";

enum class SandboxStrategy {
    WORKTREE,  // git worktree --detach, shares the object store
    COPY       // recursive copy of the project tree
};

std::string strategyName(SandboxStrategy strategy);

// ─── Sandbox ──────────────────────────────────────────────────
// An isolated, disposable workspace for one (agent, task) pair.

struct Sandbox {
    std::filesystem::path path;
    SandboxStrategy strategy = SandboxStrategy::COPY;
};

// ─── Sandbox Manager ──────────────────────────────────────────
// Creates and destroys workspaces under <project>/.agentarena/worktrees.
// Git projects get a detached worktree at the requested ref; anything
// else gets a filtered copy of the tree.
//
// destroy() never throws: a failed worktree removal falls back to
// deleting the directory and `git worktree prune`, and a failure of the
// fallback is only logged.

class SandboxManager {
public:
    explicit SandboxManager(const ProcessExecutor& executor, int git_timeout_seconds = 120)
        : executor_(executor), git_timeout_seconds_(git_timeout_seconds) {}
    virtual ~SandboxManager() = default;

    /// Create the sandbox root directory. Throws std::filesystem::filesystem_error.
    virtual std::filesystem::path prepareRoot(const std::filesystem::path& project_root) const;

    /// Create a workspace. Throws SandboxCreationError.
    virtual Sandbox create(const std::filesystem::path& project_root,
                           const std::string& ref = "HEAD");

    /// Remove a workspace. Missing paths are a no-op.
    virtual void destroy(const std::filesystem::path& project_root,
                         const Sandbox& sandbox) noexcept;

    /// True if `path` lies inside a git repository.
    bool isGitRepo(const std::filesystem::path& path) const;

    /// Paths of all active worktrees of the repository at `repo_root`.
    std::vector<std::string> listWorktrees(const std::filesystem::path& repo_root) const;

    /// Directory names skipped by the copy strategy.
    static const std::vector<std::string>& copyExclusions();

    /// Fresh `run-<12 hex>` identifier, unique across threads.
    static std::string newRunId();

private:
    Sandbox createWorktree(const std::filesystem::path& repo_root, const std::string& ref);
    Sandbox createCopy(const std::filesystem::path& project_root);
    void destroyWorktree(const std::filesystem::path& repo_root, const std::filesystem::path& path) noexcept;
    void destroyCopy(const std::filesystem::path& path) noexcept;

    ExecResult runGit(const std::string& args, const std::filesystem::path& cwd) const;

    const ProcessExecutor& executor_;
    int git_timeout_seconds_;
};

// ─── Scoped Sandbox ───────────────────────────────────────────
// Destroys the held sandbox when the scope ends, including during
// stack unwinding.

class ScopedSandbox {
public:
    ScopedSandbox(SandboxManager& manager, std::filesystem::path project_root, Sandbox sandbox)
        : manager_(manager), project_root_(std::move(project_root)), sandbox_(std::move(sandbox)) {}
    ~ScopedSandbox() { manager_.destroy(project_root_, sandbox_); }

    ScopedSandbox(const ScopedSandbox&) = delete;
    ScopedSandbox& operator=(const ScopedSandbox&) = delete;

    const Sandbox& get() const { return sandbox_; }
    const std::filesystem::path& path() const { return sandbox_.path; }

private:
    SandboxManager& manager_;
    std::filesystem::path project_root_;
    Sandbox sandbox_;
};

} // namespace arena
