#include "sandbox/sandbox_manager.hpp"
#include "common/errors.hpp"
#include "common/strings.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <random>
#include <sstream>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace arena {

namespace {

bool isExcluded(const fs::path& name) {
    const auto& excluded = SandboxManager::copyExclusions();
    return std::find(excluded.begin(), excluded.end(), name.string()) != excluded.end();
}

/// Copy `from` into the existing directory `to`, skipping excluded names
/// at every depth. Symlinks are copied as links.
void copyTree(const fs::path& from, const fs::path& to) {
    for (auto it = fs::recursive_directory_iterator(from); it != fs::recursive_directory_iterator(); ++it) {
        const fs::directory_entry& entry = *it;
        if (isExcluded(entry.path().filename())) {
            if (entry.is_directory() && !entry.is_symlink()) it.disable_recursion_pending();
            continue;
        }

        fs::path dest = to / entry.path().lexically_relative(from);
        if (entry.is_symlink()) {
            fs::copy_symlink(entry.path(), dest);
        } else if (entry.is_directory()) {
            fs::create_directory(dest);
        } else if (entry.is_regular_file()) {
            fs::copy_file(entry.path(), dest);
        }
        // sockets, fifos and devices are not part of a project tree
    }
}

} // namespace

std::string strategyName(SandboxStrategy strategy) {
    switch (strategy) {
        case SandboxStrategy::WORKTREE: return "worktree";
        case SandboxStrategy::COPY:     return "copy";
    }
    return "unknown";
}

// ─── Identifiers ──────────────────────────────────────────────

std::string SandboxManager::newRunId() {
    static std::atomic<uint64_t> sequence{0};
    thread_local std::mt19937_64 rng([] {
        std::random_device rd;
        uint64_t seed = (static_cast<uint64_t>(rd()) << 32) ^ rd();
        return seed ^ std::hash<std::thread::id>{}(std::this_thread::get_id());
    }());

    uint64_t value = rng() ^ (sequence.fetch_add(1) * 0x9E3779B97F4A7C15ULL);
    char buf[13];
    std::snprintf(buf, sizeof(buf), "%012llx",
                  static_cast<unsigned long long>(value & 0xFFFFFFFFFFFFULL));
    return std::string("run-") + buf;
}

const std::vector<std::string>& SandboxManager::copyExclusions() {
    static const std::vector<std::string> names = {
        ".git", ".agentarena",
        ".venv", "venv", "node_modules",
        "__pycache__", ".pytest_cache", ".mypy_cache", ".ruff_cache",
    };
    return names;
}

// ─── Git helpers ──────────────────────────────────────────────

ExecResult SandboxManager::runGit(const std::string& args, const fs::path& cwd) const {
    return executor_.execute("git " + args, cwd, git_timeout_seconds_);
}

bool SandboxManager::isGitRepo(const fs::path& path) const {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) return false;
    return runGit("rev-parse --git-dir", path).succeeded();
}

std::vector<std::string> SandboxManager::listWorktrees(const fs::path& repo_root) const {
    ExecResult r = runGit("worktree list --porcelain", repo_root);
    if (!r.succeeded()) {
        throw std::runtime_error("git worktree list failed: " + trim(r.stderr_text));
    }

    std::vector<std::string> paths;
    std::istringstream lines(r.stdout_text);
    std::string line;
    const std::string prefix = "worktree ";
    while (std::getline(lines, line)) {
        if (line.compare(0, prefix.size(), prefix) == 0) {
            paths.push_back(line.substr(prefix.size()));
        }
    }
    return paths;
}

// ─── Create ───────────────────────────────────────────────────

fs::path SandboxManager::prepareRoot(const fs::path& project_root) const {
    if (!fs::is_directory(project_root)) {
        throw fs::filesystem_error("project root is not a directory", project_root,
                                   std::make_error_code(std::errc::not_a_directory));
    }
    fs::path root = fs::absolute(project_root) / kSandboxDir;
    fs::create_directories(root);
    return root;
}

Sandbox SandboxManager::create(const fs::path& project_root, const std::string& ref) {
    Sandbox sandbox;
    try {
        // git resolves the worktree path against its own cwd, so the root must be absolute
        fs::path root = fs::absolute(project_root);
        sandbox = isGitRepo(root) ? createWorktree(root, ref) : createCopy(root);
    } catch (const SandboxCreationError&) {
        throw;
    } catch (const std::exception& e) {
        throw SandboxCreationError(e.what());
    }
    spdlog::debug("created {} sandbox {}", strategyName(sandbox.strategy), sandbox.path.string());
    return sandbox;
}

Sandbox SandboxManager::createWorktree(const fs::path& repo_root, const std::string& ref) {
    fs::path path = prepareRoot(repo_root) / newRunId();

    ExecResult r = runGit("worktree add " + shellQuote(path.string()) + " --detach " + shellQuote(ref),
                          repo_root);
    if (!r.succeeded()) {
        throw SandboxCreationError("Failed to create worktree at " + path.string() + ": " +
                                   trim(r.stderr_text));
    }
    return Sandbox{path, SandboxStrategy::WORKTREE};
}

Sandbox SandboxManager::createCopy(const fs::path& project_root) {
    fs::path parent = prepareRoot(project_root);
    fs::path path = parent / newRunId();
    while (!fs::create_directory(path)) {
        path = parent / newRunId();
    }

    try {
        copyTree(project_root, path);
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove_all(path, ec);
        throw SandboxCreationError("Failed to copy project into " + path.string() + ": " + e.what());
    }
    return Sandbox{path, SandboxStrategy::COPY};
}

// ─── Destroy ──────────────────────────────────────────────────

void SandboxManager::destroy(const fs::path& project_root, const Sandbox& sandbox) noexcept {
    std::error_code ec;
    if (sandbox.path.empty() || !fs::exists(sandbox.path, ec)) {
        return;
    }

    if (sandbox.strategy == SandboxStrategy::WORKTREE) {
        destroyWorktree(project_root, sandbox.path);
    } else {
        destroyCopy(sandbox.path);
    }
}

void SandboxManager::destroyWorktree(const fs::path& repo_root, const fs::path& path) noexcept {
    try {
        ExecResult r = runGit("worktree remove " + shellQuote(path.string()) + " --force", repo_root);
        if (r.succeeded()) {
            spdlog::debug("removed worktree {}", path.string());
            return;
        }
        spdlog::warn("git worktree remove failed for {}: {}", path.string(), trim(r.stderr_text));
    } catch (const std::exception& e) {
        spdlog::warn("git worktree remove failed for {}: {}", path.string(), e.what());
    }

    // Fallback: drop the directory, then let git forget the stale entry.
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        spdlog::warn("could not delete {}: {}", path.string(), ec.message());
    }
    try {
        ExecResult r = runGit("worktree prune", repo_root);
        if (!r.succeeded()) {
            spdlog::warn("git worktree prune failed: {}", trim(r.stderr_text));
        }
    } catch (const std::exception& e) {
        spdlog::warn("git worktree prune failed: {}", e.what());
    }
}

void SandboxManager::destroyCopy(const fs::path& path) noexcept {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        spdlog::debug("ignoring cleanup error for {}: {}", path.string(), ec.message());
    }
}

} // namespace arena
