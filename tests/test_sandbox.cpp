#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "sandbox/sandbox_manager.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <thread>

using namespace arena;
using arena::test::TempDir;
using arena::test::readFile;

namespace fs = std::filesystem;

// ─── Identifier Tests ─────────────────────────────────────────

TEST(SandboxTest, RunIdFormat) {
    std::string id = SandboxManager::newRunId();
    ASSERT_EQ(id.size(), 16u);
    EXPECT_EQ(id.substr(0, 4), "run-");
    for (char c : id.substr(4)) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c))) << id;
    }
}

TEST(SandboxTest, RunIdsUniqueAcrossThreads) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;
    std::vector<std::vector<std::string>> ids(kThreads);
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; t++) {
        workers.emplace_back([&ids, t] {
            for (int i = 0; i < kPerThread; i++) ids[t].push_back(SandboxManager::newRunId());
        });
    }
    for (auto& w : workers) w.join();

    std::set<std::string> all;
    for (const auto& batch : ids) all.insert(batch.begin(), batch.end());
    EXPECT_EQ(all.size(), static_cast<size_t>(kThreads * kPerThread));
}

// ─── Copy Strategy Tests ──────────────────────────────────────

TEST(SandboxTest, CopyStrategyOutsideGit) {
    TempDir project;
    project.write("main.py", "print('hi')\n");
    project.write("src/lib.py", "x = 1\n");

    ProcessExecutor executor;
    SandboxManager manager(executor);
    Sandbox sb = manager.create(project.path());

    EXPECT_EQ(sb.strategy, SandboxStrategy::COPY);
    EXPECT_EQ(sb.path.parent_path(), project.path() / kSandboxDir);
    EXPECT_EQ(readFile(sb.path / "main.py"), "print('hi')\n");
    EXPECT_EQ(readFile(sb.path / "src" / "lib.py"), "x = 1\n");

    manager.destroy(project.path(), sb);
    EXPECT_FALSE(fs::exists(sb.path));
}

TEST(SandboxTest, CopySkipsExcludedDirectories) {
    TempDir project;
    project.write("app.js", "1");
    project.write("node_modules/dep/index.js", "2");
    project.write("src/__pycache__/mod.pyc", "3");
    project.write(".venv/bin/python", "4");
    project.write(".agentarena/runs/old.json", "{}");

    ProcessExecutor executor;
    SandboxManager manager(executor);
    Sandbox sb = manager.create(project.path());

    EXPECT_TRUE(fs::exists(sb.path / "app.js"));
    EXPECT_TRUE(fs::exists(sb.path / "src"));
    EXPECT_FALSE(fs::exists(sb.path / "node_modules"));
    EXPECT_FALSE(fs::exists(sb.path / "src" / "__pycache__"));
    EXPECT_FALSE(fs::exists(sb.path / ".venv"));
    EXPECT_FALSE(fs::exists(sb.path / ".agentarena"));

    manager.destroy(project.path(), sb);
}

TEST(SandboxTest, SandboxesAreIsolated) {
    TempDir project;
    project.write("data.txt", "original");

    ProcessExecutor executor;
    SandboxManager manager(executor);
    Sandbox a = manager.create(project.path());
    Sandbox b = manager.create(project.path());
    EXPECT_NE(a.path, b.path);

    std::ofstream(a.path / "data.txt") << "changed by a";

    EXPECT_EQ(readFile(b.path / "data.txt"), "original");
    EXPECT_EQ(readFile(project.path() / "data.txt"), "original");

    manager.destroy(project.path(), a);
    manager.destroy(project.path(), b);
}

TEST(SandboxTest, ExclusionList) {
    const auto& names = SandboxManager::copyExclusions();
    for (const char* expected : {".git", ".agentarena", ".venv", "venv", "node_modules",
                                 "__pycache__", ".pytest_cache", ".mypy_cache", ".ruff_cache"}) {
        EXPECT_NE(std::find(names.begin(), names.end(), expected), names.end()) << expected;
    }
}

// ─── Destroy Tests ────────────────────────────────────────────

TEST(SandboxTest, DestroyMissingPathIsNoOp) {
    TempDir project;
    ProcessExecutor executor;
    SandboxManager manager(executor);

    Sandbox ghost{project.path() / kSandboxDir / "run-000000000000", SandboxStrategy::WORKTREE};
    manager.destroy(project.path(), ghost);
    manager.destroy(project.path(), Sandbox{});
    EXPECT_FALSE(fs::exists(ghost.path));
}

TEST(SandboxTest, ScopedSandboxDestroysOnScopeExit) {
    TempDir project;
    project.write("f.txt", "x");
    ProcessExecutor executor;
    SandboxManager manager(executor);

    fs::path path;
    {
        ScopedSandbox guard(manager, project.path(), manager.create(project.path()));
        path = guard.path();
        EXPECT_TRUE(fs::exists(path / "f.txt"));
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST(SandboxTest, PrepareRootRejectsMissingProject) {
    TempDir project;
    ProcessExecutor executor;
    SandboxManager manager(executor);

    EXPECT_THROW(manager.prepareRoot(project.path() / "missing"), fs::filesystem_error);
    EXPECT_THROW(manager.create(project.path() / "missing"), SandboxCreationError);
}

TEST(SandboxTest, StrategyName) {
    EXPECT_EQ(strategyName(SandboxStrategy::WORKTREE), "worktree");
    EXPECT_EQ(strategyName(SandboxStrategy::COPY), "copy");
}

// ─── Worktree Strategy Tests ──────────────────────────────────

TEST(SandboxTest, WorktreeStrategyInsideGit) {
    if (!arena::test::haveGit()) GTEST_SKIP() << "git not available";

    TempDir project;
    project.write("README.md", "hello\n");
    arena::test::initGitRepo(project.path());

    ProcessExecutor executor;
    SandboxManager manager(executor);
    ASSERT_TRUE(manager.isGitRepo(project.path()));

    Sandbox sb = manager.create(project.path(), "HEAD");
    EXPECT_EQ(sb.strategy, SandboxStrategy::WORKTREE);
    EXPECT_EQ(readFile(sb.path / "README.md"), "hello\n");

    auto worktrees = manager.listWorktrees(project.path());
    EXPECT_EQ(worktrees.size(), 2u);

    manager.destroy(project.path(), sb);
    EXPECT_FALSE(fs::exists(sb.path));
    EXPECT_EQ(manager.listWorktrees(project.path()).size(), 1u);
}

TEST(SandboxTest, WorktreeBadRefFails) {
    if (!arena::test::haveGit()) GTEST_SKIP() << "git not available";

    TempDir project;
    project.write("README.md", "hello\n");
    arena::test::initGitRepo(project.path());

    ProcessExecutor executor;
    SandboxManager manager(executor);
    EXPECT_THROW(manager.create(project.path(), "no-such-ref"), SandboxCreationError);
}

TEST(SandboxTest, WorktreeFallbackWhenGitForgetsIt) {
    if (!arena::test::haveGit()) GTEST_SKIP() << "git not available";

    TempDir project;
    project.write("README.md", "hello\n");
    arena::test::initGitRepo(project.path());

    ProcessExecutor executor;
    SandboxManager manager(executor);
    Sandbox sb = manager.create(project.path());

    // a plain directory git does not know about
    Sandbox stray{project.path() / kSandboxDir / SandboxManager::newRunId(), SandboxStrategy::WORKTREE};
    fs::create_directories(stray.path / "sub");
    manager.destroy(project.path(), stray);
    EXPECT_FALSE(fs::exists(stray.path));

    manager.destroy(project.path(), sb);
}

TEST(SandboxTest, WorktreeFromRelativeProjectRoot) {
    if (!arena::test::haveGit()) GTEST_SKIP() << "git not available";

    TempDir base;
    base.write("sub/README.md", "hello\n");
    arena::test::initGitRepo(base.path() / "sub");

    ProcessExecutor executor;
    SandboxManager manager(executor);
    arena::test::CurrentDir cwd(base.path());

    Sandbox sb = manager.create("sub", "HEAD");
    EXPECT_EQ(sb.strategy, SandboxStrategy::WORKTREE);
    EXPECT_TRUE(sb.path.is_absolute());
    EXPECT_EQ(sb.path.parent_path(), fs::absolute("sub") / kSandboxDir);
    EXPECT_EQ(readFile(sb.path / "README.md"), "hello\n");
    EXPECT_FALSE(fs::exists(base.path() / "sub" / "sub"));

    manager.destroy("sub", sb);
    EXPECT_FALSE(fs::exists(sb.path));
    EXPECT_EQ(manager.listWorktrees(base.path() / "sub").size(), 1u);
}

TEST(SandboxTest, CopyFromRelativeProjectRoot) {
    TempDir base;
    base.write("sub/main.py", "print(1)\n");

    ProcessExecutor executor;
    SandboxManager manager(executor);
    arena::test::CurrentDir cwd(base.path());

    Sandbox sb = manager.create("sub", "HEAD");
    EXPECT_EQ(sb.strategy, SandboxStrategy::COPY);
    EXPECT_TRUE(sb.path.is_absolute());
    EXPECT_EQ(readFile(sb.path / "main.py"), "print(1)\n");

    manager.destroy("sub", sb);
    EXPECT_FALSE(fs::exists(sb.path));
}

TEST(SandboxTest, IsGitRepoFalseForPlainDirectory) {
    TempDir project;
    ProcessExecutor executor;
    SandboxManager manager(executor);
    EXPECT_FALSE(manager.isGitRepo(project.path() / "missing"));
}
