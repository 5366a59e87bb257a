#include "common/errors.hpp"
#include "common/logging.hpp"
#include "config/config_loader.hpp"
#include "history/history_store.hpp"
#include "process/process_executor.hpp"
#include "report/console_reporter.hpp"
#include "report/export.hpp"
#include "runner/benchmark_runner.hpp"
#include "sandbox/sandbox_manager.hpp"
#include "scoring/scoring.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#ifndef AGENTARENA_VERSION
#define AGENTARENA_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;

namespace {

/// Bad flags or values. Reported with the usage text, exit code 1.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& what) : std::runtime_error(what) {}
};

struct RunOptions {
    std::string config = "bench.json";
    std::vector<std::string> tasks;
    std::vector<std::string> agents;
    std::optional<int> timeout;
    bool json = false;
    bool csv = false;
    bool md = false;
    bool verbose = false;
};

struct InitOptions {
    std::string output = "bench.json";
    bool force = false;
};

void printUsage() {
    std::cerr << "Usage: agentarena <command> [options]\n\n"
              << "Race coding agents on your tasks.\n\n"
              << "Commands:\n"
              << "  run       Run the benchmark\n"
              << "  init      Create a starter bench.json\n"
              << "  history   List past benchmark runs\n\n"
              << "run options:\n"
              << "  -c, --config PATH    config file (default bench.json)\n"
              << "  -t, --task NAME      run only this task (repeatable)\n"
              << "  -a, --agent NAME     run only this agent, or add one as 'name:command'\n"
              << "                       (repeatable)\n"
              << "      --timeout N      override the global timeout in seconds\n"
              << "      --json           print all runs as JSON on stdout\n"
              << "      --csv            print all runs as CSV on stdout\n"
              << "      --md             print the summary as a Markdown table on stdout\n"
              << "  -v, --verbose        debug logging\n\n"
              << "init options:\n"
              << "  -o, --output PATH    where to write the config (default bench.json)\n"
              << "      --force          overwrite an existing file\n\n"
              << "  -h, --help           show this help\n"
              << "      --version        print the version\n";
}

/// Accepts "--flag value" and "--flag=value".
class ArgCursor {
public:
    ArgCursor(int argc, char** argv, int start) : argc_(argc), argv_(argv), i_(start) {}

    bool done() const { return i_ >= argc_; }
    std::string_view current() const { return argv_[i_]; }
    void next() { i_++; }

    std::optional<std::string> value(std::string_view short_flag, std::string_view long_flag) {
        std::string_view a = current();
        if (a.size() > long_flag.size() + 1 && a.substr(0, long_flag.size()) == long_flag &&
            a[long_flag.size()] == '=') {
            return std::string(a.substr(long_flag.size() + 1));
        }
        if (a != long_flag && (short_flag.empty() || a != short_flag)) return std::nullopt;
        if (i_ + 1 >= argc_) {
            throw UsageError("Missing value for " + std::string(a));
        }
        return std::string(argv_[++i_]);
    }

private:
    int argc_;
    char** argv_;
    int i_;
};

int parseTimeout(const std::string& text) {
    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(text, &used);
    } catch (const std::logic_error&) {
        throw UsageError("Invalid --timeout value: " + text);
    }
    if (used != text.size() || value < 1) {
        throw UsageError("Invalid --timeout value: " + text);
    }
    return value;
}

RunOptions parseRunArgs(int argc, char** argv) {
    RunOptions opt;
    for (ArgCursor args(argc, argv, 2); !args.done(); args.next()) {
        std::string_view a = args.current();
        if (auto config = args.value("-c", "--config")) {
            opt.config = *config;
        } else if (auto task = args.value("-t", "--task")) {
            opt.tasks.push_back(*task);
        } else if (auto agent = args.value("-a", "--agent")) {
            opt.agents.push_back(*agent);
        } else if (auto timeout = args.value("", "--timeout")) {
            opt.timeout = parseTimeout(*timeout);
        } else if (a == "--json") {
            opt.json = true;
        } else if (a == "--csv") {
            opt.csv = true;
        } else if (a == "--md") {
            opt.md = true;
        } else if (a == "-v" || a == "--verbose") {
            opt.verbose = true;
        } else {
            throw UsageError("Unknown argument: " + std::string(a));
        }
    }
    return opt;
}

InitOptions parseInitArgs(int argc, char** argv) {
    InitOptions opt;
    for (ArgCursor args(argc, argv, 2); !args.done(); args.next()) {
        std::string_view a = args.current();
        if (auto output = args.value("-o", "--output")) {
            opt.output = *output;
        } else if (a == "--force") {
            opt.force = true;
        } else {
            throw UsageError("Unknown argument: " + std::string(a));
        }
    }
    return opt;
}

template <class T>
std::string joinNames(const std::vector<T>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item.name;
    }
    return out;
}

/// Keep only the named tasks, in config order.
void filterTasks(arena::BenchConfig& config, const std::vector<std::string>& names) {
    if (names.empty()) return;

    std::vector<std::string> missing;
    for (const auto& name : names) {
        auto it = std::find_if(config.tasks.begin(), config.tasks.end(),
                               [&](const arena::TaskConfig& t) { return t.name == name; });
        if (it == config.tasks.end()) missing.push_back(name);
    }
    if (!missing.empty()) {
        std::string list;
        for (const auto& m : missing) list += (list.empty() ? "" : ", ") + m;
        throw arena::ConfigError("Unknown task(s): " + list +
                                 "\nAvailable: " + joinNames(config.tasks));
    }

    std::vector<arena::TaskConfig> kept;
    for (const auto& task : config.tasks) {
        if (std::find(names.begin(), names.end(), task.name) != names.end()) {
            kept.push_back(task);
        }
    }
    config.tasks = std::move(kept);
}

/// Each entry either names a configured agent or defines a new one
/// as "name:command". The result replaces the configured list.
void selectAgents(arena::BenchConfig& config, const std::vector<std::string>& choices) {
    if (choices.empty()) return;

    std::vector<arena::AgentConfig> selected;
    for (const auto& choice : choices) {
        if (choice.find(':') != std::string::npos) {
            selected.push_back(arena::parseAgentFlag(choice));
            continue;
        }
        auto it = std::find_if(config.agents.begin(), config.agents.end(),
                               [&](const arena::AgentConfig& a) { return a.name == choice; });
        if (it == config.agents.end()) {
            throw arena::ConfigError("Unknown agent: " + choice +
                                     "\nAvailable: " + joinNames(config.agents));
        }
        selected.push_back(*it);
    }
    config.agents = std::move(selected);
}

fs::path projectRootFor(const fs::path& config_path) {
    fs::path parent = config_path.parent_path();
    return parent.empty() ? fs::current_path() : fs::absolute(parent);
}

int cmdRun(int argc, char** argv) {
    RunOptions opt = parseRunArgs(argc, argv);
    arena::initLogging(opt.verbose);

    fs::path config_path = opt.config;
    arena::BenchConfig config;
    try {
        config = arena::loadConfig(config_path);
        if (opt.timeout) config.timeout = *opt.timeout;
        filterTasks(config, opt.tasks);
        selectAgents(config, opt.agents);
        arena::validateConfig(config);
    } catch (const arena::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        if (!fs::exists(config_path)) {
            std::cerr << "Run `agentarena init` to create one.\n";
        }
        return 1;
    }

    fs::path project_root = projectRootFor(config_path);

    arena::ProcessExecutor executor;
    arena::SandboxManager sandboxes(executor);
    arena::ConsoleReporter reporter(std::cerr);
    arena::BenchmarkRunner runner(sandboxes, executor, &reporter);

    std::vector<arena::RunMetrics> runs = runner.runBenchmark(config, project_root);
    std::vector<arena::TaskSummary> summaries = arena::summarize(runs, config.agents);

    try {
        fs::path saved = arena::saveRun(project_root, config.project, runs, summaries);
        spdlog::info("results saved to {}", saved.string());
    } catch (const std::exception& e) {
        spdlog::warn("could not save run history: {}", e.what());
    }

    if (opt.json) std::cout << arena::toJson(runs) << "\n";
    if (opt.csv) std::cout << arena::toCsv(runs) << "\n";
    if (opt.md) std::cout << arena::toMarkdown(summaries) << "\n";
    return 0;
}

int cmdInit(int argc, char** argv) {
    InitOptions opt = parseInitArgs(argc, argv);
    arena::initLogging();

    fs::path path = opt.output;
    if (fs::exists(path) && !opt.force) {
        std::cerr << path.string() << " already exists. Use --force to overwrite.\n";
        return 1;
    }

    std::ofstream out(path);
    out << arena::sampleConfig();
    if (!out) {
        std::cerr << "Error: could not write " << path.string() << "\n";
        return 1;
    }
    std::cerr << "Created " << path.string() << "\n"
              << "Edit it with your tasks and agents, then run: agentarena run\n"
              << "Configs are JSON; an existing bench.yaml must be converted to this format.\n";
    return 0;
}

int cmdHistory(int argc, char** /*argv*/) {
    if (argc > 2) {
        throw UsageError("history takes no arguments");
    }
    arena::initLogging();
    std::cout << arena::formatHistory(arena::listRuns(fs::current_path()));
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    std::string_view command = argv[1];
    try {
        if (command == "-h" || command == "--help") {
            printUsage();
            return 0;
        }
        if (command == "--version") {
            std::cout << "agentarena " << AGENTARENA_VERSION << "\n";
            return 0;
        }
        if (command == "run") return cmdRun(argc, argv);
        if (command == "init") return cmdInit(argc, argv);
        if (command == "history") return cmdHistory(argc, argv);

        std::cerr << "Unknown command: " << command << "\n";
        printUsage();
        return 2;
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage();
        return 1;
    } catch (const arena::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
