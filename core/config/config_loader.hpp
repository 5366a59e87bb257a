#pragma once

#include "config/bench_config.hpp"

#include <filesystem>
#include <string>

namespace arena {

/// Load and validate a bench.json file. Throws ConfigError for a missing
/// file, malformed JSON, wrong field types or failed validation.
BenchConfig loadConfig(const std::filesystem::path& path);

/// Parse and validate config text (the contents of a bench.json).
BenchConfig parseConfig(const std::string& text);

} // namespace arena
