#pragma once

#include <cstdint>
#include <optional>
#include <regex>
#include <string>

namespace arena {

/// Extraction patterns declared by an agent. Each is a regular expression
/// with exactly one capture group; unset patterns are simply skipped.
struct MetricPatterns {
    std::optional<std::string> tokens_in;
    std::optional<std::string> tokens_out;
    std::optional<std::string> cost;
    std::optional<std::string> llm_calls;

    bool empty() const { return !tokens_in && !tokens_out && !cost && !llm_calls; }
};

/// Values found in an agent's output. Missing means "not reported",
/// never zero.
struct ExtractedMetrics {
    std::optional<int64_t> tokens_in;
    std::optional<int64_t> tokens_out;
    std::optional<double> cost_usd;
    std::optional<int64_t> llm_calls;
};

// ─── Metric Extractor ─────────────────────────────────────────
// Compiles an agent's patterns once (ECMAScript, case-insensitive) and
// pulls the first match of each out of combined stdout + stderr.
// Integer captures may contain thousands separators ("4,200").

class MetricExtractor {
public:
    /// Throws ConfigError if a pattern does not compile.
    explicit MetricExtractor(const MetricPatterns& patterns);

    ExtractedMetrics extract(const std::string& combined_output) const;
    ExtractedMetrics extract(const std::string& stdout_text, const std::string& stderr_text) const;

    /// Number of capture groups in `pattern`. Throws ConfigError if it
    /// does not compile.
    static size_t captureGroups(const std::string& pattern);

private:
    std::optional<std::regex> tokens_in_;
    std::optional<std::regex> tokens_out_;
    std::optional<std::regex> cost_;
    std::optional<std::regex> llm_calls_;
};

/// One-shot form of MetricExtractor::extract.
ExtractedMetrics extractMetrics(const std::string& combined_output, const MetricPatterns& patterns);

/// Parse "4,200" style integers. Nothing if the text is not a number.
std::optional<int64_t> parseCount(const std::string& text);

/// Parse a decimal cost such as "0.08". Nothing if the text is not a number.
std::optional<double> parseCost(const std::string& text);

} // namespace arena
