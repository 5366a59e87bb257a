#include "metrics/metric_extractor.hpp"
#include "common/errors.hpp"
#include "common/strings.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace arena {

namespace {

constexpr auto kPatternFlags = std::regex::ECMAScript | std::regex::icase;

std::optional<std::regex> compile(const std::optional<std::string>& pattern) {
    if (!pattern) return std::nullopt;
    try {
        return std::regex(*pattern, kPatternFlags);
    } catch (const std::regex_error& e) {
        throw ConfigError("Invalid pattern '" + *pattern + "': " + e.what());
    }
}

/// First capture group of the first match, if any.
std::optional<std::string> firstCapture(const std::optional<std::regex>& re, const std::string& text) {
    if (!re) return std::nullopt;
    std::smatch m;
    if (!std::regex_search(text, m, *re) || m.size() < 2) return std::nullopt;
    return m[1].str();
}

template <class T, class Parse>
void assign(std::optional<T>& field, const char* name,
            const std::optional<std::string>& capture, Parse parse) {
    if (!capture) return;
    field = parse(*capture);
    if (!field) {
        spdlog::warn("ignoring unparsable {} value '{}'", name, *capture);
    } else {
        spdlog::debug("extracted {} = {}", name, *field);
    }
}

} // namespace

std::optional<int64_t> parseCount(const std::string& text) {
    std::string digits = trim(text);
    digits.erase(std::remove(digits.begin(), digits.end(), ','), digits.end());
    if (digits.empty()) return std::nullopt;
    try {
        size_t pos = 0;
        long long value = std::stoll(digits, &pos);
        if (pos != digits.size()) return std::nullopt;
        return static_cast<int64_t>(value);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::optional<double> parseCost(const std::string& text) {
    std::string number = trim(text);
    if (number.empty()) return std::nullopt;
    try {
        size_t pos = 0;
        double value = std::stod(number, &pos);
        if (pos != number.size()) return std::nullopt;
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

MetricExtractor::MetricExtractor(const MetricPatterns& patterns)
    : tokens_in_(compile(patterns.tokens_in)),
      tokens_out_(compile(patterns.tokens_out)),
      cost_(compile(patterns.cost)),
      llm_calls_(compile(patterns.llm_calls)) {}

size_t MetricExtractor::captureGroups(const std::string& pattern) {
    return compile(pattern)->mark_count();
}

ExtractedMetrics MetricExtractor::extract(const std::string& combined_output) const {
    ExtractedMetrics out;
    assign(out.tokens_in, "tokens_in", firstCapture(tokens_in_, combined_output), parseCount);
    assign(out.tokens_out, "tokens_out", firstCapture(tokens_out_, combined_output), parseCount);
    assign(out.cost_usd, "cost", firstCapture(cost_, combined_output), parseCost);
    assign(out.llm_calls, "llm_calls", firstCapture(llm_calls_, combined_output), parseCount);
    return out;
}

ExtractedMetrics MetricExtractor::extract(const std::string& stdout_text,
                                          const std::string& stderr_text) const {
    return extract(stdout_text + "\n" + stderr_text);
}

ExtractedMetrics extractMetrics(const std::string& combined_output, const MetricPatterns& patterns) {
    return MetricExtractor(patterns).extract(combined_output);
}

} // namespace arena
