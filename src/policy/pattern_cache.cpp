#include "policy/pattern_cache.hpp"

#include <algorithm>

namespace shelter {

PatternCache::PatternCache(const MaskConfig& config)
    : key_patterns_(compile(config.patterns)),
      source_patterns_(compile(config.sources)),
      default_mode_(config.default_mode) {}

std::regex PatternCache::glob_to_regex(std::string_view glob) {
    static constexpr std::string_view kRegexSpecial = R"(\^$.|+()[]{}/)";

    std::string pattern;
    pattern.reserve(glob.size() * 2);
    for (const char c : glob) {
        if (c == '*') {
            pattern += ".*";
        } else if (c == '?') {
            pattern += '.';
        } else {
            if (kRegexSpecial.find(c) != std::string_view::npos) pattern += '\\';
            pattern += c;
        }
    }
    // Compile once; match is anchored by regex_match
    return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
}

std::vector<PatternCache::CompiledPattern> PatternCache::compile(
    const std::map<std::string, std::string>& globs) {

    std::vector<CompiledPattern> compiled;
    compiled.reserve(globs.size());
    for (const auto& [glob, mode] : globs) {
        const auto wildcards = static_cast<size_t>(
            std::count_if(glob.begin(), glob.end(), [](char c) { return c == '*' || c == '?'; }));
        compiled.push_back({glob, mode, glob.size() - wildcards, glob_to_regex(glob)});
    }

    // Most specific first; std::map already ordered ties by glob text
    std::stable_sort(compiled.begin(), compiled.end(),
        [](const CompiledPattern& a, const CompiledPattern& b) {
            return a.literal_count > b.literal_count;
        });
    return compiled;
}

const std::string& PatternCache::determine_mode(
    std::string_view key,
    std::string_view source_basename) const {

    const std::string key_str(key);
    for (const auto& p : key_patterns_) {
        if (std::regex_match(key_str, p.regex)) {
            return p.mode;
        }
    }

    if (!source_basename.empty()) {
        const std::string source_str(source_basename);
        for (const auto& p : source_patterns_) {
            if (std::regex_match(source_str, p.regex)) {
                return p.mode;
            }
        }
    }

    return default_mode_;
}

} // namespace shelter
