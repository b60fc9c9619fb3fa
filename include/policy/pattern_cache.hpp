#pragma once

#include "config/config_types.hpp"
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace shelter {

/**
 * @brief Precompiled key/source globs that pick a masking mode
 *
 * Globs support `*` (any run) and `?` (one byte); every other character is
 * literal. Lookup order:
 * 1. Key patterns
 * 2. Source (file basename) patterns
 * 3. default_mode
 *
 * Within each group the pattern with more literal characters wins, ties are
 * broken by pattern text.
 *
 * Thread-safety: immutable after construction, safe for concurrent lookups
 */
class PatternCache {
public:
    PatternCache() = default;
    explicit PatternCache(const MaskConfig& config);

    /**
     * @brief Mode name for a key
     * @param source_basename File name the key came from (empty = unknown)
     */
    [[nodiscard]] const std::string& determine_mode(
        std::string_view key,
        std::string_view source_basename = {}) const;

    [[nodiscard]] size_t key_pattern_count() const { return key_patterns_.size(); }
    [[nodiscard]] size_t source_pattern_count() const { return source_patterns_.size(); }

private:
    struct CompiledPattern {
        std::string glob;
        std::string mode;
        size_t literal_count;
        std::regex regex;
    };

    static std::vector<CompiledPattern> compile(
        const std::map<std::string, std::string>& globs);

    static std::regex glob_to_regex(std::string_view glob);

    std::vector<CompiledPattern> key_patterns_;
    std::vector<CompiledPattern> source_patterns_;
    std::string default_mode_ = "full";
};

} // namespace shelter
