#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace shelter {

// ============================================================================
// Mode Config
// ============================================================================

enum class ModeType {
    FULL,       // Every byte masked
    PARTIAL,    // Prefix/suffix shown
    NONE        // Value left as-is
};

[[nodiscard]] inline std::optional<ModeType> parse_mode_type(std::string_view name) {
    if (name == "full") return ModeType::FULL;
    if (name == "partial") return ModeType::PARTIAL;
    if (name == "none") return ModeType::NONE;
    return std::nullopt;
}

[[nodiscard]] inline constexpr const char* mode_type_name(ModeType type) noexcept {
    switch (type) {
        case ModeType::FULL:    return "full";
        case ModeType::PARTIAL: return "partial";
        case ModeType::NONE:    return "none";
    }
    return "full";
}

/**
 * @brief A named masking mode ([modes.<name>] table)
 *
 * Built-in names "full", "partial" and "none" select their own type;
 * any other name needs an explicit `type`.
 */
struct ModeConfig {
    std::string name;
    ModeType type = ModeType::FULL;
    char mask_char = '*';

    // FULL
    bool preserve_length = true;
    size_t mask_length = 0;             // used when preserve_length = false

    // PARTIAL
    size_t show_start = 3;
    size_t show_end = 3;
    size_t min_mask = 3;
    std::string fallback_mode = "full"; // applied when the value is too short
};

// ============================================================================
// Top-level Config (mirrors shelter.toml)
// ============================================================================

struct MaskConfig {
    char mask_char = '*';
    bool skip_comments = true;
    std::string default_mode = "full";

    // Ordered by name so iteration is deterministic
    std::map<std::string, ModeConfig> modes;

    // Glob -> mode name
    std::map<std::string, std::string> patterns;   // matched against keys
    std::map<std::string, std::string> sources;    // matched against file basenames

    [[nodiscard]] const ModeConfig* find_mode(const std::string& name) const {
        const auto it = modes.find(name);
        return it != modes.end() ? &it->second : nullptr;
    }

    /**
     * @brief Config with the three built-in modes at their defaults
     */
    [[nodiscard]] static MaskConfig defaults() {
        MaskConfig cfg;

        ModeConfig full;
        full.name = "full";
        full.type = ModeType::FULL;
        cfg.modes.emplace(full.name, full);

        ModeConfig partial;
        partial.name = "partial";
        partial.type = ModeType::PARTIAL;
        cfg.modes.emplace(partial.name, partial);

        ModeConfig none;
        none.name = "none";
        none.type = ModeType::NONE;
        cfg.modes.emplace(none.name, none);

        return cfg;
    }
};

} // namespace shelter
