#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>
#include <unordered_set>

namespace shelter {

namespace {

// ---- Extraction helpers ----------------------------------------------------

char toml_mask_char(const toml::table& tbl, const std::string_view key,
                    const char fallback, const std::string_view where) {
    const auto* v = tbl[key].as_string();
    if (!v) return fallback;
    const std::string& s = v->get();
    if (s.size() != 1) {
        throw std::runtime_error(std::format(
            "{}mask_char must be a single byte, got \"{}\"", where, s));
    }
    return s[0];
}

size_t toml_size(const toml::table& tbl, const std::string_view key,
                 const size_t fallback, const std::string_view where) {
    const auto v = tbl[key].value<int64_t>();
    if (!v) return fallback;
    if (*v < 0) {
        throw std::runtime_error(std::format(
            "{}{} must be >= 0, got {}", where, key, *v));
    }
    return static_cast<size_t>(*v);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

void ConfigLoader::extract_modes(const toml::table& root, MaskConfig& config) {
    // Built-in modes pick up the global mask_char unless they override it
    for (auto& [name, mode] : config.modes) {
        mode.mask_char = config.mask_char;
    }

    const auto* modes = root["modes"].as_table();
    if (!modes) return;

    for (const auto& [key, node] : *modes) {
        const std::string name(key.str());
        const auto* m = node.as_table();
        if (!m) {
            throw std::runtime_error(std::format("modes.{} must be a table", name));
        }
        const std::string where = std::format("modes.{}.", name);

        ModeConfig mode;
        if (const auto* existing = config.find_mode(name)) {
            mode = *existing;
        } else {
            mode.name = name;
            mode.mask_char = config.mask_char;
            if (!(*m)["type"]) {
                throw std::runtime_error(std::format(
                    "{}type is required for custom modes", where));
            }
        }

        if (const auto type_str = (*m)["type"].value<std::string>()) {
            const auto type = parse_mode_type(utils::to_lower(*type_str));
            if (!type) {
                throw std::runtime_error(std::format(
                    "{}type must be full, partial or none, got \"{}\"", where, *type_str));
            }
            mode.type = *type;
        }

        mode.mask_char       = toml_mask_char(*m, "mask_char", mode.mask_char, where);
        mode.preserve_length = (*m)["preserve_length"].value_or(mode.preserve_length);
        mode.mask_length     = toml_size(*m, "mask_length", mode.mask_length, where);
        mode.show_start      = toml_size(*m, "show_start", mode.show_start, where);
        mode.show_end        = toml_size(*m, "show_end", mode.show_end, where);
        mode.min_mask        = toml_size(*m, "min_mask", mode.min_mask, where);
        mode.fallback_mode   = (*m)["fallback_mode"].value_or(mode.fallback_mode);

        config.modes.insert_or_assign(name, std::move(mode));
    }
}

std::map<std::string, std::string> ConfigLoader::extract_mode_map(
    const toml::table& root, const std::string_view section) {

    std::map<std::string, std::string> result;
    const auto* tbl = root[section].as_table();
    if (!tbl) return result;

    for (const auto& [key, node] : *tbl) {
        if (const auto* s = node.as_string()) {
            result.emplace(std::string(key.str()), s->get());
        } else {
            utils::log::warn(std::format(
                "Ignoring {}.\"{}\": mode name must be a string", section, key.str()));
        }
    }
    return result;
}

// ---- Shared extraction + validation ----------------------------------------

MaskConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    MaskConfig config = MaskConfig::defaults();
    config.mask_char     = toml_mask_char(tbl, "mask_char", config.mask_char, "");
    config.skip_comments = tbl["skip_comments"].value_or(config.skip_comments);
    config.default_mode  = tbl["default_mode"].value_or(config.default_mode);
    extract_modes(tbl, config);
    config.patterns = extract_mode_map(tbl, "patterns");
    config.sources  = extract_mode_map(tbl, "sources");

    static const std::unordered_set<std::string_view> known_keys = {
        "mask_char", "skip_comments", "default_mode", "modes", "patterns", "sources",
    };
    for (const auto& [key, node] : tbl) {
        if (!known_keys.contains(key.str())) {
            utils::log::warn(std::format("Ignoring unknown config key \"{}\"", key.str()));
        }
    }
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(MaskConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = toml::parse_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = toml::parse(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const MaskConfig& config) {
    std::vector<std::string> errors;

    if (!config.find_mode(config.default_mode)) {
        errors.push_back(std::format(
            "default_mode \"{}\" is not a defined mode", config.default_mode));
    }

    for (const auto& [name, mode] : config.modes) {
        if (mode.type != ModeType::PARTIAL) continue;
        if (mode.fallback_mode == name) {
            errors.push_back(std::format(
                "modes.{}.fallback_mode must not refer to itself", name));
        } else if (!config.find_mode(mode.fallback_mode)) {
            errors.push_back(std::format(
                "modes.{}.fallback_mode \"{}\" is not a defined mode", name, mode.fallback_mode));
        }
    }

    for (const auto& [glob, mode_name] : config.patterns) {
        if (!config.find_mode(mode_name)) {
            errors.push_back(std::format(
                "patterns.\"{}\" refers to undefined mode \"{}\"", glob, mode_name));
        }
    }

    for (const auto& [glob, mode_name] : config.sources) {
        if (!config.find_mode(mode_name)) {
            errors.push_back(std::format(
                "sources.\"{}\" refers to undefined mode \"{}\"", glob, mode_name));
        }
    }

    return errors;
}

} // namespace shelter
