#pragma once

#include "config/config_types.hpp"

#include <toml.hpp>

#include <string>
#include <vector>

namespace shelter {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        MaskConfig config;

        static LoadResult ok(MaskConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to shelter.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check cross-references and value ranges
     * @return One message per problem (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const MaskConfig& config);

private:
    static MaskConfig extract_all_sections(const toml::table& root);
    static void extract_modes(const toml::table& root, MaskConfig& config);
    static std::map<std::string, std::string> extract_mode_map(
        const toml::table& root, std::string_view section);
    static LoadResult validate_and_return(MaskConfig config);
};

} // namespace shelter
