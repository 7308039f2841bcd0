#pragma once

#include "config/config_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sanitizer {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads sanitizer.toml into a SanitizerConfig.
 *
 * String values may reference environment variables as ${NAME}; an unset
 * variable expands to the empty string. A top-level `include = "other.toml"`
 * (or an array of paths) is merged underneath the including file, which wins
 * on conflicting keys. Every section is optional.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        SanitizerConfig config;

        static LoadResult ok(SanitizerConfig cfg) {
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
     * @param config_path Path to sanitizer.toml
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
     * @brief All validation errors of a config; empty when valid.
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const SanitizerConfig& config);

    [[nodiscard]] static std::optional<utils::log::Level> parse_log_level(const std::string& level_str);

private:
    static LoadResult validate_and_return(SanitizerConfig config);
};

} // namespace sanitizer
