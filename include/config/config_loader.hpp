#pragma once

#include "config/config_types.hpp"
#include "catalog/api_key_detector.hpp"
#include "catalog/token_set.hpp"

#include <toml++/toml.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace biip {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        BiipConfig config;

        static LoadResult ok(BiipConfig cfg) {
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
     * @param config_path Path to config.toml
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
     * @brief $XDG_CONFIG_HOME/biip/config.toml, else ~/.config/biip/config.toml
     * @return nullopt when neither base directory is known
     */
    [[nodiscard]] static std::optional<std::filesystem::path> default_path(
        const char* xdg_config_home, const char* home);

    /**
     * @brief Default tokens with [tokens] overrides applied
     * Call only on a validated config.
     */
    [[nodiscard]] static TokenSet build_token_set(const BiipConfig& config);

    /**
     * @brief Typed shapes for the [[api_keys]] entries
     * Call only on a validated config.
     */
    [[nodiscard]] static std::vector<ApiKeyShape> build_api_key_shapes(const BiipConfig& config);

    [[nodiscard]] static std::vector<std::string> validate_config(const BiipConfig& config);

private:
    static BiipConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(BiipConfig config);

    static LoggingConfig extract_logging(const toml::table& root);
    static SecretsConfig extract_secrets(const toml::table& root);
    static InputConfig extract_input(const toml::table& root);
    static BinaryScreener::Config extract_binary(const toml::table& root);
    static std::vector<std::pair<std::string, std::string>> extract_tokens(const toml::table& root);
    static std::vector<ApiKeyConfigEntry> extract_api_keys(const toml::table& root);
};

} // namespace biip
