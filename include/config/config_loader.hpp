#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace shiplog {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads ShipperConfig from TOML.
 *
 * Supports ${ENV_VAR} expansion in string values, "~" expansion in path
 * values, and `include = "file.toml"` (or an array of files) resolved
 * relative to the including file. The including file wins on conflicts.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ShipperConfig config;

        static LoadResult ok(ShipperConfig cfg) {
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
     * @brief Write the first-run default configuration to @p config_path.
     * Parent directories are created. Existing files are never overwritten.
     * @return true if the file exists afterwards
     */
    static bool write_default(const std::string& config_path);

    /// Default config text written on first run
    [[nodiscard]] static std::string default_config_text();

    /// All validation problems of a config (empty = valid)
    [[nodiscard]] static std::vector<std::string> validate_config(const ShipperConfig& config);

private:
    static MonitorConfig extract_monitor(const toml::table& root);
    static StorageConfig extract_storage(const toml::table& root);
    static RemoteConfig extract_remote(const toml::table& root);
    static SyncConfig extract_sync(const toml::table& root);
    static RedactionConfig extract_redaction(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static ShipperConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(ShipperConfig config);
};

} // namespace shiplog
