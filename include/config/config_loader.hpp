#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace ybadapter {

// ============================================================================
// ConfigLoader - Extract typed config from a TOML profile
// ============================================================================

/**
 * @brief Loads adapter profiles
 *
 * Layout:
 *
 *   [logging]
 *   level = "debug"
 *
 *   [profile]
 *   target = "dev"
 *
 *   [[targets]]
 *   name = "dev"
 *   host = "localhost"
 *   port = 5433
 *   user = "yugabyte"
 *   pass = "${YB_PASSWORD}"     # alias of password
 *   dbname = "yugabyte"         # alias of database
 *
 * String values support ${VAR} environment expansion.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AdapterConfig config;

        static LoadResult ok(AdapterConfig cfg) {
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
     * @brief Load profile from TOML file
     * @param config_path Path to profile .toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load profile from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Validate a parsed profile
     * @return One message per problem found (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AdapterConfig& config);

private:
    // Extractors append type and range problems to `errors`
    static AdapterConfig extract_all_sections(const toml::table& root,
                                              std::vector<std::string>& errors);
    static LoggingConfig extract_logging(const toml::table& root);
    static std::vector<TargetConfig> extract_targets(const toml::table& root,
                                                     std::vector<std::string>& errors);
    static Credentials extract_credentials(const toml::table& tbl,
                                           const std::string& where,
                                           std::vector<std::string>& errors);
    static LoadResult validate_and_return(AdapterConfig config, std::vector<std::string> errors);
};

} // namespace ybadapter
