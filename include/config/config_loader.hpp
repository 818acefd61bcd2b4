#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace wpdb {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Builds a GatewayConfig from a TOML file, a TOML string or the
 *        environment alone
 *
 * Order of precedence (lowest first): built-in defaults, TOML values (with
 * ${VAR} expanded from the environment), WP_* environment variables.
 *
 * Recognized environment overrides:
 *   WP_DB_HOST, WP_DB_PORT, WP_DB_USER, WP_DB_PASSWORD, WP_DB_NAME,
 *   WP_DB_SOCKET, WP_TABLE_PREFIX, WP_MAX_ROWS, WP_QUERY_TIMEOUT
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        GatewayConfig config;

        static LoadResult ok(GatewayConfig cfg) {
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
     * @param config_path Path to wpdb.toml
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
     * @brief Defaults plus WP_* environment overrides, no file
     */
    [[nodiscard]] static LoadResult load_from_env();

    /**
     * @brief Collect every problem in a config (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const GatewayConfig& config);

private:
    static DatabaseConfig extract_database(const toml::table& root);
    static QueryConfig extract_query(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static GatewayConfig extract_all_sections(const toml::table& root);

    static void apply_env_overrides(GatewayConfig& config, std::vector<std::string>& errors);
    static LoadResult finish(GatewayConfig config);
};

} // namespace wpdb
