#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <limits>
#include <optional>
#include <stdexcept>

using namespace std::string_literals;

namespace wpdb {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

// Negative counts become 0 so validation reports them instead of wrapping
size_t to_count(int64_t v) {
    return v < 0 ? 0 : static_cast<size_t>(v);
}

// Out-of-range ports become 0, which validation rejects
uint16_t to_port(int64_t v) {
    return utils::in_range<1, 65535>(v) ? static_cast<uint16_t>(v) : uint16_t{0};
}

uint32_t to_u32(int64_t v) {
    if (v < 0) return 0;
    if (v > std::numeric_limits<uint32_t>::max()) return std::numeric_limits<uint32_t>::max();
    return static_cast<uint32_t>(v);
}

std::optional<std::string> env_value(const char* name) {
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

std::optional<int64_t> env_int(const char* name, std::vector<std::string>& errors) {
    const auto raw = env_value(name);
    if (!raw) return std::nullopt;
    const auto parsed = utils::try_parse_int<int64_t>(utils::trim(*raw));
    if (!parsed) {
        errors.push_back(std::format("{} must be an integer, got '{}'", name, *raw));
    }
    return parsed;
}

bool is_known_log_level(const std::string& level) {
    const std::string lower = utils::to_lower(level);
    return lower == "debug" || lower == "info" || lower == "warn"
        || lower == "warning" || lower == "error";
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* database = root["database"].as_table();
    if (!database) return cfg;
    const auto& d = *database;

    auto& conn = cfg.connection;
    conn.host = d["host"].value_or(conn.host);
    conn.port = to_port(d["port"].value_or(int64_t{conn.port}));
    conn.socket = d["socket"].value_or(""s);
    conn.user = d["user"].value_or(conn.user);
    conn.password = d["password"].value_or(""s);
    conn.database = d["name"].value_or(conn.database);
    conn.connect_timeout = std::chrono::seconds(
        d["connect_timeout_seconds"].value_or(int64_t{conn.connect_timeout.count()}));

    cfg.table_prefix = d["table_prefix"].value_or(""s);
    cfg.min_connections = to_count(d["min_connections"].value_or(int64_t{1}));
    cfg.max_connections = to_count(d["max_connections"].value_or(int64_t{5}));
    cfg.pool_acquire_timeout = std::chrono::milliseconds(
        d["pool_acquire_timeout_ms"].value_or(int64_t{5000}));
    cfg.idle_timeout = std::chrono::seconds(d["idle_timeout_seconds"].value_or(int64_t{300}));
    return cfg;
}

QueryConfig ConfigLoader::extract_query(const toml::table& root) {
    QueryConfig cfg;
    const auto* query = root["query"].as_table();
    if (!query) return cfg;
    const auto& q = *query;

    cfg.max_rows = to_count(q["max_rows"].value_or(int64_t{1000}));
    cfg.timeout_seconds = to_u32(q["timeout_seconds"].value_or(int64_t{30}));
    cfg.grace = std::chrono::milliseconds(q["grace_ms"].value_or(int64_t{5000}));
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or("info"s);
    return cfg;
}

GatewayConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    GatewayConfig config;
    config.database = extract_database(root);
    config.query = extract_query(root);
    config.logging = extract_logging(root);
    return config;
}

void ConfigLoader::apply_env_overrides(GatewayConfig& config, std::vector<std::string>& errors) {
    auto& conn = config.database.connection;

    if (auto v = env_value("WP_DB_HOST")) conn.host = std::move(*v);
    if (auto v = env_int("WP_DB_PORT", errors)) conn.port = to_port(*v);
    if (auto v = env_value("WP_DB_USER")) conn.user = std::move(*v);
    if (auto v = env_value("WP_DB_PASSWORD")) conn.password = std::move(*v);
    if (auto v = env_value("WP_DB_NAME")) conn.database = std::move(*v);
    if (auto v = env_value("WP_DB_SOCKET")) conn.socket = std::move(*v);
    if (auto v = env_value("WP_TABLE_PREFIX")) config.database.table_prefix = std::move(*v);
    if (auto v = env_int("WP_MAX_ROWS", errors)) config.query.max_rows = to_count(*v);
    if (auto v = env_int("WP_QUERY_TIMEOUT", errors)) config.query.timeout_seconds = to_u32(*v);
}

ConfigLoader::LoadResult ConfigLoader::finish(GatewayConfig config) {
    std::vector<std::string> errors;
    apply_env_overrides(config, errors);

    auto validation = validate_config(config);
    errors.insert(errors.end(), validation.begin(), validation.end());

    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }

    if (config.database.connection.password.empty()) {
        utils::log::warn("Database password is empty; set WP_DB_PASSWORD or database.password");
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return finish(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return finish(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_env() {
    return finish(GatewayConfig{});
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GatewayConfig& config) {
    std::vector<std::string> errors;
    const auto& db = config.database;
    const auto& conn = db.connection;

    if (conn.database.empty()) {
        errors.push_back("database.name must not be empty");
    }
    if (conn.user.empty()) {
        errors.push_back("database.user must not be empty");
    }
    if (!conn.uses_socket()) {
        if (conn.host.empty()) {
            errors.push_back("database.host must not be empty when no socket is configured");
        }
        if (conn.port == 0) {
            errors.push_back("database.port must be 1-65535");
        }
    }
    if (conn.connect_timeout.count() <= 0) {
        errors.push_back("database.connect_timeout_seconds must be > 0");
    }

    if (db.max_connections == 0) {
        errors.push_back("database.max_connections must be > 0");
    }
    if (db.min_connections > db.max_connections) {
        errors.push_back(std::format(
            "database.min_connections ({}) > max_connections ({})",
            db.min_connections, db.max_connections));
    }
    if (db.pool_acquire_timeout.count() <= 0) {
        errors.push_back("database.pool_acquire_timeout_ms must be > 0");
    }
    if (db.idle_timeout.count() < 0) {
        errors.push_back("database.idle_timeout_seconds must be >= 0");
    }

    if (config.query.max_rows == 0) {
        errors.push_back("query.max_rows must be > 0");
    }
    if (config.query.timeout_seconds == 0) {
        errors.push_back("query.timeout_seconds must be > 0");
    }
    if (config.query.grace.count() < 0) {
        errors.push_back("query.grace_ms must be >= 0");
    }

    if (!is_known_log_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error; got '{}'",
            config.logging.level));
    }

    return errors;
}

} // namespace wpdb
