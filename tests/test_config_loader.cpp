#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace wpdb;

namespace {

constexpr const char* kOverrideVars[] = {
    "WP_DB_HOST", "WP_DB_PORT", "WP_DB_USER", "WP_DB_PASSWORD", "WP_DB_NAME",
    "WP_DB_SOCKET", "WP_TABLE_PREFIX", "WP_MAX_ROWS", "WP_QUERY_TIMEOUT"};

// Clears WP_* overrides on entry and exit so tests do not see each other's env
struct CleanEnv {
    CleanEnv() { clear(); }
    ~CleanEnv() { clear(); }

    static void clear() {
        for (const char* name : kOverrideVars) ::unsetenv(name);
    }
};

bool has_error(const std::string& message, const std::string& fragment) {
    return message.find(fragment) != std::string::npos;
}

} // namespace

TEST_CASE("ConfigLoader: full file", "[config]") {
    CleanEnv env;
    const std::string toml = R"(
[database]
host = "db.internal"
port = 3307
user = "wp_reader"
password = "hunter2"
name = "wp_network"
connect_timeout_seconds = 3
table_prefix = "blog_"
min_connections = 2
max_connections = 8
pool_acquire_timeout_ms = 750
idle_timeout_seconds = 60

[query]
max_rows = 250
timeout_seconds = 12
grace_ms = 1500

[logging]
level = "debug"
)";

    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);

    const auto& db = result.config.database;
    CHECK(db.connection.host == "db.internal");
    CHECK(db.connection.port == 3307);
    CHECK(db.connection.user == "wp_reader");
    CHECK(db.connection.password == "hunter2");
    CHECK(db.connection.database == "wp_network");
    CHECK(db.connection.connect_timeout == std::chrono::seconds{3});
    CHECK_FALSE(db.connection.uses_socket());
    CHECK(db.table_prefix == "blog_");
    CHECK(db.min_connections == 2);
    CHECK(db.max_connections == 8);
    CHECK(db.pool_acquire_timeout == std::chrono::milliseconds{750});
    CHECK(db.idle_timeout == std::chrono::seconds{60});

    CHECK(result.config.query.max_rows == 250);
    CHECK(result.config.query.timeout_seconds == 12);
    CHECK(result.config.query.grace == std::chrono::milliseconds{1500});
    CHECK(result.config.logging.level == "debug");
}

TEST_CASE("ConfigLoader: defaults apply to omitted keys", "[config]") {
    CleanEnv env;
    const auto result = ConfigLoader::load_from_string("[database]\nname = \"wordpress\"\n");
    REQUIRE(result.success);

    const auto& config = result.config;
    CHECK(config.database.connection.host == "127.0.0.1");
    CHECK(config.database.connection.port == 3306);
    CHECK(config.database.connection.user == "root");
    CHECK(config.database.table_prefix.empty());
    CHECK(config.database.min_connections == 1);
    CHECK(config.database.max_connections == 5);
    CHECK(config.query.max_rows == 1000);
    CHECK(config.query.timeout_seconds == 30);
    CHECK(config.logging.level == "info");
}

TEST_CASE("ConfigLoader: ${VAR} is expanded from the environment", "[config][env]") {
    CleanEnv env;
    ::setenv("WPDB_TEST_SECRET", "s3cret", 1);
    ::unsetenv("WPDB_TEST_MISSING");

    const auto result = ConfigLoader::load_from_string(R"(
[database]
password = "${WPDB_TEST_SECRET}"
host = "db-${WPDB_TEST_MISSING}.local"
)");
    REQUIRE(result.success);
    CHECK(result.config.database.connection.password == "s3cret");
    CHECK(result.config.database.connection.host == "db-.local");

    ::unsetenv("WPDB_TEST_SECRET");
}

TEST_CASE("ConfigLoader: unclosed ${ is a parse error", "[config][env]") {
    CleanEnv env;
    const auto result = ConfigLoader::load_from_string("[database]\npassword = \"${OOPS\"\n");
    REQUIRE_FALSE(result.success);
    CHECK(has_error(result.error_message, "Unclosed env var substitution"));
}

TEST_CASE("ConfigLoader: malformed TOML is reported", "[config]") {
    CleanEnv env;
    const auto result = ConfigLoader::load_from_string("[database\nname = ");
    REQUIRE_FALSE(result.success);
    CHECK(has_error(result.error_message, "Failed to parse config"));
}

TEST_CASE("ConfigLoader: missing file is reported", "[config]") {
    CleanEnv env;
    const auto result = ConfigLoader::load_from_file("/nonexistent/wpdb.toml");
    REQUIRE_FALSE(result.success);
    CHECK(has_error(result.error_message, "Failed to load config"));
}

TEST_CASE("ConfigLoader: loads from a file on disk", "[config]") {
    CleanEnv env;
    const auto path = std::filesystem::temp_directory_path() / "wpdb_config_loader_test.toml";
    {
        std::ofstream out(path);
        out << "[database]\nname = \"from_file\"\nsocket = \"/tmp/mysql.sock\"\n";
    }

    const auto result = ConfigLoader::load_from_file(path.string());
    std::filesystem::remove(path);

    REQUIRE(result.success);
    CHECK(result.config.database.connection.database == "from_file");
    CHECK(result.config.database.connection.uses_socket());
}

TEST_CASE("ConfigLoader: WP_* variables override file values", "[config][env]") {
    CleanEnv env;
    ::setenv("WP_DB_HOST", "override.host", 1);
    ::setenv("WP_DB_PORT", "3310", 1);
    ::setenv("WP_DB_USER", "env_user", 1);
    ::setenv("WP_DB_PASSWORD", "env_pass", 1);
    ::setenv("WP_DB_NAME", "env_db", 1);
    ::setenv("WP_TABLE_PREFIX", "site_", 1);
    ::setenv("WP_MAX_ROWS", "42", 1);
    ::setenv("WP_QUERY_TIMEOUT", "7", 1);

    const auto result = ConfigLoader::load_from_string(R"(
[database]
host = "file.host"
port = 3306
user = "file_user"
name = "file_db"
table_prefix = "wp_"

[query]
max_rows = 500
timeout_seconds = 30
)");
    REQUIRE(result.success);

    const auto& config = result.config;
    CHECK(config.database.connection.host == "override.host");
    CHECK(config.database.connection.port == 3310);
    CHECK(config.database.connection.user == "env_user");
    CHECK(config.database.connection.password == "env_pass");
    CHECK(config.database.connection.database == "env_db");
    CHECK(config.database.table_prefix == "site_");
    CHECK(config.query.max_rows == 42);
    CHECK(config.query.timeout_seconds == 7);
}

TEST_CASE("ConfigLoader: environment alone is enough", "[config][env]") {
    CleanEnv env;
    ::setenv("WP_DB_NAME", "wordpress", 1);
    ::setenv("WP_DB_SOCKET", "/var/run/mysqld/mysqld.sock", 1);

    const auto result = ConfigLoader::load_from_env();
    REQUIRE(result.success);
    CHECK(result.config.database.connection.database == "wordpress");
    CHECK(result.config.database.connection.socket == "/var/run/mysqld/mysqld.sock");
}

TEST_CASE("ConfigLoader: non-numeric WP_* integer is rejected", "[config][env]") {
    CleanEnv env;
    ::setenv("WP_DB_PORT", "abc", 1);
    ::setenv("WP_MAX_ROWS", "12x", 1);

    const auto result = ConfigLoader::load_from_env();
    REQUIRE_FALSE(result.success);
    CHECK(has_error(result.error_message, "WP_DB_PORT must be an integer, got 'abc'"));
    CHECK(has_error(result.error_message, "WP_MAX_ROWS must be an integer, got '12x'"));
}

TEST_CASE("ConfigLoader: out-of-range port is rejected", "[config]") {
    CleanEnv env;
    const auto result = ConfigLoader::load_from_string("[database]\nport = 70000\n");
    REQUIRE_FALSE(result.success);
    CHECK(has_error(result.error_message, "database.port must be 1-65535"));
}

TEST_CASE("ConfigLoader: socket makes host and port irrelevant", "[config]") {
    CleanEnv env;
    const auto result = ConfigLoader::load_from_string(R"(
[database]
host = ""
port = 0
socket = "/tmp/mysql.sock"
)");
    CHECK(result.success);
}

TEST_CASE("ConfigLoader: validation reports every problem", "[config]") {
    GatewayConfig config;
    config.database.connection.database.clear();
    config.database.connection.user.clear();
    config.database.connection.host.clear();
    config.database.min_connections = 4;
    config.database.max_connections = 2;
    config.query.max_rows = 0;
    config.query.timeout_seconds = 0;
    config.logging.level = "chatty";

    const auto errors = ConfigLoader::validate_config(config);
    const auto contains = [&](const std::string& fragment) {
        for (const auto& e : errors) {
            if (e.find(fragment) != std::string::npos) return true;
        }
        return false;
    };

    CHECK(contains("database.name must not be empty"));
    CHECK(contains("database.user must not be empty"));
    CHECK(contains("database.host must not be empty"));
    CHECK(contains("database.min_connections (4) > max_connections (2)"));
    CHECK(contains("query.max_rows must be > 0"));
    CHECK(contains("query.timeout_seconds must be > 0"));
    CHECK(contains("logging.level"));
}

TEST_CASE("ConfigLoader: defaults are valid", "[config]") {
    CHECK(ConfigLoader::validate_config(GatewayConfig{}).empty());
}

TEST_CASE("ConfigLoader: zero max_connections is rejected", "[config]") {
    CleanEnv env;
    const auto result = ConfigLoader::load_from_string("[database]\nmin_connections = 0\nmax_connections = 0\n");
    REQUIRE_FALSE(result.success);
    CHECK(has_error(result.error_message, "database.max_connections must be > 0"));
    CHECK(has_error(result.error_message, "Config validation failed:"));
}
