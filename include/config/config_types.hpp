#pragma once

#include "db/iconnection_factory.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace wpdb {

// ============================================================================
// Database ([database] section, WP_DB_* / WP_TABLE_PREFIX overrides)
// ============================================================================

struct DatabaseConfig {
    ConnectionParams connection;
    std::string table_prefix;                       // empty = auto-detect at startup
    size_t min_connections = 1;
    size_t max_connections = 5;
    std::chrono::milliseconds pool_acquire_timeout{5000};
    std::chrono::seconds idle_timeout{300};
};

// ============================================================================
// Query execution ([query] section, WP_MAX_ROWS / WP_QUERY_TIMEOUT overrides)
// ============================================================================

struct QueryConfig {
    size_t max_rows = 1000;
    uint32_t timeout_seconds = 30;
    std::chrono::milliseconds grace{5000};
};

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Top-level
// ============================================================================

struct GatewayConfig {
    DatabaseConfig database;
    QueryConfig query;
    LoggingConfig logging;
};

} // namespace wpdb
