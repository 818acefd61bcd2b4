#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace wpdb {

/**
 * @brief Failure class reported by a connection
 */
enum class DbFailure {
    NONE,
    CONNECTION,     // transport lost, server gone, handle unusable
    TIMEOUT,        // server-side execution-time ceiling hit
    QUERY           // anything else the server rejected
};

/**
 * @brief Result set from a statement execution
 *
 * Returned by IDbConnection::execute(). Owns the decoded rows (copied from
 * native result handles).
 */
struct DbResultSet {
    bool success = false;
    DbFailure failure = DbFailure::NONE;
    unsigned int error_number = 0;      // native error code, diagnostics only
    std::string error_message;          // native error text, diagnostics only

    std::vector<std::string> column_names;
    RowSet rows;

    static DbResultSet failed(DbFailure failure, unsigned int number, std::string message) {
        DbResultSet result;
        result.failure = failure;
        result.error_number = number;
        result.error_message = std::move(message);
        return result;
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (MYSQL*).
 * Implementations are not thread-safe; thread safety comes from the pool.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a statement with positional `?` parameters
     * @param sql SQL text
     * @param params Values bound to the placeholders, in order
     * @param max_rows Fetch at most this many rows; the rest are discarded
     */
    [[nodiscard]] virtual DbResultSet execute(
        const std::string& sql, const QueryParams& params, size_t max_rows) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     * @return true if connection is usable
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set the server-side execution-time ceiling for this session
     * @param timeout_ms Timeout in milliseconds (0 = no timeout)
     * @return true if timeout was set successfully
     *
     * MySQL: SET SESSION MAX_EXECUTION_TIME = ? (bound, not interpolated);
     * MariaDB: SET SESSION max_statement_time = ? in seconds. A server that
     * rejects the setting is not asked again on the same connection.
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace wpdb
