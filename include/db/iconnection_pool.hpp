#pragma once

#include "db/iconnection_factory.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace wpdb {

// Forward declarations
class PooledConnection;

/**
 * @brief Pool configuration
 */
struct PoolConfig {
    ConnectionParams connection;
    size_t min_connections = 1;
    size_t max_connections = 5;
    std::chrono::milliseconds idle_timeout{300000};
    std::string health_check_query{"SELECT 1"};
};

/**
 * @brief Pool statistics for monitoring
 */
struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t abandoned_connections = 0;   // slot released, still owned by a worker
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t failed_creates = 0;
    size_t health_check_failures = 0;
    size_t connections_discarded = 0;
};

/**
 * @brief Abstract connection pool interface
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Acquire connection from pool (blocking with timeout)
     * @param timeout Max wait time for acquisition
     * @return RAII connection handle or nullptr on timeout/error/shutdown
     */
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) = 0;

    /**
     * @brief Get pool statistics (thread-safe)
     */
    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /**
     * @brief Stop handing out connections, close idle ones and wait up to
     *        `wait` for checked-out and abandoned ones to come back
     * @return true if every connection was closed within `wait`
     */
    virtual bool drain(std::chrono::milliseconds wait = std::chrono::milliseconds{0}) = 0;

    /**
     * @brief Get database name this pool serves
     */
    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace wpdb
