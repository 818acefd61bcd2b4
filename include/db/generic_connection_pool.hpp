#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace wpdb {

/**
 * @brief Bounded connection pool
 *
 * Design:
 * - Bounded pool: max_connections enforced via counting_semaphore (C++20)
 * - Pre-warms min_connections at construction, grows on demand up to max
 * - Health checking: connections idle longer than idle_timeout are
 *   validated before being handed out
 * - Thread-safe: mutex protects deque, semaphore prevents oversubscription
 * - RAII: PooledConnection auto-returns on destruction; broken connections
 *   are closed instead of going back to the idle deque
 * - Abandoned connections (PooledConnection::release_slot) free their slot
 *   at once and are closed when their owner finally lets go; drain() waits
 *   for those too
 * - No fairness among waiters
 */
class GenericConnectionPool : public IConnectionPool {
public:
    /**
     * @param db_name Database name (for logging)
     * @param config Pool configuration
     * @param factory Connection factory (creates IDbConnection instances)
     */
    GenericConnectionPool(
        std::string db_name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    GenericConnectionPool(const GenericConnectionPool&) = delete;
    GenericConnectionPool& operator=(const GenericConnectionPool&) = delete;

    std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    PoolStats get_stats() const override;

    bool drain(std::chrono::milliseconds wait = std::chrono::milliseconds{0}) override;

    const std::string& name() const override { return db_name_; }

private:
    /**
     * @brief Create new connection via factory
     */
    std::unique_ptr<IDbConnection> create_connection();

    /**
     * @brief Close a connection and forget its bookkeeping (caller holds no lock)
     */
    void destroy_connection(std::unique_ptr<IDbConnection> conn);

    /**
     * @brief Return connection to pool (called by PooledConnection destructor)
     */
    void return_connection(std::unique_ptr<IDbConnection> conn, bool reusable);

    /**
     * @brief Give back the slot of a connection that stays checked out
     */
    void release_slot(IDbConnection* conn);

    std::string db_name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    // Connection storage
    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    std::unordered_map<IDbConnection*, std::chrono::steady_clock::time_point> last_used_;
    std::unordered_set<IDbConnection*> abandoned_;
    size_t checked_out_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable returned_cv_;

    // Semaphore for bounded pool (C++20)
    std::counting_semaphore<> semaphore_;

    // Statistics (atomic for lock-free reads)
    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> failed_creates_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_discarded_{0};

    // Shutdown flag
    std::atomic<bool> shutdown_{false};
};

} // namespace wpdb
