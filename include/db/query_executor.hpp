#pragma once

#include "db/iquery_executor.hpp"
#include "db/iconnection_pool.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace wpdb {

/**
 * @brief Pooled, timeout-bounded query executor
 *
 * Uses IConnectionPool to acquire connections and IDbConnection::execute()
 * to run statements. Each execution:
 *  1. acquires a connection (bounded wait, POOL_EXHAUSTED on failure)
 *  2. sets the session execution-time ceiling to query_timeout_ms
 *  3. runs the statement on a worker thread, waiting at most
 *     query_timeout_ms + grace; past that the caller gets TIMEOUT, the
 *     connection's pool slot is released at once and the worker closes the
 *     connection once the driver returns
 *  4. fetches limit + 1 rows; an extra row means has_more
 *
 * Abandoned workers are joined, never detached: finished ones on the next
 * execute(), the rest by drain() or the destructor.
 *
 * Driver failures are logged with their native text and surfaced only as
 * error codes.
 */
class QueryExecutor : public IQueryExecutor {
public:
    struct Config {
        uint32_t query_timeout_ms = 30000;               // 0 = no ceiling
        std::chrono::milliseconds grace{5000};           // client wait beyond the server ceiling
        std::chrono::milliseconds acquire_timeout{5000};
        size_t max_rows = 1000;
    };

    QueryExecutor(std::shared_ptr<IConnectionPool> pool, const Config& config);

    explicit QueryExecutor(std::shared_ptr<IConnectionPool> pool)
        : QueryExecutor(std::move(pool), Config{}) {}

    /**
     * @brief Joins every abandoned worker (blocks until the driver returns)
     */
    ~QueryExecutor() override;

    QueryExecutor(const QueryExecutor&) = delete;
    QueryExecutor& operator=(const QueryExecutor&) = delete;

    Result<QueryRows> execute(
        const std::string& sql, const QueryParams& params, size_t limit) override;

    size_t effective_limit(size_t requested) const override;

    bool drain(std::chrono::milliseconds wait) override;

    [[nodiscard]] const Config& config() const { return config_; }

    // Workers abandoned after a timeout and not joined yet
    [[nodiscard]] size_t abandoned_workers() const;

private:
    struct PendingExecution;

    struct AbandonedWorker {
        std::thread thread;
        std::shared_ptr<PendingExecution> state;
    };

    Result<QueryRows> run_bounded(
        std::unique_ptr<PooledConnection> conn,
        const std::string& sql, const QueryParams& params, size_t limit);

    void park_worker(std::thread worker, std::shared_ptr<PendingExecution> state);
    void reap_finished_workers();

    std::shared_ptr<IConnectionPool> pool_;
    Config config_;

    std::vector<AbandonedWorker> abandoned_workers_;
    mutable std::mutex workers_mutex_;
};

} // namespace wpdb
