#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "db/iconnection_factory.hpp"
#include "db/iconnection_pool.hpp"
#include "db/iquery_executor.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace wpdb {

/**
 * @brief Process-wide database state: pool, executor and table prefix
 *
 * Built once by create() during startup and read-only afterwards. Request
 * handlers reach it through a ContextSlot, never through a global.
 */
class DatabaseContext {
public:
    /**
     * @brief Build the pool, verify connectivity and resolve the prefix
     *
     * Fails with CONNECTION_ERROR if any connection cannot be opened; the
     * half-built pool is drained before returning. With no configured
     * prefix the base prefix is auto-detected through the new pool.
     */
    [[nodiscard]] static Result<std::shared_ptr<const DatabaseContext>> create(
        const GatewayConfig& config, std::shared_ptr<IConnectionFactory> factory);

    DatabaseContext(const DatabaseContext&) = delete;
    DatabaseContext& operator=(const DatabaseContext&) = delete;

    [[nodiscard]] const std::string& table_prefix() const { return table_prefix_; }
    [[nodiscard]] const std::string& schema() const { return schema_; }
    [[nodiscard]] std::shared_ptr<IQueryExecutor> executor() const { return executor_; }
    [[nodiscard]] std::shared_ptr<IConnectionPool> pool() const { return pool_; }

    /**
     * @brief Close idle connections and wait up to `wait` for in-flight ones
     *
     * Statements abandoned after a timeout are joined before returning, even
     * when that takes longer than `wait`.
     * @return true if nothing had to be dropped
     */
    bool shutdown(std::chrono::milliseconds wait) const;

private:
    DatabaseContext(std::shared_ptr<IConnectionPool> pool,
                    std::shared_ptr<IQueryExecutor> executor,
                    std::string schema,
                    std::string table_prefix);

    std::shared_ptr<IConnectionPool> pool_;
    std::shared_ptr<IQueryExecutor> executor_;
    std::string schema_;
    std::string table_prefix_;
};

/**
 * @brief Set-once holder for the DatabaseContext
 *
 * get() before set() yields NOT_INITIALIZED instead of blocking, so request
 * handling can report "still starting up".
 */
class ContextSlot {
public:
    ContextSlot() = default;
    ContextSlot(const ContextSlot&) = delete;
    ContextSlot& operator=(const ContextSlot&) = delete;

    /**
     * @brief Publish the context; returns false if one was already set
     */
    bool set(std::shared_ptr<const DatabaseContext> context);

    [[nodiscard]] Result<std::shared_ptr<const DatabaseContext>> get() const;

    [[nodiscard]] bool is_ready() const;

    /**
     * @brief Drain the published context's pool and empty the slot
     *
     * Safe to call when nothing was ever set.
     */
    bool shutdown(std::chrono::milliseconds wait);

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const DatabaseContext> context_;
    bool ever_set_ = false;
};

} // namespace wpdb
