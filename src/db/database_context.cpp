#include "db/database_context.hpp"
#include "catalog/catalog_inspector.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/pooled_connection.hpp"
#include "db/query_executor.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>
#include <limits>

namespace wpdb {

namespace {

using ContextResult = Result<std::shared_ptr<const DatabaseContext>>;

uint32_t seconds_to_ms(uint32_t seconds) {
    const uint64_t ms = uint64_t{seconds} * 1000;
    return static_cast<uint32_t>(std::min<uint64_t>(ms, std::numeric_limits<uint32_t>::max()));
}

// Socket bound matching the executor's client-side wait, rounded up
std::chrono::seconds driver_read_timeout(const QueryConfig& query) {
    if (query.timeout_seconds == 0) {
        return std::chrono::seconds{0};
    }
    const auto grace = std::chrono::ceil<std::chrono::seconds>(query.grace);
    return std::chrono::seconds{query.timeout_seconds} + std::max(grace, std::chrono::seconds{0});
}

} // namespace

DatabaseContext::DatabaseContext(
    std::shared_ptr<IConnectionPool> pool,
    std::shared_ptr<IQueryExecutor> executor,
    std::string schema,
    std::string table_prefix)
    : pool_(std::move(pool)),
      executor_(std::move(executor)),
      schema_(std::move(schema)),
      table_prefix_(std::move(table_prefix)) {}

ContextResult DatabaseContext::create(
    const GatewayConfig& config, std::shared_ptr<IConnectionFactory> factory) {

    const auto& db = config.database;

    PoolConfig pool_config;
    pool_config.connection = db.connection;
    pool_config.connection.read_timeout = driver_read_timeout(config.query);
    pool_config.min_connections = db.min_connections;
    pool_config.max_connections = db.max_connections;
    pool_config.idle_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(db.idle_timeout);

    utils::log::info(std::format("Connecting to {} (pool min={}, max={})",
                                 db.connection.describe(), db.min_connections, db.max_connections));

    auto pool = std::make_shared<GenericConnectionPool>(
        db.connection.database, pool_config, std::move(factory));

    const auto stats = pool->get_stats();
    if (stats.failed_creates > 0) {
        pool->drain();
        const auto detail = std::format("{} of {} initial connection(s) to {} failed",
                                        stats.failed_creates, db.min_connections,
                                        db.connection.describe());
        utils::log::error(std::format("Database startup failed: {}", detail));
        return ContextResult::error(ErrorCode::CONNECTION_ERROR, detail);
    }

    // min_connections may be 0; make sure at least one connection opens
    if (!pool->acquire(db.pool_acquire_timeout)) {
        pool->drain();
        const auto detail = std::format("could not open a connection to {}", db.connection.describe());
        utils::log::error(std::format("Database startup failed: {}", detail));
        return ContextResult::error(ErrorCode::CONNECTION_ERROR, detail);
    }

    QueryExecutor::Config exec_config;
    exec_config.query_timeout_ms = seconds_to_ms(config.query.timeout_seconds);
    exec_config.grace = config.query.grace;
    exec_config.acquire_timeout = db.pool_acquire_timeout;
    exec_config.max_rows = config.query.max_rows;
    auto executor = std::make_shared<QueryExecutor>(pool, exec_config);

    std::string prefix = db.table_prefix;
    if (prefix.empty()) {
        auto detected = CatalogInspector::detect_prefix(*executor, db.connection.database);
        if (detected.is_error()) {
            pool->drain();
            utils::log::error(std::format("Table prefix detection failed: {}",
                                          detected.error_message()));
            return ContextResult::error(detected.error());
        }
        prefix = std::move(detected.value());
        utils::log::info(std::format("Auto-detected table prefix: '{}'", prefix));
    } else {
        utils::log::info(std::format("Using configured table prefix: '{}'", prefix));
    }

    std::shared_ptr<const DatabaseContext> context(new DatabaseContext(
        std::move(pool), std::move(executor), db.connection.database, std::move(prefix)));
    return ContextResult::ok(std::move(context));
}

bool DatabaseContext::shutdown(std::chrono::milliseconds wait) const {
    const auto deadline = std::chrono::steady_clock::now() + wait;
    const bool pool_clean = pool_->drain(wait);

    // Abandoned workers are joined even past the deadline; nothing may still
    // be inside the client library once this returns.
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    const bool workers_clean = executor_->drain(std::max(left, std::chrono::milliseconds{0}));

    const auto stats = pool_->get_stats();
    utils::log::info(std::format(
        "Connection pool closed ({} acquires, {} discarded, {} still in use, {} abandoned)",
        stats.total_acquires, stats.connections_discarded, stats.active_connections,
        stats.abandoned_connections));
    return pool_clean && workers_clean;
}

// ============================================================================
// ContextSlot
// ============================================================================

bool ContextSlot::set(std::shared_ptr<const DatabaseContext> context) {
    std::lock_guard lock(mutex_);
    if (ever_set_ || !context) {
        return false;
    }
    context_ = std::move(context);
    ever_set_ = true;
    return true;
}

Result<std::shared_ptr<const DatabaseContext>> ContextSlot::get() const {
    std::lock_guard lock(mutex_);
    if (!context_) {
        return ContextResult::error(ErrorCode::NOT_INITIALIZED,
            ever_set_ ? "database context already shut down" : "database context not yet created");
    }
    return ContextResult::ok(context_);
}

bool ContextSlot::is_ready() const {
    std::lock_guard lock(mutex_);
    return context_ != nullptr;
}

bool ContextSlot::shutdown(std::chrono::milliseconds wait) {
    std::shared_ptr<const DatabaseContext> context;
    {
        std::lock_guard lock(mutex_);
        context = std::move(context_);
        context_.reset();
    }
    if (!context) {
        return true;
    }
    return context->shutdown(wait);
}

} // namespace wpdb
