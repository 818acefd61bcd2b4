#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <format>
#include <vector>

namespace wpdb {

GenericConnectionPool::GenericConnectionPool(
    std::string db_name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : db_name_(std::move(db_name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    // Pre-warm pool with min_connections
    const size_t prewarm = std::min(config_.min_connections, config_.max_connections);
    for (size_t i = 0; i < prewarm; ++i) {
        auto conn = create_connection();
        if (conn) {
            std::lock_guard lock(mutex_);
            last_used_[conn.get()] = std::chrono::steady_clock::now();
            idle_connections_.emplace_back(std::move(conn));
        } else {
            utils::log::warn(std::format(
                "Failed to create connection {} during pool initialization for database '{}'",
                i + 1, db_name_));
        }
    }

    utils::log::info(std::format(
        "ConnectionPool initialized for database '{}': {} connections (min={}, max={})",
        db_name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    // Acquire semaphore slot (blocks if pool full)
    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    // Re-check shutdown after acquiring semaphore (drain may have started
    // while this thread was waiting)
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    std::unique_ptr<IDbConnection> conn;
    std::chrono::steady_clock::time_point last_used{};

    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            const auto it = last_used_.find(conn.get());
            if (it != last_used_.end()) last_used = it->second;
        }
    }

    // Only health-check connections that sat idle longer than idle_timeout;
    // recently used ones skip the round trip.
    if (conn && std::chrono::steady_clock::now() - last_used > config_.idle_timeout) {
        if (!conn->is_healthy(config_.health_check_query)) {
            health_check_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format(
                "Discarding stale connection for database '{}' after failed health check",
                db_name_));
            destroy_connection(std::move(conn));
        }
    }

    if (!conn) {
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
    }

    {
        std::lock_guard lock(mutex_);
        last_used_[conn.get()] = std::chrono::steady_clock::now();
        ++checked_out_;
    }
    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    auto return_fn = [this](std::unique_ptr<IDbConnection> c, bool reusable) {
        this->return_connection(std::move(c), reusable);
    };
    auto release_slot_fn = [this](IDbConnection* c) {
        this->release_slot(c);
    };

    return std::make_unique<PooledConnection>(std::move(conn), return_fn, release_slot_fn);
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = checked_out_;
    stats.abandoned_connections = abandoned_.size();
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.failed_creates = failed_creates_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_discarded = connections_discarded_.load(std::memory_order_relaxed);
    return stats;
}

bool GenericConnectionPool::drain(std::chrono::milliseconds wait) {
    const bool first_drain = !shutdown_.exchange(true, std::memory_order_acq_rel);

    std::deque<std::unique_ptr<IDbConnection>> idle;
    {
        std::lock_guard lock(mutex_);
        idle.swap(idle_connections_);
    }
    for (auto& conn : idle) {
        destroy_connection(std::move(conn));
    }

    std::unique_lock lock(mutex_);
    const bool all_returned = returned_cv_.wait_for(lock, wait, [this] {
        return checked_out_ == 0 && abandoned_.empty();
    });

    if (first_drain) {
        if (all_returned) {
            utils::log::info(std::format("ConnectionPool drained for database '{}'", db_name_));
        } else {
            utils::log::warn(std::format(
                "ConnectionPool for database '{}' drained with {} connection(s) still in use "
                "and {} abandoned; they will be closed when released",
                db_name_, checked_out_, abandoned_.size()));
        }
    }
    return all_returned;
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection);
    if (conn) {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
    } else {
        failed_creates_.fetch_add(1, std::memory_order_relaxed);
    }
    return conn;
}

void GenericConnectionPool::destroy_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }
    {
        std::lock_guard lock(mutex_);
        last_used_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::release_slot(IDbConnection* conn) {
    {
        std::lock_guard lock(mutex_);
        if (!abandoned_.insert(conn).second) {
            return;
        }
        last_used_.erase(conn);
        --checked_out_;
    }
    connections_discarded_.fetch_add(1, std::memory_order_relaxed);
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
    utils::log::warn(std::format(
        "Connection for database '{}' abandoned; slot released, close deferred to its owner",
        db_name_));
    returned_cv_.notify_all();
    semaphore_.release();
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn, bool reusable) {
    if (!conn) {
        return;
    }

    // Slot and accounting were already given back by release_slot()
    bool was_abandoned = false;
    {
        std::lock_guard lock(mutex_);
        was_abandoned = abandoned_.contains(conn.get());
    }
    if (was_abandoned) {
        conn->close();
        {
            std::lock_guard lock(mutex_);
            abandoned_.erase(conn.get());
        }
        returned_cv_.notify_all();
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    const bool keep = reusable && !shutdown_.load(std::memory_order_acquire);
    if (keep) {
        std::lock_guard lock(mutex_);
        last_used_[conn.get()] = std::chrono::steady_clock::now();
        idle_connections_.emplace_back(std::move(conn));
    } else {
        if (!reusable) {
            connections_discarded_.fetch_add(1, std::memory_order_relaxed);
        }
        destroy_connection(std::move(conn));
    }

    {
        std::lock_guard lock(mutex_);
        --checked_out_;
    }
    returned_cv_.notify_all();
    semaphore_.release();
}

} // namespace wpdb
