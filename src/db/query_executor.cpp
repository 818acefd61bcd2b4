#include "db/query_executor.hpp"
#include "db/pooled_connection.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <condition_variable>
#include <format>
#include <mutex>
#include <thread>
#include <vector>

namespace wpdb {

/**
 * @brief Rendezvous between the caller and the worker running a statement
 */
struct QueryExecutor::PendingExecution {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    bool abandoned = false;                 // caller stopped waiting
    PooledConnection* handle = nullptr;     // owned by the worker, null once done
    DbResultSet result;
    std::string exception_text;             // non-empty if the worker threw
};

namespace {

ErrorCode to_error_code(DbFailure failure) {
    switch (failure) {
        case DbFailure::CONNECTION: return ErrorCode::CONNECTION_ERROR;
        case DbFailure::TIMEOUT:    return ErrorCode::TIMEOUT;
        default:                    return ErrorCode::QUERY_ERROR;
    }
}

// Single-line excerpt of a statement for log lines
std::string excerpt(const std::string& sql) {
    constexpr size_t kMax = 200;
    std::string out = sql.size() > kMax ? sql.substr(0, kMax) + "..." : sql;
    std::replace(out.begin(), out.end(), '\n', ' ');
    return out;
}

} // namespace

QueryExecutor::QueryExecutor(
    std::shared_ptr<IConnectionPool> pool,
    const Config& config)
    : pool_(std::move(pool)),
      config_(config) {}

QueryExecutor::~QueryExecutor() {
    drain(std::chrono::milliseconds{0});
}

size_t QueryExecutor::effective_limit(size_t requested) const {
    const size_t ceiling = std::max<size_t>(config_.max_rows, 1);
    return std::clamp<size_t>(requested, 1, ceiling);
}

Result<QueryRows> QueryExecutor::execute(
    const std::string& sql, const QueryParams& params, size_t limit) {

    const size_t effective = effective_limit(limit);
    reap_finished_workers();

    auto conn = pool_->acquire(config_.acquire_timeout);
    if (!conn) {
        const auto stats = pool_->get_stats();
        utils::log::warn(std::format(
            "No connection from pool '{}' within {}ms (active={}, total={})",
            pool_->name(), config_.acquire_timeout.count(),
            stats.active_connections, stats.total_connections));
        return Result<QueryRows>::error(ErrorCode::POOL_EXHAUSTED, std::format(
            "pool '{}' acquire timed out after {}ms",
            pool_->name(), config_.acquire_timeout.count()));
    }

    if (!conn->is_valid()) {
        conn->mark_broken();
        utils::log::error(std::format("Pool '{}' handed out a dead connection", pool_->name()));
        return Result<QueryRows>::error(ErrorCode::CONNECTION_ERROR, "acquired connection is not connected");
    }

    // Server-side ceiling; the client-side bound below still applies if this fails
    if (config_.query_timeout_ms > 0 && !(*conn)->set_query_timeout(config_.query_timeout_ms)) {
        if (!conn->is_valid()) {
            conn->mark_broken();
            utils::log::error("Connection lost while setting the session execution timeout");
            return Result<QueryRows>::error(ErrorCode::CONNECTION_ERROR,
                "connection lost while setting MAX_EXECUTION_TIME");
        }
        utils::log::debug("Session execution timeout not set; relying on client-side wait only");
    }

    try {
        return run_bounded(std::move(conn), sql, params, effective);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Query execution failed unexpectedly: {} (sql: {})",
                                      e.what(), excerpt(sql)));
        return Result<QueryRows>::error(ErrorCode::INTERNAL_ERROR, e.what());
    }
}

Result<QueryRows> QueryExecutor::run_bounded(
    std::unique_ptr<PooledConnection> conn,
    const std::string& sql, const QueryParams& params, size_t limit) {

    utils::Timer timer;
    auto state = std::make_shared<PendingExecution>();
    state->handle = conn.get();

    // The worker owns the connection handle and a reference to the pool, so
    // an abandoned execution can still close its connection after the
    // caller has moved on.
    std::thread worker([state, conn = std::move(conn), pool = pool_,
                        sql, params, fetch = limit + 1]() mutable {
        DbResultSet result;
        std::string exception_text;
        try {
            result = conn->get()->execute(sql, params, fetch);
        } catch (const std::exception& e) {
            exception_text = e.what();
            if (exception_text.empty()) exception_text = "unknown exception";
        }

        {
            // Returning under the lock keeps release_slot() off a dead handle
            std::lock_guard lock(state->mutex);
            if (state->abandoned || !exception_text.empty()
                || result.failure == DbFailure::CONNECTION) {
                conn->mark_broken();
            }
            conn.reset();
            state->handle = nullptr;
            state->result = std::move(result);
            state->exception_text = std::move(exception_text);
            state->done = true;
        }
        state->cv.notify_all();
    });

    std::unique_lock lock(state->mutex);
    bool finished = true;
    std::chrono::milliseconds bound{0};
    if (config_.query_timeout_ms == 0) {
        state->cv.wait(lock, [&] { return state->done; });
    } else {
        bound = std::chrono::milliseconds{config_.query_timeout_ms} + config_.grace;
        finished = state->cv.wait_for(lock, bound, [&] { return state->done; });
    }

    if (!finished) {
        state->abandoned = true;
        state->handle->release_slot();
        lock.unlock();
        park_worker(std::move(worker), state);
        utils::log::error(std::format(
            "Query abandoned after {}ms client-side wait (sql: {})",
            bound.count(), excerpt(sql)));
        return Result<QueryRows>::error(ErrorCode::TIMEOUT, std::format(
            "client-side wait of {}ms elapsed", bound.count()));
    }
    lock.unlock();
    worker.join();

    if (!state->exception_text.empty()) {
        utils::log::error(std::format("Query worker threw: {} (sql: {})",
                                      state->exception_text, excerpt(sql)));
        return Result<QueryRows>::error(ErrorCode::INTERNAL_ERROR, state->exception_text);
    }

    DbResultSet& db_result = state->result;
    if (!db_result.success) {
        const ErrorCode code = to_error_code(db_result.failure);
        const auto detail = std::format("[{}] {}", db_result.error_number, db_result.error_message);
        utils::log::error(std::format("Query failed ({}): {} (sql: {})",
                                      error_code_to_string(code), detail, excerpt(sql)));
        return Result<QueryRows>::error(code, detail);
    }

    QueryRows rows;
    rows.rows = std::move(db_result.rows);
    if (rows.rows.size() > limit) {
        rows.rows.resize(limit);
        rows.has_more = true;
    }

    utils::log::debug(std::format("Query returned {} row(s){} in {}ms",
                                  rows.rows.size(), rows.has_more ? " (truncated)" : "",
                                  timer.elapsed_ms().count()));
    return Result<QueryRows>::ok(std::move(rows));
}

void QueryExecutor::park_worker(std::thread worker, std::shared_ptr<PendingExecution> state) {
    std::lock_guard lock(workers_mutex_);
    abandoned_workers_.push_back({std::move(worker), std::move(state)});
}

void QueryExecutor::reap_finished_workers() {
    std::vector<std::thread> finished;
    {
        std::lock_guard lock(workers_mutex_);
        auto it = abandoned_workers_.begin();
        while (it != abandoned_workers_.end()) {
            bool done = false;
            {
                std::lock_guard state_lock(it->state->mutex);
                done = it->state->done;
            }
            if (done) {
                finished.push_back(std::move(it->thread));
                it = abandoned_workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& thread : finished) {
        thread.join();
    }
}

bool QueryExecutor::drain(std::chrono::milliseconds wait) {
    std::vector<AbandonedWorker> workers;
    {
        std::lock_guard lock(workers_mutex_);
        workers.swap(abandoned_workers_);
    }
    if (workers.empty()) {
        return true;
    }

    const auto deadline = std::chrono::steady_clock::now() + wait;
    size_t still_running = 0;
    for (auto& w : workers) {
        std::unique_lock lock(w.state->mutex);
        if (!w.state->cv.wait_until(lock, deadline, [&] { return w.state->done; })) {
            ++still_running;
        }
    }
    if (still_running > 0) {
        utils::log::warn(std::format(
            "Waiting for {} abandoned statement(s) to return from the driver", still_running));
    }

    for (auto& w : workers) {
        w.thread.join();
    }
    return still_running == 0;
}

size_t QueryExecutor::abandoned_workers() const {
    std::lock_guard lock(workers_mutex_);
    return abandoned_workers_.size();
}

} // namespace wpdb
