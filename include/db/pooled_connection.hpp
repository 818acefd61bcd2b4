#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace wpdb {

/**
 * @brief RAII wrapper for database connection
 *
 * Automatically returns connection to pool on destruction.
 * Move-only to prevent accidental copying.
 *
 * A connection whose state is unknown (abandoned after a timeout, transport
 * error) is marked broken; the pool closes it instead of reusing it.
 *
 * release_slot() gives the pool slot back while the handle still owns the
 * connection; the connection is closed later, when the handle is destroyed.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>, bool reusable)>;
    using ReleaseSlotFunc = std::function<void(IDbConnection*)>;

    /**
     * @brief Construct pooled connection with return callback
     * @param conn Database connection
     * @param return_fn Function to call on destruction (returns to pool)
     * @param release_slot_fn Function called by release_slot() (may be empty)
     */
    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn,
                     ReleaseSlotFunc release_slot_fn = {});

    /**
     * @brief Destructor - automatically returns connection to pool
     */
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /**
     * @brief Discard instead of reuse when returned
     */
    void mark_broken() { broken_ = true; }
    bool is_broken() const { return broken_; }

    /**
     * @brief Stop counting this connection against the pool right away
     *
     * Marks the connection broken. Must not race with destruction of the
     * handle; the caller synchronizes with whichever thread owns it.
     */
    void release_slot();
    bool is_slot_released() const { return slot_released_; }

private:
    void give_back();

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    ReleaseSlotFunc release_slot_fn_;
    bool broken_ = false;
    bool slot_released_ = false;
};

} // namespace wpdb
