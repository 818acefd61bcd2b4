#include "db/pooled_connection.hpp"

namespace wpdb {

PooledConnection::PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn,
                                   ReleaseSlotFunc release_slot_fn)
    : conn_(std::move(conn)),
      return_fn_(std::move(return_fn)),
      release_slot_fn_(std::move(release_slot_fn)) {}

PooledConnection::~PooledConnection() {
    give_back();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : conn_(std::move(other.conn_)),
      return_fn_(std::move(other.return_fn_)),
      release_slot_fn_(std::move(other.release_slot_fn_)),
      broken_(other.broken_),
      slot_released_(other.slot_released_) {}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        // Return current connection before taking new one
        give_back();
        conn_ = std::move(other.conn_);
        return_fn_ = std::move(other.return_fn_);
        release_slot_fn_ = std::move(other.release_slot_fn_);
        broken_ = other.broken_;
        slot_released_ = other.slot_released_;
    }
    return *this;
}

void PooledConnection::release_slot() {
    broken_ = true;
    if (slot_released_ || !conn_ || !release_slot_fn_) {
        return;
    }
    slot_released_ = true;
    release_slot_fn_(conn_.get());
}

void PooledConnection::give_back() {
    if (conn_ && return_fn_) {
        const bool reusable = !broken_ && conn_->is_connected();
        return_fn_(std::move(conn_), reusable);
    }
}

} // namespace wpdb
