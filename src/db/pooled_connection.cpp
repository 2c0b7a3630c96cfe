#include "db/pooled_connection.hpp"

namespace unidb {

PooledConnection::PooledConnection(std::unique_ptr<DbConnection> conn,
                                   std::chrono::steady_clock::time_point created_at,
                                   ReturnFunc return_fn)
    : conn_(std::move(conn)), created_at_(created_at), return_fn_(std::move(return_fn)) {}

PooledConnection::~PooledConnection() {
    release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : conn_(std::move(other.conn_)),
      created_at_(other.created_at_),
      return_fn_(std::move(other.return_fn_)),
      broken_(other.broken_.load(std::memory_order_acquire)) {}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        // Return current connection before taking the new one
        release();
        conn_ = std::move(other.conn_);
        created_at_ = other.created_at_;
        return_fn_ = std::move(other.return_fn_);
        broken_.store(other.broken_.load(std::memory_order_acquire), std::memory_order_release);
    }
    return *this;
}

void PooledConnection::release() {
    if (conn_ && return_fn_) {
        return_fn_(Lease{std::move(conn_), created_at_, is_broken()});
    }
    conn_.reset();
}

} // namespace unidb
