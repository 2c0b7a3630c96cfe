#pragma once

#include "db/db_connection.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace unidb {

/**
 * @brief RAII lease of one pooled connection
 *
 * Returns the connection to its pool on release() or destruction. A lease
 * marked broken (the connection failed or timed out mid-operation) is
 * physically closed by the pool instead of being reused.
 * Move-only to prevent two holders of one connection.
 */
class PooledConnection {
public:
    struct Lease {
        std::unique_ptr<DbConnection> conn;
        std::chrono::steady_clock::time_point created_at;
        bool broken = false;
    };
    using ReturnFunc = std::function<void(Lease)>;

    PooledConnection(std::unique_ptr<DbConnection> conn,
                     std::chrono::steady_clock::time_point created_at,
                     ReturnFunc return_fn);

    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    DbConnection* get() const { return conn_.get(); }
    DbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /**
     * @brief Close instead of reuse when returned. Safe from any thread.
     */
    void mark_broken() { broken_.store(true, std::memory_order_release); }
    [[nodiscard]] bool is_broken() const { return broken_.load(std::memory_order_acquire); }

    /**
     * @brief Return the connection now; the lease becomes empty
     */
    void release();

private:
    std::unique_ptr<DbConnection> conn_;
    std::chrono::steady_clock::time_point created_at_;
    ReturnFunc return_fn_;
    std::atomic<bool> broken_{false};
};

} // namespace unidb
