#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "db/idb_engine.hpp"
#include "db/pooled_connection.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <semaphore>
#include <shared_mutex>
#include <string>

namespace unidb {

/**
 * @brief Bounded connection pool for one engine
 *
 * Design:
 * - Bound: max_connections enforced via counting_semaphore. A caller opens
 *   a new connection only while holding a permit and after finding the idle
 *   set empty, so live connections (leased + idle) never exceed the bound.
 * - Lazy growth: min_connections pre-warmed, the rest opened on demand
 * - Recycling: idle connections past idle_timeout or max_lifetime are
 *   closed on the next acquire instead of being reused
 * - Broken leases (see PooledConnection::mark_broken) are closed on return
 * - Locking: shared_mutex over the idle deque (shared for stats, exclusive
 *   for push/pop). No lock is held across backend I/O; connect() and
 *   close() always run outside it.
 *
 * Leases hold a weak reference, so a lease outliving its pool just closes
 * its connection. Always created through create().
 */
class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
public:
    [[nodiscard]] static Result<std::shared_ptr<ConnectionPool>> create(
        std::string name,
        std::shared_ptr<IDbEngine> engine,
        const DatabaseConfig& config);

    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Lease a connection, waiting at most pool.connection_timeout
     * @return TIMEOUT when no connection frees up in time, POOL_ERROR when
     *         draining, or the engine's CONNECTION_FAILED
     */
    [[nodiscard]] Result<std::unique_ptr<PooledConnection>> acquire();
    [[nodiscard]] Result<std::unique_ptr<PooledConnection>> acquire(std::chrono::milliseconds timeout);

    /**
     * @brief Explicitly return a lease (destruction does the same)
     */
    void release(std::unique_ptr<PooledConnection> conn);

    /**
     * @brief Engine health combined with occupancy
     *
     * CRITICAL when the engine is unreachable and no connection is live,
     * DEGRADED when unreachable with live connections or when saturated.
     */
    [[nodiscard]] HealthStatus health_check();

    [[nodiscard]] PoolStats get_stats() const;

    /**
     * @brief Close idle connections past idle_timeout or max_lifetime
     * @return Number of connections closed
     */
    size_t evict_expired();

    /**
     * @brief Stop leasing and close every idle connection. Leased
     * connections are closed as they come back.
     */
    void drain();

    const std::string& name() const { return name_; }
    const DatabaseConfig& config() const { return config_; }
    const std::shared_ptr<IDbEngine>& engine() const { return engine_; }

private:
    struct IdleEntry {
        std::unique_ptr<DbConnection> conn;
        std::chrono::steady_clock::time_point created_at;
        std::chrono::steady_clock::time_point last_used;
    };

    ConnectionPool(std::string name, std::shared_ptr<IDbEngine> engine, const DatabaseConfig& config);

    void prewarm();
    [[nodiscard]] Result<std::unique_ptr<DbConnection>> open_connection();
    void close_connection(std::unique_ptr<DbConnection> conn);
    [[nodiscard]] bool is_expired(const IdleEntry& entry,
                                  std::chrono::steady_clock::time_point now) const;
    void return_connection(PooledConnection::Lease lease);
    void record_acquire_time(std::chrono::microseconds elapsed);

    std::string name_;
    std::shared_ptr<IDbEngine> engine_;
    DatabaseConfig config_;

    std::deque<IdleEntry> idle_connections_;
    mutable std::shared_mutex mutex_;

    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<uint64_t> total_acquires_{0};
    std::atomic<uint64_t> total_releases_{0};
    std::atomic<uint64_t> failed_acquires_{0};
    std::atomic<uint64_t> connections_recycled_{0};
    std::atomic<uint64_t> connections_discarded_{0};

    std::atomic<uint64_t> acquire_time_sum_us_{0};
    std::atomic<uint64_t> acquire_time_count_{0};
    std::array<std::atomic<uint64_t>, PoolStats::kBucketCount> acquire_time_buckets_{};

    std::atomic<bool> shutdown_{false};
};

} // namespace unidb
