#include "db/connection_pool.hpp"
#include "core/utils.hpp"
#include "safety/loop_guard.hpp"
#include <format>
#include <mutex>
#include <optional>

namespace unidb {

Result<std::shared_ptr<ConnectionPool>> ConnectionPool::create(
    std::string name,
    std::shared_ptr<IDbEngine> engine,
    const DatabaseConfig& config) {

    using R = Result<std::shared_ptr<ConnectionPool>>;
    if (!engine) {
        return R::error(ErrorCode::CONFIGURATION_ERROR, "pool requires an engine");
    }
    if (config.pool.max_connections == 0) {
        return R::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("pool '{}': max_connections must be > 0", name));
    }
    if (config.pool.min_connections > config.pool.max_connections) {
        return R::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("pool '{}': min_connections ({}) > max_connections ({})",
                name, config.pool.min_connections, config.pool.max_connections));
    }

    std::shared_ptr<ConnectionPool> pool(new ConnectionPool(std::move(name), std::move(engine), config));
    pool->prewarm();
    return R::ok(std::move(pool));
}

ConnectionPool::ConnectionPool(std::string name,
                               std::shared_ptr<IDbEngine> engine,
                               const DatabaseConfig& config)
    : name_(std::move(name)),
      engine_(std::move(engine)),
      config_(config),
      semaphore_(static_cast<std::ptrdiff_t>(config.pool.max_connections)) {}

ConnectionPool::~ConnectionPool() {
    drain();
}

void ConnectionPool::prewarm() {
    for (size_t i = 0; i < config_.pool.min_connections; ++i) {
        auto conn = open_connection();
        if (conn.is_error()) {
            utils::log::warn(std::format(
                "Failed to create connection {} during pool initialization for '{}': {}",
                i + 1, name_, conn.error_message()));
            continue;
        }
        const auto now = std::chrono::steady_clock::now();
        std::unique_lock lock(mutex_);
        idle_connections_.push_back({std::move(conn.value()), now, now});
    }

    utils::log::info(std::format("ConnectionPool '{}' ({}) initialized: {} connections (min={}, max={})",
        name_, database_type_to_string(engine_->type()), total_connections_.load(),
        config_.pool.min_connections, config_.pool.max_connections));
}

Result<std::unique_ptr<PooledConnection>> ConnectionPool::acquire() {
    return acquire(config_.pool.connection_timeout);
}

Result<std::unique_ptr<PooledConnection>> ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    using R = Result<std::unique_ptr<PooledConnection>>;
    utils::Timer timer;

    if (shutdown_.load(std::memory_order_acquire)) {
        return R::error(ErrorCode::POOL_ERROR, std::format("pool '{}' is draining", name_));
    }

    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return R::error(ErrorCode::TIMEOUT,
            std::format("pool '{}': no connection available within {}ms (max={})",
                name_, timeout.count(), config_.pool.max_connections));
    }

    // Shutdown may have been set while waiting for the permit
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return R::error(ErrorCode::POOL_ERROR, std::format("pool '{}' is draining", name_));
    }

    std::unique_ptr<DbConnection> conn;
    std::chrono::steady_clock::time_point created_at{};

    // Idle set never holds more than max_connections entries
    LoopGuard guard(std::format("pool.acquire[{}]", name_), config_.pool.max_connections + 1);
    while (guard.check_iteration()) {
        std::optional<IdleEntry> entry;
        {
            std::unique_lock lock(mutex_);
            if (idle_connections_.empty()) break;
            entry.emplace(std::move(idle_connections_.front()));
            idle_connections_.pop_front();
        }

        if (is_expired(*entry, std::chrono::steady_clock::now()) || !entry->conn->is_connected()) {
            close_connection(std::move(entry->conn));
            connections_recycled_.fetch_add(1, std::memory_order_relaxed);
            continue;
        }

        conn = std::move(entry->conn);
        created_at = entry->created_at;
        break;
    }

    if (!conn) {
        auto opened = open_connection();
        if (opened.is_error()) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return opened.as_error<std::unique_ptr<PooledConnection>>();
        }
        conn = std::move(opened.value());
        created_at = std::chrono::steady_clock::now();
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);
    record_acquire_time(timer.elapsed_us());

    auto return_fn = [weak = weak_from_this()](PooledConnection::Lease lease) {
        if (auto pool = weak.lock()) {
            pool->return_connection(std::move(lease));
        } else if (lease.conn) {
            lease.conn->close();
        }
    };

    return R::ok(std::make_unique<PooledConnection>(std::move(conn), created_at, std::move(return_fn)));
}

void ConnectionPool::release(std::unique_ptr<PooledConnection> conn) {
    if (conn) {
        conn->release();
    }
}

HealthStatus ConnectionPool::health_check() {
    HealthStatus status = engine_->health_check();
    const auto stats = get_stats();
    status.connection_count = stats.total_connections;

    if (status.state == HealthState::CRITICAL) {
        if (stats.total_connections > 0) {
            status.state = HealthState::DEGRADED;
        }
    } else if (stats.active_connections >= config_.pool.max_connections) {
        status.state = HealthState::DEGRADED;
        status.error_message = std::format("pool saturated ({}/{} connections leased)",
            stats.active_connections, config_.pool.max_connections);
    }
    return status;
}

PoolStats ConnectionPool::get_stats() const {
    PoolStats stats;
    {
        std::shared_lock lock(mutex_);
        stats.idle_connections = idle_connections_.size();
    }
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.active_connections = stats.total_connections > stats.idle_connections
        ? stats.total_connections - stats.idle_connections : 0;
    stats.max_connections = config_.pool.max_connections;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    stats.connections_discarded = connections_discarded_.load(std::memory_order_relaxed);

    stats.acquire_time_sum_us = acquire_time_sum_us_.load(std::memory_order_relaxed);
    stats.acquire_time_count = acquire_time_count_.load(std::memory_order_relaxed);
    for (size_t i = 0; i < acquire_time_buckets_.size(); ++i) {
        stats.acquire_time_buckets[i] = acquire_time_buckets_[i].load(std::memory_order_relaxed);
    }
    return stats;
}

size_t ConnectionPool::evict_expired() {
    std::deque<IdleEntry> expired;
    {
        std::unique_lock lock(mutex_);
        const auto now = std::chrono::steady_clock::now();
        for (auto it = idle_connections_.begin(); it != idle_connections_.end();) {
            if (is_expired(*it, now)) {
                expired.push_back(std::move(*it));
                it = idle_connections_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& entry : expired) {
        close_connection(std::move(entry.conn));
        connections_recycled_.fetch_add(1, std::memory_order_relaxed);
    }
    return expired.size();
}

void ConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::deque<IdleEntry> to_close;
    {
        std::unique_lock lock(mutex_);
        to_close.swap(idle_connections_);
    }

    const size_t closed = to_close.size();
    for (auto& entry : to_close) {
        close_connection(std::move(entry.conn));
    }

    utils::log::info(std::format("ConnectionPool '{}' drained ({} idle connections closed)",
        name_, closed));
}

// ---- Internals -------------------------------------------------------------

Result<std::unique_ptr<DbConnection>> ConnectionPool::open_connection() {
    auto conn = engine_->connect(config_.connection);
    if (conn.is_ok()) {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
    } else {
        utils::log::warn(std::format("Pool '{}': connect failed: {}", name_, conn.error_message()));
    }
    return conn;
}

void ConnectionPool::close_connection(std::unique_ptr<DbConnection> conn) {
    if (!conn) return;
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

bool ConnectionPool::is_expired(const IdleEntry& entry,
                                std::chrono::steady_clock::time_point now) const {
    if (config_.pool.idle_timeout.count() > 0 &&
        now - entry.last_used > config_.pool.idle_timeout) {
        return true;
    }
    if (config_.pool.max_lifetime.count() > 0 &&
        now - entry.created_at > config_.pool.max_lifetime) {
        return true;
    }
    return false;
}

void ConnectionPool::return_connection(PooledConnection::Lease lease) {
    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (!lease.conn) {
        semaphore_.release();
        return;
    }

    if (shutdown_.load(std::memory_order_acquire) || lease.broken || !lease.conn->is_connected()) {
        if (lease.broken) {
            connections_discarded_.fetch_add(1, std::memory_order_relaxed);
            utils::log::debug(std::format("Pool '{}': closing broken connection {}",
                name_, lease.conn->connection_info().id));
        }
        close_connection(std::move(lease.conn));
        semaphore_.release();
        return;
    }

    // No health check on return; stale connections are caught on the next acquire
    {
        std::unique_lock lock(mutex_);
        idle_connections_.push_back({std::move(lease.conn), lease.created_at,
                                     std::chrono::steady_clock::now()});
    }
    semaphore_.release();
}

void ConnectionPool::record_acquire_time(std::chrono::microseconds elapsed) {
    const auto us = static_cast<uint64_t>(elapsed.count());
    acquire_time_sum_us_.fetch_add(us, std::memory_order_relaxed);
    acquire_time_count_.fetch_add(1, std::memory_order_relaxed);

    size_t bucket = 5;  // +Inf
    if (us <= 100)        bucket = 0;
    else if (us <= 500)   bucket = 1;
    else if (us <= 1000)  bucket = 2;
    else if (us <= 5000)  bucket = 3;
    else if (us <= 50000) bucket = 4;
    acquire_time_buckets_[bucket].fetch_add(1, std::memory_order_relaxed);
}

} // namespace unidb
