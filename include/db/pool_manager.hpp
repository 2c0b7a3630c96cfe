#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "db/connection_pool.hpp"
#include "db/idb_engine.hpp"
#include <chrono>
#include <memory>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace unidb {

/**
 * @brief One ConnectionPool per registered engine id
 *
 * Thread-safe: the id -> pool map is guarded by a shared_mutex (shared for
 * lookups). Pool I/O (pre-warm, drain, health checks) runs outside the lock.
 *
 * An optional maintenance thread periodically evicts expired idle
 * connections from every pool.
 */
class PoolManager {
public:
    PoolManager() = default;
    ~PoolManager();

    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;

    /**
     * @brief Build and register a pool for engine under id
     * @return CONFIGURATION_ERROR if id is taken or the config is invalid
     */
    [[nodiscard]] Result<std::shared_ptr<ConnectionPool>> add_engine(
        const std::string& id,
        std::shared_ptr<IDbEngine> engine,
        const DatabaseConfig& config);

    /**
     * @brief Look up a pool (POOL_ERROR if id is unknown)
     */
    [[nodiscard]] Result<std::shared_ptr<ConnectionPool>> get_pool(const std::string& id) const;

    /**
     * @brief Unregister and drain the pool. Idle connections are closed
     * before this returns.
     * @return false if id was unknown
     */
    bool remove_engine(const std::string& id);

    [[nodiscard]] std::vector<std::pair<std::string, HealthStatus>> health_check_all() const;

    [[nodiscard]] std::vector<std::string> engine_ids() const;
    [[nodiscard]] size_t size() const;

    void start_maintenance(std::chrono::milliseconds interval);
    void stop_maintenance();

    /**
     * @brief One maintenance pass over every pool
     * @return Total connections evicted
     */
    size_t run_maintenance();

private:
    [[nodiscard]] std::vector<std::shared_ptr<ConnectionPool>> snapshot() const;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ConnectionPool>> pools_;

    std::jthread maintenance_thread_;
};

} // namespace unidb
