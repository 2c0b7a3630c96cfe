#include "db/pool_manager.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>
#include <mutex>

namespace unidb {

PoolManager::~PoolManager() {
    stop_maintenance();

    std::unordered_map<std::string, std::shared_ptr<ConnectionPool>> pools;
    {
        std::unique_lock lock(mutex_);
        pools.swap(pools_);
    }
    for (auto& [id, pool] : pools) {
        pool->drain();
    }
}

Result<std::shared_ptr<ConnectionPool>> PoolManager::add_engine(
    const std::string& id,
    std::shared_ptr<IDbEngine> engine,
    const DatabaseConfig& config) {

    using R = Result<std::shared_ptr<ConnectionPool>>;
    if (id.empty()) {
        return R::error(ErrorCode::CONFIGURATION_ERROR, "engine id must not be empty");
    }
    {
        std::shared_lock lock(mutex_);
        if (pools_.contains(id)) {
            return R::error(ErrorCode::CONFIGURATION_ERROR,
                std::format("engine '{}' is already registered", id));
        }
    }
    if (!engine) {
        return R::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("engine '{}': no engine instance", id));
    }
    if (auto valid = engine->validate_config(config); valid.is_error()) {
        return valid.as_error<std::shared_ptr<ConnectionPool>>();
    }

    // Pre-warm happens here, outside the map lock
    auto pool = ConnectionPool::create(id, std::move(engine), config);
    if (pool.is_error()) {
        return pool;
    }

    {
        std::unique_lock lock(mutex_);
        const auto [it, inserted] = pools_.try_emplace(id, pool.value());
        if (!inserted) {
            lock.unlock();
            pool.value()->drain();
            return R::error(ErrorCode::CONFIGURATION_ERROR,
                std::format("engine '{}' is already registered", id));
        }
    }

    utils::log::info(std::format("Registered engine '{}'", id));
    return pool;
}

Result<std::shared_ptr<ConnectionPool>> PoolManager::get_pool(const std::string& id) const {
    std::shared_lock lock(mutex_);
    const auto it = pools_.find(id);
    if (it == pools_.end()) {
        return Result<std::shared_ptr<ConnectionPool>>::error(ErrorCode::POOL_ERROR,
            std::format("no pool registered for engine '{}'", id));
    }
    return Result<std::shared_ptr<ConnectionPool>>::ok(it->second);
}

bool PoolManager::remove_engine(const std::string& id) {
    std::shared_ptr<ConnectionPool> pool;
    {
        std::unique_lock lock(mutex_);
        const auto it = pools_.find(id);
        if (it == pools_.end()) {
            return false;
        }
        pool = std::move(it->second);
        pools_.erase(it);
    }

    pool->drain();
    utils::log::info(std::format("Removed engine '{}'", id));
    return true;
}

std::vector<std::pair<std::string, HealthStatus>> PoolManager::health_check_all() const {
    std::vector<std::pair<std::string, HealthStatus>> results;
    for (const auto& pool : snapshot()) {
        results.emplace_back(pool->name(), pool->health_check());
    }
    std::sort(results.begin(), results.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });
    return results;
}

std::vector<std::string> PoolManager::engine_ids() const {
    std::vector<std::string> ids;
    {
        std::shared_lock lock(mutex_);
        ids.reserve(pools_.size());
        for (const auto& [id, pool] : pools_) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

size_t PoolManager::size() const {
    std::shared_lock lock(mutex_);
    return pools_.size();
}

void PoolManager::start_maintenance(std::chrono::milliseconds interval) {
    if (interval.count() <= 0 || maintenance_thread_.joinable()) return;

    maintenance_thread_ = std::jthread([this, interval](std::stop_token stop) {
        while (!stop.stop_requested()) {
            // Sleep in 100ms increments for responsive shutdown
            const auto deadline = std::chrono::steady_clock::now() + interval;
            while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(
                    interval, std::chrono::milliseconds{100}));
            }
            if (stop.stop_requested()) break;
            if (const size_t evicted = run_maintenance(); evicted > 0) {
                utils::log::debug(std::format("Pool maintenance evicted {} connections", evicted));
            }
        }
    });
    utils::log::info(std::format("Pool maintenance started: every {}ms", interval.count()));
}

void PoolManager::stop_maintenance() {
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.request_stop();
        maintenance_thread_.join();
        utils::log::info("Pool maintenance stopped");
    }
}

size_t PoolManager::run_maintenance() {
    size_t evicted = 0;
    for (const auto& pool : snapshot()) {
        evicted += pool->evict_expired();
    }
    return evicted;
}

std::vector<std::shared_ptr<ConnectionPool>> PoolManager::snapshot() const {
    std::vector<std::shared_ptr<ConnectionPool>> pools;
    std::shared_lock lock(mutex_);
    pools.reserve(pools_.size());
    for (const auto& [id, pool] : pools_) {
        pools.push_back(pool);
    }
    return pools;
}

} // namespace unidb
