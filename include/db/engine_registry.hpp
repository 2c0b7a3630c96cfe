#pragma once

#include "db/idb_engine.hpp"
#include "core/database_type.hpp"
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace unidb {

/**
 * @brief Registry of engine factories keyed by DatabaseType
 *
 * Adapters are registered once at startup via register_builtin_engines()
 * (or register_engine() for custom engines); configuration then picks the
 * engine by type. The core never special-cases a backend name.
 *
 * Usage:
 *   EngineRegistry::instance().register_engine(
 *       DatabaseType::POSTGRESQL,
 *       [](const DatabaseConfig& c) { return std::make_shared<PgEngine>(c); });
 *
 *   auto engine = EngineRegistry::instance().create(config);
 */
class EngineRegistry {
public:
    using Factory = std::function<std::shared_ptr<IDbEngine>(const DatabaseConfig&)>;

    static EngineRegistry& instance() {
        static EngineRegistry registry;
        return registry;
    }

    void register_engine(DatabaseType type, Factory factory) {
        std::unique_lock lock(mutex_);
        factories_[type] = std::move(factory);
    }

    [[nodiscard]] Result<std::shared_ptr<IDbEngine>> create(const DatabaseConfig& config) const {
        Factory factory;
        {
            std::shared_lock lock(mutex_);
            const auto it = factories_.find(config.type);
            if (it == factories_.end()) {
                return Result<std::shared_ptr<IDbEngine>>::error(ErrorCode::CONFIGURATION_ERROR,
                    std::format("no engine registered for database type: {}",
                        database_type_to_string(config.type)));
            }
            factory = it->second;
        }

        auto engine = factory(config);
        if (!engine) {
            return Result<std::shared_ptr<IDbEngine>>::error(ErrorCode::CONFIGURATION_ERROR,
                std::format("engine factory for {} returned nothing",
                    database_type_to_string(config.type)));
        }
        if (auto valid = engine->validate_config(config); valid.is_error()) {
            return valid.as_error<std::shared_ptr<IDbEngine>>();
        }
        return Result<std::shared_ptr<IDbEngine>>::ok(std::move(engine));
    }

    [[nodiscard]] bool has_engine(DatabaseType type) const {
        std::shared_lock lock(mutex_);
        return factories_.count(type) > 0;
    }

private:
    EngineRegistry() = default;

    struct DatabaseTypeHash {
        size_t operator()(DatabaseType t) const {
            return std::hash<int>()(static_cast<int>(t));
        }
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<DatabaseType, Factory, DatabaseTypeHash> factories_;
};

/**
 * @brief Register the PostgreSQL, MySQL and in-memory key-value engines.
 * Idempotent.
 */
void register_builtin_engines(EngineRegistry& registry = EngineRegistry::instance());

} // namespace unidb
