#pragma once

#include "config/config_types.hpp"
#include "core/database_type.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "db/db_connection.hpp"
#include <memory>
#include <string>

namespace unidb {

/**
 * @brief Abstract database engine: opens connections and reports what the
 * backend can do
 *
 * One engine per registered backend, shared by its pool. Implementations
 * must be thread-safe (connect() is called concurrently by the pool).
 *
 * Usage:
 *   auto engine = EngineRegistry::instance().create(config);
 *   auto conn = engine.value()->connect(config.connection);
 */
class IDbEngine {
public:
    virtual ~IDbEngine() = default;

    [[nodiscard]] virtual DatabaseType type() const = 0;

    /** @brief Open a new connection (CONNECTION_FAILED on error) */
    [[nodiscard]] virtual Result<std::unique_ptr<DbConnection>> connect(
        const ConnectionConfig& config) = 0;

    /** @brief Probe the backend; latency and error detail in the status */
    [[nodiscard]] virtual HealthStatus health_check() = 0;

    /** @brief Capabilities of this engine. Pure, no I/O. */
    [[nodiscard]] virtual FeatureSet supported_features() const = 0;

    /** @brief Check a config before a pool is built on it (CONFIGURATION_ERROR) */
    [[nodiscard]] virtual Result<void> validate_config(const DatabaseConfig& config) const = 0;

    /** @brief Server version string */
    [[nodiscard]] virtual Result<std::string> version() = 0;
};

} // namespace unidb
