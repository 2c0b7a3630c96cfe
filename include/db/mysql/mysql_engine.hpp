#pragma once

#include "db/idb_engine.hpp"
#include <chrono>

namespace unidb {

/**
 * @brief MySQL / MariaDB engine over the MySQL C API
 *
 * Features: TRANSACTIONS, SAVEPOINTS, ISOLATION_LEVELS,
 * PREPARED_STATEMENTS, SCHEMA_INTROSPECTION, JSON_SUPPORT, REPLICATION,
 * ACID, narrowed by the database's [features] switches.
 *
 * Auto-reconnect stays off: a silent reconnect would drop an open
 * transaction, so a lost server surfaces as CONNECTION_FAILED and the pool
 * discards the connection.
 */
class MysqlEngine : public IDbEngine {
public:
    // A health probe slower than this reports DEGRADED
    static constexpr std::chrono::milliseconds kSlowProbe{1000};

    explicit MysqlEngine(const DatabaseConfig& config);

    [[nodiscard]] DatabaseType type() const override { return DatabaseType::MYSQL; }

    [[nodiscard]] Result<std::unique_ptr<DbConnection>> connect(
        const ConnectionConfig& config) override;

    [[nodiscard]] HealthStatus health_check() override;

    [[nodiscard]] FeatureSet supported_features() const override { return features_; }

    [[nodiscard]] Result<void> validate_config(const DatabaseConfig& config) const override;

    [[nodiscard]] Result<std::string> version() override;

private:
    DatabaseConfig config_;
    FeatureSet features_;
};

} // namespace unidb
