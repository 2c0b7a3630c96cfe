#pragma once

#include "db/idb_engine.hpp"
#include <chrono>

namespace unidb {

/**
 * @brief PostgreSQL engine over libpq
 *
 * Features: TRANSACTIONS, SAVEPOINTS, ISOLATION_LEVELS,
 * PREPARED_STATEMENTS, SCHEMA_INTROSPECTION, JSON_SUPPORT, REPLICATION,
 * ACID, narrowed by the database's [features] switches.
 *
 * health_check() and version() open a short-lived connection of their own
 * so they never compete with pooled leases.
 */
class PgEngine : public IDbEngine {
public:
    // A health probe slower than this reports DEGRADED
    static constexpr std::chrono::milliseconds kSlowProbe{1000};

    explicit PgEngine(const DatabaseConfig& config);

    [[nodiscard]] DatabaseType type() const override { return DatabaseType::POSTGRESQL; }

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
