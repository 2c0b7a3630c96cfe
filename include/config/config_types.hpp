#pragma once

#include "core/database_type.hpp"
#include "core/types.hpp"
#include "safety/timeout_config.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace unidb {

// ============================================================================
// Per-database configuration
// ============================================================================

struct ConnectionConfig {
    std::string host = "localhost";
    uint16_t port = 0;                 // 0 = engine default
    std::string database;
    std::string username;
    std::string password;
    std::optional<std::string> ssl_mode;
    std::chrono::milliseconds connect_timeout{10000};
    std::map<std::string, std::string> options;  // Passed through to the driver
};

struct PoolConfig {
    size_t min_connections = 2;
    size_t max_connections = 10;
    std::chrono::milliseconds connection_timeout{5000};    // Max wait in acquire()
    std::chrono::milliseconds idle_timeout{300000};        // 0 = never expire idle
    std::chrono::milliseconds max_lifetime{3600000};       // 0 = unlimited
};

struct SecurityConfig {
    bool enabled = true;
    size_t max_query_length = 10000;
    std::vector<StatementType> allowed_operations = {
        StatementType::SELECT, StatementType::INSERT,
        StatementType::UPDATE, StatementType::DELETE};
};

struct FeatureConfig {
    bool enable_transactions = true;
    bool enable_prepared_statements = true;
    bool enable_schema_introspection = true;
    std::chrono::milliseconds query_timeout{30000};
};

struct DatabaseConfig {
    std::string name;
    DatabaseType type = DatabaseType::POSTGRESQL;
    ConnectionConfig connection;
    PoolConfig pool;
    SecurityConfig security;
    FeatureConfig features;
};

/**
 * @brief Narrow an engine's native features by what the config switches off
 *
 * Disabling transactions also removes savepoints and isolation levels.
 */
[[nodiscard]] inline FeatureSet apply_feature_config(FeatureSet native, const FeatureConfig& cfg) {
    if (!cfg.enable_transactions) {
        native.erase(DatabaseFeature::TRANSACTIONS);
        native.erase(DatabaseFeature::SAVEPOINTS);
        native.erase(DatabaseFeature::ISOLATION_LEVELS);
    }
    if (!cfg.enable_prepared_statements) {
        native.erase(DatabaseFeature::PREPARED_STATEMENTS);
    }
    if (!cfg.enable_schema_introspection) {
        native.erase(DatabaseFeature::SCHEMA_INTROSPECTION);
    }
    return native;
}

// ============================================================================
// Process-wide configuration
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct SafetySettings {
    TimeoutConfig timeouts;
    size_t max_active_operations = 100;
    std::chrono::milliseconds maintenance_interval{30000};  // Pool eviction pass; 0 = off
};

struct CircuitBreakerSettings {
    uint32_t failure_threshold = 5;
    uint32_t success_threshold = 3;
    std::chrono::milliseconds recovery_timeout{60000};
};

struct CoreConfig {
    LoggingConfig logging;
    SafetySettings safety;
    CircuitBreakerSettings circuit_breaker;
    std::vector<DatabaseConfig> databases;
    std::optional<std::string> active_database;  // Defaults to the first entry
};

} // namespace unidb
