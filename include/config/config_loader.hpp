#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace unidb {

/**
 * @brief Loads CoreConfig from TOML
 *
 * Layout:
 *   [logging]            level
 *   [safety]             *_timeout_ms, max_active_operations,
 *                        maintenance_interval_ms
 *   [circuit_breaker]    failure_threshold, success_threshold,
 *                        recovery_timeout_ms
 *   active_database = "name"
 *   [[databases]]        name, type
 *     [databases.connection]  host, port, database, username, password,
 *                             ssl_mode, connect_timeout_ms, [options]
 *     [databases.pool]        min/max_connections, connection_timeout_ms,
 *                             idle_timeout_ms, max_lifetime_ms
 *     [databases.security]    enabled, max_query_length, allowed_operations
 *     [databases.features]    enable_transactions, enable_prepared_statements,
 *                             enable_schema_introspection, query_timeout_ms
 *
 * ${VAR} in any string value is replaced by the environment variable (empty
 * if unset). Missing keys keep their defaults. Every validation problem is
 * reported at once.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        CoreConfig config;

        static LoadResult ok(CoreConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief All problems found in config, empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const CoreConfig& config);

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static SafetySettings extract_safety(const toml::table& root);
    static CircuitBreakerSettings extract_circuit_breaker(const toml::table& root);
    static std::vector<DatabaseConfig> extract_databases(const toml::table& root,
                                                         std::vector<std::string>& errors);

    static LoadResult extract_and_validate(const toml::table& root);
};

} // namespace unidb
