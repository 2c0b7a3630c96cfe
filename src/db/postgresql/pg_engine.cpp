#include "db/postgresql/pg_engine.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include <format>

namespace unidb {

PgEngine::PgEngine(const DatabaseConfig& config)
    : config_(config),
      features_(apply_feature_config({
          DatabaseFeature::TRANSACTIONS,
          DatabaseFeature::SAVEPOINTS,
          DatabaseFeature::ISOLATION_LEVELS,
          DatabaseFeature::PREPARED_STATEMENTS,
          DatabaseFeature::SCHEMA_INTROSPECTION,
          DatabaseFeature::JSON_SUPPORT,
          DatabaseFeature::REPLICATION,
          DatabaseFeature::ACID}, config.features)) {}

Result<std::unique_ptr<DbConnection>> PgEngine::connect(const ConnectionConfig& config) {
    using R = Result<std::unique_ptr<DbConnection>>;

    PGconn* conn = PQconnectdb(build_pg_conninfo(config).c_str());
    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return R::error(ErrorCode::CONNECTION_FAILED, "failed to allocate PGconn");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string message = utils::trim(PQerrorMessage(conn));
        PQfinish(conn);
        return R::error(ErrorCode::CONNECTION_FAILED,
            std::format("postgresql connect to {}:{} failed: {}",
                config.host, config.port, message));
    }

    return R::ok(std::make_unique<PgConnection>(conn, features_));
}

HealthStatus PgEngine::health_check() {
    HealthStatus status;
    status.last_check = std::chrono::system_clock::now();
    utils::Timer timer;

    auto conn = connect(config_.connection);
    if (conn.is_ok()) {
        if (auto ping = conn.value()->ping(); ping.is_error()) {
            status.state = HealthState::CRITICAL;
            status.error_message = ping.error_message();
        }
        conn.value()->close();
    } else {
        status.state = HealthState::CRITICAL;
        status.error_message = conn.error_message();
    }

    status.response_time = timer.elapsed_ms();
    if (status.state == HealthState::HEALTHY && status.response_time > kSlowProbe) {
        status.state = HealthState::DEGRADED;
        status.error_message = std::format("slow health probe: {}ms", status.response_time.count());
    }
    return status;
}

Result<void> PgEngine::validate_config(const DatabaseConfig& config) const {
    if (config.type != DatabaseType::POSTGRESQL) {
        return Result<void>::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("database '{}': type {} given to the postgresql engine",
                config.name, database_type_to_string(config.type)));
    }
    if (config.connection.host.empty()) {
        return Result<void>::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("database '{}': connection.host is required", config.name));
    }
    return Result<void>::ok();
}

Result<std::string> PgEngine::version() {
    auto conn = connect(config_.connection);
    if (conn.is_error()) {
        return conn.as_error<std::string>();
    }

    auto result = conn.value()->query("SHOW server_version");
    conn.value()->close();
    if (result.is_error()) {
        return result.as_error<std::string>();
    }
    if (result->rows.empty() || result->rows[0].empty()) {
        return Result<std::string>::error(ErrorCode::QUERY_FAILED, "empty server_version");
    }
    return result->rows[0][0].to_text();
}

} // namespace unidb
