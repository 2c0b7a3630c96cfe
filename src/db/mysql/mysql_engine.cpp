#include "db/mysql/mysql_engine.hpp"
#include "db/mysql/mysql_connection.hpp"
#include "core/utils.hpp"
#include <format>
#include <mutex>

namespace unidb {

namespace {

// mysql_init() initializes the library lazily, which is not thread-safe
void ensure_library_initialized() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (mysql_library_init(0, nullptr, nullptr) != 0) {
            utils::log::error("mysql_library_init failed");
        }
    });
}

} // namespace

MysqlEngine::MysqlEngine(const DatabaseConfig& config)
    : config_(config),
      features_(apply_feature_config({
          DatabaseFeature::TRANSACTIONS,
          DatabaseFeature::SAVEPOINTS,
          DatabaseFeature::ISOLATION_LEVELS,
          DatabaseFeature::PREPARED_STATEMENTS,
          DatabaseFeature::SCHEMA_INTROSPECTION,
          DatabaseFeature::JSON_SUPPORT,
          DatabaseFeature::REPLICATION,
          DatabaseFeature::ACID}, config.features)) {
    ensure_library_initialized();
    if (config_.connection.ssl_mode) {
        utils::log::warn(std::format(
            "database '{}': ssl_mode is not applied by the mysql engine", config_.name));
    }
}

Result<std::unique_ptr<DbConnection>> MysqlEngine::connect(const ConnectionConfig& config) {
    using R = Result<std::unique_ptr<DbConnection>>;

    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        utils::log::error("mysql_init failed");
        return R::error(ErrorCode::CONNECTION_FAILED, "mysql_init failed");
    }

    // Whole seconds, at least one
    const auto seconds = (config.connect_timeout.count() + 999) / 1000;
    unsigned int timeout = static_cast<unsigned int>(seconds > 0 ? seconds : 1);
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);

    // Set character set to UTF-8
    mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");

    MYSQL* result = mysql_real_connect(
        conn,
        config.host.c_str(),
        config.username.c_str(),
        config.password.c_str(),
        config.database.empty() ? nullptr : config.database.c_str(),
        config.port,  // 0 = default 3306
        nullptr,      // unix socket
        0             // client flags
    );

    if (!result) {
        std::string message = mysql_error(conn);
        mysql_close(conn);
        return R::error(ErrorCode::CONNECTION_FAILED,
            std::format("mysql connect to {}:{} failed: {}", config.host, config.port, message));
    }

    return R::ok(std::make_unique<MysqlConnection>(conn, features_, config));
}

HealthStatus MysqlEngine::health_check() {
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

Result<void> MysqlEngine::validate_config(const DatabaseConfig& config) const {
    if (config.type != DatabaseType::MYSQL) {
        return Result<void>::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("database '{}': type {} given to the mysql engine",
                config.name, database_type_to_string(config.type)));
    }
    if (config.connection.host.empty()) {
        return Result<void>::error(ErrorCode::CONFIGURATION_ERROR,
            std::format("database '{}': connection.host is required", config.name));
    }
    return Result<void>::ok();
}

Result<std::string> MysqlEngine::version() {
    auto conn = connect(config_.connection);
    if (conn.is_error()) {
        return conn.as_error<std::string>();
    }

    auto result = conn.value()->query("SELECT VERSION()");
    conn.value()->close();
    if (result.is_error()) {
        return result.as_error<std::string>();
    }
    if (result->rows.empty() || result->rows[0].empty()) {
        return Result<std::string>::error(ErrorCode::QUERY_FAILED, "empty VERSION()");
    }
    return result->rows[0][0].to_text();
}

} // namespace unidb
