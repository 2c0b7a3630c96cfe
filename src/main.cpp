#include "config/config_loader.hpp"
#include "core/request_counters.hpp"
#include "core/utils.hpp"
#include "service/database_service.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <string>

using namespace unidb;
using namespace std::string_literals;

namespace {

// Used when no config file is given: one in-memory key-value database
CoreConfig default_config() {
    CoreConfig config;
    DatabaseConfig db;
    db.name = "memory";
    db.type = DatabaseType::MEMORY_KV;
    db.pool.min_connections = 1;
    db.pool.max_connections = 4;
    config.databases.push_back(std::move(db));
    return config;
}

std::string cell_text(const Value& v) {
    if (v.is_null()) return "NULL";
    auto text = v.to_text();
    return text.is_ok() ? text.value() : std::format("<{}>", value_kind_to_string(v.kind()));
}

void print_result(const QueryResult& result) {
    std::string header;
    for (const auto& col : result.columns) {
        if (!header.empty()) header += " | ";
        header += col.name;
    }
    std::cout << header << '\n';
    for (const auto& row : result.rows) {
        std::string line;
        for (const auto& cell : row) {
            if (!line.empty()) line += " | ";
            line += cell_text(cell);
        }
        std::cout << line << '\n';
    }
    std::cout << std::format("({} rows, {}us)\n", result.row_count(), result.execution_time.count());
}

void run_key_value_demo(DatabaseService& service) {
    if (auto set = service.execute_command("SET greeting hello world"); set.is_error()) {
        utils::log::error(std::format("SET failed: {}", set.error_message()));
        return;
    }

    auto batch = service.execute_batch({
        {"SET user:1 ?", {Value("alice")}},
        {"SET user:2 ?", {Value("bob")}},
        {"DEL greeting", {}},
    });
    if (batch.is_error()) {
        utils::log::error(std::format("Batch failed: {}", batch.error_message()));
        return;
    }
    std::cout << std::format("Batch applied {} commands\n", batch->size());

    if (auto keys = service.execute_query("KEYS user:*"); keys.is_ok()) {
        print_result(keys.value());
    } else {
        utils::log::error(std::format("KEYS failed: {}", keys.error_message()));
    }

    if (auto get = service.execute_query("GET ?", {Value("user:1")}); get.is_ok()) {
        print_result(get.value());
    } else {
        utils::log::error(std::format("GET failed: {}", get.error_message()));
    }

    // Savepoints and transactions are not offered by this engine
    auto tx = service.begin_transaction();
    std::cout << std::format("begin_transaction: {}\n",
        tx.is_ok() ? "ok"s : std::string(error_code_to_string(tx.error_code())));
}

void run_sql_demo(DatabaseService& service) {
    if (auto one = service.execute_query("SELECT 1 AS one"); one.is_ok()) {
        print_result(one.value());
    } else {
        utils::log::error(std::format("SELECT failed: {}", one.error_message()));
    }

    auto schema = service.get_schema();
    if (schema.is_ok()) {
        std::cout << std::format("Schema '{}': {} tables, {} views\n",
            schema->database_name, schema->tables.size(), schema->views.size());
    } else {
        utils::log::warn(std::format("Schema unavailable: {}", schema.error_message()));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CoreConfig config;
    if (argc > 1) {
        const std::string config_file = argv[1];
        utils::log::info(std::format("Loading configuration from {}", config_file));
        auto loaded = ConfigLoader::load_from_file(config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return EXIT_FAILURE;
        }
        config = std::move(loaded.config);
    } else {
        utils::log::info("No config file given, using an in-memory key-value database");
        config = default_config();
    }

    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    auto created = DatabaseService::from_config(config);
    if (created.is_error()) {
        utils::log::error(std::format("Startup failed: {}", created.error_message()));
        return EXIT_FAILURE;
    }
    auto& service = *created.value();

    for (const auto& [name, health] : service.health_check_all()) {
        std::cout << std::format("{}: {} ({}ms){}\n", name,
            health_state_to_string(health.state), health.response_time.count(),
            health.error_message ? " - " + *health.error_message : "");
    }

    const auto active = service.active_database();
    if (!active) {
        utils::log::error("No database configured");
        return EXIT_FAILURE;
    }
    std::cout << std::format("Active database: {}\n", *active);

    const auto* db = [&]() -> const DatabaseConfig* {
        for (const auto& d : config.databases) {
            if (d.name == *active) return &d;
        }
        return nullptr;
    }();

    if (db && db->type == DatabaseType::MEMORY_KV) {
        run_key_value_demo(service);
    } else {
        run_sql_demo(service);
    }

    const auto breaker = service.safety()->circuit_breaker()->get_stats();
    std::cout << std::format("Circuit: {}, operations: {} ({} failed), uptime {}ms\n",
        circuit_state_to_string(breaker.state),
        RequestCounters::total_operations(),
        RequestCounters::failed_operations(),
        RequestCounters::uptime().count());

    return EXIT_SUCCESS;
}
