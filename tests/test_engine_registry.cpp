#include <catch2/catch_test_macros.hpp>
#include "db/engine_registry.hpp"
#include "db/memory/memory_kv_engine.hpp"
#include "db/mysql/mysql_engine.hpp"
#include "db/postgresql/pg_engine.hpp"

using namespace unidb;

TEST_CASE("parse_database_type: names and aliases", "[engine_registry]") {
    CHECK(parse_database_type("postgresql") == DatabaseType::POSTGRESQL);
    CHECK(parse_database_type("pg") == DatabaseType::POSTGRESQL);
    CHECK(parse_database_type("Postgres") == DatabaseType::POSTGRESQL);
    CHECK(parse_database_type("mariadb") == DatabaseType::MYSQL);
    CHECK(parse_database_type("MYSQL") == DatabaseType::MYSQL);
    CHECK(parse_database_type("kv") == DatabaseType::MEMORY_KV);
    CHECK(parse_database_type("memory") == DatabaseType::MEMORY_KV);
    CHECK_FALSE(parse_database_type("oracle").has_value());
    CHECK(database_type_to_string(DatabaseType::MEMORY_KV) == "memory_kv");
}

TEST_CASE("EngineRegistry: built-in engines are registered explicitly", "[engine_registry]") {
    auto& registry = EngineRegistry::instance();
    register_builtin_engines(registry);
    // Idempotent
    register_builtin_engines(registry);

    CHECK(registry.has_engine(DatabaseType::POSTGRESQL));
    CHECK(registry.has_engine(DatabaseType::MYSQL));
    CHECK(registry.has_engine(DatabaseType::MEMORY_KV));
}

TEST_CASE("EngineRegistry: creates the engine matching the config type", "[engine_registry]") {
    register_builtin_engines();

    DatabaseConfig config;
    config.name = "cache";
    config.type = DatabaseType::MEMORY_KV;

    auto engine = EngineRegistry::instance().create(config);
    REQUIRE(engine.is_ok());
    CHECK(engine.value()->type() == DatabaseType::MEMORY_KV);
    CHECK(dynamic_cast<MemoryKvEngine*>(engine.value().get()) != nullptr);
}

TEST_CASE("EngineRegistry: engine config validation is applied", "[engine_registry]") {
    register_builtin_engines();

    DatabaseConfig pg;
    pg.name = "pg";
    pg.type = DatabaseType::POSTGRESQL;
    pg.connection.host = "";
    auto no_host = EngineRegistry::instance().create(pg);
    CHECK(no_host.error_code() == ErrorCode::CONFIGURATION_ERROR);
    CHECK(no_host.error_message().find("connection.host is required") != std::string::npos);

    DatabaseConfig mysql;
    mysql.name = "my";
    mysql.type = DatabaseType::MYSQL;
    mysql.connection.host = "";
    CHECK(EngineRegistry::instance().create(mysql).error_code() == ErrorCode::CONFIGURATION_ERROR);
}

TEST_CASE("EngineRegistry: factories can be replaced", "[engine_registry]") {
    auto& registry = EngineRegistry::instance();
    int calls = 0;
    registry.register_engine(DatabaseType::MEMORY_KV, [&calls](const DatabaseConfig& c) {
        ++calls;
        return std::make_shared<MemoryKvEngine>(c);
    });

    DatabaseConfig config;
    config.name = "custom";
    config.type = DatabaseType::MEMORY_KV;
    CHECK(registry.create(config).is_ok());
    CHECK(calls == 1);

    // Restore the built-in factory for later tests
    register_builtin_engines(registry);
}

TEST_CASE("PgEngine: features narrowed by config", "[engine_registry][postgresql]") {
    DatabaseConfig config;
    config.name = "pg";
    PgEngine full(config);
    CHECK(full.supported_features().contains(DatabaseFeature::SAVEPOINTS));
    CHECK(full.supported_features().contains(DatabaseFeature::PREPARED_STATEMENTS));

    config.features.enable_transactions = false;
    config.features.enable_prepared_statements = false;
    PgEngine narrowed(config);
    CHECK_FALSE(narrowed.supported_features().contains(DatabaseFeature::TRANSACTIONS));
    CHECK_FALSE(narrowed.supported_features().contains(DatabaseFeature::SAVEPOINTS));
    CHECK_FALSE(narrowed.supported_features().contains(DatabaseFeature::ISOLATION_LEVELS));
    CHECK_FALSE(narrowed.supported_features().contains(DatabaseFeature::PREPARED_STATEMENTS));
    CHECK(narrowed.supported_features().contains(DatabaseFeature::SCHEMA_INTROSPECTION));
}

TEST_CASE("MysqlEngine: advertises SQL capabilities", "[engine_registry][mysql]") {
    DatabaseConfig config;
    config.name = "my";
    config.type = DatabaseType::MYSQL;
    MysqlEngine engine(config);

    CHECK(engine.type() == DatabaseType::MYSQL);
    CHECK(engine.supported_features().contains(DatabaseFeature::TRANSACTIONS));
    CHECK(engine.supported_features().contains(DatabaseFeature::SAVEPOINTS));
    CHECK(engine.validate_config(config).is_ok());
}
