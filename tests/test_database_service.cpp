#include <catch2/catch_test_macros.hpp>
#include "core/request_counters.hpp"
#include "db/engine_registry.hpp"
#include "mocks/mock_engine.hpp"
#include "service/database_service.hpp"
#include <thread>

using namespace unidb;
using namespace unidb::testing;

namespace {

const std::string kInsert = "INSERT INTO items VALUES (?)";

std::shared_ptr<SafetyManager> test_safety(uint32_t failure_threshold = 100) {
    SafetyManager::Config cfg;
    cfg.timeouts.pool_timeout = std::chrono::milliseconds(1000);
    cfg.breaker.failure_threshold = failure_threshold;
    cfg.breaker.recovery_timeout = std::chrono::milliseconds(60000);
    return std::make_shared<SafetyManager>("service-test", cfg);
}

class RecordingValidator : public IQueryValidator {
public:
    explicit RecordingValidator(ValidationResult result) : result_(std::move(result)) {}

    ValidationResult validate(std::string_view statement, const CallerContext& context) override {
        std::lock_guard lock(mutex_);
        statements.emplace_back(statement);
        last_user = context.user_id;
        return result_;
    }

    std::vector<std::string> statements;
    std::string last_user;

private:
    std::mutex mutex_;
    ValidationResult result_;
};

struct ServiceFixture {
    explicit ServiceFixture(FeatureSet features = kSqlFeatures,
                            std::shared_ptr<IQueryValidator> validator = nullptr,
                            std::shared_ptr<SafetyManager> safety = test_safety())
        : engine(std::make_shared<MockEngine>(features)),
          service(std::move(safety), std::move(validator)) {
        REQUIRE(service.add_database(mock_config("main", 0, 2), engine).is_ok());
    }

    MockBackend& backend() { return *engine->backend(); }
    PoolStats stats() { return service.pool_stats("main").value(); }

    std::shared_ptr<MockEngine> engine;
    DatabaseService service;
};

} // namespace

// ============================================================================
// Databases
// ============================================================================

TEST_CASE("DatabaseService: first database becomes active", "[service]") {
    ServiceFixture f;

    CHECK(f.service.active_database() == "main");
    CHECK(f.service.database_names() == std::vector<std::string>{"main"});
}

TEST_CASE("DatabaseService: duplicate database names are rejected", "[service]") {
    ServiceFixture f;

    auto dup = f.service.add_database(mock_config("main"), std::make_shared<MockEngine>());
    CHECK(dup.error_code() == ErrorCode::CONFIGURATION_ERROR);
}

TEST_CASE("DatabaseService: switch_engine retargets later calls", "[service]") {
    ServiceFixture f;
    auto other = std::make_shared<MockEngine>();
    REQUIRE(f.service.add_database(mock_config("other"), other).is_ok());
    CHECK(f.service.active_database() == "main");

    const auto generation = RequestCounters::engine_generation();
    REQUIRE(f.service.switch_engine("other").is_ok());
    CHECK(f.service.active_database() == "other");
    CHECK(RequestCounters::engine_generation() == generation + 1);

    REQUIRE(f.service.execute_command(kInsert, {Value(5)}).is_ok());
    CHECK(other->backend()->items() == std::vector<int64_t>{5});
    CHECK(f.backend().items().empty());

    auto unknown = f.service.switch_engine("missing");
    CHECK(unknown.error_code() == ErrorCode::CONFIGURATION_ERROR);
    CHECK(unknown.error_message() == "unknown database: missing");
    CHECK(f.service.active_database() == "other");
}

TEST_CASE("DatabaseService: removing the active database leaves none active", "[service]") {
    ServiceFixture f;

    CHECK(f.service.remove_database("main"));
    CHECK_FALSE(f.service.remove_database("main"));
    CHECK_FALSE(f.service.active_database().has_value());

    auto result = f.service.execute_query("SELECT v FROM items");
    CHECK(result.error_code() == ErrorCode::CONFIGURATION_ERROR);
    CHECK(result.error_message() == "no active database");
}

// ============================================================================
// Pre-flight validation
// ============================================================================

TEST_CASE("DatabaseService: denied statement never touches the pool", "[service][query_validator]") {
    ServiceFixture f;

    auto result = f.service.execute_command("DROP TABLE items");
    CHECK(result.error_code() == ErrorCode::SECURITY_VIOLATION);
    CHECK(result.error_message() == "statement denied: statement type 'drop' is not allowed");

    CHECK(f.stats().total_acquires == 0);
    CHECK(f.backend().connects == 0);
}

TEST_CASE("DatabaseService: external validator sees the caller", "[service][query_validator]") {
    auto validator = std::make_shared<RecordingValidator>(ValidationResult::denied("maintenance window"));
    ServiceFixture f(kSqlFeatures, validator);

    CallerContext ctx;
    ctx.user_id = "alice";
    auto result = f.service.execute_query("SELECT v FROM items", {}, ctx);

    CHECK(result.error_code() == ErrorCode::SECURITY_VIOLATION);
    CHECK(result.error_message() == "statement denied: maintenance window");
    CHECK(validator->last_user == "alice");
    CHECK(f.backend().connects == 0);
}

TEST_CASE("DatabaseService: local guard runs before the external validator", "[service][query_validator]") {
    auto validator = std::make_shared<RecordingValidator>(ValidationResult::approved());
    ServiceFixture f(kSqlFeatures, validator);

    CHECK(f.service.execute_command("DROP TABLE items").error_code() == ErrorCode::SECURITY_VIOLATION);
    CHECK(validator->statements.empty());

    CHECK(f.service.execute_query("SELECT v FROM items").is_ok());
    CHECK(validator->statements == std::vector<std::string>{"SELECT v FROM items"});
}

TEST_CASE("DatabaseService: warnings do not block the call", "[service][query_validator]") {
    auto validator = std::make_shared<RecordingValidator>(ValidationResult::warning("full scan"));
    ServiceFixture f(kSqlFeatures, validator);

    CHECK(f.service.execute_query("SELECT v FROM items").is_ok());
}

// ============================================================================
// Statements
// ============================================================================

TEST_CASE("DatabaseService: query and command round trip", "[service]") {
    ServiceFixture f;

    auto inserted = f.service.execute_command(kInsert, {Value(1)});
    REQUIRE(inserted.is_ok());
    CHECK(inserted->rows_affected == 1);

    auto rows = f.service.execute_query("SELECT v FROM items");
    REQUIRE(rows.is_ok());
    REQUIRE(rows->row_count() == 1);
    CHECK(rows->rows[0][0] == Value(1));

    // Each call hands its connection back before returning
    const auto stats = f.stats();
    CHECK(stats.total_acquires == 2);
    CHECK(stats.active_connections == 0);
    CHECK(stats.idle_connections == 1);
}

TEST_CASE("DatabaseService: schema introspection", "[service]") {
    ServiceFixture f;

    auto schema = f.service.get_schema();
    REQUIRE(schema.is_ok());
    CHECK(schema->find_table("items") != nullptr);

    ServiceFixture coarse(kCoarseFeatures);
    CHECK(coarse.service.get_schema().error_code() == ErrorCode::UNSUPPORTED_OPERATION);
}

TEST_CASE("DatabaseService: query failure keeps the connection", "[service][pool]") {
    ServiceFixture f;
    f.backend().fail_code = ErrorCode::QUERY_FAILED;

    CHECK(f.service.execute_query("SELECT v FROM items").error_code() == ErrorCode::QUERY_FAILED);
    CHECK(f.stats().connections_discarded == 0);
    CHECK(f.stats().idle_connections == 1);
}

TEST_CASE("DatabaseService: connection failure discards the connection", "[service][pool]") {
    ServiceFixture f;
    f.backend().fail_code = ErrorCode::CONNECTION_FAILED;

    CHECK(f.service.execute_query("SELECT v FROM items").error_code() == ErrorCode::CONNECTION_FAILED);
    CHECK(f.stats().connections_discarded == 1);
    CHECK(f.stats().total_connections == 0);
}

TEST_CASE("DatabaseService: timed-out call marks its lease broken", "[service][timeout]") {
    auto engine = std::make_shared<MockEngine>();
    DatabaseService service(test_safety());
    auto config = mock_config("slow", 0, 2);
    config.features.query_timeout = std::chrono::milliseconds(30);
    REQUIRE(service.add_database(config, engine).is_ok());

    engine->backend()->delay_ms = 300;
    auto result = service.execute_query("SELECT v FROM items");
    CHECK(result.error_code() == ErrorCode::TIMEOUT);

    // The abandoned worker returns the lease once the backend call ends
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    const auto stats = service.pool_stats("slow").value();
    CHECK(stats.connections_discarded == 1);
    CHECK(stats.total_connections == 0);
    CHECK(engine->backend()->live == 0);
}

TEST_CASE("DatabaseService: open circuit rejects before the backend", "[service][circuit_breaker]") {
    ServiceFixture f(kSqlFeatures, nullptr, test_safety(2));
    f.backend().fail_code = ErrorCode::CONNECTION_FAILED;

    (void)f.service.execute_query("SELECT v FROM items");
    (void)f.service.execute_query("SELECT v FROM items");
    REQUIRE(f.service.safety()->circuit_breaker()->get_state() == CircuitState::OPEN);

    f.backend().fail_code = ErrorCode::NONE;
    const int executed = f.backend().statements_executed;
    CHECK(f.service.execute_query("SELECT v FROM items").error_code() == ErrorCode::CIRCUIT_OPEN);
    CHECK(f.backend().statements_executed == executed);
}

TEST_CASE("DatabaseService: pool exhaustion surfaces as TIMEOUT", "[service][pool]") {
    auto engine = std::make_shared<MockEngine>();
    DatabaseService service(test_safety());
    auto config = mock_config("tiny", 0, 1);
    config.pool.connection_timeout = std::chrono::milliseconds(20);
    REQUIRE(service.add_database(config, engine).is_ok());

    auto held = service.begin_transaction();
    REQUIRE(held.is_ok());

    CHECK(service.execute_query("SELECT v FROM items").error_code() == ErrorCode::TIMEOUT);

    REQUIRE(held.value()->commit().is_ok());
    CHECK(service.execute_query("SELECT v FROM items").is_ok());
}

TEST_CASE("DatabaseService: pool stats for unknown database", "[service]") {
    ServiceFixture f;
    CHECK(f.service.pool_stats("missing").error_code() == ErrorCode::POOL_ERROR);
}

TEST_CASE("DatabaseService: health of every database", "[service][health]") {
    ServiceFixture f;
    auto down = std::make_shared<MockEngine>();
    down->backend()->health = HealthState::CRITICAL;
    REQUIRE(f.service.add_database(mock_config("down"), down).is_ok());

    const auto health = f.service.health_check_all();
    REQUIRE(health.size() == 2);
    CHECK(health[0].first == "down");
    CHECK(health[0].second.state == HealthState::CRITICAL);
    CHECK(health[1].first == "main");
    CHECK(health[1].second.is_healthy());
}

// ============================================================================
// Transactions
// ============================================================================

TEST_CASE("DatabaseService: savepoint rollback keeps only earlier work", "[service][transaction]") {
    ServiceFixture f;

    auto session = f.service.begin_transaction();
    REQUIRE(session.is_ok());
    auto& tx = *session.value();

    REQUIRE(tx.execute(kInsert, {Value(1)}).is_ok());
    REQUIRE(tx.savepoint("s1").is_ok());
    REQUIRE(tx.execute(kInsert, {Value(2)}).is_ok());
    REQUIRE(tx.rollback_to_savepoint("s1").is_ok());
    CHECK(tx.info().savepoints.empty());
    REQUIRE(tx.commit().is_ok());

    CHECK(f.backend().items() == std::vector<int64_t>{1});
    CHECK_FALSE(tx.is_active());
}

TEST_CASE("DatabaseService: finished session returns its connection at once", "[service][transaction]") {
    ServiceFixture f;

    auto session = f.service.begin_transaction();
    REQUIRE(session.is_ok());
    CHECK(f.stats().active_connections == 1);

    REQUIRE(session.value()->rollback().is_ok());
    CHECK(f.stats().active_connections == 0);

    auto again = session.value()->commit();
    CHECK(again.error_code() == ErrorCode::VALIDATION_ERROR);
    CHECK(again.error_message() == "transaction is not active");
}

TEST_CASE("DatabaseService: dropped session rolls back and returns the connection", "[service][transaction]") {
    ServiceFixture f;
    {
        auto session = f.service.begin_transaction();
        REQUIRE(session.is_ok());
        REQUIRE(session.value()->execute(kInsert, {Value(9)}).is_ok());
    }

    CHECK(f.backend().driver_rollbacks == 1);
    CHECK(f.backend().items().empty());
    CHECK(f.stats().active_connections == 0);
    CHECK(f.stats().idle_connections == 1);
}

TEST_CASE("DatabaseService: session statements are pre-flight checked", "[service][transaction]") {
    ServiceFixture f;

    auto session = f.service.begin_transaction();
    REQUIRE(session.is_ok());
    CHECK(session.value()->execute("DROP TABLE items").error_code() == ErrorCode::SECURITY_VIOLATION);
    CHECK(session.value()->is_active());
}

TEST_CASE("DatabaseService: broken connection abandons the session", "[service][transaction]") {
    ServiceFixture f;

    auto session = f.service.begin_transaction();
    REQUIRE(session.is_ok());
    auto& tx = *session.value();

    f.backend().fail_code = ErrorCode::CONNECTION_FAILED;
    CHECK(tx.execute(kInsert, {Value(1)}).error_code() == ErrorCode::CONNECTION_FAILED);
    CHECK(tx.is_abandoned());
    CHECK_FALSE(tx.is_active());

    f.backend().fail_code = ErrorCode::NONE;
    auto after = tx.commit();
    CHECK(after.error_code() == ErrorCode::TRANSACTION_FAILED);
    CHECK(after.error_message().find("abandoned") != std::string::npos);

    session.value().reset();
    CHECK(f.stats().connections_discarded == 1);
    CHECK(f.backend().items().empty());
}

TEST_CASE("DatabaseService: isolation level is passed through", "[service][transaction]") {
    ServiceFixture f;

    auto session = f.service.begin_transaction(IsolationLevel::SERIALIZABLE, true);
    REQUIRE(session.is_ok());
    CHECK(session.value()->info().isolation_level == IsolationLevel::SERIALIZABLE);
    CHECK(session.value()->info().read_only);
    CHECK(session.value()->execute(kInsert, {Value(1)}).error_code() == ErrorCode::VALIDATION_ERROR);
}

TEST_CASE("DatabaseService: savepoints unsupported on coarse engines", "[service][transaction][capability]") {
    ServiceFixture f(kCoarseFeatures);

    CHECK(f.service.begin_transaction(IsolationLevel::SERIALIZABLE).error_code() ==
          ErrorCode::UNSUPPORTED_OPERATION);

    auto session = f.service.begin_transaction();
    REQUIRE(session.is_ok());
    CHECK(session.value()->savepoint("s1").error_code() == ErrorCode::UNSUPPORTED_OPERATION);
    CHECK(session.value()->is_active());
    CHECK(f.backend().driver_savepoint_calls == 0);
}

TEST_CASE("DatabaseService: failed begin returns the connection", "[service][transaction]") {
    ServiceFixture f(FeatureSet{DatabaseFeature::BATCHED_COMMANDS});

    CHECK(f.service.begin_transaction().error_code() == ErrorCode::UNSUPPORTED_OPERATION);
    CHECK(f.stats().active_connections == 0);
    CHECK(f.stats().connections_discarded == 0);
}

// ============================================================================
// Batches and the in-memory engine
// ============================================================================

TEST_CASE("DatabaseService: batches on the in-memory key-value engine", "[service][memory_kv]") {
    register_builtin_engines();
    DatabaseService service(test_safety());

    DatabaseConfig config;
    config.name = "kv";
    config.type = DatabaseType::MEMORY_KV;
    config.pool.min_connections = 1;
    config.pool.max_connections = 2;
    REQUIRE(service.add_database(config).is_ok());

    auto results = service.execute_batch({
        {"SET user:1 ?", {Value("alice")}},
        {"SET user:2 bob", {}},
        {"DEL user:3", {}},
    });
    REQUIRE(results.is_ok());
    CHECK(results->size() == 3);

    auto keys = service.execute_query("KEYS user:*");
    REQUIRE(keys.is_ok());
    CHECK(keys->row_count() == 2);

    auto get = service.execute_query("GET ?", {Value("user:1")});
    REQUIRE(get.is_ok());
    CHECK(get->rows[0][1] == Value("alice"));

    CHECK(service.begin_transaction().error_code() == ErrorCode::UNSUPPORTED_OPERATION);
}

TEST_CASE("DatabaseService: one denied command rejects the whole batch", "[service][memory_kv]") {
    register_builtin_engines();
    DatabaseService service(test_safety());

    DatabaseConfig config;
    config.name = "kv";
    config.type = DatabaseType::MEMORY_KV;
    config.pool.min_connections = 0;
    REQUIRE(service.add_database(config).is_ok());

    auto results = service.execute_batch({
        {"SET a 1", {}},
        {"FLUSHALL", {}},
    });
    CHECK(results.error_code() == ErrorCode::SECURITY_VIOLATION);
    CHECK(service.pool_stats("kv").value().total_acquires == 0);
    CHECK(service.execute_query("EXISTS a")->rows[0][0] == Value(false));
}

TEST_CASE("DatabaseService: batches need the capability", "[service][capability]") {
    ServiceFixture f;

    auto result = f.service.execute_batch({{kInsert, {Value(1)}}});
    CHECK(result.error_code() == ErrorCode::UNSUPPORTED_OPERATION);
    CHECK(f.stats().connections_discarded == 0);
}

TEST_CASE("DatabaseService: batch with mock driver applies atomically", "[service][command_batch]") {
    ServiceFixture f(kCoarseFeatures);

    auto ok = f.service.execute_batch({{kInsert, {Value(1)}}, {kInsert, {Value(2)}}});
    REQUIRE(ok.is_ok());
    CHECK(f.backend().items() == std::vector<int64_t>{1, 2});

    auto failed = f.service.execute_batch({{kInsert, {Value(3)}}, {kInsert, {}}});
    CHECK(failed.error_code() == ErrorCode::QUERY_FAILED);
    CHECK(f.backend().items() == std::vector<int64_t>{1, 2});
}

// ============================================================================
// Construction from config
// ============================================================================

TEST_CASE("DatabaseService: from_config builds every database", "[service][config]") {
    CoreConfig config;
    config.safety.maintenance_interval = std::chrono::milliseconds(0);
    for (const char* name : {"cache", "sessions"}) {
        DatabaseConfig db;
        db.name = name;
        db.type = DatabaseType::MEMORY_KV;
        db.pool.min_connections = 0;
        config.databases.push_back(db);
    }
    config.active_database = "sessions";

    auto service = DatabaseService::from_config(config);
    REQUIRE(service.is_ok());
    CHECK(service.value()->database_names() == std::vector<std::string>{"cache", "sessions"});
    CHECK(service.value()->active_database() == "sessions");
    CHECK(service.value()->execute_command("SET k v").is_ok());
}

TEST_CASE("DatabaseService: from_config rejects an unknown active database", "[service][config]") {
    CoreConfig config;
    DatabaseConfig db;
    db.name = "cache";
    db.type = DatabaseType::MEMORY_KV;
    db.pool.min_connections = 0;
    config.databases.push_back(db);
    config.active_database = "missing";

    auto service = DatabaseService::from_config(config);
    CHECK(service.error_code() == ErrorCode::CONFIGURATION_ERROR);
}
