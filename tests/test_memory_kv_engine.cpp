#include <catch2/catch_test_macros.hpp>
#include "db/memory/memory_kv_engine.hpp"

using namespace unidb;

namespace {

DatabaseConfig kv_config() {
    DatabaseConfig config;
    config.name = "kv";
    config.type = DatabaseType::MEMORY_KV;
    return config;
}

struct KvFixture {
    KvFixture() : engine(kv_config()) {
        auto connected = engine.connect(ConnectionConfig{});
        REQUIRE(connected.is_ok());
        conn = std::move(connected.value());
    }

    MemoryKvEngine engine;
    std::unique_ptr<DbConnection> conn;
};

} // namespace

TEST_CASE("KvCommand: parses verbs case-insensitively", "[memory_kv][parse]") {
    auto get = KvCommand::parse("get user:1", {});
    REQUIRE(get.is_ok());
    CHECK(get->verb == KvCommand::Verb::GET);
    CHECK(get->key == "user:1");
    CHECK_FALSE(get->is_write());

    auto set = KvCommand::parse("SET greeting hello  world", {});
    REQUIRE(set.is_ok());
    CHECK(set->is_write());
    CHECK(set->value == Value("hello world"));
}

TEST_CASE("KvCommand: placeholders take positional parameters", "[memory_kv][parse]") {
    auto set = KvCommand::parse("SET ? ?", {Value("k"), Value(42)});
    REQUIRE(set.is_ok());
    CHECK(set->key == "k");
    CHECK(set->value == Value(42));

    auto wrong = KvCommand::parse("GET ?", {});
    CHECK(wrong.error_code() == ErrorCode::VALIDATION_ERROR);
    CHECK(wrong.error_message() == "expected 1 parameters, got 0");

    CHECK(KvCommand::parse("GET k", {Value(1)}).error_code() == ErrorCode::VALIDATION_ERROR);
}

TEST_CASE("KvCommand: malformed commands", "[memory_kv][parse]") {
    CHECK(KvCommand::parse("", {}).error_code() == ErrorCode::QUERY_FAILED);
    CHECK(KvCommand::parse("INCR k", {}).error_code() == ErrorCode::QUERY_FAILED);
    CHECK(KvCommand::parse("GET", {}).error_code() == ErrorCode::QUERY_FAILED);
    CHECK(KvCommand::parse("GET a b", {}).error_code() == ErrorCode::QUERY_FAILED);
    CHECK(KvCommand::parse("SET k", {}).error_code() == ErrorCode::QUERY_FAILED);
    CHECK(KvCommand::parse("GET ?", {Value("")}).error_code() == ErrorCode::VALIDATION_ERROR);
    CHECK(KvCommand::parse("GET ?", {Value(Binary{1, 2})}).error_code() == ErrorCode::CONVERSION_ERROR);
}

TEST_CASE("MemoryKvEngine: advertises batches but no transactions", "[memory_kv][capability]") {
    MemoryKvEngine engine(kv_config());
    const auto features = engine.supported_features();

    CHECK(features.contains(DatabaseFeature::BATCHED_COMMANDS));
    CHECK_FALSE(features.contains(DatabaseFeature::TRANSACTIONS));
    CHECK_FALSE(features.contains(DatabaseFeature::SAVEPOINTS));
    CHECK_FALSE(features.contains(DatabaseFeature::PREPARED_STATEMENTS));
    CHECK(engine.type() == DatabaseType::MEMORY_KV);
    CHECK(engine.version().value() == MemoryKvEngine::kVersion);
    CHECK(engine.health_check().is_healthy());
}

TEST_CASE("MemoryKvEngine: validate_config checks the type", "[memory_kv]") {
    MemoryKvEngine engine(kv_config());

    CHECK(engine.validate_config(kv_config()).is_ok());
    auto wrong = kv_config();
    wrong.type = DatabaseType::MYSQL;
    CHECK(engine.validate_config(wrong).error_code() == ErrorCode::CONFIGURATION_ERROR);
}

TEST_CASE("MemoryKvConnection: set, get, exists, delete", "[memory_kv]") {
    KvFixture f;

    auto set = f.conn->execute("SET user:1 ?", {Value("alice")});
    REQUIRE(set.is_ok());
    CHECK(set->rows_affected == 1);

    auto get = f.conn->query("GET user:1");
    REQUIRE(get.is_ok());
    REQUIRE(get->row_count() == 1);
    CHECK(get->columns.size() == 2);
    CHECK(get->rows[0][0] == Value("user:1"));
    CHECK(get->rows[0][1] == Value("alice"));

    auto exists = f.conn->query("EXISTS user:1");
    REQUIRE(exists.is_ok());
    CHECK(exists->rows[0][0] == Value(true));

    auto del = f.conn->execute("DEL user:1");
    REQUIRE(del.is_ok());
    CHECK(del->rows_affected == 1);
    CHECK(f.conn->execute("DEL user:1")->rows_affected == 0);

    auto missing = f.conn->query("GET user:1");
    REQUIRE(missing.is_ok());
    CHECK(missing->row_count() == 0);
}

TEST_CASE("MemoryKvConnection: KEYS prefix and exact match", "[memory_kv]") {
    KvFixture f;
    for (const char* key : {"user:2", "user:1", "order:1"}) {
        REQUIRE(f.conn->execute(std::string("SET ") + key + " x").is_ok());
    }

    auto prefix = f.conn->query("KEYS user:*");
    REQUIRE(prefix.is_ok());
    REQUIRE(prefix->row_count() == 2);
    CHECK(prefix->rows[0][0] == Value("user:1"));
    CHECK(prefix->rows[1][0] == Value("user:2"));

    CHECK(f.conn->query("KEYS order:1")->row_count() == 1);
    CHECK(f.conn->query("KEYS order:2")->row_count() == 0);
    CHECK(f.conn->query("KEYS *")->row_count() == 3);
}

TEST_CASE("MemoryKvConnection: reads and writes use the right entry point", "[memory_kv]") {
    KvFixture f;

    CHECK(f.conn->query("SET k v").error_code() == ErrorCode::VALIDATION_ERROR);
    CHECK(f.conn->execute("GET k").error_code() == ErrorCode::VALIDATION_ERROR);
}

TEST_CASE("MemoryKvConnection: connections share one store", "[memory_kv]") {
    KvFixture f;
    auto other = f.engine.connect(ConnectionConfig{});
    REQUIRE(other.is_ok());

    REQUIRE(f.conn->execute("SET shared 1").is_ok());
    auto seen = other.value()->query("GET shared");
    REQUIRE(seen.is_ok());
    CHECK(seen->row_count() == 1);
    CHECK(f.engine.store()->size() == 1);
}

TEST_CASE("MemoryKvConnection: closed connection fails", "[memory_kv]") {
    KvFixture f;
    f.conn->close();

    CHECK_FALSE(f.conn->is_connected());
    CHECK(f.conn->ping().error_code() == ErrorCode::CONNECTION_FAILED);
    CHECK(f.conn->query("GET k").error_code() == ErrorCode::CONNECTION_FAILED);
}

TEST_CASE("MemoryKvConnection: transactions are unsupported", "[memory_kv][capability]") {
    KvFixture f;

    CHECK(f.conn->begin_transaction().error_code() == ErrorCode::UNSUPPORTED_OPERATION);
    CHECK(f.conn->prepare("GET k").error_code() == ErrorCode::UNSUPPORTED_OPERATION);
    CHECK(f.conn->get_schema().error_code() == ErrorCode::UNSUPPORTED_OPERATION);
}

TEST_CASE("MemoryKvConnection: batch applies all or nothing", "[memory_kv][command_batch]") {
    KvFixture f;
    REQUIRE(f.conn->execute("SET a old").is_ok());

    auto batch = f.conn->begin_batch();
    REQUIRE(batch.is_ok());
    auto& b = *batch.value();

    REQUIRE(b.queue("SET a new").is_ok());
    REQUIRE(b.queue("SET b ?", {Value(2)}).is_ok());
    REQUIRE(b.queue("GET a").is_ok());
    REQUIRE(b.queue("DEL missing").is_ok());
    REQUIRE(b.queue("EXISTS b").is_ok());
    REQUIRE(b.queue("KEYS *").is_ok());
    CHECK(b.queue("INCR a").is_error());

    // Nothing is visible before commit
    CHECK(f.conn->query("GET a")->rows[0][1] == Value("old"));

    auto results = b.commit();
    REQUIRE(results.is_ok());
    REQUIRE(results->size() == 6);
    CHECK(results.value()[0] == Value(1));
    CHECK(results.value()[1] == Value(1));
    CHECK(results.value()[2] == Value("new"));
    CHECK(results.value()[3] == Value(0));
    CHECK(results.value()[4] == Value(true));
    CHECK(results.value()[5] == Value::json(Json::array({"a", "b"})));
    CHECK(f.engine.store()->size() == 2);
}

TEST_CASE("MemoryKvConnection: discarded batch leaves the store untouched", "[memory_kv][command_batch]") {
    KvFixture f;

    auto batch = f.conn->begin_batch();
    REQUIRE(batch.is_ok());
    REQUIRE(batch.value()->queue("SET a 1").is_ok());
    REQUIRE(batch.value()->discard().is_ok());

    CHECK(f.engine.store()->size() == 0);
}
