#include "db/db_connection.hpp"
#include "core/utils.hpp"
#include <format>

namespace unidb {

namespace {

template<typename T>
Result<T> unsupported(DatabaseFeature feature) {
    return Result<T>::error(ErrorCode::UNSUPPORTED_OPERATION,
        std::format("engine does not support {}", feature_to_string(feature)));
}

} // namespace

DbConnection::DbConnection(FeatureSet features)
    : features_(features) {
    info_.id = utils::generate_uuid();
    info_.connected_at = std::chrono::system_clock::now();
    info_.last_activity = info_.connected_at;
}

Result<QueryResult> DbConnection::query(const std::string& sql, const std::vector<Value>& params) {
    utils::Timer timer;
    auto result = do_query(sql, params);
    touch();
    if (result.is_ok()) {
        result->execution_time = timer.elapsed_us();
    }
    return result;
}

Result<ExecuteResult> DbConnection::execute(const std::string& sql, const std::vector<Value>& params) {
    utils::Timer timer;
    auto result = do_execute(sql, params);
    touch();
    if (result.is_ok()) {
        result->execution_time = timer.elapsed_us();
    }
    return result;
}

Result<std::unique_ptr<Transaction>> DbConnection::begin_transaction(IsolationLevel level,
                                                                     bool read_only) {
    if (!features_.contains(DatabaseFeature::TRANSACTIONS)) {
        return unsupported<std::unique_ptr<Transaction>>(DatabaseFeature::TRANSACTIONS);
    }
    if (level != IsolationLevel::READ_COMMITTED &&
        !features_.contains(DatabaseFeature::ISOLATION_LEVELS)) {
        return unsupported<std::unique_ptr<Transaction>>(DatabaseFeature::ISOLATION_LEVELS);
    }

    auto driver = do_begin(level, read_only);
    touch();
    if (driver.is_error()) {
        return driver.as_error<std::unique_ptr<Transaction>>();
    }
    return Result<std::unique_ptr<Transaction>>::ok(
        std::make_unique<Transaction>(std::move(driver.value()), features_, level, read_only));
}

Result<std::unique_ptr<PreparedStatement>> DbConnection::prepare(const std::string& sql) {
    if (!features_.contains(DatabaseFeature::PREPARED_STATEMENTS)) {
        return unsupported<std::unique_ptr<PreparedStatement>>(DatabaseFeature::PREPARED_STATEMENTS);
    }

    auto driver = do_prepare(sql);
    touch();
    if (driver.is_error()) {
        return driver.as_error<std::unique_ptr<PreparedStatement>>();
    }
    return Result<std::unique_ptr<PreparedStatement>>::ok(
        std::make_unique<PreparedStatement>(sql, std::move(driver.value())));
}

Result<std::unique_ptr<CommandBatch>> DbConnection::begin_batch() {
    if (!features_.contains(DatabaseFeature::BATCHED_COMMANDS)) {
        return unsupported<std::unique_ptr<CommandBatch>>(DatabaseFeature::BATCHED_COMMANDS);
    }

    auto driver = do_begin_batch();
    if (driver.is_error()) {
        return driver.as_error<std::unique_ptr<CommandBatch>>();
    }
    return Result<std::unique_ptr<CommandBatch>>::ok(
        std::make_unique<CommandBatch>(std::move(driver.value())));
}

Result<DatabaseSchema> DbConnection::get_schema() {
    if (!features_.contains(DatabaseFeature::SCHEMA_INTROSPECTION)) {
        return unsupported<DatabaseSchema>(DatabaseFeature::SCHEMA_INTROSPECTION);
    }
    auto result = do_get_schema();
    touch();
    return result;
}

Result<TableInfo> DbConnection::get_table_schema(const std::string& table_name) {
    if (!features_.contains(DatabaseFeature::SCHEMA_INTROSPECTION)) {
        return unsupported<TableInfo>(DatabaseFeature::SCHEMA_INTROSPECTION);
    }
    auto result = do_get_table_schema(table_name);
    touch();
    return result;
}

// ---- Default hooks ---------------------------------------------------------

Result<std::unique_ptr<ITransactionDriver>> DbConnection::do_begin(IsolationLevel, bool) {
    return unsupported<std::unique_ptr<ITransactionDriver>>(DatabaseFeature::TRANSACTIONS);
}

Result<std::unique_ptr<IStatementDriver>> DbConnection::do_prepare(const std::string&) {
    return unsupported<std::unique_ptr<IStatementDriver>>(DatabaseFeature::PREPARED_STATEMENTS);
}

Result<std::unique_ptr<IBatchDriver>> DbConnection::do_begin_batch() {
    return unsupported<std::unique_ptr<IBatchDriver>>(DatabaseFeature::BATCHED_COMMANDS);
}

Result<DatabaseSchema> DbConnection::do_get_schema() {
    return unsupported<DatabaseSchema>(DatabaseFeature::SCHEMA_INTROSPECTION);
}

Result<TableInfo> DbConnection::do_get_table_schema(const std::string& table_name) {
    auto schema = do_get_schema();
    if (schema.is_error()) {
        return schema.as_error<TableInfo>();
    }
    if (const auto* table = schema->find_table(table_name)) {
        return Result<TableInfo>::ok(*table);
    }
    return Result<TableInfo>::error(ErrorCode::QUERY_FAILED,
        std::format("table '{}' not found", table_name));
}

} // namespace unidb
