#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_type_map.hpp"
#include "core/utils.hpp"
#include <mysql/errmsg.h>
#include <format>
#include <memory>
#include <type_traits>

namespace unidb {

namespace {

// my_bool (MariaDB Connector/C) or bool (libmysqlclient 8)
using mysql_flag = std::remove_pointer_t<decltype(MYSQL_BIND::is_null)>;

struct StmtDeleter {
    void operator()(MYSQL_STMT* stmt) const noexcept {
        if (stmt) {
            mysql_stmt_close(stmt);
        }
    }
};
using StmtPtr = std::unique_ptr<MYSQL_STMT, StmtDeleter>;

struct ResDeleter {
    void operator()(MYSQL_RES* res) const noexcept {
        if (res) {
            mysql_free_result(res);
        }
    }
};
using ResPtr = std::unique_ptr<MYSQL_RES, ResDeleter>;

// Bind storage; every vector is reserved up front so pointers stay valid
struct BoundParams {
    std::vector<MYSQL_BIND> binds;
    std::vector<long long> ints;
    std::vector<double> doubles;
    std::vector<std::string> texts;
    std::vector<unsigned long> lengths;
};

Result<void> bind_params(const std::vector<Value>& params, BoundParams& out) {
    out.binds.assign(params.size(), MYSQL_BIND{});
    out.ints.reserve(params.size());
    out.doubles.reserve(params.size());
    out.texts.reserve(params.size());
    out.lengths.reserve(params.size());

    const auto bind_text = [&out](MYSQL_BIND& b, std::string text, enum_field_types type) {
        out.texts.push_back(std::move(text));
        out.lengths.push_back(static_cast<unsigned long>(out.texts.back().size()));
        b.buffer_type = type;
        b.buffer = out.texts.back().data();
        b.buffer_length = out.lengths.back();
        b.length = &out.lengths.back();
    };

    for (size_t i = 0; i < params.size(); ++i) {
        const Value& v = params[i];
        MYSQL_BIND& b = out.binds[i];
        switch (v.kind()) {
            case ValueKind::NULL_VALUE:
                b.buffer_type = MYSQL_TYPE_NULL;
                break;
            case ValueKind::BOOL:
                out.ints.push_back(*v.get_if<bool>() ? 1 : 0);
                b.buffer_type = MYSQL_TYPE_LONGLONG;
                b.buffer = &out.ints.back();
                break;
            case ValueKind::INT64:
                out.ints.push_back(*v.get_if<int64_t>());
                b.buffer_type = MYSQL_TYPE_LONGLONG;
                b.buffer = &out.ints.back();
                break;
            case ValueKind::FLOAT64:
                out.doubles.push_back(*v.get_if<double>());
                b.buffer_type = MYSQL_TYPE_DOUBLE;
                b.buffer = &out.doubles.back();
                break;
            case ValueKind::BINARY: {
                const auto& bytes = *v.get_if<Binary>();
                bind_text(b, std::string(bytes.begin(), bytes.end()), MYSQL_TYPE_BLOB);
                break;
            }
            case ValueKind::DATETIME:
                bind_text(b, MysqlTypeMap::datetime_to_text(*v.get_if<DateTime>()), MYSQL_TYPE_STRING);
                break;
            default: {
                auto text = v.to_text();
                if (text.is_error()) {
                    return Result<void>::error(text.error_code(),
                        std::format("parameter {}: {}", i + 1, text.error_message()));
                }
                bind_text(b, std::move(text.value()), MYSQL_TYPE_STRING);
                break;
            }
        }
    }
    return Result<void>::ok();
}

Result<StmtPtr> prepare_statement(MysqlConnection& conn, const std::string& sql) {
    MYSQL* mysql = conn.native_handle();
    if (!mysql) {
        return Result<StmtPtr>::error(ErrorCode::CONNECTION_FAILED, "connection is closed");
    }
    StmtPtr stmt(mysql_stmt_init(mysql));
    if (!stmt) {
        return conn.fail<StmtPtr>(mysql_errno(mysql), mysql_error(mysql));
    }
    if (mysql_stmt_prepare(stmt.get(), sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
        return conn.fail<StmtPtr>(mysql_stmt_errno(stmt.get()), mysql_stmt_error(stmt.get()));
    }
    return Result<StmtPtr>::ok(std::move(stmt));
}

Result<void> execute_statement(MysqlConnection& conn, MYSQL_STMT* stmt,
                               const std::vector<Value>& params) {
    const auto expected = static_cast<size_t>(mysql_stmt_param_count(stmt));
    if (expected != params.size()) {
        return Result<void>::error(ErrorCode::VALIDATION_ERROR,
            std::format("expected {} parameters, got {}", expected, params.size()));
    }

    BoundParams bound;
    if (auto b = bind_params(params, bound); b.is_error()) {
        return b;
    }
    if (!params.empty() && mysql_stmt_bind_param(stmt, bound.binds.data()) != 0) {
        return conn.fail<void>(mysql_stmt_errno(stmt), mysql_stmt_error(stmt));
    }
    if (mysql_stmt_execute(stmt) != 0) {
        return conn.fail<void>(mysql_stmt_errno(stmt), mysql_stmt_error(stmt));
    }
    return Result<void>::ok();
}

void describe_columns(MYSQL_FIELD* fields, unsigned int count,
                      QueryResult& result, std::vector<ValueKind>& kinds) {
    result.columns.reserve(count);
    kinds.reserve(count);
    for (unsigned int i = 0; i < count; ++i) {
        const MYSQL_FIELD& f = fields[i];
        result.columns.push_back({f.name, MysqlTypeMap::field_type_name(f.type),
                                  (f.flags & NOT_NULL_FLAG) == 0,
                                  static_cast<uint32_t>(f.length)});
        kinds.push_back(MysqlTypeMap::field_to_kind(f));
    }
}

/**
 * @brief Fetch every row of an executed statement
 *
 * Columns are bound as strings with a zero-length buffer; each non-null
 * cell is then pulled at its real length with mysql_stmt_fetch_column.
 */
Result<QueryResult> fetch_statement_rows(MysqlConnection& conn, MYSQL_STMT* stmt) {
    QueryResult result;
    ResPtr meta(mysql_stmt_result_metadata(stmt));
    if (!meta) {
        return Result<QueryResult>::ok(std::move(result));
    }

    const unsigned int ncols = mysql_num_fields(meta.get());
    std::vector<ValueKind> kinds;
    describe_columns(mysql_fetch_fields(meta.get()), ncols, result, kinds);

    std::vector<MYSQL_BIND> binds(ncols, MYSQL_BIND{});
    std::vector<unsigned long> lengths(ncols, 0);
    std::vector<mysql_flag> nulls(ncols, 0);
    std::vector<mysql_flag> errors(ncols, 0);
    for (unsigned int i = 0; i < ncols; ++i) {
        binds[i].buffer_type = MYSQL_TYPE_STRING;
        binds[i].buffer = nullptr;
        binds[i].buffer_length = 0;
        binds[i].length = &lengths[i];
        binds[i].is_null = &nulls[i];
        binds[i].error = &errors[i];
    }

    if (mysql_stmt_bind_result(stmt, binds.data()) != 0 || mysql_stmt_store_result(stmt) != 0) {
        return conn.fail<QueryResult>(mysql_stmt_errno(stmt), mysql_stmt_error(stmt));
    }

    while (true) {
        const int rc = mysql_stmt_fetch(stmt);
        if (rc == MYSQL_NO_DATA) break;
        if (rc == 1) {
            auto err = conn.fail<QueryResult>(mysql_stmt_errno(stmt), mysql_stmt_error(stmt));
            mysql_stmt_free_result(stmt);
            return err;
        }

        std::vector<Value> row;
        row.reserve(ncols);
        for (unsigned int i = 0; i < ncols; ++i) {
            if (nulls[i]) {
                row.emplace_back();
                continue;
            }
            std::string buf(lengths[i], '\0');
            if (!buf.empty()) {
                unsigned long fetched = 0;
                MYSQL_BIND col{};
                col.buffer_type = MYSQL_TYPE_STRING;
                col.buffer = buf.data();
                col.buffer_length = static_cast<unsigned long>(buf.size());
                col.length = &fetched;
                if (mysql_stmt_fetch_column(stmt, &col, i, 0) != 0) {
                    auto err = conn.fail<QueryResult>(mysql_stmt_errno(stmt), mysql_stmt_error(stmt));
                    mysql_stmt_free_result(stmt);
                    return err;
                }
            }
            auto cell = MysqlTypeMap::cell_to_value(kinds[i], buf);
            if (cell.is_error()) {
                mysql_stmt_free_result(stmt);
                return Result<QueryResult>::error(ErrorCode::CONVERSION_ERROR,
                    std::format("column '{}': {}", result.columns[i].name, cell.error_message()));
            }
            row.push_back(std::move(cell.value()));
        }
        result.rows.push_back(std::move(row));
    }

    mysql_stmt_free_result(stmt);
    result.total_rows = result.rows.size();
    return Result<QueryResult>::ok(std::move(result));
}

ExecuteResult statement_execute_result(MYSQL_STMT* stmt) {
    // Drain a result set if the statement produced one
    if (ResPtr meta(mysql_stmt_result_metadata(stmt)); meta) {
        mysql_stmt_store_result(stmt);
        mysql_stmt_free_result(stmt);
    }

    ExecuteResult result;
    const auto affected = mysql_stmt_affected_rows(stmt);
    result.rows_affected = affected == static_cast<decltype(affected)>(-1) ? 0 : affected;
    if (const auto id = mysql_stmt_insert_id(stmt); id > 0) {
        result.last_insert_id = static_cast<int64_t>(id);
    }
    return result;
}

class MysqlStatementDriver : public IStatementDriver {
public:
    MysqlStatementDriver(MysqlConnection& conn, StmtPtr stmt)
        : conn_(conn),
          stmt_(std::move(stmt)),
          parameter_count_(mysql_stmt_param_count(stmt_.get())) {}

    size_t parameter_count() const override { return parameter_count_; }

    Result<QueryResult> query(const std::vector<Value>& params) override {
        if (auto exec = execute_statement(conn_, stmt_.get(), params); exec.is_error()) {
            return exec.as_error<QueryResult>();
        }
        return fetch_statement_rows(conn_, stmt_.get());
    }

    Result<ExecuteResult> execute(const std::vector<Value>& params) override {
        if (auto exec = execute_statement(conn_, stmt_.get(), params); exec.is_error()) {
            return exec.as_error<ExecuteResult>();
        }
        return Result<ExecuteResult>::ok(statement_execute_result(stmt_.get()));
    }

    void close() override { stmt_.reset(); }

private:
    MysqlConnection& conn_;
    StmtPtr stmt_;
    size_t parameter_count_;
};

class MysqlTransactionDriver : public ITransactionDriver {
public:
    explicit MysqlTransactionDriver(MysqlConnection& conn) : conn_(conn) {}

    Result<QueryResult> query(const std::string& sql, const std::vector<Value>& params) override {
        return conn_.query(sql, params);
    }

    Result<ExecuteResult> execute(const std::string& sql, const std::vector<Value>& params) override {
        return conn_.execute(sql, params);
    }

    Result<void> commit() override { return conn_.run("COMMIT"); }
    Result<void> rollback() override { return conn_.run("ROLLBACK"); }

    Result<void> savepoint(const std::string& name) override {
        return conn_.run(std::format("SAVEPOINT {}", name));
    }

    Result<void> rollback_to_savepoint(const std::string& name) override {
        return conn_.run(std::format("ROLLBACK TO SAVEPOINT {}", name));
    }

    Result<void> release_savepoint(const std::string& name) override {
        return conn_.run(std::format("RELEASE SAVEPOINT {}", name));
    }

    // The server rejects this once the transaction has run a statement
    Result<void> set_isolation_level(IsolationLevel level) override {
        return conn_.run(std::format("SET TRANSACTION ISOLATION LEVEL {}",
            isolation_level_to_sql(level)));
    }

private:
    MysqlConnection& conn_;
};

} // namespace

// ============================================================================
// MysqlConnection
// ============================================================================

MysqlConnection::MysqlConnection(MYSQL* conn, FeatureSet features, const ConnectionConfig& config)
    : DbConnection(features), conn_(conn) {
    info_.database_name = config.database;
    info_.user = config.username;
    const char* version = mysql_get_server_info(conn_);
    info_.server_version = version ? version : "";
}

MysqlConnection::~MysqlConnection() {
    close();
}

Result<void> MysqlConnection::ping() {
    if (!conn_) {
        return Result<void>::error(ErrorCode::CONNECTION_FAILED, "connection is closed");
    }
    if (mysql_ping(conn_) != 0) {
        return fail<void>(mysql_errno(conn_), mysql_error(conn_));
    }
    return Result<void>::ok();
}

bool MysqlConnection::is_connected() const {
    return conn_ != nullptr && !lost_;
}

void MysqlConnection::close() {
    if (conn_) {
        mysql_close(conn_);
        conn_ = nullptr;
    }
}

ErrorCode MysqlConnection::classify_error(unsigned int err) {
    if (err == CR_SERVER_GONE_ERROR || err == CR_SERVER_LOST) {
        lost_ = true;
        return ErrorCode::CONNECTION_FAILED;
    }
    return ErrorCode::QUERY_FAILED;
}

Result<void> MysqlConnection::run(const std::string& sql) {
    if (!conn_) {
        return Result<void>::error(ErrorCode::CONNECTION_FAILED, "connection is closed");
    }
    if (mysql_real_query(conn_, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
        return fail<void>(mysql_errno(conn_), mysql_error(conn_));
    }
    // Discard any result set so the connection stays usable
    ResPtr res(mysql_store_result(conn_));
    return Result<void>::ok();
}

Result<QueryResult> MysqlConnection::query_text(const std::string& sql) {
    if (!conn_) {
        return Result<QueryResult>::error(ErrorCode::CONNECTION_FAILED, "connection is closed");
    }
    if (mysql_real_query(conn_, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
        return fail<QueryResult>(mysql_errno(conn_), mysql_error(conn_));
    }

    QueryResult result;
    ResPtr res(mysql_store_result(conn_));
    if (!res) {
        // No result set: DML/DDL, or an error
        if (mysql_field_count(conn_) != 0) {
            return fail<QueryResult>(mysql_errno(conn_), mysql_error(conn_));
        }
        return Result<QueryResult>::ok(std::move(result));
    }

    const unsigned int ncols = mysql_num_fields(res.get());
    std::vector<ValueKind> kinds;
    describe_columns(mysql_fetch_fields(res.get()), ncols, result, kinds);

    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res.get())) != nullptr) {
        const unsigned long* lengths = mysql_fetch_lengths(res.get());
        std::vector<Value> values;
        values.reserve(ncols);
        for (unsigned int i = 0; i < ncols; ++i) {
            if (!row[i]) {
                values.emplace_back();
                continue;
            }
            auto cell = MysqlTypeMap::cell_to_value(kinds[i], std::string_view(row[i], lengths[i]));
            if (cell.is_error()) {
                return Result<QueryResult>::error(ErrorCode::CONVERSION_ERROR,
                    std::format("column '{}': {}", result.columns[i].name, cell.error_message()));
            }
            values.push_back(std::move(cell.value()));
        }
        result.rows.push_back(std::move(values));
    }

    result.total_rows = result.rows.size();
    return Result<QueryResult>::ok(std::move(result));
}

Result<QueryResult> MysqlConnection::do_query(const std::string& sql, const std::vector<Value>& params) {
    if (params.empty()) {
        return query_text(sql);
    }

    auto stmt = prepare_statement(*this, sql);
    if (stmt.is_error()) return stmt.as_error<QueryResult>();
    if (auto exec = execute_statement(*this, stmt.value().get(), params); exec.is_error()) {
        return exec.as_error<QueryResult>();
    }
    return fetch_statement_rows(*this, stmt.value().get());
}

Result<ExecuteResult> MysqlConnection::do_execute(const std::string& sql, const std::vector<Value>& params) {
    if (params.empty()) {
        if (auto r = run(sql); r.is_error()) {
            return r.as_error<ExecuteResult>();
        }
        ExecuteResult result;
        const auto affected = mysql_affected_rows(conn_);
        result.rows_affected = affected == static_cast<decltype(affected)>(-1) ? 0 : affected;
        if (const auto id = mysql_insert_id(conn_); id > 0) {
            result.last_insert_id = static_cast<int64_t>(id);
        }
        return Result<ExecuteResult>::ok(result);
    }

    auto stmt = prepare_statement(*this, sql);
    if (stmt.is_error()) return stmt.as_error<ExecuteResult>();
    if (auto exec = execute_statement(*this, stmt.value().get(), params); exec.is_error()) {
        return exec.as_error<ExecuteResult>();
    }
    return Result<ExecuteResult>::ok(statement_execute_result(stmt.value().get()));
}

Result<std::unique_ptr<ITransactionDriver>> MysqlConnection::do_begin(IsolationLevel level,
                                                                      bool read_only) {
    using R = Result<std::unique_ptr<ITransactionDriver>>;
    // Applies to the next transaction only
    if (auto r = run(std::format("SET TRANSACTION ISOLATION LEVEL {}", isolation_level_to_sql(level)));
        r.is_error()) {
        return r.as_error<std::unique_ptr<ITransactionDriver>>();
    }
    if (auto r = run(read_only ? "START TRANSACTION READ ONLY" : "START TRANSACTION"); r.is_error()) {
        return r.as_error<std::unique_ptr<ITransactionDriver>>();
    }
    return R::ok(std::make_unique<MysqlTransactionDriver>(*this));
}

Result<std::unique_ptr<IStatementDriver>> MysqlConnection::do_prepare(const std::string& sql) {
    auto stmt = prepare_statement(*this, sql);
    if (stmt.is_error()) {
        return stmt.as_error<std::unique_ptr<IStatementDriver>>();
    }
    return Result<std::unique_ptr<IStatementDriver>>::ok(
        std::make_unique<MysqlStatementDriver>(*this, std::move(stmt.value())));
}

} // namespace unidb
