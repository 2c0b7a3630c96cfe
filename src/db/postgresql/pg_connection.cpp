#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <cstring>
#include <iterator>
#include <format>
#include <optional>

namespace unidb {

namespace {

// Text-format parameters: storage first, then stable pointers into it
struct PgParams {
    std::vector<std::optional<std::string>> storage;
    std::vector<const char*> values;
};

Result<PgParams> build_params(const std::vector<Value>& params) {
    PgParams out;
    out.storage.reserve(params.size());
    for (const auto& p : params) {
        auto text = PgTypeMap::param_to_text(p);
        if (text.is_error()) {
            return text.as_error<PgParams>();
        }
        out.storage.push_back(std::move(text.value()));
    }
    out.values.reserve(out.storage.size());
    for (const auto& s : out.storage) {
        out.values.push_back(s ? s->c_str() : nullptr);
    }
    return Result<PgParams>::ok(std::move(out));
}

class PgTransactionDriver : public ITransactionDriver {
public:
    explicit PgTransactionDriver(PgConnection& conn) : conn_(conn) {}

    Result<QueryResult> query(const std::string& sql, const std::vector<Value>& params) override {
        auto res = conn_.exec(sql, params);
        if (res.is_error()) return res.as_error<QueryResult>();
        return PgConnection::to_query_result(res.value().get());
    }

    Result<ExecuteResult> execute(const std::string& sql, const std::vector<Value>& params) override {
        auto res = conn_.exec(sql, params);
        if (res.is_error()) return res.as_error<ExecuteResult>();
        return Result<ExecuteResult>::ok(PgConnection::to_execute_result(res.value().get()));
    }

    Result<void> commit() override {
        auto res = conn_.exec("COMMIT");
        if (res.is_error()) return res.as_error<void>();
        // COMMIT of an aborted transaction succeeds with the tag ROLLBACK
        if (std::strcmp(PQcmdStatus(res.value().get()), "ROLLBACK") == 0) {
            return Result<void>::error(ErrorCode::TRANSACTION_FAILED,
                "transaction was aborted by the server and rolled back");
        }
        return Result<void>::ok();
    }

    Result<void> rollback() override { return run("ROLLBACK"); }

    Result<void> savepoint(const std::string& name) override {
        auto result = run(std::format("SAVEPOINT {}", name));
        if (result.is_ok()) savepoints_.push(name);
        return result;
    }

    Result<void> rollback_to_savepoint(const std::string& name) override {
        auto result = run(std::format("ROLLBACK TO SAVEPOINT {}", name));
        if (result.is_ok()) savepoints_.rollback_to(name);
        return result;
    }

    Result<void> release_savepoint(const std::string& name) override {
        // Later savepoints must survive; the server would drop them with this one
        const auto stack = savepoints_;
        if (!savepoints_.release(name)) {
            return Result<void>::ok();
        }
        auto result = run(std::format("RELEASE SAVEPOINT {}", name));
        if (result.is_error()) savepoints_ = stack;
        return result;
    }

    Result<void> set_isolation_level(IsolationLevel level) override {
        return run(std::format("SET TRANSACTION ISOLATION LEVEL {}", isolation_level_to_sql(level)));
    }

private:
    Result<void> run(const std::string& sql) {
        auto res = conn_.exec(sql);
        if (res.is_error()) return res.as_error<void>();
        return Result<void>::ok();
    }

    PgConnection& conn_;
    PgSavepointStack savepoints_;
};

class PgStatementDriver : public IStatementDriver {
public:
    PgStatementDriver(PgConnection& conn, std::string name, size_t parameter_count)
        : conn_(conn), name_(std::move(name)), parameter_count_(parameter_count) {}

    size_t parameter_count() const override { return parameter_count_; }

    Result<QueryResult> query(const std::vector<Value>& params) override {
        auto res = run(params);
        if (res.is_error()) return res.as_error<QueryResult>();
        return PgConnection::to_query_result(res.value().get());
    }

    Result<ExecuteResult> execute(const std::vector<Value>& params) override {
        auto res = run(params);
        if (res.is_error()) return res.as_error<ExecuteResult>();
        return Result<ExecuteResult>::ok(PgConnection::to_execute_result(res.value().get()));
    }

    void close() override {
        if (!conn_.is_connected()) return;
        auto res = conn_.exec(std::format("DEALLOCATE {}", name_));
        if (res.is_error()) {
            utils::log::warn(std::format("Failed to deallocate statement {}: {}",
                name_, res.error_message()));
        }
    }

private:
    Result<PGResultPtr> run(const std::vector<Value>& params) {
        auto bound = build_params(params);
        if (bound.is_error()) return bound.as_error<PGResultPtr>();
        const auto& values = bound.value().values;
        return conn_.check_result(PQexecPrepared(conn_.native_handle(), name_.c_str(),
            static_cast<int>(values.size()), values.data(), nullptr, nullptr, 0));
    }

    PgConnection& conn_;
    std::string name_;
    size_t parameter_count_;
};

std::string quote_conninfo_value(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

} // namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn, FeatureSet features)
    : DbConnection(features), conn_(conn) {
    info_.database_name = PQdb(conn_);
    info_.user = PQuser(conn_);
    const char* version = PQparameterStatus(conn_, "server_version");
    info_.server_version = version ? version : "";
}

PgConnection::~PgConnection() {
    close();
}

Result<void> PgConnection::ping() {
    auto res = exec("SELECT 1");
    if (res.is_error()) return res.as_error<void>();
    return Result<void>::ok();
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

std::string PgConnection::next_statement_name() {
    return std::format("unidb_stmt_{}", ++statement_counter_);
}

Result<PGResultPtr> PgConnection::exec(const std::string& sql, const std::vector<Value>& params) {
    if (!conn_) {
        return Result<PGResultPtr>::error(ErrorCode::CONNECTION_FAILED, "connection is closed");
    }
    if (params.empty()) {
        return check_result(PQexec(conn_, sql.c_str()));
    }

    auto bound = build_params(params);
    if (bound.is_error()) return bound.as_error<PGResultPtr>();
    const auto& values = bound.value().values;
    return check_result(PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()),
        nullptr, values.data(), nullptr, nullptr, 0));
}

Result<PGResultPtr> PgConnection::check_result(PGresult* raw) {
    PGResultPtr res(raw);
    const auto failure_code = [this]() {
        return is_connected() ? ErrorCode::QUERY_FAILED : ErrorCode::CONNECTION_FAILED;
    };

    if (!res) {
        return Result<PGResultPtr>::error(failure_code(),
            utils::trim(conn_ ? PQerrorMessage(conn_) : "connection is closed"));
    }

    const ExecStatusType status = PQresultStatus(res.get());
    if (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK) {
        return Result<PGResultPtr>::ok(std::move(res));
    }
    return Result<PGResultPtr>::error(failure_code(),
        utils::trim(PQresultErrorMessage(res.get())));
}

Result<QueryResult> PgConnection::to_query_result(PGresult* res) {
    QueryResult result;

    const int ncols = PQnfields(res);
    std::vector<uint32_t> oids;
    oids.reserve(ncols);
    result.columns.reserve(ncols);
    for (int i = 0; i < ncols; ++i) {
        const auto oid = static_cast<uint32_t>(PQftype(res, i));
        oids.push_back(oid);
        result.columns.push_back({PQfname(res, i), PgTypeMap::oid_to_type_name(oid), true, std::nullopt});
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);
    for (int r = 0; r < nrows; ++r) {
        std::vector<Value> row;
        row.reserve(ncols);
        for (int c = 0; c < ncols; ++c) {
            if (PQgetisnull(res, r, c)) {
                row.emplace_back();
                continue;
            }
            auto cell = PgTypeMap::cell_to_value(oids[c],
                std::string_view(PQgetvalue(res, r, c), PQgetlength(res, r, c)));
            if (cell.is_error()) {
                return Result<QueryResult>::error(ErrorCode::CONVERSION_ERROR,
                    std::format("column '{}': {}", result.columns[c].name, cell.error_message()));
            }
            row.push_back(std::move(cell.value()));
        }
        result.rows.push_back(std::move(row));
    }
    result.total_rows = static_cast<uint64_t>(nrows);
    return Result<QueryResult>::ok(std::move(result));
}

ExecuteResult PgConnection::to_execute_result(PGresult* res) {
    ExecuteResult result;
    result.rows_affected = utils::try_parse_int<uint64_t>(PQcmdTuples(res)).value_or(0);

    // INSERT ... RETURNING id: first cell of the first row
    if (PQresultStatus(res) == PGRES_TUPLES_OK && PQntuples(res) > 0 &&
        PQnfields(res) > 0 && !PQgetisnull(res, 0, 0)) {
        result.last_insert_id = utils::try_parse_int<int64_t>(PQgetvalue(res, 0, 0));
    } else if (const Oid oid = PQoidValue(res); oid != InvalidOid) {
        result.last_insert_id = static_cast<int64_t>(oid);
    }
    return result;
}

Result<QueryResult> PgConnection::do_query(const std::string& sql, const std::vector<Value>& params) {
    auto res = exec(sql, params);
    if (res.is_error()) return res.as_error<QueryResult>();
    return to_query_result(res.value().get());
}

Result<ExecuteResult> PgConnection::do_execute(const std::string& sql, const std::vector<Value>& params) {
    auto res = exec(sql, params);
    if (res.is_error()) return res.as_error<ExecuteResult>();
    return Result<ExecuteResult>::ok(to_execute_result(res.value().get()));
}

Result<std::unique_ptr<ITransactionDriver>> PgConnection::do_begin(IsolationLevel level,
                                                                   bool read_only) {
    auto res = exec(std::format("BEGIN ISOLATION LEVEL {}{}",
        isolation_level_to_sql(level), read_only ? " READ ONLY" : ""));
    if (res.is_error()) {
        return res.as_error<std::unique_ptr<ITransactionDriver>>();
    }
    return Result<std::unique_ptr<ITransactionDriver>>::ok(
        std::make_unique<PgTransactionDriver>(*this));
}

Result<std::unique_ptr<IStatementDriver>> PgConnection::do_prepare(const std::string& sql) {
    using R = Result<std::unique_ptr<IStatementDriver>>;
    if (!conn_) {
        return R::error(ErrorCode::CONNECTION_FAILED, "connection is closed");
    }

    std::string name = next_statement_name();
    auto prepared = check_result(PQprepare(conn_, name.c_str(), sql.c_str(), 0, nullptr));
    if (prepared.is_error()) {
        return prepared.as_error<std::unique_ptr<IStatementDriver>>();
    }

    auto described = check_result(PQdescribePrepared(conn_, name.c_str()));
    if (described.is_error()) {
        return described.as_error<std::unique_ptr<IStatementDriver>>();
    }
    const auto nparams = static_cast<size_t>(PQnparams(described.value().get()));

    return R::ok(std::make_unique<PgStatementDriver>(*this, std::move(name), nparams));
}

// ============================================================================
// Connection string
// ============================================================================

// ============================================================================
// PgSavepointStack
// ============================================================================

void PgSavepointStack::rollback_to(const std::string& name) {
    const auto it = std::find(names_.rbegin(), names_.rend(), name);
    if (it == names_.rend()) return;
    names_.erase(std::prev(it.base()), names_.end());
}

bool PgSavepointStack::release(const std::string& name) {
    const auto it = std::find(names_.rbegin(), names_.rend(), name);
    if (it == names_.rend()) {
        // Unknown here: let the server report it
        return true;
    }
    const bool on_top = it == names_.rbegin();
    names_.erase(std::prev(it.base()));
    return on_top;
}

std::string build_pg_conninfo(const ConnectionConfig& config) {
    std::string conninfo = "host=" + quote_conninfo_value(config.host);
    if (config.port != 0) {
        conninfo += std::format(" port={}", config.port);
    }
    if (!config.database.empty()) {
        conninfo += " dbname=" + quote_conninfo_value(config.database);
    }
    if (!config.username.empty()) {
        conninfo += " user=" + quote_conninfo_value(config.username);
    }
    if (!config.password.empty()) {
        conninfo += " password=" + quote_conninfo_value(config.password);
    }

    // libpq takes whole seconds
    const auto seconds = (config.connect_timeout.count() + 999) / 1000;
    conninfo += std::format(" connect_timeout={}", seconds > 0 ? seconds : 1);

    if (config.ssl_mode) {
        conninfo += " sslmode=" + quote_conninfo_value(*config.ssl_mode);
    }
    for (const auto& [key, value] : config.options) {
        if (utils::is_safe_identifier(key)) {
            conninfo += std::format(" {}={}", key, quote_conninfo_value(value));
        }
    }
    return conninfo;
}

} // namespace unidb
