#pragma once

#include "config/config_types.hpp"
#include "db/db_connection.hpp"
#include <libpq-fe.h>
#include <memory>
#include <string>
#include <vector>

namespace unidb {

// RAII wrapper for PGresult
struct PGResultDeleter {
    void operator()(PGresult* res) const noexcept {
        if (res) {
            PQclear(res);
        }
    }
};
using PGResultPtr = std::unique_ptr<PGresult, PGResultDeleter>;

/**
 * @brief PostgreSQL connection over libpq
 *
 * Wraps PGconn* (owned). Parameters are sent in text format through
 * PQexecParams with $1..$n placeholders; cells come back in text format and
 * are decoded by PgTypeMap.
 */
class PgConnection : public DbConnection {
public:
    /**
     * @brief Take ownership of an established PGconn*
     */
    PgConnection(PGconn* conn, FeatureSet features);
    ~PgConnection() override;

    [[nodiscard]] Result<void> ping() override;
    [[nodiscard]] bool is_connected() const override;
    void close() override;

    /**
     * @brief Run a statement and keep the raw result
     *
     * Used by the transaction and statement drivers. Any status other than
     * TUPLES_OK / COMMAND_OK becomes QUERY_FAILED, or CONNECTION_FAILED
     * when the connection itself is gone.
     */
    [[nodiscard]] Result<PGResultPtr> exec(const std::string& sql,
                                           const std::vector<Value>& params = {});

    /**
     * @brief Check a PGresult returned by any libpq exec call
     */
    [[nodiscard]] Result<PGResultPtr> check_result(PGresult* raw);

    [[nodiscard]] static Result<QueryResult> to_query_result(PGresult* res);
    [[nodiscard]] static ExecuteResult to_execute_result(PGresult* res);

    [[nodiscard]] PGconn* native_handle() const { return conn_; }

    // Unique server-side name for the next prepared statement
    [[nodiscard]] std::string next_statement_name();

protected:
    [[nodiscard]] Result<QueryResult> do_query(const std::string& sql,
                                               const std::vector<Value>& params) override;
    [[nodiscard]] Result<ExecuteResult> do_execute(const std::string& sql,
                                                   const std::vector<Value>& params) override;
    [[nodiscard]] Result<std::unique_ptr<ITransactionDriver>> do_begin(
        IsolationLevel level, bool read_only) override;
    [[nodiscard]] Result<std::unique_ptr<IStatementDriver>> do_prepare(const std::string& sql) override;
    [[nodiscard]] Result<DatabaseSchema> do_get_schema() override;

private:
    PGconn* conn_;
    uint64_t statement_counter_ = 0;
};

/**
 * @brief Client-side copy of the server's savepoint stack
 *
 * PostgreSQL's RELEASE SAVEPOINT also destroys every savepoint created after
 * the named one. Releasing a savepoint that still has later ones on top is
 * only recorded here; the server keeps it until the transaction ends, and a
 * reused name resolves to the newest savepoint.
 */
class PgSavepointStack {
public:
    void push(const std::string& name) { names_.push_back(name); }

    // Drops name and everything after it
    void rollback_to(const std::string& name);

    /**
     * @brief Drop name from the stack
     * @return true when RELEASE SAVEPOINT must be sent to the server
     */
    [[nodiscard]] bool release(const std::string& name);

    [[nodiscard]] const std::vector<std::string>& names() const { return names_; }

private:
    std::vector<std::string> names_;
};

/**
 * @brief Build a libpq conninfo string; values are single-quoted and escaped
 */
[[nodiscard]] std::string build_pg_conninfo(const ConnectionConfig& config);

} // namespace unidb
