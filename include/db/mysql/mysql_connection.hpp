#pragma once

#include "config/config_types.hpp"
#include "db/db_connection.hpp"
#include <mysql/mysql.h>
#include <string>
#include <vector>

namespace unidb {

/**
 * @brief MySQL / MariaDB connection over the C API
 *
 * Wraps MYSQL* (owned). Statements without parameters use the text
 * protocol (mysql_query + mysql_store_result); statements with parameters
 * go through a one-shot server-side statement with mysql_stmt binds.
 */
class MysqlConnection : public DbConnection {
public:
    /**
     * @brief Take ownership of a connected MYSQL*
     */
    MysqlConnection(MYSQL* conn, FeatureSet features, const ConnectionConfig& config);
    ~MysqlConnection() override;

    [[nodiscard]] Result<void> ping() override;
    [[nodiscard]] bool is_connected() const override;
    void close() override;

    /**
     * @brief Run a statement that returns no rows
     */
    [[nodiscard]] Result<void> run(const std::string& sql);

    /**
     * @brief Wrap a client error number: CONNECTION_FAILED when the server
     * is gone (the connection then reports disconnected), else QUERY_FAILED
     */
    template<typename T>
    [[nodiscard]] Result<T> fail(unsigned int err, const std::string& message) {
        return Result<T>::error(classify_error(err), message);
    }

    [[nodiscard]] ErrorCode classify_error(unsigned int err);

    [[nodiscard]] MYSQL* native_handle() const { return conn_; }

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
    [[nodiscard]] Result<QueryResult> query_text(const std::string& sql);

    MYSQL* conn_;
    bool lost_ = false;
};

} // namespace unidb
