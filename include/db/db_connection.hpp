#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/command_batch.hpp"
#include "db/prepared_statement.hpp"
#include "db/transaction.hpp"
#include <memory>
#include <string>
#include <vector>

namespace unidb {

/**
 * @brief One live backend connection
 *
 * Public calls are non-virtual: they check the connection's FeatureSet,
 * stamp latency and last activity, then delegate to the protected do_*
 * hooks an adapter implements. A missing capability is reported as
 * UNSUPPORTED_OPERATION before any backend I/O.
 *
 * Not thread-safe; the pool hands a connection to one caller at a time.
 * Adapters close the native handle in their destructor.
 */
class DbConnection {
public:
    explicit DbConnection(FeatureSet features);
    virtual ~DbConnection() = default;

    DbConnection(const DbConnection&) = delete;
    DbConnection& operator=(const DbConnection&) = delete;

    [[nodiscard]] Result<QueryResult> query(const std::string& sql,
                                            const std::vector<Value>& params = {});
    [[nodiscard]] Result<ExecuteResult> execute(const std::string& sql,
                                                const std::vector<Value>& params = {});

    /**
     * @brief Open a transaction
     *
     * Fails with UNSUPPORTED_OPERATION without DatabaseFeature::TRANSACTIONS,
     * or when a non-default isolation level is requested from an engine
     * without DatabaseFeature::ISOLATION_LEVELS.
     */
    [[nodiscard]] Result<std::unique_ptr<Transaction>> begin_transaction(
        IsolationLevel level = IsolationLevel::READ_COMMITTED, bool read_only = false);

    [[nodiscard]] Result<std::unique_ptr<PreparedStatement>> prepare(const std::string& sql);

    /**
     * @brief Open a batched-command unit (DatabaseFeature::BATCHED_COMMANDS)
     */
    [[nodiscard]] Result<std::unique_ptr<CommandBatch>> begin_batch();

    [[nodiscard]] Result<DatabaseSchema> get_schema();
    [[nodiscard]] Result<TableInfo> get_table_schema(const std::string& table_name);

    [[nodiscard]] virtual Result<void> ping() = 0;
    [[nodiscard]] virtual bool is_connected() const = 0;
    virtual void close() = 0;

    [[nodiscard]] const ConnectionInfo& connection_info() const { return info_; }
    [[nodiscard]] const FeatureSet& features() const { return features_; }

protected:
    [[nodiscard]] virtual Result<QueryResult> do_query(const std::string& sql,
                                                       const std::vector<Value>& params) = 0;
    [[nodiscard]] virtual Result<ExecuteResult> do_execute(const std::string& sql,
                                                           const std::vector<Value>& params) = 0;

    // Defaults report UNSUPPORTED_OPERATION; adapters override what they advertise
    [[nodiscard]] virtual Result<std::unique_ptr<ITransactionDriver>> do_begin(
        IsolationLevel level, bool read_only);
    [[nodiscard]] virtual Result<std::unique_ptr<IStatementDriver>> do_prepare(const std::string& sql);
    [[nodiscard]] virtual Result<std::unique_ptr<IBatchDriver>> do_begin_batch();
    [[nodiscard]] virtual Result<DatabaseSchema> do_get_schema();
    [[nodiscard]] virtual Result<TableInfo> do_get_table_schema(const std::string& table_name);

    void touch() { info_.last_activity = std::chrono::system_clock::now(); }

    ConnectionInfo info_;

private:
    FeatureSet features_;
};

} // namespace unidb
