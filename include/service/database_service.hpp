#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "db/command_batch.hpp"
#include "db/pool_manager.hpp"
#include "db/transaction.hpp"
#include "safety/safety_manager.hpp"
#include "security/query_validator.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace unidb {

/**
 * @brief Whether a failed operation leaves its connection unusable
 *
 * Such a lease is marked broken and closed by the pool instead of reused.
 */
[[nodiscard]] bool breaks_connection(ErrorCode code);

/**
 * @brief A transaction bound to its pooled connection
 *
 * Owns the lease for as long as the transaction lives; the transaction is
 * torn down (rolled back if still active) before the connection goes back
 * to the pool. Every call runs through SafetyManager::safe_execute with the
 * database's query timeout.
 *
 * After a timed-out or connection-breaking call the session is abandoned:
 * the connection is marked broken, further calls fail with
 * TRANSACTION_FAILED, and the backend rolls the transaction back when the
 * connection closes.
 *
 * Not thread-safe: one session belongs to one caller.
 */
class TransactionSession {
public:
    ~TransactionSession() = default;

    TransactionSession(const TransactionSession&) = delete;
    TransactionSession& operator=(const TransactionSession&) = delete;

    [[nodiscard]] Result<QueryResult> query(const std::string& sql,
                                            const std::vector<Value>& params = {});
    [[nodiscard]] Result<ExecuteResult> execute(const std::string& sql,
                                                const std::vector<Value>& params = {});

    [[nodiscard]] Result<void> commit();
    [[nodiscard]] Result<void> rollback();

    [[nodiscard]] Result<void> savepoint(const std::string& name);
    [[nodiscard]] Result<void> rollback_to_savepoint(const std::string& name);
    [[nodiscard]] Result<void> release_savepoint(const std::string& name);
    [[nodiscard]] Result<void> set_isolation_level(IsolationLevel level);

    // Snapshot as of the last completed call
    [[nodiscard]] const TransactionInfo& info() const { return info_; }
    [[nodiscard]] bool is_active() const { return !abandoned_ && active_; }
    [[nodiscard]] bool is_abandoned() const { return abandoned_; }

private:
    friend class DatabaseService;

    // Declaration order matters: the transaction is destroyed first
    struct State {
        std::unique_ptr<PooledConnection> lease;
        std::unique_ptr<Transaction> tx;
    };

    TransactionSession(std::shared_ptr<State> state,
                       std::shared_ptr<SafetyManager> safety,
                       std::shared_ptr<IQueryValidator> validator,
                       CallerContext context,
                       std::chrono::milliseconds budget);

    template<typename T, typename Fn>
    [[nodiscard]] Result<T> run(std::string_view operation, Fn fn);

    std::shared_ptr<State> state_;
    std::shared_ptr<SafetyManager> safety_;
    std::shared_ptr<IQueryValidator> validator_;
    CallerContext context_;
    std::chrono::milliseconds budget_;

    TransactionInfo info_;
    bool active_ = true;
    bool abandoned_ = false;
};

/**
 * @brief Caller-facing data-access service
 *
 * Holds one pool per configured database and an active database that the
 * caller-facing operations target. Each operation:
 *   1. runs the pre-flight validators (the database's LocalQueryGuard, then
 *      the external validator); DENIED fails with SECURITY_VIOLATION before
 *      the pool is touched
 *   2. leases a connection through safe_pool_operation
 *   3. runs the backend call through safe_execute with the database's
 *      query timeout
 *   4. returns the lease, or closes it if the call broke the connection
 *
 * Thread-safe. The database map is guarded by a shared_mutex; no lock is
 * held across backend I/O.
 */
class DatabaseService {
public:
    explicit DatabaseService(std::shared_ptr<SafetyManager> safety,
                             std::shared_ptr<IQueryValidator> validator = nullptr);
    ~DatabaseService();

    DatabaseService(const DatabaseService&) = delete;
    DatabaseService& operator=(const DatabaseService&) = delete;

    /**
     * @brief Build a service from a loaded config
     *
     * Registers the built-in engines, adds every [[databases]] entry,
     * activates active_database (or the first entry) and starts pool
     * maintenance when configured.
     */
    [[nodiscard]] static Result<std::unique_ptr<DatabaseService>> from_config(
        const CoreConfig& config,
        std::shared_ptr<IQueryValidator> validator = nullptr);

    // ========================================================================
    // Databases
    // ========================================================================

    /**
     * @brief Add a database whose engine comes from EngineRegistry
     *
     * The first database added becomes the active one.
     */
    [[nodiscard]] Result<void> add_database(const DatabaseConfig& config);

    /**
     * @brief Add a database backed by an explicit engine instance
     */
    [[nodiscard]] Result<void> add_database(const DatabaseConfig& config,
                                            std::shared_ptr<IDbEngine> engine);

    /**
     * @brief Drain and remove a database. Removing the active database
     * leaves no database active.
     */
    bool remove_database(const std::string& name);

    /**
     * @brief Make name the target of subsequent operations
     * @return CONFIGURATION_ERROR if name is not registered
     */
    [[nodiscard]] Result<void> switch_engine(const std::string& name);

    [[nodiscard]] std::optional<std::string> active_database() const;
    [[nodiscard]] std::vector<std::string> database_names() const;

    // ========================================================================
    // Caller-facing operations (active database)
    // ========================================================================

    [[nodiscard]] Result<QueryResult> execute_query(const std::string& sql,
                                                    const std::vector<Value>& params = {},
                                                    const CallerContext& context = {});

    [[nodiscard]] Result<ExecuteResult> execute_command(const std::string& sql,
                                                        const std::vector<Value>& params = {},
                                                        const CallerContext& context = {});

    [[nodiscard]] Result<DatabaseSchema> get_schema(const CallerContext& context = {});

    [[nodiscard]] Result<std::unique_ptr<TransactionSession>> begin_transaction(
        IsolationLevel level = IsolationLevel::READ_COMMITTED,
        bool read_only = false,
        const CallerContext& context = {});

    /**
     * @brief Apply commands atomically through a CommandBatch
     *
     * For engines with BATCHED_COMMANDS; every command is pre-flight checked
     * before the batch is opened.
     * @return One Value per command
     */
    [[nodiscard]] Result<std::vector<Value>> execute_batch(
        const std::vector<IBatchDriver::Command>& commands,
        const CallerContext& context = {});

    // ========================================================================
    // Health & introspection
    // ========================================================================

    [[nodiscard]] std::vector<std::pair<std::string, HealthStatus>> health_check_all() const;

    [[nodiscard]] Result<PoolStats> pool_stats(const std::string& name) const;

    PoolManager& pools() { return pools_; }
    const std::shared_ptr<SafetyManager>& safety() const { return safety_; }

private:
    struct Database {
        DatabaseConfig config;
        std::shared_ptr<ConnectionPool> pool;
        std::shared_ptr<IQueryValidator> validator;  // Local guard + external
    };

    [[nodiscard]] Result<std::shared_ptr<Database>> active() const;

    [[nodiscard]] Result<void> preflight(const Database& db,
                                         std::string_view statement,
                                         const CallerContext& context) const;

    [[nodiscard]] Result<std::unique_ptr<PooledConnection>> lease(const Database& db);

    template<typename T, typename Fn>
    [[nodiscard]] Result<T> with_connection(const Database& db, std::string_view operation, Fn fn);

    std::shared_ptr<SafetyManager> safety_;
    std::shared_ptr<IQueryValidator> validator_;
    PoolManager pools_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Database>> databases_;
    std::optional<std::string> active_;
};

} // namespace unidb
