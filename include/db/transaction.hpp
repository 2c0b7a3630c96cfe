#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace unidb {

/**
 * @brief Backend half of a transaction
 *
 * Adapters implement the raw statements (COMMIT, SAVEPOINT ...). They never
 * see a call that the state machine in Transaction has not already
 * validated, so drivers do no state or capability checking themselves.
 */
class ITransactionDriver {
public:
    virtual ~ITransactionDriver() = default;

    [[nodiscard]] virtual Result<QueryResult> query(const std::string& sql,
                                                    const std::vector<Value>& params) = 0;
    [[nodiscard]] virtual Result<ExecuteResult> execute(const std::string& sql,
                                                        const std::vector<Value>& params) = 0;

    [[nodiscard]] virtual Result<void> commit() = 0;
    [[nodiscard]] virtual Result<void> rollback() = 0;

    [[nodiscard]] virtual Result<void> savepoint(const std::string& name) = 0;
    [[nodiscard]] virtual Result<void> rollback_to_savepoint(const std::string& name) = 0;
    [[nodiscard]] virtual Result<void> release_savepoint(const std::string& name) = 0;

    [[nodiscard]] virtual Result<void> set_isolation_level(IsolationLevel level) = 0;
};

/**
 * @brief Capability-checked transaction state machine
 *
 * ACTIVE -> COMMITTED or ACTIVE -> ROLLED_BACK, both terminal. commit() and
 * rollback() consume the handle exactly once: afterwards every call fails
 * with VALIDATION_ERROR("transaction is not active").
 *
 * ACTIVE carries a stack of unique savepoint names. Savepoint calls on an
 * engine without DatabaseFeature::SAVEPOINTS fail with UNSUPPORTED_OPERATION
 * and never reach the driver.
 *
 * A transaction destroyed while still ACTIVE is rolled back.
 * Not thread-safe: one handle belongs to one caller.
 */
class Transaction {
public:
    enum class State { ACTIVE, COMMITTED, ROLLED_BACK };

    Transaction(std::unique_ptr<ITransactionDriver> driver,
                FeatureSet features,
                IsolationLevel isolation_level,
                bool read_only = false);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    [[nodiscard]] Result<QueryResult> query(const std::string& sql,
                                            const std::vector<Value>& params = {});
    [[nodiscard]] Result<ExecuteResult> execute(const std::string& sql,
                                                const std::vector<Value>& params = {});

    [[nodiscard]] Result<void> commit();
    [[nodiscard]] Result<void> rollback();

    [[nodiscard]] Result<void> savepoint(const std::string& name);

    /**
     * @brief Roll back to name; name and every later savepoint are removed
     */
    [[nodiscard]] Result<void> rollback_to_savepoint(const std::string& name);

    /**
     * @brief Release exactly name; later savepoints are kept
     */
    [[nodiscard]] Result<void> release_savepoint(const std::string& name);

    [[nodiscard]] Result<void> set_isolation_level(IsolationLevel level);

    [[nodiscard]] TransactionInfo info() const { return info_; }
    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] bool is_active() const { return state_ == State::ACTIVE; }
    [[nodiscard]] const std::vector<std::string>& savepoints() const { return info_.savepoints; }

private:
    [[nodiscard]] Result<void> check_active() const;
    [[nodiscard]] Result<void> check_savepoint_call(const std::string& name) const;
    [[nodiscard]] std::vector<std::string>::iterator find_savepoint(const std::string& name);

    std::unique_ptr<ITransactionDriver> driver_;
    FeatureSet features_;
    State state_ = State::ACTIVE;
    TransactionInfo info_;
};

} // namespace unidb
