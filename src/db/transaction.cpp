#include "db/transaction.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>

namespace unidb {

namespace {

const char* const kNotActive = "transaction is not active";

} // namespace

Transaction::Transaction(std::unique_ptr<ITransactionDriver> driver,
                         FeatureSet features,
                         IsolationLevel isolation_level,
                         bool read_only)
    : driver_(std::move(driver)),
      features_(features) {
    info_.id = utils::generate_uuid();
    info_.isolation_level = isolation_level;
    info_.started_at = std::chrono::system_clock::now();
    info_.read_only = read_only;
}

Transaction::~Transaction() {
    if (state_ != State::ACTIVE || !driver_) {
        return;
    }
    state_ = State::ROLLED_BACK;
    const auto result = driver_->rollback();
    if (result.is_ok()) {
        utils::log::warn(std::format("Transaction {} dropped while active; rolled back", info_.id));
    } else {
        utils::log::error(std::format("Transaction {} dropped while active; rollback failed: {}",
            info_.id, result.error_message()));
    }
}

Result<void> Transaction::check_active() const {
    if (state_ != State::ACTIVE) {
        return Result<void>::error(ErrorCode::VALIDATION_ERROR, kNotActive);
    }
    return Result<void>::ok();
}

Result<void> Transaction::check_savepoint_call(const std::string& name) const {
    if (!features_.contains(DatabaseFeature::SAVEPOINTS)) {
        return Result<void>::error(ErrorCode::UNSUPPORTED_OPERATION,
            "savepoints are not supported by this engine");
    }
    if (auto active = check_active(); active.is_error()) {
        return active;
    }
    if (!utils::is_safe_identifier(name)) {
        return Result<void>::error(ErrorCode::VALIDATION_ERROR,
            std::format("invalid savepoint name '{}'", name));
    }
    return Result<void>::ok();
}

std::vector<std::string>::iterator Transaction::find_savepoint(const std::string& name) {
    return std::find(info_.savepoints.begin(), info_.savepoints.end(), name);
}

Result<QueryResult> Transaction::query(const std::string& sql, const std::vector<Value>& params) {
    if (auto active = check_active(); active.is_error()) {
        return active.as_error<QueryResult>();
    }
    return driver_->query(sql, params);
}

Result<ExecuteResult> Transaction::execute(const std::string& sql, const std::vector<Value>& params) {
    if (auto active = check_active(); active.is_error()) {
        return active.as_error<ExecuteResult>();
    }
    if (info_.read_only && stmt_mask::test(classify_statement(sql), stmt_mask::kWrite)) {
        return Result<ExecuteResult>::error(ErrorCode::VALIDATION_ERROR,
            "write statement in read-only transaction");
    }
    return driver_->execute(sql, params);
}

Result<void> Transaction::commit() {
    if (auto active = check_active(); active.is_error()) {
        return active;
    }

    auto result = driver_->commit();
    if (result.is_ok()) {
        state_ = State::COMMITTED;
        info_.savepoints.clear();
        return result;
    }

    // The handle is consumed either way; make sure the backend is not left mid-transaction
    state_ = State::ROLLED_BACK;
    info_.savepoints.clear();
    if (const auto rb = driver_->rollback(); rb.is_error()) {
        utils::log::warn(std::format("Rollback after failed commit of {} failed: {}",
            info_.id, rb.error_message()));
    }
    return Result<void>::error(ErrorCode::TRANSACTION_FAILED,
        std::format("commit failed: {}", result.error_message()));
}

Result<void> Transaction::rollback() {
    if (auto active = check_active(); active.is_error()) {
        return active;
    }

    state_ = State::ROLLED_BACK;
    info_.savepoints.clear();
    auto result = driver_->rollback();
    if (result.is_error()) {
        return Result<void>::error(ErrorCode::TRANSACTION_FAILED,
            std::format("rollback failed: {}", result.error_message()));
    }
    return result;
}

Result<void> Transaction::savepoint(const std::string& name) {
    if (auto check = check_savepoint_call(name); check.is_error()) {
        return check;
    }
    if (find_savepoint(name) != info_.savepoints.end()) {
        return Result<void>::error(ErrorCode::VALIDATION_ERROR,
            std::format("savepoint '{}' already exists", name));
    }

    auto result = driver_->savepoint(name);
    if (result.is_ok()) {
        info_.savepoints.push_back(name);
    }
    return result;
}

Result<void> Transaction::rollback_to_savepoint(const std::string& name) {
    if (auto check = check_savepoint_call(name); check.is_error()) {
        return check;
    }
    if (find_savepoint(name) == info_.savepoints.end()) {
        return Result<void>::error(ErrorCode::VALIDATION_ERROR,
            std::format("savepoint '{}' does not exist", name));
    }

    auto result = driver_->rollback_to_savepoint(name);
    if (result.is_ok()) {
        // The driver call may not touch the stack, so look the name up again
        info_.savepoints.erase(find_savepoint(name), info_.savepoints.end());
    }
    return result;
}

Result<void> Transaction::release_savepoint(const std::string& name) {
    if (auto check = check_savepoint_call(name); check.is_error()) {
        return check;
    }
    if (find_savepoint(name) == info_.savepoints.end()) {
        return Result<void>::error(ErrorCode::VALIDATION_ERROR,
            std::format("savepoint '{}' does not exist", name));
    }

    auto result = driver_->release_savepoint(name);
    if (result.is_ok()) {
        info_.savepoints.erase(find_savepoint(name));
    }
    return result;
}

Result<void> Transaction::set_isolation_level(IsolationLevel level) {
    if (!features_.contains(DatabaseFeature::ISOLATION_LEVELS)) {
        return Result<void>::error(ErrorCode::UNSUPPORTED_OPERATION,
            "isolation levels are not supported by this engine");
    }
    if (auto active = check_active(); active.is_error()) {
        return active;
    }

    auto result = driver_->set_isolation_level(level);
    if (result.is_ok()) {
        info_.isolation_level = level;
    }
    return result;
}

} // namespace unidb
