#include "db/prepared_statement.hpp"
#include <format>

namespace unidb {

PreparedStatement::PreparedStatement(std::string sql, std::unique_ptr<IStatementDriver> driver)
    : sql_(std::move(sql)),
      driver_(std::move(driver)),
      parameter_count_(driver_->parameter_count()) {}

PreparedStatement::~PreparedStatement() {
    close();
}

Result<void> PreparedStatement::check_call(const std::vector<Value>& params) const {
    if (closed_) {
        return Result<void>::error(ErrorCode::VALIDATION_ERROR, "prepared statement is closed");
    }
    if (params.size() != parameter_count_) {
        return Result<void>::error(ErrorCode::VALIDATION_ERROR,
            std::format("expected {} parameters, got {}", parameter_count_, params.size()));
    }
    return Result<void>::ok();
}

Result<QueryResult> PreparedStatement::query(const std::vector<Value>& params) {
    if (auto check = check_call(params); check.is_error()) {
        return check.as_error<QueryResult>();
    }
    return driver_->query(params);
}

Result<ExecuteResult> PreparedStatement::execute(const std::vector<Value>& params) {
    if (auto check = check_call(params); check.is_error()) {
        return check.as_error<ExecuteResult>();
    }
    return driver_->execute(params);
}

void PreparedStatement::close() {
    if (closed_) return;
    closed_ = true;
    driver_->close();
}

} // namespace unidb
