#include "db/command_batch.hpp"

namespace unidb {

namespace {

const char* const kNotOpen = "batch is not open";

} // namespace

CommandBatch::CommandBatch(std::unique_ptr<IBatchDriver> driver)
    : driver_(std::move(driver)) {}

Result<void> CommandBatch::queue(const std::string& command, const std::vector<Value>& params) {
    if (state_ != State::OPEN) {
        return Result<void>::error(ErrorCode::VALIDATION_ERROR, kNotOpen);
    }
    if (auto valid = driver_->validate(command, params); valid.is_error()) {
        return valid;
    }
    commands_.push_back({command, params});
    return Result<void>::ok();
}

Result<std::vector<Value>> CommandBatch::commit() {
    if (state_ != State::OPEN) {
        return Result<std::vector<Value>>::error(ErrorCode::VALIDATION_ERROR, kNotOpen);
    }
    state_ = State::COMMITTED;
    auto result = driver_->apply(commands_);
    commands_.clear();
    if (result.is_error()) {
        state_ = State::DISCARDED;
    }
    return result;
}

Result<void> CommandBatch::discard() {
    if (state_ != State::OPEN) {
        return Result<void>::error(ErrorCode::VALIDATION_ERROR, kNotOpen);
    }
    state_ = State::DISCARDED;
    commands_.clear();
    return Result<void>::ok();
}

} // namespace unidb
