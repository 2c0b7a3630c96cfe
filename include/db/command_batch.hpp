#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace unidb {

/**
 * @brief Backend half of a batched-command unit
 *
 * validate() runs at queue time; apply() runs every queued command as one
 * unit at commit time and returns one Value per command.
 */
class IBatchDriver {
public:
    virtual ~IBatchDriver() = default;

    [[nodiscard]] virtual Result<void> validate(const std::string& command,
                                                const std::vector<Value>& params) = 0;

    struct Command {
        std::string text;
        std::vector<Value> params;
    };
    [[nodiscard]] virtual Result<std::vector<Value>> apply(const std::vector<Command>& commands) = 0;
};

/**
 * @brief Atomic multi-command primitive for engines without transactions
 *
 * OPEN -> COMMITTED or OPEN -> DISCARDED. There are no isolation levels and
 * no partial rollback: either every queued command is applied by commit()
 * or none is. A batch destroyed while OPEN is discarded.
 */
class CommandBatch {
public:
    enum class State { OPEN, COMMITTED, DISCARDED };

    explicit CommandBatch(std::unique_ptr<IBatchDriver> driver);
    ~CommandBatch() = default;

    CommandBatch(const CommandBatch&) = delete;
    CommandBatch& operator=(const CommandBatch&) = delete;

    [[nodiscard]] Result<void> queue(const std::string& command,
                                     const std::vector<Value>& params = {});
    [[nodiscard]] Result<std::vector<Value>> commit();
    [[nodiscard]] Result<void> discard();

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] size_t size() const { return commands_.size(); }

private:
    std::unique_ptr<IBatchDriver> driver_;
    std::vector<IBatchDriver::Command> commands_;
    State state_ = State::OPEN;
};

} // namespace unidb
