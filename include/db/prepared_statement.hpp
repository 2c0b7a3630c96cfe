#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace unidb {

/**
 * @brief Backend half of a prepared statement
 */
class IStatementDriver {
public:
    virtual ~IStatementDriver() = default;

    [[nodiscard]] virtual size_t parameter_count() const = 0;
    [[nodiscard]] virtual Result<QueryResult> query(const std::vector<Value>& params) = 0;
    [[nodiscard]] virtual Result<ExecuteResult> execute(const std::vector<Value>& params) = 0;

    // Frees the server-side statement; called at most once
    virtual void close() = 0;
};

/**
 * @brief Prepared statement handle
 *
 * The parameter count is checked before the driver is contacted. The
 * server-side statement is freed on close() or destruction.
 */
class PreparedStatement {
public:
    PreparedStatement(std::string sql, std::unique_ptr<IStatementDriver> driver);
    ~PreparedStatement();

    PreparedStatement(const PreparedStatement&) = delete;
    PreparedStatement& operator=(const PreparedStatement&) = delete;

    [[nodiscard]] Result<QueryResult> query(const std::vector<Value>& params = {});
    [[nodiscard]] Result<ExecuteResult> execute(const std::vector<Value>& params = {});

    void close();

    [[nodiscard]] size_t parameter_count() const { return parameter_count_; }
    [[nodiscard]] const std::string& sql() const { return sql_; }
    [[nodiscard]] bool is_closed() const { return closed_; }

private:
    [[nodiscard]] Result<void> check_call(const std::vector<Value>& params) const;

    std::string sql_;
    std::unique_ptr<IStatementDriver> driver_;
    size_t parameter_count_;
    bool closed_ = false;
};

} // namespace unidb
