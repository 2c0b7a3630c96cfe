#include "security/query_validator.hpp"
#include <format>

namespace unidb {

LocalQueryGuard::LocalQueryGuard(const SecurityConfig& config)
    : config_(config) {
    for (const auto type : config_.allowed_operations) {
        allowed_mask_ |= stmt_mask::bit(type);
    }
}

ValidationResult LocalQueryGuard::validate(std::string_view statement,
                                           const CallerContext& /*context*/) {
    if (!config_.enabled) {
        return ValidationResult::approved();
    }

    if (statement.size() > config_.max_query_length) {
        return ValidationResult::denied(std::format(
            "statement length {} exceeds limit {}", statement.size(), config_.max_query_length));
    }

    const StatementType type = classify_statement(statement);
    if (type == StatementType::UNKNOWN) {
        return ValidationResult::denied("unrecognized statement");
    }
    if (!is_allowed(type)) {
        return ValidationResult::denied(std::format(
            "statement type '{}' is not allowed", statement_type_to_string(type)));
    }
    return ValidationResult::approved();
}

void ValidatorChain::add(std::shared_ptr<IQueryValidator> validator) {
    if (validator) {
        validators_.push_back(std::move(validator));
    }
}

ValidationResult ValidatorChain::validate(std::string_view statement,
                                          const CallerContext& context) {
    std::string warnings;
    for (const auto& validator : validators_) {
        auto result = validator->validate(statement, context);
        if (result.verdict == ValidationVerdict::DENIED) {
            return result;
        }
        if (result.verdict == ValidationVerdict::WARNING) {
            if (!warnings.empty()) warnings += "; ";
            warnings += result.message;
        }
    }
    if (!warnings.empty()) {
        return ValidationResult::warning(std::move(warnings));
    }
    return ValidationResult::approved();
}

} // namespace unidb
