#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace unidb {

/**
 * @brief Who is asking. Passed through to the validator untouched.
 */
struct CallerContext {
    std::string user_id;
    std::string session_id;
    std::string source_ip;
    std::string client_info;
};

enum class ValidationVerdict : uint8_t { APPROVED, DENIED, WARNING };

inline const char* validation_verdict_to_string(ValidationVerdict verdict) {
    switch (verdict) {
        case ValidationVerdict::APPROVED: return "approved";
        case ValidationVerdict::DENIED:   return "denied";
        case ValidationVerdict::WARNING:  return "warning";
        default:                          return "denied";
    }
}

struct ValidationResult {
    ValidationVerdict verdict = ValidationVerdict::APPROVED;
    std::string message;  // Denial reason or warning text

    static ValidationResult approved() { return {}; }
    static ValidationResult denied(std::string reason) {
        return {ValidationVerdict::DENIED, std::move(reason)};
    }
    static ValidationResult warning(std::string message) {
        return {ValidationVerdict::WARNING, std::move(message)};
    }

    [[nodiscard]] bool is_denied() const { return verdict == ValidationVerdict::DENIED; }
};

/**
 * @brief Pre-flight "is this statement allowed" check
 *
 * Runs before the pool is touched. DENIED short-circuits the call with
 * SECURITY_VIOLATION; WARNING is logged and the call proceeds.
 * Implementations must be thread-safe.
 */
class IQueryValidator {
public:
    virtual ~IQueryValidator() = default;

    [[nodiscard]] virtual ValidationResult validate(std::string_view statement,
                                                    const CallerContext& context) = 0;
};

/**
 * @brief Per-database limits from SecurityConfig
 *
 * Rejects statements longer than max_query_length and statements whose
 * class (see classify_statement) is not in allowed_operations. Unknown
 * statement classes are denied. A disabled config approves everything.
 */
class LocalQueryGuard : public IQueryValidator {
public:
    explicit LocalQueryGuard(const SecurityConfig& config);

    [[nodiscard]] ValidationResult validate(std::string_view statement,
                                            const CallerContext& context) override;

    [[nodiscard]] bool is_allowed(StatementType type) const {
        return (allowed_mask_ & stmt_mask::bit(type)) != 0;
    }

private:
    SecurityConfig config_;
    uint16_t allowed_mask_ = 0;
};

/**
 * @brief Runs validators in order: first DENIED wins, warnings are joined
 */
class ValidatorChain : public IQueryValidator {
public:
    void add(std::shared_ptr<IQueryValidator> validator);

    [[nodiscard]] ValidationResult validate(std::string_view statement,
                                            const CallerContext& context) override;

    [[nodiscard]] size_t size() const { return validators_.size(); }

private:
    std::vector<std::shared_ptr<IQueryValidator>> validators_;
};

} // namespace unidb
