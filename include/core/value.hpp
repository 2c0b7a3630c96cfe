#pragma once

#include "core/error.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace unidb {

using Binary = std::vector<uint8_t>;
using Json = nlohmann::json;
using DateTime = std::chrono::sys_time<std::chrono::microseconds>;

enum class ValueKind {
    NULL_VALUE,
    BOOL,
    INT64,
    FLOAT64,
    STRING,
    BINARY,
    JSON,
    DATETIME
};

[[nodiscard]] std::string_view value_kind_to_string(ValueKind kind);

/**
 * @brief Backend-neutral value used for parameter binding and result cells
 *
 * Conversions between kinds succeed only when they are lossless; anything
 * else reports CONVERSION_ERROR instead of truncating.
 */
class Value {
public:
    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool v) : data_(v) {}
    template<std::signed_integral I>
        requires (!std::same_as<I, bool>)
    Value(I v) : data_(static_cast<int64_t>(v)) {}
    Value(double v) : data_(v) {}
    Value(std::string v) : data_(std::move(v)) {}
    Value(std::string_view v) : data_(std::string(v)) {}
    Value(const char* v) : data_(std::string(v)) {}
    Value(Binary v) : data_(std::move(v)) {}
    Value(DateTime v) : data_(v) {}

    // Json is constructible from almost anything, so it gets a named constructor
    static Value json(Json v);

    // Rejects values above INT64_MAX
    static Result<Value> from_unsigned(uint64_t v);

    /**
     * @brief Parse backend text into the requested kind
     *
     * Used by adapters that receive cells in text form. BINARY expects hex,
     * optionally prefixed with "\x"; DATETIME expects ISO 8601.
     */
    static Result<Value> from_text(ValueKind kind, std::string_view text);

    [[nodiscard]] ValueKind kind() const { return static_cast<ValueKind>(data_.index()); }
    [[nodiscard]] bool is_null() const { return kind() == ValueKind::NULL_VALUE; }

    template<typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data_); }

    [[nodiscard]] Result<bool> to_bool() const;
    [[nodiscard]] Result<int64_t> to_int64() const;
    [[nodiscard]] Result<double> to_double() const;
    [[nodiscard]] Result<std::string> to_text() const;
    [[nodiscard]] Result<Binary> to_binary() const;
    [[nodiscard]] Result<Json> to_json() const;
    [[nodiscard]] Result<DateTime> to_datetime() const;

    bool operator==(const Value& other) const = default;

private:
    std::variant<std::monostate, bool, int64_t, double, std::string, Binary, Json, DateTime> data_;
};

// ISO 8601 "YYYY-MM-DDTHH:MM:SS.ffffffZ"
[[nodiscard]] std::string format_datetime(DateTime tp);

// Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS[.f{1,6}]" ('T' or ' ' separator)
// with an optional "Z" or "+HH[:MM]" / "-HH[:MM]" offset
[[nodiscard]] Result<DateTime> parse_datetime(std::string_view text);

} // namespace unidb
