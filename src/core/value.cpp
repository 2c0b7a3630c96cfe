#include "core/value.hpp"
#include "core/utils.hpp"
#include <cmath>
#include <format>
#include <limits>

namespace unidb {

namespace {

constexpr int64_t kMaxExactDouble = int64_t{1} << 53;

template<typename T>
Result<T> conversion_error(ValueKind from, std::string_view to) {
    return Result<T>::error(ErrorCode::CONVERSION_ERROR,
        std::format("cannot convert {} to {}", value_kind_to_string(from), to));
}

std::optional<int> parse_fixed(std::string_view text, size_t pos, size_t len) {
    if (pos + len > text.size()) return std::nullopt;
    return utils::try_parse_int<int>(text.substr(pos, len));
}

} // namespace

std::string_view value_kind_to_string(ValueKind kind) {
    switch (kind) {
        case ValueKind::NULL_VALUE: return "null";
        case ValueKind::BOOL:       return "bool";
        case ValueKind::INT64:      return "int64";
        case ValueKind::FLOAT64:    return "float64";
        case ValueKind::STRING:     return "string";
        case ValueKind::BINARY:     return "binary";
        case ValueKind::JSON:       return "json";
        case ValueKind::DATETIME:   return "datetime";
        default:                    return "unknown";
    }
}

Value Value::json(Json v) {
    Value out;
    out.data_ = std::move(v);
    return out;
}

Result<Value> Value::from_unsigned(uint64_t v) {
    if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return Result<Value>::error(ErrorCode::CONVERSION_ERROR,
            std::format("unsigned value {} does not fit in int64", v));
    }
    return Result<Value>::ok(Value(static_cast<int64_t>(v)));
}

Result<Value> Value::from_text(ValueKind kind, std::string_view text) {
    switch (kind) {
        case ValueKind::NULL_VALUE:
            return Result<Value>::ok(Value{});
        case ValueKind::STRING:
            return Result<Value>::ok(Value(text));
        case ValueKind::BOOL: {
            const auto lower = utils::to_lower(text);
            if (lower == "t" || lower == "true" || lower == "1") return Result<Value>::ok(Value(true));
            if (lower == "f" || lower == "false" || lower == "0") return Result<Value>::ok(Value(false));
            break;
        }
        case ValueKind::INT64:
            if (const auto v = utils::try_parse_int<int64_t>(text)) {
                return Result<Value>::ok(Value(*v));
            }
            break;
        case ValueKind::FLOAT64: {
            if (text == "NaN") return Result<Value>::ok(Value(std::numeric_limits<double>::quiet_NaN()));
            if (text == "Infinity") return Result<Value>::ok(Value(std::numeric_limits<double>::infinity()));
            if (text == "-Infinity") return Result<Value>::ok(Value(-std::numeric_limits<double>::infinity()));
            if (const auto v = utils::try_parse_double(text)) {
                return Result<Value>::ok(Value(*v));
            }
            break;
        }
        case ValueKind::BINARY: {
            std::string_view hex = text;
            if (hex.starts_with("\\x")) hex.remove_prefix(2);
            if (auto bytes = utils::hex_to_bytes(hex)) {
                return Result<Value>::ok(Value(std::move(*bytes)));
            }
            break;
        }
        case ValueKind::JSON: {
            auto parsed = Json::parse(text, nullptr, false);
            if (!parsed.is_discarded()) {
                return Result<Value>::ok(Value::json(std::move(parsed)));
            }
            break;
        }
        case ValueKind::DATETIME: {
            auto dt = parse_datetime(text);
            if (dt.is_error()) return dt.as_error<Value>();
            return Result<Value>::ok(Value(dt.value()));
        }
    }
    return Result<Value>::error(ErrorCode::CONVERSION_ERROR,
        std::format("cannot parse '{}' as {}", text, value_kind_to_string(kind)));
}

Result<bool> Value::to_bool() const {
    if (const auto* b = get_if<bool>()) return Result<bool>::ok(*b);
    if (const auto* i = get_if<int64_t>()) {
        if (*i == 0 || *i == 1) return Result<bool>::ok(*i == 1);
    }
    if (const auto* s = get_if<std::string>()) {
        auto parsed = from_text(ValueKind::BOOL, *s);
        if (parsed.is_ok()) return Result<bool>::ok(*parsed.value().get_if<bool>());
    }
    return conversion_error<bool>(kind(), "bool");
}

Result<int64_t> Value::to_int64() const {
    if (const auto* i = get_if<int64_t>()) return Result<int64_t>::ok(*i);
    if (const auto* b = get_if<bool>()) return Result<int64_t>::ok(*b ? 1 : 0);
    if (const auto* d = get_if<double>()) {
        // Only integral doubles inside the exactly representable range convert
        if (std::isfinite(*d) && std::trunc(*d) == *d &&
            std::fabs(*d) <= static_cast<double>(kMaxExactDouble)) {
            return Result<int64_t>::ok(static_cast<int64_t>(*d));
        }
    }
    if (const auto* s = get_if<std::string>()) {
        if (const auto v = utils::try_parse_int<int64_t>(*s)) return Result<int64_t>::ok(*v);
    }
    return conversion_error<int64_t>(kind(), "int64");
}

Result<double> Value::to_double() const {
    if (const auto* d = get_if<double>()) return Result<double>::ok(*d);
    if (const auto* i = get_if<int64_t>()) {
        if (*i >= -kMaxExactDouble && *i <= kMaxExactDouble) {
            return Result<double>::ok(static_cast<double>(*i));
        }
    }
    if (const auto* s = get_if<std::string>()) {
        if (const auto v = utils::try_parse_double(*s)) return Result<double>::ok(*v);
    }
    return conversion_error<double>(kind(), "float64");
}

Result<std::string> Value::to_text() const {
    switch (kind()) {
        case ValueKind::BOOL:
            return Result<std::string>::ok(*get_if<bool>() ? "true" : "false");
        case ValueKind::INT64:
            return Result<std::string>::ok(std::to_string(*get_if<int64_t>()));
        case ValueKind::FLOAT64: {
            const double d = *get_if<double>();
            if (std::isnan(d)) return Result<std::string>::ok("NaN");
            if (std::isinf(d)) return Result<std::string>::ok(d > 0 ? "Infinity" : "-Infinity");
            // {} yields the shortest representation that round-trips
            return Result<std::string>::ok(std::format("{}", d));
        }
        case ValueKind::STRING:
            return Result<std::string>::ok(*get_if<std::string>());
        case ValueKind::JSON:
            return Result<std::string>::ok(get_if<Json>()->dump());
        case ValueKind::DATETIME:
            return Result<std::string>::ok(format_datetime(*get_if<DateTime>()));
        case ValueKind::NULL_VALUE:
        case ValueKind::BINARY:
        default:
            return conversion_error<std::string>(kind(), "text");
    }
}

Result<Binary> Value::to_binary() const {
    if (const auto* b = get_if<Binary>()) return Result<Binary>::ok(*b);
    if (const auto* s = get_if<std::string>()) {
        return Result<Binary>::ok(Binary(s->begin(), s->end()));
    }
    return conversion_error<Binary>(kind(), "binary");
}

Result<Json> Value::to_json() const {
    switch (kind()) {
        case ValueKind::JSON:     return Result<Json>::ok(*get_if<Json>());
        case ValueKind::NULL_VALUE: return Result<Json>::ok(Json(nullptr));
        case ValueKind::BOOL:     return Result<Json>::ok(Json(*get_if<bool>()));
        case ValueKind::INT64:    return Result<Json>::ok(Json(*get_if<int64_t>()));
        case ValueKind::FLOAT64:  return Result<Json>::ok(Json(*get_if<double>()));
        case ValueKind::STRING: {
            auto parsed = Json::parse(*get_if<std::string>(), nullptr, false);
            if (!parsed.is_discarded()) return Result<Json>::ok(std::move(parsed));
            break;
        }
        default:
            break;
    }
    return conversion_error<Json>(kind(), "json");
}

Result<DateTime> Value::to_datetime() const {
    if (const auto* dt = get_if<DateTime>()) return Result<DateTime>::ok(*dt);
    if (const auto* s = get_if<std::string>()) {
        auto parsed = parse_datetime(*s);
        if (parsed.is_ok()) return parsed;
    }
    return conversion_error<DateTime>(kind(), "datetime");
}

// ============================================================================
// DateTime text form
// ============================================================================

std::string format_datetime(DateTime tp) {
    using namespace std::chrono;
    const auto day = floor<days>(tp);
    const year_month_day ymd{day};
    const hh_mm_ss<microseconds> tod{tp - day};
    return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:06d}Z",
        static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()), tod.hours().count(), tod.minutes().count(),
        static_cast<long long>(tod.seconds().count()),
        static_cast<long long>(tod.subseconds().count()));
}

Result<DateTime> parse_datetime(std::string_view text) {
    using namespace std::chrono;
    const auto fail = [&]() {
        return Result<DateTime>::error(ErrorCode::CONVERSION_ERROR,
            std::format("invalid datetime '{}'", text));
    };

    if (text.size() < 10 || text[4] != '-' || text[7] != '-') return fail();
    const auto y = parse_fixed(text, 0, 4);
    const auto mo = parse_fixed(text, 5, 2);
    const auto d = parse_fixed(text, 8, 2);
    if (!y || !mo || !d) return fail();

    const year_month_day ymd{year{*y}, month{static_cast<unsigned>(*mo)},
                             day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) return fail();

    DateTime result = time_point_cast<microseconds>(sys_days{ymd});
    if (text.size() == 10) return Result<DateTime>::ok(result);

    if ((text[10] != 'T' && text[10] != ' ') || text.size() < 19 ||
        text[13] != ':' || text[16] != ':') {
        return fail();
    }
    const auto hh = parse_fixed(text, 11, 2);
    const auto mm = parse_fixed(text, 14, 2);
    const auto ss = parse_fixed(text, 17, 2);
    if (!hh || !mm || !ss || *hh > 23 || *mm > 59 || *ss > 60) return fail();
    result += hours{*hh} + minutes{*mm} + seconds{*ss};

    size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int64_t micros = 0;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            // Sub-microsecond digits would be lost, so they are rejected
            if (digits == 6) return fail();
            micros = micros * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return fail();
        for (int i = digits; i < 6; ++i) micros *= 10;
        result += microseconds{micros};
    }

    if (pos == text.size()) return Result<DateTime>::ok(result);

    if (text[pos] == 'Z' && pos + 1 == text.size()) return Result<DateTime>::ok(result);

    if (text[pos] == '+' || text[pos] == '-') {
        const int sign = text[pos] == '+' ? 1 : -1;
        const auto oh = parse_fixed(text, pos + 1, 2);
        if (!oh) return fail();
        int om = 0;
        size_t end = pos + 3;
        if (end < text.size()) {
            if (text[end] == ':') ++end;
            const auto parsed_min = parse_fixed(text, end, 2);
            if (!parsed_min) return fail();
            om = *parsed_min;
            end += 2;
        }
        if (end != text.size()) return fail();
        result -= sign * (hours{*oh} + minutes{om});
        return Result<DateTime>::ok(result);
    }

    return fail();
}

} // namespace unidb
