#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"
#include <format>
#include <unordered_map>

namespace unidb {

ValueKind PgTypeMap::oid_to_kind(uint32_t oid) {
    static const std::unordered_map<uint32_t, ValueKind> OID_TO_KIND = {
        {kBool, ValueKind::BOOL},
        {kBytea, ValueKind::BINARY},
        {kInt8, ValueKind::INT64},
        {kInt2, ValueKind::INT64},
        {kInt4, ValueKind::INT64},
        {kOid, ValueKind::INT64},
        {kFloat4, ValueKind::FLOAT64},
        {kFloat8, ValueKind::FLOAT64},
        {kJson, ValueKind::JSON},
        {kJsonb, ValueKind::JSON},
        {kDate, ValueKind::DATETIME},
        {kTimestamp, ValueKind::DATETIME},
        {kTimestampTz, ValueKind::DATETIME},
    };

    const auto it = OID_TO_KIND.find(oid);
    return it != OID_TO_KIND.end() ? it->second : ValueKind::STRING;
}

std::string PgTypeMap::oid_to_type_name(uint32_t oid) {
    static const std::unordered_map<uint32_t, std::string> OID_NAMES = {
        {kBool, "boolean"},
        {kBytea, "bytea"},
        {kInt8, "bigint"},
        {kInt2, "smallint"},
        {kInt4, "integer"},
        {kText, "text"},
        {kOid, "oid"},
        {kJson, "json"},
        {kFloat4, "real"},
        {kFloat8, "double precision"},
        {kBpchar, "character"},
        {kVarchar, "character varying"},
        {kDate, "date"},
        {kTimestamp, "timestamp without time zone"},
        {kTimestampTz, "timestamp with time zone"},
        {kNumeric, "numeric"},
        {kUuid, "uuid"},
        {kJsonb, "jsonb"},
    };

    const auto it = OID_NAMES.find(oid);
    return it != OID_NAMES.end() ? it->second : std::format("oid:{}", oid);
}

Result<Value> PgTypeMap::cell_to_value(uint32_t oid, std::string_view text) {
    // timestamptz text carries an offset like "+00" that parse_datetime accepts
    return Value::from_text(oid_to_kind(oid), text);
}

Result<std::optional<std::string>> PgTypeMap::param_to_text(const Value& value) {
    using R = Result<std::optional<std::string>>;
    switch (value.kind()) {
        case ValueKind::NULL_VALUE:
            return R::ok(std::nullopt);
        case ValueKind::BINARY:
            return R::ok("\\x" + utils::bytes_to_hex(*value.get_if<Binary>()));
        default: {
            auto text = value.to_text();
            if (text.is_error()) {
                return text.as_error<std::optional<std::string>>();
            }
            return R::ok(std::move(text.value()));
        }
    }
}

} // namespace unidb
