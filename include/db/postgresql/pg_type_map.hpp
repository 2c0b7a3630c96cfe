#pragma once

#include "core/error.hpp"
#include "core/value.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace unidb {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps result column OIDs to ValueKind and converts between Value and the
 * libpq text format used for parameters and result cells.
 */
class PgTypeMap {
public:
    // Built-in type OIDs (pg_type.dat)
    static constexpr uint32_t kBool = 16;
    static constexpr uint32_t kBytea = 17;
    static constexpr uint32_t kInt8 = 20;
    static constexpr uint32_t kInt2 = 21;
    static constexpr uint32_t kInt4 = 23;
    static constexpr uint32_t kText = 25;
    static constexpr uint32_t kOid = 26;
    static constexpr uint32_t kJson = 114;
    static constexpr uint32_t kFloat4 = 700;
    static constexpr uint32_t kFloat8 = 701;
    static constexpr uint32_t kBpchar = 1042;
    static constexpr uint32_t kVarchar = 1043;
    static constexpr uint32_t kDate = 1082;
    static constexpr uint32_t kTimestamp = 1114;
    static constexpr uint32_t kTimestampTz = 1184;
    static constexpr uint32_t kNumeric = 1700;
    static constexpr uint32_t kUuid = 2950;
    static constexpr uint32_t kJsonb = 3802;

    /**
     * @brief Map a result column OID to the Value kind its cells decode to
     *
     * NUMERIC and every type without a lossless native mapping decode as
     * STRING.
     */
    [[nodiscard]] static ValueKind oid_to_kind(uint32_t oid);

    /**
     * @brief Short type name for ColumnInfo::data_type
     * @return "oid:<n>" for types not in the table
     */
    [[nodiscard]] static std::string oid_to_type_name(uint32_t oid);

    /**
     * @brief Decode one text-format cell
     */
    [[nodiscard]] static Result<Value> cell_to_value(uint32_t oid, std::string_view text);

    /**
     * @brief Encode a parameter in text format
     * @return std::nullopt for NULL; BINARY as "\x<hex>"
     */
    [[nodiscard]] static Result<std::optional<std::string>> param_to_text(const Value& value);
};

} // namespace unidb
