#pragma once

#include "core/error.hpp"
#include "core/value.hpp"
#include <mysql/mysql.h>
#include <string>
#include <string_view>

namespace unidb {

/**
 * @brief MySQL type mapping utilities
 *
 * Maps MySQL field types to ValueKind and decodes cells, which arrive as
 * raw bytes from both the text protocol and string-bound statement results.
 */
class MysqlTypeMap {
public:
    /**
     * @brief Map a result field to the Value kind its cells decode to
     *
     * BLOB-family fields with the binary charset (63) decode as BINARY,
     * other BLOB-family fields (TEXT columns) as STRING. DECIMAL decodes as
     * STRING to stay lossless.
     */
    [[nodiscard]] static ValueKind field_to_kind(const MYSQL_FIELD& field);

    /**
     * @brief Lowercase type name for ColumnInfo::data_type
     */
    [[nodiscard]] static std::string field_type_name(enum_field_types field_type);

    /**
     * @brief Decode one cell
     *
     * BINARY takes the bytes verbatim. Zero dates ("0000-00-00") decode
     * as NULL.
     */
    [[nodiscard]] static Result<Value> cell_to_value(ValueKind kind, std::string_view bytes);

    /**
     * @brief DATETIME literal MySQL accepts: "YYYY-MM-DD HH:MM:SS.ffffff"
     */
    [[nodiscard]] static std::string datetime_to_text(DateTime tp);
};

} // namespace unidb
