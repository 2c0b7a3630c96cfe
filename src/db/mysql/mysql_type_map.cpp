#include "db/mysql/mysql_type_map.hpp"

namespace unidb {

namespace {

constexpr unsigned int kBinaryCharset = 63;

} // namespace

ValueKind MysqlTypeMap::field_to_kind(const MYSQL_FIELD& field) {
    switch (field.type) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_YEAR:
            return ValueKind::INT64;
        case MYSQL_TYPE_LONGLONG:
            // BIGINT UNSIGNED may exceed INT64_MAX
            return (field.flags & UNSIGNED_FLAG) ? ValueKind::STRING : ValueKind::INT64;
        case MYSQL_TYPE_FLOAT:
        case MYSQL_TYPE_DOUBLE:
            return ValueKind::FLOAT64;
        case MYSQL_TYPE_JSON:
            return ValueKind::JSON;
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE:
        case MYSQL_TYPE_DATETIME:
        case MYSQL_TYPE_TIMESTAMP:
            return ValueKind::DATETIME;
        case MYSQL_TYPE_BLOB:
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
        case MYSQL_TYPE_STRING:
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_VARCHAR:
            return field.charsetnr == kBinaryCharset ? ValueKind::BINARY : ValueKind::STRING;
        case MYSQL_TYPE_BIT:
        case MYSQL_TYPE_GEOMETRY:
            return ValueKind::BINARY;
        default:
            return ValueKind::STRING;
    }
}

std::string MysqlTypeMap::field_type_name(enum_field_types field_type) {
    switch (field_type) {
        case MYSQL_TYPE_TINY:        return "tinyint";
        case MYSQL_TYPE_SHORT:       return "smallint";
        case MYSQL_TYPE_LONG:        return "int";
        case MYSQL_TYPE_INT24:       return "mediumint";
        case MYSQL_TYPE_LONGLONG:    return "bigint";
        case MYSQL_TYPE_FLOAT:       return "float";
        case MYSQL_TYPE_DOUBLE:      return "double";
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL:  return "decimal";
        case MYSQL_TYPE_STRING:      return "char";
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_VARCHAR:     return "varchar";
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
        case MYSQL_TYPE_BLOB:        return "blob";
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE:     return "date";
        case MYSQL_TYPE_TIME:        return "time";
        case MYSQL_TYPE_DATETIME:    return "datetime";
        case MYSQL_TYPE_TIMESTAMP:   return "timestamp";
        case MYSQL_TYPE_YEAR:        return "year";
        case MYSQL_TYPE_JSON:        return "json";
        case MYSQL_TYPE_BIT:         return "bit";
        case MYSQL_TYPE_ENUM:        return "enum";
        case MYSQL_TYPE_SET:         return "set";
        case MYSQL_TYPE_GEOMETRY:    return "geometry";
        case MYSQL_TYPE_NULL:        return "null";
        default:                     return "unknown";
    }
}

Result<Value> MysqlTypeMap::cell_to_value(ValueKind kind, std::string_view bytes) {
    if (kind == ValueKind::BINARY) {
        return Result<Value>::ok(Value(Binary(bytes.begin(), bytes.end())));
    }
    if (kind == ValueKind::DATETIME && bytes.starts_with("0000-00-00")) {
        return Result<Value>::ok(Value{});
    }
    return Value::from_text(kind, bytes);
}

std::string MysqlTypeMap::datetime_to_text(DateTime tp) {
    // "YYYY-MM-DDTHH:MM:SS.ffffffZ" -> "YYYY-MM-DD HH:MM:SS.ffffff"
    std::string text = format_datetime(tp);
    if (text.size() > 10 && text[10] == 'T') text[10] = ' ';
    if (!text.empty() && text.back() == 'Z') text.pop_back();
    return text;
}

} // namespace unidb
