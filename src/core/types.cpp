#include "core/types.hpp"
#include "core/utils.hpp"
#include <unordered_map>

namespace unidb {

std::string_view feature_to_string(DatabaseFeature feature) {
    switch (feature) {
        case DatabaseFeature::TRANSACTIONS:         return "transactions";
        case DatabaseFeature::SAVEPOINTS:           return "savepoints";
        case DatabaseFeature::PREPARED_STATEMENTS:  return "prepared_statements";
        case DatabaseFeature::SCHEMA_INTROSPECTION: return "schema_introspection";
        case DatabaseFeature::REPLICATION:          return "replication";
        case DatabaseFeature::DOCUMENT_STORE:       return "document_store";
        case DatabaseFeature::JSON_SUPPORT:         return "json_support";
        case DatabaseFeature::BATCHED_COMMANDS:     return "batched_commands";
        case DatabaseFeature::ACID:                 return "acid";
        case DatabaseFeature::EVENTUAL_CONSISTENCY: return "eventual_consistency";
        case DatabaseFeature::ISOLATION_LEVELS:     return "isolation_levels";
        default:                                    return "unknown";
    }
}

std::vector<DatabaseFeature> FeatureSet::to_vector() const {
    std::vector<DatabaseFeature> out;
    for (unsigned i = 0; i <= static_cast<unsigned>(DatabaseFeature::ISOLATION_LEVELS); ++i) {
        const auto f = static_cast<DatabaseFeature>(i);
        if (contains(f)) out.push_back(f);
    }
    return out;
}

// ============================================================================
// Statement classification
// ============================================================================

StatementType classify_statement(std::string_view statement) {
    size_t pos = 0;
    // Skip leading whitespace, parentheses and "--" line comments
    while (pos < statement.size()) {
        const char c = statement[pos];
        if (std::isspace(static_cast<unsigned char>(c)) || c == '(') {
            ++pos;
        } else if (c == '-' && pos + 1 < statement.size() && statement[pos + 1] == '-') {
            const auto eol = statement.find('\n', pos);
            if (eol == std::string_view::npos) return StatementType::UNKNOWN;
            pos = eol + 1;
        } else {
            break;
        }
    }

    size_t end = pos;
    while (end < statement.size() && std::isalpha(static_cast<unsigned char>(statement[end]))) {
        ++end;
    }
    const auto keyword = utils::to_upper(statement.substr(pos, end - pos));

    static const std::unordered_map<std::string, StatementType> lookup = {
        {"SELECT", StatementType::SELECT},
        {"WITH", StatementType::SELECT},
        {"VALUES", StatementType::SELECT},
        {"EXPLAIN", StatementType::SELECT},
        {"INSERT", StatementType::INSERT},
        {"REPLACE", StatementType::INSERT},
        {"UPDATE", StatementType::UPDATE},
        {"DELETE", StatementType::DELETE},
        {"CREATE", StatementType::CREATE},
        {"ALTER", StatementType::ALTER},
        {"DROP", StatementType::DROP},
        {"TRUNCATE", StatementType::TRUNCATE},
        {"CALL", StatementType::CALL},
        {"EXEC", StatementType::CALL},
        {"BEGIN", StatementType::TRANSACTION},
        {"START", StatementType::TRANSACTION},
        {"COMMIT", StatementType::TRANSACTION},
        {"ROLLBACK", StatementType::TRANSACTION},
        {"SAVEPOINT", StatementType::TRANSACTION},
        {"RELEASE", StatementType::TRANSACTION},
        {"SHOW", StatementType::SHOW},
        // Key-value verbs
        {"GET", StatementType::SELECT},
        {"EXISTS", StatementType::SELECT},
        {"KEYS", StatementType::SELECT},
        {"DEL", StatementType::DELETE},
    };

    if (keyword == "SET") {
        // "SET key value" writes a key; "SET name = value" / "SET LOCAL ..." is a session setting
        const auto tokens = utils::split_whitespace(statement.substr(pos));
        if (tokens.size() >= 3 && tokens[2] != "=" && !tokens[1].ends_with('=') &&
            !utils::iequals(tokens[1], "LOCAL") && !utils::iequals(tokens[1], "SESSION") &&
            !utils::iequals(tokens[1], "TRANSACTION")) {
            return StatementType::UPDATE;
        }
        return StatementType::SET;
    }

    if (const auto it = lookup.find(keyword); it != lookup.end()) {
        return it->second;
    }
    return StatementType::UNKNOWN;
}

std::string_view statement_type_to_string(StatementType type) {
    switch (type) {
        case StatementType::SELECT:      return "select";
        case StatementType::INSERT:      return "insert";
        case StatementType::UPDATE:      return "update";
        case StatementType::DELETE:      return "delete";
        case StatementType::CREATE:      return "create";
        case StatementType::ALTER:       return "alter";
        case StatementType::DROP:        return "drop";
        case StatementType::TRUNCATE:    return "truncate";
        case StatementType::CALL:        return "call";
        case StatementType::TRANSACTION: return "transaction";
        case StatementType::SET:         return "set";
        case StatementType::SHOW:        return "show";
        case StatementType::UNKNOWN:
        default:                         return "unknown";
    }
}

std::optional<StatementType> parse_statement_type(std::string_view name) {
    const auto lower = utils::to_lower(name);
    for (int i = 0; i <= static_cast<int>(StatementType::SHOW); ++i) {
        const auto t = static_cast<StatementType>(i);
        if (statement_type_to_string(t) == lower) return t;
    }
    return std::nullopt;
}

// ============================================================================
// Results, transactions, health, schema
// ============================================================================

std::optional<size_t> QueryResult::column_index(std::string_view name) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].name == name) return i;
    }
    return std::nullopt;
}

std::string_view isolation_level_to_sql(IsolationLevel level) {
    switch (level) {
        case IsolationLevel::READ_UNCOMMITTED: return "READ UNCOMMITTED";
        case IsolationLevel::READ_COMMITTED:   return "READ COMMITTED";
        case IsolationLevel::REPEATABLE_READ:  return "REPEATABLE READ";
        case IsolationLevel::SERIALIZABLE:     return "SERIALIZABLE";
        default:                               return "READ COMMITTED";
    }
}

std::string_view health_state_to_string(HealthState state) {
    switch (state) {
        case HealthState::HEALTHY:  return "healthy";
        case HealthState::DEGRADED: return "degraded";
        case HealthState::CRITICAL: return "critical";
        default:                    return "unknown";
    }
}

const TableInfo* DatabaseSchema::find_table(std::string_view name) const {
    for (const auto& table : tables) {
        if (table.name == name) return &table;
    }
    return nullptr;
}

std::string_view circuit_state_to_string(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED:    return "closed";
        case CircuitState::OPEN:      return "open";
        case CircuitState::HALF_OPEN: return "half_open";
        default:                      return "unknown";
    }
}

} // namespace unidb
