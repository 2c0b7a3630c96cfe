#pragma once

#include "core/value.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace unidb {

// ============================================================================
// Capabilities
// ============================================================================

enum class DatabaseFeature : uint8_t {
    TRANSACTIONS,
    SAVEPOINTS,
    PREPARED_STATEMENTS,
    SCHEMA_INTROSPECTION,
    REPLICATION,
    DOCUMENT_STORE,
    JSON_SUPPORT,
    BATCHED_COMMANDS,
    ACID,
    EVENTUAL_CONSISTENCY,
    ISOLATION_LEVELS
};

[[nodiscard]] std::string_view feature_to_string(DatabaseFeature feature);

/**
 * @brief Set of DatabaseFeature flags, one bit per feature
 *
 * Membership checks are a single AND, so the capability gate in front of
 * every transactional call costs nothing measurable.
 */
class FeatureSet {
public:
    constexpr FeatureSet() = default;
    constexpr FeatureSet(std::initializer_list<DatabaseFeature> features) {
        for (const auto f : features) bits_ |= bit(f);
    }

    [[nodiscard]] constexpr bool contains(DatabaseFeature f) const noexcept {
        return (bits_ & bit(f)) != 0;
    }
    constexpr void insert(DatabaseFeature f) noexcept { bits_ |= bit(f); }
    constexpr void erase(DatabaseFeature f) noexcept { bits_ &= ~bit(f); }
    [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }
    [[nodiscard]] constexpr uint32_t bits() const noexcept { return bits_; }

    [[nodiscard]] std::vector<DatabaseFeature> to_vector() const;

    constexpr bool operator==(const FeatureSet&) const = default;

private:
    static constexpr uint32_t bit(DatabaseFeature f) noexcept {
        return 1u << static_cast<unsigned>(f);
    }

    uint32_t bits_ = 0;
};

// ============================================================================
// Statement classification
// ============================================================================

enum class StatementType {
    UNKNOWN,
    SELECT,
    INSERT,
    UPDATE,
    DELETE,
    CREATE,
    ALTER,
    DROP,
    TRUNCATE,
    CALL,
    TRANSACTION,
    SET,
    SHOW
};

// Each StatementType maps to a bit; category membership is one AND
namespace stmt_mask {
    inline constexpr uint16_t bit(StatementType t) noexcept {
        return static_cast<uint16_t>(1u << static_cast<int>(t));
    }
    inline constexpr uint16_t kDML =
        bit(StatementType::INSERT) | bit(StatementType::UPDATE) | bit(StatementType::DELETE);
    inline constexpr uint16_t kDDL =
        bit(StatementType::CREATE) | bit(StatementType::ALTER) |
        bit(StatementType::DROP) | bit(StatementType::TRUNCATE);
    inline constexpr uint16_t kWrite = kDML | kDDL;
    [[nodiscard]] inline constexpr bool test(StatementType t, uint16_t mask) noexcept {
        return (mask & bit(t)) != 0;
    }
}

/**
 * @brief Classify a statement by its leading keyword
 *
 * Key-value verbs map onto the nearest SQL class (GET/EXISTS/KEYS read,
 * SET writes, DEL deletes) so one allow-list covers every engine.
 */
[[nodiscard]] StatementType classify_statement(std::string_view statement);

[[nodiscard]] std::string_view statement_type_to_string(StatementType type);
[[nodiscard]] std::optional<StatementType> parse_statement_type(std::string_view name);

// ============================================================================
// Query results
// ============================================================================

struct ColumnInfo {
    std::string name;
    std::string data_type;
    bool nullable = true;
    std::optional<uint32_t> max_length;
};

struct QueryResult {
    std::vector<ColumnInfo> columns;
    std::vector<std::vector<Value>> rows;
    std::optional<uint64_t> total_rows;
    std::chrono::microseconds execution_time{0};

    [[nodiscard]] size_t row_count() const { return rows.size(); }
    [[nodiscard]] std::optional<size_t> column_index(std::string_view name) const;
};

struct ExecuteResult {
    uint64_t rows_affected = 0;
    std::optional<int64_t> last_insert_id;
    std::chrono::microseconds execution_time{0};
};

// ============================================================================
// Transactions
// ============================================================================

enum class IsolationLevel {
    READ_UNCOMMITTED,
    READ_COMMITTED,
    REPEATABLE_READ,
    SERIALIZABLE
};

// SQL spelling, e.g. "READ COMMITTED"
[[nodiscard]] std::string_view isolation_level_to_sql(IsolationLevel level);

struct TransactionInfo {
    std::string id;
    IsolationLevel isolation_level = IsolationLevel::READ_COMMITTED;
    std::chrono::system_clock::time_point started_at;
    std::vector<std::string> savepoints;
    bool read_only = false;
};

// ============================================================================
// Connections, health, schema
// ============================================================================

struct ConnectionInfo {
    std::string id;
    std::string database_name;
    std::string user;
    std::string server_version;
    std::chrono::system_clock::time_point connected_at;
    std::chrono::system_clock::time_point last_activity;
};

enum class HealthState {
    HEALTHY,
    DEGRADED,
    CRITICAL
};

[[nodiscard]] std::string_view health_state_to_string(HealthState state);

struct HealthStatus {
    HealthState state = HealthState::HEALTHY;
    std::chrono::system_clock::time_point last_check;
    std::chrono::milliseconds response_time{0};
    std::optional<std::string> error_message;
    size_t connection_count = 0;
    size_t active_transactions = 0;

    [[nodiscard]] bool is_healthy() const { return state == HealthState::HEALTHY; }
};

struct IndexInfo {
    std::string name;
    std::vector<std::string> columns;
    bool unique = false;
};

struct ForeignKeyInfo {
    std::string name;
    std::string column;
    std::string referenced_table;
    std::string referenced_column;
};

struct TableInfo {
    std::string schema;
    std::string name;
    std::vector<ColumnInfo> columns;
    std::vector<std::string> primary_key;
    std::vector<IndexInfo> indexes;
    std::vector<ForeignKeyInfo> foreign_keys;
};

struct ViewInfo {
    std::string schema;
    std::string name;
    std::string definition;
};

struct DatabaseSchema {
    std::string database_name;
    std::vector<TableInfo> tables;
    std::vector<ViewInfo> views;

    [[nodiscard]] const TableInfo* find_table(std::string_view name) const;
};

// ============================================================================
// Circuit Breaker
// ============================================================================

enum class CircuitState {
    CLOSED,
    OPEN,
    HALF_OPEN
};

[[nodiscard]] std::string_view circuit_state_to_string(CircuitState state);

struct CircuitBreakerStats {
    CircuitState state = CircuitState::CLOSED;
    uint64_t success_count = 0;
    uint64_t failure_count = 0;
    uint64_t transitions_to_open = 0;
    std::optional<std::chrono::system_clock::time_point> last_failure;
    std::optional<std::chrono::system_clock::time_point> opened_at;
};

// ============================================================================
// Pool statistics
// ============================================================================

struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t max_connections = 0;
    uint64_t total_acquires = 0;
    uint64_t total_releases = 0;
    uint64_t failed_acquires = 0;
    uint64_t connections_recycled = 0;
    uint64_t connections_discarded = 0;

    // Buckets: <=100us, <=500us, <=1ms, <=5ms, <=50ms, +Inf
    static constexpr size_t kBucketCount = 6;
    std::array<uint64_t, kBucketCount> acquire_time_buckets{};
    uint64_t acquire_time_sum_us = 0;
    uint64_t acquire_time_count = 0;
};

} // namespace unidb
