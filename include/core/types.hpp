#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sqlgate {

// ============================================================================
// Basic Enums
// ============================================================================

enum class Decision {
    ALLOW,
    DENY
};

enum class ErrorCode {
    NONE,
    VALIDATION_REJECTED,
    RESOURCE_LIMIT_EXCEEDED,
    EXECUTION_FAILED,
    CONNECTION_UNAVAILABLE,
    TIMEOUT
};

// ============================================================================
// Admission
// ============================================================================

/**
 * @brief Outcome of classifying one statement
 *
 * `statement` holds the comment-free text that was classified; it is the
 * text handed to the executor when the decision is ALLOW.
 */
struct ClassificationVerdict {
    std::string statement;
    Decision decision = Decision::ALLOW;
    std::optional<std::string> reason;

    [[nodiscard]] bool allowed() const { return decision == Decision::ALLOW; }

    // Empty statements are allowed and skipped by the executor
    [[nodiscard]] bool is_noop() const { return allowed() && statement.empty(); }
};

// ============================================================================
// Result Values
// ============================================================================

enum class ValueKind : uint8_t {
    NULL_VALUE,
    TEXT,
    NUMERIC,
    BOOLEAN,
    TIMESTAMP
};

/**
 * @brief One scalar cell as returned by the database
 *
 * The database's own text rendering is kept so numerics never lose
 * precision; `kind` tells consumers how to interpret it.
 */
struct ResultValue {
    ValueKind kind = ValueKind::NULL_VALUE;
    std::string text;

    ResultValue() = default;
    ResultValue(ValueKind k, std::string t) : kind(k), text(std::move(t)) {}

    [[nodiscard]] static ResultValue null() { return {}; }
    [[nodiscard]] bool is_null() const { return kind == ValueKind::NULL_VALUE; }

    bool operator==(const ResultValue&) const = default;
};

// Cells are positionally aligned with StatementResult::column_names
using ResultRow = std::vector<ResultValue>;

struct StatementResult {
    size_t index = 0;                   // Position in the caller's batch
    std::string statement;              // Text that was executed
    std::vector<std::string> column_names;
    std::vector<ResultRow> rows;
    uint64_t affected_rows = 0;
    std::chrono::microseconds execution_time{0};
};

struct BatchResult {
    std::vector<StatementResult> statements;
    std::chrono::microseconds execution_time{0};
};

// ============================================================================
// Schema Snapshot
// ============================================================================

struct ColumnDescriptor {
    std::string name;
    std::string declared_type;
    bool nullable = true;
    uint32_t ordinal_position = 0;

    bool operator==(const ColumnDescriptor&) const = default;
};

/**
 * @brief One foreign-key constraint, grouped from per-column catalog rows
 *
 * local_columns[i] references referenced_columns[i].
 */
struct ForeignKeyRelation {
    std::string constraint_name;
    std::vector<std::string> local_columns;
    std::string referenced_schema;
    std::string referenced_table;
    std::vector<std::string> referenced_columns;
};

struct TableDescriptor {
    std::string schema;
    std::string name;
    bool is_view = false;
    std::vector<ColumnDescriptor> columns;
    std::vector<ForeignKeyRelation> foreign_keys;
};

struct TableKey {
    std::string schema;
    std::string table;

    auto operator<=>(const TableKey&) const = default;
};

using SchemaSnapshot = std::map<TableKey, TableDescriptor>;

// ============================================================================
// Utility Functions
// ============================================================================

inline const char* decision_to_string(Decision decision) {
    switch (decision) {
        case Decision::ALLOW: return "ALLOW";
        case Decision::DENY: return "DENY";
        default: return "UNKNOWN";
    }
}

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::VALIDATION_REJECTED: return "ValidationRejected";
        case ErrorCode::RESOURCE_LIMIT_EXCEEDED: return "ResourceLimitExceeded";
        case ErrorCode::EXECUTION_FAILED: return "ExecutionFailed";
        case ErrorCode::CONNECTION_UNAVAILABLE: return "ConnectionUnavailable";
        case ErrorCode::TIMEOUT: return "Timeout";
        default: return "UNKNOWN";
    }
}

} // namespace sqlgate
