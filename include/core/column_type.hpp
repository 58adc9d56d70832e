#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace sqlgate {

/**
 * @brief Database-agnostic column type classification
 *
 * Maps from vendor-specific types (PG OIDs, MySQL field types) and decides
 * how result cells are reported to the caller.
 */
enum class GenericColumnType : uint16_t {
    UNKNOWN = 0,

    // Integer family
    SMALLINT,
    INTEGER,
    BIGINT,

    // Floating point
    REAL,
    DOUBLE_PRECISION,
    NUMERIC,

    // String family
    TEXT,
    VARCHAR,
    CHAR,

    // Boolean
    BOOLEAN,

    // Date/Time
    DATE,
    TIME,
    TIMESTAMP,
    TIMESTAMP_TZ,
    INTERVAL,

    // Binary
    BLOB,

    // JSON
    JSON,
    JSONB,

    // UUID
    UUID,

    // Network
    INET,

    // Monetary
    MONEY,

    // XML
    XML,

    // Array
    ARRAY,

    // Vendor-specific fallback
    VENDOR_SPECIFIC,
};

/**
 * @brief Extended column type info carrying both generic and vendor-specific data
 */
struct ColumnTypeInfo {
    GenericColumnType generic_type = GenericColumnType::UNKNOWN;
    uint32_t vendor_type_id = 0;       // PG OID or MySQL field type enum
    std::string vendor_type_name;      // "integer", "INT", etc.

    ColumnTypeInfo() = default;
    ColumnTypeInfo(GenericColumnType gt, uint32_t vid, std::string vname)
        : generic_type(gt), vendor_type_id(vid), vendor_type_name(std::move(vname)) {}
};

/**
 * @brief Value kind used for non-null cells of a column of this type
 *
 * MONEY is rendered with a currency symbol by the server, so it stays text.
 */
[[nodiscard]] inline constexpr ValueKind value_kind_for(GenericColumnType type) noexcept {
    switch (type) {
        case GenericColumnType::SMALLINT:
        case GenericColumnType::INTEGER:
        case GenericColumnType::BIGINT:
        case GenericColumnType::REAL:
        case GenericColumnType::DOUBLE_PRECISION:
        case GenericColumnType::NUMERIC:
            return ValueKind::NUMERIC;
        case GenericColumnType::BOOLEAN:
            return ValueKind::BOOLEAN;
        case GenericColumnType::DATE:
        case GenericColumnType::TIME:
        case GenericColumnType::TIMESTAMP:
        case GenericColumnType::TIMESTAMP_TZ:
            return ValueKind::TIMESTAMP;
        default:
            return ValueKind::TEXT;
    }
}

} // namespace sqlgate
