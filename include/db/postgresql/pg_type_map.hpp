#pragma once

#include "core/column_type.hpp"
#include <cstdint>
#include <string>

namespace sqlgate {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps result column OIDs (PQftype) to GenericColumnType.
 */
class PgTypeMap {
public:
    /**
     * @brief Build a full ColumnTypeInfo from a result column OID
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(uint32_t oid);
};

} // namespace sqlgate
