#pragma once

#include "core/column_type.hpp"
#include <mysql/mysql.h>
#include <cstdint>
#include <string>

namespace sqlgate {

/**
 * @brief MySQL type mapping utilities
 *
 * Maps MySQL result field types to GenericColumnType.
 */
class MysqlTypeMap {
public:
    // charsetnr of binary strings and BLOBs
    static constexpr unsigned int kBinaryCharset = 63;

    /**
     * @brief Map MySQL field type to GenericColumnType
     * @param field_type MySQL enum_field_types value
     * @param binary True when the field uses the binary charset
     */
    [[nodiscard]] static GenericColumnType field_type_to_generic(
        enum_field_types field_type, bool binary);

    /**
     * @brief Build a full ColumnTypeInfo from a result field
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(const MYSQL_FIELD& field);
};

} // namespace sqlgate
