#pragma once

#include <string>

namespace sqlgate {

/**
 * @brief Catalog queries a backend answers for schema inspection
 *
 * Each query is a fixed SELECT with no caller-supplied text. Result column
 * order is part of the contract:
 *
 *   tables_query:       schema, table, table_type ('BASE TABLE' | 'VIEW')
 *   columns_query:      schema, table, column, declared_type,
 *                       is_nullable ('YES' | 'NO'), ordinal_position
 *   foreign_keys_query: schema, table, constraint_name, column,
 *                       referenced_schema, referenced_table,
 *                       referenced_column, position_in_constraint
 *
 * Rows are ordered by schema, table and then ordinal/constraint position.
 * System schemas are excluded by the queries themselves.
 */
class ICatalogDialect {
public:
    virtual ~ICatalogDialect() = default;

    [[nodiscard]] virtual const std::string& tables_query() const = 0;
    [[nodiscard]] virtual const std::string& columns_query() const = 0;
    [[nodiscard]] virtual const std::string& foreign_keys_query() const = 0;
};

} // namespace sqlgate
