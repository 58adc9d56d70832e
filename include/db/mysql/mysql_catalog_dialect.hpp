#pragma once

#include "db/icatalog_dialect.hpp"

namespace sqlgate {

/**
 * @brief MySQL catalog queries (information_schema)
 *
 * A MySQL database plays the role of a schema. Declared types come from
 * COLUMN_TYPE, so lengths and unsigned markers are kept ("int unsigned",
 * "varchar(255)").
 */
class MysqlCatalogDialect : public ICatalogDialect {
public:
    const std::string& tables_query() const override;
    const std::string& columns_query() const override;
    const std::string& foreign_keys_query() const override;
};

} // namespace sqlgate
