#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "db/icatalog_dialect.hpp"
#include "db/idb_connection.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlgate {

/**
 * @brief Builds a SchemaSnapshot from the database catalog
 *
 * Issues the dialect's three catalog SELECTs (tables, columns, foreign
 * keys) and assembles them. Filtering by schema name and by table prefix
 * happens here, after the fixed queries return, so caller-supplied text
 * never reaches the database.
 *
 * Tables without columns keep an empty column list. Foreign keys arrive one
 * row per column pair and are grouped into one relation per constraint.
 */
class SchemaInspector {
public:
    struct Config {
        std::vector<std::string> exclude_table_prefixes;
        bool include_views = true;
    };

    explicit SchemaInspector(std::shared_ptr<const ICatalogDialect> dialect)
        : SchemaInspector(std::move(dialect), Config{}) {}
    SchemaInspector(std::shared_ptr<const ICatalogDialect> dialect, Config config);

    /**
     * @param schema_filter Exact schema name to keep; nullopt keeps all
     */
    [[nodiscard]] Result<SchemaSnapshot> inspect(
        IDbConnection& conn,
        const std::optional<std::string>& schema_filter = std::nullopt) const;

private:
    [[nodiscard]] bool is_excluded(const std::string& table_name) const;

    std::shared_ptr<const ICatalogDialect> dialect_;
    Config config_;
};

} // namespace sqlgate
