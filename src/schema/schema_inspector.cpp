#include "schema/schema_inspector.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>
#include <iterator>

namespace sqlgate {

namespace {

// Column positions fixed by ICatalogDialect
namespace tables_col {
    constexpr size_t SCHEMA = 0;
    constexpr size_t TABLE  = 1;
    constexpr size_t TYPE   = 2;
}

namespace columns_col {
    constexpr size_t SCHEMA   = 0;
    constexpr size_t TABLE    = 1;
    constexpr size_t COLUMN   = 2;
    constexpr size_t TYPE     = 3;
    constexpr size_t NULLABLE = 4;
    constexpr size_t POSITION = 5;
}

namespace fk_col {
    constexpr size_t SCHEMA            = 0;
    constexpr size_t TABLE             = 1;
    constexpr size_t CONSTRAINT        = 2;
    constexpr size_t COLUMN            = 3;
    constexpr size_t REFERENCED_SCHEMA = 4;
    constexpr size_t REFERENCED_TABLE  = 5;
    constexpr size_t REFERENCED_COLUMN = 6;
}

constexpr std::string_view kView = "VIEW";
constexpr std::string_view kYes = "YES";

const std::string& cell(const ResultRow& row, size_t index) {
    static const std::string empty;
    return index < row.size() ? row[index].text : empty;
}

Result<DbResultSet> run_catalog_query(IDbConnection& conn, const std::string& sql,
                                      std::string_view what) {
    auto result = conn.execute(sql);
    if (!result.success) {
        utils::log::warn(std::format("Catalog {} query failed: {}", what, result.error_message));
        return Result<DbResultSet>::error(classify_db_failure(result, conn),
            std::format("failed to read {}: {}", what, result.error_message));
    }
    return Result<DbResultSet>::ok(std::move(result));
}

} // anonymous namespace

SchemaInspector::SchemaInspector(std::shared_ptr<const ICatalogDialect> dialect, Config config)
    : dialect_(std::move(dialect)), config_(std::move(config)) {}

bool SchemaInspector::is_excluded(const std::string& table_name) const {
    return std::any_of(config_.exclude_table_prefixes.begin(),
                       config_.exclude_table_prefixes.end(),
                       [&](const std::string& prefix) { return table_name.starts_with(prefix); });
}

Result<SchemaSnapshot> SchemaInspector::inspect(
    IDbConnection& conn,
    const std::optional<std::string>& schema_filter) const {

    const auto tables = run_catalog_query(conn, dialect_->tables_query(), "tables");
    if (tables.is_error()) return Result<SchemaSnapshot>::from_error(tables);

    SchemaSnapshot snapshot;
    for (const auto& row : tables.value().rows) {
        TableDescriptor table;
        table.schema = cell(row, tables_col::SCHEMA);
        table.name = cell(row, tables_col::TABLE);
        table.is_view = (cell(row, tables_col::TYPE) == kView);

        if (schema_filter && table.schema != *schema_filter) continue;
        if (table.is_view && !config_.include_views) continue;
        if (is_excluded(table.name)) continue;

        TableKey key{table.schema, table.name};
        snapshot.try_emplace(std::move(key), std::move(table));
    }

    if (snapshot.empty()) {
        return Result<SchemaSnapshot>::ok(std::move(snapshot));
    }

    const auto columns = run_catalog_query(conn, dialect_->columns_query(), "columns");
    if (columns.is_error()) return Result<SchemaSnapshot>::from_error(columns);

    for (const auto& row : columns.value().rows) {
        const auto it = snapshot.find(TableKey{cell(row, columns_col::SCHEMA),
                                               cell(row, columns_col::TABLE)});
        if (it == snapshot.end()) continue;

        ColumnDescriptor col;
        col.name = cell(row, columns_col::COLUMN);
        col.declared_type = cell(row, columns_col::TYPE);
        col.nullable = (cell(row, columns_col::NULLABLE) == kYes);
        col.ordinal_position = utils::parse_int<uint32_t>(cell(row, columns_col::POSITION));
        it->second.columns.push_back(std::move(col));
    }

    const auto foreign_keys = run_catalog_query(conn, dialect_->foreign_keys_query(), "foreign keys");
    if (foreign_keys.is_error()) return Result<SchemaSnapshot>::from_error(foreign_keys);

    for (const auto& row : foreign_keys.value().rows) {
        const auto it = snapshot.find(TableKey{cell(row, fk_col::SCHEMA), cell(row, fk_col::TABLE)});
        if (it == snapshot.end()) continue;

        auto& relations = it->second.foreign_keys;
        const auto& constraint = cell(row, fk_col::CONSTRAINT);
        auto rel = std::find_if(relations.begin(), relations.end(),
            [&](const ForeignKeyRelation& r) { return r.constraint_name == constraint; });
        if (rel == relations.end()) {
            ForeignKeyRelation relation;
            relation.constraint_name = constraint;
            relation.referenced_schema = cell(row, fk_col::REFERENCED_SCHEMA);
            relation.referenced_table = cell(row, fk_col::REFERENCED_TABLE);
            relations.push_back(std::move(relation));
            rel = std::prev(relations.end());
        }

        const auto& local = cell(row, fk_col::COLUMN);
        const auto& referenced = cell(row, fk_col::REFERENCED_COLUMN);

        // Some catalogs repeat a pair once per matching index
        bool seen = false;
        for (size_t i = 0; i < rel->local_columns.size(); ++i) {
            if (rel->local_columns[i] == local && rel->referenced_columns[i] == referenced) {
                seen = true;
                break;
            }
        }
        if (!seen) {
            rel->local_columns.push_back(local);
            rel->referenced_columns.push_back(referenced);
        }
    }

    for (auto& [key, table] : snapshot) {
        std::stable_sort(table.columns.begin(), table.columns.end(),
            [](const ColumnDescriptor& a, const ColumnDescriptor& b) {
                return a.ordinal_position < b.ordinal_position;
            });
    }

    utils::log::debug(std::format("Schema snapshot holds {} tables", snapshot.size()));
    return Result<SchemaSnapshot>::ok(std::move(snapshot));
}

} // namespace sqlgate
