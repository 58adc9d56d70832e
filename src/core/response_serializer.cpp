#include "core/response_serializer.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>

namespace sqlgate {

namespace {

ResponseSerializer::json numeric_to_json(const std::string& text) {
    if (const auto i = utils::try_parse_int<int64_t>(text)) {
        return *i;
    }
    if (const auto u = utils::try_parse_int<uint64_t>(text)) {
        return *u;
    }
    // Only when the double prints back as the same text
    if (const auto d = utils::try_parse_double(text);
        d && std::isfinite(*d) && std::format("{}", *d) == text) {
        return *d;
    }
    return text;
}

ResponseSerializer::json boolean_to_json(const std::string& text) {
    const auto lower = utils::to_lower(text);
    if (lower == "t" || lower == "true" || lower == "1") return true;
    if (lower == "f" || lower == "false" || lower == "0") return false;
    return text;
}

} // anonymous namespace

ResponseSerializer::json ResponseSerializer::value_to_json(const ResultValue& value) {
    switch (value.kind) {
        case ValueKind::NULL_VALUE: return nullptr;
        case ValueKind::NUMERIC:    return numeric_to_json(value.text);
        case ValueKind::BOOLEAN:    return boolean_to_json(value.text);
        case ValueKind::TEXT:
        case ValueKind::TIMESTAMP:
        default:                    return value.text;
    }
}

ResponseSerializer::json ResponseSerializer::batch_to_json(std::string_view sql,
                                                           const BatchResult& batch) {
    json results = json::array();
    for (const auto& stmt : batch.statements) {
        json rows = json::array();
        for (const auto& row : stmt.rows) {
            json obj = json::object();
            for (size_t c = 0; c < row.size() && c < stmt.column_names.size(); ++c) {
                obj[stmt.column_names[c]] = value_to_json(row[c]);
            }
            rows.push_back(std::move(obj));
        }

        json entry = json::object();
        entry["statement"] = stmt.statement;
        entry["columns"] = stmt.column_names;
        entry["rows"] = std::move(rows);
        results.push_back(std::move(entry));
    }

    json out = json::object();
    out["sql"] = std::string(sql);
    out["results"] = std::move(results);
    return out;
}

ResponseSerializer::json ResponseSerializer::verdicts_to_json(
    std::string_view sql, const std::vector<ClassificationVerdict>& verdicts) {
    json statements = json::array();
    for (size_t i = 0; i < verdicts.size(); ++i) {
        const auto& v = verdicts[i];
        json entry = json::object();
        entry["index"] = i;
        entry["statement"] = v.statement;
        entry["decision"] = decision_to_string(v.decision);
        entry["noop"] = v.is_noop();
        if (v.reason) entry["reason"] = *v.reason;
        statements.push_back(std::move(entry));
    }

    json out = json::object();
    out["sql"] = std::string(sql);
    out["statements"] = std::move(statements);
    return out;
}

ResponseSerializer::json ResponseSerializer::schema_to_json(const SchemaSnapshot& snapshot) {
    json tables = json::array();
    for (const auto& [key, table] : snapshot) {
        json columns = json::array();
        for (const auto& col : table.columns) {
            json c = json::object();
            c["name"] = col.name;
            c["type"] = col.declared_type;
            c["nullable"] = col.nullable;
            c["position"] = col.ordinal_position;
            columns.push_back(std::move(c));
        }

        json foreign_keys = json::array();
        for (const auto& fk : table.foreign_keys) {
            json f = json::object();
            f["name"] = fk.constraint_name;
            f["columns"] = fk.local_columns;
            f["referenced_schema"] = fk.referenced_schema;
            f["referenced_table"] = fk.referenced_table;
            f["referenced_columns"] = fk.referenced_columns;
            foreign_keys.push_back(std::move(f));
        }

        json t = json::object();
        t["schema"] = table.schema;
        t["table"] = table.name;
        t["is_view"] = table.is_view;
        t["columns"] = std::move(columns);
        t["foreign_keys"] = std::move(foreign_keys);
        tables.push_back(std::move(t));
    }

    json out = json::object();
    out["tables"] = std::move(tables);
    return out;
}

ResponseSerializer::json ResponseSerializer::error_to_json(ErrorCode code, std::string_view message,
                                                           std::optional<size_t> statement_index,
                                                           std::string_view sql) {
    json error = json::object();
    error["kind"] = error_code_to_string(code);
    error["message"] = std::string(message);
    if (statement_index) error["statement_index"] = *statement_index;

    json out = json::object();
    out["error"] = std::move(error);
    if (!sql.empty()) out["sql"] = std::string(sql);
    return out;
}

} // namespace sqlgate
