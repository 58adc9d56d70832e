#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace sqlgate {

/**
 * @brief JSON rendering of gateway results for the CLI
 *
 * Object keys keep insertion order so row objects list columns in result
 * order. Cell values:
 *   NULL                     -> null
 *   numeric                  -> number when the text converts losslessly,
 *                               otherwise the database's text
 *   boolean                  -> true/false
 *   text, timestamp          -> string, as rendered by the database
 * Duplicate column names in one result collapse to the last value.
 */
class ResponseSerializer {
public:
    using json = nlohmann::ordered_json;

    [[nodiscard]] static json value_to_json(const ResultValue& value);

    // {"sql": ..., "results": [{"statement", "columns", "rows": [{col: value}]}]}
    [[nodiscard]] static json batch_to_json(std::string_view sql, const BatchResult& batch);

    // {"sql": ..., "statements": [{"index", "statement", "decision", "noop"}]}
    [[nodiscard]] static json verdicts_to_json(std::string_view sql,
                                               const std::vector<ClassificationVerdict>& verdicts);

    // {"tables": [{"schema", "table", "is_view", "columns", "foreign_keys"}]}
    [[nodiscard]] static json schema_to_json(const SchemaSnapshot& snapshot);

    // {"error": {"kind", "message", "statement_index"?}, "sql"?}
    template<typename T>
    [[nodiscard]] static json error_to_json(const Result<T>& result, std::string_view sql = {}) {
        return error_to_json(result.error_code(), result.error_message(),
                             result.statement_index(), sql);
    }

    [[nodiscard]] static json error_to_json(ErrorCode code, std::string_view message,
                                            std::optional<size_t> statement_index,
                                            std::string_view sql = {});
};

} // namespace sqlgate
