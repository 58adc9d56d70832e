#include "db/postgresql/pg_type_map.hpp"
#include <string_view>
#include <unordered_map>

namespace sqlgate {

namespace {

struct PgTypeEntry {
    GenericColumnType generic;
    std::string_view name;
};

// Built-in type OIDs from pg_type.dat
const std::unordered_map<uint32_t, PgTypeEntry>& builtin_types() {
    static const std::unordered_map<uint32_t, PgTypeEntry> TYPES = {
        {16,   {GenericColumnType::BOOLEAN, "boolean"}},
        {17,   {GenericColumnType::BLOB, "bytea"}},
        {18,   {GenericColumnType::CHAR, "char"}},
        {19,   {GenericColumnType::VARCHAR, "name"}},
        {20,   {GenericColumnType::BIGINT, "bigint"}},
        {21,   {GenericColumnType::SMALLINT, "smallint"}},
        {23,   {GenericColumnType::INTEGER, "integer"}},
        {25,   {GenericColumnType::TEXT, "text"}},
        {26,   {GenericColumnType::INTEGER, "oid"}},
        {114,  {GenericColumnType::JSON, "json"}},
        {142,  {GenericColumnType::XML, "xml"}},
        {650,  {GenericColumnType::INET, "cidr"}},
        {700,  {GenericColumnType::REAL, "real"}},
        {701,  {GenericColumnType::DOUBLE_PRECISION, "double precision"}},
        {790,  {GenericColumnType::MONEY, "money"}},
        {869,  {GenericColumnType::INET, "inet"}},
        {1042, {GenericColumnType::CHAR, "character"}},
        {1043, {GenericColumnType::VARCHAR, "character varying"}},
        {1082, {GenericColumnType::DATE, "date"}},
        {1083, {GenericColumnType::TIME, "time without time zone"}},
        {1114, {GenericColumnType::TIMESTAMP, "timestamp without time zone"}},
        {1184, {GenericColumnType::TIMESTAMP_TZ, "timestamp with time zone"}},
        {1186, {GenericColumnType::INTERVAL, "interval"}},
        {1266, {GenericColumnType::TIME, "time with time zone"}},
        {1700, {GenericColumnType::NUMERIC, "numeric"}},
        {2950, {GenericColumnType::UUID, "uuid"}},
        {3802, {GenericColumnType::JSONB, "jsonb"}},
        // Arrays of the common scalar types
        {1000, {GenericColumnType::ARRAY, "boolean[]"}},
        {1005, {GenericColumnType::ARRAY, "smallint[]"}},
        {1007, {GenericColumnType::ARRAY, "integer[]"}},
        {1009, {GenericColumnType::ARRAY, "text[]"}},
        {1015, {GenericColumnType::ARRAY, "character varying[]"}},
        {1016, {GenericColumnType::ARRAY, "bigint[]"}},
        {1021, {GenericColumnType::ARRAY, "real[]"}},
        {1022, {GenericColumnType::ARRAY, "double precision[]"}},
        {1231, {GenericColumnType::ARRAY, "numeric[]"}},
        {2951, {GenericColumnType::ARRAY, "uuid[]"}},
    };
    return TYPES;
}

} // anonymous namespace

ColumnTypeInfo PgTypeMap::build_type_info(uint32_t oid) {
    const auto& types = builtin_types();
    const auto it = types.find(oid);
    if (it == types.end()) {
        return {GenericColumnType::VENDOR_SPECIFIC, oid, ""};
    }
    return {it->second.generic, oid, std::string(it->second.name)};
}

} // namespace sqlgate
