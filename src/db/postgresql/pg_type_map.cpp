#include "db/postgresql/pg_type_map.hpp"
#include <unordered_map>

namespace ybadapter {

namespace {

const std::unordered_map<uint32_t, std::string>& oid_names() {
    static const std::unordered_map<uint32_t, std::string> OID_NAMES = {
        {16, "bool"},
        {17, "bytea"},
        {18, "char"},
        {19, "name"},
        {20, "int8"},
        {21, "int2"},
        {23, "int4"},
        {25, "text"},
        {26, "oid"},
        {114, "json"},
        {142, "xml"},
        {600, "point"},
        {601, "lseg"},
        {602, "path"},
        {603, "box"},
        {604, "polygon"},
        {628, "line"},
        {650, "cidr"},
        {700, "float4"},
        {701, "float8"},
        {718, "circle"},
        {790, "money"},
        {829, "macaddr"},
        {869, "inet"},
        {1042, "bpchar"},
        {1043, "varchar"},
        {1082, "date"},
        {1083, "time"},
        {1114, "timestamp"},
        {1184, "timestamptz"},
        {1186, "interval"},
        {1266, "timetz"},
        {1700, "numeric"},
        {2277, "anyarray"},
        {2950, "uuid"},
        {3614, "tsvector"},
        {3615, "tsquery"},
        {3802, "jsonb"},
    };
    return OID_NAMES;
}

} // anonymous namespace

std::string PgTypeMap::oid_to_type_name(uint32_t oid) {
    const auto& names = oid_names();
    auto it = names.find(oid);
    return it != names.end() ? it->second : std::string{};
}

} // namespace ybadapter
