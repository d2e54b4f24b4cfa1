#include "strata/type_mapping.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace strata {

column_type column_type_for(property_type type) {
    switch (type) {
        case property_type::integer:
        case property_type::boolean:
            return column_type::integer;
        case property_type::floating:
            return column_type::real;
        case property_type::blob:
            return column_type::blob;
        case property_type::string:
        case property_type::text:
        case property_type::big_integer:
        case property_type::big_decimal:
        case property_type::date_time:
        case property_type::uri:
        case property_type::uuid:
        case property_type::clob:
            return column_type::text;
    }
    return column_type::text;
}

column_type column_type_for(const property_def& def) {
    return def.is_multivalued ? column_type::text : column_type_for(def.type);
}

property_type property_type_for(column_type type) {
    switch (type) {
        case column_type::integer: return property_type::integer;
        case column_type::real: return property_type::floating;
        case column_type::text: return property_type::text;
        case column_type::blob: return property_type::blob;
    }
    return property_type::text;
}

const char* sql_type_name(column_type type) {
    switch (type) {
        case column_type::integer: return "INTEGER";
        case column_type::real: return "REAL";
        case column_type::text: return "TEXT";
        case column_type::blob: return "BLOB";
    }
    return "TEXT";
}

std::optional<column_type> column_type_from_sql(std::string_view declared) {
    std::string upper(declared);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper.empty()) return std::nullopt;

    // Section 3.1 of the SQLite datatype documentation, in rule order.
    if (upper.find("INT") != std::string::npos) return column_type::integer;
    if (upper.find("CHAR") != std::string::npos || upper.find("CLOB") != std::string::npos ||
        upper.find("TEXT") != std::string::npos) {
        return column_type::text;
    }
    if (upper.find("BLOB") != std::string::npos) return column_type::blob;
    return column_type::real;
}

} // namespace strata
