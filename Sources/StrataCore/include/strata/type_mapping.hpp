#pragma once

#ifdef __cplusplus

#include "property_type.hpp"
#include "schema.hpp"
#include "types.hpp"
#include <optional>
#include <string_view>

namespace strata {

// Property type <-> SQLite column type. INT and BLN share INTEGER; every
// textual or structured type is TEXT.
column_type column_type_for(property_type type);

/// Multivalued properties are JSON arrays and therefore TEXT.
column_type column_type_for(const property_def& def);

/// Canonical property type of a column type: INTEGER -> INT, REAL -> FLT,
/// BLOB -> BLB, TEXT -> TXT.
property_type property_type_for(column_type type);

/// "INTEGER", "REAL", "TEXT" or "BLOB".
const char* sql_type_name(column_type type);

/// Column affinity of a declared SQL type, following SQLite's rules
/// (e.g. "VARCHAR(20)" is TEXT, "BIGINT" is INTEGER). Numeric affinity maps
/// to REAL; an empty declaration has no mapping.
std::optional<column_type> column_type_from_sql(std::string_view declared);

} // namespace strata

#endif // __cplusplus
