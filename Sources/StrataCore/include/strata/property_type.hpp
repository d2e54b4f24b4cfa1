#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace strata {

enum class property_type {
    integer,        // INT
    floating,       // FLT
    boolean,        // BLN
    string,         // STR
    text,           // TXT
    big_integer,    // BGI
    big_decimal,    // BGF
    date_time,      // DAT
    uri,            // URI
    uuid,           // UID
    clob,           // CLB
    blob            // BLB
};

/// Longest value an STR property accepts.
constexpr size_t max_string_length = 8192;

/// Three-letter storage code, e.g. "INT".
const char* type_code(property_type type);

/// Inverse of type_code. Codes are matched exactly.
std::optional<property_type> property_type_from_code(std::string_view code);

/// Every property type in code order.
const std::vector<property_type>& all_property_types();

/// Converts value to the representation of target. Null passes through, lists
/// are coerced element by element and a blob bound for BLB is one scalar.
/// Throws type_coercion_error naming both types on failure.
/// default_offset_minutes applies to date-times parsed without an offset.
property_value coerce(const property_value& value, property_type target,
                      int32_t default_offset_minutes = 0);

} // namespace strata

#endif // __cplusplus
