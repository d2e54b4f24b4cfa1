#pragma once

#ifdef __cplusplus

#include "property_type.hpp"
#include "schema.hpp"
#include "types.hpp"

namespace strata {

/// Converts property values to and from what the store writes.
///
/// The property_value path handles one scalar at a time: BLB becomes a blob
/// bound to value_binary, everything else canonical text for value_text.
/// The column path handles a whole value for a mapped-table column: native
/// INTEGER, REAL and BLOB where the type has one, JSON text for multivalued
/// properties, canonical text otherwise.
class value_adapter {
public:
    explicit value_adapter(int32_t default_offset_minutes = 0) : default_offset_(default_offset_minutes) {}
    virtual ~value_adapter() = default;

    int32_t default_offset_minutes() const { return default_offset_; }

    virtual column_value_t to_storage(const property_value& scalar, property_type type) const;
    virtual property_value from_storage(const column_value_t& stored, property_type type) const;

    virtual column_value_t to_column(const property_value& value, const property_def& def) const;
    virtual property_value from_column(const column_value_t& stored, const property_def& def) const;

private:
    int32_t default_offset_;
};

} // namespace strata

#endif // __cplusplus
