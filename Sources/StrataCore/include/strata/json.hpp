#pragma once

#ifdef __cplusplus

#include "catalog.hpp"
#include "factory.hpp"
#include "schema.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>

// ============================================================================
// nlohmann::json ADL serialization for strata types
// ============================================================================

namespace strata {

// Ordered so directory and aspect map contents keep their insertion order.
using json = nlohmann::ordered_json;

// uuid_t serialization - stores as string (ADL works since uuid_t is in strata namespace)
inline void to_json(json& j, const uuid_t& u) {
    j = u.to_string();
}

void from_json(const json& j, uuid_t& u);

inline void to_json(json& j, const entity& e) {
    j = e.id().to_string();
}

// ============================================================================
// Property values
// ============================================================================

/// Numbers and booleans stay native; every other scalar is its canonical
/// text, blobs as hex. Lists become arrays.
json value_to_json(const property_value& value);

/// Untyped reading: integers, floats, booleans, strings, arrays and null.
property_value value_from_json(const json& j);

/// Typed reading. Hex strings decode for BLB; everything is then coerced to
/// type. Throws type_coercion_error.
property_value value_from_json(const json& j, property_type type, int32_t default_offset_minutes = 0);

// ============================================================================
// Schema and catalogs
// ============================================================================

json property_def_to_json(const property_def& def);
property_def property_def_from_json(const json& j);

json aspect_def_to_json(const aspect_def& def);
aspect_def_ptr aspect_def_from_json(const json& j, object_factory& factory);

/// {globalId, uri?, species, upstream?, version, aspectDefs, hierarchies}
json to_json(const catalog& cat);

/// Throws structural_inconsistency for malformed documents and the model's
/// own errors for invalid contents.
catalog catalog_from_json(const json& j, object_factory& factory);

} // namespace strata

#endif // __cplusplus
