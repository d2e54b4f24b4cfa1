#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "property_type.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

// ============================================================================
// Property definitions
// ============================================================================

struct property_def {
    std::string name;
    property_type type = property_type::string;
    property_value default_value;
    bool has_default_value = false;
    bool is_readable = true;
    bool is_writable = true;
    bool is_nullable = true;
    bool is_removable = false;
    bool is_multivalued = false;

    property_def() = default;
    property_def(std::string n, property_type t) : name(std::move(n)), type(t) {}

    // Chainable setters for building definitions inline.
    property_def& with_default(property_value v) {
        default_value = std::move(v);
        has_default_value = true;
        return *this;
    }
    property_def& not_null() { is_nullable = false; return *this; }
    property_def& multivalued() { is_multivalued = true; return *this; }
    property_def& removable() { is_removable = true; return *this; }
    property_def& read_only() { is_writable = false; return *this; }
    property_def& write_only() { is_readable = false; return *this; }

    /// FNV-1a over readable, writable, nullable, removable, multivalued,
    /// has-default, [default], type code, name.
    uint64_t hash() const;

    /// Compares every field, not just the name.
    bool fully_equals(const property_def& other) const;

    // Structural identity is the name.
    bool operator==(const property_def& other) const { return name == other.name; }
    bool operator!=(const property_def& other) const { return name != other.name; }
};

// ============================================================================
// Aspect definitions
// ============================================================================

/// Instance mutability selected by the (can-add, can-remove) capability pair.
enum class aspect_mutability {
    immutable,      // neither capability
    fully_mutable,  // both
    mixed           // exactly one
};

class aspect_def {
public:
    /// Throws schema_violation for an empty name or duplicate property names.
    aspect_def(std::string name,
               uuid_t global_id,
               std::vector<property_def> properties = {},
               bool is_readable = true,
               bool is_writable = true,
               bool can_add_properties = false,
               bool can_remove_properties = false);

    const std::string& name() const { return name_; }
    const uuid_t& global_id() const { return global_id_; }
    const std::vector<property_def>& properties() const { return properties_; }

    bool is_readable() const { return readable_; }
    bool is_writable() const { return writable_; }
    bool can_add_properties() const { return can_add_; }
    bool can_remove_properties() const { return can_remove_; }
    aspect_mutability mutability() const;

    const property_def* find_property(std::string_view name) const;
    size_t size() const { return properties_.size(); }

    /// Requires can_add_properties; duplicate names are rejected.
    void add_property(property_def def);

    /// Requires can_remove_properties and a removable property.
    void remove_property(std::string_view name);

    /// Properties contribute in name order, so declaration order never matters.
    uint64_t hash() const;

    /// Same name, id, flags and property set, each property fully equal.
    bool fully_equals(const aspect_def& other) const;

private:
    std::string name_;
    uuid_t global_id_;
    std::vector<property_def> properties_;
    bool readable_;
    bool writable_;
    bool can_add_;
    bool can_remove_;
};

using aspect_def_ptr = std::shared_ptr<aspect_def>;

// ============================================================================
// Hierarchy and catalog definitions
// ============================================================================

enum class hierarchy_type {
    entity_list,        // EL
    entity_set,         // ES
    entity_directory,   // ED
    entity_tree,        // ET
    aspect_map          // AM
};

const char* hierarchy_type_code(hierarchy_type type);
std::optional<hierarchy_type> hierarchy_type_from_code(std::string_view code);

struct hierarchy_def {
    std::string name;
    hierarchy_type type = hierarchy_type::entity_list;

    uint64_t hash() const;

    bool operator==(const hierarchy_def& other) const {
        return name == other.name && type == other.type;
    }
    bool operator!=(const hierarchy_def& other) const { return !(*this == other); }
};

struct catalog_def {
    std::vector<aspect_def_ptr> aspect_defs;
    std::vector<hierarchy_def> hierarchy_defs;

    const aspect_def* find_aspect_def(std::string_view name) const;
    const hierarchy_def* find_hierarchy_def(std::string_view name) const;

    /// Aspect definitions then hierarchy definitions, each in name order.
    uint64_t hash() const;
};

} // namespace strata

#endif // __cplusplus
