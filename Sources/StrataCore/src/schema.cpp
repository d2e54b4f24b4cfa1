#include "strata/schema.hpp"
#include "strata/errors.hpp"
#include "strata/hasher.hpp"
#include "strata/log.hpp"
#include <algorithm>

namespace strata {

// ============================================================================
// property_def
// ============================================================================

uint64_t property_def::hash() const {
    hasher h;
    h.update(is_readable)
     .update(is_writable)
     .update(is_nullable)
     .update(is_removable)
     .update(is_multivalued)
     .update(has_default_value);
    if (has_default_value) {
        h.update(default_value);
    }
    h.update(type_code(type)).update(name);
    return h.value();
}

bool property_def::fully_equals(const property_def& other) const {
    return name == other.name &&
           type == other.type &&
           has_default_value == other.has_default_value &&
           (!has_default_value || default_value == other.default_value) &&
           is_readable == other.is_readable &&
           is_writable == other.is_writable &&
           is_nullable == other.is_nullable &&
           is_removable == other.is_removable &&
           is_multivalued == other.is_multivalued;
}

// ============================================================================
// aspect_def
// ============================================================================

aspect_def::aspect_def(std::string name,
                       uuid_t global_id,
                       std::vector<property_def> properties,
                       bool is_readable,
                       bool is_writable,
                       bool can_add_properties,
                       bool can_remove_properties)
    : name_(std::move(name))
    , global_id_(global_id)
    , readable_(is_readable)
    , writable_(is_writable)
    , can_add_(can_add_properties)
    , can_remove_(can_remove_properties) {
    if (name_.empty()) {
        throw schema_violation("aspect definition name must not be empty");
    }
    properties_.reserve(properties.size());
    for (auto& prop : properties) {
        if (prop.name.empty()) {
            throw schema_violation("aspect definition " + name_ + " has a property with an empty name");
        }
        if (find_property(prop.name)) {
            throw schema_violation("aspect definition " + name_ + " declares property " + prop.name + " twice");
        }
        properties_.push_back(std::move(prop));
    }
}

aspect_mutability aspect_def::mutability() const {
    if (can_add_ && can_remove_) return aspect_mutability::fully_mutable;
    if (!can_add_ && !can_remove_) return aspect_mutability::immutable;
    return aspect_mutability::mixed;
}

const property_def* aspect_def::find_property(std::string_view name) const {
    for (const auto& prop : properties_) {
        if (prop.name == name) return &prop;
    }
    return nullptr;
}

void aspect_def::add_property(property_def def) {
    if (!can_add_) {
        throw schema_violation("aspect definition " + name_ + " does not allow adding properties");
    }
    if (def.name.empty()) {
        throw schema_violation("aspect definition " + name_ + ": property name must not be empty");
    }
    if (find_property(def.name)) {
        throw schema_violation("aspect definition " + name_ + " already has property " + def.name);
    }
    LOG_DEBUG("schema", "%s: add property %s", name_.c_str(), def.name.c_str());
    properties_.push_back(std::move(def));
}

void aspect_def::remove_property(std::string_view name) {
    if (!can_remove_) {
        throw schema_violation("aspect definition " + name_ + " does not allow removing properties");
    }
    auto it = std::find_if(properties_.begin(), properties_.end(),
                           [&](const property_def& p) { return p.name == name; });
    if (it == properties_.end()) {
        throw schema_violation("aspect definition " + name_ + " has no property " + std::string(name));
    }
    if (!it->is_removable) {
        throw schema_violation("property " + it->name + " of " + name_ + " is not removable");
    }
    properties_.erase(it);
}

uint64_t aspect_def::hash() const {
    hasher h;
    h.update(readable_)
     .update(writable_)
     .update(can_add_)
     .update(can_remove_)
     .update(name_)
     .update(global_id_);

    std::vector<const property_def*> sorted;
    sorted.reserve(properties_.size());
    for (const auto& prop : properties_) sorted.push_back(&prop);
    std::sort(sorted.begin(), sorted.end(),
              [](const property_def* a, const property_def* b) { return a->name < b->name; });
    for (const auto* prop : sorted) {
        h.update(prop->hash());
    }
    return h.value();
}

bool aspect_def::fully_equals(const aspect_def& other) const {
    if (this == &other) return true;
    if (name_ != other.name_ || global_id_ != other.global_id_ ||
        readable_ != other.readable_ || writable_ != other.writable_ ||
        can_add_ != other.can_add_ || can_remove_ != other.can_remove_ ||
        properties_.size() != other.properties_.size()) {
        return false;
    }
    for (const auto& prop : properties_) {
        const auto* theirs = other.find_property(prop.name);
        if (!theirs || !prop.fully_equals(*theirs)) return false;
    }
    return true;
}

// ============================================================================
// hierarchy_def / catalog_def
// ============================================================================

const char* hierarchy_type_code(hierarchy_type type) {
    switch (type) {
        case hierarchy_type::entity_list: return "EL";
        case hierarchy_type::entity_set: return "ES";
        case hierarchy_type::entity_directory: return "ED";
        case hierarchy_type::entity_tree: return "ET";
        case hierarchy_type::aspect_map: return "AM";
    }
    return "??";
}

std::optional<hierarchy_type> hierarchy_type_from_code(std::string_view code) {
    if (code == "EL") return hierarchy_type::entity_list;
    if (code == "ES") return hierarchy_type::entity_set;
    if (code == "ED") return hierarchy_type::entity_directory;
    if (code == "ET") return hierarchy_type::entity_tree;
    if (code == "AM") return hierarchy_type::aspect_map;
    return std::nullopt;
}

uint64_t hierarchy_def::hash() const {
    return hasher().update(name).update(hierarchy_type_code(type)).value();
}

const aspect_def* catalog_def::find_aspect_def(std::string_view name) const {
    for (const auto& def : aspect_defs) {
        if (def->name() == name) return def.get();
    }
    return nullptr;
}

const hierarchy_def* catalog_def::find_hierarchy_def(std::string_view name) const {
    for (const auto& def : hierarchy_defs) {
        if (def.name == name) return &def;
    }
    return nullptr;
}

uint64_t catalog_def::hash() const {
    std::vector<const aspect_def*> aspects;
    for (const auto& def : aspect_defs) aspects.push_back(def.get());
    std::sort(aspects.begin(), aspects.end(),
              [](const aspect_def* a, const aspect_def* b) { return a->name() < b->name(); });

    std::vector<const hierarchy_def*> hierarchies;
    for (const auto& def : hierarchy_defs) hierarchies.push_back(&def);
    std::sort(hierarchies.begin(), hierarchies.end(),
              [](const hierarchy_def* a, const hierarchy_def* b) { return a->name < b->name; });

    hasher h;
    for (const auto* def : aspects) h.update(def->hash());
    for (const auto* def : hierarchies) h.update(def->hash());
    return h.value();
}

} // namespace strata
