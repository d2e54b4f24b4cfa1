#include "strata/aspect.hpp"
#include "strata/errors.hpp"

namespace strata {

namespace {

// A lone scalar written to a multivalued property becomes a one-element list.
property_value as_declared(const property_def& prop, const property_value& value) {
    if (prop.is_multivalued && !value.is_null() && !value.is_list()) {
        return property_value::make_list({value});
    }
    return value;
}

} // namespace

aspect::aspect(entity owner, std::shared_ptr<const aspect_def> def, int32_t default_offset_minutes)
    : owner_(owner), def_(std::move(def)), default_offset_(default_offset_minutes) {
    if (!def_) {
        throw schema_violation("aspect for entity " + owner_.to_string() + " has no aspect definition");
    }
}

const property_def* aspect::find_property(std::string_view name) const {
    if (const auto* prop = def_->find_property(name)) return prop;
    for (const auto& prop : added_) {
        if (prop.name == name) return &prop;
    }
    return nullptr;
}

bool aspect::contains(std::string_view name) const {
    return values_.find(name) != values_.end();
}

property_value aspect::read(std::string_view name) const {
    if (!def_->is_readable()) {
        throw schema_violation("aspect " + def_->name() + " is not readable");
    }
    const auto* prop = find_property(name);
    if (!prop) {
        throw schema_violation("aspect " + def_->name() + " has no property " + std::string(name));
    }
    if (!prop->is_readable) {
        throw schema_violation("property " + prop->name + " of " + def_->name() + " is not readable");
    }
    return unsafe_read(name);
}

void aspect::write(std::string_view name, const property_value& value) {
    if (!def_->is_writable()) {
        throw schema_violation("aspect " + def_->name() + " is not writable");
    }
    const auto* prop = find_property(name);
    if (!prop) {
        throw schema_violation("aspect " + def_->name() + " has no property " + std::string(name));
    }
    if (!prop->is_writable) {
        throw schema_violation("property " + prop->name + " of " + def_->name() + " is not writable");
    }
    if (value.is_null() && !prop->is_nullable) {
        throw null_violation("property " + prop->name + " of " + def_->name() + " is not nullable");
    }
    if (value.is_list() && !prop->is_multivalued) {
        throw type_coercion_error("list", type_code(prop->type), "property " + prop->name + " is single-valued");
    }
    unsafe_write(name, coerce(as_declared(*prop, value), prop->type, default_offset_));
}

void aspect::add(property_def def, const property_value& value) {
    if (!def_->can_add_properties()) {
        throw schema_violation("aspect " + def_->name() + " does not allow adding properties");
    }
    if (!def_->is_writable()) {
        throw schema_violation("aspect " + def_->name() + " is not writable");
    }
    if (def.name.empty()) {
        throw schema_violation("aspect " + def_->name() + ": property name must not be empty");
    }
    if (find_property(def.name)) {
        throw schema_violation("aspect " + def_->name() + " already has property " + def.name);
    }
    if (value.is_null() && !def.is_nullable) {
        throw null_violation("property " + def.name + " of " + def_->name() + " is not nullable");
    }
    if (value.is_list() && !def.is_multivalued) {
        throw type_coercion_error("list", type_code(def.type), "property " + def.name + " is single-valued");
    }
    auto coerced = coerce(as_declared(def, value), def.type, default_offset_);
    std::string name = def.name;
    added_.push_back(std::move(def));
    unsafe_write(name, std::move(coerced));
}

void aspect::remove(std::string_view name) {
    if (!def_->can_remove_properties()) {
        throw schema_violation("aspect " + def_->name() + " does not allow removing properties");
    }
    const auto* prop = find_property(name);
    if (!prop) {
        throw schema_violation("aspect " + def_->name() + " has no property " + std::string(name));
    }
    if (!prop->is_removable) {
        throw schema_violation("property " + prop->name + " of " + def_->name() + " is not removable");
    }
    unsafe_remove(name);
}

property_value aspect::unsafe_read(std::string_view name) const {
    auto it = values_.find(name);
    if (it != values_.end()) return it->second;
    if (const auto* prop = find_property(name); prop && prop->has_default_value) {
        return prop->default_value;
    }
    return property_value();
}

void aspect::unsafe_write(std::string_view name, property_value value) {
    auto it = values_.find(name);
    if (it != values_.end()) {
        it->second = std::move(value);
    } else {
        values_.emplace(std::string(name), std::move(value));
    }
}

void aspect::unsafe_remove(std::string_view name) {
    auto it = values_.find(name);
    if (it != values_.end()) values_.erase(it);
    for (auto added = added_.begin(); added != added_.end(); ++added) {
        if (added->name == name) {
            added_.erase(added);
            break;
        }
    }
}

bool aspect::values_equal(const aspect& other) const {
    if (owner_ != other.owner_ || def_->name() != other.def_->name()) return false;
    for (const auto& prop : def_->properties()) {
        if (unsafe_read(prop.name) != other.unsafe_read(prop.name)) return false;
    }
    return true;
}

} // namespace strata
