#pragma once

#ifdef __cplusplus

#include "aspect.hpp"
#include "catalog.hpp"
#include "entity.hpp"
#include "hierarchy.hpp"
#include "schema.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strata {

/// Builds the model objects the store and the JSON reader hand back. Override
/// to substitute richer aspect or catalog construction.
class object_factory {
public:
    explicit object_factory(size_t aspect_cache_capacity = 1024, int32_t default_offset_minutes = 0)
        : registry_(aspect_cache_capacity), default_offset_(default_offset_minutes) {}

    virtual ~object_factory() = default;

    entity_registry& entities() { return registry_; }
    int32_t default_offset_minutes() const { return default_offset_; }

    entity get_or_register_entity(const uuid_t& id) { return registry_.get_or_register(id); }
    entity create_entity() { return registry_.create(); }

    /// The (can_add, can_remove) pair picks the mutability shape.
    virtual aspect_def_ptr create_aspect_def(const std::string& name,
                                             const uuid_t& global_id,
                                             std::vector<property_def> properties,
                                             bool is_readable = true,
                                             bool is_writable = true,
                                             bool can_add_properties = false,
                                             bool can_remove_properties = false) {
        return std::make_shared<aspect_def>(name, global_id, std::move(properties), is_readable, is_writable,
                                            can_add_properties, can_remove_properties);
    }

    aspect_def_ptr create_immutable_aspect_def(const std::string& name, const uuid_t& global_id,
                                               std::vector<property_def> properties) {
        return create_aspect_def(name, global_id, std::move(properties), true, true, false, false);
    }

    aspect_def_ptr create_mutable_aspect_def(const std::string& name, const uuid_t& global_id,
                                             std::vector<property_def> properties = {}) {
        return create_aspect_def(name, global_id, std::move(properties), true, true, true, true);
    }

    virtual aspect_ptr create_aspect(const entity& owner, std::shared_ptr<const aspect_def> def) {
        return std::make_shared<aspect>(owner, std::move(def), default_offset_);
    }

    virtual catalog create_catalog(const uuid_t& global_id,
                                   catalog_species species,
                                   std::optional<uri_t> uri = std::nullopt,
                                   std::optional<uuid_t> upstream = std::nullopt,
                                   int64_t version = 0) {
        return catalog(global_id, species, std::move(uri), upstream, version);
    }

    /// def is required for aspect maps and ignored otherwise.
    virtual hierarchy create_hierarchy(hierarchy_type type,
                                       const std::string& name,
                                       const uuid_t& catalog_id,
                                       int64_t version = 0,
                                       std::shared_ptr<const aspect_def> def = nullptr);

private:
    entity_registry registry_;
    int32_t default_offset_;
};

} // namespace strata

#endif // __cplusplus
