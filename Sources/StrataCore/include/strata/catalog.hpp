#pragma once

#ifdef __cplusplus

#include "hierarchy.hpp"
#include "schema.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

/// How a catalog relates to its upstream. Descriptive only: nothing here
/// synchronizes catalogs.
enum class catalog_species {
    source,   // read-only cache of an external source
    sink,     // read-write working copy
    mirror,   // cached read-only view of another catalog
    cache,    // write-through view
    clone,    // manually-synced working copy
    fork      // transient, severable copy
};

/// "SOURCE", "SINK", ...
const char* species_name(catalog_species species);

/// Case-insensitive inverse of species_name.
std::optional<catalog_species> catalog_species_from_string(std::string_view name);

/// SOURCE and SINK stand alone; every other species names an upstream.
inline bool species_requires_upstream(catalog_species species) {
    return species != catalog_species::source && species != catalog_species::sink;
}

class catalog {
public:
    /// Throws schema_violation when the upstream does not match the species.
    catalog(const uuid_t& global_id,
            catalog_species species,
            std::optional<uri_t> uri = std::nullopt,
            std::optional<uuid_t> upstream = std::nullopt,
            int64_t version = 0);

    catalog(catalog&&) noexcept = default;
    catalog& operator=(catalog&&) noexcept = default;
    catalog(const catalog&) = delete;
    catalog& operator=(const catalog&) = delete;

    const uuid_t& global_id() const { return global_id_; }
    catalog_species species() const { return species_; }
    const std::optional<uri_t>& uri() const { return uri_; }
    const std::optional<uuid_t>& upstream() const { return upstream_; }
    int64_t version() const { return version_; }
    void set_version(int64_t v) { version_ = v; }

    // MARK: - Aspect definitions

    /// Registers def. Re-registering a name needs a fully equal definition.
    void extend(aspect_def_ptr def);
    aspect_def_ptr find_aspect_def(std::string_view name) const;
    const std::vector<aspect_def_ptr>& aspect_defs() const { return aspect_defs_; }

    // MARK: - Hierarchies

    /// Adds h, replacing a same-named hierarchy unless that one is an aspect
    /// map. h must belong to this catalog. An aspect map also registers its
    /// aspect definition.
    hierarchy& add_hierarchy(hierarchy h);
    bool remove_hierarchy(std::string_view name);

    hierarchy* find_hierarchy(std::string_view name);
    const hierarchy* find_hierarchy(std::string_view name) const;

    template<typename T>
    T* find(std::string_view name) {
        auto* h = find_hierarchy(name);
        return h ? std::get_if<T>(h) : nullptr;
    }

    template<typename T>
    const T* find(std::string_view name) const {
        const auto* h = find_hierarchy(name);
        return h ? std::get_if<T>(h) : nullptr;
    }

    const std::vector<std::unique_ptr<hierarchy>>& hierarchies() const { return hierarchies_; }

    entity_list_hierarchy& create_entity_list(const std::string& name, int64_t version = 0);
    entity_set_hierarchy& create_entity_set(const std::string& name, int64_t version = 0);
    entity_directory_hierarchy& create_entity_directory(const std::string& name, int64_t version = 0);
    entity_tree_hierarchy& create_entity_tree(const std::string& name, int64_t version = 0);
    aspect_map_hierarchy& create_aspect_map(aspect_def_ptr def, int64_t version = 0);

    // MARK: - Structure

    catalog_def def() const;
    uint64_t schema_hash() const { return def().hash(); }

    /// Same identity fields, equal schema hash and equal hierarchy contents.
    bool contents_equal(const catalog& other) const;

private:
    uuid_t global_id_;
    catalog_species species_;
    std::optional<uri_t> uri_;
    std::optional<uuid_t> upstream_;
    int64_t version_;

    std::vector<aspect_def_ptr> aspect_defs_;
    std::vector<std::unique_ptr<hierarchy>> hierarchies_;
};

} // namespace strata

#endif // __cplusplus
