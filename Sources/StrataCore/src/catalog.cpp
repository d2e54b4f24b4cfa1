#include "strata/catalog.hpp"
#include "strata/errors.hpp"
#include "strata/log.hpp"
#include <algorithm>
#include <cctype>

namespace strata {

const char* species_name(catalog_species species) {
    switch (species) {
        case catalog_species::source: return "SOURCE";
        case catalog_species::sink: return "SINK";
        case catalog_species::mirror: return "MIRROR";
        case catalog_species::cache: return "CACHE";
        case catalog_species::clone: return "CLONE";
        case catalog_species::fork: return "FORK";
    }
    return "UNKNOWN";
}

std::optional<catalog_species> catalog_species_from_string(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (auto species : {catalog_species::source, catalog_species::sink, catalog_species::mirror,
                         catalog_species::cache, catalog_species::clone, catalog_species::fork}) {
        if (upper == species_name(species)) return species;
    }
    return std::nullopt;
}

catalog::catalog(const uuid_t& global_id,
                 catalog_species species,
                 std::optional<uri_t> uri,
                 std::optional<uuid_t> upstream,
                 int64_t version)
    : global_id_(global_id)
    , species_(species)
    , uri_(std::move(uri))
    , upstream_(upstream)
    , version_(version) {
    if (species_requires_upstream(species_) && !upstream_) {
        throw schema_violation(std::string(species_name(species_)) + " catalog " +
                               global_id_.to_string() + " requires an upstream catalog");
    }
    if (!species_requires_upstream(species_) && upstream_) {
        throw schema_violation(std::string(species_name(species_)) + " catalog " +
                               global_id_.to_string() + " cannot have an upstream catalog");
    }
}

// MARK: - Aspect definitions

void catalog::extend(aspect_def_ptr def) {
    if (!def) {
        throw schema_violation("catalog " + global_id_.to_string() + ": null aspect definition");
    }
    auto it = std::find_if(aspect_defs_.begin(), aspect_defs_.end(),
                           [&](const aspect_def_ptr& d) { return d->name() == def->name(); });
    if (it == aspect_defs_.end()) {
        aspect_defs_.push_back(std::move(def));
        return;
    }
    if (it->get() == def.get()) return;
    if (!(*it)->fully_equals(*def)) {
        throw schema_violation("catalog " + global_id_.to_string() + " already has a different aspect definition " +
                               def->name());
    }
}

aspect_def_ptr catalog::find_aspect_def(std::string_view name) const {
    for (const auto& def : aspect_defs_) {
        if (def->name() == name) return def;
    }
    return nullptr;
}

// MARK: - Hierarchies

hierarchy& catalog::add_hierarchy(hierarchy h) {
    const auto& base = base_of(h);
    if (base.catalog_id() != global_id_) {
        throw schema_violation("hierarchy " + base.name() + " belongs to catalog " +
                               base.catalog_id().to_string() + ", not " + global_id_.to_string());
    }

    if (auto* am = std::get_if<aspect_map_hierarchy>(&h)) {
        auto def = find_aspect_def(am->def().name());
        if (!def) {
            extend(std::const_pointer_cast<aspect_def>(am->def_ptr()));
        } else if (def.get() != &am->def() && !def->fully_equals(am->def())) {
            throw schema_violation("aspect map " + base.name() + " uses a definition that differs from the catalog's");
        }
    }

    for (auto& existing : hierarchies_) {
        if (name_of(*existing) != base.name()) continue;
        if (type_of(*existing) == hierarchy_type::aspect_map) {
            throw schema_violation("catalog " + global_id_.to_string() + ": hierarchy " + base.name() +
                                   " would replace an aspect map");
        }
        LOG_DEBUG("catalog", "replacing hierarchy %s", base.name().c_str());
        *existing = std::move(h);
        return *existing;
    }

    hierarchies_.push_back(std::make_unique<hierarchy>(std::move(h)));
    return *hierarchies_.back();
}

bool catalog::remove_hierarchy(std::string_view name) {
    auto it = std::find_if(hierarchies_.begin(), hierarchies_.end(),
                           [&](const std::unique_ptr<hierarchy>& h) { return name_of(*h) == name; });
    if (it == hierarchies_.end()) return false;
    hierarchies_.erase(it);
    return true;
}

hierarchy* catalog::find_hierarchy(std::string_view name) {
    for (auto& h : hierarchies_) {
        if (name_of(*h) == name) return h.get();
    }
    return nullptr;
}

const hierarchy* catalog::find_hierarchy(std::string_view name) const {
    for (const auto& h : hierarchies_) {
        if (name_of(*h) == name) return h.get();
    }
    return nullptr;
}

entity_list_hierarchy& catalog::create_entity_list(const std::string& name, int64_t version) {
    return std::get<entity_list_hierarchy>(add_hierarchy(entity_list_hierarchy(name, global_id_, version)));
}

entity_set_hierarchy& catalog::create_entity_set(const std::string& name, int64_t version) {
    return std::get<entity_set_hierarchy>(add_hierarchy(entity_set_hierarchy(name, global_id_, version)));
}

entity_directory_hierarchy& catalog::create_entity_directory(const std::string& name, int64_t version) {
    return std::get<entity_directory_hierarchy>(add_hierarchy(entity_directory_hierarchy(name, global_id_, version)));
}

entity_tree_hierarchy& catalog::create_entity_tree(const std::string& name, int64_t version) {
    return std::get<entity_tree_hierarchy>(add_hierarchy(entity_tree_hierarchy(name, global_id_, version)));
}

aspect_map_hierarchy& catalog::create_aspect_map(aspect_def_ptr def, int64_t version) {
    if (!def) {
        throw schema_violation("catalog " + global_id_.to_string() + ": aspect map needs an aspect definition");
    }
    extend(def);
    auto registered = find_aspect_def(def->name());
    return std::get<aspect_map_hierarchy>(add_hierarchy(aspect_map_hierarchy(registered, global_id_, version)));
}

// MARK: - Structure

catalog_def catalog::def() const {
    catalog_def out;
    out.aspect_defs = aspect_defs_;
    for (const auto& h : hierarchies_) {
        out.hierarchy_defs.push_back(def_of(*h));
    }
    return out;
}

bool catalog::contents_equal(const catalog& other) const {
    if (global_id_ != other.global_id_ || species_ != other.species_ || uri_ != other.uri_ ||
        upstream_ != other.upstream_ || version_ != other.version_) {
        return false;
    }
    if (schema_hash() != other.schema_hash()) return false;
    if (hierarchies_.size() != other.hierarchies_.size()) return false;
    for (const auto& h : hierarchies_) {
        const auto* theirs = other.find_hierarchy(name_of(*h));
        if (!theirs || !strata::contents_equal(*h, *theirs)) return false;
    }
    return true;
}

} // namespace strata
