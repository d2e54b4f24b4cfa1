#include "strata/json.hpp"
#include "strata/errors.hpp"
#include "strata/log.hpp"
#include <algorithm>
#include <cctype>

namespace strata {

namespace {

const json& require(const json& j, const char* key, const std::string& where) {
    auto it = j.find(key);
    if (it == j.end()) {
        throw structural_inconsistency(where + ": missing \"" + key + "\"");
    }
    return *it;
}

uuid_t parse_id(const json& j, const std::string& where) {
    if (!j.is_string()) {
        throw structural_inconsistency(where + ": expected an id string");
    }
    auto id = uuid_t::parse(j.get<std::string>());
    if (!id) {
        throw structural_inconsistency(where + ": malformed id '" + j.get<std::string>() + "'");
    }
    return *id;
}

bool flag(const json& j, const char* key, bool fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    return it->get<bool>();
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// MARK: - Hierarchy contents

json tree_node_to_json(const entity_tree_hierarchy& tree, entity_tree_hierarchy::node_id id) {
    const auto& n = tree.at(id);
    json out = json::object();
    if (n.value) out["entityId"] = *n.value;
    json children = json::object();
    for (const auto& [key, child] : n.children) {
        children[key] = tree_node_to_json(tree, child);
    }
    out["children"] = std::move(children);
    return out;
}

void tree_node_from_json(const json& j, entity_tree_hierarchy& tree, entity_tree_hierarchy::node_id id,
                         object_factory& factory) {
    if (auto it = j.find("entityId"); it != j.end() && !it->is_null()) {
        tree.set_value(id, factory.get_or_register_entity(parse_id(*it, "tree " + tree.name())));
    }
    auto children = j.find("children");
    if (children == j.end()) return;
    for (const auto& [key, child] : children->items()) {
        auto child_id = tree.add_child(id, key);
        tree_node_from_json(child, tree, child_id, factory);
    }
}

json aspect_to_json(const aspect& a) {
    json out = json::object();
    for (const auto& prop : a.def().properties()) {
        if (a.contains(prop.name)) out[prop.name] = value_to_json(a.unsafe_read(prop.name));
    }
    return out;
}

json contents_to_json(const hierarchy& h) {
    return std::visit([](const auto& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, entity_list_hierarchy> || std::is_same_v<T, entity_set_hierarchy>) {
            json out = json::array();
            for (const auto& e : v.entities()) out.push_back(e);
            return out;
        } else if constexpr (std::is_same_v<T, entity_directory_hierarchy>) {
            json out = json::object();
            for (const auto& [key, e] : v.entries()) out[key] = e;
            return out;
        } else if constexpr (std::is_same_v<T, entity_tree_hierarchy>) {
            return tree_node_to_json(v, v.root());
        } else {
            json out = json::object();
            for (const auto& e : v.entities()) out[e.to_string()] = aspect_to_json(*v.get(e));
            return out;
        }
    }, h);
}

void contents_from_json(const json& j, hierarchy& h, object_factory& factory) {
    const std::string where = "hierarchy " + name_of(h);
    std::visit([&](auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, entity_list_hierarchy> || std::is_same_v<T, entity_set_hierarchy>) {
            if (!j.is_array()) throw structural_inconsistency(where + ": contents must be an array");
            for (const auto& id : j) v.add(factory.get_or_register_entity(parse_id(id, where)));
        } else if constexpr (std::is_same_v<T, entity_directory_hierarchy>) {
            if (!j.is_object()) throw structural_inconsistency(where + ": contents must be an object");
            for (const auto& [key, id] : j.items()) v.put(key, factory.get_or_register_entity(parse_id(id, where)));
        } else if constexpr (std::is_same_v<T, entity_tree_hierarchy>) {
            if (!j.is_object()) throw structural_inconsistency(where + ": contents must be an object");
            tree_node_from_json(j, v, v.root(), factory);
        } else {
            if (!j.is_object()) throw structural_inconsistency(where + ": contents must be an object");
            for (const auto& [id, values] : j.items()) {
                auto owner = factory.get_or_register_entity(parse_id(json(id), where));
                auto a = factory.create_aspect(owner, v.def_ptr());
                for (const auto& [name, value] : values.items()) {
                    const auto* prop = v.def().find_property(name);
                    if (!prop) {
                        LOG_WARN("json", "skipping unknown property %s of %s", name.c_str(), v.def().name().c_str());
                        continue;
                    }
                    a->unsafe_write(name, value_from_json(value, prop->type, factory.default_offset_minutes()));
                }
                v.put(std::move(a));
            }
        }
    }, h);
}

} // namespace

void from_json(const json& j, uuid_t& u) {
    u = parse_id(j, "uuid");
}

// ============================================================================
// Property values
// ============================================================================

json value_to_json(const property_value& value) {
    return std::visit([&](auto&& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double> ||
                             std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, property_value::list_t>) {
            json out = json::array();
            for (const auto& item : v) out.push_back(value_to_json(item));
            return out;
        } else {
            return value.to_string();
        }
    }, value.storage());
}

property_value value_from_json(const json& j) {
    if (j.is_null()) return nullptr;
    if (j.is_boolean()) return j.get<bool>();
    if (j.is_number_integer()) return j.get<int64_t>();
    if (j.is_number()) return j.get<double>();
    if (j.is_string()) return j.get<std::string>();
    if (j.is_array()) {
        property_value::list_t items;
        items.reserve(j.size());
        for (const auto& item : j) items.push_back(value_from_json(item));
        return property_value::make_list(std::move(items));
    }
    throw type_coercion_error("object", "property value");
}

property_value value_from_json(const json& j, property_type type, int32_t default_offset_minutes) {
    if (type == property_type::blob) {
        auto decode = [](const json& item) -> property_value {
            if (item.is_null()) return nullptr;
            if (!item.is_string()) throw type_coercion_error(item.type_name(), type_code(property_type::blob));
            auto bytes = blob_from_hex(item.get<std::string>());
            if (!bytes) throw type_coercion_error("string", type_code(property_type::blob), "not hex");
            return *bytes;
        };
        if (!j.is_array()) return decode(j);
        property_value::list_t items;
        for (const auto& item : j) items.push_back(decode(item));
        return property_value::make_list(std::move(items));
    }
    return coerce(value_from_json(j), type, default_offset_minutes);
}

// ============================================================================
// Schema
// ============================================================================

json property_def_to_json(const property_def& def) {
    json out = json::object();
    out["name"] = def.name;
    out["type"] = type_code(def.type);
    if (def.has_default_value) out["defaultValue"] = value_to_json(def.default_value);
    if (!def.is_readable) out["isReadable"] = false;
    if (!def.is_writable) out["isWritable"] = false;
    if (!def.is_nullable) out["isNullable"] = false;
    if (def.is_removable) out["isRemovable"] = true;
    if (def.is_multivalued) out["isMultivalued"] = true;
    return out;
}

property_def property_def_from_json(const json& j) {
    const auto& name = require(j, "name", "property definition").get<std::string>();
    const auto& code = require(j, "type", "property " + name).get<std::string>();
    auto type = property_type_from_code(code);
    if (!type) {
        throw structural_inconsistency("property " + name + ": unknown type code " + code);
    }

    property_def def(name, *type);
    def.is_readable = flag(j, "isReadable", true);
    def.is_writable = flag(j, "isWritable", true);
    def.is_nullable = flag(j, "isNullable", true);
    def.is_removable = flag(j, "isRemovable", false);
    def.is_multivalued = flag(j, "isMultivalued", false);
    if (auto it = j.find("defaultValue"); it != j.end()) {
        def.with_default(value_from_json(*it, *type));
    }
    return def;
}

json aspect_def_to_json(const aspect_def& def) {
    json out = json::object();
    out["name"] = def.name();
    out["globalId"] = def.global_id();
    if (!def.is_readable()) out["isReadable"] = false;
    if (!def.is_writable()) out["isWritable"] = false;
    if (def.can_add_properties()) out["canAddProperties"] = true;
    if (def.can_remove_properties()) out["canRemoveProperties"] = true;
    json props = json::array();
    for (const auto& prop : def.properties()) props.push_back(property_def_to_json(prop));
    out["propertyDefs"] = std::move(props);
    return out;
}

aspect_def_ptr aspect_def_from_json(const json& j, object_factory& factory) {
    const auto& name = require(j, "name", "aspect definition").get<std::string>();
    auto id = parse_id(require(j, "globalId", "aspect definition " + name), "aspect definition " + name);

    std::vector<property_def> props;
    if (auto it = j.find("propertyDefs"); it != j.end()) {
        for (const auto& prop : *it) props.push_back(property_def_from_json(prop));
    }
    return factory.create_aspect_def(name, id, std::move(props),
                                     flag(j, "isReadable", true),
                                     flag(j, "isWritable", true),
                                     flag(j, "canAddProperties", false),
                                     flag(j, "canRemoveProperties", false));
}

// ============================================================================
// Catalogs
// ============================================================================

json to_json(const catalog& cat) {
    json out = json::object();
    out["globalId"] = cat.global_id();
    if (cat.uri()) out["uri"] = cat.uri()->value;
    out["species"] = lowercase(species_name(cat.species()));
    if (cat.upstream()) out["upstream"] = *cat.upstream();
    out["version"] = cat.version();

    json defs = json::object();
    for (const auto& def : cat.aspect_defs()) defs[def->name()] = aspect_def_to_json(*def);
    out["aspectDefs"] = std::move(defs);

    json hierarchies = json::object();
    for (const auto& h : cat.hierarchies()) {
        const auto& base = base_of(*h);
        json entry = json::object();
        entry["type"] = hierarchy_type_code(type_of(*h));
        entry["name"] = base.name();
        entry["version"] = base.version();
        entry["contents"] = contents_to_json(*h);
        hierarchies[base.name()] = std::move(entry);
    }
    out["hierarchies"] = std::move(hierarchies);
    return out;
}

catalog catalog_from_json(const json& j, object_factory& factory) {
    if (!j.is_object()) {
        throw structural_inconsistency("catalog document must be an object");
    }
    auto id = parse_id(require(j, "globalId", "catalog"), "catalog");
    const std::string where = "catalog " + id.to_string();

    const auto& species_text = require(j, "species", where).get<std::string>();
    auto species = catalog_species_from_string(species_text);
    if (!species) {
        throw structural_inconsistency(where + ": unknown species " + species_text);
    }

    std::optional<uri_t> uri;
    if (auto it = j.find("uri"); it != j.end() && !it->is_null()) {
        uri = uri_t::parse(it->get<std::string>());
        if (!uri) throw structural_inconsistency(where + ": malformed uri");
    }
    std::optional<uuid_t> upstream;
    if (auto it = j.find("upstream"); it != j.end() && !it->is_null()) {
        upstream = parse_id(*it, where);
    }
    int64_t version = j.value("version", int64_t{0});

    auto cat = factory.create_catalog(id, *species, std::move(uri), upstream, version);

    if (auto defs = j.find("aspectDefs"); defs != j.end()) {
        for (const auto& [name, def] : defs->items()) {
            cat.extend(aspect_def_from_json(def, factory));
        }
    }

    if (auto hierarchies = j.find("hierarchies"); hierarchies != j.end()) {
        for (const auto& [name, entry] : hierarchies->items()) {
            const auto& code = require(entry, "type", where + " hierarchy " + name).get<std::string>();
            auto type = hierarchy_type_from_code(code);
            if (!type) {
                throw structural_inconsistency(where + ": hierarchy " + name + " has unknown type " + code);
            }
            aspect_def_ptr def;
            if (*type == hierarchy_type::aspect_map) {
                def = cat.find_aspect_def(name);
                if (!def) {
                    throw structural_inconsistency(where + ": aspect map " + name + " references an unknown aspect definition");
                }
            }
            auto h = factory.create_hierarchy(*type, name, id, entry.value("version", int64_t{0}), def);
            if (auto contents = entry.find("contents"); contents != entry.end()) {
                contents_from_json(*contents, h, factory);
            }
            cat.add_hierarchy(std::move(h));
        }
    }

    LOG_DEBUG("json", "imported catalog %s", id.to_string().c_str());
    return cat;
}

} // namespace strata
