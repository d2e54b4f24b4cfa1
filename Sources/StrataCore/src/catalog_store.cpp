#include "strata/catalog_store.hpp"
#include "strata/errors.hpp"
#include "strata/json.hpp"
#include "strata/log.hpp"
#include "strata/store_schema.hpp"
#include <algorithm>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace strata {

namespace {

// MARK: - Row access

const column_value_t& column_of(const database::row_t& row, const char* column) {
    auto it = row.find(column);
    if (it == row.end()) {
        throw structural_inconsistency(std::string("stored row has no column ") + column);
    }
    return it->second;
}

std::optional<std::string> optional_text(const database::row_t& row, const char* column) {
    const auto& value = column_of(row, column);
    if (const auto* text = std::get_if<std::string>(&value)) return *text;
    return std::nullopt;
}

std::string text_of(const database::row_t& row, const char* column) {
    auto text = optional_text(row, column);
    if (!text) {
        throw structural_inconsistency(std::string("stored column ") + column + " is not text");
    }
    return *text;
}

int64_t integer_of(const database::row_t& row, const char* column, int64_t fallback = 0) {
    const auto& value = column_of(row, column);
    if (const auto* v = std::get_if<int64_t>(&value)) return *v;
    return fallback;
}

bool flag_of(const database::row_t& row, const char* column) {
    return integer_of(row, column) != 0;
}

uuid_t parse_stored_id(const std::string& text, const std::string& where) {
    auto id = uuid_t::parse(text);
    if (!id) {
        throw structural_inconsistency(where + ": malformed id '" + text + "'");
    }
    return *id;
}

// MARK: - Default values

column_value_t default_to_column(const property_def& def, const value_adapter& adapter) {
    if (!def.has_default_value || def.default_value.is_null()) return nullptr;
    if (def.is_multivalued || def.default_value.is_list()) {
        return value_to_json(coerce(def.default_value, def.type, adapter.default_offset_minutes())).dump();
    }
    auto stored = adapter.to_storage(def.default_value, def.type);
    if (const auto* bytes = std::get_if<std::vector<uint8_t>>(&stored)) return to_hex(*bytes);
    return stored;
}

property_value default_from_column(const column_value_t& stored, property_type type, bool multivalued,
                                   const value_adapter& adapter) {
    if (std::holds_alternative<std::nullptr_t>(stored)) return nullptr;
    if (multivalued) {
        const auto* text = std::get_if<std::string>(&stored);
        if (!text) throw type_coercion_error("column", type_code(type), "default value is not text");
        try {
            return value_from_json(json::parse(*text), type, adapter.default_offset_minutes());
        } catch (const json::parse_error& e) {
            throw type_coercion_error("string", type_code(type), e.what());
        }
    }
    return adapter.from_storage(stored, type);
}

// MARK: - Entity collection

void collect_entities(const hierarchy& h, std::vector<uuid_t>& out) {
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, entity_directory_hierarchy>) {
            for (const auto& [_, e] : v.entries()) out.push_back(e.id());
        } else if constexpr (std::is_same_v<T, entity_tree_hierarchy>) {
            std::vector<entity_tree_hierarchy::node_id> pending{v.root()};
            while (!pending.empty()) {
                const auto& n = v.at(pending.back());
                pending.pop_back();
                if (n.value) out.push_back(n.value->id());
                for (const auto& [_, child] : n.children) pending.push_back(child);
            }
        } else {
            for (const auto& e : v.entities()) out.push_back(e.id());
        }
    }, h);
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

catalog_store::catalog_store(connection_provider& provider, object_factory& factory, const configuration& config)
    : catalog_store(provider, factory, std::make_unique<value_adapter>(config.default_utc_offset_minutes), config) {}

catalog_store::catalog_store(connection_provider& provider, object_factory& factory,
                             std::unique_ptr<value_adapter> adapter, const configuration& config)
    : provider_(provider), factory_(factory), adapter_(std::move(adapter)), config_(config) {
    if (config_.log) {
        set_log_level(*config_.log);
    }
    if (!adapter_) {
        adapter_ = std::make_unique<value_adapter>(config_.default_utc_offset_minutes);
    }
    if (config_.read_only) return;

    connection_lease lease(provider_);
    try {
        create_store_schema(lease.db(), config_.enable_audit);
    } catch (const db_error& e) {
        throw persistence_error("create_store_schema", "-", e.what());
    }
}

// ============================================================================
// Save
// ============================================================================

void catalog_store::save_catalog(const catalog& cat) {
    const std::string catalog_id = cat.global_id().to_string();
    connection_lease lease(provider_);
    auto& db = lease.db();

    try {
        transaction tx(db);

        // Every referenced entity needs its row before the hierarchy rows.
        std::vector<uuid_t> ids{cat.global_id()};
        for (const auto& h : cat.hierarchies()) collect_entities(*h, ids);
        std::unordered_set<uuid_t> seen;
        statement insert_entity(db, "INSERT OR IGNORE INTO entity (entity_id) VALUES (?)");
        for (const auto& id : ids) {
            if (seen.insert(id).second) insert_entity.execute({id.to_string()});
        }

        db.insert("catalog", {
            {"catalog_id", catalog_id},
            {"species", std::string(species_name(cat.species()))},
            {"uri", cat.uri() ? column_value_t(cat.uri()->value) : column_value_t(nullptr)},
            {"upstream_catalog_id", cat.upstream() ? column_value_t(cat.upstream()->to_string()) : column_value_t(nullptr)},
            {"version_number", cat.version()},
        }, {"catalog_id"});

        // Aspect definitions: unlink the ones the catalog dropped, then save the rest.
        std::set<std::string> def_ids;
        for (const auto& def : cat.aspect_defs()) def_ids.insert(def->global_id().to_string());
        for (const auto& row : db.query("SELECT aspect_def_id FROM catalog_aspect_def WHERE catalog_id = ?", {catalog_id})) {
            auto def_id = text_of(row, "aspect_def_id");
            if (!def_ids.count(def_id)) {
                db.execute("DELETE FROM catalog_aspect_def WHERE catalog_id = ? AND aspect_def_id = ?", {catalog_id, def_id});
            }
        }
        for (const auto& def : cat.aspect_defs()) {
            save_aspect_def(db, cat, *def);
        }

        // Hierarchies that are gone or changed type lose their rows by cascade.
        for (const auto& row : db.query("SELECT name, hierarchy_type FROM hierarchy WHERE catalog_id = ?", {catalog_id})) {
            auto name = text_of(row, "name");
            const auto* current = cat.find_hierarchy(name);
            if (!current || text_of(row, "hierarchy_type") != hierarchy_type_code(type_of(*current))) {
                LOG_DEBUG("store", "dropping stored hierarchy %s", name.c_str());
                db.execute("DELETE FROM hierarchy WHERE catalog_id = ? AND name = ?", {catalog_id, name});
            }
        }
        for (const auto& h : cat.hierarchies()) {
            save_hierarchy(db, cat, *h);
        }

        tx.commit();
    } catch (const db_error& e) {
        LOG_ERROR("store", "save of catalog %s rolled back: %s", catalog_id.c_str(), e.what());
        throw persistence_error("save_catalog", catalog_id, e.what());
    } catch (const error& e) {
        LOG_ERROR("store", "save of catalog %s rolled back: %s", catalog_id.c_str(), e.what());
        throw;
    }
    LOG_INFO("store", "saved catalog %s (%zu hierarchies)", catalog_id.c_str(), cat.hierarchies().size());
}

void catalog_store::save_aspect_def(database& db, const catalog& cat, const aspect_def& def) {
    const std::string def_id = def.global_id().to_string();

    db.insert("aspect_def", {
        {"aspect_def_id", def_id},
        {"name", def.name()},
        {"hash_version", std::to_string(def.hash())},
        {"is_readable", int64_t{def.is_readable()}},
        {"is_writable", int64_t{def.is_writable()}},
        {"can_add_properties", int64_t{def.can_add_properties()}},
        {"can_remove_properties", int64_t{def.can_remove_properties()}},
    }, {"aspect_def_id"});

    for (const auto& row : db.query("SELECT name FROM property_def WHERE aspect_def_id = ?", {def_id})) {
        auto name = text_of(row, "name");
        if (def.find_property(name)) continue;
        db.execute("DELETE FROM property_value WHERE aspect_def_id = ? AND property_name = ?", {def_id, name});
        db.execute("DELETE FROM property_def WHERE aspect_def_id = ? AND name = ?", {def_id, name});
    }

    int64_t index = 0;
    for (const auto& prop : def.properties()) {
        db.insert("property_def", {
            {"aspect_def_id", def_id},
            {"name", prop.name},
            {"property_index", index++},
            {"property_type", std::string(type_code(prop.type))},
            {"default_value", default_to_column(prop, *adapter_)},
            {"has_default_value", int64_t{prop.has_default_value}},
            {"is_readable", int64_t{prop.is_readable}},
            {"is_writable", int64_t{prop.is_writable}},
            {"is_nullable", int64_t{prop.is_nullable}},
            {"is_removable", int64_t{prop.is_removable}},
            {"is_multivalued", int64_t{prop.is_multivalued}},
        }, {"aspect_def_id", "name"});
    }

    db.execute("INSERT OR IGNORE INTO catalog_aspect_def (catalog_id, aspect_def_id) VALUES (?, ?)",
               {cat.global_id().to_string(), def_id});
}

void catalog_store::save_hierarchy(database& db, const catalog& cat, const hierarchy& h) {
    const std::string catalog_id = cat.global_id().to_string();
    const auto& base = base_of(h);

    db.insert("hierarchy", {
        {"catalog_id", catalog_id},
        {"name", base.name()},
        {"hierarchy_type", std::string(hierarchy_type_code(type_of(h)))},
        {"version_number", base.version()},
    }, {"catalog_id", "name"});

    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, entity_list_hierarchy>) {
            save_entity_list(db, catalog_id, v);
        } else if constexpr (std::is_same_v<T, entity_set_hierarchy>) {
            save_entity_set(db, catalog_id, v);
        } else if constexpr (std::is_same_v<T, entity_directory_hierarchy>) {
            save_entity_directory(db, catalog_id, v);
        } else if constexpr (std::is_same_v<T, entity_tree_hierarchy>) {
            save_entity_tree(db, catalog_id, v);
        } else {
            save_aspect_map(db, catalog_id, v);
        }
    }, h);
}

void catalog_store::save_entity_list(database& db, const std::string& catalog_id, const entity_list_hierarchy& h) {
    statement upsert(db,
        "INSERT INTO hierarchy_entity_list (catalog_id, hierarchy_name, entity_id, list_order) VALUES (?, ?, ?, ?) "
        "ON CONFLICT (catalog_id, hierarchy_name, list_order) DO UPDATE SET entity_id = excluded.entity_id");
    int64_t order = 0;
    for (const auto& e : h) {
        upsert.execute({catalog_id, h.name(), e.to_string(), order++});
    }
    db.execute("DELETE FROM hierarchy_entity_list WHERE catalog_id = ? AND hierarchy_name = ? AND list_order >= ?",
               {catalog_id, h.name(), order});
}

void catalog_store::save_entity_set(database& db, const std::string& catalog_id, const entity_set_hierarchy& h) {
    for (const auto& row : db.query("SELECT entity_id FROM hierarchy_entity_set WHERE catalog_id = ? AND hierarchy_name = ?",
                                    {catalog_id, h.name()})) {
        auto id = text_of(row, "entity_id");
        auto parsed = uuid_t::parse(id);
        if (!parsed || !h.contains(entity(*parsed))) {
            db.execute("DELETE FROM hierarchy_entity_set WHERE catalog_id = ? AND hierarchy_name = ? AND entity_id = ?",
                       {catalog_id, h.name(), id});
        }
    }

    statement upsert(db,
        "INSERT INTO hierarchy_entity_set (catalog_id, hierarchy_name, entity_id, set_order) VALUES (?, ?, ?, ?) "
        "ON CONFLICT (catalog_id, hierarchy_name, entity_id) DO UPDATE SET set_order = excluded.set_order");
    int64_t order = 0;
    for (const auto& e : h) {
        upsert.execute({catalog_id, h.name(), e.to_string(), order++});
    }
}

void catalog_store::save_entity_directory(database& db, const std::string& catalog_id,
                                          const entity_directory_hierarchy& h) {
    for (const auto& row : db.query("SELECT entity_key FROM hierarchy_entity_directory WHERE catalog_id = ? AND hierarchy_name = ?",
                                    {catalog_id, h.name()})) {
        auto key = text_of(row, "entity_key");
        if (!h.contains_key(key)) {
            db.execute("DELETE FROM hierarchy_entity_directory WHERE catalog_id = ? AND hierarchy_name = ? AND entity_key = ?",
                       {catalog_id, h.name(), key});
        }
    }

    statement upsert(db,
        "INSERT INTO hierarchy_entity_directory (catalog_id, hierarchy_name, entity_key, entity_id, dir_order) "
        "VALUES (?, ?, ?, ?, ?) ON CONFLICT (catalog_id, hierarchy_name, entity_key) "
        "DO UPDATE SET entity_id = excluded.entity_id, dir_order = excluded.dir_order");
    int64_t order = 0;
    for (const auto& [key, e] : h) {
        upsert.execute({catalog_id, h.name(), key, e.to_string(), order++});
    }
}

void catalog_store::save_entity_tree(database& db, const std::string& catalog_id, const entity_tree_hierarchy& h) {
    db.execute("DELETE FROM hierarchy_entity_tree_node WHERE catalog_id = ? AND hierarchy_name = ?",
               {catalog_id, h.name()});

    statement insert(db,
        "INSERT INTO hierarchy_entity_tree_node "
        "(node_id, catalog_id, hierarchy_name, parent_node_id, node_key, entity_id, node_path, tree_order) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)");

    struct pending_node {
        entity_tree_hierarchy::node_id id;
        column_value_t parent_row;
        std::string path;
        int64_t order;
    };

    // Parents are written before their children.
    std::vector<pending_node> pending{{h.root(), nullptr, "", 0}};
    while (!pending.empty()) {
        auto current = std::move(pending.back());
        pending.pop_back();

        const auto& n = h.at(current.id);
        std::string row_id = uuid_t::generate().to_string();
        insert.execute({
            row_id,
            catalog_id,
            h.name(),
            current.parent_row,
            n.key,
            n.value ? column_value_t(n.value->to_string()) : column_value_t(nullptr),
            current.path,
            current.order,
        });

        int64_t order = 0;
        for (const auto& [key, child] : n.children) {
            pending.push_back({child, row_id, current.path + "/" + key, order++});
        }
    }
}

void catalog_store::save_aspect_map(database& db, const std::string& catalog_id, const aspect_map_hierarchy& h) {
    const auto& def = h.def();
    const std::string def_id = def.global_id().to_string();

    if (const auto* mapping = find_table_mapping(def.name())) {
        db.execute("DELETE FROM aspect WHERE catalog_id = ? AND hierarchy_name = ?", {catalog_id, h.name()});
        save_aspect_map_to_table(db, catalog_id, h, *mapping);
        return;
    }

    // Aspects no longer in the map take their values and map rows with them.
    for (const auto& row : db.query("SELECT entity_id FROM aspect WHERE catalog_id = ? AND hierarchy_name = ?",
                                    {catalog_id, h.name()})) {
        auto id = text_of(row, "entity_id");
        auto parsed = uuid_t::parse(id);
        if (!parsed || !h.contains(entity(*parsed))) {
            db.execute("DELETE FROM aspect WHERE entity_id = ? AND aspect_def_id = ? AND catalog_id = ?",
                       {id, def_id, catalog_id});
        }
    }

    statement upsert_aspect(db,
        "INSERT INTO aspect (entity_id, aspect_def_id, catalog_id, hierarchy_name) VALUES (?, ?, ?, ?) "
        "ON CONFLICT (entity_id, aspect_def_id, catalog_id) DO UPDATE SET hierarchy_name = excluded.hierarchy_name");
    statement upsert_entry(db,
        "INSERT INTO hierarchy_aspect_map (catalog_id, hierarchy_name, entity_id, aspect_def_id, map_order) "
        "VALUES (?, ?, ?, ?, ?) ON CONFLICT (catalog_id, hierarchy_name, entity_id) "
        "DO UPDATE SET aspect_def_id = excluded.aspect_def_id, map_order = excluded.map_order");
    statement clear_values(db,
        "DELETE FROM property_value WHERE entity_id = ? AND aspect_def_id = ? AND catalog_id = ?");
    statement insert_value(db,
        "INSERT INTO property_value (entity_id, aspect_def_id, catalog_id, property_name, property_index, "
        "value_index, value_text, value_binary) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");

    int64_t order = 0;
    for (const auto& e : h.entities()) {
        const auto a = h.get(e);
        const std::string entity_id = e.to_string();

        upsert_aspect.execute({entity_id, def_id, catalog_id, h.name()});
        upsert_entry.execute({catalog_id, h.name(), entity_id, def_id, order++});
        clear_values.execute({entity_id, def_id, catalog_id});

        int64_t property_index = 0;
        for (const auto& prop : def.properties()) {
            const int64_t index = property_index++;
            if (!a->contains(prop.name)) continue;

            auto write = [&](const property_value& scalar, int64_t value_index) {
                auto stored = adapter_->to_storage(scalar, prop.type);
                bool binary = std::holds_alternative<std::vector<uint8_t>>(stored);
                insert_value.execute({
                    entity_id, def_id, catalog_id, prop.name, index, value_index,
                    binary ? column_value_t(nullptr) : stored,
                    binary ? stored : column_value_t(nullptr),
                });
            };

            auto value = a->unsafe_read(prop.name);
            if (!prop.is_multivalued) {
                write(value, 0);
            } else if (value.is_list()) {
                int64_t value_index = 0;
                for (const auto& item : value.items()) write(item, value_index++);
            } else if (!value.is_null()) {
                write(value, 0);
            }
        }

        for (const auto& added : a->added_properties()) {
            LOG_WARN("store", "property %s added to aspect %s of %s is not stored", added.name.c_str(),
                     def.name().c_str(), entity_id.c_str());
        }
    }
}

void catalog_store::save_aspect_map_to_table(database& db, const std::string& catalog_id,
                                             const aspect_map_hierarchy& h, const aspect_table_mapping& mapping) {
    if (mapping.has_catalog_id()) {
        db.execute(mapping.clear_sql(), {catalog_id});
    } else {
        db.execute(mapping.clear_sql());
    }

    statement insert(db, mapping.insert_sql());
    for (const auto& e : h.entities()) {
        const auto a = h.get(e);
        std::vector<column_value_t> params;
        if (mapping.has_catalog_id()) params.emplace_back(catalog_id);
        if (mapping.has_entity_id()) params.emplace_back(e.to_string());
        for (const auto& [property, column] : mapping.columns()) {
            const auto* prop = h.def().find_property(property);
            if (!prop) {
                throw structural_inconsistency("table mapping " + mapping.table_name() + " references unknown property " +
                                               property + " of " + h.def().name());
            }
            params.push_back(adapter_->to_column(a->unsafe_read(property), *prop));
        }
        insert.execute(params);
    }
    LOG_DEBUG("store", "wrote %zu rows to %s", h.size(), mapping.table_name().c_str());
}

// ============================================================================
// Load
// ============================================================================

std::optional<catalog> catalog_store::load_catalog(const uuid_t& id) {
    const std::string catalog_id = id.to_string();
    connection_lease lease(provider_);
    auto& db = lease.db();

    try {
        auto rows = db.query("SELECT catalog_id, species, uri, upstream_catalog_id, version_number "
                             "FROM catalog WHERE catalog_id = ?", {catalog_id});
        if (rows.empty()) {
            LOG_DEBUG("store", "catalog %s not found", catalog_id.c_str());
            return std::nullopt;
        }

        auto cat = load_catalog_row(rows.front());
        load_aspect_defs(db, cat);
        load_hierarchies(db, cat);

        LOG_INFO("store", "loaded catalog %s (%zu hierarchies)", catalog_id.c_str(), cat.hierarchies().size());
        return std::optional<catalog>(std::move(cat));
    } catch (const db_error& e) {
        LOG_ERROR("store", "load of catalog %s failed: %s", catalog_id.c_str(), e.what());
        throw persistence_error("load_catalog", catalog_id, e.what());
    }
}

catalog catalog_store::load_catalog_row(const database::row_t& row) {
    const auto catalog_id = text_of(row, "catalog_id");
    const std::string where = "catalog " + catalog_id;

    const auto species_text = text_of(row, "species");
    auto species = catalog_species_from_string(species_text);
    if (!species) {
        throw structural_inconsistency(where + " has unknown species " + species_text);
    }

    std::optional<uri_t> uri;
    if (auto text = optional_text(row, "uri")) {
        uri = uri_t::parse(*text);
        if (!uri) throw structural_inconsistency(where + " has a malformed uri");
    }
    std::optional<uuid_t> upstream;
    if (auto text = optional_text(row, "upstream_catalog_id")) {
        upstream = parse_stored_id(*text, where);
    }

    return factory_.create_catalog(parse_stored_id(catalog_id, where), *species, std::move(uri), upstream,
                                   integer_of(row, "version_number"));
}

void catalog_store::load_aspect_defs(database& db, catalog& cat) {
    auto rows = db.query(
        "SELECT d.aspect_def_id, d.name, d.hash_version, d.is_readable, d.is_writable, "
        "d.can_add_properties, d.can_remove_properties "
        "FROM aspect_def d JOIN catalog_aspect_def c ON c.aspect_def_id = d.aspect_def_id "
        "WHERE c.catalog_id = ? ORDER BY c.rowid",
        {cat.global_id().to_string()});

    for (const auto& row : rows) {
        auto def = load_aspect_def(db, text_of(row, "aspect_def_id"), text_of(row, "name"), row);
        cat.extend(std::move(def));
    }
}

aspect_def_ptr catalog_store::load_aspect_def(database& db, const std::string& aspect_def_id, const std::string& name,
                                              const database::row_t& row) {
    const std::string where = "aspect definition " + name;
    std::vector<property_def> properties;
    for (const auto& prop_row : db.query(
             "SELECT name, property_type, default_value, has_default_value, is_readable, is_writable, "
             "is_nullable, is_removable, is_multivalued FROM property_def "
             "WHERE aspect_def_id = ? ORDER BY property_index, name", {aspect_def_id})) {
        auto prop_name = text_of(prop_row, "name");
        auto code = text_of(prop_row, "property_type");
        auto type = property_type_from_code(code);
        if (!type) {
            throw structural_inconsistency(where + ": property " + prop_name + " has unknown type " + code);
        }

        property_def prop(prop_name, *type);
        prop.is_readable = flag_of(prop_row, "is_readable");
        prop.is_writable = flag_of(prop_row, "is_writable");
        prop.is_nullable = flag_of(prop_row, "is_nullable");
        prop.is_removable = flag_of(prop_row, "is_removable");
        prop.is_multivalued = flag_of(prop_row, "is_multivalued");
        if (flag_of(prop_row, "has_default_value")) {
            prop.with_default(default_from_column(column_of(prop_row, "default_value"), *type, prop.is_multivalued,
                                                  *adapter_));
        }
        properties.push_back(std::move(prop));
    }

    auto def = factory_.create_aspect_def(name, parse_stored_id(aspect_def_id, where), std::move(properties),
                                          flag_of(row, "is_readable"),
                                          flag_of(row, "is_writable"),
                                          flag_of(row, "can_add_properties"),
                                          flag_of(row, "can_remove_properties"));

    auto stored_hash = optional_text(row, "hash_version");
    if (stored_hash && *stored_hash != std::to_string(def->hash())) {
        LOG_WARN("store", "%s: stored hash %s does not match rebuilt definition", where.c_str(), stored_hash->c_str());
    }
    return def;
}

void catalog_store::load_hierarchies(database& db, catalog& cat) {
    const std::string catalog_id = cat.global_id().to_string();
    auto rows = db.query("SELECT name, hierarchy_type, version_number FROM hierarchy "
                         "WHERE catalog_id = ? ORDER BY rowid", {catalog_id});

    for (const auto& row : rows) {
        const auto name = text_of(row, "name");
        const auto code = text_of(row, "hierarchy_type");
        const auto version = integer_of(row, "version_number");
        auto type = hierarchy_type_from_code(code);
        if (!type) {
            throw structural_inconsistency("catalog " + catalog_id + ": hierarchy " + name + " has unknown type " + code);
        }

        if (*type == hierarchy_type::entity_tree) {
            std::vector<tree_node_row> nodes;
            for (const auto& node : db.query(
                     "SELECT node_id, parent_node_id, node_key, entity_id, node_path, tree_order "
                     "FROM hierarchy_entity_tree_node WHERE catalog_id = ? AND hierarchy_name = ?",
                     {catalog_id, name})) {
                tree_node_row r;
                r.node_id = text_of(node, "node_id");
                r.parent_node_id = optional_text(node, "parent_node_id");
                r.node_key = optional_text(node, "node_key").value_or("");
                if (auto id = optional_text(node, "entity_id")) r.entity_id = parse_stored_id(*id, "tree " + name);
                r.node_path = optional_text(node, "node_path").value_or("");
                r.tree_order = integer_of(node, "tree_order");
                nodes.push_back(std::move(r));
            }
            cat.add_hierarchy(assemble_tree(name, cat.global_id(), version, nodes, factory_));
            continue;
        }

        aspect_def_ptr def;
        if (*type == hierarchy_type::aspect_map) {
            def = cat.find_aspect_def(name);
            if (!def) {
                throw structural_inconsistency("catalog " + catalog_id + ": aspect map " + name +
                                               " references an unknown aspect definition");
            }
        }

        auto h = factory_.create_hierarchy(*type, name, cat.global_id(), version, def);
        std::visit([&](auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, entity_list_hierarchy>) {
                load_entity_list(db, v);
            } else if constexpr (std::is_same_v<T, entity_set_hierarchy>) {
                load_entity_set(db, v);
            } else if constexpr (std::is_same_v<T, entity_directory_hierarchy>) {
                load_entity_directory(db, v);
            } else if constexpr (std::is_same_v<T, aspect_map_hierarchy>) {
                load_aspect_map(db, v);
            }
        }, h);
        cat.add_hierarchy(std::move(h));
    }
}

entity catalog_store::entity_from_column(const column_value_t& value, const std::string& where) {
    const auto* text = std::get_if<std::string>(&value);
    if (!text) {
        throw structural_inconsistency(where + ": entity id is not text");
    }
    return factory_.get_or_register_entity(parse_stored_id(*text, where));
}

void catalog_store::load_entity_list(database& db, entity_list_hierarchy& h) {
    for (const auto& row : db.query("SELECT entity_id FROM hierarchy_entity_list "
                                    "WHERE catalog_id = ? AND hierarchy_name = ? ORDER BY list_order",
                                    {h.catalog_id().to_string(), h.name()})) {
        h.add(entity_from_column(column_of(row, "entity_id"), "list " + h.name()));
    }
}

void catalog_store::load_entity_set(database& db, entity_set_hierarchy& h) {
    for (const auto& row : db.query("SELECT entity_id FROM hierarchy_entity_set "
                                    "WHERE catalog_id = ? AND hierarchy_name = ? ORDER BY set_order, rowid",
                                    {h.catalog_id().to_string(), h.name()})) {
        h.add(entity_from_column(column_of(row, "entity_id"), "set " + h.name()));
    }
}

void catalog_store::load_entity_directory(database& db, entity_directory_hierarchy& h) {
    for (const auto& row : db.query("SELECT entity_key, entity_id FROM hierarchy_entity_directory "
                                    "WHERE catalog_id = ? AND hierarchy_name = ? ORDER BY dir_order",
                                    {h.catalog_id().to_string(), h.name()})) {
        h.put(text_of(row, "entity_key"), entity_from_column(column_of(row, "entity_id"), "directory " + h.name()));
    }
}

void catalog_store::load_aspect_map(database& db, aspect_map_hierarchy& h) {
    const auto& def = h.def();
    if (const auto* mapping = find_table_mapping(def.name())) {
        load_aspect_map_from_table(db, h, *mapping);
        return;
    }

    const std::string catalog_id = h.catalog_id().to_string();
    const std::string where = "aspect map " + h.name();

    std::vector<aspect_ptr> aspects;
    std::unordered_map<uuid_t, size_t> index;
    for (const auto& row : db.query("SELECT entity_id FROM hierarchy_aspect_map "
                                    "WHERE catalog_id = ? AND hierarchy_name = ? ORDER BY map_order",
                                    {catalog_id, h.name()})) {
        auto e = entity_from_column(column_of(row, "entity_id"), where);
        index.emplace(e.id(), aspects.size());
        aspects.push_back(factory_.create_aspect(e, h.def_ptr()));
    }

    // Values observed per aspect, by property name.
    std::vector<std::map<std::string, property_value::list_t>> observed(aspects.size());
    std::set<std::string> skipped;

    statement values(db,
        "SELECT entity_id, property_name, value_text, value_binary FROM property_value "
        "WHERE catalog_id = ? AND aspect_def_id = ? ORDER BY entity_id, property_name, value_index");
    values.bind_all({catalog_id, def.global_id().to_string()});
    while (values.step()) {
        auto owner = values.column(0);
        const auto* owner_text = std::get_if<std::string>(&owner);
        auto owner_id = owner_text ? uuid_t::parse(*owner_text) : std::nullopt;
        auto slot = owner_id ? index.find(*owner_id) : index.end();
        if (slot == index.end()) continue;

        auto name_column = values.column(1);
        const auto* name = std::get_if<std::string>(&name_column);
        if (!name) continue;
        const auto* prop = def.find_property(*name);
        if (!prop) {
            if (skipped.insert(*name).second) {
                LOG_WARN("store", "%s: skipping stored property %s missing from the definition", where.c_str(),
                         name->c_str());
            }
            continue;
        }

        auto binary = values.column(3);
        auto stored = std::holds_alternative<std::nullptr_t>(binary) ? values.column(2) : binary;
        observed[slot->second][*name].push_back(adapter_->from_storage(stored, prop->type));
    }

    for (size_t i = 0; i < aspects.size(); ++i) {
        auto& a = aspects[i];
        for (const auto& prop : def.properties()) {
            auto it = observed[i].find(prop.name);
            if (it != observed[i].end()) {
                if (prop.is_multivalued) {
                    a->unsafe_write(prop.name, property_value::make_list(std::move(it->second)));
                } else {
                    a->unsafe_write(prop.name, std::move(it->second.front()));
                }
            } else if (prop.is_multivalued) {
                // Empty lists store no rows.
                a->unsafe_write(prop.name, property_value::make_list());
            }
        }
        h.put(a);
        factory_.entities().cache_aspect(a);
    }
}

void catalog_store::load_aspect_map_from_table(database& db, aspect_map_hierarchy& h,
                                               const aspect_table_mapping& mapping) {
    statement select(db, mapping.select_sql());
    if (mapping.has_catalog_id()) {
        select.bind_all({h.catalog_id().to_string()});
    } else {
        select.bind_all({});
    }

    while (select.step()) {
        int column = mapping.has_catalog_id() ? 1 : 0;
        entity owner = mapping.has_entity_id()
            ? entity_from_column(select.column(column++), "table " + mapping.table_name())
            : factory_.create_entity();

        auto a = factory_.create_aspect(owner, h.def_ptr());
        for (const auto& [property, _] : mapping.columns()) {
            const auto* prop = h.def().find_property(property);
            auto stored = select.column(column++);
            if (!prop) {
                LOG_WARN("store", "table %s: skipping column for unknown property %s", mapping.table_name().c_str(),
                         property.c_str());
                continue;
            }
            a->unsafe_write(property, adapter_->from_column(stored, *prop));
        }
        h.put(a);
    }
}

// ============================================================================
// Tree assembly
// ============================================================================

entity_tree_hierarchy catalog_store::assemble_tree(const std::string& name, const uuid_t& catalog_id, int64_t version,
                                                   const std::vector<tree_node_row>& rows, object_factory& factory) {
    entity_tree_hierarchy tree(name, catalog_id, version);
    if (rows.empty()) return tree;

    const std::string where = "tree " + name;

    // First pass: every row by id.
    std::unordered_map<std::string, size_t> by_id;
    for (size_t i = 0; i < rows.size(); ++i) {
        if (!by_id.emplace(rows[i].node_id, i).second) {
            throw structural_inconsistency(where + ": duplicate node id " + rows[i].node_id);
        }
    }

    // Second pass: wire parent -> children edges.
    std::optional<size_t> root;
    std::unordered_map<std::string, std::vector<size_t>> children;
    for (size_t i = 0; i < rows.size(); ++i) {
        const auto& row = rows[i];
        if (!row.parent_node_id) {
            if (root) throw structural_inconsistency(where + ": more than one root node");
            root = i;
            continue;
        }
        if (!by_id.count(*row.parent_node_id)) {
            throw structural_inconsistency(where + ": node " + row.node_id + " references missing parent " +
                                           *row.parent_node_id);
        }
        children[*row.parent_node_id].push_back(i);
    }
    if (!root) {
        throw structural_inconsistency(where + ": no root node");
    }

    auto entity_of = [&](const tree_node_row& row) -> std::optional<entity> {
        if (!row.entity_id) return std::nullopt;
        return factory.get_or_register_entity(*row.entity_id);
    };

    tree.set_value(tree.root(), entity_of(rows[*root]));
    size_t placed = 1;

    std::vector<std::pair<size_t, entity_tree_hierarchy::node_id>> pending{{*root, tree.root()}};
    while (!pending.empty()) {
        auto [row_index, node] = pending.back();
        pending.pop_back();

        auto it = children.find(rows[row_index].node_id);
        if (it == children.end()) continue;
        auto& siblings = it->second;
        std::sort(siblings.begin(), siblings.end(), [&](size_t a, size_t b) {
            if (rows[a].node_path != rows[b].node_path) return rows[a].node_path < rows[b].node_path;
            return rows[a].tree_order < rows[b].tree_order;
        });
        for (size_t child : siblings) {
            const auto& row = rows[child];
            if (tree.child(node, row.node_key)) {
                throw structural_inconsistency(where + ": duplicate key " + row.node_key + " under " + tree.path_of(node));
            }
            pending.emplace_back(child, tree.add_child(node, row.node_key, entity_of(row)));
            ++placed;
        }
    }

    if (placed != rows.size()) {
        throw structural_inconsistency(where + ": " + std::to_string(rows.size() - placed) + " unreachable nodes");
    }
    return tree;
}

// ============================================================================
// Exists / delete
// ============================================================================

bool catalog_store::catalog_exists(const uuid_t& id) {
    connection_lease lease(provider_);
    try {
        return !lease->query("SELECT 1 FROM catalog WHERE catalog_id = ?", {id.to_string()}).empty();
    } catch (const db_error& e) {
        throw persistence_error("catalog_exists", id.to_string(), e.what());
    }
}

bool catalog_store::delete_catalog(const uuid_t& id) {
    const std::string catalog_id = id.to_string();
    connection_lease lease(provider_);
    auto& db = lease.db();

    bool deleted = false;
    try {
        transaction tx(db);

        for (const auto& row : db.query("SELECT d.name FROM aspect_def d "
                                        "JOIN catalog_aspect_def c ON c.aspect_def_id = d.aspect_def_id "
                                        "WHERE c.catalog_id = ?", {catalog_id})) {
            const auto* mapping = find_table_mapping(text_of(row, "name"));
            if (!mapping) continue;
            if (mapping->has_catalog_id()) {
                db.execute(mapping->clear_sql(), {catalog_id});
            } else {
                LOG_DEBUG("store", "table %s is not catalog-scoped; leaving its rows", mapping->table_name().c_str());
            }
        }

        db.execute("DELETE FROM catalog WHERE catalog_id = ?", {catalog_id});
        deleted = db.changes() > 0;
        tx.commit();
    } catch (const db_error& e) {
        LOG_ERROR("store", "delete of catalog %s rolled back: %s", catalog_id.c_str(), e.what());
        throw persistence_error("delete_catalog", catalog_id, e.what());
    }

    if (deleted) {
        LOG_INFO("store", "deleted catalog %s", catalog_id.c_str());
    }
    return deleted;
}

// ============================================================================
// Mapped tables
// ============================================================================

void catalog_store::create_aspect_table(const aspect_table_mapping& mapping) {
    mapping.validate();
    {
        connection_lease lease(provider_);
        try {
            lease->execute(mapping.create_table_sql());
        } catch (const db_error& e) {
            throw persistence_error("create_aspect_table " + mapping.table_name(), "-", e.what());
        }
    }
    add_aspect_table_mapping(mapping);
}

void catalog_store::create_aspect_table(aspect_def_ptr def, const std::string& table_name) {
    create_aspect_table(aspect_table_mapping(std::move(def), table_name));
}

void catalog_store::add_aspect_table_mapping(aspect_table_mapping mapping) {
    mapping.validate();
    auto name = mapping.def().name();
    LOG_DEBUG("store", "aspect %s maps to table %s", name.c_str(), mapping.table_name().c_str());
    mappings_.insert_or_assign(std::move(name), std::move(mapping));
}

const aspect_table_mapping* catalog_store::find_table_mapping(std::string_view aspect_def_name) const {
    auto it = mappings_.find(aspect_def_name);
    return it == mappings_.end() ? nullptr : &it->second;
}

} // namespace strata
