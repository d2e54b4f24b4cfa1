#include "strata/store_schema.hpp"
#include "strata/log.hpp"

namespace strata {

namespace {

const char* const table_ddl[] = {
R"(CREATE TABLE IF NOT EXISTS entity (
    entity_id TEXT PRIMARY KEY
))",

R"(CREATE TABLE IF NOT EXISTS aspect_def (
    aspect_def_id TEXT PRIMARY KEY,
    name TEXT NOT NULL UNIQUE,
    hash_version TEXT,
    is_readable INTEGER NOT NULL DEFAULT 1 CHECK (is_readable IN (0, 1)),
    is_writable INTEGER NOT NULL DEFAULT 1 CHECK (is_writable IN (0, 1)),
    can_add_properties INTEGER NOT NULL DEFAULT 0 CHECK (can_add_properties IN (0, 1)),
    can_remove_properties INTEGER NOT NULL DEFAULT 0 CHECK (can_remove_properties IN (0, 1))
))",

R"(CREATE TABLE IF NOT EXISTS property_def (
    aspect_def_id TEXT NOT NULL REFERENCES aspect_def(aspect_def_id) ON DELETE CASCADE,
    name TEXT NOT NULL,
    property_index INTEGER NOT NULL DEFAULT 0,
    property_type TEXT NOT NULL CHECK (property_type IN (
        'INT', 'FLT', 'BLN', 'STR', 'TXT', 'BGI', 'BGF',
        'DAT', 'URI', 'UID', 'CLB', 'BLB'
    )),
    default_value TEXT,
    has_default_value INTEGER NOT NULL DEFAULT 0 CHECK (has_default_value IN (0, 1)),
    is_readable INTEGER NOT NULL DEFAULT 1 CHECK (is_readable IN (0, 1)),
    is_writable INTEGER NOT NULL DEFAULT 1 CHECK (is_writable IN (0, 1)),
    is_nullable INTEGER NOT NULL DEFAULT 1 CHECK (is_nullable IN (0, 1)),
    is_removable INTEGER NOT NULL DEFAULT 0 CHECK (is_removable IN (0, 1)),
    is_multivalued INTEGER NOT NULL DEFAULT 0 CHECK (is_multivalued IN (0, 1)),
    PRIMARY KEY (aspect_def_id, name)
))",

R"(CREATE TABLE IF NOT EXISTS catalog (
    catalog_id TEXT PRIMARY KEY,
    species TEXT NOT NULL CHECK (species IN ('SOURCE', 'SINK', 'MIRROR', 'CACHE', 'CLONE', 'FORK')),
    uri TEXT,
    upstream_catalog_id TEXT,
    version_number INTEGER NOT NULL DEFAULT 0
))",

R"(CREATE TABLE IF NOT EXISTS catalog_aspect_def (
    catalog_id TEXT NOT NULL REFERENCES catalog(catalog_id) ON DELETE CASCADE,
    aspect_def_id TEXT NOT NULL REFERENCES aspect_def(aspect_def_id) ON DELETE CASCADE,
    PRIMARY KEY (catalog_id, aspect_def_id)
))",

R"(CREATE TABLE IF NOT EXISTS hierarchy (
    catalog_id TEXT NOT NULL REFERENCES catalog(catalog_id) ON DELETE CASCADE,
    name TEXT NOT NULL,
    hierarchy_type TEXT NOT NULL CHECK (hierarchy_type IN ('EL', 'ES', 'ED', 'ET', 'AM')),
    version_number INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY (catalog_id, name)
))",

R"(CREATE TABLE IF NOT EXISTS aspect (
    entity_id TEXT NOT NULL REFERENCES entity(entity_id) ON DELETE CASCADE,
    aspect_def_id TEXT NOT NULL REFERENCES aspect_def(aspect_def_id) ON DELETE CASCADE,
    catalog_id TEXT NOT NULL REFERENCES catalog(catalog_id) ON DELETE CASCADE,
    hierarchy_name TEXT NOT NULL,
    PRIMARY KEY (entity_id, aspect_def_id, catalog_id),
    FOREIGN KEY (catalog_id, hierarchy_name) REFERENCES hierarchy(catalog_id, name) ON DELETE CASCADE
))",

R"(CREATE TABLE IF NOT EXISTS property_value (
    entity_id TEXT NOT NULL,
    aspect_def_id TEXT NOT NULL,
    catalog_id TEXT NOT NULL,
    property_name TEXT NOT NULL,
    property_index INTEGER NOT NULL DEFAULT 0,
    value_index INTEGER NOT NULL DEFAULT 0,
    value_text TEXT,
    value_binary BLOB,
    PRIMARY KEY (entity_id, aspect_def_id, catalog_id, property_name, value_index),
    FOREIGN KEY (entity_id, aspect_def_id, catalog_id) REFERENCES aspect(entity_id, aspect_def_id, catalog_id) ON DELETE CASCADE,
    FOREIGN KEY (aspect_def_id, property_name) REFERENCES property_def(aspect_def_id, name)
))",

R"(CREATE TABLE IF NOT EXISTS hierarchy_entity_list (
    catalog_id TEXT NOT NULL REFERENCES catalog(catalog_id) ON DELETE CASCADE,
    hierarchy_name TEXT NOT NULL,
    entity_id TEXT NOT NULL REFERENCES entity(entity_id) ON DELETE CASCADE,
    list_order INTEGER NOT NULL,
    PRIMARY KEY (catalog_id, hierarchy_name, list_order),
    FOREIGN KEY (catalog_id, hierarchy_name) REFERENCES hierarchy(catalog_id, name) ON DELETE CASCADE
))",

R"(CREATE TABLE IF NOT EXISTS hierarchy_entity_set (
    catalog_id TEXT NOT NULL REFERENCES catalog(catalog_id) ON DELETE CASCADE,
    hierarchy_name TEXT NOT NULL,
    entity_id TEXT NOT NULL REFERENCES entity(entity_id) ON DELETE CASCADE,
    set_order INTEGER,
    PRIMARY KEY (catalog_id, hierarchy_name, entity_id),
    FOREIGN KEY (catalog_id, hierarchy_name) REFERENCES hierarchy(catalog_id, name) ON DELETE CASCADE
))",

R"(CREATE TABLE IF NOT EXISTS hierarchy_entity_directory (
    catalog_id TEXT NOT NULL REFERENCES catalog(catalog_id) ON DELETE CASCADE,
    hierarchy_name TEXT NOT NULL,
    entity_key TEXT NOT NULL,
    entity_id TEXT NOT NULL REFERENCES entity(entity_id) ON DELETE CASCADE,
    dir_order INTEGER NOT NULL,
    PRIMARY KEY (catalog_id, hierarchy_name, entity_key),
    FOREIGN KEY (catalog_id, hierarchy_name) REFERENCES hierarchy(catalog_id, name) ON DELETE CASCADE
))",

R"(CREATE TABLE IF NOT EXISTS hierarchy_entity_tree_node (
    node_id TEXT PRIMARY KEY,
    catalog_id TEXT NOT NULL REFERENCES catalog(catalog_id) ON DELETE CASCADE,
    hierarchy_name TEXT NOT NULL,
    parent_node_id TEXT REFERENCES hierarchy_entity_tree_node(node_id) ON DELETE CASCADE,
    node_key TEXT,
    entity_id TEXT REFERENCES entity(entity_id) ON DELETE CASCADE,
    node_path TEXT,
    tree_order INTEGER NOT NULL,
    FOREIGN KEY (catalog_id, hierarchy_name) REFERENCES hierarchy(catalog_id, name) ON DELETE CASCADE,
    UNIQUE(catalog_id, hierarchy_name, parent_node_id, node_key)
))",

R"(CREATE TABLE IF NOT EXISTS hierarchy_aspect_map (
    catalog_id TEXT NOT NULL REFERENCES catalog(catalog_id) ON DELETE CASCADE,
    hierarchy_name TEXT NOT NULL,
    entity_id TEXT NOT NULL REFERENCES entity(entity_id) ON DELETE CASCADE,
    aspect_def_id TEXT NOT NULL REFERENCES aspect_def(aspect_def_id),
    map_order INTEGER NOT NULL,
    PRIMARY KEY (catalog_id, hierarchy_name, entity_id),
    FOREIGN KEY (catalog_id, hierarchy_name) REFERENCES hierarchy(catalog_id, name) ON DELETE CASCADE,
    FOREIGN KEY (entity_id, aspect_def_id, catalog_id) REFERENCES aspect(entity_id, aspect_def_id, catalog_id) ON DELETE CASCADE
))",
};

const char* const index_ddl = R"(
CREATE INDEX IF NOT EXISTS idx_aspect_def_name ON aspect_def(name);
CREATE INDEX IF NOT EXISTS idx_property_def_aspect_def_id ON property_def(aspect_def_id);
CREATE INDEX IF NOT EXISTS idx_catalog_species ON catalog(species);
CREATE INDEX IF NOT EXISTS idx_catalog_upstream ON catalog(upstream_catalog_id);
CREATE INDEX IF NOT EXISTS idx_hierarchy_catalog_id ON hierarchy(catalog_id);
CREATE INDEX IF NOT EXISTS idx_hierarchy_type ON hierarchy(hierarchy_type);
CREATE INDEX IF NOT EXISTS idx_aspect_entity_id ON aspect(entity_id);
CREATE INDEX IF NOT EXISTS idx_aspect_def_id ON aspect(aspect_def_id);
CREATE INDEX IF NOT EXISTS idx_aspect_catalog_hierarchy ON aspect(catalog_id, hierarchy_name);
CREATE INDEX IF NOT EXISTS idx_property_value_aspect ON property_value(catalog_id, aspect_def_id, entity_id);
CREATE INDEX IF NOT EXISTS idx_property_value_name ON property_value(aspect_def_id, property_name);
CREATE INDEX IF NOT EXISTS idx_hierarchy_entity_list_entity_id ON hierarchy_entity_list(entity_id);
CREATE INDEX IF NOT EXISTS idx_hierarchy_entity_set_entity_id ON hierarchy_entity_set(entity_id);
CREATE INDEX IF NOT EXISTS idx_hierarchy_entity_directory_entity_id ON hierarchy_entity_directory(entity_id);
CREATE INDEX IF NOT EXISTS idx_hierarchy_entity_tree_hierarchy ON hierarchy_entity_tree_node(catalog_id, hierarchy_name);
CREATE INDEX IF NOT EXISTS idx_hierarchy_entity_tree_parent_id ON hierarchy_entity_tree_node(parent_node_id);
CREATE INDEX IF NOT EXISTS idx_hierarchy_entity_tree_entity_id ON hierarchy_entity_tree_node(entity_id);
CREATE INDEX IF NOT EXISTS idx_hierarchy_entity_tree_path ON hierarchy_entity_tree_node(node_path);
CREATE INDEX IF NOT EXISTS idx_hierarchy_aspect_map_entity_id ON hierarchy_aspect_map(entity_id);
CREATE INDEX IF NOT EXISTS idx_hierarchy_aspect_map_aspect_def_id ON hierarchy_aspect_map(aspect_def_id);
)";

struct audit_table {
    const char* table;
    bool tracks_updates;
};

const audit_table audit_tables[] = {
    {"aspect_def", true},
    {"property_def", true},
    {"catalog", true},
    {"catalog_aspect_def", false},
    {"hierarchy", true},
    {"aspect", true},
    {"property_value", true},
    {"hierarchy_entity_list", false},
    {"hierarchy_entity_set", false},
    {"hierarchy_entity_directory", false},
    {"hierarchy_entity_tree_node", false},
    {"hierarchy_aspect_map", false},
};

} // namespace

const std::vector<std::string>& store_tables() {
    static const std::vector<std::string> tables = {
        "aspect_def",
        "property_def",
        "entity",
        "catalog",
        "catalog_aspect_def",
        "hierarchy",
        "aspect",
        "property_value",
        "hierarchy_entity_list",
        "hierarchy_entity_set",
        "hierarchy_entity_directory",
        "hierarchy_entity_tree_node",
        "hierarchy_aspect_map",
    };
    return tables;
}

bool store_schema_exists(database& db) {
    for (const auto& table : store_tables()) {
        if (!db.table_exists(table)) return false;
    }
    return true;
}

void create_store_schema(database& db, bool with_audit) {
    for (const char* ddl : table_ddl) {
        db.execute(ddl);
    }
    db.execute(index_ddl);
    if (with_audit) {
        create_audit_extension(db);
    }
    LOG_INFO("store", "store schema ready%s", with_audit ? " (audit)" : "");
}

void create_audit_extension(database& db) {
    for (const auto& audit : audit_tables) {
        const std::string table(audit.table);
        auto columns = db.get_table_info(table);
        if (!columns.count("created_at")) {
            db.execute("ALTER TABLE " + table + " ADD COLUMN created_at TEXT");
        }
        if (audit.tracks_updates && !columns.count("updated_at")) {
            db.execute("ALTER TABLE " + table + " ADD COLUMN updated_at TEXT");
        }

        const std::string stamp = audit.tracks_updates
            ? "created_at = CURRENT_TIMESTAMP, updated_at = CURRENT_TIMESTAMP"
            : "created_at = CURRENT_TIMESTAMP";
        db.execute("CREATE TRIGGER IF NOT EXISTS insert_" + table + "_created_at\n"
                   "AFTER INSERT ON " + table + "\nFOR EACH ROW\nBEGIN\n"
                   "    UPDATE " + table + " SET " + stamp + " WHERE rowid = NEW.rowid;\nEND;");
        if (audit.tracks_updates) {
            db.execute("CREATE TRIGGER IF NOT EXISTS update_" + table + "_updated_at\n"
                       "AFTER UPDATE ON " + table + "\nFOR EACH ROW\nBEGIN\n"
                       "    UPDATE " + table + " SET updated_at = CURRENT_TIMESTAMP WHERE rowid = NEW.rowid;\nEND;");
        }
    }
}

void drop_store_schema(database& db) {
    for (const auto& audit : audit_tables) {
        const std::string table(audit.table);
        db.execute("DROP TRIGGER IF EXISTS insert_" + table + "_created_at");
        db.execute("DROP TRIGGER IF EXISTS update_" + table + "_updated_at");
    }
    const auto& tables = store_tables();
    for (auto it = tables.rbegin(); it != tables.rend(); ++it) {
        db.execute("DROP TABLE IF EXISTS " + *it);
    }
    LOG_INFO("store", "store schema dropped");
}

void truncate_store_schema(database& db) {
    const auto& tables = store_tables();
    for (auto it = tables.rbegin(); it != tables.rend(); ++it) {
        db.execute("DELETE FROM " + *it);
    }
}

} // namespace strata
