#pragma once

#ifdef __cplusplus

#include "catalog.hpp"
#include "configuration.hpp"
#include "connection.hpp"
#include "factory.hpp"
#include "table_mapping.hpp"
#include "value_adapter.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

/// One stored entity-tree node as it comes back from the database.
struct tree_node_row {
    std::string node_id;
    std::optional<std::string> parent_node_id;
    std::string node_key;
    std::optional<uuid_t> entity_id;
    std::string node_path;
    int64_t tree_order = 0;
};

/// Saves and loads whole catalogs in the relational store.
///
/// Every call leases one connection from the provider for its duration. A
/// save runs in one transaction: on any failure nothing of it remains, and a
/// db_error is re-raised as persistence_error. A load either returns a fully
/// built catalog, returns nullopt when the id is unknown, or throws.
///
/// Aspect maps whose definition has a registered table mapping are stored in
/// that table; all others use the aspect/property_value rows.
class catalog_store {
public:
    /// Creates the store schema unless config.read_only is set.
    catalog_store(connection_provider& provider, object_factory& factory, const configuration& config = {});

    catalog_store(connection_provider& provider, object_factory& factory,
                  std::unique_ptr<value_adapter> adapter, const configuration& config = {});

    catalog_store(const catalog_store&) = delete;
    catalog_store& operator=(const catalog_store&) = delete;

    // MARK: - Catalogs

    void save_catalog(const catalog& cat);
    std::optional<catalog> load_catalog(const uuid_t& id);
    bool catalog_exists(const uuid_t& id);

    /// Clears the catalog's rows from mapped tables, then deletes the catalog
    /// and everything cascading from it. Returns false when it did not exist.
    bool delete_catalog(const uuid_t& id);

    // MARK: - Mapped tables

    /// Validates mapping, creates its table and registers it.
    void create_aspect_table(const aspect_table_mapping& mapping);

    /// Entity-keyed table with one same-named column per property.
    void create_aspect_table(aspect_def_ptr def, const std::string& table_name);

    /// Registers mapping for its aspect definition's name, replacing any
    /// previous one. The table must already exist.
    void add_aspect_table_mapping(aspect_table_mapping mapping);

    const aspect_table_mapping* find_table_mapping(std::string_view aspect_def_name) const;

    // MARK: - Tree assembly

    /// Builds a tree from its stored rows in any order. Siblings are ordered
    /// by node path, then tree order. Throws structural_inconsistency for an
    /// orphaned parent reference, a missing or duplicate root, or unreachable
    /// rows. No rows at all give an empty tree.
    static entity_tree_hierarchy assemble_tree(const std::string& name, const uuid_t& catalog_id, int64_t version,
                                               const std::vector<tree_node_row>& rows, object_factory& factory);

    const value_adapter& adapter() const { return *adapter_; }

private:
    void save_aspect_def(database& db, const catalog& cat, const aspect_def& def);
    void save_hierarchy(database& db, const catalog& cat, const hierarchy& h);
    void save_entity_list(database& db, const std::string& catalog_id, const entity_list_hierarchy& h);
    void save_entity_set(database& db, const std::string& catalog_id, const entity_set_hierarchy& h);
    void save_entity_directory(database& db, const std::string& catalog_id, const entity_directory_hierarchy& h);
    void save_entity_tree(database& db, const std::string& catalog_id, const entity_tree_hierarchy& h);
    void save_aspect_map(database& db, const std::string& catalog_id, const aspect_map_hierarchy& h);
    void save_aspect_map_to_table(database& db, const std::string& catalog_id, const aspect_map_hierarchy& h,
                                  const aspect_table_mapping& mapping);

    catalog load_catalog_row(const database::row_t& row);
    void load_aspect_defs(database& db, catalog& cat);
    aspect_def_ptr load_aspect_def(database& db, const std::string& aspect_def_id, const std::string& name,
                                   const database::row_t& row);
    void load_hierarchies(database& db, catalog& cat);
    void load_entity_list(database& db, entity_list_hierarchy& h);
    void load_entity_set(database& db, entity_set_hierarchy& h);
    void load_entity_directory(database& db, entity_directory_hierarchy& h);
    void load_aspect_map(database& db, aspect_map_hierarchy& h);
    void load_aspect_map_from_table(database& db, aspect_map_hierarchy& h, const aspect_table_mapping& mapping);

    entity entity_from_column(const column_value_t& value, const std::string& where);

    connection_provider& provider_;
    object_factory& factory_;
    std::unique_ptr<value_adapter> adapter_;
    configuration config_;
    std::map<std::string, aspect_table_mapping, std::less<>> mappings_;
};

} // namespace strata

#endif // __cplusplus
