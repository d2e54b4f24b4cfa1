#pragma once

#ifdef __cplusplus

#include "schema.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace strata {

/// Stores one aspect definition's properties as native columns of a
/// dedicated table instead of property_value rows.
///
/// The two key flags give four table shapes:
///   neither           unscoped rows, no primary key, cleared by full delete
///   catalog_id only   no primary key, cleared by a catalog-scoped delete
///   entity_id only    PRIMARY KEY (entity_id), cleared by full delete
///   both              PRIMARY KEY (catalog_id, entity_id), catalog-scoped delete
class aspect_table_mapping {
public:
    using column_map = std::vector<std::pair<std::string, std::string>>;  // property -> column

    /// Maps every property of def to a same-named column.
    aspect_table_mapping(std::shared_ptr<const aspect_def> def,
                         std::string table_name,
                         bool has_catalog_id = false,
                         bool has_entity_id = true);

    aspect_table_mapping(std::shared_ptr<const aspect_def> def,
                         std::string table_name,
                         column_map columns,
                         bool has_catalog_id,
                         bool has_entity_id);

    const aspect_def& def() const { return *def_; }
    const std::shared_ptr<const aspect_def>& def_ptr() const { return def_; }
    const std::string& table_name() const { return table_name_; }
    const column_map& columns() const { return columns_; }
    bool has_catalog_id() const { return has_catalog_id_; }
    bool has_entity_id() const { return has_entity_id_; }

    /// Throws structural_inconsistency for an unknown property, a duplicate
    /// or reserved column, or an unusable identifier.
    void validate() const;

    std::string create_table_sql() const;

    /// Plain INSERT, or an upsert on the primary key when the table has one.
    std::string insert_sql() const;

    /// DELETE of every row, scoped to one catalog (one bound parameter) when
    /// the table has a catalog_id column.
    std::string clear_sql() const;

    /// Key columns first, then mapped columns, in rowid order. Scoped to one
    /// catalog (one bound parameter) when the table has a catalog_id column.
    std::string select_sql() const;

private:
    std::shared_ptr<const aspect_def> def_;
    std::string table_name_;
    column_map columns_;
    bool has_catalog_id_;
    bool has_entity_id_;
};

/// Double-quoted SQL identifier.
std::string quote_identifier(const std::string& name);

} // namespace strata

#endif // __cplusplus
