#include "strata/table_mapping.hpp"
#include "strata/errors.hpp"
#include "strata/type_mapping.hpp"
#include <set>
#include <sstream>

namespace strata {

namespace {

bool usable_identifier(const std::string& name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (c == '"' || static_cast<unsigned char>(c) < 0x20) return false;
    }
    return true;
}

aspect_table_mapping::column_map identity_columns(const std::shared_ptr<const aspect_def>& def) {
    aspect_table_mapping::column_map columns;
    if (def) {
        for (const auto& prop : def->properties()) {
            columns.emplace_back(prop.name, prop.name);
        }
    }
    return columns;
}

} // namespace

std::string quote_identifier(const std::string& name) {
    return "\"" + name + "\"";
}

aspect_table_mapping::aspect_table_mapping(std::shared_ptr<const aspect_def> def,
                                           std::string table_name,
                                           bool has_catalog_id,
                                           bool has_entity_id)
    : aspect_table_mapping(def, std::move(table_name), identity_columns(def), has_catalog_id, has_entity_id) {}

aspect_table_mapping::aspect_table_mapping(std::shared_ptr<const aspect_def> def,
                                           std::string table_name,
                                           column_map columns,
                                           bool has_catalog_id,
                                           bool has_entity_id)
    : def_(std::move(def))
    , table_name_(std::move(table_name))
    , columns_(std::move(columns))
    , has_catalog_id_(has_catalog_id)
    , has_entity_id_(has_entity_id) {
    if (!def_) {
        throw structural_inconsistency("table mapping " + table_name_ + " has no aspect definition");
    }
}

void aspect_table_mapping::validate() const {
    if (!usable_identifier(table_name_)) {
        throw structural_inconsistency("table mapping for " + def_->name() + " has an unusable table name '" +
                                       table_name_ + "'");
    }
    std::set<std::string> seen;
    for (const auto& [property, column] : columns_) {
        if (!def_->find_property(property)) {
            throw structural_inconsistency("table mapping " + table_name_ + " references unknown property " +
                                           property + " of " + def_->name());
        }
        if (!usable_identifier(column)) {
            throw structural_inconsistency("table mapping " + table_name_ + " has an unusable column name '" +
                                           column + "'");
        }
        if ((has_catalog_id_ && column == "catalog_id") || (has_entity_id_ && column == "entity_id")) {
            throw structural_inconsistency("table mapping " + table_name_ + " maps " + property +
                                           " onto key column " + column);
        }
        if (!seen.insert(column).second) {
            throw structural_inconsistency("table mapping " + table_name_ + " maps two properties to column " + column);
        }
    }
}

std::string aspect_table_mapping::create_table_sql() const {
    std::ostringstream sql;
    sql << "CREATE TABLE IF NOT EXISTS " << quote_identifier(table_name_) << " (";

    bool first = true;
    if (has_catalog_id_) {
        sql << "catalog_id TEXT NOT NULL";
        first = false;
    }
    if (has_entity_id_) {
        if (!first) sql << ", ";
        sql << "entity_id TEXT NOT NULL";
        if (!has_catalog_id_) sql << " PRIMARY KEY";
        first = false;
    }
    for (const auto& [property, column] : columns_) {
        const auto* prop = def_->find_property(property);
        if (!first) sql << ", ";
        sql << quote_identifier(column) << " " << sql_type_name(column_type_for(*prop));
        if (!prop->is_nullable) sql << " NOT NULL";
        first = false;
    }
    if (has_catalog_id_ && has_entity_id_) {
        sql << ", PRIMARY KEY (catalog_id, entity_id)";
    }
    sql << ")";
    return sql.str();
}

std::string aspect_table_mapping::insert_sql() const {
    std::ostringstream sql;
    sql << "INSERT INTO " << quote_identifier(table_name_) << " (";

    std::vector<std::string> names;
    if (has_catalog_id_) names.emplace_back("catalog_id");
    if (has_entity_id_) names.emplace_back("entity_id");
    for (const auto& [_, column] : columns_) names.push_back(quote_identifier(column));

    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) sql << ", ";
        sql << names[i];
    }
    sql << ") VALUES (";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) sql << ", ";
        sql << "?";
    }
    sql << ")";

    if (has_entity_id_) {
        sql << (has_catalog_id_ ? " ON CONFLICT (catalog_id, entity_id)" : " ON CONFLICT (entity_id)");
        if (columns_.empty()) {
            sql << " DO NOTHING";
        } else {
            sql << " DO UPDATE SET ";
            bool first = true;
            for (const auto& [_, column] : columns_) {
                if (!first) sql << ", ";
                sql << quote_identifier(column) << " = excluded." << quote_identifier(column);
                first = false;
            }
        }
    }
    return sql.str();
}

std::string aspect_table_mapping::clear_sql() const {
    std::string sql = "DELETE FROM " + quote_identifier(table_name_);
    if (has_catalog_id_) sql += " WHERE catalog_id = ?";
    return sql;
}

std::string aspect_table_mapping::select_sql() const {
    std::ostringstream sql;
    sql << "SELECT ";
    bool first = true;
    if (has_catalog_id_) {
        sql << "catalog_id";
        first = false;
    }
    if (has_entity_id_) {
        if (!first) sql << ", ";
        sql << "entity_id";
        first = false;
    }
    for (const auto& [_, column] : columns_) {
        if (!first) sql << ", ";
        sql << quote_identifier(column);
        first = false;
    }
    if (first) sql << "1";
    sql << " FROM " << quote_identifier(table_name_);
    if (has_catalog_id_) sql << " WHERE catalog_id = ?";
    sql << " ORDER BY rowid";
    return sql.str();
}

} // namespace strata
