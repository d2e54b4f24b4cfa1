#include "strata/factory.hpp"
#include "strata/errors.hpp"

namespace strata {

hierarchy object_factory::create_hierarchy(hierarchy_type type,
                                           const std::string& name,
                                           const uuid_t& catalog_id,
                                           int64_t version,
                                           std::shared_ptr<const aspect_def> def) {
    switch (type) {
        case hierarchy_type::entity_list:
            return entity_list_hierarchy(name, catalog_id, version);
        case hierarchy_type::entity_set:
            return entity_set_hierarchy(name, catalog_id, version);
        case hierarchy_type::entity_directory:
            return entity_directory_hierarchy(name, catalog_id, version);
        case hierarchy_type::entity_tree:
            return entity_tree_hierarchy(name, catalog_id, version);
        case hierarchy_type::aspect_map:
            if (!def) {
                throw structural_inconsistency("aspect map " + name + " has no aspect definition");
            }
            if (def->name() != name) {
                throw structural_inconsistency("aspect map " + name + " must be named after its aspect definition " +
                                               def->name());
            }
            return aspect_map_hierarchy(std::move(def), catalog_id, version);
    }
    throw structural_inconsistency("hierarchy " + name + " has an unknown type");
}

} // namespace strata
