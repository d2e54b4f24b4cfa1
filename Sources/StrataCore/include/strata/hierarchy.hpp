#pragma once

#ifdef __cplusplus

#include "aspect.hpp"
#include "entity.hpp"
#include "schema.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace strata {

// ============================================================================
// Common hierarchy state
// ============================================================================

/// Name, owning catalog and version shared by every hierarchy shape.
class hierarchy_base {
public:
    const std::string& name() const { return name_; }
    const uuid_t& catalog_id() const { return catalog_id_; }
    int64_t version() const { return version_; }
    void set_version(int64_t v) { version_ = v; }

protected:
    hierarchy_base(std::string name, const uuid_t& catalog_id, int64_t version);

    std::string name_;
    uuid_t catalog_id_;
    int64_t version_;
};

// ============================================================================
// EL: ordered entity references, duplicates allowed
// ============================================================================

class entity_list_hierarchy : public hierarchy_base {
public:
    static constexpr hierarchy_type type = hierarchy_type::entity_list;

    entity_list_hierarchy(std::string name, const uuid_t& catalog_id, int64_t version = 0)
        : hierarchy_base(std::move(name), catalog_id, version) {}

    void add(const entity& e) { entities_.push_back(e); }
    void insert(size_t index, const entity& e);
    void remove_at(size_t index);
    /// Removes the first occurrence. Returns false when absent.
    bool remove(const entity& e);

    const entity& at(size_t index) const { return entities_.at(index); }
    size_t size() const { return entities_.size(); }
    bool empty() const { return entities_.empty(); }
    const std::vector<entity>& entities() const { return entities_; }

    auto begin() const { return entities_.begin(); }
    auto end() const { return entities_.end(); }

    bool contents_equal(const entity_list_hierarchy& other) const { return entities_ == other.entities_; }

private:
    std::vector<entity> entities_;
};

// ============================================================================
// ES: unique entity references in insertion order
// ============================================================================

class entity_set_hierarchy : public hierarchy_base {
public:
    static constexpr hierarchy_type type = hierarchy_type::entity_set;

    entity_set_hierarchy(std::string name, const uuid_t& catalog_id, int64_t version = 0)
        : hierarchy_base(std::move(name), catalog_id, version) {}

    /// Returns false when e is already a member.
    bool add(const entity& e);
    bool remove(const entity& e);
    bool contains(const entity& e) const { return members_.count(e) != 0; }

    size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }
    const std::vector<entity>& entities() const { return order_; }

    auto begin() const { return order_.begin(); }
    auto end() const { return order_.end(); }

    bool contents_equal(const entity_set_hierarchy& other) const { return order_ == other.order_; }

private:
    std::vector<entity> order_;
    std::unordered_set<entity> members_;
};

// ============================================================================
// ED: string key -> entity, insertion order, unique keys
// ============================================================================

class entity_directory_hierarchy : public hierarchy_base {
public:
    static constexpr hierarchy_type type = hierarchy_type::entity_directory;

    using entry = std::pair<std::string, entity>;

    entity_directory_hierarchy(std::string name, const uuid_t& catalog_id, int64_t version = 0)
        : hierarchy_base(std::move(name), catalog_id, version) {}

    /// Replacing an existing key keeps its position.
    void put(const std::string& key, const entity& e);
    std::optional<entity> get(std::string_view key) const;
    bool contains_key(std::string_view key) const { return find(key) != entries_.size(); }
    bool remove(std::string_view key);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::vector<entry>& entries() const { return entries_; }

    auto begin() const { return entries_.begin(); }
    auto end() const { return entries_.end(); }

    bool contents_equal(const entity_directory_hierarchy& other) const { return entries_ == other.entries_; }

private:
    size_t find(std::string_view key) const;

    std::vector<entry> entries_;
};

// ============================================================================
// ET: tree of named edges, nodes optionally hold an entity
// ============================================================================

/// Nodes live in an arena owned by the tree and are addressed by index. The
/// root is always node 0. Children are keyed by name and iterate in key order,
/// which is also materialized-path order. Slots of removed or replaced
/// subtrees are reused, so a node_id is only valid while its node is attached.
class entity_tree_hierarchy : public hierarchy_base {
public:
    static constexpr hierarchy_type type = hierarchy_type::entity_tree;

    using node_id = size_t;
    static constexpr node_id root_id = 0;

    struct node {
        std::optional<entity> value;
        std::optional<node_id> parent;
        std::string key;
        std::map<std::string, node_id> children;
        bool detached = false;

        bool is_leaf() const { return children.empty(); }
    };

    entity_tree_hierarchy(std::string name, const uuid_t& catalog_id, int64_t version = 0);

    node_id root() const { return root_id; }
    const node& at(node_id id) const;

    /// Adds or replaces the child of parent under key. A replaced child's
    /// subtree is detached.
    node_id add_child(node_id parent, const std::string& key, std::optional<entity> value = std::nullopt);
    std::optional<node_id> child(node_id parent, std::string_view key) const;
    bool remove_child(node_id parent, std::string_view key);

    void set_value(node_id id, std::optional<entity> value);

    /// "/a/b" style lookup from the root; "" and "/" name the root.
    std::optional<node_id> find(std::string_view path) const;

    /// Materialized path of a node: "" for the root, "/a/b" below it.
    std::string path_of(node_id id) const;

    /// Reachable nodes, root included.
    size_t size() const;

    /// Slots held by the arena, free ones included.
    size_t arena_size() const { return nodes_.size(); }

    /// Same shape, keys and values, compared from the roots.
    bool contents_equal(const entity_tree_hierarchy& other) const;

private:
    bool subtree_equal(node_id mine, const entity_tree_hierarchy& other, node_id theirs) const;
    void detach(node_id id);

    std::vector<node> nodes_;
    std::vector<node_id> free_;
};

// ============================================================================
// AM: entity -> aspect, all sharing one aspect definition
// ============================================================================

/// Named after its aspect definition.
class aspect_map_hierarchy : public hierarchy_base {
public:
    static constexpr hierarchy_type type = hierarchy_type::aspect_map;

    aspect_map_hierarchy(std::shared_ptr<const aspect_def> def, const uuid_t& catalog_id, int64_t version = 0);

    const aspect_def& def() const { return *def_; }
    const std::shared_ptr<const aspect_def>& def_ptr() const { return def_; }

    /// Throws schema_violation when a uses another aspect definition.
    void put(aspect_ptr a);
    aspect_ptr get(const entity& e) const;
    bool contains(const entity& e) const { return aspects_.count(e) != 0; }
    bool remove(const entity& e);

    size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }
    /// Entities in insertion order.
    const std::vector<entity>& entities() const { return order_; }

    bool contents_equal(const aspect_map_hierarchy& other) const;

private:
    std::shared_ptr<const aspect_def> def_;
    std::vector<entity> order_;
    std::unordered_map<entity, aspect_ptr> aspects_;
};

// ============================================================================
// Closed variant over the five shapes
// ============================================================================

using hierarchy = std::variant<
    entity_list_hierarchy,
    entity_set_hierarchy,
    entity_directory_hierarchy,
    entity_tree_hierarchy,
    aspect_map_hierarchy
>;

inline hierarchy_type type_of(const hierarchy& h) {
    return std::visit([](const auto& v) { return std::decay_t<decltype(v)>::type; }, h);
}

inline const hierarchy_base& base_of(const hierarchy& h) {
    return std::visit([](const auto& v) -> const hierarchy_base& { return v; }, h);
}

inline hierarchy_base& base_of(hierarchy& h) {
    return std::visit([](auto& v) -> hierarchy_base& { return v; }, h);
}

inline const std::string& name_of(const hierarchy& h) { return base_of(h).name(); }

inline hierarchy_def def_of(const hierarchy& h) { return hierarchy_def{name_of(h), type_of(h)}; }

/// Same shape, name and contents. Versions are not compared.
bool contents_equal(const hierarchy& a, const hierarchy& b);

} // namespace strata

#endif // __cplusplus
