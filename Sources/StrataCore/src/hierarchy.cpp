#include "strata/hierarchy.hpp"
#include "strata/errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace strata {

hierarchy_base::hierarchy_base(std::string name, const uuid_t& catalog_id, int64_t version)
    : name_(std::move(name)), catalog_id_(catalog_id), version_(version) {
    if (name_.empty()) {
        throw schema_violation("hierarchy name must not be empty");
    }
}

// MARK: - entity_list_hierarchy

void entity_list_hierarchy::insert(size_t index, const entity& e) {
    if (index > entities_.size()) {
        throw std::out_of_range("entity list " + name_ + ": insert position " + std::to_string(index));
    }
    entities_.insert(entities_.begin() + static_cast<std::ptrdiff_t>(index), e);
}

void entity_list_hierarchy::remove_at(size_t index) {
    if (index >= entities_.size()) {
        throw std::out_of_range("entity list " + name_ + ": remove position " + std::to_string(index));
    }
    entities_.erase(entities_.begin() + static_cast<std::ptrdiff_t>(index));
}

bool entity_list_hierarchy::remove(const entity& e) {
    auto it = std::find(entities_.begin(), entities_.end(), e);
    if (it == entities_.end()) return false;
    entities_.erase(it);
    return true;
}

// MARK: - entity_set_hierarchy

bool entity_set_hierarchy::add(const entity& e) {
    if (!members_.insert(e).second) return false;
    order_.push_back(e);
    return true;
}

bool entity_set_hierarchy::remove(const entity& e) {
    if (members_.erase(e) == 0) return false;
    order_.erase(std::find(order_.begin(), order_.end(), e));
    return true;
}

// MARK: - entity_directory_hierarchy

size_t entity_directory_hierarchy::find(std::string_view key) const {
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].first == key) return i;
    }
    return entries_.size();
}

void entity_directory_hierarchy::put(const std::string& key, const entity& e) {
    size_t pos = find(key);
    if (pos < entries_.size()) {
        entries_[pos].second = e;
    } else {
        entries_.emplace_back(key, e);
    }
}

std::optional<entity> entity_directory_hierarchy::get(std::string_view key) const {
    size_t pos = find(key);
    if (pos == entries_.size()) return std::nullopt;
    return entries_[pos].second;
}

bool entity_directory_hierarchy::remove(std::string_view key) {
    size_t pos = find(key);
    if (pos == entries_.size()) return false;
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));
    return true;
}

// MARK: - entity_tree_hierarchy

entity_tree_hierarchy::entity_tree_hierarchy(std::string name, const uuid_t& catalog_id, int64_t version)
    : hierarchy_base(std::move(name), catalog_id, version) {
    nodes_.emplace_back();
}

const entity_tree_hierarchy::node& entity_tree_hierarchy::at(node_id id) const {
    if (id >= nodes_.size() || nodes_[id].detached) {
        throw std::out_of_range("entity tree " + name_ + ": no node " + std::to_string(id));
    }
    return nodes_[id];
}

entity_tree_hierarchy::node_id entity_tree_hierarchy::add_child(node_id parent, const std::string& key,
                                                                std::optional<entity> value) {
    at(parent);
    if (key.empty() || key.find('/') != std::string::npos) {
        throw schema_violation("entity tree " + name_ + ": invalid child key '" + key + "'");
    }
    auto existing = nodes_[parent].children.find(key);
    if (existing != nodes_[parent].children.end()) {
        detach(existing->second);
    }

    node child;
    child.value = std::move(value);
    child.parent = parent;
    child.key = key;
    node_id id;
    if (!free_.empty()) {
        id = free_.back();
        free_.pop_back();
        nodes_[id] = std::move(child);
    } else {
        nodes_.push_back(std::move(child));
        id = nodes_.size() - 1;
    }
    nodes_[parent].children[key] = id;
    return id;
}

std::optional<entity_tree_hierarchy::node_id> entity_tree_hierarchy::child(node_id parent, std::string_view key) const {
    const auto& children = at(parent).children;
    auto it = children.find(std::string(key));
    if (it == children.end()) return std::nullopt;
    return it->second;
}

bool entity_tree_hierarchy::remove_child(node_id parent, std::string_view key) {
    at(parent);
    auto& children = nodes_[parent].children;
    auto it = children.find(std::string(key));
    if (it == children.end()) return false;
    detach(it->second);
    children.erase(it);
    return true;
}

void entity_tree_hierarchy::detach(node_id id) {
    auto children = std::move(nodes_[id].children);
    nodes_[id] = node{};
    nodes_[id].detached = true;
    free_.push_back(id);
    for (const auto& [_, child] : children) {
        detach(child);
    }
}

void entity_tree_hierarchy::set_value(node_id id, std::optional<entity> value) {
    at(id);
    nodes_[id].value = std::move(value);
}

std::optional<entity_tree_hierarchy::node_id> entity_tree_hierarchy::find(std::string_view path) const {
    node_id current = root_id;
    size_t pos = 0;
    while (pos < path.size()) {
        if (path[pos] == '/') {
            ++pos;
            continue;
        }
        size_t next = path.find('/', pos);
        if (next == std::string_view::npos) next = path.size();
        auto step = child(current, path.substr(pos, next - pos));
        if (!step) return std::nullopt;
        current = *step;
        pos = next;
    }
    return current;
}

std::string entity_tree_hierarchy::path_of(node_id id) const {
    std::string path;
    const node* n = &at(id);
    while (n->parent) {
        path = "/" + n->key + path;
        n = &nodes_[*n->parent];
    }
    return path;
}

size_t entity_tree_hierarchy::size() const {
    size_t count = 0;
    for (const auto& n : nodes_) {
        if (!n.detached) ++count;
    }
    return count;
}

bool entity_tree_hierarchy::subtree_equal(node_id mine, const entity_tree_hierarchy& other, node_id theirs) const {
    const auto& a = nodes_[mine];
    const auto& b = other.nodes_[theirs];
    if (a.value != b.value || a.children.size() != b.children.size()) return false;
    auto ia = a.children.begin();
    auto ib = b.children.begin();
    for (; ia != a.children.end(); ++ia, ++ib) {
        if (ia->first != ib->first) return false;
        if (!subtree_equal(ia->second, other, ib->second)) return false;
    }
    return true;
}

bool entity_tree_hierarchy::contents_equal(const entity_tree_hierarchy& other) const {
    return subtree_equal(root_id, other, root_id);
}

// MARK: - aspect_map_hierarchy

aspect_map_hierarchy::aspect_map_hierarchy(std::shared_ptr<const aspect_def> def, const uuid_t& catalog_id,
                                           int64_t version)
    : hierarchy_base(def ? def->name() : std::string(), catalog_id, version), def_(std::move(def)) {}

void aspect_map_hierarchy::put(aspect_ptr a) {
    if (!a) {
        throw schema_violation("aspect map " + name_ + ": null aspect");
    }
    if (a->def_ptr() != def_ && !a->def().fully_equals(*def_)) {
        throw schema_violation("aspect map " + name_ + " cannot hold an aspect of a different " +
                               a->def().name() + " definition");
    }
    const entity owner = a->owner();
    auto [it, inserted] = aspects_.insert_or_assign(owner, std::move(a));
    if (inserted) order_.push_back(owner);
}

aspect_ptr aspect_map_hierarchy::get(const entity& e) const {
    auto it = aspects_.find(e);
    return it == aspects_.end() ? nullptr : it->second;
}

bool aspect_map_hierarchy::remove(const entity& e) {
    if (aspects_.erase(e) == 0) return false;
    order_.erase(std::find(order_.begin(), order_.end(), e));
    return true;
}

bool aspect_map_hierarchy::contents_equal(const aspect_map_hierarchy& other) const {
    if (order_ != other.order_) return false;
    for (const auto& e : order_) {
        if (!aspects_.at(e)->values_equal(*other.aspects_.at(e))) return false;
    }
    return true;
}

// MARK: - variant helpers

bool contents_equal(const hierarchy& a, const hierarchy& b) {
    if (a.index() != b.index() || name_of(a) != name_of(b)) return false;
    return std::visit([&](const auto& mine) {
        using T = std::decay_t<decltype(mine)>;
        return mine.contents_equal(std::get<T>(b));
    }, a);
}

} // namespace strata
