#include "strata/entity.hpp"
#include "strata/aspect.hpp"
#include "strata/catalog.hpp"
#include "strata/log.hpp"

namespace strata {

entity_registry::entity_registry(size_t aspect_cache_capacity)
    : capacity_(aspect_cache_capacity) {}

entity entity_registry::get_or_register(const uuid_t& id) {
    return entity(id);
}

entity entity_registry::create() {
    return entity::generate();
}

// MARK: - Advisory aspect cache

void entity_registry::cache_aspect(const std::shared_ptr<aspect>& a) {
    if (!a || capacity_ == 0) return;
    cache_key key{a->owner().id(), a->def().name()};

    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->second = a;
        lru_.splice(lru_.begin(), lru_, it->second);
        return;
    }
    lru_.emplace_front(key, a);
    index_.emplace(std::move(key), lru_.begin());
    if (lru_.size() > capacity_) {
        LOG_DEBUG("registry", "evicting %s from aspect cache", lru_.back().first.aspect_def_name.c_str());
        index_.erase(lru_.back().first);
        lru_.pop_back();
    }
}

std::shared_ptr<aspect> entity_registry::cached_aspect(const entity& e, const std::string& aspect_def_name) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = index_.find(cache_key{e.id(), aspect_def_name});
    if (it == index_.end()) return nullptr;
    lru_.splice(lru_.begin(), lru_, it->second);
    return it->second->second;
}

std::shared_ptr<aspect> entity_registry::find_aspect(const entity& e, const aspect_def& def,
                                                     const std::vector<const catalog*>& catalogs) {
    if (auto hit = cached_aspect(e, def.name())) return hit;

    for (const auto* cat : catalogs) {
        if (!cat) continue;
        const auto* map = cat->find<aspect_map_hierarchy>(def.name());
        if (!map) continue;
        if (auto found = map->get(e)) {
            cache_aspect(found);
            return found;
        }
    }
    return nullptr;
}

void entity_registry::evict(const entity& e) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    for (auto it = lru_.begin(); it != lru_.end();) {
        if (it->first.entity_id == e.id()) {
            index_.erase(it->first);
            it = lru_.erase(it);
        } else {
            ++it;
        }
    }
}

void entity_registry::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    index_.clear();
    lru_.clear();
}

size_t entity_registry::cache_size() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return lru_.size();
}

} // namespace strata
