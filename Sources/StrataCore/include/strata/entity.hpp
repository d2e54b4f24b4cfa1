#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata {

class aspect;
class aspect_def;
class catalog;

/// A bare global id. Equality and hashing use the id alone.
class entity {
public:
    entity() = default;
    explicit entity(const uuid_t& id) : id_(id) {}

    static entity generate() { return entity(uuid_t::generate()); }

    const uuid_t& id() const { return id_; }
    std::string to_string() const { return id_.to_string(); }

    bool operator==(const entity& other) const { return id_ == other.id_; }
    bool operator!=(const entity& other) const { return id_ != other.id_; }
    bool operator<(const entity& other) const { return id_ < other.id_; }

private:
    uuid_t id_;
};

} // namespace strata

template<>
struct std::hash<strata::entity> {
    size_t operator()(const strata::entity& e) const noexcept {
        return std::hash<strata::uuid_t>()(e.id());
    }
};

namespace strata {

/// Hands out entities by id and owns the advisory aspect cache.
///
/// An entity is its id, so get_or_register keeps no per-id state. The aspect
/// cache is mutex-guarded and may be read concurrently. It is bounded and
/// evicts least-recently-used entries; a miss falls through to the catalogs
/// passed to find_aspect, which stay authoritative.
class entity_registry {
public:
    explicit entity_registry(size_t aspect_cache_capacity = 1024);

    entity_registry(const entity_registry&) = delete;
    entity_registry& operator=(const entity_registry&) = delete;

    /// Returns the entity for id. Equal ids give equal entities.
    entity get_or_register(const uuid_t& id);

    /// Registers and returns a fresh entity.
    entity create();

    // MARK: - Advisory aspect cache

    void cache_aspect(const std::shared_ptr<aspect>& a);
    std::shared_ptr<aspect> cached_aspect(const entity& e, const std::string& aspect_def_name) const;

    /// Cache first, then each catalog's aspect map for the definition. A hit
    /// found in a catalog is cached.
    std::shared_ptr<aspect> find_aspect(const entity& e, const aspect_def& def,
                                        const std::vector<const catalog*>& catalogs);

    void evict(const entity& e);
    void clear_cache();
    size_t cache_size() const;
    size_t cache_capacity() const { return capacity_; }

private:
    struct cache_key {
        uuid_t entity_id;
        std::string aspect_def_name;

        bool operator==(const cache_key& other) const {
            return entity_id == other.entity_id && aspect_def_name == other.aspect_def_name;
        }
    };

    struct cache_key_hash {
        size_t operator()(const cache_key& k) const noexcept {
            return std::hash<uuid_t>()(k.entity_id) ^ (std::hash<std::string>()(k.aspect_def_name) << 1);
        }
    };

    using lru_list = std::list<std::pair<cache_key, std::shared_ptr<aspect>>>;

    size_t capacity_;
    mutable std::mutex cache_mutex_;
    mutable lru_list lru_;
    std::unordered_map<cache_key, lru_list::iterator, cache_key_hash> index_;
};

} // namespace strata

#endif // __cplusplus
