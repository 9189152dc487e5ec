#pragma once

#include "resolution/types.hpp"
#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace canon {

/**
 * @brief Arena of canonical entity records with a union-find parent index
 *
 * Every allocated id owns one slot holding the latest published record and the
 * id of its parent (kNoEntity for a root). Records are immutable snapshots
 * swapped in with atomic stores, so record readers never lock. Slots live in
 * fixed-size segments that are never moved once allocated. The mention and
 * key indexes are striped maps read under shared locks.
 *
 * Writers must hold stripe(root) of every root they modify; the registry does
 * not lock on their behalf.
 */
class EntityRegistry {
public:
    static constexpr size_t kSegmentSize = 1024;
    static constexpr size_t kStripeCount = 64;

    explicit EntityRegistry(size_t max_segments = 4096);

    EntityRegistry(const EntityRegistry&) = delete;
    EntityRegistry& operator=(const EntityRegistry&) = delete;

    // ========================================
    // Arena
    // ========================================

    /**
     * @brief Reserve a fresh id (never reused)
     * @throws std::length_error when the arena is full
     */
    EntityId allocate();

    /**
     * @brief Publish a new version of a record (record->id must be allocated)
     */
    void publish(std::shared_ptr<const CanonicalEntity> record);

    /**
     * @brief Latest record stored under an id, root or not
     * @return nullptr when the id is unknown or nothing was published yet
     */
    std::shared_ptr<const CanonicalEntity> record(EntityId id) const;

    bool contains(EntityId id) const;

    /**
     * @brief Number of ids handed out so far
     */
    size_t size() const;

    // ========================================
    // Union-Find
    // ========================================

    /**
     * @brief Root of an id's set
     *
     * Lock-free. Compresses the walked path as a side effect.
     * @throws std::out_of_range when the id was never allocated
     * @throws RegistryCorruptionError on a cycle or a dangling parent
     */
    EntityId find(EntityId id) const;

    std::shared_ptr<const CanonicalEntity> root_record(EntityId id) const;

    bool is_root(EntityId id) const;

    EntityId parent(EntityId id) const;

    /**
     * @brief Point an id at its new parent
     * @throws RegistryCorruptionError when either id is unknown or they are equal
     */
    void set_parent(EntityId child, EntityId new_parent);

    /**
     * @brief Records of all current roots, ordered by id
     */
    std::vector<std::shared_ptr<const CanonicalEntity>> roots() const;

    /**
     * @brief Records of every published id, absorbed ones included
     */
    std::vector<std::shared_ptr<const CanonicalEntity>> all_records() const;

    /**
     * @brief Commit lock guarding a root's record
     */
    std::mutex& stripe(EntityId id) const;

    // ========================================
    // Indexes
    // ========================================

    /**
     * @brief Entity a mention was committed to (not necessarily a root any more)
     */
    std::optional<EntityId> mention_owner(const std::string& mention_id) const;

    void index_mention(const std::string& mention_id, EntityId id);

    /**
     * @brief Ids of every type that ever held a normalized key
     */
    std::vector<EntityId> ids_for_key(const std::string& key) const;

    void index_key(const std::string& key, EntityId id);

private:
    struct Slot {
        std::shared_ptr<const CanonicalEntity> record;  // atomic_load / atomic_store only
        std::atomic<EntityId> parent{kNoEntity};
    };

    struct Segment {
        std::array<Slot, kSegmentSize> slots;
    };

    template <typename Value>
    struct IndexStripe {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, Value> entries;
    };

    Slot* slot(EntityId id) const;
    size_t index_stripe(const std::string& key) const;

    size_t max_segments_;
    std::unique_ptr<std::unique_ptr<Segment>[]> owned_segments_;   // guarded by growth_mutex_
    std::unique_ptr<std::atomic<Segment*>[]> segments_;            // published view of owned_segments_
    std::mutex growth_mutex_;
    std::atomic<EntityId> next_id_{1};

    mutable std::array<std::mutex, kStripeCount> commit_stripes_;

    std::array<IndexStripe<EntityId>, kStripeCount> mention_index_;
    std::array<IndexStripe<std::vector<EntityId>>, kStripeCount> key_index_;
};

} // namespace canon
