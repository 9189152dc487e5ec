#include "resolution/entity_registry.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <functional>
#include <stdexcept>

namespace canon {

EntityRegistry::EntityRegistry(size_t max_segments)
    : max_segments_(max_segments),
      owned_segments_(new std::unique_ptr<Segment>[max_segments]),
      segments_(new std::atomic<Segment*>[max_segments]) {
    for (size_t i = 0; i < max_segments_; ++i) {
        segments_[i].store(nullptr, std::memory_order_relaxed);
    }
}

// ============================================================================
// Arena
// ============================================================================

EntityId EntityRegistry::allocate() {
    EntityId id = next_id_.fetch_add(1, std::memory_order_acq_rel);
    size_t segment = id / kSegmentSize;

    if (segment >= max_segments_) {
        throw std::length_error(
            "Entity arena exhausted (" + std::to_string(max_segments_ * kSegmentSize) + " slots)");
    }

    if (segments_[segment].load(std::memory_order_acquire) == nullptr) {
        std::lock_guard<std::mutex> lock(growth_mutex_);
        if (!owned_segments_[segment]) {
            owned_segments_[segment] = std::make_unique<Segment>();
            segments_[segment].store(owned_segments_[segment].get(), std::memory_order_release);
        }
    }

    return id;
}

EntityRegistry::Slot* EntityRegistry::slot(EntityId id) const {
    if (id == kNoEntity || id >= next_id_.load(std::memory_order_acquire)) {
        return nullptr;
    }
    size_t segment = id / kSegmentSize;
    if (segment >= max_segments_) {
        return nullptr;
    }
    Segment* seg = segments_[segment].load(std::memory_order_acquire);
    if (seg == nullptr) {
        return nullptr;
    }
    return &seg->slots[id % kSegmentSize];
}

void EntityRegistry::publish(std::shared_ptr<const CanonicalEntity> record) {
    if (!record) {
        throw std::invalid_argument("Cannot publish a null entity record");
    }
    Slot* s = slot(record->id);
    if (s == nullptr) {
        throw RegistryCorruptionError(
            "Publishing entity " + std::to_string(record->id) + " which was never allocated");
    }
    std::atomic_store(&s->record, std::move(record));
}

std::shared_ptr<const CanonicalEntity> EntityRegistry::record(EntityId id) const {
    Slot* s = slot(id);
    if (s == nullptr) {
        return nullptr;
    }
    return std::atomic_load(&s->record);
}

bool EntityRegistry::contains(EntityId id) const {
    return slot(id) != nullptr;
}

size_t EntityRegistry::size() const {
    return static_cast<size_t>(next_id_.load(std::memory_order_acquire) - 1);
}

// ============================================================================
// Union-Find
// ============================================================================

EntityId EntityRegistry::find(EntityId id) const {
    Slot* start = slot(id);
    if (start == nullptr) {
        throw std::out_of_range("Unknown entity id " + std::to_string(id));
    }

    const size_t limit = size();
    size_t steps = 0;
    EntityId current = id;
    Slot* current_slot = start;

    while (true) {
        EntityId up = current_slot->parent.load(std::memory_order_acquire);
        if (up == kNoEntity) {
            break;
        }
        if (++steps > limit) {
            throw RegistryCorruptionError(
                "Parent chain of entity " + std::to_string(id) + " is longer than the arena (cycle)");
        }
        Slot* up_slot = slot(up);
        if (up_slot == nullptr) {
            throw RegistryCorruptionError(
                "Entity " + std::to_string(current) + " has dangling parent " + std::to_string(up));
        }
        current = up;
        current_slot = up_slot;
    }

    // Path compression: parents only ever move towards the root, so a failed
    // exchange just means another thread already shortened the path.
    EntityId root = current;
    current = id;
    current_slot = start;
    while (current != root) {
        EntityId up = current_slot->parent.load(std::memory_order_acquire);
        if (up == kNoEntity || up == root) {
            break;
        }
        current_slot->parent.compare_exchange_strong(up, root, std::memory_order_acq_rel);
        current = up;
        current_slot = slot(up);
        if (current_slot == nullptr) {
            break;
        }
    }

    return root;
}

std::shared_ptr<const CanonicalEntity> EntityRegistry::root_record(EntityId id) const {
    return record(find(id));
}

bool EntityRegistry::is_root(EntityId id) const {
    Slot* s = slot(id);
    return s != nullptr && s->parent.load(std::memory_order_acquire) == kNoEntity;
}

EntityId EntityRegistry::parent(EntityId id) const {
    Slot* s = slot(id);
    if (s == nullptr) {
        throw std::out_of_range("Unknown entity id " + std::to_string(id));
    }
    return s->parent.load(std::memory_order_acquire);
}

void EntityRegistry::set_parent(EntityId child, EntityId new_parent) {
    Slot* s = slot(child);
    if (s == nullptr || (new_parent != kNoEntity && !contains(new_parent))) {
        throw RegistryCorruptionError(
            "Cannot link entity " + std::to_string(child) + " to " + std::to_string(new_parent));
    }
    if (child == new_parent) {
        throw RegistryCorruptionError("Entity " + std::to_string(child) + " cannot be its own parent");
    }
    s->parent.store(new_parent, std::memory_order_release);
}

std::vector<std::shared_ptr<const CanonicalEntity>> EntityRegistry::roots() const {
    std::vector<std::shared_ptr<const CanonicalEntity>> result;
    EntityId end = next_id_.load(std::memory_order_acquire);
    for (EntityId id = 1; id < end; ++id) {
        Slot* s = slot(id);
        if (s == nullptr || s->parent.load(std::memory_order_acquire) != kNoEntity) {
            continue;
        }
        auto rec = std::atomic_load(&s->record);
        if (rec) {
            result.push_back(std::move(rec));
        }
    }
    return result;
}

std::vector<std::shared_ptr<const CanonicalEntity>> EntityRegistry::all_records() const {
    std::vector<std::shared_ptr<const CanonicalEntity>> result;
    EntityId end = next_id_.load(std::memory_order_acquire);
    for (EntityId id = 1; id < end; ++id) {
        auto rec = record(id);
        if (rec) {
            result.push_back(std::move(rec));
        }
    }
    return result;
}

std::mutex& EntityRegistry::stripe(EntityId id) const {
    return commit_stripes_[id % kStripeCount];
}

// ============================================================================
// Indexes
// ============================================================================

size_t EntityRegistry::index_stripe(const std::string& key) const {
    return std::hash<std::string>{}(key) % kStripeCount;
}

std::optional<EntityId> EntityRegistry::mention_owner(const std::string& mention_id) const {
    const auto& stripe = mention_index_[index_stripe(mention_id)];
    std::shared_lock<std::shared_mutex> lock(stripe.mutex);
    auto it = stripe.entries.find(mention_id);
    if (it == stripe.entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

void EntityRegistry::index_mention(const std::string& mention_id, EntityId id) {
    auto& stripe = mention_index_[index_stripe(mention_id)];
    std::unique_lock<std::shared_mutex> lock(stripe.mutex);
    stripe.entries.emplace(mention_id, id);
}

std::vector<EntityId> EntityRegistry::ids_for_key(const std::string& key) const {
    const auto& stripe = key_index_[index_stripe(key)];
    std::shared_lock<std::shared_mutex> lock(stripe.mutex);
    auto it = stripe.entries.find(key);
    if (it == stripe.entries.end()) {
        return {};
    }
    return it->second;
}

void EntityRegistry::index_key(const std::string& key, EntityId id) {
    auto& stripe = key_index_[index_stripe(key)];
    std::unique_lock<std::shared_mutex> lock(stripe.mutex);
    auto& ids = stripe.entries[key];
    if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
        ids.push_back(id);
    }
}

} // namespace canon
