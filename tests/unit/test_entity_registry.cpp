#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "resolution/entity_registry.hpp"
#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace canon;

class EntityRegistryTest : public ::testing::Test {
protected:
    EntityRegistry registry{4};

    EntityId add(const std::string& label) {
        EntityId id = registry.allocate();
        auto record = std::make_shared<CanonicalEntity>();
        record->id = id;
        record->type = EntityType::Organization;
        record->primary_label = label;
        registry.publish(record);
        return id;
    }
};

// ==========================================
// Arena
// ==========================================

TEST_F(EntityRegistryTest, IdsAreStableAndNeverZero) {
    EntityId a = add("A");
    EntityId b = add("B");
    EXPECT_NE(a, kNoEntity);
    EXPECT_NE(a, b);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.record(a)->primary_label, "A");
    EXPECT_TRUE(registry.contains(b));
    EXPECT_FALSE(registry.contains(b + 1));
    EXPECT_EQ(registry.record(b + 1), nullptr);
}

TEST_F(EntityRegistryTest, PublishReplacesSnapshot) {
    EntityId a = add("A");
    auto before = registry.record(a);

    auto next = std::make_shared<CanonicalEntity>(*before);
    next->primary_label = "A2";
    registry.publish(next);

    EXPECT_EQ(before->primary_label, "A");      // old snapshot unchanged
    EXPECT_EQ(registry.record(a)->primary_label, "A2");
}

TEST_F(EntityRegistryTest, PublishUnallocatedIsCorruption) {
    auto record = std::make_shared<CanonicalEntity>();
    record->id = 77;
    EXPECT_THROW(registry.publish(record), RegistryCorruptionError);
}

TEST(EntityRegistryArenaTest, ExhaustionThrows) {
    EntityRegistry small(1);
    for (size_t i = 1; i < EntityRegistry::kSegmentSize; ++i) {
        small.allocate();
    }
    EXPECT_THROW(small.allocate(), std::length_error);
}

TEST(EntityRegistryArenaTest, GrowsAcrossSegments) {
    EntityRegistry registry(3);
    EntityId last = kNoEntity;
    for (size_t i = 0; i < EntityRegistry::kSegmentSize + 10; ++i) {
        last = registry.allocate();
    }
    EXPECT_GT(last, EntityRegistry::kSegmentSize);
    EXPECT_TRUE(registry.contains(last));
    EXPECT_EQ(registry.find(last), last);
}

TEST(EntityRegistryArenaTest, ConcurrentGrowthKeepsEverySlot) {
    constexpr size_t kThreads = 8;
    constexpr size_t kPerThread = EntityRegistry::kSegmentSize / 2;
    EntityRegistry registry(kThreads);

    std::vector<std::vector<EntityId>> ids(kThreads);
    std::vector<std::thread> workers;
    for (size_t t = 0; t < kThreads; ++t) {
        workers.emplace_back([&registry, &ids, t]() {
            for (size_t i = 0; i < kPerThread; ++i) {
                auto record = std::make_shared<CanonicalEntity>();
                record->id = registry.allocate();
                record->primary_label = "e" + std::to_string(record->id);
                registry.publish(record);
                ids[t].push_back(record->id);
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    std::set<EntityId> distinct;
    for (const auto& batch : ids) {
        for (EntityId id : batch) {
            distinct.insert(id);
            auto record = registry.record(id);
            ASSERT_NE(record, nullptr) << id;
            EXPECT_EQ(record->primary_label, "e" + std::to_string(id));
        }
    }
    EXPECT_EQ(distinct.size(), kThreads * kPerThread);
    EXPECT_EQ(registry.size(), kThreads * kPerThread);
    EXPECT_EQ(registry.all_records().size(), kThreads * kPerThread);
}

// ==========================================
// Union-Find
// ==========================================

TEST_F(EntityRegistryTest, FindFollowsParents) {
    EntityId a = add("A");
    EntityId b = add("B");
    EntityId c = add("C");

    registry.set_parent(a, b);
    registry.set_parent(b, c);

    EXPECT_EQ(registry.find(a), c);
    EXPECT_EQ(registry.find(b), c);
    EXPECT_TRUE(registry.is_root(c));
    EXPECT_FALSE(registry.is_root(a));
    EXPECT_EQ(registry.root_record(a)->primary_label, "C");
}

TEST_F(EntityRegistryTest, FindCompressesPath) {
    EntityId a = add("A");
    EntityId b = add("B");
    EntityId c = add("C");
    registry.set_parent(a, b);
    registry.set_parent(b, c);

    registry.find(a);
    EXPECT_EQ(registry.parent(a), c);
}

TEST_F(EntityRegistryTest, RootsExcludeAbsorbed) {
    EntityId a = add("A");
    EntityId b = add("B");
    add("C");
    registry.set_parent(a, b);

    auto roots = registry.roots();
    ASSERT_EQ(roots.size(), 2u);
    for (const auto& r : roots) {
        EXPECT_NE(r->id, a);
    }
    EXPECT_EQ(registry.all_records().size(), 3u);
}

TEST_F(EntityRegistryTest, UnknownIdIsOutOfRange) {
    EXPECT_THROW(registry.find(42), std::out_of_range);
    EXPECT_THROW(registry.find(kNoEntity), std::out_of_range);
}

TEST_F(EntityRegistryTest, CycleIsCorruption) {
    EntityId a = add("A");
    EntityId b = add("B");
    registry.set_parent(a, b);
    registry.set_parent(b, a);

    try {
        registry.find(a);
        FAIL() << "expected RegistryCorruptionError";
    } catch (const RegistryCorruptionError& e) {
        EXPECT_TRUE(e.is_fatal());
        EXPECT_EQ(e.kind(), ErrorKind::RegistryCorruption);
    }
}

TEST_F(EntityRegistryTest, SelfOrUnknownParentIsCorruption) {
    EntityId a = add("A");
    EXPECT_THROW(registry.set_parent(a, a), RegistryCorruptionError);
    EXPECT_THROW(registry.set_parent(a, 999), RegistryCorruptionError);
    EXPECT_THROW(registry.set_parent(999, a), RegistryCorruptionError);
}

// ==========================================
// Indexes
// ==========================================

TEST_F(EntityRegistryTest, MentionAndKeyIndexes) {
    EntityId a = add("A");
    EntityId b = add("B");

    registry.index_mention("doc#0-5", a);
    ASSERT_TRUE(registry.mention_owner("doc#0-5").has_value());
    EXPECT_EQ(*registry.mention_owner("doc#0-5"), a);
    EXPECT_FALSE(registry.mention_owner("doc#9-12").has_value());

    registry.index_key("apple", a);
    registry.index_key("apple", b);
    registry.index_key("apple", a);
    auto ids = registry.ids_for_key("apple");
    EXPECT_EQ(ids.size(), 2u);
    EXPECT_TRUE(registry.ids_for_key("pear").empty());
}

TEST_F(EntityRegistryTest, ConcurrentReadersSeeConsistentRoots) {
    std::vector<EntityId> ids;
    for (int i = 0; i < 64; ++i) {
        ids.push_back(add("E" + std::to_string(i)));
    }

    std::atomic<bool> failed{false};
    std::thread writer([&] {
        for (size_t i = 1; i < ids.size(); ++i) {
            std::lock_guard<std::mutex> lock(registry.stripe(ids[i]));
            registry.set_parent(ids[i], ids[0]);
        }
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            for (int round = 0; round < 200; ++round) {
                for (EntityId id : ids) {
                    EntityId root = registry.find(id);
                    if (root != id && root != ids[0]) {
                        failed = true;
                    }
                }
            }
        });
    }

    writer.join();
    for (auto& t : readers) t.join();

    EXPECT_FALSE(failed.load());
    for (EntityId id : ids) {
        EXPECT_EQ(registry.find(id), ids[0]);
    }
}
