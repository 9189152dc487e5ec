#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "resolution/merge_engine.hpp"
#include "resolution/normalizer.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <thread>
#include <vector>

using namespace canon;

class MergeEngineTest : public ::testing::Test {
protected:
    CandidateNormalizer normalizer;
    std::unique_ptr<MergeEngine> engine;

    void SetUp() override {
        MergeEngineConfig config;
        config.writer_shards = 4;
        engine = std::make_unique<MergeEngine>(ResolverConfig(), config);
    }

    Candidate candidate(const std::string& text, const std::string& label,
                        size_t start, const std::string& document = "doc") {
        RawMention m;
        m.text = text;
        m.declared_type = label;
        m.document_id = document;
        m.start = start;
        m.end = start + text.size();
        m.mention_id = RawMention::make_id(document, m.start, m.end);
        return normalizer.normalize(m);
    }

    ApplyResult add(const std::string& text, const std::string& label,
                    size_t start, const std::string& document = "doc") {
        return engine->submit(candidate(text, label, start, document)).get();
    }
};

// ==========================================
// Create / merge / replay
// ==========================================

TEST_F(MergeEngineTest, FirstMentionCreatesEntity) {
    auto r = add("Apple Inc.", "organization", 0);
    EXPECT_EQ(r.outcome, ApplyOutcome::Created);
    EXPECT_NE(r.entity_id, kNoEntity);
    EXPECT_EQ(r.decision.tier, DecisionTier::New);

    auto e = engine->entity(r.entity_id);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->primary_label, "Apple Inc.");
    EXPECT_EQ(e->type, EntityType::Organization);
    EXPECT_EQ(e->mention_count(), 1u);
}

TEST_F(MergeEngineTest, VariantsMergeIntoOneEntity) {
    auto first = add("Apple Inc.", "organization", 0);
    auto second = add("Apple", "organization", 50);
    auto third = add("Apple Inc.", "organization", 100);

    EXPECT_EQ(second.outcome, ApplyOutcome::Merged);
    EXPECT_EQ(second.entity_id, first.entity_id);
    EXPECT_EQ(second.decision.tier, DecisionTier::HighConfidence);
    EXPECT_EQ(third.entity_id, first.entity_id);

    auto e = engine->entity(first.entity_id);
    EXPECT_EQ(e->mention_count(), 3u);
    EXPECT_EQ(e->primary_label, "Apple Inc.");
    EXPECT_EQ(e->alias_frequency.at("Apple Inc."), 2u);
    EXPECT_EQ(e->alias_frequency.at("Apple"), 1u);
    EXPECT_EQ(engine->entities().size(), 1u);
}

TEST_F(MergeEngineTest, NicknameMergeIsQueuedForReview) {
    auto tim = add("Tim Cook", "person", 0);
    auto timothy = add("Timothy Cook", "person", 40);

    EXPECT_EQ(timothy.entity_id, tim.entity_id);
    EXPECT_EQ(timothy.decision.tier, DecisionTier::LowConfidence);

    auto queue = engine->review_queue();
    ASSERT_EQ(queue.size(), 1u);
    EXPECT_EQ(queue[0].surface_form, "Timothy Cook");
    ASSERT_TRUE(queue[0].matched.has_value());
    EXPECT_EQ(*queue[0].matched, tim.entity_id);
}

TEST_F(MergeEngineTest, ReplayedMentionChangesNothing) {
    auto first = add("Tim Cook", "person", 10);
    auto replay = add("Tim Cook", "person", 10);

    EXPECT_EQ(replay.outcome, ApplyOutcome::Replayed);
    EXPECT_EQ(replay.entity_id, first.entity_id);
    EXPECT_EQ(engine->entity(first.entity_id)->mention_count(), 1u);
    EXPECT_EQ(engine->audit_log().size(), 1u);
}

TEST_F(MergeEngineTest, LookupFollowsTheRoot) {
    auto tim = add("Tim Cook", "person", 0);
    auto jane = add("Jane Cook", "person", 20);
    ASSERT_NE(tim.entity_id, jane.entity_id);

    engine->merge_entities(jane.entity_id, tim.entity_id);

    auto owner = engine->lookup(RawMention::make_id("doc", 20, 29));
    ASSERT_TRUE(owner.has_value());
    EXPECT_EQ(*owner, tim.entity_id);
    EXPECT_FALSE(engine->lookup("doc#999-1000").has_value());
    EXPECT_EQ(engine->entity(jane.entity_id)->id, tim.entity_id);
    EXPECT_EQ(engine->entity(12345), nullptr);
}

// ==========================================
// Type safety
// ==========================================

TEST_F(MergeEngineTest, SameStringDifferentTypeStaysApart) {
    auto company = add("Apple", "organization", 0);
    auto fruit = add("Apple", "food", 30);

    EXPECT_EQ(fruit.outcome, ApplyOutcome::Created);
    EXPECT_NE(fruit.entity_id, company.entity_id);
    EXPECT_TRUE(fruit.type_conflict);
    EXPECT_EQ(engine->entity(fruit.entity_id)->type, EntityType::Other);

    auto queue = engine->review_queue();
    ASSERT_EQ(queue.size(), 1u);
    EXPECT_TRUE(queue[0].type_conflict);
    ASSERT_TRUE(queue[0].conflict_with.has_value());
    EXPECT_EQ(*queue[0].conflict_with, company.entity_id);
}

TEST_F(MergeEngineTest, ManualCrossTypeMergeNeedsOverride) {
    auto company = add("Apple", "organization", 0);
    auto fruit = add("Apple", "food", 30);

    EXPECT_THROW(engine->merge_entities(fruit.entity_id, company.entity_id), TypeConflictError);
    EXPECT_EQ(engine->entities().size(), 2u);

    auto r = engine->merge_entities(fruit.entity_id, company.entity_id, true);
    EXPECT_EQ(r.entity_id, company.entity_id);
    EXPECT_EQ(r.decision.tier, DecisionTier::Manual);
    EXPECT_EQ(engine->entities().size(), 1u);
    EXPECT_EQ(engine->entity(company.entity_id)->type, EntityType::Organization);
}

TEST_F(MergeEngineTest, ManualMergeOfUnknownIdThrows) {
    auto tim = add("Tim Cook", "person", 0);
    EXPECT_THROW(engine->merge_entities(tim.entity_id, 999), std::out_of_range);
}

TEST_F(MergeEngineTest, ManualMergeOfOneSetIsNoop) {
    auto tim = add("Tim Cook", "person", 0);
    auto r = engine->merge_entities(tim.entity_id, tim.entity_id);
    EXPECT_TRUE(r.absorbed.empty());
    EXPECT_EQ(r.entity_id, tim.entity_id);
    EXPECT_EQ(engine->audit_log().size(), 1u);
}

// ==========================================
// Precomputed decisions
// ==========================================

TEST_F(MergeEngineTest, BridgesConsolidateRoots) {
    auto tim = add("Tim Cook", "person", 0);
    auto jane = add("Jane Cook", "person", 20);
    ASSERT_NE(tim.entity_id, jane.entity_id);

    auto c = candidate("T. Cook", "person", 60);
    auto snap = engine->snapshot(c).get();
    EXPECT_EQ(snap.bucket.size(), 2u);

    Decision d;
    d.action = Decision::Action::MergeInto;
    d.candidate = c;
    d.target = tim.entity_id;
    d.score = 0.8;
    d.tier = DecisionTier::LowConfidence;
    d.bridges.push_back({jane.entity_id, 0.79});
    d.bucket_version = snap.bucket_version;

    auto r = engine->apply(d).get();
    EXPECT_EQ(r.outcome, ApplyOutcome::Merged);
    EXPECT_EQ(r.entity_id, tim.entity_id);
    ASSERT_EQ(r.absorbed.size(), 1u);
    EXPECT_EQ(r.absorbed[0], jane.entity_id);

    EXPECT_EQ(engine->entities().size(), 1u);
    EXPECT_EQ(engine->find_root(jane.entity_id), tim.entity_id);
    EXPECT_EQ(engine->entity(tim.entity_id)->mention_count(), 3u);

    auto log = engine->audit_log();
    ASSERT_FALSE(log.empty());
    EXPECT_EQ(log.back().tier, DecisionTier::Consolidated);
    EXPECT_TRUE(log.back().low_confidence);

    // Consolidations below the high threshold enter the review queue
    auto queue = engine->review_queue();
    auto consolidated = std::find_if(queue.begin(), queue.end(), [](const MergeDecision& m) {
        return m.tier == DecisionTier::Consolidated;
    });
    ASSERT_NE(consolidated, queue.end());
    EXPECT_EQ(consolidated->matched, std::optional<EntityId>(jane.entity_id));
    EXPECT_TRUE(MergeDecision::from_json(consolidated->to_json()).needs_review());
}

TEST_F(MergeEngineTest, ConfidentBridgeSkipsReview) {
    auto tim = add("Tim Cook", "person", 0);
    auto jane = add("Jane Cook", "person", 20);

    auto c = candidate("T. Cook", "person", 60);
    auto snap = engine->snapshot(c).get();

    Decision d;
    d.action = Decision::Action::MergeInto;
    d.candidate = c;
    d.target = tim.entity_id;
    d.score = 0.95;
    d.tier = DecisionTier::HighConfidence;
    d.bridges.push_back({jane.entity_id, 0.93});
    d.bucket_version = snap.bucket_version;

    engine->apply(d).get();
    EXPECT_EQ(engine->entities().size(), 1u);
    EXPECT_EQ(engine->audit_log().back().tier, DecisionTier::Consolidated);
    EXPECT_TRUE(engine->review_queue().empty());
}

TEST_F(MergeEngineTest, MergesOnlyGrowEntities) {
    std::vector<std::string> mentions;
    auto track = [&](const ApplyResult& r, const Candidate& c) {
        mentions.push_back(c.mention.mention_id);
        return r;
    };
    auto tracked_add = [&](const std::string& text, const std::string& label, size_t start) {
        auto c = candidate(text, label, start);
        return track(engine->submit(c).get(), c);
    };

    struct View {
        std::map<std::string, EntityId> root;
        std::map<std::string, std::set<std::string>> aliases;
    };
    auto capture = [&]() {
        View view;
        for (const auto& id : mentions) {
            auto root = engine->lookup(id);
            EXPECT_TRUE(root.has_value()) << id;
            if (!root) continue;
            view.root[id] = *root;
            view.aliases[id] = engine->entity(*root)->aliases();
        }
        return view;
    };
    auto expect_grown = [&](const View& before, const View& after, const std::string& step) {
        for (const auto& [id, aliases] : before.aliases) {
            const auto& now = after.aliases.at(id);
            EXPECT_TRUE(std::includes(now.begin(), now.end(), aliases.begin(), aliases.end()))
                << id << " lost aliases after " << step;
        }
        for (const auto& [a, root_a] : before.root) {
            for (const auto& [b, root_b] : before.root) {
                if (root_a == root_b) {
                    EXPECT_EQ(after.root.at(a), after.root.at(b))
                        << a << " and " << b << " split after " << step;
                }
            }
        }
    };

    auto tim = tracked_add("Tim Cook", "person", 0);
    auto jane = tracked_add("Jane Cook", "person", 20);
    auto apple = tracked_add("Apple Inc.", "organization", 40);
    auto acme = tracked_add("Acme Corp", "organization", 60);
    tracked_add("Apple", "organization", 80);
    ASSERT_NE(apple.entity_id, acme.entity_id);
    View view = capture();

    // Bridge consolidation
    auto c = candidate("T. Cook", "person", 100);
    Decision d;
    d.action = Decision::Action::MergeInto;
    d.candidate = c;
    d.target = tim.entity_id;
    d.score = 0.8;
    d.tier = DecisionTier::LowConfidence;
    d.bridges.push_back({jane.entity_id, 0.79});
    d.bucket_version = engine->snapshot(c).get().bucket_version;
    track(engine->apply(d).get(), c);
    View bridged = capture();
    expect_grown(view, bridged, "bridge");
    EXPECT_EQ(bridged.root.at(c.mention.mention_id), bridged.root.at(mentions[0]));
    EXPECT_EQ(bridged.root.at(mentions[1]), bridged.root.at(mentions[0]));

    // Manual merge
    engine->merge_entities(acme.entity_id, apple.entity_id);
    View merged = capture();
    expect_grown(bridged, merged, "manual merge");
    EXPECT_TRUE(merged.aliases.at(mentions[2]).count("Acme Corp"));

    // Further ingestion into the merged sets
    tracked_add("Apple Inc.", "organization", 120);
    tracked_add("Tim Cook", "person", 140);
    tracked_add("Acme Corp", "organization", 160);
    View later = capture();
    expect_grown(merged, later, "ingestion");
    expect_grown(view, later, "all steps");

    std::set<EntityId> roots;
    for (const auto& [id, root] : later.root) {
        roots.insert(root);
    }
    EXPECT_EQ(roots.size(), 2u);
}

TEST_F(MergeEngineTest, StaleDecisionIsResolvedAgain) {
    auto c = candidate("Tim Cook", "person", 0);
    auto snap = engine->snapshot(c).get();
    SimilarityResolver resolver;
    Decision stale = resolver.resolve(c, snap);
    ASSERT_EQ(stale.action, Decision::Action::CreateNew);

    // Another writer commits into the same bucket first
    auto other = add("Tim Cook", "person", 80);

    auto r = engine->apply(stale).get();
    EXPECT_EQ(r.outcome, ApplyOutcome::Merged);
    EXPECT_EQ(r.entity_id, other.entity_id);
    EXPECT_EQ(engine->entities().size(), 1u);
}

// ==========================================
// Concurrency
// ==========================================

TEST_F(MergeEngineTest, ConcurrentVariantsConvergeOnOneEntity) {
    const int threads = 8;
    const int per_thread = 25;
    std::vector<std::thread> workers;
    std::vector<EntityId> ids(threads * per_thread, kNoEntity);

    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < per_thread; ++i) {
                int n = t * per_thread + i;
                std::string surface = (n % 2 == 0) ? "Apple Inc." : "Apple";
                ids[n] = add(surface, "organization", static_cast<size_t>(n) * 20,
                             "doc" + std::to_string(t)).entity_id;
            }
        });
    }
    for (auto& w : workers) w.join();

    ASSERT_EQ(engine->entities().size(), 1u);
    EntityId root = engine->entities()[0]->id;
    for (EntityId id : ids) {
        EXPECT_EQ(engine->find_root(id), root);
    }
    EXPECT_EQ(engine->entity(root)->mention_count(), static_cast<uint64_t>(threads * per_thread));
}

TEST_F(MergeEngineTest, ConcurrentReplaysCountOnce) {
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&] { add("Tim Cook", "person", 5); });
    }
    for (auto& w : workers) w.join();

    ASSERT_EQ(engine->entities().size(), 1u);
    EXPECT_EQ(engine->entities()[0]->mention_count(), 1u);
}

// ==========================================
// Corruption and audit export
// ==========================================

TEST_F(MergeEngineTest, CorruptionHaltsTheEngine) {
    auto tim = add("Tim Cook", "person", 0);
    auto jane = add("Jane Cook", "person", 20);

    auto& registry = const_cast<EntityRegistry&>(engine->registry());
    registry.set_parent(tim.entity_id, jane.entity_id);
    registry.set_parent(jane.entity_id, tim.entity_id);

    EXPECT_THROW(add("Ann Cook", "person", 40), RegistryCorruptionError);
    EXPECT_TRUE(engine->halted());
    EXPECT_THROW(add("Microsoft", "organization", 60), RegistryCorruptionError);
    EXPECT_THROW(engine->merge_entities(tim.entity_id, jane.entity_id), RegistryCorruptionError);
}

TEST_F(MergeEngineTest, ExportsAuditLogAsJsonLines) {
    add("Tim Cook", "person", 0);
    add("Timothy Cook", "person", 40);

    auto path = std::filesystem::temp_directory_path() / "canon_audit_test.jsonl";
    engine->export_audit_log(path.string());

    std::ifstream file(path);
    std::string line;
    std::vector<MergeDecision> decisions;
    while (std::getline(file, line)) {
        decisions.push_back(MergeDecision::from_json(nlohmann::json::parse(line)));
    }
    std::filesystem::remove(path);

    ASSERT_EQ(decisions.size(), 2u);
    EXPECT_EQ(decisions[0].tier, DecisionTier::New);
    EXPECT_EQ(decisions[1].tier, DecisionTier::LowConfidence);
    EXPECT_EQ(decisions[1].surface_form, "Timothy Cook");
}

TEST_F(MergeEngineTest, EntitiesJsonListsRedirects) {
    auto tim = add("Tim Cook", "person", 0);
    auto jane = add("Jane Cook", "person", 20);
    engine->merge_entities(jane.entity_id, tim.entity_id);

    auto j = engine->entities_to_json();
    EXPECT_EQ(j["entities"].size(), 1u);
    EXPECT_EQ(j["merged_into"][std::to_string(jane.entity_id)].get<EntityId>(), tim.entity_id);
}

TEST(MergeEngineConfigTest, RejectsZeroShards) {
    MergeEngineConfig config;
    config.writer_shards = 0;
    EXPECT_THROW({ MergeEngine engine(ResolverConfig{}, config); }, std::invalid_argument);
}

TEST(MergeEngineConfigTest, SubmitAfterShutdownFails) {
    MergeEngine engine;
    engine.shutdown();
    CandidateNormalizer normalizer;
    RawMention m;
    m.text = "Tim Cook";
    m.declared_type = "person";
    m.document_id = "doc";
    m.end = 8;
    m.mention_id = RawMention::make_id("doc", 0, 8);
    EXPECT_THROW(engine.submit(normalizer.normalize(m)).get(), std::runtime_error);
}
