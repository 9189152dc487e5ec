#include <gtest/gtest.h>
#include "graph/graph_store.hpp"
#include "search/hybrid_search.hpp"
#include <algorithm>
#include <map>

using namespace canon;

namespace {

/**
 * @brief Embedder returning hand-picked vectors, zero for anything else
 */
class FixedEmbedder : public Embedder {
public:
    std::vector<float> embed(const std::string& text) const override {
        auto it = vectors.find(text);
        return it == vectors.end() ? std::vector<float>(3, 0.0f) : it->second;
    }
    size_t dimension() const override { return 3; }

    std::map<std::string, std::vector<float>> vectors;
};

} // namespace

class HybridSearchTest : public ::testing::Test {
protected:
    std::shared_ptr<InMemoryGraphStore> store = std::make_shared<InMemoryGraphStore>();
    std::shared_ptr<FixedEmbedder> embedder = std::make_shared<FixedEmbedder>();
    SearchConfig config;

    void SetUp() override {
        config.min_score = 0.2;

        embedder->vectors["apple"] = {1.0f, 0.0f, 0.0f};
        embedder->vectors["tim cook"] = {0.0f, 1.0f, 0.0f};

        add_entity(1, "Apple Inc.", "Organization", {1.0f, 0.0f, 0.0f}, "Apple | Apple Inc.");
        add_entity(2, "Tim Cook", "Person", {0.0f, 1.0f, 0.0f}, "Tim Cook | Timothy Cook");
        add_entity(3, "Cupertino", "Location", {0.0f, 0.0f, 1.0f}, "Cupertino");
        add_entity(6, "Steve Jobs", "Person", {}, "Steve Jobs");

        GraphNode doc;
        doc.id = document_node_id("news");
        doc.label = "news";
        doc.kind = "document";
        store->upsert_node(doc);

        store->upsert_edge("entity:2", "entity:1", "WORKS_AT", {});
        store->upsert_edge("entity:1", "entity:3", "LOCATED_IN", {});
        store->upsert_edge("entity:6", "entity:2", "KNOWS", {});
        store->upsert_edge("document:news", "entity:1", "MENTIONS", {});
    }

    void add_entity(EntityId id, const std::string& label, const std::string& type,
                    std::vector<float> embedding, const std::string& aliases) {
        GraphNode node;
        node.id = entity_node_id(id);
        node.label = label;
        node.kind = "entity";
        node.properties["type"] = type;
        node.properties["aliases"] = aliases;
        node.embedding = std::move(embedding);
        store->upsert_node(node);
    }

    static const SearchHit* find(const std::vector<SearchHit>& hits, const std::string& node_id) {
        auto it = std::find_if(hits.begin(), hits.end(),
                               [&](const SearchHit& h) { return h.node_id == node_id; });
        return it == hits.end() ? nullptr : &*it;
    }
};

TEST_F(HybridSearchTest, SeedRanksFirstAndNeighboursFollow) {
    HybridSearch search(store, embedder, config);
    auto hits = search.query("apple", 10);

    ASSERT_EQ(hits.size(), 4u);
    EXPECT_EQ(hits[0].node_id, "entity:1");
    EXPECT_EQ(hits[0].entity_id, 1u);
    EXPECT_EQ(hits[0].type, "Organization");
    EXPECT_EQ(hits[0].hops, 0);
    EXPECT_NEAR(hits[0].score, 1.0 + 0.15 + 0.05, 1e-9);

    // Equal scores at one hop break ties on node id
    EXPECT_EQ(hits[1].node_id, "entity:2");
    EXPECT_EQ(hits[2].node_id, "entity:3");
    EXPECT_EQ(hits[1].hops, 1);
    EXPECT_NEAR(hits[1].graph_score, 0.5, 1e-9);
    EXPECT_NEAR(hits[1].score, 0.55, 1e-9);

    EXPECT_EQ(hits[3].node_id, "document:news");
    EXPECT_EQ(hits[3].kind, "document");
    EXPECT_NEAR(hits[3].score, 0.5, 1e-9);
}

TEST_F(HybridSearchTest, DepthControlsExpansion) {
    HybridSearch search(store, embedder, config);

    auto seeds_only = search.query("apple", 10, 0);
    ASSERT_EQ(seeds_only.size(), 1u);
    EXPECT_EQ(seeds_only[0].node_id, "entity:1");

    EXPECT_EQ(find(search.query("apple", 10, 1), "entity:6"), nullptr);

    auto two_hops = search.query("apple", 10, 2);
    const SearchHit* jobs = find(two_hops, "entity:6");
    ASSERT_NE(jobs, nullptr);
    EXPECT_EQ(jobs->hops, 2);
    EXPECT_NEAR(jobs->graph_score, 0.25, 1e-9);

    // Clamped to max_explore_depth
    EXPECT_EQ(search.query("apple", 10, 50).size(), two_hops.size());
}

TEST_F(HybridSearchTest, LimitTruncates) {
    HybridSearch search(store, embedder, config);
    auto hits = search.query("apple", 2);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].node_id, "entity:1");
}

TEST_F(HybridSearchTest, EmptyOrUnknownQueriesFindNothing) {
    HybridSearch search(store, embedder, config);
    EXPECT_TRUE(search.query("", 10).empty());
    EXPECT_TRUE(search.query("  ...  ", 10).empty());
    EXPECT_TRUE(search.query("apple", 0).empty());
    EXPECT_TRUE(search.query("quantum chromodynamics", 10).empty());
}

TEST_F(HybridSearchTest, MergedSeedsReportTheirRoot) {
    add_entity(5, "Apple Computer", "Organization", {1.0f, 0.0f, 0.0f}, "Apple Computer");
    std::map<EntityId, EntityId> roots = {{5, 1}};
    HybridSearch search(store, embedder, config, [&](EntityId id) {
        auto it = roots.find(id);
        return it == roots.end() ? id : it->second;
    });

    auto hits = search.query("apple", 10);
    EXPECT_EQ(find(hits, "entity:5"), nullptr);
    ASSERT_FALSE(hits.empty());
    EXPECT_EQ(hits[0].node_id, "entity:1");
    EXPECT_EQ(std::count_if(hits.begin(), hits.end(),
                            [](const SearchHit& h) { return h.node_id == "entity:1"; }), 1);
}

TEST_F(HybridSearchTest, FollowsMergeMarkersWithoutRegistry) {
    add_entity(5, "Apple Computer", "Organization", {1.0f, 0.0f, 0.0f}, "Apple Computer");
    GraphNode old = *store->get_node("entity:5");
    old.properties["merged_into"] = "entity:1";
    store->upsert_node(old);

    HybridSearch search(store, embedder, config);
    auto hits = search.query("apple", 10);
    EXPECT_EQ(find(hits, "entity:5"), nullptr);
    EXPECT_EQ(hits[0].node_id, "entity:1");
}

TEST_F(HybridSearchTest, DoesNotWriteToTheStore) {
    HybridSearch search(store, embedder, config);
    size_t nodes = store->num_nodes();
    size_t edges = store->num_edges();
    search.query("tim cook", 10, 3);
    EXPECT_EQ(store->num_nodes(), nodes);
    EXPECT_EQ(store->num_edges(), edges);
}

TEST(SearchConfigTest, Validation) {
    std::string error;
    SearchConfig config;
    EXPECT_TRUE(config.validate(error));

    config.default_explore_depth = 5;
    EXPECT_FALSE(config.validate(error));

    SearchConfig decay;
    decay.hop_decay = 0.0;
    EXPECT_FALSE(decay.validate(error));

    auto store = std::make_shared<InMemoryGraphStore>();
    EXPECT_THROW(HybridSearch(store, nullptr), std::invalid_argument);

    SearchConfig back = SearchConfig::from_json(SearchConfig().to_json());
    EXPECT_DOUBLE_EQ(back.hop_decay, 0.5);
    EXPECT_EQ(back.max_explore_depth, 3);
}
