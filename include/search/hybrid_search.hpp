#pragma once

#include "graph/graph_store.hpp"
#include "resolution/types.hpp"
#include "search/embedder.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace canon {

struct SearchConfig {
    double min_score = 0.3;             ///< Seeds and final hits below this are dropped
    double hop_decay = 0.5;             ///< Score multiplier per traversal hop
    int max_explore_depth = 3;
    int default_explore_depth = 1;
    size_t seed_k = 20;                 ///< Nearest nodes considered as seeds

    // Re-ranking
    double keyword_boost = 0.15;        ///< Added for the share of query tokens found in labels
    double keyword_min_ratio = 0.8;     ///< Levenshtein ratio counting as a token hit
    double entity_boost = 0.05;         ///< Entities rank above documents at equal relevance

    bool verbose = false;

    nlohmann::json to_json() const;
    static SearchConfig from_json(const nlohmann::json& j);

    bool validate(std::string& error) const;
};

struct SearchHit {
    std::string node_id;
    std::string kind;                   ///< "entity" or "document"
    EntityId entity_id = kNoEntity;     ///< Set for entity hits
    std::string label;
    std::string type;
    double score = 0.0;                 ///< Combined relevance
    double vector_score = 0.0;
    double graph_score = 0.0;
    int hops = 0;                       ///< 0 for a seed, otherwise distance to its seed

    nlohmann::json to_json() const;
};

/**
 * @brief Vector seeds expanded through the graph, merged and re-ranked
 *
 * Read-only: the search never writes to the store or the registry. Hits on
 * entities that have been merged away are reported under their root.
 */
class HybridSearch {
public:
    using RootResolver = std::function<EntityId(EntityId)>;

    HybridSearch(
        std::shared_ptr<const GraphStore> store,
        std::shared_ptr<const Embedder> embedder,
        const SearchConfig& config = SearchConfig(),
        RootResolver resolve_root = nullptr
    );

    /**
     * @brief Rank entities and documents for a free-text query
     * @param explore_depth Hops to expand from each seed; negative uses the
     *        configured default, larger values are clamped to max_explore_depth
     */
    std::vector<SearchHit> query(const std::string& text, size_t limit, int explore_depth = -1) const;

    const SearchConfig& config() const { return config_; }

private:
    /// Node id that stands for `node_id` after merges
    std::string canonical_node(const std::string& node_id) const;

    double keyword_score(const std::vector<std::string>& query_tokens, const GraphNode& node) const;

    std::shared_ptr<const GraphStore> store_;
    std::shared_ptr<const Embedder> embedder_;
    SearchConfig config_;
    RootResolver resolve_root_;
};

} // namespace canon
