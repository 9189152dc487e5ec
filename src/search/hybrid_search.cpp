#include "search/hybrid_search.hpp"
#include "common/text.hpp"
#include "resolution/normalizer.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <stdexcept>

using json = nlohmann::json;

namespace canon {

// ============================================================================
// SearchConfig / SearchHit
// ============================================================================

json SearchConfig::to_json() const {
    return json{
        {"min_score", min_score},
        {"hop_decay", hop_decay},
        {"max_explore_depth", max_explore_depth},
        {"default_explore_depth", default_explore_depth},
        {"seed_k", seed_k},
        {"keyword_boost", keyword_boost},
        {"keyword_min_ratio", keyword_min_ratio},
        {"entity_boost", entity_boost},
        {"verbose", verbose}
    };
}

SearchConfig SearchConfig::from_json(const json& j) {
    SearchConfig config;
    config.min_score = j.value("min_score", config.min_score);
    config.hop_decay = j.value("hop_decay", config.hop_decay);
    config.max_explore_depth = j.value("max_explore_depth", config.max_explore_depth);
    config.default_explore_depth = j.value("default_explore_depth", config.default_explore_depth);
    config.seed_k = j.value("seed_k", config.seed_k);
    config.keyword_boost = j.value("keyword_boost", config.keyword_boost);
    config.keyword_min_ratio = j.value("keyword_min_ratio", config.keyword_min_ratio);
    config.entity_boost = j.value("entity_boost", config.entity_boost);
    config.verbose = j.value("verbose", config.verbose);
    return config;
}

bool SearchConfig::validate(std::string& error) const {
    if (min_score < 0.0 || min_score > 1.0) {
        error = "search.min_score must be in [0, 1]";
        return false;
    }
    if (hop_decay <= 0.0 || hop_decay > 1.0) {
        error = "search.hop_decay must be in (0, 1]";
        return false;
    }
    if (max_explore_depth < 0) {
        error = "search.max_explore_depth must be non-negative";
        return false;
    }
    if (default_explore_depth < 0 || default_explore_depth > max_explore_depth) {
        error = "search.default_explore_depth must be in [0, max_explore_depth]";
        return false;
    }
    if (seed_k == 0) {
        error = "search.seed_k must be positive";
        return false;
    }
    if (keyword_boost < 0.0 || entity_boost < 0.0) {
        error = "search boosts must be non-negative";
        return false;
    }
    return true;
}

json SearchHit::to_json() const {
    json j{
        {"node_id", node_id},
        {"kind", kind},
        {"label", label},
        {"score", score},
        {"vector_score", vector_score},
        {"graph_score", graph_score},
        {"hops", hops}
    };
    if (entity_id != kNoEntity) {
        j["entity_id"] = entity_id;
        j["type"] = type;
    }
    return j;
}

// ============================================================================
// HybridSearch
// ============================================================================

HybridSearch::HybridSearch(
    std::shared_ptr<const GraphStore> store,
    std::shared_ptr<const Embedder> embedder,
    const SearchConfig& config,
    RootResolver resolve_root
) : store_(std::move(store)),
    embedder_(std::move(embedder)),
    config_(config),
    resolve_root_(std::move(resolve_root)) {
    if (!store_ || !embedder_) {
        throw std::invalid_argument("HybridSearch requires a graph store and an embedder");
    }
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid search configuration: " + error);
    }
}

std::string HybridSearch::canonical_node(const std::string& node_id) const {
    auto entity = parse_entity_node_id(node_id);
    if (!entity) {
        return node_id;
    }

    if (resolve_root_) {
        return entity_node_id(resolve_root_(*entity));
    }

    // Without a registry, follow merged_into markers left by the graph builder
    std::string current = node_id;
    for (int guard = 0; guard < 64; ++guard) {
        auto node = store_->get_node(current);
        if (!node) break;
        auto it = node->properties.find("merged_into");
        if (it == node->properties.end() || it->second == current) break;
        current = it->second;
    }
    return current;
}

double HybridSearch::keyword_score(const std::vector<std::string>& query_tokens, const GraphNode& node) const {
    if (query_tokens.empty()) {
        return 0.0;
    }

    std::string haystack = node.label;
    auto aliases = node.properties.find("aliases");
    if (aliases != node.properties.end()) {
        haystack += " " + aliases->second;
    }
    std::vector<std::string> label_tokens = text::split_whitespace(CandidateNormalizer::clean(haystack));

    size_t matched = 0;
    for (const auto& q : query_tokens) {
        for (const auto& t : label_tokens) {
            if (q == t || text::levenshtein_ratio(q, t) >= config_.keyword_min_ratio) {
                ++matched;
                break;
            }
        }
    }
    return static_cast<double>(matched) / static_cast<double>(query_tokens.size());
}

std::vector<SearchHit> HybridSearch::query(const std::string& text, size_t limit, int explore_depth) const {
    std::vector<std::string> query_tokens = text::split_whitespace(CandidateNormalizer::clean(text));
    if (query_tokens.empty() || limit == 0) {
        return {};
    }

    int depth = explore_depth < 0 ? config_.default_explore_depth : explore_depth;
    depth = std::min(depth, config_.max_explore_depth);

    struct Accumulated {
        double vector_score = 0.0;
        double graph_score = 0.0;
        int hops = 0;
    };
    std::map<std::string, Accumulated> found;

    // Step 1: dense seeds
    auto seeds = store_->nearest(embedder_->embed(text), config_.seed_k);

    for (const auto& [seed_id, similarity] : seeds) {
        if (similarity < config_.min_score) {
            continue;
        }

        std::string seed = canonical_node(seed_id);
        Accumulated& acc = found[seed];
        if (similarity > acc.vector_score) {
            acc.vector_score = similarity;
            acc.hops = 0;
        }

        // Step 2: graph expansion, score decays per hop
        if (depth == 0) {
            continue;
        }
        GraphPattern pattern;
        pattern.start = seed;
        for (const auto& hit : store_->query(pattern, depth)) {
            std::string neighbour = canonical_node(hit.node_id);
            if (neighbour == seed) {
                continue;
            }
            double propagated = similarity * std::pow(config_.hop_decay, hit.hops);
            Accumulated& n = found[neighbour];
            if (propagated > n.graph_score) {
                n.graph_score = propagated;
                if (n.vector_score == 0.0) {
                    n.hops = hit.hops;
                }
            }
        }
    }

    // Step 3: merge and re-rank
    std::vector<SearchHit> hits;
    for (const auto& [node_id, acc] : found) {
        auto node = store_->get_node(node_id);
        if (!node) {
            continue;
        }

        SearchHit hit;
        hit.node_id = node_id;
        hit.kind = node->kind;
        hit.label = node->label;
        hit.vector_score = acc.vector_score;
        hit.graph_score = acc.graph_score;
        hit.hops = acc.hops;

        if (auto entity = parse_entity_node_id(node_id)) {
            hit.entity_id = *entity;
            auto type = node->properties.find("type");
            if (type != node->properties.end()) {
                hit.type = type->second;
            }
        }

        hit.score = std::max(acc.vector_score, acc.graph_score)
                  + config_.keyword_boost * keyword_score(query_tokens, *node)
                  + (hit.kind == "entity" ? config_.entity_boost : 0.0);

        if (hit.score >= config_.min_score) {
            hits.push_back(std::move(hit));
        }
    }

    std::sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.hops != b.hops) return a.hops < b.hops;
        return a.node_id < b.node_id;
    });

    if (hits.size() > limit) {
        hits.resize(limit);
    }

    if (config_.verbose) {
        std::cerr << ("[HybridSearch] \"" + text + "\": " + std::to_string(seeds.size()) +
                      " seeds, depth " + std::to_string(depth) + ", " +
                      std::to_string(hits.size()) + " hits\n");
    }

    return hits;
}

} // namespace canon
