#include "resolution/resolver.hpp"
#include <algorithm>

using json = nlohmann::json;

namespace canon {

// ============================================================================
// ResolverConfig
// ============================================================================

json ResolverConfig::to_json() const {
    json j;
    j["high_threshold"] = high_threshold;
    j["mid_threshold"] = mid_threshold;
    j["edit_weight"] = weights.edit;
    j["token_weight"] = weights.token;
    j["embedding_weight"] = weights.embedding;
    j["min_prefix_length"] = token_options.min_prefix_length;
    j["min_token_ratio"] = token_options.min_token_ratio;
    j["use_embeddings"] = use_embeddings;
    return j;
}

ResolverConfig ResolverConfig::from_json(const json& j) {
    ResolverConfig config;
    config.high_threshold = j.value("high_threshold", config.high_threshold);
    config.mid_threshold = j.value("mid_threshold", config.mid_threshold);
    config.weights.edit = j.value("edit_weight", config.weights.edit);
    config.weights.token = j.value("token_weight", config.weights.token);
    config.weights.embedding = j.value("embedding_weight", config.weights.embedding);
    config.token_options.min_prefix_length =
        j.value("min_prefix_length", config.token_options.min_prefix_length);
    config.token_options.min_token_ratio =
        j.value("min_token_ratio", config.token_options.min_token_ratio);
    config.use_embeddings = j.value("use_embeddings", config.use_embeddings);
    return config;
}

bool ResolverConfig::validate(std::string& error_message) const {
    if (mid_threshold <= 0.0 || mid_threshold > 1.0) {
        error_message = "resolver.mid_threshold must be in (0, 1]";
        return false;
    }
    if (high_threshold < mid_threshold || high_threshold > 1.0) {
        error_message = "resolver.high_threshold must be in [mid_threshold, 1]";
        return false;
    }
    if (weights.edit < 0.0 || weights.token < 0.0 || weights.embedding < 0.0) {
        error_message = "resolver weights must be non-negative";
        return false;
    }
    if (weights.edit + weights.token <= 0.0) {
        error_message = "resolver edit and token weights cannot both be zero";
        return false;
    }
    return true;
}

// ============================================================================
// SimilarityResolver
// ============================================================================

SimilarityResolver::SimilarityResolver(
    const ResolverConfig& config,
    std::shared_ptr<const Embedder> embedder
) : config_(config),
    scorer_(config.weights, config.token_options,
            config.use_embeddings ? std::move(embedder) : nullptr) {}

double SimilarityResolver::score(const Candidate& candidate, const CanonicalEntity& entity) const {
    if (entity.type != candidate.type) {
        return 0.0;
    }
    if (entity.alias_keys.count(candidate.key)) {
        return 1.0;
    }

    double best = 0.0;
    for (const auto& alias_key : entity.alias_keys) {
        best = std::max(best, scorer_.score(candidate.key, alias_key).combined);
    }
    return best;
}

DecisionTier SimilarityResolver::tier_for(double score) const {
    if (score >= config_.high_threshold) return DecisionTier::HighConfidence;
    if (score >= config_.mid_threshold) return DecisionTier::LowConfidence;
    return DecisionTier::New;
}

Decision SimilarityResolver::resolve(const Candidate& candidate, const RegistrySnapshot& snapshot) const {
    Decision decision;
    decision.candidate = candidate;
    decision.bucket_version = snapshot.bucket_version;

    struct Scored {
        const CanonicalEntity* entity;
        double score;
    };
    std::vector<Scored> matches;

    for (const auto& entity : snapshot.bucket) {
        if (!entity || entity->type != candidate.type) {
            continue;
        }
        double s = score(candidate, *entity);
        if (s >= config_.mid_threshold) {
            matches.push_back({entity.get(), s});
        }
    }

    if (!matches.empty()) {
        std::sort(matches.begin(), matches.end(), [](const Scored& a, const Scored& b) {
            if (a.score != b.score) return a.score > b.score;
            uint64_t fa = a.entity->mention_count();
            uint64_t fb = b.entity->mention_count();
            if (fa != fb) return fa > fb;
            return a.entity->id < b.entity->id;
        });

        decision.action = Decision::Action::MergeInto;
        decision.target = matches.front().entity->id;
        decision.score = matches.front().score;
        decision.tier = tier_for(decision.score);

        for (size_t i = 1; i < matches.size(); ++i) {
            if (matches[i].entity->id != decision.target) {
                decision.bridges.push_back({matches[i].entity->id, matches[i].score});
            }
        }
        return decision;
    }

    decision.action = Decision::Action::CreateNew;
    decision.tier = DecisionTier::New;

    // Same string, different type: never merged, but surfaced for review
    for (const auto& entity : snapshot.same_key) {
        if (entity && entity->type != candidate.type && entity->alias_keys.count(candidate.key)) {
            decision.type_conflict = true;
            decision.conflict_with = entity->id;
            break;
        }
    }

    return decision;
}

} // namespace canon
