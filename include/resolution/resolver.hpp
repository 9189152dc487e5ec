#pragma once

#include "resolution/types.hpp"
#include "resolution/similarity.hpp"
#include <memory>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace canon {

// ============================================================================
// Resolver Configuration
// ============================================================================

struct ResolverConfig {
    double high_threshold = 0.92;       ///< At or above: auto-merge
    double mid_threshold = 0.78;        ///< At or above (below high): merge, flag for audit
    SimilarityWeights weights;
    TokenMatchOptions token_options;
    bool use_embeddings = false;        ///< Add embedding cosine to the score

    nlohmann::json to_json() const;
    static ResolverConfig from_json(const nlohmann::json& j);

    bool validate(std::string& error_message) const;
};

// ============================================================================
// Snapshot and Decision
// ============================================================================

/**
 * @brief Read-only view of the registry as seen by one candidate
 */
struct RegistrySnapshot {
    BlockingKey block;
    uint64_t bucket_version = 0;
    std::vector<std::shared_ptr<const CanonicalEntity>> bucket;     ///< Roots of the candidate's bucket
    std::vector<std::shared_ptr<const CanonicalEntity>> same_key;   ///< Roots of any type holding the exact key
};

struct ScoredMatch {
    EntityId entity_id = kNoEntity;
    double score = 0.0;
};

/**
 * @brief Outcome of resolving one candidate
 */
struct Decision {
    enum class Action {
        MergeInto,
        CreateNew
    };

    Action action = Action::CreateNew;
    Candidate candidate;
    EntityId target = kNoEntity;            ///< Root to merge into (MergeInto only)
    double score = 0.0;
    DecisionTier tier = DecisionTier::New;
    std::vector<ScoredMatch> bridges;       ///< Other roots that also cleared the mid threshold
    bool type_conflict = false;
    std::optional<EntityId> conflict_with;
    uint64_t bucket_version = 0;            ///< Version of the snapshot it was computed on

    bool is_merge() const { return action == Action::MergeInto; }
};

// ============================================================================
// Similarity Resolver
// ============================================================================

/**
 * @brief Decides whether a candidate belongs to an existing canonical entity
 *
 * Pure function of (candidate, snapshot); holds no mutable state.
 */
class SimilarityResolver {
public:
    explicit SimilarityResolver(
        const ResolverConfig& config = ResolverConfig(),
        std::shared_ptr<const Embedder> embedder = nullptr
    );

    Decision resolve(const Candidate& candidate, const RegistrySnapshot& snapshot) const;

    /**
     * @brief Best score of a candidate against any alias key of an entity
     *
     * Returns 0.0 for an entity of another type.
     */
    double score(const Candidate& candidate, const CanonicalEntity& entity) const;

    DecisionTier tier_for(double score) const;

    const ResolverConfig& config() const { return config_; }

private:
    ResolverConfig config_;
    SimilarityScorer scorer_;
};

} // namespace canon
