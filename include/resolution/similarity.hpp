#pragma once

#include "search/embedder.hpp"
#include <memory>
#include <string>
#include <vector>

namespace canon {

/**
 * @brief Component weights of the combined score
 *
 * Weights are renormalized over the components actually available, so with
 * no embedder the edit and token weights alone sum to one.
 */
struct SimilarityWeights {
    double edit = 0.25;
    double token = 0.45;
    double embedding = 0.30;
};

struct TokenMatchOptions {
    size_t min_prefix_length = 3;   ///< "tim" matches "timothy"
    double min_token_ratio = 0.8;   ///< Edit ratio for two tokens to count as equal
};

/**
 * @brief Per-component scores of one key pair
 */
struct SimilarityScore {
    bool exact = false;
    double edit = 0.0;
    double token = 0.0;
    double embedding = 0.0;
    bool has_embedding = false;
    double combined = 0.0;
};

/**
 * @brief Fuzzy token-set overlap in [0, 1]
 *
 * Tokens are paired greedily; two tokens pair when equal, when the shorter is
 * a prefix of the longer and at least min_prefix_length long, or when their
 * edit ratio reaches min_token_ratio. Score = pairs / max(|a|, |b|).
 */
double token_set_similarity(
    const std::vector<std::string>& a,
    const std::vector<std::string>& b,
    const TokenMatchOptions& options = TokenMatchOptions()
);

/**
 * @brief Scores two normalized keys
 */
class SimilarityScorer {
public:
    SimilarityScorer(
        const SimilarityWeights& weights,
        const TokenMatchOptions& token_options,
        std::shared_ptr<const Embedder> embedder = nullptr
    );

    SimilarityScore score(const std::string& key_a, const std::string& key_b) const;

    bool uses_embeddings() const { return embedder_ != nullptr; }

private:
    SimilarityWeights weights_;
    TokenMatchOptions token_options_;
    std::shared_ptr<const Embedder> embedder_;
};

} // namespace canon
