#include "resolution/similarity.hpp"
#include "common/text.hpp"
#include <algorithm>

namespace canon {

namespace {

bool tokens_match(const std::string& a, const std::string& b, const TokenMatchOptions& options) {
    if (a == b) {
        return true;
    }

    const std::string& shorter = a.size() <= b.size() ? a : b;
    const std::string& longer = a.size() <= b.size() ? b : a;
    if (shorter.size() >= options.min_prefix_length &&
        longer.compare(0, shorter.size(), shorter) == 0) {
        return true;
    }

    return text::levenshtein_ratio(a, b) >= options.min_token_ratio;
}

} // anonymous namespace

double token_set_similarity(
    const std::vector<std::string>& a,
    const std::vector<std::string>& b,
    const TokenMatchOptions& options
) {
    size_t longest = std::max(a.size(), b.size());
    if (longest == 0) {
        return 1.0;
    }

    std::vector<bool> used(b.size(), false);
    size_t matched = 0;

    // Exact pairs first so a fuzzy pair cannot steal an exact partner
    std::vector<bool> done(a.size(), false);
    for (size_t i = 0; i < a.size(); ++i) {
        for (size_t j = 0; j < b.size(); ++j) {
            if (!used[j] && a[i] == b[j]) {
                used[j] = true;
                done[i] = true;
                ++matched;
                break;
            }
        }
    }

    for (size_t i = 0; i < a.size(); ++i) {
        if (done[i]) continue;
        for (size_t j = 0; j < b.size(); ++j) {
            if (!used[j] && tokens_match(a[i], b[j], options)) {
                used[j] = true;
                ++matched;
                break;
            }
        }
    }

    return static_cast<double>(matched) / static_cast<double>(longest);
}

SimilarityScorer::SimilarityScorer(
    const SimilarityWeights& weights,
    const TokenMatchOptions& token_options,
    std::shared_ptr<const Embedder> embedder
) : weights_(weights), token_options_(token_options), embedder_(std::move(embedder)) {}

SimilarityScore SimilarityScorer::score(const std::string& key_a, const std::string& key_b) const {
    SimilarityScore result;

    if (key_a == key_b) {
        result.exact = true;
        result.edit = 1.0;
        result.token = 1.0;
        result.embedding = 1.0;
        result.has_embedding = uses_embeddings();
        result.combined = 1.0;
        return result;
    }

    result.edit = text::levenshtein_ratio(key_a, key_b);
    result.token = token_set_similarity(
        text::split_whitespace(key_a), text::split_whitespace(key_b), token_options_);

    double weighted = weights_.edit * result.edit + weights_.token * result.token;
    double total_weight = weights_.edit + weights_.token;

    if (embedder_) {
        double cos = cosine_similarity(embedder_->embed(key_a), embedder_->embed(key_b));
        result.embedding = std::clamp(cos, 0.0, 1.0);
        result.has_embedding = true;
        weighted += weights_.embedding * result.embedding;
        total_weight += weights_.embedding;
    }

    result.combined = total_weight > 0.0 ? weighted / total_weight : 0.0;
    return result;
}

} // namespace canon
