#pragma once

#include <string>
#include <vector>

namespace canon {

/**
 * @brief Maps text to a fixed-size dense vector
 *
 * Implementations must be thread-safe: the resolver, graph builder and search
 * layer call embed() concurrently.
 */
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual std::vector<float> embed(const std::string& text) const = 0;

    virtual size_t dimension() const = 0;
};

/**
 * @brief Character trigram hashing embedder
 *
 * Text is folded and padded with spaces, every character trigram is hashed
 * into one of `dimension` buckets and the result is L2-normalized. Cosine
 * similarity of two embeddings then approximates trigram overlap, which is
 * enough for dense retrieval over entity labels without a model server.
 */
class HashedNgramEmbedder : public Embedder {
public:
    explicit HashedNgramEmbedder(size_t dimension = 256, size_t ngram = 3);

    std::vector<float> embed(const std::string& text) const override;

    size_t dimension() const override { return dimension_; }

private:
    size_t dimension_;
    size_t ngram_;
};

/**
 * @brief Cosine similarity; 0.0 when either vector is empty, zero or the sizes differ
 */
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

} // namespace canon
