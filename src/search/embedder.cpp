#include "search/embedder.hpp"
#include "common/text.hpp"
#include <cmath>
#include <stdexcept>

namespace canon {

namespace {

// FNV-1a, stable across runs and platforms
uint64_t fnv1a(const std::u32string& s, size_t begin, size_t length) {
    uint64_t hash = 14695981039346656037ULL;
    for (size_t i = begin; i < begin + length; ++i) {
        uint32_t cp = static_cast<uint32_t>(s[i]);
        for (int shift = 0; shift < 32; shift += 8) {
            hash ^= (cp >> shift) & 0xFF;
            hash *= 1099511628211ULL;
        }
    }
    return hash;
}

} // anonymous namespace

HashedNgramEmbedder::HashedNgramEmbedder(size_t dimension, size_t ngram)
    : dimension_(dimension), ngram_(ngram) {
    if (dimension_ == 0 || ngram_ == 0) {
        throw std::invalid_argument("HashedNgramEmbedder needs a positive dimension and n-gram size");
    }
}

std::vector<float> HashedNgramEmbedder::embed(const std::string& input) const {
    std::vector<float> vec(dimension_, 0.0f);

    std::string folded = text::join(text::split_whitespace(text::fold(input)), " ");
    if (folded.empty()) {
        return vec;
    }

    std::u32string padded = text::decode_utf8(" " + folded + " ");
    if (padded.size() < ngram_) {
        vec[fnv1a(padded, 0, padded.size()) % dimension_] += 1.0f;
    } else {
        for (size_t i = 0; i + ngram_ <= padded.size(); ++i) {
            uint64_t h = fnv1a(padded, i, ngram_);
            // High bit picks the sign to spread collisions around zero
            float sign = (h >> 63) ? -1.0f : 1.0f;
            vec[h % dimension_] += sign;
        }
    }

    double norm = 0.0;
    for (float v : vec) {
        norm += static_cast<double>(v) * v;
    }
    norm = std::sqrt(norm);
    if (norm > 0.0) {
        for (auto& v : vec) {
            v = static_cast<float>(v / norm);
        }
    }
    return vec;
}

double cosine_similarity(const std::vector<float>& vec1, const std::vector<float>& vec2) {
    if (vec1.size() != vec2.size() || vec1.empty()) {
        return 0.0;
    }

    double dot_product = 0.0;
    double norm1 = 0.0;
    double norm2 = 0.0;

    for (size_t i = 0; i < vec1.size(); ++i) {
        dot_product += static_cast<double>(vec1[i]) * vec2[i];
        norm1 += static_cast<double>(vec1[i]) * vec1[i];
        norm2 += static_cast<double>(vec2[i]) * vec2[i];
    }

    if (norm1 == 0.0 || norm2 == 0.0) {
        return 0.0;
    }

    return dot_product / (std::sqrt(norm1) * std::sqrt(norm2));
}

} // namespace canon
