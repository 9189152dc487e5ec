#include <gtest/gtest.h>
#include "common/text.hpp"
#include "resolution/similarity.hpp"
#include "search/embedder.hpp"

using namespace canon;

// ==========================================
// Text helpers
// ==========================================

TEST(TextTest, Soundex) {
    EXPECT_EQ(text::soundex("robert"), "R163");
    EXPECT_EQ(text::soundex("rupert"), "R163");
    EXPECT_EQ(text::soundex("cook"), "C200");
    EXPECT_EQ(text::soundex("koch"), "K200");
    EXPECT_EQ(text::soundex("42"), "42");
}

TEST(TextTest, LevenshteinRatio) {
    EXPECT_DOUBLE_EQ(text::levenshtein_ratio("", ""), 1.0);
    EXPECT_DOUBLE_EQ(text::levenshtein_ratio("abc", "abc"), 1.0);
    EXPECT_NEAR(text::levenshtein_ratio("tim cook", "timothy cook"), 1.0 - 4.0 / 12.0, 1e-9);
    // Code points, not bytes
    EXPECT_NEAR(text::levenshtein_ratio("zurich", "z\xc3\xbcrich"), 1.0 - 1.0 / 6.0, 1e-9);
}

TEST(TextTest, FoldStripsDiacritics) {
    EXPECT_EQ(text::fold("\xc3\x89lys\xc3\xa9" "e"), "elysee");
    EXPECT_EQ(text::fold("Stra\xc3\x9f" "e"), "strasse");
}

TEST(TextTest, Utf8DecodeReplacesInvalidBytes) {
    std::u32string decoded = text::decode_utf8("Z\xc3\xbcrich");
    ASSERT_EQ(decoded.size(), 6u);
    EXPECT_EQ(decoded[1], static_cast<char32_t>(0xFC));
    EXPECT_EQ(text::encode_utf8(decoded), "Z\xc3\xbcrich");

    std::u32string broken = text::decode_utf8("a\xff" "b");
    ASSERT_EQ(broken.size(), 3u);
    EXPECT_EQ(broken[1], static_cast<char32_t>(0xFFFD));
}

// ==========================================
// Token set similarity
// ==========================================

TEST(TokenSetTest, PrefixTokensPair) {
    EXPECT_DOUBLE_EQ(token_set_similarity({"tim", "cook"}, {"timothy", "cook"}), 1.0);
}

TEST(TokenSetTest, ShortPrefixDoesNotPair) {
    TokenMatchOptions options;
    EXPECT_DOUBLE_EQ(token_set_similarity({"ti", "cook"}, {"timothy", "cook"}, options), 0.5);
}

TEST(TokenSetTest, ExactPartnersAreNotStolen) {
    // "jon" could fuzzily take "john", leaving "jones" unmatched
    EXPECT_DOUBLE_EQ(token_set_similarity({"jon", "john"}, {"john", "jones"}), 1.0);
}

TEST(TokenSetTest, DividesByLongerSide) {
    EXPECT_DOUBLE_EQ(token_set_similarity({"bank"}, {"bank", "of", "america"}), 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(token_set_similarity({}, {}), 1.0);
}

// ==========================================
// Scorer
// ==========================================

TEST(SimilarityScorerTest, ExactKeyScoresOne) {
    SimilarityScorer scorer{SimilarityWeights(), TokenMatchOptions()};
    auto s = scorer.score("apple", "apple");
    EXPECT_TRUE(s.exact);
    EXPECT_DOUBLE_EQ(s.combined, 1.0);
}

TEST(SimilarityScorerTest, WeightsRenormalizeWithoutEmbeddings) {
    SimilarityScorer scorer{SimilarityWeights(), TokenMatchOptions()};
    auto s = scorer.score("tim cook", "timothy cook");

    double edit = 1.0 - 4.0 / 12.0;
    double expected = (0.25 * edit + 0.45 * 1.0) / 0.70;
    EXPECT_FALSE(s.has_embedding);
    EXPECT_NEAR(s.combined, expected, 1e-9);
    EXPECT_GT(s.combined, 0.78);
    EXPECT_LT(s.combined, 0.92);
}

TEST(SimilarityScorerTest, UnrelatedNamesScoreLow) {
    SimilarityScorer scorer{SimilarityWeights(), TokenMatchOptions()};
    EXPECT_LT(scorer.score("tim cook", "jane cook").combined, 0.78);
    EXPECT_LT(scorer.score("microsoft", "apple").combined, 0.3);
}

TEST(SimilarityScorerTest, EmbeddingComponentIsClamped) {
    auto embedder = std::make_shared<HashedNgramEmbedder>();
    SimilarityScorer scorer(SimilarityWeights(), TokenMatchOptions(), embedder);
    auto s = scorer.score("tim cook", "timothy cook");
    EXPECT_TRUE(s.has_embedding);
    EXPECT_GE(s.embedding, 0.0);
    EXPECT_LE(s.embedding, 1.0);
    EXPECT_GT(s.combined, 0.0);
    EXPECT_LE(s.combined, 1.0);
}

// ==========================================
// Embedder
// ==========================================

TEST(EmbedderTest, NormalizedAndDeterministic) {
    HashedNgramEmbedder embedder(128);
    auto a = embedder.embed("Apple Inc.");
    auto b = embedder.embed("Apple Inc.");
    ASSERT_EQ(a.size(), 128u);
    EXPECT_EQ(a, b);
    EXPECT_NEAR(cosine_similarity(a, a), 1.0, 1e-6);
}

TEST(EmbedderTest, SimilarTextIsCloser) {
    HashedNgramEmbedder embedder;
    auto apple = embedder.embed("apple");
    EXPECT_GT(cosine_similarity(apple, embedder.embed("apple inc")),
              cosine_similarity(apple, embedder.embed("microsoft")));
}

TEST(EmbedderTest, CosineOfMismatchedVectorsIsZero) {
    EXPECT_DOUBLE_EQ(cosine_similarity({1.0f, 0.0f}, {1.0f}), 0.0);
    EXPECT_DOUBLE_EQ(cosine_similarity({}, {}), 0.0);
    EXPECT_DOUBLE_EQ(cosine_similarity({0.0f, 0.0f}, {1.0f, 0.0f}), 0.0);
}
