#include <gtest/gtest.h>
#include "extraction/text_chunker.hpp"

using namespace canon;

namespace {

void expect_slices_of(const std::string& text, const std::vector<TextChunk>& chunks) {
    for (const auto& c : chunks) {
        EXPECT_EQ(c.text, text.substr(c.start_position, c.end_position - c.start_position));
    }
}

} // namespace

TEST(TextChunkerTest, ShortDocumentIsOneChunk) {
    TextChunker chunker(800);
    auto chunks = chunker.chunk("doc", "Apple Inc. reported revenue.");
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].chunk_id, "doc_chunk_0");
    EXPECT_EQ(chunks[0].start_position, 0u);
    EXPECT_EQ(chunks[0].end_position, 28u);
}

TEST(TextChunkerTest, EmptyOrBlankDocumentHasNoChunks) {
    TextChunker chunker(100);
    EXPECT_TRUE(chunker.chunk("doc", "").empty());
    EXPECT_TRUE(chunker.chunk("doc", "   \n\t ").empty());
}

TEST(TextChunkerTest, BreaksAtSentenceBoundary) {
    TextChunker chunker(30);
    std::string text = "First sentence here. Second sentence is here.";
    auto chunks = chunker.chunk("doc", text);

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].text, "First sentence here.");
    EXPECT_EQ(chunks[1].text, "Second sentence is here.");
    EXPECT_EQ(chunks[1].start_position, 21u);
    expect_slices_of(text, chunks);
}

TEST(TextChunkerTest, FallsBackToWordBoundary) {
    TextChunker chunker(12);
    std::string text = "alpha beta gamma delta";
    auto chunks = chunker.chunk("doc", text);

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].text, "alpha beta");
    EXPECT_EQ(chunks[1].text, "gamma delta");
    expect_slices_of(text, chunks);
}

TEST(TextChunkerTest, NeverSplitsAMultibyteCharacter) {
    TextChunker chunker(5);
    // "e" + 2 x "é" (2 bytes each) + "e": a hard split at 5 bytes lands inside a character
    std::string text = "e\xc3\xa9\xc3\xa9" "e\xc3\xa9";
    auto chunks = chunker.chunk("doc", text);

    ASSERT_GE(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].text, "e\xc3\xa9\xc3\xa9");
    size_t covered = 0;
    for (const auto& c : chunks) {
        EXPECT_LE(c.text.size(), 5u);
        EXPECT_NE(static_cast<unsigned char>(c.text[0]) & 0xC0, 0x80);
        covered += c.text.size();
    }
    EXPECT_EQ(covered, text.size());
    expect_slices_of(text, chunks);
}

TEST(TextChunkerTest, IndexesAreSequential) {
    TextChunker chunker(20);
    std::string text = "One two three. Four five six. Seven eight nine. Ten.";
    auto chunks = chunker.chunk("report", text);

    ASSERT_GT(chunks.size(), 1u);
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].chunk_index, static_cast<int>(i));
        EXPECT_EQ(chunks[i].document_id, "report");
        EXPECT_LE(chunks[i].text.size(), 20u);
    }
    expect_slices_of(text, chunks);
}

TEST(TextChunkerTest, RejectsTinyChunkSize) {
    EXPECT_THROW(TextChunker(2), std::invalid_argument);
}
