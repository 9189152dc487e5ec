#pragma once

#include <string>
#include <vector>

namespace canon {

/**
 * @brief A contiguous slice of a document sent to the extractor as one unit
 */
struct TextChunk {
    std::string text;              ///< The text content
    std::string document_id;       ///< Source document identifier
    std::string chunk_id;          ///< Unique chunk identifier
    int chunk_index = 0;           ///< Chunk index within document
    size_t start_position = 0;     ///< Byte offset in the document
    size_t end_position = 0;       ///< One past the last byte

    /**
     * @brief Create chunk ID from document and index
     */
    static std::string generate_chunk_id(const std::string& doc_id, int index);
};

/**
 * @brief Splits documents into chunks of at most max_chunk_bytes
 *
 * A chunk ends at the last sentence boundary that fits, else at the last
 * space, else at the last UTF-8 character boundary. Whitespace between two
 * chunks belongs to neither. text == document.substr(start, end - start)
 * holds for every chunk.
 */
class TextChunker {
public:
    explicit TextChunker(size_t max_chunk_bytes = 800);

    std::vector<TextChunk> chunk(const std::string& document_id, const std::string& text) const;

    size_t max_chunk_bytes() const { return max_chunk_bytes_; }

private:
    size_t find_break(const std::string& text, size_t pos) const;

    size_t max_chunk_bytes_;
};

} // namespace canon
