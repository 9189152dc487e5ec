#include "extraction/text_chunker.hpp"
#include "common/text.hpp"
#include <cctype>
#include <stdexcept>

namespace canon {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_sentence_end(char c) {
    return c == '.' || c == '!' || c == '?';
}

} // anonymous namespace

std::string TextChunk::generate_chunk_id(const std::string& doc_id, int index) {
    return doc_id + "_chunk_" + std::to_string(index);
}

TextChunker::TextChunker(size_t max_chunk_bytes) : max_chunk_bytes_(max_chunk_bytes) {
    if (max_chunk_bytes_ < 4) {
        throw std::invalid_argument("Chunk size must hold at least one UTF-8 character");
    }
}

size_t TextChunker::find_break(const std::string& text, size_t pos) const {
    size_t limit = pos + max_chunk_bytes_;
    if (limit >= text.size()) {
        return text.size();
    }

    // Sentence boundary: terminator followed by whitespace
    for (size_t i = limit; i > pos; --i) {
        if (is_sentence_end(text[i - 1]) && is_space(text[i])) {
            return i;
        }
    }

    // Word boundary
    for (size_t i = limit; i > pos; --i) {
        if (is_space(text[i])) {
            return i;
        }
    }

    size_t end = text::utf8_boundary_before(text, limit);
    if (end <= pos) {
        end = limit;
    }
    return end;
}

std::vector<TextChunk> TextChunker::chunk(const std::string& document_id, const std::string& text) const {
    std::vector<TextChunk> chunks;

    size_t pos = 0;
    int chunk_index = 0;

    while (pos < text.size()) {
        while (pos < text.size() && is_space(text[pos])) {
            ++pos;
        }
        if (pos >= text.size()) {
            break;
        }

        size_t end = find_break(text, pos);

        // Trailing whitespace stays outside the chunk
        size_t trimmed = end;
        while (trimmed > pos && is_space(text[trimmed - 1])) {
            --trimmed;
        }

        TextChunk chunk;
        chunk.text = text.substr(pos, trimmed - pos);
        chunk.document_id = document_id;
        chunk.chunk_id = TextChunk::generate_chunk_id(document_id, chunk_index);
        chunk.chunk_index = chunk_index;
        chunk.start_position = pos;
        chunk.end_position = trimmed;
        chunks.push_back(chunk);

        chunk_index++;
        pos = end;
    }

    return chunks;
}

} // namespace canon
