#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace canon {
namespace text {

/**
 * @brief Check that a byte string is well-formed UTF-8
 */
bool is_valid_utf8(const std::string& s);

/**
 * @brief Decode UTF-8 into code points (invalid bytes map to U+FFFD)
 */
std::u32string decode_utf8(const std::string& s);

/**
 * @brief Encode code points as UTF-8
 */
std::string encode_utf8(const std::u32string& s);

/**
 * @brief Lowercase and strip diacritics
 *
 * ASCII is lowercased, Latin-1 Supplement and Latin Extended-A letters are
 * folded to their ASCII base ("É" -> "e", "ß" -> "ss", "Œ" -> "oe") and
 * combining marks are dropped. Other code points pass through unchanged.
 */
std::string fold(const std::string& s);

/**
 * @brief Trim ASCII whitespace from both ends
 */
std::string trim(const std::string& s);

/**
 * @brief Split on ASCII whitespace, dropping empty tokens
 */
std::vector<std::string> split_whitespace(const std::string& s);

/**
 * @brief Join tokens with a separator
 */
std::string join(const std::vector<std::string>& tokens, const std::string& separator);

/**
 * @brief American Soundex code of an ASCII word ("cook" -> "C200")
 *
 * Words that do not start with an ASCII letter are returned unchanged.
 */
std::string soundex(const std::string& word);

/**
 * @brief Levenshtein edit distance over code points
 */
size_t levenshtein(const std::u32string& s, const std::u32string& t);

/**
 * @brief 1 - distance / max(length); 1.0 for two empty strings
 */
double levenshtein_ratio(const std::string& a, const std::string& b);

/**
 * @brief Byte offset of the n-th code point (clamped to the string size)
 */
size_t codepoint_to_byte_offset(const std::string& s, size_t codepoint_index);

/**
 * @brief Move a byte position back until it does not split a UTF-8 sequence
 */
size_t utf8_boundary_before(const std::string& s, size_t pos);

} // namespace text
} // namespace canon
