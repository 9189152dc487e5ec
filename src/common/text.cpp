#include "common/text.hpp"
#include <algorithm>
#include <cctype>

namespace canon {
namespace text {

namespace {

struct FoldRange {
    char32_t first;
    char32_t last;
    const char* ascii;
};

// Latin-1 Supplement and Latin Extended-A letters folded to lowercase ASCII.
const FoldRange kFoldTable[] = {
    {0x00C0, 0x00C5, "a"}, {0x00C6, 0x00C6, "ae"}, {0x00C7, 0x00C7, "c"},
    {0x00C8, 0x00CB, "e"}, {0x00CC, 0x00CF, "i"}, {0x00D0, 0x00D0, "d"},
    {0x00D1, 0x00D1, "n"}, {0x00D2, 0x00D6, "o"}, {0x00D7, 0x00D7, " "},
    {0x00D8, 0x00D8, "o"}, {0x00D9, 0x00DC, "u"}, {0x00DD, 0x00DD, "y"},
    {0x00DE, 0x00DE, "th"}, {0x00DF, 0x00DF, "ss"},
    {0x00E0, 0x00E5, "a"}, {0x00E6, 0x00E6, "ae"}, {0x00E7, 0x00E7, "c"},
    {0x00E8, 0x00EB, "e"}, {0x00EC, 0x00EF, "i"}, {0x00F0, 0x00F0, "d"},
    {0x00F1, 0x00F1, "n"}, {0x00F2, 0x00F6, "o"}, {0x00F7, 0x00F7, " "},
    {0x00F8, 0x00F8, "o"}, {0x00F9, 0x00FC, "u"}, {0x00FD, 0x00FD, "y"},
    {0x00FE, 0x00FE, "th"}, {0x00FF, 0x00FF, "y"},
    {0x0100, 0x0105, "a"}, {0x0106, 0x010D, "c"}, {0x010E, 0x0111, "d"},
    {0x0112, 0x011B, "e"}, {0x011C, 0x0123, "g"}, {0x0124, 0x0127, "h"},
    {0x0128, 0x0131, "i"}, {0x0132, 0x0133, "ij"}, {0x0134, 0x0135, "j"},
    {0x0136, 0x0138, "k"}, {0x0139, 0x0142, "l"}, {0x0143, 0x014B, "n"},
    {0x014C, 0x0151, "o"}, {0x0152, 0x0153, "oe"}, {0x0154, 0x0159, "r"},
    {0x015A, 0x0161, "s"}, {0x0162, 0x0167, "t"}, {0x0168, 0x0173, "u"},
    {0x0174, 0x0175, "w"}, {0x0176, 0x0178, "y"}, {0x0179, 0x017E, "z"},
    {0x017F, 0x017F, "s"},
    // Typographic punctuation
    {0x2010, 0x2015, " "}, {0x2018, 0x2019, "'"}, {0x201C, 0x201D, "\""},
};

const char* fold_codepoint(char32_t cp) {
    for (const auto& range : kFoldTable) {
        if (cp >= range.first && cp <= range.last) {
            return range.ascii;
        }
    }
    return nullptr;
}

bool is_combining_mark(char32_t cp) {
    return cp >= 0x0300 && cp <= 0x036F;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Length of the sequence starting with lead byte c, 0 if c is not a lead byte.
size_t sequence_length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 0;
}

char soundex_digit(char c) {
    switch (c) {
        case 'b': case 'f': case 'p': case 'v':
            return '1';
        case 'c': case 'g': case 'j': case 'k':
        case 'q': case 's': case 'x': case 'z':
            return '2';
        case 'd': case 't':
            return '3';
        case 'l':
            return '4';
        case 'm': case 'n':
            return '5';
        case 'r':
            return '6';
        default:
            return '0';
    }
}

} // anonymous namespace

bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len = sequence_length(c);
        if (len == 0 || i + len > s.size()) return false;
        if (len == 2 && c < 0xC2) return false;  // overlong
        for (size_t k = 1; k < len; ++k) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return false;
        }
        i += len;
    }
    return true;
}

std::u32string decode_utf8(const std::string& s) {
    std::u32string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len = sequence_length(c);
        if (len == 0 || i + len > s.size()) {
            result += static_cast<char32_t>(0xFFFD);
            ++i;
            continue;
        }

        char32_t cp = 0;
        if (len == 1) {
            cp = c;
        } else if (len == 2) {
            cp = c & 0x1F;
        } else if (len == 3) {
            cp = c & 0x0F;
        } else {
            cp = c & 0x07;
        }

        bool valid = true;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (!valid) {
            result += static_cast<char32_t>(0xFFFD);
            ++i;
            continue;
        }

        result += cp;
        i += len;
    }

    return result;
}

std::string encode_utf8(const std::u32string& s) {
    std::string out;
    out.reserve(s.size());
    for (char32_t cp : s) {
        append_utf8(out, cp);
    }
    return out;
}

std::string fold(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    for (char32_t cp : decode_utf8(s)) {
        if (cp < 0x80) {
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(cp)));
        } else if (is_combining_mark(cp)) {
            continue;
        } else if (const char* ascii = fold_codepoint(cp)) {
            out += ascii;
        } else {
            append_utf8(out, cp);
        }
    }

    return out;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

std::string join(const std::vector<std::string>& tokens, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) out += separator;
        out += tokens[i];
    }
    return out;
}

std::string soundex(const std::string& word) {
    if (word.empty() || !std::isalpha(static_cast<unsigned char>(word[0])) ||
        static_cast<unsigned char>(word[0]) >= 128) {
        return word;
    }

    std::string code;
    code += static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
    char last = soundex_digit(static_cast<char>(std::tolower(static_cast<unsigned char>(word[0]))));

    for (size_t i = 1; i < word.size() && code.size() < 4; ++i) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(word[i])));
        if (!std::isalpha(static_cast<unsigned char>(c))) continue;

        // 'h' and 'w' do not separate letters with the same code
        if (c == 'h' || c == 'w') continue;

        char digit = soundex_digit(c);
        if (digit != '0' && digit != last) {
            code += digit;
        }
        last = digit;
    }

    while (code.size() < 4) {
        code += '0';
    }
    return code;
}

size_t levenshtein(const std::u32string& s, const std::u32string& t) {
    size_t begin = 0;
    size_t m = s.size();
    size_t n = t.size();

    // A common prefix does not change the distance
    while (begin < m && begin < n && s[begin] == t[begin]) {
        ++begin;
    }
    m -= begin;
    n -= begin;

    std::vector<size_t> prev(n + 1);
    std::vector<size_t> curr(n + 1);
    for (size_t j = 0; j <= n; ++j) prev[j] = j;

    for (size_t i = 0; i < m; ++i) {
        curr[0] = i + 1;
        for (size_t j = 0; j < n; ++j) {
            size_t deletion = prev[j + 1] + 1;
            size_t insertion = curr[j] + 1;
            size_t substitution = s[begin + i] == t[begin + j] ? prev[j] : prev[j] + 1;
            curr[j + 1] = std::min(std::min(deletion, insertion), substitution);
        }
        prev.swap(curr);
    }

    return prev[n];
}

double levenshtein_ratio(const std::string& a, const std::string& b) {
    std::u32string ua = decode_utf8(a);
    std::u32string ub = decode_utf8(b);
    size_t longest = std::max(ua.size(), ub.size());
    if (longest == 0) return 1.0;
    return 1.0 - static_cast<double>(levenshtein(ua, ub)) / static_cast<double>(longest);
}

size_t codepoint_to_byte_offset(const std::string& s, size_t codepoint_index) {
    size_t pos = 0;
    size_t count = 0;
    while (pos < s.size() && count < codepoint_index) {
        size_t len = sequence_length(static_cast<unsigned char>(s[pos]));
        pos += len == 0 ? 1 : len;
        ++count;
    }
    return std::min(pos, s.size());
}

size_t utf8_boundary_before(const std::string& s, size_t pos) {
    if (pos >= s.size()) return s.size();
    while (pos > 0 && (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80) {
        --pos;
    }
    return pos;
}

} // namespace text
} // namespace canon
