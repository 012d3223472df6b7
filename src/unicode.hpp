#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace textseg {

// CJK Unified Ideographs and Extension A
constexpr char32_t CJK_START = 0x4E00;
constexpr char32_t CJK_END = 0x9FFF;
constexpr char32_t CJK_EXT_A_START = 0x3400;
constexpr char32_t CJK_EXT_A_END = 0x4DBF;

inline bool is_cjk_ideograph(char32_t c) {
    return (c >= CJK_START && c <= CJK_END) || (c >= CJK_EXT_A_START && c <= CJK_EXT_A_END);
}

inline bool is_ascii_letter(char32_t c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

inline bool is_ascii_upper(char32_t c) {
    return c >= 'A' && c <= 'Z';
}

inline bool is_ascii_lower(char32_t c) {
    return c >= 'a' && c <= 'z';
}

inline bool is_digit(char32_t c) {
    return c >= '0' && c <= '9';
}

// [A-Za-z0-9_]
inline bool is_word_char(char32_t c) {
    return is_ascii_letter(c) || is_digit(c) || c == '_';
}

// Same membership as the ECMAScript \s class
inline bool is_whitespace(char32_t c) {
    switch (c) {
        case ' ': case '\t': case '\n': case '\v': case '\f': case '\r':
        case 0x00A0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F:
        case 0x3000: case 0xFEFF:
            return true;
        default:
            return c >= 0x2000 && c <= 0x200A;
    }
}

// Punctuation that always forms its own token (smart mode) or acts as a
// break point (halfSentence, charBreak, removeSymbols).
inline bool is_punctuation(char32_t c) {
    switch (c) {
        case 0xFF0C: // ，
        case 0x3002: // 。
        case 0xFF01: // ！
        case 0xFF1F: // ？
        case 0xFF1B: // ；
        case 0xFF1A: // ：
        case 0xFF08: // （
        case 0xFF09: // ）
        case 0x3010: // 【
        case 0x3011: // 】
        case 0x300A: // 《
        case 0x300B: // 》
        case 0x300C: // 「
        case 0x300D: // 」
        case 0x300E: // 『
        case 0x300F: // 』
        case 0x201C: // “
        case 0x201D: // ”
        case 0x2018: // ‘
        case 0x2019: // ’
        case 0x2013: // –
        case 0x2014: // —
        case '"': case '\'': case '<': case '>':
        case ',': case '.': case '!': case '?': case ';': case ':':
        case '(': case ')': case '[': case ']': case '{': case '}': case '-':
            return true;
        default:
            return false;
    }
}

// Punctuation break set without the full stop, so "3.14" and "a.b" stay whole
inline bool is_break_punctuation(char32_t c) {
    return c != '.' && is_punctuation(c);
}

// ASCII symbol class removed by the english and removeSymbols modes
inline bool is_ascii_symbol(char32_t c) {
    switch (c) {
        case ',': case '.': case '!': case '?': case ';': case ':':
        case '\'': case '"': case '(': case ')': case '[': case ']':
        case '{': case '}': case '-':
        case 0x2013: // –
        case 0x2014: // —
            return true;
        default:
            return false;
    }
}

inline bool is_continuation_byte(std::string_view text, size_t index) {
    return (static_cast<unsigned char>(text[index]) & 0xC0) == 0x80;
}

// UTF-8 Helper: Get code point and length from string at index.
// Returns {0, 0} for a byte that does not start a well-formed sequence;
// callers skip that single byte.
inline std::pair<char32_t, int> get_char_at(std::string_view text, size_t index) {
    if (index >= text.length()) return {0, 0};

    unsigned char c = static_cast<unsigned char>(text[index]);
    if (c < 0x80) return {c, 1};

    int len = 0;
    char32_t cp = 0;
    if ((c & 0xE0) == 0xC0) {
        len = 2;
        cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
        len = 3;
        cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
        len = 4;
        cp = c & 0x07;
    } else {
        return {0, 0}; // Stray continuation byte or invalid lead
    }

    if (index + len > text.length()) return {0, 0};
    for (int k = 1; k < len; ++k) {
        if (!is_continuation_byte(text, index + k)) return {0, 0};
        cp = (cp << 6) | (static_cast<unsigned char>(text[index + k]) & 0x3F);
    }
    return {cp, len};
}

inline void append_utf8(std::string& out, char32_t c) {
    if (c <= 0x7F) {
        out.push_back(static_cast<char>(c));
    } else if (c <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((c >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((c >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c <= 0x10FFFF) {
        out.push_back(static_cast<char>(0xF0 | ((c >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
}

// Helper: UTF-8 to UTF-32
inline std::u32string to_u32(std::string_view utf8) {
    std::u32string utf32;
    utf32.reserve(utf8.size()); // Optimistic reserve
    size_t i = 0;
    while (i < utf8.length()) {
        auto [c, len] = get_char_at(utf8, i);
        if (len == 0) { i++; continue; } // Skip invalid
        utf32.push_back(c);
        i += len;
    }
    return utf32;
}

// Helper: UTF-32 to UTF-8
inline std::string to_utf8(std::u32string_view utf32) {
    std::string utf8;
    utf8.reserve(utf32.size() * 3); // Average for CJK
    for (char32_t c : utf32) {
        append_utf8(utf8, c);
    }
    return utf8;
}

// Codepoint range to UTF-8, reusing the caller's buffer
inline void codepoints_to_utf8(const char32_t* cps, size_t start, size_t end, std::string& out) {
    out.clear();
    for (size_t i = start; i < end; ++i) {
        append_utf8(out, cps[i]);
    }
}

inline size_t codepoint_count(std::string_view s) {
    size_t count = 0;
    size_t i = 0;
    while (i < s.length()) {
        auto [cp, len] = get_char_at(s, i);
        if (len == 0) { i++; continue; }
        count++;
        i += len;
    }
    return count;
}

inline bool is_blank(std::u32string_view s) {
    for (char32_t c : s) {
        if (!is_whitespace(c)) return false;
    }
    return true;
}

inline bool is_blank(std::string_view s) {
    return is_blank(to_u32(s));
}

inline std::u32string_view trim(std::u32string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_whitespace(s[b])) b++;
    while (e > b && is_whitespace(s[e - 1])) e--;
    return s.substr(b, e - b);
}

inline std::u32string_view trim_end(std::u32string_view s) {
    size_t e = s.size();
    while (e > 0 && is_whitespace(s[e - 1])) e--;
    return s.substr(0, e);
}

inline std::string trim_utf8(std::string_view s) {
    std::u32string u = to_u32(s);
    return to_utf8(trim(u));
}

} // namespace textseg
