#include "basic_modes.hpp"
#include "rules.hpp"
#include "unicode.hpp"

namespace textseg {

namespace {

template <typename Pred>
size_t run_end(std::u32string_view text, size_t pos, Pred pred) {
    while (pos < text.size() && pred(text[pos])) pos++;
    return pos;
}

// Splits on runs of separator chars; pieces are trimmed and empty ones dropped
template <typename IsSeparator>
std::vector<std::string> split_trimmed(std::string_view text, IsSeparator is_separator) {
    std::vector<std::string> result;
    std::u32string cps = to_u32(text);
    std::u32string_view view(cps);

    size_t i = 0;
    while (i < view.size()) {
        size_t end = run_end(view, i, [&](char32_t c) { return !is_separator(c); });
        std::u32string_view piece = trim(view.substr(i, end - i));
        if (!piece.empty()) result.push_back(to_utf8(piece));
        i = run_end(view, end, is_separator);
    }
    return result;
}

bool is_sentence_end(char32_t c) {
    switch (c) {
        case '\n': case '!': case '?':
        case 0x3002: // 。
        case 0xFF01: // ！
        case 0xFF1F: // ？
            return true;
        default:
            return false;
    }
}

bool is_soft_break(char32_t c) {
    return is_whitespace(c) || is_break_punctuation(c);
}

} // namespace

size_t scan_smart_token(std::u32string_view text, size_t pos, std::vector<std::string>& out) {
    char32_t c = text[pos];

    if (is_whitespace(c)) {
        return pos + 1;
    }

    size_t end = pos + 1;
    if (is_punctuation(c)) {
        // single char
    } else if (is_cjk_ideograph(c)) {
        end = run_end(text, pos, is_cjk_ideograph);
    } else if (is_digit(c)) {
        end = run_end(text, pos, is_digit);
    } else if (is_ascii_letter(c)) {
        end = run_end(text, pos, is_ascii_letter);
    }

    out.push_back(to_utf8(text.substr(pos, end - pos)));
    return end;
}

std::vector<std::string> smart_segment(std::string_view text) {
    std::vector<std::string> result;
    std::u32string cps = to_u32(text);

    size_t i = 0;
    while (i < cps.size()) {
        i = scan_smart_token(cps, i, result);
    }
    return result;
}

std::vector<std::string> english_segment(std::string_view text, bool strip_separators) {
    std::vector<std::string> result;
    std::u32string cps = to_u32(text);
    std::u32string_view view(cps);

    size_t i = 0;
    while (i < view.size()) {
        if (is_cjk_ideograph(view[i])) {
            // CJK run, whitespace removed
            size_t end = run_end(view, i, is_cjk_ideograph);
            result.push_back(to_utf8(view.substr(i, end - i)));
            i = end;
            continue;
        }

        if (is_whitespace(view[i]) || is_ascii_symbol(view[i])) {
            i++;
            continue;
        }

        size_t end = run_end(view, i, [](char32_t c) {
            return !is_whitespace(c) && !is_ascii_symbol(c) && !is_cjk_ideograph(c);
        });
        std::u32string_view word = view.substr(i, end - i);
        i = end;

        if (run_end(word, 0, is_digit) == word.size()) {
            result.push_back(to_utf8(word));
            continue;
        }

        auto parts = split_naming(word, strip_separators);
        for (auto& p : parts) result.push_back(std::move(p));
    }
    return result;
}

std::vector<std::string> sentence_segment(std::string_view text) {
    return split_trimmed(text, is_sentence_end);
}

std::vector<std::string> half_sentence_segment(std::string_view text) {
    return split_trimmed(text, is_soft_break);
}

std::vector<std::string> char_break_segment(std::string_view text, size_t limit, size_t min_fragment) {
    std::vector<std::string> result;
    if (limit == 0) limit = 100;

    std::u32string cps = to_u32(text);
    std::u32string_view remaining(cps);

    while (remaining.size() > limit) {
        size_t break_point = 0;
        for (size_t i = limit; i > 0; --i) {
            if (is_soft_break(remaining[i - 1])) {
                break_point = i;
                break;
            }
        }

        if (break_point == 0 || break_point < min_fragment) {
            // hard break
            break_point = limit;
        }
        result.push_back(to_utf8(remaining.substr(0, break_point)));
        remaining.remove_prefix(break_point);
    }

    if (!remaining.empty()) {
        result.push_back(to_utf8(remaining));
    }
    return result;
}

std::vector<std::string> remove_symbols_segment(std::string_view text) {
    std::vector<std::string> result;
    std::u32string cps = to_u32(text);
    std::u32string_view view(cps);

    size_t start = 0;
    for (size_t i = 0; i <= view.size(); ++i) {
        if (i < view.size() && !is_punctuation(view[i])) continue;

        // Drop symbols and collapse whitespace runs
        std::u32string cleaned;
        bool pending_space = false;
        for (char32_t c : view.substr(start, i - start)) {
            if (is_ascii_symbol(c)) continue;
            if (is_whitespace(c)) {
                pending_space = true;
                continue;
            }
            if (pending_space && !cleaned.empty()) cleaned.push_back(' ');
            pending_space = false;
            cleaned.push_back(c);
        }
        start = i + 1;

        // Letter runs, digit runs and the text between them
        std::u32string_view rest(cleaned);
        size_t j = 0;
        while (j < rest.size()) {
            size_t end;
            if (is_ascii_letter(rest[j])) {
                end = run_end(rest, j, is_ascii_letter);
            } else if (is_digit(rest[j])) {
                end = run_end(rest, j, is_digit);
            } else {
                end = run_end(rest, j, [](char32_t c) { return !is_ascii_letter(c) && !is_digit(c); });
            }
            std::u32string_view piece = trim(rest.substr(j, end - j));
            if (!piece.empty()) result.push_back(to_utf8(piece));
            j = end;
        }
    }
    return result;
}

} // namespace textseg
