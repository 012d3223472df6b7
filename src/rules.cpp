#include "rules.hpp"
#include "unicode.hpp"
#include <iostream>

namespace textseg {

size_t RuleSet::size() const {
    size_t n = 0;
    for (uint32_t b = bits_; b != 0; b &= b - 1) n++;
    return n;
}

std::vector<RuleId> RuleSet::to_vector() const {
    std::vector<RuleId> ids;
    for (size_t i = 0; i < kRuleCount; ++i) {
        RuleId id = static_cast<RuleId>(i);
        if (contains(id)) ids.push_back(id);
    }
    return ids;
}

std::string_view rule_key(RuleId id) {
    return rule_descriptor(id).key;
}

std::optional<RuleId> parse_rule(std::string_view key) {
    for (const auto& desc : kRuleTable) {
        if (desc.key == key) return desc.id;
    }
    return std::nullopt;
}

RuleSet parse_rule_list(std::string_view keys) {
    RuleSet rules;
    size_t start = 0;
    while (start <= keys.size()) {
        size_t comma = keys.find(',', start);
        if (comma == std::string_view::npos) comma = keys.size();
        std::string key = trim_utf8(keys.substr(start, comma - start));
        if (!key.empty()) {
            if (auto id = parse_rule(key)) {
                rules.insert(*id);
            } else {
                std::cerr << "Warning: unknown rule '" << key << "' ignored" << std::endl;
            }
        }
        start = comma + 1;
    }
    return rules;
}

namespace {

// Appends a non-empty codepoint range as a UTF-8 element
void push_range(std::vector<std::string>& out, std::u32string_view cps) {
    if (!cps.empty()) out.push_back(to_utf8(cps));
}

// Splits into runs of chars sharing a class; every run is kept
template <typename Classify>
void split_runs(std::u32string_view text, Classify classify, std::vector<std::string>& out) {
    size_t i = 0;
    while (i < text.size()) {
        int cls = classify(text[i]);
        size_t j = i + 1;
        while (j < text.size() && classify(text[j]) == cls) j++;
        push_range(out, text.substr(i, j - i));
        i = j;
    }
}

template <typename Drop>
std::vector<std::string> remove_chars(const std::vector<std::string>& input, Drop drop) {
    std::vector<std::string> out;
    out.reserve(input.size());
    for (const auto& element : input) {
        std::string kept;
        kept.reserve(element.size());
        size_t i = 0;
        while (i < element.size()) {
            auto [cp, len] = get_char_at(element, i);
            if (len == 0) { i++; continue; }
            if (!drop(cp)) kept.append(element, i, len);
            i += len;
        }
        if (!kept.empty()) out.push_back(std::move(kept));
    }
    return out;
}

bool is_pair_opener(char32_t c) {
    switch (c) {
        case '(': case '[': case '{': case '<':
        case '"': case '\'': case '`':
        case 0x00AB: // «
            return true;
        default:
            return false;
    }
}

} // namespace

std::vector<std::string> apply_symbol_split(const std::vector<std::string>& input) {
    std::vector<std::string> out;
    for (const auto& element : input) {
        std::u32string text = to_u32(element);
        std::u32string buffer;
        // true while the buffer holds only openers kept for the following text
        bool prefix_only = false;

        for (size_t i = 0; i < text.size(); ++i) {
            char32_t c = text[i];
            if (!is_pair_opener(c)) {
                buffer.push_back(c);
                prefix_only = false;
                continue;
            }

            bool nested = i + 1 < text.size() && is_pair_opener(text[i + 1]);
            if (prefix_only) {
                buffer.push_back(c);
                continue;
            }
            push_range(out, buffer);
            buffer.clear();
            if (nested) {
                buffer.push_back(c);
                prefix_only = true;
            } else {
                out.push_back(to_utf8(std::u32string(1, c)));
            }
        }
        push_range(out, buffer);
    }
    return out;
}

std::vector<std::string> apply_whitespace_split(const std::vector<std::string>& input) {
    std::vector<std::string> out;
    for (const auto& element : input) {
        std::u32string text = to_u32(element);
        split_runs(text, [](char32_t c) { return is_whitespace(c) ? 1 : 0; }, out);
    }
    return out;
}

std::vector<std::string> apply_newline_split(const std::vector<std::string>& input) {
    std::vector<std::string> out;
    for (const auto& element : input) {
        size_t start = 0;
        size_t i = 0;
        while (i < element.size()) {
            char c = element[i];
            if (c != '\n' && c != '\r') { i++; continue; }
            size_t nl_len = (c == '\r' && i + 1 < element.size() && element[i + 1] == '\n') ? 2 : 1;
            if (i > start) out.push_back(element.substr(start, i - start));
            out.push_back(element.substr(i, nl_len));
            i += nl_len;
            start = i;
        }
        if (start < element.size()) out.push_back(element.substr(start));
    }
    return out;
}

std::vector<std::string> apply_chinese_english_split(const std::vector<std::string>& input) {
    std::vector<std::string> out;
    for (const auto& element : input) {
        std::u32string text = to_u32(element);
        split_runs(text, [](char32_t c) {
            if (is_cjk_ideograph(c)) return 1;
            if (is_ascii_letter(c)) return 2;
            return 0;
        }, out);
    }
    return out;
}

std::vector<std::string> apply_uppercase_split(const std::vector<std::string>& input) {
    std::vector<std::string> out;
    for (const auto& element : input) {
        std::u32string text = to_u32(element);
        size_t start = 0;
        for (size_t i = 1; i < text.size(); ++i) {
            if (is_ascii_upper(text[i])) {
                push_range(out, std::u32string_view(text).substr(start, i - start));
                start = i;
            }
        }
        push_range(out, std::u32string_view(text).substr(start));
    }
    return out;
}

std::vector<std::string> split_naming(std::u32string_view word, bool strip_separators) {
    std::vector<std::string> result;
    std::u32string buffer;
    bool word_start = true;

    auto flush = [&]() {
        push_range(result, buffer);
        buffer.clear();
    };

    for (size_t i = 0; i < word.size(); ++i) {
        char32_t c = word[i];

        if (is_whitespace(c)) {
            flush();
            word_start = true;
            continue;
        }

        if (c == '_' || c == '-') {
            if (!strip_separators) buffer.push_back(c);
            flush();
            word_start = true;
            continue;
        }

        if (is_ascii_upper(c)) {
            size_t run = 1;
            while (i + run < word.size() && is_ascii_upper(word[i + run])) run++;

            if (run >= 2) {
                bool lower_follows = i + run < word.size() && is_ascii_lower(word[i + run]);
                if (word_start) {
                    // Leading acronym stays with the word it prefixes: XMLHttp, HTTPSConnection
                    buffer.append(word.substr(i, run));
                } else {
                    flush();
                    if (lower_follows) {
                        push_range(result, word.substr(i, run - 1));
                        buffer.push_back(word[i + run - 1]);
                    } else {
                        buffer.append(word.substr(i, run));
                    }
                }
                i += run - 1;
                word_start = false;
                continue;
            }

            // camelCase boundary
            if (!buffer.empty() && is_ascii_lower(buffer.back())) {
                flush();
            }
        }

        buffer.push_back(c);
        word_start = false;
    }

    flush();
    return result;
}

std::vector<std::string> apply_naming_split(const std::vector<std::string>& input, bool strip_separators) {
    std::vector<std::string> out;
    for (const auto& element : input) {
        std::u32string text = to_u32(element);
        auto parts = split_naming(text, strip_separators);
        for (auto& p : parts) out.push_back(std::move(p));
    }
    return out;
}

std::vector<std::string> apply_digit_split(const std::vector<std::string>& input) {
    std::vector<std::string> out;
    for (const auto& element : input) {
        std::u32string text = to_u32(element);
        split_runs(text, [](char32_t c) { return is_digit(c) ? 1 : 0; }, out);
    }
    return out;
}

std::vector<std::string> apply_remove_whitespace(const std::vector<std::string>& input) {
    return remove_chars(input, [](char32_t c) { return is_whitespace(c); });
}

std::vector<std::string> apply_remove_symbols(const std::vector<std::string>& input) {
    return remove_chars(input, [](char32_t c) {
        return !is_word_char(c) && !is_whitespace(c) && !is_cjk_ideograph(c);
    });
}

std::vector<std::string> apply_remove_chinese(const std::vector<std::string>& input) {
    return remove_chars(input, [](char32_t c) { return is_cjk_ideograph(c); });
}

std::vector<std::string> apply_remove_english(const std::vector<std::string>& input) {
    return remove_chars(input, [](char32_t c) { return is_ascii_letter(c); });
}

std::vector<std::string> apply_remove_digits(const std::vector<std::string>& input) {
    return remove_chars(input, [](char32_t c) { return is_digit(c); });
}

std::vector<std::string> apply_rule(RuleId id, const std::vector<std::string>& input, bool naming_strip_separators) {
    switch (id) {
        case RuleId::SymbolSplit:         return apply_symbol_split(input);
        case RuleId::WhitespaceSplit:     return apply_whitespace_split(input);
        case RuleId::NewlineSplit:        return apply_newline_split(input);
        case RuleId::ChineseEnglishSplit: return apply_chinese_english_split(input);
        case RuleId::UppercaseSplit:      return apply_uppercase_split(input);
        case RuleId::NamingSplit:         return apply_naming_split(input, naming_strip_separators);
        case RuleId::DigitSplit:          return apply_digit_split(input);
        case RuleId::RemoveWhitespace:    return apply_remove_whitespace(input);
        case RuleId::RemoveSymbols:       return apply_remove_symbols(input);
        case RuleId::RemoveChinese:       return apply_remove_chinese(input);
        case RuleId::RemoveEnglish:       return apply_remove_english(input);
        case RuleId::RemoveDigits:        return apply_remove_digits(input);
    }
    return input;
}

} // namespace textseg
