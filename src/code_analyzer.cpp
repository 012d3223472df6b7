#include "code_analyzer.hpp"
#include "unicode.hpp"
#include <algorithm>
#include <array>

namespace textseg {

namespace {

struct BracketPair {
    char32_t open;
    char32_t close;
    bool nested;
};

// Lookup order matters: the first pair whose opener matches is used
constexpr std::array<BracketPair, 8> kPairs{{
    {'(', ')', true},
    {'"', '"', false},
    {'\'', '\'', false},
    {'{', '}', true},
    {'[', ']', true},
    {'<', '>', true},
    {'`', '`', false},
    {0x00AB, 0x00BB, true},  // « »
}};

const BracketPair* find_opener(char32_t c) {
    for (const auto& p : kPairs) {
        if (p.open == c) return &p;
    }
    return nullptr;
}

bool is_closer(char32_t c) {
    for (const auto& p : kPairs) {
        if (p.nested && p.close == c) return true;
    }
    return false;
}

// Mismatched closers are ignored; only unclosed nesting openers fail
bool is_complete_bracket_pair(std::u32string_view text) {
    std::vector<char32_t> expected;
    for (char32_t c : text) {
        if (const BracketPair* p = find_opener(c)) {
            if (p->nested) expected.push_back(p->close);
        } else if (is_closer(c) && !expected.empty() && expected.back() == c) {
            expected.pop_back();
        }
    }
    return expected.empty();
}

// Non-blank pieces between runs of \r and \n
std::vector<std::u32string> split_lines(std::string_view text) {
    std::vector<std::u32string> lines;
    std::u32string cps = to_u32(text);
    size_t start = 0;
    for (size_t i = 0; i <= cps.size(); ++i) {
        if (i < cps.size() && cps[i] != '\n' && cps[i] != '\r') continue;
        if (i > start) {
            std::u32string line = cps.substr(start, i - start);
            if (!is_blank(line)) lines.push_back(std::move(line));
        }
        start = i + 1;
    }
    return lines;
}

size_t indent_width(std::u32string_view line) {
    size_t w = 0;
    while (w < line.size() && is_whitespace(line[w])) w++;
    return w;
}

bool ends_with_colon(std::u32string_view trimmed) {
    return !trimmed.empty() && trimmed.back() == ':';
}

// Ends in ':' but not '::'
bool is_block_header(std::u32string_view trimmed) {
    if (!ends_with_colon(trimmed)) return false;
    return trimmed.size() < 2 || trimmed[trimmed.size() - 2] != ':';
}

bool starts_with_keyword(std::u32string_view text, size_t pos, std::string_view keyword) {
    if (pos + keyword.size() > text.size()) return false;
    for (size_t k = 0; k < keyword.size(); ++k) {
        if (text[pos + k] != static_cast<char32_t>(keyword[k])) return false;
    }
    return true;
}

bool is_import_line(std::u32string_view line) {
    static constexpr std::array<std::string_view, 5> kKeywords{"import", "from", "require", "using", "include"};

    size_t i = indent_width(line);
    for (std::string_view kw : kKeywords) {
        if (!starts_with_keyword(line, i, kw)) continue;
        size_t j = i + kw.size();
        size_t ws = j;
        while (ws < line.size() && is_whitespace(line[ws])) ws++;
        if (ws == j || ws >= line.size()) continue;
        char32_t c = line[ws];
        if (is_word_char(c) || c == '.') return true;
    }
    return false;
}

bool is_preprocessor_line(std::u32string_view line) {
    static constexpr std::array<std::string_view, 8> kDirectives{
        "define", "include", "ifdef", "ifndef", "endif", "else", "if", "pragma"};

    size_t i = indent_width(line);
    if (i >= line.size() || line[i] != '#') return false;
    i++;
    while (i < line.size() && is_whitespace(line[i])) i++;

    size_t end = i;
    while (end < line.size() && is_word_char(line[end])) end++;
    std::string directive = to_utf8(line.substr(i, end - i));
    return std::find(kDirectives.begin(), kDirectives.end(), directive) != kDirectives.end();
}

void push_trimmed(std::vector<std::string>& out, std::u32string_view text) {
    std::u32string_view t = trim(text);
    if (!t.empty()) out.push_back(to_utf8(t));
}

} // namespace

std::string_view dialect_name(CodeDialect dialect) {
    switch (dialect) {
        case CodeDialect::BraceDelimited:  return "brace";
        case CodeDialect::IndentDelimited: return "indent";
        case CodeDialect::LineBased:       return "line";
    }
    return "line";
}

bool CodeAnalyzer::is_import_statement(std::string_view line) {
    return is_import_line(to_u32(line));
}

bool CodeAnalyzer::is_preprocessor_directive(std::string_view line) {
    return is_preprocessor_line(to_u32(line));
}

CodeDialect CodeAnalyzer::detect_dialect(std::string_view text) {
    auto lines = split_lines(text);

    for (const auto& line : lines) {
        if (line.find(U'{') != std::u32string::npos || line.find(U'}') != std::u32string::npos) {
            return CodeDialect::BraceDelimited;
        }
    }
    for (const auto& line : lines) {
        if (is_block_header(trim(line))) {
            return CodeDialect::IndentDelimited;
        }
    }
    return CodeDialect::LineBased;
}

std::optional<BracketSplit> CodeAnalyzer::extract_max_bracket(std::u32string_view text) {
    size_t best_start = 0;
    size_t best_end = 0;
    size_t max_parens = 0;

    for (size_t i = 0; i < text.size(); ++i) {
        const BracketPair* pair = find_opener(text[i]);
        if (!pair) continue;

        size_t depth = 0;
        for (size_t j = i + 1; j < text.size(); ++j) {
            char32_t c = text[j];
            if (pair->nested && c == pair->open) {
                depth++;
            } else if (c == pair->close) {
                if (depth > 0) {
                    depth--;
                    continue;
                }
                std::u32string_view candidate = text.substr(i, j + 1 - i);
                if (is_complete_bracket_pair(candidate)) {
                    size_t parens = static_cast<size_t>(std::count(candidate.begin(), candidate.end(), U'('));
                    // strictly greater: the earliest span wins ties
                    if (parens > max_parens) {
                        max_parens = parens;
                        best_start = i;
                        best_end = j + 1;
                    }
                }
                break;
            }
        }
    }

    if (max_parens == 0) return std::nullopt;

    BracketSplit split;
    split.prefix = to_utf8(trim(text.substr(0, best_start)));
    split.span = to_utf8(trim(text.substr(best_start, best_end - best_start)));
    split.rest = to_utf8(trim(text.substr(best_end)));
    return split;
}

std::vector<std::string> CodeAnalyzer::analyze(std::string_view text) const {
    if (is_blank(text)) return {};

    auto lines = split_lines(text);
    switch (detect_dialect(text)) {
        case CodeDialect::BraceDelimited:
            return analyze_braced(lines);
        case CodeDialect::IndentDelimited:
            return analyze_indented(lines);
        case CodeDialect::LineBased:
            break;
    }

    std::vector<std::string> result;
    for (const auto& line : lines) push_trimmed(result, line);
    return result;
}

std::vector<std::string> CodeAnalyzer::analyze_indented(const std::vector<std::u32string>& lines) const {
    std::vector<std::string> result;
    std::vector<size_t> indent_stack{0};
    std::u32string block;
    size_t block_indent = 0;

    auto flush = [&]() {
        push_trimmed(result, block);
        block.clear();
    };

    for (size_t idx = 0; idx < lines.size(); ++idx) {
        std::u32string_view line = trim_end(lines[idx]);
        std::u32string_view trimmed = trim(line);
        size_t indent = indent_width(line);

        if (is_import_line(line)) {
            flush();
            push_trimmed(result, trimmed);
            block_indent = indent;
            continue;
        }

        if (indent < indent_stack.back()) {
            while (indent_stack.size() > 1 && indent < indent_stack.back()) {
                indent_stack.pop_back();
            }
            if (!block.empty() && block_indent >= indent_stack.back()) {
                flush();
            }
            block_indent = indent;
        } else if (indent > indent_stack.back()) {
            indent_stack.push_back(indent);
            block_indent = indent;
        }

        if (is_block_header(trimmed)) {
            flush();
            block.assign(trimmed);
            block_indent = indent;
            if (indent_stack.back() < indent) {
                indent_stack.push_back(indent);
            }
            continue;
        }

        if (!block.empty()) {
            block.push_back(' ');
            block.append(trimmed);
        } else {
            block.assign(trimmed);
            block_indent = indent;
        }

        // Look ahead: a shallower or equal line that is not a header closes the block
        if (idx + 1 < lines.size()) {
            std::u32string_view next = lines[idx + 1];
            if (indent_width(next) <= block_indent && !ends_with_colon(trim(next))) {
                flush();
            }
        }
    }
    flush();

    if (result.empty()) {
        for (const auto& line : lines) push_trimmed(result, line);
    }
    return result;
}

std::vector<std::string> CodeAnalyzer::analyze_braced(const std::vector<std::u32string>& lines) const {
    std::vector<std::string> result;
    std::u32string chunk;
    size_t brace_depth = 0;
    size_t paren_depth = 0;

    auto emit_chunk = [&]() {
        auto split = extract_max_bracket(chunk);
        if (split && !split->prefix.empty() && !split->span.empty()) {
            result.push_back(std::move(split->prefix));
            result.push_back(std::move(split->span));
            if (!split->rest.empty()) result.push_back(std::move(split->rest));
        } else {
            push_trimmed(result, chunk);
        }
        chunk.clear();
    };

    for (const auto& raw : lines) {
        std::u32string_view line = trim(raw);

        // Directives and imports stand alone and skip depth tracking
        if (is_preprocessor_line(line) || is_import_line(line)) {
            push_trimmed(result, chunk);
            chunk.clear();
            result.push_back(to_utf8(line));
            continue;
        }

        for (char32_t c : line) {
            if (c == '{') brace_depth++;
            else if (c == '}') brace_depth = brace_depth > 0 ? brace_depth - 1 : 0;
            else if (c == '(') paren_depth++;
            else if (c == ')') paren_depth = paren_depth > 0 ? paren_depth - 1 : 0;
        }

        if (!chunk.empty()) chunk.push_back(' ');
        chunk.append(line);

        if (brace_depth == 0 && paren_depth == 0) {
            emit_chunk();
        }
    }

    if (!is_blank(chunk)) emit_chunk();

    if (result.empty()) {
        for (const auto& line : lines) push_trimmed(result, line);
    }
    return result;
}

} // namespace textseg
