#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace textseg {

enum class CodeDialect {
    BraceDelimited,     // any line with { or }
    IndentDelimited,    // block headers end in ':'
    LineBased,
};

std::string_view dialect_name(CodeDialect dialect);

// Prefix, bracket span and trailing remainder of a buffer
struct BracketSplit {
    std::string prefix;
    std::string span;
    std::string rest;
};

class CodeAnalyzer {
public:
    std::vector<std::string> analyze(std::string_view text) const;

    static CodeDialect detect_dialect(std::string_view text);

    // import / from / require / using / include followed by a dotted name
    static bool is_import_statement(std::string_view line);
    // #define, #include, #ifdef, #ifndef, #endif, #else, #if, #pragma
    static bool is_preprocessor_directive(std::string_view line);

    // Largest balanced bracket span by '(' count; nullopt when no span has one
    static std::optional<BracketSplit> extract_max_bracket(std::u32string_view text);

private:
    std::vector<std::string> analyze_indented(const std::vector<std::u32string>& lines) const;
    std::vector<std::string> analyze_braced(const std::vector<std::u32string>& lines) const;
};

} // namespace textseg
