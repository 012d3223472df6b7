#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace textseg {

// Emits the smart-mode token starting at `pos` and returns the position after
// it. Whitespace is consumed without emitting anything.
size_t scan_smart_token(std::u32string_view text, size_t pos, std::vector<std::string>& out);

std::vector<std::string> smart_segment(std::string_view text);

// CJK runs kept whole, the rest split on whitespace and symbols, then by
// naming convention
std::vector<std::string> english_segment(std::string_view text, bool strip_separators = true);

std::vector<std::string> sentence_segment(std::string_view text);
std::vector<std::string> half_sentence_segment(std::string_view text);

// Fixed-width line breaking that prefers whitespace/punctuation break points.
// Concatenating the result reproduces the input.
std::vector<std::string> char_break_segment(std::string_view text, size_t limit, size_t min_fragment);

std::vector<std::string> remove_symbols_segment(std::string_view text);

} // namespace textseg
