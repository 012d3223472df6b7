#pragma once

#include "dictionary.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace textseg {

// Per-call filters for ChineseSegmenter::cut
struct CutOptions {
    bool remove_stop_words = true;  // drop matched dictionary stop words
    bool keep_english = true;       // ASCII letter runs
    bool keep_number = true;        // digit runs
    size_t min_length = 1;          // shorter letter/digit runs are dropped
};

class ChineseSegmenter {
public:
    explicit ChineseSegmenter(const DictionaryStore& store);

    // Forward maximum match over the length-keyed dictionary (4, 3, 2),
    // dropping matched stop words
    std::vector<std::string> segment(std::string_view text, bool use_dictionary = true, bool use_algorithm = true) const;

    // Dictionary segmentation with per-call filters. Default options give
    // the same tokens as segment(text).
    std::vector<std::string> cut(std::string_view text, const CutOptions& options = CutOptions{}) const;

    // cut() per text, all against one dictionary snapshot
    std::vector<std::vector<std::string>> cut_batch(const std::vector<std::string>& texts,
                                                    const CutOptions& options = CutOptions{}) const;

    // Most frequent multi-character words, ties in order of first appearance
    std::vector<std::pair<std::string, size_t>> extract_keywords(std::string_view text, size_t top_k = 10) const;

    // Wraps every dictionary word (longest match, left to right, stop words
    // excluded) in prefix/suffix. Other bytes are copied unchanged.
    std::string highlight(std::string_view text, std::string_view prefix = "<mark>",
                          std::string_view suffix = "</mark>") const;

private:
    const DictionaryStore& store_;

    void max_match(std::string_view text, const Dictionary& dict, bool use_dictionary,
                   const CutOptions& options, std::vector<std::string>& out) const;
};

} // namespace textseg
