#include "dictionary.hpp"
#include "unicode.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>

namespace textseg {

namespace {

// Reads trimmed, non-empty, non-comment lines
template <typename Fn>
bool for_each_entry(const std::string& path, Fn fn) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        // UTF-8 BOM on the first line
        if (line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);

        // Trim
        line.erase(0, line.find_first_not_of(" \t\r\n"));
        line.erase(line.find_last_not_of(" \t\r\n") + 1);

        if (line.empty() || line[0] == '#') continue;

        fn(line);
    }
    return true;
}

} // namespace

bool Dictionary::add_word(std::string_view word) {
    size_t len = codepoint_count(word);
    if (len < MIN_WORD_LENGTH || len > MAX_WORD_LENGTH) return false;

    words_[len - MIN_WORD_LENGTH].insert(std::string(word));
    if (len > max_word_length_) max_word_length_ = len;
    return true;
}

void Dictionary::add_stop_word(std::string_view word) {
    stop_words_.insert(std::string(word));
    // Multi-character stop words must be reachable by the maximum match
    add_word(word);
}

bool Dictionary::load_words(const std::string& path) {
    size_t added = 0;
    size_t skipped = 0;
    bool ok = for_each_entry(path, [&](const std::string& word) {
        if (add_word(word)) {
            added++;
        } else {
            skipped++;
        }
    });
    if (!ok) {
        std::cerr << "Error: Could not open dictionary file: " << path << std::endl;
        return false;
    }

    std::cout << "Loaded " << added << " words from " << path;
    if (skipped > 0) {
        std::cout << " (" << skipped << " skipped, length outside "
                  << MIN_WORD_LENGTH << ".." << MAX_WORD_LENGTH << ")";
    }
    std::cout << std::endl;
    return true;
}

bool Dictionary::load_stop_words(const std::string& path) {
    size_t added = 0;
    bool ok = for_each_entry(path, [&](const std::string& word) {
        add_stop_word(word);
        added++;
    });
    if (!ok) {
        std::cerr << "Error: Could not open stop word file: " << path << std::endl;
        return false;
    }
    std::cout << "Loaded " << added << " stop words from " << path << std::endl;
    return true;
}

bool Dictionary::contains(std::string_view word) const {
    return contains(word, codepoint_count(word));
}

bool Dictionary::contains_word_in(std::string_view text) const {
    std::u32string cps = to_u32(text);
    std::string candidate;
    for (size_t i = 0; i < cps.size(); ++i) {
        size_t max_len = std::min(MAX_WORD_LENGTH, cps.size() - i);
        for (size_t len = MIN_WORD_LENGTH; len <= max_len; ++len) {
            codepoints_to_utf8(cps.data(), i, i + len, candidate);
            if (contains(candidate, len)) return true;
        }
    }
    return false;
}

size_t Dictionary::word_count() const {
    size_t n = 0;
    for (const auto& bucket : words_) n += bucket.size();
    return n;
}

} // namespace textseg
