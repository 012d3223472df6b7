#pragma once

#include <array>
#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include "robin_hood.h"

namespace textseg {

// Length-keyed word sets (2, 3 and 4 code points) plus stop words
class Dictionary {
public:
    static constexpr size_t MIN_WORD_LENGTH = 2;
    static constexpr size_t MAX_WORD_LENGTH = 4;

    Dictionary() = default;

    // Built-in technical vocabulary and stop words
    static Dictionary with_defaults();

    // Returns false when the word is outside 2..4 code points
    bool add_word(std::string_view word);
    void add_stop_word(std::string_view word);

    // One word per line, '#' starts a comment line
    bool load_words(const std::string& path);
    bool load_stop_words(const std::string& path);

    // Hot path: `len` is the word length in code points
    inline bool contains(std::string_view word, size_t len) const {
        if (len < MIN_WORD_LENGTH || len > MAX_WORD_LENGTH) return false;
        return words_[len - MIN_WORD_LENGTH].count(std::string(word)) > 0;
    }

    bool contains(std::string_view word) const;

    bool is_stop_word(std::string_view word) const {
        return stop_words_.count(std::string(word)) > 0;
    }

    // True if any dictionary word occurs in `text`
    bool contains_word_in(std::string_view text) const;

    size_t word_count() const;
    size_t stop_word_count() const { return stop_words_.size(); }
    size_t max_word_length() const { return max_word_length_; }

private:
    std::array<robin_hood::unordered_flat_set<std::string>, MAX_WORD_LENGTH - MIN_WORD_LENGTH + 1> words_;
    robin_hood::unordered_flat_set<std::string> stop_words_;
    size_t max_word_length_ = 0;
};

// Publishes an immutable dictionary snapshot. Readers take one snapshot per
// call; update() swaps the whole dictionary at once.
class DictionaryStore {
public:
    explicit DictionaryStore(Dictionary dict = Dictionary::with_defaults())
        : current_(std::make_shared<const Dictionary>(std::move(dict)))
    {
    }

    std::shared_ptr<const Dictionary> snapshot() const {
        return std::atomic_load(&current_);
    }

    void update(Dictionary dict) {
        std::atomic_store(&current_, std::shared_ptr<const Dictionary>(
            std::make_shared<const Dictionary>(std::move(dict))));
    }

private:
    std::shared_ptr<const Dictionary> current_;
};

} // namespace textseg
