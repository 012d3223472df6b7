#include "chinese_segmenter.hpp"
#include "basic_modes.hpp"
#include "unicode.hpp"
#include <algorithm>

namespace textseg {

ChineseSegmenter::ChineseSegmenter(const DictionaryStore& store) : store_(store) {}

namespace {

bool keep_scanned_token(const std::string& token, const CutOptions& options) {
    auto [first, len] = get_char_at(token, 0);
    if (len == 0) return true;
    if (is_ascii_letter(first)) {
        return options.keep_english && codepoint_count(token) >= options.min_length;
    }
    if (is_digit(first)) {
        return options.keep_number && codepoint_count(token) >= options.min_length;
    }
    return true;
}

} // namespace

void ChineseSegmenter::max_match(std::string_view text, const Dictionary& dict, bool use_dictionary,
                                 const CutOptions& options, std::vector<std::string>& out) const {
    std::u32string cps = to_u32(text);
    const size_t n = cps.size();
    std::string candidate;
    candidate.reserve(16);
    std::vector<std::string> scanned;

    size_t i = 0;
    while (i < n) {
        if (!is_cjk_ideograph(cps[i])) {
            scanned.clear();
            i = scan_smart_token(cps, i, scanned);
            for (auto& token : scanned) {
                if (keep_scanned_token(token, options)) out.push_back(std::move(token));
            }
            continue;
        }

        size_t matched_len = 0;
        if (use_dictionary) {
            size_t max_len = std::min(Dictionary::MAX_WORD_LENGTH, n - i);
            for (size_t len = max_len; len >= Dictionary::MIN_WORD_LENGTH; --len) {
                codepoints_to_utf8(cps.data(), i, i + len, candidate);
                if (dict.contains(candidate, len)) {
                    matched_len = len;
                    break;
                }
            }
        }

        if (matched_len > 0) {
            if (!options.remove_stop_words || !dict.is_stop_word(candidate)) {
                out.push_back(candidate);
            }
            i += matched_len;
        } else {
            // Single ideographs are never stop-word filtered
            codepoints_to_utf8(cps.data(), i, i + 1, candidate);
            out.push_back(candidate);
            i++;
        }
    }
}

std::vector<std::string> ChineseSegmenter::segment(std::string_view text, bool use_dictionary, bool use_algorithm) const {
    std::vector<std::string> result;
    if (is_blank(text)) return result;

    if (!use_dictionary && !use_algorithm) {
        result.emplace_back(text);
        return result;
    }

    // One snapshot for the whole call
    std::shared_ptr<const Dictionary> dict = store_.snapshot();
    max_match(text, *dict, use_dictionary, CutOptions{}, result);
    return result;
}

std::vector<std::string> ChineseSegmenter::cut(std::string_view text, const CutOptions& options) const {
    std::vector<std::string> result;
    if (is_blank(text)) return result;

    std::shared_ptr<const Dictionary> dict = store_.snapshot();
    max_match(text, *dict, true, options, result);
    return result;
}

std::vector<std::vector<std::string>> ChineseSegmenter::cut_batch(const std::vector<std::string>& texts,
                                                                  const CutOptions& options) const {
    std::vector<std::vector<std::string>> results;
    results.reserve(texts.size());

    std::shared_ptr<const Dictionary> dict = store_.snapshot();
    for (const auto& text : texts) {
        results.emplace_back();
        if (!is_blank(text)) max_match(text, *dict, true, options, results.back());
    }
    return results;
}

std::vector<std::pair<std::string, size_t>> ChineseSegmenter::extract_keywords(std::string_view text, size_t top_k) const {
    std::vector<std::pair<std::string, size_t>> counts;
    robin_hood::unordered_flat_map<std::string, size_t> index;

    for (const auto& word : segment(text)) {
        if (codepoint_count(word) < 2) continue;
        auto it = index.find(word);
        if (it == index.end()) {
            index[word] = counts.size();
            counts.emplace_back(word, 1);
        } else {
            counts[it->second].second++;
        }
    }

    std::stable_sort(counts.begin(), counts.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (counts.size() > top_k) counts.resize(top_k);
    return counts;
}

std::string ChineseSegmenter::highlight(std::string_view text, std::string_view prefix,
                                        std::string_view suffix) const {
    std::string out;
    if (text.empty()) return out;

    std::shared_ptr<const Dictionary> dict = store_.snapshot();

    // Byte offset of every code point; an invalid byte is its own unit
    std::vector<size_t> offsets;
    std::vector<char32_t> cps;
    size_t pos = 0;
    while (pos < text.size()) {
        auto [cp, len] = get_char_at(text, pos);
        offsets.push_back(pos);
        cps.push_back(len == 0 ? 0 : cp);
        pos += len == 0 ? 1 : static_cast<size_t>(len);
    }
    offsets.push_back(text.size());

    const size_t n = cps.size();
    out.reserve(text.size() + 32);

    size_t i = 0;
    while (i < n) {
        size_t matched_len = 0;
        if (is_cjk_ideograph(cps[i])) {
            size_t max_len = std::min(Dictionary::MAX_WORD_LENGTH, n - i);
            for (size_t len = max_len; len >= Dictionary::MIN_WORD_LENGTH; --len) {
                std::string_view word = text.substr(offsets[i], offsets[i + len] - offsets[i]);
                if (dict->contains(word, len) && !dict->is_stop_word(word)) {
                    matched_len = len;
                    break;
                }
            }
        }

        size_t step = matched_len > 0 ? matched_len : 1;
        std::string_view piece = text.substr(offsets[i], offsets[i + step] - offsets[i]);
        if (matched_len > 0) {
            out.append(prefix);
            out.append(piece);
            out.append(suffix);
        } else {
            out.append(piece);
        }
        i += step;
    }
    return out;
}

} // namespace textseg
