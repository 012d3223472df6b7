#include "random_chaos.hpp"
#include "unicode.hpp"
#include <algorithm>

namespace textseg {

std::vector<std::string> redistribute_chunks(std::u32string_view cps, int min_len, int max_len, int min_tokens) {
    std::vector<std::string> result;
    const size_t n = cps.size();
    size_t target = (n + static_cast<size_t>(min_tokens) - 1) / static_cast<size_t>(min_tokens);
    size_t chunk = std::max(static_cast<size_t>(min_len), std::min(static_cast<size_t>(max_len), target));
    if (chunk == 0) chunk = 1;

    for (size_t i = 0; i < n; i += chunk) {
        result.push_back(to_utf8(cps.substr(i, chunk)));
    }
    return result;
}

std::vector<std::string> random_chaos(std::string_view text, int min_len, int max_len, int min_tokens,
                                      std::mt19937_64& rng) {
    std::vector<std::string> result;
    if (is_blank(text)) return result;

    // Normalise knobs
    min_len = std::max(1, min_len);
    max_len = std::max(min_len, max_len);
    min_tokens = std::max(1, min_tokens);

    std::u32string cps = to_u32(text);
    std::u32string_view view(cps);
    const size_t n = cps.size();
    const size_t lo = static_cast<size_t>(min_len);
    const size_t current_max = std::min(static_cast<size_t>(max_len), n);

    size_t i = 0;
    while (i < n) {
        size_t remaining = n - i;
        size_t available_max = std::min(current_max, remaining);

        // Leave room for the tokens still owed
        size_t needed = result.size() < static_cast<size_t>(min_tokens)
                            ? static_cast<size_t>(min_tokens) - result.size()
                            : 1;
        size_t max_allowed = remaining / needed;
        size_t actual_max = std::min(available_max, std::max(lo, max_allowed));

        size_t length = lo;
        if (actual_max > lo) {
            std::uniform_int_distribution<size_t> dist(lo, actual_max);
            length = dist(rng);
        }
        length = std::min(length, remaining);

        result.push_back(to_utf8(view.substr(i, length)));
        i += length;
    }

    if (result.size() < static_cast<size_t>(min_tokens) && n >= static_cast<size_t>(min_tokens) * lo) {
        return redistribute_chunks(view, min_len, max_len, min_tokens);
    }
    return result;
}

} // namespace textseg
