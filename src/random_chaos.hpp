#pragma once

#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace textseg {

// Partitions `text` into random-length chunks in order. Every code point,
// whitespace included, lands in exactly one chunk. When the text holds at
// least min_tokens * min_len code points the result has at least min_tokens
// chunks. Output depends on `rng` and must not be cached.
std::vector<std::string> random_chaos(std::string_view text, int min_len, int max_len, int min_tokens,
                                      std::mt19937_64& rng);

// Fixed chunks of ceil(length / min_tokens), clamped to [min_len, max_len]
std::vector<std::string> redistribute_chunks(std::u32string_view cps, int min_len, int max_len, int min_tokens);

} // namespace textseg
