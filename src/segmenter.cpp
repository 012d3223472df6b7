#include "segmenter.hpp"
#include "basic_modes.hpp"
#include "random_chaos.hpp"
#include "unicode.hpp"
#include <random>

namespace textseg {

namespace {

// Per-thread engine for unseeded calls
std::mt19937_64& thread_rng() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return rng;
}

} // namespace

Segmenter::Segmenter(const DictionaryStore& store, std::shared_ptr<CompletionClient> ai_client)
    : chinese_(store), ai_(std::move(ai_client))
{
}

std::vector<std::string> Segmenter::segment(std::string_view text, Mode mode, const SegmentOptions& options) const {
    if (is_blank(text)) {
        return {};
    }

    switch (mode) {
        case Mode::Smart:
            return smart_segment(text);
        case Mode::Chinese:
            return chinese_.segment(text, options.use_dictionary(), options.use_algorithm());
        case Mode::English:
            return english_segment(text, options.naming_strip_separators());
        case Mode::Code:
            return code_.analyze(text);
        case Mode::Ai:
            return ai_.segment(text, options);
        case Mode::Sentence:
            return sentence_segment(text);
        case Mode::HalfSentence:
            return half_sentence_segment(text);
        case Mode::CharBreak:
            return char_break_segment(text, options.line_char_limit(), options.char_break_min_fragment());
        case Mode::RemoveSymbols:
            return remove_symbols_segment(text);
        case Mode::Random: {
            if (auto seed = options.random_seed()) {
                std::mt19937_64 seeded(*seed);
                return random_chaos(text, options.random_min_length(), options.random_max_length(),
                                    options.chaos_min_tokens(), seeded);
            }
            return random_chaos(text, options.random_min_length(), options.random_max_length(),
                                options.chaos_min_tokens(), thread_rng());
        }
        case Mode::Multi:
            return compose(text, options.rules(), options).tokens;
    }
    return smart_segment(text);
}

std::vector<std::string> Segmenter::segment(std::string_view text, std::string_view mode, const SegmentOptions& options) const {
    return segment(text, parse_mode(mode), options);
}

CompositionResult Segmenter::compose(std::string_view text, RuleSet rules, const SegmentOptions& options) const {
    return composer_.compose(text, rules, options.naming_strip_separators());
}

} // namespace textseg
