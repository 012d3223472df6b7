#pragma once

#include "rules.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace textseg {

enum class Mode : uint8_t {
    Smart,
    Chinese,
    English,
    Code,
    Ai,
    Sentence,
    HalfSentence,
    CharBreak,
    RemoveSymbols,
    Random,
    Multi,
};

// Unknown identifiers map to Mode::Smart
Mode parse_mode(std::string_view name);
std::string_view mode_name(Mode mode);

// Immutable per-call configuration. Build with SegmentOptions::Builder.
class SegmentOptions {
public:
    class Builder;

    SegmentOptions() = default;

    int random_min_length() const { return random_min_length_; }
    int random_max_length() const { return random_max_length_; }
    int chaos_min_tokens() const { return chaos_min_tokens_; }
    bool naming_strip_separators() const { return naming_strip_separators_; }
    size_t line_char_limit() const { return line_char_limit_; }
    size_t char_break_min_fragment() const { return char_break_min_fragment_; }
    bool use_dictionary() const { return use_dictionary_; }
    bool use_algorithm() const { return use_algorithm_; }
    RuleSet rules() const { return rules_; }
    std::optional<uint64_t> random_seed() const { return random_seed_; }
    bool ai_enabled() const { return ai_enabled_; }
    const std::string& ai_default_protocol() const { return ai_default_protocol_; }
    const std::string& ai_model() const { return ai_model_; }
    std::chrono::milliseconds ai_timeout() const { return ai_timeout_; }

private:
    int random_min_length_ = 1;
    int random_max_length_ = 10;
    int chaos_min_tokens_ = 3;
    bool naming_strip_separators_ = true;
    size_t line_char_limit_ = 100;
    size_t char_break_min_fragment_ = 50;
    bool use_dictionary_ = true;
    bool use_algorithm_ = true;
    RuleSet rules_;
    std::optional<uint64_t> random_seed_;
    bool ai_enabled_ = false;
    std::string ai_default_protocol_ = "https://";
    std::string ai_model_;
    std::chrono::milliseconds ai_timeout_{30000};
};

class SegmentOptions::Builder {
public:
    Builder() = default;
    explicit Builder(const SegmentOptions& base) : opts_(base) {}

    Builder& random_length(int min_len, int max_len);
    Builder& chaos_min_tokens(int n);
    Builder& naming_strip_separators(bool strip);
    Builder& line_char_limit(size_t limit);
    Builder& char_break_min_fragment(size_t n);
    Builder& use_dictionary(bool enabled);
    Builder& use_algorithm(bool enabled);
    Builder& rules(RuleSet rules);
    Builder& random_seed(uint64_t seed);
    Builder& ai_enabled(bool enabled);
    Builder& ai_default_protocol(std::string protocol);
    Builder& ai_model(std::string model);
    Builder& ai_timeout(std::chrono::milliseconds timeout);

    SegmentOptions build() const { return opts_; }

private:
    SegmentOptions opts_;
};

// Reads a JSON settings file and merges it over `defaults`.
// Missing or unreadable files leave the defaults untouched.
SegmentOptions load_settings(const std::string& path, const SegmentOptions& defaults = SegmentOptions{});

// Same, from an in-memory JSON document
SegmentOptions parse_settings(std::string_view json_text, const SegmentOptions& defaults = SegmentOptions{});

} // namespace textseg
