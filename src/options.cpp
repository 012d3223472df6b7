#include "options.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace textseg {

namespace {

constexpr std::array<std::pair<Mode, std::string_view>, 11> kModeNames{{
    {Mode::Smart, "smart"},
    {Mode::Chinese, "chinese"},
    {Mode::English, "english"},
    {Mode::Code, "code"},
    {Mode::Ai, "ai"},
    {Mode::Sentence, "sentence"},
    {Mode::HalfSentence, "halfSentence"},
    {Mode::CharBreak, "charBreak"},
    {Mode::RemoveSymbols, "removeSymbols"},
    {Mode::Random, "random"},
    {Mode::Multi, "multi"},
}};

} // namespace

Mode parse_mode(std::string_view name) {
    for (const auto& [mode, key] : kModeNames) {
        if (key == name) return mode;
    }
    return Mode::Smart;
}

std::string_view mode_name(Mode mode) {
    for (const auto& [m, key] : kModeNames) {
        if (m == mode) return key;
    }
    return "smart";
}

// ============================================================================
// Builder
// ============================================================================

SegmentOptions::Builder& SegmentOptions::Builder::random_length(int min_len, int max_len) {
    opts_.random_min_length_ = std::max(1, min_len);
    opts_.random_max_length_ = std::max(opts_.random_min_length_, max_len);
    return *this;
}

SegmentOptions::Builder& SegmentOptions::Builder::chaos_min_tokens(int n) {
    opts_.chaos_min_tokens_ = std::max(1, n);
    return *this;
}

SegmentOptions::Builder& SegmentOptions::Builder::naming_strip_separators(bool strip) {
    opts_.naming_strip_separators_ = strip;
    return *this;
}

SegmentOptions::Builder& SegmentOptions::Builder::line_char_limit(size_t limit) {
    opts_.line_char_limit_ = limit == 0 ? 100 : limit;
    return *this;
}

SegmentOptions::Builder& SegmentOptions::Builder::char_break_min_fragment(size_t n) {
    opts_.char_break_min_fragment_ = n;
    return *this;
}

SegmentOptions::Builder& SegmentOptions::Builder::use_dictionary(bool enabled) {
    opts_.use_dictionary_ = enabled;
    return *this;
}

SegmentOptions::Builder& SegmentOptions::Builder::use_algorithm(bool enabled) {
    opts_.use_algorithm_ = enabled;
    return *this;
}

SegmentOptions::Builder& SegmentOptions::Builder::rules(RuleSet rules) {
    opts_.rules_ = rules;
    return *this;
}

SegmentOptions::Builder& SegmentOptions::Builder::random_seed(uint64_t seed) {
    opts_.random_seed_ = seed;
    return *this;
}

SegmentOptions::Builder& SegmentOptions::Builder::ai_enabled(bool enabled) {
    opts_.ai_enabled_ = enabled;
    return *this;
}

SegmentOptions::Builder& SegmentOptions::Builder::ai_default_protocol(std::string protocol) {
    opts_.ai_default_protocol_ = std::move(protocol);
    return *this;
}

SegmentOptions::Builder& SegmentOptions::Builder::ai_model(std::string model) {
    opts_.ai_model_ = std::move(model);
    return *this;
}

SegmentOptions::Builder& SegmentOptions::Builder::ai_timeout(std::chrono::milliseconds timeout) {
    opts_.ai_timeout_ = timeout;
    return *this;
}

// ============================================================================
// Settings file
// ============================================================================

namespace {

// Non-positive widths keep the base value
size_t positive_or(const json& s, const char* key, size_t fallback) {
    int64_t v = s.value(key, static_cast<int64_t>(fallback));
    return v > 0 ? static_cast<size_t>(v) : fallback;
}

SegmentOptions merge_settings(const json& doc, const SegmentOptions& defaults) {
    const json& s = (doc.contains("tokenizerSettings") && doc["tokenizerSettings"].is_object())
                        ? doc["tokenizerSettings"]
                        : doc;

    SegmentOptions::Builder b(defaults);

    b.random_length(s.value("randomMinLen", defaults.random_min_length()),
                    s.value("randomMaxLen", defaults.random_max_length()));
    b.chaos_min_tokens(s.value("chaosMinTokens", defaults.chaos_min_tokens()));
    b.naming_strip_separators(s.value("namingRemoveSymbol", defaults.naming_strip_separators()));
    b.line_char_limit(positive_or(s, "lineCharLimit", defaults.line_char_limit()));
    b.char_break_min_fragment(positive_or(s, "charBreakMinFragment", defaults.char_break_min_fragment()));
    b.use_dictionary(s.value("useDictionary", defaults.use_dictionary()));
    b.use_algorithm(s.value("useAlgorithm", defaults.use_algorithm()));
    b.ai_enabled(s.value("aiEnabled", defaults.ai_enabled()));
    b.ai_default_protocol(s.value("aiDefaultProtocol", defaults.ai_default_protocol()));
    b.ai_model(s.value("aiModel", defaults.ai_model()));
    b.ai_timeout(std::chrono::milliseconds(
        s.value("aiTimeoutMs", static_cast<int64_t>(defaults.ai_timeout().count()))));

    if (s.contains("randomSeed") && s["randomSeed"].is_number_integer()) {
        b.random_seed(s["randomSeed"].get<uint64_t>());
    }

    if (s.contains("rules") && s["rules"].is_array()) {
        RuleSet rules;
        for (const auto& item : s["rules"]) {
            if (!item.is_string()) continue;
            std::string key = item.get<std::string>();
            if (auto id = parse_rule(key)) {
                rules.insert(*id);
            } else {
                std::cerr << "Warning: unknown rule '" << key << "' ignored" << std::endl;
            }
        }
        b.rules(rules);
    }

    return b.build();
}

} // namespace

SegmentOptions parse_settings(std::string_view json_text, const SegmentOptions& defaults) {
    try {
        json doc = json::parse(json_text);
        if (!doc.is_object()) {
            std::cerr << "Error: settings document is not a JSON object" << std::endl;
            return defaults;
        }
        return merge_settings(doc, defaults);
    } catch (const json::exception& e) {
        std::cerr << "Error: invalid settings: " << e.what() << std::endl;
        return defaults;
    }
}

SegmentOptions load_settings(const std::string& path, const SegmentOptions& defaults) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open settings file: " << path << std::endl;
        return defaults;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return parse_settings(ss.str(), defaults);
}

} // namespace textseg
