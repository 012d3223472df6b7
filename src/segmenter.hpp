#pragma once

#include "ai_tokenizer.hpp"
#include "chinese_segmenter.hpp"
#include "code_analyzer.hpp"
#include "dictionary.hpp"
#include "options.hpp"
#include "rule_composer.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace textseg {

// Mode dispatcher. Stateless apart from the shared dictionary store, so one
// instance can serve many threads.
class Segmenter {
public:
    explicit Segmenter(const DictionaryStore& store, std::shared_ptr<CompletionClient> ai_client = nullptr);

    std::vector<std::string> segment(std::string_view text, Mode mode,
                                     const SegmentOptions& options = SegmentOptions{}) const;

    // Unknown mode identifiers segment as smart
    std::vector<std::string> segment(std::string_view text, std::string_view mode,
                                     const SegmentOptions& options = SegmentOptions{}) const;

    // Multi-rule composition with applied rules and conflict records
    CompositionResult compose(std::string_view text, RuleSet rules,
                              const SegmentOptions& options = SegmentOptions{}) const;

private:
    ChineseSegmenter chinese_;
    CodeAnalyzer code_;
    RuleComposer composer_;
    AiTokenizer ai_;
};

} // namespace textseg
