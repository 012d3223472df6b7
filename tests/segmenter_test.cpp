/**
 * Tests for the mode dispatcher.
 * Runs the shared scenario file, then checks dispatch details.
 */

#include "test_harness.hpp"
#include "segmenter.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

struct TestCase {
    int id;
    std::string mode;
    std::string input;
    std::string description;
    textseg::RuleSet rules;
    std::vector<std::string> expected;
};

class SegmenterTest : public TestSuite {
private:
    textseg::DictionaryStore store;
    textseg::Segmenter segmenter{store};
    std::vector<TestCase> testCases;

public:
    SegmenterTest() : TestSuite("Segmenter Tests") {
        std::string testCasesPath = std::string(TEXTSEG_DATA_DIR) + "/test_cases.json";
        std::ifstream file(testCasesPath);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open test cases file: " + testCasesPath);
        }
        json j;
        file >> j;

        for (const auto& tc : j) {
            TestCase testCase;
            testCase.id = tc["id"];
            testCase.mode = tc["mode"];
            testCase.input = tc["input"];
            testCase.description = tc["description"];
            if (tc.contains("rules")) {
                for (const auto& key : tc["rules"]) {
                    if (auto id = textseg::parse_rule(key.get<std::string>())) {
                        testCase.rules.insert(*id);
                    }
                }
            }
            for (const auto& exp : tc["expected"]) {
                testCase.expected.push_back(exp);
            }
            testCases.push_back(testCase);
        }
    }

    void testScenarios() {
        for (const auto& tc : testCases) {
            std::string name = "Case " + std::to_string(tc.id) + " [" + tc.mode + "]: " + tc.description;
            runTest(name, [this, &tc]() {
                auto opts = textseg::SegmentOptions::Builder().rules(tc.rules).build();
                return expectTokens(segmenter.segment(tc.input, tc.mode, opts), tc.expected);
            });
        }
    }

    void testDispatchByEnum() {
        runTest("Enum and string dispatch agree", [this]() {
            std::string text = "DarkSoul 中文分词, 2024!";
            for (auto mode : {textseg::Mode::Smart, textseg::Mode::Chinese, textseg::Mode::English,
                              textseg::Mode::Sentence, textseg::Mode::HalfSentence,
                              textseg::Mode::RemoveSymbols}) {
                if (!vectorsEqual(segmenter.segment(text, mode),
                                  segmenter.segment(text, textseg::mode_name(mode)))) {
                    return false;
                }
            }
            return true;
        });
    }

    void testOptionsReachModes() {
        runTest("Options reach the selected mode", [this]() {
            auto no_dict = textseg::SegmentOptions::Builder().use_dictionary(false).build();
            auto keep_sep = textseg::SegmentOptions::Builder().naming_strip_separators(false).build();
            auto narrow = textseg::SegmentOptions::Builder().line_char_limit(4).char_break_min_fragment(2).build();
            return expectTokens(segmenter.segment("中文分词", textseg::Mode::Chinese, no_dict),
                                {"中", "文", "分", "词"})
                && expectTokens(segmenter.segment("dark_soul", textseg::Mode::English, keep_sep),
                                {"dark_", "soul"})
                && expectTokens(segmenter.segment("abcdefghij", textseg::Mode::CharBreak, narrow),
                                {"abcd", "efgh", "ij"});
        });
    }

    void testSeededRandom() {
        runTest("Seeded random mode is reproducible", [this]() {
            auto opts = textseg::SegmentOptions::Builder().random_seed(1234).random_length(1, 4).build();
            std::string text = "random chaos over a medium sized sentence";
            auto a = segmenter.segment(text, textseg::Mode::Random, opts);
            auto b = segmenter.segment(text, textseg::Mode::Random, opts);
            return vectorsEqual(a, b) && concat(a) == text && a.size() >= 3;
        });
    }

    void testUnseededRandomCoversText() {
        runTest("Unseeded random mode covers the text", [this]() {
            std::string text = "每个字符都在某个块里 with spaces";
            return concat(segmenter.segment(text, textseg::Mode::Random)) == text;
        });
    }

    void testComposeReportsConflicts() {
        runTest("Compose reports applied rules and conflicts", [this]() {
            auto result = segmenter.compose("f(x) y", {textseg::RuleId::SymbolSplit, textseg::RuleId::RemoveSymbols});
            return result.conflicts.size() == 1 && result.applied_rules.size() == 1
                && expectTokens(result.tokens, {"fx y"});
        });
    }

    void testBlankEveryMode() {
        runTest("Blank input is empty in every mode", [this]() {
            for (auto mode : {textseg::Mode::Smart, textseg::Mode::Chinese, textseg::Mode::English,
                              textseg::Mode::Code, textseg::Mode::Ai, textseg::Mode::Sentence,
                              textseg::Mode::HalfSentence, textseg::Mode::CharBreak,
                              textseg::Mode::RemoveSymbols, textseg::Mode::Random, textseg::Mode::Multi}) {
                if (!segmenter.segment(" \n ", mode).empty()) return false;
            }
            return true;
        });
    }

protected:
    void runAll() override {
        testScenarios();
        testDispatchByEnum();
        testOptionsReachModes();
        testSeededRandom();
        testUnseededRandomCoversText();
        testComposeReportsConflicts();
        testBlankEveryMode();
    }
};

int main() {
    return runSuite<SegmenterTest>();
}
