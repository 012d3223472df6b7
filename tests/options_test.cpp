/**
 * Unit tests for modes, option building and the JSON settings loader.
 */

#include "test_harness.hpp"
#include "options.hpp"

using textseg::Mode;
using textseg::RuleId;
using textseg::SegmentOptions;

class OptionsTest : public TestSuite {
public:
    OptionsTest() : TestSuite("Options Tests") {}

    void testModeNames() {
        runTest("Mode identifiers", []() {
            for (Mode m : {Mode::Smart, Mode::Chinese, Mode::English, Mode::Code, Mode::Ai, Mode::Sentence,
                           Mode::HalfSentence, Mode::CharBreak, Mode::RemoveSymbols, Mode::Random, Mode::Multi}) {
                if (textseg::parse_mode(textseg::mode_name(m)) != m) return false;
            }
            return textseg::parse_mode("halfSentence") == Mode::HalfSentence
                && textseg::parse_mode("bogus") == Mode::Smart
                && textseg::parse_mode("") == Mode::Smart;
        });
    }

    void testDefaults() {
        runTest("Defaults", []() {
            SegmentOptions o;
            return o.random_min_length() == 1 && o.random_max_length() == 10 && o.chaos_min_tokens() == 3
                && o.naming_strip_separators() && o.line_char_limit() == 100
                && o.char_break_min_fragment() == 50 && o.use_dictionary() && o.use_algorithm()
                && o.rules().empty() && !o.random_seed() && !o.ai_enabled()
                && o.ai_default_protocol() == "https://" && o.ai_timeout().count() == 30000;
        });
    }

    void testBuilderNormalises() {
        runTest("Builder normalises knobs", []() {
            auto o = SegmentOptions::Builder()
                         .random_length(0, -3)
                         .chaos_min_tokens(0)
                         .line_char_limit(0)
                         .build();
            auto p = SegmentOptions::Builder().random_length(4, 2).build();
            return o.random_min_length() == 1 && o.random_max_length() == 1 && o.chaos_min_tokens() == 1
                && o.line_char_limit() == 100
                && p.random_min_length() == 4 && p.random_max_length() == 4;
        });
    }

    void testParseSettingsNested() {
        runTest("Settings under tokenizerSettings", []() {
            auto o = textseg::parse_settings(R"({
                "tokenizerSettings": {
                    "randomMinLen": 2,
                    "randomMaxLen": 6,
                    "chaosMinTokens": 5,
                    "namingRemoveSymbol": false,
                    "lineCharLimit": 80,
                    "useDictionary": false,
                    "aiEnabled": true,
                    "aiDefaultProtocol": "http://",
                    "aiTimeoutMs": 1500,
                    "randomSeed": 99,
                    "rules": ["namingSplit", "removeSymbols", "noSuchRule"]
                }
            })");
            return o.random_min_length() == 2 && o.random_max_length() == 6 && o.chaos_min_tokens() == 5
                && !o.naming_strip_separators() && o.line_char_limit() == 80 && !o.use_dictionary()
                && o.use_algorithm() && o.ai_enabled() && o.ai_default_protocol() == "http://"
                && o.ai_timeout().count() == 1500 && o.random_seed() && *o.random_seed() == 99
                && o.rules().size() == 2 && o.rules().contains(RuleId::NamingSplit)
                && o.rules().contains(RuleId::RemoveSymbols);
        });
    }

    void testParseSettingsFlat() {
        runTest("Flat settings merge over defaults", []() {
            auto base = SegmentOptions::Builder().line_char_limit(40).build();
            auto o = textseg::parse_settings(R"({"randomMaxLen": 3})", base);
            return o.random_max_length() == 3 && o.random_min_length() == 1 && o.line_char_limit() == 40;
        });
    }

    void testInvalidSettings() {
        runTest("Invalid JSON keeps defaults", []() {
            auto base = SegmentOptions::Builder().chaos_min_tokens(7).build();
            auto bad = textseg::parse_settings("{ not json", base);
            auto array = textseg::parse_settings("[1, 2]", base);
            auto wrong_type = textseg::parse_settings(R"({"randomMinLen": "big"})", base);
            return bad.chaos_min_tokens() == 7 && array.chaos_min_tokens() == 7
                && wrong_type.chaos_min_tokens() == 7 && wrong_type.random_min_length() == 1;
        });
    }

    void testNegativeWidthsIgnored() {
        runTest("Negative or zero widths keep the base values", []() {
            auto o = textseg::parse_settings(R"({"lineCharLimit": -5, "charBreakMinFragment": -1})");
            auto base = SegmentOptions::Builder().line_char_limit(60).char_break_min_fragment(20).build();
            auto z = textseg::parse_settings(R"({"lineCharLimit": 0, "charBreakMinFragment": 0})", base);
            return o.line_char_limit() == 100 && o.char_break_min_fragment() == 50
                && z.line_char_limit() == 60 && z.char_break_min_fragment() == 20;
        });
    }

    void testMissingFile() {
        runTest("Missing settings file keeps defaults", []() {
            auto base = SegmentOptions::Builder().random_seed(5).build();
            auto o = textseg::load_settings("/nonexistent/settings.json", base);
            return o.random_seed() && *o.random_seed() == 5;
        });
    }

protected:
    void runAll() override {
        testModeNames();
        testDefaults();
        testBuilderNormalises();
        testParseSettingsNested();
        testParseSettingsFlat();
        testInvalidSettings();
        testNegativeWidthsIgnored();
        testMissingFile();
    }
};

int main() {
    return runSuite<OptionsTest>();
}
