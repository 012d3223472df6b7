/**
 * Unit tests for the dictionary-driven Chinese segmenter.
 */

#include "test_harness.hpp"
#include "chinese_segmenter.hpp"

class ChineseSegmenterTest : public TestSuite {
private:
    textseg::DictionaryStore store;
    textseg::ChineseSegmenter segmenter{store};

public:
    ChineseSegmenterTest() : TestSuite("Chinese Segmenter Tests") {}

    void testLongestMatchFirst() {
        runTest("Longest dictionary match first", [this]() {
            return expectTokens(segmenter.segment("中文分词算法"), {"中文分词", "算法"});
        });
    }

    void testThreeCharacterMatch() {
        runTest("Three character match", [this]() {
            return expectTokens(segmenter.segment("数据库连接"), {"数据库", "连接"});
        });
    }

    void testStopWordDropped() {
        runTest("Matched stop words are dropped, single ideographs kept", [this]() {
            return expectTokens(segmenter.segment("我们的数据库表"), {"的", "数据库表"});
        });
    }

    void testUnknownIdeographsSingle() {
        runTest("Unknown ideographs emitted singly", [this]() {
            return expectTokens(segmenter.segment("今天"), {"今", "天"});
        });
    }

    void testMixedText() {
        runTest("Letters, digits and punctuation as in smart mode", [this]() {
            return expectTokens(segmenter.segment("打开数据库 version 2, OK"),
                                {"打", "开", "数据库", "version", "2", ",", "OK"});
        });
    }

    void testDictionaryDisabled() {
        runTest("Dictionary disabled emits each ideograph", [this]() {
            return expectTokens(segmenter.segment("中文分词", false, true), {"中", "文", "分", "词"});
        });
    }

    void testBothDisabled() {
        runTest("Dictionary and algorithm disabled returns input", [this]() {
            return expectTokens(segmenter.segment("中文 分词 abc", false, false), {"中文 分词 abc"});
        });
    }

    void testEmptyAndBlank() {
        runTest("Empty and blank input", [this]() {
            return segmenter.segment("").empty() && segmenter.segment(" \n\t").empty();
        });
    }

    void testRoundTrip() {
        runTest("Concatenation is the input minus whitespace and dropped stop words", [this]() {
            auto tokens = segmenter.segment("我们 在使用 数据库");
            return concat(tokens) == "在使用数据库";
        });
    }

    void testUsesCurrentSnapshot() {
        runTest("Uses the dictionary published to the store", []() {
            textseg::DictionaryStore local;
            textseg::ChineseSegmenter seg(local);
            bool before = vectorsEqual(seg.segment("天气很好"), {"天", "气", "很", "好"});

            textseg::Dictionary dict = textseg::Dictionary::with_defaults();
            dict.add_word("天气");
            dict.add_word("很好");
            local.update(std::move(dict));
            bool after = vectorsEqual(seg.segment("天气很好"), {"天气", "很好"});
            return before && after;
        });
    }

    void testExtractKeywords() {
        runTest("Keywords by frequency", [this]() {
            auto keywords = segmenter.extract_keywords("数据库数据库算法算法算法的", 5);
            return keywords.size() == 2
                && keywords[0].first == "算法" && keywords[0].second == 3
                && keywords[1].first == "数据库" && keywords[1].second == 2;
        });
    }

    void testCutDefaultsMatchSegment() {
        runTest("cut with default options equals segment", [this]() {
            std::string text = "我们的数据库表 version 2";
            return vectorsEqual(segmenter.cut(text), segmenter.segment(text))
                && expectTokens(segmenter.cut(text), {"的", "数据库表", "version", "2"});
        });
    }

    void testCutKeepsStopWords() {
        runTest("cut can keep matched stop words", [this]() {
            textseg::CutOptions opts;
            opts.remove_stop_words = false;
            return expectTokens(segmenter.cut("我们的数据库表", opts), {"我们", "的", "数据库表"});
        });
    }

    void testCutDropsEnglishAndNumbers() {
        runTest("cut can drop letter and digit runs", [this]() {
            textseg::CutOptions opts;
            opts.keep_english = false;
            opts.keep_number = false;
            return expectTokens(segmenter.cut("数据库 version 2, OK", opts), {"数据库", ","});
        });
    }

    void testCutMinLength() {
        runTest("cut min_length filters short letter and digit runs", [this]() {
            textseg::CutOptions opts;
            opts.min_length = 3;
            return expectTokens(segmenter.cut("ab 数据 abc 12 123", opts), {"数据", "abc", "123"});
        });
    }

    void testCutBatch() {
        runTest("cut_batch keeps one result per text", [this]() {
            auto results = segmenter.cut_batch({"中文分词算法", "  ", "数据库连接"});
            return results.size() == 3
                && expectTokens(results[0], {"中文分词", "算法"})
                && results[1].empty()
                && expectTokens(results[2], {"数据库", "连接"});
        });
    }

    void testHighlight() {
        runTest("Highlight wraps longest dictionary words", [this]() {
            return segmenter.highlight("打开数据库连接") == "打开<mark>数据库</mark><mark>连接</mark>"
                && segmenter.highlight("中文分词 test", "[", "]") == "[中文分词] test";
        });
    }

    void testHighlightSkipsStopWords() {
        runTest("Highlight leaves stop words and invalid bytes alone", [this]() {
            return segmenter.highlight("我们的算法") == "我们的<mark>算法</mark>"
                && segmenter.highlight("\xFF" "数据库") == "\xFF" "<mark>数据库</mark>"
                && segmenter.highlight("").empty()
                && segmenter.highlight("no words here") == "no words here";
        });
    }

protected:
    void runAll() override {
        testLongestMatchFirst();
        testThreeCharacterMatch();
        testStopWordDropped();
        testUnknownIdeographsSingle();
        testMixedText();
        testDictionaryDisabled();
        testBothDisabled();
        testEmptyAndBlank();
        testRoundTrip();
        testUsesCurrentSnapshot();
        testExtractKeywords();
        testCutDefaultsMatchSegment();
        testCutKeepsStopWords();
        testCutDropsEnglishAndNumbers();
        testCutMinLength();
        testCutBatch();
        testHighlight();
        testHighlightSkipsStopWords();
    }
};

int main() {
    return runSuite<ChineseSegmenterTest>();
}
