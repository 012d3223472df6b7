/**
 * Unit tests for the random chaos tokenizer.
 */

#include "test_harness.hpp"
#include "random_chaos.hpp"
#include "unicode.hpp"

using textseg::random_chaos;

class RandomChaosTest : public TestSuite {
public:
    RandomChaosTest() : TestSuite("Random Chaos Tests") {}

    void testMinimumTokensAcrossSeeds() {
        runTest("At least min_tokens chunks, lengths within bounds", []() {
            for (uint64_t seed = 0; seed < 200; ++seed) {
                std::mt19937_64 rng(seed);
                auto parts = random_chaos("abcdefghij", 1, 3, 4, rng);
                if (parts.size() < 4 || concat(parts) != "abcdefghij") return false;
                for (const auto& p : parts) {
                    if (p.empty() || p.size() > 3) return false;
                }
            }
            return true;
        });
    }

    void testWhitespacePreserved() {
        runTest("Whitespace lands in chunks", []() {
            std::mt19937_64 rng(7);
            std::string text = "a b\tc\nd  e";
            return concat(random_chaos(text, 1, 4, 2, rng)) == text;
        });
    }

    void testCodePointChunks() {
        runTest("Chunks never split a code point", []() {
            std::string text = "中文分词测试用例";
            for (uint64_t seed = 0; seed < 50; ++seed) {
                std::mt19937_64 rng(seed);
                auto parts = random_chaos(text, 1, 3, 3, rng);
                if (concat(parts) != text) return false;
                for (const auto& p : parts) {
                    size_t len = textseg::codepoint_count(p);
                    if (len < 1 || len > 3 || p.size() != len * 3) return false;
                }
            }
            return true;
        });
    }

    void testSeedReproducible() {
        runTest("Same seed, same chunks", []() {
            std::mt19937_64 a(42);
            std::mt19937_64 b(42);
            std::string text = "The quick brown fox jumps over the lazy dog";
            return vectorsEqual(random_chaos(text, 1, 5, 3, a), random_chaos(text, 1, 5, 3, b));
        });
    }

    void testKnobNormalisation() {
        runTest("Invalid knobs are normalised", []() {
            std::mt19937_64 rng(1);
            return expectTokens(random_chaos("abc", 0, -5, 0, rng), {"a", "b", "c"});
        });
    }

    void testShortTextKeepsMinLength() {
        runTest("Text too short for min_tokens keeps min length", []() {
            std::mt19937_64 rng(3);
            return expectTokens(random_chaos("abcdefghij", 5, 5, 4, rng), {"abcde", "fghij"});
        });
    }

    void testRedistribute() {
        runTest("Redistribute into even chunks", []() {
            return expectTokens(textseg::redistribute_chunks(U"abcdefgh", 1, 10, 4), {"ab", "cd", "ef", "gh"})
                && expectTokens(textseg::redistribute_chunks(U"abcdefg", 1, 10, 3), {"abc", "def", "g"});
        });
    }

    void testBlank() {
        runTest("Blank input yields nothing", []() {
            std::mt19937_64 rng(0);
            return random_chaos("", 1, 3, 2, rng).empty() && random_chaos("   ", 1, 3, 2, rng).empty();
        });
    }

protected:
    void runAll() override {
        testMinimumTokensAcrossSeeds();
        testWhitespacePreserved();
        testCodePointChunks();
        testSeedReproducible();
        testKnobNormalisation();
        testShortTextKeepsMinLength();
        testRedistribute();
        testBlank();
    }
};

int main() {
    return runSuite<RandomChaosTest>();
}
