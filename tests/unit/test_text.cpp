#include <gtest/gtest.h>
#include "text/utf8.hpp"
#include "text/tokenizer.hpp"
#include "text/fuzzy.hpp"

using namespace lore;

// ==========================================
// UTF-8 Tests
// ==========================================

TEST(Utf8Test, LengthCountsCodepoints) {
    EXPECT_EQ(utf8::length("abc"), 3);
    EXPECT_EQ(utf8::length("Хорус"), 5);
    EXPECT_EQ(std::string("Хорус").size(), 10);
    EXPECT_EQ(utf8::length(""), 0);
}

TEST(Utf8Test, DecodeEncodeRoundTrip) {
    std::string text = "Ересь Хоруса";
    std::u32string decoded = utf8::decode(text);
    EXPECT_EQ(decoded.size(), 12);
    EXPECT_EQ(utf8::encode(decoded), text);
}

TEST(Utf8Test, MalformedByteDecodesToReplacement) {
    std::string text = "a\xFF" "b";
    size_t pos = 1;
    EXPECT_EQ(utf8::decode_next(text, pos), U'\uFFFD');
    EXPECT_EQ(pos, 2);

    // Truncated two-byte sequence at the end
    std::string truncated = "\xD0";
    pos = 0;
    EXPECT_EQ(utf8::decode_next(truncated, pos), U'\uFFFD');
    EXPECT_EQ(pos, 1);
}

TEST(Utf8Test, CaseMapping) {
    EXPECT_EQ(utf8::to_lower("ХОРУС Iron"), "хорус iron");
    EXPECT_EQ(utf8::to_upper("ссылка"), "ССЫЛКА");
    EXPECT_EQ(utf8::to_upper("ёж"), "ЁЖ");
    EXPECT_TRUE(utf8::starts_upper("Хорус"));
    EXPECT_FALSE(utf8::starts_upper("хорус"));
    EXPECT_FALSE(utf8::starts_upper(""));
}

TEST(Utf8Test, Capitalization) {
    EXPECT_EQ(utf8::capitalize_first("хорус ЛУПЕРКАЛЬ"), "Хорус ЛУПЕРКАЛЬ");
    EXPECT_EQ(utf8::capitalize_word("хОРУС"), "Хорус");
    EXPECT_EQ(utf8::capitalize_first(""), "");
}

TEST(Utf8Test, Trim) {
    EXPECT_EQ(utf8::trim("  text \n"), "text");
    EXPECT_EQ(utf8::trim(" \t "), "");
}

// ==========================================
// Tokenizer Tests
// ==========================================

TEST(TokenizerTest, WordsPunctuationAndOffsets) {
    std::string text = "Жиль-де Рэ, don't stop...";
    auto tokens = tokenize(text);

    ASSERT_EQ(tokens.size(), 6);
    EXPECT_EQ(tokens[0].text, "Жиль-де");
    EXPECT_EQ(tokens[1].text, "Рэ");
    EXPECT_EQ(tokens[2].text, ",");
    EXPECT_EQ(tokens[3].text, "don't");
    EXPECT_EQ(tokens[4].text, "stop");
    EXPECT_EQ(tokens[5].text, "...");

    for (const auto& token : tokens) {
        EXPECT_LT(token.start, token.end);
        EXPECT_EQ(text.substr(token.start, token.end - token.start), token.text);
    }
}

TEST(TokenizerTest, StandaloneHyphenIsPunctuation) {
    auto tokens = tokenize("a - b");
    ASSERT_EQ(tokens.size(), 3);
    EXPECT_EQ(tokens[1].text, "-");
    EXPECT_EQ(tokens[1].start, 2);
}

TEST(TokenizerTest, SplitWordsDropsPunctuation) {
    auto words = split_words("Who, what? Horus!");
    ASSERT_EQ(words.size(), 3);
    EXPECT_EQ(words[0], "Who");
    EXPECT_EQ(words[2], "Horus");
}

TEST(TokenizerTest, EmptyAndWhitespaceOnly) {
    EXPECT_TRUE(tokenize("").empty());
    EXPECT_TRUE(tokenize("   \n\t").empty());
}

// ==========================================
// Fuzzy Ratio Tests
// ==========================================

TEST(FuzzyTest, IdenticalAndEmpty) {
    EXPECT_DOUBLE_EQ(fuzzy::ratio("iron hand", "iron hand"), 100.0);
    EXPECT_DOUBLE_EQ(fuzzy::ratio("", ""), 100.0);
    EXPECT_DOUBLE_EQ(fuzzy::ratio("abc", ""), 0.0);
}

TEST(FuzzyTest, IndelSimilarity) {
    // LCS("kitten", "sitting") = 4
    EXPECT_EQ(fuzzy::lcs_length(U"kitten", U"sitting"), 4);
    EXPECT_NEAR(fuzzy::ratio("kitten", "sitting"), 200.0 * 4 / 13, 1e-9);
}

TEST(FuzzyTest, ComparesCodepointsNotBytes) {
    // One substituted letter in a five-letter word: LCS 4 of 5 + 5
    EXPECT_NEAR(fuzzy::ratio("хорус", "хорес"), 80.0, 1e-9);
}

TEST(FuzzyTest, Symmetric) {
    EXPECT_DOUBLE_EQ(fuzzy::ratio("abcdef", "azced"), fuzzy::ratio("azced", "abcdef"));
}

TEST(FuzzyTest, UpperBoundDominatesRatio) {
    EXPECT_NEAR(fuzzy::ratio_upper_bound(4, 9), 200.0 * 4 / 13, 1e-9);
    EXPECT_DOUBLE_EQ(fuzzy::ratio_upper_bound(0, 0), 100.0);
    EXPECT_LE(fuzzy::ratio("hand", "iron hand"), fuzzy::ratio_upper_bound(4, 9));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
