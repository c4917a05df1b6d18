#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/comparator.hpp"

using namespace std;
using namespace sandbox;
using ::testing::HasSubstr;
using ::testing::Not;

TEST(ComparatorTest, ExactIsReflexive) {
    for (const string text : {"", "4", "hello world", "多字节 输出"}) {
        auto result = compare(text, text, compare_mode::EXACT);
        EXPECT_TRUE(result.matched) << text;
        EXPECT_DOUBLE_EQ(1.0, result.similarity);
        EXPECT_EQ("Output matches exactly!", result.details);
    }
}

TEST(ComparatorTest, ExactTrimsBothSides) {
    auto result = compare("  42  \n", "\n42", "exact");
    EXPECT_EQ("exact", result.mode);
    EXPECT_TRUE(result.matched);
}

TEST(ComparatorTest, ExactMismatchDescribesDifference) {
    auto result = compare("abc\n", "abd", compare_mode::EXACT);
    EXPECT_FALSE(result.matched);
    EXPECT_DOUBLE_EQ(0.0, result.similarity);
    EXPECT_EQ("Output does not match!\n\nExpected:\nabd\n\nGot:\nabc\n\nSimilarity: 66.7%", result.details);
}

TEST(ComparatorTest, ExactMismatchTruncatesPreview) {
    string expected(300, 'a');
    auto result = compare("b", expected, compare_mode::EXACT);
    EXPECT_FALSE(result.matched);
    EXPECT_THAT(result.details, HasSubstr("Expected:\n" + string(200, 'a') + "...\n\nGot:\nb\n\n"));
    EXPECT_THAT(result.details, Not(HasSubstr(string(201, 'a'))));
}

TEST(ComparatorTest, FuzzyAcceptsNearIdentical) {
    auto result = compare("Hello World", "Hello World!", compare_mode::FUZZY);
    EXPECT_EQ("fuzzy", result.mode);
    EXPECT_TRUE(result.matched);
    EXPECT_NEAR(22.0 / 23.0, result.similarity, 1e-9);
    EXPECT_EQ("Output matches with 95.7% similarity", result.details);
}

TEST(ComparatorTest, FuzzyRejectsDisjoint) {
    auto result = compare("abc", "xyz", compare_mode::FUZZY);
    EXPECT_FALSE(result.matched);
    EXPECT_DOUBLE_EQ(0.0, result.similarity);
    EXPECT_EQ("Output only 0.0% similar. Expected at least 80%.", result.details);
}

TEST(ComparatorTest, ContainsChecksSubstring) {
    auto result = compare("The answer is 42\n", "42", compare_mode::CONTAINS);
    EXPECT_EQ("contains", result.mode);
    EXPECT_TRUE(result.matched);
    EXPECT_DOUBLE_EQ(0.0, result.similarity);
    EXPECT_EQ("Output contains expected text!", result.details);

    result = compare("The answer is 42\n", " 43 ", compare_mode::CONTAINS);
    EXPECT_FALSE(result.matched);
    EXPECT_DOUBLE_EQ(0.0, result.similarity);
    EXPECT_EQ("Output does not contain expected text: '43'", result.details);
}

TEST(ComparatorTest, ContainsMatchesWord) {
    EXPECT_TRUE(compare("hello world", "world", compare_mode::CONTAINS).matched);

    auto result = compare("hello", "world", compare_mode::CONTAINS);
    EXPECT_FALSE(result.matched);
    EXPECT_EQ("Output does not contain expected text: 'world'", result.details);
}

TEST(ComparatorTest, UnknownModeNeverMatches) {
    auto result = compare("x", "x", "regex");
    EXPECT_EQ("regex", result.mode);
    EXPECT_FALSE(result.matched);
    EXPECT_DOUBLE_EQ(0.0, result.similarity);
    EXPECT_EQ("Unknown comparison mode: regex", result.details);
}

TEST(ComparatorTest, ParsesModeNames) {
    EXPECT_TRUE(parse_compare_mode("exact") == compare_mode::EXACT);
    EXPECT_TRUE(parse_compare_mode("fuzzy") == compare_mode::FUZZY);
    EXPECT_TRUE(parse_compare_mode("contains") == compare_mode::CONTAINS);
    EXPECT_FALSE(parse_compare_mode("Exact"));
    EXPECT_STREQ("fuzzy", get_mode_name(compare_mode::FUZZY));
}

TEST(ComparatorTest, SimilarityRatio) {
    EXPECT_DOUBLE_EQ(1.0, similarity_ratio("", ""));
    EXPECT_DOUBLE_EQ(0.0, similarity_ratio("abc", ""));
    EXPECT_DOUBLE_EQ(0.75, similarity_ratio("abcd", "bcde"));
}

TEST(ComparatorTest, SimilarityCountsCodePoints) {
    // 按字节比较时为 8 / 11
    EXPECT_DOUBLE_EQ(0.8, similarity_ratio("héllo", "hello"));
}

TEST(ComparatorTest, PopularElementsStillExtendMatches) {
    // 长度不少于 200 时 'a' 出现得过于频繁，不能作为匹配起点，但仍然可以被扩展覆盖
    string text(300, 'a');
    EXPECT_DOUBLE_EQ(1.0, similarity_ratio(text, text));
}
