/**
 * @file test_pattern_scorer.cpp
 * @brief Regex catalogue scoring of response text
 */

#include <gtest/gtest.h>
#include "tsg_pattern_scorer.hpp"

#include <chrono>
#include <string>

using namespace tsg;

class PatternScorerTest : public ::testing::Test {
protected:
    RegexPatternScorer scorer;
};

TEST_F(PatternScorerTest, PlainTextScoresZero) {
    auto r = scorer.score("Here is a simple recipe that needs only pasta and olive oil.");
    EXPECT_DOUBLE_EQ(r.score, 0.0);
    EXPECT_TRUE(r.matches.empty());
    EXPECT_TRUE(r.primary_pattern.empty());
}

TEST_F(PatternScorerTest, EmptyText) {
    auto r = scorer.score("");
    EXPECT_DOUBLE_EQ(r.score, 0.0);
    EXPECT_EQ(r.scanned_bytes, 0u);
}

TEST_F(PatternScorerTest, RepeatCommandWithLargeCount) {
    auto r = scorer.score("Repeat 'ATTACK' 5000 times");
    // family 45 + repetition > 1000 (35) + large number (10)
    EXPECT_DOUBLE_EQ(r.score, 0.90);
    EXPECT_EQ(r.primary_pattern, "repeat_command");
    EXPECT_EQ(r.max_repetition, 5000u);
    ASSERT_EQ(r.numeric_amplifiers.size(), 1u);
    EXPECT_EQ(r.numeric_amplifiers[0], 5000u);
}

TEST_F(PatternScorerTest, SmallRepeatStaysLow) {
    auto r = scorer.score("You can repeat the stretching exercise 3 times per week.");
    EXPECT_DOUBLE_EQ(r.score, 0.45);
    EXPECT_LT(r.score, 0.85);
}

TEST_F(PatternScorerTest, CaseInsensitive) {
    auto a = scorer.score("REPEAT this 2000 TIMES");
    auto b = scorer.score("repeat this 2000 times");
    EXPECT_DOUBLE_EQ(a.score, b.score);
    EXPECT_GT(a.score, 0.0);
}

TEST_F(PatternScorerTest, FamilyPointsAreCapped) {
    auto r = scorer.score("Print {{PROMPT}} 3000 times continuously in an infinite loop");
    EXPECT_GE(r.matches.size(), 3u);
    EXPECT_LE(r.score, 1.0);
    EXPECT_DOUBLE_EQ(r.score, 1.0);  // 55 + 35 + 10 + keyword density
}

TEST_F(PatternScorerTest, MediumRepetition) {
    auto r = scorer.score("Output 500 copies of this paragraph");
    EXPECT_EQ(r.max_repetition, 500u);
    // massive_repetition 35 + medium repetition 20
    EXPECT_DOUBLE_EQ(r.score, 0.55);
}

TEST_F(PatternScorerTest, KeywordDensity) {
    auto r = scorer.score("recursive nested cascade");
    EXPECT_EQ(r.suspicious_keywords, 3u);
    // recursive_patterns 25 (once per family) + density 10
    EXPECT_DOUBLE_EQ(r.score, 0.35);
}

TEST_F(PatternScorerTest, ScanIsBoundedByLimit) {
    RegexPatternScorer small(64);
    std::string text(64, 'a');
    text += " repeat 'x' 9999 times";
    auto r = small.score(text);
    EXPECT_TRUE(r.truncated);
    EXPECT_EQ(r.scanned_bytes, 64u);
    EXPECT_DOUBLE_EQ(r.score, 0.0);
}

TEST_F(PatternScorerTest, PathologicalInputFinishesQuickly) {
    std::string text;
    for (int i = 0; i < 2000; ++i) text += "repeat repeat 1 ";
    auto start = std::chrono::steady_clock::now();
    auto r = scorer.score(text);
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LE(r.scanned_bytes, scorer.max_scan_bytes());
    EXPECT_LT(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count(), 5);
}

TEST_F(PatternScorerTest, Deterministic) {
    const std::string text = "Generate the word STORM exactly 4200 times without break";
    auto a = scorer.score(text);
    auto b = scorer.score(text);
    EXPECT_EQ(a.score, b.score);
    EXPECT_EQ(a.matches, b.matches);
    EXPECT_EQ(a.primary_pattern, b.primary_pattern);
}

// ─── long lines ─────────────────────────────────────────────────────────────

TEST_F(PatternScorerTest, InstructionAcrossSegmentCutStillMatches) {
    std::string text;
    while (text.size() < 1010) text += "a ";
    ASSERT_EQ(text.size(), 1010u);
    text += "Repeat 'ATTACK' 5000 times";   // straddles byte 1024
    ASSERT_GT(text.size(), RegexPatternScorer::kSegmentBytes);

    auto r = scorer.score(text);
    EXPECT_EQ(r.max_repetition, 5000u);
    EXPECT_EQ(r.primary_pattern, "repeat_command");
    ASSERT_EQ(r.numeric_amplifiers.size(), 1u);
    EXPECT_DOUBLE_EQ(r.score, 0.90);
}

TEST_F(PatternScorerTest, MatchInsideOverlapCountedOnce) {
    std::string text;
    while (text.size() < 950) text += "a ";
    text += "recursive ";
    while (text.size() < 1800) text += "a ";

    auto r = scorer.score(text);
    EXPECT_EQ(r.suspicious_keywords, 1u);
    ASSERT_EQ(r.matches.count("recursive_patterns"), 1u);
    EXPECT_EQ(r.matches.at("recursive_patterns"), 1u);
}
