// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

#include <gtest/gtest.h>
#include "../src/core/StrengthScorer.h"

using namespace ZeroVault;

using Codes = std::vector<std::string_view>;

// ============================================================================
// Rule table
// ============================================================================

TEST(StrengthScorerTest, EmptyPasswordShortCircuits) {
    const auto result = StrengthScorer::score("");
    EXPECT_EQ(result.score, 0);
    EXPECT_EQ(result.feedback_codes(), Codes{"empty_password"});
}

TEST(StrengthScorerTest, DictionaryWordScoresZero) {
    const auto result = StrengthScorer::score("password");
    EXPECT_EQ(result.score, 0);
    EXPECT_EQ(result.feedback_codes(),
              (Codes{"add_uppercase", "add_numbers", "add_special", "avoid_common_patterns"}));
}

TEST(StrengthScorerTest, LongMixedPasswordScoresHigh) {
    const auto result = StrengthScorer::score("Tr0ub4dor&3Xylophone");
    EXPECT_GE(result.score, 6);
    EXPECT_EQ(result.score, StrengthScorer::MAX_SCORE);
    EXPECT_TRUE(result.feedback.empty());
    EXPECT_EQ(result.band(), StrengthBand::Strong);
}

TEST(StrengthScorerTest, ShortPasswordGetsLengthFeedback) {
    const auto result = StrengthScorer::score("short");
    EXPECT_EQ(result.score, 1);
    EXPECT_EQ(result.feedback_codes(),
              (Codes{"password_too_short", "add_uppercase", "add_numbers", "add_special"}));
}

TEST(StrengthScorerTest, LengthThresholds) {
    // Lowercase only, no patterns: 1 point for the class plus length points
    EXPECT_EQ(StrengthScorer::score("xkcdmqz").score, 1);                 // 7
    EXPECT_EQ(StrengthScorer::score("xkcdmqzw").score, 2);                // 8
    EXPECT_EQ(StrengthScorer::score("xkcdmqzwxkcd").score, 3);            // 12
    EXPECT_EQ(StrengthScorer::score("xkcdmqzwxkcdmqzw").score, 4);        // 16
}

TEST(StrengthScorerTest, CommonPatternIsCaseInsensitiveSubstring) {
    const auto result = StrengthScorer::score("Abcdef1!");
    // 8 chars (+1), four classes (+4), "abc" (-2)
    EXPECT_EQ(result.score, 3);
    EXPECT_EQ(result.feedback_codes(), Codes{"avoid_common_patterns"});

    EXPECT_EQ(StrengthScorer::score("MyQWERTYkeys").feedback.back(),
              FeedbackCode::AvoidCommonPatterns);
}

TEST(StrengthScorerTest, ScoreNeverGoesNegative) {
    const auto result = StrengthScorer::score("aaa");
    EXPECT_EQ(result.score, 0);
    EXPECT_EQ(result.feedback_codes(),
              (Codes{"password_too_short", "add_uppercase", "add_numbers", "add_special",
                     "avoid_common_patterns"}));
}

TEST(StrengthScorerTest, LengthCountsCodePoints) {
    // Seven two-byte characters: 14 bytes but still too short
    const auto result = StrengthScorer::score("ééééééé");
    ASSERT_FALSE(result.feedback.empty());
    EXPECT_EQ(result.feedback.front(), FeedbackCode::PasswordTooShort);

    // Non-ASCII letters count as special characters
    const auto accented = StrengthScorer::score("pässwörd");
    EXPECT_EQ(accented.score, 3);
    EXPECT_EQ(accented.feedback_codes(), (Codes{"add_uppercase", "add_numbers"}));
}

TEST(StrengthScorerTest, ScoringIsDeterministic) {
    const auto first = StrengthScorer::score("Some Passphrase 42");
    const auto second = StrengthScorer::score("Some Passphrase 42");
    EXPECT_EQ(first.score, second.score);
    EXPECT_EQ(first.feedback, second.feedback);
}

// ============================================================================
// Bands
// ============================================================================

TEST(StrengthScorerTest, BandBoundaries) {
    const auto band_of = [](int score) {
        StrengthResult r;
        r.score = score;
        return r.band();
    };
    EXPECT_EQ(band_of(0), StrengthBand::Weak);
    EXPECT_EQ(band_of(2), StrengthBand::Weak);
    EXPECT_EQ(band_of(3), StrengthBand::Fair);
    EXPECT_EQ(band_of(4), StrengthBand::Fair);
    EXPECT_EQ(band_of(5), StrengthBand::Good);
    EXPECT_EQ(band_of(6), StrengthBand::Strong);
    EXPECT_EQ(band_of(7), StrengthBand::Strong);
    EXPECT_EQ(to_string(StrengthBand::Fair), "fair");
}
