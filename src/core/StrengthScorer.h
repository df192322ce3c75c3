// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

#ifndef ZEROVAULT_STRENGTH_SCORER_H
#define ZEROVAULT_STRENGTH_SCORER_H

#include <string_view>
#include <vector>

namespace ZeroVault {

/**
 * @brief Reasons a password lost points, in the order the rules run
 */
enum class FeedbackCode {
    EmptyPassword,
    PasswordTooShort,
    AddLowercase,
    AddUppercase,
    AddNumbers,
    AddSpecial,
    AvoidCommonPatterns
};

/// Symbolic code used by the UI's localization tables, e.g. "add_numbers"
inline constexpr std::string_view to_string(FeedbackCode code) noexcept {
    switch (code) {
        case FeedbackCode::EmptyPassword:       return "empty_password";
        case FeedbackCode::PasswordTooShort:    return "password_too_short";
        case FeedbackCode::AddLowercase:        return "add_lowercase";
        case FeedbackCode::AddUppercase:        return "add_uppercase";
        case FeedbackCode::AddNumbers:          return "add_numbers";
        case FeedbackCode::AddSpecial:          return "add_special";
        case FeedbackCode::AvoidCommonPatterns: return "avoid_common_patterns";
    }
    return "unknown";
}

/**
 * @brief Display band for a score
 */
enum class StrengthBand {
    Weak,     ///< 0-2
    Fair,     ///< 3-4
    Good,     ///< 5
    Strong    ///< 6-7
};

inline constexpr std::string_view to_string(StrengthBand band) noexcept {
    switch (band) {
        case StrengthBand::Weak:   return "weak";
        case StrengthBand::Fair:   return "fair";
        case StrengthBand::Good:   return "good";
        case StrengthBand::Strong: return "strong";
    }
    return "unknown";
}

struct StrengthResult {
    int score = 0;                        ///< 0..7
    std::vector<FeedbackCode> feedback;

    [[nodiscard]] StrengthBand band() const noexcept;

    [[nodiscard]] std::vector<std::string_view> feedback_codes() const;
};

/**
 * @brief Deterministic rule-table password scoring
 *
 * | Rule                                   | Effect | Feedback when it fails  |
 * |----------------------------------------|--------|-------------------------|
 * | length >= 8                            | +1     | password_too_short      |
 * | length >= 12                           | +1     |                         |
 * | length >= 16                           | +1     |                         |
 * | has [a-z]                              | +1     | add_lowercase           |
 * | has [A-Z]                              | +1     | add_uppercase           |
 * | has [0-9]                              | +1     | add_numbers             |
 * | has a character outside [a-zA-Z0-9]    | +1     | add_special             |
 * | contains a common pattern              | -2     | avoid_common_patterns   |
 *
 * Length counts UTF-8 code points. The total is clamped to [0, 7]. An empty
 * password scores 0 with only empty_password and no other rule runs.
 */
class StrengthScorer {
public:
    static constexpr int MIN_SCORE = 0;
    static constexpr int MAX_SCORE = 7;

    [[nodiscard]] static StrengthResult score(std::string_view password);

    StrengthScorer() = delete;
};

} // namespace ZeroVault

#endif // ZEROVAULT_STRENGTH_SCORER_H
