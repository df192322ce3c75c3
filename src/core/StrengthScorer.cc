// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

#include "StrengthScorer.h"
#include "CommonPatterns.h"
#include <glib.h>
#include <algorithm>

namespace ZeroVault {

StrengthBand StrengthResult::band() const noexcept {
    if (score <= 2) return StrengthBand::Weak;
    if (score <= 4) return StrengthBand::Fair;
    if (score == 5) return StrengthBand::Good;
    return StrengthBand::Strong;
}

std::vector<std::string_view> StrengthResult::feedback_codes() const {
    std::vector<std::string_view> codes;
    codes.reserve(feedback.size());
    for (auto code : feedback) {
        codes.push_back(to_string(code));
    }
    return codes;
}

StrengthResult StrengthScorer::score(std::string_view password) {
    StrengthResult result;

    if (password.empty()) {
        result.feedback.push_back(FeedbackCode::EmptyPassword);
        return result;
    }

    // Code points, not bytes; invalid UTF-8 falls back to the byte count
    const glong utf8_length = g_utf8_validate(password.data(), static_cast<gssize>(password.size()), nullptr)
        ? g_utf8_strlen(password.data(), static_cast<gssize>(password.size()))
        : static_cast<glong>(password.size());

    int score = 0;

    if (utf8_length >= 8) score += 1;
    else result.feedback.push_back(FeedbackCode::PasswordTooShort);

    if (utf8_length >= 12) score += 1;
    if (utf8_length >= 16) score += 1;

    const auto has = [password](auto predicate) {
        return std::any_of(password.begin(), password.end(), predicate);
    };

    if (has([](char c) { return c >= 'a' && c <= 'z'; })) score += 1;
    else result.feedback.push_back(FeedbackCode::AddLowercase);

    if (has([](char c) { return c >= 'A' && c <= 'Z'; })) score += 1;
    else result.feedback.push_back(FeedbackCode::AddUppercase);

    if (has([](char c) { return c >= '0' && c <= '9'; })) score += 1;
    else result.feedback.push_back(FeedbackCode::AddNumbers);

    if (has([](char c) {
            return !((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'));
        })) score += 1;
    else result.feedback.push_back(FeedbackCode::AddSpecial);

    if (contains_common_pattern(password)) {
        score -= 2;
        result.feedback.push_back(FeedbackCode::AvoidCommonPatterns);
    }

    result.score = std::clamp(score, MIN_SCORE, MAX_SCORE);
    return result;
}

} // namespace ZeroVault
