// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

/**
 * @file CommonPatterns.h
 * @brief Substrings that mark a password as predictable
 *
 * Used by StrengthScorer. Matching is a case-insensitive substring search,
 * so "MyPassword!" and "xx123yy" both hit. The list is short on purpose:
 * it is a scoring penalty, not a breach blacklist, and changing it changes
 * every score the scorer reports.
 */

#ifndef ZEROVAULT_COMMON_PATTERNS_H
#define ZEROVAULT_COMMON_PATTERNS_H

#include "../utils/SecureMemory.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <string_view>

namespace ZeroVault {

inline constexpr std::array<std::string_view, 7> COMMON_PATTERNS = {
    "123",
    "abc",
    "qwerty",
    "password",
    "admin",
    "111",
    "aaa",
};

/** @brief Check if @p password contains any common pattern (ASCII case-insensitive)
 *  @param password Password to check
 *  @return true on the first pattern found */
inline bool contains_common_pattern(std::string_view password) {
    std::string lower_pass;
    lower_pass.reserve(password.length());
    for (char c : password) {
        lower_pass += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    const bool found = std::any_of(COMMON_PATTERNS.begin(), COMMON_PATTERNS.end(),
        [&lower_pass](std::string_view pattern) {
            return lower_pass.find(pattern) != std::string::npos;
        });

    secure_clear(lower_pass);
    return found;
}

} // namespace ZeroVault

#endif // ZEROVAULT_COMMON_PATTERNS_H
