// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

#include "PasswordGenerator.h"
#include "crypto/CryptoPrimitives.h"
#include "../utils/Log.h"
#include <algorithm>

namespace ZeroVault {

PasswordPolicy PasswordGenerator::normalize(const PasswordPolicy& policy) noexcept {
    PasswordPolicy result = policy;
    result.length = std::clamp(policy.length, MIN_LENGTH, MAX_LENGTH);

    if (!result.include_upper && !result.include_lower &&
        !result.include_digits && !result.include_symbols) {
        result.include_lower = true;
    }
    return result;
}

std::vector<std::string_view> PasswordGenerator::class_alphabets(const PasswordPolicy& policy) {
    std::vector<std::string_view> classes;
    if (policy.include_lower) {
        classes.push_back(policy.exclude_ambiguous ? LOWERCASE_UNAMBIGUOUS : LOWERCASE);
    }
    if (policy.include_upper) {
        classes.push_back(policy.exclude_ambiguous ? UPPERCASE_UNAMBIGUOUS : UPPERCASE);
    }
    if (policy.include_digits) {
        classes.push_back(policy.exclude_ambiguous ? DIGITS_UNAMBIGUOUS : DIGITS);
    }
    if (policy.include_symbols) {
        classes.push_back(SYMBOLS);
    }
    return classes;
}

std::string PasswordGenerator::generate(const PasswordPolicy& requested) {
    const PasswordPolicy policy = normalize(requested);

    if (policy.length != requested.length) {
        Log::warning("PasswordGenerator: Length {} clamped to {} (valid range: {}-{})",
                     requested.length, policy.length, MIN_LENGTH, MAX_LENGTH);
    }
    if (policy.include_lower != requested.include_lower) {
        Log::debug("PasswordGenerator: No character class selected, using lowercase");
    }

    const auto classes = class_alphabets(policy);

    std::string charset;
    for (const auto& alphabet : classes) {
        charset.append(alphabet);
    }

    const auto pick = [](std::string_view alphabet) {
        return alphabet[CryptoPrimitives::random_uniform(static_cast<uint32_t>(alphabet.size()))];
    };

    std::string password;
    password.reserve(static_cast<size_t>(policy.length));
    for (int i = 0; i < policy.length; ++i) {
        password.push_back(pick(charset));
    }

    // Coverage pass: one random slot per selected class, redrawn if already claimed
    std::vector<bool> claimed(static_cast<size_t>(policy.length), false);
    for (const auto& alphabet : classes) {
        uint32_t pos = 0;
        do {
            pos = CryptoPrimitives::random_uniform(static_cast<uint32_t>(policy.length));
        } while (claimed[pos]);
        claimed[pos] = true;
        password[pos] = pick(alphabet);
    }

    return password;
}

} // namespace ZeroVault
