// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

#ifndef ZEROVAULT_PASSWORD_GENERATOR_H
#define ZEROVAULT_PASSWORD_GENERATOR_H

#include <string>
#include <string_view>
#include <vector>

namespace ZeroVault {

/**
 * @brief Character-class policy for generated passwords
 *
 * At least one include flag must be set; if all four are cleared the
 * generator turns include_lower back on.
 */
struct PasswordPolicy {
    int length = 16;                  ///< Clamped to [MIN_LENGTH, MAX_LENGTH]
    bool include_upper = true;
    bool include_lower = true;
    bool include_digits = true;
    bool include_symbols = true;
    bool exclude_ambiguous = false;   ///< Drop i/l/o, I/L/O, 0/1
};

/**
 * @brief Random password generation with per-class coverage
 *
 * Algorithm:
 * 1. Build the alphabet as the union of the selected class alphabets.
 * 2. Draw every character independently and uniformly from it using the
 *    OpenSSL CSPRNG (rejection sampling, no modulo bias).
 * 3. For each selected class, overwrite one uniformly chosen position with
 *    a uniformly chosen character of that class.
 *
 * Step 3 redraws a position that an earlier class already claimed, so every
 * class keeps its injected character and the output always contains each
 * selected class (length >= 8 > number of classes). Slots stay uniformly
 * random among the unclaimed ones; nothing is placed at a fixed index.
 *
 * Stateless and thread-safe.
 */
class PasswordGenerator {
public:
    static constexpr int MIN_LENGTH = 8;
    static constexpr int MAX_LENGTH = 128;

    static constexpr std::string_view LOWERCASE = "abcdefghijklmnopqrstuvwxyz";
    static constexpr std::string_view UPPERCASE = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    static constexpr std::string_view DIGITS = "0123456789";
    static constexpr std::string_view SYMBOLS = "!@#$%^&*()_+-=[]{}|;:,.<>?";

    static constexpr std::string_view LOWERCASE_UNAMBIGUOUS = "abcdefghjkmnpqrstuvwxyz";
    static constexpr std::string_view UPPERCASE_UNAMBIGUOUS = "ABCDEFGHJKMNPQRSTUVWXYZ";
    static constexpr std::string_view DIGITS_UNAMBIGUOUS = "23456789";

    /**
     * @brief Generate a password for @p policy
     *
     * Out-of-range lengths are clamped (and logged), not rejected.
     *
     * @throws std::runtime_error if the CSPRNG fails
     */
    [[nodiscard]] static std::string generate(const PasswordPolicy& policy);

    /**
     * @brief Apply the silent corrections generate() performs
     *
     * Clamps the length and forces include_lower when no class is selected.
     */
    [[nodiscard]] static PasswordPolicy normalize(const PasswordPolicy& policy) noexcept;

    /**
     * @brief Alphabets of the classes selected by @p policy, in the order
     *        lower, upper, digits, symbols
     */
    [[nodiscard]] static std::vector<std::string_view> class_alphabets(const PasswordPolicy& policy);

    PasswordGenerator() = delete;
};

} // namespace ZeroVault

#endif // ZEROVAULT_PASSWORD_GENERATOR_H
