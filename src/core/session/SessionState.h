// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

#ifndef ZEROVAULT_SESSION_STATE_H
#define ZEROVAULT_SESSION_STATE_H

#include <optional>
#include <string>
#include <string_view>

namespace ZeroVault {

/**
 * @brief Session states; only Unlocked holds a key
 *
 * Unauthenticated is both the initial state and the state after logout.
 */
enum class SessionState {
    Unauthenticated,
    Locked,
    Unlocked
};

inline constexpr std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Unauthenticated: return "Unauthenticated";
        case SessionState::Locked:          return "Locked";
        case SessionState::Unlocked:        return "Unlocked";
    }
    return "Unknown";
}

/**
 * @brief What the identity collaborator hands over at login/registration
 */
struct IdentityProfile {
    std::string user_id;
    std::string salt_hex;         ///< 64 hex digits, issued once per account
    /// Clamped to 1..60 by the session; unset means the configured default
    std::optional<int> auto_lock_minutes;
};

} // namespace ZeroVault

#endif // ZEROVAULT_SESSION_STATE_H
