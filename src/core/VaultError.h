// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors
//
// VaultError.h - Error types for the cryptographic core
// C++23 std::expected-based error handling

#ifndef ZEROVAULT_VAULT_ERROR_H
#define ZEROVAULT_VAULT_ERROR_H

#include <expected>
#include <string_view>

namespace ZeroVault {

// Failures that cross the core's public boundary. Cryptographic failures are
// deliberately coarse: callers cannot tell which step of a decrypt failed.
enum class VaultError {
    // Key derivation
    MalformedSalt,
    KeyDerivationFailed,
    UnsupportedAlgorithm,

    // Record encryption
    EncryptionFailed,
    DecryptionFailure,
    SerializationFailed,

    // Session
    InvalidCredentials,
    NotAuthenticated,
    TransitionSuperseded,

    // Clipboard
    ClipboardUnavailable
};

// Messages are safe to show to a user; none of them names a cryptographic step.
inline constexpr std::string_view to_string(VaultError error) noexcept {
    switch (error) {
        case VaultError::MalformedSalt:
            return "Cannot process credentials";
        case VaultError::KeyDerivationFailed:
            return "Cannot process credentials";
        case VaultError::UnsupportedAlgorithm:
            return "Unsupported key derivation algorithm";
        case VaultError::EncryptionFailed:
            return "Encryption failed";
        case VaultError::DecryptionFailure:
            return "Cannot decrypt";
        case VaultError::SerializationFailed:
            return "Failed to serialize record";
        case VaultError::InvalidCredentials:
            return "Invalid credentials";
        case VaultError::NotAuthenticated:
            return "No active session";
        case VaultError::TransitionSuperseded:
            return "Session changed during the operation";
        case VaultError::ClipboardUnavailable:
            return "Clipboard unavailable";
    }
    return "Unknown error";
}

template<typename T = void>
using VaultResult = std::expected<T, VaultError>;

} // namespace ZeroVault

#endif // ZEROVAULT_VAULT_ERROR_H
