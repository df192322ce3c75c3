// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

/**
 * @file KeyDerivation.h
 * @brief Turns (secret, salt) into the session key
 *
 * Responsibilities:
 * - Validate the server-issued salt encoding
 * - Stretch the master secret with a deliberately slow KDF
 * - Return the 256-bit key in zeroizing memory
 *
 * NOT responsible for:
 * - Holding the key (see SessionLifecycle)
 * - Verifying the secret (nothing local can; a wrong secret yields a key
 *   that fails to decrypt existing records)
 *
 * Determinism: the same (secret, salt, parameters) always produce the same
 * key, so login and unlock converge on one key without re-encrypting records.
 */

#pragma once

#include "../VaultError.h"
#include "../../utils/SecureMemory.h"
#include <giomm/settings.h>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace ZeroVault {

/**
 * @class KeyDerivation
 * @brief Stateless password-based key derivation
 *
 * | Algorithm             | Cost (defaults)        | Notes                    |
 * |-----------------------|------------------------|--------------------------|
 * | PBKDF2-HMAC-SHA256    | 100,000 iterations     | Default, record-compatible |
 * | Argon2id              | 64 MB, t=3, p=4        | Memory-hard, opt-in      |
 *
 * Thread-safety: all methods are thread-safe (no shared mutable state).
 *
 * @code
 * auto key = KeyDerivation::derive(secret, profile.salt_hex);
 * if (!key) {
 *     show_error(to_string(key.error()));   // "Cannot process credentials"
 * }
 * @endcode
 */
class KeyDerivation {
public:
    /// Salt size in bytes; the wire form is twice as many hex digits
    static constexpr size_t SALT_LENGTH = 32;

    static constexpr uint32_t DEFAULT_PBKDF2_ITERATIONS = 100000;
    static constexpr uint32_t MIN_PBKDF2_ITERATIONS = 10000;
    static constexpr uint32_t MAX_PBKDF2_ITERATIONS = 10000000;

    enum class Algorithm : uint8_t {
        PBKDF2_HMAC_SHA256 = 0x04,
        ARGON2ID = 0x05
    };

    struct Parameters {
        Algorithm algorithm = Algorithm::PBKDF2_HMAC_SHA256;
        uint32_t pbkdf2_iterations = DEFAULT_PBKDF2_ITERATIONS;
        uint32_t argon2_memory_kb = 65536;
        uint32_t argon2_time_cost = 3;
        uint8_t argon2_parallelism = 4;
    };

    /**
     * @brief Derive the 256-bit session key
     *
     * @param secret Master passphrase (UTF-8); not retained
     * @param salt_hex Salt as exactly 64 hex digits
     * @param params Algorithm and work factor
     * @return Key in secure memory, or:
     *         - VaultError::MalformedSalt if salt_hex is not 64 hex digits
     *         - VaultError::UnsupportedAlgorithm for an unknown algorithm
     *         - VaultError::KeyDerivationFailed if the primitive fails
     *
     * @note Never throws
     */
    [[nodiscard]] static VaultResult<SessionKey> derive(
        std::string_view secret,
        std::string_view salt_hex,
        const Parameters& params = {}) noexcept;

    /**
     * @brief Check salt encoding without deriving
     */
    [[nodiscard]] static bool is_well_formed_salt(std::string_view salt_hex) noexcept;

    /**
     * @brief Fresh random salt in the wire encoding (64 lowercase hex digits)
     * @throws std::runtime_error if the CSPRNG fails
     */
    [[nodiscard]] static std::string generate_salt();

    /**
     * @brief Build parameters from GSettings, clamped to safe ranges
     * @param settings May be null; defaults are returned then
     */
    [[nodiscard]] static Parameters parameters_from_settings(
        const Glib::RefPtr<Gio::Settings>& settings) noexcept;

private:
    [[nodiscard]] static VaultResult<SessionKey> derive_pbkdf2(
        std::string_view secret,
        std::span<const uint8_t> salt,
        uint32_t iterations) noexcept;

    [[nodiscard]] static VaultResult<SessionKey> derive_argon2id(
        std::string_view secret,
        std::span<const uint8_t> salt,
        uint32_t memory_kb,
        uint32_t time_cost,
        uint8_t parallelism) noexcept;
};

} // namespace ZeroVault
