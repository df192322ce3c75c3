// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

#include "KeyDerivation.h"
#include "CryptoPrimitives.h"
#include "../../utils/Encoding.h"
#include "../../utils/Log.h"
#include "../../utils/SettingsValidator.h"
#include <argon2.h>
#include <algorithm>
#include <cctype>

namespace ZeroVault {

bool KeyDerivation::is_well_formed_salt(std::string_view salt_hex) noexcept {
    if (salt_hex.size() != SALT_LENGTH * 2) {
        return false;
    }
    return std::all_of(salt_hex.begin(), salt_hex.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
}

VaultResult<SessionKey> KeyDerivation::derive(
    std::string_view secret,
    std::string_view salt_hex,
    const Parameters& params) noexcept {

    if (!is_well_formed_salt(salt_hex)) {
        // Length only; the salt is not secret but there is no reason to echo it
        Log::error("KeyDerivation: Malformed salt ({} characters, expected {} hex digits)",
                   salt_hex.size(), SALT_LENGTH * 2);
        return std::unexpected(VaultError::MalformedSalt);
    }

    const auto salt = Encoding::from_hex(salt_hex);
    if (!salt) {
        return std::unexpected(VaultError::MalformedSalt);
    }

    switch (params.algorithm) {
        case Algorithm::PBKDF2_HMAC_SHA256:
            return derive_pbkdf2(secret, *salt, params.pbkdf2_iterations);

        case Algorithm::ARGON2ID:
            return derive_argon2id(
                secret, *salt,
                params.argon2_memory_kb,
                params.argon2_time_cost,
                params.argon2_parallelism);
    }

    Log::error("KeyDerivation: Unsupported algorithm: {}",
               static_cast<int>(params.algorithm));
    return std::unexpected(VaultError::UnsupportedAlgorithm);
}

VaultResult<SessionKey> KeyDerivation::derive_pbkdf2(
    std::string_view secret,
    std::span<const uint8_t> salt,
    uint32_t iterations) noexcept {

    const uint32_t clamped = std::clamp(iterations, MIN_PBKDF2_ITERATIONS, MAX_PBKDF2_ITERATIONS);
    if (clamped != iterations) {
        Log::warning("KeyDerivation: PBKDF2 iterations {} clamped to {}", iterations, clamped);
    }

    SessionKey key;
    if (!CryptoPrimitives::pbkdf2_sha256(secret, salt, clamped, key)) {
        Log::error("KeyDerivation: PBKDF2 failed");
        return std::unexpected(VaultError::KeyDerivationFailed);
    }

    Log::debug("KeyDerivation: PBKDF2 key derived ({} iterations)", clamped);
    return key;
}

VaultResult<SessionKey> KeyDerivation::derive_argon2id(
    std::string_view secret,
    std::span<const uint8_t> salt,
    uint32_t memory_kb,
    uint32_t time_cost,
    uint8_t parallelism) noexcept {

    SessionKey key(CryptoPrimitives::KEY_LENGTH);

    int result = argon2id_hash_raw(
        time_cost,
        memory_kb,
        parallelism,
        secret.data(),
        secret.size(),
        salt.data(),
        salt.size(),
        key.data(),
        key.size()
    );

    if (result != ARGON2_OK) {
        Log::error("KeyDerivation: Argon2id derivation failed: {}",
                   argon2_error_message(result));
        return std::unexpected(VaultError::KeyDerivationFailed);
    }

    Log::debug("KeyDerivation: Argon2id key derived "
               "({} KB memory, {} iterations, {} threads)",
               memory_kb, time_cost, parallelism);
    return key;
}

std::string KeyDerivation::generate_salt() {
    const auto bytes = CryptoPrimitives::random_bytes(SALT_LENGTH);
    return Encoding::to_hex(bytes);
}

KeyDerivation::Parameters KeyDerivation::parameters_from_settings(
    const Glib::RefPtr<Gio::Settings>& settings) noexcept {

    Parameters params;

    if (!settings) {
        Log::warning("KeyDerivation: null settings, using defaults");
        return params;
    }

    try {
        params.algorithm = SettingsValidator::get_kdf_algorithm(settings) == "argon2id"
            ? Algorithm::ARGON2ID
            : Algorithm::PBKDF2_HMAC_SHA256;
    } catch (const std::exception& e) {
        Log::warning("KeyDerivation: Could not read kdf-algorithm ({}), using PBKDF2", e.what());
        params.algorithm = Algorithm::PBKDF2_HMAC_SHA256;
    }

    params.pbkdf2_iterations = SettingsValidator::get_pbkdf2_iterations(settings);
    params.argon2_memory_kb = SettingsValidator::get_argon2_memory_kb(settings);
    params.argon2_time_cost = SettingsValidator::get_argon2_iterations(settings);
    params.argon2_parallelism = 4;

    Log::debug("KeyDerivation: Parameters from settings - "
               "PBKDF2: {} iterations, Argon2: {} KB / {} iterations / {} threads",
               params.pbkdf2_iterations, params.argon2_memory_kb,
               params.argon2_time_cost, params.argon2_parallelism);

    return params;
}

} // namespace ZeroVault
