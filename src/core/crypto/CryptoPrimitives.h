// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

#ifndef ZEROVAULT_CRYPTO_PRIMITIVES_H
#define ZEROVAULT_CRYPTO_PRIMITIVES_H

#include "../../utils/SecureMemory.h"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace ZeroVault {

/**
 * @brief Thin layer over the OpenSSL primitives the core is built from
 *
 * - PBKDF2-HMAC-SHA256 key stretching
 * - AES-256-GCM authenticated encryption
 * - OpenSSL CSPRNG (RAND_bytes)
 *
 * Higher layers (KeyDerivation, RecordCipher) decide policy: salt format,
 * nonce handling, record encoding. This class only validates sizes and
 * reports success or failure.
 *
 * Stateless and thread-safe; all methods are static.
 *
 * @code
 * auto nonce = CryptoPrimitives::random_bytes(CryptoPrimitives::NONCE_LENGTH);
 * std::vector<uint8_t> sealed;
 * if (!CryptoPrimitives::aes_gcm_encrypt(plaintext, key, nonce, sealed)) {
 *     // handle error
 * }
 * @endcode
 */
class CryptoPrimitives {
public:
    static constexpr size_t KEY_LENGTH = 32;     ///< AES-256 key (256 bits)
    static constexpr size_t NONCE_LENGTH = 12;   ///< GCM nonce (96 bits)
    static constexpr size_t TAG_LENGTH = 16;     ///< GCM tag (128 bits)

    /**
     * @brief PBKDF2-HMAC-SHA256
     *
     * @param secret Passphrase bytes (UTF-8)
     * @param salt Salt bytes
     * @param iterations Iteration count (work factor)
     * @param out Receives KEY_LENGTH bytes
     * @return true on success
     */
    [[nodiscard]] static bool pbkdf2_sha256(
        std::string_view secret,
        std::span<const uint8_t> salt,
        uint32_t iterations,
        SessionKey& out);

    /**
     * @brief Encrypt with AES-256-GCM
     *
     * @param plaintext Data to encrypt
     * @param key KEY_LENGTH bytes
     * @param nonce NONCE_LENGTH bytes, never reused with the same key
     * @param ciphertext Receives ciphertext with the 16-byte tag appended
     * @return true on success
     *
     * @warning Reusing a nonce with the same key breaks GCM confidentiality
     *          and authenticity.
     */
    [[nodiscard]] static bool aes_gcm_encrypt(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::vector<uint8_t>& ciphertext);

    /**
     * @brief Decrypt and authenticate AES-256-GCM output
     *
     * @param ciphertext Ciphertext with the tag appended
     * @param key KEY_LENGTH bytes
     * @param nonce NONCE_LENGTH bytes
     * @param plaintext Receives the plaintext; only meaningful on success
     * @return false on size errors or tag mismatch
     */
    [[nodiscard]] static bool aes_gcm_decrypt(
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        SecureVector<uint8_t>& plaintext);

    /**
     * @brief Cryptographically secure random bytes
     * @throws std::runtime_error if the CSPRNG fails
     */
    [[nodiscard]] static std::vector<uint8_t> random_bytes(size_t length);

    /**
     * @brief Uniform random integer in [0, upper_bound)
     *
     * Rejection sampling over RAND_bytes, so there is no modulo bias.
     *
     * @pre upper_bound > 0
     * @throws std::runtime_error if the CSPRNG fails
     */
    [[nodiscard]] static uint32_t random_uniform(uint32_t upper_bound);

    CryptoPrimitives() = delete;
    ~CryptoPrimitives() = delete;
    CryptoPrimitives(const CryptoPrimitives&) = delete;
    CryptoPrimitives& operator=(const CryptoPrimitives&) = delete;
};

}  // namespace ZeroVault

#endif  // ZEROVAULT_CRYPTO_PRIMITIVES_H
