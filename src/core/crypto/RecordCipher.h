// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

/**
 * @file RecordCipher.h
 * @brief Seals and opens vault records with the session key
 *
 * Wire layout (compatibility contract with the storage collaborator):
 * - nonce: 12 random bytes, lowercase hex (24 characters)
 * - ciphertext: base64( AES-256-GCM(VaultRecord protobuf) || 16-byte tag )
 *
 * Every encrypt() draws a fresh nonce from the OpenSSL CSPRNG, so one key
 * never sees the same nonce twice in practice (2^-96 collision bound).
 */

#pragma once

#include "../RecordTypes.h"
#include "../VaultError.h"
#include "../../utils/SecureMemory.h"
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace ZeroVault {

/**
 * @class RecordCipher
 * @brief Stateless record encryption
 *
 * decrypt() reports every problem (bad encoding, wrong key, tampered bytes,
 * undecodable plaintext) as the single value VaultError::DecryptionFailure
 * and never throws, so a caller cannot learn which step failed.
 *
 * Thread-safety: all methods are thread-safe.
 *
 * @code
 * auto sealed = RecordCipher::encrypt(record, key);
 * if (sealed) {
 *     storage.save(*sealed);
 * }
 *
 * auto opened = RecordCipher::decrypt(storage.load(id), key);
 * if (!opened) {
 *     // wrong key or corrupted record; omit it
 * }
 * @endcode
 */
class RecordCipher {
public:
    /// A successfully decrypted record paired with its storage id
    using DecryptedEntry = std::pair<std::string, PlaintextRecord>;

    /**
     * @brief Encrypt a record under @p key with a fresh random nonce
     *
     * @return CipherRecord with ciphertext, nonce and category_id filled, or
     *         VaultError::SerializationFailed / VaultError::EncryptionFailed
     * @throws std::runtime_error only if the CSPRNG fails
     */
    [[nodiscard]] static VaultResult<CipherRecord> encrypt(
        const PlaintextRecord& plaintext,
        std::span<const uint8_t> key);

    /**
     * @brief Decrypt and authenticate a record
     * @return Plaintext, or VaultError::DecryptionFailure
     */
    [[nodiscard]] static VaultResult<PlaintextRecord> decrypt(
        const CipherRecord& record,
        std::span<const uint8_t> key) noexcept;

    /**
     * @brief Decrypt a list, omitting records that fail
     *
     * Failed records are logged by id only. The result keeps input order.
     */
    [[nodiscard]] static std::vector<DecryptedEntry> decrypt_all(
        std::span<const CipherRecord> records,
        std::span<const uint8_t> key);

    RecordCipher() = delete;
};

} // namespace ZeroVault
