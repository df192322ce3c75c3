// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

#include "RecordCipher.h"
#include "CryptoPrimitives.h"
#include "../serialization/RecordSerialization.h"
#include "../../utils/Encoding.h"
#include "../../utils/Log.h"

namespace ZeroVault {

VaultResult<CipherRecord> RecordCipher::encrypt(
    const PlaintextRecord& plaintext,
    std::span<const uint8_t> key) {

    if (key.size() != CryptoPrimitives::KEY_LENGTH) {
        Log::error("RecordCipher: Invalid key length {}", key.size());
        return std::unexpected(VaultError::EncryptionFailed);
    }

    auto serialized = RecordSerialization::serialize(plaintext);
    if (!serialized) {
        return std::unexpected(serialized.error());
    }

    const auto nonce = CryptoPrimitives::random_bytes(CryptoPrimitives::NONCE_LENGTH);

    std::vector<uint8_t> sealed;
    if (!CryptoPrimitives::aes_gcm_encrypt(*serialized, key, nonce, sealed)) {
        Log::error("RecordCipher: AES-256-GCM encryption failed");
        return std::unexpected(VaultError::EncryptionFailed);
    }

    CipherRecord out;
    out.ciphertext = Encoding::to_base64(sealed);
    out.nonce = Encoding::to_hex(nonce);
    out.category_id = plaintext.category_id;
    return out;
}

VaultResult<PlaintextRecord> RecordCipher::decrypt(
    const CipherRecord& record,
    std::span<const uint8_t> key) noexcept {

    try {
        const auto nonce = Encoding::from_hex(record.nonce);
        const auto sealed = Encoding::from_base64(record.ciphertext);

        SecureVector<uint8_t> plain;
        const bool opened =
            nonce && sealed &&
            nonce->size() == CryptoPrimitives::NONCE_LENGTH &&
            CryptoPrimitives::aes_gcm_decrypt(*sealed, key, *nonce, plain);

        if (!opened) {
            return std::unexpected(VaultError::DecryptionFailure);
        }

        return RecordSerialization::deserialize(plain);
    } catch (const std::exception&) {
        // Allocation failure on hostile input sizes; same answer as any other failure
        return std::unexpected(VaultError::DecryptionFailure);
    }
}

std::vector<RecordCipher::DecryptedEntry> RecordCipher::decrypt_all(
    std::span<const CipherRecord> records,
    std::span<const uint8_t> key) {

    std::vector<DecryptedEntry> entries;
    entries.reserve(records.size());

    size_t skipped = 0;
    for (const auto& record : records) {
        auto opened = decrypt(record, key);
        if (!opened) {
            ++skipped;
            Log::warning("RecordCipher: Omitting record '{}': {}",
                         record.id, to_string(opened.error()));
            continue;
        }
        entries.emplace_back(record.id, std::move(*opened));
    }

    if (skipped > 0) {
        Log::warning("RecordCipher: {} of {} records could not be decrypted",
                     skipped, records.size());
    }
    return entries;
}

} // namespace ZeroVault
