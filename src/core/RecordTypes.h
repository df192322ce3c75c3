// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

#ifndef ZEROVAULT_RECORD_TYPES_H
#define ZEROVAULT_RECORD_TYPES_H

#include "../utils/SecureMemory.h"
#include <string>

namespace ZeroVault {

/**
 * @brief Vault record fields as the caller sees them
 *
 * Created and owned by the caller. The core serializes it during encrypt()
 * and does not keep a copy afterwards. The password field is wiped when the
 * record is destroyed.
 */
struct PlaintextRecord {
    std::string title;
    std::string username;
    std::string password;
    std::string url;
    std::string notes;
    std::string category_id;   ///< Empty if uncategorized

    PlaintextRecord() = default;
    PlaintextRecord(const PlaintextRecord&) = default;
    PlaintextRecord& operator=(const PlaintextRecord&) = default;
    PlaintextRecord(PlaintextRecord&&) noexcept = default;
    PlaintextRecord& operator=(PlaintextRecord&&) noexcept = default;

    ~PlaintextRecord() {
        secure_clear(password);
        secure_clear(notes);
    }

    bool operator==(const PlaintextRecord& other) const = default;
};

/**
 * @brief Encrypted record as exchanged with the storage collaborator
 *
 * The core fills ciphertext and nonce (and copies category_id from the
 * plaintext); id and timestamps are assigned and owned by storage.
 */
struct CipherRecord {
    std::string ciphertext;    ///< base64(AES-256-GCM ciphertext || tag)
    std::string nonce;         ///< 24 lowercase hex digits (96-bit nonce)
    std::string id;
    std::string category_id;
    std::string created_at;
    std::string updated_at;

    bool operator==(const CipherRecord& other) const = default;
};

} // namespace ZeroVault

#endif // ZEROVAULT_RECORD_TYPES_H
