// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

/**
 * @file RecordSerialization.h
 * @brief Canonical byte form of a PlaintextRecord
 *
 * Records are encoded as a zerovault.VaultRecord protobuf message with
 * deterministic serialization. The bytes produced here are plaintext and
 * are only ever handed to RecordCipher for sealing.
 */

#ifndef ZEROVAULT_RECORD_SERIALIZATION_H
#define ZEROVAULT_RECORD_SERIALIZATION_H

#include "../VaultError.h"
#include "../RecordTypes.h"
#include "../../utils/SecureMemory.h"
#include <cstdint>
#include <span>

namespace ZeroVault {

/**
 * @class RecordSerialization
 * @brief Static conversion between PlaintextRecord and protobuf bytes
 *
 * ## Thread Safety
 * All methods are thread-safe; they only touch their arguments.
 */
class RecordSerialization {
public:
    /// Value written to VaultRecord.schema_version
    static constexpr uint32_t CURRENT_SCHEMA_VERSION = 1;

    /// Upper bound on a single serialized record
    static constexpr size_t MAX_RECORD_SIZE = 1024 * 1024;

    /**
     * @brief Encode a record
     * @return Serialized bytes in zeroizing memory, or VaultError::SerializationFailed
     *         (oversized record or non-UTF-8 field)
     */
    [[nodiscard]] static VaultResult<SecureVector<uint8_t>> serialize(const PlaintextRecord& record);

    /**
     * @brief Decode a record
     * @return Record, or VaultError::DecryptionFailure for any malformed input
     *
     * Decode failures are reported with the same error as a failed tag check
     * so that callers cannot distinguish the two.
     */
    [[nodiscard]] static VaultResult<PlaintextRecord> deserialize(std::span<const uint8_t> data);

    RecordSerialization() = delete;
};

} // namespace ZeroVault

#endif // ZEROVAULT_RECORD_SERIALIZATION_H
