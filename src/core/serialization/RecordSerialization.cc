// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

#include "RecordSerialization.h"
#include "../../utils/Log.h"
#include "record.pb.h"
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <glib.h>

namespace ZeroVault {

namespace {

bool is_utf8(const std::string& s) noexcept {
    return g_utf8_validate(s.data(), static_cast<gssize>(s.size()), nullptr) == TRUE;
}

// The message owns copies of secret fields; wipe them before it is destroyed
void wipe(zerovault::VaultRecord& message) noexcept {
    secure_clear(*message.mutable_password());
    secure_clear(*message.mutable_notes());
    secure_clear(*message.mutable_username());
}

}  // namespace

VaultResult<SecureVector<uint8_t>>
RecordSerialization::serialize(const PlaintextRecord& record) {
    for (const std::string* field : {&record.title, &record.username, &record.password,
                                     &record.url, &record.notes, &record.category_id}) {
        if (!is_utf8(*field)) {
            Log::error("RecordSerialization: Record contains a field that is not valid UTF-8");
            return std::unexpected(VaultError::SerializationFailed);
        }
    }

    zerovault::VaultRecord message;
    message.set_schema_version(CURRENT_SCHEMA_VERSION);
    message.set_title(record.title);
    message.set_username(record.username);
    message.set_password(record.password);
    message.set_url(record.url);
    message.set_notes(record.notes);
    message.set_category_id(record.category_id);

    const size_t size = message.ByteSizeLong();
    if (size > MAX_RECORD_SIZE) {
        Log::error("RecordSerialization: Record exceeds maximum size ({} bytes > {} bytes)",
                   size, MAX_RECORD_SIZE);
        wipe(message);
        return std::unexpected(VaultError::SerializationFailed);
    }

    SecureVector<uint8_t> bytes(size);
    bool ok = true;
    {
        google::protobuf::io::ArrayOutputStream array_stream(bytes.data(), static_cast<int>(size));
        google::protobuf::io::CodedOutputStream coded(&array_stream);
        coded.SetSerializationDeterministic(true);
        message.SerializeWithCachedSizes(&coded);
        ok = !coded.HadError();
    }
    wipe(message);

    if (!ok) {
        Log::error("RecordSerialization: Failed to serialize VaultRecord");
        return std::unexpected(VaultError::SerializationFailed);
    }
    return bytes;
}

VaultResult<PlaintextRecord>
RecordSerialization::deserialize(std::span<const uint8_t> data) {
    if (data.size() > MAX_RECORD_SIZE) {
        Log::debug("RecordSerialization: Rejecting oversized record ({} bytes)", data.size());
        return std::unexpected(VaultError::DecryptionFailure);
    }

    zerovault::VaultRecord message;
    if (!message.ParseFromArray(data.data(), static_cast<int>(data.size()))) {
        Log::debug("RecordSerialization: VaultRecord parse failed");
        return std::unexpected(VaultError::DecryptionFailure);
    }

    if (message.schema_version() > CURRENT_SCHEMA_VERSION) {
        Log::debug("RecordSerialization: Record schema v{} is newer than v{}",
                   message.schema_version(), CURRENT_SCHEMA_VERSION);
    }

    PlaintextRecord record;
    record.title = message.title();
    record.username = message.username();
    record.password = message.password();
    record.url = message.url();
    record.notes = message.notes();
    record.category_id = message.category_id();
    wipe(message);

    for (const std::string* field : {&record.title, &record.username, &record.password,
                                     &record.url, &record.notes, &record.category_id}) {
        if (!is_utf8(*field)) {
            return std::unexpected(VaultError::DecryptionFailure);
        }
    }

    return record;
}

} // namespace ZeroVault
