// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

/**
 * @file Encoding.h
 * @brief Text encodings used by the persisted record layout
 *
 * Ciphertext travels as standard padded base64, nonces and salts as
 * lowercase hex. Both decoders are strict and report malformed input as
 * std::nullopt rather than throwing.
 */

#ifndef ZEROVAULT_ENCODING_H
#define ZEROVAULT_ENCODING_H

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ZeroVault::Encoding {

[[nodiscard]] std::string to_hex(std::span<const uint8_t> bytes);

/**
 * @brief Decode a hex string (either case, no separators)
 * @return Decoded bytes, or std::nullopt on odd length or a non-hex digit
 */
[[nodiscard]] std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);

[[nodiscard]] std::string to_base64(std::span<const uint8_t> bytes);

/**
 * @brief Decode standard padded base64
 *
 * Input must consist only of the base64 alphabet and padding, with a length
 * that is a multiple of four. Whitespace is rejected.
 *
 * @return Decoded bytes, or std::nullopt if the input is not canonical base64
 */
[[nodiscard]] std::optional<std::vector<uint8_t>> from_base64(std::string_view text);

} // namespace ZeroVault::Encoding

#endif // ZEROVAULT_ENCODING_H
