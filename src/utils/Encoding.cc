// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

#include "Encoding.h"
#include <glibmm/base64.h>
#include <array>

namespace ZeroVault::Encoding {

namespace {

constexpr std::array<char, 16> HEX_DIGITS = {
    '0', '1', '2', '3', '4', '5', '6', '7',
    '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'
};

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

int base64_value(char c) noexcept {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

}  // namespace

std::string to_hex(std::span<const uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

std::optional<std::vector<uint8_t>> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        const int hi = hex_value(hex[i]);
        const int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string to_base64(std::span<const uint8_t> bytes) {
    const std::string raw(bytes.begin(), bytes.end());
    return Glib::Base64::encode(raw);
}

std::optional<std::vector<uint8_t>> from_base64(std::string_view text) {
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }

    // g_base64_decode() silently skips invalid characters, so validate first
    size_t padding = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '=') {
            // Padding is only legal in the last two positions
            if (i + 2 < text.size()) {
                return std::nullopt;
            }
            ++padding;
        } else if (padding > 0 || base64_value(c) < 0) {
            return std::nullopt;
        }
    }

    // The bits below the last full byte must be zero ("QR==" is not "QQ==")
    if (padding > 0) {
        const int last = base64_value(text[text.size() - padding - 1]);
        const int unused_mask = (padding == 1) ? 0x03 : 0x0F;
        if ((last & unused_mask) != 0) {
            return std::nullopt;
        }
    }

    const std::string decoded = Glib::Base64::decode(std::string(text));
    return std::vector<uint8_t>(decoded.begin(), decoded.end());
}

} // namespace ZeroVault::Encoding
