// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

#include <gtest/gtest.h>
#include "../src/utils/Encoding.h"

using namespace ZeroVault;

namespace {

std::vector<uint8_t> bytes_of(std::string_view s) {
    return {s.begin(), s.end()};
}

}  // namespace

// ============================================================================
// Hex
// ============================================================================

TEST(EncodingTest, HexIsLowercase) {
    const std::vector<uint8_t> data{0x00, 0xAB, 0xFF, 0x10};
    EXPECT_EQ(Encoding::to_hex(data), "00abff10");
}

TEST(EncodingTest, HexDecodeAcceptsEitherCase) {
    const auto lower = Encoding::from_hex("deadbeef");
    const auto upper = Encoding::from_hex("DEADBEEF");
    ASSERT_TRUE(lower.has_value());
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(*lower, *upper);
    EXPECT_EQ(*lower, (std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF}));
}

TEST(EncodingTest, HexDecodeRejectsMalformedInput) {
    EXPECT_FALSE(Encoding::from_hex("abc").has_value());     // odd length
    EXPECT_FALSE(Encoding::from_hex("zz").has_value());
    EXPECT_FALSE(Encoding::from_hex("0x12").has_value());
    EXPECT_FALSE(Encoding::from_hex("12 34").has_value());
    EXPECT_TRUE(Encoding::from_hex("").has_value());
}

// ============================================================================
// Base64
// ============================================================================

TEST(EncodingTest, Base64StandardPaddedAlphabet) {
    EXPECT_EQ(Encoding::to_base64(bytes_of("f")), "Zg==");
    EXPECT_EQ(Encoding::to_base64(bytes_of("fo")), "Zm8=");
    EXPECT_EQ(Encoding::to_base64(bytes_of("foo")), "Zm9v");
    EXPECT_EQ(Encoding::to_base64(std::vector<uint8_t>{0xFB, 0xFF}), "+/8=");
}

TEST(EncodingTest, Base64DecodesCanonicalInput) {
    const auto decoded = Encoding::from_base64("Zm9vYmE=");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytes_of("fooba"));
}

TEST(EncodingTest, Base64RejectsNonCanonicalInput) {
    EXPECT_FALSE(Encoding::from_base64("Zm9").has_value());        // length
    EXPECT_FALSE(Encoding::from_base64("Zm9v\n").has_value());     // whitespace
    EXPECT_FALSE(Encoding::from_base64("Zm=v").has_value());       // inner padding
    EXPECT_FALSE(Encoding::from_base64("Z===").has_value());       // too much padding
    EXPECT_FALSE(Encoding::from_base64("Zm9-").has_value());       // url-safe alphabet
    EXPECT_FALSE(Encoding::from_base64("Zm9v!!!!").has_value());
}

TEST(EncodingTest, Base64RejectsNonZeroPaddingBits) {
    ASSERT_TRUE(Encoding::from_base64("QQ==").has_value());
    EXPECT_FALSE(Encoding::from_base64("QR==").has_value());
    EXPECT_FALSE(Encoding::from_base64("QX==").has_value());

    ASSERT_TRUE(Encoding::from_base64("QUE=").has_value());
    EXPECT_FALSE(Encoding::from_base64("QUF=").has_value());
    EXPECT_FALSE(Encoding::from_base64("Zm9vYmF=").has_value());
}
