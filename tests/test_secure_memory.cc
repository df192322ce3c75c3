// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

/**
 * @file test_secure_memory.cc
 * @brief Tests for the secret-holding helpers in SecureMemory.h
 */

#include <gtest/gtest.h>
#include "../src/utils/SecureMemory.h"
#include <memory>
#include <type_traits>
#include <utility>

using namespace ZeroVault;

// ============================================================================
// String wiping
// ============================================================================

TEST(SecureMemoryTest, SecureClearEmptiesString) {
    std::string secret = "correct horse battery staple";
    secure_clear(secret);
    EXPECT_TRUE(secret.empty());

    std::string empty;
    secure_clear(empty);
    EXPECT_TRUE(empty.empty());
}

TEST(SecureMemoryTest, SecureClearOverwritesBufferInPlace) {
    std::string secret = "correct horse battery staple";
    const char* buffer = secret.data();
    const size_t length = secret.size();

    secure_clear(secret);

    // clear() keeps the allocation, so the old bytes are still addressable
    ASSERT_EQ(secret.data(), buffer);
    for (size_t i = 0; i < length; ++i) {
        EXPECT_EQ(buffer[i], '\0') << "byte " << i;
    }
}

TEST(SecureMemoryTest, SecureClearUstringEmptiesString) {
    Glib::ustring secret("pässwörd");
    secure_clear_ustring(secret);
    EXPECT_TRUE(secret.empty());
}

// ============================================================================
// SecureString
// ============================================================================

TEST(SecureMemoryTest, SecureStringReportsCodePointsAndBytes) {
    SecureString secret{Glib::ustring("pässwörd")};
    EXPECT_FALSE(secret.empty());
    EXPECT_EQ(secret.length(), 8u);
    EXPECT_EQ(secret.bytes(), 10u);
}

TEST(SecureMemoryTest, SecureStringMoveLeavesSourceEmpty) {
    SecureString source{Glib::ustring("master passphrase")};
    SecureString target = std::move(source);

    EXPECT_EQ(target.get(), "master passphrase");
    EXPECT_TRUE(source.empty());  // NOLINT(bugprone-use-after-move)

    SecureString assigned{Glib::ustring("other")};
    assigned = std::move(target);
    EXPECT_EQ(assigned.get(), "master passphrase");
    EXPECT_TRUE(target.empty());  // NOLINT(bugprone-use-after-move)
}

TEST(SecureMemoryTest, SecureStringClear) {
    SecureString secret{Glib::ustring("master passphrase")};
    secret.clear();
    EXPECT_TRUE(secret.empty());
    EXPECT_EQ(secret.bytes(), 0u);
}

// ============================================================================
// SecureVector / SessionKey
// ============================================================================

TEST(SecureMemoryTest, SecureVectorBehavesLikeVector) {
    SessionKey key(32, 0xAB);
    EXPECT_EQ(key.size(), 32u);

    key.resize(64, 0xCD);
    EXPECT_EQ(key[0], 0xAB);
    EXPECT_EQ(key[63], 0xCD);

    SessionKey copy = key;
    EXPECT_EQ(copy, key);

    key.clear();
    key.shrink_to_fit();
    EXPECT_TRUE(key.empty());
    EXPECT_EQ(copy.size(), 64u);
}

TEST(SecureMemoryTest, SecureAllocatorRebinds) {
    using Rebound = std::allocator_traits<SecureAllocator<uint8_t>>::rebind_alloc<char>;
    static_assert(std::is_same_v<Rebound, SecureAllocator<char>>);

    SecureVector<char> text(16, 'x');
    EXPECT_EQ(text.size(), 16u);
}

TEST(SecureMemoryTest, CipherContextIsReleasedByDeleter) {
    EVPCipherContextPtr ctx(EVP_CIPHER_CTX_new());
    ASSERT_NE(ctx, nullptr);
    ctx.reset();
    EXPECT_EQ(ctx, nullptr);
}
