// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

/**
 * @file test_key_derivation.cc
 * @brief Unit tests for KeyDerivation (PBKDF2-HMAC-SHA256 and Argon2id)
 */

#include <gtest/gtest.h>
#include "../src/core/crypto/KeyDerivation.h"
#include "../src/core/crypto/CryptoPrimitives.h"
#include "../src/utils/Encoding.h"
#include <cctype>

using namespace ZeroVault;

// ============================================================================
// Test Fixture
// ============================================================================

class KeyDerivationTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Lowest accepted work factor keeps the suite fast
        fast_params.algorithm = KeyDerivation::Algorithm::PBKDF2_HMAC_SHA256;
        fast_params.pbkdf2_iterations = KeyDerivation::MIN_PBKDF2_ITERATIONS;

        salt_a = std::string(64, 'a');
        salt_b = "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff";
    }

    KeyDerivation::Parameters fast_params;
    std::string salt_a;
    std::string salt_b;
};

// ============================================================================
// Determinism and separation
// ============================================================================

TEST_F(KeyDerivationTest, SameInputsGiveSameKey) {
    auto first = KeyDerivation::derive("TestPassword123!", salt_a, fast_params);
    auto second = KeyDerivation::derive("TestPassword123!", salt_a, fast_params);

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->size(), CryptoPrimitives::KEY_LENGTH);
    EXPECT_EQ(*first, *second);
}

TEST_F(KeyDerivationTest, DifferentSaltsGiveDifferentKeys) {
    auto with_a = KeyDerivation::derive("TestPassword123!", salt_a, fast_params);
    auto with_b = KeyDerivation::derive("TestPassword123!", salt_b, fast_params);

    ASSERT_TRUE(with_a.has_value());
    ASSERT_TRUE(with_b.has_value());
    EXPECT_NE(*with_a, *with_b);
}

TEST_F(KeyDerivationTest, DifferentSecretsGiveDifferentKeys) {
    auto first = KeyDerivation::derive("TestPassword123!", salt_a, fast_params);
    auto second = KeyDerivation::derive("TestPassword123?", salt_a, fast_params);

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*first, *second);
}

TEST_F(KeyDerivationTest, SaltIsDecodedFromHexBeforeUse) {
    auto derived = KeyDerivation::derive("secret", salt_b, fast_params);
    ASSERT_TRUE(derived.has_value());

    const auto salt_bytes = Encoding::from_hex(salt_b);
    ASSERT_TRUE(salt_bytes.has_value());
    SessionKey expected;
    ASSERT_TRUE(CryptoPrimitives::pbkdf2_sha256("secret", *salt_bytes,
                                                KeyDerivation::MIN_PBKDF2_ITERATIONS, expected));
    EXPECT_EQ(*derived, expected);
}

TEST_F(KeyDerivationTest, UppercaseHexSaltMatchesLowercase) {
    std::string upper = salt_b;
    for (char& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    auto lower_key = KeyDerivation::derive("secret", salt_b, fast_params);
    auto upper_key = KeyDerivation::derive("secret", upper, fast_params);
    ASSERT_TRUE(lower_key.has_value());
    ASSERT_TRUE(upper_key.has_value());
    EXPECT_EQ(*lower_key, *upper_key);
}

TEST_F(KeyDerivationTest, IterationsBelowMinimumAreClamped) {
    KeyDerivation::Parameters weak = fast_params;
    weak.pbkdf2_iterations = 1;

    auto clamped = KeyDerivation::derive("secret", salt_a, weak);
    auto minimum = KeyDerivation::derive("secret", salt_a, fast_params);
    ASSERT_TRUE(clamped.has_value());
    ASSERT_TRUE(minimum.has_value());
    EXPECT_EQ(*clamped, *minimum);
}

// ============================================================================
// Malformed salt
// ============================================================================

TEST_F(KeyDerivationTest, MalformedSaltIsRejected) {
    const std::vector<std::string> bad_salts = {
        "",
        std::string(63, 'a'),
        std::string(65, 'a'),
        std::string(62, 'a') + "zz",
        std::string(32, 'a'),
        "c2FsdA==" + std::string(56, 'a'),
    };

    for (const auto& salt : bad_salts) {
        EXPECT_FALSE(KeyDerivation::is_well_formed_salt(salt)) << salt;
        auto result = KeyDerivation::derive("secret", salt, fast_params);
        ASSERT_FALSE(result.has_value()) << salt;
        EXPECT_EQ(result.error(), VaultError::MalformedSalt);
    }
}

TEST_F(KeyDerivationTest, MalformedSaltMessageIsGeneric) {
    EXPECT_EQ(to_string(VaultError::MalformedSalt), "Cannot process credentials");
}

// ============================================================================
// Salt generation
// ============================================================================

TEST_F(KeyDerivationTest, GeneratedSaltIsWellFormedAndUnique) {
    const std::string first = KeyDerivation::generate_salt();
    const std::string second = KeyDerivation::generate_salt();

    EXPECT_EQ(first.size(), 64u);
    EXPECT_TRUE(KeyDerivation::is_well_formed_salt(first));
    EXPECT_EQ(first.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_NE(first, second);
}

// ============================================================================
// Argon2id
// ============================================================================

TEST_F(KeyDerivationTest, Argon2idIsDeterministicAndDistinctFromPbkdf2) {
    KeyDerivation::Parameters argon;
    argon.algorithm = KeyDerivation::Algorithm::ARGON2ID;
    argon.argon2_memory_kb = 8192;
    argon.argon2_time_cost = 1;
    argon.argon2_parallelism = 1;

    auto first = KeyDerivation::derive("secret", salt_a, argon);
    auto second = KeyDerivation::derive("secret", salt_a, argon);
    auto pbkdf2 = KeyDerivation::derive("secret", salt_a, fast_params);

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(pbkdf2.has_value());
    EXPECT_EQ(first->size(), CryptoPrimitives::KEY_LENGTH);
    EXPECT_EQ(*first, *second);
    EXPECT_NE(*first, *pbkdf2);
}

TEST_F(KeyDerivationTest, NullSettingsGiveDefaults) {
    const auto params = KeyDerivation::parameters_from_settings({});
    EXPECT_EQ(params.algorithm, KeyDerivation::Algorithm::PBKDF2_HMAC_SHA256);
    EXPECT_EQ(params.pbkdf2_iterations, KeyDerivation::DEFAULT_PBKDF2_ITERATIONS);
}
