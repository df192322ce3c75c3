// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

#include "../src/utils/SettingsValidator.h"
#include "../src/core/crypto/KeyDerivation.h"
#include "../src/core/session/SessionLifecycle.h"
#include "../src/ui/controllers/ClipboardGuard.h"
#include "FakeClipboard.h"
#include "FakeScheduler.h"
#include <gtest/gtest.h>
#include <giomm/init.h>
#include <giomm/settings.h>
#include <glibmm/miscutils.h>
#include <cstdlib>

using namespace ZeroVault;

/**
 * @brief Test fixture for SettingsValidator tests
 *
 * Needs the compiled schema; the build points GSETTINGS_SCHEMA_DIR at it.
 * Values go to the in-memory backend, never to the user's dconf database.
 */
class SettingsValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Glib::setenv("GSETTINGS_BACKEND", "memory", true);
        Gio::init();

        const char* schema_dir = std::getenv("GSETTINGS_SCHEMA_DIR");
        if (!schema_dir) {
            GTEST_SKIP() << "GSETTINGS_SCHEMA_DIR not set";
        }

        settings = SettingsValidator::open();
        if (!settings) {
            GTEST_SKIP() << "Schema " << SettingsValidator::SCHEMA_ID << " not installed";
        }
    }

    void TearDown() override {
        if (settings) {
            for (const char* key : {"auto-lock-minutes", "clipboard-clear-timeout",
                                    "kdf-algorithm", "pbkdf2-iterations",
                                    "argon2-memory-kb", "argon2-iterations",
                                    "generator-default-length"}) {
                settings->reset(key);
            }
        }
    }

    Glib::RefPtr<Gio::Settings> settings;
};

/**
 * @brief Schema defaults are what the core assumes when no settings exist
 */
TEST_F(SettingsValidatorTest, DefaultsMatchCoreDefaults) {
    EXPECT_EQ(SettingsValidator::get_auto_lock_minutes(settings), 15);
    EXPECT_EQ(SettingsValidator::get_clipboard_timeout(settings), 30);
    EXPECT_EQ(SettingsValidator::get_kdf_algorithm(settings), "pbkdf2");
    EXPECT_EQ(SettingsValidator::get_pbkdf2_iterations(settings), 100000u);
    EXPECT_EQ(SettingsValidator::get_generator_length(settings), 16);
}

TEST_F(SettingsValidatorTest, AutoLockMinutesWithinRange) {
    settings->set_int("auto-lock-minutes", 1);
    EXPECT_EQ(SettingsValidator::get_auto_lock_minutes(settings), 1);

    settings->set_int("auto-lock-minutes", 60);
    EXPECT_EQ(SettingsValidator::get_auto_lock_minutes(settings), 60);
}

TEST_F(SettingsValidatorTest, ClipboardTimeoutWithinRange) {
    settings->set_int("clipboard-clear-timeout", 5);
    EXPECT_EQ(SettingsValidator::get_clipboard_timeout(settings), 5);

    settings->set_int("clipboard-clear-timeout", 300);
    EXPECT_EQ(SettingsValidator::get_clipboard_timeout(settings), 300);
}

/**
 * @brief Derivation parameters follow the stored algorithm and work factors
 */
TEST_F(SettingsValidatorTest, KeyDerivationParametersFromSettings) {
    settings->set_string("kdf-algorithm", "argon2id");
    settings->set_uint("argon2-memory-kb", 131072);
    settings->set_uint("argon2-iterations", 4);
    settings->set_uint("pbkdf2-iterations", 200000);

    const auto params = KeyDerivation::parameters_from_settings(settings);
    EXPECT_EQ(params.algorithm, KeyDerivation::Algorithm::ARGON2ID);
    EXPECT_EQ(params.argon2_memory_kb, 131072u);
    EXPECT_EQ(params.argon2_time_cost, 4u);
    EXPECT_EQ(params.pbkdf2_iterations, 200000u);
}

TEST_F(SettingsValidatorTest, GeneratorLengthWithinRange) {
    settings->set_int("generator-default-length", 24);
    EXPECT_EQ(SettingsValidator::get_generator_length(settings), 24);
}

// ============================================================================
// Consumers
// ============================================================================

TEST_F(SettingsValidatorTest, ClipboardGuardTakesTimeoutFromSettings) {
    FakeClipboard clipboard;
    FakeScheduler scheduler;
    ClipboardGuard guard(clipboard, scheduler);

    settings->set_int("clipboard-clear-timeout", 10);
    guard.apply_settings(settings);
    EXPECT_EQ(guard.get_clear_timeout_seconds(), 10);

    ASSERT_TRUE(guard.copy_with_auto_clear("s3cret"));
    scheduler.advance(std::chrono::seconds(10));
    EXPECT_EQ(clipboard.content, "");
}

TEST_F(SettingsValidatorTest, ClipboardGuardKeepsTimeoutWithoutSettings) {
    FakeClipboard clipboard;
    FakeScheduler scheduler;
    ClipboardGuard guard(clipboard, scheduler);

    guard.apply_settings({});
    EXPECT_EQ(guard.get_clear_timeout_seconds(), ClipboardGuard::DEFAULT_CLEAR_TIMEOUT);
}

TEST_F(SettingsValidatorTest, SessionTakesDefaultAutoLockFromSettings) {
    FakeScheduler scheduler;
    KeyDerivation::Parameters params;
    params.pbkdf2_iterations = KeyDerivation::MIN_PBKDF2_ITERATIONS;
    SessionLifecycle session(scheduler, params);

    settings->set_int("auto-lock-minutes", 7);
    session.apply_settings(settings);

    IdentityProfile profile;
    profile.user_id = "user-1";
    profile.salt_hex = KeyDerivation::generate_salt();
    ASSERT_TRUE(session.login("secret", profile).has_value());
    EXPECT_EQ(session.auto_lock_duration(), std::chrono::minutes(7));
}

/**
 * @brief Validator ranges match the schema ranges
 *
 * Even if the schema file is edited to allow weaker values, the validator
 * clamps them back.
 */
TEST(SettingsValidatorConstantsTest, RangesMatchSchema) {
    EXPECT_EQ(SettingsValidator::MIN_AUTO_LOCK_MINUTES, 1);
    EXPECT_EQ(SettingsValidator::MAX_AUTO_LOCK_MINUTES, 60);
    EXPECT_EQ(SettingsValidator::MIN_CLIPBOARD_TIMEOUT, 5);
    EXPECT_EQ(SettingsValidator::MAX_CLIPBOARD_TIMEOUT, 300);
    EXPECT_EQ(SettingsValidator::MIN_PBKDF2_ITERATIONS, KeyDerivation::MIN_PBKDF2_ITERATIONS);
    EXPECT_EQ(SettingsValidator::MAX_PBKDF2_ITERATIONS, KeyDerivation::MAX_PBKDF2_ITERATIONS);
    EXPECT_EQ(SettingsValidator::MIN_GENERATOR_LENGTH, 8);
    EXPECT_EQ(SettingsValidator::MAX_GENERATOR_LENGTH, 128);
}
