// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

#ifndef ZEROVAULT_SETTINGS_VALIDATOR_H
#define ZEROVAULT_SETTINGS_VALIDATOR_H

#include <algorithm>
#include <cstdint>
#include <string>
#include <giomm/settings.h>
#include <giomm/settingsschemasource.h>

namespace ZeroVault {

/**
 * @brief Reads com.zerovault.core GSettings keys and clamps them to safe ranges
 *
 * The schema already declares ranges, but a modified schema file must not
 * be able to weaken the core (for example a 1-iteration KDF or a clipboard
 * that is never cleared), so every value is clamped again at runtime.
 *
 * @note This is a static utility class and cannot be instantiated.
 */
class SettingsValidator final {
public:
    static inline constexpr const char* SCHEMA_ID = "com.zerovault.core";

    static inline constexpr int MIN_AUTO_LOCK_MINUTES{1};
    static inline constexpr int MAX_AUTO_LOCK_MINUTES{60};
    static inline constexpr int DEFAULT_AUTO_LOCK_MINUTES{15};

    static inline constexpr int MIN_CLIPBOARD_TIMEOUT{5};      // seconds
    static inline constexpr int MAX_CLIPBOARD_TIMEOUT{300};    // 5 minutes
    static inline constexpr int DEFAULT_CLIPBOARD_TIMEOUT{30};

    static inline constexpr uint32_t MIN_PBKDF2_ITERATIONS{10000};
    static inline constexpr uint32_t MAX_PBKDF2_ITERATIONS{10000000};

    static inline constexpr uint32_t MIN_ARGON2_MEMORY_KB{8192};      // 8 MB
    static inline constexpr uint32_t MAX_ARGON2_MEMORY_KB{1048576};   // 1 GB
    static inline constexpr uint32_t MIN_ARGON2_ITERATIONS{1};
    static inline constexpr uint32_t MAX_ARGON2_ITERATIONS{10};

    static inline constexpr int MIN_GENERATOR_LENGTH{8};
    static inline constexpr int MAX_GENERATOR_LENGTH{128};

    /**
     * @brief Open the com.zerovault.core settings
     * @return Settings, or null when the schema is not installed
     *
     * Gio::Settings::create() aborts the process on an unknown schema, so
     * the schema is looked up first. Gio::init() must have been called.
     */
    [[nodiscard]] static Glib::RefPtr<Gio::Settings> open() {
        auto source = Gio::SettingsSchemaSource::get_default();
        if (!source || !source->lookup(SCHEMA_ID, true)) {
            return {};
        }
        return Gio::Settings::create(SCHEMA_ID);
    }

    /**
     * @brief Auto-lock inactivity window in minutes (1-60)
     * @param settings GSettings instance (must not be null)
     */
    [[nodiscard]] static int get_auto_lock_minutes(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const int value{settings->get_int("auto-lock-minutes")};
        return std::clamp(value, MIN_AUTO_LOCK_MINUTES, MAX_AUTO_LOCK_MINUTES);
    }

    /**
     * @brief Clipboard auto-clear timeout in seconds (5-300)
     * @param settings GSettings instance (must not be null)
     */
    [[nodiscard]] static int get_clipboard_timeout(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const int value{settings->get_int("clipboard-clear-timeout")};
        return std::clamp(value, MIN_CLIPBOARD_TIMEOUT, MAX_CLIPBOARD_TIMEOUT);
    }

    [[nodiscard]] static uint32_t get_pbkdf2_iterations(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const uint32_t value{settings->get_uint("pbkdf2-iterations")};
        return std::clamp(value, MIN_PBKDF2_ITERATIONS, MAX_PBKDF2_ITERATIONS);
    }

    [[nodiscard]] static uint32_t get_argon2_memory_kb(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const uint32_t value{settings->get_uint("argon2-memory-kb")};
        return std::clamp(value, MIN_ARGON2_MEMORY_KB, MAX_ARGON2_MEMORY_KB);
    }

    [[nodiscard]] static uint32_t get_argon2_iterations(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const uint32_t value{settings->get_uint("argon2-iterations")};
        return std::clamp(value, MIN_ARGON2_ITERATIONS, MAX_ARGON2_ITERATIONS);
    }

    /**
     * @brief Preferred KDF name, "pbkdf2" or "argon2id"
     *
     * Unknown values read as "pbkdf2" so records stay decryptable by default.
     */
    [[nodiscard]] static std::string get_kdf_algorithm(const Glib::RefPtr<Gio::Settings>& settings) {
        const std::string value{settings->get_string("kdf-algorithm").raw()};
        return value == "argon2id" ? value : std::string{"pbkdf2"};
    }

    /**
     * @brief Default length offered by the password generator (8-128)
     */
    [[nodiscard]] static int get_generator_length(const Glib::RefPtr<Gio::Settings>& settings) noexcept {
        const int value{settings->get_int("generator-default-length")};
        return std::clamp(value, MIN_GENERATOR_LENGTH, MAX_GENERATOR_LENGTH);
    }

private:
    SettingsValidator() = delete;
    ~SettingsValidator() = delete;
    SettingsValidator(const SettingsValidator&) = delete;
    SettingsValidator& operator=(const SettingsValidator&) = delete;
    SettingsValidator(SettingsValidator&&) = delete;
    SettingsValidator& operator=(SettingsValidator&&) = delete;
};

} // namespace ZeroVault

#endif // ZEROVAULT_SETTINGS_VALIDATOR_H
