// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors
//
// SessionLifecycle.cc - Session state machine and auto-lock

#include "SessionLifecycle.h"
#include "../../utils/Log.h"
#include "../../utils/SettingsValidator.h"
#include <algorithm>
#include <atomic>
#include <format>
#include <stdexcept>

namespace ZeroVault {

/**
 * @brief Shared between the session and its queued auto-lock tasks
 *
 * Tasks hold a reference, so the gate outlives a destroyed session. The
 * destructor clears @c session under @c mutex, after which no task can
 * reach the session.
 */
struct SessionLifecycle::AutoLockGate {
    std::recursive_mutex mutex;           ///< Held while a check runs; recursive for re-entrant handlers
    SessionLifecycle* session{nullptr};   ///< Cleared by the destructor
    std::atomic<uint64_t> epoch{0};       ///< Bumped on start/stop; older tasks stop themselves
    sigc::connection connection;          ///< Dispatch thread only
};

SessionLifecycle::SessionLifecycle(IScheduler& scheduler, KeyDerivation::Parameters kdf_params)
    : m_scheduler(scheduler),
      m_kdf_params(kdf_params),
      m_auto_lock_gate(std::make_shared<AutoLockGate>()) {
    m_auto_lock_gate->session = this;
    Log::debug("SessionLifecycle: Constructed (Unauthenticated)");
}

SessionLifecycle::~SessionLifecycle() {
    {
        // Waits for a check running on the dispatch thread to finish
        std::lock_guard gate_lock(m_auto_lock_gate->mutex);
        m_auto_lock_gate->session = nullptr;
    }

    std::lock_guard lock(m_mutex);
    stop_auto_lock_check_locked();
    drop_key_locked();
}

// ============================================================================
// Transitions
// ============================================================================

VaultResult<void> SessionLifecycle::login(std::string_view secret, const IdentityProfile& profile) {
    return begin_session(secret, profile, "login");
}

VaultResult<void> SessionLifecycle::register_account(std::string_view secret,
                                                     const IdentityProfile& profile) {
    return begin_session(secret, profile, "registration");
}

VaultResult<void> SessionLifecycle::begin_session(std::string_view secret,
                                                  const IdentityProfile& profile,
                                                  std::string_view action) {
    if (secret.empty()) {
        Log::warning("SessionLifecycle: {} rejected, empty secret", action);
        return std::unexpected(VaultError::InvalidCredentials);
    }

    uint64_t generation = 0;
    {
        std::lock_guard lock(m_mutex);
        generation = m_generation;
    }

    // Derivation is slow by design of the KDF; keep it outside the mutex
    auto key = KeyDerivation::derive(secret, profile.salt_hex, m_kdf_params);
    if (!key) {
        Log::error("SessionLifecycle: {} failed: {}", action, to_string(key.error()));
        return std::unexpected(key.error());
    }

    int minutes = 0;
    {
        std::lock_guard lock(m_mutex);
        if (m_generation != generation) {
            // The derived key is wiped when `key` goes out of scope
            Log::warning("SessionLifecycle: {} superseded by a concurrent transition", action);
            return std::unexpected(VaultError::TransitionSuperseded);
        }

        const int requested = profile.auto_lock_minutes.value_or(m_default_auto_lock_minutes);
        minutes = std::clamp(requested, MIN_AUTO_LOCK_MINUTES, MAX_AUTO_LOCK_MINUTES);
        if (minutes != requested) {
            Log::warning("SessionLifecycle: Auto-lock {} minutes clamped to {}", requested, minutes);
        }

        ++m_generation;
        drop_key_locked();
        m_key = std::move(*key);
        m_identity = IdentityProfile{profile.user_id, profile.salt_hex, minutes};
        m_auto_lock_duration = std::chrono::minutes(minutes);
        m_last_activity = m_scheduler.now();
        m_state = SessionState::Unlocked;
        start_auto_lock_check_locked();
    }

    Log::info("SessionLifecycle: Session started ({}), auto-lock after {} minutes", action, minutes);
    notify(SessionState::Unlocked);
    return {};
}

void SessionLifecycle::lock() {
    {
        std::lock_guard lock(m_mutex);
        if (m_state != SessionState::Unlocked) {
            return;
        }
        ++m_generation;
        stop_auto_lock_check_locked();
        drop_key_locked();
        m_state = SessionState::Locked;
    }

    Log::info("SessionLifecycle: Locked");
    notify(SessionState::Locked);
}

VaultResult<void> SessionLifecycle::unlock(std::string_view secret) {
    if (secret.empty()) {
        Log::warning("SessionLifecycle: unlock rejected, empty secret");
        return std::unexpected(VaultError::InvalidCredentials);
    }

    std::string salt_hex;
    uint64_t generation = 0;
    {
        std::lock_guard lock(m_mutex);
        if (!m_identity) {
            Log::warning("SessionLifecycle: unlock without an identity");
            return std::unexpected(VaultError::NotAuthenticated);
        }
        if (m_state == SessionState::Unlocked) {
            return {};
        }
        salt_hex = m_identity->salt_hex;
        generation = m_generation;
    }

    auto key = KeyDerivation::derive(secret, salt_hex, m_kdf_params);
    if (!key) {
        Log::error("SessionLifecycle: unlock failed: {}", to_string(key.error()));
        return std::unexpected(key.error());
    }

    {
        std::lock_guard lock(m_mutex);
        if (m_generation != generation || m_state != SessionState::Locked) {
            Log::warning("SessionLifecycle: unlock superseded by a concurrent transition");
            return std::unexpected(VaultError::TransitionSuperseded);
        }

        ++m_generation;
        m_key = std::move(*key);
        m_last_activity = m_scheduler.now();
        m_state = SessionState::Unlocked;
        start_auto_lock_check_locked();
    }

    Log::info("SessionLifecycle: Unlocked");
    notify(SessionState::Unlocked);
    return {};
}

void SessionLifecycle::logout() {
    bool changed = false;
    {
        std::lock_guard lock(m_mutex);
        ++m_generation;
        stop_auto_lock_check_locked();
        drop_key_locked();
        m_identity.reset();
        changed = (m_state != SessionState::Unauthenticated);
        m_state = SessionState::Unauthenticated;
    }

    if (changed) {
        Log::info("SessionLifecycle: Logged out");
        notify(SessionState::Unauthenticated);
    }
}

void SessionLifecycle::mark_activity() {
    std::lock_guard lock(m_mutex);
    if (m_state == SessionState::Unlocked) {
        m_last_activity = m_scheduler.now();
    }
}

void SessionLifecycle::set_auto_lock_minutes(int minutes) {
    const int clamped = std::clamp(minutes, MIN_AUTO_LOCK_MINUTES, MAX_AUTO_LOCK_MINUTES);
    if (clamped != minutes) {
        Log::warning("SessionLifecycle: Auto-lock {} minutes clamped to {} (valid range: {}-{})",
                     minutes, clamped, MIN_AUTO_LOCK_MINUTES, MAX_AUTO_LOCK_MINUTES);
    }

    std::lock_guard lock(m_mutex);
    m_auto_lock_duration = std::chrono::minutes(clamped);
    if (m_identity) {
        m_identity->auto_lock_minutes = clamped;
    }
}

void SessionLifecycle::set_default_auto_lock_minutes(int minutes) {
    const int clamped = std::clamp(minutes, MIN_AUTO_LOCK_MINUTES, MAX_AUTO_LOCK_MINUTES);
    if (clamped != minutes) {
        Log::warning("SessionLifecycle: Default auto-lock {} minutes clamped to {}", minutes, clamped);
    }

    std::lock_guard lock(m_mutex);
    m_default_auto_lock_minutes = clamped;
}

void SessionLifecycle::apply_settings(const Glib::RefPtr<Gio::Settings>& settings) {
    if (!settings) {
        Log::warning("SessionLifecycle: null settings, keeping default auto-lock");
        return;
    }
    set_default_auto_lock_minutes(SettingsValidator::get_auto_lock_minutes(settings));
}

// ============================================================================
// Queries
// ============================================================================

SessionState SessionLifecycle::state() const {
    std::lock_guard lock(m_mutex);
    return m_state;
}

bool SessionLifecycle::is_unlocked() const {
    return state() == SessionState::Unlocked;
}

std::optional<std::string> SessionLifecycle::user_id() const {
    std::lock_guard lock(m_mutex);
    if (!m_identity) {
        return std::nullopt;
    }
    return m_identity->user_id;
}

std::chrono::minutes SessionLifecycle::auto_lock_duration() const {
    std::lock_guard lock(m_mutex);
    return m_auto_lock_duration;
}

bool SessionLifecycle::is_auto_lock_check_active() const {
    std::lock_guard lock(m_mutex);
    return m_auto_lock_active;
}

// ============================================================================
// Record operations
// ============================================================================

VaultResult<CipherRecord> SessionLifecycle::encrypt_record(const PlaintextRecord& record) const {
    std::lock_guard lock(m_mutex);
    require_unlocked_locked("encrypt_record");
    return RecordCipher::encrypt(record, *m_key);
}

VaultResult<PlaintextRecord> SessionLifecycle::decrypt_record(const CipherRecord& record) const {
    std::lock_guard lock(m_mutex);
    require_unlocked_locked("decrypt_record");
    return RecordCipher::decrypt(record, *m_key);
}

std::vector<RecordCipher::DecryptedEntry> SessionLifecycle::decrypt_all(
    std::span<const CipherRecord> records) const {
    std::lock_guard lock(m_mutex);
    require_unlocked_locked("decrypt_all");
    return RecordCipher::decrypt_all(records, *m_key);
}

// ============================================================================
// Auto-lock
// ============================================================================

bool SessionLifecycle::on_auto_lock_check() {
    std::chrono::seconds idle{};
    {
        std::lock_guard lock(m_mutex);
        if (m_state != SessionState::Unlocked) {
            return false;
        }

        idle = std::chrono::duration_cast<std::chrono::seconds>(m_scheduler.now() - m_last_activity);
        if (idle < m_auto_lock_duration) {
            return true;
        }

        // Returning false ends this task; no explicit disconnect from inside it
        ++m_generation;
        drop_key_locked();
        m_state = SessionState::Locked;
        m_auto_lock_active = false;
    }

    Log::info("SessionLifecycle: Auto-locked after {} seconds of inactivity", idle.count());
    notify(SessionState::Locked);
    return false;
}

bool SessionLifecycle::dispatch_auto_lock_check(const std::shared_ptr<AutoLockGate>& gate,
                                                uint64_t epoch) {
    std::lock_guard gate_lock(gate->mutex);
    if (!gate->session || gate->epoch != epoch) {
        return false;
    }
    return gate->session->on_auto_lock_check();
}

// The queued work below captures the gate and the scheduler, never `this`

void SessionLifecycle::start_auto_lock_check_locked() {
    m_auto_lock_active = true;
    const uint64_t epoch = ++m_auto_lock_gate->epoch;

    m_scheduler.invoke([gate = m_auto_lock_gate, &scheduler = m_scheduler, epoch]() {
        if (gate->epoch != epoch) {
            return;
        }
        gate->connection.disconnect();
        gate->connection = scheduler.schedule_repeating(
            AUTO_LOCK_CHECK_INTERVAL,
            [gate, epoch]() { return dispatch_auto_lock_check(gate, epoch); });
    });
}

void SessionLifecycle::stop_auto_lock_check_locked() {
    if (!m_auto_lock_active) {
        return;
    }
    m_auto_lock_active = false;
    const uint64_t epoch = ++m_auto_lock_gate->epoch;

    m_scheduler.invoke([gate = m_auto_lock_gate, epoch]() {
        if (gate->epoch == epoch) {
            gate->connection.disconnect();
        }
    });
}

void SessionLifecycle::drop_key_locked() noexcept {
    // SecureAllocator wipes the buffer on deallocation
    m_key.reset();
}

void SessionLifecycle::require_unlocked_locked(std::string_view operation) const {
    if (m_state != SessionState::Unlocked || !m_key) {
        Log::error("SessionLifecycle: {} called while {}", operation, to_string(m_state));
        throw std::logic_error(std::format("SessionLifecycle::{} requires an unlocked session (state: {})",
                                           operation, to_string(m_state)));
    }
}

void SessionLifecycle::notify(SessionState state) {
    m_signal_state_changed.emit(state);
}

}  // namespace ZeroVault
