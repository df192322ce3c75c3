// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors
//
// SessionLifecycle.h - Owns the session key and drives lock/unlock/logout

#pragma once

#include "SessionState.h"
#include "../RecordTypes.h"
#include "../VaultError.h"
#include "../crypto/KeyDerivation.h"
#include "../crypto/RecordCipher.h"
#include "../scheduling/IScheduler.h"
#include "../../utils/SecureMemory.h"
#include <giomm/settings.h>
#include <sigc++/sigc++.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ZeroVault {

/**
 * @brief Session state machine and sole owner of the in-memory key
 *
 * Transitions:
 * @verbatim
 *   Unauthenticated --login/register_account--> Unlocked
 *   Unlocked --lock() / inactivity--> Locked      (key dropped, identity kept)
 *   Locked --unlock(secret)--> Unlocked           (key re-derived from salt)
 *   any --logout()--> Unauthenticated             (key and identity dropped)
 * @endverbatim
 *
 * Responsibilities:
 * - Derive the key once per login/unlock and hold it only while Unlocked
 * - Track user activity and lock after the configured inactivity window
 *   (checked by a recurring task every AUTO_LOCK_CHECK_INTERVAL)
 * - Gate record encryption/decryption on the key being present
 *
 * A wrong secret at unlock cannot be detected here: it yields a key that
 * fails to decrypt existing records, which callers observe as
 * VaultError::DecryptionFailure.
 *
 * Thread Safety:
 * - Every public method, including the destructor, may be called from any
 *   thread
 * - All transitions are serialized by one mutex; a key produced by one
 *   transition can never survive a later transition
 * - Key derivation runs outside the mutex; its result is committed only if
 *   no other transition happened meanwhile (otherwise it is wiped and
 *   VaultError::TransitionSuperseded is returned)
 * - The auto-lock task is created, cancelled and run only on the
 *   scheduler's dispatch thread (transitions hand that work over with
 *   IScheduler::invoke()); a task still queued when the session is
 *   destroyed stops without touching it
 * - signal_state_changed() is emitted after the mutex is released, on the
 *   thread that made the transition
 *
 * Usage Example:
 * @code
 * GlibScheduler scheduler;
 * SessionLifecycle session(scheduler);
 *
 * auto profile = identity.fetch_profile();   // { user_id, salt_hex, auto_lock_minutes }
 * if (auto r = session.login(secret, profile); !r) {
 *     show_error(to_string(r.error()));
 * }
 *
 * auto sealed = session.encrypt_record(record);
 * session.mark_activity();                   // on user input
 * session.lock();
 * @endcode
 */
class SessionLifecycle {
public:
    /// Period of the inactivity check
    static constexpr std::chrono::seconds AUTO_LOCK_CHECK_INTERVAL{10};

    static constexpr int MIN_AUTO_LOCK_MINUTES = 1;
    static constexpr int MAX_AUTO_LOCK_MINUTES = 60;
    static constexpr int DEFAULT_AUTO_LOCK_MINUTES = 15;

    /**
     * @brief Create a session in the Unauthenticated state
     * @param scheduler Timer/clock collaborator; must outlive the session
     *                  and the work it queued on the dispatch thread
     * @param kdf_params Derivation parameters used for login and unlock
     */
    explicit SessionLifecycle(IScheduler& scheduler,
                              KeyDerivation::Parameters kdf_params = {});

    /**
     * @brief Destructor - stops the auto-lock task and wipes the key
     */
    ~SessionLifecycle();

    SessionLifecycle(const SessionLifecycle&) = delete;
    SessionLifecycle& operator=(const SessionLifecycle&) = delete;
    SessionLifecycle(SessionLifecycle&&) = delete;
    SessionLifecycle& operator=(SessionLifecycle&&) = delete;

    /**
     * @brief Start a session from any state
     *
     * On success any previous key and identity are replaced; on failure the
     * session is left as it was.
     *
     * @param secret Master passphrase; not retained
     * @param profile Identity data with the account's salt
     * @return Nothing on success, or:
     *         - VaultError::InvalidCredentials for an empty secret
     *         - VaultError::MalformedSalt for a bad salt
     *         - VaultError::KeyDerivationFailed
     *         - VaultError::TransitionSuperseded if another transition won
     *
     * @post On success: state() == Unlocked, last activity = now
     */
    [[nodiscard]] VaultResult<void> login(std::string_view secret, const IdentityProfile& profile);

    /**
     * @brief Same transition as login(), for a freshly registered account
     */
    [[nodiscard]] VaultResult<void> register_account(std::string_view secret,
                                                     const IdentityProfile& profile);

    /**
     * @brief Unlocked -> Locked; no-op in other states
     * @post No key is held; identity and salt are kept
     */
    void lock();

    /**
     * @brief Locked -> Unlocked by re-deriving the key from the stored salt
     *
     * @return Nothing on success (also when already Unlocked), or:
     *         - VaultError::InvalidCredentials for an empty secret
     *         - VaultError::NotAuthenticated when there is no identity
     *         - VaultError::TransitionSuperseded if another transition won
     */
    [[nodiscard]] VaultResult<void> unlock(std::string_view secret);

    /**
     * @brief Any state -> Unauthenticated
     * @post No key, no identity, auto-lock task stopped
     */
    void logout();

    /**
     * @brief Record user interaction; only has an effect while Unlocked
     */
    void mark_activity();

    /**
     * @brief Change the inactivity window
     * @param minutes Clamped to MIN_AUTO_LOCK_MINUTES..MAX_AUTO_LOCK_MINUTES
     *
     * Takes effect at the next periodic check.
     */
    void set_auto_lock_minutes(int minutes);

    /**
     * @brief Window used when a profile carries no auto_lock_minutes
     * @param minutes Clamped to MIN_AUTO_LOCK_MINUTES..MAX_AUTO_LOCK_MINUTES
     *
     * Affects the next login/registration only.
     */
    void set_default_auto_lock_minutes(int minutes);

    /**
     * @brief Take the default window from the "auto-lock-minutes" key
     * @param settings com.zerovault.core settings; null keeps the current default
     */
    void apply_settings(const Glib::RefPtr<Gio::Settings>& settings);

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] bool is_unlocked() const;

    /// Identity of the current account; empty when Unauthenticated
    [[nodiscard]] std::optional<std::string> user_id() const;

    [[nodiscard]] std::chrono::minutes auto_lock_duration() const;

    /// Whether the recurring inactivity check is scheduled
    [[nodiscard]] bool is_auto_lock_check_active() const;

    /**
     * @brief Encrypt a record with the held key
     * @throws std::logic_error if the session is not Unlocked
     */
    [[nodiscard]] VaultResult<CipherRecord> encrypt_record(const PlaintextRecord& record) const;

    /**
     * @brief Decrypt a record with the held key
     * @return Plaintext or VaultError::DecryptionFailure
     * @throws std::logic_error if the session is not Unlocked
     */
    [[nodiscard]] VaultResult<PlaintextRecord> decrypt_record(const CipherRecord& record) const;

    /**
     * @brief Decrypt a record list, omitting the ones that fail
     * @throws std::logic_error if the session is not Unlocked
     */
    [[nodiscard]] std::vector<RecordCipher::DecryptedEntry> decrypt_all(
        std::span<const CipherRecord> records) const;

    /**
     * @brief Emitted after every state change with the new state
     *
     * Signal Signature: void(SessionState)
     */
    [[nodiscard]] sigc::signal<void(SessionState)>& signal_state_changed() { return m_signal_state_changed; }

private:
    [[nodiscard]] VaultResult<void> begin_session(std::string_view secret,
                                                  const IdentityProfile& profile,
                                                  std::string_view action);

    struct AutoLockGate;

    /// Runs a queued check unless the session is gone or the task is stale
    static bool dispatch_auto_lock_check(const std::shared_ptr<AutoLockGate>& gate,
                                         uint64_t epoch);

    /// Periodic inactivity check; returns false to stop repeating
    bool on_auto_lock_check();

    // The *_locked helpers expect m_mutex to be held by the caller
    void drop_key_locked() noexcept;
    void start_auto_lock_check_locked();
    void stop_auto_lock_check_locked();
    void require_unlocked_locked(std::string_view operation) const;

    void notify(SessionState state);

    IScheduler& m_scheduler;
    const KeyDerivation::Parameters m_kdf_params;
    const std::shared_ptr<AutoLockGate> m_auto_lock_gate;

    mutable std::mutex m_mutex;                       ///< Guards everything below
    SessionState m_state{SessionState::Unauthenticated};
    std::optional<SessionKey> m_key;                  ///< Present iff Unlocked
    std::optional<IdentityProfile> m_identity;        ///< Present unless Unauthenticated
    std::chrono::minutes m_auto_lock_duration{DEFAULT_AUTO_LOCK_MINUTES};
    int m_default_auto_lock_minutes{DEFAULT_AUTO_LOCK_MINUTES};
    IScheduler::Clock::time_point m_last_activity{};
    uint64_t m_generation{0};                         ///< Bumped on every transition
    bool m_auto_lock_active{false};                   ///< Check wanted (Unlocked)

    sigc::signal<void(SessionState)> m_signal_state_changed;
};

}  // namespace ZeroVault
