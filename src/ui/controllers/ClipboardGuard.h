// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors
//
// ClipboardGuard.h - Copies sensitive text and clears it again after a timeout

#pragma once

#include "IClipboard.h"
#include "../../core/scheduling/IScheduler.h"
#include <giomm/settings.h>
#include <sigc++/sigc++.h>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace ZeroVault {

/**
 * @brief Clipboard copy with deferred, content-checked clearing
 *
 * Responsibilities:
 * - Copy sensitive data (passwords, usernames) to the clipboard
 * - Schedule one deferred check per copy; the check clears the clipboard
 *   only if it still holds exactly the copied text
 * - Clear immediately on request (vault lock, logout)
 *
 * Earlier timers are never cancelled by a new copy. They fire as usual and do
 * nothing because the clipboard no longer matches their text, so a newer copy
 * (ours or another application's) is never wiped early.
 *
 * Usage Example:
 * @code
 * GdkClipboardBackend backend(window.get_clipboard());
 * ClipboardGuard guard(backend, scheduler);
 * guard.apply_settings(settings);
 *
 * guard.signal_cleared().connect([]() { status_bar.push("Clipboard cleared"); });
 * if (!guard.copy_with_auto_clear(record.password)) {
 *     show_error("Clipboard unavailable");
 * }
 * @endcode
 *
 * Security Considerations:
 * - Other applications can read the clipboard before the timeout
 * - Pending texts are wiped from memory once their check has run
 *
 * Thread Safety:
 * - All methods must be called from the scheduler's dispatch thread
 */
class ClipboardGuard : public sigc::trackable {
public:
    /// Minimum allowed clear timeout in seconds
    static constexpr int MIN_CLEAR_TIMEOUT = 5;

    /// Maximum allowed clear timeout in seconds
    static constexpr int MAX_CLEAR_TIMEOUT = 300;

    static constexpr int DEFAULT_CLEAR_TIMEOUT = 30;

    /**
     * @param clipboard Clipboard collaborator; must outlive the guard
     * @param scheduler Timer collaborator; must outlive the guard
     */
    ClipboardGuard(IClipboard& clipboard, IScheduler& scheduler);

    /**
     * @brief Destructor - cancels pending checks without touching the clipboard
     */
    ~ClipboardGuard();

    ClipboardGuard(const ClipboardGuard&) = delete;
    ClipboardGuard& operator=(const ClipboardGuard&) = delete;
    ClipboardGuard(ClipboardGuard&&) = delete;
    ClipboardGuard& operator=(ClipboardGuard&&) = delete;

    /**
     * @brief Copy @p text and clear it after the configured timeout
     * @return false if the clipboard rejected the write (nothing scheduled)
     */
    [[nodiscard]] bool copy_with_auto_clear(const std::string& text);

    /**
     * @brief Copy @p text and clear it after @p timeout
     * @param timeout Clamped to MIN_CLEAR_TIMEOUT..MAX_CLEAR_TIMEOUT
     * @return false if the clipboard rejected the write (nothing scheduled)
     *
     * Never throws on clipboard failure.
     */
    [[nodiscard]] bool copy_with_auto_clear(const std::string& text, std::chrono::seconds timeout);

    /**
     * @brief Empty the clipboard now and drop every pending check
     * @return false if the clipboard could not be cleared
     * @post Emits signal_cleared() on success
     */
    bool clear_now();

    /**
     * @brief Set the default timeout used by copy_with_auto_clear(text)
     * @param seconds Clamped to MIN_CLEAR_TIMEOUT..MAX_CLEAR_TIMEOUT
     *
     * Pending checks keep the timeout they were scheduled with.
     */
    void set_clear_timeout_seconds(int seconds);

    /**
     * @brief Take the default timeout from the "clipboard-clear-timeout" key
     * @param settings com.zerovault.core settings; null keeps the current timeout
     */
    void apply_settings(const Glib::RefPtr<Gio::Settings>& settings);

    [[nodiscard]] int get_clear_timeout_seconds() const noexcept { return m_clear_timeout_seconds; }

    /// Number of copies whose deferred check has not completed yet
    [[nodiscard]] std::size_t pending_count() const noexcept { return m_pending.size(); }

    [[nodiscard]] bool is_clear_pending() const noexcept { return !m_pending.empty(); }

    /**
     * @brief Signal emitted after text is copied
     *
     * Signal Signature: void()
     *
     * The copied text is intentionally not passed to listeners.
     */
    [[nodiscard]] sigc::signal<void()>& signal_copied() { return m_signal_copied; }

    /**
     * @brief Signal emitted after the clipboard was cleared (timer or clear_now)
     *
     * Signal Signature: void()
     */
    [[nodiscard]] sigc::signal<void()>& signal_cleared() { return m_signal_cleared; }

private:
    struct PendingClear {
        std::string text;              ///< What this copy put on the clipboard
        sigc::connection timer;
    };

    void on_clear_timeout(uint64_t copy_id);
    void on_clipboard_read(std::optional<std::string> content, uint64_t copy_id);
    void erase_pending(std::map<uint64_t, PendingClear>::iterator it);

    IClipboard& m_clipboard;
    IScheduler& m_scheduler;
    int m_clear_timeout_seconds{DEFAULT_CLEAR_TIMEOUT};
    uint64_t m_next_copy_id{0};
    std::map<uint64_t, PendingClear> m_pending;   ///< Keyed by copy id

    sigc::signal<void()> m_signal_copied;
    sigc::signal<void()> m_signal_cleared;
};

}  // namespace ZeroVault
