// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors
//
// ClipboardGuard.cc - Clipboard copy with content-checked auto-clear

#include "ClipboardGuard.h"
#include "../../core/VaultError.h"
#include "../../utils/Log.h"
#include "../../utils/SecureMemory.h"
#include "../../utils/SettingsValidator.h"
#include <algorithm>

namespace ZeroVault {

ClipboardGuard::ClipboardGuard(IClipboard& clipboard, IScheduler& scheduler)
    : m_clipboard(clipboard),
      m_scheduler(scheduler) {
    Log::debug("ClipboardGuard: Constructed with default timeout {} seconds", DEFAULT_CLEAR_TIMEOUT);
}

ClipboardGuard::~ClipboardGuard() {
    while (!m_pending.empty()) {
        erase_pending(m_pending.begin());
    }
    Log::debug("ClipboardGuard: Destroyed");
}

bool ClipboardGuard::copy_with_auto_clear(const std::string& text) {
    return copy_with_auto_clear(text, std::chrono::seconds(m_clear_timeout_seconds));
}

bool ClipboardGuard::copy_with_auto_clear(const std::string& text, std::chrono::seconds timeout) {
    const auto clamped = std::clamp(timeout,
                                    std::chrono::seconds(MIN_CLEAR_TIMEOUT),
                                    std::chrono::seconds(MAX_CLEAR_TIMEOUT));
    if (clamped != timeout) {
        Log::warning("ClipboardGuard: Timeout {} seconds clamped to {}",
                     timeout.count(), clamped.count());
    }

    if (!m_clipboard.set_text(text)) {
        Log::warning("ClipboardGuard: Copy failed: {}", to_string(VaultError::ClipboardUnavailable));
        return false;
    }

    const uint64_t copy_id = ++m_next_copy_id;
    auto& pending = m_pending[copy_id];
    pending.text = text;
    pending.timer = m_scheduler.schedule_once(
        clamped,
        sigc::bind(sigc::mem_fun(*this, &ClipboardGuard::on_clear_timeout), copy_id));

    Log::info("ClipboardGuard: Text copied, will clear in {} seconds", clamped.count());
    m_signal_copied.emit();
    return true;
}

bool ClipboardGuard::clear_now() {
    while (!m_pending.empty()) {
        erase_pending(m_pending.begin());
    }

    if (!m_clipboard.clear()) {
        Log::warning("ClipboardGuard: Clear failed: {}", to_string(VaultError::ClipboardUnavailable));
        return false;
    }

    Log::info("ClipboardGuard: Clipboard cleared immediately");
    m_signal_cleared.emit();
    return true;
}

void ClipboardGuard::set_clear_timeout_seconds(int seconds) {
    const int clamped = std::clamp(seconds, MIN_CLEAR_TIMEOUT, MAX_CLEAR_TIMEOUT);

    if (clamped != seconds) {
        Log::warning("ClipboardGuard: Timeout {} seconds clamped to {} (valid range: {}-{})",
                     seconds, clamped, MIN_CLEAR_TIMEOUT, MAX_CLEAR_TIMEOUT);
    }

    m_clear_timeout_seconds = clamped;
    Log::info("ClipboardGuard: Clear timeout set to {} seconds", m_clear_timeout_seconds);
}

void ClipboardGuard::apply_settings(const Glib::RefPtr<Gio::Settings>& settings) {
    if (!settings) {
        Log::warning("ClipboardGuard: null settings, keeping {} seconds", m_clear_timeout_seconds);
        return;
    }
    set_clear_timeout_seconds(SettingsValidator::get_clipboard_timeout(settings));
}

void ClipboardGuard::on_clear_timeout(uint64_t copy_id) {
    if (!m_pending.contains(copy_id)) {
        return;
    }

    // The reply may arrive after this guard is gone; sigc::trackable
    // invalidates the slot in that case
    m_clipboard.read_text(
        sigc::bind(sigc::mem_fun(*this, &ClipboardGuard::on_clipboard_read), copy_id));
}

void ClipboardGuard::on_clipboard_read(std::optional<std::string> content, uint64_t copy_id) {
    auto it = m_pending.find(copy_id);
    if (it == m_pending.end()) {
        // clear_now() ran while the read was in flight
        if (content) {
            secure_clear(*content);
        }
        return;
    }

    if (!content) {
        Log::warning("ClipboardGuard: Auto-clear skipped: {}",
                     to_string(VaultError::ClipboardUnavailable));
        erase_pending(it);
        return;
    }

    const bool unchanged = (*content == it->second.text);
    secure_clear(*content);
    erase_pending(it);

    if (!unchanged) {
        Log::debug("ClipboardGuard: Clipboard changed since copy {}, left untouched", copy_id);
        return;
    }

    if (!m_clipboard.clear()) {
        Log::warning("ClipboardGuard: Auto-clear failed: {}",
                     to_string(VaultError::ClipboardUnavailable));
        return;
    }

    Log::info("ClipboardGuard: Clipboard auto-cleared");
    m_signal_cleared.emit();
}

void ClipboardGuard::erase_pending(std::map<uint64_t, PendingClear>::iterator it) {
    it->second.timer.disconnect();
    secure_clear(it->second.text);
    m_pending.erase(it);
}

}  // namespace ZeroVault
