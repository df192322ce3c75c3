// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors
//
// GdkClipboardBackend.h - IClipboard over Gdk::Clipboard

#pragma once

#include "IClipboard.h"
#include <gdkmm/clipboard.h>

namespace ZeroVault {

/**
 * @brief Adapts the GTK4 clipboard of a display or widget to IClipboard
 *
 * Thread Safety:
 * - All methods must be called from the GTK main thread
 * - Gdk::Clipboard is not thread-safe
 *
 * @code
 * GdkClipboardBackend backend(window.get_clipboard());
 * ClipboardGuard guard(backend, scheduler);
 * @endcode
 */
class GdkClipboardBackend : public IClipboard {
public:
    /**
     * @param clipboard Clipboard instance (must not be null)
     * @throws std::invalid_argument if clipboard is null
     */
    explicit GdkClipboardBackend(const Glib::RefPtr<Gdk::Clipboard>& clipboard);

    [[nodiscard]] bool set_text(const std::string& text) override;
    void read_text(const ReadSlot& on_done) override;
    [[nodiscard]] bool clear() override;

private:
    Glib::RefPtr<Gdk::Clipboard> m_clipboard;
};

}  // namespace ZeroVault
