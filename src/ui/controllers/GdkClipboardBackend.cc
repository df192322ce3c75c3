// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

#include "GdkClipboardBackend.h"
#include "../../utils/Log.h"
#include <giomm/asyncresult.h>
#include <glibmm/error.h>
#include <stdexcept>

namespace ZeroVault {

GdkClipboardBackend::GdkClipboardBackend(const Glib::RefPtr<Gdk::Clipboard>& clipboard)
    : m_clipboard(clipboard) {
    if (!m_clipboard) {
        throw std::invalid_argument("GdkClipboardBackend: clipboard cannot be null");
    }
}

bool GdkClipboardBackend::set_text(const std::string& text) {
    try {
        m_clipboard->set_text(text);
        return true;
    } catch (const Glib::Error& e) {
        Log::warning("GdkClipboardBackend: set_text failed: {}", e.what());
        return false;
    }
}

void GdkClipboardBackend::read_text(const ReadSlot& on_done) {
    m_clipboard->read_text_async(
        [clipboard = m_clipboard, on_done](Glib::RefPtr<Gio::AsyncResult>& result) {
            std::optional<std::string> text;
            try {
                text = clipboard->read_text_finish(result).raw();
            } catch (const Glib::Error& e) {
                // Empty clipboard or non-text content also lands here
                Log::debug("GdkClipboardBackend: read_text failed: {}", e.what());
            }
            on_done(std::move(text));
        });
}

bool GdkClipboardBackend::clear() {
    return set_text("");
}

}  // namespace ZeroVault
