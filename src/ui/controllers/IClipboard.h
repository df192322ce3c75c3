// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors
//
// IClipboard.h - System clipboard collaborator used by ClipboardGuard

#pragma once

#include <sigc++/sigc++.h>
#include <optional>
#include <string>

namespace ZeroVault {

/**
 * @brief Minimal text clipboard
 *
 * Implementations report failure through return values and never throw.
 * Reading is asynchronous because the system clipboard may be owned by
 * another process.
 */
class IClipboard {
public:
    /// Receives the clipboard text, or std::nullopt if it could not be read
    using ReadSlot = sigc::slot<void(std::optional<std::string>)>;

    virtual ~IClipboard() = default;

    /// @return false if the clipboard rejected the write
    [[nodiscard]] virtual bool set_text(const std::string& text) = 0;

    /// Invoke @p on_done with the current text once it is available
    virtual void read_text(const ReadSlot& on_done) = 0;

    /// @return false if the clipboard could not be emptied
    [[nodiscard]] virtual bool clear() = 0;

protected:
    IClipboard() = default;
    IClipboard(const IClipboard&) = delete;
    IClipboard& operator=(const IClipboard&) = delete;
};

}  // namespace ZeroVault
