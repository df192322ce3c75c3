// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors
//
// GlibScheduler.h - IScheduler backed by the GLib main loop

#pragma once

#include "IScheduler.h"

namespace ZeroVault {

/**
 * @brief Production scheduler using Glib::signal_timeout()
 *
 * Tasks fire on the thread running the default GLib main context, so the
 * application must run a Glib::MainLoop (or a Gtk::Application). Clock
 * readings come from std::chrono::steady_clock.
 */
class GlibScheduler final : public IScheduler {
public:
    GlibScheduler() = default;

    [[nodiscard]] sigc::connection schedule_once(
        std::chrono::milliseconds delay,
        const sigc::slot<void()>& task) override;

    [[nodiscard]] sigc::connection schedule_repeating(
        std::chrono::milliseconds interval,
        const sigc::slot<bool()>& task) override;

    /// Glib::MainContext::invoke() on the default context
    void invoke(const sigc::slot<void()>& task) override;

    [[nodiscard]] Clock::time_point now() const override;
};

}  // namespace ZeroVault
