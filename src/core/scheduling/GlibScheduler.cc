// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors

#include "GlibScheduler.h"
#include <glibmm/main.h>

namespace ZeroVault {

sigc::connection GlibScheduler::schedule_once(
    std::chrono::milliseconds delay,
    const sigc::slot<void()>& task) {

    // Return false to stop repeating (one-shot timer)
    return Glib::signal_timeout().connect(
        [task]() {
            task();
            return false;
        },
        static_cast<unsigned int>(delay.count()));
}

sigc::connection GlibScheduler::schedule_repeating(
    std::chrono::milliseconds interval,
    const sigc::slot<bool()>& task) {

    return Glib::signal_timeout().connect(task, static_cast<unsigned int>(interval.count()));
}

void GlibScheduler::invoke(const sigc::slot<void()>& task) {
    Glib::MainContext::get_default()->invoke(
        [task]() {
            task();
            return false;
        });
}

IScheduler::Clock::time_point GlibScheduler::now() const {
    return Clock::now();
}

}  // namespace ZeroVault
