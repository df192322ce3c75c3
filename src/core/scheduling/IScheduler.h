// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors
//
// IScheduler.h - Timer and clock collaborator for session and clipboard timers

#pragma once

#include <sigc++/sigc++.h>
#include <chrono>

namespace ZeroVault {

/**
 * @brief Deferred and recurring task scheduling with a monotonic clock
 *
 * Every scheduled task is represented by a sigc::connection. Calling
 * disconnect() on it cancels the task; connected() reports whether it is
 * still pending. Tasks run on the scheduler's dispatch thread (the GLib main
 * context for GlibScheduler).
 *
 * schedule_once(), schedule_repeating() and the returned connections are
 * not thread-safe: use them only on the dispatch thread. Code running on
 * another thread hands that work over with invoke().
 *
 * Abstracted so that SessionLifecycle and ClipboardGuard can be driven by
 * virtual time in tests.
 */
class IScheduler {
public:
    using Clock = std::chrono::steady_clock;

    virtual ~IScheduler() = default;

    /**
     * @brief Run @p task once after @p delay
     * @return Handle; disconnect() cancels the task if it has not run yet
     */
    [[nodiscard]] virtual sigc::connection schedule_once(
        std::chrono::milliseconds delay,
        const sigc::slot<void()>& task) = 0;

    /**
     * @brief Run @p task every @p interval until it returns false or is cancelled
     */
    [[nodiscard]] virtual sigc::connection schedule_repeating(
        std::chrono::milliseconds interval,
        const sigc::slot<bool()>& task) = 0;

    /**
     * @brief Run @p task on the dispatch thread
     *
     * Runs @p task before returning when the caller may dispatch (it is the
     * dispatch thread, or nothing else is dispatching); otherwise queues it.
     * Safe to call from any thread.
     */
    virtual void invoke(const sigc::slot<void()>& task) = 0;

    /// Monotonic current time
    [[nodiscard]] virtual Clock::time_point now() const = 0;

protected:
    IScheduler() = default;
    IScheduler(const IScheduler&) = delete;
    IScheduler& operator=(const IScheduler&) = delete;
};

}  // namespace ZeroVault
