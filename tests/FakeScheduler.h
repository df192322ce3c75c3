// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 ZeroVault contributors
//
// FakeScheduler.h - Virtual-time IScheduler for unit tests

#pragma once

#include "../src/core/scheduling/IScheduler.h"
#include <sigc++/sigc++.h>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <list>

/**
 * @brief IScheduler driven by advance() instead of a main loop
 *
 * Tasks run in due order (ties in scheduling order) on the thread calling
 * advance(). Tasks may schedule or cancel other tasks, including themselves.
 */
class FakeScheduler : public ZeroVault::IScheduler {
public:
    sigc::connection schedule_once(std::chrono::milliseconds delay,
                                   const sigc::slot<void()>& task) override {
        sigc::slot<bool()> once = [task]() {
            task();
            return false;
        };
        return add(delay, std::chrono::milliseconds::zero(), once);
    }

    sigc::connection schedule_repeating(std::chrono::milliseconds interval,
                                        const sigc::slot<bool()>& task) override {
        return add(interval, interval, task);
    }

    /// Runs @p task immediately on the calling thread
    void invoke(const sigc::slot<void()>& task) override {
        task();
    }

    Clock::time_point now() const override { return m_now; }

    /// Move virtual time forward, running every task that falls due
    void advance(std::chrono::milliseconds delta) {
        const auto target = m_now + delta;

        for (;;) {
            purge();
            auto next = std::min_element(m_tasks.begin(), m_tasks.end(),
                [](const Task& a, const Task& b) {
                    return a.due != b.due ? a.due < b.due : a.sequence < b.sequence;
                });
            if (next == m_tasks.end() || next->due > target) {
                break;
            }

            m_now = next->due;
            const bool again = next->signal.emit();

            if (again && next->interval.count() > 0 && next->connection.connected()) {
                next->due += next->interval;
            } else {
                next->connection.disconnect();
            }
        }

        m_now = target;
    }

    /// Number of tasks still scheduled
    [[nodiscard]] std::size_t pending_tasks() {
        purge();
        return m_tasks.size();
    }

private:
    struct Task {
        Clock::time_point due;
        std::chrono::milliseconds interval;
        uint64_t sequence;
        sigc::signal<bool()> signal;
        sigc::connection connection;
    };

    sigc::connection add(std::chrono::milliseconds delay,
                         std::chrono::milliseconds interval,
                         const sigc::slot<bool()>& slot) {
        auto& task = m_tasks.emplace_back();
        task.due = m_now + delay;
        task.interval = interval;
        task.sequence = m_next_sequence++;
        task.connection = task.signal.connect(slot);
        return task.connection;
    }

    void purge() {
        m_tasks.remove_if([](const Task& t) { return !t.connection.connected(); });
    }

    Clock::time_point m_now{std::chrono::hours(1)};
    uint64_t m_next_sequence{0};
    std::list<Task> m_tasks;
};
