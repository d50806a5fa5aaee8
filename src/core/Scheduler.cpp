// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Scheduler.cpp
 * @brief Timer bookkeeping for the poll-driven scheduler
 */

#include "Scheduler.h"

#include <utility>

namespace lumenlink {
namespace core {

Scheduler::Scheduler(const hal::IClock& clock)
    : m_clock(clock)
    , m_nextId(1)
{
}

TimerId Scheduler::scheduleOnce(uint32_t delayMs, TimerCallback callback) {
    return addTimer(delayMs, 0, std::move(callback));
}

TimerId Scheduler::scheduleRepeating(uint32_t intervalMs, TimerCallback callback) {
    if (intervalMs == 0) intervalMs = 1;
    return addTimer(intervalMs, intervalMs, std::move(callback));
}

TimerId Scheduler::addTimer(uint32_t delayMs, uint32_t intervalMs, TimerCallback callback) {
    if (!callback) return INVALID_TIMER;

    std::lock_guard<std::mutex> lock(m_mutex);
    TimerId id = m_nextId++;
    if (m_nextId == INVALID_TIMER) m_nextId = 1;

    Timer timer;
    timer.id = id;
    timer.dueMs = m_clock.nowMs() + delayMs;
    timer.intervalMs = intervalMs;
    timer.callback = std::move(callback);
    m_timers.push_back(std::move(timer));
    return id;
}

bool Scheduler::cancel(TimerId id) {
    if (id == INVALID_TIMER) return false;

    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_timers.begin(); it != m_timers.end(); ++it) {
        if (it->id == id) {
            m_timers.erase(it);
            return true;
        }
    }
    return false;
}

bool Scheduler::isPending(TimerId id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& timer : m_timers) {
        if (timer.id == id) return true;
    }
    return false;
}

size_t Scheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_timers.size();
}

size_t Scheduler::poll() {
    size_t fired = 0;
    const uint32_t now = m_clock.nowMs();

    TimerId lastEligibleId;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        lastEligibleId = m_nextId;
    }

    for (;;) {
        TimerCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            // Earliest due timer that existed when poll() started
            auto best = m_timers.end();
            for (auto it = m_timers.begin(); it != m_timers.end(); ++it) {
                if (it->id >= lastEligibleId) continue;
                if (!hal::deadlineReached(now, it->dueMs)) continue;
                if (best == m_timers.end() ||
                    static_cast<int32_t>(it->dueMs - best->dueMs) < 0) {
                    best = it;
                }
            }
            if (best == m_timers.end()) break;

            if (best->intervalMs > 0) {
                callback = best->callback;
                best->dueMs = now + best->intervalMs;
            } else {
                callback = std::move(best->callback);
                m_timers.erase(best);
            }
        }

        callback();
        fired++;
    }

    return fired;
}

} // namespace core
} // namespace lumenlink
