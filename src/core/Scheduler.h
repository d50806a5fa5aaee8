// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Scheduler.h
 * @brief One-shot and repeating timers driven by poll()
 *
 * The main loop (or a test) calls poll() frequently. Due timers fire in
 * deadline order on the polling thread, one at a time and outside the
 * scheduler lock, so a callback may schedule or cancel other timers.
 * Timers created while poll() is running fire on the next poll() at the
 * earliest.
 *
 * Thread-safe: timers may be scheduled and cancelled from any thread.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

#include "hal/interface/IClock.h"

namespace lumenlink {
namespace core {

using TimerId = uint32_t;
using TimerCallback = std::function<void()>;

constexpr TimerId INVALID_TIMER = 0;

class Scheduler {
public:
    explicit Scheduler(const hal::IClock& clock);

    // Prevent copying
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Fire @p callback once, @p delayMs from now
     */
    TimerId scheduleOnce(uint32_t delayMs, TimerCallback callback);

    /**
     * @brief Fire @p callback every @p intervalMs (minimum 1ms)
     */
    TimerId scheduleRepeating(uint32_t intervalMs, TimerCallback callback);

    /**
     * @brief Cancel a pending timer
     * @return true if the timer was still pending
     */
    bool cancel(TimerId id);

    bool isPending(TimerId id) const;

    /**
     * @brief Fire all due timers
     * @return Number of callbacks invoked
     */
    size_t poll();

    size_t pendingCount() const;

    uint32_t nowMs() const { return m_clock.nowMs(); }

private:
    struct Timer {
        TimerId id;
        uint32_t dueMs;
        uint32_t intervalMs;        ///< 0 for one-shot timers
        TimerCallback callback;
    };

    TimerId addTimer(uint32_t delayMs, uint32_t intervalMs, TimerCallback callback);

    const hal::IClock& m_clock;
    mutable std::mutex m_mutex;
    std::vector<Timer> m_timers;
    TimerId m_nextId;
};

} // namespace core
} // namespace lumenlink
