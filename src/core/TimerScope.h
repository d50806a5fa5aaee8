// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file TimerScope.h
 * @brief Group of scheduler timers cancelled together
 *
 * Every timer a component arms for one device (ping, reconnect, retry) goes
 * through that device's TimerScope. cancelAll() or destroying the scope
 * cancels every pending timer and flips the scope's cancellation token, so a
 * callback already taken by Scheduler::poll() also becomes a no-op.
 */

#pragma once

#include <mutex>
#include <vector>

#include "Cancellation.h"
#include "Scheduler.h"

namespace lumenlink {
namespace core {

class TimerScope {
public:
    explicit TimerScope(Scheduler& scheduler);
    ~TimerScope();

    // Prevent copying
    TimerScope(const TimerScope&) = delete;
    TimerScope& operator=(const TimerScope&) = delete;

    TimerId once(uint32_t delayMs, TimerCallback callback);
    TimerId every(uint32_t intervalMs, TimerCallback callback);

    void cancel(TimerId id);

    /**
     * @brief Cancel all timers and in-flight callbacks of this scope
     *
     * The scope stays usable; timers armed afterwards belong to a new
     * cancellation generation.
     */
    void cancelAll();

    /**
     * @brief Token that flips when cancelAll() runs or the scope dies
     */
    CancellationToken token() const;

    /**
     * @brief Number of timers still pending in the scheduler
     */
    size_t activeCount() const;

private:
    TimerCallback guard(TimerCallback callback) const;
    void pruneLocked();

    Scheduler& m_scheduler;
    mutable std::mutex m_mutex;
    std::vector<TimerId> m_timers;
    CancellationSource m_cancel;
};

} // namespace core
} // namespace lumenlink
