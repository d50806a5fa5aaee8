// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file TimerScope.cpp
 * @brief Scoped timer ownership
 */

#include "TimerScope.h"

#include <algorithm>
#include <utility>

namespace lumenlink {
namespace core {

TimerScope::TimerScope(Scheduler& scheduler)
    : m_scheduler(scheduler)
{
}

TimerScope::~TimerScope() {
    cancelAll();
}

TimerCallback TimerScope::guard(TimerCallback callback) const {
    CancellationToken token = m_cancel.token();
    return [token, callback]() {
        if (!token.isCancelled()) callback();
    };
}

void TimerScope::pruneLocked() {
    m_timers.erase(std::remove_if(m_timers.begin(), m_timers.end(),
                                  [this](TimerId id) { return !m_scheduler.isPending(id); }),
                   m_timers.end());
}

TimerId TimerScope::once(uint32_t delayMs, TimerCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    pruneLocked();
    TimerId id = m_scheduler.scheduleOnce(delayMs, guard(std::move(callback)));
    if (id != INVALID_TIMER) m_timers.push_back(id);
    return id;
}

TimerId TimerScope::every(uint32_t intervalMs, TimerCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    pruneLocked();
    TimerId id = m_scheduler.scheduleRepeating(intervalMs, guard(std::move(callback)));
    if (id != INVALID_TIMER) m_timers.push_back(id);
    return id;
}

void TimerScope::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_scheduler.cancel(id);
    m_timers.erase(std::remove(m_timers.begin(), m_timers.end(), id), m_timers.end());
}

void TimerScope::cancelAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cancel.reset();
    for (TimerId id : m_timers) {
        m_scheduler.cancel(id);
    }
    m_timers.clear();
}

CancellationToken TimerScope::token() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancel.token();
}

size_t TimerScope::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t count = 0;
    for (TimerId id : m_timers) {
        if (m_scheduler.isPending(id)) count++;
    }
    return count;
}

} // namespace core
} // namespace lumenlink
