// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AddressBanList.cpp
 */

#include "AddressBanList.h"

namespace lumenlink {
namespace discovery {

AddressBanList::AddressBanList(const hal::IClock& clock, uint32_t ttlMs)
    : m_clock(clock)
    , m_ttlMs(ttlMs)
{
}

void AddressBanList::ban(const std::string& address) {
    std::lock_guard<std::mutex> lock(m_mutex);
    uint32_t now = m_clock.nowMs();
    pruneLocked(now);
    m_expiry[address] = now + m_ttlMs;
}

bool AddressBanList::isBanned(const std::string& address) {
    return remainingMs(address) > 0;
}

uint32_t AddressBanList::remainingMs(const std::string& address) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_expiry.find(address);
    if (it == m_expiry.end()) return 0;

    uint32_t now = m_clock.nowMs();
    if (hal::deadlineReached(now, it->second)) {
        m_expiry.erase(it);
        return 0;
    }
    return it->second - now;
}

void AddressBanList::unban(const std::string& address) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_expiry.erase(address);
}

void AddressBanList::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_expiry.clear();
}

size_t AddressBanList::size() {
    std::lock_guard<std::mutex> lock(m_mutex);
    pruneLocked(m_clock.nowMs());
    return m_expiry.size();
}

size_t AddressBanList::storedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_expiry.size();
}

void AddressBanList::pruneLocked(uint32_t nowMs) {
    for (auto it = m_expiry.begin(); it != m_expiry.end();) {
        if (hal::deadlineReached(nowMs, it->second)) {
            it = m_expiry.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace discovery
} // namespace lumenlink
