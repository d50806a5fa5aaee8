// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AddressBanList.h
 * @brief Time-limited denylist of addresses that failed at the network level
 *
 * Single writer: the owning component (DiscoveryEngine for probe bans,
 * ConnectionPoolManager for off-subnet bans). Reads and writes from probe
 * completions on any worker are serialized by the internal mutex.
 */

#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "hal/interface/IClock.h"

namespace lumenlink {
namespace discovery {

class AddressBanList {
public:
    AddressBanList(const hal::IClock& clock, uint32_t ttlMs);

    // Prevent copying
    AddressBanList(const AddressBanList&) = delete;
    AddressBanList& operator=(const AddressBanList&) = delete;

    /**
     * @brief Ban @p address until now + TTL (re-banning extends the ban)
     *
     * Expired entries for other addresses are pruned first.
     */
    void ban(const std::string& address);

    /**
     * @brief True while the ban is active; expired entries are dropped
     */
    bool isBanned(const std::string& address);

    /**
     * @brief Milliseconds until the ban lifts, 0 if not banned
     */
    uint32_t remainingMs(const std::string& address);

    void unban(const std::string& address);
    void clear();

    /**
     * @brief Number of active bans (expired entries are pruned first)
     */
    size_t size();

    /**
     * @brief Entries held, including expired ones not yet pruned
     */
    size_t storedCount() const;

    uint32_t ttlMs() const { return m_ttlMs; }

private:
    void pruneLocked(uint32_t nowMs);

    const hal::IClock& m_clock;
    const uint32_t m_ttlMs;
    mutable std::mutex m_mutex;
    std::map<std::string, uint32_t> m_expiry;   ///< address -> ban expiry
};

} // namespace discovery
} // namespace lumenlink
