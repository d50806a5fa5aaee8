// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DiscoveryEngine.h
 * @brief Multi-strategy device discovery on the local network
 *
 * Three strategies run concurrently once startDiscovery() is called:
 * - mDNS browse of well-known service types, 2s window each
 * - UDP broadcast of a full-state request, 5s listen window
 * - /24 scan of the host's own interface prefixes (hosts 1..254)
 *
 * Every candidate address funnels through one admission path:
 *   scanned-set dedup -> ban list -> bounded probe queue (5 in flight)
 *
 * Found devices are buffered and delivered through events() after a 300ms
 * debounce, deduplicated by identifier. An existing record is updated in
 * place and keeps its display name.
 *
 * Threading:
 * - Probes, browse and broadcast listening run as executor jobs
 * - Batch flush and early stop run from Scheduler::poll()
 * - All engine state is guarded by one mutex; events are published outside it
 * - The engine must outlive any job it posted
 */

#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "AddressBanList.h"
#include "AddressProbe.h"
#include "config/network_config.h"
#include "core/Cancellation.h"
#include "core/DeviceTypes.h"
#include "core/EventStream.h"
#include "core/Scheduler.h"
#include "core/TimerScope.h"
#include "hal/interface/IClock.h"
#include "hal/interface/IDatagramSocket.h"
#include "hal/interface/IExecutor.h"
#include "hal/interface/INetworkInfo.h"
#include "hal/interface/IServiceBrowser.h"

namespace lumenlink {
namespace discovery {

struct DiscoveryConfig {
    std::vector<std::string> serviceTypes{"_wled._tcp", "_http._tcp", "_arduino._tcp", "_esp32._tcp"};
    uint32_t serviceWindowMs = config::DiscoveryDefaults::MDNS_WINDOW_MS;
    uint32_t broadcastWindowMs = config::DiscoveryDefaults::BROADCAST_WINDOW_MS;
    uint32_t broadcastReceiveSliceMs = config::DiscoveryDefaults::BROADCAST_RECEIVE_SLICE_MS;
    uint16_t broadcastPort = config::Protocol::DISCOVERY_UDP_PORT;
    uint32_t probeTimeoutMs = config::DiscoveryDefaults::PROBE_TIMEOUT_MS;
    uint8_t maxConcurrentProbes = config::DiscoveryDefaults::MAX_CONCURRENT_PROBES;
    uint8_t maxScanRanges = config::DiscoveryDefaults::MAX_SCAN_RANGES;
    uint32_t banTtlMs = config::DiscoveryDefaults::BAN_TTL_MS;
    uint32_t batchDebounceMs = config::DiscoveryDefaults::BATCH_DEBOUNCE_MS;
    uint32_t earlyStopGraceMs = config::DiscoveryDefaults::EARLY_STOP_GRACE_MS;

    /// Halt all strategies earlyStopGraceMs after the first device is found.
    /// Set false for exhaustive discovery.
    bool stopAfterFirstDevice = true;

    bool enableServiceBrowse = true;
    bool enableBroadcast = true;
    bool enableRangeScan = true;
};

/**
 * @brief Aggregate counters for the current (or last) run
 */
struct DiscoveryStats {
    uint32_t candidates = 0;        ///< Addresses offered by any strategy
    uint32_t probesIssued = 0;
    uint32_t found = 0;
    uint32_t timeouts = 0;
    uint32_t unreachable = 0;
    uint32_t protocolMismatch = 0;
    uint32_t alreadyAttempted = 0;
    uint32_t banned = 0;
    uint8_t strategiesFailed = 0;   ///< Strategies that could not start
};

struct DiscoveryEvent {
    DeviceRecord record;
    bool isNew;                     ///< false when an existing id was updated
};

class DiscoveryEngine {
public:
    using ProbeCallback = std::function<void(const ProbeResult&)>;

    /**
     * @param browser Optional; service browsing is skipped when null
     * @param socket Optional; broadcast discovery is skipped when null
     */
    DiscoveryEngine(const DiscoveryConfig& config,
                    const AddressProbe& probe,
                    hal::IExecutor& executor,
                    core::Scheduler& scheduler,
                    const hal::IClock& clock,
                    const hal::INetworkInfo& network,
                    hal::IServiceBrowser* browser,
                    hal::IDatagramSocket* socket);
    ~DiscoveryEngine();

    // Prevent copying
    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    /**
     * @brief Start all strategies
     * @return false if discovery was already running (no-op)
     */
    bool startDiscovery();

    /**
     * @brief Cancel all strategies and abandon in-flight probe results
     *
     * Devices already found are flushed to events() immediately.
     */
    void stopDiscovery();

    /**
     * @brief Probe a single user-supplied address
     *
     * Bypasses the scanned set and the ban list. Network failures still ban
     * the address. A found device is delivered through events(); the outcome
     * is also passed to @p callback when given.
     */
    void addDeviceByAddress(const std::string& address, ProbeCallback callback = nullptr);

    /**
     * @brief Lifecycle hooks: stop on background, resume on foreground
     */
    void enterBackground();
    void becomeActive();

    bool isRunning() const;
    DiscoveryStats stats() const;

    /**
     * @brief Pin a user-chosen display name; later sightings keep it
     * @return false if @p deviceId has not been discovered
     */
    bool setDisplayName(const std::string& deviceId, const std::string& name);

    /**
     * @brief Every device delivered so far, one entry per identifier
     */
    std::vector<DeviceRecord> discoveredDevices() const;

    core::EventStream<DiscoveryEvent>& events() { return m_events; }
    AddressBanList& banList() { return m_banList; }

    /**
     * @brief Service-name heuristic used to pick mDNS candidates
     */
    static bool looksLikeDevice(const std::string& serviceType, const std::string& instanceName);

private:
    // Strategy jobs
    void runServiceBrowse(uint32_t generation, core::CancellationToken token);
    void runBroadcast(uint32_t generation, core::CancellationToken token);
    std::vector<std::string> buildScanCandidates();

    // Admission and probing
    void offerCandidates(const std::vector<std::string>& addresses, uint32_t generation);
    void offerCandidatesLocked(const std::vector<std::string>& addresses,
                               std::vector<std::string>& toDispatch);
    void takeDispatchableLocked(std::vector<std::string>& toDispatch);
    void dispatch(const std::vector<std::string>& addresses, uint32_t generation,
                  core::CancellationToken token);
    void onProbeComplete(uint32_t generation, const core::CancellationToken& token,
                         const ProbeResult& result);
    void onPostRejected(uint32_t generation);
    void onStrategyDone(uint32_t generation, bool failed);

    // Results
    void recordOutcomeLocked(ProbeOutcome outcome);
    void acceptDeviceLocked(const ProbeResult& result);
    void flushPending();
    void maybeFinishLocked();

    DiscoveryConfig m_config;
    const AddressProbe& m_probe;
    hal::IExecutor& m_executor;
    const hal::IClock& m_clock;
    const hal::INetworkInfo& m_network;
    hal::IServiceBrowser* m_browser;
    hal::IDatagramSocket* m_socket;

    AddressBanList m_banList;
    core::TimerScope m_timers;
    core::EventStream<DiscoveryEvent> m_events;

    mutable std::mutex m_mutex;
    bool m_running;
    bool m_resumeOnActive;
    uint32_t m_generation;
    core::CancellationSource m_cancel;
    std::set<std::string> m_scanned;
    std::set<std::string> m_localAddresses;
    std::deque<std::string> m_queue;
    uint8_t m_inFlight;
    uint8_t m_strategyJobs;
    std::vector<DeviceRecord> m_pending;
    std::map<std::string, DeviceRecord> m_known;
    core::TimerId m_batchTimer;
    core::TimerId m_earlyStopTimer;
    DiscoveryStats m_stats;
};

} // namespace discovery
} // namespace lumenlink
