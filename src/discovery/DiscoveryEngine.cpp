// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DiscoveryEngine.cpp
 * @brief Multi-strategy discovery implementation
 */

#define LL_LOG_TAG "Discovery"
#include "utils/Log.h"

#include "DiscoveryEngine.h"

#include <algorithm>
#include <cctype>

#include "codec/WledJsonCodec.h"
#include "net/DeviceEndpoint.h"

namespace lumenlink {
namespace discovery {

using namespace config;

namespace {

std::string toLower(const std::string& text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

DiscoveryEngine::DiscoveryEngine(const DiscoveryConfig& config,
                                 const AddressProbe& probe,
                                 hal::IExecutor& executor,
                                 core::Scheduler& scheduler,
                                 const hal::IClock& clock,
                                 const hal::INetworkInfo& network,
                                 hal::IServiceBrowser* browser,
                                 hal::IDatagramSocket* socket)
    : m_config(config)
    , m_probe(probe)
    , m_executor(executor)
    , m_clock(clock)
    , m_network(network)
    , m_browser(browser)
    , m_socket(socket)
    , m_banList(clock, config.banTtlMs)
    , m_timers(scheduler)
    , m_running(false)
    , m_resumeOnActive(false)
    , m_generation(0)
    , m_inFlight(0)
    , m_strategyJobs(0)
    , m_batchTimer(core::INVALID_TIMER)
    , m_earlyStopTimer(core::INVALID_TIMER)
{
    if (m_config.maxConcurrentProbes == 0) m_config.maxConcurrentProbes = 1;
}

DiscoveryEngine::~DiscoveryEngine() {
    stopDiscovery();
    m_timers.cancelAll();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool DiscoveryEngine::startDiscovery() {
    // Interface queries stay outside the lock
    std::set<std::string> localAddresses;
    for (const hal::InterfaceAddress& iface : m_network.interfaces()) {
        localAddresses.insert(iface.address.toString());
    }
    std::vector<std::string> scanCandidates;
    if (m_config.enableRangeScan) {
        scanCandidates = buildScanCandidates();
    }

    uint32_t generation;
    core::CancellationToken token;
    std::vector<std::string> toDispatch;
    bool runBrowse = false;
    bool runBcast = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running) {
            LL_LOGD("Already running");
            return false;
        }

        m_running = true;
        generation = ++m_generation;
        m_cancel.reset();
        token = m_cancel.token();

        m_scanned.clear();
        m_queue.clear();
        m_inFlight = 0;
        m_strategyJobs = 0;
        m_stats = DiscoveryStats();
        m_localAddresses = localAddresses;
        m_earlyStopTimer = core::INVALID_TIMER;

        if (m_config.enableServiceBrowse) {
            if (m_browser) {
                runBrowse = true;
                m_strategyJobs++;
            } else {
                m_stats.strategiesFailed++;
            }
        }
        if (m_config.enableBroadcast) {
            if (m_socket) {
                runBcast = true;
                m_strategyJobs++;
            } else {
                m_stats.strategiesFailed++;
            }
        }

        offerCandidatesLocked(scanCandidates, toDispatch);

        LL_LOGI("Discovery started (mdns=%d broadcast=%d scan=%u hosts)",
                runBrowse ? 1 : 0, runBcast ? 1 : 0, (unsigned)scanCandidates.size());
    }

    if (runBrowse) {
        bool posted = m_executor.post([this, generation, token]() {
            runServiceBrowse(generation, token);
        });
        if (!posted) {
            LL_LOGW("Executor rejected service browse");
            onStrategyDone(generation, true);
        }
    }
    if (runBcast) {
        bool posted = m_executor.post([this, generation, token]() {
            runBroadcast(generation, token);
        });
        if (!posted) {
            LL_LOGW("Executor rejected broadcast listener");
            onStrategyDone(generation, true);
        }
    }

    dispatch(toDispatch, generation, token);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation == m_generation) maybeFinishLocked();
    }
    return true;
}

void DiscoveryEngine::stopDiscovery() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running) {
            m_running = false;
            m_generation++;
            m_cancel.reset();
            m_queue.clear();
            m_inFlight = 0;
            m_strategyJobs = 0;
            LL_LOGI("Discovery stopped (%u found, %u probes)",
                    (unsigned)m_stats.found, (unsigned)m_stats.probesIssued);
        }
        if (m_earlyStopTimer != core::INVALID_TIMER) {
            m_timers.cancel(m_earlyStopTimer);
            m_earlyStopTimer = core::INVALID_TIMER;
        }
        if (m_batchTimer != core::INVALID_TIMER) {
            m_timers.cancel(m_batchTimer);
            m_batchTimer = core::INVALID_TIMER;
        }
    }

    // Anything found before the stop is still delivered
    flushPending();
}

void DiscoveryEngine::enterBackground() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_resumeOnActive = m_running;
    }
    stopDiscovery();
}

void DiscoveryEngine::becomeActive() {
    bool resume;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        resume = m_resumeOnActive;
        m_resumeOnActive = false;
    }
    if (resume) {
        LL_LOGI("Resuming discovery after background");
        startDiscovery();
    }
}

bool DiscoveryEngine::isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

DiscoveryStats DiscoveryEngine::stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

std::vector<DeviceRecord> DiscoveryEngine::discoveredDevices() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<DeviceRecord> out;
    out.reserve(m_known.size());
    for (const auto& entry : m_known) {
        out.push_back(entry.second);
    }
    return out;
}

bool DiscoveryEngine::setDisplayName(const std::string& deviceId, const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_known.find(deviceId);
    if (it == m_known.end()) return false;
    it->second.name = name;
    it->second.nameIsUserAssigned = true;
    return true;
}

// ============================================================================
// Strategies
// ============================================================================

bool DiscoveryEngine::looksLikeDevice(const std::string& serviceType,
                                      const std::string& instanceName) {
    if (toLower(serviceType).find("wled") != std::string::npos) return true;

    static const char* const kNameHints[] = {"wled", "led", "light", "esp", "arduino"};
    std::string name = toLower(instanceName);
    for (const char* hint : kNameHints) {
        if (name.find(hint) != std::string::npos) return true;
    }
    return false;
}

void DiscoveryEngine::runServiceBrowse(uint32_t generation, core::CancellationToken token) {
    size_t failures = 0;

    for (const std::string& type : m_config.serviceTypes) {
        if (token.isCancelled()) break;

        std::vector<hal::ServiceRecord> records;
        if (!m_browser->browse(type, m_config.serviceWindowMs, records)) {
            LL_LOGW("Browse %s failed", type.c_str());
            failures++;
            continue;
        }

        std::vector<std::string> addresses;
        for (const hal::ServiceRecord& record : records) {
            if (record.address.empty()) continue;
            if (!looksLikeDevice(type, record.instanceName)) {
                LL_LOGD("Ignoring %s (%s)", record.instanceName.c_str(), type.c_str());
                continue;
            }
            if (record.port != 0 && record.port != Protocol::HTTP_PORT) {
                addresses.push_back(record.address + ":" + std::to_string(record.port));
            } else {
                addresses.push_back(record.address);
            }
        }

        if (!addresses.empty()) {
            LL_LOGD("%s: %u candidates", type.c_str(), (unsigned)addresses.size());
            offerCandidates(addresses, generation);
        }
    }

    onStrategyDone(generation, !m_config.serviceTypes.empty() &&
                               failures == m_config.serviceTypes.size());
}

void DiscoveryEngine::runBroadcast(uint32_t generation, core::CancellationToken token) {
    if (!m_socket->open(0)) {
        LL_LOGW("UDP socket unavailable - broadcast discovery skipped");
        onStrategyDone(generation, true);
        return;
    }

    if (!m_socket->broadcast(Protocol::FULL_STATE_REQUEST, m_config.broadcastPort)) {
        LL_LOGW("Broadcast to port %u failed", m_config.broadcastPort);
        m_socket->close();
        onStrategyDone(generation, true);
        return;
    }

    const uint32_t startMs = m_clock.nowMs();
    while (!token.isCancelled()) {
        uint32_t elapsed = m_clock.nowMs() - startMs;
        if (elapsed >= m_config.broadcastWindowMs) break;

        uint32_t slice = std::min(m_config.broadcastReceiveSliceMs,
                                  m_config.broadcastWindowMs - elapsed);
        hal::Datagram datagram;
        if (!m_socket->receive(datagram, slice)) continue;

        std::string ip;
        if (!codec::WledJsonCodec::decodeDiscoveryReply(datagram.payload, ip)) {
            ip = datagram.sourceAddress;
        }
        if (ip.empty()) continue;

        offerCandidates(std::vector<std::string>{ip}, generation);
    }

    m_socket->close();
    onStrategyDone(generation, false);
}

std::vector<std::string> DiscoveryEngine::buildScanCandidates() {
    std::vector<std::string> out;
    std::vector<uint32_t> prefixes;

    for (const hal::InterfaceAddress& iface : m_network.interfaces()) {
        if (iface.address.isZero()) continue;

        uint32_t prefix = iface.address.toUint32() & 0xFFFFFF00u;
        if (std::find(prefixes.begin(), prefixes.end(), prefix) != prefixes.end()) continue;
        if (prefixes.size() >= m_config.maxScanRanges) break;
        prefixes.push_back(prefix);

        const uint8_t* o = iface.address.octets;
        for (int host = 1; host <= 254; host++) {
            net::Ipv4Address candidate(o[0], o[1], o[2], static_cast<uint8_t>(host));
            if (candidate == iface.address) continue;
            out.push_back(candidate.toString());
        }
        LL_LOGD("Scan range %u.%u.%u.0/24", o[0], o[1], o[2]);
    }

    return out;
}

// ============================================================================
// Admission and probing
// ============================================================================

void DiscoveryEngine::offerCandidates(const std::vector<std::string>& addresses,
                                      uint32_t generation) {
    std::vector<std::string> toDispatch;
    core::CancellationToken token;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running || generation != m_generation) return;
        offerCandidatesLocked(addresses, toDispatch);
        token = m_cancel.token();
    }
    dispatch(toDispatch, generation, token);
}

void DiscoveryEngine::offerCandidatesLocked(const std::vector<std::string>& addresses,
                                            std::vector<std::string>& toDispatch) {
    for (const std::string& address : addresses) {
        m_stats.candidates++;

        if (m_localAddresses.count(address)) continue;

        if (m_scanned.count(address)) {
            m_stats.alreadyAttempted++;
            continue;
        }
        m_scanned.insert(address);

        if (m_banList.isBanned(address)) {
            m_stats.banned++;
            continue;
        }

        m_queue.push_back(address);
    }
    takeDispatchableLocked(toDispatch);
}

void DiscoveryEngine::takeDispatchableLocked(std::vector<std::string>& toDispatch) {
    while (m_inFlight < m_config.maxConcurrentProbes && !m_queue.empty()) {
        toDispatch.push_back(m_queue.front());
        m_queue.pop_front();
        m_inFlight++;
        m_stats.probesIssued++;
    }
}

void DiscoveryEngine::dispatch(const std::vector<std::string>& addresses, uint32_t generation,
                               core::CancellationToken token) {
    for (const std::string& address : addresses) {
        bool posted = m_executor.post([this, address, generation, token]() {
            if (token.isCancelled()) return;
            ProbeResult result = m_probe.probe(address, m_config.probeTimeoutMs);
            onProbeComplete(generation, token, result);
        });
        if (!posted) {
            LL_LOGW("Executor rejected probe for %s", address.c_str());
            onPostRejected(generation);
        }
    }
}

void DiscoveryEngine::onProbeComplete(uint32_t generation, const core::CancellationToken& token,
                                      const ProbeResult& result) {
    std::vector<std::string> toDispatch;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation != m_generation || token.isCancelled()) {
            LL_LOGD("Abandoning result for %s", result.address.c_str());
            return;
        }

        if (m_inFlight > 0) m_inFlight--;
        recordOutcomeLocked(result.outcome);

        if (isBannable(result.outcome)) {
            m_banList.ban(result.address);
        }
        if (result.succeeded()) {
            acceptDeviceLocked(result);
        }

        takeDispatchableLocked(toDispatch);
        maybeFinishLocked();
    }
    dispatch(toDispatch, generation, token);
}

void DiscoveryEngine::onPostRejected(uint32_t generation) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (generation != m_generation) return;

    if (m_inFlight > 0) m_inFlight--;
    if (m_stats.probesIssued > 0) m_stats.probesIssued--;

    // Nothing left to drive the queue forward
    if (m_inFlight == 0 && !m_queue.empty()) {
        LL_LOGW("Dropping %u queued candidates", (unsigned)m_queue.size());
        m_queue.clear();
    }
    maybeFinishLocked();
}

void DiscoveryEngine::onStrategyDone(uint32_t generation, bool failed) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (generation != m_generation) return;

    if (failed) m_stats.strategiesFailed++;
    if (m_strategyJobs > 0) m_strategyJobs--;
    maybeFinishLocked();
}

void DiscoveryEngine::addDeviceByAddress(const std::string& address, ProbeCallback callback) {
    if (!net::isValidDeviceAddress(address)) {
        LL_LOGW("Rejecting manual address '%s'", address.c_str());
        ProbeResult result;
        result.address = address;
        result.outcome = ProbeOutcome::Unreachable;
        if (callback) callback(result);
        return;
    }

    bool posted = m_executor.post([this, address, callback]() {
        ProbeResult result = m_probe.probe(address, m_config.probeTimeoutMs);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            recordOutcomeLocked(result.outcome);
            if (isBannable(result.outcome)) {
                m_banList.ban(address);
            }
            if (result.succeeded()) {
                acceptDeviceLocked(result);
            }
        }
        LL_LOGI("Manual probe %s -> %s", address.c_str(), toString(result.outcome));
        if (callback) callback(result);
    });

    if (!posted) {
        LL_LOGW("Executor rejected manual probe for %s", address.c_str());
        ProbeResult result;
        result.address = address;
        result.outcome = ProbeOutcome::Unreachable;
        if (callback) callback(result);
    }
}

// ============================================================================
// Results
// ============================================================================

void DiscoveryEngine::recordOutcomeLocked(ProbeOutcome outcome) {
    switch (outcome) {
        case ProbeOutcome::Success:          m_stats.found++; break;
        case ProbeOutcome::Timeout:          m_stats.timeouts++; break;
        case ProbeOutcome::Unreachable:      m_stats.unreachable++; break;
        case ProbeOutcome::ProtocolMismatch: m_stats.protocolMismatch++; break;
        case ProbeOutcome::AlreadyAttempted: m_stats.alreadyAttempted++; break;
        case ProbeOutcome::Banned:           m_stats.banned++; break;
    }
}

void DiscoveryEngine::acceptDeviceLocked(const ProbeResult& result) {
    const DeviceInfo& info = result.snapshot.info;

    DeviceRecord record;
    record.id = info.mac;
    record.address = result.address;
    record.name = info.name.empty() ? result.address : info.name;
    record.lastSeenMs = m_clock.nowMs();
    record.online = true;
    record.snapshot = result.snapshot;
    m_pending.push_back(record);

    LL_LOGI("Found %s (%s) at %s", record.name.c_str(), record.id.c_str(),
            record.address.c_str());

    // Re-arm the debounce window on every find
    if (m_batchTimer != core::INVALID_TIMER) {
        m_timers.cancel(m_batchTimer);
    }
    m_batchTimer = m_timers.once(m_config.batchDebounceMs, [this]() { flushPending(); });

    if (m_running && m_config.stopAfterFirstDevice &&
        m_earlyStopTimer == core::INVALID_TIMER) {
        m_earlyStopTimer = m_timers.once(m_config.earlyStopGraceMs, [this]() {
            LL_LOGI("Early stop after first device");
            stopDiscovery();
        });
    }
}

void DiscoveryEngine::flushPending() {
    std::vector<DiscoveryEvent> events;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_batchTimer = core::INVALID_TIMER;
        if (m_pending.empty()) return;

        std::map<std::string, size_t> eventIndex;
        for (const DeviceRecord& found : m_pending) {
            auto known = m_known.find(found.id);
            bool isNew = (known == m_known.end());

            if (isNew) {
                known = m_known.emplace(found.id, found).first;
            } else {
                DeviceRecord& existing = known->second;
                existing.address = found.address;
                existing.lastSeenMs = found.lastSeenMs;
                existing.online = true;
                existing.snapshot = found.snapshot;
                if (!existing.nameIsUserAssigned) {
                    existing.name = found.name;
                }
            }

            // One event per identifier per batch
            auto idx = eventIndex.find(found.id);
            if (idx == eventIndex.end()) {
                eventIndex[found.id] = events.size();
                events.push_back(DiscoveryEvent{known->second, isNew});
            } else {
                events[idx->second].record = known->second;
            }
        }
        m_pending.clear();
    }

    LL_LOGD("Delivering batch of %u devices", (unsigned)events.size());
    for (const DiscoveryEvent& event : events) {
        m_events.publish(event);
    }
}

void DiscoveryEngine::maybeFinishLocked() {
    if (!m_running) return;
    if (m_strategyJobs > 0 || !m_queue.empty() || m_inFlight > 0) return;

    m_running = false;
    if (m_earlyStopTimer != core::INVALID_TIMER) {
        m_timers.cancel(m_earlyStopTimer);
        m_earlyStopTimer = core::INVALID_TIMER;
    }

    LL_LOGI("Discovery complete: %u found, %u probes, %u timeouts, %u unreachable, %u banned",
            (unsigned)m_stats.found, (unsigned)m_stats.probesIssued,
            (unsigned)m_stats.timeouts, (unsigned)m_stats.unreachable,
            (unsigned)m_stats.banned);
}

} // namespace discovery
} // namespace lumenlink
