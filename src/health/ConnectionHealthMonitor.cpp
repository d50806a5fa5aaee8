// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConnectionHealthMonitor.cpp
 * @brief Health state machine implementation
 */

#define LL_LOG_TAG "Health"
#include "utils/Log.h"

#include "ConnectionHealthMonitor.h"

#include <cstdio>

namespace lumenlink {
namespace health {

const char* toString(HealthState state) {
    switch (state) {
        case HealthState::Monitoring:   return "monitoring";
        case HealthState::Degraded:     return "degraded";
        case HealthState::Offline:      return "offline";
        case HealthState::Reconnecting: return "reconnecting";
        case HealthState::Exhausted:    return "exhausted";
    }
    return "unknown";
}

ConnectionHealthMonitor::ConnectionHealthMonitor(const HealthMonitorConfig& config,
                                                 const discovery::AddressProbe& probe,
                                                 hal::IExecutor& executor,
                                                 core::Scheduler& scheduler,
                                                 const hal::IClock& clock,
                                                 hal::IRandom* random)
    : m_config(config)
    , m_probe(probe)
    , m_executor(executor)
    , m_scheduler(scheduler)
    , m_clock(clock)
    , m_random(random)
    , m_sweepTimers(scheduler)
    , m_started(false)
    , m_suspended(false)
    , m_networkAvailable(true)
    , m_nextEpoch(0)
{
    if (m_config.offlineThreshold == 0) m_config.offlineThreshold = 1;
}

ConnectionHealthMonitor::~ConnectionHealthMonitor() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

void ConnectionHealthMonitor::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_started) return;
    m_started = true;
    if (!m_suspended) armSweepsLocked();
    LL_LOGI("Health monitor started (full=%lums quick=%lums)",
            (unsigned long)m_config.fullSweepIntervalMs,
            (unsigned long)m_config.quickSweepIntervalMs);
}

void ConnectionHealthMonitor::stop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_started = false;
    m_sweepTimers.cancelAll();
    for (auto& entry : m_devices) {
        entry.second.timers->cancelAll();
    }
}

void ConnectionHealthMonitor::armSweepsLocked() {
    m_sweepTimers.cancelAll();
    m_sweepTimers.every(m_config.fullSweepIntervalMs, [this]() { runSweep(false); });
    m_sweepTimers.every(m_config.quickSweepIntervalMs, [this]() { runSweep(true); });
}

void ConnectionHealthMonitor::enterBackground() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_suspended) return;
    m_suspended = true;
    m_sweepTimers.cancelAll();
    for (auto& entry : m_devices) {
        // reconnectArmed survives so the retry is re-armed on resume
        entry.second.timers->cancelAll();
    }
    LL_LOGI("Suspended for background");
}

void ConnectionHealthMonitor::becomeActive() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_suspended) return;
    m_suspended = false;
    if (m_started) armSweepsLocked();

    if (!m_networkAvailable) return;
    for (auto& entry : m_devices) {
        DeviceHealth& device = entry.second;
        if (device.state == HealthState::Reconnecting && device.reconnectArmed) {
            scheduleReconnectLocked(device);
        }
    }
    LL_LOGI("Resumed from background");
}

// ============================================================================
// Registration
// ============================================================================

void ConnectionHealthMonitor::registerDevice(const DeviceRecord& record) {
    std::vector<ProbeRequest> requests;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(record.id);
        if (it != m_devices.end()) {
            it->second.address = record.address;
            it->second.name = record.name;
            return;
        }

        DeviceHealth device;
        device.id = record.id;
        device.address = record.address;
        device.name = record.name;
        device.online = record.online;
        device.epoch = ++m_nextEpoch;
        device.status = "Monitoring";
        device.timers.reset(new core::TimerScope(m_scheduler));
        DeviceHealth& stored = m_devices.emplace(record.id, std::move(device)).first->second;

        LL_LOGI("Registered %s (%s) at %s", record.name.c_str(), record.id.c_str(),
                record.address.c_str());

        if (m_networkAvailable && !m_suspended) {
            requestProbeLocked(stored, ProbeKind::Check, requests);
        }
    }
    launch(requests);
}

void ConnectionHealthMonitor::unregisterDevice(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_devices.erase(deviceId) > 0) {
        LL_LOGI("Unregistered %s", deviceId.c_str());
    }
}

bool ConnectionHealthMonitor::updateDeviceAddress(const std::string& deviceId,
                                                  const std::string& address) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_devices.find(deviceId);
    if (it == m_devices.end()) return false;
    if (it->second.address != address) {
        LL_LOGI("%s moved %s -> %s", deviceId.c_str(), it->second.address.c_str(),
                address.c_str());
        it->second.address = address;
    }
    return true;
}

// ============================================================================
// Manual operations
// ============================================================================

void ConnectionHealthMonitor::forceHealthCheck() {
    std::vector<ProbeRequest> requests;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_networkAvailable) {
            LL_LOGD("Forced check skipped - network unavailable");
            return;
        }
        for (auto& entry : m_devices) {
            requestProbeLocked(entry.second, ProbeKind::Check, requests);
        }
        LL_LOGI("Forced health check of %u devices", (unsigned)requests.size());
    }
    launch(requests);
}

bool ConnectionHealthMonitor::forceReconnection(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_devices.find(deviceId);
    if (it == m_devices.end()) {
        LL_LOGW("Cannot force reconnection - %s not tracked", deviceId.c_str());
        return false;
    }
    if (!m_networkAvailable) return false;

    DeviceHealth& device = it->second;
    device.timers->cancelAll();
    device.attempts = 0;
    device.state = HealthState::Reconnecting;
    LL_LOGI("Forced reconnection for %s", deviceId.c_str());
    scheduleReconnectLocked(device);
    return true;
}

bool ConnectionHealthMonitor::resetReconnectionAttempts(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_devices.find(deviceId);
    if (it == m_devices.end()) return false;

    DeviceHealth& device = it->second;
    device.timers->cancelAll();
    device.reconnectArmed = false;
    device.attempts = 0;
    device.failures = 0;
    device.state = HealthState::Monitoring;
    device.status = "Reset - monitoring";
    LL_LOGI("Reset reconnection attempts for %s", deviceId.c_str());
    return true;
}

void ConnectionHealthMonitor::setNetworkAvailable(bool available) {
    std::vector<HealthChange> changes;
    std::vector<ProbeRequest> requests;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (available == m_networkAvailable) return;
        m_networkAvailable = available;

        if (!available) {
            LL_LOGW("Network connectivity lost");
            for (auto& entry : m_devices) {
                DeviceHealth& device = entry.second;
                device.epoch = ++m_nextEpoch;
                device.timers->cancelAll();
                device.reconnectArmed = false;
                device.status = "Network unavailable";
                if (device.online) {
                    changes.push_back(HealthChange{device.id, false, HealthState::Offline});
                }
                device.online = false;
                device.state = HealthState::Offline;
            }
        } else {
            LL_LOGI("Network connectivity restored - resuming health checks");
            for (auto& entry : m_devices) {
                DeviceHealth& device = entry.second;
                device.epoch = ++m_nextEpoch;
                device.state = HealthState::Monitoring;
                device.failures = 0;
                device.attempts = 0;
                device.status = "Checking connection...";
                if (!m_suspended) {
                    requestProbeLocked(device, ProbeKind::Check, requests);
                }
            }
        }
    }
    publish(changes);
    launch(requests);
}

// ============================================================================
// Queries
// ============================================================================

bool ConnectionHealthMonitor::isOnline(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_devices.find(deviceId);
    return it != m_devices.end() && it->second.online;
}

std::string ConnectionHealthMonitor::getStatus(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_devices.find(deviceId);
    return it == m_devices.end() ? std::string("Unknown") : it->second.status;
}

bool ConnectionHealthMonitor::getHealth(const std::string& deviceId, HealthSnapshot& out) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_devices.find(deviceId);
    if (it == m_devices.end()) return false;
    out = snapshotOf(it->second);
    return true;
}

std::vector<ConnectionAttempt> ConnectionHealthMonitor::getConnectionHistory(
    const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_devices.find(deviceId);
    if (it == m_devices.end()) return std::vector<ConnectionAttempt>();
    return std::vector<ConnectionAttempt>(it->second.history.begin(), it->second.history.end());
}

std::vector<std::string> ConnectionHealthMonitor::trackedDeviceIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> ids;
    for (const auto& entry : m_devices) {
        ids.push_back(entry.first);
    }
    return ids;
}

bool ConnectionHealthMonitor::isNetworkAvailable() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_networkAvailable;
}

HealthSnapshot ConnectionHealthMonitor::snapshotOf(const DeviceHealth& device) {
    HealthSnapshot snap;
    snap.deviceId = device.id;
    snap.state = device.state;
    snap.online = device.online;
    snap.consecutiveFailures = device.failures;
    snap.reconnectAttempts = device.attempts;
    snap.lastAttemptMs = device.lastAttemptMs;
    snap.nextRetryAtMs = device.nextRetryAtMs;
    snap.retryExhausted = (device.state == HealthState::Exhausted);
    snap.status = device.status;
    return snap;
}

// ============================================================================
// Probing
// ============================================================================

void ConnectionHealthMonitor::runSweep(bool quick) {
    std::vector<ProbeRequest> requests;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_networkAvailable || m_suspended) return;

        for (auto& entry : m_devices) {
            DeviceHealth& device = entry.second;
            if (device.state != HealthState::Monitoring &&
                device.state != HealthState::Degraded) {
                continue;
            }
            if (quick && device.failures == 0) continue;
            requestProbeLocked(device, ProbeKind::Check, requests);
        }
    }
    if (!requests.empty()) {
        LL_LOGD("%s sweep: %u probes", quick ? "Quick" : "Full", (unsigned)requests.size());
    }
    launch(requests);
}

bool ConnectionHealthMonitor::requestProbeLocked(DeviceHealth& device, ProbeKind kind,
                                                 std::vector<ProbeRequest>& out) {
    if (device.probeInFlight) {
        // A reconnect attempt takes over the probe already on the wire
        if (kind == ProbeKind::Reconnect) device.inFlightKind = ProbeKind::Reconnect;
        return false;
    }

    device.probeInFlight = true;
    device.inFlightEpoch = device.epoch;
    device.inFlightKind = kind;
    device.lastAttemptMs = m_clock.nowMs();
    out.push_back(ProbeRequest{device.id, device.address, device.epoch});
    return true;
}

void ConnectionHealthMonitor::launch(const std::vector<ProbeRequest>& requests) {
    for (const ProbeRequest& request : requests) {
        bool posted = m_executor.post([this, request]() {
            discovery::ProbeResult result = m_probe.probe(request.address, m_config.probeTimeoutMs);
            onProbeResult(request.deviceId, request.epoch, result);
        });
        if (!posted) {
            LL_LOGW("Executor rejected probe for %s", request.deviceId.c_str());
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_devices.find(request.deviceId);
            if (it != m_devices.end() && ownsInFlightProbe(it->second, request.epoch)) {
                it->second.probeInFlight = false;
            }
        }
    }
}

bool ConnectionHealthMonitor::ownsInFlightProbe(const DeviceHealth& device, uint32_t epoch) const {
    return device.probeInFlight && device.inFlightEpoch == epoch;
}

void ConnectionHealthMonitor::onProbeResult(const std::string& deviceId, uint32_t epoch,
                                            const discovery::ProbeResult& result) {
    std::vector<HealthChange> changes;
    std::vector<ProbeRequest> requests;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(deviceId);
        if (it == m_devices.end()) return;

        DeviceHealth& device = it->second;
        // Issued for an earlier registration of this id
        if (!ownsInFlightProbe(device, epoch)) return;
        device.probeInFlight = false;

        if (epoch != device.epoch) {
            // State was reset while this probe ran; check again from scratch
            if (m_networkAvailable && !m_suspended && device.state == HealthState::Monitoring) {
                requestProbeLocked(device, ProbeKind::Check, requests);
            }
        } else {
            recordAttemptLocked(device, result);

            if (result.succeeded()) {
                markOnlineLocked(device, changes);
            } else if (device.inFlightKind == ProbeKind::Reconnect) {
                markReconnectFailureLocked(device);
            } else {
                markCheckFailureLocked(device, changes);
            }
        }
    }
    publish(changes);
    launch(requests);
}

void ConnectionHealthMonitor::onReconnectTimer(const std::string& deviceId) {
    std::vector<ProbeRequest> requests;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(deviceId);
        if (it == m_devices.end()) return;

        DeviceHealth& device = it->second;
        if (device.state != HealthState::Reconnecting || !m_networkAvailable || m_suspended) {
            return;
        }

        device.reconnectArmed = false;
        device.attempts++;
        device.status = "Attempting reconnection...";
        LL_LOGI("Reconnection attempt %u/%u for %s", device.attempts, m_config.maxRetries,
                device.name.c_str());
        requestProbeLocked(device, ProbeKind::Reconnect, requests);
    }
    launch(requests);
}

// ============================================================================
// Transitions
// ============================================================================

void ConnectionHealthMonitor::recordAttemptLocked(DeviceHealth& device,
                                                  const discovery::ProbeResult& result) {
    device.history.push_back(ConnectionAttempt{m_clock.nowMs(), result.succeeded(), result.outcome});
    while (device.history.size() > m_config.historyLimit) {
        device.history.pop_front();
    }
}

void ConnectionHealthMonitor::markOnlineLocked(DeviceHealth& device,
                                               std::vector<HealthChange>& changes) {
    bool wasRecovering = device.state == HealthState::Reconnecting ||
                         device.state == HealthState::Exhausted ||
                         device.state == HealthState::Offline;

    device.timers->cancelAll();
    device.reconnectArmed = false;
    device.failures = 0;
    device.attempts = 0;
    device.nextRetryAtMs = 0;
    device.state = HealthState::Monitoring;
    device.status = "Online";

    if (wasRecovering) {
        LL_LOGI("Reconnection successful for %s (%s)", device.name.c_str(), device.id.c_str());
    }
    if (!device.online) {
        device.online = true;
        LL_LOGI("Device came online: %s (%s)", device.name.c_str(), device.id.c_str());
        changes.push_back(HealthChange{device.id, true, device.state});
    }
}

void ConnectionHealthMonitor::markCheckFailureLocked(DeviceHealth& device,
                                                     std::vector<HealthChange>& changes) {
    if (device.failures < 255) device.failures++;

    if (device.state != HealthState::Monitoring && device.state != HealthState::Degraded) {
        // Reconnecting/Exhausted devices only record out-of-band failures
        return;
    }

    LL_LOGD("Health check failed for %s (%u/%u)", device.name.c_str(), device.failures,
            m_config.offlineThreshold);

    if (device.failures >= m_config.offlineThreshold) {
        setOfflineLocked(device, changes);
        device.attempts = 0;
        device.state = HealthState::Reconnecting;
        scheduleReconnectLocked(device);
        return;
    }

    device.state = HealthState::Degraded;
    char status[64];
    snprintf(status, sizeof(status), "Connection issues detected (%u/%u)",
             device.failures, m_config.offlineThreshold);
    device.status = status;
}

void ConnectionHealthMonitor::markReconnectFailureLocked(DeviceHealth& device) {
    if (device.failures < 255) device.failures++;

    if (device.attempts >= m_config.maxRetries) {
        device.state = HealthState::Exhausted;
        device.reconnectArmed = false;
        device.nextRetryAtMs = 0;
        device.status = "Reconnection failed - device may be offline";
        LL_LOGE("All reconnection attempts exhausted for %s (%s)", device.name.c_str(),
                device.id.c_str());
        return;
    }

    LL_LOGW("Reconnection attempt %u/%u failed for %s", device.attempts, m_config.maxRetries,
            device.name.c_str());
    scheduleReconnectLocked(device);
}

void ConnectionHealthMonitor::setOfflineLocked(DeviceHealth& device,
                                               std::vector<HealthChange>& changes) {
    device.state = HealthState::Offline;
    if (device.online) {
        device.online = false;
        LL_LOGI("Device went offline: %s (%s) - initiating reconnection",
                device.name.c_str(), device.id.c_str());
        changes.push_back(HealthChange{device.id, false, HealthState::Offline});
    }
}

void ConnectionHealthMonitor::scheduleReconnectLocked(DeviceHealth& device) {
    float unit = m_random ? m_random->nextUnit() : 0.5f;
    uint32_t delay = m_config.backoff.jitteredDelay(device.attempts, unit);

    device.state = HealthState::Reconnecting;
    device.reconnectArmed = true;
    device.nextRetryAtMs = m_clock.nowMs() + delay;

    char status[64];
    snprintf(status, sizeof(status), "Reconnecting in %lus... (%u/%u)",
             (unsigned long)((delay + 500) / 1000), device.attempts + 1, m_config.maxRetries);
    device.status = status;

    LL_LOGI("Scheduling reconnection attempt %u/%u for %s in %lums", device.attempts + 1,
            m_config.maxRetries, device.name.c_str(), (unsigned long)delay);

    device.timers->cancelAll();
    if (m_suspended) return;

    std::string deviceId = device.id;
    device.timers->once(delay, [this, deviceId]() { onReconnectTimer(deviceId); });
}

void ConnectionHealthMonitor::publish(const std::vector<HealthChange>& changes) {
    for (const HealthChange& change : changes) {
        m_changes.publish(change);
    }
}

} // namespace health
} // namespace lumenlink
