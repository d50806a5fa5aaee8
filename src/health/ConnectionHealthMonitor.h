// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConnectionHealthMonitor.h
 * @brief Per-device health state machine with backoff reconnection
 *
 * States:
 *   Monitoring -> Degraded (1-2 failures) -> Offline (3rd failure)
 *   Offline -> Reconnecting (immediately, first retry after baseDelay)
 *   Reconnecting -> Monitoring on success, -> Exhausted after maxRetries
 *   any -> Offline when the host network goes away
 *
 * Cadence:
 * - Full sweep every 15s over Monitoring/Degraded devices
 * - Quick sweep every 3s over devices with at least one failure
 * - Reconnecting devices are driven by their own backoff timer
 *
 * Probes for one device never overlap. A check requested while a probe is
 * in flight is coalesced into it. Probe failures never escape this class;
 * callers read isOnline()/getStatus()/getHealth() or subscribe to
 * onlineChanges().
 *
 * Single writer: all health state is owned here and guarded by m_mutex.
 */

#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config/network_config.h"
#include "core/Backoff.h"
#include "core/DeviceTypes.h"
#include "core/Errors.h"
#include "core/EventStream.h"
#include "core/Scheduler.h"
#include "core/TimerScope.h"
#include "discovery/AddressProbe.h"
#include "hal/interface/IClock.h"
#include "hal/interface/IExecutor.h"

namespace lumenlink {
namespace health {

enum class HealthState : uint8_t {
    Monitoring,     ///< Healthy
    Degraded,       ///< 1-2 consecutive failures
    Offline,        ///< Failure threshold reached, or network down
    Reconnecting,   ///< Retrying with backoff
    Exhausted       ///< Retry budget spent; waits for a manual reset
};

const char* toString(HealthState state);

struct ConnectionAttempt {
    uint32_t timestampMs;
    bool success;
    ProbeOutcome outcome;
};

/**
 * @brief Synchronous view of one device's health
 */
struct HealthSnapshot {
    std::string deviceId;
    HealthState state = HealthState::Monitoring;
    bool online = false;
    uint8_t consecutiveFailures = 0;
    uint8_t reconnectAttempts = 0;
    uint32_t lastAttemptMs = 0;
    uint32_t nextRetryAtMs = 0;     ///< Valid while state == Reconnecting
    bool retryExhausted = false;
    std::string status;
};

struct HealthChange {
    std::string deviceId;
    bool online;
    HealthState state;
};

struct HealthMonitorConfig {
    uint32_t fullSweepIntervalMs = config::HealthDefaults::FULL_SWEEP_INTERVAL_MS;
    uint32_t quickSweepIntervalMs = config::HealthDefaults::QUICK_SWEEP_INTERVAL_MS;
    uint32_t probeTimeoutMs = config::HealthDefaults::PROBE_TIMEOUT_MS;
    uint8_t offlineThreshold = config::HealthDefaults::OFFLINE_FAILURE_THRESHOLD;
    uint8_t maxRetries = config::HealthDefaults::RECONNECT_MAX_RETRIES;
    uint8_t historyLimit = config::HealthDefaults::HISTORY_LIMIT;
    core::BackoffPolicy backoff{config::HealthDefaults::RECONNECT_BASE_DELAY_MS,
                                config::HealthDefaults::RECONNECT_MULTIPLIER,
                                config::HealthDefaults::RECONNECT_MAX_DELAY_MS,
                                0.0f};
};

class ConnectionHealthMonitor {
public:
    /**
     * @param random Optional jitter source, only used when backoff.jitter > 0
     */
    ConnectionHealthMonitor(const HealthMonitorConfig& config,
                            const discovery::AddressProbe& probe,
                            hal::IExecutor& executor,
                            core::Scheduler& scheduler,
                            const hal::IClock& clock,
                            hal::IRandom* random = nullptr);
    ~ConnectionHealthMonitor();

    // Prevent copying
    ConnectionHealthMonitor(const ConnectionHealthMonitor&) = delete;
    ConnectionHealthMonitor& operator=(const ConnectionHealthMonitor&) = delete;

    /**
     * @brief Arm the periodic sweeps
     */
    void start();

    /**
     * @brief Cancel sweeps and every reconnect timer
     */
    void stop();

    /**
     * @brief Track a device and probe it immediately
     *
     * Registering a tracked id updates its address and name only.
     */
    void registerDevice(const DeviceRecord& device);

    /**
     * @brief Stop tracking; cancels timers and drops state and history
     */
    void unregisterDevice(const std::string& deviceId);

    /**
     * @brief Point future probes at a new address (DHCP change)
     */
    bool updateDeviceAddress(const std::string& deviceId, const std::string& address);

    /**
     * @brief Probe every tracked device now, bypassing the schedule
     */
    void forceHealthCheck();

    /**
     * @brief Reset the attempt counter and re-enter Reconnecting
     * @return false if the device is unknown or the network is down
     */
    bool forceReconnection(const std::string& deviceId);

    /**
     * @brief Clear counters and return to Monitoring (manual reset)
     */
    bool resetReconnectionAttempts(const std::string& deviceId);

    /**
     * @brief Host-level connectivity change
     *
     * Loss marks every device offline and cancels retries. Restoration
     * returns every device to Monitoring and checks it immediately.
     */
    void setNetworkAvailable(bool available);

    /**
     * @brief Suspend sweeps and reconnect timers while backgrounded
     */
    void enterBackground();
    void becomeActive();

    bool isOnline(const std::string& deviceId) const;

    /**
     * @brief Human-readable status ("Unknown" for untracked ids)
     */
    std::string getStatus(const std::string& deviceId) const;

    bool getHealth(const std::string& deviceId, HealthSnapshot& out) const;

    std::vector<ConnectionAttempt> getConnectionHistory(const std::string& deviceId) const;

    std::vector<std::string> trackedDeviceIds() const;
    bool isNetworkAvailable() const;

    core::EventStream<HealthChange>& onlineChanges() { return m_changes; }

private:
    enum class ProbeKind : uint8_t {
        Check,          ///< Sweep, registration or forced check
        Reconnect       ///< Counts against the retry budget
    };

    struct DeviceHealth {
        std::string id;
        std::string address;
        std::string name;
        HealthState state = HealthState::Monitoring;
        bool online = false;
        uint8_t failures = 0;
        uint8_t attempts = 0;
        uint32_t lastAttemptMs = 0;
        uint32_t nextRetryAtMs = 0;
        bool probeInFlight = false;
        ProbeKind inFlightKind = ProbeKind::Check;
        bool reconnectArmed = false;    ///< A retry is owed (re-armed on resume)
        uint32_t epoch = 0;             ///< Replaced to invalidate in-flight results
        uint32_t inFlightEpoch = 0;     ///< Epoch the in-flight probe was issued under
        std::string status;
        std::deque<ConnectionAttempt> history;
        std::unique_ptr<core::TimerScope> timers;
    };

    struct ProbeRequest {
        std::string deviceId;
        std::string address;
        uint32_t epoch;
    };

    void runSweep(bool quick);
    bool requestProbeLocked(DeviceHealth& device, ProbeKind kind,
                            std::vector<ProbeRequest>& out);
    void launch(const std::vector<ProbeRequest>& requests);
    void onProbeResult(const std::string& deviceId, uint32_t epoch,
                       const discovery::ProbeResult& result);
    void onReconnectTimer(const std::string& deviceId);
    bool ownsInFlightProbe(const DeviceHealth& device, uint32_t epoch) const;

    void markOnlineLocked(DeviceHealth& device, std::vector<HealthChange>& changes);
    void markCheckFailureLocked(DeviceHealth& device, std::vector<HealthChange>& changes);
    void markReconnectFailureLocked(DeviceHealth& device);
    void setOfflineLocked(DeviceHealth& device, std::vector<HealthChange>& changes);
    void scheduleReconnectLocked(DeviceHealth& device);
    void recordAttemptLocked(DeviceHealth& device, const discovery::ProbeResult& result);
    void armSweepsLocked();
    void publish(const std::vector<HealthChange>& changes);

    static HealthSnapshot snapshotOf(const DeviceHealth& device);

    HealthMonitorConfig m_config;
    const discovery::AddressProbe& m_probe;
    hal::IExecutor& m_executor;
    core::Scheduler& m_scheduler;
    const hal::IClock& m_clock;
    hal::IRandom* m_random;

    core::TimerScope m_sweepTimers;
    core::EventStream<HealthChange> m_changes;

    mutable std::mutex m_mutex;
    std::map<std::string, DeviceHealth> m_devices;
    bool m_started;
    bool m_suspended;
    bool m_networkAvailable;
    uint32_t m_nextEpoch;               ///< Monitor-wide; never reused across records
};

} // namespace health
} // namespace lumenlink
