// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FleetController.h
 * @brief Composition root for the connectivity core
 *
 * Owns one instance of every component and wires them together:
 *
 *   DiscoveryEngine --events--> IDeviceDirectory (upsert)
 *                           \-> ConnectionHealthMonitor (register / readdress)
 *   ConnectionHealthMonitor --onlineChanges--> IDeviceDirectory (online flag)
 *   ConnectionPoolManager --stateUpdates--> IDeviceDirectory (snapshot)
 *   INetworkInfo (polled) --> ConnectionHealthMonitor::setNetworkAvailable
 *
 * Platform services arrive through FleetPlatform; nothing here touches
 * hardware directly. The main loop calls update() to drive all timers.
 *
 * The executor must have finished every posted job before the controller
 * is destroyed.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/Errors.h"
#include "core/EventStream.h"
#include "core/Scheduler.h"
#include "core/TimerScope.h"
#include "directory/IDeviceDirectory.h"
#include "discovery/AddressProbe.h"
#include "discovery/DiscoveryEngine.h"
#include "hal/interface/IClock.h"
#include "hal/interface/IDatagramSocket.h"
#include "hal/interface/IDuplexTransport.h"
#include "hal/interface/IExecutor.h"
#include "hal/interface/IHttpTransport.h"
#include "hal/interface/INetworkInfo.h"
#include "hal/interface/IServiceBrowser.h"
#include "health/ConnectionHealthMonitor.h"
#include "net/DeviceHttpClient.h"
#include "pool/ConnectionPoolManager.h"
#include "sync/ChunkedSyncProtocol.h"

namespace lumenlink {
namespace fleet {

/**
 * @brief Platform services injected into the controller
 */
struct FleetPlatform {
    const hal::IClock& clock;
    hal::IRandom& random;
    hal::IExecutor& executor;
    hal::IHttpTransport& http;
    hal::IDuplexTransport& duplex;
    const hal::INetworkInfo& network;
    hal::IServiceBrowser* browser;      ///< Optional
    hal::IDatagramSocket* socket;       ///< Optional
};

struct FleetConfig {
    discovery::DiscoveryConfig discovery;
    health::HealthMonitorConfig health;
    pool::PoolConfig pool;
    uint32_t networkCheckIntervalMs = 1000;
    uint32_t httpTimeoutMs = config::SyncDefaults::HTTP_TIMEOUT_MS;
};

class FleetController {
public:
    FleetController(const FleetConfig& config,
                    const FleetPlatform& platform,
                    directory::IDeviceDirectory& directory);
    ~FleetController();

    // Prevent copying
    FleetController(const FleetController&) = delete;
    FleetController& operator=(const FleetController&) = delete;

    /**
     * @brief Register directory records, start health monitoring and the
     *        network watch
     */
    void begin();

    /**
     * @brief Fire due timers; call from the main loop
     * @return Number of timer callbacks run
     */
    size_t update();

    bool startDiscovery();
    void stopDiscovery();
    void addDeviceByAddress(const std::string& address,
                            discovery::DiscoveryEngine::ProbeCallback callback = nullptr);

    /**
     * @brief Open a pooled link to a directory device
     *
     * When the pool is full, a lower-priority link is evicted to make room.
     */
    ConnectionError connectDevice(const std::string& deviceId, int priority = 0);

    /**
     * @brief Close every other pooled link, then connect @p deviceId
     */
    ConnectionError focusDevice(const std::string& deviceId, int priority = 0);

    bool disconnectDevice(const std::string& deviceId);

    /**
     * @brief Forget a device everywhere: pool, health and directory
     */
    bool removeDevice(const std::string& deviceId);

    /**
     * @brief Pin a user display name (not pushed to the device)
     */
    bool renameDevice(const std::string& deviceId, const std::string& name);

    ConnectionError sendUpdate(const std::string& deviceId, const StateUpdate& update);

    /**
     * @brief Push per-LED colors over the pooled link, or one-shot HTTP
     *        when the device has no open link
     *
     * Blocks on HTTP; run from an executor job.
     */
    std::vector<sync::ChunkReport> pushPixels(const std::string& deviceId,
                                              int16_t segmentId,
                                              uint32_t startOffset,
                                              const std::vector<uint32_t>& colors,
                                              const sync::ChunkedSender::AfterChunk& afterChunk = nullptr);

    /**
     * @brief Suspend discovery, health timers and pool pings
     */
    void enterBackground();
    void becomeActive();

    bool isNetworkAvailable() const { return m_networkUp.load(); }

    core::Scheduler& scheduler() { return m_scheduler; }
    discovery::DiscoveryEngine& discovery() { return m_discovery; }
    health::ConnectionHealthMonitor& health() { return m_health; }
    pool::ConnectionPoolManager& pool() { return m_pool; }
    net::DeviceHttpClient& http() { return m_http; }
    directory::IDeviceDirectory& directory() { return m_directory; }

    static SyncError toSyncError(ConnectionError error);

private:
    void onDiscovered(const discovery::DiscoveryEvent& event);
    void onHealthChange(const health::HealthChange& change);
    void onDeviceState(const pool::DeviceStateUpdate& update);
    void checkNetwork();

    FleetConfig m_config;
    FleetPlatform m_platform;
    directory::IDeviceDirectory& m_directory;

    core::Scheduler m_scheduler;
    discovery::AddressProbe m_probe;
    discovery::DiscoveryEngine m_discovery;
    health::ConnectionHealthMonitor m_health;
    pool::ConnectionPoolManager m_pool;
    net::DeviceHttpClient m_http;
    core::TimerScope m_timers;

    core::SubscriptionId m_discoverySub;
    core::SubscriptionId m_healthSub;
    core::SubscriptionId m_stateSub;
    bool m_started;
    std::atomic<bool> m_networkUp;
};

} // namespace fleet
} // namespace lumenlink
