// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FleetController.cpp
 * @brief Component wiring and lifecycle propagation
 */

#define LL_LOG_TAG "Fleet"
#include "utils/Log.h"

#include "FleetController.h"

namespace lumenlink {
namespace fleet {

FleetController::FleetController(const FleetConfig& config,
                                 const FleetPlatform& platform,
                                 directory::IDeviceDirectory& directory)
    : m_config(config)
    , m_platform(platform)
    , m_directory(directory)
    , m_scheduler(platform.clock)
    , m_probe(platform.http)
    , m_discovery(config.discovery, m_probe, platform.executor, m_scheduler, platform.clock,
                  platform.network, platform.browser, platform.socket)
    , m_health(config.health, m_probe, platform.executor, m_scheduler, platform.clock,
               &platform.random)
    , m_pool(config.pool, platform.duplex, m_scheduler, platform.clock, platform.network,
             &platform.random)
    , m_http(platform.http, config.httpTimeoutMs)
    , m_timers(m_scheduler)
    , m_discoverySub(0)
    , m_healthSub(0)
    , m_stateSub(0)
    , m_started(false)
    , m_networkUp(true)
{
    m_discoverySub = m_discovery.events().subscribe(
        [this](const discovery::DiscoveryEvent& event) { onDiscovered(event); });
    m_healthSub = m_health.onlineChanges().subscribe(
        [this](const health::HealthChange& change) { onHealthChange(change); });
    m_stateSub = m_pool.stateUpdates().subscribe(
        [this](const pool::DeviceStateUpdate& update) { onDeviceState(update); });
}

FleetController::~FleetController() {
    m_timers.cancelAll();
    m_discovery.events().unsubscribe(m_discoverySub);
    m_health.onlineChanges().unsubscribe(m_healthSub);
    m_pool.stateUpdates().unsubscribe(m_stateSub);
    m_discovery.stopDiscovery();
    m_health.stop();
    m_pool.disconnectAll();
}

// ============================================================================
// Lifecycle
// ============================================================================

void FleetController::begin() {
    if (m_started) return;
    m_started = true;

    m_networkUp = m_platform.network.isConnected();
    m_health.setNetworkAvailable(m_networkUp);

    std::vector<DeviceRecord> known = m_directory.all();
    for (const DeviceRecord& record : known) {
        m_health.registerDevice(record);
    }
    m_health.start();

    m_timers.every(m_config.networkCheckIntervalMs, [this]() { checkNetwork(); });

    LL_LOGI("Fleet started: %u known devices, network %s", (unsigned)known.size(),
            m_networkUp ? "up" : "down");
}

size_t FleetController::update() {
    return m_scheduler.poll();
}

void FleetController::enterBackground() {
    LL_LOGI("Entering background");
    m_discovery.enterBackground();
    m_health.enterBackground();
    m_pool.enterBackground();
}

void FleetController::becomeActive() {
    LL_LOGI("Becoming active");
    m_pool.becomeActive();
    m_health.becomeActive();
    m_discovery.becomeActive();
}

void FleetController::checkNetwork() {
    bool up = m_platform.network.isConnected();
    if (up == m_networkUp) return;

    m_networkUp = up;
    LL_LOGI("Network %s", up ? "restored" : "lost");
    m_health.setNetworkAvailable(up);
    if (!up) m_discovery.stopDiscovery();
}

// ============================================================================
// Discovery
// ============================================================================

bool FleetController::startDiscovery() {
    if (!m_networkUp) {
        LL_LOGW("Discovery not started - network unavailable");
        return false;
    }
    return m_discovery.startDiscovery();
}

void FleetController::stopDiscovery() {
    m_discovery.stopDiscovery();
}

void FleetController::addDeviceByAddress(const std::string& address,
                                         discovery::DiscoveryEngine::ProbeCallback callback) {
    m_discovery.addDeviceByAddress(address, callback);
}

void FleetController::onDiscovered(const discovery::DiscoveryEvent& event) {
    const DeviceRecord& record = event.record;
    bool isNew = m_directory.upsert(record);

    DeviceRecord stored;
    if (!m_directory.find(record.id, stored)) return;

    if (isNew) {
        m_health.registerDevice(stored);
    } else if (!m_health.updateDeviceAddress(stored.id, stored.address)) {
        m_health.registerDevice(stored);
    }
}

void FleetController::onHealthChange(const health::HealthChange& change) {
    m_directory.setOnline(change.deviceId, change.online, m_platform.clock.nowMs());
}

void FleetController::onDeviceState(const pool::DeviceStateUpdate& update) {
    DeviceRecord record;
    if (!m_directory.find(update.deviceId, record)) return;

    if (update.snapshot.hasInfo) {
        record.snapshot.info = update.snapshot.info;
        record.snapshot.hasInfo = true;
    }
    if (update.snapshot.hasState) {
        record.snapshot.state = update.snapshot.state;
        record.snapshot.hasState = true;
    }
    record.lastSeenMs = update.receivedMs;
    m_directory.upsert(record);
}

// ============================================================================
// Connections
// ============================================================================

ConnectionError FleetController::connectDevice(const std::string& deviceId, int priority) {
    DeviceRecord record;
    if (!m_directory.find(deviceId, record)) {
        LL_LOGW("Cannot connect unknown device %s", deviceId.c_str());
        return ConnectionError::InvalidAddress;
    }

    ConnectionError result = m_pool.connect(deviceId, record.address, priority);
    if (result == ConnectionError::MaxConnectionsReached &&
        m_pool.optimizeConnections(priority) > 0) {
        result = m_pool.connect(deviceId, record.address, priority);
    }
    return result;
}

ConnectionError FleetController::focusDevice(const std::string& deviceId, int priority) {
    m_pool.disconnectAllExcept(deviceId);
    return connectDevice(deviceId, priority);
}

bool FleetController::disconnectDevice(const std::string& deviceId) {
    return m_pool.disconnect(deviceId);
}

bool FleetController::removeDevice(const std::string& deviceId) {
    m_pool.disconnect(deviceId);
    m_health.unregisterDevice(deviceId);
    return m_directory.remove(deviceId);
}

bool FleetController::renameDevice(const std::string& deviceId, const std::string& name) {
    if (name.empty() || !m_directory.rename(deviceId, name)) return false;
    m_discovery.setDisplayName(deviceId, name);
    return true;
}

ConnectionError FleetController::sendUpdate(const std::string& deviceId,
                                            const StateUpdate& update) {
    return m_pool.sendUpdate(update, deviceId);
}

SyncError FleetController::toSyncError(ConnectionError error) {
    switch (error) {
        case ConnectionError::None:         return SyncError::None;
        case ConnectionError::NotConnected: return SyncError::NotConnected;
        default:                            return SyncError::SendFailed;
    }
}

std::vector<sync::ChunkReport> FleetController::pushPixels(
    const std::string& deviceId,
    int16_t segmentId,
    uint32_t startOffset,
    const std::vector<uint32_t>& colors,
    const sync::ChunkedSender::AfterChunk& afterChunk) {
    DeviceRecord record;
    if (!m_directory.find(deviceId, record)) {
        LL_LOGW("Cannot push pixels to unknown device %s", deviceId.c_str());
        return std::vector<sync::ChunkReport>();
    }

    if (m_pool.getStatus(deviceId).status == pool::ConnectionStatus::Connected) {
        std::vector<sync::PixelChunk> chunks = sync::buildChunks(segmentId, startOffset, colors);
        sync::ChunkedSender sender;
        return sender.send(chunks, [this, &deviceId](const std::string& body) {
            return toSyncError(m_pool.sendRaw(deviceId, body));
        }, afterChunk);
    }

    return m_http.setSegmentPixels(record.address, segmentId, startOffset, colors, afterChunk);
}

} // namespace fleet
} // namespace lumenlink
