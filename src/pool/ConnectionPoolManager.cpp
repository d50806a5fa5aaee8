// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConnectionPoolManager.cpp
 * @brief Pooled WebSocket connection management implementation
 */

#define LL_LOG_TAG "Pool"
#include "utils/Log.h"

#include "ConnectionPoolManager.h"

#include "codec/WledJsonCodec.h"
#include "net/DeviceEndpoint.h"

namespace lumenlink {
namespace pool {

const char* toString(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting:   return "connecting";
        case ConnectionStatus::Connected:    return "connected";
        case ConnectionStatus::Reconnecting: return "reconnecting";
        case ConnectionStatus::LimitReached: return "limit-reached";
    }
    return "unknown";
}

ConnectionPoolManager::ConnectionPoolManager(const PoolConfig& config,
                                             hal::IDuplexTransport& transport,
                                             core::Scheduler& scheduler,
                                             const hal::IClock& clock,
                                             const hal::INetworkInfo& network,
                                             hal::IRandom* random)
    : m_config(config)
    , m_transport(transport)
    , m_scheduler(scheduler)
    , m_clock(clock)
    , m_network(network)
    , m_random(random)
    , m_offSubnetBans(clock, config.offSubnetBanMs)
    , m_nextGeneration(0)
    , m_suspended(false)
{
}

ConnectionPoolManager::~ConnectionPoolManager() {
    disconnectAll();
}

// ============================================================================
// Admission
// ============================================================================

ConnectionError ConnectionPoolManager::connect(const std::string& deviceId,
                                               const std::string& address,
                                               int priority) {
    if (deviceId.empty()) return ConnectionError::InvalidAddress;

    std::string url;
    if (!net::buildWebSocketUrl(address, url)) {
        LL_LOGW("Invalid address for %s: '%s'", deviceId.c_str(), address.c_str());
        noteRejection(deviceId, address, ConnectionError::InvalidAddress,
                      "address cannot form a connection URL");
        return ConnectionError::InvalidAddress;
    }

    // Hostnames cannot be checked against interface prefixes; let them through
    std::string host = net::hostOf(address);
    net::Ipv4Address ip;
    if (net::Ipv4Address::parse(host, ip)) {
        SubnetMatch match = matchLocalSubnets(ip);
        bool banned = m_offSubnetBans.isBanned(host);
        if (banned && match == SubnetMatch::Local) {
            m_offSubnetBans.unban(host);
            banned = false;
            LL_LOGI("%s (%s) is on a local subnet now - ban lifted", deviceId.c_str(), host.c_str());
        } else if (!banned && match == SubnetMatch::Outside) {
            m_offSubnetBans.ban(host);
            banned = true;
            LL_LOGI("%s (%s) is outside every local subnet - banned for %lus",
                    deviceId.c_str(), host.c_str(),
                    (unsigned long)(m_config.offSubnetBanMs / 1000));
        }
        if (banned) {
            noteRejection(deviceId, address, ConnectionError::ConnectionFailed,
                          "device is not on a local subnet");
            return ConnectionError::ConnectionFailed;
        }
    }

    uint32_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Connection& conn = entryLocked(deviceId);

        if (isActive(conn.info.status)) {
            conn.info.priority = priority;
            return ConnectionError::None;
        }

        if (activeCountLocked() >= m_config.capacity) {
            conn.info.address = address;
            conn.info.status = ConnectionStatus::LimitReached;
            conn.info.lastError = ConnectionError::MaxConnectionsReached;
            conn.info.lastErrorDetail = "connection pool is full";
            LL_LOGW("Pool full (%u) - rejected %s", m_config.capacity, deviceId.c_str());
            return ConnectionError::MaxConnectionsReached;
        }

        conn.info.address = address;
        conn.info.status = ConnectionStatus::Connecting;
        conn.info.priority = priority;
        conn.info.lastConnectedMs = m_clock.nowMs();
        conn.info.reconnectAttempts = 0;
        conn.info.lastError = ConnectionError::None;
        conn.info.lastErrorDetail.clear();
        conn.info.healthy = false;
        conn.url = url;
        conn.transportOpen = false;
        conn.fullStateSent = false;
        conn.pingOutstanding = false;
        conn.reconnectOwed = false;
        conn.timers->cancelAll();
        conn.generation = ++m_nextGeneration;
        generation = conn.generation;
    }

    LL_LOGI("Connecting to %s at %s (priority %d)", deviceId.c_str(), url.c_str(), priority);

    if (!openLink(deviceId, url, generation)) {
        HandleList toClose;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            Connection& conn = entryLocked(deviceId);
            if (conn.generation == generation) {
                releaseLocked(conn, ConnectionStatus::Disconnected,
                              ConnectionError::ConnectionFailed, toClose);
                conn.info.lastErrorDetail = "transport refused to open";
            }
        }
        closeAll(toClose);
        LL_LOGW("Transport refused connection to %s", deviceId.c_str());
        return ConnectionError::ConnectionFailed;
    }
    return ConnectionError::None;
}

ConnectionPoolManager::SubnetMatch ConnectionPoolManager::matchLocalSubnets(
    const net::Ipv4Address& address) const {
    std::vector<hal::InterfaceAddress> interfaces = m_network.interfaces();
    bool anyAddressed = false;
    for (const hal::InterfaceAddress& iface : interfaces) {
        if (iface.address.isZero()) continue;
        anyAddressed = true;
        if (address.sameSubnet(iface.address, iface.netmask)) return SubnetMatch::Local;
    }
    // No interface has an address yet (link still coming up)
    return anyAddressed ? SubnetMatch::Outside : SubnetMatch::Unknown;
}

void ConnectionPoolManager::noteRejection(const std::string& deviceId, const std::string& address,
                                          ConnectionError error, const char* detail) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_connections.find(deviceId);
    if (it == m_connections.end() || isActive(it->second.info.status)) return;

    PooledConnectionStatus& info = it->second.info;
    info.address = address;
    info.lastError = error;
    info.lastErrorDetail = detail;
}

uint8_t ConnectionPoolManager::activeCountLocked() const {
    uint8_t count = 0;
    for (const auto& entry : m_connections) {
        if (isActive(entry.second.info.status)) count++;
    }
    return count;
}

ConnectionPoolManager::Connection& ConnectionPoolManager::entryLocked(const std::string& deviceId) {
    auto it = m_connections.find(deviceId);
    if (it != m_connections.end()) return it->second;

    Connection& conn = m_connections[deviceId];
    conn.info.deviceId = deviceId;
    conn.timers.reset(new core::TimerScope(m_scheduler));
    return conn;
}

// ============================================================================
// Link events
// ============================================================================

bool ConnectionPoolManager::openLink(const std::string& deviceId, const std::string& url,
                                     uint32_t generation) {
    hal::DuplexCallbacks callbacks;
    callbacks.onOpen = [this, deviceId, generation]() {
        onLinkOpen(deviceId, generation);
    };
    callbacks.onText = [this, deviceId, generation](const std::string& text) {
        onLinkText(deviceId, generation, text);
    };
    callbacks.onPong = [this, deviceId, generation]() {
        onLinkPong(deviceId, generation);
    };
    callbacks.onClosed = [this, deviceId, generation](bool error, const std::string& reason) {
        onLinkFailure(deviceId, generation, ConnectionError::ConnectionLost,
                      error ? reason : std::string("closed by device"));
    };

    std::shared_ptr<hal::IDuplexConnection> handle = m_transport.open(url, callbacks);
    if (!handle) return false;

    bool stale = false;
    bool sendFullState = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(deviceId);
        if (it == m_connections.end() || it->second.generation != generation ||
            !isActive(it->second.info.status)) {
            stale = true;
        } else {
            Connection& conn = it->second;
            conn.handle = handle;
            // onOpen may already have fired inside open()
            if (conn.transportOpen && !conn.fullStateSent) {
                conn.fullStateSent = true;
                sendFullState = true;
            }
        }
    }

    if (stale) {
        handle->close();
        return true;
    }
    if (sendFullState && !handle->sendText(config::Protocol::FULL_STATE_REQUEST)) {
        onLinkFailure(deviceId, generation, ConnectionError::SendFailed,
                      "full state request failed");
    }
    return true;
}

void ConnectionPoolManager::onLinkOpen(const std::string& deviceId, uint32_t generation) {
    std::shared_ptr<hal::IDuplexConnection> handle;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(deviceId);
        if (it == m_connections.end() || it->second.generation != generation) return;

        Connection& conn = it->second;
        if (!isActive(conn.info.status)) return;

        bool wasReconnect = conn.info.status == ConnectionStatus::Reconnecting;
        conn.info.status = ConnectionStatus::Connected;
        conn.info.lastConnectedMs = m_clock.nowMs();
        conn.info.reconnectAttempts = 0;
        conn.info.lastError = ConnectionError::None;
        conn.info.lastErrorDetail.clear();
        conn.info.healthy = true;
        conn.transportOpen = true;
        conn.reconnectOwed = false;
        conn.timers->cancelAll();
        if (!m_suspended) armPingLocked(conn);

        if (conn.handle && !conn.fullStateSent) {
            conn.fullStateSent = true;
            handle = conn.handle;
        }
        LL_LOGI("%s %s", wasReconnect ? "Reconnected to" : "Connected to", deviceId.c_str());
    }

    if (handle && !handle->sendText(config::Protocol::FULL_STATE_REQUEST)) {
        onLinkFailure(deviceId, generation, ConnectionError::SendFailed,
                      "full state request failed");
    }
}

void ConnectionPoolManager::onLinkText(const std::string& deviceId, uint32_t generation,
                                       const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(deviceId);
        if (it == m_connections.end() || it->second.generation != generation) return;
        recordLatencyLocked(it->second);
    }

    // "pong" and other non-JSON replies only count for latency
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos || text[start] != '{') return;

    codec::DeviceDecodeResult decoded = codec::WledJsonCodec::decodeDocument(text);
    if (!decoded.success) {
        LL_LOGD("Ignoring message from %s: %s", deviceId.c_str(), decoded.errorMsg);
        return;
    }

    DeviceStateUpdate update;
    update.deviceId = deviceId;
    update.snapshot = decoded.snapshot;
    update.receivedMs = m_clock.nowMs();
    m_stateUpdates.publish(update);
}

void ConnectionPoolManager::onLinkPong(const std::string& deviceId, uint32_t generation) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_connections.find(deviceId);
    if (it == m_connections.end() || it->second.generation != generation) return;
    recordLatencyLocked(it->second);
}

bool ConnectionPoolManager::recordLatencyLocked(Connection& conn) {
    if (!conn.pingOutstanding) return false;
    conn.pingOutstanding = false;
    conn.info.latencyMs = m_clock.nowMs() - conn.pingSentMs;
    conn.info.hasLatency = true;
    conn.info.healthy = true;
    LL_LOGD("%s latency %lums", conn.info.deviceId.c_str(), (unsigned long)conn.info.latencyMs);
    return true;
}

void ConnectionPoolManager::onLinkFailure(const std::string& deviceId, uint32_t generation,
                                          ConnectionError error, const std::string& detail) {
    HandleList toClose;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(deviceId);
        if (it == m_connections.end() || it->second.generation != generation) return;

        Connection& conn = it->second;
        if (!isActive(conn.info.status)) return;

        LL_LOGW("Link to %s failed: %s (%s)", deviceId.c_str(), toString(error), detail.c_str());

        if (conn.handle) toClose.push_back(conn.handle);
        conn.handle.reset();
        conn.transportOpen = false;
        conn.fullStateSent = false;
        conn.pingOutstanding = false;
        conn.info.healthy = false;
        conn.info.lastError = error;
        conn.info.lastErrorDetail = detail;
        conn.timers->cancelAll();
        conn.generation = ++m_nextGeneration;

        scheduleReconnectLocked(conn, toClose);
    }
    closeAll(toClose);
}

void ConnectionPoolManager::scheduleReconnectLocked(Connection& conn, HandleList& toClose) {
    if (conn.info.reconnectAttempts >= m_config.maxReconnectAttempts) {
        LL_LOGE("Giving up on %s after %u reconnect attempts", conn.info.deviceId.c_str(),
                conn.info.reconnectAttempts);
        releaseLocked(conn, ConnectionStatus::Disconnected,
                      ConnectionError::MaxReconnectAttemptsReached, toClose);
        return;
    }

    conn.info.reconnectAttempts++;
    conn.info.status = ConnectionStatus::Reconnecting;
    if (m_suspended) {
        conn.reconnectOwed = true;
        return;
    }
    armReconnectTimerLocked(conn);
}

void ConnectionPoolManager::armReconnectTimerLocked(Connection& conn) {
    // Attempt k waits base * multiplier^(k-1)
    uint8_t exponent = conn.info.reconnectAttempts > 0 ? conn.info.reconnectAttempts - 1 : 0;
    float unit = m_random ? m_random->nextUnit() : 0.5f;
    uint32_t delay = m_config.backoff.jitteredDelay(exponent, unit);

    conn.reconnectOwed = false;
    std::string deviceId = conn.info.deviceId;
    uint32_t generation = conn.generation;
    conn.timers->once(delay, [this, deviceId, generation]() {
        onReconnectTimer(deviceId, generation);
    });

    LL_LOGI("Reconnect %u/%u for %s in %lums", conn.info.reconnectAttempts,
            m_config.maxReconnectAttempts, deviceId.c_str(), (unsigned long)delay);
}

void ConnectionPoolManager::onReconnectTimer(const std::string& deviceId, uint32_t generation) {
    std::string url;
    uint32_t newGeneration = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(deviceId);
        if (it == m_connections.end()) return;

        Connection& conn = it->second;
        if (conn.generation != generation || conn.info.status != ConnectionStatus::Reconnecting ||
            m_suspended) {
            return;
        }
        conn.generation = ++m_nextGeneration;
        newGeneration = conn.generation;
        url = conn.url;
    }

    if (!openLink(deviceId, url, newGeneration)) {
        onLinkFailure(deviceId, newGeneration, ConnectionError::ConnectionFailed,
                      "transport refused to open");
    }
}

// ============================================================================
// Health pings
// ============================================================================

void ConnectionPoolManager::armPingLocked(Connection& conn) {
    std::string deviceId = conn.info.deviceId;
    uint32_t generation = conn.generation;
    conn.timers->every(m_config.pingIntervalMs, [this, deviceId, generation]() {
        sendPing(deviceId, generation);
    });
}

void ConnectionPoolManager::sendPing(const std::string& deviceId, uint32_t generation) {
    std::shared_ptr<hal::IDuplexConnection> handle;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(deviceId);
        if (it == m_connections.end() || it->second.generation != generation) return;

        Connection& conn = it->second;
        if (conn.info.status != ConnectionStatus::Connected || !conn.handle) return;

        if (conn.pingOutstanding) {
            conn.info.healthy = false;
            LL_LOGW("%s missed a ping", deviceId.c_str());
        }
        conn.pingOutstanding = true;
        conn.pingSentMs = m_clock.nowMs();
        conn.info.pingsSent++;
        handle = conn.handle;
    }

    if (!handle->sendText(config::Protocol::PING_TEXT)) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(deviceId);
        if (it != m_connections.end() && it->second.generation == generation) {
            it->second.info.healthy = false;
            it->second.pingOutstanding = false;
        }
        LL_LOGW("Ping send to %s failed", deviceId.c_str());
    }
}

// ============================================================================
// Teardown
// ============================================================================

void ConnectionPoolManager::releaseLocked(Connection& conn, ConnectionStatus status,
                                          ConnectionError error, HandleList& toClose) {
    if (conn.handle) toClose.push_back(conn.handle);
    conn.handle.reset();
    conn.timers->cancelAll();
    conn.generation = ++m_nextGeneration;
    conn.transportOpen = false;
    conn.fullStateSent = false;
    conn.pingOutstanding = false;
    conn.reconnectOwed = false;
    conn.info.status = status;
    conn.info.healthy = false;
    conn.info.lastError = error;
    if (error == ConnectionError::None) conn.info.lastErrorDetail.clear();
}

void ConnectionPoolManager::closeAll(const HandleList& handles) {
    for (const auto& handle : handles) {
        handle->close();
    }
}

bool ConnectionPoolManager::disconnect(const std::string& deviceId) {
    HandleList toClose;
    bool wasActive = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(deviceId);
        if (it == m_connections.end()) return false;

        wasActive = isActive(it->second.info.status);
        releaseLocked(it->second, ConnectionStatus::Disconnected, ConnectionError::None, toClose);
        m_connections.erase(it);
    }
    closeAll(toClose);
    if (wasActive) LL_LOGI("Disconnected %s", deviceId.c_str());
    return wasActive;
}

void ConnectionPoolManager::disconnectAll() {
    disconnectAllExcept(std::string());
}

void ConnectionPoolManager::disconnectAllExcept(const std::string& keepDeviceId) {
    HandleList toClose;
    uint8_t closed = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_connections.begin(); it != m_connections.end();) {
            if (!keepDeviceId.empty() && it->first == keepDeviceId) {
                ++it;
                continue;
            }
            if (isActive(it->second.info.status)) closed++;
            releaseLocked(it->second, ConnectionStatus::Disconnected, ConnectionError::None,
                          toClose);
            it = m_connections.erase(it);
        }
    }
    closeAll(toClose);
    if (closed > 0) {
        LL_LOGI("Closed %u connections%s%s", closed, keepDeviceId.empty() ? "" : " except ",
                keepDeviceId.c_str());
    }
}

uint8_t ConnectionPoolManager::optimizeConnections(int incomingPriority) {
    HandleList toClose;
    std::string evicted;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (activeCountLocked() < m_config.capacity) return 0;

        auto victim = m_connections.end();
        for (auto it = m_connections.begin(); it != m_connections.end(); ++it) {
            const PooledConnectionStatus& info = it->second.info;
            if (!isActive(info.status)) continue;
            if (victim == m_connections.end() ||
                info.priority < victim->second.info.priority ||
                (info.priority == victim->second.info.priority &&
                 static_cast<int32_t>(info.lastConnectedMs - victim->second.info.lastConnectedMs) < 0)) {
                victim = it;
            }
        }
        if (victim == m_connections.end() ||
            victim->second.info.priority >= incomingPriority) {
            return 0;
        }

        evicted = victim->first;
        releaseLocked(victim->second, ConnectionStatus::Disconnected, ConnectionError::None, toClose);
        m_connections.erase(victim);
    }
    closeAll(toClose);
    LL_LOGI("Evicted %s to make room for priority %d", evicted.c_str(), incomingPriority);
    return 1;
}

// ============================================================================
// Sending
// ============================================================================

ConnectionError ConnectionPoolManager::sendUpdate(const StateUpdate& update,
                                                  const std::string& deviceId) {
    return sendRaw(deviceId, codec::WledJsonCodec::encodeStateUpdate(update));
}

ConnectionError ConnectionPoolManager::sendRaw(const std::string& deviceId,
                                               const std::string& body) {
    std::shared_ptr<hal::IDuplexConnection> handle;
    uint32_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_connections.find(deviceId);
        if (it == m_connections.end() || it->second.info.status != ConnectionStatus::Connected ||
            !it->second.handle) {
            LL_LOGW("Send to %s dropped - no open connection", deviceId.c_str());
            return ConnectionError::NotConnected;
        }
        handle = it->second.handle;
        generation = it->second.generation;
    }

    if (!handle->sendText(body)) {
        onLinkFailure(deviceId, generation, ConnectionError::SendFailed, "send rejected");
        return ConnectionError::SendFailed;
    }
    return ConnectionError::None;
}

// ============================================================================
// Lifecycle
// ============================================================================

void ConnectionPoolManager::enterBackground() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_suspended) return;
    m_suspended = true;
    for (auto& entry : m_connections) {
        Connection& conn = entry.second;
        if (conn.info.status == ConnectionStatus::Reconnecting) conn.reconnectOwed = true;
        conn.timers->cancelAll();
        conn.pingOutstanding = false;
    }
    LL_LOGI("Suspended health checks for background");
}

void ConnectionPoolManager::becomeActive() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_suspended) return;
    m_suspended = false;
    uint8_t resumed = 0;
    for (auto& entry : m_connections) {
        Connection& conn = entry.second;
        if (conn.info.status == ConnectionStatus::Connected) {
            armPingLocked(conn);
            resumed++;
        } else if (conn.info.status == ConnectionStatus::Reconnecting && conn.reconnectOwed) {
            armReconnectTimerLocked(conn);
        }
    }
    LL_LOGI("Resumed health checks for %u connections", resumed);
}

// ============================================================================
// Queries
// ============================================================================

PooledConnectionStatus ConnectionPoolManager::getStatus(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_connections.find(deviceId);
    if (it == m_connections.end()) {
        PooledConnectionStatus unknown;
        unknown.deviceId = deviceId;
        return unknown;
    }
    return it->second.info;
}

std::vector<std::string> ConnectionPoolManager::connectedDeviceIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> ids;
    for (const auto& entry : m_connections) {
        if (entry.second.info.status == ConnectionStatus::Connected) ids.push_back(entry.first);
    }
    return ids;
}

uint8_t ConnectionPoolManager::activeConnectionCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return activeCountLocked();
}

} // namespace pool
} // namespace lumenlink
