// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConnectionPoolManager.h
 * @brief Bounded pool of persistent WebSocket connections to devices
 *
 * Connection Strategy:
 * - At most `capacity` links are Connecting/Connected/Reconnecting at once
 * - Admission (check + reserve) is one critical section under m_mutex
 * - IPv4 devices outside every local subnet are banned instead of dialled;
 *   the check is skipped while no interface has an address, and a ban is
 *   lifted as soon as the host matches a local subnet
 * - Disconnected devices are forgotten; only a connect() that got as far as
 *   a slot request leaves an entry behind
 * - Lowest priority (then oldest) links are evicted by optimizeConnections()
 *
 * Health:
 * - Each connected link sends "ping" every 30s; the next inbound message
 *   or pong yields latencyMs
 * - A receive error, unexpected close or failed send starts jittered
 *   exponential backoff reconnection, at most maxReconnectAttempts times
 *
 * Threading:
 * - Transport events may arrive on any thread; each carries the generation
 *   of the link it belongs to and is dropped once that link is replaced
 * - Transports are never called with m_mutex held
 * - All timers of a device live in its TimerScope and die together
 */

#pragma once

#include <cstdint>
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
#include "discovery/AddressBanList.h"
#include "hal/interface/IClock.h"
#include "hal/interface/IDuplexTransport.h"
#include "hal/interface/INetworkInfo.h"

namespace lumenlink {
namespace pool {

enum class ConnectionStatus : uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    LimitReached        ///< Last connect() was refused at capacity
};

const char* toString(ConnectionStatus status);

/**
 * @brief Counts against pool capacity
 */
inline bool isActive(ConnectionStatus status) {
    return status == ConnectionStatus::Connecting ||
           status == ConnectionStatus::Connected ||
           status == ConnectionStatus::Reconnecting;
}

struct PoolConfig {
    uint8_t capacity = config::PoolDefaults::CAPACITY;
    uint32_t pingIntervalMs = config::PoolDefaults::PING_INTERVAL_MS;
    uint8_t maxReconnectAttempts = config::PoolDefaults::MAX_RECONNECT_ATTEMPTS;
    uint32_t offSubnetBanMs = config::PoolDefaults::OFF_SUBNET_BAN_MS;
    core::BackoffPolicy backoff{config::PoolDefaults::RECONNECT_BASE_DELAY_MS,
                                config::PoolDefaults::RECONNECT_MULTIPLIER,
                                config::PoolDefaults::RECONNECT_MAX_DELAY_MS,
                                config::PoolDefaults::RECONNECT_JITTER};
};

/**
 * @brief Snapshot of one pooled connection
 */
struct PooledConnectionStatus {
    std::string deviceId;
    std::string address;
    ConnectionStatus status = ConnectionStatus::Disconnected;
    int priority = 0;
    uint32_t lastConnectedMs = 0;
    uint32_t latencyMs = 0;
    bool hasLatency = false;        ///< A ping round trip has completed
    uint8_t reconnectAttempts = 0;
    ConnectionError lastError = ConnectionError::None;
    std::string lastErrorDetail;
    bool healthy = false;
    uint32_t pingsSent = 0;
};

/**
 * @brief State pushed by a device over its pooled link
 */
struct DeviceStateUpdate {
    std::string deviceId;
    DeviceSnapshot snapshot;
    uint32_t receivedMs;
};

class ConnectionPoolManager {
public:
    /**
     * @param random Jitter source; without one, delays are unjittered
     */
    ConnectionPoolManager(const PoolConfig& config,
                          hal::IDuplexTransport& transport,
                          core::Scheduler& scheduler,
                          const hal::IClock& clock,
                          const hal::INetworkInfo& network,
                          hal::IRandom* random = nullptr);
    ~ConnectionPoolManager();

    // Prevent copying
    ConnectionPoolManager(const ConnectionPoolManager&) = delete;
    ConnectionPoolManager& operator=(const ConnectionPoolManager&) = delete;

    /**
     * @brief Open a persistent connection to ws://<address>/ws
     *
     * Already-active devices only get their priority updated.
     *
     * @return None when accepted; MaxConnectionsReached at capacity;
     *         InvalidAddress when no URL can be formed; ConnectionFailed for
     *         off-subnet (banned) devices or when the transport refuses
     */
    ConnectionError connect(const std::string& deviceId, const std::string& address,
                            int priority = 0);

    /**
     * @brief Close the link, cancel its timers and forget the device
     * @return true if the device held a slot
     */
    bool disconnect(const std::string& deviceId);

    void disconnectAll();
    void disconnectAllExcept(const std::string& keepDeviceId);

    /**
     * @brief Make room for a request of @p incomingPriority
     *
     * At capacity, evicts the lowest-priority link (oldest first on ties)
     * if its priority is below @p incomingPriority.
     *
     * @return Number of links evicted
     */
    uint8_t optimizeConnections(int incomingPriority);

    /**
     * @brief Encode and send a partial state update
     * @return NotConnected (nothing sent) or SendFailed (link reconnects)
     */
    ConnectionError sendUpdate(const StateUpdate& update, const std::string& deviceId);

    /**
     * @brief Send a pre-encoded JSON body over the device's link
     */
    ConnectionError sendRaw(const std::string& deviceId, const std::string& body);

    /**
     * @brief Suspend pings and reconnect timers; open links stay open
     */
    void enterBackground();

    /**
     * @brief Resume pings for Connected links and owed reconnects
     */
    void becomeActive();

    PooledConnectionStatus getStatus(const std::string& deviceId) const;
    std::vector<std::string> connectedDeviceIds() const;
    uint8_t activeConnectionCount() const;
    uint8_t capacity() const { return m_config.capacity; }

    core::EventStream<DeviceStateUpdate>& stateUpdates() { return m_stateUpdates; }
    discovery::AddressBanList& offSubnetBans() { return m_offSubnetBans; }

private:
    struct Connection {
        PooledConnectionStatus info;
        std::string url;
        uint32_t generation = 0;        ///< Identifies the current link attempt
        std::shared_ptr<hal::IDuplexConnection> handle;
        bool transportOpen = false;
        bool fullStateSent = false;
        bool pingOutstanding = false;
        uint32_t pingSentMs = 0;
        bool reconnectOwed = false;     ///< Reconnect timer dropped by background
        std::unique_ptr<core::TimerScope> timers;
    };

    using HandleList = std::vector<std::shared_ptr<hal::IDuplexConnection>>;

    enum class SubnetMatch : uint8_t {
        Local,
        Outside,
        Unknown         ///< No addressed interface to compare against
    };

    SubnetMatch matchLocalSubnets(const net::Ipv4Address& address) const;
    void noteRejection(const std::string& deviceId, const std::string& address,
                       ConnectionError error, const char* detail);
    uint8_t activeCountLocked() const;
    Connection& entryLocked(const std::string& deviceId);

    bool openLink(const std::string& deviceId, const std::string& url, uint32_t generation);
    void onLinkOpen(const std::string& deviceId, uint32_t generation);
    void onLinkText(const std::string& deviceId, uint32_t generation, const std::string& text);
    void onLinkPong(const std::string& deviceId, uint32_t generation);
    void onLinkFailure(const std::string& deviceId, uint32_t generation,
                       ConnectionError error, const std::string& detail);
    void onReconnectTimer(const std::string& deviceId, uint32_t generation);
    void sendPing(const std::string& deviceId, uint32_t generation);

    bool recordLatencyLocked(Connection& conn);
    void scheduleReconnectLocked(Connection& conn, HandleList& toClose);
    void armReconnectTimerLocked(Connection& conn);
    void armPingLocked(Connection& conn);
    void releaseLocked(Connection& conn, ConnectionStatus status, ConnectionError error,
                       HandleList& toClose);

    static void closeAll(const HandleList& handles);

    PoolConfig m_config;
    hal::IDuplexTransport& m_transport;
    core::Scheduler& m_scheduler;
    const hal::IClock& m_clock;
    const hal::INetworkInfo& m_network;
    hal::IRandom* m_random;

    discovery::AddressBanList m_offSubnetBans;
    core::EventStream<DeviceStateUpdate> m_stateUpdates;

    mutable std::mutex m_mutex;
    std::map<std::string, Connection> m_connections;
    uint32_t m_nextGeneration;
    bool m_suspended;
};

} // namespace pool
} // namespace lumenlink
