// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * LumenLink - Connection Pool Manager Unit Tests
 *
 * Tests admission (capacity, subnet bans, address validation), link events
 * (open, text, pong, close), ping latency, eviction, and the reconnection
 * schedule of 1s, 2s, 4s, 8s, 16s before giving up.
 */

#include <unity.h>
#include <atomic>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

#ifndef NATIVE_BUILD
#define NATIVE_BUILD
#endif

#include "../../src/pool/ConnectionPoolManager.h"
#include "mocks/FakeClock.h"
#include "mocks/FakeDuplexTransport.h"
#include "mocks/FakeHttpTransport.h"
#include "mocks/FakeNetwork.h"

using namespace lumenlink;
using namespace lumenlink::pool;
using namespace lumenlink::test;

//==============================================================================
// Test Fixtures
//==============================================================================

namespace {

const char* kDesk = "desk";
const char* kDeskAddress = "192.168.1.50";
const char* kDeskUrl = "ws://192.168.1.50/ws";
const char* kFullState = "{\"v\":true}";

PoolConfig smallPool(uint8_t capacity) {
    PoolConfig config;
    config.capacity = capacity;
    return config;
}

struct PoolRig {
    FakeClock clock;
    FakeDuplexTransport transport;
    core::Scheduler scheduler;
    FakeNetworkInfo network;
    FixedRandom random;
    ConnectionPoolManager pool;

    explicit PoolRig(const PoolConfig& config = PoolConfig(), bool linkUp = true)
        : clock(0)
        , scheduler(clock)
        , random(0.5f)
        , pool(config, transport, scheduler, clock, network, &random)
    {
        if (linkUp) network.addInterface("192.168.1.10", "255.255.255.0");
    }

    void advance(uint32_t ms) {
        clock.advance(ms);
        scheduler.poll();
    }

    /**
     * Step in 100ms increments until a new link is opened.
     * @return Clock time of the open, or 0 if none within @p limitMs
     */
    uint32_t advanceUntilOpen(uint32_t limitMs) {
        size_t before = transport.openCount();
        uint32_t end = clock.nowMs() + limitMs;
        while (clock.nowMs() < end) {
            advance(100);
            if (transport.openCount() > before) return clock.nowMs();
        }
        return 0;
    }

    std::shared_ptr<FakeDuplexConnection> connectOpen(const char* id = kDesk,
                                                      const char* address = kDeskAddress,
                                                      int priority = 0) {
        pool.connect(id, address, priority);
        std::shared_ptr<FakeDuplexConnection> link = transport.latest();
        link->fireOpen();
        return link;
    }

    ConnectionStatus status(const char* id = kDesk) const {
        return pool.getStatus(id).status;
    }
};

} // namespace

//==============================================================================
// Admission
//==============================================================================

void test_pool_connect_opens_websocket() {
    PoolRig rig;
    TEST_ASSERT_EQUAL(ConnectionError::None, rig.pool.connect(kDesk, kDeskAddress, 3));

    TEST_ASSERT_EQUAL(1, rig.transport.openCount(kDeskUrl));
    PooledConnectionStatus s = rig.pool.getStatus(kDesk);
    TEST_ASSERT_EQUAL(ConnectionStatus::Connecting, s.status);
    TEST_ASSERT_EQUAL_STRING(kDeskAddress, s.address.c_str());
    TEST_ASSERT_EQUAL(3, s.priority);
    TEST_ASSERT_EQUAL(1, rig.pool.activeConnectionCount());

    // Nothing is sent before the socket opens
    TEST_ASSERT_EQUAL(0, rig.transport.latest()->sent().size());

    rig.transport.latest()->fireOpen();
    s = rig.pool.getStatus(kDesk);
    TEST_ASSERT_EQUAL(ConnectionStatus::Connected, s.status);
    TEST_ASSERT_TRUE(s.healthy);
    TEST_ASSERT_EQUAL(1, rig.transport.latest()->sentCount(kFullState));
    TEST_ASSERT_EQUAL(1, rig.pool.connectedDeviceIds().size());
}

void test_pool_synchronous_open_requests_state_once() {
    PoolRig rig;
    rig.transport.setAutoOpen(true);

    TEST_ASSERT_EQUAL(ConnectionError::None, rig.pool.connect(kDesk, kDeskAddress));
    TEST_ASSERT_EQUAL(ConnectionStatus::Connected, rig.status());

    std::vector<std::string> sent = rig.transport.latest()->sent();
    TEST_ASSERT_EQUAL(1, sent.size());
    TEST_ASSERT_EQUAL_STRING(kFullState, sent[0].c_str());
}

void test_pool_connect_active_device_updates_priority() {
    PoolRig rig;
    rig.connectOpen(kDesk, kDeskAddress, 1);

    TEST_ASSERT_EQUAL(ConnectionError::None, rig.pool.connect(kDesk, kDeskAddress, 7));
    TEST_ASSERT_EQUAL(1, rig.transport.openCount());
    TEST_ASSERT_EQUAL(7, rig.pool.getStatus(kDesk).priority);
    TEST_ASSERT_EQUAL(ConnectionStatus::Connected, rig.status());
}

void test_pool_capacity_under_concurrency() {
    PoolRig rig;
    const int kThreads = 50;
    std::atomic<int> accepted(0);
    std::atomic<int> rejected(0);

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; i++) {
        threads.push_back(std::thread([&rig, &accepted, &rejected, i]() {
            char id[16];
            char address[20];
            snprintf(id, sizeof(id), "dev%d", i);
            snprintf(address, sizeof(address), "192.168.1.%d", 100 + i);
            ConnectionError result = rig.pool.connect(id, address);
            if (result == ConnectionError::None) accepted++;
            else if (result == ConnectionError::MaxConnectionsReached) rejected++;
        }));
    }
    for (std::thread& t : threads) t.join();

    TEST_ASSERT_EQUAL(20, accepted.load());
    TEST_ASSERT_EQUAL(30, rejected.load());
    TEST_ASSERT_EQUAL(20, rig.pool.activeConnectionCount());
    TEST_ASSERT_EQUAL(20, rig.transport.openCount());
}

void test_pool_full_pool_reports_limit() {
    PoolRig rig(smallPool(1));
    rig.pool.connect("a", "192.168.1.20");

    TEST_ASSERT_EQUAL(ConnectionError::MaxConnectionsReached,
                      rig.pool.connect("b", "192.168.1.21"));
    PooledConnectionStatus s = rig.pool.getStatus("b");
    TEST_ASSERT_EQUAL(ConnectionStatus::LimitReached, s.status);
    TEST_ASSERT_EQUAL(ConnectionError::MaxConnectionsReached, s.lastError);
    TEST_ASSERT_EQUAL_STRING("connection pool is full", s.lastErrorDetail.c_str());

    // LimitReached does not hold a slot
    rig.pool.disconnect("a");
    TEST_ASSERT_EQUAL(ConnectionError::None, rig.pool.connect("b", "192.168.1.21"));
}

void test_pool_off_subnet_device_is_banned() {
    PoolRig rig;
    TEST_ASSERT_EQUAL(ConnectionError::ConnectionFailed, rig.pool.connect("far", "10.0.0.5"));
    TEST_ASSERT_EQUAL(0, rig.transport.openCount());
    TEST_ASSERT_TRUE(rig.pool.offSubnetBans().isBanned("10.0.0.5"));
    TEST_ASSERT_EQUAL(ConnectionStatus::Disconnected, rig.status("far"));

    // Refused without touching the transport while the ban holds
    rig.advance(60000);
    TEST_ASSERT_EQUAL(ConnectionError::ConnectionFailed, rig.pool.connect("far", "10.0.0.5"));
    TEST_ASSERT_EQUAL(0, rig.transport.openCount());

    // A lapsed ban is re-checked and renewed while the host is still remote
    rig.advance(config::PoolDefaults::OFF_SUBNET_BAN_MS);
    TEST_ASSERT_FALSE(rig.pool.offSubnetBans().isBanned("10.0.0.5"));
    TEST_ASSERT_EQUAL(ConnectionError::ConnectionFailed, rig.pool.connect("far", "10.0.0.5"));
    TEST_ASSERT_EQUAL_UINT32(config::PoolDefaults::OFF_SUBNET_BAN_MS,
                             rig.pool.offSubnetBans().remainingMs("10.0.0.5"));
}

void test_pool_ban_lifted_once_host_is_local() {
    PoolRig rig;
    TEST_ASSERT_EQUAL(ConnectionError::ConnectionFailed, rig.pool.connect("far", "10.0.0.5"));

    rig.network.addInterface("10.0.0.2", "255.255.255.0");
    rig.advance(1000);
    TEST_ASSERT_EQUAL(ConnectionError::None, rig.pool.connect("far", "10.0.0.5"));
    TEST_ASSERT_EQUAL(1, rig.transport.openCount("ws://10.0.0.5/ws"));
    TEST_ASSERT_FALSE(rig.pool.offSubnetBans().isBanned("10.0.0.5"));
}

void test_pool_connect_before_link_up() {
    PoolRig rig(PoolConfig(), false);

    // No interface address to compare against: dial rather than ban
    TEST_ASSERT_EQUAL(ConnectionError::None, rig.pool.connect(kDesk, kDeskAddress));
    TEST_ASSERT_EQUAL(1, rig.transport.openCount(kDeskUrl));
    TEST_ASSERT_EQUAL(0, rig.pool.offSubnetBans().size());
    rig.pool.disconnect(kDesk);

    rig.network.addInterface("192.168.1.10", "255.255.255.0");
    rig.advance(60000);
    TEST_ASSERT_EQUAL(ConnectionError::None, rig.pool.connect(kDesk, kDeskAddress));
    TEST_ASSERT_EQUAL(2, rig.transport.openCount(kDeskUrl));
    TEST_ASSERT_EQUAL(ConnectionError::ConnectionFailed, rig.pool.connect("far", "10.0.0.5"));
}

void test_pool_invalid_address() {
    PoolRig rig;
    TEST_ASSERT_EQUAL(ConnectionError::InvalidAddress, rig.pool.connect("x", "not an address"));
    TEST_ASSERT_EQUAL(ConnectionError::InvalidAddress, rig.pool.connect("", kDeskAddress));
    TEST_ASSERT_EQUAL(0, rig.transport.openCount());

    // Rejected before admission: nothing is remembered for an unknown device
    PooledConnectionStatus s = rig.pool.getStatus("x");
    TEST_ASSERT_EQUAL(ConnectionStatus::Disconnected, s.status);
    TEST_ASSERT_EQUAL(ConnectionError::None, s.lastError);
    TEST_ASSERT_TRUE(s.address.empty());

    // A known idle device records why its latest attempt failed
    rig.transport.setRefuse(true);
    rig.pool.connect(kDesk, kDeskAddress);
    TEST_ASSERT_EQUAL(ConnectionError::InvalidAddress, rig.pool.connect(kDesk, "not an address"));
    s = rig.pool.getStatus(kDesk);
    TEST_ASSERT_EQUAL(ConnectionError::InvalidAddress, s.lastError);
    TEST_ASSERT_EQUAL_STRING("address cannot form a connection URL", s.lastErrorDetail.c_str());
}

void test_pool_hostname_skips_subnet_check() {
    PoolRig rig;
    TEST_ASSERT_EQUAL(ConnectionError::None, rig.pool.connect("hall", "wled-hall.local"));
    TEST_ASSERT_EQUAL(1, rig.transport.openCount("ws://wled-hall.local/ws"));
    TEST_ASSERT_EQUAL(0, rig.pool.offSubnetBans().size());
}

void test_pool_transport_refusal() {
    PoolRig rig;
    rig.transport.setRefuse(true);

    TEST_ASSERT_EQUAL(ConnectionError::ConnectionFailed, rig.pool.connect(kDesk, kDeskAddress));
    PooledConnectionStatus s = rig.pool.getStatus(kDesk);
    TEST_ASSERT_EQUAL(ConnectionStatus::Disconnected, s.status);
    TEST_ASSERT_EQUAL(ConnectionError::ConnectionFailed, s.lastError);
    TEST_ASSERT_EQUAL_STRING("transport refused to open", s.lastErrorDetail.c_str());
    TEST_ASSERT_EQUAL(0, rig.pool.activeConnectionCount());
}

//==============================================================================
// Sending
//==============================================================================

void test_pool_send_requires_open_link() {
    PoolRig rig;
    TEST_ASSERT_EQUAL(ConnectionError::NotConnected, rig.pool.sendRaw("ghost", "{}"));

    rig.pool.connect(kDesk, kDeskAddress);
    TEST_ASSERT_EQUAL(ConnectionError::NotConnected,
                      rig.pool.sendUpdate(StateUpdate::power(true), kDesk));
}

void test_pool_send_update_encodes_json() {
    PoolRig rig;
    std::shared_ptr<FakeDuplexConnection> link = rig.connectOpen();

    TEST_ASSERT_EQUAL(ConnectionError::None, rig.pool.sendUpdate(StateUpdate::power(true), kDesk));
    TEST_ASSERT_EQUAL(ConnectionError::None,
                      rig.pool.sendUpdate(StateUpdate::withBrightness(40), kDesk));

    std::vector<std::string> sent = link->sent();
    TEST_ASSERT_EQUAL(3, sent.size());
    TEST_ASSERT_EQUAL_STRING("{\"on\":true}", sent[1].c_str());
    TEST_ASSERT_EQUAL_STRING("{\"bri\":40}", sent[2].c_str());
}

void test_pool_send_failure_starts_reconnect() {
    PoolRig rig;
    std::shared_ptr<FakeDuplexConnection> link = rig.connectOpen();
    link->setFailSends(true);

    TEST_ASSERT_EQUAL(ConnectionError::SendFailed, rig.pool.sendRaw(kDesk, "{\"on\":false}"));
    PooledConnectionStatus s = rig.pool.getStatus(kDesk);
    TEST_ASSERT_EQUAL(ConnectionStatus::Reconnecting, s.status);
    TEST_ASSERT_EQUAL(ConnectionError::SendFailed, s.lastError);
    TEST_ASSERT_EQUAL_UINT8(1, s.reconnectAttempts);
    TEST_ASSERT_FALSE(s.healthy);
    TEST_ASSERT_TRUE(link->isClosed());

    TEST_ASSERT_EQUAL_UINT32(1000, rig.advanceUntilOpen(5000));
}

//==============================================================================
// Health Pings
//==============================================================================

void test_pool_ping_measures_latency() {
    PoolRig rig;
    std::shared_ptr<FakeDuplexConnection> link = rig.connectOpen();

    rig.advance(29999);
    TEST_ASSERT_EQUAL(0, link->sentCount("ping"));
    rig.advance(1);
    TEST_ASSERT_EQUAL(1, link->sentCount("ping"));
    TEST_ASSERT_EQUAL_UINT32(1, rig.pool.getStatus(kDesk).pingsSent);
    TEST_ASSERT_FALSE(rig.pool.getStatus(kDesk).hasLatency);

    rig.clock.advance(45);
    link->fireText("pong");
    PooledConnectionStatus s = rig.pool.getStatus(kDesk);
    TEST_ASSERT_TRUE(s.hasLatency);
    TEST_ASSERT_EQUAL_UINT32(45, s.latencyMs);

    // Transport-level pong frames count as well
    rig.advance(29955);
    rig.clock.advance(12);
    link->firePong();
    TEST_ASSERT_EQUAL_UINT32(12, rig.pool.getStatus(kDesk).latencyMs);
    TEST_ASSERT_EQUAL_UINT32(2, rig.pool.getStatus(kDesk).pingsSent);
}

void test_pool_unanswered_ping_marks_unhealthy() {
    PoolRig rig;
    rig.connectOpen();

    rig.advance(30000);
    TEST_ASSERT_TRUE(rig.pool.getStatus(kDesk).healthy);
    rig.advance(30000);
    TEST_ASSERT_FALSE(rig.pool.getStatus(kDesk).healthy);
    TEST_ASSERT_EQUAL(ConnectionStatus::Connected, rig.status());
}

void test_pool_state_updates_published() {
    PoolRig rig;
    std::vector<DeviceStateUpdate> updates;
    rig.pool.stateUpdates().subscribe([&updates](const DeviceStateUpdate& u) { updates.push_back(u); });

    std::shared_ptr<FakeDuplexConnection> link = rig.connectOpen();
    rig.clock.advance(250);
    link->fireText(deviceJson("Desk", "aabbccddee50", "", 77));
    link->fireText("pong");
    link->fireText("{not json");

    TEST_ASSERT_EQUAL(1, updates.size());
    TEST_ASSERT_EQUAL_STRING(kDesk, updates[0].deviceId.c_str());
    TEST_ASSERT_EQUAL_UINT32(250, updates[0].receivedMs);
    TEST_ASSERT_TRUE(updates[0].snapshot.hasInfo);
    TEST_ASSERT_EQUAL_STRING("Desk", updates[0].snapshot.info.name.c_str());
    TEST_ASSERT_TRUE(updates[0].snapshot.hasState);
    TEST_ASSERT_EQUAL_UINT8(77, updates[0].snapshot.state.brightness);
}

//==============================================================================
// Reconnection
//==============================================================================

void test_pool_reconnect_backoff_then_give_up() {
    PoolRig rig;
    rig.connectOpen();
    rig.transport.latest()->fireClosed(true);
    TEST_ASSERT_EQUAL(ConnectionStatus::Reconnecting, rig.status());

    const uint32_t expected[] = {1000, 3000, 7000, 15000, 31000};
    for (int i = 0; i < 5; i++) {
        TEST_ASSERT_EQUAL_UINT32(expected[i], rig.advanceUntilOpen(40000));
        TEST_ASSERT_EQUAL(ConnectionStatus::Reconnecting, rig.status());
        TEST_ASSERT_EQUAL_UINT8(i + 1, rig.pool.getStatus(kDesk).reconnectAttempts);
        rig.transport.latest()->fireClosed(true);
    }

    PooledConnectionStatus s = rig.pool.getStatus(kDesk);
    TEST_ASSERT_EQUAL(ConnectionStatus::Disconnected, s.status);
    TEST_ASSERT_EQUAL(ConnectionError::MaxReconnectAttemptsReached, s.lastError);
    TEST_ASSERT_EQUAL(0, rig.pool.activeConnectionCount());
    TEST_ASSERT_EQUAL_UINT32(0, rig.advanceUntilOpen(120000));
}

void test_pool_reconnect_success_resets_attempts() {
    PoolRig rig;
    rig.connectOpen();
    rig.transport.latest()->fireClosed(true);
    rig.advanceUntilOpen(5000);

    std::shared_ptr<FakeDuplexConnection> link = rig.transport.latest();
    link->fireOpen();
    PooledConnectionStatus s = rig.pool.getStatus(kDesk);
    TEST_ASSERT_EQUAL(ConnectionStatus::Connected, s.status);
    TEST_ASSERT_EQUAL_UINT8(0, s.reconnectAttempts);
    TEST_ASSERT_EQUAL(ConnectionError::None, s.lastError);
    TEST_ASSERT_EQUAL(1, link->sentCount(kFullState));
}

void test_pool_reconnect_jitter_bounds() {
    PoolRig low;
    low.random.set(0.0f);
    low.connectOpen();
    low.transport.latest()->fireClosed(true);
    TEST_ASSERT_EQUAL_UINT32(800, low.advanceUntilOpen(5000));

    PoolRig high;
    high.random.set(1.0f);
    high.connectOpen();
    high.transport.latest()->fireClosed(true);
    TEST_ASSERT_EQUAL_UINT32(1200, high.advanceUntilOpen(5000));
}

void test_pool_orderly_close_reconnects() {
    PoolRig rig;
    rig.connectOpen();
    rig.transport.latest()->fireClosed(false);

    PooledConnectionStatus s = rig.pool.getStatus(kDesk);
    TEST_ASSERT_EQUAL(ConnectionStatus::Reconnecting, s.status);
    TEST_ASSERT_EQUAL(ConnectionError::ConnectionLost, s.lastError);
    TEST_ASSERT_EQUAL_STRING("closed by device", s.lastErrorDetail.c_str());
}

void test_pool_stale_link_events_ignored() {
    PoolRig rig;
    rig.pool.connect(kDesk, kDeskAddress);
    hal::DuplexCallbacks old = rig.transport.latest()->callbacks();

    rig.pool.disconnect(kDesk);
    rig.pool.connect(kDesk, kDeskAddress);

    old.onOpen();
    old.onText(deviceJson("Desk", "aabbccddee50"));
    old.onClosed(true, "late error");

    PooledConnectionStatus s = rig.pool.getStatus(kDesk);
    TEST_ASSERT_EQUAL(ConnectionStatus::Connecting, s.status);
    TEST_ASSERT_EQUAL_UINT8(0, s.reconnectAttempts);
    TEST_ASSERT_EQUAL(ConnectionError::None, s.lastError);
}

//==============================================================================
// Pool Management
//==============================================================================

void test_pool_disconnect_all_except() {
    PoolRig rig;
    const char* ids[] = {"dev-1", "dev-2", "dev-3", "dev-4", "dev-5"};
    std::vector<std::shared_ptr<FakeDuplexConnection>> links;
    for (int i = 0; i < 5; i++) {
        char address[20];
        snprintf(address, sizeof(address), "192.168.1.%d", 20 + i);
        links.push_back(rig.connectOpen(ids[i], address));
    }
    TEST_ASSERT_EQUAL(5, rig.pool.activeConnectionCount());

    rig.pool.disconnectAllExcept("dev-1");
    TEST_ASSERT_FALSE(links[0]->isClosed());
    TEST_ASSERT_EQUAL(1, rig.pool.activeConnectionCount());
    TEST_ASSERT_EQUAL(ConnectionStatus::Connected, rig.status("dev-1"));

    std::vector<size_t> sentAtClose;
    for (int i = 1; i < 5; i++) {
        TEST_ASSERT_TRUE(links[i]->isClosed());
        TEST_ASSERT_EQUAL(ConnectionStatus::Disconnected, rig.status(ids[i]));
        sentAtClose.push_back(links[i]->sent().size());
    }

    // Only the kept link's ping timer is still armed
    TEST_ASSERT_EQUAL(1, rig.scheduler.pendingCount());

    // Late transport errors from closed links must not start reconnects
    hal::DuplexCallbacks late = links[2]->callbacks();
    late.onClosed(true, "late error");
    TEST_ASSERT_EQUAL(1, rig.scheduler.pendingCount());

    // Past two ping intervals and the whole reconnect schedule
    size_t opens = rig.transport.openCount();
    for (int i = 0; i < 100; i++) rig.advance(1000);

    TEST_ASSERT_EQUAL(opens, rig.transport.openCount());
    for (int i = 1; i < 5; i++) {
        TEST_ASSERT_EQUAL(sentAtClose[i - 1], links[i]->sent().size());
        TEST_ASSERT_EQUAL(0, links[i]->sentCount("ping"));
    }
    TEST_ASSERT_EQUAL(3, links[0]->sentCount("ping"));

    TEST_ASSERT_TRUE(rig.pool.disconnect("dev-1"));
    TEST_ASSERT_FALSE(rig.pool.disconnect("dev-1"));
    TEST_ASSERT_FALSE(rig.pool.disconnect("never"));
}

void test_pool_disconnect_forgets_device() {
    PoolRig rig;
    rig.transport.setRefuse(true);
    rig.pool.connect(kDesk, kDeskAddress);
    TEST_ASSERT_EQUAL(ConnectionError::ConnectionFailed, rig.pool.getStatus(kDesk).lastError);

    TEST_ASSERT_FALSE(rig.pool.disconnect(kDesk));
    PooledConnectionStatus s = rig.pool.getStatus(kDesk);
    TEST_ASSERT_EQUAL(ConnectionError::None, s.lastError);
    TEST_ASSERT_TRUE(s.address.empty());

    rig.transport.setRefuse(false);
    rig.connectOpen();
    rig.pool.disconnectAll();
    TEST_ASSERT_TRUE(rig.pool.getStatus(kDesk).address.empty());
    TEST_ASSERT_EQUAL(0, rig.pool.connectedDeviceIds().size());
}

void test_pool_optimize_evicts_lowest_priority() {
    PoolRig rig(smallPool(2));
    rig.pool.connect("old", "192.168.1.20", 1);
    rig.advance(100);
    rig.pool.connect("new", "192.168.1.21", 1);

    // Nothing to do below capacity or against equal priority
    TEST_ASSERT_EQUAL_UINT8(0, rig.pool.optimizeConnections(1));

    TEST_ASSERT_EQUAL(ConnectionError::MaxConnectionsReached,
                      rig.pool.connect("vip", "192.168.1.22", 5));
    TEST_ASSERT_EQUAL_UINT8(1, rig.pool.optimizeConnections(5));
    TEST_ASSERT_EQUAL(ConnectionStatus::Disconnected, rig.status("old"));
    TEST_ASSERT_EQUAL(ConnectionStatus::Connecting, rig.status("new"));

    TEST_ASSERT_EQUAL(ConnectionError::None, rig.pool.connect("vip", "192.168.1.22", 5));
    TEST_ASSERT_EQUAL_UINT8(1, rig.pool.optimizeConnections(3));
    TEST_ASSERT_EQUAL(ConnectionStatus::Disconnected, rig.status("new"));
    TEST_ASSERT_EQUAL(ConnectionStatus::Connecting, rig.status("vip"));
}

//==============================================================================
// Background / Foreground
//==============================================================================

void test_pool_background_suspends_pings() {
    PoolRig rig;
    std::shared_ptr<FakeDuplexConnection> link = rig.connectOpen();

    rig.pool.enterBackground();
    rig.advance(90000);
    TEST_ASSERT_EQUAL(0, link->sentCount("ping"));
    TEST_ASSERT_EQUAL(ConnectionStatus::Connected, rig.status());

    rig.pool.becomeActive();
    rig.advance(30000);
    TEST_ASSERT_EQUAL(1, link->sentCount("ping"));
}

void test_pool_background_defers_reconnect() {
    PoolRig rig;
    rig.connectOpen();
    rig.transport.latest()->fireClosed(true);

    rig.advance(500);
    rig.pool.enterBackground();
    TEST_ASSERT_EQUAL_UINT32(0, rig.advanceUntilOpen(10000));
    TEST_ASSERT_EQUAL(ConnectionStatus::Reconnecting, rig.status());

    rig.pool.becomeActive();
    TEST_ASSERT_EQUAL_UINT32(11500, rig.advanceUntilOpen(5000));
}

void test_pool_failure_in_background_is_owed() {
    PoolRig rig;
    rig.connectOpen();
    rig.pool.enterBackground();
    rig.transport.latest()->fireClosed(true);

    TEST_ASSERT_EQUAL(ConnectionStatus::Reconnecting, rig.status());
    TEST_ASSERT_EQUAL_UINT32(0, rig.advanceUntilOpen(10000));

    rig.pool.becomeActive();
    TEST_ASSERT_EQUAL_UINT32(11000, rig.advanceUntilOpen(5000));
}

//==============================================================================
// Test Runner
//==============================================================================

void run_pool_tests() {
    RUN_TEST(test_pool_connect_opens_websocket);
    RUN_TEST(test_pool_synchronous_open_requests_state_once);
    RUN_TEST(test_pool_connect_active_device_updates_priority);
    RUN_TEST(test_pool_capacity_under_concurrency);
    RUN_TEST(test_pool_full_pool_reports_limit);
    RUN_TEST(test_pool_off_subnet_device_is_banned);
    RUN_TEST(test_pool_ban_lifted_once_host_is_local);
    RUN_TEST(test_pool_connect_before_link_up);
    RUN_TEST(test_pool_invalid_address);
    RUN_TEST(test_pool_hostname_skips_subnet_check);
    RUN_TEST(test_pool_transport_refusal);
    RUN_TEST(test_pool_send_requires_open_link);
    RUN_TEST(test_pool_send_update_encodes_json);
    RUN_TEST(test_pool_send_failure_starts_reconnect);
    RUN_TEST(test_pool_ping_measures_latency);
    RUN_TEST(test_pool_unanswered_ping_marks_unhealthy);
    RUN_TEST(test_pool_state_updates_published);
    RUN_TEST(test_pool_reconnect_backoff_then_give_up);
    RUN_TEST(test_pool_reconnect_success_resets_attempts);
    RUN_TEST(test_pool_reconnect_jitter_bounds);
    RUN_TEST(test_pool_orderly_close_reconnects);
    RUN_TEST(test_pool_stale_link_events_ignored);
    RUN_TEST(test_pool_disconnect_all_except);
    RUN_TEST(test_pool_disconnect_forgets_device);
    RUN_TEST(test_pool_optimize_evicts_lowest_priority);
    RUN_TEST(test_pool_background_suspends_pings);
    RUN_TEST(test_pool_background_defers_reconnect);
    RUN_TEST(test_pool_failure_in_background_is_owed);
}
