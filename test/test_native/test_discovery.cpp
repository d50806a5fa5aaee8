// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * LumenLink - Discovery Engine Unit Tests
 *
 * Tests for the discovery strategies and the shared admission path:
 * - /24 range scan with bounded probe concurrency
 * - Ban list and scanned-set admission
 * - mDNS candidates (name heuristic, non-default ports)
 * - UDP broadcast replies
 * - Debounced, deduplicated delivery and early stop
 * - Manual address probes
 */

#include <unity.h>
#include <string>
#include <vector>

#ifndef NATIVE_BUILD
#define NATIVE_BUILD
#endif

#include "../../src/discovery/DiscoveryEngine.h"
#include "mocks/FakeClock.h"
#include "mocks/FakeHttpTransport.h"
#include "mocks/FakeNetwork.h"
#include "mocks/ManualExecutor.h"

using namespace lumenlink;
using namespace lumenlink::discovery;
using namespace lumenlink::test;

//==============================================================================
// Test Fixtures
//==============================================================================

namespace {

DiscoveryConfig scanOnlyConfig() {
    DiscoveryConfig config;
    config.enableServiceBrowse = false;
    config.enableBroadcast = false;
    config.stopAfterFirstDevice = false;
    return config;
}

DiscoveryConfig browseOnlyConfig() {
    DiscoveryConfig config;
    config.enableRangeScan = false;
    config.enableBroadcast = false;
    config.stopAfterFirstDevice = false;
    return config;
}

DiscoveryConfig broadcastOnlyConfig() {
    DiscoveryConfig config;
    config.enableRangeScan = false;
    config.enableServiceBrowse = false;
    config.stopAfterFirstDevice = false;
    return config;
}

std::string jsonUrl(const std::string& address) {
    return "http://" + address + "/json";
}

/**
 * Engine on 192.168.1.10/24 with every platform seam faked.
 * Unscripted addresses answer Unreachable.
 */
struct DiscoveryRig {
    FakeClock clock;
    FakeHttpTransport http;
    AddressProbe probe;
    ManualExecutor executor;
    core::Scheduler scheduler;
    FakeNetworkInfo network;
    FakeServiceBrowser browser;
    FakeDatagramSocket socket;
    DiscoveryEngine engine;
    std::vector<DiscoveryEvent> events;

    explicit DiscoveryRig(const DiscoveryConfig& config, bool withBrowser = true,
                          bool withSocket = true)
        : clock(0)
        , http(&clock)
        , probe(http)
        , scheduler(clock)
        , socket(clock)
        , engine(config, probe, executor, scheduler, clock, network,
                 withBrowser ? &browser : nullptr, withSocket ? &socket : nullptr)
    {
        network.addInterface("192.168.1.10", "255.255.255.0");
        engine.events().subscribe([this](const DiscoveryEvent& e) { events.push_back(e); });
    }

    void device(const std::string& address, const std::string& name, const std::string& mac) {
        http.respond(jsonUrl(address), 200, deviceJson(name, mac, address));
    }

    void advance(uint32_t ms) {
        clock.advance(ms);
        scheduler.poll();
    }
};

} // namespace

//==============================================================================
// Range Scan
//==============================================================================

void test_discovery_range_scan_bounded_concurrency() {
    DiscoveryRig rig(scanOnlyConfig());
    rig.device("192.168.1.20", "Porch", "a0a0a0a0a020");

    TEST_ASSERT_TRUE(rig.engine.startDiscovery());
    TEST_ASSERT_TRUE(rig.engine.isRunning());
    TEST_ASSERT_FALSE(rig.engine.startDiscovery());

    // Only five probes may be in flight
    TEST_ASSERT_EQUAL(5, rig.executor.pending());
    while (rig.executor.runOne()) {
        TEST_ASSERT_TRUE(rig.executor.pending() <= 5);
    }

    TEST_ASSERT_FALSE(rig.engine.isRunning());
    TEST_ASSERT_EQUAL(253, rig.http.requestCount());
    TEST_ASSERT_EQUAL(0, rig.http.requestCount(jsonUrl("192.168.1.10")));
    TEST_ASSERT_EQUAL(1, rig.http.requestCount(jsonUrl("192.168.1.254")));

    DiscoveryStats stats = rig.engine.stats();
    TEST_ASSERT_EQUAL_UINT32(253, stats.candidates);
    TEST_ASSERT_EQUAL_UINT32(253, stats.probesIssued);
    TEST_ASSERT_EQUAL_UINT32(1, stats.found);
    TEST_ASSERT_EQUAL_UINT32(252, stats.unreachable);
    TEST_ASSERT_EQUAL(252, rig.engine.banList().size());
}

void test_discovery_batch_debounce() {
    DiscoveryRig rig(scanOnlyConfig());
    rig.device("192.168.1.20", "Porch", "a0a0a0a0a020");

    rig.engine.startDiscovery();
    rig.executor.runAll();

    rig.advance(299);
    TEST_ASSERT_EQUAL(0, rig.events.size());
    rig.advance(1);
    TEST_ASSERT_EQUAL(1, rig.events.size());

    const DiscoveryEvent& event = rig.events[0];
    TEST_ASSERT_TRUE(event.isNew);
    TEST_ASSERT_EQUAL_STRING("a0a0a0a0a020", event.record.id.c_str());
    TEST_ASSERT_EQUAL_STRING("192.168.1.20", event.record.address.c_str());
    TEST_ASSERT_EQUAL_STRING("Porch", event.record.name.c_str());
    TEST_ASSERT_TRUE(event.record.online);
    TEST_ASSERT_TRUE(event.record.snapshot.hasInfo);
}

void test_discovery_rerun_skips_banned_addresses() {
    DiscoveryRig rig(scanOnlyConfig());
    rig.device("192.168.1.20", "Porch", "a0a0a0a0a020");

    rig.engine.startDiscovery();
    rig.executor.runAll();
    rig.advance(300);
    rig.http.clearRequests();

    TEST_ASSERT_TRUE(rig.engine.startDiscovery());
    rig.executor.runAll();

    DiscoveryStats stats = rig.engine.stats();
    TEST_ASSERT_EQUAL_UINT32(252, stats.banned);
    TEST_ASSERT_EQUAL_UINT32(1, stats.probesIssued);
    TEST_ASSERT_EQUAL(1, rig.http.requestCount());

    // Second sighting of a known id is an update
    rig.advance(300);
    TEST_ASSERT_EQUAL(2, rig.events.size());
    TEST_ASSERT_FALSE(rig.events[1].isNew);
}

void test_discovery_scan_covers_two_prefixes_at_most() {
    DiscoveryRig rig(scanOnlyConfig());
    rig.network.addInterface("10.0.0.5", "255.255.255.0");
    rig.network.addInterface("172.16.4.1", "255.255.255.0");

    rig.engine.startDiscovery();
    rig.executor.runAll();

    TEST_ASSERT_EQUAL(506, rig.http.requestCount());
    TEST_ASSERT_EQUAL(1, rig.http.requestCount(jsonUrl("10.0.0.1")));
    TEST_ASSERT_EQUAL(0, rig.http.requestCount(jsonUrl("172.16.4.2")));
}

void test_discovery_dedupes_by_identifier() {
    DiscoveryRig rig(scanOnlyConfig());
    rig.device("192.168.1.20", "Strip", "cafecafecafe");
    rig.device("192.168.1.21", "Strip", "cafecafecafe");

    rig.engine.startDiscovery();
    rig.executor.runAll();
    rig.advance(300);

    TEST_ASSERT_EQUAL_UINT32(2, rig.engine.stats().found);
    TEST_ASSERT_EQUAL(1, rig.events.size());
    TEST_ASSERT_EQUAL(1, rig.engine.discoveredDevices().size());
}

//==============================================================================
// Service Browse
//==============================================================================

void test_discovery_looks_like_device() {
    TEST_ASSERT_TRUE(DiscoveryEngine::looksLikeDevice("_wled._tcp", "anything"));
    TEST_ASSERT_TRUE(DiscoveryEngine::looksLikeDevice("_http._tcp", "WLED-Kitchen"));
    TEST_ASSERT_TRUE(DiscoveryEngine::looksLikeDevice("_http._tcp", "esp32-node"));
    TEST_ASSERT_TRUE(DiscoveryEngine::looksLikeDevice("_arduino._tcp", "Light Bar"));
    TEST_ASSERT_FALSE(DiscoveryEngine::looksLikeDevice("_http._tcp", "Office Printer"));
}

void test_discovery_service_browse_candidates() {
    DiscoveryRig rig(browseOnlyConfig());
    rig.browser.advertise("_wled._tcp", "kitchen", "192.168.1.30");
    rig.browser.advertise("_http._tcp", "Office Printer", "192.168.1.40");
    rig.browser.advertise("_http._tcp", "led-strip", "192.168.1.41", 8080);
    rig.device("192.168.1.30", "Kitchen", "303030303030");
    rig.device("192.168.1.41:8080", "Strip", "414141414141");

    rig.engine.startDiscovery();
    TEST_ASSERT_EQUAL(1, rig.executor.pending());
    rig.executor.runAll();

    std::vector<std::pair<std::string, uint32_t>> browsed = rig.browser.browsed();
    TEST_ASSERT_EQUAL(4, browsed.size());
    TEST_ASSERT_EQUAL_STRING("_wled._tcp", browsed[0].first.c_str());
    TEST_ASSERT_EQUAL_UINT32(2000, browsed[0].second);

    TEST_ASSERT_EQUAL(0, rig.http.requestCount(jsonUrl("192.168.1.40")));
    TEST_ASSERT_EQUAL(1, rig.http.requestCount(jsonUrl("192.168.1.41:8080")));
    TEST_ASSERT_EQUAL_UINT32(2, rig.engine.stats().found);
    TEST_ASSERT_FALSE(rig.engine.isRunning());

    rig.advance(300);
    TEST_ASSERT_EQUAL(2, rig.events.size());
}

void test_discovery_failed_browse_counts_strategy_failure() {
    DiscoveryRig rig(browseOnlyConfig());
    rig.browser.setFailing(true);

    rig.engine.startDiscovery();
    rig.executor.runAll();

    TEST_ASSERT_FALSE(rig.engine.isRunning());
    TEST_ASSERT_EQUAL_UINT8(1, rig.engine.stats().strategiesFailed);
}

//==============================================================================
// Broadcast
//==============================================================================

void test_discovery_broadcast_replies() {
    DiscoveryRig rig(broadcastOnlyConfig());
    rig.socket.deliver("192.168.1.50", "{\"info\":{\"ip\":\"192.168.1.51\"}}");
    rig.socket.deliver("192.168.1.52", "binary-reply");
    rig.device("192.168.1.51", "Shelf", "515151515151");
    rig.device("192.168.1.52", "Desk", "525252525252");

    rig.engine.startDiscovery();
    rig.executor.runAll();

    std::vector<std::pair<std::string, uint16_t>> sent = rig.socket.broadcasts();
    TEST_ASSERT_EQUAL(1, sent.size());
    TEST_ASSERT_EQUAL_STRING("{\"v\":true}", sent[0].first.c_str());
    TEST_ASSERT_EQUAL_UINT16(21324, sent[0].second);

    // Listened for the whole window, then closed the socket
    TEST_ASSERT_EQUAL_UINT32(5000, rig.clock.nowMs());
    TEST_ASSERT_FALSE(rig.socket.isOpen());

    TEST_ASSERT_EQUAL(0, rig.http.requestCount(jsonUrl("192.168.1.50")));
    TEST_ASSERT_EQUAL_UINT32(2, rig.engine.stats().found);
    TEST_ASSERT_FALSE(rig.engine.isRunning());
}

void test_discovery_broadcast_socket_unavailable() {
    DiscoveryRig rig(broadcastOnlyConfig());
    rig.socket.setFailOpen(true);

    rig.engine.startDiscovery();
    rig.executor.runAll();

    TEST_ASSERT_FALSE(rig.engine.isRunning());
    TEST_ASSERT_EQUAL_UINT8(1, rig.engine.stats().strategiesFailed);
}

void test_discovery_missing_strategies_count_as_failed() {
    DiscoveryConfig config;
    config.enableRangeScan = false;
    DiscoveryRig rig(config, false, false);

    TEST_ASSERT_TRUE(rig.engine.startDiscovery());
    TEST_ASSERT_FALSE(rig.engine.isRunning());
    TEST_ASSERT_EQUAL_UINT8(2, rig.engine.stats().strategiesFailed);
    TEST_ASSERT_EQUAL(0, rig.executor.pending());
}

//==============================================================================
// Stopping
//==============================================================================

void test_discovery_early_stop_after_first_device() {
    DiscoveryConfig config = scanOnlyConfig();
    config.stopAfterFirstDevice = true;
    DiscoveryRig rig(config);
    rig.device("192.168.1.2", "First", "020202020202");

    rig.engine.startDiscovery();
    for (int i = 0; i < 5; i++) {
        rig.executor.runOne();
    }
    TEST_ASSERT_EQUAL_UINT32(1, rig.engine.stats().found);

    rig.advance(1999);
    TEST_ASSERT_TRUE(rig.engine.isRunning());
    TEST_ASSERT_EQUAL(1, rig.events.size());

    rig.advance(1);
    TEST_ASSERT_FALSE(rig.engine.isRunning());

    // Queued probes are abandoned without touching the network
    rig.executor.runAll();
    TEST_ASSERT_EQUAL(5, rig.http.requestCount());
}

void test_discovery_stop_abandons_in_flight_result() {
    DiscoveryRig rig(browseOnlyConfig());
    rig.browser.advertise("_wled._tcp", "kitchen", "192.168.1.30");
    rig.device("192.168.1.30", "Kitchen", "303030303030");

    rig.http.onPerform([&rig](const hal::HttpRequest&) { rig.engine.stopDiscovery(); });

    rig.engine.startDiscovery();
    rig.executor.runAll();
    rig.advance(1000);

    TEST_ASSERT_EQUAL(1, rig.http.requestCount());
    TEST_ASSERT_EQUAL_UINT32(0, rig.engine.stats().found);
    TEST_ASSERT_EQUAL(0, rig.events.size());
    TEST_ASSERT_FALSE(rig.engine.isRunning());
}

void test_discovery_stop_flushes_found_devices() {
    DiscoveryRig rig(scanOnlyConfig());
    rig.device("192.168.1.1", "Gateway Strip", "010101010101");

    rig.engine.startDiscovery();
    rig.executor.runOne();
    TEST_ASSERT_EQUAL(0, rig.events.size());

    rig.engine.stopDiscovery();
    TEST_ASSERT_EQUAL(1, rig.events.size());
}

void test_discovery_background_and_resume() {
    DiscoveryRig rig(scanOnlyConfig());

    rig.engine.startDiscovery();
    rig.engine.enterBackground();
    TEST_ASSERT_FALSE(rig.engine.isRunning());

    rig.executor.runAll();
    TEST_ASSERT_EQUAL(0, rig.http.requestCount());

    rig.engine.becomeActive();
    TEST_ASSERT_TRUE(rig.engine.isRunning());
    TEST_ASSERT_EQUAL(5, rig.executor.pending());

    // Not resumed when it was idle going into background
    rig.executor.runAll();
    TEST_ASSERT_FALSE(rig.engine.isRunning());
    rig.engine.enterBackground();
    rig.engine.becomeActive();
    TEST_ASSERT_FALSE(rig.engine.isRunning());
}

//==============================================================================
// Manual Address
//==============================================================================

void test_discovery_manual_add_bypasses_ban_list() {
    DiscoveryRig rig(scanOnlyConfig());
    rig.device("192.168.1.77", "Garage", "777777777777");
    rig.engine.banList().ban("192.168.1.77");

    ProbeOutcome outcome = ProbeOutcome::Banned;
    rig.engine.addDeviceByAddress("192.168.1.77",
                                  [&outcome](const ProbeResult& r) { outcome = r.outcome; });
    rig.executor.runAll();
    TEST_ASSERT_EQUAL(ProbeOutcome::Success, outcome);

    rig.advance(300);
    TEST_ASSERT_EQUAL(1, rig.events.size());
    TEST_ASSERT_EQUAL_STRING("Garage", rig.events[0].record.name.c_str());
}

void test_discovery_manual_failure_bans_address() {
    DiscoveryRig rig(scanOnlyConfig());

    ProbeOutcome outcome = ProbeOutcome::Success;
    rig.engine.addDeviceByAddress("192.168.1.78",
                                  [&outcome](const ProbeResult& r) { outcome = r.outcome; });
    rig.executor.runAll();

    TEST_ASSERT_EQUAL(ProbeOutcome::Unreachable, outcome);
    TEST_ASSERT_TRUE(rig.engine.banList().isBanned("192.168.1.78"));
}

void test_discovery_manual_invalid_address() {
    DiscoveryRig rig(scanOnlyConfig());

    ProbeOutcome outcome = ProbeOutcome::Success;
    rig.engine.addDeviceByAddress("no such host!",
                                  [&outcome](const ProbeResult& r) { outcome = r.outcome; });

    TEST_ASSERT_EQUAL(ProbeOutcome::Unreachable, outcome);
    TEST_ASSERT_EQUAL(0, rig.executor.pending());
}

void test_discovery_display_name_survives_rediscovery() {
    DiscoveryRig rig(scanOnlyConfig());
    rig.device("192.168.1.77", "Garage", "777777777777");

    rig.engine.addDeviceByAddress("192.168.1.77");
    rig.executor.runAll();
    rig.advance(300);

    TEST_ASSERT_TRUE(rig.engine.setDisplayName("777777777777", "Workshop"));
    TEST_ASSERT_FALSE(rig.engine.setDisplayName("unknown", "Nope"));

    rig.engine.addDeviceByAddress("192.168.1.77");
    rig.executor.runAll();
    rig.advance(300);

    TEST_ASSERT_EQUAL(2, rig.events.size());
    TEST_ASSERT_EQUAL_STRING("Workshop", rig.events[1].record.name.c_str());
}

//==============================================================================
// Test Runner
//==============================================================================

void run_discovery_tests() {
    RUN_TEST(test_discovery_range_scan_bounded_concurrency);
    RUN_TEST(test_discovery_batch_debounce);
    RUN_TEST(test_discovery_rerun_skips_banned_addresses);
    RUN_TEST(test_discovery_scan_covers_two_prefixes_at_most);
    RUN_TEST(test_discovery_dedupes_by_identifier);
    RUN_TEST(test_discovery_looks_like_device);
    RUN_TEST(test_discovery_service_browse_candidates);
    RUN_TEST(test_discovery_failed_browse_counts_strategy_failure);
    RUN_TEST(test_discovery_broadcast_replies);
    RUN_TEST(test_discovery_broadcast_socket_unavailable);
    RUN_TEST(test_discovery_missing_strategies_count_as_failed);
    RUN_TEST(test_discovery_early_stop_after_first_device);
    RUN_TEST(test_discovery_stop_abandons_in_flight_result);
    RUN_TEST(test_discovery_stop_flushes_found_devices);
    RUN_TEST(test_discovery_background_and_resume);
    RUN_TEST(test_discovery_manual_add_bypasses_ban_list);
    RUN_TEST(test_discovery_manual_failure_bans_address);
    RUN_TEST(test_discovery_manual_invalid_address);
    RUN_TEST(test_discovery_display_name_survives_rediscovery);
}
