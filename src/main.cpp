// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * LumenLink - Main Entry Point
 *
 * Fleet controller for WLED-compatible LED controllers on the local network:
 * - Discovery (mDNS, UDP broadcast, subnet scan)
 * - Health monitoring with reconnect backoff
 * - Pooled WebSocket links with full-state sync
 * - Chunked per-LED pixel pushes
 *
 * Serial console: type "help" for commands.
 */

#ifndef NATIVE_BUILD

#include <Arduino.h>
#include <WiFi.h>

#include <memory>

#include "config/network_config.h"
#include "directory/DeviceDirectory.h"
#include "fleet/FleetController.h"
#include "hal/esp32/EspHttpTransport.h"
#include "hal/esp32/EspMdnsBrowser.h"
#include "hal/esp32/EspNetworkInfo.h"
#include "hal/esp32/EspPlatform.h"
#include "hal/esp32/EspUdpSocket.h"
#include "hal/esp32/EspWebSocketTransport.h"
#include "hal/esp32/FreeRtosExecutor.h"

#define LL_LOG_TAG "Main"
#include "utils/Log.h"

using namespace lumenlink;
using namespace lumenlink::hal::esp32;

// Platform services
static EspClock clockSource;
static EspRandom randomSource;
static FreeRtosExecutor executor;
static EspHttpTransport httpTransport;
static EspWebSocketTransport wsTransport;
static EspUdpSocket udpSocket;
static EspMdnsBrowser mdnsBrowser;
static EspNetworkInfo networkInfo;

static directory::DeviceDirectory deviceDirectory;
static std::unique_ptr<fleet::FleetController> fleetController;

// ============================================================================
// Serial console
// ============================================================================

static void printHelp() {
    Serial.println("Commands:");
    Serial.println("  scan                 start discovery");
    Serial.println("  stop                 stop discovery");
    Serial.println("  list                 list known devices");
    Serial.println("  add <ip>             probe and add a device by address");
    Serial.println("  connect <id>         open a pooled link");
    Serial.println("  focus <id>           close other links, connect <id>");
    Serial.println("  drop <id>            close the pooled link");
    Serial.println("  power <id> on|off    switch a device");
    Serial.println("  bri <id> <0-255>     set brightness");
    Serial.println("  check                force a health check");
    Serial.println("  status               pool and discovery status");
}

static void printDevices() {
    std::vector<DeviceRecord> records = deviceDirectory.all();
    Serial.printf("%u devices\n", (unsigned)records.size());
    for (const DeviceRecord& record : records) {
        pool::PooledConnectionStatus link = fleetController->pool().getStatus(record.id);
        Serial.printf("  %-18s %-16s %-20s %-8s link=%s health=\"%s\"\n",
                      record.id.c_str(),
                      record.address.c_str(),
                      record.name.c_str(),
                      record.online ? "online" : "offline",
                      pool::toString(link.status),
                      fleetController->health().getStatus(record.id).c_str());
    }
}

static void printStatus() {
    discovery::DiscoveryStats stats = fleetController->discovery().stats();
    Serial.printf("Network: %s\n", fleetController->isNetworkAvailable() ? "up" : "down");
    Serial.printf("Discovery: %s, %lu candidates, %lu probes, %lu found, %lu timeouts, %lu banned\n",
                  fleetController->discovery().isRunning() ? "running" : "idle",
                  (unsigned long)stats.candidates,
                  (unsigned long)stats.probesIssued,
                  (unsigned long)stats.found,
                  (unsigned long)stats.timeouts,
                  (unsigned long)stats.banned);
    Serial.printf("Pool: %u/%u active\n",
                  (unsigned)fleetController->pool().activeConnectionCount(),
                  (unsigned)fleetController->pool().capacity());
    Serial.printf("Heap: %u free\n", (unsigned)ESP.getFreeHeap());
}

static void handleCommand(String input) {
    input.trim();
    if (input.length() == 0) return;

    int space = input.indexOf(' ');
    String command = space < 0 ? input : input.substring(0, space);
    String args = space < 0 ? String() : input.substring(space + 1);
    args.trim();

    int argSpace = args.indexOf(' ');
    std::string first = (argSpace < 0 ? args : args.substring(0, argSpace)).c_str();
    String rest = argSpace < 0 ? String() : args.substring(argSpace + 1);
    rest.trim();

    if (command == "help") {
        printHelp();
    } else if (command == "scan") {
        Serial.println(fleetController->startDiscovery() ? "Discovery started" : "Discovery refused");
    } else if (command == "stop") {
        fleetController->stopDiscovery();
    } else if (command == "list") {
        printDevices();
    } else if (command == "add" && !first.empty()) {
        fleetController->addDeviceByAddress(first, [](const discovery::ProbeResult& result) {
            LL_LOGI("Probe %s: %s", result.address.c_str(), toString(result.outcome));
        });
    } else if (command == "connect" && !first.empty()) {
        Serial.println(toString(fleetController->connectDevice(first)));
    } else if (command == "focus" && !first.empty()) {
        Serial.println(toString(fleetController->focusDevice(first, 1)));
    } else if (command == "drop" && !first.empty()) {
        Serial.println(fleetController->disconnectDevice(first) ? "Disconnected" : "Not pooled");
    } else if (command == "power" && !first.empty()) {
        StateUpdate update = StateUpdate::power(rest == "on");
        Serial.println(toString(fleetController->sendUpdate(first, update)));
    } else if (command == "bri" && !first.empty()) {
        long value = rest.toInt();
        if (value < 0) value = 0;
        if (value > 255) value = 255;
        StateUpdate update = StateUpdate::withBrightness(static_cast<uint8_t>(value));
        Serial.println(toString(fleetController->sendUpdate(first, update)));
    } else if (command == "check") {
        fleetController->health().forceHealthCheck();
    } else if (command == "status") {
        printStatus();
    } else {
        Serial.printf("Unknown command: %s\n", input.c_str());
    }
}

// ============================================================================
// Arduino entry points
// ============================================================================

void setup() {
    Serial.begin(115200);
    delay(1000);

    Serial.println("\n\n==========================================");
    Serial.println("LumenLink - Fleet Controller");
    Serial.println("==========================================\n");

    WiFi.mode(WIFI_STA);
    WiFi.begin(LL_WIFI_SSID, LL_WIFI_PASSWORD);
    LL_LOGI("Joining %s", LL_WIFI_SSID);

    if (!executor.start()) {
        LL_LOGE("Executor failed to start - halting");
        while (1) delay(1000);
    }
    if (!wsTransport.start()) {
        LL_LOGE("WebSocket pump failed to start - halting");
        while (1) delay(1000);
    }

    fleet::FleetConfig config;
    fleet::FleetPlatform platform{
        clockSource,
        randomSource,
        executor,
        httpTransport,
        wsTransport,
        networkInfo,
        &mdnsBrowser,
        &udpSocket
    };

    fleetController.reset(new fleet::FleetController(config, platform, deviceDirectory));
    fleetController->begin();

    printHelp();
}

void loop() {
    static bool mdnsStarted = false;
    static bool initialScanDone = false;

    if (!mdnsStarted && networkInfo.isConnected()) {
        LL_LOGI("WiFi connected: %s", WiFi.localIP().toString().c_str());
        mdnsStarted = mdnsBrowser.begin("lumenlink");
    }

    fleetController->update();

    if (!initialScanDone && fleetController->isNetworkAvailable()) {
        initialScanDone = fleetController->startDiscovery();
    }

    if (Serial.available()) {
        handleCommand(Serial.readStringUntil('\n'));
    }

    delay(5);
}

#endif // NATIVE_BUILD
