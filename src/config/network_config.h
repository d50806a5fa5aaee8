// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#pragma once
// ============================================================================
// Network Configuration - LumenLink
// ============================================================================
// Defaults for discovery, health monitoring, the connection pool and chunked
// pixel sync. Every value can be overridden with a build flag, e.g.
//   -D LL_POOL_CAPACITY=12
// Runtime config structs (DiscoveryConfig, HealthMonitorConfig, PoolConfig)
// start from these values.
// ============================================================================

#include <cstdint>

// WiFi Station Credentials (firmware only, overridden by build flags)
#ifndef LL_WIFI_SSID
#define LL_WIFI_SSID "lumenlink"
#endif
#ifndef LL_WIFI_PASSWORD
#define LL_WIFI_PASSWORD ""
#endif

#ifndef LL_POOL_CAPACITY
#define LL_POOL_CAPACITY 20
#endif

#ifndef LL_DISCOVERY_MAX_CONCURRENT_PROBES
#define LL_DISCOVERY_MAX_CONCURRENT_PROBES 5
#endif

#ifndef LL_SYNC_MAX_ITEMS_PER_CHUNK
#define LL_SYNC_MAX_ITEMS_PER_CHUNK 256
#endif

namespace lumenlink {
namespace config {

// Device-side protocol constants
namespace Protocol {
    constexpr uint16_t HTTP_PORT = 80;
    constexpr const char* JSON_PATH = "/json";
    constexpr const char* STATE_PATH = "/json/state";
    constexpr const char* CONFIG_PATH = "/json/cfg";
    constexpr const char* WS_PATH = "/ws";

    // UDP discovery port used by WLED-compatible controllers
    constexpr uint16_t DISCOVERY_UDP_PORT = 21324;

    // Full-state request, sent as UDP probe and after a WebSocket opens
    constexpr const char* FULL_STATE_REQUEST = "{\"v\":true}";
    constexpr const char* PING_TEXT = "ping";
}

namespace DiscoveryDefaults {
    // Per-address probe timeout (must stay <= PROBE_TIMEOUT_CAP_MS)
    constexpr uint32_t PROBE_TIMEOUT_MS = 1000;
    constexpr uint32_t PROBE_TIMEOUT_CAP_MS = 2000;

    constexpr uint32_t MDNS_WINDOW_MS = 2000;
    constexpr uint32_t BROADCAST_WINDOW_MS = 5000;

    // Receive poll slice while listening for broadcast replies
    constexpr uint32_t BROADCAST_RECEIVE_SLICE_MS = 250;

    constexpr uint8_t MAX_CONCURRENT_PROBES = LL_DISCOVERY_MAX_CONCURRENT_PROBES;

    // Only the first two local interface prefixes are scanned
    constexpr uint8_t MAX_SCAN_RANGES = 2;

    constexpr uint32_t BAN_TTL_MS = 15UL * 60UL * 1000UL;
    constexpr uint32_t BATCH_DEBOUNCE_MS = 300;
    constexpr uint32_t EARLY_STOP_GRACE_MS = 2000;
}

namespace HealthDefaults {
    constexpr uint32_t FULL_SWEEP_INTERVAL_MS = 15000;
    constexpr uint32_t QUICK_SWEEP_INTERVAL_MS = 3000;
    constexpr uint32_t PROBE_TIMEOUT_MS = 2000;

    constexpr uint8_t OFFLINE_FAILURE_THRESHOLD = 3;

    constexpr uint32_t RECONNECT_BASE_DELAY_MS = 2000;
    constexpr float RECONNECT_MULTIPLIER = 2.0f;
    constexpr uint32_t RECONNECT_MAX_DELAY_MS = 60000;
    constexpr uint8_t RECONNECT_MAX_RETRIES = 5;

    constexpr uint8_t HISTORY_LIMIT = 50;
}

namespace PoolDefaults {
    constexpr uint8_t CAPACITY = LL_POOL_CAPACITY;
    constexpr uint32_t PING_INTERVAL_MS = 30000;

    constexpr uint32_t RECONNECT_BASE_DELAY_MS = 1000;
    constexpr float RECONNECT_MULTIPLIER = 2.0f;
    constexpr uint32_t RECONNECT_MAX_DELAY_MS = 60000;
    constexpr float RECONNECT_JITTER = 0.2f;
    constexpr uint8_t MAX_RECONNECT_ATTEMPTS = 5;

    // Devices outside every local subnet are not retried for this long
    constexpr uint32_t OFF_SUBNET_BAN_MS = 5UL * 60UL * 1000UL;
}

namespace SyncDefaults {
    constexpr uint16_t MAX_ITEMS_PER_CHUNK = LL_SYNC_MAX_ITEMS_PER_CHUNK;
    constexpr uint32_t HTTP_TIMEOUT_MS = 5000;
}

} // namespace config
} // namespace lumenlink
