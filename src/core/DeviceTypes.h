// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DeviceTypes.h
 * @brief Device identity, state and update payload types
 *
 * Field names follow the device JSON API: "bri", "seg", "fx", "sx", "ix", "pal".
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lumenlink {

// ============================================================================
// Device-reported state
// ============================================================================

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t w = 0;
    bool hasWhite = false;          ///< RGBW devices report a 4th channel

    Color() = default;
    Color(uint8_t red, uint8_t green, uint8_t blue)
        : r(red), g(green), b(blue) {}
    Color(uint8_t red, uint8_t green, uint8_t blue, uint8_t white)
        : r(red), g(green), b(blue), w(white), hasWhite(true) {}

    uint32_t rgb() const {
        return (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) | b;
    }
};

struct SegmentState {
    uint8_t id = 0;
    uint16_t start = 0;
    uint16_t stop = 0;
    bool on = true;
    uint8_t brightness = 255;
    std::vector<Color> colors;      ///< Primary, secondary, tertiary
    uint8_t effect = 0;             ///< fx
    uint8_t speed = 128;            ///< sx
    uint8_t intensity = 128;        ///< ix
    uint8_t palette = 0;            ///< pal
};

struct DeviceInfo {
    std::string name;
    std::string mac;                ///< Stable identifier
    std::string version;
    std::string ip;                 ///< Self-reported address, may be empty
    uint16_t ledCount = 0;
};

struct DeviceState {
    bool on = false;
    uint8_t brightness = 0;
    uint16_t transition = 0;        ///< In 100ms units, as reported
    std::vector<SegmentState> segments;
};

struct DeviceSnapshot {
    DeviceInfo info;
    DeviceState state;
    bool hasInfo = false;
    bool hasState = false;
};

// ============================================================================
// Directory record
// ============================================================================

struct DeviceRecord {
    std::string id;                 ///< Logical identifier (hardware address)
    std::string address;            ///< Current IP or hostname
    std::string name;               ///< Display name
    bool nameIsUserAssigned = false;
    uint32_t lastSeenMs = 0;
    bool online = false;
    DeviceSnapshot snapshot;
};

// ============================================================================
// Partial state update (POST /json/state, WebSocket)
// ============================================================================
// Negative numeric fields and has* flags mark fields left out of the payload.

struct SegmentUpdate {
    int16_t id = -1;
    std::vector<Color> colors;
    int16_t effect = -1;
    int16_t speed = -1;
    int16_t intensity = -1;
    int16_t palette = -1;
    bool hasSelected = false;
    bool selected = false;
    bool hasReverse = false;
    bool reverse = false;
};

struct StateUpdate {
    bool hasOn = false;
    bool on = false;
    int16_t brightness = -1;
    int32_t transition = -1;
    int16_t presetId = -1;
    std::vector<SegmentUpdate> segments;

    static StateUpdate power(bool isOn) {
        StateUpdate u;
        u.hasOn = true;
        u.on = isOn;
        return u;
    }

    static StateUpdate withBrightness(uint8_t value) {
        StateUpdate u;
        u.brightness = value;
        return u;
    }

    bool isEmpty() const {
        return !hasOn && brightness < 0 && transition < 0 && presetId < 0 && segments.empty();
    }
};

} // namespace lumenlink
