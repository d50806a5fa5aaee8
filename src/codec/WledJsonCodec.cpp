// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file WledJsonCodec.cpp
 * @brief Device JSON codec implementation
 */

#include "WledJsonCodec.h"

#include <cstdio>

namespace lumenlink {
namespace codec {

namespace {

uint8_t clampByte(int value) {
    if (value < 0) return 0;
    if (value > 255) return 255;
    return static_cast<uint8_t>(value);
}

int hexNibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// ============================================================================
// Decoding
// ============================================================================

DeviceDecodeResult WledJsonCodec::decodeDocument(const std::string& json) {
    DeviceDecodeResult result;

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, json);
    if (err) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Invalid JSON: %s", err.c_str());
        return result;
    }
    if (!doc.is<JsonObjectConst>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Expected JSON object");
        return result;
    }

    return decodeDocument(doc.as<JsonObjectConst>());
}

DeviceDecodeResult WledJsonCodec::decodeDocument(JsonObjectConst root) {
    DeviceDecodeResult result;

    if (root["info"].is<JsonObjectConst>()) {
        decodeInfo(root["info"].as<JsonObjectConst>(), result.snapshot.info);
        result.snapshot.hasInfo = true;
    }

    if (root["state"].is<JsonObjectConst>()) {
        decodeState(root["state"].as<JsonObjectConst>(), result.snapshot.state);
        result.snapshot.hasState = true;
    } else if (root["on"].is<bool>() || root["bri"].is<int>() || root["seg"].is<JsonArrayConst>()) {
        // Bare state object
        decodeState(root, result.snapshot.state);
        result.snapshot.hasState = true;
    }

    if (!result.snapshot.hasInfo && !result.snapshot.hasState) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Missing 'info' and 'state'");
        return result;
    }

    result.success = true;
    return result;
}

void WledJsonCodec::decodeInfo(JsonObjectConst info, DeviceInfo& out) {
    out.name = info["name"] | "";
    out.mac = info["mac"] | "";
    out.version = info["ver"] | "";
    out.ip = info["ip"] | "";
    out.ledCount = info["leds"]["count"] | 0;
}

void WledJsonCodec::decodeState(JsonObjectConst state, DeviceState& out) {
    out.on = state["on"] | false;
    out.brightness = clampByte(state["bri"] | 0);
    out.transition = state["transition"] | 0;

    out.segments.clear();
    if (!state["seg"].is<JsonArrayConst>()) return;

    for (JsonObjectConst seg : state["seg"].as<JsonArrayConst>()) {
        SegmentState s;
        s.id = clampByte(seg["id"] | 0);
        s.start = seg["start"] | 0;
        s.stop = seg["stop"] | 0;
        s.on = seg["on"] | true;
        s.brightness = clampByte(seg["bri"] | 255);
        s.effect = clampByte(seg["fx"] | 0);
        s.speed = clampByte(seg["sx"] | 128);
        s.intensity = clampByte(seg["ix"] | 128);
        s.palette = clampByte(seg["pal"] | 0);

        if (seg["col"].is<JsonArrayConst>()) {
            for (JsonVariantConst col : seg["col"].as<JsonArrayConst>()) {
                Color c;
                decodeColor(col, c);
                s.colors.push_back(c);
            }
        }
        out.segments.push_back(s);
    }
}

void WledJsonCodec::decodeColor(JsonVariantConst value, Color& out) {
    if (value.is<const char*>()) {
        parseHexColor(value.as<const char*>(), out);
        return;
    }
    if (!value.is<JsonArrayConst>()) return;

    JsonArrayConst channels = value.as<JsonArrayConst>();
    out.r = clampByte(channels[0] | 0);
    out.g = clampByte(channels[1] | 0);
    out.b = clampByte(channels[2] | 0);
    if (channels.size() > 3) {
        out.w = clampByte(channels[3] | 0);
        out.hasWhite = true;
    }
}

bool WledJsonCodec::parseHexColor(const char* text, Color& out) {
    if (!text) return false;
    if (*text == '#') text++;

    size_t len = strlen(text);
    if (len != 6 && len != 8) return false;

    uint8_t bytes[4] = {0, 0, 0, 0};
    for (size_t i = 0; i < len / 2; i++) {
        int hi = hexNibble(text[i * 2]);
        int lo = hexNibble(text[i * 2 + 1]);
        if (hi < 0 || lo < 0) return false;
        bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }

    out.r = bytes[0];
    out.g = bytes[1];
    out.b = bytes[2];
    out.hasWhite = (len == 8);
    out.w = out.hasWhite ? bytes[3] : 0;
    return true;
}

PostResponseDecodeResult WledJsonCodec::decodePostResponse(const std::string& body) {
    PostResponseDecodeResult result;

    // Empty body is how many firmwares acknowledge a POST
    bool blank = true;
    for (char c : body) {
        if (c != ' ' && c != '\n' && c != '\r' && c != '\t') {
            blank = false;
            break;
        }
    }
    if (blank) {
        result.success = true;
        return result;
    }

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, body);
    if (err) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Invalid JSON: %s", err.c_str());
        return result;
    }
    if (!doc.is<JsonObjectConst>()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Expected JSON object");
        return result;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    if (root["success"].is<bool>()) {
        if (root["success"].as<bool>()) {
            result.success = true;
        } else {
            snprintf(result.errorMsg, MAX_ERROR_MSG, "Device reported failure");
        }
        return result;
    }

    DeviceDecodeResult docResult = decodeDocument(root);
    if (!docResult.success) {
        memcpy(result.errorMsg, docResult.errorMsg, MAX_ERROR_MSG);
        return result;
    }

    result.success = true;
    result.hasSnapshot = true;
    result.snapshot = docResult.snapshot;
    return result;
}

bool WledJsonCodec::decodeDiscoveryReply(const std::string& payload, std::string& outIp) {
    JsonDocument doc;
    if (deserializeJson(doc, payload)) return false;
    if (!doc.is<JsonObjectConst>()) return false;

    JsonObjectConst root = doc.as<JsonObjectConst>();
    const char* ip = nullptr;
    if (root["info"]["ip"].is<const char*>()) {
        ip = root["info"]["ip"].as<const char*>();
    } else if (root["ip"].is<const char*>()) {
        ip = root["ip"].as<const char*>();
    }

    if (!ip || ip[0] == '\0') return false;
    outIp = ip;
    return true;
}

// ============================================================================
// Encoding
// ============================================================================

void WledJsonCodec::encodeColor(const Color& color, JsonArray out) {
    out.add(color.r);
    out.add(color.g);
    out.add(color.b);
    if (color.hasWhite) out.add(color.w);
}

void WledJsonCodec::encodeStateUpdate(const StateUpdate& update, JsonObject root) {
    if (update.hasOn) root["on"] = update.on;
    if (update.brightness >= 0) root["bri"] = update.brightness;
    if (update.transition >= 0) root["transition"] = update.transition;
    if (update.presetId >= 0) root["ps"] = update.presetId;

    if (update.segments.empty()) return;

    JsonArray segArr = root["seg"].to<JsonArray>();
    for (const SegmentUpdate& seg : update.segments) {
        JsonObject s = segArr.add<JsonObject>();
        if (seg.id >= 0) s["id"] = seg.id;
        if (!seg.colors.empty()) {
            JsonArray colArr = s["col"].to<JsonArray>();
            for (const Color& c : seg.colors) {
                encodeColor(c, colArr.add<JsonArray>());
            }
        }
        if (seg.effect >= 0) s["fx"] = seg.effect;
        if (seg.speed >= 0) s["sx"] = seg.speed;
        if (seg.intensity >= 0) s["ix"] = seg.intensity;
        if (seg.palette >= 0) s["pal"] = seg.palette;
        if (seg.hasSelected) s["sel"] = seg.selected;
        if (seg.hasReverse) s["rev"] = seg.reverse;
    }
}

std::string WledJsonCodec::encodeStateUpdate(const StateUpdate& update) {
    JsonDocument doc;
    encodeStateUpdate(update, doc.to<JsonObject>());
    std::string out;
    serializeJson(doc, out);
    return out;
}

std::string WledJsonCodec::encodeRename(const std::string& name) {
    JsonDocument doc;
    doc["id"]["name"] = name;
    std::string out;
    serializeJson(doc, out);
    return out;
}

} // namespace codec
} // namespace lumenlink
