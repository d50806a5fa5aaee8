// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file WledJsonCodec.h
 * @brief JSON codec for the device HTTP/WebSocket API
 *
 * Single canonical location for reading and writing device JSON:
 * - GET /json and WebSocket pushes: {"state":{...},"info":{...}}
 * - POST /json/state responses: empty, {"success":true} or a full document
 * - UDP discovery replies carrying info.ip
 * - Partial state updates and rename requests
 *
 * Rule: Only this module reads or writes device JSON keys. Everything else
 * consumes DeviceSnapshot / StateUpdate.
 */

#pragma once

#include <ArduinoJson.h>
#include <cstddef>
#include <cstring>
#include <string>

#include "core/DeviceTypes.h"

namespace lumenlink {
namespace codec {

/**
 * @brief Maximum length for error messages
 */
static constexpr size_t MAX_ERROR_MSG = 128;

struct DeviceDecodeResult {
    bool success;
    DeviceSnapshot snapshot;
    char errorMsg[MAX_ERROR_MSG];

    DeviceDecodeResult() : success(false) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

struct PostResponseDecodeResult {
    bool success;
    bool hasSnapshot;               ///< false for empty / {"success":true} bodies
    DeviceSnapshot snapshot;
    char errorMsg[MAX_ERROR_MSG];

    PostResponseDecodeResult() : success(false), hasSnapshot(false) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

class WledJsonCodec {
public:
    /**
     * @brief Decode a device document
     *
     * Accepts {"state":..,"info":..}, either half alone, or a bare state
     * object (as pushed over WebSocket). Fails when neither part is present.
     */
    static DeviceDecodeResult decodeDocument(const std::string& json);
    static DeviceDecodeResult decodeDocument(JsonObjectConst root);

    static void decodeInfo(JsonObjectConst info, DeviceInfo& out);
    static void decodeState(JsonObjectConst state, DeviceState& out);

    /**
     * @brief Decode a POST /json/state response body
     *
     * Empty bodies and {"success":true} are successes without a snapshot.
     */
    static PostResponseDecodeResult decodePostResponse(const std::string& body);

    /**
     * @brief Extract info.ip from a UDP discovery reply
     * @return false if the payload is not JSON or carries no address
     */
    static bool decodeDiscoveryReply(const std::string& payload, std::string& outIp);

    static void encodeStateUpdate(const StateUpdate& update, JsonObject root);
    static std::string encodeStateUpdate(const StateUpdate& update);

    /**
     * @brief Body for POST /json/cfg renaming the device
     */
    static std::string encodeRename(const std::string& name);

    /**
     * @brief Parse "RRGGBB" / "#RRGGBB" into a Color
     */
    static bool parseHexColor(const char* text, Color& out);

private:
    static void decodeColor(JsonVariantConst value, Color& out);
    static void encodeColor(const Color& color, JsonArray out);
};

} // namespace codec
} // namespace lumenlink
