// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DeviceHttpClient.h
 * @brief One-shot HTTP requests against the device JSON API
 *
 * Every call blocks the calling worker for at most the configured timeout
 * (per request). Run it from an IExecutor job, never from Scheduler::poll().
 *
 * Error codes (apiErrorCode):
 *   1001 network   1002 invalid response   1003 decoding   1004 encoding
 *   1005 offline   1006 unreachable        1007 timeout    1008 invalid URL
 *   1009 retries   1010 unsupported        1011 busy       1012 configuration
 *   HttpError reports the HTTP status code itself.
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "config/network_config.h"
#include "core/DeviceTypes.h"
#include "core/Errors.h"
#include "hal/interface/IHttpTransport.h"
#include "sync/ChunkedSyncProtocol.h"

namespace lumenlink {
namespace net {

enum class ApiError : uint8_t {
    None,
    NetworkError,
    InvalidResponse,
    HttpError,
    DecodingError,
    EncodingError,
    DeviceOffline,
    DeviceUnreachable,
    Timeout,
    InvalidUrl,
    MaxRetriesExceeded,
    UnsupportedOperation,
    DeviceBusy,
    InvalidConfiguration
};

const char* toString(ApiError error);

/**
 * @brief Stable numeric code; HttpError yields @p httpStatus
 */
int apiErrorCode(ApiError error, int httpStatus = 0);

/**
 * @brief Whether repeating the request may succeed (HTTP 5xx only)
 */
bool isRetryable(ApiError error, int httpStatus = 0);

struct ApiResult {
    ApiError error = ApiError::None;
    int httpStatus = 0;
    bool hasSnapshot = false;       ///< false for empty / {"success":true} replies
    DeviceSnapshot snapshot;

    bool ok() const { return error == ApiError::None; }
    int code() const { return apiErrorCode(error, httpStatus); }
    bool retryable() const { return isRetryable(error, httpStatus); }
};

class DeviceHttpClient {
public:
    explicit DeviceHttpClient(hal::IHttpTransport& http,
                              uint32_t timeoutMs = config::SyncDefaults::HTTP_TIMEOUT_MS);

    // Prevent copying
    DeviceHttpClient(const DeviceHttpClient&) = delete;
    DeviceHttpClient& operator=(const DeviceHttpClient&) = delete;

    /**
     * @brief GET /json
     */
    ApiResult getState(const std::string& address);

    /**
     * @brief POST /json/state with a partial update
     */
    ApiResult updateState(const std::string& address, const StateUpdate& update);

    ApiResult setPower(const std::string& address, bool on);
    ApiResult setBrightness(const std::string& address, uint8_t brightness);

    /**
     * @brief Primary color of the main segment
     */
    ApiResult setColor(const std::string& address, const Color& color);

    /**
     * @param transition Transition in 100ms units, negative keeps the device's
     */
    ApiResult applyPreset(const std::string& address, uint8_t presetId, int32_t transition = -1);

    /**
     * @brief POST /json/cfg with the new name, then re-read the device
     */
    ApiResult renameDevice(const std::string& address, const std::string& name);

    /**
     * @brief Push per-LED colors as sequential chunked POSTs
     *
     * Stops at the first failed chunk. @p afterChunk runs after every chunk.
     */
    std::vector<sync::ChunkReport> setSegmentPixels(
        const std::string& address,
        int16_t segmentId,
        uint32_t startOffset,
        const std::vector<uint32_t>& colors,
        const sync::ChunkedSender::AfterChunk& afterChunk = nullptr);

    /**
     * @brief Apply one update to several devices, one request each
     * @param addresses deviceId -> address
     * @return deviceId -> result, one entry per device
     */
    std::map<std::string, ApiResult> setBatchState(
        const std::map<std::string, std::string>& addresses,
        const StateUpdate& update);

    /**
     * @brief Map a chunk POST result onto the sync error taxonomy
     */
    static SyncError toSyncError(const ApiResult& result);

    /**
     * @brief Map a transport failure onto the API error taxonomy
     */
    static ApiError classify(hal::TransportError error);

private:
    ApiResult postJson(const std::string& address, const char* path, const std::string& body);

    hal::IHttpTransport& m_http;
    uint32_t m_timeoutMs;
};

} // namespace net
} // namespace lumenlink
