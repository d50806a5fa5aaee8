// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DeviceHttpClient.cpp
 * @brief One-shot device API client implementation
 */

#define LL_LOG_TAG "Http"
#include "utils/Log.h"

#include "DeviceHttpClient.h"

#include "codec/WledJsonCodec.h"
#include "net/DeviceEndpoint.h"

namespace lumenlink {
namespace net {

using namespace config;

const char* toString(ApiError error) {
    switch (error) {
        case ApiError::None:                 return "none";
        case ApiError::NetworkError:         return "network-error";
        case ApiError::InvalidResponse:      return "invalid-response";
        case ApiError::HttpError:            return "http-error";
        case ApiError::DecodingError:        return "decoding-error";
        case ApiError::EncodingError:        return "encoding-error";
        case ApiError::DeviceOffline:        return "device-offline";
        case ApiError::DeviceUnreachable:    return "device-unreachable";
        case ApiError::Timeout:              return "timeout";
        case ApiError::InvalidUrl:           return "invalid-url";
        case ApiError::MaxRetriesExceeded:   return "max-retries-exceeded";
        case ApiError::UnsupportedOperation: return "unsupported-operation";
        case ApiError::DeviceBusy:           return "device-busy";
        case ApiError::InvalidConfiguration: return "invalid-configuration";
    }
    return "unknown";
}

int apiErrorCode(ApiError error, int httpStatus) {
    switch (error) {
        case ApiError::None:                 return 0;
        case ApiError::NetworkError:         return 1001;
        case ApiError::InvalidResponse:      return 1002;
        case ApiError::HttpError:            return httpStatus;
        case ApiError::DecodingError:        return 1003;
        case ApiError::EncodingError:        return 1004;
        case ApiError::DeviceOffline:        return 1005;
        case ApiError::DeviceUnreachable:    return 1006;
        case ApiError::Timeout:              return 1007;
        case ApiError::InvalidUrl:           return 1008;
        case ApiError::MaxRetriesExceeded:   return 1009;
        case ApiError::UnsupportedOperation: return 1010;
        case ApiError::DeviceBusy:           return 1011;
        case ApiError::InvalidConfiguration: return 1012;
    }
    return 1001;
}

bool isRetryable(ApiError error, int httpStatus) {
    switch (error) {
        case ApiError::NetworkError:
        case ApiError::Timeout:
        case ApiError::DeviceBusy:
        case ApiError::DeviceOffline:
        case ApiError::DeviceUnreachable:
            return true;
        case ApiError::HttpError:
            return httpStatus >= 500;
        default:
            return false;
    }
}

DeviceHttpClient::DeviceHttpClient(hal::IHttpTransport& http, uint32_t timeoutMs)
    : m_http(http)
    , m_timeoutMs(timeoutMs)
{
}

ApiError DeviceHttpClient::classify(hal::TransportError error) {
    switch (error) {
        case hal::TransportError::None:           return ApiError::None;
        case hal::TransportError::Timeout:        return ApiError::Timeout;
        case hal::TransportError::Unreachable:    return ApiError::DeviceUnreachable;
        case hal::TransportError::InvalidUrl:     return ApiError::InvalidUrl;
        case hal::TransportError::ConnectionLost: return ApiError::DeviceOffline;
        case hal::TransportError::Other:          return ApiError::NetworkError;
    }
    return ApiError::NetworkError;
}

SyncError DeviceHttpClient::toSyncError(const ApiResult& result) {
    switch (result.error) {
        case ApiError::None:
            return SyncError::None;
        case ApiError::Timeout:
            return SyncError::Timeout;
        case ApiError::NetworkError:
        case ApiError::DeviceOffline:
        case ApiError::DeviceUnreachable:
        case ApiError::InvalidUrl:
            return SyncError::Unreachable;
        case ApiError::EncodingError:
            return SyncError::EncodingFailed;
        default:
            return SyncError::Rejected;
    }
}

// ============================================================================
// Requests
// ============================================================================

ApiResult DeviceHttpClient::getState(const std::string& address) {
    ApiResult result;

    hal::HttpRequest request;
    request.method = hal::HttpMethod::Get;
    request.timeoutMs = m_timeoutMs;
    if (!buildHttpUrl(address, Protocol::JSON_PATH, request.url)) {
        result.error = ApiError::InvalidUrl;
        return result;
    }

    hal::HttpResponse response = m_http.perform(request);
    if (response.error != hal::TransportError::None) {
        result.error = classify(response.error);
        LL_LOGD("GET %s failed: %s", request.url.c_str(), toString(result.error));
        return result;
    }
    result.httpStatus = response.statusCode;
    if (!response.ok()) {
        result.error = ApiError::HttpError;
        LL_LOGW("GET %s -> HTTP %d", request.url.c_str(), response.statusCode);
        return result;
    }
    if (response.body.empty()) {
        result.error = ApiError::InvalidResponse;
        return result;
    }

    codec::DeviceDecodeResult decoded = codec::WledJsonCodec::decodeDocument(response.body);
    if (!decoded.success) {
        result.error = ApiError::DecodingError;
        LL_LOGW("GET %s: %s", request.url.c_str(), decoded.errorMsg);
        return result;
    }
    result.hasSnapshot = true;
    result.snapshot = decoded.snapshot;
    return result;
}

ApiResult DeviceHttpClient::postJson(const std::string& address, const char* path,
                                     const std::string& body) {
    ApiResult result;

    hal::HttpRequest request;
    request.method = hal::HttpMethod::Post;
    request.timeoutMs = m_timeoutMs;
    request.body = body;
    if (!buildHttpUrl(address, path, request.url)) {
        result.error = ApiError::InvalidUrl;
        return result;
    }

    hal::HttpResponse response = m_http.perform(request);
    if (response.error != hal::TransportError::None) {
        result.error = classify(response.error);
        LL_LOGD("POST %s failed: %s", request.url.c_str(), toString(result.error));
        return result;
    }
    result.httpStatus = response.statusCode;
    if (!response.ok()) {
        result.error = ApiError::HttpError;
        LL_LOGW("POST %s -> HTTP %d", request.url.c_str(), response.statusCode);
        return result;
    }

    codec::PostResponseDecodeResult decoded = codec::WledJsonCodec::decodePostResponse(response.body);
    if (!decoded.success) {
        result.error = ApiError::DecodingError;
        LL_LOGW("POST %s: %s", request.url.c_str(), decoded.errorMsg);
        return result;
    }
    result.hasSnapshot = decoded.hasSnapshot;
    result.snapshot = decoded.snapshot;
    return result;
}

ApiResult DeviceHttpClient::updateState(const std::string& address, const StateUpdate& update) {
    return postJson(address, Protocol::STATE_PATH, codec::WledJsonCodec::encodeStateUpdate(update));
}

ApiResult DeviceHttpClient::setPower(const std::string& address, bool on) {
    return updateState(address, StateUpdate::power(on));
}

ApiResult DeviceHttpClient::setBrightness(const std::string& address, uint8_t brightness) {
    return updateState(address, StateUpdate::withBrightness(brightness));
}

ApiResult DeviceHttpClient::setColor(const std::string& address, const Color& color) {
    SegmentUpdate segment;
    segment.colors.push_back(color);
    StateUpdate update;
    update.segments.push_back(segment);
    return updateState(address, update);
}

ApiResult DeviceHttpClient::applyPreset(const std::string& address, uint8_t presetId,
                                        int32_t transition) {
    StateUpdate update;
    update.presetId = presetId;
    update.transition = transition;
    return updateState(address, update);
}

ApiResult DeviceHttpClient::renameDevice(const std::string& address, const std::string& name) {
    if (name.empty()) {
        ApiResult result;
        result.error = ApiError::InvalidConfiguration;
        return result;
    }

    ApiResult posted = postJson(address, Protocol::CONFIG_PATH, codec::WledJsonCodec::encodeRename(name));
    if (!posted.ok()) return posted;

    LL_LOGI("Renamed %s to '%s'", address.c_str(), name.c_str());
    return getState(address);
}

std::vector<sync::ChunkReport> DeviceHttpClient::setSegmentPixels(
    const std::string& address,
    int16_t segmentId,
    uint32_t startOffset,
    const std::vector<uint32_t>& colors,
    const sync::ChunkedSender::AfterChunk& afterChunk) {
    std::vector<sync::PixelChunk> chunks = sync::buildChunks(segmentId, startOffset, colors);
    if (chunks.empty()) return std::vector<sync::ChunkReport>();

    sync::ChunkedSender sender;
    return sender.send(chunks, [this, &address](const std::string& body) {
        return toSyncError(postJson(address, Protocol::STATE_PATH, body));
    }, afterChunk);
}

std::map<std::string, ApiResult> DeviceHttpClient::setBatchState(
    const std::map<std::string, std::string>& addresses,
    const StateUpdate& update) {
    std::map<std::string, ApiResult> results;
    const std::string body = codec::WledJsonCodec::encodeStateUpdate(update);

    size_t failed = 0;
    for (const auto& entry : addresses) {
        ApiResult result = postJson(entry.second, Protocol::STATE_PATH, body);
        if (!result.ok()) failed++;
        results[entry.first] = result;
    }
    if (failed > 0) {
        LL_LOGW("Batch update: %u of %u devices failed", (unsigned)failed, (unsigned)addresses.size());
    }
    return results;
}

} // namespace net
} // namespace lumenlink
