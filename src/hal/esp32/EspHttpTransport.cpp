// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EspHttpTransport.cpp
 * @brief HTTPClient request execution and error mapping
 */

#include "EspHttpTransport.h"

#ifndef NATIVE_BUILD

#include <Arduino.h>
#include <HTTPClient.h>

#define LL_LOG_TAG "HttpTx"
#include "utils/Log.h"

namespace lumenlink {
namespace hal {
namespace esp32 {

TransportError EspHttpTransport::classify(int httpcError) {
    switch (httpcError) {
        case HTTPC_ERROR_READ_TIMEOUT:
            return TransportError::Timeout;
        case HTTPC_ERROR_CONNECTION_REFUSED:    // Also reported for connect timeouts
        case HTTPC_ERROR_NOT_CONNECTED:
            return TransportError::Unreachable;
        case HTTPC_ERROR_CONNECTION_LOST:
        case HTTPC_ERROR_SEND_HEADER_FAILED:
        case HTTPC_ERROR_SEND_PAYLOAD_FAILED:
            return TransportError::ConnectionLost;
        default:
            return TransportError::Other;
    }
}

HttpResponse EspHttpTransport::perform(const HttpRequest& request) {
    HttpResponse response;

    HTTPClient http;
    http.setReuse(false);
    http.setConnectTimeout(static_cast<int32_t>(request.timeoutMs));
    http.setTimeout(static_cast<uint16_t>(request.timeoutMs > 0xFFFF ? 0xFFFF : request.timeoutMs));

    if (!http.begin(request.url.c_str())) {
        LL_LOGW("Bad URL: %s", request.url.c_str());
        response.error = TransportError::InvalidUrl;
        return response;
    }

    int code;
    if (request.method == HttpMethod::Post) {
        http.addHeader("Content-Type", "application/json");
        code = http.POST(reinterpret_cast<uint8_t*>(const_cast<char*>(request.body.data())),
                         request.body.size());
    } else {
        code = http.GET();
    }

    if (code < 0) {
        response.error = classify(code);
        LL_LOGD("%s failed: %s (%d)", request.url.c_str(),
                HTTPClient::errorToString(code).c_str(), code);
        http.end();
        return response;
    }

    response.statusCode = code;
    String body = http.getString();
    response.body.assign(body.c_str(), body.length());
    http.end();
    return response;
}

} // namespace esp32
} // namespace hal
} // namespace lumenlink

#endif // NATIVE_BUILD
