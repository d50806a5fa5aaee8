// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IHttpTransport.h
 * @brief Blocking one-shot HTTP request seam
 */

#pragma once

#include <cstdint>
#include <string>

namespace lumenlink {
namespace hal {

/**
 * @brief Transport-level failure class of a request
 */
enum class TransportError : uint8_t {
    None,           ///< A response was received (any status code)
    Timeout,        ///< Connect or read timed out
    Unreachable,    ///< Refused, host unreachable or name resolution failed
    InvalidUrl,     ///< URL could not be parsed
    ConnectionLost, ///< Connection dropped mid-response
    Other           ///< Any other transport failure
};

enum class HttpMethod : uint8_t {
    Get,
    Post
};

struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string url;
    std::string body;               ///< JSON body for POST
    uint32_t timeoutMs = 2000;      ///< Applies to connect and read
};

struct HttpResponse {
    TransportError error = TransportError::None;
    int statusCode = 0;             ///< Valid when error == None
    std::string body;

    bool ok() const {
        return error == TransportError::None && statusCode >= 200 && statusCode < 300;
    }
};

/**
 * @brief Abstract HTTP client
 *
 * Implementations block the calling worker for at most request.timeoutMs.
 * - ESP32: EspHttpTransport (Arduino HTTPClient)
 * - Native tests: FakeHttpTransport (scripted responses)
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

} // namespace hal
} // namespace lumenlink
