// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EspHttpTransport.h
 * @brief IHttpTransport over the Arduino-ESP32 HTTPClient
 */

#pragma once

#ifndef NATIVE_BUILD

#include "hal/interface/IHttpTransport.h"

namespace lumenlink {
namespace hal {
namespace esp32 {

/**
 * @brief One HTTPClient per request; safe to call from any worker task
 */
class EspHttpTransport : public IHttpTransport {
public:
    EspHttpTransport() = default;

    HttpResponse perform(const HttpRequest& request) override;

    /**
     * @brief Map a negative HTTPClient result (HTTPC_ERROR_*) to a transport error
     */
    static TransportError classify(int httpcError);
};

} // namespace esp32
} // namespace hal
} // namespace lumenlink

#endif // NATIVE_BUILD
