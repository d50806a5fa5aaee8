// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EspMdnsBrowser.h
 * @brief IServiceBrowser over ESPmDNS
 */

#pragma once

#ifndef NATIVE_BUILD

#include <mutex>

#include "hal/interface/IServiceBrowser.h"

namespace lumenlink {
namespace hal {
namespace esp32 {

class EspMdnsBrowser : public IServiceBrowser {
public:
    EspMdnsBrowser();

    /**
     * @brief Start the mDNS responder under @p hostname
     */
    bool begin(const char* hostname);

    /**
     * @brief Query for @p serviceType
     *
     * ESPmDNS runs its own fixed query window; @p windowMs is an upper bound
     * that the library does not expose.
     */
    bool browse(const std::string& serviceType, uint32_t windowMs,
                std::vector<ServiceRecord>& out) override;

    /**
     * @brief Split "_wled._tcp" into "wled" and "tcp"
     */
    static bool splitServiceType(const std::string& serviceType, std::string& service,
                                 std::string& proto);

private:
    std::mutex m_mutex;             ///< ESPmDNS result slots are global
    bool m_started;
};

} // namespace esp32
} // namespace hal
} // namespace lumenlink

#endif // NATIVE_BUILD
