// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IServiceBrowser.h
 * @brief mDNS / DNS-SD browse seam
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lumenlink {
namespace hal {

/**
 * @brief One resolved service advertisement
 */
struct ServiceRecord {
    std::string instanceName;       ///< Instance or host name as advertised
    std::string address;            ///< Resolved IPv4, empty if unresolved
    uint16_t port = 0;
};

/**
 * @brief Abstract service browser
 *
 * - ESP32: EspMdnsBrowser (ESPmDNS)
 * - Native tests: FakeServiceBrowser
 */
class IServiceBrowser {
public:
    virtual ~IServiceBrowser() = default;

    /**
     * @brief Browse for @p serviceType ("_wled._tcp") for up to @p windowMs
     * @param out Filled with resolved advertisements
     * @return false if the browser could not be started
     */
    virtual bool browse(const std::string& serviceType, uint32_t windowMs,
                        std::vector<ServiceRecord>& out) = 0;
};

} // namespace hal
} // namespace lumenlink
