// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EspNetworkInfo.cpp
 * @brief WiFi station status and address
 */

#include "EspNetworkInfo.h"

#ifndef NATIVE_BUILD

#include <WiFi.h>

namespace lumenlink {
namespace hal {
namespace esp32 {

namespace {
net::Ipv4Address fromIp(const IPAddress& ip) {
    net::Ipv4Address out;
    for (uint8_t i = 0; i < 4; ++i) {
        out.octets[i] = ip[i];
    }
    return out;
}
}

bool EspNetworkInfo::isConnected() const {
    return WiFi.status() == WL_CONNECTED;
}

std::vector<InterfaceAddress> EspNetworkInfo::interfaces() const {
    std::vector<InterfaceAddress> result;
    if (!isConnected()) return result;

    InterfaceAddress iface;
    iface.address = fromIp(WiFi.localIP());
    iface.netmask = fromIp(WiFi.subnetMask());
    if (!iface.address.isZero()) result.push_back(iface);
    return result;
}

} // namespace esp32
} // namespace hal
} // namespace lumenlink

#endif // NATIVE_BUILD
