// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file INetworkInfo.h
 * @brief Host network interface and connectivity seam
 */

#pragma once

#include <vector>

#include "net/Ipv4Address.h"

namespace lumenlink {
namespace hal {

/**
 * @brief One assigned IPv4 interface address
 */
struct InterfaceAddress {
    net::Ipv4Address address;
    net::Ipv4Address netmask;
};

/**
 * @brief Abstract view of the host's network state
 *
 * - ESP32: EspNetworkInfo (WiFi station)
 * - Native tests: FakeNetworkInfo
 */
class INetworkInfo {
public:
    virtual ~INetworkInfo() = default;

    /**
     * @brief True when the host has a usable network link
     */
    virtual bool isConnected() const = 0;

    /**
     * @brief Currently assigned IPv4 interfaces (empty when offline)
     */
    virtual std::vector<InterfaceAddress> interfaces() const = 0;
};

} // namespace hal
} // namespace lumenlink
