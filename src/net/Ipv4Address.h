// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Ipv4Address.h
 * @brief Minimal IPv4 value type for subnet checks and range scans
 */

#pragma once

#include <cstdint>
#include <string>

namespace lumenlink {
namespace net {

struct Ipv4Address {
    uint8_t octets[4];

    Ipv4Address()
        : octets{0, 0, 0, 0}
    {}

    Ipv4Address(uint8_t a, uint8_t b, uint8_t c, uint8_t d)
        : octets{a, b, c, d}
    {}

    /**
     * @brief Parse dotted-quad text ("192.168.1.20")
     * @return false for hostnames, out-of-range octets or trailing garbage
     */
    static bool parse(const std::string& text, Ipv4Address& out);

    std::string toString() const;

    uint32_t toUint32() const {
        return (static_cast<uint32_t>(octets[0]) << 24) |
               (static_cast<uint32_t>(octets[1]) << 16) |
               (static_cast<uint32_t>(octets[2]) << 8) |
               static_cast<uint32_t>(octets[3]);
    }

    bool isZero() const { return toUint32() == 0; }

    /**
     * @brief True if both addresses share the network selected by @p netmask
     */
    bool sameSubnet(const Ipv4Address& other, const Ipv4Address& netmask) const {
        return (toUint32() & netmask.toUint32()) == (other.toUint32() & netmask.toUint32());
    }

    bool operator==(const Ipv4Address& other) const { return toUint32() == other.toUint32(); }
    bool operator!=(const Ipv4Address& other) const { return !(*this == other); }
};

} // namespace net
} // namespace lumenlink
