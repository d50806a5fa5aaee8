// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IDatagramSocket.h
 * @brief UDP broadcast socket seam used by broadcast discovery
 */

#pragma once

#include <cstdint>
#include <string>

namespace lumenlink {
namespace hal {

struct Datagram {
    std::string sourceAddress;      ///< Dotted IPv4 of the sender
    std::string payload;
};

/**
 * @brief Abstract UDP socket
 *
 * - ESP32: EspUdpSocket (WiFiUDP)
 * - Native tests: FakeDatagramSocket
 */
class IDatagramSocket {
public:
    virtual ~IDatagramSocket() = default;

    /**
     * @brief Bind to @p localPort (0 = any)
     */
    virtual bool open(uint16_t localPort) = 0;

    virtual bool broadcast(const std::string& payload, uint16_t port) = 0;

    /**
     * @brief Wait up to @p timeoutMs for one datagram
     * @return true if @p out was filled
     */
    virtual bool receive(Datagram& out, uint32_t timeoutMs) = 0;

    virtual void close() = 0;
};

} // namespace hal
} // namespace lumenlink
