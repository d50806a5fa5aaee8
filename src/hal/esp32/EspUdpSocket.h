// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EspUdpSocket.h
 * @brief IDatagramSocket over WiFiUDP
 */

#pragma once

#ifndef NATIVE_BUILD

#include <WiFiUdp.h>

#include "hal/interface/IDatagramSocket.h"

namespace lumenlink {
namespace hal {
namespace esp32 {

class EspUdpSocket : public IDatagramSocket {
public:
    EspUdpSocket();
    ~EspUdpSocket() override;

    // Prevent copying
    EspUdpSocket(const EspUdpSocket&) = delete;
    EspUdpSocket& operator=(const EspUdpSocket&) = delete;

    bool open(uint16_t localPort) override;
    bool broadcast(const std::string& payload, uint16_t port) override;
    bool receive(Datagram& out, uint32_t timeoutMs) override;
    void close() override;

private:
    static constexpr size_t MAX_DATAGRAM = 1472;

    WiFiUDP m_udp;
    bool m_open;
};

} // namespace esp32
} // namespace hal
} // namespace lumenlink

#endif // NATIVE_BUILD
