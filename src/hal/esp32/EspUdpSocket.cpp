// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EspUdpSocket.cpp
 * @brief WiFiUDP broadcast and polled receive
 */

#include "EspUdpSocket.h"

#ifndef NATIVE_BUILD

#include <Arduino.h>
#include <WiFi.h>

#define LL_LOG_TAG "Udp"
#include "utils/Log.h"

namespace lumenlink {
namespace hal {
namespace esp32 {

constexpr size_t EspUdpSocket::MAX_DATAGRAM;

EspUdpSocket::EspUdpSocket()
    : m_open(false)
{
}

EspUdpSocket::~EspUdpSocket() {
    close();
}

bool EspUdpSocket::open(uint16_t localPort) {
    close();
    if (m_udp.begin(localPort) != 1) {
        LL_LOGW("Bind to port %u failed", (unsigned)localPort);
        return false;
    }
    m_open = true;
    return true;
}

bool EspUdpSocket::broadcast(const std::string& payload, uint16_t port) {
    if (!m_open) return false;

    IPAddress target = WiFi.broadcastIP();
    if (m_udp.beginPacket(target, port) != 1) return false;
    m_udp.write(reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
    return m_udp.endPacket() == 1;
}

bool EspUdpSocket::receive(Datagram& out, uint32_t timeoutMs) {
    if (!m_open) return false;

    uint32_t start = millis();
    do {
        int size = m_udp.parsePacket();
        if (size > 0) {
            char buffer[MAX_DATAGRAM];
            int len = m_udp.read(buffer, sizeof(buffer));
            if (len < 0) len = 0;
            out.payload.assign(buffer, static_cast<size_t>(len));
            out.sourceAddress = m_udp.remoteIP().toString().c_str();
            return true;
        }
        delay(10);
    } while (millis() - start < timeoutMs);

    return false;
}

void EspUdpSocket::close() {
    if (!m_open) return;
    m_udp.stop();
    m_open = false;
}

} // namespace esp32
} // namespace hal
} // namespace lumenlink

#endif // NATIVE_BUILD
