// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Ipv4Address.cpp
 * @brief Dotted-quad parsing and formatting
 */

#include "Ipv4Address.h"

#include <cstdio>

namespace lumenlink {
namespace net {

bool Ipv4Address::parse(const std::string& text, Ipv4Address& out) {
    uint8_t parsed[4] = {0, 0, 0, 0};
    size_t pos = 0;

    for (int part = 0; part < 4; part++) {
        if (pos >= text.size()) return false;

        uint32_t value = 0;
        size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            value = value * 10 + static_cast<uint32_t>(text[pos] - '0');
            if (++digits > 3 || value > 255) return false;
            pos++;
        }
        if (digits == 0) return false;
        parsed[part] = static_cast<uint8_t>(value);

        if (part < 3) {
            if (pos >= text.size() || text[pos] != '.') return false;
            pos++;
        }
    }

    if (pos != text.size()) return false;

    for (int i = 0; i < 4; i++) {
        out.octets[i] = parsed[i];
    }
    return true;
}

std::string Ipv4Address::toString() const {
    char buf[16];
    snprintf(buf, sizeof(buf), "%u.%u.%u.%u",
             octets[0], octets[1], octets[2], octets[3]);
    return std::string(buf);
}

} // namespace net
} // namespace lumenlink
