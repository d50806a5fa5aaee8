// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DeviceEndpoint.cpp
 */

#include "DeviceEndpoint.h"

#include "config/network_config.h"

namespace lumenlink {
namespace net {

bool isValidDeviceAddress(const std::string& address) {
    if (address.empty() || address.size() > 253) return false;

    size_t colons = 0;
    for (char c : address) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '_' || c == ':';
        if (!ok) return false;
        if (c == ':') colons++;
    }
    if (colons > 1) return false;
    if (address.front() == '.' || address.front() == ':' || address.back() == ':') return false;

    size_t colon = address.find(':');
    if (colon != std::string::npos) {
        std::string port = address.substr(colon + 1);
        if (port.size() > 5) return false;
        unsigned long value = 0;
        for (char c : port) {
            if (c < '0' || c > '9') return false;
            value = value * 10 + static_cast<unsigned long>(c - '0');
        }
        if (value == 0 || value > 65535) return false;
    }
    return true;
}

std::string hostOf(const std::string& address) {
    size_t colon = address.find(':');
    return colon == std::string::npos ? address : address.substr(0, colon);
}

bool buildHttpUrl(const std::string& address, const char* path, std::string& out) {
    if (!isValidDeviceAddress(address)) return false;
    out = "http://" + address + (path ? path : "");
    return true;
}

bool buildWebSocketUrl(const std::string& address, std::string& out) {
    if (!isValidDeviceAddress(address)) return false;
    out = "ws://" + address + config::Protocol::WS_PATH;
    return true;
}

} // namespace net
} // namespace lumenlink
