// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DeviceEndpoint.h
 * @brief URL construction for device addresses
 *
 * A device address is an IPv4 literal or hostname, optionally followed by
 * ":port". Anything that cannot form a URL authority is rejected.
 */

#pragma once

#include <string>

namespace lumenlink {
namespace net {

/**
 * @brief True if @p address can be used as a URL authority
 */
bool isValidDeviceAddress(const std::string& address);

/**
 * @brief Host part of @p address with any ":port" suffix removed
 */
std::string hostOf(const std::string& address);

/**
 * @brief "http://<address><path>"
 * @return false (and @p out untouched) for invalid addresses
 */
bool buildHttpUrl(const std::string& address, const char* path, std::string& out);

/**
 * @brief "ws://<address>/ws"
 */
bool buildWebSocketUrl(const std::string& address, std::string& out);

} // namespace net
} // namespace lumenlink
