// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EspNetworkInfo.h
 * @brief INetworkInfo for the WiFi station interface
 */

#pragma once

#ifndef NATIVE_BUILD

#include "hal/interface/INetworkInfo.h"

namespace lumenlink {
namespace hal {
namespace esp32 {

class EspNetworkInfo : public INetworkInfo {
public:
    bool isConnected() const override;
    std::vector<InterfaceAddress> interfaces() const override;
};

} // namespace esp32
} // namespace hal
} // namespace lumenlink

#endif // NATIVE_BUILD
