// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EspPlatform.h
 * @brief ESP32 clock and random source
 */

#pragma once

#ifndef NATIVE_BUILD

#include <Arduino.h>
#include <esp_random.h>

#include "hal/interface/IClock.h"

namespace lumenlink {
namespace hal {
namespace esp32 {

class EspClock : public IClock {
public:
    uint32_t nowMs() const override { return millis(); }
};

/**
 * @brief Hardware RNG (esp_random), 24 bits of mantissa per sample
 */
class EspRandom : public IRandom {
public:
    float nextUnit() override {
        return static_cast<float>(esp_random() >> 8) * (1.0f / 16777216.0f);
    }
};

} // namespace esp32
} // namespace hal
} // namespace lumenlink

#endif // NATIVE_BUILD
