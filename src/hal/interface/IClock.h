// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IClock.h
 * @brief Monotonic millisecond clock and random source
 *
 * All timing in LumenLink is expressed in uint32_t milliseconds that wrap
 * like Arduino millis(). Compare deadlines with signed differences, never
 * with plain less-than.
 */

#pragma once

#include <cstdint>

namespace lumenlink {
namespace hal {

/**
 * @brief Abstract monotonic clock
 *
 * Platform-specific implementations:
 * - ESP32: EspClock (millis())
 * - Native tests: FakeClock (manually advanced)
 */
class IClock {
public:
    virtual ~IClock() = default;

    /**
     * @brief Current time in milliseconds (wraps at 2^32)
     */
    virtual uint32_t nowMs() const = 0;
};

/**
 * @brief Uniform random source used for retry jitter
 */
class IRandom {
public:
    virtual ~IRandom() = default;

    /**
     * @brief Uniform value in [0, 1)
     */
    virtual float nextUnit() = 0;
};

/**
 * @brief True once @p nowMs has reached @p deadlineMs, wrap-safe
 */
inline bool deadlineReached(uint32_t nowMs, uint32_t deadlineMs) {
    return static_cast<int32_t>(nowMs - deadlineMs) >= 0;
}

} // namespace hal
} // namespace lumenlink
