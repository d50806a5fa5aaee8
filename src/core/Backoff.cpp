// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Backoff.cpp
 */

#include "Backoff.h"

namespace lumenlink {
namespace core {

uint32_t BackoffPolicy::delayForAttempt(uint8_t attempt) const {
    double delay = static_cast<double>(baseDelayMs);
    for (uint8_t i = 0; i < attempt; i++) {
        delay *= multiplier;
        if (delay >= maxDelayMs) return maxDelayMs;
    }
    if (delay >= maxDelayMs) return maxDelayMs;
    return static_cast<uint32_t>(delay);
}

uint32_t BackoffPolicy::jitteredDelay(uint8_t attempt, float unitRandom) const {
    uint32_t delay = delayForAttempt(attempt);
    if (jitter <= 0.0f) return delay;

    if (unitRandom < 0.0f) unitRandom = 0.0f;
    if (unitRandom > 1.0f) unitRandom = 1.0f;

    double factor = 1.0 + static_cast<double>(jitter) * (2.0 * unitRandom - 1.0);
    double jittered = static_cast<double>(delay) * factor;
    if (jittered < 0.0) jittered = 0.0;
    if (jittered > maxDelayMs) jittered = maxDelayMs;
    return static_cast<uint32_t>(jittered);
}

} // namespace core
} // namespace lumenlink
