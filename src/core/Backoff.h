// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Backoff.h
 * @brief Exponential retry delay with optional jitter
 */

#pragma once

#include <cstdint>

namespace lumenlink {
namespace core {

struct BackoffPolicy {
    uint32_t baseDelayMs = 2000;
    float multiplier = 2.0f;
    uint32_t maxDelayMs = 60000;
    float jitter = 0.0f;            ///< Fraction, 0.2 = +/-20%

    /**
     * @brief min(baseDelay * multiplier^attempt, maxDelay), attempt is 0-based
     */
    uint32_t delayForAttempt(uint8_t attempt) const;

    /**
     * @brief delayForAttempt() perturbed by +/-jitter, still capped at maxDelay
     * @param unitRandom Uniform sample in [0, 1); 0.5 yields no perturbation
     */
    uint32_t jitteredDelay(uint8_t attempt, float unitRandom) const;
};

} // namespace core
} // namespace lumenlink
