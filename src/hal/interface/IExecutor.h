// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IExecutor.h
 * @brief Worker pool seam for blocking network jobs
 *
 * Probes, HTTP requests and socket listens block for up to their timeout.
 * They are posted to an executor so that the main loop and the scheduler
 * never block on the network.
 */

#pragma once

#include <functional>

namespace lumenlink {
namespace hal {

using Job = std::function<void()>;

/**
 * @brief Abstract job executor
 *
 * Platform-specific implementations:
 * - ESP32: FreeRtosExecutor (queue + worker tasks)
 * - Native tests: ManualExecutor (jobs run when the test drains the queue)
 */
class IExecutor {
public:
    virtual ~IExecutor() = default;

    /**
     * @brief Queue a job for execution on a worker
     * @return false if the job could not be queued (queue full, shutting down)
     */
    virtual bool post(Job job) = 0;
};

} // namespace hal
} // namespace lumenlink
