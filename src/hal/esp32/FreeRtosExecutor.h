// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FreeRtosExecutor.h
 * @brief IExecutor backed by a FreeRTOS queue and worker tasks
 *
 * Jobs travel through the queue as heap pointers; a worker owns and frees
 * the job once it has run. post() never blocks: a full queue rejects.
 */

#pragma once

#ifndef NATIVE_BUILD

#include <atomic>
#include <vector>

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/task.h>

#include "hal/interface/IExecutor.h"

namespace lumenlink {
namespace hal {
namespace esp32 {

struct ExecutorConfig {
    const char* name = "ll_worker";
    uint8_t workers = 8;            ///< Probes (5) + broadcast listen + browse + slack
    uint32_t stackSize = 8192;      ///< Bytes (HTTPClient + JsonDocument)
    UBaseType_t priority = 2;
    BaseType_t coreId = 0;          ///< Keep off the loop() core
    uint8_t queueLength = 32;
};

class FreeRtosExecutor : public IExecutor {
public:
    explicit FreeRtosExecutor(const ExecutorConfig& config = ExecutorConfig());
    ~FreeRtosExecutor() override;

    // Prevent copying
    FreeRtosExecutor(const FreeRtosExecutor&) = delete;
    FreeRtosExecutor& operator=(const FreeRtosExecutor&) = delete;

    /**
     * @brief Create the queue and spawn worker tasks
     * @return false if the queue or any worker could not be created
     */
    bool start();

    /**
     * @brief Stop workers after their current job and drop queued jobs
     */
    void stop();

    bool post(Job job) override;

    bool isRunning() const { return m_running.load(); }

private:
    static void workerEntry(void* param);
    void workerLoop();
    void drainQueue();

    ExecutorConfig m_config;
    QueueHandle_t m_queue;
    std::vector<TaskHandle_t> m_tasks;
    std::atomic<bool> m_running;
    std::atomic<uint8_t> m_activeWorkers;
};

} // namespace esp32
} // namespace hal
} // namespace lumenlink

#endif // NATIVE_BUILD
