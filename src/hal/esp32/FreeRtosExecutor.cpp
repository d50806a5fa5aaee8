// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FreeRtosExecutor.cpp
 * @brief FreeRTOS worker pool implementation
 */

#include "FreeRtosExecutor.h"

#ifndef NATIVE_BUILD

#include <cstdio>

#define LL_LOG_TAG "Executor"
#include "utils/Log.h"

namespace lumenlink {
namespace hal {
namespace esp32 {

namespace {
constexpr TickType_t RECEIVE_WAIT = pdMS_TO_TICKS(100);
constexpr TickType_t STOP_POLL = pdMS_TO_TICKS(20);
}

FreeRtosExecutor::FreeRtosExecutor(const ExecutorConfig& config)
    : m_config(config)
    , m_queue(nullptr)
    , m_running(false)
    , m_activeWorkers(0)
{
}

FreeRtosExecutor::~FreeRtosExecutor() {
    stop();
    if (m_queue != nullptr) {
        vQueueDelete(m_queue);
        m_queue = nullptr;
    }
}

bool FreeRtosExecutor::start() {
    if (m_running.load()) return true;

    if (m_queue == nullptr) {
        m_queue = xQueueCreate(m_config.queueLength, sizeof(Job*));
        if (m_queue == nullptr) {
            LL_LOGE("Failed to create job queue");
            return false;
        }
    }

    m_running = true;
    for (uint8_t i = 0; i < m_config.workers; ++i) {
        char taskName[16];
        snprintf(taskName, sizeof(taskName), "%s%u", m_config.name, (unsigned)i);

        TaskHandle_t handle = nullptr;
        ++m_activeWorkers;
        BaseType_t result = xTaskCreatePinnedToCore(
            workerEntry,
            taskName,
            m_config.stackSize,
            this,
            m_config.priority,
            &handle,
            m_config.coreId
        );
        if (result != pdPASS) {
            --m_activeWorkers;
            LL_LOGE("Failed to create worker %s", taskName);
            stop();
            return false;
        }
        m_tasks.push_back(handle);
    }

    LL_LOGI("Started %u workers on core %d", (unsigned)m_config.workers, (int)m_config.coreId);
    return true;
}

void FreeRtosExecutor::stop() {
    if (!m_running.exchange(false) && m_activeWorkers.load() == 0) return;

    while (m_activeWorkers.load() > 0) {
        vTaskDelay(STOP_POLL);
    }
    m_tasks.clear();
    drainQueue();
}

bool FreeRtosExecutor::post(Job job) {
    if (!m_running.load() || m_queue == nullptr) return false;

    Job* item = new Job(std::move(job));
    if (xQueueSend(m_queue, &item, 0) != pdTRUE) {
        delete item;
        LL_LOGW("Job queue full");
        return false;
    }
    return true;
}

void FreeRtosExecutor::workerEntry(void* param) {
    static_cast<FreeRtosExecutor*>(param)->workerLoop();
    vTaskDelete(nullptr);
}

void FreeRtosExecutor::workerLoop() {
    while (m_running.load()) {
        Job* item = nullptr;
        if (xQueueReceive(m_queue, &item, RECEIVE_WAIT) != pdTRUE) continue;
        if (*item) (*item)();
        delete item;
    }
    --m_activeWorkers;
}

void FreeRtosExecutor::drainQueue() {
    if (m_queue == nullptr) return;
    Job* item = nullptr;
    while (xQueueReceive(m_queue, &item, 0) == pdTRUE) {
        delete item;
    }
}

} // namespace esp32
} // namespace hal
} // namespace lumenlink

#endif // NATIVE_BUILD
