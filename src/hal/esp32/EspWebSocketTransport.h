// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EspWebSocketTransport.h
 * @brief IDuplexTransport over links2004 WebSocketsClient
 *
 * WebSocketsClient is not thread-safe. Every client is driven by a single
 * pump task: loop(), outgoing frames and disconnects all happen there.
 * sendText() from other tasks only appends to a per-connection outbox.
 *
 * Callbacks run on the pump task while the connection's dispatch mutex is
 * held. close() takes the same (recursive) mutex, so once it returns no
 * callback is running or will run, and it may be called from inside a
 * callback.
 */

#pragma once

#ifndef NATIVE_BUILD

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <WebSocketsClient.h>

#include "hal/interface/IDuplexTransport.h"

namespace lumenlink {
namespace hal {
namespace esp32 {

class EspWebSocketConnection : public IDuplexConnection {
public:
    EspWebSocketConnection(DuplexCallbacks callbacks, uint32_t connectTimeoutMs);
    ~EspWebSocketConnection() override = default;

    // Prevent copying
    EspWebSocketConnection(const EspWebSocketConnection&) = delete;
    EspWebSocketConnection& operator=(const EspWebSocketConnection&) = delete;

    void begin(const std::string& host, uint16_t port, const std::string& path);

    bool sendText(const std::string& text) override;
    void close() override;

    // Pump task only
    void service(uint32_t nowMs);
    void shutdown();
    bool isFinished() const { return m_finished; }

private:
    void handleEvent(WStype_t type, uint8_t* payload, size_t length);
    void dispatchClosed(bool error, const char* reason);

    WebSocketsClient m_ws;
    std::recursive_mutex m_dispatchMutex;
    std::mutex m_stateMutex;
    DuplexCallbacks m_callbacks;
    std::deque<std::string> m_outbox;
    bool m_open;
    bool m_closeRequested;
    bool m_closedNotified;
    bool m_finished;
    uint32_t m_startedMs;
    uint32_t m_connectTimeoutMs;
};

class EspWebSocketTransport : public IDuplexTransport {
public:
    explicit EspWebSocketTransport(uint32_t connectTimeoutMs = 5000);
    ~EspWebSocketTransport() override;

    // Prevent copying
    EspWebSocketTransport(const EspWebSocketTransport&) = delete;
    EspWebSocketTransport& operator=(const EspWebSocketTransport&) = delete;

    /**
     * @brief Spawn the pump task
     */
    bool start(UBaseType_t priority = 3, BaseType_t coreId = 0);
    void stop();

    std::shared_ptr<IDuplexConnection> open(const std::string& url,
                                            DuplexCallbacks callbacks) override;

    /**
     * @brief Split ws://host[:port]/path; port defaults to 80, path to "/"
     */
    static bool parseUrl(const std::string& url, std::string& host, uint16_t& port,
                         std::string& path);

private:
    static void pumpEntry(void* param);
    void pumpLoop();

    uint32_t m_connectTimeoutMs;
    std::mutex m_mutex;
    std::vector<std::shared_ptr<EspWebSocketConnection>> m_connections;
    TaskHandle_t m_task;
    std::atomic<bool> m_running;
    std::atomic<bool> m_pumpAlive;
};

} // namespace esp32
} // namespace hal
} // namespace lumenlink

#endif // NATIVE_BUILD
