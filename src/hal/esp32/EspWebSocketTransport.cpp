// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EspWebSocketTransport.cpp
 * @brief links2004 WebSocketsClient connections and their pump task
 */

#include "EspWebSocketTransport.h"

#ifndef NATIVE_BUILD

#include <Arduino.h>
#include <cstdlib>

#define LL_LOG_TAG "WsTx"
#include "utils/Log.h"

namespace lumenlink {
namespace hal {
namespace esp32 {

namespace {
constexpr size_t MAX_OUTBOX = 16;
constexpr TickType_t PUMP_INTERVAL = pdMS_TO_TICKS(5);
}

// ============================================================================
// Connection
// ============================================================================

EspWebSocketConnection::EspWebSocketConnection(DuplexCallbacks callbacks,
                                               uint32_t connectTimeoutMs)
    : m_callbacks(std::move(callbacks))
    , m_open(false)
    , m_closeRequested(false)
    , m_closedNotified(false)
    , m_finished(false)
    , m_startedMs(0)
    , m_connectTimeoutMs(connectTimeoutMs)
{
    m_ws.onEvent([this](WStype_t type, uint8_t* payload, size_t length) {
        handleEvent(type, payload, length);
    });
}

void EspWebSocketConnection::begin(const std::string& host, uint16_t port,
                                   const std::string& path) {
    m_startedMs = millis();
    // Reconnects are owned by the pool; keep the library from retrying first
    m_ws.setReconnectInterval(m_connectTimeoutMs * 4);
    m_ws.begin(host.c_str(), port, path.c_str());
}

bool EspWebSocketConnection::sendText(const std::string& text) {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (!m_open || m_closeRequested) return false;
    if (m_outbox.size() >= MAX_OUTBOX) {
        LL_LOGW("Outbox full, frame dropped");
        return false;
    }
    m_outbox.push_back(text);
    return true;
}

void EspWebSocketConnection::close() {
    {
        std::lock_guard<std::recursive_mutex> dispatch(m_dispatchMutex);
        m_callbacks = DuplexCallbacks();
        m_closedNotified = true;
    }
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_closeRequested = true;
    m_open = false;
    m_outbox.clear();
}

void EspWebSocketConnection::service(uint32_t nowMs) {
    if (m_finished) return;

    bool closeRequested;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        closeRequested = m_closeRequested;
    }
    if (closeRequested) {
        shutdown();
        return;
    }

    m_ws.loop();

    std::deque<std::string> pending;
    bool open;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        open = m_open;
        if (open) pending.swap(m_outbox);
    }

    for (std::string& text : pending) {
        if (!m_ws.sendTXT(text.c_str(), text.size())) {
            dispatchClosed(true, "send failed");
            return;
        }
    }

    if (!open && static_cast<int32_t>(nowMs - m_startedMs) >=
                     static_cast<int32_t>(m_connectTimeoutMs)) {
        dispatchClosed(true, "connect timeout");
    }
}

void EspWebSocketConnection::shutdown() {
    if (m_finished) return;
    m_ws.disconnect();
    m_finished = true;
}

void EspWebSocketConnection::handleEvent(WStype_t type, uint8_t* payload, size_t length) {
    switch (type) {
        case WStype_CONNECTED: {
            {
                std::lock_guard<std::mutex> lock(m_stateMutex);
                if (m_closeRequested) return;
                m_open = true;
            }
            std::lock_guard<std::recursive_mutex> dispatch(m_dispatchMutex);
            std::function<void()> onOpen = m_callbacks.onOpen;
            if (onOpen) onOpen();
            break;
        }

        case WStype_TEXT: {
            std::string text(reinterpret_cast<const char*>(payload), length);
            std::lock_guard<std::recursive_mutex> dispatch(m_dispatchMutex);
            std::function<void(const std::string&)> onText = m_callbacks.onText;
            if (onText) onText(text);
            break;
        }

        case WStype_PONG: {
            std::lock_guard<std::recursive_mutex> dispatch(m_dispatchMutex);
            std::function<void()> onPong = m_callbacks.onPong;
            if (onPong) onPong();
            break;
        }

        case WStype_DISCONNECTED:
            dispatchClosed(true, "disconnected");
            break;

        case WStype_ERROR:
            dispatchClosed(true, "error");
            break;

        case WStype_BIN:
        case WStype_FRAGMENT_TEXT_START:
        case WStype_FRAGMENT_BIN_START:
        case WStype_FRAGMENT:
        case WStype_FRAGMENT_FIN:
        case WStype_PING:
        default:
            break;
    }
}

void EspWebSocketConnection::dispatchClosed(bool error, const char* reason) {
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_closeRequested = true;
        m_open = false;
        m_outbox.clear();
    }

    std::function<void(bool, const std::string&)> onClosed;
    {
        std::lock_guard<std::recursive_mutex> dispatch(m_dispatchMutex);
        if (m_closedNotified) return;
        m_closedNotified = true;
        onClosed = m_callbacks.onClosed;
        if (onClosed) onClosed(error, reason);
    }
}

// ============================================================================
// Transport
// ============================================================================

EspWebSocketTransport::EspWebSocketTransport(uint32_t connectTimeoutMs)
    : m_connectTimeoutMs(connectTimeoutMs)
    , m_task(nullptr)
    , m_running(false)
    , m_pumpAlive(false)
{
}

EspWebSocketTransport::~EspWebSocketTransport() {
    stop();
}

bool EspWebSocketTransport::start(UBaseType_t priority, BaseType_t coreId) {
    if (m_running.load()) return true;

    m_running = true;
    m_pumpAlive = true;
    BaseType_t result = xTaskCreatePinnedToCore(
        pumpEntry,
        "ll_ws_pump",
        8192,
        this,
        priority,
        &m_task,
        coreId
    );
    if (result != pdPASS) {
        LL_LOGE("Failed to create WebSocket pump task");
        m_running = false;
        m_pumpAlive = false;
        m_task = nullptr;
        return false;
    }
    return true;
}

void EspWebSocketTransport::stop() {
    m_running = false;
    while (m_pumpAlive.load()) {
        vTaskDelay(PUMP_INTERVAL);
    }
    m_task = nullptr;
}

std::shared_ptr<IDuplexConnection> EspWebSocketTransport::open(const std::string& url,
                                                              DuplexCallbacks callbacks) {
    if (!m_running.load()) {
        LL_LOGW("Pump not running, refusing %s", url.c_str());
        return nullptr;
    }

    std::string host;
    std::string path;
    uint16_t port = 0;
    if (!parseUrl(url, host, port, path)) {
        LL_LOGW("Bad WebSocket URL: %s", url.c_str());
        return nullptr;
    }

    std::shared_ptr<EspWebSocketConnection> conn =
        std::make_shared<EspWebSocketConnection>(std::move(callbacks), m_connectTimeoutMs);
    conn->begin(host, port, path);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_connections.push_back(conn);
    return conn;
}

bool EspWebSocketTransport::parseUrl(const std::string& url, std::string& host,
                                     uint16_t& port, std::string& path) {
    static const char SCHEME[] = "ws://";
    const size_t schemeLen = sizeof(SCHEME) - 1;
    if (url.compare(0, schemeLen, SCHEME) != 0) return false;

    size_t hostStart = schemeLen;
    size_t slash = url.find('/', hostStart);
    std::string authority = url.substr(hostStart, slash == std::string::npos
                                                      ? std::string::npos
                                                      : slash - hostStart);
    path = (slash == std::string::npos) ? "/" : url.substr(slash);

    size_t colon = authority.find(':');
    if (colon == std::string::npos) {
        host = authority;
        port = 80;
    } else {
        host = authority.substr(0, colon);
        std::string portText = authority.substr(colon + 1);
        if (portText.empty()) return false;
        char* end = nullptr;
        unsigned long value = std::strtoul(portText.c_str(), &end, 10);
        if (*end != '\0' || value == 0 || value > 65535) return false;
        port = static_cast<uint16_t>(value);
    }
    return !host.empty();
}

void EspWebSocketTransport::pumpEntry(void* param) {
    static_cast<EspWebSocketTransport*>(param)->pumpLoop();
    vTaskDelete(nullptr);
}

void EspWebSocketTransport::pumpLoop() {
    std::vector<std::shared_ptr<EspWebSocketConnection>> snapshot;

    while (m_running.load()) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            snapshot = m_connections;
        }

        uint32_t now = millis();
        for (const auto& conn : snapshot) {
            conn->service(now);
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto it = m_connections.begin(); it != m_connections.end();) {
                if ((*it)->isFinished()) {
                    it = m_connections.erase(it);
                } else {
                    ++it;
                }
            }
        }
        snapshot.clear();
        vTaskDelay(PUMP_INTERVAL);
    }

    std::vector<std::shared_ptr<EspWebSocketConnection>> remaining;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        remaining.swap(m_connections);
    }
    for (const auto& conn : remaining) {
        conn->shutdown();
    }
    m_pumpAlive = false;
}

} // namespace esp32
} // namespace hal
} // namespace lumenlink

#endif // NATIVE_BUILD
