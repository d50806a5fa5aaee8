// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IDuplexTransport.h
 * @brief Persistent WebSocket-style connection seam
 *
 * Events may be delivered on any thread, including synchronously from inside
 * open(). Consumers must not hold locks across calls into a connection.
 */

#pragma once

#include <functional>
#include <memory>
#include <string>

namespace lumenlink {
namespace hal {

/**
 * @brief Event callbacks for one duplex connection
 */
struct DuplexCallbacks {
    std::function<void()> onOpen;
    std::function<void(const std::string& text)> onText;
    std::function<void()> onPong;
    /// @param error true for receive errors and unexpected drops,
    ///              false for an orderly close we requested
    std::function<void(bool error, const std::string& reason)> onClosed;
};

/**
 * @brief Handle to one open (or opening) duplex connection
 */
class IDuplexConnection {
public:
    virtual ~IDuplexConnection() = default;

    /**
     * @brief Queue a text frame
     * @return false if the connection is not open or the frame was rejected
     */
    virtual bool sendText(const std::string& text) = 0;

    /**
     * @brief Close the connection; no callbacks fire after close() returns
     */
    virtual void close() = 0;
};

/**
 * @brief Factory for duplex connections
 *
 * - ESP32: EspWebSocketTransport (links2004 WebSocketsClient)
 * - Native tests: FakeDuplexTransport
 */
class IDuplexTransport {
public:
    virtual ~IDuplexTransport() = default;

    /**
     * @brief Start connecting to @p url (ws://host[:port]/path)
     * @return Handle, or nullptr if the connection could not be started
     *         (no callback fires in that case)
     */
    virtual std::shared_ptr<IDuplexConnection> open(const std::string& url,
                                                    DuplexCallbacks callbacks) = 0;
};

} // namespace hal
} // namespace lumenlink
