// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EventStream.h
 * @brief Typed publish/subscribe stream
 *
 * Handlers are copied under the lock and invoked outside it, so a handler
 * may subscribe, unsubscribe or publish without deadlocking.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace lumenlink {
namespace core {

using SubscriptionId = uint32_t;

template <typename T>
class EventStream {
public:
    using Handler = std::function<void(const T&)>;

    EventStream()
        : m_nextId(1)
    {}

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    SubscriptionId subscribe(Handler handler) {
        std::lock_guard<std::mutex> lock(m_mutex);
        SubscriptionId id = m_nextId++;
        m_handlers.emplace_back(id, std::move(handler));
        return id;
    }

    bool unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_handlers.begin(); it != m_handlers.end(); ++it) {
            if (it->first == id) {
                m_handlers.erase(it);
                return true;
            }
        }
        return false;
    }

    void publish(const T& event) {
        std::vector<std::pair<SubscriptionId, Handler>> snapshot;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            snapshot = m_handlers;
        }
        for (auto& entry : snapshot) {
            if (entry.second) entry.second(event);
        }
    }

    size_t subscriberCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_handlers.size();
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::pair<SubscriptionId, Handler>> m_handlers;
    SubscriptionId m_nextId;
};

} // namespace core
} // namespace lumenlink
