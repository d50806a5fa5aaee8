// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Cancellation.h
 * @brief Cooperative cancellation flag shared between an owner and its jobs
 *
 * A CancellationSource hands out tokens. Jobs running on executor workers poll
 * their token and abandon their result once it reads cancelled. reset() starts
 * a new generation: tokens handed out earlier stay cancelled forever.
 */

#pragma once

#include <atomic>
#include <memory>

namespace lumenlink {
namespace core {

class CancellationToken {
public:
    /// A token that is never cancelled
    CancellationToken() = default;

    bool isCancelled() const {
        return m_flag && m_flag->load(std::memory_order_acquire);
    }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag)
        : m_flag(std::move(flag))
    {}

    std::shared_ptr<std::atomic<bool>> m_flag;
};

class CancellationSource {
public:
    CancellationSource()
        : m_flag(std::make_shared<std::atomic<bool>>(false))
    {}

    CancellationToken token() const { return CancellationToken(m_flag); }

    void cancel() { m_flag->store(true, std::memory_order_release); }

    bool isCancelled() const { return m_flag->load(std::memory_order_acquire); }

    /**
     * @brief Cancel the current generation and start a fresh one
     */
    void reset() {
        cancel();
        m_flag = std::make_shared<std::atomic<bool>>(false);
    }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace core
} // namespace lumenlink
