// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DeviceDirectory.h
 * @brief In-memory IDeviceDirectory
 *
 * Mutex-protected map keyed by device id. Change events are published after
 * the lock is released.
 */

#pragma once

#include <map>
#include <mutex>

#include "IDeviceDirectory.h"

namespace lumenlink {
namespace directory {

class DeviceDirectory : public IDeviceDirectory {
public:
    DeviceDirectory() = default;

    // Prevent copying
    DeviceDirectory(const DeviceDirectory&) = delete;
    DeviceDirectory& operator=(const DeviceDirectory&) = delete;

    bool upsert(const DeviceRecord& record) override;
    bool remove(const std::string& deviceId) override;
    bool find(const std::string& deviceId, DeviceRecord& out) const override;
    std::vector<DeviceRecord> all() const override;
    size_t size() const override;
    bool setOnline(const std::string& deviceId, bool online, uint32_t nowMs) override;
    bool rename(const std::string& deviceId, const std::string& name) override;

    core::EventStream<DirectoryChange>& changes() override { return m_changes; }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, DeviceRecord> m_records;
    core::EventStream<DirectoryChange> m_changes;
};

} // namespace directory
} // namespace lumenlink
