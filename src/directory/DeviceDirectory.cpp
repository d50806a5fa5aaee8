// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DeviceDirectory.cpp
 * @brief In-memory device directory implementation
 */

#define LL_LOG_TAG "Directory"
#include "utils/Log.h"

#include "DeviceDirectory.h"

namespace lumenlink {
namespace directory {

bool DeviceDirectory::upsert(const DeviceRecord& record) {
    if (record.id.empty()) {
        LL_LOGW("Rejected record without identifier (%s)", record.address.c_str());
        return false;
    }

    DirectoryChange change;
    bool isNew = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(record.id);
        if (it == m_records.end()) {
            m_records[record.id] = record;
            change.kind = DirectoryChangeKind::Added;
            change.record = record;
            isNew = true;
        } else {
            DeviceRecord& stored = it->second;
            if (stored.address != record.address) {
                LL_LOGI("%s moved %s -> %s", record.id.c_str(), stored.address.c_str(),
                        record.address.c_str());
            }
            stored.address = record.address;
            if (!stored.nameIsUserAssigned && !record.name.empty()) {
                stored.name = record.name;
            }
            if (record.snapshot.hasInfo || record.snapshot.hasState) {
                stored.snapshot = record.snapshot;
            }
            if (static_cast<int32_t>(record.lastSeenMs - stored.lastSeenMs) > 0) {
                stored.lastSeenMs = record.lastSeenMs;
            }
            change.kind = DirectoryChangeKind::Updated;
            change.record = stored;
        }
    }

    if (isNew) {
        LL_LOGI("Added %s (%s) at %s", record.name.c_str(), record.id.c_str(),
                record.address.c_str());
    }
    m_changes.publish(change);
    return isNew;
}

bool DeviceDirectory::remove(const std::string& deviceId) {
    DirectoryChange change;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(deviceId);
        if (it == m_records.end()) return false;
        change.kind = DirectoryChangeKind::Removed;
        change.record = it->second;
        m_records.erase(it);
    }
    LL_LOGI("Removed %s", deviceId.c_str());
    m_changes.publish(change);
    return true;
}

bool DeviceDirectory::find(const std::string& deviceId, DeviceRecord& out) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(deviceId);
    if (it == m_records.end()) return false;
    out = it->second;
    return true;
}

std::vector<DeviceRecord> DeviceDirectory::all() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<DeviceRecord> records;
    records.reserve(m_records.size());
    for (const auto& entry : m_records) {
        records.push_back(entry.second);
    }
    return records;
}

size_t DeviceDirectory::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

bool DeviceDirectory::setOnline(const std::string& deviceId, bool online, uint32_t nowMs) {
    DirectoryChange change;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(deviceId);
        if (it == m_records.end()) return false;
        if (online) it->second.lastSeenMs = nowMs;
        if (it->second.online == online) return true;
        it->second.online = online;
        change.kind = DirectoryChangeKind::Updated;
        change.record = it->second;
    }
    m_changes.publish(change);
    return true;
}

bool DeviceDirectory::rename(const std::string& deviceId, const std::string& name) {
    DirectoryChange change;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(deviceId);
        if (it == m_records.end()) return false;
        it->second.name = name;
        it->second.nameIsUserAssigned = true;
        change.kind = DirectoryChangeKind::Updated;
        change.record = it->second;
    }
    m_changes.publish(change);
    return true;
}

} // namespace directory
} // namespace lumenlink
