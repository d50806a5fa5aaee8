// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IDeviceDirectory.h
 * @brief Authoritative device list consumed by the connectivity core
 *
 * Records are keyed by logical identifier. Discovery upserts, the health
 * monitor flips online flags, and only the directory's owner removes.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/DeviceTypes.h"
#include "core/EventStream.h"

namespace lumenlink {
namespace directory {

enum class DirectoryChangeKind : uint8_t {
    Added,
    Updated,
    Removed
};

struct DirectoryChange {
    DirectoryChangeKind kind;
    DeviceRecord record;            ///< Record after the change (before, for Removed)
};

class IDeviceDirectory {
public:
    virtual ~IDeviceDirectory() = default;

    /**
     * @brief Insert or merge a record by id
     *
     * A user-assigned name on the stored record survives the merge.
     *
     * @return true if the id was not known before
     */
    virtual bool upsert(const DeviceRecord& record) = 0;

    virtual bool remove(const std::string& deviceId) = 0;
    virtual bool find(const std::string& deviceId, DeviceRecord& out) const = 0;
    virtual std::vector<DeviceRecord> all() const = 0;
    virtual size_t size() const = 0;

    virtual bool setOnline(const std::string& deviceId, bool online, uint32_t nowMs) = 0;

    /**
     * @brief Set a user-assigned display name
     */
    virtual bool rename(const std::string& deviceId, const std::string& name) = 0;

    virtual core::EventStream<DirectoryChange>& changes() = 0;
};

} // namespace directory
} // namespace lumenlink
