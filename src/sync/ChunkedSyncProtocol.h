// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ChunkedSyncProtocol.h
 * @brief Per-pixel payload chunking and sequential transmission
 *
 * A long per-LED color array is split into chunks of at most
 * maxItemsPerChunk pixels. Each chunk carries its absolute start offset, so
 * any single chunk can be retransmitted on its own.
 *
 * Wire shape (POST /json/state or WebSocket):
 *   default segment:  {"seg":{"i":[offset,"RRGGBB","RRGGBB",...]}}
 *   named segment:    {"seg":[{"id":2,"i":[offset,"RRGGBB",...]}]}
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "config/network_config.h"
#include "core/Errors.h"

namespace lumenlink {
namespace sync {

/// Segment id meaning "the device's main segment" (no id in the body)
constexpr int16_t kDefaultSegment = -1;

struct PixelChunk {
    int16_t segmentId = kDefaultSegment;
    uint32_t offset = 0;                ///< Absolute index of items[0]
    std::vector<uint32_t> items;        ///< 0xRRGGBB per pixel
};

struct ChunkReport {
    size_t index;                       ///< Position in the chunk list
    uint32_t offset;
    size_t itemCount;
    SyncError error;

    bool ok() const { return error == SyncError::None; }
};

/**
 * @brief Split @p items into chunks
 *
 * Chunk k starts at startOffset + k * maxItemsPerChunk. Empty input yields no
 * chunks; maxItemsPerChunk == 0 selects the default.
 */
std::vector<PixelChunk> buildChunks(int16_t segmentId,
                                    uint32_t startOffset,
                                    const std::vector<uint32_t>& items,
                                    uint16_t maxItemsPerChunk = config::SyncDefaults::MAX_ITEMS_PER_CHUNK);

/**
 * @brief Serialize one chunk as a partial state document
 * @return false if the document could not be built
 */
bool encodeChunkBody(const PixelChunk& chunk, std::string& out);

/**
 * @brief Format 0xRRGGBB as "RRGGBB" (upper case)
 */
std::string toHexColor(uint32_t rgb);

/**
 * @brief Sends chunk lists one body at a time
 *
 * Chunk n+1 is handed to the sink only after the sink returned for chunk n.
 * Failures are reported per chunk; nothing is retried here.
 */
class ChunkedSender {
public:
    using Sink = std::function<SyncError(const std::string& body)>;
    using AfterChunk = std::function<void(const ChunkReport& report)>;

    explicit ChunkedSender(bool stopOnFailure = true)
        : m_stopOnFailure(stopOnFailure)
    {}

    /**
     * @return One report per attempted chunk, in send order
     */
    std::vector<ChunkReport> send(const std::vector<PixelChunk>& chunks,
                                  const Sink& sink,
                                  const AfterChunk& afterChunk = nullptr) const;

    /**
     * @brief Retransmit the chunk starting at @p offset
     * @return false if no chunk starts at @p offset
     */
    bool sendChunk(const std::vector<PixelChunk>& chunks, uint32_t offset,
                   const Sink& sink, ChunkReport& out) const;

    bool stopOnFailure() const { return m_stopOnFailure; }

    static bool allSucceeded(const std::vector<ChunkReport>& reports, size_t expected);

private:
    static ChunkReport transmit(const PixelChunk& chunk, size_t index, const Sink& sink);

    bool m_stopOnFailure;
};

} // namespace sync
} // namespace lumenlink
