// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ChunkedSyncProtocol.cpp
 * @brief Chunk builder, body encoder and sequential sender
 */

#define LL_LOG_TAG "Sync"
#include "utils/Log.h"

#include "ChunkedSyncProtocol.h"

#include <ArduinoJson.h>

#include <algorithm>
#include <cstdio>

namespace lumenlink {
namespace sync {

std::vector<PixelChunk> buildChunks(int16_t segmentId,
                                    uint32_t startOffset,
                                    const std::vector<uint32_t>& items,
                                    uint16_t maxItemsPerChunk) {
    std::vector<PixelChunk> chunks;
    if (items.empty()) return chunks;

    const size_t step = maxItemsPerChunk == 0
        ? config::SyncDefaults::MAX_ITEMS_PER_CHUNK
        : maxItemsPerChunk;
    chunks.reserve((items.size() + step - 1) / step);

    for (size_t begin = 0; begin < items.size(); begin += step) {
        size_t end = std::min(begin + step, items.size());
        PixelChunk chunk;
        chunk.segmentId = segmentId;
        chunk.offset = startOffset + static_cast<uint32_t>(begin);
        chunk.items.assign(items.begin() + begin, items.begin() + end);
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

std::string toHexColor(uint32_t rgb) {
    char hex[7];
    snprintf(hex, sizeof(hex), "%06lX", (unsigned long)(rgb & 0xFFFFFFUL));
    return std::string(hex);
}

bool encodeChunkBody(const PixelChunk& chunk, std::string& out) {
    JsonDocument doc;

    JsonObject seg;
    if (chunk.segmentId == kDefaultSegment) {
        seg = doc["seg"].to<JsonObject>();
    } else {
        JsonArray segments = doc["seg"].to<JsonArray>();
        seg = segments.add<JsonObject>();
        seg["id"] = chunk.segmentId;
    }

    JsonArray pixels = seg["i"].to<JsonArray>();
    pixels.add(chunk.offset);
    for (uint32_t rgb : chunk.items) {
        pixels.add(toHexColor(rgb));
    }

    if (doc.overflowed()) {
        LL_LOGE("Chunk at offset %lu does not fit in memory", (unsigned long)chunk.offset);
        return false;
    }

    out.clear();
    serializeJson(doc, out);
    return true;
}

// ============================================================================
// ChunkedSender
// ============================================================================

ChunkReport ChunkedSender::transmit(const PixelChunk& chunk, size_t index, const Sink& sink) {
    ChunkReport report;
    report.index = index;
    report.offset = chunk.offset;
    report.itemCount = chunk.items.size();

    std::string body;
    if (!encodeChunkBody(chunk, body)) {
        report.error = SyncError::EncodingFailed;
        return report;
    }
    report.error = sink ? sink(body) : SyncError::NotConnected;
    return report;
}

std::vector<ChunkReport> ChunkedSender::send(const std::vector<PixelChunk>& chunks,
                                             const Sink& sink,
                                             const AfterChunk& afterChunk) const {
    std::vector<ChunkReport> reports;
    reports.reserve(chunks.size());

    for (size_t i = 0; i < chunks.size(); i++) {
        ChunkReport report = transmit(chunks[i], i, sink);
        reports.push_back(report);
        if (afterChunk) afterChunk(report);

        if (!report.ok()) {
            LL_LOGW("Chunk %u/%u (offset %lu) failed: %s", (unsigned)(i + 1),
                    (unsigned)chunks.size(), (unsigned long)report.offset,
                    toString(report.error));
            if (m_stopOnFailure) break;
        }
    }
    return reports;
}

bool ChunkedSender::sendChunk(const std::vector<PixelChunk>& chunks, uint32_t offset,
                              const Sink& sink, ChunkReport& out) const {
    for (size_t i = 0; i < chunks.size(); i++) {
        if (chunks[i].offset == offset) {
            out = transmit(chunks[i], i, sink);
            return true;
        }
    }
    return false;
}

bool ChunkedSender::allSucceeded(const std::vector<ChunkReport>& reports, size_t expected) {
    if (reports.size() != expected) return false;
    for (const ChunkReport& report : reports) {
        if (!report.ok()) return false;
    }
    return true;
}

} // namespace sync
} // namespace lumenlink
