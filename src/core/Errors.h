// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Errors.h
 * @brief Error and outcome enums shared across LumenLink
 *
 * Nothing in LumenLink throws. Discovery and health fold failures into
 * ProbeOutcome; pool and sync operations return their error per call.
 */

#pragma once

#include <cstdint>

namespace lumenlink {

/**
 * @brief Classified result of probing one address
 */
enum class ProbeOutcome : uint8_t {
    Success,            ///< Device answered with a well-formed identity
    Timeout,            ///< No answer within the probe timeout
    Unreachable,        ///< Refused, host unreachable or name not resolved
    ProtocolMismatch,   ///< Something answered, but not a device
    AlreadyAttempted,   ///< Skipped: probed earlier in this run
    Banned              ///< Skipped: address is on the ban list
};

/**
 * @brief Errors surfaced by the connection pool, per operation or as lastError
 */
enum class ConnectionError : uint8_t {
    None,
    ConnectionFailed,
    ConnectionLost,
    SendFailed,
    InvalidAddress,
    MaxReconnectAttemptsReached,
    MaxConnectionsReached,
    NotConnected        ///< sendUpdate() without an open connection
};

/**
 * @brief Per-chunk transmission result
 */
enum class SyncError : uint8_t {
    None,
    NotConnected,
    SendFailed,
    Timeout,
    Unreachable,
    Rejected,           ///< Device answered with an error status
    EncodingFailed
};

const char* toString(ProbeOutcome outcome);
const char* toString(ConnectionError error);
const char* toString(SyncError error);

/**
 * @brief Network-level failures are the ones that earn an address a ban
 */
inline bool isBannable(ProbeOutcome outcome) {
    return outcome == ProbeOutcome::Timeout || outcome == ProbeOutcome::Unreachable;
}

} // namespace lumenlink
