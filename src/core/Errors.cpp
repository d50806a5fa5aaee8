// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Errors.cpp
 */

#include "Errors.h"

namespace lumenlink {

const char* toString(ProbeOutcome outcome) {
    switch (outcome) {
        case ProbeOutcome::Success:          return "success";
        case ProbeOutcome::Timeout:          return "timeout";
        case ProbeOutcome::Unreachable:      return "unreachable";
        case ProbeOutcome::ProtocolMismatch: return "protocol-mismatch";
        case ProbeOutcome::AlreadyAttempted: return "already-attempted";
        case ProbeOutcome::Banned:           return "banned";
    }
    return "unknown";
}

const char* toString(ConnectionError error) {
    switch (error) {
        case ConnectionError::None:                        return "none";
        case ConnectionError::ConnectionFailed:            return "connection-failed";
        case ConnectionError::ConnectionLost:              return "connection-lost";
        case ConnectionError::SendFailed:                  return "send-failed";
        case ConnectionError::InvalidAddress:              return "invalid-address";
        case ConnectionError::MaxReconnectAttemptsReached: return "max-reconnect-attempts-reached";
        case ConnectionError::MaxConnectionsReached:       return "max-connections-reached";
        case ConnectionError::NotConnected:                return "not-connected";
    }
    return "unknown";
}

const char* toString(SyncError error) {
    switch (error) {
        case SyncError::None:           return "none";
        case SyncError::NotConnected:   return "not-connected";
        case SyncError::SendFailed:     return "send-failed";
        case SyncError::Timeout:        return "timeout";
        case SyncError::Unreachable:    return "unreachable";
        case SyncError::Rejected:       return "rejected";
        case SyncError::EncodingFailed: return "encoding-failed";
    }
    return "unknown";
}

} // namespace lumenlink
