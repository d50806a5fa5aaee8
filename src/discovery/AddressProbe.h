// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AddressProbe.h
 * @brief Bounded-timeout identity probe for one candidate address
 *
 * Issues GET http://<address>/json and classifies the outcome. Used by
 * discovery (hundreds of calls per pass) and by the health monitor (one call
 * per device per sweep), so the timeout is capped at 2s.
 *
 * Threading: probe() blocks the calling worker; the probe itself keeps no
 * state and may run on many workers at once.
 */

#pragma once

#include <cstdint>
#include <string>

#include "core/DeviceTypes.h"
#include "core/Errors.h"
#include "hal/interface/IHttpTransport.h"

namespace lumenlink {
namespace discovery {

struct ProbeResult {
    ProbeOutcome outcome = ProbeOutcome::Unreachable;
    std::string address;
    DeviceSnapshot snapshot;        ///< Valid when outcome == Success

    bool succeeded() const { return outcome == ProbeOutcome::Success; }
};

class AddressProbe {
public:
    explicit AddressProbe(hal::IHttpTransport& http);

    /**
     * @brief Fetch and parse the identity document at @p address
     * @param timeoutMs Clamped to the 2s probe cap
     */
    ProbeResult probe(const std::string& address, uint32_t timeoutMs) const;

    /**
     * @brief Map a transport failure onto a probe outcome
     */
    static ProbeOutcome classify(hal::TransportError error);

private:
    hal::IHttpTransport& m_http;
};

} // namespace discovery
} // namespace lumenlink
