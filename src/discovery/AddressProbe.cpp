// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AddressProbe.cpp
 * @brief Identity probe implementation
 */

#define LL_LOG_TAG "Probe"
#include "utils/Log.h"

#include "AddressProbe.h"

#include "codec/WledJsonCodec.h"
#include "config/network_config.h"
#include "net/DeviceEndpoint.h"

namespace lumenlink {
namespace discovery {

using namespace config;

AddressProbe::AddressProbe(hal::IHttpTransport& http)
    : m_http(http)
{
}

ProbeOutcome AddressProbe::classify(hal::TransportError error) {
    switch (error) {
        case hal::TransportError::None:
            return ProbeOutcome::Success;
        case hal::TransportError::Timeout:
            return ProbeOutcome::Timeout;
        case hal::TransportError::Unreachable:
        case hal::TransportError::InvalidUrl:
            return ProbeOutcome::Unreachable;
        case hal::TransportError::ConnectionLost:
        case hal::TransportError::Other:
            // Something accepted the connection and then misbehaved
            return ProbeOutcome::ProtocolMismatch;
    }
    return ProbeOutcome::Unreachable;
}

ProbeResult AddressProbe::probe(const std::string& address, uint32_t timeoutMs) const {
    ProbeResult result;
    result.address = address;

    hal::HttpRequest request;
    request.method = hal::HttpMethod::Get;
    if (!net::buildHttpUrl(address, Protocol::JSON_PATH, request.url)) {
        LL_LOGD("Invalid address '%s'", address.c_str());
        result.outcome = ProbeOutcome::Unreachable;
        return result;
    }

    if (timeoutMs == 0 || timeoutMs > DiscoveryDefaults::PROBE_TIMEOUT_CAP_MS) {
        timeoutMs = DiscoveryDefaults::PROBE_TIMEOUT_CAP_MS;
    }
    request.timeoutMs = timeoutMs;

    hal::HttpResponse response = m_http.perform(request);
    if (response.error != hal::TransportError::None) {
        result.outcome = classify(response.error);
        LL_LOGD("%s -> %s", address.c_str(), toString(result.outcome));
        return result;
    }

    if (!response.ok()) {
        LL_LOGD("%s -> HTTP %d", address.c_str(), response.statusCode);
        result.outcome = ProbeOutcome::ProtocolMismatch;
        return result;
    }

    codec::DeviceDecodeResult decoded = codec::WledJsonCodec::decodeDocument(response.body);
    if (!decoded.success || !decoded.snapshot.hasInfo || decoded.snapshot.info.mac.empty()) {
        LL_LOGD("%s -> not a device (%s)", address.c_str(),
                decoded.success ? "no identifier" : decoded.errorMsg);
        result.outcome = ProbeOutcome::ProtocolMismatch;
        return result;
    }

    result.outcome = ProbeOutcome::Success;
    result.snapshot = decoded.snapshot;
    return result;
}

} // namespace discovery
} // namespace lumenlink
