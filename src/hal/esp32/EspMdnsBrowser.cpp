// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EspMdnsBrowser.cpp
 * @brief ESPmDNS service query
 */

#include "EspMdnsBrowser.h"

#ifndef NATIVE_BUILD

#include <Arduino.h>
#include <ESPmDNS.h>

#define LL_LOG_TAG "mDNS"
#include "utils/Log.h"

namespace lumenlink {
namespace hal {
namespace esp32 {

EspMdnsBrowser::EspMdnsBrowser()
    : m_started(false)
{
}

bool EspMdnsBrowser::begin(const char* hostname) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_started) return true;
    if (!MDNS.begin(hostname)) {
        LL_LOGE("mDNS responder failed to start");
        return false;
    }
    m_started = true;
    LL_LOGI("mDNS responder started: %s.local", hostname);
    return true;
}

bool EspMdnsBrowser::splitServiceType(const std::string& serviceType, std::string& service,
                                      std::string& proto) {
    size_t dot = serviceType.find('.');
    if (dot == std::string::npos) return false;

    service = serviceType.substr(0, dot);
    proto = serviceType.substr(dot + 1);
    if (!service.empty() && service[0] == '_') service.erase(0, 1);
    if (!proto.empty() && proto[0] == '_') proto.erase(0, 1);
    if (!proto.empty() && proto[proto.size() - 1] == '.') proto.erase(proto.size() - 1);
    return !service.empty() && !proto.empty();
}

bool EspMdnsBrowser::browse(const std::string& serviceType, uint32_t windowMs,
                            std::vector<ServiceRecord>& out) {
    std::string service;
    std::string proto;
    if (!splitServiceType(serviceType, service, proto)) {
        LL_LOGW("Bad service type: %s", serviceType.c_str());
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_started) {
        LL_LOGW("Browse before begin()");
        return false;
    }

    uint32_t start = millis();
    int count = MDNS.queryService(service.c_str(), proto.c_str());
    LL_LOGD("%s: %d results in %lums (window %lums)", serviceType.c_str(), count,
            (unsigned long)(millis() - start), (unsigned long)windowMs);

    for (int i = 0; i < count; ++i) {
        ServiceRecord record;
        record.instanceName = MDNS.hostname(i).c_str();
        IPAddress ip = MDNS.IP(i);
        if (ip != IPAddress(0, 0, 0, 0)) {
            record.address = ip.toString().c_str();
        }
        record.port = MDNS.port(i);
        out.push_back(record);
    }
    return true;
}

} // namespace esp32
} // namespace hal
} // namespace lumenlink

#endif // NATIVE_BUILD
