// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Log.h
 * @brief Unified logging for LumenLink
 *
 * Consistent, colored log lines with timestamps and component tags.
 *
 * Usage:
 *   #define LL_LOG_TAG "Discovery"
 *   #include "utils/Log.h"
 *
 *   LL_LOGI("Found %u devices", count);
 *   LL_LOGW("Probe timeout: %s", address.c_str());
 *
 * Output format:
 *   [12345][INFO][Discovery] Found 3 devices
 *   [12346][WARN][Pool] Send failed for AA:BB:CC:DD:EE:FF
 */

#pragma once

#include <cstdio>

// ============================================================================
// ANSI Color Constants
// ============================================================================

#define LL_ANSI_RESET      "\033[0m"

#define LL_CLR_GREEN       "\033[1;32m"
#define LL_CLR_RED         "\033[1;31m"
#define LL_CLR_MAGENTA     "\033[1;35m"
#define LL_CLR_GRAY        "\033[0;37m"

#define LL_CLR_ERROR       LL_CLR_RED
#define LL_CLR_WARN        LL_CLR_MAGENTA
#define LL_CLR_INFO        LL_CLR_GREEN
#define LL_CLR_DEBUG       LL_CLR_GRAY

// ============================================================================
// Log Level Configuration
// ============================================================================
// Set via build flags:
//   -D LL_LOG_LEVEL=3   (0=None, 1=Error, 2=Warn, 3=Info, 4=Debug)

#ifndef LL_LOG_LEVEL
    #ifdef NDEBUG
        #define LL_LOG_LEVEL 2   // Release: Warn and above
    #else
        #define LL_LOG_LEVEL 3   // Debug: Info and above
    #endif
#endif

#define LL_LOG_LEVEL_NONE  0
#define LL_LOG_LEVEL_ERROR 1
#define LL_LOG_LEVEL_WARN  2
#define LL_LOG_LEVEL_INFO  3
#define LL_LOG_LEVEL_DEBUG 4

// ============================================================================
// Platform Detection
// ============================================================================

#ifdef ARDUINO
    #include <Arduino.h>
    #define LL_LOG_MILLIS()    millis()
    #define LL_LOG_PRINTF(...) Serial.printf(__VA_ARGS__)
#else
    // Native build support (unit tests)
    #include <cstdint>
    #include <chrono>
    static inline uint32_t _ll_native_millis() {
        using namespace std::chrono;
        static const steady_clock::time_point start = steady_clock::now();
        return static_cast<uint32_t>(
            duration_cast<milliseconds>(steady_clock::now() - start).count());
    }
    #define LL_LOG_MILLIS()    _ll_native_millis()
    #define LL_LOG_PRINTF(...) printf(__VA_ARGS__)
#endif

// ============================================================================
// Core Logging Macros
// ============================================================================
// Format: [timestamp][LEVEL][TAG] message

#ifndef LL_LOG_TAG
    #define LL_LOG_TAG "LL"
#endif

#define LL_LOG_FORMAT(level_str, level_color, fmt) \
    "[%lu]" level_color "[" level_str "]" LL_ANSI_RESET "[" LL_LOG_TAG "] " fmt "\n"

#if LL_LOG_LEVEL >= LL_LOG_LEVEL_ERROR
    #define LL_LOGE(fmt, ...) \
        LL_LOG_PRINTF(LL_LOG_FORMAT("ERROR", LL_CLR_ERROR, fmt), \
                      (unsigned long)LL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define LL_LOGE(fmt, ...) ((void)0)
#endif

#if LL_LOG_LEVEL >= LL_LOG_LEVEL_WARN
    #define LL_LOGW(fmt, ...) \
        LL_LOG_PRINTF(LL_LOG_FORMAT("WARN", LL_CLR_WARN, fmt), \
                      (unsigned long)LL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define LL_LOGW(fmt, ...) ((void)0)
#endif

#if LL_LOG_LEVEL >= LL_LOG_LEVEL_INFO
    #define LL_LOGI(fmt, ...) \
        LL_LOG_PRINTF(LL_LOG_FORMAT("INFO", LL_CLR_INFO, fmt), \
                      (unsigned long)LL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define LL_LOGI(fmt, ...) ((void)0)
#endif

#if LL_LOG_LEVEL >= LL_LOG_LEVEL_DEBUG
    #define LL_LOGD(fmt, ...) \
        LL_LOG_PRINTF(LL_LOG_FORMAT("DEBUG", LL_CLR_DEBUG, fmt), \
                      (unsigned long)LL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define LL_LOGD(fmt, ...) ((void)0)
#endif
