// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for chunked_upload
 *
 * Central entry point for feature detection and integration flags.
 *
 * Feature categories:
 * - CHUNKED_UPLOAD_HAS_* : Local feature availability (LZ4)
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * @code
 * #include <kcenon/chunked_upload/config/feature_flags.h>
 *
 * #if CHUNKED_UPLOAD_HAS_LZ4
 *     compress_with_lz4(data);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define CHUNKED_UPLOAD_HAS_COMMON_FEATURE_FLAGS 1
#else
#define CHUNKED_UPLOAD_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// Chunked Upload Feature Flags
//==============================================================================

/**
 * @brief LZ4 chunk compression
 *
 * Set via CMake option CHUNKED_UPLOAD_ENABLE_LZ4. Without it every chunk is
 * sent uncompressed.
 */
#ifndef CHUNKED_UPLOAD_HAS_LZ4
    #if defined(CHUNKED_UPLOAD_ENABLE_LZ4)
        #define CHUNKED_UPLOAD_HAS_LZ4 1
    #else
        #define CHUNKED_UPLOAD_HAS_LZ4 0
    #endif
#endif

//==============================================================================
// System Integration Flags
//==============================================================================

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (thread_pool for chunk workers)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (structured logging)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

// network_system integration (HTTP client for the upload endpoint)
#ifndef KCENON_WITH_NETWORK_SYSTEM
    #if defined(BUILD_WITH_NETWORK_SYSTEM)
        #define KCENON_WITH_NETWORK_SYSTEM 1
    #else
        #define KCENON_WITH_NETWORK_SYSTEM 0
    #endif
#endif

/**
 * @brief Unified flag for logger_system usage
 *
 * logger_system depends on common_system, so both must be present.
 */
#ifndef CHUNKED_UPLOAD_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define CHUNKED_UPLOAD_USE_LOGGER_SYSTEM 1
    #else
        #define CHUNKED_UPLOAD_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef CHUNKED_UPLOAD_PRINT_FEATURE_SUMMARY

#pragma message("=== Chunked Upload Feature Summary ===")

#if CHUNKED_UPLOAD_HAS_LZ4
    #pragma message("  LZ4 Compression: Enabled")
#else
    #pragma message("  LZ4 Compression: Disabled")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif

#if KCENON_WITH_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system: Available")
#else
    #pragma message("  network_system: Not Available")
#endif

#pragma message("======================================")

#endif  // CHUNKED_UPLOAD_PRINT_FEATURE_SUMMARY
