// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for chunked_upload_system
 *
 * Central entry point for feature detection and integration flags.
 *
 * Feature categories:
 * - CHUNKED_UPLOAD_HAS_*  : Local feature availability
 * - KCENON_WITH_*         : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <chunked_upload/config/feature_flags.h>
 *
 * #if KCENON_WITH_NETWORK_SYSTEM
 *     auto response = client->post(url, body, headers);
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
// System Integration Flags
//==============================================================================

// common_system integration
#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// thread_system integration (thread_pool for chunk tasks)
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

// network_system integration (HTTP chunk transport)
#ifndef KCENON_WITH_NETWORK_SYSTEM
    #if defined(BUILD_WITH_NETWORK_SYSTEM)
        #define KCENON_WITH_NETWORK_SYSTEM 1
    #else
        #define KCENON_WITH_NETWORK_SYSTEM 0
    #endif
#endif

//==============================================================================
// Upload Feature Flags
//==============================================================================

/**
 * @brief HTTP chunk transport availability
 *
 * The HTTP transport is functional only when network_system is linked.
 * Without it, http_chunk_transport reports error_code::not_available.
 */
#ifndef CHUNKED_UPLOAD_HAS_HTTP_TRANSPORT
    #if KCENON_WITH_NETWORK_SYSTEM
        #define CHUNKED_UPLOAD_HAS_HTTP_TRANSPORT 1
    #else
        #define CHUNKED_UPLOAD_HAS_HTTP_TRANSPORT 0
    #endif
#endif

/**
 * @brief Unified flag for logger_system usage
 *
 * logger_system requires common_system for its result types.
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

#pragma message("=== Chunked Upload System Feature Summary ===")

#if CHUNKED_UPLOAD_HAS_HTTP_TRANSPORT
    #pragma message("  HTTP transport: Enabled")
#else
    #pragma message("  HTTP transport: Disabled")
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

#pragma message("=============================================")

#endif // CHUNKED_UPLOAD_PRINT_FEATURE_SUMMARY
