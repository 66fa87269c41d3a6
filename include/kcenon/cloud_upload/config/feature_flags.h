// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for cloud_upload
 *
 * Central entry point for feature detection. Provides the CLOUD_UPLOAD_HAS_*
 * and KCENON_WITH_* macros consumed by the rest of the library.
 *
 * Feature categories:
 * - CLOUD_UPLOAD_HAS_*  : Local feature availability (OpenSSL signing)
 * - KCENON_WITH_*       : System integration flags (inherited from common_system)
 *
 * @code
 * #include <kcenon/cloud_upload/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     auto pool = thread_system_upload_adapter::start(16, "cloud_upload_pool");
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define CLOUD_UPLOAD_HAS_COMMON_FEATURE_FLAGS 1
#else
#define CLOUD_UPLOAD_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// cloud_upload Feature Flags
//==============================================================================

/**
 * @brief OpenSSL support
 *
 * Required for service-account token signing (RS256) and MD5 object
 * validation. Set via the CMake option CLOUD_UPLOAD_ENABLE_OPENSSL.
 */
#ifndef CLOUD_UPLOAD_HAS_OPENSSL
    #if defined(CLOUD_UPLOAD_ENABLE_OPENSSL)
        #define CLOUD_UPLOAD_HAS_OPENSSL 1
    #else
        #define CLOUD_UPLOAD_HAS_OPENSSL 0
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

// thread_system integration (worker pool backing the upload workers)
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

// network_system integration (HTTPS client for the storage API)
#ifndef KCENON_WITH_NETWORK_SYSTEM
    #if defined(BUILD_WITH_NETWORK_SYSTEM)
        #define KCENON_WITH_NETWORK_SYSTEM 1
    #else
        #define KCENON_WITH_NETWORK_SYSTEM 0
    #endif
#endif

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Whether upload_logger forwards to logger_system
 *
 * logger_system depends on common_system, so both must be present.
 */
#ifndef CLOUD_UPLOAD_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define CLOUD_UPLOAD_USE_LOGGER_SYSTEM 1
    #else
        #define CLOUD_UPLOAD_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef CLOUD_UPLOAD_PRINT_FEATURE_SUMMARY

#pragma message("=== cloud_upload Feature Summary ===")

#if CLOUD_UPLOAD_HAS_OPENSSL
    #pragma message("  OpenSSL: Enabled")
#else
    #pragma message("  OpenSSL: Disabled")
#endif

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available")
#endif

#if CLOUD_UPLOAD_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available")
#endif

#if KCENON_WITH_NETWORK_SYSTEM
    #pragma message("  network_system: Available")
#else
    #pragma message("  network_system: Not Available")
#endif

#pragma message("====================================")

#endif // CLOUD_UPLOAD_PRINT_FEATURE_SUMMARY
