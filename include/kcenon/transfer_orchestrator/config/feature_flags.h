// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for transfer_orchestrator
 *
 * Central entry point for feature detection and ecosystem integration flags.
 *
 * Feature categories:
 * - TRANSFER_ORCH_HAS_*  : Local feature availability (checksum fingerprints)
 * - KCENON_WITH_*        : System integration flags (inherited from common_system)
 *
 * Usage:
 * @code
 * #include <kcenon/transfer_orchestrator/config/feature_flags.h>
 *
 * #if TRANSFER_ORCH_HAS_CHECKSUM
 *     entry.source_etag = compute_md5(path);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define TRANSFER_ORCH_HAS_COMMON_FEATURE_FLAGS 1
#else
#define TRANSFER_ORCH_HAS_COMMON_FEATURE_FLAGS 0
#endif

//==============================================================================
// Transfer Orchestrator Feature Flags
//==============================================================================

/**
 * @brief Content fingerprint support (OpenSSL MD5)
 *
 * When enabled, local_tree_differ fills etags with MD5 digests so that the
 * checksum compare mode can detect same-size modifications. Set via CMake
 * option TRANSFER_ORCH_ENABLE_ENCRYPTION.
 */
#ifndef TRANSFER_ORCH_HAS_CHECKSUM
    #if defined(TRANSFER_ORCH_ENABLE_ENCRYPTION)
        #define TRANSFER_ORCH_HAS_CHECKSUM 1
    #else
        #define TRANSFER_ORCH_HAS_CHECKSUM 0
    #endif
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

// thread_system integration (worker pool for dispatched transfers)
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

// network_system integration (shared basic_thread_pool)
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
 * @brief Unified flag for logger_system usage
 *
 * logger_system requires common_system; both must be present.
 */
#ifndef TRANSFER_ORCH_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define TRANSFER_ORCH_USE_LOGGER_SYSTEM 1
    #else
        #define TRANSFER_ORCH_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef TRANSFER_ORCH_PRINT_FEATURE_SUMMARY

#pragma message("=== Transfer Orchestrator Feature Summary ===")

#if TRANSFER_ORCH_HAS_CHECKSUM
    #pragma message("  Checksum (OpenSSL MD5): Enabled")
#else
    #pragma message("  Checksum (OpenSSL MD5): Disabled")
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

#endif // TRANSFER_ORCH_PRINT_FEATURE_SUMMARY
