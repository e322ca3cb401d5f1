// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Unified feature flags header for cymo
 *
 * Central entry point for integration flags. Include this header to get the
 * KCENON_WITH_* macros and the CYMO_USE_LOGGER_SYSTEM helper.
 *
 * Usage:
 * @code
 * #include <cymo/config/feature_flags.h>
 *
 * #if KCENON_WITH_THREAD_SYSTEM
 *     pool = thread_system_worker_pool::create_default(shards);
 * #endif
 * @endcode
 */

#pragma once

//==============================================================================
// Include common_system feature flags if available
//==============================================================================

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#define CYMO_HAS_COMMON_FEATURE_FLAGS 1
#else
#define CYMO_HAS_COMMON_FEATURE_FLAGS 0
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

// thread_system integration (worker pool)
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// logger_system integration (log backend)
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Logger System Integration Helper
//==============================================================================

/**
 * @brief Whether log output is routed to logger_system
 *
 * logger_system needs common_system for its result types, so both flags
 * must be on.
 */
#ifndef CYMO_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define CYMO_USE_LOGGER_SYSTEM 1
    #else
        #define CYMO_USE_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Feature Summary (for debugging)
//==============================================================================

#ifdef CYMO_PRINT_FEATURE_SUMMARY

#pragma message("=== cymo Feature Summary ===")

#if KCENON_WITH_THREAD_SYSTEM
    #pragma message("  thread_system: Available")
#else
    #pragma message("  thread_system: Not Available (std::async worker pool)")
#endif

#if CYMO_USE_LOGGER_SYSTEM
    #pragma message("  logger_system: Available")
#else
    #pragma message("  logger_system: Not Available (stderr logger)")
#endif

#pragma message("============================")

#endif // CYMO_PRINT_FEATURE_SUMMARY
