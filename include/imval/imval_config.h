// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file imval_config.h
/// @brief Centralized compile-time configuration for imval and its dependencies
///
/// Settings for:
///   - immer: persistent containers and boxes backing every Value
///   - lager: lens helpers in lenses.h
///   - imval itself: thread-safety switch and verbose logging
///
/// It MUST be included before any immer or lager header. Every imval public
/// header includes it first, so users who only include imval headers don't
/// need to do anything.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(IMVAL_CONFIGURED)
#error "immer headers were included before imval/imval_config.h. " \
       "Please include imval headers before any direct immer includes."
#endif

#define IMVAL_CONFIGURED 1

// ============================================================
// Thread Safety
// ============================================================

/// @brief Keep immer's atomic reference counting available
///
/// SyncValue / SyncImmutableObject rely on immer's thread-safe default
/// memory policy. Define IMVAL_ENABLE_THREAD_SAFE=0 for builds that only
/// ever touch values from one thread; immer then drops atomics and locks
/// everywhere and the Sync* aliases are not declared.
#ifndef IMVAL_ENABLE_THREAD_SAFE
#define IMVAL_ENABLE_THREAD_SAFE 1
#endif

#if !IMVAL_ENABLE_THREAD_SAFE && !defined(IMMER_NO_THREAD_SAFETY)
#define IMMER_NO_THREAD_SAFETY 1
#endif

// ============================================================
// Immer Settings
// ============================================================

/// @brief Disable tagged node assertions (smaller nodes, no tag checks)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

/// @brief Don't throw on invalid state (use assertions instead)
///
/// imval validates its own inputs and throws ImmutableValueError subclasses;
/// immer's internal state checks stay assertions.
#ifndef IMMER_THROW_ON_INVALID_STATE
#define IMMER_THROW_ON_INVALID_STATE 0
#endif

// ============================================================
// Lager Settings
// ============================================================

/// @brief Skip lager's store dependency SFINAE checks
///
/// imval only uses lenses, never stores with dependencies.
#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

// ============================================================
// Verbose Logging
//
// When IMVAL_VERBOSE_LOG is 1:
//   - Value::at() misses are reported on stderr
//   - merge engine validation failures are reported on stderr right
//     before the corresponding exception is thrown
//
// Default: enabled in debug builds, disabled when NDEBUG is defined.
// ============================================================

#ifndef IMVAL_VERBOSE_LOG
#  if defined(NDEBUG)
#    define IMVAL_VERBOSE_LOG 0
#  else
#    define IMVAL_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef IMVAL_CONFIG_VERBOSE
#if IMVAL_ENABLE_THREAD_SAFE
#pragma message("imval: thread-safe memory policy ENABLED")
#else
#pragma message("imval: thread-safe memory policy DISABLED (single-thread build)")
#endif
#if IMVAL_VERBOSE_LOG
#pragma message("imval: verbose logging ENABLED")
#endif
#endif // IMVAL_CONFIG_VERBOSE
