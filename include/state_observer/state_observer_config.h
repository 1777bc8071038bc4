// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file state_observer_config.h
/// @brief Centralized compile-time configuration for state_observer and its dependencies
///
/// Settings for the third-party libraries used by state_observer:
///   - immer: Immutable containers backing the observed Value
///   - lager / zug: Lenses used by the JSON Pointer API
///
/// It MUST be included before any library headers to ensure consistent settings.
/// All state_observer public headers include it first, so users who only include
/// state_observer headers don't need to do anything special.
///
/// Unlike a purely single-threaded build, immer thread safety is left ON by default:
/// independent observers may run on different threads, and immer's lock-free
/// free list is process-wide. Define STATE_OBSERVER_SINGLE_THREADED to 1 to trade
/// that away for non-atomic reference counting.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(STATE_OBSERVER_CONFIGURED)
#error "immer headers were included before state_observer/state_observer_config.h. " \
       "Please include state_observer headers before any direct immer includes."
#endif

#define STATE_OBSERVER_CONFIGURED 1

// ============================================================
// Threading
// ============================================================

#ifndef STATE_OBSERVER_SINGLE_THREADED
#define STATE_OBSERVER_SINGLE_THREADED 0
#endif

#if STATE_OBSERVER_SINGLE_THREADED && !defined(IMMER_NO_THREAD_SAFETY)
#define IMMER_NO_THREAD_SAFETY 1
#endif

// ============================================================
// Immer Settings
// ============================================================

/// @brief Disable tagged node assertions (smaller nodes, no assertion overhead)
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

// ============================================================
// Lager / Zug Settings
// ============================================================

/// @brief Disable store dependency SFINAE checks (only lenses are used)
#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

/// @brief Force zug to use std::variant instead of boost::variant
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Verbose Logging
//
// When STATE_OBSERVER_VERBOSE_LOG is 1:
//   - Value accessors log missing keys / out-of-range indices to stderr
//   - StateObserver logs dropped (unprojectable) values and cut cycles
//
// Disabled by default in release builds, enabled in debug builds.
// ============================================================

#ifndef STATE_OBSERVER_VERBOSE_LOG
#  if defined(NDEBUG)
#    define STATE_OBSERVER_VERBOSE_LOG 0
#  else
#    define STATE_OBSERVER_VERBOSE_LOG 1
#  endif
#endif

#ifdef STATE_OBSERVER_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("state_observer: immer thread safety DISABLED")
#else
#pragma message("state_observer: immer thread safety ENABLED")
#endif
#if STATE_OBSERVER_VERBOSE_LOG
#pragma message("state_observer: verbose diagnostics ENABLED")
#endif
#endif // STATE_OBSERVER_CONFIG_VERBOSE
