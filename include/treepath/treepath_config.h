// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file treepath_config.h
/// @brief Compile-time configuration for treepath and the immer library.
///
/// treepath keeps every tree in immer persistent containers. The settings
/// below MUST be visible before any immer header is parsed, so every public
/// treepath header includes this file first.
///
/// treepath is single-threaded by design: one Diff or PathMatcher may be
/// reused across calls, but a Value tree is never shared across threads
/// while it is being rebound by Path::set().
///
/// @warning Do NOT include immer headers directly without including this file first.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(TREEPATH_CONFIGURED)
#error "immer headers were included before treepath/treepath_config.h. " \
       "Please include treepath headers before any direct immer includes."
#endif

#define TREEPATH_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Non-atomic reference counting, no free-list locks
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
#endif

/// @brief No type tags in nodes
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_STATS
#define IMMER_DEBUG_STATS 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

#ifndef IMMER_ENABLE_DEBUG_SIZE_HEAP
#define IMMER_ENABLE_DEBUG_SIZE_HEAP 0
#endif

/// @brief Don't throw on invalid state (use assertions instead)
#ifndef IMMER_THROW_ON_INVALID_STATE
#define IMMER_THROW_ON_INVALID_STATE 0
#endif

// ============================================================
// Diagnostics
// ============================================================

/// @brief Verbose stderr diagnostics for rejected Value accessors
///
/// Enabled by default in debug builds, disabled with NDEBUG.
///   #define TREEPATH_VERBOSE_LOG 0   // force off
///   #define TREEPATH_VERBOSE_LOG 1   // force on
#ifndef TREEPATH_VERBOSE_LOG
#  if defined(NDEBUG)
#    define TREEPATH_VERBOSE_LOG 0
#  else
#    define TREEPATH_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef TREEPATH_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("treepath: Thread safety DISABLED (optimized for single-thread)")
#else
#pragma message("treepath: Thread safety ENABLED")
#endif

#if TREEPATH_VERBOSE_LOG
#pragma message("treepath: Verbose access logging ENABLED")
#endif
#endif // TREEPATH_CONFIG_VERBOSE
