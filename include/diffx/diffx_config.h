// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diffx_config.h
/// @brief Centralized compile-time configuration for diffx and its dependencies
///
/// Third-party libraries configured here:
///   - immer: persistent containers backing Value
///   - boost: property_tree (INI and XML adapters)
///
/// It MUST be included before any library headers. Every public diffx
/// header includes it first, so users of diffx headers don't need to do
/// anything special.

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(DIFFX_CONFIGURED)
#error "immer headers were included before diffx/diffx_config.h. " \
       "Please include diffx headers before any direct immer includes."
#endif

#define DIFFX_CONFIGURED 1

// ============================================================
// Immer Settings
//
// Thread safety is left at immer's default so that SyncValue really is
// thread-safe. Value opts out per type through unsafe_memory_policy.
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

// ============================================================
// Boost Settings
// ============================================================

/// @brief Disable Boost auto-linking (MSVC). property_tree is header-only.
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

/// @brief property_tree still pulls in boost/bind.hpp; keep placeholders out
/// of the global namespace and silence the deprecation pragma.
#ifndef BOOST_BIND_GLOBAL_PLACEHOLDERS
#define BOOST_BIND_GLOBAL_PLACEHOLDERS 1
#endif

// ============================================================
// Verbose Logging
//
// When DIFFX_VERBOSE_LOG is 1, value accesses, rejected options and
// adapter failures are reported on stderr (see detail::log_* in value.h).
//
// Default: enabled in debug builds, disabled when NDEBUG is defined.
// ============================================================

#ifndef DIFFX_VERBOSE_LOG
#  if defined(NDEBUG)
#    define DIFFX_VERBOSE_LOG 0
#  else
#    define DIFFX_VERBOSE_LOG 1
#  endif
#endif

#ifdef DIFFX_CONFIG_VERBOSE
#if IMMER_TAGGED_NODE
#pragma message("diffx: immer tagged nodes ENABLED (debug mode)")
#else
#pragma message("diffx: immer tagged nodes DISABLED (optimized)")
#endif
#if DIFFX_VERBOSE_LOG
#pragma message("diffx: verbose logging ENABLED")
#endif
#endif // DIFFX_CONFIG_VERBOSE
