// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file post_body_config.h
/// @brief Centralized configuration for post_body and its dependencies
///
/// This file defines the compile-time configuration for the third-party
/// libraries used by post_body:
///   - immer: immutable boxes holding the producer's body in the lager store
///   - lager: the producer session store
///   - zug: transducers (pulled in by lager)
///   - boost: UTF-8 decoding (Boost.Locale utf traits, header only)
///
/// It also carries the project's own limits (body length, allocation hints)
/// and the verbose logging switch.
///
/// @warning Include this before any immer/lager header. All post_body public
///          headers already do.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(POST_BODY_CONFIGURED)
#error "immer headers were included before post_body/post_body_config.h. " \
       "Please include post_body headers before any direct immer includes."
#endif

#define POST_BODY_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// Producer sessions are single threaded per document.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
#endif

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
// Lager Library Configuration
// ============================================================

/// @brief Disable store dependency SFINAE checks (faster compilation)
#ifndef LAGER_DISABLE_STORE_DEPENDENCY_CHECKS
#define LAGER_DISABLE_STORE_DEPENDENCY_CHECKS 1
#endif

// ============================================================
// Zug Library Configuration
// ============================================================

/// @brief Force zug to use std::variant instead of boost::variant
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Boost Library Configuration
// ============================================================

/// @brief Disable Boost auto-linking (MSVC). Only header-only parts are used.
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// post_body Limits
// ============================================================

/// @brief Maximum length of a post body in Unicode scalars.
///
/// The producer session clips text appends at this length.
#ifndef POST_BODY_MAX_BODY_LENGTH
#define POST_BODY_MAX_BODY_LENGTH 2000
#endif

/// @brief Upper bound for the buffer pre-allocation hint of a text patch.
///
/// A text patch whose estimated output size falls outside [0, hint] is
/// pre-sized to the source length instead. Affects only reserve() calls.
#ifndef POST_BODY_MAX_SIZE_HINT
#define POST_BODY_MAX_SIZE_HINT 2000
#endif

// ============================================================
// Verbose Logging Configuration
//
// When POST_BODY_VERBOSE_LOG is 1, patch failures, clipped appends and
// stale replicas are reported on stderr. Enabled in debug builds.
// ============================================================

#ifndef POST_BODY_VERBOSE_LOG
#  if defined(NDEBUG)
#    define POST_BODY_VERBOSE_LOG 0
#  else
#    define POST_BODY_VERBOSE_LOG 1
#  endif
#endif
