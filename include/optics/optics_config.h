// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file optics_config.h
/// @brief Centralized configuration for optics and its dependencies
///
/// This file defines the compile-time configuration for the third-party
/// libraries used by optics:
///   - immer: persistent vectors backing LensPath and ImmerIndexLens
///   - zug: function composition for lager lens chains
///   - lager: lens functors and type-erased lager::lens
///
/// It MUST be included before any library headers to ensure consistent settings.
/// All optics public headers already include this file first.
///
/// @warning Unlike a single-threaded store, optics descriptors (lenses,
///          transforms, paths) are meant to be shared between threads for
///          reading. LensPath copies share immer nodes, so immer keeps its
///          default atomic reference counting here.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(OPTICS_CONFIGURED)
#error "immer headers were included before optics/optics_config.h. " \
       "Please include optics headers before any direct immer includes."
#endif

#define OPTICS_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

#if defined(IMMER_NO_THREAD_SAFETY) && IMMER_NO_THREAD_SAFETY
#error "optics shares LensPath storage across threads; IMMER_NO_THREAD_SAFETY must stay 0"
#endif

/// @brief Disable tagged node assertions
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

/// @brief Disable store dependency SFINAE checks
///
/// The library itself never builds a lager store; this only trims compile
/// time when lager headers are pulled in through lager_adapters.h.
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
// Configuration Summary (compile-time message)
// ============================================================

#ifdef OPTICS_CONFIG_VERBOSE
#pragma message("optics: immer atomic refcounting ENABLED (shareable paths)")

#if IMMER_TAGGED_NODE
#pragma message("optics: Tagged nodes ENABLED (debug mode)")
#else
#pragma message("optics: Tagged nodes DISABLED (optimized)")
#endif

#if ZUG_VARIANT_STD
#pragma message("optics: Using std::variant for zug")
#endif
#endif // OPTICS_CONFIG_VERBOSE
