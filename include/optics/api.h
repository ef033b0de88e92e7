// api.h - Shared library export/import macros for optics

#pragma once

/// @file api.h
/// @brief Cross-platform export/import macros for the optics library.
///
/// Usage:
/// - When building optics as a SHARED library:
///   - CMake defines OPTICS_EXPORTS (private) and OPTICS_SHARED (public)
///   - Functions/classes marked with OPTICS_API are exported
///
/// - When using optics as a SHARED library:
///   - Link against the optics target (CMake propagates OPTICS_SHARED)
///   - Functions/classes marked with OPTICS_API are imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, OPTICS_API expands to nothing
///
/// Most of optics is header-only templates; only the non-template parts
/// (LensPath, IndexOutOfRange, trace formatting) carry OPTICS_API.

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef OPTICS_SHARED
        #ifdef OPTICS_EXPORTS
            #define OPTICS_API __declspec(dllexport)
        #else
            #define OPTICS_API __declspec(dllimport)
        #endif
    #else
        #define OPTICS_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(OPTICS_SHARED) && defined(OPTICS_EXPORTS)
        #define OPTICS_API __attribute__((visibility("default")))
    #else
        #define OPTICS_API
    #endif
#else
    #define OPTICS_API
#endif
