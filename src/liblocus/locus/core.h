// =====================================================================
//  src/liblocus/locus/core.h — Library initialization and export macros
// =====================================================================
//
//  Part of liblocus.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef LOCUS_CORE_H
#define LOCUS_CORE_H

// ---- Export macro ----------------------------------------------------
//
// When building liblocus as a shared library, LOCUS_SHARED and
// LOCUS_BUILDING are defined.  Consumers linking against the shared
// library only see LOCUS_SHARED (set as a PUBLIC compile definition).

#if defined(LOCUS_SHARED)
  #if defined(LOCUS_BUILDING)
    #if defined(_WIN32)
      #define LOCUS_EXPORT __declspec(dllexport)
    #else
      #define LOCUS_EXPORT __attribute__((visibility("default")))
    #endif
  #else
    #if defined(_WIN32)
      #define LOCUS_EXPORT __declspec(dllimport)
    #else
      #define LOCUS_EXPORT
    #endif
  #endif
#else
  #define LOCUS_EXPORT
#endif

namespace locus {

/// Library version string (e.g., "0.1.0").
LOCUS_EXPORT const char* version();

/// Initialize library-wide state.
/// Installs the default logging rules for the "locus.geometry"
/// category (debug output off) unless the application has already
/// provided rules through QT_LOGGING_RULES.
/// Returns true on success.
LOCUS_EXPORT bool initialize();

/// Shut down the library and release resources.
/// Call once at application exit.
LOCUS_EXPORT void shutdown();

}  // namespace locus

#endif  // LOCUS_CORE_H
