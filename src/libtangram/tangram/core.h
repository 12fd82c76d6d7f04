// =====================================================================
//  src/libtangram/tangram/core.h — Library initialization and export macros
// =====================================================================
//
//  Part of libtangram.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TANGRAM_CORE_H
#define TANGRAM_CORE_H

// ---- Export macro ----------------------------------------------------
//
// When building libtangram as a shared library, TANGRAM_SHARED and
// TANGRAM_BUILDING are defined.  Consumers linking against the shared
// library only see TANGRAM_SHARED (set as a PUBLIC compile definition).

#if defined(TANGRAM_SHARED)
  #if defined(TANGRAM_BUILDING)
    #if defined(_WIN32)
      #define TANGRAM_EXPORT __declspec(dllexport)
    #else
      #define TANGRAM_EXPORT __attribute__((visibility("default")))
    #endif
  #else
    #if defined(_WIN32)
      #define TANGRAM_EXPORT __declspec(dllimport)
    #else
      #define TANGRAM_EXPORT
    #endif
  #endif
#else
  #define TANGRAM_EXPORT
#endif

namespace tangram {

/// Library version string (e.g., "1.0.0").
TANGRAM_EXPORT const char* version();

/// Initialize library-wide state.
/// Call once at application startup before using other functions.
/// Returns true on success.
TANGRAM_EXPORT bool initialize();

/// Shut down the library and release resources.
/// Call once at application exit.
TANGRAM_EXPORT void shutdown();

}  // namespace tangram

#endif  // TANGRAM_CORE_H
