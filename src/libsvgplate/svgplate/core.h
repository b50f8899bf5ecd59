// =====================================================================
//  src/libsvgplate/svgplate/core.h — Version information and export macros
// =====================================================================
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef SVGPLATE_CORE_H
#define SVGPLATE_CORE_H

// ---- Export macro ----------------------------------------------------
//
// When building libsvgplate as a shared library, SVGPLATE_SHARED and
// SVGPLATE_BUILDING are defined.  Consumers linking against the shared
// library only see SVGPLATE_SHARED (set as a PUBLIC compile definition).

#if defined(SVGPLATE_SHARED)
  #if defined(SVGPLATE_BUILDING)
    #if defined(_WIN32)
      #define SVGPLATE_EXPORT __declspec(dllexport)
    #else
      #define SVGPLATE_EXPORT __attribute__((visibility("default")))
    #endif
  #else
    #if defined(_WIN32)
      #define SVGPLATE_EXPORT __declspec(dllimport)
    #else
      #define SVGPLATE_EXPORT
    #endif
  #endif
#else
  #define SVGPLATE_EXPORT
#endif

namespace svgplate {

/// Library version string (e.g., "0.1.0").
SVGPLATE_EXPORT const char* version();

/// Version string of the OCCT kernel the library was built against.
SVGPLATE_EXPORT const char* kernelVersion();

}  // namespace svgplate

#endif  // SVGPLATE_CORE_H
