// =====================================================================
//  src/libsvgplate/core.cpp — Library version information
// =====================================================================
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <svgplate/core.h>

// OCCT kernel headers
#include <Standard_Version.hxx>

namespace svgplate {

const char* version()
{
    return "0.1.0";
}

const char* kernelVersion()
{
    return OCC_VERSION_COMPLETE;
}

}  // namespace svgplate
