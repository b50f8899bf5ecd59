// =====================================================================
//  src/libsvgplate/svgplate/brep_io.h — BREP file read/write utilities
// =====================================================================
//
//  Stores the solid built from a profile set as an OCCT BREP file,
//  and reads one back for inspection.
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef SVGPLATE_BREP_IO_H
#define SVGPLATE_BREP_IO_H

#include "core.h"

#include <TopoDS_Shape.hxx>
#include <QString>

namespace svgplate {
namespace brep_io {

/// Read a BREP file.
/// On failure, returns a null shape and sets errorMsg if non-null.
SVGPLATE_EXPORT TopoDS_Shape readBrep(
    const QString& path,
    QString* errorMsg = nullptr);

/// Write a shape to a BREP file.
/// Returns true on success.  Sets errorMsg on failure.
SVGPLATE_EXPORT bool writeBrep(
    const QString& path,
    const TopoDS_Shape& shape,
    QString* errorMsg = nullptr);

/// Number of solids contained in a shape
SVGPLATE_EXPORT int solidCount(const TopoDS_Shape& shape);

}  // namespace brep_io
}  // namespace svgplate

#endif  // SVGPLATE_BREP_IO_H
