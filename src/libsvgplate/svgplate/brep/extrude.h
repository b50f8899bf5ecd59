// =====================================================================
//  src/libsvgplate/svgplate/brep/extrude.h — Profile extrusion
// =====================================================================
//
//  Turns role-tagged profiles into an OCCT solid: every polygon is
//  extruded along +Z from the XY plane, fills are fused and holes
//  are cut.
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef SVGPLATE_BREP_EXTRUDE_H
#define SVGPLATE_BREP_EXTRUDE_H

#include "../core.h"
#include "../geometry/types.h"
#include "../outline/decoration.h"

#include <TopoDS_Shape.hxx>
#include <gp_Pnt.hxx>

#include <QString>
#include <QStringList>

namespace svgplate {
namespace brep {

// =====================================================================
//  Operation Results
// =====================================================================

/// Result of a BREP operation
struct OperationResult {
    bool success = false;
    TopoDS_Shape shape;
    QString errorMessage;
    int skippedProfiles = 0;    ///< Profiles that could not be extruded
    QStringList warnings;       ///< One entry per skipped profile
};

// =====================================================================
//  Extrusion
// =====================================================================

/// Extrude a closed polygon (closure implied) from Z=0 to Z=depth
/// @param polygon At least 3 points in the XY plane
/// @param depth Extrusion distance, must be positive
SVGPLATE_EXPORT OperationResult extrudePolygon(
    const geometry::Subpath& polygon,
    double depth);

/// Extrude and compose a profile set.
/// Profiles are processed in order: fills are fused into the result,
/// holes are cut from it.  Since parents precede children, an island
/// inside a hole survives.  Holes met before any fill are skipped.
/// A profile that cannot be extruded (e.g. collinear points) is
/// skipped and counted; the rest of the set is still built.
SVGPLATE_EXPORT OperationResult composeProfiles(
    const outline::ProfileSet& profiles);

/// Fuse (union) two shapes
SVGPLATE_EXPORT OperationResult fuseShapes(
    const TopoDS_Shape& shape1,
    const TopoDS_Shape& shape2);

/// Cut (difference) one shape from another
SVGPLATE_EXPORT OperationResult cutShape(
    const TopoDS_Shape& shape,
    const TopoDS_Shape& tool);

// =====================================================================
//  Shape Queries
// =====================================================================

/// Calculate volume of a solid shape
/// @return Volume in cubic mm (0 if not a solid)
SVGPLATE_EXPORT double shapeVolume(const TopoDS_Shape& shape);

/// Get bounding box of a shape
/// @param shape The shape
/// @param minPt Output: minimum corner
/// @param maxPt Output: maximum corner
/// @return True if bounding box is valid
SVGPLATE_EXPORT bool shapeBounds(
    const TopoDS_Shape& shape,
    gp_Pnt& minPt,
    gp_Pnt& maxPt);

}  // namespace brep
}  // namespace svgplate

#endif  // SVGPLATE_BREP_EXTRUDE_H
