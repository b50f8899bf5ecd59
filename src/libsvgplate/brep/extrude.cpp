// =====================================================================
//  src/libsvgplate/brep/extrude.cpp — Profile extrusion
// =====================================================================
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <svgplate/brep/extrude.h>

// OpenCASCADE includes
#include <BRepGProp.hxx>
#include <GProp_GProps.hxx>
#include <Bnd_Box.hxx>
#include <BRepBndLib.hxx>
#include <Standard_Failure.hxx>

// Wire/Face building
#include <BRepBuilderAPI_MakePolygon.hxx>
#include <BRepBuilderAPI_MakeFace.hxx>
#include <TopoDS_Face.hxx>
#include <TopoDS_Wire.hxx>

// 3D operations
#include <BRepPrimAPI_MakePrism.hxx>
#include <gp_Vec.hxx>

// Boolean operations
#include <BRepAlgoAPI_Fuse.hxx>
#include <BRepAlgoAPI_Cut.hxx>

namespace svgplate {
namespace brep {

// =====================================================================
//  Helper Functions
// =====================================================================

namespace {

/// Message carried by an OCCT exception
QString failureMessage(const Standard_Failure& failure)
{
    const char* message = failure.GetMessageString();
    return (message && *message) ? QString::fromUtf8(message)
                                 : QStringLiteral("unknown OCCT failure");
}

/// Convert 2D outline point to 3D point (on XY plane at Z=0)
gp_Pnt toPoint3D(const QPointF& p2d, double z = 0.0)
{
    return gp_Pnt(p2d.x(), p2d.y(), z);
}

/// Build a closed wire through the polygon's points
TopoDS_Wire buildPolygonWire(const geometry::Subpath& polygon)
{
    BRepBuilderAPI_MakePolygon polygonBuilder;
    for (const QPointF& p : polygon) {
        polygonBuilder.Add(toPoint3D(p));
    }
    polygonBuilder.Close();

    if (polygonBuilder.IsDone()) {
        return polygonBuilder.Wire();
    }

    return TopoDS_Wire();
}

/// Build a face from a wire
TopoDS_Face buildFaceFromWire(const TopoDS_Wire& wire)
{
    if (wire.IsNull()) return TopoDS_Face();

    BRepBuilderAPI_MakeFace faceBuilder(wire, Standard_True);  // planar = true
    if (faceBuilder.IsDone()) {
        return faceBuilder.Face();
    }

    return TopoDS_Face();
}

}  // anonymous namespace

// =====================================================================
//  Extrusion
// =====================================================================

OperationResult extrudePolygon(
    const geometry::Subpath& polygon,
    double depth)
{
    OperationResult result;

    if (polygon.size() < 3) {
        result.errorMessage = QStringLiteral("Polygon needs at least 3 points");
        return result;
    }

    if (depth <= 0.0) {
        result.errorMessage = QStringLiteral("Extrusion depth must be positive");
        return result;
    }

    try {
        TopoDS_Wire wire = buildPolygonWire(polygon);
        if (wire.IsNull()) {
            result.errorMessage = QStringLiteral("Failed to build wire from polygon");
            return result;
        }

        TopoDS_Face face = buildFaceFromWire(wire);
        if (face.IsNull()) {
            result.errorMessage = QStringLiteral("Failed to build face from wire");
            return result;
        }

        BRepPrimAPI_MakePrism prism(face, gp_Vec(0.0, 0.0, depth), Standard_True);  // copy = true
        if (prism.IsDone()) {
            result.shape = prism.Shape();
            result.success = true;
        } else {
            result.errorMessage = QStringLiteral("Extrusion operation failed");
        }
    } catch (const Standard_Failure& failure) {
        result.errorMessage = QStringLiteral("Exception during extrusion: ") +
                              failureMessage(failure);
    }

    return result;
}

OperationResult composeProfiles(const outline::ProfileSet& profiles)
{
    OperationResult result;

    if (profiles.isEmpty()) {
        result.errorMessage = QStringLiteral("No profiles to extrude");
        return result;
    }

    if (profiles.depth <= 0.0) {
        result.errorMessage = QStringLiteral("Extrusion depth must be positive");
        return result;
    }

    bool haveSolid = false;

    for (int i = 0; i < profiles.profiles.size(); ++i) {
        const outline::NestedSubpath& profile = profiles.profiles[i];

        if (profile.role == outline::ProfileRole::Hole && !haveSolid) {
            continue;
        }

        OperationResult solid = extrudePolygon(profile.points, profiles.depth);
        if (!solid.success) {
            ++result.skippedProfiles;
            result.warnings.append(QString("Profile %1 skipped: %2")
                                       .arg(i).arg(solid.errorMessage));
            continue;
        }

        if (!haveSolid) {
            result.shape = solid.shape;
            haveSolid = true;
            continue;
        }

        OperationResult composed = (profile.role == outline::ProfileRole::Fill)
            ? fuseShapes(result.shape, solid.shape)
            : cutShape(result.shape, solid.shape);
        if (!composed.success) {
            result.errorMessage = QString("Profile %1: %2").arg(i).arg(composed.errorMessage);
            return result;
        }
        result.shape = composed.shape;
    }

    if (!haveSolid) {
        result.errorMessage = QStringLiteral("No fill profile could be extruded");
        return result;
    }

    result.success = true;
    return result;
}

// =====================================================================
//  Boolean Operations
// =====================================================================

OperationResult fuseShapes(
    const TopoDS_Shape& shape1,
    const TopoDS_Shape& shape2)
{
    OperationResult result;

    if (shape1.IsNull() || shape2.IsNull()) {
        result.errorMessage = QStringLiteral("One or both shapes are null");
        return result;
    }

    try {
        BRepAlgoAPI_Fuse fuse(shape1, shape2);
        if (fuse.IsDone()) {
            result.shape = fuse.Shape();
            result.success = true;
        } else {
            result.errorMessage = QStringLiteral("Fuse operation failed");
        }
    } catch (const Standard_Failure& failure) {
        result.errorMessage = QStringLiteral("Exception during fuse operation: ") +
                              failureMessage(failure);
    }

    return result;
}

OperationResult cutShape(
    const TopoDS_Shape& shape,
    const TopoDS_Shape& tool)
{
    OperationResult result;

    if (shape.IsNull() || tool.IsNull()) {
        result.errorMessage = QStringLiteral("One or both shapes are null");
        return result;
    }

    try {
        BRepAlgoAPI_Cut cut(shape, tool);
        if (cut.IsDone()) {
            result.shape = cut.Shape();
            result.success = true;
        } else {
            result.errorMessage = QStringLiteral("Cut operation failed");
        }
    } catch (const Standard_Failure& failure) {
        result.errorMessage = QStringLiteral("Exception during cut operation: ") +
                              failureMessage(failure);
    }

    return result;
}

// =====================================================================
//  Shape Queries
// =====================================================================

double shapeVolume(const TopoDS_Shape& shape)
{
    if (shape.IsNull()) return 0.0;

    GProp_GProps props;
    BRepGProp::VolumeProperties(shape, props);
    return props.Mass();
}

bool shapeBounds(
    const TopoDS_Shape& shape,
    gp_Pnt& minPt,
    gp_Pnt& maxPt)
{
    if (shape.IsNull()) return false;

    Bnd_Box box;
    BRepBndLib::Add(shape, box);

    if (box.IsVoid()) return false;

    double xmin, ymin, zmin, xmax, ymax, zmax;
    box.Get(xmin, ymin, zmin, xmax, ymax, zmax);

    minPt = gp_Pnt(xmin, ymin, zmin);
    maxPt = gp_Pnt(xmax, ymax, zmax);
    return true;
}

}  // namespace brep
}  // namespace svgplate
