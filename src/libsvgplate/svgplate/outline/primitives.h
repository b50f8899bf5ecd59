// =====================================================================
//  src/libsvgplate/svgplate/outline/primitives.h — Basic shape outlines
// =====================================================================
//
//  Converts SVG basic shapes (rect, circle, ellipse, polygon,
//  polyline) directly into point sequences.  Closed shapes end with
//  a copy of their first point; polylines are left open.
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef SVGPLATE_OUTLINE_PRIMITIVES_H
#define SVGPLATE_OUTLINE_PRIMITIVES_H

#include "../geometry/types.h"
#include "../core.h"

#include <QString>

namespace svgplate {
namespace outline {

/// Options for basic shape conversion
struct PrimitiveOptions {
    int ellipseSegments = 36;   ///< Samples around a circle or ellipse
};

/// Rectangle corners in order (x,y) (x+w,y) (x+w,y+h) (x,y+h) (x,y).
/// Empty if width or height is not positive.
SVGPLATE_EXPORT geometry::Subpath rectangleOutline(
    double x, double y, double width, double height);

/// Circle sampled at evenly spaced angles plus a closing point.
/// Empty if the radius is not positive.
SVGPLATE_EXPORT geometry::Subpath circleOutline(
    double cx, double cy, double r,
    const PrimitiveOptions& options = {});

/// Axis-aligned ellipse, sampled like circleOutline().
/// Empty if either radius is not positive.
SVGPLATE_EXPORT geometry::Subpath ellipseOutline(
    double cx, double cy, double rx, double ry,
    const PrimitiveOptions& options = {});

/// Polygon from a "points" attribute ("x1,y1 x2,y2 ..."), closed
SVGPLATE_EXPORT geometry::Subpath polygonOutline(const QString& points);

/// Polyline from a "points" attribute, left open
SVGPLATE_EXPORT geometry::Subpath polylineOutline(const QString& points);

}  // namespace outline
}  // namespace svgplate

#endif  // SVGPLATE_OUTLINE_PRIMITIVES_H
