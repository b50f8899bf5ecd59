// =====================================================================
//  src/libsvgplate/svgplate/geometry/types.h — Basic geometry types
// =====================================================================
//
//  Fundamental geometric types used throughout libsvgplate.
//  These are lightweight value types built on Qt's point and vector
//  classes.
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef SVGPLATE_GEOMETRY_TYPES_H
#define SVGPLATE_GEOMETRY_TYPES_H

#include "../core.h"

#include <QPointF>
#include <QVector>
#include <QtMath>

namespace svgplate {
namespace geometry {

// =====================================================================
//  Constants
// =====================================================================

/// Tolerance for degenerate-input checks in curve math
constexpr double DEFAULT_TOLERANCE = 1e-10;

/// Distance below which two outline points are the same point
/// (in target units, i.e. mm after normalization)
constexpr double POINT_TOLERANCE = 0.001;

// =====================================================================
//  Outlines
// =====================================================================

/// One continuous pen stroke, points in reading order along the outline
using Subpath = QVector<QPointF>;

// =====================================================================
//  Bounding Box
// =====================================================================

/// Axis-aligned bounding box with utility methods
struct SVGPLATE_EXPORT BoundingBox {
    double minX = 0.0;
    double minY = 0.0;
    double maxX = 0.0;
    double maxY = 0.0;
    bool valid = false;

    BoundingBox() = default;
    BoundingBox(double x1, double y1, double x2, double y2);
    explicit BoundingBox(const Subpath& points);

    /// Expand to include a point
    void include(const QPointF& point);

    /// Get center point
    QPointF center() const;

    /// Get width
    double width() const { return maxX - minX; }

    /// Get height
    double height() const { return maxY - minY; }

    /// Width times height (0 for an invalid box)
    double area() const;

    /// Check if another box lies entirely inside this one (inclusive edges)
    bool contains(const BoundingBox& other) const;
};

}  // namespace geometry
}  // namespace svgplate

#endif  // SVGPLATE_GEOMETRY_TYPES_H
