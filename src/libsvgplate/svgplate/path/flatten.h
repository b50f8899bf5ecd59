// =====================================================================
//  src/libsvgplate/svgplate/path/flatten.h — Curve flattening
// =====================================================================
//
//  Pure sampling functions that approximate cubic and quadratic
//  Bezier segments and SVG elliptical arcs with line segments.
//  Each returns segments + 1 points, first and last equal to the
//  exact segment endpoints.
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef SVGPLATE_PATH_FLATTEN_H
#define SVGPLATE_PATH_FLATTEN_H

#include "../core.h"

#include <QPointF>
#include <QVector>

namespace svgplate {
namespace path {

/// Default sample counts used by the interpreter
constexpr int DEFAULT_CURVE_SEGMENTS = 10;
constexpr int DEFAULT_ARC_SEGMENTS = 20;

// =====================================================================
//  Results
// =====================================================================

/// Outcome of flattening one segment
struct FlattenResult {
    /// True when the input could not be sampled as a curve and
    /// points holds the straight-line fallback [start, end]
    bool degenerate = false;
    QVector<QPointF> points;
};

/// SVG arc in endpoint parameterization (as written in path data)
struct ArcSegment {
    QPointF start;
    double rx = 0.0;
    double ry = 0.0;
    double xAxisRotation = 0.0;   ///< Degrees
    bool largeArc = false;
    bool sweep = false;
    QPointF end;
};

/// Arc in center parameterization
struct ArcCenter {
    QPointF center;
    double rx = 0.0;              ///< Radii after out-of-range correction
    double ry = 0.0;
    double xAxisRotation = 0.0;   ///< Degrees
    double startAngle = 0.0;      ///< Degrees, in the ellipse's local frame
    double sweepAngle = 0.0;      ///< Degrees, positive = sweep-flag direction
};

// =====================================================================
//  Sampling
// =====================================================================

/// Sample a cubic Bezier at segments + 1 uniformly spaced t values
SVGPLATE_EXPORT FlattenResult flattenCubic(
    const QPointF& p0, const QPointF& p1,
    const QPointF& p2, const QPointF& p3,
    int segments = DEFAULT_CURVE_SEGMENTS);

/// Sample a quadratic Bezier at segments + 1 uniformly spaced t values
SVGPLATE_EXPORT FlattenResult flattenQuadratic(
    const QPointF& p0, const QPointF& p1, const QPointF& p2,
    int segments = DEFAULT_CURVE_SEGMENTS);

/// Convert an arc to center parameterization.
/// @return False for a degenerate arc (zero radius or coincident
///         endpoints); center is left untouched in that case.
SVGPLATE_EXPORT bool arcToCenter(const ArcSegment& arc, ArcCenter& center);

/// Sample an elliptical arc at segments + 1 evenly spaced angles.
/// A degenerate arc yields exactly [start, end] with degenerate set.
SVGPLATE_EXPORT FlattenResult flattenArc(
    const ArcSegment& arc,
    int segments = DEFAULT_ARC_SEGMENTS);

}  // namespace path
}  // namespace svgplate

#endif  // SVGPLATE_PATH_FLATTEN_H
