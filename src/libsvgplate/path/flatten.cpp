// =====================================================================
//  src/libsvgplate/path/flatten.cpp — Curve flattening implementation
// =====================================================================
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <svgplate/path/flatten.h>
#include <svgplate/geometry/types.h>

#include <QtMath>

namespace svgplate {
namespace path {

using geometry::DEFAULT_TOLERANCE;

namespace {

/// Signed angle from vector u to vector v, in radians
double angleBetween(double ux, double uy, double vx, double vy)
{
    double dot = ux * vx + uy * vy;
    double len = qSqrt(ux * ux + uy * uy) * qSqrt(vx * vx + vy * vy);
    double ang = qAcos(qBound(-1.0, dot / len, 1.0));
    if (ux * vy - uy * vx < 0) ang = -ang;
    return ang;
}

FlattenResult straightLine(const QPointF& start, const QPointF& end)
{
    FlattenResult result;
    result.degenerate = true;
    result.points = {start, end};
    return result;
}

}  // anonymous namespace

// =====================================================================
//  Bezier Curves
// =====================================================================

FlattenResult flattenCubic(
    const QPointF& p0, const QPointF& p1,
    const QPointF& p2, const QPointF& p3,
    int segments)
{
    segments = qMax(1, segments);

    FlattenResult result;
    result.points.reserve(segments + 1);
    result.points.append(p0);

    for (int i = 1; i < segments; ++i) {
        double t = static_cast<double>(i) / segments;
        double mt = 1.0 - t;
        double a = mt * mt * mt;
        double b = 3.0 * mt * mt * t;
        double c = 3.0 * mt * t * t;
        double d = t * t * t;
        result.points.append(QPointF(
            a * p0.x() + b * p1.x() + c * p2.x() + d * p3.x(),
            a * p0.y() + b * p1.y() + c * p2.y() + d * p3.y()));
    }

    result.points.append(p3);
    return result;
}

FlattenResult flattenQuadratic(
    const QPointF& p0, const QPointF& p1, const QPointF& p2,
    int segments)
{
    segments = qMax(1, segments);

    FlattenResult result;
    result.points.reserve(segments + 1);
    result.points.append(p0);

    for (int i = 1; i < segments; ++i) {
        double t = static_cast<double>(i) / segments;
        double mt = 1.0 - t;
        double a = mt * mt;
        double b = 2.0 * mt * t;
        double c = t * t;
        result.points.append(QPointF(
            a * p0.x() + b * p1.x() + c * p2.x(),
            a * p0.y() + b * p1.y() + c * p2.y()));
    }

    result.points.append(p2);
    return result;
}

// =====================================================================
//  Elliptical Arcs
// =====================================================================

bool arcToCenter(const ArcSegment& arc, ArcCenter& center)
{
    double x1 = arc.start.x();
    double y1 = arc.start.y();
    double x2 = arc.end.x();
    double y2 = arc.end.y();

    // Coincident endpoints: the arc is omitted
    if (qAbs(x1 - x2) < DEFAULT_TOLERANCE && qAbs(y1 - y2) < DEFAULT_TOLERANCE) {
        return false;
    }

    double rx = qAbs(arc.rx);
    double ry = qAbs(arc.ry);

    // Zero radius: treated as a straight line
    if (rx < DEFAULT_TOLERANCE || ry < DEFAULT_TOLERANCE) {
        return false;
    }

    double phiRad = qDegreesToRadians(arc.xAxisRotation);
    double cosPhi = qCos(phiRad);
    double sinPhi = qSin(phiRad);

    // Step 1: Compute (x1', y1') in the ellipse's local frame
    double dx = (x1 - x2) / 2.0;
    double dy = (y1 - y2) / 2.0;
    double x1p = cosPhi * dx + sinPhi * dy;
    double y1p = -sinPhi * dx + cosPhi * dy;

    // Step 2: Scale radii up if they cannot span the chord
    double x1pSq = x1p * x1p;
    double y1pSq = y1p * y1p;
    double lambda = x1pSq / (rx * rx) + y1pSq / (ry * ry);
    if (lambda > 1.0) {
        double sqrtLambda = qSqrt(lambda);
        rx *= sqrtLambda;
        ry *= sqrtLambda;
    }
    double rxSq = rx * rx;
    double rySq = ry * ry;

    // Step 3: Compute (cx', cy'), picking the center matching the flags
    double num = rxSq * rySq - rxSq * y1pSq - rySq * x1pSq;
    double denom = rxSq * y1pSq + rySq * x1pSq;

    double sq = qMax(0.0, num / denom);
    double coef = qSqrt(sq) * ((arc.largeArc == arc.sweep) ? -1 : 1);

    double cxp = coef * rx * y1p / ry;
    double cyp = -coef * ry * x1p / rx;

    // Step 4: Compute (cx, cy)
    double mx = (x1 + x2) / 2.0;
    double my = (y1 + y2) / 2.0;

    // Step 5: Compute angles
    double ux = (x1p - cxp) / rx;
    double uy = (y1p - cyp) / ry;
    double vx = (-x1p - cxp) / rx;
    double vy = (-y1p - cyp) / ry;

    double startAngle = qRadiansToDegrees(angleBetween(1, 0, ux, uy));
    double sweepAngle = qRadiansToDegrees(angleBetween(ux, uy, vx, vy));

    if (!arc.sweep && sweepAngle > 0) {
        sweepAngle -= 360;
    } else if (arc.sweep && sweepAngle < 0) {
        sweepAngle += 360;
    }

    center.center = QPointF(cosPhi * cxp - sinPhi * cyp + mx,
                            sinPhi * cxp + cosPhi * cyp + my);
    center.rx = rx;
    center.ry = ry;
    center.xAxisRotation = arc.xAxisRotation;
    center.startAngle = startAngle;
    center.sweepAngle = sweepAngle;
    return true;
}

FlattenResult flattenArc(const ArcSegment& arc, int segments)
{
    ArcCenter params;
    if (!arcToCenter(arc, params)) {
        return straightLine(arc.start, arc.end);
    }

    segments = qMax(1, segments);

    double phiRad = qDegreesToRadians(params.xAxisRotation);
    double cosPhi = qCos(phiRad);
    double sinPhi = qSin(phiRad);

    FlattenResult result;
    result.points.reserve(segments + 1);
    result.points.append(arc.start);

    for (int i = 1; i < segments; ++i) {
        double t = static_cast<double>(i) / segments;
        double theta = qDegreesToRadians(params.startAngle + t * params.sweepAngle);
        double ex = params.rx * qCos(theta);
        double ey = params.ry * qSin(theta);
        result.points.append(QPointF(
            params.center.x() + cosPhi * ex - sinPhi * ey,
            params.center.y() + sinPhi * ex + cosPhi * ey));
    }

    result.points.append(arc.end);
    return result;
}

}  // namespace path
}  // namespace svgplate
