// =====================================================================
//  src/libsvgplate/geometry/types.cpp — Basic geometry types implementation
// =====================================================================
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <svgplate/geometry/types.h>

namespace svgplate {
namespace geometry {

// =====================================================================
//  BoundingBox Implementation
// =====================================================================

BoundingBox::BoundingBox(double x1, double y1, double x2, double y2)
    : minX(qMin(x1, x2))
    , minY(qMin(y1, y2))
    , maxX(qMax(x1, x2))
    , maxY(qMax(y1, y2))
    , valid(true)
{
}

BoundingBox::BoundingBox(const Subpath& points)
{
    for (const QPointF& p : points) {
        include(p);
    }
}

void BoundingBox::include(const QPointF& point)
{
    if (!valid) {
        minX = maxX = point.x();
        minY = maxY = point.y();
        valid = true;
    } else {
        minX = qMin(minX, point.x());
        minY = qMin(minY, point.y());
        maxX = qMax(maxX, point.x());
        maxY = qMax(maxY, point.y());
    }
}

QPointF BoundingBox::center() const
{
    return QPointF((minX + maxX) / 2.0, (minY + maxY) / 2.0);
}

double BoundingBox::area() const
{
    if (!valid) return 0.0;
    return width() * height();
}

bool BoundingBox::contains(const BoundingBox& other) const
{
    if (!valid || !other.valid) return false;
    return minX <= other.minX && minY <= other.minY &&
           maxX >= other.maxX && maxY >= other.maxY;
}

}  // namespace geometry
}  // namespace svgplate
