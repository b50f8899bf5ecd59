// =====================================================================
//  src/libsvgplate/outline/primitives.cpp — Basic shape outlines
// =====================================================================
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <svgplate/outline/primitives.h>
#include <svgplate/path/tokenizer.h>

#include <QtMath>

namespace svgplate {
namespace outline {

using geometry::Subpath;

namespace {

/// Coordinate pairs of a points attribute; an odd trailing value is dropped
Subpath parsePointPairs(const QString& points)
{
    QVector<double> coords = path::parseNumberList(points);

    Subpath result;
    result.reserve(coords.size() / 2 + 1);
    for (int i = 0; i + 1 < coords.size(); i += 2) {
        result.append(QPointF(coords[i], coords[i + 1]));
    }
    return result;
}

}  // anonymous namespace

Subpath rectangleOutline(double x, double y, double width, double height)
{
    if (width <= 0.0 || height <= 0.0) {
        return {};
    }

    return {
        QPointF(x, y),
        QPointF(x + width, y),
        QPointF(x + width, y + height),
        QPointF(x, y + height),
        QPointF(x, y)
    };
}

Subpath circleOutline(double cx, double cy, double r,
                      const PrimitiveOptions& options)
{
    return ellipseOutline(cx, cy, r, r, options);
}

Subpath ellipseOutline(double cx, double cy, double rx, double ry,
                       const PrimitiveOptions& options)
{
    if (rx <= 0.0 || ry <= 0.0) {
        return {};
    }

    int segments = qMax(3, options.ellipseSegments);

    Subpath points;
    points.reserve(segments + 1);
    for (int i = 0; i < segments; ++i) {
        double angle = 2.0 * M_PI * i / segments;
        points.append(QPointF(cx + rx * qCos(angle), cy + ry * qSin(angle)));
    }
    points.append(points.first());
    return points;
}

Subpath polygonOutline(const QString& points)
{
    Subpath result = parsePointPairs(points);
    if (!result.isEmpty()) {
        result.append(result.first());
    }
    return result;
}

Subpath polylineOutline(const QString& points)
{
    return parsePointPairs(points);
}

}  // namespace outline
}  // namespace svgplate
