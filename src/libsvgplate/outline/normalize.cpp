// =====================================================================
//  src/libsvgplate/outline/normalize.cpp — Outline normalization
// =====================================================================
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <svgplate/outline/normalize.h>

#include <QLineF>

namespace svgplate {
namespace outline {

using geometry::BoundingBox;
using geometry::Subpath;

namespace {

bool pointsEqual(const QPointF& a, const QPointF& b, double tolerance)
{
    return QLineF(a, b).length() < tolerance;
}

}  // anonymous namespace

NormalizationFrame computeFrame(
    const SourceOutline& outline,
    const NormalizeOptions& options)
{
    NormalizationFrame frame;

    double extent = qMax(outline.viewBox.width, outline.viewBox.height);
    if (extent > 0.0) {
        frame.center = outline.viewBox.center();
        frame.scale = options.targetSize / extent * options.userScale;
        return frame;
    }

    // No usable viewBox: fit the drawn geometry instead
    BoundingBox bounds;
    for (const Subpath& subpath : outline.subpaths) {
        for (const QPointF& p : subpath) {
            bounds.include(p);
        }
    }

    extent = qMax(bounds.width(), bounds.height());
    if (bounds.valid && extent > 0.0) {
        frame.center = bounds.center();
        frame.scale = options.targetSize / extent * options.userScale;
    } else {
        frame.center = bounds.valid ? bounds.center() : QPointF(0, 0);
        frame.scale = options.userScale;
    }
    return frame;
}

Subpath cleanSubpath(const Subpath& points, double epsilon)
{
    Subpath cleaned;
    cleaned.reserve(points.size());

    for (const QPointF& p : points) {
        if (cleaned.isEmpty() || !pointsEqual(cleaned.last(), p, epsilon)) {
            cleaned.append(p);
        }
    }

    if (cleaned.size() >= 2 && pointsEqual(cleaned.first(), cleaned.last(), epsilon)) {
        // Closure is implied, not stored.  Three points with coincident
        // ends are only two distinct ones.
        if (cleaned.size() <= 3) {
            return {};
        }
        cleaned.removeLast();
    }

    if (cleaned.size() < 3) {
        return {};
    }
    return cleaned;
}

QVector<Subpath> normalizeOutline(
    const SourceOutline& outline,
    const NormalizeOptions& options)
{
    NormalizationFrame frame = computeFrame(outline, options);

    QVector<Subpath> result;
    result.reserve(outline.subpaths.size());

    for (const Subpath& subpath : outline.subpaths) {
        Subpath transformed;
        transformed.reserve(subpath.size());
        for (const QPointF& p : subpath) {
            transformed.append(frame.map(p));
        }

        Subpath cleaned = cleanSubpath(transformed, options.epsilon);
        if (!cleaned.isEmpty()) {
            result.append(cleaned);
        }
    }

    return result;
}

}  // namespace outline
}  // namespace svgplate
