// =====================================================================
//  src/libsvgplate/svgplate/outline/normalize.h — Outline normalization
// =====================================================================
//
//  Maps source coordinates into the target frame (uniform scale to
//  the requested size, centered on the viewBox, Y axis pointing up)
//  and removes near-duplicate points.
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef SVGPLATE_OUTLINE_NORMALIZE_H
#define SVGPLATE_OUTLINE_NORMALIZE_H

#include "outline.h"
#include "../geometry/types.h"
#include "../core.h"

#include <QPointF>
#include <QVector>

namespace svgplate {
namespace outline {

/// Options for normalization
struct NormalizeOptions {
    double targetSize = 20.0;   ///< Length the larger viewBox side maps to (mm)
    double userScale = 1.0;     ///< Extra factor applied on top of target size
    double epsilon = geometry::POINT_TOLERANCE;  ///< Point merge distance (mm)
};

/// Center and scale of the source-to-target mapping
struct NormalizationFrame {
    QPointF center;
    double scale = 1.0;

    /// x' = (x - cx) * s,  y' = -(y - cy) * s
    QPointF map(const QPointF& p) const
    {
        return QPointF((p.x() - center.x()) * scale,
                       -(p.y() - center.y()) * scale);
    }
};

/// Compute the frame for an outline.  The scale is the same on both
/// axes.  If the viewBox has no positive extent, the bounds of the raw
/// subpaths stand in for it.
SVGPLATE_EXPORT NormalizationFrame computeFrame(
    const SourceOutline& outline,
    const NormalizeOptions& options = {});

/// Remove consecutive points closer than epsilon and drop the closing
/// duplicate of a closed subpath.
/// @return The cleaned subpath, or an empty one if fewer than 3 points
///         would remain (cannot form a polygon)
SVGPLATE_EXPORT geometry::Subpath cleanSubpath(
    const geometry::Subpath& points,
    double epsilon = geometry::POINT_TOLERANCE);

/// Transform and clean every subpath of an outline.
/// Subpaths that cannot form a polygon are dropped; order is kept.
SVGPLATE_EXPORT QVector<geometry::Subpath> normalizeOutline(
    const SourceOutline& outline,
    const NormalizeOptions& options = {});

}  // namespace outline
}  // namespace svgplate

#endif  // SVGPLATE_OUTLINE_NORMALIZE_H
