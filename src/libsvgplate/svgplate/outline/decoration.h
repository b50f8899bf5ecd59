// =====================================================================
//  src/libsvgplate/svgplate/outline/decoration.h — Profile set assembly
// =====================================================================
//
//  Runs normalization and nesting resolution over a source outline
//  and packages the result for the solid-modeling stage: the ordered
//  (polygon, role) list plus extrusion depth and style.
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef SVGPLATE_OUTLINE_DECORATION_H
#define SVGPLATE_OUTLINE_DECORATION_H

#include "outline.h"
#include "normalize.h"
#include "nesting.h"
#include "../core.h"

#include <QString>
#include <QVector>

namespace svgplate {
namespace outline {

/// Presentation parameters for one decoration
struct DecorationOptions {
    NormalizeOptions normalize;
    double depth = 2.0;                          ///< Extrusion depth (mm)
    ExtrusionStyle style = ExtrusionStyle::Raised;
};

/// Role-tagged polygons ready for extrusion
struct SVGPLATE_EXPORT ProfileSet {
    QString name;
    QVector<NestedSubpath> profiles;   ///< Parents before children
    double depth = 2.0;
    ExtrusionStyle style = ExtrusionStyle::Raised;

    bool isEmpty() const { return profiles.isEmpty(); }
    int fillCount() const;
    int holeCount() const;

    /// Bounds of all profiles in target units
    geometry::BoundingBox bounds() const;
};

/// Normalize an outline and resolve its nesting
SVGPLATE_EXPORT ProfileSet buildProfileSet(
    const SourceOutline& outline,
    const DecorationOptions& options = {});

}  // namespace outline
}  // namespace svgplate

#endif  // SVGPLATE_OUTLINE_DECORATION_H
