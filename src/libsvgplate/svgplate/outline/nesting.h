// =====================================================================
//  src/libsvgplate/svgplate/outline/nesting.h — Fill/hole resolution
// =====================================================================
//
//  Assigns each normalized subpath a nesting level from bounding-box
//  containment and maps level parity to a fill or hole role (even-odd
//  rule).  Bounding boxes stand in for true point-in-polygon tests:
//  correct for nested shapes, not for overlapping or self-intersecting
//  subpaths.
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef SVGPLATE_OUTLINE_NESTING_H
#define SVGPLATE_OUTLINE_NESTING_H

#include "../geometry/types.h"
#include "../core.h"

#include <QString>
#include <QVector>

namespace svgplate {
namespace outline {

/// What a profile contributes to the extruded result
enum class ProfileRole {
    Fill,   ///< Even nesting level: added
    Hole    ///< Odd nesting level: subtracted
};

/// Lower-case role name ("fill" / "hole")
SVGPLATE_EXPORT QString profileRoleName(ProfileRole role);

/// A subpath with its containment information
struct NestedSubpath {
    geometry::Subpath points;
    geometry::BoundingBox bounds;
    double area = 0.0;          ///< Bounding-box area
    int level = 0;              ///< 0 = outermost
    int parent = -1;            ///< Index of the parent in the resolved list
    int sourceIndex = 0;        ///< Index in the input list
    ProfileRole role = ProfileRole::Fill;
};

/// Resolve nesting for one outline's normalized subpaths.
/// The result is ordered by area, largest first (ties keep input
/// order), so every parent precedes its children.  A subpath whose
/// points enclose no area is never chosen as a parent.
SVGPLATE_EXPORT QVector<NestedSubpath> resolveNesting(
    const QVector<geometry::Subpath>& subpaths);

}  // namespace outline
}  // namespace svgplate

#endif  // SVGPLATE_OUTLINE_NESTING_H
