// =====================================================================
//  src/libsvgplate/outline/nesting.cpp — Fill/hole resolution
// =====================================================================
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <svgplate/outline/nesting.h>

#include <algorithm>

namespace svgplate {
namespace outline {

using geometry::BoundingBox;
using geometry::Subpath;

namespace {

/// Whether the closed polygon through the points encloses any area
bool enclosesArea(const Subpath& points)
{
    double twiceArea = 0.0;
    for (int i = 0; i < points.size(); ++i) {
        const QPointF& a = points[i];
        const QPointF& b = points[(i + 1) % points.size()];
        twiceArea += a.x() * b.y() - b.x() * a.y();
    }
    return qAbs(twiceArea) > geometry::DEFAULT_TOLERANCE;
}

}  // anonymous namespace

QString profileRoleName(ProfileRole role)
{
    switch (role) {
    case ProfileRole::Fill: return QStringLiteral("fill");
    case ProfileRole::Hole: return QStringLiteral("hole");
    }
    return QString();
}

QVector<NestedSubpath> resolveNesting(const QVector<Subpath>& subpaths)
{
    QVector<NestedSubpath> nested;
    nested.reserve(subpaths.size());

    for (int i = 0; i < subpaths.size(); ++i) {
        NestedSubpath entry;
        entry.points = subpaths[i];
        entry.bounds = BoundingBox(subpaths[i]);
        entry.area = entry.bounds.area();
        entry.sourceIndex = i;
        nested.append(entry);
    }

    // Sort by area (largest first)
    std::stable_sort(nested.begin(), nested.end(),
                     [](const NestedSubpath& a, const NestedSubpath& b) {
        return a.area > b.area;
    });

    // A flat subpath (collinear points) has a box but no interior
    QVector<bool> canContain;
    canContain.reserve(nested.size());
    for (const NestedSubpath& entry : nested) {
        canContain.append(enclosesArea(entry.points));
    }

    // The immediate parent is the smallest earlier subpath whose box
    // contains this one, so scan back from the nearest
    for (int i = 0; i < nested.size(); ++i) {
        NestedSubpath& entry = nested[i];
        for (int j = i - 1; j >= 0; --j) {
            if (canContain[j] && nested[j].bounds.contains(entry.bounds)) {
                entry.parent = j;
                entry.level = nested[j].level + 1;
                break;
            }
        }
        entry.role = (entry.level % 2 == 0) ? ProfileRole::Fill : ProfileRole::Hole;
    }

    return nested;
}

}  // namespace outline
}  // namespace svgplate
