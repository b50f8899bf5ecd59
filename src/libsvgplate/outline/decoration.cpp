// =====================================================================
//  src/libsvgplate/outline/decoration.cpp — Profile set assembly
// =====================================================================
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <svgplate/outline/decoration.h>

#include <algorithm>

namespace svgplate {
namespace outline {

int ProfileSet::fillCount() const
{
    return static_cast<int>(std::count_if(profiles.begin(), profiles.end(),
        [](const NestedSubpath& p) { return p.role == ProfileRole::Fill; }));
}

int ProfileSet::holeCount() const
{
    return static_cast<int>(profiles.size()) - fillCount();
}

geometry::BoundingBox ProfileSet::bounds() const
{
    geometry::BoundingBox box;
    for (const NestedSubpath& profile : profiles) {
        for (const QPointF& p : profile.points) {
            box.include(p);
        }
    }
    return box;
}

ProfileSet buildProfileSet(
    const SourceOutline& outline,
    const DecorationOptions& options)
{
    ProfileSet set;
    set.name = outline.name;
    set.depth = options.depth;
    set.style = options.style;
    set.profiles = resolveNesting(normalizeOutline(outline, options.normalize));
    return set;
}

}  // namespace outline
}  // namespace svgplate
