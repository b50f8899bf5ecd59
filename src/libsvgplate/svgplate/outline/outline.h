// =====================================================================
//  src/libsvgplate/svgplate/outline/outline.h — Source outline record
// =====================================================================
//
//  The raw geometry of one imported element together with the
//  coordinate frame it was drawn in.
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef SVGPLATE_OUTLINE_OUTLINE_H
#define SVGPLATE_OUTLINE_OUTLINE_H

#include "../geometry/types.h"
#include "../core.h"

#include <QString>
#include <QVector>

#include <optional>

namespace svgplate {
namespace outline {

/// Fallback for a missing or unparsable width/height
constexpr double DEFAULT_DOCUMENT_SIZE = 100.0;

/// Declared source coordinate rectangle
struct ViewBox {
    double minX = 0.0;
    double minY = 0.0;
    double width = DEFAULT_DOCUMENT_SIZE;
    double height = DEFAULT_DOCUMENT_SIZE;

    QPointF center() const { return QPointF(minX + width / 2.0, minY + height / 2.0); }
};

/// Raw subpaths of one imported element
struct SourceOutline {
    QString name;
    QVector<geometry::Subpath> subpaths;
    double width = DEFAULT_DOCUMENT_SIZE;    ///< Declared document width
    double height = DEFAULT_DOCUMENT_SIZE;   ///< Declared document height
    ViewBox viewBox;

    bool isEmpty() const { return subpaths.isEmpty(); }
};

/// How the extruded decoration is placed on the host model.
/// Carried through untouched; the placement itself happens elsewhere.
enum class ExtrusionStyle {
    Raised,     ///< Added on top of the surface
    Engraved,   ///< Cut into the surface
    Cutout      ///< Cut through the host
};

/// Parse a style name ("raised", "engraved", "cutout"; case-insensitive)
SVGPLATE_EXPORT std::optional<ExtrusionStyle> parseExtrusionStyle(const QString& name);

/// Lower-case style name
SVGPLATE_EXPORT QString extrusionStyleName(ExtrusionStyle style);

/// Parse a width/height attribute such as "24", "24px" or "10.5mm".
/// Unit suffixes are ignored; unparsable input yields
/// DEFAULT_DOCUMENT_SIZE.
SVGPLATE_EXPORT double parseDimension(const QString& value);

/// Parse a viewBox attribute ("min-x min-y width height").
/// Returns nullopt unless four numbers are present.
SVGPLATE_EXPORT std::optional<ViewBox> parseViewBox(const QString& value);

}  // namespace outline
}  // namespace svgplate

#endif  // SVGPLATE_OUTLINE_OUTLINE_H
