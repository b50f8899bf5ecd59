// =====================================================================
//  src/libsvgplate/outline/outline.cpp — Source outline helpers
// =====================================================================
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <svgplate/outline/outline.h>
#include <svgplate/path/tokenizer.h>

#include <QRegularExpression>

namespace svgplate {
namespace outline {

std::optional<ExtrusionStyle> parseExtrusionStyle(const QString& name)
{
    QString key = name.trimmed().toLower();
    if (key == QLatin1String("raised")) return ExtrusionStyle::Raised;
    if (key == QLatin1String("engraved")) return ExtrusionStyle::Engraved;
    if (key == QLatin1String("cutout")) return ExtrusionStyle::Cutout;
    return std::nullopt;
}

QString extrusionStyleName(ExtrusionStyle style)
{
    switch (style) {
    case ExtrusionStyle::Raised:   return QStringLiteral("raised");
    case ExtrusionStyle::Engraved: return QStringLiteral("engraved");
    case ExtrusionStyle::Cutout:   return QStringLiteral("cutout");
    }
    return QString();
}

double parseDimension(const QString& value)
{
    // Only a trailing unit suffix; "1e2px" keeps its exponent
    static const QRegularExpression unitRegex(QStringLiteral("[a-zA-Z%]+$"));

    QString number = value.trimmed();
    number.remove(unitRegex);

    bool ok = false;
    double result = number.toDouble(&ok);
    return ok ? result : DEFAULT_DOCUMENT_SIZE;
}

std::optional<ViewBox> parseViewBox(const QString& value)
{
    QVector<double> numbers = path::parseNumberList(value);
    if (numbers.size() < 4) {
        return std::nullopt;
    }

    ViewBox box;
    box.minX = numbers[0];
    box.minY = numbers[1];
    box.width = numbers[2];
    box.height = numbers[3];
    return box;
}

}  // namespace outline
}  // namespace svgplate
