// =====================================================================
//  src/libsvgplate/svg/import.cpp — SVG document import
// =====================================================================
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <svgplate/svg/import.h>
#include <svgplate/path/tokenizer.h>

#include <QFile>
#include <QFileInfo>
#include <QXmlStreamReader>

namespace svgplate {
namespace svg {

using geometry::Subpath;

namespace {

/// Read a numeric attribute; missing or unparsable values are 0
double numberAttribute(const QXmlStreamAttributes& attrs, const QString& name)
{
    QVector<double> numbers = path::parseNumberList(attrs.value(name).toString());
    return numbers.isEmpty() ? 0.0 : numbers.first();
}

QString stringAttribute(const QXmlStreamAttributes& attrs, const QString& name)
{
    return attrs.value(name).toString();
}

/// Read width, height and viewBox from the root element
void readDocumentFrame(const QXmlStreamAttributes& attrs, outline::SourceOutline& outline)
{
    outline.width = outline::parseDimension(stringAttribute(attrs, QStringLiteral("width")));
    outline.height = outline::parseDimension(stringAttribute(attrs, QStringLiteral("height")));

    std::optional<outline::ViewBox> viewBox =
        outline::parseViewBox(stringAttribute(attrs, QStringLiteral("viewBox")));
    if (viewBox) {
        outline.viewBox = *viewBox;
    } else {
        outline.viewBox = outline::ViewBox{0.0, 0.0, outline.width, outline.height};
    }
}

void appendSubpath(outline::SourceOutline& outline, const Subpath& subpath)
{
    if (!subpath.isEmpty()) {
        outline.subpaths.append(subpath);
    }
}

}  // anonymous namespace

QString importStatusName(ImportStatus status)
{
    switch (status) {
    case ImportStatus::Success:         return QStringLiteral("success");
    case ImportStatus::NoContent:       return QStringLiteral("no content");
    case ImportStatus::InvalidDocument: return QStringLiteral("invalid document");
    case ImportStatus::FileError:       return QStringLiteral("file error");
    }
    return QString();
}

ImportResult importSVGString(
    const QString& svgContent,
    const QString& name,
    const ImportOptions& options)
{
    ImportResult result;
    result.outline.name = name;

    QXmlStreamReader xml(svgContent);
    bool sawRoot = false;

    while (!xml.atEnd()) {
        xml.readNext();
        if (!xml.isStartElement()) {
            continue;
        }

        const QString tag = xml.name().toString();
        const QXmlStreamAttributes attrs = xml.attributes();

        if (!sawRoot) {
            if (tag != QLatin1String("svg")) {
                result.status = ImportStatus::InvalidDocument;
                result.errorMessage =
                    QString("Root element is <%1>, expected <svg>").arg(tag);
                return result;
            }
            readDocumentFrame(attrs, result.outline);
            sawRoot = true;
            continue;
        }

        if (tag == QLatin1String("path")) {
            int index = result.elementCount++;
            QString data = stringAttribute(attrs, QStringLiteral("d"));
            if (data.trimmed().isEmpty()) {
                continue;
            }

            path::ParseResult parsed = path::parsePath(data, options.path);
            result.droppedArguments += parsed.droppedArguments;
            result.degenerateSegments += parsed.degenerateSegments;
            if (!parsed.ok) {
                result.pathErrors.append(PathError{index, parsed.errorMessage, parsed.fragment});
                continue;
            }
            for (const Subpath& subpath : parsed.subpaths) {
                appendSubpath(result.outline, subpath);
            }

        } else if (tag == QLatin1String("rect")) {
            ++result.elementCount;
            appendSubpath(result.outline, outline::rectangleOutline(
                numberAttribute(attrs, QStringLiteral("x")),
                numberAttribute(attrs, QStringLiteral("y")),
                numberAttribute(attrs, QStringLiteral("width")),
                numberAttribute(attrs, QStringLiteral("height"))));

        } else if (tag == QLatin1String("circle")) {
            ++result.elementCount;
            appendSubpath(result.outline, outline::circleOutline(
                numberAttribute(attrs, QStringLiteral("cx")),
                numberAttribute(attrs, QStringLiteral("cy")),
                numberAttribute(attrs, QStringLiteral("r")),
                options.primitives));

        } else if (tag == QLatin1String("ellipse")) {
            ++result.elementCount;
            appendSubpath(result.outline, outline::ellipseOutline(
                numberAttribute(attrs, QStringLiteral("cx")),
                numberAttribute(attrs, QStringLiteral("cy")),
                numberAttribute(attrs, QStringLiteral("rx")),
                numberAttribute(attrs, QStringLiteral("ry")),
                options.primitives));

        } else if (tag == QLatin1String("polygon")) {
            ++result.elementCount;
            appendSubpath(result.outline, outline::polygonOutline(
                stringAttribute(attrs, QStringLiteral("points"))));

        } else if (tag == QLatin1String("polyline")) {
            ++result.elementCount;
            appendSubpath(result.outline, outline::polylineOutline(
                stringAttribute(attrs, QStringLiteral("points"))));
        }
    }

    if (xml.hasError()) {
        result.status = ImportStatus::InvalidDocument;
        result.errorMessage = QString("XML error at line %1, column %2: %3")
                                  .arg(xml.lineNumber())
                                  .arg(xml.columnNumber())
                                  .arg(xml.errorString());
        result.outline.subpaths.clear();
        return result;
    }

    if (!sawRoot) {
        result.status = ImportStatus::InvalidDocument;
        result.errorMessage = QStringLiteral("Document has no <svg> element");
        return result;
    }

    if (result.outline.isEmpty() && !result.pathErrors.isEmpty()) {
        result.status = ImportStatus::InvalidDocument;
        result.errorMessage = QStringLiteral("No path data could be interpreted: ") +
                              result.pathErrors.first().message;
        return result;
    }

    if (result.outline.isEmpty()) {
        result.status = ImportStatus::NoContent;
        result.errorMessage = QStringLiteral("No drawable content found in SVG");
        return result;
    }

    result.status = ImportStatus::Success;
    return result;
}

ImportResult importSVGFile(
    const QString& filePath,
    const ImportOptions& options)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        ImportResult result;
        result.status = ImportStatus::FileError;
        result.errorMessage = QString("Cannot open file: %1 (%2)")
                                  .arg(filePath, file.errorString());
        return result;
    }

    QString content = QString::fromUtf8(file.readAll());
    return importSVGString(content, QFileInfo(filePath).completeBaseName(), options);
}

}  // namespace svg
}  // namespace svgplate
