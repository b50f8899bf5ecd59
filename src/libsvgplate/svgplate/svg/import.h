// =====================================================================
//  src/libsvgplate/svgplate/svg/import.h — SVG document import
// =====================================================================
//
//  Reads an SVG document and collects the raw outline of every path
//  and basic shape it contains.  Only geometry is read: transforms,
//  <use>/<defs>, styling and paint are ignored.
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef SVGPLATE_SVG_IMPORT_H
#define SVGPLATE_SVG_IMPORT_H

#include "../outline/outline.h"
#include "../outline/primitives.h"
#include "../path/interpreter.h"
#include "../core.h"

#include <QString>
#include <QVector>

namespace svgplate {
namespace svg {

// =====================================================================
//  Options and Results
// =====================================================================

/// Options for SVG import
struct ImportOptions {
    path::InterpreterOptions path;          ///< Curve tessellation
    outline::PrimitiveOptions primitives;   ///< Circle/ellipse sampling
};

/// Outcome of an import
enum class ImportStatus {
    Success,            ///< At least one subpath was read
    NoContent,          ///< Well-formed document without drawable geometry
    InvalidDocument,    ///< Not an SVG document, malformed XML, or only unreadable path data
    FileError           ///< Source could not be read
};

/// Human-readable status name
SVGPLATE_EXPORT QString importStatusName(ImportStatus status);

/// A path element whose data could not be interpreted.
/// The element is skipped; the rest of the document is still imported.
struct PathError {
    int elementIndex = 0;   ///< Position among the document's shape elements
    QString message;
    QString fragment;       ///< Offending source text
};

/// Result of SVG import
struct ImportResult {
    ImportStatus status = ImportStatus::InvalidDocument;
    outline::SourceOutline outline;
    QVector<PathError> pathErrors;
    QString errorMessage;
    int elementCount = 0;           ///< Shape elements encountered
    int droppedArguments = 0;       ///< Summed over all paths
    int degenerateSegments = 0;     ///< Summed over all paths

    bool success() const { return status == ImportStatus::Success; }
};

// =====================================================================
//  Import
// =====================================================================

/// Import from SVG document content
/// @param svgContent SVG document as string
/// @param name Name given to the resulting outline
/// @param options Import options
SVGPLATE_EXPORT ImportResult importSVGString(
    const QString& svgContent,
    const QString& name = QString(),
    const ImportOptions& options = {});

/// Import from an SVG file.  The outline is named after the file's
/// base name.
SVGPLATE_EXPORT ImportResult importSVGFile(
    const QString& filePath,
    const ImportOptions& options = {});

}  // namespace svg
}  // namespace svgplate

#endif  // SVGPLATE_SVG_IMPORT_H
