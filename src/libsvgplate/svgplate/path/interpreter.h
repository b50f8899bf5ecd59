// =====================================================================
//  src/libsvgplate/svgplate/path/interpreter.h — Path data interpreter
// =====================================================================
//
//  Turns SVG path data into one flattened point list per subpath.
//
//  The token stream is first grouped into segments (one command
//  letter plus exactly the arguments of one repetition), then folded
//  through applySegment(), which maps one ParseState to the next.
//  Each step can therefore be tested in isolation.
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef SVGPLATE_PATH_INTERPRETER_H
#define SVGPLATE_PATH_INTERPRETER_H

#include "tokenizer.h"
#include "flatten.h"
#include "../geometry/types.h"
#include "../core.h"

#include <QPointF>
#include <QString>
#include <QVector>

#include <optional>

namespace svgplate {
namespace path {

// =====================================================================
//  Options
// =====================================================================

/// Tessellation budget for curved segments
struct InterpreterOptions {
    int curveSegments = DEFAULT_CURVE_SEGMENTS;  ///< Samples per cubic/quadratic
    int arcSegments = DEFAULT_ARC_SEGMENTS;      ///< Samples per elliptical arc
};

// =====================================================================
//  Segments
// =====================================================================

/// One repetition of a command with its arguments.
/// Coordinate pairs following a moveto are grouped as lineto (L/l).
struct PathSegment {
    QChar command;
    QVector<double> args;
};

/// Result of grouping a token stream into segments
struct SegmentList {
    bool ok = true;
    QVector<PathSegment> segments;
    int droppedArguments = 0;     ///< Trailing numbers that did not fill a group
    QString errorMessage;
    QString fragment;             ///< Offending source text when !ok
};

/// Group tokens into segments.
/// Fails only when numeric data appears before any command or the
/// first command is not a moveto.
SVGPLATE_EXPORT SegmentList groupSegments(const QVector<PathToken>& tokens);

// =====================================================================
//  Interpreter State
// =====================================================================

/// Which curve family produced the last control point
enum class CurveFamily {
    None,
    Cubic,      // C, S
    Quadratic   // Q, T
};

/// Cursor state while interpreting one path string
struct ParseState {
    QPointF current;                    ///< Current point
    QPointF subpathStart;               ///< Start of the active subpath
    std::optional<QPointF> lastControl; ///< For S/T reflection
    CurveFamily lastCurve = CurveFamily::None;

    geometry::Subpath active;           ///< Subpath being built
    bool activeClosed = false;          ///< Active subpath ended with Z
    QVector<geometry::Subpath> completed;

    int degenerateSegments = 0;         ///< Curves replaced by straight lines
};

/// Apply one segment and return the resulting state
SVGPLATE_EXPORT ParseState applySegment(
    ParseState state,
    const PathSegment& segment,
    const InterpreterOptions& options = {});

/// Close out the state: the unterminated trailing subpath (if any)
/// is appended to the completed list.
SVGPLATE_EXPORT QVector<geometry::Subpath> finishSubpaths(ParseState state);

// =====================================================================
//  Interpreting
// =====================================================================

/// Result of interpreting one path string
struct ParseResult {
    bool ok = true;                     ///< False on a grammar error
    QVector<geometry::Subpath> subpaths;
    QString errorMessage;
    QString fragment;                   ///< Offending source text when !ok
    int droppedArguments = 0;
    int degenerateSegments = 0;
};

/// Interpret an already tokenized path
SVGPLATE_EXPORT ParseResult interpretTokens(
    const QVector<PathToken>& tokens,
    const InterpreterOptions& options = {});

/// Tokenize and interpret path data
SVGPLATE_EXPORT ParseResult parsePath(
    const QString& data,
    const InterpreterOptions& options = {});

}  // namespace path
}  // namespace svgplate

#endif  // SVGPLATE_PATH_INTERPRETER_H
