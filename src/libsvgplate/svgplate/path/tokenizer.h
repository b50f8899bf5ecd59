// =====================================================================
//  src/libsvgplate/svgplate/path/tokenizer.h — Path data tokenizer
// =====================================================================
//
//  Splits SVG path data (the "d" attribute) into a flat sequence of
//  command letters and numeric literals.  The tokenizer never fails:
//  characters that cannot start a token are skipped.
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef SVGPLATE_PATH_TOKENIZER_H
#define SVGPLATE_PATH_TOKENIZER_H

#include "../core.h"

#include <QChar>
#include <QString>
#include <QVector>

namespace svgplate {
namespace path {

// =====================================================================
//  Tokens
// =====================================================================

/// One lexical element of path data
struct PathToken {
    enum class Type {
        Command,    ///< One of MmLlHhVvCcSsQqTtAaZz
        Number      ///< Numeric literal
    };

    Type type = Type::Number;
    QChar command;          ///< Command letter (Type::Command only)
    double value = 0.0;     ///< Parsed value (Type::Number only)
    QString text;           ///< Source text of the token

    bool isCommand() const { return type == Type::Command; }
    bool isNumber() const { return type == Type::Number; }
};

/// Check whether a character is a path command letter
SVGPLATE_EXPORT bool isPathCommand(QChar ch);

/// Number of numeric arguments one repetition of a command consumes
/// (0 for Z/z and for characters that are not commands)
SVGPLATE_EXPORT int commandArgumentCount(QChar command);

// =====================================================================
//  Tokenizing
// =====================================================================

/// Tokenize path data.
///
/// Numbers may be separated by whitespace, commas, or nothing at all
/// where a sign or a second decimal point starts the next literal:
/// "10-5" yields 10 and -5, "1.5.5" yields 1.5 and .5.  Within an
/// arc command the two flag arguments are read as single characters,
/// so "a1 1 0 00.5.5" yields the flags 0, 0 followed by .5 and .5.
SVGPLATE_EXPORT QVector<PathToken> tokenizePath(const QString& data);

/// Read every numeric literal from a string using the path-data
/// number grammar.  Used for "points" lists and "viewBox" values.
SVGPLATE_EXPORT QVector<double> parseNumberList(const QString& data);

}  // namespace path
}  // namespace svgplate

#endif  // SVGPLATE_PATH_TOKENIZER_H
