// =====================================================================
//  src/libsvgplate/path/tokenizer.cpp — Path data tokenizer
// =====================================================================
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <svgplate/path/tokenizer.h>

namespace svgplate {
namespace path {

namespace {

bool isDigit(const QString& data, int pos)
{
    return pos < data.length() && data[pos] >= QLatin1Char('0') &&
           data[pos] <= QLatin1Char('9');
}

bool isSign(const QString& data, int pos)
{
    return pos < data.length() &&
           (data[pos] == QLatin1Char('-') || data[pos] == QLatin1Char('+'));
}

/// Measure the numeric literal starting at pos.
/// Returns its length, or 0 if no literal starts there.
int scanNumber(const QString& data, int pos)
{
    int end = pos;

    // Sign
    if (isSign(data, end)) {
        ++end;
    }

    // Integer part
    int intDigits = 0;
    while (isDigit(data, end)) {
        ++end;
        ++intDigits;
    }

    // Decimal part: only one point per literal, so a second '.'
    // starts the next number
    int fracDigits = 0;
    if (end < data.length() && data[end] == QLatin1Char('.')) {
        ++end;
        while (isDigit(data, end)) {
            ++end;
            ++fracDigits;
        }
    }

    if (intDigits == 0 && fracDigits == 0) {
        return 0;
    }

    // Exponent, only when digits follow
    if (end < data.length() &&
        (data[end] == QLatin1Char('e') || data[end] == QLatin1Char('E'))) {
        int expEnd = end + 1;
        if (isSign(data, expEnd)) {
            ++expEnd;
        }
        if (isDigit(data, expEnd)) {
            while (isDigit(data, expEnd)) {
                ++expEnd;
            }
            end = expEnd;
        }
    }

    return end - pos;
}

/// Convert a scanned literal.  Digits are added around a bare
/// decimal point (".5", "5.", "-.5e2") before conversion.
double literalValue(const QString& literal)
{
    QString text = literal;
    int dot = text.indexOf(QLatin1Char('.'));
    if (dot >= 0) {
        if (dot == 0 || !isDigit(text, dot - 1)) {
            text.insert(dot, QLatin1Char('0'));
            ++dot;
        }
        if (!isDigit(text, dot + 1)) {
            text.insert(dot + 1, QLatin1Char('0'));
        }
    }

    bool ok = false;
    double value = text.toDouble(&ok);
    return ok ? value : 0.0;
}

/// Whether the next argument of the active command is an arc flag
bool expectsArcFlag(QChar command, int argIndex)
{
    if (command != QLatin1Char('A') && command != QLatin1Char('a')) {
        return false;
    }
    int slot = argIndex % 7;
    return slot == 3 || slot == 4;
}

}  // anonymous namespace

bool isPathCommand(QChar ch)
{
    switch (ch.unicode()) {
    case 'M': case 'm':
    case 'L': case 'l':
    case 'H': case 'h':
    case 'V': case 'v':
    case 'C': case 'c':
    case 'S': case 's':
    case 'Q': case 'q':
    case 'T': case 't':
    case 'A': case 'a':
    case 'Z': case 'z':
        return true;
    default:
        return false;
    }
}

int commandArgumentCount(QChar command)
{
    switch (command.toUpper().unicode()) {
    case 'M':
    case 'L':
    case 'T':
        return 2;
    case 'H':
    case 'V':
        return 1;
    case 'C':
        return 6;
    case 'S':
    case 'Q':
        return 4;
    case 'A':
        return 7;
    default:
        return 0;
    }
}

QVector<PathToken> tokenizePath(const QString& data)
{
    QVector<PathToken> tokens;

    QChar activeCommand;
    int argIndex = 0;
    int pos = 0;

    while (pos < data.length()) {
        QChar ch = data[pos];

        if (isPathCommand(ch)) {
            PathToken token;
            token.type = PathToken::Type::Command;
            token.command = ch;
            token.text = QString(ch);
            tokens.append(token);

            activeCommand = ch;
            argIndex = 0;
            ++pos;
            continue;
        }

        if (expectsArcFlag(activeCommand, argIndex) &&
            (ch == QLatin1Char('0') || ch == QLatin1Char('1'))) {
            PathToken token;
            token.value = ch.digitValue();
            token.text = QString(ch);
            tokens.append(token);

            ++argIndex;
            ++pos;
            continue;
        }

        int length = scanNumber(data, pos);
        if (length > 0) {
            PathToken token;
            token.text = data.mid(pos, length);
            token.value = literalValue(token.text);
            tokens.append(token);

            ++argIndex;
            pos += length;
            continue;
        }

        // Separator or unrecognized character
        ++pos;
    }

    return tokens;
}

QVector<double> parseNumberList(const QString& data)
{
    QVector<double> numbers;

    int pos = 0;
    while (pos < data.length()) {
        int length = scanNumber(data, pos);
        if (length > 0) {
            numbers.append(literalValue(data.mid(pos, length)));
            pos += length;
        } else {
            ++pos;
        }
    }

    return numbers;
}

}  // namespace path
}  // namespace svgplate
