// =====================================================================
//  src/libsvgplate/path/interpreter.cpp — Path data interpreter
// =====================================================================
//
//  Part of libsvgplate.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <svgplate/path/interpreter.h>

namespace svgplate {
namespace path {

using geometry::Subpath;

// =====================================================================
//  Segment Grouping
// =====================================================================

SegmentList groupSegments(const QVector<PathToken>& tokens)
{
    SegmentList list;

    int i = 0;
    bool seenMoveTo = false;

    while (i < tokens.size()) {
        const PathToken& token = tokens[i];

        if (!token.isCommand()) {
            list.ok = false;
            list.errorMessage = QStringLiteral("Numeric data before any command");
            list.fragment = token.text;
            list.segments.clear();
            return list;
        }

        QChar command = token.command;
        if (!seenMoveTo && command.toUpper() != QLatin1Char('M')) {
            list.ok = false;
            list.errorMessage = QStringLiteral("Path data must begin with a moveto");
            list.fragment = token.text;
            list.segments.clear();
            return list;
        }
        seenMoveTo = true;
        ++i;

        int argCount = commandArgumentCount(command);

        if (argCount == 0) {
            list.segments.append(PathSegment{command, {}});
            // ClosePath takes no arguments; stray numbers are dropped
            while (i < tokens.size() && tokens[i].isNumber()) {
                ++list.droppedArguments;
                ++i;
            }
            continue;
        }

        // Repeat the command for each complete argument group
        QChar groupCommand = command;
        while (i < tokens.size() && tokens[i].isNumber()) {
            int available = 0;
            while (available < argCount && i + available < tokens.size() &&
                   tokens[i + available].isNumber()) {
                ++available;
            }

            if (available < argCount) {
                list.droppedArguments += available;
                i += available;
                break;
            }

            PathSegment segment;
            segment.command = groupCommand;
            segment.args.reserve(argCount);
            for (int k = 0; k < argCount; ++k) {
                segment.args.append(tokens[i + k].value);
            }
            list.segments.append(segment);
            i += argCount;

            // Extra pairs after a moveto are implicit linetos
            if (groupCommand == QLatin1Char('M')) {
                groupCommand = QLatin1Char('L');
            } else if (groupCommand == QLatin1Char('m')) {
                groupCommand = QLatin1Char('l');
            }
        }
    }

    return list;
}

// =====================================================================
//  State Transitions
// =====================================================================

namespace {

/// Move the active subpath to the completed list
void pushActive(ParseState& state)
{
    if (!state.active.isEmpty()) {
        state.completed.append(state.active);
    }
    state.active.clear();
    state.activeClosed = false;
}

/// Prepare the active subpath for a drawing command.
/// Drawing after a closepath starts a new subpath at the start point.
void beginDrawing(ParseState& state)
{
    if (state.activeClosed) {
        pushActive(state);
    }
    if (state.active.isEmpty()) {
        state.active.append(state.current);
    }
}

void clearControl(ParseState& state)
{
    state.lastControl.reset();
    state.lastCurve = CurveFamily::None;
}

void lineTo(ParseState& state, const QPointF& point)
{
    beginDrawing(state);
    state.active.append(point);
    state.current = point;
    clearControl(state);
}

/// Append a flattened curve, skipping its first sample (the current point)
void appendCurve(ParseState& state, const FlattenResult& curve)
{
    beginDrawing(state);
    if (curve.degenerate) {
        ++state.degenerateSegments;
    }
    for (int i = 1; i < curve.points.size(); ++i) {
        state.active.append(curve.points[i]);
    }
    if (!curve.points.isEmpty()) {
        state.current = curve.points.last();
    }
}

/// First control point of a smooth curve
QPointF reflectedControl(const ParseState& state, CurveFamily family)
{
    if (state.lastCurve == family && state.lastControl) {
        return state.current * 2.0 - *state.lastControl;
    }
    return state.current;
}

}  // anonymous namespace

ParseState applySegment(
    ParseState state,
    const PathSegment& segment,
    const InterpreterOptions& options)
{
    const QChar command = segment.command;
    const QVector<double>& a = segment.args;
    const bool relative = command.isLower();
    const QPointF origin = relative ? state.current : QPointF(0, 0);

    if (a.size() < commandArgumentCount(command)) {
        return state;
    }

    auto pointAt = [&](int index) {
        return QPointF(a[index], a[index + 1]) + origin;
    };

    switch (command.toUpper().unicode()) {
    case 'M': {
        pushActive(state);
        QPointF p = pointAt(0);
        state.current = p;
        state.subpathStart = p;
        state.active.append(p);
        clearControl(state);
        break;
    }

    case 'L':
        lineTo(state, pointAt(0));
        break;

    case 'H':
        lineTo(state, QPointF(a[0] + origin.x(), state.current.y()));
        break;

    case 'V':
        lineTo(state, QPointF(state.current.x(), a[0] + origin.y()));
        break;

    case 'C': {
        QPointF p1 = pointAt(0);
        QPointF p2 = pointAt(2);
        QPointF p3 = pointAt(4);
        appendCurve(state, flattenCubic(state.current, p1, p2, p3,
                                        options.curveSegments));
        state.lastControl = p2;
        state.lastCurve = CurveFamily::Cubic;
        break;
    }

    case 'S': {
        QPointF p1 = reflectedControl(state, CurveFamily::Cubic);
        QPointF p2 = pointAt(0);
        QPointF p3 = pointAt(2);
        appendCurve(state, flattenCubic(state.current, p1, p2, p3,
                                        options.curveSegments));
        state.lastControl = p2;
        state.lastCurve = CurveFamily::Cubic;
        break;
    }

    case 'Q': {
        QPointF p1 = pointAt(0);
        QPointF p2 = pointAt(2);
        appendCurve(state, flattenQuadratic(state.current, p1, p2,
                                            options.curveSegments));
        state.lastControl = p1;
        state.lastCurve = CurveFamily::Quadratic;
        break;
    }

    case 'T': {
        QPointF p1 = reflectedControl(state, CurveFamily::Quadratic);
        QPointF p2 = pointAt(0);
        appendCurve(state, flattenQuadratic(state.current, p1, p2,
                                            options.curveSegments));
        state.lastControl = p1;
        state.lastCurve = CurveFamily::Quadratic;
        break;
    }

    case 'A': {
        ArcSegment arc;
        arc.start = state.current;
        arc.rx = a[0];
        arc.ry = a[1];
        arc.xAxisRotation = a[2];
        arc.largeArc = !qFuzzyIsNull(a[3]);
        arc.sweep = !qFuzzyIsNull(a[4]);
        arc.end = pointAt(5);
        appendCurve(state, flattenArc(arc, options.arcSegments));
        clearControl(state);
        break;
    }

    case 'Z':
        if (!state.active.isEmpty() && !state.activeClosed) {
            if (state.active.last() != state.subpathStart) {
                state.active.append(state.subpathStart);
            }
            state.activeClosed = true;
        }
        state.current = state.subpathStart;
        clearControl(state);
        break;

    default:
        break;
    }

    return state;
}

QVector<Subpath> finishSubpaths(ParseState state)
{
    pushActive(state);
    return state.completed;
}

// =====================================================================
//  Interpreting
// =====================================================================

ParseResult interpretTokens(
    const QVector<PathToken>& tokens,
    const InterpreterOptions& options)
{
    ParseResult result;

    SegmentList list = groupSegments(tokens);
    result.droppedArguments = list.droppedArguments;
    if (!list.ok) {
        result.ok = false;
        result.errorMessage = list.errorMessage;
        result.fragment = list.fragment;
        return result;
    }

    ParseState state;
    for (const PathSegment& segment : list.segments) {
        state = applySegment(std::move(state), segment, options);
    }

    result.degenerateSegments = state.degenerateSegments;
    result.subpaths = finishSubpaths(std::move(state));
    return result;
}

ParseResult parsePath(const QString& data, const InterpreterOptions& options)
{
    return interpretTokens(tokenizePath(data), options);
}

}  // namespace path
}  // namespace svgplate
