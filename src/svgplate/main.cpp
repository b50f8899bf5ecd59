// =====================================================================
//  src/svgplate/main.cpp — svgplate command-line entry point
// =====================================================================
//
//  Parses flags into CliOptions and hands off to CliMode:
//
//    svgplate [options] <input.svg>
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <svgplate/core.h>

#include "cli/climode.h"

#include <QString>

#include <iostream>
#include <optional>

// ---- Helper: command-line flags --------------------------------------

struct StartupFlags {
    bool help    = false;
    bool version = false;
    QString error;              // first bad argument, if any
    svgplate::CliOptions options;
};

static void printUsage()
{
    std::cout
        << "Usage: svgplate [options] <input.svg>\n"
        << "\n"
        << "Options:\n"
        << "  --size <mm>            Target size of the longer viewBox side (default 20)\n"
        << "  --scale <factor>       Extra scale factor (default 1)\n"
        << "  --depth <mm>           Extrusion depth (default 2)\n"
        << "  --style <name>         raised, engraved or cutout (default raised)\n"
        << "  --curve-segments <n>   Segments per Bezier curve (default 10)\n"
        << "  --arc-segments <n>     Segments per elliptical arc (default 20)\n"
        << "  -o, --output <file>    Write the extruded solid as BREP\n"
        << "  --verbose              List every profile\n"
        << "  --help                 Show this help\n"
        << "  --version              Show version information\n";
}

static std::optional<double> positiveNumber(const QString& text)
{
    bool ok = false;
    double value = text.toDouble(&ok);
    if (!ok || value <= 0.0) return std::nullopt;
    return value;
}

static std::optional<int> positiveCount(const QString& text)
{
    bool ok = false;
    int value = text.toInt(&ok);
    if (!ok || value < 1) return std::nullopt;
    return value;
}

static StartupFlags parseFlags(int argc, char* argv[])
{
    StartupFlags flags;
    svgplate::CliOptions& opts = flags.options;

    auto fail = [&](const QString& message) {
        if (flags.error.isEmpty()) flags.error = message;
    };

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);
        bool hasValue = i + 1 < argc;

        if (arg == QLatin1String("--help") || arg == QLatin1String("-h")) {
            flags.help = true;
        }
        else if (arg == QLatin1String("--version")) {
            flags.version = true;
        }
        else if (arg == QLatin1String("--verbose") || arg == QLatin1String("-v")) {
            opts.verbose = true;
        }
        else if ((arg == QLatin1String("--output") || arg == QLatin1String("-o")) && hasValue) {
            opts.output = QString::fromLocal8Bit(argv[++i]);
        }
        else if (arg == QLatin1String("--size") && hasValue) {
            QString value = QString::fromLocal8Bit(argv[++i]);
            if (auto size = positiveNumber(value))
                opts.decoration.normalize.targetSize = *size;
            else
                fail(QStringLiteral("Invalid --size: ") + value);
        }
        else if (arg == QLatin1String("--scale") && hasValue) {
            QString value = QString::fromLocal8Bit(argv[++i]);
            if (auto scale = positiveNumber(value))
                opts.decoration.normalize.userScale = *scale;
            else
                fail(QStringLiteral("Invalid --scale: ") + value);
        }
        else if (arg == QLatin1String("--depth") && hasValue) {
            QString value = QString::fromLocal8Bit(argv[++i]);
            if (auto depth = positiveNumber(value))
                opts.decoration.depth = *depth;
            else
                fail(QStringLiteral("Invalid --depth: ") + value);
        }
        else if (arg == QLatin1String("--style") && hasValue) {
            QString value = QString::fromLocal8Bit(argv[++i]);
            if (auto style = svgplate::outline::parseExtrusionStyle(value))
                opts.decoration.style = *style;
            else
                fail(QStringLiteral("Unknown --style: ") + value);
        }
        else if (arg == QLatin1String("--curve-segments") && hasValue) {
            QString value = QString::fromLocal8Bit(argv[++i]);
            if (auto n = positiveCount(value))
                opts.import.path.curveSegments = *n;
            else
                fail(QStringLiteral("Invalid --curve-segments: ") + value);
        }
        else if (arg == QLatin1String("--arc-segments") && hasValue) {
            QString value = QString::fromLocal8Bit(argv[++i]);
            if (auto n = positiveCount(value))
                opts.import.path.arcSegments = *n;
            else
                fail(QStringLiteral("Invalid --arc-segments: ") + value);
        }
        else if (arg.startsWith(QLatin1Char('-')) && arg.size() > 1) {
            fail(QStringLiteral("Unknown or incomplete option: ") + arg);
        }
        else if (opts.input.isEmpty()) {
            opts.input = arg;
        }
        else {
            fail(QStringLiteral("Unexpected argument: ") + arg);
        }
    }

    return flags;
}

// ---- main ------------------------------------------------------------

int main(int argc, char* argv[])
{
    StartupFlags flags = parseFlags(argc, argv);

    if (flags.help) {
        printUsage();
        return svgplate::CliMode::ExitSuccess;
    }

    if (flags.version) {
        std::cout << "svgplate " << svgplate::version()
                  << " (OpenCASCADE " << svgplate::kernelVersion() << ")"
                  << std::endl;
        return svgplate::CliMode::ExitSuccess;
    }

    if (!flags.error.isEmpty()) {
        std::cerr << "Error: " << flags.error.toStdString() << std::endl;
        return svgplate::CliMode::ExitFailure;
    }

    if (flags.options.input.isEmpty()) {
        std::cerr << "Error: no input file given" << std::endl;
        printUsage();
        return svgplate::CliMode::ExitFailure;
    }

    svgplate::CliMode cli(flags.options);
    return cli.runImport();
}
