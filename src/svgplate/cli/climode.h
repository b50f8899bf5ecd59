// =====================================================================
//  src/svgplate/cli/climode.h — Command-line mode
// =====================================================================
//
//  Headless import: reads one SVG document, builds its profile set,
//  reports a summary and optionally writes the extruded solid as BREP.
//  Uses libsvgplate directly.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef SVGPLATE_CLIMODE_H
#define SVGPLATE_CLIMODE_H

#include <svgplate/outline/decoration.h>
#include <svgplate/svg/import.h>

#include <QString>

namespace svgplate {

/// Settings gathered from the command line
struct CliOptions {
    QString input;
    QString output;                     ///< BREP file; empty = summary only
    svg::ImportOptions import;
    outline::DecorationOptions decoration;
    bool verbose = false;
};

class CliMode {
public:
    /// Exit codes
    static constexpr int ExitSuccess   = 0;
    static constexpr int ExitFailure   = 1;
    static constexpr int ExitNoContent = 2;

    explicit CliMode(const CliOptions& options);

    /// Import the input document and, when requested, write the solid.
    /// Returns one of the exit codes above.
    int runImport();

private:
    void printSummary(const outline::ProfileSet& profiles) const;
    void printProfiles(const outline::ProfileSet& profiles) const;
    int  writeSolid(const outline::ProfileSet& profiles) const;

    CliOptions m_options;
};

}  // namespace svgplate

#endif  // SVGPLATE_CLIMODE_H
