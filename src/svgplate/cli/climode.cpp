// =====================================================================
//  src/svgplate/cli/climode.cpp — Command-line mode
// =====================================================================
//
//  Import, summarize, extrude.  Progress goes to stdout, warnings and
//  errors to stderr.
//
// =====================================================================

#include "climode.h"

#include <svgplate/brep/extrude.h>
#include <svgplate/brep_io.h>

#include <iostream>

namespace svgplate {

CliMode::CliMode(const CliOptions& options)
    : m_options(options)
{
}

// ---- Single-command: import -----------------------------------------

int CliMode::runImport()
{
    std::cout << "Importing: " << m_options.input.toStdString() << std::endl;

    svg::ImportResult imported = svg::importSVGFile(m_options.input, m_options.import);

    for (const svg::PathError& error : imported.pathErrors) {
        std::cerr << "Warning: path element " << error.elementIndex
                  << " skipped: " << error.message.toStdString();
        if (!error.fragment.isEmpty()) {
            std::cerr << " near \"" << error.fragment.toStdString() << "\"";
        }
        std::cerr << std::endl;
    }

    if (imported.droppedArguments > 0) {
        std::cerr << "Warning: " << imported.droppedArguments
                  << " incomplete argument(s) ignored" << std::endl;
    }
    if (imported.degenerateSegments > 0 && m_options.verbose) {
        std::cout << imported.degenerateSegments
                  << " degenerate segment(s) replaced by lines" << std::endl;
    }

    if (imported.status == svg::ImportStatus::NoContent) {
        std::cerr << "Error: " << imported.errorMessage.toStdString() << std::endl;
        return ExitNoContent;
    }
    if (!imported.success()) {
        std::cerr << "Error: " << imported.errorMessage.toStdString() << std::endl;
        return ExitFailure;
    }

    outline::ProfileSet profiles =
        outline::buildProfileSet(imported.outline, m_options.decoration);

    if (profiles.isEmpty()) {
        std::cerr << "Error: No closed outline left after normalization"
                  << std::endl;
        return ExitNoContent;
    }

    printSummary(profiles);
    if (m_options.verbose) {
        printProfiles(profiles);
    }

    if (m_options.output.isEmpty()) {
        return ExitSuccess;
    }

    return writeSolid(profiles);
}

// ---- Reporting -------------------------------------------------------

void CliMode::printSummary(const outline::ProfileSet& profiles) const
{
    geometry::BoundingBox box = profiles.bounds();

    std::cout << "Outline: " << profiles.name.toStdString() << std::endl;
    std::cout << "  Subpaths: " << profiles.profiles.size()
              << " (" << profiles.fillCount() << " fill, "
              << profiles.holeCount() << " hole)" << std::endl;
    std::cout << "  Extent:   " << box.width() << " x " << box.height()
              << " mm" << std::endl;
    std::cout << "  Depth:    " << profiles.depth << " mm ("
              << outline::extrusionStyleName(profiles.style).toStdString()
              << ")" << std::endl;
}

void CliMode::printProfiles(const outline::ProfileSet& profiles) const
{
    for (int i = 0; i < profiles.profiles.size(); ++i) {
        const outline::NestedSubpath& p = profiles.profiles[i];
        std::cout << "  [" << i << "] "
                  << outline::profileRoleName(p.role).toStdString()
                  << " level=" << p.level
                  << " parent=" << p.parent
                  << " points=" << p.points.size()
                  << " area=" << p.area << std::endl;
    }
}

// ---- Extrusion -------------------------------------------------------

int CliMode::writeSolid(const outline::ProfileSet& profiles) const
{
    brep::OperationResult solid = brep::composeProfiles(profiles);
    if (!solid.success) {
        std::cerr << "Error: " << solid.errorMessage.toStdString() << std::endl;
        return ExitFailure;
    }

    for (const QString& warning : solid.warnings) {
        std::cerr << "Warning: " << warning.toStdString() << std::endl;
    }
    if (solid.skippedProfiles > 0) {
        std::cerr << "Warning: " << solid.skippedProfiles
                  << " profile(s) could not be extruded" << std::endl;
    }

    QString errorMsg;
    if (!brep_io::writeBrep(m_options.output, solid.shape, &errorMsg)) {
        std::cerr << "Error writing output: "
                  << errorMsg.toStdString() << std::endl;
        return ExitFailure;
    }

    std::cout << "Done. Wrote " << m_options.output.toStdString()
              << " (volume " << brep::shapeVolume(solid.shape)
              << " mm^3)" << std::endl;
    return ExitSuccess;
}

}  // namespace svgplate
