#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <svgplate/brep/extrude.h>
#include <svgplate/brep_io.h>
#include <svgplate/outline/decoration.h>
#include <svgplate/svg/import.h>

#include <QTemporaryDir>

#include <algorithm>

using namespace svgplate;
using Catch::Approx;

namespace
{
geometry::Subpath square(double x0, double y0, double x1, double y1)
{
    return geometry::Subpath{ { x0, y0 }, { x1, y0 }, { x1, y1 }, { x0, y1 } };
}

outline::ProfileSet profileSet(const QVector<geometry::Subpath>& subpaths, double depth)
{
    outline::ProfileSet set;
    set.name = QStringLiteral("test");
    set.profiles = outline::resolveNesting(subpaths);
    set.depth = depth;
    return set;
}
} // namespace

TEST_CASE("Extrude a square", "[extrude]")
{
    const auto result{ brep::extrudePolygon(square(0, 0, 10, 10), 2.0) };

    REQUIRE(result.success);
    REQUIRE_FALSE(result.shape.IsNull());
    REQUIRE(brep::shapeVolume(result.shape) == Approx(200.0));

    gp_Pnt minPt;
    gp_Pnt maxPt;
    REQUIRE(brep::shapeBounds(result.shape, minPt, maxPt));
    REQUIRE(minPt.Z() == Approx(0.0).margin(1e-3));
    REQUIRE(maxPt.Z() == Approx(2.0).margin(1e-3));
    REQUIRE(maxPt.X() - minPt.X() == Approx(10.0).margin(1e-3));
    REQUIRE(brep_io::solidCount(result.shape) == 1);
}

TEST_CASE("Clockwise polygons extrude the same way", "[extrude]")
{
    auto points{ square(0, 0, 10, 5) };
    std::reverse(points.begin(), points.end());

    const auto result{ brep::extrudePolygon(points, 1.0) };

    REQUIRE(result.success);
    REQUIRE(brep::shapeVolume(result.shape) == Approx(50.0));
}

TEST_CASE("Extrusion input is validated", "[extrude]")
{
    SECTION("Too few points")
    {
        const auto result{ brep::extrudePolygon(geometry::Subpath{ { 0, 0 }, { 1, 1 } }, 2.0) };
        REQUIRE_FALSE(result.success);
        REQUIRE(result.shape.IsNull());
        REQUIRE_FALSE(result.errorMessage.isEmpty());
    }

    SECTION("Non-positive depth")
    {
        REQUIRE_FALSE(brep::extrudePolygon(square(0, 0, 1, 1), 0.0).success);
        REQUIRE_FALSE(brep::extrudePolygon(square(0, 0, 1, 1), -1.0).success);
    }
}

TEST_CASE("Holes are cut from fills", "[compose]")
{
    const auto outer{ square(0, 0, 10, 10) };
    const auto hole{ square(2.5, 2.5, 7.5, 7.5) };
    const auto island{ square(4, 4, 6, 6) };

    SECTION("Plate with a hole")
    {
        const auto result{ brep::composeProfiles(profileSet({ hole, outer }, 2.0)) };
        REQUIRE(result.success);
        REQUIRE(brep::shapeVolume(result.shape) == Approx(150.0));
    }

    SECTION("Island inside the hole survives")
    {
        const auto result{ brep::composeProfiles(profileSet({ island, hole, outer }, 2.0)) };
        REQUIRE(result.success);
        REQUIRE(brep::shapeVolume(result.shape) == Approx(158.0));
        REQUIRE(brep_io::solidCount(result.shape) == 2);
    }
}

TEST_CASE("Separate fills are fused", "[compose]")
{
    const auto result{ brep::composeProfiles(profileSet({ square(0, 0, 10, 10), square(20, 0, 25, 10) }, 1.0)) };

    REQUIRE(result.success);
    REQUIRE(brep::shapeVolume(result.shape) == Approx(150.0));
}

TEST_CASE("Composition errors", "[compose]")
{
    SECTION("Empty profile set")
    {
        const auto result{ brep::composeProfiles(outline::ProfileSet{}) };
        REQUIRE_FALSE(result.success);
        REQUIRE(result.errorMessage == QStringLiteral("No profiles to extrude"));
    }

    SECTION("Only holes")
    {
        outline::ProfileSet set{ profileSet({ square(0, 0, 10, 10) }, 2.0) };
        set.profiles[0].role = outline::ProfileRole::Hole;

        const auto result{ brep::composeProfiles(set) };
        REQUIRE_FALSE(result.success);
    }

    SECTION("Bad depth")
    {
        const auto result{ brep::composeProfiles(profileSet({ square(0, 0, 10, 10) }, 0.0)) };
        REQUIRE_FALSE(result.success);
        REQUIRE(result.errorMessage.contains(QStringLiteral("depth")));
    }

    SECTION("No fill can be extruded")
    {
        const auto result{ brep::composeProfiles(profileSet({ geometry::Subpath{ { 0, 0 }, { 5, 5 }, { 10, 10 } } }, 2.0)) };
        REQUIRE_FALSE(result.success);
        REQUIRE(result.skippedProfiles == 1);
    }
}

TEST_CASE("Degenerate profiles are skipped", "[compose]")
{
    const auto outer{ square(0, 0, 10, 10) };
    const geometry::Subpath collinear{ { 0, 0 }, { 10, 10 }, { 20, 20 } };

    const auto result{ brep::composeProfiles(profileSet({ outer, collinear }, 2.0)) };

    REQUIRE(result.success);
    REQUIRE(brep::shapeVolume(result.shape) == Approx(200.0));
    REQUIRE(result.skippedProfiles == 1);
    REQUIRE(result.warnings.size() == 1);
    REQUIRE(result.warnings[0].startsWith(QStringLiteral("Profile ")));
}

TEST_CASE("Boolean operations reject null shapes", "[compose]")
{
    const auto solid{ brep::extrudePolygon(square(0, 0, 1, 1), 1.0) };
    REQUIRE(solid.success);

    REQUIRE_FALSE(brep::fuseShapes(solid.shape, TopoDS_Shape()).success);
    REQUIRE_FALSE(brep::cutShape(TopoDS_Shape(), solid.shape).success);
    REQUIRE(brep::shapeVolume(TopoDS_Shape()) == 0.0);
}

TEST_CASE("Document to solid", "[compose]")
{
    const QString svg{
        R"(<svg viewBox="0 0 100 100">
  <rect x="0" y="0" width="100" height="100"/>
  <rect x="25" y="25" width="50" height="50"/>
</svg>)"
    };

    const auto imported{ svg::importSVGString(svg) };
    REQUIRE(imported.success());

    outline::DecorationOptions options;
    options.depth = 3.0;
    const auto profiles{ outline::buildProfileSet(imported.outline, options) };

    const auto result{ brep::composeProfiles(profiles) };
    REQUIRE(result.success);

    // 20 mm plate with a 10 mm square hole
    REQUIRE(brep::shapeVolume(result.shape) == Approx((400.0 - 100.0) * 3.0));
}

TEST_CASE("BREP files", "[brep_io]")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path{ dir.filePath(QStringLiteral("plate.brep")) };

    const auto solid{ brep::extrudePolygon(square(0, 0, 4, 4), 2.0) };
    REQUIRE(solid.success);

    QString error;
    REQUIRE(brep_io::writeBrep(path, solid.shape, &error));

    const auto shape{ brep_io::readBrep(path, &error) };
    REQUIRE_FALSE(shape.IsNull());
    REQUIRE(brep::shapeVolume(shape) == Approx(32.0));

    SECTION("Missing file")
    {
        const auto missing{ brep_io::readBrep(dir.filePath(QStringLiteral("none.brep")), &error) };
        REQUIRE(missing.IsNull());
        REQUIRE(error.startsWith(QStringLiteral("File not found")));
    }

    SECTION("Null shape")
    {
        REQUIRE_FALSE(brep_io::writeBrep(path, TopoDS_Shape(), &error));
    }
}
