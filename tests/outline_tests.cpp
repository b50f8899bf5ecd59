#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <svgplate/outline/decoration.h>
#include <svgplate/outline/nesting.h>
#include <svgplate/outline/normalize.h>
#include <svgplate/outline/outline.h>
#include <svgplate/outline/primitives.h>
#include <svgplate/path/interpreter.h>

using namespace svgplate;
using Catch::Approx;

namespace
{
geometry::Subpath square(double x0, double y0, double x1, double y1)
{
    return outline::rectangleOutline(x0, y0, x1 - x0, y1 - y0);
}

outline::SourceOutline documentWith(QVector<geometry::Subpath> subpaths, double width, double height)
{
    outline::SourceOutline source;
    source.name = QStringLiteral("test");
    source.subpaths = std::move(subpaths);
    source.width = width;
    source.height = height;
    source.viewBox = outline::ViewBox{ 0.0, 0.0, width, height };
    return source;
}
} // namespace

// ---- Primitive shapes ------------------------------------------------

TEST_CASE("Rectangle outline", "[primitives]")
{
    const auto rect{ outline::rectangleOutline(1, 2, 10, 5) };

    REQUIRE(rect.size() == 5);
    REQUIRE(rect[0] == QPointF(1, 2));
    REQUIRE(rect[2] == QPointF(11, 7));
    REQUIRE(rect.first() == rect.last());

    REQUIRE(outline::rectangleOutline(0, 0, 0, 5).isEmpty());
    REQUIRE(outline::rectangleOutline(0, 0, 5, -1).isEmpty());
}

TEST_CASE("Circle and ellipse outlines", "[primitives]")
{
    outline::PrimitiveOptions options;
    options.ellipseSegments = 8;

    const auto circle{ outline::circleOutline(10, 10, 5, options) };
    REQUIRE(circle.size() == 9);
    REQUIRE(circle[0].x() == Approx(15.0));
    REQUIRE(circle[0].y() == Approx(10.0));
    REQUIRE(circle[2].x() == Approx(10.0));
    REQUIRE(circle[2].y() == Approx(15.0));
    REQUIRE(circle.first() == circle.last());

    const auto ellipse{ outline::ellipseOutline(0, 0, 4, 2, options) };
    const geometry::BoundingBox box{ ellipse };
    REQUIRE(box.width() == Approx(8.0));
    REQUIRE(box.height() == Approx(4.0));

    REQUIRE(outline::circleOutline(0, 0, 0).isEmpty());
    REQUIRE(outline::ellipseOutline(0, 0, 3, 0).isEmpty());
    REQUIRE(outline::circleOutline(0, 0, 1).size() == 37);
}

TEST_CASE("Polygon and polyline points", "[primitives]")
{
    SECTION("Polygon is closed")
    {
        const auto polygon{ outline::polygonOutline("0,0 10,0 10,10") };
        REQUIRE(polygon.size() == 4);
        REQUIRE(polygon.last() == QPointF(0, 0));
    }

    SECTION("Odd trailing coordinate is dropped")
    {
        const auto polygon{ outline::polygonOutline("0,0 10,0 10,10 5") };
        REQUIRE(polygon.size() == 4);
    }

    SECTION("Polyline stays open and shares the number grammar")
    {
        const auto polyline{ outline::polylineOutline("0,0 10-5") };
        REQUIRE(polyline.size() == 2);
        REQUIRE(polyline[1] == QPointF(10, -5));
    }

    SECTION("Empty list")
    {
        REQUIRE(outline::polygonOutline("").isEmpty());
        REQUIRE(outline::polylineOutline("  ").isEmpty());
    }
}

// ---- Document attributes ---------------------------------------------

TEST_CASE("Dimensions and viewBox", "[outline]")
{
    REQUIRE(outline::parseDimension("24") == 24.0);
    REQUIRE(outline::parseDimension("10.5mm") == 10.5);
    REQUIRE(outline::parseDimension("200px") == 200.0);
    REQUIRE(outline::parseDimension("1e2px") == 100.0);
    REQUIRE(outline::parseDimension(" 1.5e1mm ") == 15.0);
    REQUIRE(outline::parseDimension("50%") == 50.0);
    REQUIRE(outline::parseDimension("") == outline::DEFAULT_DOCUMENT_SIZE);
    REQUIRE(outline::parseDimension("auto") == outline::DEFAULT_DOCUMENT_SIZE);

    const auto viewBox{ outline::parseViewBox("0,0 24 12") };
    REQUIRE(viewBox.has_value());
    REQUIRE(viewBox->width == 24.0);
    REQUIRE(viewBox->height == 12.0);
    REQUIRE(viewBox->center() == QPointF(12, 6));

    REQUIRE_FALSE(outline::parseViewBox("0 0 24").has_value());
    REQUIRE_FALSE(outline::parseViewBox("").has_value());
}

TEST_CASE("Extrusion style names", "[outline]")
{
    REQUIRE(outline::parseExtrusionStyle("raised") == outline::ExtrusionStyle::Raised);
    REQUIRE(outline::parseExtrusionStyle("Engraved") == outline::ExtrusionStyle::Engraved);
    REQUIRE(outline::parseExtrusionStyle(" CUTOUT ") == outline::ExtrusionStyle::Cutout);
    REQUIRE_FALSE(outline::parseExtrusionStyle("embossed").has_value());
    REQUIRE(outline::extrusionStyleName(outline::ExtrusionStyle::Engraved) == QStringLiteral("engraved"));
}

// ---- Normalizer ------------------------------------------------------

TEST_CASE("Bounding box queries", "[outline]")
{
    geometry::BoundingBox box;
    REQUIRE_FALSE(box.valid);
    REQUIRE(box.area() == 0.0);

    box.include(QPointF(2, 1));
    box.include(QPointF(8, 5));
    REQUIRE(box.valid);
    REQUIRE(box.area() == 24.0);
    REQUIRE(box.center() == QPointF(5, 3));

    REQUIRE(box.contains(geometry::BoundingBox(3, 2, 8, 5)));
    REQUIRE_FALSE(box.contains(geometry::BoundingBox(0, 0, 4, 4)));
}

TEST_CASE("Closure cleanup", "[normalize]")
{
    SECTION("Closing duplicate is removed")
    {
        const auto parsed{ path::parsePath("M 10 10 L 90 10 L 90 90 L 10 90 Z") };
        const auto cleaned{ outline::cleanSubpath(parsed.subpaths[0]) };

        REQUIRE(cleaned.size() == 4);
        REQUIRE(cleaned[0] == QPointF(10, 10));
        REQUIRE(cleaned[1] == QPointF(90, 10));
        REQUIRE(cleaned[2] == QPointF(90, 90));
        REQUIRE(cleaned[3] == QPointF(10, 90));

        const auto nested{ outline::resolveNesting({ cleaned }) };
        REQUIRE(nested.size() == 1);
        REQUIRE(nested[0].level == 0);
        REQUIRE(nested[0].parent == -1);
        REQUIRE(nested[0].role == outline::ProfileRole::Fill);
    }

    SECTION("Three points with coincident ends are dropped")
    {
        const geometry::Subpath spike{ { 0, 0 }, { 5, 5 }, { 0, 0 } };
        REQUIRE(outline::cleanSubpath(spike).isEmpty());
    }

    SECTION("Consecutive near-duplicates are merged")
    {
        const geometry::Subpath points{ { 0, 0 }, { 0, 0.0001 }, { 10, 0 }, { 10, 0 }, { 10, 10 } };
        const auto cleaned{ outline::cleanSubpath(points) };
        REQUIRE(cleaned.size() == 3);
    }

    SECTION("Fewer than three points are dropped")
    {
        const geometry::Subpath line{ { 0, 0 }, { 10, 10 } };
        REQUIRE(outline::cleanSubpath(line).isEmpty());
    }
}

TEST_CASE("Scale to fit preserves aspect ratio", "[normalize]")
{
    const auto source{ documentWith({ square(0, 0, 200, 100) }, 200, 100) };

    const auto frame{ outline::computeFrame(source) };
    REQUIRE(frame.scale == Approx(0.1));

    const auto normalized{ outline::normalizeOutline(source) };
    REQUIRE(normalized.size() == 1);

    const geometry::BoundingBox box{ normalized[0] };
    REQUIRE(box.width() == Approx(20.0));
    REQUIRE(box.height() == Approx(10.0));
    REQUIRE(box.center().x() == Approx(0.0).margin(1e-12));
    REQUIRE(box.center().y() == Approx(0.0).margin(1e-12));
}

TEST_CASE("Y axis points up after normalization", "[normalize]")
{
    const auto source{ documentWith({ square(0, 0, 100, 100) }, 100, 100) };
    const auto normalized{ outline::normalizeOutline(source) };

    // Source top-left corner
    REQUIRE(normalized[0][0].x() == Approx(-10.0));
    REQUIRE(normalized[0][0].y() == Approx(10.0));
}

TEST_CASE("Target size and user scale", "[normalize]")
{
    const auto source{ documentWith({ square(0, 0, 100, 100) }, 100, 100) };

    outline::NormalizeOptions options;
    options.targetSize = 50.0;
    options.userScale = 2.0;

    const geometry::BoundingBox box{ outline::normalizeOutline(source, options)[0] };
    REQUIRE(box.width() == Approx(100.0));
}

TEST_CASE("Missing viewBox extent falls back to content bounds", "[normalize]")
{
    auto source{ documentWith({ square(10, 10, 50, 30) }, 0, 0) };

    const auto frame{ outline::computeFrame(source) };
    REQUIRE(frame.center == QPointF(30, 20));
    REQUIRE(frame.scale == Approx(0.5));

    source.subpaths = { geometry::Subpath{ { 5, 5 }, { 5, 5 } } };
    REQUIRE(outline::computeFrame(source).scale == 1.0);
}

// ---- Nesting ---------------------------------------------------------

TEST_CASE("Nested squares alternate fill and hole", "[nesting]")
{
    const auto outer{ square(0, 0, 100, 100) };
    const auto inner{ square(25, 25, 75, 75) };
    const auto innermost{ square(40, 40, 60, 60) };

    SECTION("Two levels")
    {
        const auto nested{ outline::resolveNesting({ inner, outer }) };

        REQUIRE(nested.size() == 2);
        REQUIRE(nested[0].sourceIndex == 1);
        REQUIRE(nested[0].level == 0);
        REQUIRE(nested[0].role == outline::ProfileRole::Fill);
        REQUIRE(nested[1].level == 1);
        REQUIRE(nested[1].parent == 0);
        REQUIRE(nested[1].role == outline::ProfileRole::Hole);
    }

    SECTION("Three levels")
    {
        const auto nested{ outline::resolveNesting({ innermost, outer, inner }) };

        REQUIRE(nested.size() == 3);
        REQUIRE(nested[0].level == 0);
        REQUIRE(nested[1].level == 1);
        REQUIRE(nested[2].level == 2);
        REQUIRE(nested[2].parent == 1);
        REQUIRE(nested[0].role == outline::ProfileRole::Fill);
        REQUIRE(nested[1].role == outline::ProfileRole::Hole);
        REQUIRE(nested[2].role == outline::ProfileRole::Fill);
    }
}

TEST_CASE("Parent is the smallest containing subpath", "[nesting]")
{
    // Two holes side by side, an island in the second one
    const auto nested{ outline::resolveNesting({
        square(0, 0, 100, 100),
        square(10, 10, 40, 40),
        square(50, 10, 90, 90),
        square(60, 20, 70, 30),
    }) };

    REQUIRE(nested.size() == 4);
    const auto& island{ nested[3] };
    REQUIRE(island.sourceIndex == 3);
    REQUIRE(island.level == 2);
    REQUIRE(nested[island.parent].sourceIndex == 2);
}

TEST_CASE("Disjoint subpaths are all fills", "[nesting]")
{
    const auto nested{ outline::resolveNesting({ square(0, 0, 10, 10), square(20, 0, 30, 10), square(5, 5, 25, 8) }) };

    for (const auto& entry : nested)
    {
        REQUIRE(entry.level == 0);
        REQUIRE(entry.parent == -1);
        REQUIRE(entry.role == outline::ProfileRole::Fill);
    }
}

TEST_CASE("Flat subpaths contain nothing", "[nesting]")
{
    const geometry::Subpath diagonal{ { 0, 0 }, { 10, 10 }, { 20, 20 } };
    const auto nested{ outline::resolveNesting({ square(0, 0, 10, 10), diagonal }) };

    REQUIRE(nested.size() == 2);
    REQUIRE(nested[0].sourceIndex == 1);
    REQUIRE(nested[1].parent == -1);
    REQUIRE(nested[1].role == outline::ProfileRole::Fill);
}

TEST_CASE("Equal areas keep their input order", "[nesting]")
{
    const auto nested{ outline::resolveNesting({ square(0, 0, 10, 10), square(20, 0, 30, 10) }) };

    REQUIRE(nested[0].sourceIndex == 0);
    REQUIRE(nested[1].sourceIndex == 1);
}

// ---- Pipeline --------------------------------------------------------

TEST_CASE("Profile set from a document", "[decoration]")
{
    const auto source{ documentWith({ square(40, 40, 60, 60), square(0, 0, 100, 100), square(25, 25, 75, 75) }, 100, 100) };

    outline::DecorationOptions options;
    options.depth = 3.5;
    options.style = outline::ExtrusionStyle::Engraved;

    const auto profiles{ outline::buildProfileSet(source, options) };

    REQUIRE(profiles.name == QStringLiteral("test"));
    REQUIRE(profiles.profiles.size() == 3);
    REQUIRE(profiles.fillCount() == 2);
    REQUIRE(profiles.holeCount() == 1);
    REQUIRE(profiles.depth == 3.5);
    REQUIRE(profiles.style == outline::ExtrusionStyle::Engraved);

    for (const auto& profile : profiles.profiles)
    {
        REQUIRE(profile.points.size() == 4);
    }

    const auto box{ profiles.bounds() };
    REQUIRE(box.width() == Approx(20.0));
    REQUIRE(box.height() == Approx(20.0));
}

TEST_CASE("Degenerate subpaths vanish from the profile set", "[decoration]")
{
    const auto source{ documentWith({ geometry::Subpath{ { 0, 0 }, { 10, 10 } }, outline::polylineOutline("5,5") }, 100, 100) };

    REQUIRE(outline::buildProfileSet(source).isEmpty());
}

TEST_CASE("Pipeline output is deterministic", "[decoration]")
{
    const auto parsed{ path::parsePath("M12 2C6.48 2 2 6.48 2 12s4.48 10 10 10 10-4.48 10-10S17.52 2 12 2z"
                                       "m0 18c-4.41 0-8-3.59-8-8s3.59-8 8-8 8 3.59 8 8-3.59 8-8 8z") };
    REQUIRE(parsed.ok);

    const auto source{ documentWith(parsed.subpaths, 24, 24) };

    const auto first{ outline::buildProfileSet(source) };
    const auto second{ outline::buildProfileSet(source) };

    REQUIRE(first.profiles.size() == second.profiles.size());
    for (int i = 0; i < first.profiles.size(); ++i)
    {
        const auto& a{ first.profiles[i].points };
        const auto& b{ second.profiles[i].points };
        REQUIRE(a.size() == b.size());
        for (int k = 0; k < a.size(); ++k)
        {
            REQUIRE(a[k].x() == b[k].x());
            REQUIRE(a[k].y() == b[k].y());
        }
        REQUIRE(first.profiles[i].level == second.profiles[i].level);
    }

    REQUIRE(first.fillCount() == 1);
    REQUIRE(first.holeCount() == 1);
}
