/**
 * @file test_svg_path.cpp
 * @brief Path data tokenizing, command parsing and curve flattening
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <layershift/svg_path.h>
#include <cmath>

using namespace layershift;
using Catch::Matchers::WithinAbs;

TEST_CASE("SVG path tokenizer", "[svg][tokenize]") {
    REQUIRE(tokenizeSvgPath("M10-5.5.5e2,3") ==
            std::vector<std::string>{"M", "10", "-5.5", ".5e2", "3"});
    REQUIRE(tokenizeSvgPath("  l 1e-3 +4 ") == std::vector<std::string>{"l", "1e-3", "+4"});
    REQUIRE(tokenizeSvgPath("M0,0;#L1 1") == std::vector<std::string>{"M", "0", "0", "L", "1", "1"});
    REQUIRE(tokenizeSvgPath("").empty());
}

TEST_CASE("SVG path commands", "[svg][parse]") {
    SECTION("absolute lines with H and V") {
        auto contours = parseSvgPath("M0 0 H10 V10 H0 Z");
        REQUIRE(contours.size() == 1);
        REQUIRE(contours[0] == Contour{0, 0, 10, 0, 10, 10, 0, 10});
    }

    SECTION("relative commands") {
        auto contours = parseSvgPath("m 1 1 l 2 0 0 2 z");
        REQUIRE(contours.size() == 1);
        REQUIRE(contours[0] == Contour{1, 1, 3, 1, 3, 3});
    }

    SECTION("extra coordinates after M repeat as lineto") {
        REQUIRE(parseSvgPath("M0 0 5 0 5 5 Z")[0] == Contour{0, 0, 5, 0, 5, 5});
        REQUIRE(parseSvgPath("m1 1 2 0 0 2z")[0] == Contour{1, 1, 3, 1, 3, 3});
    }

    SECTION("each Z closes a contour") {
        auto contours = parseSvgPath("M0 0 L1 0 L1 1 Z M5 5 L6 5 L6 6 Z");
        REQUIRE(contours.size() == 2);
        REQUIRE(contours[1][0] == 5.0);
    }

    SECTION("relative move after Z starts from the closed subpath's start") {
        auto contours = parseSvgPath("M10 10 L20 10 L20 20 Z m 1 1 l 1 0 l 0 1 z");
        REQUIRE(contours.size() == 2);
        REQUIRE(contours[1][0] == 11.0);
        REQUIRE(contours[1][1] == 11.0);
    }

    SECTION("open trailing subpath needs three points") {
        REQUIRE(parseSvgPath("M0 0 L10 0 L10 10").size() == 1);
        REQUIRE(parseSvgPath("M0 0 L10 0").empty());
    }

    SECTION("smooth cubic reflects the previous control point") {
        auto contours = parseSvgPath("M0 0 C 0 10 10 10 10 0 S 20 -10 20 0 Z");
        REQUIRE(contours.size() == 1);
        const Contour& c = contours[0];
        // The reflected curve dips below the axis between x = 10 and 20
        bool below = false;
        for (size_t i = 0; i + 1 < c.size(); i += 2) {
            if (c[i] > 10.0 && c[i] < 20.0 && c[i + 1] < -1.0) below = true;
        }
        REQUIRE(below);
        REQUIRE(c[c.size() - 2] == 20.0);
    }

    SECTION("quadratic and smooth quadratic end on their endpoints") {
        auto contours = parseSvgPath("M0 0 Q 5 10 10 0 T 20 0 L 20 -5 Z");
        REQUIRE(contours.size() == 1);
        const Contour& c = contours[0];
        REQUIRE(c[c.size() - 2] == 20.0);
        REQUIRE(c[c.size() - 1] == -5.0);
    }
}

TEST_CASE("Cubic flattening", "[svg][flatten]") {
    SECTION("a straight cubic emits only its end point") {
        Contour out;
        flattenCubicBezier(out, 0, 0, 1, 0, 2, 0, 3, 0);
        REQUIRE(out == Contour{3, 0});
    }

    SECTION("a curved cubic is subdivided") {
        Contour out;
        flattenCubicBezier(out, 0, 0, 0, 100, 100, 100, 100, 0);
        REQUIRE(out.size() > 8);
        REQUIRE(out[out.size() - 2] == 100.0);
        REQUIRE(out[out.size() - 1] == 0.0);
        for (size_t i = 0; i + 1 < out.size(); i += 2) {
            REQUIRE(out[i] >= 0.0);
            REQUIRE(out[i] <= 100.0);
            REQUIRE(out[i + 1] >= 0.0);
            REQUIRE(out[i + 1] <= 75.0 + 1e-9);
        }
    }

    SECTION("degenerate chord") {
        Contour out;
        flattenCubicBezier(out, 5, 5, 9, 9, 1, 1, 5, 5);
        REQUIRE(out == Contour{5, 5});
    }
}

TEST_CASE("Arc flattening", "[svg][arc]") {
    SECTION("semicircle") {
        Contour out;
        flattenSvgArc(out, 0, 0, 5, 5, 0, false, true, 10, 0);
        const size_t points = out.size() / 2;
        REQUIRE(points >= 16);
        REQUIRE(points <= 17);
        for (size_t i = 0; i + 1 < out.size(); i += 2) {
            REQUIRE_THAT(std::hypot(out[i] - 5.0, out[i + 1]), WithinAbs(5.0, 1e-9));
        }
        REQUIRE_THAT(out[out.size() - 2], WithinAbs(10.0, 1e-9));
        REQUIRE_THAT(out[out.size() - 1], WithinAbs(0.0, 1e-9));
    }

    SECTION("radii too small are scaled up") {
        Contour out;
        flattenSvgArc(out, 0, 0, 1, 1, 0, false, false, 10, 0);
        for (size_t i = 0; i + 1 < out.size(); i += 2) {
            REQUIRE_THAT(std::hypot(out[i] - 5.0, out[i + 1]), WithinAbs(5.0, 1e-9));
        }
    }

    SECTION("sweep flag picks the side") {
        Contour cw, ccw;
        flattenSvgArc(cw, 0, 0, 5, 5, 0, false, true, 10, 0);
        flattenSvgArc(ccw, 0, 0, 5, 5, 0, false, false, 10, 0);
        REQUIRE(cw[1] * ccw[1] < 0.0);
    }

    SECTION("zero radius is a straight line") {
        Contour out;
        flattenSvgArc(out, 0, 0, 0, 5, 0, false, true, 10, 0);
        REQUIRE(out == Contour{10, 0});
    }
}

TEST_CASE("Points lists and ellipses", "[svg]") {
    REQUIRE(parseSvgPointsList("0,0 10,0 10,10") == Contour{0, 0, 10, 0, 10, 10});
    REQUIRE(parseSvgPointsList(" 1 2,3 ") == Contour{1, 2});
    REQUIRE(parseSvgPointsList("a,b 1,1") == Contour{1, 1});

    Contour ellipse = ellipseToPolygon(0, 0, 2, 1, 4);
    REQUIRE(ellipse.size() == 8);
    REQUIRE_THAT(ellipse[0], WithinAbs(2.0, 1e-9));
    REQUIRE_THAT(ellipse[3], WithinAbs(1.0, 1e-9));
    REQUIRE_THAT(ellipse[4], WithinAbs(-2.0, 1e-9));
    REQUIRE(ellipseToPolygon(0, 0, 1, 1).size() == static_cast<size_t>(SVG_ELLIPSE_SEGMENTS) * 2);
}
