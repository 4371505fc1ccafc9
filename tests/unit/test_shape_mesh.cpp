/**
 * @file test_shape_mesh.cpp
 * @brief SVG outline to portal mesh: normalization, nesting, edge and chamfer strips
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <layershift/shape_mesh.h>
#include <cmath>

using namespace layershift;
using Catch::Matchers::WithinAbs;

namespace {

Contour square(double x, double y, double size) {
    return {x, y, x + size, y, x + size, y + size, x, y + size};
}

} // namespace

TEST_CASE("Contour geometry", "[mesh]") {
    Contour ccw = {0, 0, 2, 0, 2, 2, 0, 2};
    REQUIRE_THAT(contourSignedArea(ccw), WithinAbs(4.0, 1e-12));
    Contour cw = {0, 0, 0, 2, 2, 2, 2, 0};
    REQUIRE_THAT(contourSignedArea(cw), WithinAbs(-4.0, 1e-12));

    REQUIRE(pointInContour(1, 1, ccw));
    REQUIRE_FALSE(pointInContour(3, 1, ccw));
    REQUIRE(pointInContour(1, 1, cw));
}

TEST_CASE("Nesting classification", "[mesh][nesting]") {
    // Outer, hole inside it, island inside the hole
    std::vector<Contour> contours = {square(0, 0, 100), square(10, 10, 80), square(30, 30, 20)};

    SECTION("depth parity decides holes") {
        REQUIRE(classifyContoursByNesting(contours) == std::vector<bool>{false, true, false});
    }

    SECTION("winding is ignored") {
        Contour reversed = {10, 10, 10, 90, 90, 90, 90, 10};
        std::vector<Contour> mixed = {square(0, 0, 100), reversed};
        REQUIRE(classifyContoursByNesting(mixed) == std::vector<bool>{false, true});
    }

    SECTION("holes join the smallest containing outer") {
        auto groups = groupContoursWithHoles(contours);
        REQUIRE(groups.size() == 2);
        REQUIRE(groups[0].size() == 2);   // outer + hole
        REQUIRE(groups[1].size() == 1);   // island
    }

    SECTION("disjoint contours stand alone") {
        auto groups = groupContoursWithHoles({square(0, 0, 10), square(20, 0, 5)});
        REQUIRE(groups.size() == 2);
        REQUIRE(groups[0].size() == 1);
        REQUIRE(groups[1].size() == 1);
    }

    SECTION("single contour") {
        auto groups = groupContoursWithHoles({square(0, 0, 10)});
        REQUIRE(groups.size() == 1);
    }
}

TEST_CASE("Mesh from SVG", "[mesh][svg]") {
    SECTION("normalization to clip space with Y up") {
        ShapeMesh mesh = generateMeshFromSvgString(R"(<svg><rect x="0" y="0" width="20" height="10"/></svg>)");
        REQUIRE(mesh.triangleCount() == 2);
        REQUIRE(mesh.aspect == 2.0f);
        REQUIRE_THAT(mesh.bounds.minX, WithinAbs(-1.0, 1e-6));
        REQUIRE_THAT(mesh.bounds.maxX, WithinAbs(1.0, 1e-6));
        REQUIRE_THAT(mesh.bounds.minY, WithinAbs(-0.5, 1e-6));
        REQUIRE_THAT(mesh.bounds.maxY, WithinAbs(0.5, 1e-6));
        // The SVG origin is the top-left corner
        REQUIRE_THAT(mesh.vertices[0], WithinAbs(-1.0, 1e-6));
        REQUIRE_THAT(mesh.vertices[1], WithinAbs(0.5, 1e-6));
    }

    SECTION("path with a hole") {
        ShapeMesh mesh = generateMeshFromSvgString(
            R"(<svg xmlns="http://www.w3.org/2000/svg"><g><path d="M0 0 H10 V10 H0 Z M3 3 H7 V7 H3 Z"/></g></svg>)");
        REQUIRE(mesh.triangleCount() == 8);
        REQUIRE(mesh.contourIsHole == std::vector<bool>{false, true});
        // Each contour is closed by repeating its first point
        REQUIRE(mesh.contourOffsets == std::vector<size_t>{0, 10});
        REQUIRE(mesh.edgeVertices.size() == 20);
        REQUIRE(mesh.edgeVertices[8] == mesh.edgeVertices[0]);
        REQUIRE(mesh.edgeVertices[9] == mesh.edgeVertices[1]);
    }

    SECTION("circle, ellipse, polygon and polyline elements") {
        ShapeMesh circle = generateMeshFromSvgString(R"(<svg><circle cx="5" cy="5" r="5"/></svg>)");
        REQUIRE(circle.triangleCount() == static_cast<size_t>(SVG_ELLIPSE_SEGMENTS - 2));

        ShapeMesh ellipse = generateMeshFromSvgString(R"(<svg><ellipse cx="0" cy="0" rx="4" ry="2"/></svg>)");
        REQUIRE_THAT(ellipse.aspect, WithinAbs(2.0, 1e-3));

        ShapeMesh polygon = generateMeshFromSvgString(R"(<svg><polygon points="0,0 4,0 2,3"/></svg>)");
        REQUIRE(polygon.triangleCount() == 1);

        ShapeMesh polyline = generateMeshFromSvgString(R"(<svg><polyline points="0,0 4,0 4,4 0,4"/></svg>)");
        REQUIRE(polyline.triangleCount() == 2);
    }

    SECTION("errors") {
        REQUIRE_THROWS_AS(generateMeshFromSvgString("<svg><rect"), std::runtime_error);
        REQUIRE_THROWS_AS(generateMeshFromSvgString("<html><body/></html>"), std::runtime_error);
        REQUIRE_THROWS_AS(generateMeshFromSvgString("<svg><text>hi</text></svg>"), std::runtime_error);
        // Collinear outline has zero height
        REQUIRE_THROWS_AS(generateMeshFromSvgString(R"(<svg><polygon points="0,0 1,0 2,0"/></svg>)"),
                          std::runtime_error);
        REQUIRE_THROWS_AS(generateMeshFromSvgFile("/nonexistent/logo.svg"), std::runtime_error);
    }
}

TEST_CASE("Edge strip", "[mesh][edge]") {
    // Closed unit square
    std::vector<float> edge = {0, 0, 1, 0, 1, 1, 0, 1, 0, 0};
    StripMesh strip = buildEdgeMesh(edge);
    REQUIRE(strip.stride == 4);
    REQUIRE(strip.count == 24);
    REQUIRE(strip.vertices.size() == 24 * 4);

    for (uint32_t v = 0; v < strip.count; ++v) {
        const float nx = strip.vertices[v * 4 + 2];
        const float ny = strip.vertices[v * 4 + 3];
        REQUIRE_THAT(std::hypot(nx, ny), WithinAbs(1.0, 1e-6));
    }

    SECTION("degenerate segments are skipped") {
        StripMesh dup = buildEdgeMesh({0, 0, 0, 0, 1, 0});
        REQUIRE(dup.count == 6);
    }

    SECTION("too short") {
        REQUIRE(buildEdgeMesh({0, 0}).count == 0);
    }
}

TEST_CASE("Chamfer ring", "[mesh][chamfer]") {
    ShapeMesh mesh = buildShapeMesh({square(0, 0, 10)});

    SECTION("layout") {
        StripMesh ring = buildChamferMesh(mesh, 0.1f, 45.0f);
        REQUIRE(ring.stride == 6);
        REQUIRE(ring.count == 4 * 6);
        REQUIRE(ring.vertices.size() == ring.count * 6u);

        for (uint32_t v = 0; v < ring.count; ++v) {
            const float* p = &ring.vertices[v * 6];
            const float lerpT = p[5];
            REQUIRE((lerpT == 0.0f || lerpT == 1.0f));
            // Silhouette vertices sit on the square, ring vertices are offset by the width
            const float edgeDist = std::min(1.0f - std::abs(p[0]), 1.0f - std::abs(p[1]));
            if (lerpT == 0.0f) {
                REQUIRE_THAT(edgeDist, WithinAbs(0.0, 1e-5));
            } else {
                REQUIRE(std::abs(edgeDist) > 0.05f);
            }
            REQUIRE_THAT(std::sqrt(p[2] * p[2] + p[3] * p[3] + p[4] * p[4]), WithinAbs(1.0, 1e-5));
        }
    }

    SECTION("zero angle faces the viewer") {
        StripMesh ring = buildChamferMesh(mesh, 0.1f, 0.0f);
        REQUIRE_THAT(ring.vertices[2], WithinAbs(0.0, 1e-6));
        REQUIRE_THAT(ring.vertices[3], WithinAbs(0.0, 1e-6));
        REQUIRE_THAT(ring.vertices[4], WithinAbs(-1.0, 1e-6));
    }

    SECTION("non-positive width yields nothing") {
        REQUIRE(buildChamferMesh(mesh, 0.0f, 45.0f).count == 0);
        REQUIRE(buildChamferMesh(mesh, -1.0f, 45.0f).vertices.empty());
    }
}

TEST_CASE("Portal mesh scale", "[mesh]") {
    glm::vec2 wideViewport = portalMeshScale(1.0f, 2.0f);
    REQUIRE_THAT(wideViewport.x, WithinAbs(0.325, 1e-6));
    REQUIRE_THAT(wideViewport.y, WithinAbs(0.65, 1e-6));

    glm::vec2 wideLogo = portalMeshScale(2.0f, 1.0f);
    REQUIRE_THAT(wideLogo.x, WithinAbs(0.65, 1e-6));
    REQUIRE_THAT(wideLogo.y, WithinAbs(0.325, 1e-6));
}
