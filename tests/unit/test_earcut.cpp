/**
 * @file test_earcut.cpp
 * @brief Ear-clipping triangulation with holes
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <layershift/earcut.h>
#include <cmath>

using namespace layershift;
using Catch::Matchers::WithinAbs;

namespace {

double triangleArea(const std::vector<float>& coords, uint32_t a, uint32_t b, uint32_t c) {
    const double ax = coords[a * 2], ay = coords[a * 2 + 1];
    const double bx = coords[b * 2], by = coords[b * 2 + 1];
    const double cx = coords[c * 2], cy = coords[c * 2 + 1];
    return std::abs((bx - ax) * (cy - ay) - (cx - ax) * (by - ay)) * 0.5;
}

double totalArea(const std::vector<float>& coords, const std::vector<uint32_t>& indices) {
    double sum = 0.0;
    for (size_t i = 0; i + 2 < indices.size(); i += 3) {
        sum += triangleArea(coords, indices[i], indices[i + 1], indices[i + 2]);
    }
    return sum;
}

bool hasZeroAreaTriangle(const std::vector<float>& coords, const std::vector<uint32_t>& indices) {
    for (size_t i = 0; i + 2 < indices.size(); i += 3) {
        if (triangleArea(coords, indices[i], indices[i + 1], indices[i + 2]) < 1e-9) return true;
    }
    return false;
}

void appendRing(std::vector<float>& coords, double cx, double cy, double r, int n, bool clockwise) {
    for (int i = 0; i < n; ++i) {
        const double t = 2.0 * 3.14159265358979 * i / n * (clockwise ? -1.0 : 1.0);
        coords.push_back(static_cast<float>(cx + r * std::cos(t)));
        coords.push_back(static_cast<float>(cy + r * std::sin(t)));
    }
}

} // namespace

TEST_CASE("Earcut simple polygons", "[earcut]") {
    SECTION("square") {
        std::vector<float> square = {0, 0, 10, 0, 10, 10, 0, 10};
        std::vector<uint32_t> tris = earcut(square);
        REQUIRE(tris.size() == 6);
        REQUIRE_THAT(totalArea(square, tris), WithinAbs(100.0, 1e-6));
    }

    SECTION("winding does not matter") {
        std::vector<float> square = {0, 0, 0, 10, 10, 10, 10, 0};
        std::vector<uint32_t> tris = earcut(square);
        REQUIRE(tris.size() == 6);
        REQUIRE_THAT(totalArea(square, tris), WithinAbs(100.0, 1e-6));
    }

    SECTION("concave L shape") {
        std::vector<float> l = {0, 0, 4, 0, 4, 1, 1, 1, 1, 4, 0, 4};
        std::vector<uint32_t> tris = earcut(l);
        REQUIRE(tris.size() == 4 * 3);
        REQUIRE_THAT(totalArea(l, tris), WithinAbs(7.0, 1e-6));
        REQUIRE_FALSE(hasZeroAreaTriangle(l, tris));
    }

    SECTION("fewer than three vertices") {
        REQUIRE(earcut({0, 0, 1, 1}).empty());
        REQUIRE(earcut({}).empty());
    }
}

TEST_CASE("Earcut with holes", "[earcut][holes]") {
    SECTION("square with a square hole") {
        std::vector<float> coords = {0, 0, 10, 0, 10, 10, 0, 10,
                                     3, 3, 3, 7, 7, 7, 7, 3};
        std::vector<uint32_t> tris = earcut(coords, {4});
        // N + 2H - 2 with N = 8 vertices, H = 1 hole
        REQUIRE(tris.size() / 3 == 8);
        REQUIRE_THAT(totalArea(coords, tris), WithinAbs(100.0 - 16.0, 1e-6));
        REQUIRE_FALSE(hasZeroAreaTriangle(coords, tris));
    }

    SECTION("two holes") {
        std::vector<float> coords = {0, 0, 20, 0, 20, 10, 0, 10,
                                     2, 2, 2, 8, 8, 8, 8, 2,
                                     12, 2, 12, 8, 18, 8, 18, 2};
        std::vector<uint32_t> tris = earcut(coords, {4, 8});
        REQUIRE_FALSE(tris.empty());
        REQUIRE_FALSE(hasZeroAreaTriangle(coords, tris));
        REQUIRE_THAT(totalArea(coords, tris), WithinAbs(200.0 - 72.0, 1e-5));
    }

    SECTION("indices stay in range") {
        std::vector<float> coords = {0, 0, 10, 0, 10, 10, 0, 10,
                                     3, 3, 3, 7, 7, 7, 7, 3};
        for (uint32_t index : earcut(coords, {4})) {
            REQUIRE(index < 8);
        }
    }
}

TEST_CASE("Earcut large rings use the z-order index", "[earcut][hash]") {
    std::vector<float> coords;
    appendRing(coords, 0.0, 0.0, 100.0, 120, false);
    appendRing(coords, 0.0, 0.0, 40.0, 40, true);

    std::vector<uint32_t> tris = earcut(coords, {120});
    REQUIRE_FALSE(hasZeroAreaTriangle(coords, tris));

    const double outer = std::abs(earcutSignedArea(coords, 0, 240)) * 0.5;
    const double hole = std::abs(earcutSignedArea(coords, 240, coords.size())) * 0.5;
    REQUIRE_THAT(totalArea(coords, tris), WithinAbs(outer - hole, outer * 1e-4));
}

TEST_CASE("Earcut signed area", "[earcut]") {
    std::vector<float> square = {0, 0, 1, 0, 1, 1, 0, 1};
    REQUIRE_THAT(std::abs(earcutSignedArea(square, 0, square.size())), WithinAbs(2.0, 1e-9));

    std::vector<float> reversed = {0, 1, 1, 1, 1, 0, 0, 0};
    REQUIRE(earcutSignedArea(square, 0, 8) == -earcutSignedArea(reversed, 0, 8));
}
