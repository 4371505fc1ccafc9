/**
 * @file test_parallax_input.cpp
 * @brief Pointer and device-tilt smoothing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <layershift/parallax_input.h>

using namespace layershift;
using Catch::Matchers::WithinAbs;

TEST_CASE("Pointer input", "[input]") {
    ParallaxInput input;
    REQUIRE(input.lerpFactor() == DEFAULT_MOTION_LERP_FACTOR);

    input.pointerMove(300.0f, 0.0f, 400.0f, 200.0f);
    glm::vec2 first = input.update();
    REQUIRE_THAT(first.x, WithinAbs(0.05, 1e-6));
    REQUIRE_THAT(first.y, WithinAbs(-0.1, 1e-6));

    for (int i = 0; i < 200; ++i) input.update();
    REQUIRE_THAT(input.current().x, WithinAbs(0.5, 1e-4));
    REQUIRE_THAT(input.current().y, WithinAbs(-1.0, 1e-4));

    SECTION("leaving recenters") {
        input.pointerLeave();
        for (int i = 0; i < 200; ++i) input.update();
        REQUIRE_THAT(input.current().x, WithinAbs(0.0, 1e-4));
    }

    SECTION("positions outside the view clamp") {
        input.pointerMove(-100.0f, 500.0f, 400.0f, 200.0f);
        for (int i = 0; i < 200; ++i) input.update();
        REQUIRE_THAT(input.current().x, WithinAbs(-1.0, 1e-4));
        REQUIRE_THAT(input.current().y, WithinAbs(1.0, 1e-4));
    }

    SECTION("empty viewport is ignored") {
        input.pointerMove(10.0f, 10.0f, 0.0f, 0.0f);
        const glm::vec2 before = input.current();
        REQUIRE(input.update() == glm::mix(before, glm::vec2(0.5f, -1.0f), DEFAULT_MOTION_LERP_FACTOR));
    }

    SECTION("reset") {
        input.reset();
        REQUIRE(input.current() == glm::vec2(0.0f));
        REQUIRE(input.update() == glm::vec2(0.0f));
    }
}

TEST_CASE("Device tilt takes over from the pointer", "[input]") {
    ParallaxInput input(1.0f);
    input.pointerMove(400.0f, 200.0f, 400.0f, 200.0f);
    REQUIRE(input.update() == glm::vec2(1.0f, 1.0f));

    // gamma -> x, beta -> y
    input.orientation(22.5f, -90.0f);
    REQUIRE(input.usingMotion());
    glm::vec2 v = input.update();
    REQUIRE_THAT(v.x, WithinAbs(-1.0, 1e-6));
    REQUIRE_THAT(v.y, WithinAbs(0.5, 1e-6));

    // Pointer moves no longer steer
    input.pointerMove(0.0f, 0.0f, 400.0f, 200.0f);
    REQUIRE(input.update() == v);
}

TEST_CASE("Tilt readings are smoothed", "[input]") {
    ParallaxInput input;
    input.orientation(0.0f, 45.0f);
    // Target moved 10% of the way, output 10% of that
    REQUIRE_THAT(input.update().x, WithinAbs(0.01, 1e-6));
    REQUIRE(ParallaxInput(2.0f).lerpFactor() == 1.0f);
}
