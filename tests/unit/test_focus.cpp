/**
 * @file test_focus.cpp
 * @brief Focus spring and rack focus input state machine
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <layershift/focus_controller.h>
#include <algorithm>
#include <cmath>

using namespace layershift;
using Catch::Matchers::WithinAbs;

namespace {

// Left half near (50), right half far (200)
std::vector<uint8_t> splitDepth() {
    std::vector<uint8_t> depth(100 * 10);
    for (int y = 0; y < 10; ++y) {
        for (int x = 0; x < 100; ++x) depth[y * 100 + x] = x < 50 ? 50 : 200;
    }
    return depth;
}

} // namespace

TEST_CASE("Focus mode names", "[focus]") {
    REQUIRE(parseFocusMode("auto") == FocusMode::Auto);
    REQUIRE(parseFocusMode("programmatic") == FocusMode::Programmatic);
    REQUIRE_FALSE(parseFocusMode("hover").has_value());
    REQUIRE(std::string(focusModeName(FocusMode::Scroll)) == "scroll");
}

TEST_CASE("Spring approaches without overshoot", "[focus][spring]") {
    const float durationMs = GENERATE(60.0f, 300.0f, 500.0f);
    const float dt = GENERATE(1.0f / 120.0f, 1.0f / 60.0f, 1.0f / 30.0f);

    CriticallyDampedSpring spring(0.0f);
    spring.setTarget(1.0f);

    float previous = spring.value();
    float elapsed = 0.0f;
    bool checkedAtDuration = false;
    while (elapsed < durationMs * 4.0f / 1000.0f) {
        spring.tick(dt, durationMs);
        elapsed += dt;
        REQUIRE(spring.value() >= previous);
        REQUIRE(spring.value() <= 1.0f);
        previous = spring.value();
        if (!checkedAtDuration && elapsed >= durationMs / 1000.0f) {
            REQUIRE(1.0f - spring.value() <= 0.1f);
            checkedAtDuration = true;
        }
    }
    REQUIRE(spring.settled());
    REQUIRE(spring.value() == 1.0f);
}

TEST_CASE("Spring details", "[focus][spring]") {
    SECTION("trajectories are reproducible") {
        CriticallyDampedSpring a(0.2f), b(0.2f);
        a.setTarget(0.9f);
        b.setTarget(0.9f);
        for (int i = 0; i < 20; ++i) {
            a.tick(0.016f, 250.0f);
            b.tick(0.016f, 250.0f);
            REQUIRE(a.value() == b.value());
        }
    }

    SECTION("long frames are capped") {
        CriticallyDampedSpring capped(0.0f), step(0.0f);
        capped.setTarget(1.0f);
        step.setTarget(1.0f);
        capped.tick(1.0f, 300.0f);
        step.tick(CriticallyDampedSpring::MAX_STEP_SECONDS, 300.0f);
        REQUIRE(capped.value() == step.value());
    }

    SECTION("targets clamp to [0, 1]") {
        CriticallyDampedSpring spring;
        spring.setTarget(3.0f);
        REQUIRE(spring.target() == 1.0f);
        spring.snapTo(-2.0f);
        REQUIRE(spring.value() == 0.0f);
        REQUIRE(spring.settled());
        REQUIRE(spring.progress() == 0.0f);
    }
}

TEST_CASE("Transition duration", "[focus]") {
    REQUIRE_THAT(computeTransitionDuration(0.0f, 1.0f, 300.0f), WithinAbs(300.0, 1e-4));
    REQUIRE_THAT(computeTransitionDuration(0.5f, 0.55f, 300.0f), WithinAbs(60.0, 1e-4));
    REQUIRE_THAT(computeTransitionDuration(0.0f, 1.0f, 1000.0f), WithinAbs(500.0, 1e-4));
    REQUIRE_THAT(computeTransitionDuration(0.2f, 0.6f, 400.0f), WithinAbs(160.0, 1e-3));
}

TEST_CASE("Depth sampling under the pointer", "[focus]") {
    std::vector<uint8_t> depth = splitDepth();
    REQUIRE_THAT(sampleDepthAtUV(depth.data(), 100, 10, 0.75f, 0.5f), WithinAbs(200.0 / 255.0, 1e-6));
    // Edges are pulled in before the 3x3 mean
    REQUIRE_THAT(sampleDepthAtUV(depth.data(), 100, 10, 0.0f, 0.0f), WithinAbs(50.0 / 255.0, 1e-6));
    // Straddling the boundary averages both sides
    const float mixed = sampleDepthAtUV(depth.data(), 100, 10, 50.0f / 99.0f, 0.5f);
    REQUIRE(mixed > 50.0f / 255.0f);
    REQUIRE(mixed < 200.0f / 255.0f);
    REQUIRE(sampleDepthAtUV(nullptr, 100, 10, 0.5f, 0.5f) == 0.0f);
}

TEST_CASE("Focus controller input", "[focus][controller]") {
    std::vector<uint8_t> depth = splitDepth();
    FocusInputConfig config;
    config.autoFocusDepth = 0.4f;

    std::vector<FocusChange> changes;
    auto attach = [&](FocusController& c) {
        c.setDepthData(depth.data(), 100, 10);
        c.onFocusChange([&](const FocusChange& change) { changes.push_back(change); });
    };

    SECTION("auto mode tracks the pointer and reverts on leave") {
        FocusController focus(config);
        attach(focus);

        focus.pointerMove(75, 50, 100, 100);
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].source == "pointer");
        REQUIRE_THAT(focus.targetDepth(), WithinAbs(200.0 / 255.0, 1e-6));

        // Same region: within the hysteresis band
        focus.pointerMove(80, 40, 100, 100);
        REQUIRE(changes.size() == 1);

        focus.pointerLeave();
        REQUIRE(changes.size() == 2);
        REQUIRE(changes[1].source == "leave");
        REQUIRE(changes[1].transitionDurationMs >= FOCUS_EXIT_MIN_DURATION_MS);
        REQUIRE_THAT(focus.targetDepth(), WithinAbs(0.4, 1e-6));
    }

    SECTION("pointer mode holds on leave") {
        config.mode = FocusMode::Pointer;
        FocusController focus(config);
        attach(focus);

        focus.pointerMove(20, 50, 100, 100);
        focus.pointerLeave();
        REQUIRE(changes.size() == 1);
        REQUIRE_THAT(focus.targetDepth(), WithinAbs(50.0 / 255.0, 1e-6));
    }

    SECTION("programmatic mode ignores input") {
        config.mode = FocusMode::Programmatic;
        FocusController focus(config);
        attach(focus);

        focus.pointerMove(75, 50, 100, 100);
        focus.click(75, 50, 100, 100, 0.0);
        focus.scroll(10.0f, 100.0f);
        REQUIRE(changes.empty());

        focus.setFocusDepth(0.9f);
        REQUIRE(changes.size() == 1);
        REQUIRE(changes[0].source == "api");
        REQUIRE_THAT(changes[0].transitionDurationMs, WithinAbs(150.0, 1e-3));

        focus.setFocusDepth(0.1f, 42.0f);
        REQUIRE(changes.back().transitionDurationMs == 42.0f);
    }

    SECTION("scroll mode maps the element position") {
        config.mode = FocusMode::Scroll;
        FocusController focus(config);
        attach(focus);

        focus.scroll(0.0f, 100.0f);
        REQUIRE_THAT(focus.targetDepth(), WithinAbs(0.0, 1e-6));
        focus.scroll(100.0f, 100.0f);
        REQUIRE_THAT(focus.targetDepth(), WithinAbs(1.0, 1e-6));
        focus.scroll(25.0f, 100.0f);
        REQUIRE_THAT(focus.targetDepth(), WithinAbs(0.25, 1e-6));
        REQUIRE(changes.back().source == "scroll");

        // Pointer input does nothing in scroll mode
        const size_t before = changes.size();
        focus.pointerMove(75, 50, 100, 100);
        REQUIRE(changes.size() == before);
    }

    SECTION("auto mode ignores scroll") {
        FocusController focus(config);
        attach(focus);
        focus.scroll(0.0f, 100.0f);
        REQUIRE(changes.empty());
    }

    SECTION("click locks with a minimum hold") {
        FocusController focus(config);
        attach(focus);

        focus.click(75, 50, 100, 100, 1000.0);
        REQUIRE(focus.locked());
        REQUIRE(changes.back().source == "click");

        // Locked: the pointer can't move focus
        focus.pointerMove(20, 50, 100, 100);
        REQUIRE(changes.size() == 1);

        // Too soon to unlock
        focus.click(75, 50, 100, 100, 1200.0);
        REQUIRE(focus.locked());

        // Same depth after the hold unlocks
        focus.click(75, 50, 100, 100, 1500.0);
        REQUIRE_FALSE(focus.locked());
        REQUIRE(changes.size() == 1);

        // A click elsewhere locks on the new depth
        focus.click(20, 50, 100, 100, 1600.0);
        REQUIRE(focus.locked());
        focus.click(75, 50, 100, 100, 2100.0);
        REQUIRE(focus.locked());
        REQUIRE_THAT(focus.targetDepth(), WithinAbs(200.0 / 255.0, 1e-6));
    }

    SECTION("reset clears the lock") {
        FocusController focus(config);
        attach(focus);
        focus.click(75, 50, 100, 100, 0.0);
        focus.resetFocus();
        REQUIRE_FALSE(focus.locked());
        REQUIRE(changes.back().source == "reset");
        REQUIRE_THAT(focus.targetDepth(), WithinAbs(0.4, 1e-6));
    }
}

TEST_CASE("Focus controller update", "[focus][controller]") {
    FocusInputConfig config;
    config.mode = FocusMode::Programmatic;
    config.autoFocusDepth = 0.5f;
    FocusController focus(config);

    int settledCount = 0;
    float settledDepth = -1.0f;
    focus.onFocusSettled([&](float d) {
        ++settledCount;
        settledDepth = d;
    });

    SECTION("at rest") {
        FocusState state = focus.update(0.0);
        REQUIRE(state.focalDepth == 0.5f);
        REQUIRE_FALSE(state.transitioning);
        REQUIRE(state.breathScale == 1.0f);
        REQUIRE(settledCount == 0);
    }

    SECTION("a rack breathes and settles once") {
        focus.update(0.0);
        focus.setFocusDepth(1.0f, 200.0f);

        float maxBreath = 1.0f;
        double now = 0.0;
        for (int i = 0; i < 120; ++i) {
            now += 16.0;
            FocusState state = focus.update(now);
            maxBreath = std::max(maxBreath, state.breathScale);
            REQUIRE_THAT(state.breathOffset.x, WithinAbs((state.breathScale - 1.0f) * 0.5f, 1e-6));
        }
        REQUIRE(maxBreath > 1.0f);
        REQUIRE(maxBreath <= 1.0f + config.breathAmount + 1e-6f);
        REQUIRE(settledCount == 1);
        REQUIRE(settledDepth == 1.0f);
        REQUIRE_FALSE(focus.isTransitioning());
    }

    SECTION("instant focus skips the transition") {
        focus.setFocusDepthInstant(0.8f);
        FocusState state = focus.update(0.0);
        REQUIRE(state.focalDepth == 0.8f);
        REQUIRE_FALSE(state.transitioning);
    }
}
