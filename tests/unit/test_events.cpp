/**
 * @file test_events.cpp
 * @brief Event naming, emission and payload helpers
 */

#include <catch2/catch_test_macros.hpp>

#include <layershift/events.h>
#include <vector>

using namespace layershift;

TEST_CASE("Event names", "[events]") {
    Event e;
    e.effect = EffectKind::RackFocus;
    e.type = EventType::FocusSettled;
    REQUIRE(e.name() == "layershift-rack-focus:focus-settled");

    e.effect = EffectKind::Portal;
    e.type = EventType::ModelDownloadProgress;
    REQUIRE(e.name() == "layershift-portal:model-download-progress");

    REQUIRE(std::string(eventTypeName(EventType::Loop)) == "loop");
}

TEST_CASE("Event emitter", "[events]") {
    std::vector<Event> received;
    EventEmitter emitter(EffectKind::Parallax, [&](const Event& e) { received.push_back(e); });

    emitter.emit(EventType::Frame, {{"frameNumber", 3}, {"currentTime", 0.1}});
    REQUIRE(received.size() == 1);
    REQUIRE(received[0].effect == EffectKind::Parallax);
    REQUIRE(received[0].type == EventType::Frame);
    REQUIRE(received[0].detail["frameNumber"] == 3);

    emitter.emitError("source failed to load");
    REQUIRE(received.size() == 2);
    REQUIRE(received[1].type == EventType::Error);
    REQUIRE(received[1].detail["message"] == "source failed to load");

    SECTION("no sink is a no-op") {
        EventEmitter silent(EffectKind::Portal);
        silent.emit(EventType::Ready);
        silent.emitError("ignored");
        silent.setSink([&](const Event& e) { received.push_back(e); });
        silent.emit(EventType::Play);
        REQUIRE(received.size() == 3);
        REQUIRE(received.back().name() == "layershift-portal:play");
    }
}

TEST_CASE("Event payloads", "[events]") {
    DepthProfile profile;
    profile.median = 0.5f;
    nlohmann::json p = toJson(profile);
    REQUIRE(p["median"] == 0.5f);
    REQUIRE(p.contains("bimodality"));
    REQUIRE_FALSE(p.contains("histogram"));

    nlohmann::json parallax = toJson(DerivedParallaxParams{});
    REQUIRE(parallax["pomSteps"] == 16);

    nlohmann::json focus = toJson(DerivedFocusParams{});
    REQUIRE(focus["depthScale"] == 50.0f);
}
