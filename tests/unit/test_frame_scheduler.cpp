/**
 * @file test_frame_scheduler.cpp
 * @brief Frame and timer callbacks driven by pump()
 */

#include <catch2/catch_test_macros.hpp>

#include <layershift/frame_scheduler.h>
#include <string>
#include <vector>

using namespace layershift;

TEST_CASE("Frame callbacks", "[scheduler]") {
    FrameScheduler scheduler;
    std::vector<std::string> log;

    SECTION("run once, in request order, with the pump time") {
        double seen = -1.0;
        scheduler.requestFrame([&](double now) { log.push_back("a"); seen = now; });
        scheduler.requestFrame([&](double) { log.push_back("b"); });
        REQUIRE(scheduler.pendingFrames() == 2);

        scheduler.pump(16.0);
        REQUIRE(log == std::vector<std::string>{"a", "b"});
        REQUIRE(seen == 16.0);
        REQUIRE(scheduler.pendingFrames() == 0);

        scheduler.pump(32.0);
        REQUIRE(log.size() == 2);
    }

    SECTION("requests made during a pump wait for the next one") {
        std::function<void(double)> loop = [&](double) {
            log.push_back("tick");
            scheduler.requestFrame(loop);
        };
        scheduler.requestFrame(loop);
        scheduler.pump(0.0);
        scheduler.pump(16.0);
        scheduler.pump(32.0);
        REQUIRE(log.size() == 3);
    }

    SECTION("cancelled frames do not run") {
        FrameScheduler::Id second = 0;
        scheduler.requestFrame([&](double) { scheduler.cancelFrame(second); });
        second = scheduler.requestFrame([&](double) { log.push_back("cancelled"); });
        scheduler.pump(0.0);
        REQUIRE(log.empty());
    }
}

TEST_CASE("Timers", "[scheduler]") {
    FrameScheduler scheduler;
    std::vector<int> fired;

    scheduler.pump(1000.0);
    scheduler.setTimeout(100.0, [&] { fired.push_back(100); });
    scheduler.setTimeout(50.0, [&] { fired.push_back(50); });
    const auto cleared = scheduler.setTimeout(10.0, [&] { fired.push_back(10); });
    scheduler.clearTimeout(cleared);

    scheduler.pump(1049.0);
    REQUIRE(fired.empty());

    // Both due: deadline order
    scheduler.pump(1200.0);
    REQUIRE(fired == std::vector<int>{50, 100});
    REQUIRE(scheduler.pendingTimers() == 0);

    SECTION("time never runs backwards") {
        scheduler.pump(500.0);
        REQUIRE(scheduler.now() == 1200.0);
    }

    SECTION("frames run before timers") {
        std::vector<std::string> order;
        scheduler.setTimeout(0.0, [&] { order.push_back("timer"); });
        scheduler.requestFrame([&](double) { order.push_back("frame"); });
        scheduler.pump(1300.0);
        REQUIRE(order == std::vector<std::string>{"frame", "timer"});
    }
}
