/**
 * @file test_lifecycle.cpp
 * @brief Init/dispose state machine with superseded attempts
 */

#include <catch2/catch_test_macros.hpp>

#include <layershift/lifecycle.h>
#include <stdexcept>

using namespace layershift;

namespace {

// Records attempts; completion is driven by the test
class FakeEffect : public ManagedEffect {
public:
    std::vector<std::string> reinitAttributes() const override { return {"src", "depth-src"}; }

    void setup() override { ++setups; }
    void doInit(const InitAttempt& attempt) override {
        if (throwOnInit) throw std::runtime_error("decode failed");
        attempts.push_back(attempt);
    }
    void doDispose() override { ++disposals; }

    std::vector<InitAttempt> attempts;
    int setups = 0;
    int disposals = 0;
    bool throwOnInit = false;
};

// Only the source is required
class SourceOnlyEffect : public FakeEffect {
public:
    bool canInit(const std::map<std::string, std::string>& attributes) const override {
        auto it = attributes.find("src");
        return it != attributes.end() && !it->second.empty();
    }
};

} // namespace

TEST_CASE("Lifecycle waits for required attributes", "[lifecycle]") {
    FakeEffect effect;
    LifecycleController lifecycle(effect);

    lifecycle.setAttribute("src", "a.mp4");
    REQUIRE(effect.attempts.empty());      // not connected

    lifecycle.onConnect();
    REQUIRE(effect.setups == 1);
    REQUIRE(effect.attempts.empty());      // depth-src missing
    REQUIRE(lifecycle.state() == LifecycleState::Uninitialized);

    lifecycle.setAttribute("depth-src", "a.bin");
    REQUIRE(effect.attempts.size() == 1);
    REQUIRE(lifecycle.state() == LifecycleState::Initializing);

    REQUIRE(lifecycle.markInitialized(effect.attempts[0]));
    REQUIRE(lifecycle.isInitialized());
    REQUIRE(std::string(lifecycleStateName(lifecycle.state())) == "ready");
}

TEST_CASE("Rapid changes start a single attempt", "[lifecycle]") {
    FakeEffect effect;
    LifecycleController lifecycle(effect);
    lifecycle.onConnect();

    lifecycle.setAttribute("src", "a.mp4");
    lifecycle.setAttribute("depth-src", "a.bin");
    lifecycle.setAttribute("src", "b.mp4");
    lifecycle.setAttribute("src", "c.mp4");

    REQUIRE(effect.attempts.size() == 1);
    REQUIRE(lifecycle.attemptCount() == 1);
    // The running attempt sees the latest values
    REQUIRE(lifecycle.attribute("src") == "c.mp4");

    REQUIRE(lifecycle.markInitialized(effect.attempts[0]));
    REQUIRE(lifecycle.isInitialized());
}

TEST_CASE("Changes after ready re-initialize", "[lifecycle]") {
    FakeEffect effect;
    LifecycleController lifecycle(effect);
    lifecycle.setAttribute("src", "a.mp4");
    lifecycle.setAttribute("depth-src", "a.bin");
    lifecycle.onConnect();
    REQUIRE(lifecycle.markInitialized(effect.attempts.at(0)));

    SECTION("no-op and unwatched changes are ignored") {
        lifecycle.setAttribute("src", "a.mp4");
        lifecycle.setAttribute("parallax-x", "0.6");
        REQUIRE(effect.attempts.size() == 1);
        REQUIRE(effect.disposals == 0);
    }

    SECTION("a watched change disposes and starts over") {
        lifecycle.setAttribute("src", "b.mp4");
        REQUIRE(effect.disposals == 1);
        REQUIRE(effect.setups == 2);
        REQUIRE(effect.attempts.size() == 2);
        REQUIRE(effect.attempts[0].token.cancelled());

        // The old attempt can't mark the effect ready
        REQUIRE_FALSE(lifecycle.markInitialized(effect.attempts[0]));
        REQUIRE(lifecycle.state() == LifecycleState::Initializing);
        REQUIRE(lifecycle.markInitialized(effect.attempts[1]));
    }

    SECTION("removing a required attribute leaves it uninitialized") {
        lifecycle.removeAttribute("depth-src");
        REQUIRE(effect.disposals == 1);
        REQUIRE(effect.attempts.size() == 1);
        REQUIRE(lifecycle.state() == LifecycleState::Uninitialized);
    }

    SECTION("disconnect cancels and disposes") {
        lifecycle.onDisconnect();
        REQUIRE_FALSE(lifecycle.connected());
        REQUIRE(effect.disposals == 1);
        REQUIRE(lifecycle.state() == LifecycleState::Uninitialized);
    }
}

TEST_CASE("Disconnect during initialization", "[lifecycle]") {
    FakeEffect effect;
    LifecycleController lifecycle(effect);
    lifecycle.onConnect();
    lifecycle.setAttribute("src", "a.mp4");
    lifecycle.setAttribute("depth-src", "a.bin");
    REQUIRE(effect.attempts.size() == 1);

    lifecycle.onDisconnect();
    REQUIRE(effect.attempts[0].token.cancelled());
    REQUIRE_FALSE(lifecycle.markInitialized(effect.attempts[0]));
    REQUIRE_FALSE(lifecycle.isInitialized());
}

TEST_CASE("Failed attempts report and allow retry", "[lifecycle]") {
    FakeEffect effect;
    LifecycleController lifecycle(effect);
    std::vector<std::string> errors;
    lifecycle.onError([&](const std::string& msg) { errors.push_back(msg); });
    lifecycle.onConnect();

    SECTION("markFailed") {
        lifecycle.setAttribute("src", "a.mp4");
        lifecycle.setAttribute("depth-src", "a.bin");
        lifecycle.markFailed(effect.attempts[0], "404");
        REQUIRE(errors == std::vector<std::string>{"404"});
        REQUIRE(lifecycle.state() == LifecycleState::Uninitialized);

        lifecycle.setAttribute("src", "b.mp4");
        REQUIRE(effect.attempts.size() == 2);

        // A stale failure is ignored
        lifecycle.markFailed(effect.attempts[0], "late");
        REQUIRE(errors.size() == 1);
    }

    SECTION("exceptions from doInit") {
        effect.throwOnInit = true;
        lifecycle.setAttribute("src", "a.mp4");
        lifecycle.setAttribute("depth-src", "a.bin");
        REQUIRE(errors == std::vector<std::string>{"decode failed"});
        REQUIRE(lifecycle.state() == LifecycleState::Uninitialized);
    }
}

TEST_CASE("canInit", "[lifecycle]") {
    FakeEffect strict;
    REQUIRE_FALSE(strict.canInit({{"src", "a.mp4"}}));
    REQUIRE_FALSE(strict.canInit({{"src", "a.mp4"}, {"depth-src", ""}}));
    REQUIRE(strict.canInit({{"src", "a.mp4"}, {"depth-src", "a.bin"}}));

    SourceOnlyEffect relaxed;
    LifecycleController lifecycle(relaxed);
    lifecycle.onConnect();
    lifecycle.setAttribute("src", "a.mp4");
    REQUIRE(relaxed.attempts.size() == 1);
}
