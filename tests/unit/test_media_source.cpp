/**
 * @file test_media_source.cpp
 * @brief Still images and the frame presentation callback registry
 */

#include <catch2/catch_test_macros.hpp>

#include <layershift/media_source.h>
#include <memory>
#include <string>

using namespace layershift;

namespace {

// Presents a frame whenever the test advances it
class SteppedSource : public PresentingMediaSource {
public:
    SteppedSource() {
        m_frame.width = 2;
        m_frame.height = 2;
        m_frame.rgba.assign(16, 0);
    }

    MediaKind kind() const override { return MediaKind::Video; }
    int width() const override { return m_frame.width; }
    int height() const override { return m_frame.height; }
    double currentTime() const override { return m_time; }

    void step(double time) {
        m_time = time;
        presentFrame(time);
    }
    void wrap() { notifyLoop(); }

private:
    double m_time = 0.0;
};

std::vector<uint8_t> ppm(const std::string& header, std::vector<uint8_t> pixels) {
    std::vector<uint8_t> bytes(header.begin(), header.end());
    bytes.insert(bytes.end(), pixels.begin(), pixels.end());
    return bytes;
}

} // namespace

TEST_CASE("A callback may destroy its source", "[media]") {
    auto source = std::make_unique<SteppedSource>();
    SteppedSource* raw = source.get();

    std::vector<uint64_t> counts;
    source->requestFrameCallback([&](double, uint64_t n) {
        counts.push_back(n);
        source.reset();
    });
    source->requestFrameCallback([&](double, uint64_t n) { counts.push_back(n); });

    // The second callback of the frame still sees its count
    raw->step(0.04);
    REQUIRE(source == nullptr);
    REQUIRE(counts == std::vector<uint64_t>{1, 1});
}

TEST_CASE("Frame callbacks fire once per presented frame", "[media]") {
    SteppedSource source;
    REQUIRE(source.isLive());
    REQUIRE(source.supportsFrameCallbacks());

    std::vector<double> times;
    std::vector<uint64_t> counts;
    source.requestFrameCallback([&](double t, uint64_t n) {
        times.push_back(t);
        counts.push_back(n);
    });

    source.step(0.04);
    source.step(0.08);
    REQUIRE(times == std::vector<double>{0.04});
    REQUIRE(counts == std::vector<uint64_t>{1});
    REQUIRE(source.presentedFrames() == 2);
    REQUIRE(source.currentFrame().serial == 2);

    SECTION("re-registering from a callback waits for the next frame") {
        std::function<void(double, uint64_t)> chain = [&](double t, uint64_t) {
            times.push_back(t);
            source.requestFrameCallback(chain);
        };
        source.requestFrameCallback(chain);
        source.step(0.12);
        REQUIRE(times.size() == 2);
        REQUIRE(source.pendingFrameCallbacks() == 1);
        source.step(0.16);
        REQUIRE(times.size() == 3);
    }

    SECTION("cancelled callbacks never run") {
        auto id = source.requestFrameCallback([&](double t, uint64_t) { times.push_back(t); });
        source.cancelFrameCallback(id);
        source.step(0.12);
        REQUIRE(times.size() == 1);
        REQUIRE(source.pendingFrameCallbacks() == 0);
    }

    SECTION("loop notification") {
        int loops = 0;
        source.setLoopCallback([&] { ++loops; });
        source.wrap();
        REQUIRE(loops == 1);
    }
}

TEST_CASE("Image sources", "[media][image]") {
    SECTION("wrapping pixels") {
        ImageSource image(2, 1, std::vector<uint8_t>(8, 255));
        REQUIRE(image.kind() == MediaKind::Image);
        REQUIRE_FALSE(image.isLive());
        REQUIRE_FALSE(image.supportsFrameCallbacks());
        REQUIRE(image.requestFrameCallback([](double, uint64_t) {}) == 0);
        REQUIRE(image.currentTime() == 0.0);
        REQUIRE(image.currentFrame().serial == 1);

        image.dispose();
        REQUIRE(image.currentFrame().empty());
    }

    SECTION("buffer must match the dimensions") {
        REQUIRE_THROWS_AS(ImageSource(2, 2, std::vector<uint8_t>(8)), std::invalid_argument);
        REQUIRE_THROWS_AS(ImageSource(0, 1, {}), std::invalid_argument);
    }

    SECTION("decoding adds an opaque alpha channel") {
        auto image = decodeImageSource(ppm("P6\n2 1\n255\n", {255, 0, 0, 0, 0, 255}));
        REQUIRE(image->width() == 2);
        REQUIRE(image->height() == 1);
        REQUIRE(image->currentFrame().rgba == std::vector<uint8_t>{255, 0, 0, 255, 0, 0, 255, 255});
    }

    SECTION("decode failures") {
        REQUIRE_THROWS_AS(decodeImageSource({1, 2, 3, 4}), std::runtime_error);
        REQUIRE_THROWS_AS(loadImageSource("/nonexistent/frame.png"), std::runtime_error);
    }

    REQUIRE(std::string(mediaKindName(MediaKind::Camera)) == "camera");
}
