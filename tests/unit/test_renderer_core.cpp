/**
 * @file test_renderer_core.cpp
 * @brief Cover-fit math and the presentation/display loop driver
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <layershift/renderer_core.h>
#include <stdexcept>
#include <vector>

using namespace layershift;
using Catch::Matchers::StartsWith;
using Catch::Matchers::WithinAbs;

namespace {

class FakeSurface : public RenderSurface {
public:
    ViewportSize viewportSize() const override { return size; }
    float devicePixelRatio() const override { return dpr; }

    ViewportSize size{800, 400};
    float dpr = 1.0f;
};

class FlatDepth : public DepthProvider {
public:
    FlatDepth(int w, int h) : m_w(w), m_h(h), m_data(static_cast<size_t>(w) * h, 128) {}

    const uint8_t* sample(double timeSeconds) override {
        lastTime = timeSeconds;
        return m_data.data();
    }
    int width() const override { return m_w; }
    int height() const override { return m_h; }

    void resize(int w, int h) {
        m_w = w;
        m_h = h;
        m_data.assign(static_cast<size_t>(w) * h, 128);
    }

    double lastTime = -1.0;

private:
    int m_w, m_h;
    std::vector<uint8_t> m_data;
};

class SteppedVideo : public PresentingMediaSource {
public:
    SteppedVideo() {
        m_frame.width = 1920;
        m_frame.height = 1080;
    }
    MediaKind kind() const override { return MediaKind::Video; }
    int width() const override { return 1920; }
    int height() const override { return 1080; }
    double currentTime() const override { return m_time; }

    void step(double t) {
        m_time = t;
        presentFrame(t);
    }

private:
    double m_time = 0.0;
};

// Live, but without presentation callbacks
class PolledCamera : public MediaSource {
public:
    MediaKind kind() const override { return MediaKind::Camera; }
    int width() const override { return 640; }
    int height() const override { return 480; }
    double currentTime() const override { return time; }
    const MediaFrame& currentFrame() const override { return m_frame; }

    double time = 0.0;

private:
    MediaFrame m_frame;
};

class FakeRenderer : public RendererCore {
public:
    FakeRenderer(FrameScheduler& scheduler, const RenderSurface& surface, QualityTier tier)
        : RendererCore("FakeRenderer", scheduler, surface, paramsForTier(tier)) {}

    bool initialize(const MediaSource& source, int depthWidth, int depthHeight) override {
        configureSource(source, depthWidth, depthHeight);
        recalculateViewport();
        return true;
    }
    const char* backendName() const override { return "fake"; }

    int renders = 0;
    int resizes = 0;
    int disposals = 0;
    bool canRebuild = false;
    bool throwOnRender = false;
    std::vector<double> depthTimes;
    const uint8_t* lastDepth = nullptr;

protected:
    void onDepthUpdate(double t) override {
        lastDepth = readDepth(t);
        depthTimes.push_back(t);
    }
    void onRenderFrame() override {
        ++renders;
        if (throwOnRender) throw std::runtime_error("draw failed");
    }
    void onViewportResize() override { ++resizes; }
    void disposeRenderer() override { ++disposals; }
    bool rebuildResources() override { return canRebuild; }
    glm::vec2 coverFitPadding() const override { return {0.05f, 0.05f}; }
};

} // namespace

TEST_CASE("Cover-fit", "[renderer][coverfit]") {
    SECTION("wider viewport crops the source vertically") {
        UvTransform uv = computeCoverFit(2.0f, 1.0f, 0.0f, 0.0f);
        REQUIRE(uv.scale == glm::vec2(1.0f, 0.5f));
        REQUIRE(uv.offset == glm::vec2(0.0f, 0.25f));
    }

    SECTION("taller viewport crops horizontally") {
        UvTransform uv = computeCoverFit(0.5f, 1.0f, 0.0f, 0.0f);
        REQUIRE(uv.scale == glm::vec2(0.5f, 1.0f));
        REQUIRE(uv.offset == glm::vec2(0.25f, 0.0f));
    }

    SECTION("overscan shrinks the window around the center") {
        UvTransform uv = computeCoverFit(1.0f, 1.0f, 0.05f, 0.05f);
        REQUIRE_THAT(uv.scale.x, WithinAbs(1.0 / 1.2, 1e-6));
        REQUIRE_THAT(uv.offset.x + uv.scale.x * 0.5f, WithinAbs(0.5, 1e-6));
    }

    SECTION("mirroring flips U in place") {
        UvTransform plain = computeCoverFit(1.0f, 1.0f, 0.1f, 0.0f);
        UvTransform mirrored = computeCoverFit(1.0f, 1.0f, 0.1f, 0.0f, true);
        REQUIRE(mirrored.scale.x == -plain.scale.x);
        // screen u = 0 maps to where u = 1 used to
        REQUIRE_THAT(mirrored.offset.x, WithinAbs(plain.offset.x + plain.scale.x, 1e-6));
    }
}

TEST_CASE("Buffer sizes", "[renderer]") {
    REQUIRE(drawingBufferSize({800, 600}, 3.0f, 2.0f) == glm::ivec2(1600, 1200));
    REQUIRE(drawingBufferSize({800, 600}, 1.25f, 2.0f) == glm::ivec2(1000, 750));
    REQUIRE(drawingBufferSize({800, 600}, 0.0f, 2.0f) == glm::ivec2(800, 600));
    REQUIRE(drawingBufferSize({0, 0}, 1.0f, 1.0f) == glm::ivec2(1, 1));

    REQUIRE(dofResolution({1600, 1200}, 2) == glm::ivec2(800, 600));
    REQUIRE(dofResolution({3, 7}, 4) == glm::ivec2(1, 1));
    REQUIRE(dofResolution({10, 10}, 0) == glm::ivec2(10, 10));
}

TEST_CASE("Dual loop driving", "[renderer][loop]") {
    FrameScheduler scheduler;
    FakeSurface surface;
    FakeRenderer renderer(scheduler, surface, QualityTier::Low);
    FlatDepth depth(512, 256);

    SECTION("live source with frame callbacks") {
        SteppedVideo video;
        REQUIRE(renderer.initialize(video, 512, 256));
        REQUIRE(renderer.depthWidth() == 256);
        REQUIRE(renderer.depthHeight() == 128);

        std::vector<uint64_t> frames;
        renderer.start(&video, &depth, nullptr,
                       [&](double, uint64_t index) { frames.push_back(index); });
        REQUIRE(renderer.presentationLoopActive());
        REQUIRE(renderer.depthUpdates() == 0);

        // Display ticks don't touch depth
        scheduler.pump(16.0);
        scheduler.pump(32.0);
        REQUIRE(renderer.displayTicks() == 2);
        REQUIRE(renderer.renders == 2);
        REQUIRE(renderer.depthUpdates() == 0);

        // Presented frames do
        video.step(0.04);
        video.step(0.08);
        REQUIRE(renderer.depthTimes == std::vector<double>{0.04, 0.08});
        REQUIRE(frames == std::vector<uint64_t>{1, 2});
        REQUIRE(depth.lastTime == 0.08);
        REQUIRE(renderer.lastDepth != nullptr);

        renderer.stop();
        REQUIRE_FALSE(renderer.running());
        REQUIRE(video.pendingFrameCallbacks() == 0);
        video.step(0.12);
        scheduler.pump(48.0);
        REQUIRE(renderer.depthUpdates() == 2);
        REQUIRE(renderer.displayTicks() == 2);
    }

    SECTION("static source updates depth once") {
        ImageSource image(4, 2, std::vector<uint8_t>(32, 0));
        renderer.initialize(image, 512, 256);
        renderer.start(&image, &depth, nullptr, nullptr);
        REQUIRE(renderer.depthUpdates() == 1);
        for (int i = 1; i <= 5; ++i) scheduler.pump(i * 16.0);
        REQUIRE(renderer.depthUpdates() == 1);
        REQUIRE(renderer.displayTicks() == 5);
    }

    SECTION("live source without callbacks updates depth per display tick") {
        PolledCamera camera;
        renderer.initialize(camera, 512, 256);
        // Selfie cameras are mirrored
        REQUIRE(renderer.uvTransform().scale.x < 0.0f);

        renderer.start(&camera, &depth, nullptr, nullptr);
        REQUIRE_FALSE(renderer.presentationLoopActive());
        camera.time = 1.5;
        scheduler.pump(16.0);
        scheduler.pump(32.0);
        REQUIRE(renderer.depthUpdates() == 2);
        REQUIRE(renderer.depthTimes.back() == 1.5);
    }

    SECTION("render failures are reported and the loop continues") {
        ImageSource image(4, 2, std::vector<uint8_t>(32, 0));
        std::vector<std::string> errors;
        renderer.setErrorHandler([&](const std::string& msg) { errors.push_back(msg); });
        renderer.initialize(image, 512, 256);
        renderer.start(&image, &depth, nullptr, nullptr);
        renderer.throwOnRender = true;
        scheduler.pump(16.0);
        scheduler.pump(32.0);
        REQUIRE(renderer.displayTicks() == 2);
        REQUIRE(errors.size() == 2);
        REQUIRE_THAT(renderer.error(), StartsWith("Render frame failed"));
    }

    SECTION("depth size changes after initialization are errors") {
        SteppedVideo video;
        std::vector<std::string> errors;
        renderer.setErrorHandler([&](const std::string& msg) { errors.push_back(msg); });
        renderer.initialize(video, 512, 256);
        renderer.start(&video, &depth, nullptr, nullptr);
        depth.resize(100, 100);
        video.step(0.04);
        REQUIRE(errors.size() == 1);
        REQUIRE_THAT(errors[0], StartsWith("Depth update failed"));
        REQUIRE(renderer.depthUpdates() == 0);
    }

    SECTION("dispose releases the renderer") {
        SteppedVideo video;
        renderer.initialize(video, 512, 256);
        renderer.start(&video, &depth, nullptr, nullptr);
        renderer.dispose();
        REQUIRE(renderer.disposals == 1);
        REQUIRE(scheduler.pendingFrames() == 0);
    }
}

TEST_CASE("Viewport and resize debounce", "[renderer][resize]") {
    FrameScheduler scheduler;
    FakeSurface surface;
    surface.dpr = 3.0f;
    FakeRenderer renderer(scheduler, surface, QualityTier::Medium);

    SteppedVideo video;
    renderer.initialize(video, 64, 36);
    REQUIRE(renderer.resizes == 1);
    REQUIRE(renderer.bufferSize() == glm::ivec2(1200, 600));

    scheduler.pump(0.0);
    renderer.scheduleResize();
    scheduler.pump(50.0);
    surface.size = {400, 400};
    renderer.scheduleResize();
    scheduler.pump(120.0);
    REQUIRE(renderer.resizes == 1);

    scheduler.pump(150.0);
    REQUIRE(renderer.resizes == 2);
    REQUIRE(renderer.bufferSize() == glm::ivec2(600, 600));
    REQUIRE(scheduler.pendingTimers() == 0);
}

TEST_CASE("Device loss and restore", "[renderer][device]") {
    FrameScheduler scheduler;
    FakeSurface surface;
    FakeRenderer renderer(scheduler, surface, QualityTier::High);
    FlatDepth depth(8, 8);
    ImageSource image(4, 4, std::vector<uint8_t>(64, 0));

    std::vector<std::string> errors;
    renderer.setErrorHandler([&](const std::string& msg) { errors.push_back(msg); });
    renderer.initialize(image, 8, 8);
    renderer.start(&image, &depth, nullptr, nullptr);
    scheduler.pump(16.0);

    renderer.deviceLost("driver reset");
    REQUIRE(renderer.isDeviceLost());
    REQUIRE(errors == std::vector<std::string>{"GPU device lost: driver reset"});
    scheduler.pump(32.0);
    REQUIRE(renderer.displayTicks() == 1);

    SECTION("no rebuild support") {
        REQUIRE_FALSE(renderer.contextRestored());
        REQUIRE(renderer.isDeviceLost());
    }

    SECTION("in-place rebuild resumes both loops") {
        renderer.canRebuild = true;
        const int resizesBefore = renderer.resizes;
        REQUIRE(renderer.contextRestored());
        REQUIRE_FALSE(renderer.isDeviceLost());
        REQUIRE(renderer.resizes == resizesBefore + 1);
        REQUIRE(renderer.depthUpdates() == 2);
        scheduler.pump(48.0);
        REQUIRE(renderer.displayTicks() == 2);
    }
}
