/**
 * @file test_effect_host.cpp
 * @brief Effect host wiring with injected media, model and renderer
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <layershift/effect_host.h>
#include <filesystem>
#include <fstream>

using namespace layershift;
using Catch::Matchers::ContainsSubstring;

namespace {

class FakeSurface : public RenderSurface {
public:
    ViewportSize viewportSize() const override { return {200, 100}; }
    float devicePixelRatio() const override { return 1.0f; }
};

class FakeVideo : public PresentingMediaSource {
public:
    explicit FakeVideo(MediaKind kind) : m_kind(kind) {
        m_frame.width = 4;
        m_frame.height = 4;
        m_frame.rgba.assign(64, 100);
    }
    MediaKind kind() const override { return m_kind; }
    int width() const override { return 4; }
    int height() const override { return 4; }
    double currentTime() const override { return 0.0; }
    double duration() const override { return 2.0; }
    void play() override { m_paused = false; }
    void pause() override { m_paused = true; }
    bool paused() const override { return m_paused; }

    void wrap() { notifyLoop(); }

private:
    MediaKind m_kind;
    bool m_paused = true;
};

class SplitModel : public DepthModel {
public:
    int inputSize() const override { return 4; }
    DepthModelOutput infer(const std::vector<float>&) override {
        return {{0.0f, 1.0f}, 2, 1};
    }
};

class RecordingRenderer : public RendererCore {
public:
    RecordingRenderer(FrameScheduler& scheduler, const RenderSurface& surface, RendererSpec spec)
        : RendererCore("RecordingRenderer", scheduler, surface, spec.quality)
        , m_spec(std::move(spec)) {}

    bool initialize(const MediaSource& source, int depthWidth, int depthHeight) override {
        configureSource(source, depthWidth, depthHeight);
        recalculateViewport();
        return true;
    }
    const char* backendName() const override { return "recording"; }
    bool rebuildResources() override { return canRebuild; }

    const RendererSpec& spec() const { return m_spec; }
    glm::vec2 lastInput{0.0f};
    bool canRebuild = false;

protected:
    void onDepthUpdate(double t) override { readDepth(t); }
    void onRenderFrame() override { lastInput = readInput(); }
    void onViewportResize() override {}
    void disposeRenderer() override {}

private:
    RendererSpec m_spec;
};

struct Harness {
    FrameScheduler scheduler;
    FakeSurface surface;
    std::vector<Event> events;
    std::vector<std::string> opened;
    int renderersCreated = 0;
    bool canRebuild = false;

    EffectServices services() {
        EffectServices s;
        s.scheduler = &scheduler;
        s.surface = &surface;
        s.openMedia = [this](const std::string& src, MediaKind kind) -> std::unique_ptr<MediaSource> {
            opened.push_back(src);
            if (kind == MediaKind::Image) {
                return std::make_unique<ImageSource>(4, 4, std::vector<uint8_t>(64, 100));
            }
            return std::make_unique<FakeVideo>(kind);
        };
        s.loadModel = [](const std::string&, const ModelProgressCallback& progress) {
            ModelProgress p;
            p.receivedBytes = 10;
            p.totalBytes = 10;
            p.fraction = 1.0;
            p.label = "model";
            progress(p);
            return std::make_shared<SplitModel>();
        };
        s.createRenderer = [this](RendererSpec spec) -> std::unique_ptr<RendererCore> {
            ++renderersCreated;
            auto r = std::make_unique<RecordingRenderer>(scheduler, surface, std::move(spec));
            r->canRebuild = canRebuild;
            return r;
        };
        return s;
    }

    EventSink sink() {
        return [this](const Event& e) { events.push_back(e); };
    }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        for (const Event& e : events) out.push_back(e.name());
        return out;
    }

    const Event* find(EventType type) const {
        for (const Event& e : events) {
            if (e.type == type) return &e;
        }
        return nullptr;
    }
};

EffectConfig configFor(EffectKind kind) {
    EffectConfig config;
    config.effect = kind;
    config.quality = QualityTier::High;
    return config;
}

} // namespace

TEST_CASE("Media kinds", "[host]") {
    REQUIRE(guessMediaKind("photo.JPG") == MediaKind::Image);
    REQUIRE(guessMediaKind("still.png?v=2") == MediaKind::Image);
    REQUIRE(guessMediaKind("clip.mp4") == MediaKind::Video);
    REQUIRE(parseMediaKind("camera") == MediaKind::Camera);
    REQUIRE_FALSE(parseMediaKind("screen").has_value());
}

TEST_CASE("Required attributes per effect", "[host][lifecycle]") {
    Harness h;
    EffectHost parallax(configFor(EffectKind::Parallax), h.services());
    REQUIRE_FALSE(parallax.canInit({{"src", "a.mp4"}}));
    REQUIRE_FALSE(parallax.canInit({{"src", "a.mp4"}, {"depth-src", "a.bin"}}));
    REQUIRE(parallax.canInit({{"src", "a.mp4"}, {"depth-src", "a.bin"}, {"depth-meta", "a.json"}}));
    REQUIRE(parallax.canInit({{"src", "a.mp4"}, {"depth-model", "m.onnx"}}));
    REQUIRE(parallax.canInit({{"source-type", "camera"}}));

    EffectHost portal(configFor(EffectKind::Portal), h.services());
    REQUIRE_FALSE(portal.canInit({{"src", "a.mp4"}, {"depth-model", "m.onnx"}}));
    REQUIRE(portal.canInit({{"src", "a.mp4"}, {"depth-model", "m.onnx"}, {"logo-src", "logo.svg"}}));
    REQUIRE(portal.reinitAttributes().back() == "logo-src");

    REQUIRE_THROWS_AS(EffectHost(configFor(EffectKind::Parallax), EffectServices{}), std::invalid_argument);
}

TEST_CASE("Parallax on a still image with an estimated depth map", "[host]") {
    Harness h;
    EffectHost host(configFor(EffectKind::Parallax), h.services(), h.sink());
    host.lifecycle().onConnect();
    host.lifecycle().setAttribute("src", "still.png");
    host.lifecycle().setAttribute("depth-model", "model.onnx");

    REQUIRE(host.lifecycle().isInitialized());
    REQUIRE(h.opened == std::vector<std::string>{"still.png"});
    REQUIRE(host.source()->kind() == MediaKind::Image);
    REQUIRE(host.estimator() != nullptr);
    REQUIRE(host.estimator()->completedInferences() == 1);
    REQUIRE(host.depthProfile().has_value());

    auto* renderer = dynamic_cast<RecordingRenderer*>(host.renderer());
    REQUIRE(renderer != nullptr);
    REQUIRE(renderer->depthWidth() == ESTIMATED_DEPTH_SIZE);
    REQUIRE(renderer->depthUpdates() == 1);

    REQUIRE(h.names() == std::vector<std::string>{
        "layershift-parallax:model-download-progress",
        "layershift-parallax:ready"
    });
    const Event* ready = h.find(EventType::Ready);
    REQUIRE(ready->detail["backend"] == "recording");
    REQUIRE(ready->detail["quality"] == "high");
    REQUIRE(ready->detail["width"] == 4);
    REQUIRE(ready->detail.contains("derivedParams"));
    REQUIRE(ready->detail["depthProfile"].contains("bimodality"));

    SECTION("pointer input reaches the renderer") {
        host.pointerMove(200.0f, 50.0f);
        h.scheduler.pump(16.0);
        REQUIRE(renderer->lastInput.x > 0.0f);
        REQUIRE(renderer->lastInput.y == 0.0f);
    }

    SECTION("play and pause are ignored for images") {
        host.play();
        host.pause();
        REQUIRE(h.events.size() == 2);
    }

    SECTION("changing the source re-initializes") {
        host.lifecycle().setAttribute("src", "other.jpg");
        REQUIRE(h.renderersCreated == 2);
        REQUIRE(h.opened.back() == "other.jpg");
        REQUIRE(host.lifecycle().isInitialized());
    }
}

TEST_CASE("Video sources autoplay and report loops", "[host]") {
    Harness h;
    EffectHost host(configFor(EffectKind::Parallax), h.services(), h.sink());
    host.lifecycle().setAttribute("src", "clip.mp4");
    host.lifecycle().setAttribute("depth-model", "model.onnx");
    host.lifecycle().onConnect();

    REQUIRE(host.lifecycle().isInitialized());
    REQUIRE_FALSE(host.source()->paused());
    REQUIRE(h.find(EventType::Play) != nullptr);

    static_cast<FakeVideo*>(host.source())->wrap();
    const Event* loop = h.find(EventType::Loop);
    REQUIRE(loop != nullptr);
    REQUIRE(loop->detail["loopCount"] == 1);
    REQUIRE(host.loopCount() == 1);

    host.pause();
    REQUIRE(host.source()->paused());
    REQUIRE(h.names().back() == "layershift-parallax:pause");
}

TEST_CASE("Camera without depth shows flat", "[host][camera]") {
    Harness h;
    EffectConfig config = configFor(EffectKind::Parallax);
    EffectHost host(config, h.services(), h.sink());
    host.lifecycle().onConnect();
    host.lifecycle().setAttribute("source-type", "camera");

    REQUIRE(host.lifecycle().isInitialized());
    REQUIRE(h.opened == std::vector<std::string>{"/dev/video0"});
    REQUIRE(host.estimator() == nullptr);
    // Cameras stream on their own; no play event
    REQUIRE(h.find(EventType::Play) == nullptr);
    REQUIRE(host.depthProfile()->effectiveRange == 0.0f);
}

TEST_CASE("Rack focus wires the focus controller", "[host][focus]") {
    Harness h;
    EffectConfig config = configFor(EffectKind::RackFocus);
    config.rackFocus.focusMode = FocusMode::Pointer;
    EffectHost host(config, h.services(), h.sink());
    host.lifecycle().onConnect();
    host.lifecycle().setAttribute("src", "still.png");
    host.lifecycle().setAttribute("depth-model", "model.onnx");

    REQUIRE(host.focus() != nullptr);
    auto* renderer = dynamic_cast<RecordingRenderer*>(host.renderer());
    REQUIRE(renderer->spec().effect == EffectKind::RackFocus);
    REQUIRE(renderer->spec().focus);
    REQUIRE(h.find(EventType::Ready)->detail.contains("initialFocusDepth"));

    // Right side of the estimated map is far
    host.pointerMove(190.0f, 50.0f);
    const Event* change = h.find(EventType::FocusChange);
    REQUIRE(change != nullptr);
    REQUIRE(change->detail["source"] == "pointer");
    REQUIRE(change->detail["depth"].get<float>() > 0.5f);
}

TEST_CASE("Portal needs a readable outline", "[host][portal]") {
    namespace fs = std::filesystem;
    Harness h;
    EffectHost host(configFor(EffectKind::Portal), h.services(), h.sink());
    host.lifecycle().onConnect();
    host.lifecycle().setAttribute("src", "still.png");
    host.lifecycle().setAttribute("depth-model", "model.onnx");
    REQUIRE(h.opened.empty());

    SECTION("missing file fails the attempt") {
        host.lifecycle().setAttribute("logo-src", "/nonexistent/logo.svg");
        REQUIRE_FALSE(host.lifecycle().isInitialized());
        const Event* error = h.find(EventType::Error);
        REQUIRE(error != nullptr);
        REQUIRE(error->name() == "layershift-portal:error");
        REQUIRE(host.renderer() == nullptr);
        REQUIRE(host.source() == nullptr);
    }

    SECTION("valid outline") {
        const fs::path path = fs::temp_directory_path() / "layershift_host_logo.svg";
        {
            std::ofstream file(path);
            file << R"(<svg><rect x="0" y="0" width="10" height="10"/></svg>)";
        }
        host.lifecycle().setAttribute("logo-src", path.string());
        fs::remove(path);

        REQUIRE(host.lifecycle().isInitialized());
        REQUIRE(h.find(EventType::Ready)->detail["triangles"] == 2);
        auto* renderer = dynamic_cast<RecordingRenderer*>(host.renderer());
        REQUIRE(renderer->spec().mesh.triangleCount() == 2);
    }
}

TEST_CASE("Initialization errors surface as events", "[host][errors]") {
    Harness h;

    SECTION("unknown source type") {
        EffectHost host(configFor(EffectKind::Parallax), h.services(), h.sink());
        host.lifecycle().onConnect();
        host.lifecycle().setAttribute("src", "clip.mp4");
        host.lifecycle().setAttribute("depth-model", "m.onnx");
        host.lifecycle().setAttribute("source-type", "screen");
        REQUIRE_FALSE(host.lifecycle().isInitialized());
        REQUIRE_THAT(h.find(EventType::Error)->detail["message"].get<std::string>(),
                     ContainsSubstring("Unknown source-type"));
    }

    SECTION("no model runtime") {
        EffectServices services = h.services();
        services.loadModel = nullptr;
        EffectHost host(configFor(EffectKind::Parallax), services, h.sink());
        host.lifecycle().onConnect();
        host.lifecycle().setAttribute("src", "clip.mp4");
        host.lifecycle().setAttribute("depth-model", "m.onnx");
        REQUIRE(h.find(EventType::Error)->detail["message"] == "Depth model support is not available");
        REQUIRE(host.source() == nullptr);
    }
}

TEST_CASE("Device loss recovery", "[host][device]") {
    Harness h;
    EffectHost host(configFor(EffectKind::Parallax), h.services(), h.sink());
    host.lifecycle().onConnect();

    SECTION("renderers that rebuild in place keep the instance") {
        h.canRebuild = true;
        host.lifecycle().setAttribute("src", "still.png");
        host.lifecycle().setAttribute("depth-model", "m.onnx");
        RendererCore* before = host.renderer();
        host.deviceLost("reset");
        REQUIRE(before->isDeviceLost());
        host.deviceRestored();
        REQUIRE(host.renderer() == before);
        REQUIRE_FALSE(before->isDeviceLost());
        REQUIRE(h.renderersCreated == 1);
    }

    SECTION("otherwise the effect is rebuilt") {
        host.lifecycle().setAttribute("src", "still.png");
        host.lifecycle().setAttribute("depth-model", "m.onnx");
        host.deviceLost("reset");
        host.deviceRestored();
        REQUIRE(h.renderersCreated == 2);
        REQUIRE(host.lifecycle().isInitialized());
        REQUIRE_FALSE(host.renderer()->isDeviceLost());
    }
}
