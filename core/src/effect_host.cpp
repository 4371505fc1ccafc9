// Layershift - Effect host

#include <layershift/effect_host.h>
#include <layershift/depth_analysis.h>
#include <layershift/shape_mesh.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace layershift {

namespace {

const char* const IMAGE_EXTENSIONS[] = {".jpg", ".jpeg", ".png", ".webp", ".gif", ".avif", ".bmp", ".tga"};

constexpr const char* DEFAULT_CAMERA_DEVICE = "/dev/video0";

} // namespace

std::optional<MediaKind> parseMediaKind(const std::string& name) {
    if (name == "video") return MediaKind::Video;
    if (name == "image") return MediaKind::Image;
    if (name == "camera") return MediaKind::Camera;
    return std::nullopt;
}

MediaKind guessMediaKind(const std::string& src) {
    std::string lower = src;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const size_t query = lower.find('?');
    if (query != std::string::npos) lower.resize(query);

    for (const char* ext : IMAGE_EXTENSIONS) {
        const std::string e(ext);
        if (lower.size() >= e.size() && lower.compare(lower.size() - e.size(), e.size(), e) == 0) {
            return MediaKind::Image;
        }
    }
    return MediaKind::Video;
}

EffectHost::EffectHost(EffectConfig config, EffectServices services, EventSink sink)
    : m_config(std::move(config))
    , m_services(std::move(services))
    , m_events(m_config.effect, std::move(sink))
    , m_lifecycle(*this) {
    if (!m_services.scheduler || !m_services.surface) {
        throw std::invalid_argument("EffectHost needs a frame scheduler and a render surface");
    }
    m_lifecycle.onError([this](const std::string& message) { m_events.emitError(message); });
}

EffectHost::~EffectHost() {
    doDispose();
}

std::vector<std::string> EffectHost::reinitAttributes() const {
    std::vector<std::string> names = {"src", "depth-src", "depth-meta", "depth-model", "source-type"};
    if (m_config.effect == EffectKind::Portal) names.push_back("logo-src");
    return names;
}

bool EffectHost::canInit(const std::map<std::string, std::string>& attributes) const {
    auto has = [&](const char* name) {
        auto it = attributes.find(name);
        return it != attributes.end() && !it->second.empty();
    };

    if (m_config.effect == EffectKind::Portal && !has("logo-src")) return false;

    auto type = attributes.find("source-type");
    if (type != attributes.end() && type->second == "camera") return true;

    return has("src") && ((has("depth-src") && has("depth-meta")) || has("depth-model"));
}

std::optional<std::string> EffectHost::attr(const std::string& name) const {
    std::optional<std::string> value = m_lifecycle.attribute(name);
    if (value && value->empty()) return std::nullopt;
    return value;
}

MediaKind EffectHost::sourceKind() const {
    if (std::optional<std::string> type = attr("source-type")) {
        if (std::optional<MediaKind> kind = parseMediaKind(*type)) return *kind;
        throw std::invalid_argument("Unknown source-type: " + *type);
    }
    return guessMediaKind(attr("src").value_or(""));
}

glm::vec2 EffectHost::viewportSize() const {
    const ViewportSize size = m_services.surface->viewportSize();
    return {static_cast<float>(std::max(size.width, 1)), static_cast<float>(std::max(size.height, 1))};
}

// -----------------------------------------------------------------------------
// Initialization
// -----------------------------------------------------------------------------

void EffectHost::loadDepth(const InitAttempt& attempt) {
    const std::optional<std::string> depthSrc = attr("depth-src");
    const std::optional<std::string> depthMeta = attr("depth-meta");
    const std::optional<std::string> model = attr("depth-model");

    if (depthSrc && depthMeta) {
        m_frames = std::make_shared<const DepthFrameSet>(loadDepthFrameSet(*depthSrc, *depthMeta));
        m_framePlayer = std::make_unique<DepthFrameInterpolator>(m_frames);
        return;
    }

    if (model) {
        if (!m_services.loadModel) throw std::runtime_error("Depth model support is not available");

        ModelProgressCallback progress = [this](const ModelProgress& p) {
            nlohmann::json detail = {
                {"receivedBytes", p.receivedBytes},
                {"fraction", p.fraction},
                {"label", p.label}
            };
            detail["totalBytes"] = p.totalBytes ? nlohmann::json(*p.totalBytes) : nlohmann::json(nullptr);
            m_events.emit(EventType::ModelDownloadProgress, std::move(detail));
        };
        std::shared_ptr<DepthModel> loaded = m_services.loadModel(*model, progress);
        if (!loaded) throw std::runtime_error("Failed to load depth model: " + *model);
        if (attempt.token.cancelled()) return;

        m_estimator = std::make_unique<DepthEstimator>(loaded, ESTIMATED_DEPTH_SIZE, ESTIMATED_DEPTH_SIZE);

        auto frames = std::make_shared<DepthFrameSet>();
        frames->meta = {1, 1.0, ESTIMATED_DEPTH_SIZE, ESTIMATED_DEPTH_SIZE, 1.0};
        const MediaFrame& frame = m_source->currentFrame();
        if (!m_source->isLive() && !frame.empty()) {
            frames->frames.push_back(m_estimator->submitFrameAndWait(frame.rgba.data(), frame.width, frame.height));
        } else {
            frames->frames.push_back(createFlatDepth(ESTIMATED_DEPTH_SIZE, ESTIMATED_DEPTH_SIZE));
        }
        m_frames = std::move(frames);
        return;
    }

    if (m_source->kind() == MediaKind::Camera) {
        // No depth at all: the camera still shows, flat
        auto frames = std::make_shared<DepthFrameSet>();
        frames->meta = {1, 1.0, m_source->width(), m_source->height(), 1.0};
        frames->frames.push_back(createFlatDepth(m_source->width(), m_source->height()));
        m_frames = std::move(frames);
        m_framePlayer = std::make_unique<DepthFrameInterpolator>(m_frames);
        return;
    }

    throw std::runtime_error("Either depth-src/depth-meta or depth-model must be provided.");
}

RendererSpec EffectHost::buildSpec(nlohmann::json& readyDetail) {
    RendererSpec spec;
    spec.effect = m_config.effect;
    spec.quality = resolveQuality(m_config.quality,
                                  m_services.capabilities ? m_services.capabilities() : DeviceCapabilities{});
    readyDetail["quality"] = qualityTierName(spec.quality.tier);

    m_profile = analyzeDepthFrames(m_frames->frames, m_frames->width(), m_frames->height());
    readyDetail["depthProfile"] = toJson(*m_profile);

    switch (m_config.effect) {
        case EffectKind::Parallax: {
            const DerivedParallaxParams derived = deriveParallaxParams(*m_profile);
            spec.parallax = resolveParallaxSettings(m_config.parallax, derived, m_source->width());
            m_input = ParallaxInput(spec.parallax.motionLerp);
            readyDetail["derivedParams"] = toJson(derived);
            break;
        }
        case EffectKind::RackFocus: {
            const DerivedFocusParams derived = deriveFocusParams(*m_profile);
            spec.rackFocus = resolveRackFocusSettings(m_config.rackFocus, derived);
            readyDetail["derivedParams"] = toJson(derived);
            readyDetail["initialFocusDepth"] = spec.rackFocus.autoFocusDepth;

            m_focus = std::make_unique<FocusController>(focusInputConfig(spec.rackFocus));
            m_focus->onFocusChange([this](const FocusChange& change) {
                m_events.emit(EventType::FocusChange, {
                    {"depth", change.targetDepth},
                    {"durationMs", change.transitionDurationMs},
                    {"source", change.source}
                });
            });
            m_focus->onFocusSettled([this](float depth) {
                m_events.emit(EventType::FocusSettled, {{"depth", depth}});
            });
            if (!m_frames->frames.empty()) {
                m_focus->setDepthData(m_frames->frames.front().data(), m_frames->width(), m_frames->height());
            }

            FocusController* focus = m_focus.get();
            FrameScheduler* scheduler = m_services.scheduler;
            spec.focus = [focus, scheduler]() { return focus->update(scheduler->now()); };
            break;
        }
        case EffectKind::Portal: {
            spec.portal = m_config.portal;
            spec.mesh = generateMeshFromSvgFile(*attr("logo-src"));
            m_input = ParallaxInput(spec.portal.motionLerp);
            readyDetail["triangles"] = spec.mesh.triangleCount();
            break;
        }
    }
    return spec;
}

void EffectHost::doInit(const InitAttempt& attempt) {
    try {
        const MediaKind kind = sourceKind();
        if (!m_services.openMedia) throw std::runtime_error("No media loader configured");

        const std::string src = attr("src").value_or(kind == MediaKind::Camera ? DEFAULT_CAMERA_DEVICE : "");
        m_source = m_services.openMedia(src, kind);
        if (!m_source) throw std::runtime_error("Failed to open source: " + src);
        if (attempt.token.cancelled()) {
            doDispose();
            return;
        }

        loadDepth(attempt);
        if (attempt.token.cancelled()) {
            doDispose();
            return;
        }

        nlohmann::json ready = {
            {"width", m_source->width()},
            {"height", m_source->height()},
            {"duration", m_source->duration()}
        };
        RendererSpec spec = buildSpec(ready);

        if (!m_services.createRenderer) throw std::runtime_error("No graphics device configured");
        m_renderer = m_services.createRenderer(std::move(spec));
        if (!m_renderer) throw std::runtime_error("Failed to create renderer");
        ready["backend"] = m_renderer->backendName();

        m_renderer->setErrorHandler([this](const std::string& message) { m_events.emitError(message); });
        if (m_focus) {
            FocusController* focus = m_focus.get();
            m_renderer->setDepthObserver([focus](const uint8_t* depth, int w, int h) {
                focus->setDepthData(depth, w, h);
            });
        }

        if (!m_renderer->initialize(*m_source, m_frames->width(), m_frames->height())) {
            throw std::runtime_error(m_renderer->error());
        }

        m_loopCount = 0;
        m_source->setLoopCallback([this]() {
            ++m_loopCount;
            m_events.emit(EventType::Loop, {{"loopCount", m_loopCount}});
        });

        DepthProvider* depth = m_estimator ? static_cast<DepthProvider*>(m_estimator.get()) : m_framePlayer.get();
        InputProvider input;
        if (m_config.effect != EffectKind::RackFocus) {
            input = [this]() { return m_input.update(); };
        }
        m_renderer->start(m_source.get(), depth, std::move(input),
                          [this](double time, uint64_t frameIndex) {
                              if (m_estimator && m_source) {
                                  const MediaFrame& frame = m_source->currentFrame();
                                  if (!frame.empty()) {
                                      m_estimator->submitFrame(frame.rgba.data(), frame.width, frame.height);
                                  }
                              }
                              m_events.emit(EventType::Frame, {{"frameIndex", frameIndex}, {"time", time}});
                          });

        if (m_source->isLive() && m_source->kind() != MediaKind::Camera && m_config.autoplay) {
            play();
        }

        if (!m_lifecycle.markInitialized(attempt)) {
            doDispose();
            return;
        }
        std::cout << "[EffectHost] " << effectKindName(m_config.effect) << " ready on "
                  << m_renderer->backendName() << std::endl;
        m_events.emit(EventType::Ready, std::move(ready));
    } catch (...) {
        doDispose();
        throw;
    }
}

void EffectHost::doDispose() {
    if (m_renderer) {
        m_renderer->dispose();
        m_renderer.reset();
    }
    m_focus.reset();
    if (m_estimator) {
        m_estimator->dispose();
        m_estimator.reset();
    }
    m_framePlayer.reset();
    m_frames.reset();
    if (m_source) {
        m_source->setLoopCallback({});
        m_source->dispose();
        m_source.reset();
    }
    m_input.reset();
    m_profile.reset();
    m_loopCount = 0;
}

// -----------------------------------------------------------------------------
// Runtime
// -----------------------------------------------------------------------------

void EffectHost::update(double nowSeconds) {
    if (m_source) m_source->update(nowSeconds);
}

void EffectHost::play() {
    if (!m_source || !m_source->isLive()) return;
    m_source->play();
    m_events.emit(EventType::Play, {{"currentTime", m_source->currentTime()}});
}

void EffectHost::pause() {
    if (!m_source || !m_source->isLive()) return;
    m_source->pause();
    m_events.emit(EventType::Pause, {{"currentTime", m_source->currentTime()}});
}

void EffectHost::pointerMove(float x, float y) {
    const glm::vec2 view = viewportSize();
    if (m_focus) {
        m_focus->pointerMove(x, y, view.x, view.y);
    } else {
        m_input.pointerMove(x, y, view.x, view.y);
    }
}

void EffectHost::pointerLeave() {
    if (m_focus) {
        m_focus->pointerLeave();
    } else {
        m_input.pointerLeave();
    }
}

void EffectHost::click(float x, float y) {
    if (!m_focus) return;
    const glm::vec2 view = viewportSize();
    m_focus->click(x, y, view.x, view.y, m_services.scheduler->now());
}

void EffectHost::scroll(float elementCenterY) {
    if (m_focus) m_focus->scroll(elementCenterY, viewportSize().y);
}

void EffectHost::orientation(float betaDeg, float gammaDeg) {
    if (!m_focus) m_input.orientation(betaDeg, gammaDeg);
}

void EffectHost::resized() {
    if (m_renderer) m_renderer->scheduleResize();
}

void EffectHost::deviceLost(const std::string& reason) {
    if (m_renderer) m_renderer->deviceLost(reason);
}

void EffectHost::deviceRestored() {
    if (!m_renderer) return;
    if (m_renderer->contextRestored()) return;

    std::cout << "[EffectHost] Rebuilding " << effectKindName(m_config.effect) << " after device loss" << std::endl;
    m_lifecycle.onDisconnect();
    m_lifecycle.onConnect();
}

} // namespace layershift
