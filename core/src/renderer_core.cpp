// Layershift - Renderer core (dual-loop driver)

#include <layershift/renderer_core.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace layershift {

UvTransform computeCoverFit(float viewportAspect, float sourceAspect,
                            float strength, float overscan, bool mirrorX) {
    UvTransform uv;
    const float extra = strength + overscan;

    if (viewportAspect > sourceAspect) {
        uv.scale.y = sourceAspect / viewportAspect;
    } else {
        uv.scale.x = viewportAspect / sourceAspect;
    }

    const float overscanScale = 1.0f + extra * 2.0f;
    uv.scale /= overscanScale;
    uv.offset = (glm::vec2(1.0f) - uv.scale) * 0.5f;

    if (mirrorX) {
        uv.offset.x += uv.scale.x;
        uv.scale.x = -uv.scale.x;
    }
    return uv;
}

glm::ivec2 drawingBufferSize(ViewportSize logical, float devicePixelRatio, float dprCap) {
    const float dpr = std::min(devicePixelRatio > 0.0f ? devicePixelRatio : 1.0f, dprCap);
    const int w = std::max(1, static_cast<int>(std::lround(std::max(1, logical.width) * dpr)));
    const int h = std::max(1, static_cast<int>(std::lround(std::max(1, logical.height) * dpr)));
    return {w, h};
}

glm::ivec2 dofResolution(glm::ivec2 bufferSize, int divisor) {
    const int d = std::max(1, divisor);
    return {std::max(1, bufferSize.x / d), std::max(1, bufferSize.y / d)};
}

RendererCore::RendererCore(std::string tag, FrameScheduler& scheduler,
                           const RenderSurface& surface, QualityParams quality)
    : m_tag(std::move(tag))
    , m_scheduler(scheduler)
    , m_surface(surface)
    , m_quality(quality) {
}

RendererCore::~RendererCore() {
    // Scheduler callbacks capture this; derived classes release GPU state themselves
    cancelLoops();
    if (m_resizeTimer) {
        m_scheduler.clearTimeout(m_resizeTimer);
        m_resizeTimer = 0;
    }
}

// -----------------------------------------------------------------------------
// Loop control
// -----------------------------------------------------------------------------

void RendererCore::start(MediaSource* source, DepthProvider* depth,
                         InputProvider input, SourceFrameCallback onFrame) {
    stop();
    if (!source) {
        reportError("start() called without a source");
        return;
    }

    m_source = source;
    m_depth = depth;
    m_input = std::move(input);
    m_onFrame = std::move(onFrame);

    m_presentationSupported = source->isLive() && source->supportsFrameCallbacks();

    if (m_presentationSupported) {
        m_presentationHandle = source->requestFrameCallback(
            [this](double mediaTime, uint64_t presented) { presentationTick(mediaTime, presented); });
    } else if (!source->isLive()) {
        runDepthUpdate(source->currentTime());
    }

    if (!m_deviceLost) requestDisplayFrame();
}

void RendererCore::stop() {
    cancelLoops();
    m_source = nullptr;
    m_depth = nullptr;
    m_input = nullptr;
    m_onFrame = nullptr;
    m_presentationSupported = false;
}

void RendererCore::dispose() {
    stop();
    if (m_resizeTimer) {
        m_scheduler.clearTimeout(m_resizeTimer);
        m_resizeTimer = 0;
    }
    disposeRenderer();
}

void RendererCore::cancelLoops() {
    if (m_displayFrame) {
        m_scheduler.cancelFrame(m_displayFrame);
        m_displayFrame = 0;
    }
    if (m_presentationHandle && m_source) {
        m_source->cancelFrameCallback(m_presentationHandle);
    }
    m_presentationHandle = 0;
}

void RendererCore::requestDisplayFrame() {
    m_displayFrame = m_scheduler.requestFrame([this](double) { displayTick(); });
}

void RendererCore::displayTick() {
    m_displayFrame = 0;
    if (!m_source || m_deviceLost) return;

    // Reschedule first so a failing tick does not end the loop
    requestDisplayFrame();
    m_displayTicks++;

    if (m_source->isLive() && !m_presentationSupported) {
        runDepthUpdate(m_source->currentTime());
    }

    try {
        onRenderFrame();
    } catch (const std::exception& e) {
        reportError(std::string("Render frame failed: ") + e.what());
    }
}

void RendererCore::presentationTick(double mediaTime, uint64_t presentedFrames) {
    m_presentationHandle = 0;
    MediaSource* src = m_source;
    if (!src) return;

    m_presentationHandle = src->requestFrameCallback(
        [this](double t, uint64_t presented) { presentationTick(t, presented); });

    runDepthUpdate(mediaTime);

    if (m_onFrame) {
        try {
            m_onFrame(mediaTime, presentedFrames);
        } catch (const std::exception& e) {
            reportError(std::string("Frame callback failed: ") + e.what());
        }
    }
}

void RendererCore::runDepthUpdate(double timeSeconds) {
    if (m_deviceLost) return;
    try {
        onDepthUpdate(timeSeconds);
        m_depthUpdates++;
    } catch (const std::exception& e) {
        reportError(std::string("Depth update failed: ") + e.what());
    }
}

// -----------------------------------------------------------------------------
// Viewport
// -----------------------------------------------------------------------------

void RendererCore::scheduleResize() {
    if (m_resizeTimer) m_scheduler.clearTimeout(m_resizeTimer);
    m_resizeTimer = m_scheduler.setTimeout(RESIZE_DEBOUNCE_MS, [this]() {
        m_resizeTimer = 0;
        recalculateViewport();
    });
}

void RendererCore::recalculateViewport() {
    const ViewportSize logical = m_surface.viewportSize();
    const glm::ivec2 size = drawingBufferSize(logical, m_surface.devicePixelRatio(), m_quality.dprCap);

    const float viewportAspect = static_cast<float>(std::max(1, logical.width)) /
                                 static_cast<float>(std::max(1, logical.height));
    const glm::vec2 padding = coverFitPadding();
    m_uv = computeCoverFit(viewportAspect, m_sourceAspect, padding.x, padding.y, m_mirror);

    const bool resized = size != m_bufferSize;
    m_bufferSize = size;
    if (m_deviceLost) return;

    try {
        // Cover-fit uniforms change with the aspect even at an unchanged size
        onViewportResize();
    } catch (const std::exception& e) {
        reportError(std::string(resized ? "Resize failed: " : "Viewport update failed: ") + e.what());
    }
}

// -----------------------------------------------------------------------------
// Device loss
// -----------------------------------------------------------------------------

void RendererCore::deviceLost(const std::string& reason) {
    if (m_displayFrame) {
        m_scheduler.cancelFrame(m_displayFrame);
        m_displayFrame = 0;
    }
    m_deviceLost = true;
    reportError("GPU device lost: " + reason);
}

bool RendererCore::contextRestored() {
    if (!m_deviceLost) return true;

    bool rebuilt = false;
    try {
        rebuilt = rebuildResources();
    } catch (const std::exception& e) {
        reportError(std::string("Resource rebuild failed: ") + e.what());
        return false;
    }
    if (!rebuilt) return false;

    m_deviceLost = false;
    std::cout << "[" << m_tag << "] Resources rebuilt after context reset" << std::endl;
    recalculateViewport();
    if (m_source) {
        if (!m_source->isLive()) runDepthUpdate(m_source->currentTime());
        if (!m_displayFrame) requestDisplayFrame();
    }
    return true;
}

// -----------------------------------------------------------------------------
// Helpers for subclasses
// -----------------------------------------------------------------------------

void RendererCore::configureSource(const MediaSource& source, int depthWidth, int depthHeight) {
    if (source.width() > 0 && source.height() > 0) {
        m_sourceAspect = static_cast<float>(source.width()) / static_cast<float>(source.height());
    }
    m_mirror = source.kind() == MediaKind::Camera;

    m_sourceDepthWidth = depthWidth;
    m_sourceDepthHeight = depthHeight;
    const DepthDimensions dims = clampDepthDimensions(depthWidth, depthHeight, m_quality.depthMaxDim);
    m_depthWidth = dims.width;
    m_depthHeight = dims.height;
}

const uint8_t* RendererCore::readDepth(double timeSeconds) {
    if (!m_depth) return nullptr;
    const uint8_t* raw = m_depth->sample(timeSeconds);
    if (!raw) return nullptr;
    if (m_depth->width() != m_sourceDepthWidth || m_depth->height() != m_sourceDepthHeight) {
        throw std::runtime_error("Depth provider size changed after initialization");
    }
    const uint8_t* depth = m_subsampler.apply(raw, m_sourceDepthWidth, m_sourceDepthHeight,
                                              m_quality.depthMaxDim);
    if (m_depthObserver) m_depthObserver(depth, m_depthWidth, m_depthHeight);
    return depth;
}

glm::vec2 RendererCore::readInput() const {
    return m_input ? m_input() : glm::vec2(0.0f);
}

bool RendererCore::fail(const std::string& message) {
    m_error = message;
    std::cerr << "[" << m_tag << "] " << message << std::endl;
    return false;
}

void RendererCore::reportError(const std::string& message) {
    m_error = message;
    std::cerr << "[" << m_tag << "] " << message << std::endl;
    if (m_onError) m_onError(message);
}

} // namespace layershift
