#pragma once

/**
 * @file renderer_core.h
 * @brief Backend-neutral driver shared by every effect renderer
 *
 * RendererCore owns the two loops that decouple depth arrival from display:
 *
 * - Presentation loop: one tick per newly presented source frame (live
 *   sources with frame callbacks), or a single tick at start for a static
 *   source. Each tick runs onDepthUpdate() then the caller's frame callback.
 * - Display loop: one tick per FrameScheduler pump. Each tick runs
 *   onRenderFrame(). Live sources without frame callbacks get their depth
 *   update inline here instead.
 *
 * It also handles viewport sizing (DPR capped by the quality tier), resize
 * debouncing, cover-fit UV math, depth subsampling to the tier limit and
 * device loss. Concrete renderers implement the protected hooks.
 */

#include <layershift/depth_filter.h>
#include <layershift/depth_frames.h>
#include <layershift/frame_scheduler.h>
#include <layershift/media_source.h>
#include <layershift/quality.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <functional>
#include <string>

namespace layershift {

// -----------------------------------------------------------------------------
// Cover-fit
// -----------------------------------------------------------------------------

/// uv = offset + screenUv * scale
struct UvTransform {
    glm::vec2 offset{0.0f, 0.0f};
    glm::vec2 scale{1.0f, 1.0f};
};

/**
 * @brief Cover-fit the source into the viewport with overscan headroom
 *
 * The source fills the viewport. strength + overscan extra border is kept
 * outside the visible window so displacement never samples past the edge.
 * mirrorX flips U for selfie cameras.
 */
UvTransform computeCoverFit(float viewportAspect, float sourceAspect,
                            float strength, float overscan, bool mirrorX = false);

// -----------------------------------------------------------------------------
// Surface
// -----------------------------------------------------------------------------

struct ViewportSize {
    int width = 1;
    int height = 1;
};

/// The host window as seen by a renderer
class RenderSurface {
public:
    virtual ~RenderSurface() = default;

    /// Logical size in screen units
    virtual ViewportSize viewportSize() const = 0;
    virtual float devicePixelRatio() const = 0;
};

/// @brief round(size * min(dpr, dprCap)), never below 1x1
glm::ivec2 drawingBufferSize(ViewportSize logical, float devicePixelRatio, float dprCap);

/// @brief Blur buffer size: max(1, floor(size / divisor)) per axis
glm::ivec2 dofResolution(glm::ivec2 bufferSize, int divisor);

// -----------------------------------------------------------------------------
// Pipeline contract
// -----------------------------------------------------------------------------

using InputProvider = std::function<glm::vec2()>;
using SourceFrameCallback = std::function<void(double timeSeconds, uint64_t frameIndex)>;
using RendererErrorHandler = std::function<void(const std::string& message)>;
/// Sees every depth map a renderer uploads (subsampled, filter input)
using DepthObserver = std::function<void(const uint8_t* depth, int width, int height)>;

/**
 * @brief What the effect host drives, independent of backend
 *
 * Implemented once per effect per backend (WebGPU and OpenGL).
 */
class RenderPipeline {
public:
    virtual ~RenderPipeline() = default;

    /**
     * @brief Create every GPU resource for a source and depth size
     * @return false with error() set; partially created resources are released
     */
    virtual bool initialize(const MediaSource& source, int depthWidth, int depthHeight) = 0;

    virtual void start(MediaSource* source, DepthProvider* depth,
                       InputProvider input, SourceFrameCallback onFrame) = 0;
    virtual void stop() = 0;
    virtual void dispose() = 0;

    /// @brief Recompute drawing buffer size and cover-fit right now
    virtual void recalculateViewport() = 0;

    /// @brief Debounced variant for window resize notifications
    virtual void scheduleResize() = 0;

    virtual void setErrorHandler(RendererErrorHandler handler) = 0;
    virtual const std::string& error() const = 0;
    virtual const char* backendName() const = 0;
};

// -----------------------------------------------------------------------------
// RendererCore
// -----------------------------------------------------------------------------

class RendererCore : public RenderPipeline {
public:
    static constexpr double RESIZE_DEBOUNCE_MS = 100.0;

    RendererCore(std::string tag, FrameScheduler& scheduler,
                 const RenderSurface& surface, QualityParams quality);
    ~RendererCore() override;

    RendererCore(const RendererCore&) = delete;
    RendererCore& operator=(const RendererCore&) = delete;

    void start(MediaSource* source, DepthProvider* depth,
               InputProvider input, SourceFrameCallback onFrame) override;
    void stop() override;
    void dispose() override;
    void recalculateViewport() override;
    void scheduleResize() override;

    void setErrorHandler(RendererErrorHandler handler) override { m_onError = std::move(handler); }
    const std::string& error() const override { return m_error; }

    /// @brief Focus sampling and similar CPU consumers hook in here
    void setDepthObserver(DepthObserver observer) { m_depthObserver = std::move(observer); }

    /**
     * @brief The device went away
     *
     * Stops the display loop and reports the error. The previous frame
     * stays on screen until contextRestored() or a full rebuild by the owner.
     */
    void deviceLost(const std::string& reason);

    /**
     * @brief A replacement context is current
     * @return false when rebuildResources() is unsupported or failed
     */
    bool contextRestored();

    bool isDeviceLost() const { return m_deviceLost; }
    bool running() const { return m_source != nullptr; }
    bool presentationLoopActive() const { return m_presentationSupported; }

    const QualityParams& quality() const { return m_quality; }
    const UvTransform& uvTransform() const { return m_uv; }
    glm::ivec2 bufferSize() const { return m_bufferSize; }
    int depthWidth() const { return m_depthWidth; }
    int depthHeight() const { return m_depthHeight; }

    uint64_t displayTicks() const { return m_displayTicks; }
    uint64_t depthUpdates() const { return m_depthUpdates; }

protected:
    /// Upload and filter depth for a source time (presentation rate)
    virtual void onDepthUpdate(double timeSeconds) = 0;

    /// Sample input and draw (display rate)
    virtual void onRenderFrame() = 0;

    /// Recreate size-dependent resources after bufferSize() changed
    virtual void onViewportResize() = 0;

    /// Release every GPU resource; must tolerate partial state
    virtual void disposeRenderer() = 0;

    /// Recreate all GPU objects in place after a context reset
    virtual bool rebuildResources() { return false; }

    /// (strength, overscan) fed into the cover-fit
    virtual glm::vec2 coverFitPadding() const { return glm::vec2(0.0f); }

    /// @brief Record source facts used by cover-fit and subsampling
    void configureSource(const MediaSource& source, int depthWidth, int depthHeight);

    /**
     * @brief Depth for a time, subsampled to the tier's depthMaxDim
     * @return nullptr when stopped; dimensions are depthWidth() x depthHeight()
     */
    const uint8_t* readDepth(double timeSeconds);

    glm::vec2 readInput() const;

    MediaSource* source() const { return m_source; }

    /// @brief Store and log an initialization failure; always returns false
    bool fail(const std::string& message);

    /// @brief Log and forward a runtime error without throwing
    void reportError(const std::string& message);

    const std::string& tag() const { return m_tag; }

private:
    void requestDisplayFrame();
    void displayTick();
    void presentationTick(double mediaTime, uint64_t presentedFrames);
    void runDepthUpdate(double timeSeconds);
    void cancelLoops();

    std::string m_tag;
    FrameScheduler& m_scheduler;
    const RenderSurface& m_surface;
    QualityParams m_quality;

    // Borrowed between start() and stop()
    MediaSource* m_source = nullptr;
    DepthProvider* m_depth = nullptr;
    InputProvider m_input;
    SourceFrameCallback m_onFrame;

    FrameScheduler::Id m_displayFrame = 0;
    FrameScheduler::Id m_resizeTimer = 0;
    MediaSource::FrameCallbackId m_presentationHandle = 0;
    bool m_presentationSupported = false;
    bool m_deviceLost = false;

    float m_sourceAspect = 16.0f / 9.0f;
    bool m_mirror = false;
    UvTransform m_uv;
    glm::ivec2 m_bufferSize{1, 1};

    int m_sourceDepthWidth = 0;
    int m_sourceDepthHeight = 0;
    int m_depthWidth = 0;
    int m_depthHeight = 0;
    DepthSubsampler m_subsampler;

    uint64_t m_displayTicks = 0;
    uint64_t m_depthUpdates = 0;

    std::string m_error;
    RendererErrorHandler m_onError;
    DepthObserver m_depthObserver;
};

} // namespace layershift
