#pragma once

/**
 * @file effect_host.h
 * @brief One effect instance: media, depth, renderer, input and events
 *
 * EffectHost is the ManagedEffect the LifecycleController drives. Its
 * attributes name the inputs:
 *
 * | attribute     | meaning                                              |
 * |---------------|------------------------------------------------------|
 * | src           | image or video path (camera device for source-type=camera) |
 * | source-type   | "video", "image" or "camera"; guessed from src when absent |
 * | depth-src     | packed depth frames                                  |
 * | depth-meta    | depth metadata JSON                                  |
 * | depth-model   | ONNX model, used when no precomputed depth is given  |
 * | logo-src      | SVG outline (portal only)                            |
 *
 * Everything platform-specific (decoders, the model runtime, the graphics
 * device) is injected through EffectServices so the host stays testable.
 */

#include <layershift/depth_estimator.h>
#include <layershift/depth_frames.h>
#include <layershift/effect_config.h>
#include <layershift/events.h>
#include <layershift/focus_controller.h>
#include <layershift/graphics_device.h>
#include <layershift/lifecycle.h>
#include <layershift/media_source.h>
#include <layershift/parallax_input.h>
#include <layershift/renderer_core.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace layershift {

/// Estimated depth resolution, matching the precompute tool's output
constexpr int ESTIMATED_DEPTH_SIZE = 512;

struct EffectServices {
    FrameScheduler* scheduler = nullptr;
    const RenderSurface* surface = nullptr;

    /// Open a media source; src is a device path for cameras
    std::function<std::unique_ptr<MediaSource>(const std::string& src, MediaKind kind)> openMedia;

    /// Load a depth model; unset when no model runtime is available
    std::function<std::shared_ptr<DepthModel>(const std::string& path, const ModelProgressCallback&)> loadModel;

    /// Build the renderer on the host's graphics device
    std::function<std::unique_ptr<RendererCore>(RendererSpec spec)> createRenderer;

    /// Adapter facts for automatic quality selection
    std::function<DeviceCapabilities()> capabilities;
};

/// @brief "video" | "image" | "camera"
std::optional<MediaKind> parseMediaKind(const std::string& name);

/// @brief Image by file extension, video otherwise
MediaKind guessMediaKind(const std::string& src);

class EffectHost : public ManagedEffect {
public:
    EffectHost(EffectConfig config, EffectServices services, EventSink sink = {});
    ~EffectHost() override;

    EffectHost(const EffectHost&) = delete;
    EffectHost& operator=(const EffectHost&) = delete;

    /// @name ManagedEffect
    /// @{
    std::vector<std::string> reinitAttributes() const override;
    bool canInit(const std::map<std::string, std::string>& attributes) const override;
    void doInit(const InitAttempt& attempt) override;
    void doDispose() override;
    /// @}

    LifecycleController& lifecycle() { return m_lifecycle; }
    const EffectConfig& config() const { return m_config; }
    EffectKind effect() const { return m_config.effect; }

    /// @brief Advance the media clock; call once per host loop iteration
    void update(double nowSeconds);

    void play();
    void pause();

    /// @name Host input, in viewport pixels
    /// @{
    void pointerMove(float x, float y);
    void pointerLeave();
    void click(float x, float y);
    void scroll(float elementCenterY);
    void orientation(float betaDeg, float gammaDeg);
    /// @}

    /// @brief Window resize notification (debounced by the renderer)
    void resized();

    /// @brief Stop drawing until the device is back
    void deviceLost(const std::string& reason);

    /**
     * @brief Recover after a lost device was replaced
     *
     * Renderers that can rebuild in place do so; otherwise the effect is
     * torn down and initialized again.
     */
    void deviceRestored();

    RendererCore* renderer() const { return m_renderer.get(); }
    MediaSource* source() const { return m_source.get(); }
    FocusController* focus() const { return m_focus.get(); }
    const ParallaxInput& input() const { return m_input; }
    DepthEstimator* estimator() const { return m_estimator.get(); }
    const std::optional<DepthProfile>& depthProfile() const { return m_profile; }
    uint64_t loopCount() const { return m_loopCount; }

private:
    MediaKind sourceKind() const;
    std::optional<std::string> attr(const std::string& name) const;
    void loadDepth(const InitAttempt& attempt);
    RendererSpec buildSpec(nlohmann::json& readyDetail);
    glm::vec2 viewportSize() const;

    EffectConfig m_config;
    EffectServices m_services;
    EventEmitter m_events;
    LifecycleController m_lifecycle;

    std::unique_ptr<MediaSource> m_source;
    std::shared_ptr<const DepthFrameSet> m_frames;
    std::unique_ptr<DepthProvider> m_framePlayer;
    std::unique_ptr<DepthEstimator> m_estimator;
    std::unique_ptr<FocusController> m_focus;
    std::unique_ptr<RendererCore> m_renderer;
    ParallaxInput m_input;

    std::optional<DepthProfile> m_profile;
    uint64_t m_loopCount = 0;
};

} // namespace layershift
