#pragma once

/**
 * @file gl_rack_focus_renderer.h
 * @brief Interactive depth of field on OpenGL 3.3
 *
 * Same three passes as the WebGPU renderer. The CoC target is R16F; when a
 * driver refuses to render to it the signed CoC is packed into RG8
 * (r = far, g = near).
 */

#include <layershift/effect_config.h>
#include <layershift/focus_controller.h>
#include <layershift/gl/gl_renderer.h>

namespace layershift::gl {

class GlRackFocusRenderer : public GlRenderer {
public:
    GlRackFocusRenderer(GlContext& context, FrameScheduler& scheduler, const RenderSurface& surface,
                        QualityParams quality, RackFocusSettings settings, FocusStateProvider focus);
    ~GlRackFocusRenderer() override;

    bool initialize(const MediaSource& source, int depthWidth, int depthHeight) override;

    const RackFocusSettings& settings() const { return m_settings; }

    /// True when the CoC had to fall back to RG8
    bool packedCoc() const { return m_packedCoc; }

protected:
    void onDepthUpdate(double timeSeconds) override;
    void onRenderFrame() override;
    void onViewportResize() override;
    void disposeRenderer() override;

private:
    bool createTargets();

    RackFocusSettings m_settings;
    FocusStateProvider m_focus;

    GlProgram m_cocProgram;
    GlProgram m_blurProgram;
    GlProgram m_compositeProgram;

    GlTarget m_cocTarget;
    GlTarget m_blurTarget;
    bool m_packedCoc = false;

    std::vector<float> m_samples;   ///< xy pairs
    float m_maxBlurRadius = 0.0f;   ///< in dof texels
};

} // namespace layershift::gl
