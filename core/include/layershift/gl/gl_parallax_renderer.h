#pragma once

/**
 * @file gl_parallax_renderer.h
 * @brief Depth parallax on OpenGL 3.3
 */

#include <layershift/effect_config.h>
#include <layershift/gl/gl_renderer.h>

namespace layershift::gl {

class GlParallaxRenderer : public GlRenderer {
public:
    GlParallaxRenderer(GlContext& context, FrameScheduler& scheduler, const RenderSurface& surface,
                       QualityParams quality, ParallaxSettings settings);
    ~GlParallaxRenderer() override;

    bool initialize(const MediaSource& source, int depthWidth, int depthHeight) override;

    const ParallaxSettings& settings() const { return m_settings; }

protected:
    void onDepthUpdate(double timeSeconds) override;
    void onRenderFrame() override;
    void onViewportResize() override;
    void disposeRenderer() override;
    glm::vec2 coverFitPadding() const override;

private:
    ParallaxSettings m_settings;
    GlProgram m_program;
    int m_pomSteps = 1;
};

} // namespace layershift::gl
