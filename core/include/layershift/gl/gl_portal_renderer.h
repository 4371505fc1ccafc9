#pragma once

/**
 * @file gl_portal_renderer.h
 * @brief Logo-shaped window into the source on OpenGL 3.3
 *
 * Mirrors the WebGPU portal: an interior MRT pass, then the screen target's
 * stencil mark, composite, chamfer and rim. The screen target already
 * carries a stencil attachment.
 */

#include <layershift/effect_config.h>
#include <layershift/shape_mesh.h>
#include <layershift/gl/gl_jump_flood_pass.h>
#include <layershift/gl/gl_renderer.h>

namespace layershift::gl {

class GlPortalRenderer : public GlRenderer {
public:
    GlPortalRenderer(GlContext& context, FrameScheduler& scheduler, const RenderSurface& surface,
                     QualityParams quality, PortalSettings settings, ShapeMesh mesh);
    ~GlPortalRenderer() override;

    bool initialize(const MediaSource& source, int depthWidth, int depthHeight) override;

    const PortalSettings& settings() const { return m_settings; }
    glm::vec2 meshScale() const { return m_meshScale; }

protected:
    void onDepthUpdate(double timeSeconds) override;
    void onRenderFrame() override;
    void onViewportResize() override;
    void disposeRenderer() override;
    glm::vec2 coverFitPadding() const override;

private:
    bool buildPrograms(std::string& error);
    bool createTargets();
    void writeStaticUniforms();

    PortalSettings m_settings;
    ShapeMesh m_mesh;
    StripMesh m_edgeStrip;
    StripMesh m_chamferStrip;
    float m_strength = 0.0f;
    glm::vec2 m_meshScale{PORTAL_FILL_FACTOR};

    GlProgram m_interiorProgram;
    GlProgram m_stencilProgram;
    GlProgram m_compositeProgram;
    GlProgram m_chamferProgram;
    GlProgram m_rimProgram;

    GlMesh m_fill;
    GlMesh m_edge;
    GlMesh m_chamfer;

    GlTexture m_interiorColor;
    GlTexture m_interiorLens;
    GlFramebuffer m_interior;
    glm::ivec2 m_interiorSize{0, 0};

    GlJumpFloodPass m_distanceField;
};

} // namespace layershift::gl
