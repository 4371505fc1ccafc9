#pragma once

/**
 * @file gl_renderer.h
 * @brief Resources every OpenGL effect renderer shares
 *
 * Source texture, bilateral depth filter, the empty full-screen VAO and a
 * screen target (RGBA8 + depth/stencil) at the drawing buffer size. Effects
 * render their last pass into the screen target; presentScreen() scales it
 * onto the window framebuffer and swaps.
 *
 * After a context reset, rebuildResources() runs initialize() again with
 * the arguments of the last successful call. Names from the lost context
 * are dropped by GlObject without being deleted.
 */

#include <layershift/renderer_core.h>
#include <layershift/gl/gl_context.h>
#include <layershift/gl/gl_depth_filter_pass.h>
#include <layershift/gl/gl_utils.h>

namespace layershift::gl {

class GlRenderer : public RendererCore {
public:
    const char* backendName() const override { return "opengl"; }

protected:
    GlRenderer(std::string tag, GlContext& context, FrameScheduler& scheduler,
               const RenderSurface& surface, QualityParams quality);

    /// @return false with error() set
    bool initShared(const MediaSource& source, int rawDepthWidth, int rawDepthHeight);

    /// @brief Upload the source's current frame if it changed since the last call
    void refreshSourceTexture();

    /// @brief Read depth for a time, upload it and run the bilateral filter
    bool updateDepth(double timeSeconds);

    /// @brief Cover-fit uniforms of the shared vertex stage
    void applyViewUniforms(GlProgram& program) const;

    /// @brief (Re)allocate the screen target at bufferSize()
    bool resizeScreen(std::string& error);

    /// @brief Reset fixed-function state and bind the full-screen VAO
    void beginFrame();

    /// @brief Bind the screen target for drawing
    void bindScreen();

    /// @brief Blit the screen target to the window and swap
    void presentScreen();

    void releaseShared();

    bool rebuildResources() override;

    GlContext& context() { return m_context; }

    GlContext& m_context;
    GlTexture m_sourceTexture;
    int m_sourceWidth = 0;
    int m_sourceHeight = 0;
    uint64_t m_sourceSerial = 0;
    GlDepthFilterPass m_depthFilter;
    GlVertexArray m_fullscreenVao;

    GlFramebuffer m_screen;
    GlRenderbuffer m_screenColor;
    GlRenderbuffer m_screenDepthStencil;
    glm::ivec2 m_screenSize{0, 0};

private:
    const MediaSource* m_initSource = nullptr;
    int m_initDepthWidth = 0;
    int m_initDepthHeight = 0;
};

} // namespace layershift::gl
