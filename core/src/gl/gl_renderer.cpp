// Layershift - Shared OpenGL renderer resources

#include <layershift/gl/gl_renderer.h>

namespace layershift::gl {

GlRenderer::GlRenderer(std::string tag, GlContext& context, FrameScheduler& scheduler,
                       const RenderSurface& surface, QualityParams quality)
    : RendererCore(std::move(tag), scheduler, surface, quality)
    , m_context(context) {
}

bool GlRenderer::initShared(const MediaSource& source, int rawDepthWidth, int rawDepthHeight) {
    if (!m_context.valid()) return fail("OpenGL context is not available");
    if (source.width() <= 0 || source.height() <= 0) return fail("Source has no dimensions");
    if (rawDepthWidth <= 0 || rawDepthHeight <= 0) return fail("Depth has no dimensions");

    configureSource(source, rawDepthWidth, rawDepthHeight);
    m_initSource = &source;
    m_initDepthWidth = rawDepthWidth;
    m_initDepthHeight = rawDepthHeight;

    m_sourceWidth = source.width();
    m_sourceHeight = source.height();
    m_sourceTexture = createTexture(m_sourceWidth, m_sourceHeight, GL_FORMAT_RGBA8, GL_LINEAR);
    m_sourceSerial = 0;
    m_fullscreenVao = GlVertexArray::generate();

    std::string error;
    if (!m_depthFilter.init(depthWidth(), depthHeight(), quality().bilateralRadius, error)) {
        return fail("Depth filter: " + error);
    }
    return true;
}

void GlRenderer::refreshSourceTexture() {
    MediaSource* src = source();
    if (!src) return;
    const MediaFrame& frame = src->currentFrame();
    if (frame.empty() || frame.serial == m_sourceSerial) return;

    if (frame.width != m_sourceWidth || frame.height != m_sourceHeight) {
        m_sourceWidth = frame.width;
        m_sourceHeight = frame.height;
        m_sourceTexture = createTexture(m_sourceWidth, m_sourceHeight, GL_FORMAT_RGBA8, GL_LINEAR,
                                        frame.rgba.data());
    } else {
        uploadTexture(m_sourceTexture, m_sourceWidth, m_sourceHeight, GL_FORMAT_RGBA8, frame.rgba.data());
    }
    m_sourceSerial = frame.serial;
}

bool GlRenderer::updateDepth(double timeSeconds) {
    const uint8_t* depth = readDepth(timeSeconds);
    if (!depth) return false;
    m_depthFilter.upload(depth);
    beginFrame();
    m_depthFilter.run();
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    return true;
}

void GlRenderer::applyViewUniforms(GlProgram& program) const {
    const UvTransform& uv = uvTransform();
    program.set("uUvOffset", uv.offset.x, uv.offset.y);
    program.set("uUvScale", uv.scale.x, uv.scale.y);
}

bool GlRenderer::resizeScreen(std::string& error) {
    const glm::ivec2 size = bufferSize();
    if (m_screen && size == m_screenSize) return true;

    m_screen.reset();
    m_screenColor = GlRenderbuffer::generate();
    glBindRenderbuffer(GL_RENDERBUFFER, m_screenColor);
    glRenderbufferStorage(GL_RENDERBUFFER, GL_RGBA8, size.x, size.y);
    m_screenDepthStencil = GlRenderbuffer::generate();
    glBindRenderbuffer(GL_RENDERBUFFER, m_screenDepthStencil);
    glRenderbufferStorage(GL_RENDERBUFFER, GL_DEPTH24_STENCIL8, size.x, size.y);
    glBindRenderbuffer(GL_RENDERBUFFER, 0);

    GlFramebuffer screen = GlFramebuffer::generate();
    glBindFramebuffer(GL_FRAMEBUFFER, screen);
    glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_RENDERBUFFER, m_screenColor);
    glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_STENCIL_ATTACHMENT, GL_RENDERBUFFER,
                              m_screenDepthStencil);
    const bool complete = checkFramebuffer("Screen", error);
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    if (!complete) return false;

    m_screen = std::move(screen);
    m_screenSize = size;
    return true;
}

void GlRenderer::beginFrame() {
    glDisable(GL_DEPTH_TEST);
    glDisable(GL_CULL_FACE);
    glDisable(GL_BLEND);
    glDisable(GL_STENCIL_TEST);
    glColorMask(GL_TRUE, GL_TRUE, GL_TRUE, GL_TRUE);
    glBindVertexArray(m_fullscreenVao);
}

void GlRenderer::bindScreen() {
    bindTarget(m_screen, m_screenSize.x, m_screenSize.y);
}

void GlRenderer::presentScreen() {
    const glm::ivec2 window = m_context.framebufferSize();
    glBindFramebuffer(GL_READ_FRAMEBUFFER, m_screen);
    glBindFramebuffer(GL_DRAW_FRAMEBUFFER, 0);
    glBlitFramebuffer(0, 0, m_screenSize.x, m_screenSize.y, 0, 0, window.x, window.y,
                      GL_COLOR_BUFFER_BIT, GL_LINEAR);
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    glBindVertexArray(0);
    m_context.present();
}

void GlRenderer::releaseShared() {
    m_screen.reset();
    m_screenDepthStencil.reset();
    m_screenColor.reset();
    m_screenSize = {0, 0};
    m_fullscreenVao.reset();
    m_depthFilter.release();
    m_sourceTexture.reset();
    m_sourceSerial = 0;
}

bool GlRenderer::rebuildResources() {
    if (!m_initSource || !m_context.valid()) return false;
    return initialize(*m_initSource, m_initDepthWidth, m_initDepthHeight);
}

} // namespace layershift::gl
