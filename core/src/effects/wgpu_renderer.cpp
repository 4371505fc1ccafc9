// Layershift - Shared WebGPU renderer resources

#include <layershift/effects/wgpu_renderer.h>
#include <algorithm>
#include <stdexcept>

namespace layershift::gpu {

WgpuRenderer::WgpuRenderer(std::string tag, WgpuContext& context, FrameScheduler& scheduler,
                           const RenderSurface& surface, QualityParams quality)
    : RendererCore(std::move(tag), scheduler, surface, quality)
    , m_context(context) {
}

bool WgpuRenderer::initShared(const MediaSource& source, int rawDepthWidth, int rawDepthHeight) {
    if (!device()) return fail("WebGPU device is not available");
    if (source.width() <= 0 || source.height() <= 0) return fail("Source has no dimensions");
    if (rawDepthWidth <= 0 || rawDepthHeight <= 0) return fail("Depth has no dimensions");

    configureSource(source, rawDepthWidth, rawDepthHeight);

    m_sourceTexture = createTarget(device(), static_cast<uint32_t>(source.width()),
                                   static_cast<uint32_t>(source.height()), WGPUTextureFormat_RGBA8Unorm,
                                   WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst,
                                   "Source Texture");
    if (!m_sourceTexture) return fail("Failed to create source texture");
    m_sourceSerial = 0;

    m_linearSampler = createSampler(device(), WGPUFilterMode_Linear);
    m_nearestSampler = createSampler(device(), WGPUFilterMode_Nearest);
    m_viewUniforms = createUniformBuffer(device(), sizeof(ViewUniforms), "View Uniforms");
    if (!m_linearSampler || !m_nearestSampler || !m_viewUniforms) {
        return fail("Failed to create samplers or view uniforms");
    }

    std::string error;
    if (!m_depthFilter.init(device(), queue(), depthWidth(), depthHeight(),
                            quality().bilateralRadius, error)) {
        return fail("Depth filter: " + error);
    }
    return true;
}

bool WgpuRenderer::refreshSourceTexture() {
    MediaSource* src = source();
    if (!src) return false;
    const MediaFrame& frame = src->currentFrame();
    if (frame.empty() || frame.serial == m_sourceSerial) return false;

    bool recreated = false;
    if (static_cast<uint32_t>(frame.width) != m_sourceTexture.width ||
        static_cast<uint32_t>(frame.height) != m_sourceTexture.height) {
        m_sourceTexture = createTarget(device(), static_cast<uint32_t>(frame.width),
                                       static_cast<uint32_t>(frame.height), WGPUTextureFormat_RGBA8Unorm,
                                       WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst,
                                       "Source Texture");
        if (!m_sourceTexture) throw std::runtime_error("Failed to recreate source texture");
        recreated = true;
    }

    writeTexture(queue(), m_sourceTexture.texture, frame.rgba.data(), 4,
                 m_sourceTexture.width, m_sourceTexture.height);
    m_sourceSerial = frame.serial;
    return recreated;
}

bool WgpuRenderer::updateDepth(double timeSeconds) {
    const uint8_t* depth = readDepth(timeSeconds);
    if (!depth) return false;
    m_depthFilter.upload(depth);
    submit(device(), queue(), [this](WGPUCommandEncoder encoder) { m_depthFilter.encode(encoder); });
    return true;
}

void WgpuRenderer::writeViewUniforms() {
    if (!m_viewUniforms) return;
    const UvTransform& uv = uvTransform();
    ViewUniforms view = {{uv.offset.x, uv.offset.y}, {uv.scale.x, uv.scale.y}};
    writeUniforms(queue(), m_viewUniforms, view);
}

void WgpuRenderer::configureSurface() {
    const glm::ivec2 size = bufferSize();
    m_context.configure(static_cast<uint32_t>(size.x), static_cast<uint32_t>(size.y));
}

void WgpuRenderer::releaseShared() {
    m_depthFilter.release();
    m_viewUniforms.reset();
    m_nearestSampler.reset();
    m_linearSampler.reset();
    m_sourceTexture.reset();
    m_sourceSerial = 0;
}

} // namespace layershift::gpu
