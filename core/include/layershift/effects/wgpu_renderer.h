#pragma once

/**
 * @file wgpu_renderer.h
 * @brief Resources every WebGPU effect renderer shares
 *
 * Source texture, bilateral depth filter, cover-fit uniforms and samplers.
 * Concrete renderers add their passes on top and draw into the
 * WgpuContext's swap chain view.
 */

#include <layershift/renderer_core.h>
#include <layershift/effects/depth_filter_pass.h>
#include <layershift/effects/gpu_common.h>
#include <layershift/effects/wgpu_context.h>

namespace layershift::gpu {

class WgpuRenderer : public RendererCore {
public:
    const char* backendName() const override { return "webgpu"; }

protected:
    WgpuRenderer(std::string tag, WgpuContext& context, FrameScheduler& scheduler,
                 const RenderSurface& surface, QualityParams quality);

    /**
     * @brief Source texture, samplers, view uniforms and depth filter
     * @return false with error() set
     */
    bool initShared(const MediaSource& source, int rawDepthWidth, int rawDepthHeight);

    /**
     * @brief Upload the source's current frame if it changed since the last call
     * @return true when the texture was recreated and bind groups must be rebuilt
     */
    bool refreshSourceTexture();

    /// @brief Read depth for a time, upload it and run the bilateral filter
    bool updateDepth(double timeSeconds);

    /// @brief Push uvTransform() into the group 1 view uniforms
    void writeViewUniforms();

    /// @brief Resize the swap chain to bufferSize()
    void configureSurface();

    void releaseShared();

    WGPUDevice device() const { return m_context.device(); }
    WGPUQueue queue() const { return m_context.queue(); }
    WgpuContext& context() { return m_context; }

    WgpuContext& m_context;
    RenderTarget m_sourceTexture;
    uint64_t m_sourceSerial = 0;
    DepthFilterPass m_depthFilter;
    BufferHandle m_viewUniforms;
    SamplerHandle m_linearSampler;
    SamplerHandle m_nearestSampler;
};

} // namespace layershift::gpu
