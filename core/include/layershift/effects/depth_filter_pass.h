#pragma once

/**
 * @file depth_filter_pass.h
 * @brief GPU bilateral depth filter (WebGPU)
 *
 * Raw R8 depth in, filtered R8 depth out, same size. Matches
 * bilateralFilterDepth() texel for texel up to 8-bit rounding.
 */

#include <layershift/effects/pipeline_builder.h>
#include <layershift/effects/gpu_handle.h>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <string>

namespace layershift::gpu {

class DepthFilterPass {
public:
    bool init(WGPUDevice device, WGPUQueue queue, int width, int height, int radius,
              std::string& error);

    /// @brief Replace the raw depth (width * height bytes, top row first)
    void upload(const uint8_t* depth);

    /// @brief Record the filter pass
    void encode(WGPUCommandEncoder encoder);

    WGPUTextureView output() const { return m_filtered.view; }
    int width() const { return static_cast<int>(m_raw.width); }
    int height() const { return static_cast<int>(m_raw.height); }

    void release();

private:
    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;
    BuiltPipeline m_pipeline;
    RenderTarget m_raw;
    RenderTarget m_filtered;
    BufferHandle m_uniforms;
    BindGroupHandle m_bindGroup;
};

} // namespace layershift::gpu
