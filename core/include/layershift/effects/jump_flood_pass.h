#pragma once

/**
 * @file jump_flood_pass.h
 * @brief Portal distance field on the GPU (WebGPU)
 *
 * mask (R8) -> seed (RG32F) -> flood ping-pong (RG32F) -> distance (RGBA8).
 * Seeds hold texel coordinates, so the flood uses textureLoad only.
 * The field is cached and recomputed only when marked dirty.
 */

#include <layershift/effects/pipeline_builder.h>
#include <layershift/effects/gpu_handle.h>
#include <glm/glm.hpp>
#include <webgpu/webgpu.h>
#include <string>
#include <vector>

namespace layershift::gpu {

class JumpFloodPass {
public:
    /// @brief Build the four pipelines
    bool init(WGPUDevice device, WGPUQueue queue, std::string& error);

    /// @brief (Re)create the grid textures and the per-step bind groups; marks dirty
    bool resize(int width, int height, std::string& error);

    void markDirty() { m_dirty = true; }
    bool dirty() const { return m_dirty; }

    /**
     * @brief Record the whole chain if dirty
     * @param vertices Fill mesh positions (2 floats per vertex)
     * @param range Normalization range, see JumpFloodField::normalizedDistance
     */
    void encode(WGPUCommandEncoder encoder, WGPUBuffer vertices, WGPUBuffer indices,
                uint32_t indexCount, glm::vec2 meshScale, float range);

    WGPUTextureView distance() const { return m_distance.view; }
    int width() const { return m_width; }
    int height() const { return m_height; }
    size_t stepCount() const { return m_steps.size(); }

    void release();

private:
    void runFullscreen(WGPUCommandEncoder encoder, WGPUTextureView target,
                       const BuiltPipeline& pipeline, WGPUBindGroup bindGroup);

    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;

    BuiltPipeline m_maskPipeline;
    BuiltPipeline m_seedPipeline;
    BuiltPipeline m_floodPipeline;
    BuiltPipeline m_distancePipeline;

    RenderTarget m_mask;
    RenderTarget m_seedsA;
    RenderTarget m_seedsB;
    RenderTarget m_distance;

    BufferHandle m_maskUniforms;
    BufferHandle m_distanceUniforms;
    std::vector<BufferHandle> m_stepUniforms;

    BindGroupHandle m_maskBindGroup;
    BindGroupHandle m_seedBindGroup;
    std::vector<BindGroupHandle> m_floodBindGroups;
    BindGroupHandle m_distanceBindGroup;

    std::vector<int> m_steps;
    int m_width = 0;
    int m_height = 0;
    bool m_dirty = true;
};

} // namespace layershift::gpu
