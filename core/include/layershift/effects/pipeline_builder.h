#pragma once

/**
 * @file pipeline_builder.h
 * @brief Fluent construction of render pipelines and bind groups
 *
 * Bindings are declared per bind group. Effect passes put their own
 * resources in group 0 and the shared cover-fit ViewUniforms in group 1.
 *
 * @code
 * gpu::PipelineBuilder builder(device);
 * builder.shader(source)
 *        .colorTarget(WGPUTextureFormat_RGBA8Unorm)
 *        .uniform(0, sizeof(MyUniforms))
 *        .texture(1)
 *        .sampler(2)
 *        .group(1).uniform(0, sizeof(gpu::ViewUniforms), WGPUShaderStage_Vertex);
 * gpu::BuiltPipeline built;
 * if (!builder.build(built)) fail(builder.error());
 * @endcode
 */

#include <layershift/effects/gpu_handle.h>
#include <webgpu/webgpu.h>
#include <string>
#include <vector>

namespace layershift::gpu {

enum class BindingType {
    Uniform,
    Texture,
    UnfilterableTexture,
    Sampler,
    SamplerNonFiltering
};

enum class StencilMode {
    None,
    Write,      ///< Always pass, replace with reference, no color writes
    TestEqual,  ///< Pass where stencil == reference, keep
    Keep        ///< Stencil attachment present, always pass, never written
};

struct BindingEntry {
    uint32_t binding = 0;
    BindingType type = BindingType::Uniform;
    uint64_t size = 0;
    WGPUShaderStage visibility = WGPUShaderStage_Fragment;
};

struct BuiltPipeline {
    RenderPipelineHandle pipeline;
    std::vector<BindGroupLayoutHandle> layouts;   ///< Indexed by group

    WGPUBindGroupLayout layout(size_t group) const {
        return group < layouts.size() ? layouts[group].get() : nullptr;
    }
    void reset() {
        pipeline.reset();
        layouts.clear();
    }
};

class PipelineBuilder {
public:
    explicit PipelineBuilder(WGPUDevice device);

    PipelineBuilder& label(const std::string& name);
    PipelineBuilder& shader(const std::string& wgslSource);
    PipelineBuilder& vertexEntry(const char* entryPoint);
    PipelineBuilder& fragmentEntry(const char* entryPoint);

    /// Each call adds an attachment (multiple render targets)
    PipelineBuilder& colorTarget(WGPUTextureFormat format);
    PipelineBuilder& colorTargetWithBlend(WGPUTextureFormat format);

    /// @brief Interleaved float vertex buffer at slot 0
    PipelineBuilder& vertexBuffer(uint64_t strideBytes, std::vector<WGPUVertexAttribute> attributes);

    PipelineBuilder& topology(WGPUPrimitiveTopology topology);
    PipelineBuilder& stencil(StencilMode mode);

    /// @brief Subsequent bindings go to this bind group
    PipelineBuilder& group(uint32_t index);

    PipelineBuilder& uniform(uint32_t binding, uint64_t size,
                             WGPUShaderStage visibility = WGPUShaderStage_Fragment);
    PipelineBuilder& texture(uint32_t binding, bool filterable = true,
                             WGPUShaderStage visibility = WGPUShaderStage_Fragment);
    PipelineBuilder& sampler(uint32_t binding, bool filtering = true,
                             WGPUShaderStage visibility = WGPUShaderStage_Fragment);

    /**
     * @brief Create the pipeline inside a validation error scope
     * @return false with error() set when shader or pipeline validation fails
     */
    bool build(BuiltPipeline& out);

    const std::string& error() const { return m_error; }

private:
    WGPUDevice m_device;
    std::string m_label = "layershift";
    std::string m_shaderSource;
    std::string m_vertexEntry = "vs_main";
    std::string m_fragmentEntry = "fs_main";
    std::vector<std::pair<WGPUTextureFormat, bool>> m_targets;   // (format, blend)
    uint64_t m_vertexStride = 0;
    std::vector<WGPUVertexAttribute> m_vertexAttributes;
    WGPUPrimitiveTopology m_topology = WGPUPrimitiveTopology_TriangleList;
    StencilMode m_stencil = StencilMode::None;

    uint32_t m_currentGroup = 0;
    std::vector<std::vector<BindingEntry>> m_groups;

    std::string m_error;
};

class BindGroupBuilder {
public:
    BindGroupBuilder(WGPUDevice device, WGPUBindGroupLayout layout);

    BindGroupBuilder& buffer(uint32_t binding, WGPUBuffer buffer, uint64_t size);
    BindGroupBuilder& texture(uint32_t binding, WGPUTextureView view);
    BindGroupBuilder& sampler(uint32_t binding, WGPUSampler sampler);

    BindGroupHandle build();

private:
    WGPUDevice m_device;
    WGPUBindGroupLayout m_layout;
    std::vector<WGPUBindGroupEntry> m_entries;
};

} // namespace layershift::gpu
