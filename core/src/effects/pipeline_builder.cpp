// Layershift - WebGPU pipeline builder

#include <layershift/effects/pipeline_builder.h>
#include <layershift/effects/gpu_common.h>
#include <webgpu/wgpu.h>

namespace layershift::gpu {

namespace {

struct ScopeResult {
    bool done = false;
    WGPUErrorType type = WGPUErrorType_NoError;
    std::string message;
};

void onPopErrorScope(WGPUPopErrorScopeStatus status, WGPUErrorType type,
                     WGPUStringView message, void* userdata1, void* /*userdata2*/) {
    auto* result = static_cast<ScopeResult*>(userdata1);
    result->done = true;
    if (status == WGPUPopErrorScopeStatus_Success) {
        result->type = type;
        result->message = fromStringView(message);
    }
}

} // namespace

PipelineBuilder::PipelineBuilder(WGPUDevice device)
    : m_device(device)
    , m_groups(1) {
}

PipelineBuilder& PipelineBuilder::label(const std::string& name) {
    m_label = name;
    return *this;
}

PipelineBuilder& PipelineBuilder::shader(const std::string& wgslSource) {
    m_shaderSource = wgslSource;
    return *this;
}

PipelineBuilder& PipelineBuilder::vertexEntry(const char* entryPoint) {
    m_vertexEntry = entryPoint;
    return *this;
}

PipelineBuilder& PipelineBuilder::fragmentEntry(const char* entryPoint) {
    m_fragmentEntry = entryPoint;
    return *this;
}

PipelineBuilder& PipelineBuilder::colorTarget(WGPUTextureFormat format) {
    m_targets.emplace_back(format, false);
    return *this;
}

PipelineBuilder& PipelineBuilder::colorTargetWithBlend(WGPUTextureFormat format) {
    m_targets.emplace_back(format, true);
    return *this;
}

PipelineBuilder& PipelineBuilder::vertexBuffer(uint64_t strideBytes,
                                               std::vector<WGPUVertexAttribute> attributes) {
    m_vertexStride = strideBytes;
    m_vertexAttributes = std::move(attributes);
    return *this;
}

PipelineBuilder& PipelineBuilder::topology(WGPUPrimitiveTopology topology) {
    m_topology = topology;
    return *this;
}

PipelineBuilder& PipelineBuilder::stencil(StencilMode mode) {
    m_stencil = mode;
    return *this;
}

PipelineBuilder& PipelineBuilder::group(uint32_t index) {
    m_currentGroup = index;
    if (m_groups.size() <= index) m_groups.resize(index + 1);
    return *this;
}

PipelineBuilder& PipelineBuilder::uniform(uint32_t binding, uint64_t size, WGPUShaderStage visibility) {
    m_groups[m_currentGroup].push_back({binding, BindingType::Uniform, size, visibility});
    return *this;
}

PipelineBuilder& PipelineBuilder::texture(uint32_t binding, bool filterable, WGPUShaderStage visibility) {
    auto type = filterable ? BindingType::Texture : BindingType::UnfilterableTexture;
    m_groups[m_currentGroup].push_back({binding, type, 0, visibility});
    return *this;
}

PipelineBuilder& PipelineBuilder::sampler(uint32_t binding, bool filtering, WGPUShaderStage visibility) {
    auto type = filtering ? BindingType::Sampler : BindingType::SamplerNonFiltering;
    m_groups[m_currentGroup].push_back({binding, type, 0, visibility});
    return *this;
}

bool PipelineBuilder::build(BuiltPipeline& out) {
    out.reset();
    m_error.clear();
    if (m_targets.empty() && m_stencil != StencilMode::Write) {
        m_error = m_label + ": pipeline has no color target";
        return false;
    }

    wgpuDevicePushErrorScope(m_device, WGPUErrorFilter_Validation);

    // Shader module
    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgslDesc.code = toStringView(m_shaderSource.c_str());
    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.nextInChain = &wgslDesc.chain;
    shaderDesc.label = toStringView(m_label.c_str());
    ShaderModuleHandle module(wgpuDeviceCreateShaderModule(m_device, &shaderDesc));

    // Bind group layouts
    std::vector<WGPUBindGroupLayout> rawLayouts;
    for (const auto& bindings : m_groups) {
        std::vector<WGPUBindGroupLayoutEntry> entries(bindings.size());
        for (size_t i = 0; i < bindings.size(); ++i) {
            WGPUBindGroupLayoutEntry& entry = entries[i];
            const BindingEntry& binding = bindings[i];
            entry = {};
            entry.binding = binding.binding;
            entry.visibility = binding.visibility;
            switch (binding.type) {
                case BindingType::Uniform:
                    entry.buffer.type = WGPUBufferBindingType_Uniform;
                    entry.buffer.minBindingSize = binding.size;
                    break;
                case BindingType::Texture:
                    entry.texture.sampleType = WGPUTextureSampleType_Float;
                    entry.texture.viewDimension = WGPUTextureViewDimension_2D;
                    break;
                case BindingType::UnfilterableTexture:
                    entry.texture.sampleType = WGPUTextureSampleType_UnfilterableFloat;
                    entry.texture.viewDimension = WGPUTextureViewDimension_2D;
                    break;
                case BindingType::Sampler:
                    entry.sampler.type = WGPUSamplerBindingType_Filtering;
                    break;
                case BindingType::SamplerNonFiltering:
                    entry.sampler.type = WGPUSamplerBindingType_NonFiltering;
                    break;
            }
        }
        WGPUBindGroupLayoutDescriptor layoutDesc = {};
        layoutDesc.entryCount = entries.size();
        layoutDesc.entries = entries.data();
        out.layouts.emplace_back(wgpuDeviceCreateBindGroupLayout(m_device, &layoutDesc));
        rawLayouts.push_back(out.layouts.back().get());
    }

    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.bindGroupLayoutCount = rawLayouts.size();
    pipelineLayoutDesc.bindGroupLayouts = rawLayouts.data();
    PipelineLayoutHandle pipelineLayout(wgpuDeviceCreatePipelineLayout(m_device, &pipelineLayoutDesc));

    // Fragment targets
    WGPUBlendState blendState = {};
    blendState.color.srcFactor = WGPUBlendFactor_SrcAlpha;
    blendState.color.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.color.operation = WGPUBlendOperation_Add;
    blendState.alpha.srcFactor = WGPUBlendFactor_One;
    blendState.alpha.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.alpha.operation = WGPUBlendOperation_Add;

    std::vector<WGPUColorTargetState> targets(m_targets.size());
    for (size_t i = 0; i < m_targets.size(); ++i) {
        targets[i] = {};
        targets[i].format = m_targets[i].first;
        targets[i].writeMask = m_stencil == StencilMode::Write ? WGPUColorWriteMask_None
                                                               : WGPUColorWriteMask_All;
        if (m_targets[i].second) targets[i].blend = &blendState;
    }

    WGPUFragmentState fragmentState = {};
    fragmentState.module = module;
    fragmentState.entryPoint = toStringView(m_fragmentEntry.c_str());
    fragmentState.targetCount = targets.size();
    fragmentState.targets = targets.data();

    WGPUVertexBufferLayout vertexLayout = {};
    vertexLayout.arrayStride = m_vertexStride;
    vertexLayout.stepMode = WGPUVertexStepMode_Vertex;
    vertexLayout.attributeCount = m_vertexAttributes.size();
    vertexLayout.attributes = m_vertexAttributes.data();

    WGPUDepthStencilState depthStencil = {};
    depthStencil.format = WGPUTextureFormat_Stencil8;
    depthStencil.depthWriteEnabled = WGPUOptionalBool_False;
    depthStencil.depthCompare = WGPUCompareFunction_Always;
    depthStencil.stencilReadMask = 0xFF;
    if (m_stencil == StencilMode::Write) {
        depthStencil.stencilFront.compare = WGPUCompareFunction_Always;
        depthStencil.stencilFront.passOp = WGPUStencilOperation_Replace;
        depthStencil.stencilWriteMask = 0xFF;
    } else {
        depthStencil.stencilFront.compare = m_stencil == StencilMode::TestEqual
            ? WGPUCompareFunction_Equal : WGPUCompareFunction_Always;
        depthStencil.stencilFront.passOp = WGPUStencilOperation_Keep;
        depthStencil.stencilWriteMask = 0x00;
    }
    depthStencil.stencilFront.failOp = WGPUStencilOperation_Keep;
    depthStencil.stencilFront.depthFailOp = WGPUStencilOperation_Keep;
    depthStencil.stencilBack = depthStencil.stencilFront;

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = toStringView(m_label.c_str());
    pipelineDesc.layout = pipelineLayout;
    pipelineDesc.vertex.module = module;
    pipelineDesc.vertex.entryPoint = toStringView(m_vertexEntry.c_str());
    if (m_vertexStride > 0) {
        pipelineDesc.vertex.bufferCount = 1;
        pipelineDesc.vertex.buffers = &vertexLayout;
    }
    pipelineDesc.primitive.topology = m_topology;
    pipelineDesc.primitive.frontFace = WGPUFrontFace_CCW;
    pipelineDesc.primitive.cullMode = WGPUCullMode_None;
    pipelineDesc.depthStencil = m_stencil != StencilMode::None ? &depthStencil : nullptr;
    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = ~0u;
    pipelineDesc.fragment = &fragmentState;

    out.pipeline.reset(wgpuDeviceCreateRenderPipeline(m_device, &pipelineDesc));

    ScopeResult scope;
    WGPUPopErrorScopeCallbackInfo scopeCallback = {};
    scopeCallback.mode = WGPUCallbackMode_AllowSpontaneous;
    scopeCallback.callback = onPopErrorScope;
    scopeCallback.userdata1 = &scope;
    wgpuDevicePopErrorScope(m_device, scopeCallback);
    while (!scope.done) {
        wgpuDevicePoll(m_device, true, nullptr);
    }

    if (!out.pipeline || scope.type != WGPUErrorType_NoError) {
        m_error = m_label + ": " + (scope.message.empty() ? "pipeline creation failed" : scope.message);
        out.reset();
        return false;
    }
    return true;
}

BindGroupBuilder::BindGroupBuilder(WGPUDevice device, WGPUBindGroupLayout layout)
    : m_device(device)
    , m_layout(layout) {
}

BindGroupBuilder& BindGroupBuilder::buffer(uint32_t binding, WGPUBuffer buffer, uint64_t size) {
    WGPUBindGroupEntry entry = {};
    entry.binding = binding;
    entry.buffer = buffer;
    entry.offset = 0;
    entry.size = size;
    m_entries.push_back(entry);
    return *this;
}

BindGroupBuilder& BindGroupBuilder::texture(uint32_t binding, WGPUTextureView view) {
    WGPUBindGroupEntry entry = {};
    entry.binding = binding;
    entry.textureView = view;
    m_entries.push_back(entry);
    return *this;
}

BindGroupBuilder& BindGroupBuilder::sampler(uint32_t binding, WGPUSampler sampler) {
    WGPUBindGroupEntry entry = {};
    entry.binding = binding;
    entry.sampler = sampler;
    m_entries.push_back(entry);
    return *this;
}

BindGroupHandle BindGroupBuilder::build() {
    WGPUBindGroupDescriptor desc = {};
    desc.layout = m_layout;
    desc.entryCount = m_entries.size();
    desc.entries = m_entries.data();
    return BindGroupHandle(wgpuDeviceCreateBindGroup(m_device, &desc));
}

} // namespace layershift::gpu
