// Layershift - Bilateral depth filter pass (WebGPU)

#include <layershift/effects/depth_filter_pass.h>
#include <layershift/effects/gpu_common.h>
#include <layershift/depth_filter.h>
#include <algorithm>

namespace layershift::gpu {

namespace {

struct FilterUniforms {
    float spatialSigma2;
    float depthSigma2;
    float _pad[2];
};

const char* FILTER_FRAGMENT_SHADER = R"(
struct FilterUniforms {
    spatialSigma2: f32,
    depthSigma2: f32,
    _pad1: f32,
    _pad2: f32,
};

@group(0) @binding(0) var<uniform> uniforms: FilterUniforms;
@group(0) @binding(1) var rawDepth: texture_2d<f32>;

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let size = vec2i(textureDimensions(rawDepth));
    let center = vec2i(floor(input.position.xy));
    let centerDepth = textureLoad(rawDepth, center, 0).r;

    var sum = 0.0;
    var weightSum = 0.0;
    for (var dy = -RADIUS; dy <= RADIUS; dy++) {
        for (var dx = -RADIUS; dx <= RADIUS; dx++) {
            let p = center + vec2i(dx, dy);
            if (p.x < 0 || p.y < 0 || p.x >= size.x || p.y >= size.y) {
                continue;
            }
            let d = textureLoad(rawDepth, p, 0).r;
            let delta = d - centerDepth;
            let spatial = f32(dx * dx + dy * dy);
            let w = exp(-spatial / uniforms.spatialSigma2 - delta * delta / uniforms.depthSigma2);
            sum += d * w;
            weightSum += w;
        }
    }
    return vec4f(sum / max(weightSum, 1e-6), 0.0, 0.0, 1.0);
}
)";

} // namespace

bool DepthFilterPass::init(WGPUDevice device, WGPUQueue queue, int width, int height, int radius,
                           std::string& error) {
    release();
    m_device = device;
    m_queue = queue;
    radius = std::max(1, radius);

    const uint32_t w = static_cast<uint32_t>(std::max(1, width));
    const uint32_t h = static_cast<uint32_t>(std::max(1, height));
    m_raw = createTarget(device, w, h, WGPUTextureFormat_R8Unorm,
                         WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst, "Raw Depth");
    m_filtered = createTarget(device, w, h, WGPUTextureFormat_R8Unorm,
                              WGPUTextureUsage_TextureBinding | WGPUTextureUsage_RenderAttachment,
                              "Filtered Depth");
    m_uniforms = createUniformBuffer(device, sizeof(FilterUniforms), "Depth Filter Uniforms");
    if (!m_raw || !m_filtered || !m_uniforms) {
        error = "Failed to allocate depth filter resources";
        release();
        return false;
    }

    std::string shader = "const RADIUS: i32 = " + std::to_string(radius) + ";\n";
    shader += FULLSCREEN_VERTEX_SHADER;
    shader += FILTER_FRAGMENT_SHADER;

    PipelineBuilder builder(device);
    builder.label("Depth Filter")
           .shader(shader)
           .colorTarget(WGPUTextureFormat_R8Unorm)
           .uniform(0, sizeof(FilterUniforms))
           .texture(1);
    if (!builder.build(m_pipeline)) {
        error = builder.error();
        release();
        return false;
    }

    FilterUniforms uniforms = {};
    uniforms.spatialSigma2 = bilateralSpatialSigma2(radius);
    uniforms.depthSigma2 = BILATERAL_DEPTH_SIGMA2;
    writeUniforms(queue, m_uniforms, uniforms);

    m_bindGroup = BindGroupBuilder(device, m_pipeline.layout(0))
        .buffer(0, m_uniforms, sizeof(FilterUniforms))
        .texture(1, m_raw.view)
        .build();
    if (!m_bindGroup) {
        error = "Failed to create depth filter bind group";
        release();
        return false;
    }
    return true;
}

void DepthFilterPass::upload(const uint8_t* depth) {
    if (!m_raw || !depth) return;
    writeTexture(m_queue, m_raw.texture, depth, 1, m_raw.width, m_raw.height);
}

void DepthFilterPass::encode(WGPUCommandEncoder encoder) {
    if (!m_bindGroup) return;
    WGPURenderPassEncoder pass = beginPass(encoder, m_filtered.view);
    wgpuRenderPassEncoderSetPipeline(pass, m_pipeline.pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, m_bindGroup, 0, nullptr);
    wgpuRenderPassEncoderDraw(pass, 3, 1, 0, 0);
    endPass(pass);
}

void DepthFilterPass::release() {
    m_bindGroup.reset();
    m_uniforms.reset();
    m_filtered.reset();
    m_raw.reset();
    m_pipeline.reset();
}

} // namespace layershift::gpu
