// Layershift - Jump-flood distance field passes (WebGPU)

#include <layershift/effects/jump_flood_pass.h>
#include <layershift/effects/gpu_common.h>
#include <layershift/jump_flood.h>
#include <algorithm>

namespace layershift::gpu {

namespace {

struct MaskUniforms {
    float meshScale[2];
    float _pad[2];
};

struct FloodUniforms {
    int32_t step;
    float _pad[3];
};

struct DistanceUniforms {
    float range;
    float _pad[3];
};

const char* MASK_SHADER = R"(
struct MaskUniforms {
    meshScale: vec2f,
    _pad: vec2f,
};

@group(0) @binding(0) var<uniform> uniforms: MaskUniforms;

@vertex
fn vs_main(@location(0) position: vec2f) -> @builtin(position) vec4f {
    return vec4f(position * uniforms.meshScale, 0.0, 1.0);
}

@fragment
fn fs_main() -> @location(0) vec4f {
    return vec4f(1.0, 0.0, 0.0, 1.0);
}
)";

const char* SEED_FRAGMENT_SHADER = R"(
@group(0) @binding(0) var mask: texture_2d<f32>;

fn inside(p: vec2i, size: vec2i) -> bool {
    let q = clamp(p, vec2i(0), size - vec2i(1));
    return textureLoad(mask, q, 0).r >= 0.5;
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let size = vec2i(textureDimensions(mask));
    let p = vec2i(floor(input.position.xy));
    let c = inside(p, size);
    let edge = c != inside(p + vec2i(1, 0), size) || c != inside(p - vec2i(1, 0), size) ||
               c != inside(p + vec2i(0, 1), size) || c != inside(p - vec2i(0, 1), size);
    if (edge) {
        return vec4f(f32(p.x), f32(p.y), 0.0, 1.0);
    }
    return vec4f(-1.0, -1.0, 0.0, 1.0);
}
)";

const char* FLOOD_FRAGMENT_SHADER = R"(
struct FloodUniforms {
    step: i32,
    _pad1: f32,
    _pad2: f32,
    _pad3: f32,
};

@group(0) @binding(0) var<uniform> uniforms: FloodUniforms;
@group(0) @binding(1) var seeds: texture_2d<f32>;

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let size = vec2i(textureDimensions(seeds));
    let p = vec2i(floor(input.position.xy));
    let pf = vec2f(p);

    var best = textureLoad(seeds, p, 0).xy;
    var bestDist2 = 1.0e20;
    if (best.x >= 0.0) {
        let d = best - pf;
        bestDist2 = dot(d, d);
    }

    for (var oy = -1; oy <= 1; oy++) {
        for (var ox = -1; ox <= 1; ox++) {
            if (ox == 0 && oy == 0) {
                continue;
            }
            let s = p + vec2i(ox, oy) * uniforms.step;
            if (s.x < 0 || s.y < 0 || s.x >= size.x || s.y >= size.y) {
                continue;
            }
            let n = textureLoad(seeds, s, 0).xy;
            if (n.x < 0.0) {
                continue;
            }
            let d = n - pf;
            let d2 = dot(d, d);
            if (d2 < bestDist2) {
                bestDist2 = d2;
                best = n;
            }
        }
    }
    return vec4f(best, 0.0, 1.0);
}
)";

const char* DISTANCE_FRAGMENT_SHADER = R"(
struct DistanceUniforms {
    range: f32,
    _pad1: f32,
    _pad2: f32,
    _pad3: f32,
};

@group(0) @binding(0) var<uniform> uniforms: DistanceUniforms;
@group(0) @binding(1) var seeds: texture_2d<f32>;
@group(0) @binding(2) var mask: texture_2d<f32>;

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let size = vec2i(textureDimensions(seeds));
    let p = vec2i(floor(input.position.xy));

    if (textureLoad(mask, p, 0).r < 0.5) {
        return vec4f(0.0, 0.0, 0.0, 1.0);
    }
    let seed = textureLoad(seeds, p, 0).xy;
    if (seed.x < 0.0) {
        return vec4f(1.0, 1.0, 1.0, 1.0);
    }
    let maxDim = f32(max(size.x, size.y));
    let d = clamp((distance(seed, vec2f(p)) / maxDim) / max(uniforms.range, 0.001), 0.0, 1.0);
    return vec4f(d, d, d, 1.0);
}
)";

} // namespace

bool JumpFloodPass::init(WGPUDevice device, WGPUQueue queue, std::string& error) {
    release();
    m_device = device;
    m_queue = queue;

    std::vector<WGPUVertexAttribute> position(1);
    position[0].format = WGPUVertexFormat_Float32x2;
    position[0].offset = 0;
    position[0].shaderLocation = 0;

    PipelineBuilder mask(device);
    mask.label("JFA Mask")
        .shader(MASK_SHADER)
        .colorTarget(WGPUTextureFormat_R8Unorm)
        .vertexBuffer(2 * sizeof(float), position)
        .uniform(0, sizeof(MaskUniforms), WGPUShaderStage_Vertex);
    if (!mask.build(m_maskPipeline)) {
        error = mask.error();
        return false;
    }

    PipelineBuilder seed(device);
    seed.label("JFA Seed")
        .shader(std::string(FULLSCREEN_VERTEX_SHADER) + SEED_FRAGMENT_SHADER)
        .colorTarget(WGPUTextureFormat_RG32Float)
        .texture(0);
    if (!seed.build(m_seedPipeline)) {
        error = seed.error();
        return false;
    }

    PipelineBuilder flood(device);
    flood.label("JFA Flood")
         .shader(std::string(FULLSCREEN_VERTEX_SHADER) + FLOOD_FRAGMENT_SHADER)
         .colorTarget(WGPUTextureFormat_RG32Float)
         .uniform(0, sizeof(FloodUniforms))
         .texture(1, false);
    if (!flood.build(m_floodPipeline)) {
        error = flood.error();
        return false;
    }

    PipelineBuilder dist(device);
    dist.label("JFA Distance")
        .shader(std::string(FULLSCREEN_VERTEX_SHADER) + DISTANCE_FRAGMENT_SHADER)
        .colorTarget(WGPUTextureFormat_RGBA8Unorm)
        .uniform(0, sizeof(DistanceUniforms))
        .texture(1, false)
        .texture(2);
    if (!dist.build(m_distancePipeline)) {
        error = dist.error();
        return false;
    }

    m_maskUniforms = createUniformBuffer(device, sizeof(MaskUniforms), "JFA Mask Uniforms");
    m_distanceUniforms = createUniformBuffer(device, sizeof(DistanceUniforms), "JFA Distance Uniforms");
    if (!m_maskUniforms || !m_distanceUniforms) {
        error = "Failed to allocate distance field uniforms";
        return false;
    }

    m_maskBindGroup = BindGroupBuilder(device, m_maskPipeline.layout(0))
        .buffer(0, m_maskUniforms, sizeof(MaskUniforms))
        .build();
    return static_cast<bool>(m_maskBindGroup);
}

bool JumpFloodPass::resize(int width, int height, std::string& error) {
    m_width = std::max(1, width);
    m_height = std::max(1, height);
    m_dirty = true;

    const uint32_t w = static_cast<uint32_t>(m_width);
    const uint32_t h = static_cast<uint32_t>(m_height);
    const WGPUTextureUsage usage = WGPUTextureUsage_RenderAttachment | WGPUTextureUsage_TextureBinding;
    m_mask = createTarget(m_device, w, h, WGPUTextureFormat_R8Unorm, usage, "JFA Mask");
    m_seedsA = createTarget(m_device, w, h, WGPUTextureFormat_RG32Float, usage, "JFA Seeds A");
    m_seedsB = createTarget(m_device, w, h, WGPUTextureFormat_RG32Float, usage, "JFA Seeds B");
    m_distance = createTarget(m_device, w, h, WGPUTextureFormat_RGBA8Unorm, usage, "JFA Distance");
    if (!m_mask || !m_seedsA || !m_seedsB || !m_distance) {
        error = "Failed to allocate distance field textures";
        return false;
    }

    m_seedBindGroup = BindGroupBuilder(m_device, m_seedPipeline.layout(0))
        .texture(0, m_mask.view)
        .build();

    // Uniform writes land before the submit, so every step needs its own buffer
    m_steps = jumpFloodSteps(m_width, m_height);
    m_stepUniforms.clear();
    m_floodBindGroups.clear();
    for (size_t i = 0; i < m_steps.size(); ++i) {
        BufferHandle buffer = createUniformBuffer(m_device, sizeof(FloodUniforms), "JFA Step Uniforms");
        if (!buffer) {
            error = "Failed to allocate distance field step uniforms";
            return false;
        }
        FloodUniforms uniforms = {};
        uniforms.step = m_steps[i];
        writeUniforms(m_queue, buffer, uniforms);

        // Step 0 reads the seed output in A, then the textures alternate
        WGPUTextureView source = (i % 2 == 0) ? m_seedsA.view.get() : m_seedsB.view.get();
        m_floodBindGroups.push_back(BindGroupBuilder(m_device, m_floodPipeline.layout(0))
            .buffer(0, buffer, sizeof(FloodUniforms))
            .texture(1, source)
            .build());
        m_stepUniforms.push_back(std::move(buffer));
    }

    WGPUTextureView finalSeeds = (m_steps.size() % 2 == 0) ? m_seedsA.view.get() : m_seedsB.view.get();
    m_distanceBindGroup = BindGroupBuilder(m_device, m_distancePipeline.layout(0))
        .buffer(0, m_distanceUniforms, sizeof(DistanceUniforms))
        .texture(1, finalSeeds)
        .texture(2, m_mask.view)
        .build();

    if (!m_seedBindGroup || !m_distanceBindGroup) {
        error = "Failed to create distance field bind groups";
        return false;
    }
    return true;
}

void JumpFloodPass::runFullscreen(WGPUCommandEncoder encoder, WGPUTextureView target,
                                  const BuiltPipeline& pipeline, WGPUBindGroup bindGroup) {
    WGPURenderPassEncoder pass = beginPass(encoder, target);
    wgpuRenderPassEncoderSetPipeline(pass, pipeline.pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, bindGroup, 0, nullptr);
    wgpuRenderPassEncoderDraw(pass, 3, 1, 0, 0);
    endPass(pass);
}

void JumpFloodPass::encode(WGPUCommandEncoder encoder, WGPUBuffer vertices, WGPUBuffer indices,
                           uint32_t indexCount, glm::vec2 meshScale, float range) {
    if (!m_dirty || !m_distanceBindGroup || !vertices || !indices) return;

    MaskUniforms maskUniforms = {{meshScale.x, meshScale.y}, {0.0f, 0.0f}};
    writeUniforms(m_queue, m_maskUniforms, maskUniforms);
    DistanceUniforms distanceUniforms = {range, {0.0f, 0.0f, 0.0f}};
    writeUniforms(m_queue, m_distanceUniforms, distanceUniforms);

    // Mask
    ColorAttachment clearMask;
    clearMask.view = m_mask.view;
    clearMask.clearValue = {0.0, 0.0, 0.0, 0.0};
    WGPURenderPassEncoder pass = beginPass(encoder, &clearMask, 1);
    wgpuRenderPassEncoderSetPipeline(pass, m_maskPipeline.pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, m_maskBindGroup, 0, nullptr);
    wgpuRenderPassEncoderSetVertexBuffer(pass, 0, vertices, 0, WGPU_WHOLE_SIZE);
    wgpuRenderPassEncoderSetIndexBuffer(pass, indices, WGPUIndexFormat_Uint16, 0, WGPU_WHOLE_SIZE);
    wgpuRenderPassEncoderDrawIndexed(pass, indexCount, 1, 0, 0, 0);
    endPass(pass);

    runFullscreen(encoder, m_seedsA.view, m_seedPipeline, m_seedBindGroup);

    for (size_t i = 0; i < m_steps.size(); ++i) {
        WGPUTextureView target = (i % 2 == 0) ? m_seedsB.view.get() : m_seedsA.view.get();
        runFullscreen(encoder, target, m_floodPipeline, m_floodBindGroups[i]);
    }

    runFullscreen(encoder, m_distance.view, m_distancePipeline, m_distanceBindGroup);
    m_dirty = false;
}

void JumpFloodPass::release() {
    m_distanceBindGroup.reset();
    m_floodBindGroups.clear();
    m_seedBindGroup.reset();
    m_maskBindGroup.reset();
    m_stepUniforms.clear();
    m_distanceUniforms.reset();
    m_maskUniforms.reset();
    m_distance.reset();
    m_seedsB.reset();
    m_seedsA.reset();
    m_mask.reset();
    m_distancePipeline.reset();
    m_floodPipeline.reset();
    m_seedPipeline.reset();
    m_maskPipeline.reset();
    m_steps.clear();
    m_dirty = true;
}

} // namespace layershift::gpu
