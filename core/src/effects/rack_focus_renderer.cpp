// Layershift - Rack focus renderer (WebGPU)

#include <layershift/effects/rack_focus_renderer.h>
#include <algorithm>
#include <iostream>

namespace layershift::gpu {

namespace {

const char* BREATH_FUNCTION = R"(
fn breathe(uv: vec2f, offset: vec2f, scale: f32) -> vec2f {
    return (uv + offset) / scale;
}
)";

const char* COC_FRAGMENT_SHADER = R"(
struct CocUniforms {
    focalDepth: f32,
    breathScale: f32,
    breathOffset: vec2f,
    aperture: f32,
    focusRange: f32,
    depthScale: f32,
    maxBlurRadius: f32,
};

@group(0) @binding(0) var<uniform> uniforms: CocUniforms;
@group(0) @binding(1) var depthTex: texture_2d<f32>;
@group(0) @binding(2) var texSampler: sampler;

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let uv = breathe(input.uv, uniforms.breathOffset, uniforms.breathScale);
    let depth = textureSampleLevel(depthTex, texSampler, uv, 0.0).r;
    let diff = depth - uniforms.focalDepth;
    let outside = max(abs(diff) - uniforms.focusRange, 0.0);
    let blur = outside * uniforms.depthScale * uniforms.aperture / max(uniforms.maxBlurRadius, 1.0);
    return vec4f(clamp(sign(diff) * blur, -1.0, 1.0), 0.0, 0.0, 1.0);
}
)";

const char* BLUR_FRAGMENT_SHADER = R"(
const MAX_SAMPLES: i32 = 64;

struct BlurUniforms {
    samples: array<vec4f, 64>,
    sampleCount: f32,
    maxBlurRadius: f32,
    breathScale: f32,
    _pad0: f32,
    texelSize: vec2f,
    breathOffset: vec2f,
};

@group(0) @binding(0) var<uniform> uniforms: BlurUniforms;
@group(0) @binding(1) var sourceTex: texture_2d<f32>;
@group(0) @binding(2) var cocTex: texture_2d<f32>;
@group(0) @binding(3) var texSampler: sampler;

fn sourceAt(screenUv: vec2f) -> vec3f {
    let uv = viewUniforms.uvOffset + screenUv * viewUniforms.uvScale;
    return textureSampleLevel(sourceTex, texSampler,
                              breathe(uv, uniforms.breathOffset, uniforms.breathScale), 0.0).rgb;
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let centerCoc = abs(textureSampleLevel(cocTex, texSampler, input.screenUv, 0.0).r);
    let radius = centerCoc * uniforms.maxBlurRadius;
    let count = clamp(i32(uniforms.sampleCount), 1, MAX_SAMPLES);

    var color = vec3f(0.0);
    var weightSum = 0.0;
    for (var i = 0; i < MAX_SAMPLES; i++) {
        if (i >= count) {
            break;
        }
        let o = uniforms.samples[i].xy;
        let sampleUv = input.screenUv + o * radius * uniforms.texelSize;
        let sampleRadius = abs(textureSampleLevel(cocTex, texSampler, sampleUv, 0.0).r) * uniforms.maxBlurRadius;
        // Sharper neighbours only reach as far as their own blur
        let w = clamp(sampleRadius - length(o) * radius + 1.0, 0.0, 1.0);
        color += sourceAt(sampleUv) * w;
        weightSum += w;
    }
    if (weightSum <= 0.0) {
        return vec4f(sourceAt(input.screenUv), 1.0);
    }
    return vec4f(color / weightSum, 1.0);
}
)";

const char* COMPOSITE_FRAGMENT_SHADER = R"(
struct CompositeUniforms {
    breathOffset: vec2f,
    breathScale: f32,
    vignette: f32,
    highlightThreshold: f32,
    highlightBoost: f32,
    highlightBloom: f32,
    _pad0: f32,
};

@group(0) @binding(0) var<uniform> uniforms: CompositeUniforms;
@group(0) @binding(1) var sourceTex: texture_2d<f32>;
@group(0) @binding(2) var blurTex: texture_2d<f32>;
@group(0) @binding(3) var cocTex: texture_2d<f32>;
@group(0) @binding(4) var texSampler: sampler;

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let uv = breathe(input.uv, uniforms.breathOffset, uniforms.breathScale);
    let sharp = textureSampleLevel(sourceTex, texSampler, uv, 0.0).rgb;
    let blurred = textureSampleLevel(blurTex, texSampler, input.screenUv, 0.0).rgb;
    let coc = abs(textureSampleLevel(cocTex, texSampler, input.screenUv, 0.0).r);

    var color = mix(sharp, blurred, coc);

    if (uniforms.highlightBloom > 0.5) {
        let luma = dot(blurred, vec3f(0.2126, 0.7152, 0.0722));
        let highlight = max(luma - uniforms.highlightThreshold, 0.0) * uniforms.highlightBoost;
        color += blurred * highlight * coc;
    }

    let d = distance(input.screenUv, vec2f(0.5)) * 1.41421356;
    color *= 1.0 - uniforms.vignette * d * d;
    return vec4f(clamp(color, vec3f(0.0), vec3f(1.0)), 1.0);
}
)";

} // namespace

RackFocusRenderer::RackFocusRenderer(WgpuContext& context, FrameScheduler& scheduler,
                                     const RenderSurface& surface, QualityParams quality,
                                     RackFocusSettings settings, FocusStateProvider focus)
    : WgpuRenderer("RackFocusRenderer", context, scheduler, surface, quality)
    , m_settings(settings)
    , m_focus(std::move(focus)) {
}

RackFocusRenderer::~RackFocusRenderer() {
    dispose();
}

bool RackFocusRenderer::initialize(const MediaSource& source, int depthWidth, int depthHeight) {
    disposeRenderer();
    if (!initShared(source, depthWidth, depthHeight) || !createPipelines()) {
        disposeRenderer();
        return false;
    }

    m_blurData = {};
    const std::vector<glm::vec2> disk = generatePoissonDisk(quality().poissonSamples);
    for (size_t i = 0; i < disk.size(); ++i) {
        m_blurData.samples[i][0] = disk[i].x;
        m_blurData.samples[i][1] = disk[i].y;
    }
    m_blurData.sampleCount = static_cast<float>(disk.size());
    m_blurData.maxBlurRadius = m_settings.maxBlur / static_cast<float>(std::max(1, quality().dofDivisor));

    // Creates the dof targets and bind groups through onViewportResize()
    recalculateViewport();
    if (!m_compositeBindGroup) {
        disposeRenderer();
        return fail(error().empty() ? "Failed to create rack focus targets" : error());
    }

    std::cout << "[" << tag() << "] Initialized " << source.width() << "x" << source.height()
              << ", " << disk.size() << " blur samples, dof divisor " << quality().dofDivisor << std::endl;
    return true;
}

bool RackFocusRenderer::createPipelines() {
    const std::string vertex = std::string(COVER_FIT_VERTEX_SHADER) + BREATH_FUNCTION;

    PipelineBuilder coc(device());
    coc.label("Rack Focus CoC")
       .shader(vertex + COC_FRAGMENT_SHADER)
       .colorTarget(WGPUTextureFormat_R16Float)
       .uniform(0, sizeof(CocUniforms))
       .texture(1)
       .sampler(2)
       .group(1)
       .uniform(0, sizeof(ViewUniforms), WGPUShaderStage_Vertex);
    if (!coc.build(m_cocPipeline)) return fail(coc.error());

    PipelineBuilder blur(device());
    blur.label("Rack Focus Blur")
        .shader(vertex + BLUR_FRAGMENT_SHADER)
        .colorTarget(WGPUTextureFormat_RGBA16Float)
        .uniform(0, sizeof(BlurUniforms))
        .texture(1)
        .texture(2)
        .sampler(3)
        .group(1)
        .uniform(0, sizeof(ViewUniforms), WGPUShaderStage_Vertex | WGPUShaderStage_Fragment);
    if (!blur.build(m_blurPipeline)) return fail(blur.error());

    PipelineBuilder composite(device());
    composite.label("Rack Focus Composite")
             .shader(vertex + COMPOSITE_FRAGMENT_SHADER)
             .colorTarget(context().surfaceFormat())
             .uniform(0, sizeof(FocusCompositeUniforms))
             .texture(1)
             .texture(2)
             .texture(3)
             .sampler(4)
             .group(1)
             .uniform(0, sizeof(ViewUniforms), WGPUShaderStage_Vertex);
    if (!composite.build(m_compositePipeline)) return fail(composite.error());

    m_cocUniforms = createUniformBuffer(device(), sizeof(CocUniforms), "CoC Uniforms");
    m_blurUniforms = createUniformBuffer(device(), sizeof(BlurUniforms), "Blur Uniforms");
    m_compositeUniforms = createUniformBuffer(device(), sizeof(FocusCompositeUniforms), "Focus Composite Uniforms");
    if (!m_cocUniforms || !m_blurUniforms || !m_compositeUniforms) {
        return fail("Failed to create rack focus uniforms");
    }
    return true;
}

bool RackFocusRenderer::createTargets() {
    const glm::ivec2 size = dofResolution(bufferSize(), quality().dofDivisor);
    const WGPUTextureUsage usage = WGPUTextureUsage_RenderAttachment | WGPUTextureUsage_TextureBinding;
    m_cocTarget = createTarget(device(), static_cast<uint32_t>(size.x), static_cast<uint32_t>(size.y),
                               WGPUTextureFormat_R16Float, usage, "CoC");
    m_blurTarget = createTarget(device(), static_cast<uint32_t>(size.x), static_cast<uint32_t>(size.y),
                                WGPUTextureFormat_RGBA16Float, usage, "DoF Blur");
    if (!m_cocTarget || !m_blurTarget) return fail("Failed to create depth of field targets");

    m_blurData.texelSize[0] = 1.0f / static_cast<float>(size.x);
    m_blurData.texelSize[1] = 1.0f / static_cast<float>(size.y);
    return true;
}

bool RackFocusRenderer::createBindGroups() {
    m_cocBindGroup = BindGroupBuilder(device(), m_cocPipeline.layout(0))
        .buffer(0, m_cocUniforms, sizeof(CocUniforms))
        .texture(1, m_depthFilter.output())
        .sampler(2, m_linearSampler)
        .build();
    m_blurBindGroup = BindGroupBuilder(device(), m_blurPipeline.layout(0))
        .buffer(0, m_blurUniforms, sizeof(BlurUniforms))
        .texture(1, m_sourceTexture.view)
        .texture(2, m_cocTarget.view)
        .sampler(3, m_linearSampler)
        .build();
    m_compositeBindGroup = BindGroupBuilder(device(), m_compositePipeline.layout(0))
        .buffer(0, m_compositeUniforms, sizeof(FocusCompositeUniforms))
        .texture(1, m_sourceTexture.view)
        .texture(2, m_blurTarget.view)
        .texture(3, m_cocTarget.view)
        .sampler(4, m_linearSampler)
        .build();

    m_cocViewBindGroup = BindGroupBuilder(device(), m_cocPipeline.layout(1))
        .buffer(0, m_viewUniforms, sizeof(ViewUniforms))
        .build();
    m_blurViewBindGroup = BindGroupBuilder(device(), m_blurPipeline.layout(1))
        .buffer(0, m_viewUniforms, sizeof(ViewUniforms))
        .build();
    m_compositeViewBindGroup = BindGroupBuilder(device(), m_compositePipeline.layout(1))
        .buffer(0, m_viewUniforms, sizeof(ViewUniforms))
        .build();

    if (!m_cocBindGroup || !m_blurBindGroup || !m_compositeBindGroup ||
        !m_cocViewBindGroup || !m_blurViewBindGroup || !m_compositeViewBindGroup) {
        m_compositeBindGroup.reset();
        return fail("Failed to create rack focus bind groups");
    }
    return true;
}

void RackFocusRenderer::onDepthUpdate(double timeSeconds) {
    updateDepth(timeSeconds);
}

void RackFocusRenderer::onRenderFrame() {
    if (!m_compositeBindGroup) return;
    if (refreshSourceTexture() && !createBindGroups()) {
        reportError(error());
        return;
    }

    const FocusState focus = m_focus ? m_focus() : FocusState{};

    CocUniforms coc = {};
    coc.focalDepth = focus.focalDepth;
    coc.breathScale = focus.breathScale;
    coc.breathOffset[0] = focus.breathOffset.x;
    coc.breathOffset[1] = focus.breathOffset.y;
    coc.aperture = m_settings.aperture;
    coc.focusRange = m_settings.focusRange;
    coc.depthScale = m_settings.depthScale;
    coc.maxBlurRadius = m_settings.maxBlur;
    writeUniforms(queue(), m_cocUniforms, coc);

    m_blurData.breathScale = focus.breathScale;
    m_blurData.breathOffset[0] = focus.breathOffset.x;
    m_blurData.breathOffset[1] = focus.breathOffset.y;
    writeUniforms(queue(), m_blurUniforms, m_blurData);

    FocusCompositeUniforms composite = {};
    composite.breathOffset[0] = focus.breathOffset.x;
    composite.breathOffset[1] = focus.breathOffset.y;
    composite.breathScale = focus.breathScale;
    composite.vignette = m_settings.vignette;
    composite.highlightThreshold = m_settings.highlightThreshold;
    composite.highlightBoost = m_settings.highlightBoost;
    composite.highlightBloom = m_settings.highlightBloom ? 1.0f : 0.0f;
    writeUniforms(queue(), m_compositeUniforms, composite);

    WGPUTextureView target = context().acquireFrame();
    if (!target) return;

    submit(device(), queue(), [&](WGPUCommandEncoder encoder) {
        WGPURenderPassEncoder pass = beginPass(encoder, m_cocTarget.view);
        wgpuRenderPassEncoderSetPipeline(pass, m_cocPipeline.pipeline);
        wgpuRenderPassEncoderSetBindGroup(pass, 0, m_cocBindGroup, 0, nullptr);
        wgpuRenderPassEncoderSetBindGroup(pass, 1, m_cocViewBindGroup, 0, nullptr);
        wgpuRenderPassEncoderDraw(pass, 3, 1, 0, 0);
        endPass(pass);

        pass = beginPass(encoder, m_blurTarget.view);
        wgpuRenderPassEncoderSetPipeline(pass, m_blurPipeline.pipeline);
        wgpuRenderPassEncoderSetBindGroup(pass, 0, m_blurBindGroup, 0, nullptr);
        wgpuRenderPassEncoderSetBindGroup(pass, 1, m_blurViewBindGroup, 0, nullptr);
        wgpuRenderPassEncoderDraw(pass, 3, 1, 0, 0);
        endPass(pass);

        pass = beginPass(encoder, target);
        wgpuRenderPassEncoderSetPipeline(pass, m_compositePipeline.pipeline);
        wgpuRenderPassEncoderSetBindGroup(pass, 0, m_compositeBindGroup, 0, nullptr);
        wgpuRenderPassEncoderSetBindGroup(pass, 1, m_compositeViewBindGroup, 0, nullptr);
        wgpuRenderPassEncoderDraw(pass, 3, 1, 0, 0);
        endPass(pass);
    });
    context().present();
}

void RackFocusRenderer::onViewportResize() {
    configureSurface();
    writeViewUniforms();
    if (!m_cocPipeline.pipeline) return;

    // Bind groups reference the dof views, so both are rebuilt together
    m_compositeBindGroup.reset();
    if (!createTargets() || !createBindGroups()) {
        reportError(error());
    }
}

void RackFocusRenderer::disposeRenderer() {
    m_compositeViewBindGroup.reset();
    m_blurViewBindGroup.reset();
    m_cocViewBindGroup.reset();
    m_compositeBindGroup.reset();
    m_blurBindGroup.reset();
    m_cocBindGroup.reset();
    m_blurTarget.reset();
    m_cocTarget.reset();
    m_compositeUniforms.reset();
    m_blurUniforms.reset();
    m_cocUniforms.reset();
    m_compositePipeline.reset();
    m_blurPipeline.reset();
    m_cocPipeline.reset();
    releaseShared();
}

} // namespace layershift::gpu
