// Layershift - Parallax renderer (WebGPU)

#include <layershift/effects/parallax_renderer.h>
#include <algorithm>
#include <iostream>

namespace layershift::gpu {

namespace {

const char* PARALLAX_FRAGMENT_SHADER = R"(
const MAX_POM_STEPS: i32 = 64;

struct ParallaxUniforms {
    offset: vec2f,
    strength: f32,
    pomEnabled: f32,
    pomSteps: f32,
    contrastLow: f32,
    contrastHigh: f32,
    verticalReduction: f32,
    dofStart: f32,
    dofStrength: f32,
    imageTexelSize: vec2f,
};

@group(0) @binding(0) var<uniform> uniforms: ParallaxUniforms;
@group(0) @binding(1) var sourceTex: texture_2d<f32>;
@group(0) @binding(2) var depthTex: texture_2d<f32>;
@group(0) @binding(3) var texSampler: sampler;

fn depthAt(uv: vec2f) -> f32 {
    let raw = textureSampleLevel(depthTex, texSampler, uv, 0.0).r;
    return smoothstep(uniforms.contrastLow, uniforms.contrastHigh, raw);
}

// March from the fully displaced position down through depth layers
fn displace(uv: vec2f, shift: vec2f) -> vec2f {
    if (uniforms.pomEnabled < 0.5) {
        return uv + shift * depthAt(uv);
    }

    let steps = clamp(i32(uniforms.pomSteps), 1, MAX_POM_STEPS);
    let layerStep = 1.0 / f32(steps);
    var layer = 1.0;
    var current = uv + shift;
    var surface = depthAt(current);
    var previousUv = current;
    var previousGap = surface - layer;

    for (var i = 0; i < MAX_POM_STEPS; i++) {
        if (i >= steps || surface >= layer) {
            break;
        }
        previousUv = current;
        previousGap = surface - layer;
        layer -= layerStep;
        current = uv + shift * layer;
        surface = depthAt(current);
    }

    let gap = surface - layer;
    let denom = gap - previousGap;
    var t = 0.0;
    if (abs(denom) > 1e-5) {
        t = gap / denom;
    }
    return mix(current, previousUv, clamp(t, 0.0, 1.0));
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let shift = uniforms.offset * vec2f(1.0, 1.0 - uniforms.verticalReduction) * uniforms.strength;
    let uv = displace(input.uv, shift);
    let depth = depthAt(uv);

    let sharp = textureSampleLevel(sourceTex, texSampler, uv, 0.0).rgb;
    let t = uniforms.imageTexelSize * 2.0;
    let blurred = (textureSampleLevel(sourceTex, texSampler, uv + vec2f(t.x, 0.0), 0.0).rgb +
                   textureSampleLevel(sourceTex, texSampler, uv - vec2f(t.x, 0.0), 0.0).rgb +
                   textureSampleLevel(sourceTex, texSampler, uv + vec2f(0.0, t.y), 0.0).rgb +
                   textureSampleLevel(sourceTex, texSampler, uv - vec2f(0.0, t.y), 0.0).rgb) * 0.25;

    // Far regions (low depth) soften
    let blurWeight = smoothstep(uniforms.dofStart, 1.0, 1.0 - depth) * uniforms.dofStrength;
    return vec4f(mix(sharp, blurred, blurWeight), 1.0);
}
)";

} // namespace

ParallaxRenderer::ParallaxRenderer(WgpuContext& context, FrameScheduler& scheduler,
                                   const RenderSurface& surface, QualityParams quality,
                                   ParallaxSettings settings)
    : WgpuRenderer("ParallaxRenderer", context, scheduler, surface, quality)
    , m_settings(settings) {
}

ParallaxRenderer::~ParallaxRenderer() {
    dispose();
}

bool ParallaxRenderer::initialize(const MediaSource& source, int depthWidth, int depthHeight) {
    disposeRenderer();
    if (!initShared(source, depthWidth, depthHeight) || !createPipeline() || !createBindGroups()) {
        disposeRenderer();
        return false;
    }

    m_uniformData = {};
    m_uniformData.strength = m_settings.strength;
    m_uniformData.pomEnabled = m_settings.pomEnabled ? 1.0f : 0.0f;
    m_uniformData.pomSteps = static_cast<float>(
        std::clamp(std::min(m_settings.pomSteps, quality().pomSteps), 1, MAX_POM_STEPS));
    m_uniformData.contrastLow = m_settings.contrastLow;
    m_uniformData.contrastHigh = m_settings.contrastHigh;
    m_uniformData.verticalReduction = m_settings.verticalReduction;
    m_uniformData.dofStart = m_settings.dofStart;
    m_uniformData.dofStrength = m_settings.dofStrength;
    m_uniformData.imageTexelSize[0] = 1.0f / static_cast<float>(source.width());
    m_uniformData.imageTexelSize[1] = 1.0f / static_cast<float>(source.height());

    recalculateViewport();
    std::cout << "[" << tag() << "] Initialized " << source.width() << "x" << source.height()
              << ", depth " << this->depthWidth() << "x" << this->depthHeight()
              << ", POM " << (m_settings.pomEnabled ? "on" : "off") << std::endl;
    return true;
}

bool ParallaxRenderer::createPipeline() {
    PipelineBuilder builder(device());
    builder.label("Parallax")
           .shader(std::string(COVER_FIT_VERTEX_SHADER) + PARALLAX_FRAGMENT_SHADER)
           .colorTarget(context().surfaceFormat())
           .uniform(0, sizeof(ParallaxUniforms))
           .texture(1)
           .texture(2)
           .sampler(3)
           .group(1)
           .uniform(0, sizeof(ViewUniforms), WGPUShaderStage_Vertex);
    if (!builder.build(m_pipeline)) return fail(builder.error());

    m_uniforms = createUniformBuffer(device(), sizeof(ParallaxUniforms), "Parallax Uniforms");
    if (!m_uniforms) return fail("Failed to create parallax uniforms");
    return true;
}

bool ParallaxRenderer::createBindGroups() {
    m_bindGroup = BindGroupBuilder(device(), m_pipeline.layout(0))
        .buffer(0, m_uniforms, sizeof(ParallaxUniforms))
        .texture(1, m_sourceTexture.view)
        .texture(2, m_depthFilter.output())
        .sampler(3, m_linearSampler)
        .build();
    m_viewBindGroup = BindGroupBuilder(device(), m_pipeline.layout(1))
        .buffer(0, m_viewUniforms, sizeof(ViewUniforms))
        .build();
    if (!m_bindGroup || !m_viewBindGroup) return fail("Failed to create parallax bind groups");
    return true;
}

void ParallaxRenderer::onDepthUpdate(double timeSeconds) {
    updateDepth(timeSeconds);
}

void ParallaxRenderer::onRenderFrame() {
    if (!m_bindGroup) return;
    if (refreshSourceTexture() && !createBindGroups()) {
        reportError(error());
        return;
    }

    const glm::vec2 input = readInput();
    m_uniformData.offset[0] = -input.x * m_settings.parallaxX;
    m_uniformData.offset[1] = input.y * m_settings.parallaxY;
    writeUniforms(queue(), m_uniforms, m_uniformData);

    WGPUTextureView target = context().acquireFrame();
    if (!target) return;

    submit(device(), queue(), [&](WGPUCommandEncoder encoder) {
        WGPURenderPassEncoder pass = beginPass(encoder, target);
        wgpuRenderPassEncoderSetPipeline(pass, m_pipeline.pipeline);
        wgpuRenderPassEncoderSetBindGroup(pass, 0, m_bindGroup, 0, nullptr);
        wgpuRenderPassEncoderSetBindGroup(pass, 1, m_viewBindGroup, 0, nullptr);
        wgpuRenderPassEncoderDraw(pass, 3, 1, 0, 0);
        endPass(pass);
    });
    context().present();
}

void ParallaxRenderer::onViewportResize() {
    configureSurface();
    writeViewUniforms();
}

void ParallaxRenderer::disposeRenderer() {
    m_viewBindGroup.reset();
    m_bindGroup.reset();
    m_uniforms.reset();
    m_pipeline.reset();
    releaseShared();
}

glm::vec2 ParallaxRenderer::coverFitPadding() const {
    return {m_settings.strength, m_settings.overscan};
}

} // namespace layershift::gpu
