// Layershift - Portal renderer (WebGPU)

#include <layershift/effects/portal_renderer.h>
#include <layershift/jump_flood.h>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace layershift::gpu {

namespace {

constexpr int MAX_INTERIOR_POM_STEPS = 64;

const char* INTERIOR_FRAGMENT_SHADER = R"(
const MAX_POM_STEPS: i32 = 64;
const INTERIOR_VIGNETTE: f32 = 0.25;

struct InteriorUniforms {
    offset: vec2f,
    strength: f32,
    pomSteps: f32,
    contrastLow: f32,
    contrastHigh: f32,
    verticalReduction: f32,
    dofStart: f32,
    dofStrength: f32,
    depthPower: f32,
    depthScale: f32,
    depthBias: f32,
    fogColor: vec3f,
    fogDensity: f32,
    colorShift: f32,
    brightnessBias: f32,
    imageTexelSize: vec2f,
};

@group(0) @binding(0) var<uniform> uniforms: InteriorUniforms;
@group(0) @binding(1) var sourceTex: texture_2d<f32>;
@group(0) @binding(2) var depthTex: texture_2d<f32>;
@group(0) @binding(3) var texSampler: sampler;

struct InteriorOutput {
    @location(0) color: vec4f,
    @location(1) lensDepth: vec4f,
};

fn depthAt(uv: vec2f) -> f32 {
    let raw = textureSampleLevel(depthTex, texSampler, uv, 0.0).r;
    return smoothstep(uniforms.contrastLow, uniforms.contrastHigh, raw);
}

fn displace(uv: vec2f, shift: vec2f) -> vec2f {
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
fn fs_main(input: VertexOutput) -> InteriorOutput {
    let shift = uniforms.offset * vec2f(1.0, 1.0 - uniforms.verticalReduction) * uniforms.strength;
    let uv = displace(input.uv, shift);
    let depth = depthAt(uv);
    let lens = clamp(pow(max(depth, 0.0), uniforms.depthPower) * uniforms.depthScale + uniforms.depthBias,
                     0.0, 1.0);

    var color = textureSampleLevel(sourceTex, texSampler, uv, 0.0).rgb;
    let t = uniforms.imageTexelSize * 2.0;
    let blurred = (textureSampleLevel(sourceTex, texSampler, uv + vec2f(t.x, 0.0), 0.0).rgb +
                   textureSampleLevel(sourceTex, texSampler, uv - vec2f(t.x, 0.0), 0.0).rgb +
                   textureSampleLevel(sourceTex, texSampler, uv + vec2f(0.0, t.y), 0.0).rgb +
                   textureSampleLevel(sourceTex, texSampler, uv - vec2f(0.0, t.y), 0.0).rgb) * 0.25;
    color = mix(color, blurred, smoothstep(uniforms.dofStart, 1.0, 1.0 - lens) * uniforms.dofStrength);

    // Far regions drift cool, near regions lift
    let farAmount = 1.0 - lens;
    let luma = dot(color, vec3f(0.2126, 0.7152, 0.0722));
    color = mix(color, vec3f(luma) * vec3f(0.85, 0.95, 1.15), uniforms.colorShift * farAmount * 0.5);
    color += vec3f(uniforms.brightnessBias * lens);

    // Shifted lookups near the source border fade into the fog
    let border = min(min(uv.x, 1.0 - uv.x), min(uv.y, 1.0 - uv.y));
    let edgeFade = 1.0 - smoothstep(0.0, 0.02, border);
    let fog = clamp(farAmount * uniforms.fogDensity * 2.0, 0.0, 1.0);
    color = mix(color, uniforms.fogColor, max(fog, edgeFade));

    let v = distance(input.screenUv, vec2f(0.5)) * 1.41421356;
    color *= 1.0 - INTERIOR_VIGNETTE * v * v;

    var out: InteriorOutput;
    out.color = vec4f(clamp(color, vec3f(0.0), vec3f(1.0)), 1.0);
    out.lensDepth = vec4f(lens, 0.0, 0.0, 1.0);
    return out;
}
)";

const char* STENCIL_SHADER = R"(
struct MeshUniforms {
    meshScale: vec2f,
    _pad: vec2f,
};

@group(0) @binding(0) var<uniform> meshUniforms: MeshUniforms;

@vertex
fn vs_main(@location(0) position: vec2f) -> @builtin(position) vec4f {
    return vec4f(position * meshUniforms.meshScale, 0.0, 1.0);
}

@fragment
fn fs_main() -> @location(0) vec4f {
    return vec4f(0.0);
}
)";

const char* COMPOSITE_FRAGMENT_SHADER = R"(
struct CompositeUniforms {
    edgeOcclusionWidth: f32,
    edgeOcclusionStrength: f32,
    distanceRange: f32,
    bevelIntensity: f32,
    bevelWidth: f32,
    bevelDarkening: f32,
    bevelDesaturation: f32,
    bevelLightAngle: f32,
    distanceTexelSize: vec2f,
    _pad: vec2f,
};

@group(0) @binding(0) var<uniform> uniforms: CompositeUniforms;
@group(0) @binding(1) var interiorColor: texture_2d<f32>;
@group(0) @binding(2) var interiorDepth: texture_2d<f32>;
@group(0) @binding(3) var distanceTex: texture_2d<f32>;
@group(0) @binding(4) var texSampler: sampler;

fn edgeDistance(uv: vec2f) -> f32 {
    return textureSampleLevel(distanceTex, texSampler, uv, 0.0).r * uniforms.distanceRange;
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    var color = textureSampleLevel(interiorColor, texSampler, input.uv, 0.0).rgb;
    let lens = textureSampleLevel(interiorDepth, texSampler, input.uv, 0.0).r;
    let dist = edgeDistance(input.uv);

    // Emissive interior dims toward the silhouette; near content resists
    let occlusion = 1.0 - smoothstep(0.0, max(uniforms.edgeOcclusionWidth, 1e-4), dist);
    color *= 1.0 - uniforms.edgeOcclusionStrength * occlusion * (1.0 - 0.5 * lens);

    let bevel = 1.0 - smoothstep(0.0, max(uniforms.bevelWidth, 1e-4), dist);
    let t = uniforms.distanceTexelSize;
    let grad = vec2f(edgeDistance(input.uv + vec2f(t.x, 0.0)) - edgeDistance(input.uv - vec2f(t.x, 0.0)),
                     edgeDistance(input.uv + vec2f(0.0, t.y)) - edgeDistance(input.uv - vec2f(0.0, t.y)));
    var inward = vec2f(0.0);
    if (dot(grad, grad) > 1e-12) {
        inward = normalize(grad);
    }
    let light = vec2f(cos(uniforms.bevelLightAngle), -sin(uniforms.bevelLightAngle));
    let lit = dot(-inward, light) * uniforms.bevelIntensity * bevel;

    color = color * (1.0 - uniforms.bevelDarkening * bevel) + vec3f(lit * 0.5);
    let luma = dot(color, vec3f(0.2126, 0.7152, 0.0722));
    color = mix(color, vec3f(luma), uniforms.bevelDesaturation * bevel);
    return vec4f(clamp(color, vec3f(0.0), vec3f(1.0)), 1.0);
}
)";

const char* CHAMFER_SHADER = R"(
struct ChamferUniforms {
    lightDir: vec3f,
    ambient: f32,
    color: vec3f,
    specular: f32,
    meshScale: vec2f,
    texelSize: vec2f,
    shininess: f32,
    _pad1: f32,
    _pad2: f32,
    _pad3: f32,
};

@group(0) @binding(0) var<uniform> uniforms: ChamferUniforms;
@group(0) @binding(1) var interiorColor: texture_2d<f32>;
@group(0) @binding(2) var texSampler: sampler;

struct ChamferOutput {
    @builtin(position) position: vec4f,
    @location(0) normal: vec3f,
    @location(1) lerpT: f32,
    @location(2) screenUv: vec2f,
};

@vertex
fn vs_main(@location(0) position: vec2f, @location(1) normal: vec3f,
           @location(2) lerpT: f32) -> ChamferOutput {
    let clip = position * uniforms.meshScale;
    var out: ChamferOutput;
    out.position = vec4f(clip, 0.0, 1.0);
    out.normal = normal;
    out.lerpT = lerpT;
    out.screenUv = vec2f(clip.x * 0.5 + 0.5, 0.5 - clip.y * 0.5);
    return out;
}

fn interior(uv: vec2f) -> vec3f {
    return textureSampleLevel(interiorColor, texSampler, uv, 0.0).rgb;
}

@fragment
fn fs_main(input: ChamferOutput) -> @location(0) vec4f {
    let n = normalize(input.normal);
    let l = normalize(uniforms.lightDir);
    let h = normalize(l + vec3f(0.0, 0.0, -1.0));
    let diffuse = max(dot(n, l), 0.0);
    let spec = pow(max(dot(n, h), 0.0), uniforms.shininess) * uniforms.specular;

    // Frosted glass: the blur widens away from the silhouette
    let r = uniforms.texelSize * (1.0 + input.lerpT * 6.0);
    let frosted = (interior(input.screenUv) +
                   interior(input.screenUv + vec2f(r.x, r.y)) +
                   interior(input.screenUv + vec2f(-r.x, r.y)) +
                   interior(input.screenUv + vec2f(r.x, -r.y)) +
                   interior(input.screenUv + vec2f(-r.x, -r.y))) * 0.2;

    let base = uniforms.color * (uniforms.ambient + diffuse);
    let color = mix(frosted * 0.5, base, input.lerpT) + vec3f(spec);
    return vec4f(clamp(color, vec3f(0.0), vec3f(1.0)), 1.0);
}
)";

const char* RIM_SHADER = R"(
struct RimUniforms {
    meshScale: vec2f,
    rimWidth: f32,
    rimIntensity: f32,
    rimColor: vec3f,
    refractionStrength: f32,
    edgeColor: vec3f,
    chromaticStrength: f32,
    occlusionIntensity: f32,
    edgeThickness: f32,
    edgeSpecular: f32,
    distanceRange: f32,
    lightDir: vec2f,
    _pad: vec2f,
};

@group(0) @binding(0) var<uniform> uniforms: RimUniforms;
@group(0) @binding(1) var interiorColor: texture_2d<f32>;
@group(0) @binding(2) var distanceTex: texture_2d<f32>;
@group(0) @binding(3) var texSampler: sampler;

struct RimOutput {
    @builtin(position) position: vec4f,
    @location(0) edgeNormal: vec2f,
    @location(1) screenUv: vec2f,
};

@vertex
fn vs_main(@location(0) position: vec2f, @location(1) normal: vec2f) -> RimOutput {
    let clip = (position + normal * uniforms.rimWidth) * uniforms.meshScale;
    var out: RimOutput;
    out.position = vec4f(clip, 0.0, 1.0);
    out.edgeNormal = normal;
    out.screenUv = vec2f(clip.x * 0.5 + 0.5, 0.5 - clip.y * 0.5);
    return out;
}

fn interior(uv: vec2f) -> vec3f {
    return textureSampleLevel(interiorColor, texSampler, uv, 0.0).rgb;
}

@fragment
fn fs_main(input: RimOutput) -> @location(0) vec4f {
    // The interpolated normal shrinks to zero on the outline itself
    let across = clamp(length(input.edgeNormal), 0.0, 1.0);
    let rimCore = 1.0 - smoothstep(0.0, 1.0, across);
    var dir = vec2f(0.0);
    if (dot(input.edgeNormal, input.edgeNormal) > 1e-8) {
        dir = normalize(input.edgeNormal);
    }
    let uvDir = vec2f(dir.x, -dir.y);

    let refractUv = input.screenUv + uvDir * uniforms.refractionStrength * rimCore;
    let fringe = uvDir * uniforms.chromaticStrength * rimCore;
    let refracted = vec3f(interior(refractUv + fringe).r, interior(refractUv).g, interior(refractUv - fringe).b);

    let dist = textureSampleLevel(distanceTex, texSampler, input.screenUv, 0.0).r * uniforms.distanceRange;
    let wall = (1.0 - smoothstep(0.0, max(uniforms.edgeThickness, 1e-4), dist)) * step(1e-5, dist);
    let highlight = pow(max(dot(dir, normalize(uniforms.lightDir)), 0.0), 8.0) * uniforms.edgeSpecular;

    var color = refracted * (1.0 - uniforms.occlusionIntensity * rimCore);
    color = mix(color, uniforms.edgeColor, wall * 0.5);
    color += uniforms.rimColor * uniforms.rimIntensity * rimCore + vec3f(highlight * rimCore);
    return vec4f(clamp(color, vec3f(0.0), vec3f(1.0)), rimCore);
}
)";

WGPUVertexAttribute attribute(WGPUVertexFormat format, uint64_t offset, uint32_t location) {
    WGPUVertexAttribute attr = {};
    attr.format = format;
    attr.offset = offset;
    attr.shaderLocation = location;
    return attr;
}

} // namespace

PortalRenderer::PortalRenderer(WgpuContext& context, FrameScheduler& scheduler,
                               const RenderSurface& surface, QualityParams quality,
                               PortalSettings settings, ShapeMesh mesh)
    : WgpuRenderer("PortalRenderer", context, scheduler, surface, quality)
    , m_settings(settings)
    , m_mesh(std::move(mesh)) {
}

PortalRenderer::~PortalRenderer() {
    dispose();
}

bool PortalRenderer::initialize(const MediaSource& source, int depthWidth, int depthHeight) {
    disposeRenderer();
    if (m_mesh.indices.empty()) return fail("Portal mesh has no triangles");

    m_strength = m_settings.strengthFor(source.width());
    m_edgeStrip = buildEdgeMesh(m_mesh.edgeVertices);
    m_chamferStrip = buildChamferMesh(m_mesh, m_settings.chamferWidth, m_settings.chamferAngle);

    std::string error;
    if (!initShared(source, depthWidth, depthHeight) || !createPipelines() || !createMeshBuffers()) {
        disposeRenderer();
        return false;
    }
    if (!m_distanceField.init(device(), queue(), error)) {
        disposeRenderer();
        return fail("Distance field: " + error);
    }

    m_interiorData = {};
    m_interiorData.strength = m_strength;
    m_interiorData.pomSteps = static_cast<float>(
        std::clamp(std::min(m_settings.pomSteps, quality().pomSteps), 1, MAX_INTERIOR_POM_STEPS));
    m_interiorData.contrastLow = m_settings.contrastLow;
    m_interiorData.contrastHigh = m_settings.contrastHigh;
    m_interiorData.verticalReduction = m_settings.verticalReduction;
    m_interiorData.dofStart = m_settings.dofStart;
    m_interiorData.dofStrength = m_settings.dofStrength;
    m_interiorData.depthPower = m_settings.depthPower;
    m_interiorData.depthScale = m_settings.depthScale;
    m_interiorData.depthBias = m_settings.depthBias;
    m_interiorData.fogColor[0] = m_settings.fogColor.r;
    m_interiorData.fogColor[1] = m_settings.fogColor.g;
    m_interiorData.fogColor[2] = m_settings.fogColor.b;
    m_interiorData.fogDensity = m_settings.fogDensity;
    m_interiorData.colorShift = m_settings.colorShift;
    m_interiorData.brightnessBias = m_settings.brightnessBias;
    m_interiorData.imageTexelSize[0] = 1.0f / static_cast<float>(source.width());
    m_interiorData.imageTexelSize[1] = 1.0f / static_cast<float>(source.height());

    recalculateViewport();
    if (!m_compositeBindGroup) {
        disposeRenderer();
        return fail(this->error().empty() ? "Failed to create portal targets" : this->error());
    }

    std::cout << "[" << tag() << "] Initialized " << m_mesh.triangleCount() << " triangles, "
              << m_edgeStrip.count << " rim vertices, " << m_chamferStrip.count
              << " chamfer vertices" << std::endl;
    return true;
}

bool PortalRenderer::createPipelines() {
    const WGPUTextureFormat screen = context().surfaceFormat();

    PipelineBuilder interior(device());
    interior.label("Portal Interior")
            .shader(std::string(COVER_FIT_VERTEX_SHADER) + INTERIOR_FRAGMENT_SHADER)
            .colorTarget(WGPUTextureFormat_RGBA8Unorm)
            .colorTarget(WGPUTextureFormat_R8Unorm)
            .uniform(0, sizeof(InteriorUniforms))
            .texture(1)
            .texture(2)
            .sampler(3)
            .group(1)
            .uniform(0, sizeof(ViewUniforms), WGPUShaderStage_Vertex);
    if (!interior.build(m_interiorPipeline)) return fail(interior.error());

    PipelineBuilder stencil(device());
    stencil.label("Portal Stencil")
           .shader(STENCIL_SHADER)
           .colorTarget(screen)
           .vertexBuffer(2 * sizeof(float), {attribute(WGPUVertexFormat_Float32x2, 0, 0)})
           .stencil(StencilMode::Write)
           .uniform(0, sizeof(MeshUniforms), WGPUShaderStage_Vertex);
    if (!stencil.build(m_stencilPipeline)) return fail(stencil.error());

    PipelineBuilder composite(device());
    composite.label("Portal Composite")
             .shader(std::string(FULLSCREEN_VERTEX_SHADER) + COMPOSITE_FRAGMENT_SHADER)
             .colorTarget(screen)
             .stencil(StencilMode::TestEqual)
             .uniform(0, sizeof(PortalCompositeUniforms))
             .texture(1)
             .texture(2)
             .texture(3)
             .sampler(4);
    if (!composite.build(m_compositePipeline)) return fail(composite.error());

    PipelineBuilder chamfer(device());
    chamfer.label("Portal Chamfer")
           .shader(CHAMFER_SHADER)
           .colorTargetWithBlend(screen)
           .vertexBuffer(6 * sizeof(float), {attribute(WGPUVertexFormat_Float32x2, 0, 0),
                                             attribute(WGPUVertexFormat_Float32x3, 2 * sizeof(float), 1),
                                             attribute(WGPUVertexFormat_Float32, 5 * sizeof(float), 2)})
           .stencil(StencilMode::Keep)
           .uniform(0, sizeof(ChamferUniforms), WGPUShaderStage_Vertex | WGPUShaderStage_Fragment)
           .texture(1)
           .sampler(2);
    if (!chamfer.build(m_chamferPipeline)) return fail(chamfer.error());

    PipelineBuilder rim(device());
    rim.label("Portal Rim")
       .shader(RIM_SHADER)
       .colorTargetWithBlend(screen)
       .vertexBuffer(4 * sizeof(float), {attribute(WGPUVertexFormat_Float32x2, 0, 0),
                                         attribute(WGPUVertexFormat_Float32x2, 2 * sizeof(float), 1)})
       .stencil(StencilMode::Keep)
       .uniform(0, sizeof(RimUniforms), WGPUShaderStage_Vertex | WGPUShaderStage_Fragment)
       .texture(1)
       .texture(2)
       .sampler(3);
    if (!rim.build(m_rimPipeline)) return fail(rim.error());

    m_interiorUniforms = createUniformBuffer(device(), sizeof(InteriorUniforms), "Interior Uniforms");
    m_meshUniforms = createUniformBuffer(device(), sizeof(MeshUniforms), "Mesh Uniforms");
    m_compositeUniforms = createUniformBuffer(device(), sizeof(PortalCompositeUniforms), "Portal Composite Uniforms");
    m_chamferUniforms = createUniformBuffer(device(), sizeof(ChamferUniforms), "Chamfer Uniforms");
    m_rimUniforms = createUniformBuffer(device(), sizeof(RimUniforms), "Rim Uniforms");
    if (!m_interiorUniforms || !m_meshUniforms || !m_compositeUniforms || !m_chamferUniforms || !m_rimUniforms) {
        return fail("Failed to create portal uniforms");
    }
    return true;
}

bool PortalRenderer::createMeshBuffers() {
    m_fillVertices = createVertexBuffer(device(), queue(), m_mesh.vertices.data(),
                                        m_mesh.vertices.size(), "Portal Fill Vertices");
    m_fillIndices = createIndexBuffer(device(), queue(), m_mesh.indices.data(),
                                      m_mesh.indices.size(), "Portal Fill Indices");
    m_edgeVertices = createVertexBuffer(device(), queue(), m_edgeStrip.vertices.data(),
                                        m_edgeStrip.vertices.size(), "Portal Rim Vertices");
    m_chamferVertices = createVertexBuffer(device(), queue(), m_chamferStrip.vertices.data(),
                                           m_chamferStrip.vertices.size(), "Portal Chamfer Vertices");
    if (!m_fillVertices || !m_fillIndices || !m_edgeVertices || !m_chamferVertices) {
        return fail("Failed to upload portal mesh");
    }
    return true;
}

bool PortalRenderer::createTargets() {
    const glm::ivec2 size = bufferSize();
    const uint32_t w = static_cast<uint32_t>(size.x);
    const uint32_t h = static_cast<uint32_t>(size.y);
    const WGPUTextureUsage usage = WGPUTextureUsage_RenderAttachment | WGPUTextureUsage_TextureBinding;

    m_interiorColor = createTarget(device(), w, h, WGPUTextureFormat_RGBA8Unorm, usage, "Interior Color");
    m_interiorDepth = createTarget(device(), w, h, WGPUTextureFormat_R8Unorm, usage, "Interior Lens Depth");
    m_stencil = createTarget(device(), w, h, WGPUTextureFormat_Stencil8,
                             WGPUTextureUsage_RenderAttachment, "Portal Stencil");
    if (!m_interiorColor || !m_interiorDepth || !m_stencil) return fail("Failed to create portal targets");

    std::string error;
    const int jfaW = jumpFloodResolution(size.x, quality().jfaDivisor);
    const int jfaH = jumpFloodResolution(size.y, quality().jfaDivisor);
    if (!m_distanceField.resize(jfaW, jfaH, error)) return fail("Distance field: " + error);
    return true;
}

bool PortalRenderer::createBindGroups() {
    m_interiorBindGroup = BindGroupBuilder(device(), m_interiorPipeline.layout(0))
        .buffer(0, m_interiorUniforms, sizeof(InteriorUniforms))
        .texture(1, m_sourceTexture.view)
        .texture(2, m_depthFilter.output())
        .sampler(3, m_linearSampler)
        .build();
    m_interiorViewBindGroup = BindGroupBuilder(device(), m_interiorPipeline.layout(1))
        .buffer(0, m_viewUniforms, sizeof(ViewUniforms))
        .build();
    m_stencilBindGroup = BindGroupBuilder(device(), m_stencilPipeline.layout(0))
        .buffer(0, m_meshUniforms, sizeof(MeshUniforms))
        .build();
    m_compositeBindGroup = BindGroupBuilder(device(), m_compositePipeline.layout(0))
        .buffer(0, m_compositeUniforms, sizeof(PortalCompositeUniforms))
        .texture(1, m_interiorColor.view)
        .texture(2, m_interiorDepth.view)
        .texture(3, m_distanceField.distance())
        .sampler(4, m_linearSampler)
        .build();
    m_chamferBindGroup = BindGroupBuilder(device(), m_chamferPipeline.layout(0))
        .buffer(0, m_chamferUniforms, sizeof(ChamferUniforms))
        .texture(1, m_interiorColor.view)
        .sampler(2, m_linearSampler)
        .build();
    m_rimBindGroup = BindGroupBuilder(device(), m_rimPipeline.layout(0))
        .buffer(0, m_rimUniforms, sizeof(RimUniforms))
        .texture(1, m_interiorColor.view)
        .texture(2, m_distanceField.distance())
        .sampler(3, m_linearSampler)
        .build();

    if (!m_interiorBindGroup || !m_interiorViewBindGroup || !m_stencilBindGroup ||
        !m_compositeBindGroup || !m_chamferBindGroup || !m_rimBindGroup) {
        m_compositeBindGroup.reset();
        return fail("Failed to create portal bind groups");
    }
    return true;
}

void PortalRenderer::writeStaticUniforms() {
    const glm::ivec2 size = bufferSize();
    const float distanceRange = m_settings.distanceFieldRange();

    MeshUniforms mesh = {{m_meshScale.x, m_meshScale.y}, {0.0f, 0.0f}};
    writeUniforms(queue(), m_meshUniforms, mesh);

    PortalCompositeUniforms composite = {};
    composite.edgeOcclusionWidth = m_settings.edgeOcclusionWidth;
    composite.edgeOcclusionStrength = m_settings.edgeOcclusionStrength;
    composite.distanceRange = distanceRange;
    composite.bevelIntensity = m_settings.bevelIntensity;
    composite.bevelWidth = m_settings.bevelWidth;
    composite.bevelDarkening = m_settings.bevelDarkening;
    composite.bevelDesaturation = m_settings.bevelDesaturation;
    composite.bevelLightAngle = glm::radians(m_settings.bevelLightAngle);
    composite.distanceTexelSize[0] = 1.0f / static_cast<float>(std::max(1, m_distanceField.width()));
    composite.distanceTexelSize[1] = 1.0f / static_cast<float>(std::max(1, m_distanceField.height()));
    writeUniforms(queue(), m_compositeUniforms, composite);

    ChamferUniforms chamfer = {};
    chamfer.lightDir[0] = m_settings.lightDirection.x;
    chamfer.lightDir[1] = m_settings.lightDirection.y;
    chamfer.lightDir[2] = m_settings.lightDirection.z;
    chamfer.ambient = m_settings.chamferAmbient;
    chamfer.color[0] = m_settings.chamferColor.r;
    chamfer.color[1] = m_settings.chamferColor.g;
    chamfer.color[2] = m_settings.chamferColor.b;
    chamfer.specular = m_settings.chamferSpecular;
    chamfer.meshScale[0] = m_meshScale.x;
    chamfer.meshScale[1] = m_meshScale.y;
    chamfer.texelSize[0] = 1.0f / static_cast<float>(size.x);
    chamfer.texelSize[1] = 1.0f / static_cast<float>(size.y);
    chamfer.shininess = m_settings.chamferShininess;
    writeUniforms(queue(), m_chamferUniforms, chamfer);

    RimUniforms rim = {};
    rim.meshScale[0] = m_meshScale.x;
    rim.meshScale[1] = m_meshScale.y;
    rim.rimWidth = m_settings.rimWidth;
    rim.rimIntensity = m_settings.rimIntensity;
    rim.rimColor[0] = m_settings.rimColor.r;
    rim.rimColor[1] = m_settings.rimColor.g;
    rim.rimColor[2] = m_settings.rimColor.b;
    rim.refractionStrength = m_settings.refractionStrength;
    rim.edgeColor[0] = m_settings.edgeColor.r;
    rim.edgeColor[1] = m_settings.edgeColor.g;
    rim.edgeColor[2] = m_settings.edgeColor.b;
    rim.chromaticStrength = m_settings.chromaticStrength;
    rim.occlusionIntensity = m_settings.occlusionIntensity;
    rim.edgeThickness = m_settings.edgeThickness;
    rim.edgeSpecular = m_settings.edgeSpecular;
    rim.distanceRange = distanceRange;
    rim.lightDir[0] = m_settings.lightDirection.x;
    rim.lightDir[1] = m_settings.lightDirection.y;
    writeUniforms(queue(), m_rimUniforms, rim);
}

void PortalRenderer::onDepthUpdate(double timeSeconds) {
    updateDepth(timeSeconds);
}

void PortalRenderer::onRenderFrame() {
    if (!m_compositeBindGroup) return;
    if (refreshSourceTexture() && !createBindGroups()) {
        reportError(error());
        return;
    }

    const glm::vec2 input = readInput();
    m_interiorData.offset[0] = -input.x * m_settings.parallaxX;
    m_interiorData.offset[1] = input.y * m_settings.parallaxY;
    writeUniforms(queue(), m_interiorUniforms, m_interiorData);

    WGPUTextureView target = context().acquireFrame();
    if (!target) return;

    submit(device(), queue(), [&](WGPUCommandEncoder encoder) {
        m_distanceField.encode(encoder, m_fillVertices, m_fillIndices,
                               static_cast<uint32_t>(m_mesh.indices.size()), m_meshScale,
                               m_settings.distanceFieldRange());

        // 1. Interior into color + lens depth
        ColorAttachment interior[2];
        interior[0].view = m_interiorColor.view;
        interior[1].view = m_interiorDepth.view;
        WGPURenderPassEncoder pass = beginPass(encoder, interior, 2);
        wgpuRenderPassEncoderSetPipeline(pass, m_interiorPipeline.pipeline);
        wgpuRenderPassEncoderSetBindGroup(pass, 0, m_interiorBindGroup, 0, nullptr);
        wgpuRenderPassEncoderSetBindGroup(pass, 1, m_interiorViewBindGroup, 0, nullptr);
        wgpuRenderPassEncoderDraw(pass, 3, 1, 0, 0);
        endPass(pass);

        // 2. Screen: stencil mark, composite, chamfer, rim
        ColorAttachment screen;
        screen.view = target;
        screen.clearValue = {0.0, 0.0, 0.0, 1.0};
        pass = beginPass(encoder, &screen, 1, m_stencil.view, true);
        wgpuRenderPassEncoderSetStencilReference(pass, 1);

        wgpuRenderPassEncoderSetPipeline(pass, m_stencilPipeline.pipeline);
        wgpuRenderPassEncoderSetBindGroup(pass, 0, m_stencilBindGroup, 0, nullptr);
        wgpuRenderPassEncoderSetVertexBuffer(pass, 0, m_fillVertices, 0, WGPU_WHOLE_SIZE);
        wgpuRenderPassEncoderSetIndexBuffer(pass, m_fillIndices, WGPUIndexFormat_Uint16, 0, WGPU_WHOLE_SIZE);
        wgpuRenderPassEncoderDrawIndexed(pass, static_cast<uint32_t>(m_mesh.indices.size()), 1, 0, 0, 0);

        wgpuRenderPassEncoderSetPipeline(pass, m_compositePipeline.pipeline);
        wgpuRenderPassEncoderSetBindGroup(pass, 0, m_compositeBindGroup, 0, nullptr);
        wgpuRenderPassEncoderDraw(pass, 3, 1, 0, 0);

        if (m_chamferStrip.count > 0) {
            wgpuRenderPassEncoderSetPipeline(pass, m_chamferPipeline.pipeline);
            wgpuRenderPassEncoderSetBindGroup(pass, 0, m_chamferBindGroup, 0, nullptr);
            wgpuRenderPassEncoderSetVertexBuffer(pass, 0, m_chamferVertices, 0, WGPU_WHOLE_SIZE);
            wgpuRenderPassEncoderDraw(pass, m_chamferStrip.count, 1, 0, 0);
        }

        if (m_settings.rimIntensity > 0.0f && m_edgeStrip.count > 0) {
            wgpuRenderPassEncoderSetPipeline(pass, m_rimPipeline.pipeline);
            wgpuRenderPassEncoderSetBindGroup(pass, 0, m_rimBindGroup, 0, nullptr);
            wgpuRenderPassEncoderSetVertexBuffer(pass, 0, m_edgeVertices, 0, WGPU_WHOLE_SIZE);
            wgpuRenderPassEncoderDraw(pass, m_edgeStrip.count, 1, 0, 0);
        }
        endPass(pass);
    });
    context().present();
}

void PortalRenderer::onViewportResize() {
    configureSurface();
    writeViewUniforms();

    const glm::ivec2 size = bufferSize();
    m_meshScale = portalMeshScale(m_mesh.aspect, static_cast<float>(size.x) / static_cast<float>(size.y));
    if (!m_interiorPipeline.pipeline) return;

    m_compositeBindGroup.reset();
    if (!createTargets() || !createBindGroups()) {
        reportError(error());
        return;
    }
    writeStaticUniforms();
}

void PortalRenderer::disposeRenderer() {
    m_rimBindGroup.reset();
    m_chamferBindGroup.reset();
    m_compositeBindGroup.reset();
    m_stencilBindGroup.reset();
    m_interiorViewBindGroup.reset();
    m_interiorBindGroup.reset();
    m_distanceField.release();
    m_stencil.reset();
    m_interiorDepth.reset();
    m_interiorColor.reset();
    m_rimUniforms.reset();
    m_chamferUniforms.reset();
    m_compositeUniforms.reset();
    m_meshUniforms.reset();
    m_interiorUniforms.reset();
    m_chamferVertices.reset();
    m_edgeVertices.reset();
    m_fillIndices.reset();
    m_fillVertices.reset();
    m_rimPipeline.reset();
    m_chamferPipeline.reset();
    m_compositePipeline.reset();
    m_stencilPipeline.reset();
    m_interiorPipeline.reset();
    releaseShared();
}

glm::vec2 PortalRenderer::coverFitPadding() const {
    return {m_strength, m_settings.overscan};
}

} // namespace layershift::gpu
