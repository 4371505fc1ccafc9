// Layershift - Portal renderer (OpenGL)

#include <layershift/gl/gl_portal_renderer.h>
#include <layershift/jump_flood.h>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace layershift::gl {

namespace {

constexpr int MAX_INTERIOR_POM_STEPS = 64;

const char* INTERIOR_FRAGMENT_SHADER = R"(#version 330 core
#define MAX_POM_STEPS 64
#define INTERIOR_VIGNETTE 0.25

uniform sampler2D uSource;
uniform sampler2D uDepth;
uniform vec2 uOffset;
uniform float uStrength;
uniform int uPomSteps;
uniform float uContrastLow;
uniform float uContrastHigh;
uniform float uVerticalReduction;
uniform float uDofStart;
uniform float uDofStrength;
uniform float uDepthPower;
uniform float uDepthScale;
uniform float uDepthBias;
uniform vec3 uFogColor;
uniform float uFogDensity;
uniform float uColorShift;
uniform float uBrightnessBias;
uniform vec2 uImageTexelSize;

in vec2 vUv;
in vec2 vScreenUv;
layout(location = 0) out vec4 fragColor;
layout(location = 1) out vec4 fragLens;

float depthAt(vec2 uv) {
    return smoothstep(uContrastLow, uContrastHigh, textureLod(uDepth, uv, 0.0).r);
}

vec2 displace(vec2 uv, vec2 shift) {
    int steps = clamp(uPomSteps, 1, MAX_POM_STEPS);
    float layerStep = 1.0 / float(steps);
    float layer = 1.0;
    vec2 current = uv + shift;
    float surface = depthAt(current);
    vec2 previousUv = current;
    float previousGap = surface - layer;

    for (int i = 0; i < MAX_POM_STEPS; ++i) {
        if (i >= steps || surface >= layer) {
            break;
        }
        previousUv = current;
        previousGap = surface - layer;
        layer -= layerStep;
        current = uv + shift * layer;
        surface = depthAt(current);
    }

    float gap = surface - layer;
    float denom = gap - previousGap;
    float t = abs(denom) > 1e-5 ? gap / denom : 0.0;
    return mix(current, previousUv, clamp(t, 0.0, 1.0));
}

void main() {
    vec2 shift = uOffset * vec2(1.0, 1.0 - uVerticalReduction) * uStrength;
    vec2 uv = displace(vUv, shift);
    float depth = depthAt(uv);
    float lens = clamp(pow(max(depth, 0.0), uDepthPower) * uDepthScale + uDepthBias, 0.0, 1.0);

    vec3 color = textureLod(uSource, uv, 0.0).rgb;
    vec2 t = uImageTexelSize * 2.0;
    vec3 blurred = (textureLod(uSource, uv + vec2(t.x, 0.0), 0.0).rgb +
                    textureLod(uSource, uv - vec2(t.x, 0.0), 0.0).rgb +
                    textureLod(uSource, uv + vec2(0.0, t.y), 0.0).rgb +
                    textureLod(uSource, uv - vec2(0.0, t.y), 0.0).rgb) * 0.25;
    color = mix(color, blurred, smoothstep(uDofStart, 1.0, 1.0 - lens) * uDofStrength);

    float farAmount = 1.0 - lens;
    float luma = dot(color, vec3(0.2126, 0.7152, 0.0722));
    color = mix(color, vec3(luma) * vec3(0.85, 0.95, 1.15), uColorShift * farAmount * 0.5);
    color += vec3(uBrightnessBias * lens);

    float border = min(min(uv.x, 1.0 - uv.x), min(uv.y, 1.0 - uv.y));
    float edgeFade = 1.0 - smoothstep(0.0, 0.02, border);
    float fog = clamp(farAmount * uFogDensity * 2.0, 0.0, 1.0);
    color = mix(color, uFogColor, max(fog, edgeFade));

    float v = distance(vScreenUv, vec2(0.5)) * 1.41421356;
    color *= 1.0 - INTERIOR_VIGNETTE * v * v;

    fragColor = vec4(clamp(color, 0.0, 1.0), 1.0);
    fragLens = vec4(lens, 0.0, 0.0, 1.0);
}
)";

const char* STENCIL_VERTEX_SHADER = R"(#version 330 core
layout(location = 0) in vec2 aPosition;
uniform vec2 uMeshScale;

void main() {
    gl_Position = vec4(aPosition * uMeshScale, 0.0, 1.0);
}
)";

const char* STENCIL_FRAGMENT_SHADER = R"(#version 330 core
out vec4 fragColor;

void main() {
    fragColor = vec4(0.0);
}
)";

// Render targets keep GL's bottom-left row order, so gradients here are y-up
const char* COMPOSITE_FRAGMENT_SHADER = R"(#version 330 core
uniform sampler2D uInteriorColor;
uniform sampler2D uInteriorLens;
uniform sampler2D uDistance;
uniform float uEdgeOcclusionWidth;
uniform float uEdgeOcclusionStrength;
uniform float uDistanceRange;
uniform float uBevelIntensity;
uniform float uBevelWidth;
uniform float uBevelDarkening;
uniform float uBevelDesaturation;
uniform float uBevelLightAngle;
uniform vec2 uDistanceTexelSize;

in vec2 vTargetUv;
out vec4 fragColor;

float edgeDistance(vec2 uv) {
    return textureLod(uDistance, uv, 0.0).r * uDistanceRange;
}

void main() {
    vec2 uv = vTargetUv;
    vec3 color = textureLod(uInteriorColor, uv, 0.0).rgb;
    float lens = textureLod(uInteriorLens, uv, 0.0).r;
    float dist = edgeDistance(uv);

    float occlusion = 1.0 - smoothstep(0.0, max(uEdgeOcclusionWidth, 1e-4), dist);
    color *= 1.0 - uEdgeOcclusionStrength * occlusion * (1.0 - 0.5 * lens);

    float bevel = 1.0 - smoothstep(0.0, max(uBevelWidth, 1e-4), dist);
    vec2 t = uDistanceTexelSize;
    vec2 grad = vec2(edgeDistance(uv + vec2(t.x, 0.0)) - edgeDistance(uv - vec2(t.x, 0.0)),
                     edgeDistance(uv + vec2(0.0, t.y)) - edgeDistance(uv - vec2(0.0, t.y)));
    vec2 inward = dot(grad, grad) > 1e-12 ? normalize(grad) : vec2(0.0);
    vec2 light = vec2(cos(uBevelLightAngle), sin(uBevelLightAngle));
    float lit = dot(-inward, light) * uBevelIntensity * bevel;

    color = color * (1.0 - uBevelDarkening * bevel) + vec3(lit * 0.5);
    float luma = dot(color, vec3(0.2126, 0.7152, 0.0722));
    color = mix(color, vec3(luma), uBevelDesaturation * bevel);
    fragColor = vec4(clamp(color, 0.0, 1.0), 1.0);
}
)";

const char* CHAMFER_VERTEX_SHADER = R"(#version 330 core
layout(location = 0) in vec2 aPosition;
layout(location = 1) in vec3 aNormal;
layout(location = 2) in float aLerpT;
uniform vec2 uMeshScale;

out vec3 vNormal;
out float vLerpT;
out vec2 vTargetUv;

void main() {
    vec2 clip = aPosition * uMeshScale;
    vNormal = aNormal;
    vLerpT = aLerpT;
    vTargetUv = clip * 0.5 + 0.5;
    gl_Position = vec4(clip, 0.0, 1.0);
}
)";

const char* CHAMFER_FRAGMENT_SHADER = R"(#version 330 core
uniform sampler2D uInteriorColor;
uniform vec3 uLightDir;
uniform float uAmbient;
uniform vec3 uColor;
uniform float uSpecular;
uniform float uShininess;
uniform vec2 uTexelSize;

in vec3 vNormal;
in float vLerpT;
in vec2 vTargetUv;
out vec4 fragColor;

vec3 interior(vec2 uv) {
    return textureLod(uInteriorColor, uv, 0.0).rgb;
}

void main() {
    vec3 n = normalize(vNormal);
    vec3 l = normalize(uLightDir);
    vec3 h = normalize(l + vec3(0.0, 0.0, -1.0));
    float diffuse = max(dot(n, l), 0.0);
    float spec = pow(max(dot(n, h), 0.0), uShininess) * uSpecular;

    vec2 r = uTexelSize * (1.0 + vLerpT * 6.0);
    vec3 frosted = (interior(vTargetUv) +
                    interior(vTargetUv + vec2(r.x, r.y)) +
                    interior(vTargetUv + vec2(-r.x, r.y)) +
                    interior(vTargetUv + vec2(r.x, -r.y)) +
                    interior(vTargetUv + vec2(-r.x, -r.y))) * 0.2;

    vec3 base = uColor * (uAmbient + diffuse);
    vec3 color = mix(frosted * 0.5, base, vLerpT) + vec3(spec);
    fragColor = vec4(clamp(color, 0.0, 1.0), 1.0);
}
)";

const char* RIM_VERTEX_SHADER = R"(#version 330 core
layout(location = 0) in vec2 aPosition;
layout(location = 1) in vec2 aNormal;
uniform vec2 uMeshScale;
uniform float uRimWidth;

out vec2 vEdgeNormal;
out vec2 vTargetUv;

void main() {
    vec2 clip = (aPosition + aNormal * uRimWidth) * uMeshScale;
    vEdgeNormal = aNormal;
    vTargetUv = clip * 0.5 + 0.5;
    gl_Position = vec4(clip, 0.0, 1.0);
}
)";

const char* RIM_FRAGMENT_SHADER = R"(#version 330 core
uniform sampler2D uInteriorColor;
uniform sampler2D uDistance;
uniform float uRimIntensity;
uniform vec3 uRimColor;
uniform float uRefractionStrength;
uniform vec3 uEdgeColor;
uniform float uChromaticStrength;
uniform float uOcclusionIntensity;
uniform float uEdgeThickness;
uniform float uEdgeSpecular;
uniform float uDistanceRange;
uniform vec2 uLightDir;

in vec2 vEdgeNormal;
in vec2 vTargetUv;
out vec4 fragColor;

vec3 interior(vec2 uv) {
    return textureLod(uInteriorColor, uv, 0.0).rgb;
}

void main() {
    float across = clamp(length(vEdgeNormal), 0.0, 1.0);
    float rimCore = 1.0 - smoothstep(0.0, 1.0, across);
    vec2 dir = dot(vEdgeNormal, vEdgeNormal) > 1e-8 ? normalize(vEdgeNormal) : vec2(0.0);

    vec2 refractUv = vTargetUv + dir * uRefractionStrength * rimCore;
    vec2 fringe = dir * uChromaticStrength * rimCore;
    vec3 refracted = vec3(interior(refractUv + fringe).r, interior(refractUv).g,
                          interior(refractUv - fringe).b);

    float dist = textureLod(uDistance, vTargetUv, 0.0).r * uDistanceRange;
    float wall = (1.0 - smoothstep(0.0, max(uEdgeThickness, 1e-4), dist)) * step(1e-5, dist);
    float highlight = pow(max(dot(dir, normalize(uLightDir)), 0.0), 8.0) * uEdgeSpecular;

    vec3 color = refracted * (1.0 - uOcclusionIntensity * rimCore);
    color = mix(color, uEdgeColor, wall * 0.5);
    color += uRimColor * uRimIntensity * rimCore + vec3(highlight * rimCore);
    fragColor = vec4(clamp(color, 0.0, 1.0), rimCore);
}
)";

} // namespace

GlPortalRenderer::GlPortalRenderer(GlContext& context, FrameScheduler& scheduler,
                                   const RenderSurface& surface, QualityParams quality,
                                   PortalSettings settings, ShapeMesh mesh)
    : GlRenderer("GlPortalRenderer", context, scheduler, surface, quality)
    , m_settings(settings)
    , m_mesh(std::move(mesh)) {
}

GlPortalRenderer::~GlPortalRenderer() {
    dispose();
}

bool GlPortalRenderer::initialize(const MediaSource& source, int depthWidth, int depthHeight) {
    disposeRenderer();
    if (m_mesh.indices.empty()) return fail("Portal mesh has no triangles");

    m_strength = m_settings.strengthFor(source.width());
    m_edgeStrip = buildEdgeMesh(m_mesh.edgeVertices);
    m_chamferStrip = buildChamferMesh(m_mesh, m_settings.chamferWidth, m_settings.chamferAngle);

    if (!initShared(source, depthWidth, depthHeight)) {
        disposeRenderer();
        return false;
    }

    std::string error;
    if (!buildPrograms(error)) {
        disposeRenderer();
        return fail(error);
    }
    if (!m_distanceField.init(error)) {
        disposeRenderer();
        return fail("Distance field: " + error);
    }

    m_fill = createMesh(m_mesh.vertices, {2}, m_mesh.indices);
    m_edge = createMesh(m_edgeStrip.vertices, {2, 2});
    m_chamfer = createMesh(m_chamferStrip.vertices, {2, 3, 1});

    m_interiorProgram.use();
    m_interiorProgram.set("uStrength", m_strength);
    m_interiorProgram.set("uPomSteps",
                          std::clamp(std::min(m_settings.pomSteps, quality().pomSteps), 1, MAX_INTERIOR_POM_STEPS));
    m_interiorProgram.set("uContrastLow", m_settings.contrastLow);
    m_interiorProgram.set("uContrastHigh", m_settings.contrastHigh);
    m_interiorProgram.set("uVerticalReduction", m_settings.verticalReduction);
    m_interiorProgram.set("uDofStart", m_settings.dofStart);
    m_interiorProgram.set("uDofStrength", m_settings.dofStrength);
    m_interiorProgram.set("uDepthPower", m_settings.depthPower);
    m_interiorProgram.set("uDepthScale", m_settings.depthScale);
    m_interiorProgram.set("uDepthBias", m_settings.depthBias);
    m_interiorProgram.set("uFogColor", m_settings.fogColor.r, m_settings.fogColor.g, m_settings.fogColor.b);
    m_interiorProgram.set("uFogDensity", m_settings.fogDensity);
    m_interiorProgram.set("uColorShift", m_settings.colorShift);
    m_interiorProgram.set("uBrightnessBias", m_settings.brightnessBias);
    m_interiorProgram.set("uImageTexelSize", 1.0f / static_cast<float>(source.width()),
                          1.0f / static_cast<float>(source.height()));
    glUseProgram(0);

    recalculateViewport();
    if (!isDeviceLost() && (!m_screen || !m_interior)) {
        disposeRenderer();
        return fail(this->error().empty() ? "Failed to create portal targets" : this->error());
    }

    std::cout << "[" << tag() << "] Initialized " << m_mesh.triangleCount() << " triangles, "
              << m_edgeStrip.count << " rim vertices, " << m_chamferStrip.count
              << " chamfer vertices" << std::endl;
    return true;
}

bool GlPortalRenderer::buildPrograms(std::string& error) {
    return m_interiorProgram.build(FULLSCREEN_VERTEX_SHADER, INTERIOR_FRAGMENT_SHADER, "Portal Interior", error) &&
           m_stencilProgram.build(STENCIL_VERTEX_SHADER, STENCIL_FRAGMENT_SHADER, "Portal Stencil", error) &&
           m_compositeProgram.build(FULLSCREEN_VERTEX_SHADER, COMPOSITE_FRAGMENT_SHADER, "Portal Composite", error) &&
           m_chamferProgram.build(CHAMFER_VERTEX_SHADER, CHAMFER_FRAGMENT_SHADER, "Portal Chamfer", error) &&
           m_rimProgram.build(RIM_VERTEX_SHADER, RIM_FRAGMENT_SHADER, "Portal Rim", error);
}

bool GlPortalRenderer::createTargets() {
    const glm::ivec2 size = bufferSize();
    std::string error;

    m_interior.reset();
    m_interiorColor = createTexture(size.x, size.y, GL_FORMAT_RGBA8, GL_LINEAR);
    m_interiorLens = createTexture(size.x, size.y, GL_FORMAT_R8, GL_LINEAR);

    GlFramebuffer interior = GlFramebuffer::generate();
    glBindFramebuffer(GL_FRAMEBUFFER, interior);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, m_interiorColor, 0);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT1, GL_TEXTURE_2D, m_interiorLens, 0);
    const GLenum buffers[2] = {GL_COLOR_ATTACHMENT0, GL_COLOR_ATTACHMENT1};
    glDrawBuffers(2, buffers);
    const bool complete = checkFramebuffer("Portal Interior", error);
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    if (!complete) return fail(error);
    m_interior = std::move(interior);
    m_interiorSize = size;

    const int jfaW = jumpFloodResolution(size.x, quality().jfaDivisor);
    const int jfaH = jumpFloodResolution(size.y, quality().jfaDivisor);
    if (!m_distanceField.resize(jfaW, jfaH, error)) return fail("Distance field: " + error);
    return true;
}

void GlPortalRenderer::writeStaticUniforms() {
    const glm::ivec2 size = bufferSize();
    const float distanceRange = m_settings.distanceFieldRange();

    m_stencilProgram.use();
    m_stencilProgram.set("uMeshScale", m_meshScale.x, m_meshScale.y);

    m_compositeProgram.use();
    m_compositeProgram.set("uEdgeOcclusionWidth", m_settings.edgeOcclusionWidth);
    m_compositeProgram.set("uEdgeOcclusionStrength", m_settings.edgeOcclusionStrength);
    m_compositeProgram.set("uDistanceRange", distanceRange);
    m_compositeProgram.set("uBevelIntensity", m_settings.bevelIntensity);
    m_compositeProgram.set("uBevelWidth", m_settings.bevelWidth);
    m_compositeProgram.set("uBevelDarkening", m_settings.bevelDarkening);
    m_compositeProgram.set("uBevelDesaturation", m_settings.bevelDesaturation);
    m_compositeProgram.set("uBevelLightAngle", glm::radians(m_settings.bevelLightAngle));
    m_compositeProgram.set("uDistanceTexelSize",
                           1.0f / static_cast<float>(std::max(1, m_distanceField.width())),
                           1.0f / static_cast<float>(std::max(1, m_distanceField.height())));

    m_chamferProgram.use();
    m_chamferProgram.set("uMeshScale", m_meshScale.x, m_meshScale.y);
    m_chamferProgram.set("uLightDir", m_settings.lightDirection.x, m_settings.lightDirection.y,
                         m_settings.lightDirection.z);
    m_chamferProgram.set("uAmbient", m_settings.chamferAmbient);
    m_chamferProgram.set("uColor", m_settings.chamferColor.r, m_settings.chamferColor.g,
                         m_settings.chamferColor.b);
    m_chamferProgram.set("uSpecular", m_settings.chamferSpecular);
    m_chamferProgram.set("uShininess", m_settings.chamferShininess);
    m_chamferProgram.set("uTexelSize", 1.0f / static_cast<float>(size.x), 1.0f / static_cast<float>(size.y));

    m_rimProgram.use();
    m_rimProgram.set("uMeshScale", m_meshScale.x, m_meshScale.y);
    m_rimProgram.set("uRimWidth", m_settings.rimWidth);
    m_rimProgram.set("uRimIntensity", m_settings.rimIntensity);
    m_rimProgram.set("uRimColor", m_settings.rimColor.r, m_settings.rimColor.g, m_settings.rimColor.b);
    m_rimProgram.set("uRefractionStrength", m_settings.refractionStrength);
    m_rimProgram.set("uEdgeColor", m_settings.edgeColor.r, m_settings.edgeColor.g, m_settings.edgeColor.b);
    m_rimProgram.set("uChromaticStrength", m_settings.chromaticStrength);
    m_rimProgram.set("uOcclusionIntensity", m_settings.occlusionIntensity);
    m_rimProgram.set("uEdgeThickness", m_settings.edgeThickness);
    m_rimProgram.set("uEdgeSpecular", m_settings.edgeSpecular);
    m_rimProgram.set("uDistanceRange", distanceRange);
    m_rimProgram.set("uLightDir", m_settings.lightDirection.x, m_settings.lightDirection.y);
    glUseProgram(0);
}

void GlPortalRenderer::onDepthUpdate(double timeSeconds) {
    updateDepth(timeSeconds);
}

void GlPortalRenderer::onRenderFrame() {
    if (!m_compositeProgram || !m_screen || !m_interior) return;
    refreshSourceTexture();

    const glm::vec2 input = readInput();
    beginFrame();

    m_distanceField.run(m_fill, m_fullscreenVao, m_meshScale, m_settings.distanceFieldRange());
    glBindVertexArray(m_fullscreenVao);

    // 1. Interior into color + lens depth
    bindTarget(m_interior, m_interiorSize.x, m_interiorSize.y);
    m_interiorProgram.use();
    applyViewUniforms(m_interiorProgram);
    m_interiorProgram.set("uOffset", -input.x * m_settings.parallaxX, input.y * m_settings.parallaxY);
    m_interiorProgram.texture("uSource", 0, m_sourceTexture);
    m_interiorProgram.texture("uDepth", 1, m_depthFilter.output());
    drawFullscreen();

    // 2. Screen: stencil mark, composite, chamfer, rim
    bindScreen();
    glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
    glClearStencil(0);
    glClear(GL_COLOR_BUFFER_BIT | GL_STENCIL_BUFFER_BIT);

    glEnable(GL_STENCIL_TEST);
    glStencilFunc(GL_ALWAYS, 1, 0xFF);
    glStencilOp(GL_KEEP, GL_KEEP, GL_REPLACE);
    glColorMask(GL_FALSE, GL_FALSE, GL_FALSE, GL_FALSE);
    m_stencilProgram.use();
    glBindVertexArray(m_fill.vao);
    glDrawElements(GL_TRIANGLES, m_fill.count, GL_UNSIGNED_SHORT, nullptr);
    glColorMask(GL_TRUE, GL_TRUE, GL_TRUE, GL_TRUE);

    glStencilFunc(GL_EQUAL, 1, 0xFF);
    glStencilOp(GL_KEEP, GL_KEEP, GL_KEEP);
    m_compositeProgram.use();
    m_compositeProgram.texture("uInteriorColor", 0, m_interiorColor);
    m_compositeProgram.texture("uInteriorLens", 1, m_interiorLens);
    m_compositeProgram.texture("uDistance", 2, m_distanceField.distance());
    glBindVertexArray(m_fullscreenVao);
    drawFullscreen();
    glDisable(GL_STENCIL_TEST);

    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    if (m_chamfer.count > 0) {
        m_chamferProgram.use();
        m_chamferProgram.texture("uInteriorColor", 0, m_interiorColor);
        glBindVertexArray(m_chamfer.vao);
        glDrawArrays(GL_TRIANGLES, 0, m_chamfer.count);
    }
    if (m_settings.rimIntensity > 0.0f && m_edge.count > 0) {
        m_rimProgram.use();
        m_rimProgram.texture("uInteriorColor", 0, m_interiorColor);
        m_rimProgram.texture("uDistance", 1, m_distanceField.distance());
        glBindVertexArray(m_edge.vao);
        glDrawArrays(GL_TRIANGLES, 0, m_edge.count);
    }
    glDisable(GL_BLEND);

    presentScreen();
}

void GlPortalRenderer::onViewportResize() {
    const glm::ivec2 size = bufferSize();
    m_meshScale = portalMeshScale(m_mesh.aspect, static_cast<float>(size.x) / static_cast<float>(size.y));

    std::string error;
    if (!resizeScreen(error)) {
        reportError(error);
        return;
    }
    if (!m_interiorProgram) return;

    if (!createTargets()) {
        reportError(this->error());
        return;
    }
    writeStaticUniforms();
}

void GlPortalRenderer::disposeRenderer() {
    m_distanceField.release();
    m_interior.reset();
    m_interiorLens.reset();
    m_interiorColor.reset();
    m_interiorSize = {0, 0};
    m_chamfer.reset();
    m_edge.reset();
    m_fill.reset();
    m_rimProgram.reset();
    m_chamferProgram.reset();
    m_compositeProgram.reset();
    m_stencilProgram.reset();
    m_interiorProgram.reset();
    releaseShared();
}

glm::vec2 GlPortalRenderer::coverFitPadding() const {
    return {m_strength, m_settings.overscan};
}

} // namespace layershift::gl
