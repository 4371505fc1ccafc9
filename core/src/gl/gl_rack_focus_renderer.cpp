// Layershift - Rack focus renderer (OpenGL)

#include <layershift/gl/gl_rack_focus_renderer.h>
#include <layershift/poisson_disk.h>
#include <algorithm>
#include <iostream>

namespace layershift::gl {

namespace {

const char* COC_FRAGMENT_SHADER = R"(#version 330 core
uniform sampler2D uDepth;
uniform float uFocalDepth;
uniform float uBreathScale;
uniform vec2 uBreathOffset;
uniform float uAperture;
uniform float uFocusRange;
uniform float uDepthScale;
uniform float uMaxBlurRadius;
uniform int uCocPacked;

in vec2 vUv;
out vec4 fragColor;

void main() {
    vec2 uv = (vUv + uBreathOffset) / uBreathScale;
    float depth = textureLod(uDepth, uv, 0.0).r;
    float diff = depth - uFocalDepth;
    float outside = max(abs(diff) - uFocusRange, 0.0);
    float blur = outside * uDepthScale * uAperture / max(uMaxBlurRadius, 1.0);
    float coc = clamp(sign(diff) * blur, -1.0, 1.0);
    fragColor = uCocPacked == 1 ? vec4(max(coc, 0.0), max(-coc, 0.0), 0.0, 1.0)
                                : vec4(coc, 0.0, 0.0, 1.0);
}
)";

const char* COC_READ_FUNCTION = R"(
uniform sampler2D uCoc;
uniform int uCocPacked;

float readCoc(vec2 uv) {
    vec4 c = textureLod(uCoc, uv, 0.0);
    return uCocPacked == 1 ? c.r - c.g : c.r;
}
)";

const char* BLUR_FRAGMENT_SHADER = R"(
#define MAX_SAMPLES 64

uniform sampler2D uSource;
uniform vec2 uSamples[MAX_SAMPLES];
uniform int uSampleCount;
uniform float uMaxBlurRadius;
uniform vec2 uTexelSize;
uniform float uBreathScale;
uniform vec2 uBreathOffset;
uniform vec2 uUvOffset;
uniform vec2 uUvScale;

in vec2 vTargetUv;
out vec4 fragColor;

vec3 sourceAt(vec2 targetUv) {
    vec2 screenUv = vec2(targetUv.x, 1.0 - targetUv.y);
    vec2 uv = uUvOffset + screenUv * uUvScale;
    return textureLod(uSource, (uv + uBreathOffset) / uBreathScale, 0.0).rgb;
}

void main() {
    float radius = abs(readCoc(vTargetUv)) * uMaxBlurRadius;
    int count = clamp(uSampleCount, 1, MAX_SAMPLES);

    vec3 color = vec3(0.0);
    float weightSum = 0.0;
    for (int i = 0; i < MAX_SAMPLES; ++i) {
        if (i >= count) {
            break;
        }
        vec2 o = uSamples[i];
        vec2 sampleUv = vTargetUv + o * radius * uTexelSize;
        float sampleRadius = abs(readCoc(sampleUv)) * uMaxBlurRadius;
        float w = clamp(sampleRadius - length(o) * radius + 1.0, 0.0, 1.0);
        color += sourceAt(sampleUv) * w;
        weightSum += w;
    }
    fragColor = weightSum > 0.0 ? vec4(color / weightSum, 1.0) : vec4(sourceAt(vTargetUv), 1.0);
}
)";

const char* COMPOSITE_FRAGMENT_SHADER = R"(
uniform sampler2D uSource;
uniform sampler2D uBlur;
uniform float uBreathScale;
uniform vec2 uBreathOffset;
uniform float uVignette;
uniform float uHighlightThreshold;
uniform float uHighlightBoost;
uniform int uHighlightBloom;

in vec2 vUv;
in vec2 vScreenUv;
in vec2 vTargetUv;
out vec4 fragColor;

void main() {
    vec3 sharp = textureLod(uSource, (vUv + uBreathOffset) / uBreathScale, 0.0).rgb;
    vec3 blurred = textureLod(uBlur, vTargetUv, 0.0).rgb;
    float coc = abs(readCoc(vTargetUv));

    vec3 color = mix(sharp, blurred, coc);
    if (uHighlightBloom == 1) {
        float luma = dot(blurred, vec3(0.2126, 0.7152, 0.0722));
        color += blurred * max(luma - uHighlightThreshold, 0.0) * uHighlightBoost * coc;
    }

    float d = distance(vScreenUv, vec2(0.5)) * 1.41421356;
    color *= 1.0 - uVignette * d * d;
    fragColor = vec4(clamp(color, 0.0, 1.0), 1.0);
}
)";

} // namespace

GlRackFocusRenderer::GlRackFocusRenderer(GlContext& context, FrameScheduler& scheduler,
                                         const RenderSurface& surface, QualityParams quality,
                                         RackFocusSettings settings, FocusStateProvider focus)
    : GlRenderer("GlRackFocusRenderer", context, scheduler, surface, quality)
    , m_settings(settings)
    , m_focus(std::move(focus)) {
}

GlRackFocusRenderer::~GlRackFocusRenderer() {
    dispose();
}

bool GlRackFocusRenderer::initialize(const MediaSource& source, int depthWidth, int depthHeight) {
    disposeRenderer();
    if (!initShared(source, depthWidth, depthHeight)) {
        disposeRenderer();
        return false;
    }

    const std::string header = "#version 330 core\n";
    std::string error;
    if (!m_cocProgram.build(FULLSCREEN_VERTEX_SHADER, COC_FRAGMENT_SHADER, "Rack Focus CoC", error) ||
        !m_blurProgram.build(FULLSCREEN_VERTEX_SHADER, header + COC_READ_FUNCTION + BLUR_FRAGMENT_SHADER,
                             "Rack Focus Blur", error) ||
        !m_compositeProgram.build(FULLSCREEN_VERTEX_SHADER,
                                  header + COC_READ_FUNCTION + COMPOSITE_FRAGMENT_SHADER,
                                  "Rack Focus Composite", error)) {
        disposeRenderer();
        return fail(error);
    }

    m_samples.clear();
    for (const glm::vec2& p : generatePoissonDisk(quality().poissonSamples)) {
        m_samples.push_back(p.x);
        m_samples.push_back(p.y);
    }
    m_maxBlurRadius = m_settings.maxBlur / static_cast<float>(std::max(1, quality().dofDivisor));

    m_blurProgram.use();
    glUniform2fv(m_blurProgram.uniform("uSamples"), static_cast<GLsizei>(m_samples.size() / 2),
                 m_samples.data());
    m_blurProgram.set("uSampleCount", static_cast<int>(m_samples.size() / 2));
    m_blurProgram.set("uMaxBlurRadius", m_maxBlurRadius);

    m_compositeProgram.use();
    m_compositeProgram.set("uVignette", m_settings.vignette);
    m_compositeProgram.set("uHighlightThreshold", m_settings.highlightThreshold);
    m_compositeProgram.set("uHighlightBoost", m_settings.highlightBoost);
    m_compositeProgram.set("uHighlightBloom", m_settings.highlightBloom ? 1 : 0);

    m_cocProgram.use();
    m_cocProgram.set("uAperture", m_settings.aperture);
    m_cocProgram.set("uFocusRange", m_settings.focusRange);
    m_cocProgram.set("uDepthScale", m_settings.depthScale);
    m_cocProgram.set("uMaxBlurRadius", m_settings.maxBlur);
    glUseProgram(0);

    recalculateViewport();
    if (!isDeviceLost() && (!m_screen || !m_blurTarget)) {
        disposeRenderer();
        return fail(this->error().empty() ? "Failed to create rack focus targets" : this->error());
    }

    std::cout << "[" << tag() << "] Initialized " << source.width() << "x" << source.height()
              << ", " << m_samples.size() / 2 << " blur samples, CoC "
              << (m_packedCoc ? "RG8" : "R16F") << std::endl;
    return true;
}

bool GlRackFocusRenderer::createTargets() {
    const glm::ivec2 size = dofResolution(bufferSize(), quality().dofDivisor);
    std::string error;

    m_packedCoc = false;
    if (!createTarget(m_cocTarget, size.x, size.y, GL_FORMAT_R16F, GL_LINEAR, error)) {
        std::cerr << "[" << tag() << "] R16F CoC unavailable (" << error << "), using RG8" << std::endl;
        m_packedCoc = true;
        if (!createTarget(m_cocTarget, size.x, size.y, GL_FORMAT_RG8, GL_LINEAR, error)) {
            return fail("CoC target: " + error);
        }
    }
    if (!createTarget(m_blurTarget, size.x, size.y, GL_FORMAT_RGBA16F, GL_LINEAR, error)) {
        return fail("Blur target: " + error);
    }

    m_blurProgram.use();
    m_blurProgram.set("uTexelSize", 1.0f / static_cast<float>(size.x), 1.0f / static_cast<float>(size.y));
    for (GlProgram* program : {&m_cocProgram, &m_blurProgram, &m_compositeProgram}) {
        program->use();
        program->set("uCocPacked", m_packedCoc ? 1 : 0);
    }
    glUseProgram(0);
    return true;
}

void GlRackFocusRenderer::onDepthUpdate(double timeSeconds) {
    updateDepth(timeSeconds);
}

void GlRackFocusRenderer::onRenderFrame() {
    if (!m_compositeProgram || !m_screen || !m_blurTarget) return;
    refreshSourceTexture();

    const FocusState focus = m_focus ? m_focus() : FocusState{};
    beginFrame();

    bindTarget(m_cocTarget.framebuffer, m_cocTarget.width, m_cocTarget.height);
    m_cocProgram.use();
    applyViewUniforms(m_cocProgram);
    m_cocProgram.set("uFocalDepth", focus.focalDepth);
    m_cocProgram.set("uBreathScale", focus.breathScale);
    m_cocProgram.set("uBreathOffset", focus.breathOffset.x, focus.breathOffset.y);
    m_cocProgram.texture("uDepth", 0, m_depthFilter.output());
    drawFullscreen();

    bindTarget(m_blurTarget.framebuffer, m_blurTarget.width, m_blurTarget.height);
    m_blurProgram.use();
    applyViewUniforms(m_blurProgram);
    m_blurProgram.set("uBreathScale", focus.breathScale);
    m_blurProgram.set("uBreathOffset", focus.breathOffset.x, focus.breathOffset.y);
    m_blurProgram.texture("uSource", 0, m_sourceTexture);
    m_blurProgram.texture("uCoc", 1, m_cocTarget.texture);
    drawFullscreen();

    bindScreen();
    m_compositeProgram.use();
    applyViewUniforms(m_compositeProgram);
    m_compositeProgram.set("uBreathScale", focus.breathScale);
    m_compositeProgram.set("uBreathOffset", focus.breathOffset.x, focus.breathOffset.y);
    m_compositeProgram.texture("uSource", 0, m_sourceTexture);
    m_compositeProgram.texture("uBlur", 1, m_blurTarget.texture);
    m_compositeProgram.texture("uCoc", 2, m_cocTarget.texture);
    drawFullscreen();

    presentScreen();
}

void GlRackFocusRenderer::onViewportResize() {
    std::string error;
    if (!resizeScreen(error)) {
        reportError(error);
        return;
    }
    if (m_cocProgram && !createTargets()) reportError(this->error());
}

void GlRackFocusRenderer::disposeRenderer() {
    m_blurTarget.reset();
    m_cocTarget.reset();
    m_compositeProgram.reset();
    m_blurProgram.reset();
    m_cocProgram.reset();
    releaseShared();
}

} // namespace layershift::gl
