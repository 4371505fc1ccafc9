// Layershift - Parallax renderer (OpenGL)

#include <layershift/gl/gl_parallax_renderer.h>
#include <algorithm>
#include <iostream>

namespace layershift::gl {

namespace {

constexpr int MAX_POM_STEPS = 64;

const char* PARALLAX_FRAGMENT_SHADER = R"(#version 330 core
#define MAX_POM_STEPS 64

uniform sampler2D uSource;
uniform sampler2D uDepth;
uniform vec2 uOffset;
uniform float uStrength;
uniform int uPomEnabled;
uniform int uPomSteps;
uniform float uContrastLow;
uniform float uContrastHigh;
uniform float uVerticalReduction;
uniform float uDofStart;
uniform float uDofStrength;
uniform vec2 uImageTexelSize;

in vec2 vUv;
out vec4 fragColor;

float depthAt(vec2 uv) {
    return smoothstep(uContrastLow, uContrastHigh, textureLod(uDepth, uv, 0.0).r);
}

vec2 displace(vec2 uv, vec2 shift) {
    if (uPomEnabled == 0) {
        return uv + shift * depthAt(uv);
    }

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

    vec3 sharp = textureLod(uSource, uv, 0.0).rgb;
    vec2 t = uImageTexelSize * 2.0;
    vec3 blurred = (textureLod(uSource, uv + vec2(t.x, 0.0), 0.0).rgb +
                    textureLod(uSource, uv - vec2(t.x, 0.0), 0.0).rgb +
                    textureLod(uSource, uv + vec2(0.0, t.y), 0.0).rgb +
                    textureLod(uSource, uv - vec2(0.0, t.y), 0.0).rgb) * 0.25;

    float blurWeight = smoothstep(uDofStart, 1.0, 1.0 - depth) * uDofStrength;
    fragColor = vec4(mix(sharp, blurred, blurWeight), 1.0);
}
)";

} // namespace

GlParallaxRenderer::GlParallaxRenderer(GlContext& context, FrameScheduler& scheduler,
                                       const RenderSurface& surface, QualityParams quality,
                                       ParallaxSettings settings)
    : GlRenderer("GlParallaxRenderer", context, scheduler, surface, quality)
    , m_settings(settings) {
}

GlParallaxRenderer::~GlParallaxRenderer() {
    dispose();
}

bool GlParallaxRenderer::initialize(const MediaSource& source, int depthWidth, int depthHeight) {
    disposeRenderer();
    if (!initShared(source, depthWidth, depthHeight)) {
        disposeRenderer();
        return false;
    }

    std::string error;
    if (!m_program.build(FULLSCREEN_VERTEX_SHADER, PARALLAX_FRAGMENT_SHADER, "Parallax", error)) {
        disposeRenderer();
        return fail(error);
    }

    m_pomSteps = std::clamp(std::min(m_settings.pomSteps, quality().pomSteps), 1, MAX_POM_STEPS);
    m_program.use();
    m_program.set("uStrength", m_settings.strength);
    m_program.set("uPomEnabled", m_settings.pomEnabled ? 1 : 0);
    m_program.set("uPomSteps", m_pomSteps);
    m_program.set("uContrastLow", m_settings.contrastLow);
    m_program.set("uContrastHigh", m_settings.contrastHigh);
    m_program.set("uVerticalReduction", m_settings.verticalReduction);
    m_program.set("uDofStart", m_settings.dofStart);
    m_program.set("uDofStrength", m_settings.dofStrength);
    m_program.set("uImageTexelSize", 1.0f / static_cast<float>(source.width()),
                  1.0f / static_cast<float>(source.height()));
    glUseProgram(0);

    recalculateViewport();
    if (!isDeviceLost() && !m_screen) {
        disposeRenderer();
        return fail(this->error().empty() ? "Failed to create screen target" : this->error());
    }

    std::cout << "[" << tag() << "] Initialized " << source.width() << "x" << source.height()
              << ", depth " << this->depthWidth() << "x" << this->depthHeight()
              << ", POM " << (m_settings.pomEnabled ? "on" : "off") << std::endl;
    return true;
}

void GlParallaxRenderer::onDepthUpdate(double timeSeconds) {
    updateDepth(timeSeconds);
}

void GlParallaxRenderer::onRenderFrame() {
    if (!m_program || !m_screen) return;
    refreshSourceTexture();

    const glm::vec2 input = readInput();

    beginFrame();
    bindScreen();
    m_program.use();
    applyViewUniforms(m_program);
    m_program.set("uOffset", -input.x * m_settings.parallaxX, input.y * m_settings.parallaxY);
    m_program.texture("uSource", 0, m_sourceTexture);
    m_program.texture("uDepth", 1, m_depthFilter.output());
    drawFullscreen();

    presentScreen();
}

void GlParallaxRenderer::onViewportResize() {
    std::string error;
    if (!resizeScreen(error)) reportError(error);
}

void GlParallaxRenderer::disposeRenderer() {
    m_program.reset();
    releaseShared();
}

glm::vec2 GlParallaxRenderer::coverFitPadding() const {
    return {m_settings.strength, m_settings.overscan};
}

} // namespace layershift::gl
