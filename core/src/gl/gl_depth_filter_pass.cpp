// Layershift - Bilateral depth filter pass (OpenGL)

#include <layershift/gl/gl_depth_filter_pass.h>
#include <layershift/depth_filter.h>
#include <algorithm>

namespace layershift::gl {

namespace {

const char* FILTER_FRAGMENT_SHADER = R"(
uniform sampler2D uRawDepth;
uniform float uSpatialSigma2;
uniform float uDepthSigma2;

out vec4 fragColor;

void main() {
    ivec2 size = textureSize(uRawDepth, 0);
    ivec2 center = ivec2(gl_FragCoord.xy);
    float centerDepth = texelFetch(uRawDepth, center, 0).r;

    float sum = 0.0;
    float weightSum = 0.0;
    for (int dy = -RADIUS; dy <= RADIUS; ++dy) {
        for (int dx = -RADIUS; dx <= RADIUS; ++dx) {
            ivec2 p = center + ivec2(dx, dy);
            if (p.x < 0 || p.y < 0 || p.x >= size.x || p.y >= size.y) {
                continue;
            }
            float d = texelFetch(uRawDepth, p, 0).r;
            float delta = d - centerDepth;
            float spatial = float(dx * dx + dy * dy);
            float w = exp(-spatial / uSpatialSigma2 - delta * delta / uDepthSigma2);
            sum += d * w;
            weightSum += w;
        }
    }
    fragColor = vec4(sum / max(weightSum, 1e-6), 0.0, 0.0, 1.0);
}
)";

} // namespace

bool GlDepthFilterPass::init(int width, int height, int radius, std::string& error) {
    release();
    m_width = std::max(1, width);
    m_height = std::max(1, height);
    m_radius = std::max(1, radius);

    std::string fragment = "#version 330 core\n#define RADIUS " + std::to_string(m_radius) + "\n";
    fragment += FILTER_FRAGMENT_SHADER;
    if (!m_program.build(FULLSCREEN_VERTEX_SHADER, fragment, "Depth Filter", error)) {
        release();
        return false;
    }

    m_raw = createTexture(m_width, m_height, GL_FORMAT_R8, GL_NEAREST);
    if (!createTarget(m_filtered, m_width, m_height, GL_FORMAT_R8, GL_LINEAR, error)) {
        error = "Filtered depth: " + error;
        release();
        return false;
    }

    m_program.use();
    m_program.set("uSpatialSigma2", bilateralSpatialSigma2(m_radius));
    m_program.set("uDepthSigma2", BILATERAL_DEPTH_SIGMA2);
    glUseProgram(0);
    return true;
}

void GlDepthFilterPass::upload(const uint8_t* depth) {
    if (!m_raw || !depth) return;
    uploadTexture(m_raw, m_width, m_height, GL_FORMAT_R8, depth);
}

void GlDepthFilterPass::run() {
    if (!m_filtered) return;
    bindTarget(m_filtered.framebuffer, m_width, m_height);
    m_program.use();
    m_program.texture("uRawDepth", 0, m_raw);
    drawFullscreen();
}

void GlDepthFilterPass::release() {
    m_filtered.reset();
    m_raw.reset();
    m_program.reset();
    m_width = m_height = 0;
}

} // namespace layershift::gl
