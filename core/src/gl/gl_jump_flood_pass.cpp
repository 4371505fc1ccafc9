// Layershift - Jump-flood distance field passes (OpenGL)

#include <layershift/gl/gl_jump_flood_pass.h>
#include <layershift/jump_flood.h>
#include <algorithm>

namespace layershift::gl {

namespace {

const char* MASK_VERTEX_SHADER = R"(#version 330 core
layout(location = 0) in vec2 aPosition;
uniform vec2 uMeshScale;

void main() {
    gl_Position = vec4(aPosition * uMeshScale, 0.0, 1.0);
}
)";

const char* MASK_FRAGMENT_SHADER = R"(#version 330 core
out vec4 fragColor;

void main() {
    fragColor = vec4(1.0, 0.0, 0.0, 1.0);
}
)";

const char* SEED_FRAGMENT_SHADER = R"(#version 330 core
uniform sampler2D uMask;
out vec4 fragColor;

bool inside(ivec2 p, ivec2 size) {
    ivec2 q = clamp(p, ivec2(0), size - ivec2(1));
    return texelFetch(uMask, q, 0).r >= 0.5;
}

void main() {
    ivec2 size = textureSize(uMask, 0);
    ivec2 p = ivec2(gl_FragCoord.xy);
    bool c = inside(p, size);
    bool edge = c != inside(p + ivec2(1, 0), size) || c != inside(p - ivec2(1, 0), size) ||
                c != inside(p + ivec2(0, 1), size) || c != inside(p - ivec2(0, 1), size);
    fragColor = edge ? vec4(vec2(p), 0.0, 1.0) : vec4(-1.0, -1.0, 0.0, 1.0);
}
)";

const char* FLOOD_FRAGMENT_SHADER = R"(#version 330 core
uniform sampler2D uSeeds;
uniform int uStep;
out vec4 fragColor;

void main() {
    ivec2 size = textureSize(uSeeds, 0);
    ivec2 p = ivec2(gl_FragCoord.xy);
    vec2 pf = vec2(p);

    vec2 best = texelFetch(uSeeds, p, 0).xy;
    float bestDist2 = 1.0e20;
    if (best.x >= 0.0) {
        vec2 d = best - pf;
        bestDist2 = dot(d, d);
    }

    for (int oy = -1; oy <= 1; ++oy) {
        for (int ox = -1; ox <= 1; ++ox) {
            if (ox == 0 && oy == 0) {
                continue;
            }
            ivec2 s = p + ivec2(ox, oy) * uStep;
            if (s.x < 0 || s.y < 0 || s.x >= size.x || s.y >= size.y) {
                continue;
            }
            vec2 n = texelFetch(uSeeds, s, 0).xy;
            if (n.x < 0.0) {
                continue;
            }
            vec2 d = n - pf;
            float d2 = dot(d, d);
            if (d2 < bestDist2) {
                bestDist2 = d2;
                best = n;
            }
        }
    }
    fragColor = vec4(best, 0.0, 1.0);
}
)";

const char* DISTANCE_FRAGMENT_SHADER = R"(#version 330 core
uniform sampler2D uSeeds;
uniform sampler2D uMask;
uniform float uRange;
out vec4 fragColor;

void main() {
    ivec2 size = textureSize(uSeeds, 0);
    ivec2 p = ivec2(gl_FragCoord.xy);

    if (texelFetch(uMask, p, 0).r < 0.5) {
        fragColor = vec4(0.0, 0.0, 0.0, 1.0);
        return;
    }
    vec2 seed = texelFetch(uSeeds, p, 0).xy;
    if (seed.x < 0.0) {
        fragColor = vec4(1.0);
        return;
    }
    float maxDim = float(max(size.x, size.y));
    float d = clamp((distance(seed, vec2(p)) / maxDim) / max(uRange, 0.001), 0.0, 1.0);
    fragColor = vec4(d, d, d, 1.0);
}
)";

} // namespace

bool GlJumpFloodPass::init(std::string& error) {
    release();
    return m_maskProgram.build(MASK_VERTEX_SHADER, MASK_FRAGMENT_SHADER, "JFA Mask", error) &&
           m_seedProgram.build(FULLSCREEN_VERTEX_SHADER, SEED_FRAGMENT_SHADER, "JFA Seed", error) &&
           m_floodProgram.build(FULLSCREEN_VERTEX_SHADER, FLOOD_FRAGMENT_SHADER, "JFA Flood", error) &&
           m_distanceProgram.build(FULLSCREEN_VERTEX_SHADER, DISTANCE_FRAGMENT_SHADER, "JFA Distance", error);
}

bool GlJumpFloodPass::resize(int width, int height, std::string& error) {
    m_width = std::max(1, width);
    m_height = std::max(1, height);
    m_dirty = true;
    m_steps = jumpFloodSteps(m_width, m_height);

    return createTarget(m_mask, m_width, m_height, GL_FORMAT_R8, GL_NEAREST, error) &&
           createTarget(m_seedsA, m_width, m_height, GL_FORMAT_RG32F, GL_NEAREST, error) &&
           createTarget(m_seedsB, m_width, m_height, GL_FORMAT_RG32F, GL_NEAREST, error) &&
           createTarget(m_distance, m_width, m_height, GL_FORMAT_RGBA8, GL_LINEAR, error);
}

void GlJumpFloodPass::run(const GlMesh& fill, GLuint fullscreenVao, glm::vec2 meshScale, float range) {
    if (!m_dirty || !m_distance || !fill) return;

    // Mask
    bindTarget(m_mask.framebuffer, m_width, m_height);
    glClearColor(0.0f, 0.0f, 0.0f, 0.0f);
    glClear(GL_COLOR_BUFFER_BIT);
    m_maskProgram.use();
    m_maskProgram.set("uMeshScale", meshScale.x, meshScale.y);
    glBindVertexArray(fill.vao);
    glDrawElements(GL_TRIANGLES, fill.count, GL_UNSIGNED_SHORT, nullptr);

    glBindVertexArray(fullscreenVao);

    bindTarget(m_seedsA.framebuffer, m_width, m_height);
    m_seedProgram.use();
    m_seedProgram.texture("uMask", 0, m_mask.texture);
    drawFullscreen();

    // Step 0 reads the seeds in A, then the targets alternate
    m_floodProgram.use();
    for (size_t i = 0; i < m_steps.size(); ++i) {
        const bool fromA = (i % 2 == 0);
        const GlTarget& target = fromA ? m_seedsB : m_seedsA;
        const GlTarget& source = fromA ? m_seedsA : m_seedsB;
        bindTarget(target.framebuffer, m_width, m_height);
        m_floodProgram.set("uStep", m_steps[i]);
        m_floodProgram.texture("uSeeds", 0, source.texture);
        drawFullscreen();
    }

    const GlTarget& finalSeeds = (m_steps.size() % 2 == 0) ? m_seedsA : m_seedsB;
    bindTarget(m_distance.framebuffer, m_width, m_height);
    m_distanceProgram.use();
    m_distanceProgram.set("uRange", range);
    m_distanceProgram.texture("uSeeds", 0, finalSeeds.texture);
    m_distanceProgram.texture("uMask", 1, m_mask.texture);
    drawFullscreen();

    m_dirty = false;
}

void GlJumpFloodPass::release() {
    m_distance.reset();
    m_seedsB.reset();
    m_seedsA.reset();
    m_mask.reset();
    m_distanceProgram.reset();
    m_floodProgram.reset();
    m_seedProgram.reset();
    m_maskProgram.reset();
    m_steps.clear();
    m_dirty = true;
}

} // namespace layershift::gl
