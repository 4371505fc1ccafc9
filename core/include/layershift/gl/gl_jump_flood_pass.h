#pragma once

/**
 * @file gl_jump_flood_pass.h
 * @brief Portal distance field on OpenGL
 *
 * Same chain as the WebGPU pass: mask (R8) -> seed (RG32F) -> flood
 * ping-pong -> distance (RGBA8). All grid passes use texelFetch, so the
 * field keeps GL's bottom-left row order and is sampled with vTargetUv.
 */

#include <layershift/gl/gl_utils.h>
#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace layershift::gl {

class GlJumpFloodPass {
public:
    bool init(std::string& error);

    /// @brief Reallocate the grid; marks dirty
    bool resize(int width, int height, std::string& error);

    void markDirty() { m_dirty = true; }
    bool dirty() const { return m_dirty; }

    /**
     * @brief Recompute the field if dirty
     * @param fill Indexed fill mesh (vec2 positions)
     * @param fullscreenVao Empty VAO for the grid passes
     */
    void run(const GlMesh& fill, GLuint fullscreenVao, glm::vec2 meshScale, float range);

    GLuint distance() const { return m_distance.texture; }
    int width() const { return m_width; }
    int height() const { return m_height; }

    void release();

private:
    GlProgram m_maskProgram;
    GlProgram m_seedProgram;
    GlProgram m_floodProgram;
    GlProgram m_distanceProgram;

    GlTarget m_mask;
    GlTarget m_seedsA;
    GlTarget m_seedsB;
    GlTarget m_distance;

    std::vector<int> m_steps;
    int m_width = 0;
    int m_height = 0;
    bool m_dirty = true;
};

} // namespace layershift::gl
