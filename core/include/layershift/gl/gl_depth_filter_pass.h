#pragma once

/**
 * @file gl_depth_filter_pass.h
 * @brief Bilateral depth filter on OpenGL (raw R8 upload, filtered R8 target)
 */

#include <layershift/gl/gl_utils.h>
#include <cstdint>
#include <string>

namespace layershift::gl {

class GlDepthFilterPass {
public:
    /// @brief Allocate both textures and build the kernel for a radius
    bool init(int width, int height, int radius, std::string& error);

    void upload(const uint8_t* depth);

    /// @brief Filter raw into output(); needs a bound VAO
    void run();

    GLuint output() const { return m_filtered.texture; }
    int width() const { return m_width; }
    int height() const { return m_height; }

    void release();

private:
    GlProgram m_program;
    GlTexture m_raw;
    GlTarget m_filtered;
    int m_width = 0;
    int m_height = 0;
    int m_radius = 1;
};

} // namespace layershift::gl
