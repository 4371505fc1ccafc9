#pragma once

/**
 * @file gl_utils.h
 * @brief Shader programs, render targets and the shared vertex stage (GLSL 330 core)
 *
 * Coordinate conventions, matching the WebGPU backend:
 * - textures are uploaded top row first, so source UV (0,0) is the image's top-left
 * - vScreenUv has a top-left origin, vUv is the cover-fit source coordinate
 * - vTargetUv addresses render targets drawn by earlier passes (GL's bottom-left origin)
 */

#include <layershift/gl/gl_object.h>
#include <GL/glew.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace layershift::gl {

/**
 * @brief Full-screen triangle with the cover-fit transform
 *
 * Uniforms uUvOffset and uUvScale drive vUv; passes that don't read the
 * source image leave them unset.
 */
extern const char* FULLSCREEN_VERTEX_SHADER;

class GlProgram {
public:
    /**
     * @brief Compile and link
     * @return false with error set to the info log, prefixed with the label
     */
    bool build(const std::string& vertexSource, const std::string& fragmentSource,
               const std::string& label, std::string& error);

    void use() const { glUseProgram(m_program); }

    /// @brief Cached uniform location (-1 when the uniform was optimised away)
    GLint uniform(const char* name);

    void set(const char* name, int value);
    void set(const char* name, float value);
    void set(const char* name, float x, float y);
    void set(const char* name, float x, float y, float z);

    /// @brief Bind a texture to a unit and point the sampler uniform at it
    void texture(const char* name, int unit, GLuint texture);

    GLuint id() const { return m_program; }
    explicit operator bool() const { return static_cast<bool>(m_program); }
    void reset();

private:
    GlProgramHandle m_program;
    std::unordered_map<std::string, GLint> m_uniforms;
};

/// A texture with the framebuffer that renders into it
struct GlTarget {
    GlTexture texture;
    GlFramebuffer framebuffer;
    int width = 0;
    int height = 0;

    explicit operator bool() const { return static_cast<bool>(framebuffer); }

    void reset() {
        framebuffer.reset();
        texture.reset();
        width = height = 0;
    }
};

/// @brief Color texture formats used by the passes
struct GlFormat {
    GLenum internalFormat = GL_RGBA8;
    GLenum format = GL_RGBA;
    GLenum type = GL_UNSIGNED_BYTE;
};

constexpr GlFormat GL_FORMAT_RGBA8{GL_RGBA8, GL_RGBA, GL_UNSIGNED_BYTE};
constexpr GlFormat GL_FORMAT_R8{GL_R8, GL_RED, GL_UNSIGNED_BYTE};
constexpr GlFormat GL_FORMAT_RG8{GL_RG8, GL_RG, GL_UNSIGNED_BYTE};
constexpr GlFormat GL_FORMAT_R16F{GL_R16F, GL_RED, GL_HALF_FLOAT};
constexpr GlFormat GL_FORMAT_RGBA16F{GL_RGBA16F, GL_RGBA, GL_HALF_FLOAT};
constexpr GlFormat GL_FORMAT_RG32F{GL_RG32F, GL_RG, GL_FLOAT};

/**
 * @brief Allocate a 2D texture with clamped addressing
 * @param data Optional top-row-first pixels
 */
GlTexture createTexture(int width, int height, GlFormat format, GLenum filter,
                        const void* data = nullptr);

/// @brief Replace the whole texture's pixels (tightly packed)
void uploadTexture(GLuint texture, int width, int height, GlFormat format, const void* data);

/// @brief Texture plus framebuffer; false with error when incomplete
bool createTarget(GlTarget& out, int width, int height, GlFormat format, GLenum filter,
                  std::string& error);

/// @brief Check the bound draw framebuffer; false with error when incomplete
bool checkFramebuffer(const char* label, std::string& error);

const char* framebufferStatusName(GLenum status);

/// @brief Bind a target (0 = none = default framebuffer) and set the viewport
void bindTarget(GLuint framebuffer, int width, int height);

/// @brief Static vertex buffer of floats in a fresh VAO
struct GlMesh {
    GlVertexArray vao;
    GlBuffer vertices;
    GlBuffer indices;
    GLsizei count = 0;      ///< Vertex count, or index count when indexed

    explicit operator bool() const { return static_cast<bool>(vao); }
    void reset() {
        indices.reset();
        vertices.reset();
        vao.reset();
        count = 0;
    }
};

/**
 * @brief Upload interleaved floats
 * @param components Floats per attribute, locations assigned in order
 */
GlMesh createMesh(const std::vector<float>& vertices, const std::vector<int>& components,
                  const std::vector<uint16_t>& indices = {});

/// @brief Draw the full-screen triangle (VAO must be bound)
inline void drawFullscreen() {
    glDrawArrays(GL_TRIANGLES, 0, 3);
}

} // namespace layershift::gl
