#pragma once

/**
 * @file gl_object.h
 * @brief Move-only ownership of OpenGL object names
 *
 * Names belong to the context generation they were created in. After a
 * context reset the host creates a new context and bumps the generation;
 * names from the lost context are then forgotten instead of deleted, since
 * the new context may already reuse the same integers.
 */

#include <GL/glew.h>
#include <cstdint>

namespace layershift::gl {

/// @brief Generation of the context that is current on the render thread
uint64_t contextGeneration();

/// @brief Called by GlContext each time a new context becomes current
void advanceContextGeneration();

enum class GlKind {
    Texture,
    Buffer,
    VertexArray,
    Framebuffer,
    Renderbuffer,
    Program
};

inline void deleteGlName(GlKind kind, GLuint id) {
    switch (kind) {
        case GlKind::Texture:      glDeleteTextures(1, &id); break;
        case GlKind::Buffer:       glDeleteBuffers(1, &id); break;
        case GlKind::VertexArray:  glDeleteVertexArrays(1, &id); break;
        case GlKind::Framebuffer:  glDeleteFramebuffers(1, &id); break;
        case GlKind::Renderbuffer: glDeleteRenderbuffers(1, &id); break;
        case GlKind::Program:      glDeleteProgram(id); break;
    }
}

template<GlKind K>
class GlObject {
public:
    GlObject() = default;
    explicit GlObject(GLuint id) : m_id(id), m_generation(contextGeneration()) {}
    ~GlObject() { reset(); }

    GlObject(GlObject&& other) noexcept
        : m_id(other.m_id), m_generation(other.m_generation) {
        other.m_id = 0;
    }
    GlObject& operator=(GlObject&& other) noexcept {
        if (this != &other) {
            reset();
            m_id = other.m_id;
            m_generation = other.m_generation;
            other.m_id = 0;
        }
        return *this;
    }

    GlObject(const GlObject&) = delete;
    GlObject& operator=(const GlObject&) = delete;

    /// @brief Generate a fresh name (not used for programs)
    static GlObject generate() {
        GLuint id = 0;
        switch (K) {
            case GlKind::Texture:      glGenTextures(1, &id); break;
            case GlKind::Buffer:       glGenBuffers(1, &id); break;
            case GlKind::VertexArray:  glGenVertexArrays(1, &id); break;
            case GlKind::Framebuffer:  glGenFramebuffers(1, &id); break;
            case GlKind::Renderbuffer: glGenRenderbuffers(1, &id); break;
            case GlKind::Program:      id = glCreateProgram(); break;
        }
        return GlObject(id);
    }

    GLuint get() const { return m_id; }
    operator GLuint() const { return m_id; }
    explicit operator bool() const { return m_id != 0; }

    void reset() {
        if (m_id && m_generation == contextGeneration()) deleteGlName(K, m_id);
        m_id = 0;
    }

private:
    GLuint m_id = 0;
    uint64_t m_generation = 0;
};

using GlTexture = GlObject<GlKind::Texture>;
using GlBuffer = GlObject<GlKind::Buffer>;
using GlVertexArray = GlObject<GlKind::VertexArray>;
using GlFramebuffer = GlObject<GlKind::Framebuffer>;
using GlRenderbuffer = GlObject<GlKind::Renderbuffer>;
using GlProgramHandle = GlObject<GlKind::Program>;

} // namespace layershift::gl
