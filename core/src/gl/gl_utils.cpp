// Layershift - OpenGL shader and target helpers

#include <layershift/gl/gl_utils.h>
#include <algorithm>
#include <iostream>

namespace layershift::gl {

namespace {

uint64_t g_contextGeneration = 1;

GLuint compileStage(GLenum type, const std::string& source, const std::string& label, std::string& error) {
    GLuint shader = glCreateShader(type);
    const char* src = source.c_str();
    glShaderSource(shader, 1, &src, nullptr);
    glCompileShader(shader);

    GLint ok = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
    if (!ok) {
        GLint length = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
        std::string log(static_cast<size_t>(std::max(length, 1)), '\0');
        glGetShaderInfoLog(shader, length, nullptr, log.data());
        error = label + (type == GL_VERTEX_SHADER ? " vertex" : " fragment") + " shader: " + log;
        std::cerr << "[GL] " << error << std::endl;
        glDeleteShader(shader);
        return 0;
    }
    return shader;
}

} // namespace

uint64_t contextGeneration() {
    return g_contextGeneration;
}

void advanceContextGeneration() {
    ++g_contextGeneration;
}

const char* FULLSCREEN_VERTEX_SHADER = R"(#version 330 core
uniform vec2 uUvOffset;
uniform vec2 uUvScale;

out vec2 vUv;
out vec2 vScreenUv;
out vec2 vTargetUv;

void main() {
    vec2 p = vec2(gl_VertexID == 1 ? 3.0 : -1.0, gl_VertexID == 2 ? 3.0 : -1.0);
    vTargetUv = (p + 1.0) * 0.5;
    vScreenUv = vec2(vTargetUv.x, 1.0 - vTargetUv.y);
    vUv = uUvOffset + vScreenUv * uUvScale;
    gl_Position = vec4(p, 0.0, 1.0);
}
)";

// -----------------------------------------------------------------------------
// GlProgram
// -----------------------------------------------------------------------------

bool GlProgram::build(const std::string& vertexSource, const std::string& fragmentSource,
                      const std::string& label, std::string& error) {
    reset();

    GLuint vs = compileStage(GL_VERTEX_SHADER, vertexSource, label, error);
    if (!vs) return false;
    GLuint fs = compileStage(GL_FRAGMENT_SHADER, fragmentSource, label, error);
    if (!fs) {
        glDeleteShader(vs);
        return false;
    }

    GlProgramHandle program(glCreateProgram());
    glAttachShader(program, vs);
    glAttachShader(program, fs);
    glLinkProgram(program);
    glDeleteShader(vs);
    glDeleteShader(fs);

    GLint ok = GL_FALSE;
    glGetProgramiv(program, GL_LINK_STATUS, &ok);
    if (!ok) {
        GLint length = 0;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &length);
        std::string log(static_cast<size_t>(std::max(length, 1)), '\0');
        glGetProgramInfoLog(program, length, nullptr, log.data());
        error = label + " link: " + log;
        std::cerr << "[GL] " << error << std::endl;
        return false;
    }

    m_program = std::move(program);
    return true;
}

GLint GlProgram::uniform(const char* name) {
    auto it = m_uniforms.find(name);
    if (it != m_uniforms.end()) return it->second;
    GLint location = glGetUniformLocation(m_program, name);
    m_uniforms.emplace(name, location);
    return location;
}

void GlProgram::set(const char* name, int value) {
    glUniform1i(uniform(name), value);
}

void GlProgram::set(const char* name, float value) {
    glUniform1f(uniform(name), value);
}

void GlProgram::set(const char* name, float x, float y) {
    glUniform2f(uniform(name), x, y);
}

void GlProgram::set(const char* name, float x, float y, float z) {
    glUniform3f(uniform(name), x, y, z);
}

void GlProgram::texture(const char* name, int unit, GLuint texture) {
    glActiveTexture(GL_TEXTURE0 + static_cast<GLenum>(unit));
    glBindTexture(GL_TEXTURE_2D, texture);
    glUniform1i(uniform(name), unit);
}

void GlProgram::reset() {
    m_uniforms.clear();
    m_program.reset();
}

// -----------------------------------------------------------------------------
// Textures and targets
// -----------------------------------------------------------------------------

GlTexture createTexture(int width, int height, GlFormat format, GLenum filter, const void* data) {
    GlTexture texture = GlTexture::generate();
    glBindTexture(GL_TEXTURE_2D, texture);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, static_cast<GLint>(filter));
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, static_cast<GLint>(filter));
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D, 0, static_cast<GLint>(format.internalFormat), width, height, 0,
                 format.format, format.type, data);
    glBindTexture(GL_TEXTURE_2D, 0);
    return texture;
}

void uploadTexture(GLuint texture, int width, int height, GlFormat format, const void* data) {
    glBindTexture(GL_TEXTURE_2D, texture);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, width, height, format.format, format.type, data);
    glBindTexture(GL_TEXTURE_2D, 0);
}

const char* framebufferStatusName(GLenum status) {
    switch (status) {
        case GL_FRAMEBUFFER_COMPLETE: return "complete";
        case GL_FRAMEBUFFER_UNDEFINED: return "undefined";
        case GL_FRAMEBUFFER_INCOMPLETE_ATTACHMENT: return "incomplete attachment";
        case GL_FRAMEBUFFER_INCOMPLETE_MISSING_ATTACHMENT: return "missing attachment";
        case GL_FRAMEBUFFER_INCOMPLETE_DRAW_BUFFER: return "incomplete draw buffer";
        case GL_FRAMEBUFFER_INCOMPLETE_READ_BUFFER: return "incomplete read buffer";
        case GL_FRAMEBUFFER_UNSUPPORTED: return "unsupported";
        case GL_FRAMEBUFFER_INCOMPLETE_MULTISAMPLE: return "incomplete multisample";
        default: return "unknown";
    }
}

bool checkFramebuffer(const char* label, std::string& error) {
    const GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
    if (status == GL_FRAMEBUFFER_COMPLETE) return true;
    error = std::string(label) + " framebuffer " + framebufferStatusName(status);
    return false;
}

bool createTarget(GlTarget& out, int width, int height, GlFormat format, GLenum filter,
                  std::string& error) {
    out.reset();
    out.texture = createTexture(width, height, format, filter);
    out.framebuffer = GlFramebuffer::generate();
    glBindFramebuffer(GL_FRAMEBUFFER, out.framebuffer);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, out.texture, 0);
    const bool complete = checkFramebuffer("Render target", error);
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    if (!complete) {
        out.reset();
        return false;
    }
    out.width = width;
    out.height = height;
    return true;
}

void bindTarget(GLuint framebuffer, int width, int height) {
    glBindFramebuffer(GL_FRAMEBUFFER, framebuffer);
    glViewport(0, 0, width, height);
}

// -----------------------------------------------------------------------------
// Meshes
// -----------------------------------------------------------------------------

GlMesh createMesh(const std::vector<float>& vertices, const std::vector<int>& components,
                  const std::vector<uint16_t>& indices) {
    GlMesh mesh;
    mesh.vao = GlVertexArray::generate();
    glBindVertexArray(mesh.vao);

    mesh.vertices = GlBuffer::generate();
    glBindBuffer(GL_ARRAY_BUFFER, mesh.vertices);
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(vertices.size() * sizeof(float)),
                 vertices.empty() ? nullptr : vertices.data(), GL_STATIC_DRAW);

    int stride = 0;
    for (int c : components) stride += c;
    size_t offset = 0;
    for (size_t i = 0; i < components.size(); ++i) {
        glEnableVertexAttribArray(static_cast<GLuint>(i));
        glVertexAttribPointer(static_cast<GLuint>(i), components[i], GL_FLOAT, GL_FALSE,
                              stride * static_cast<GLsizei>(sizeof(float)),
                              reinterpret_cast<const void*>(offset * sizeof(float)));
        offset += static_cast<size_t>(components[i]);
    }

    if (!indices.empty()) {
        mesh.indices = GlBuffer::generate();
        glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, mesh.indices);
        glBufferData(GL_ELEMENT_ARRAY_BUFFER, static_cast<GLsizeiptr>(indices.size() * sizeof(uint16_t)),
                     indices.data(), GL_STATIC_DRAW);
        mesh.count = static_cast<GLsizei>(indices.size());
    } else if (stride > 0) {
        mesh.count = static_cast<GLsizei>(vertices.size() / static_cast<size_t>(stride));
    }

    glBindVertexArray(0);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    return mesh;
}

} // namespace layershift::gl
