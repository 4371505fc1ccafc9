// Layershift - OpenGL context setup

#include <layershift/gl/gl_context.h>
#include <layershift/gl/gl_object.h>
#include <GL/glew.h>
#include <GLFW/glfw3.h>
#include <algorithm>
#include <iostream>
#include <thread>

namespace layershift::gl {

bool GlContext::create(GLFWwindow* window) {
    destroy();
    if (!window) {
        m_error = "No window for the OpenGL context";
        return false;
    }

    glfwMakeContextCurrent(window);
    glewExperimental = GL_TRUE;
    const GLenum status = glewInit();
    // GLEW probes extensions with a call core profiles reject; drop that error
    while (glGetError() != GL_NO_ERROR) {}
    if (status != GLEW_OK) {
        m_error = std::string("GLEW init failed: ") +
                  reinterpret_cast<const char*>(glewGetErrorString(status));
        std::cerr << "[GL] " << m_error << std::endl;
        return false;
    }
    if (!GLEW_VERSION_3_3) {
        m_error = "OpenGL 3.3 is not supported";
        std::cerr << "[GL] " << m_error << std::endl;
        return false;
    }

    m_window = window;
    advanceContextGeneration();
    glfwSwapInterval(1);

    std::cout << "[GL] " << reinterpret_cast<const char*>(glGetString(GL_RENDERER))
              << " (" << reinterpret_cast<const char*>(glGetString(GL_VERSION)) << ")" << std::endl;
    return true;
}

void GlContext::destroy() {
    m_window = nullptr;
}

void GlContext::present() {
    if (m_window) glfwSwapBuffers(m_window);
}

glm::ivec2 GlContext::framebufferSize() const {
    int width = 1;
    int height = 1;
    if (m_window) glfwGetFramebufferSize(m_window, &width, &height);
    return {std::max(width, 1), std::max(height, 1)};
}

std::optional<std::string> GlContext::checkReset() const {
    if (!m_window) return std::nullopt;

    GLenum status = GL_NO_ERROR;
    if (GLEW_VERSION_4_5) {
        status = glGetGraphicsResetStatus();
    } else if (GLEW_ARB_robustness) {
        status = glGetGraphicsResetStatusARB();
    }

    switch (status) {
        case GL_NO_ERROR: return std::nullopt;
        case GL_GUILTY_CONTEXT_RESET: return std::string("context reset (guilty)");
        case GL_INNOCENT_CONTEXT_RESET: return std::string("context reset (innocent)");
        default: return std::string("context reset (unknown cause)");
    }
}

DeviceCapabilities GlContext::capabilities() const {
    DeviceCapabilities caps;
    if (m_window) {
        const GLubyte* vendor = glGetString(GL_VENDOR);
        const GLubyte* renderer = glGetString(GL_RENDERER);
        if (vendor) caps.renderer += reinterpret_cast<const char*>(vendor);
        if (renderer) {
            if (!caps.renderer.empty()) caps.renderer += " ";
            caps.renderer += reinterpret_cast<const char*>(renderer);
        }
        GLint maxTexture = 0;
        glGetIntegerv(GL_MAX_TEXTURE_SIZE, &maxTexture);
        caps.maxTextureSize = maxTexture;
    }
    caps.hardwareConcurrency = static_cast<int>(std::thread::hardware_concurrency());
    return caps;
}

} // namespace layershift::gl
