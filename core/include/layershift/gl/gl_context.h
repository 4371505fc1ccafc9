#pragma once

/**
 * @file gl_context.h
 * @brief OpenGL 3.3 core context on a GLFW window (GLEW loader)
 *
 * The window must be created with the GL client API, a 3.3 core profile
 * and GLFW_LOSE_CONTEXT_ON_RESET robustness so resets are observable.
 */

#include <layershift/quality.h>
#include <glm/glm.hpp>
#include <optional>
#include <string>

struct GLFWwindow;

namespace layershift::gl {

class GlContext {
public:
    GlContext() = default;
    ~GlContext() = default;

    GlContext(const GlContext&) = delete;
    GlContext& operator=(const GlContext&) = delete;

    /**
     * @brief Make the window's context current and load entry points
     * @return false with error() set when GLEW fails or GL < 3.3
     */
    bool create(GLFWwindow* window);

    /// @brief Forget the window; names created so far become stale
    void destroy();

    /// @brief Swap the window's buffers
    void present();

    /// @brief Window framebuffer size in pixels
    glm::ivec2 framebufferSize() const;

    /**
     * @brief Poll the robustness reset status
     * @return Reason string once the context has been reset
     */
    std::optional<std::string> checkReset() const;

    /// @brief Renderer string and limits for quality scoring
    DeviceCapabilities capabilities() const;

    bool valid() const { return m_window != nullptr; }
    GLFWwindow* window() const { return m_window; }
    const std::string& error() const { return m_error; }

private:
    GLFWwindow* m_window = nullptr;
    std::string m_error;
};

} // namespace layershift::gl
