// Layershift Viewer
// Window, graphics device and main loop for `layershift view`

#pragma once

#include <layershift/effect_config.h>
#include <layershift/effect_host.h>
#include <optional>
#include <string>

namespace layershift {

// Configuration passed from command-line arguments
struct ViewerConfig {
    std::string source;
    std::optional<MediaKind> sourceKind;    // nullopt = guess from the file name
    std::string depthData;
    std::string depthMeta;
    std::string model;
    std::string logo;
    EffectConfig effect;
    int windowWidth = 1280;
    int windowHeight = 720;
    bool logFrames = false;                 // frame events are noisy
};

// Owns the GLFW window, the graphics device and one EffectHost
class ViewerApp {
public:
    ViewerApp() = default;
    ~ViewerApp();

    ViewerApp(const ViewerApp&) = delete;
    ViewerApp& operator=(const ViewerApp&) = delete;

    // Returns 0 on success, non-zero on error
    int init(const ViewerConfig& config);

    // Runs until the window closes; returns the exit code
    int run();

    void shutdown();

private:
    struct Impl;
    Impl* m_impl = nullptr;
    bool m_initialized = false;
};

} // namespace layershift
