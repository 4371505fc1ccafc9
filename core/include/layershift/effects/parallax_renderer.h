#pragma once

/**
 * @file parallax_renderer.h
 * @brief Depth parallax on WebGPU
 *
 * One screen pass after the bilateral filter: contrast-remapped depth drives
 * a UV shift along the input offset, optionally refined by parallax
 * occlusion marching, with a light far-field blur.
 */

#include <layershift/effect_config.h>
#include <layershift/effects/wgpu_renderer.h>

namespace layershift::gpu {

/// Compile-time bound of the occlusion march loop
constexpr int MAX_POM_STEPS = 64;

/// Fragment stage uniforms (WGSL layout, 48 bytes)
struct ParallaxUniforms {
    float offset[2];
    float strength;
    float pomEnabled;
    float pomSteps;
    float contrastLow;
    float contrastHigh;
    float verticalReduction;
    float dofStart;
    float dofStrength;
    float imageTexelSize[2];
};

class ParallaxRenderer : public WgpuRenderer {
public:
    ParallaxRenderer(WgpuContext& context, FrameScheduler& scheduler, const RenderSurface& surface,
                     QualityParams quality, ParallaxSettings settings);
    ~ParallaxRenderer() override;

    bool initialize(const MediaSource& source, int depthWidth, int depthHeight) override;

    const ParallaxSettings& settings() const { return m_settings; }

protected:
    void onDepthUpdate(double timeSeconds) override;
    void onRenderFrame() override;
    void onViewportResize() override;
    void disposeRenderer() override;
    glm::vec2 coverFitPadding() const override;

private:
    bool createPipeline();
    bool createBindGroups();

    ParallaxSettings m_settings;
    BuiltPipeline m_pipeline;
    BufferHandle m_uniforms;
    BindGroupHandle m_bindGroup;
    BindGroupHandle m_viewBindGroup;
    ParallaxUniforms m_uniformData = {};
};

} // namespace layershift::gpu
