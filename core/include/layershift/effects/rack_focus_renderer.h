#pragma once

/**
 * @file rack_focus_renderer.h
 * @brief Interactive depth of field on WebGPU
 *
 * Passes per display frame:
 * 1. circle of confusion from filtered depth and the focal plane (R16F, dof resolution)
 * 2. Poisson disk gather blur (RGBA16F, dof resolution)
 * 3. composite of sharp and blurred by |CoC|, highlight bloom, vignette
 *
 * Focus breathing scales the source UV around the center while racking.
 */

#include <layershift/effect_config.h>
#include <layershift/focus_controller.h>
#include <layershift/poisson_disk.h>
#include <layershift/effects/wgpu_renderer.h>

namespace layershift::gpu {

struct CocUniforms {
    float focalDepth;
    float breathScale;
    float breathOffset[2];
    float aperture;
    float focusRange;
    float depthScale;
    float maxBlurRadius;
};

struct BlurUniforms {
    float samples[MAX_POISSON_SAMPLES][4];   ///< xy used, vec4 stride
    float sampleCount;
    float maxBlurRadius;                     ///< in dof texels
    float breathScale;
    float _pad0;
    float texelSize[2];
    float breathOffset[2];
};

struct FocusCompositeUniforms {
    float breathOffset[2];
    float breathScale;
    float vignette;
    float highlightThreshold;
    float highlightBoost;
    float highlightBloom;
    float _pad0;
};

class RackFocusRenderer : public WgpuRenderer {
public:
    RackFocusRenderer(WgpuContext& context, FrameScheduler& scheduler, const RenderSurface& surface,
                      QualityParams quality, RackFocusSettings settings, FocusStateProvider focus);
    ~RackFocusRenderer() override;

    bool initialize(const MediaSource& source, int depthWidth, int depthHeight) override;

    const RackFocusSettings& settings() const { return m_settings; }

protected:
    void onDepthUpdate(double timeSeconds) override;
    void onRenderFrame() override;
    void onViewportResize() override;
    void disposeRenderer() override;

private:
    bool createPipelines();
    bool createTargets();
    bool createBindGroups();

    RackFocusSettings m_settings;
    FocusStateProvider m_focus;

    BuiltPipeline m_cocPipeline;
    BuiltPipeline m_blurPipeline;
    BuiltPipeline m_compositePipeline;

    BufferHandle m_cocUniforms;
    BufferHandle m_blurUniforms;
    BufferHandle m_compositeUniforms;

    RenderTarget m_cocTarget;
    RenderTarget m_blurTarget;

    BindGroupHandle m_cocBindGroup;
    BindGroupHandle m_blurBindGroup;
    BindGroupHandle m_compositeBindGroup;
    BindGroupHandle m_cocViewBindGroup;
    BindGroupHandle m_blurViewBindGroup;
    BindGroupHandle m_compositeViewBindGroup;

    BlurUniforms m_blurData = {};
};

} // namespace layershift::gpu
