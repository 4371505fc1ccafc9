#pragma once

/**
 * @file portal_renderer.h
 * @brief Logo-shaped window into the source on WebGPU
 *
 * Per display frame:
 * 1. interior pass (MRT: color + lens depth) with POM, lens remap, fog and grade
 * 2. screen pass: stencil mark of the fill mesh, stencil-tested emissive
 *    composite with edge occlusion and bevel, chamfer ring, boundary rim
 *
 * The jump-flood distance field driving bevel, occlusion and the edge wall
 * is cached and recomputed after resizes only.
 */

#include <layershift/effect_config.h>
#include <layershift/shape_mesh.h>
#include <layershift/effects/jump_flood_pass.h>
#include <layershift/effects/wgpu_renderer.h>

namespace layershift::gpu {

/// Interior fragment uniforms (WGSL layout, 80 bytes)
struct InteriorUniforms {
    float offset[2];
    float strength;
    float pomSteps;
    float contrastLow;
    float contrastHigh;
    float verticalReduction;
    float dofStart;
    float dofStrength;
    float depthPower;
    float depthScale;
    float depthBias;
    float fogColor[3];
    float fogDensity;
    float colorShift;
    float brightnessBias;
    float imageTexelSize[2];
};

struct MeshUniforms {
    float meshScale[2];
    float _pad[2];
};

struct PortalCompositeUniforms {
    float edgeOcclusionWidth;
    float edgeOcclusionStrength;
    float distanceRange;
    float bevelIntensity;
    float bevelWidth;
    float bevelDarkening;
    float bevelDesaturation;
    float bevelLightAngle;      ///< radians
    float distanceTexelSize[2];
    float _pad[2];
};

struct ChamferUniforms {
    float lightDir[3];
    float ambient;
    float color[3];
    float specular;
    float meshScale[2];
    float texelSize[2];
    float shininess;
    float _pad[3];
};

struct RimUniforms {
    float meshScale[2];
    float rimWidth;
    float rimIntensity;
    float rimColor[3];
    float refractionStrength;
    float edgeColor[3];
    float chromaticStrength;
    float occlusionIntensity;
    float edgeThickness;
    float edgeSpecular;
    float distanceRange;
    float lightDir[2];
    float _pad[2];
};

class PortalRenderer : public WgpuRenderer {
public:
    PortalRenderer(WgpuContext& context, FrameScheduler& scheduler, const RenderSurface& surface,
                   QualityParams quality, PortalSettings settings, ShapeMesh mesh);
    ~PortalRenderer() override;

    bool initialize(const MediaSource& source, int depthWidth, int depthHeight) override;

    const PortalSettings& settings() const { return m_settings; }
    glm::vec2 meshScale() const { return m_meshScale; }

protected:
    void onDepthUpdate(double timeSeconds) override;
    void onRenderFrame() override;
    void onViewportResize() override;
    void disposeRenderer() override;
    glm::vec2 coverFitPadding() const override;

private:
    bool createPipelines();
    bool createMeshBuffers();
    bool createTargets();
    bool createBindGroups();
    void writeStaticUniforms();

    PortalSettings m_settings;
    ShapeMesh m_mesh;
    StripMesh m_edgeStrip;
    StripMesh m_chamferStrip;
    float m_strength = 0.0f;
    glm::vec2 m_meshScale{PORTAL_FILL_FACTOR};

    BuiltPipeline m_interiorPipeline;
    BuiltPipeline m_stencilPipeline;
    BuiltPipeline m_compositePipeline;
    BuiltPipeline m_chamferPipeline;
    BuiltPipeline m_rimPipeline;

    BufferHandle m_fillVertices;
    BufferHandle m_fillIndices;
    BufferHandle m_edgeVertices;
    BufferHandle m_chamferVertices;

    BufferHandle m_interiorUniforms;
    BufferHandle m_meshUniforms;
    BufferHandle m_compositeUniforms;
    BufferHandle m_chamferUniforms;
    BufferHandle m_rimUniforms;

    RenderTarget m_interiorColor;
    RenderTarget m_interiorDepth;
    RenderTarget m_stencil;
    JumpFloodPass m_distanceField;

    BindGroupHandle m_interiorBindGroup;
    BindGroupHandle m_interiorViewBindGroup;
    BindGroupHandle m_stencilBindGroup;
    BindGroupHandle m_compositeBindGroup;
    BindGroupHandle m_chamferBindGroup;
    BindGroupHandle m_rimBindGroup;

    InteriorUniforms m_interiorData = {};
};

} // namespace layershift::gpu
