#pragma once

/**
 * @file onnx_depth_model.h
 * @brief Depth Anything style monocular depth model on ONNX Runtime
 *
 * The model file is read in chunks so callers can show progress, then a
 * session is created from memory. CUDA is tried first when requested and
 * the CPU provider is used if the CUDA provider is unavailable.
 *
 * @code
 * auto model = std::make_shared<ml::OnnxDepthModel>();
 * model->load("depth_anything_v2_vits.onnx", [](const ModelProgress& p) {
 *     std::cout << p.label << " " << p.fraction << "\n";
 * });
 * DepthEstimator estimator(model, 512, 512);
 * @endcode
 */

#include <layershift/depth_estimator.h>
#include <memory>
#include <string>
#include <vector>

namespace layershift::ml {

struct OnnxDepthModelOptions {
    bool preferCuda = true;
    int intraOpThreads = 0;     ///< 0 lets the runtime decide
};

class OnnxDepthModel : public DepthModel {
public:
    explicit OnnxDepthModel(OnnxDepthModelOptions options = {});
    ~OnnxDepthModel() override;

    OnnxDepthModel(const OnnxDepthModel&) = delete;
    OnnxDepthModel& operator=(const OnnxDepthModel&) = delete;

    /**
     * @brief Read the model file and create the inference session
     * @throws std::runtime_error on a missing file or a rejected model
     */
    void load(const std::string& path, const ModelProgressCallback& progress = {});

    bool loaded() const;
    const std::string& path() const { return m_path; }
    const std::string& executionProvider() const { return m_provider; }

    /// @name DepthModel
    /// @{
    int inputSize() const override { return m_inputSize; }
    DepthModelOutput infer(const std::vector<float>& tensor) override;
    /// @}

private:
    struct OrtObjects;

    OnnxDepthModelOptions m_options;
    std::unique_ptr<OrtObjects> m_ort;
    std::string m_path;
    std::string m_provider = "none";
    std::string m_inputName;
    std::string m_outputName;
    int m_inputSize = DEPTH_MODEL_INPUT_SIZE;
};

/// @brief Convenience for EffectServices::loadModel
std::shared_ptr<DepthModel> loadOnnxDepthModel(const std::string& path,
                                               const ModelProgressCallback& progress);

} // namespace layershift::ml
