// Layershift - ONNX Runtime depth model

#include <layershift/ml/onnx_depth_model.h>
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <array>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace layershift::ml {

namespace {

constexpr size_t READ_CHUNK = 1 << 20;

std::unique_ptr<Ort::SessionOptions> makeSessionOptions(const OnnxDepthModelOptions& options) {
    auto sessionOptions = std::make_unique<Ort::SessionOptions>();
    sessionOptions->SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
    if (options.intraOpThreads > 0) {
        sessionOptions->SetIntraOpNumThreads(options.intraOpThreads);
    }
    return sessionOptions;
}

std::vector<char> readModelFile(const std::string& path, const ModelProgressCallback& progress) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("Cannot open depth model: " + path);
    }
    const auto total = static_cast<uint64_t>(file.tellg());
    file.seekg(0);

    std::vector<char> bytes(total);
    uint64_t received = 0;
    while (received < total) {
        size_t n = static_cast<size_t>(std::min<uint64_t>(READ_CHUNK, total - received));
        if (!file.read(bytes.data() + received, static_cast<std::streamsize>(n))) {
            throw std::runtime_error("Short read on depth model: " + path);
        }
        received += n;
        if (progress) {
            ModelProgress p;
            p.receivedBytes = received;
            p.totalBytes = total;
            p.fraction = total > 0 ? static_cast<double>(received) / static_cast<double>(total) : 1.0;
            p.label = "Loading depth model";
            progress(p);
        }
    }
    return bytes;
}

} // namespace

struct OnnxDepthModel::OrtObjects {
    Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "layershift-ml"};
    std::unique_ptr<Ort::SessionOptions> sessionOptions;
    std::unique_ptr<Ort::Session> session;
    Ort::MemoryInfo memoryInfo{Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)};
};

OnnxDepthModel::OnnxDepthModel(OnnxDepthModelOptions options)
    : m_options(options), m_ort(std::make_unique<OrtObjects>()) {
}

OnnxDepthModel::~OnnxDepthModel() = default;

bool OnnxDepthModel::loaded() const {
    return static_cast<bool>(m_ort->session);
}

void OnnxDepthModel::load(const std::string& path, const ModelProgressCallback& progress) {
    std::vector<char> bytes = readModelFile(path, progress);
    m_ort->session.reset();

    try {
        if (m_options.preferCuda) {
            try {
                m_ort->sessionOptions = makeSessionOptions(m_options);
                OrtCUDAProviderOptions cuda{};
                m_ort->sessionOptions->AppendExecutionProvider_CUDA(cuda);
                m_ort->session = std::make_unique<Ort::Session>(m_ort->env, bytes.data(), bytes.size(),
                                                                *m_ort->sessionOptions);
                m_provider = "cuda";
            } catch (const Ort::Exception& e) {
                std::cout << "[OnnxDepthModel] CUDA unavailable, using CPU: " << e.what() << std::endl;
                m_ort->session.reset();
            }
        }
        if (!m_ort->session) {
            m_ort->sessionOptions = makeSessionOptions(m_options);
            m_ort->session = std::make_unique<Ort::Session>(m_ort->env, bytes.data(), bytes.size(),
                                                            *m_ort->sessionOptions);
            m_provider = "cpu";
        }

        Ort::AllocatorWithDefaultOptions allocator;
        if (m_ort->session->GetInputCount() < 1 || m_ort->session->GetOutputCount() < 1) {
            throw std::runtime_error("Depth model needs one input and one output");
        }
        m_inputName = m_ort->session->GetInputNameAllocated(0, allocator).get();
        m_outputName = m_ort->session->GetOutputNameAllocated(0, allocator).get();

        // [N, 3, H, W]; dynamic axes (-1) keep the native Depth Anything size
        std::vector<int64_t> shape =
            m_ort->session->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        m_inputSize = DEPTH_MODEL_INPUT_SIZE;
        if (shape.size() == 4 && shape[2] > 0 && shape[2] == shape[3]) {
            m_inputSize = static_cast<int>(shape[2]);
        }
    } catch (const Ort::Exception& e) {
        m_ort->session.reset();
        std::cerr << "[OnnxDepthModel] Failed to load " << path << ": " << e.what() << std::endl;
        throw std::runtime_error(std::string("Depth model rejected: ") + e.what());
    }

    m_path = path;
    std::cout << "[OnnxDepthModel] Loaded " << path << " (" << m_provider << ", input "
              << m_inputSize << "x" << m_inputSize << ")" << std::endl;
}

DepthModelOutput OnnxDepthModel::infer(const std::vector<float>& tensor) {
    if (!m_ort->session) {
        throw std::runtime_error("Depth model not loaded");
    }
    const size_t expected = static_cast<size_t>(3) * m_inputSize * m_inputSize;
    if (tensor.size() != expected) {
        throw std::runtime_error("Depth model input has " + std::to_string(tensor.size()) +
                                 " values, expected " + std::to_string(expected));
    }

    std::array<int64_t, 4> shape = {1, 3, m_inputSize, m_inputSize};
    const char* inputNames[] = {m_inputName.c_str()};
    const char* outputNames[] = {m_outputName.c_str()};

    try {
        Ort::Value input = Ort::Value::CreateTensor<float>(
            m_ort->memoryInfo, const_cast<float*>(tensor.data()), tensor.size(), shape.data(), shape.size());

        std::vector<Ort::Value> outputs =
            m_ort->session->Run(Ort::RunOptions{nullptr}, inputNames, &input, 1, outputNames, 1);

        Ort::TensorTypeAndShapeInfo info = outputs[0].GetTensorTypeAndShapeInfo();
        std::vector<int64_t> outShape = info.GetShape();
        if (outShape.size() < 2) {
            throw std::runtime_error("Depth model output must be at least 2D");
        }

        DepthModelOutput out;
        out.width = static_cast<int>(outShape[outShape.size() - 1]);
        out.height = static_cast<int>(outShape[outShape.size() - 2]);
        const float* data = outputs[0].GetTensorData<float>();
        out.data.assign(data, data + static_cast<size_t>(out.width) * out.height);
        return out;
    } catch (const Ort::Exception& e) {
        std::cerr << "[OnnxDepthModel] Inference failed: " << e.what() << std::endl;
        throw std::runtime_error(std::string("Depth inference failed: ") + e.what());
    }
}

std::shared_ptr<DepthModel> loadOnnxDepthModel(const std::string& path, const ModelProgressCallback& progress) {
    auto model = std::make_shared<OnnxDepthModel>();
    model->load(path, progress);
    return model;
}

} // namespace layershift::ml
