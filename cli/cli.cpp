// Layershift CLI Commands
// Handles: layershift view, layershift precompute, layershift analyze

#include "cli.h"
#include <layershift/depth_analysis.h>
#include <layershift/depth_estimator.h>
#include <layershift/depth_frames.h>
#include <layershift/events.h>
#include <layershift/ml/onnx_depth_model.h>
#include <layershift/video/frame_extractor.h>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace layershift::cli {

bool parseWindowSize(const std::string& text, int& width, int& height) {
    const size_t x = text.find('x');
    if (x == std::string::npos || x == 0 || x + 1 >= text.size()) return false;
    try {
        size_t used = 0;
        const int w = std::stoi(text.substr(0, x), &used);
        if (used != x) return false;
        const std::string rest = text.substr(x + 1);
        const int h = std::stoi(rest, &used);
        if (used != rest.size() || w <= 0 || h <= 0) return false;
        width = w;
        height = h;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// -----------------------------------------------------------------------------
// view
// -----------------------------------------------------------------------------

int runView(const ViewerConfig& config) {
    ViewerApp app;
    int result = app.init(config);
    if (result != 0) {
        std::cerr << "Error: the effect failed to initialize.\n";
        return result;
    }
    return app.run();
}

// -----------------------------------------------------------------------------
// precompute
// -----------------------------------------------------------------------------

static void writeFile(const fs::path& path, const void* data, size_t size) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot write " + path.string());
    }
    file.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!file) {
        throw std::runtime_error("Short write on " + path.string());
    }
}

int runPrecompute(const PrecomputeOptions& options) {
    try {
        auto model = std::make_shared<ml::OnnxDepthModel>();
        model->load(options.model, [](const ModelProgress& p) {
            std::cout << "\r" << p.label << ": " << static_cast<int>(p.fraction * 100.0) << "%" << std::flush;
        });
        std::cout << std::endl;

        DepthEstimator estimator(model, options.size, options.size);
        std::vector<std::vector<uint8_t>> frames;

        video::ExtractionSummary summary = video::extractFrames(
            options.video, options.fps,
            [&](const MediaFrame& frame, int index, double time) {
                frames.push_back(estimator.submitFrameAndWait(frame.rgba.data(), frame.width, frame.height));
                std::cout << "\r[Precompute] frame " << index + 1 << " (t=" << std::fixed
                          << std::setprecision(2) << time << "s)" << std::flush;
            });
        std::cout << std::endl;
        estimator.dispose();

        if (estimator.completedInferences() < frames.size()) {
            throw std::runtime_error("Depth estimation failed for " +
                                     std::to_string(frames.size() - estimator.completedInferences()) +
                                     " frame(s)");
        }

        DepthMeta meta;
        meta.frameCount = static_cast<int>(frames.size());
        meta.fps = options.fps;
        meta.width = options.size;
        meta.height = options.size;
        meta.sourceFps = summary.sourceFps;

        fs::path outDir(options.outputDir);
        fs::create_directories(outDir);
        const std::vector<uint8_t> packed = packDepthFrames(frames);
        writeFile(outDir / "depth-data.bin", packed.data(), packed.size());
        const std::string metaText = serializeDepthMeta(meta);
        writeFile(outDir / "depth-meta.json", metaText.data(), metaText.size());

        std::cout << "[Precompute] Wrote " << meta.frameCount << " frames (" << meta.width << "x"
                  << meta.height << ") to " << outDir.string() << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

// -----------------------------------------------------------------------------
// analyze
// -----------------------------------------------------------------------------

int runAnalyze(const AnalyzeOptions& options) {
    DepthFrameSet frames;
    try {
        frames = loadDepthFrameSet(options.depthData, options.depthMeta);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    const DepthProfile profile = analyzeDepthFrames(frames.frames, frames.width(), frames.height());
    const DerivedParallaxParams parallax = deriveParallaxParams(profile);
    const DerivedFocusParams focus = deriveFocusParams(profile);

    if (options.json) {
        json out;
        out["profile"] = toJson(profile);
        out["parallax"] = toJson(parallax);
        out["focus"] = toJson(focus);
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    std::cout << "Depth profile (" << frames.frameCount() << " frames, " << frames.width() << "x"
              << frames.height() << ")\n";
    const json p = toJson(profile);
    for (auto it = p.begin(); it != p.end(); ++it) {
        std::cout << "  " << std::left << std::setw(18) << it.key() << " " << it.value().dump() << "\n";
    }
    std::cout << "\nDerived parallax\n";
    const json dp = toJson(parallax);
    for (auto it = dp.begin(); it != dp.end(); ++it) {
        std::cout << "  " << std::left << std::setw(18) << it.key() << " " << it.value().dump() << "\n";
    }
    std::cout << "\nDerived focus\n";
    const json df = toJson(focus);
    for (auto it = df.begin(); it != df.end(); ++it) {
        std::cout << "  " << std::left << std::setw(18) << it.key() << " " << it.value().dump() << "\n";
    }
    return 0;
}

// -----------------------------------------------------------------------------
// Command line
// -----------------------------------------------------------------------------

int handleCommand(int argc, char** argv) {
    CLI::App app{"Layershift - depth-driven video effects"};
    app.set_version_flag("-v,--version", std::string(VERSION));
    app.set_help_flag("-h,--help", "Show this help");
    app.require_subcommand(1);

    // 'view' subcommand
    std::string viewSource;
    std::string viewEffect;
    std::string viewDepthData;
    std::string viewDepthMeta;
    std::string viewModel;
    std::string viewLogo;
    std::string viewConfig;
    std::string viewQuality;
    std::string viewBackend;
    std::string viewWindow = "1280x720";
    bool viewCamera = false;
    bool viewImage = false;
    bool viewLogFrames = false;

    auto* viewCmd = app.add_subcommand("view", "Show an effect in a window");
    viewCmd->add_option("source", viewSource, "Video, image or camera device path");
    viewCmd->add_option("-e,--effect", viewEffect, "Effect: parallax, rack-focus, portal");
    viewCmd->add_option("--depth-data", viewDepthData, "Packed depth frames (depth-data.bin)");
    viewCmd->add_option("--depth-meta", viewDepthMeta, "Depth metadata (depth-meta.json)");
    viewCmd->add_option("-m,--model", viewModel, "ONNX depth model for live estimation");
    viewCmd->add_option("--logo", viewLogo, "SVG outline for the portal effect");
    viewCmd->add_option("-c,--config", viewConfig, "Effect configuration JSON")->check(CLI::ExistingFile);
    viewCmd->add_option("-q,--quality", viewQuality, "Quality tier: auto, high, medium, low");
    viewCmd->add_option("-b,--backend", viewBackend, "GPU backend: auto, webgpu, opengl");
    viewCmd->add_option("-w,--window", viewWindow, "Window size WxH");
    viewCmd->add_flag("--camera", viewCamera, "Treat the source as a V4L2 camera (default /dev/video0)");
    viewCmd->add_flag("--image", viewImage, "Treat the source as a still image");
    viewCmd->add_flag("--log-frames", viewLogFrames, "Log every frame event");

    // 'precompute' subcommand
    PrecomputeOptions precompute;
    auto* precomputeCmd = app.add_subcommand("precompute", "Estimate depth for every sampled video frame");
    precomputeCmd->add_option("video", precompute.video, "Input video")->required()->check(CLI::ExistingFile);
    precomputeCmd->add_option("-m,--model", precompute.model, "ONNX depth model")->required()->check(CLI::ExistingFile);
    precomputeCmd->add_option("-o,--output", precompute.outputDir, "Output directory")->required();
    precomputeCmd->add_option("--fps", precompute.fps, "Depth sample rate")->default_val(5.0)
                 ->check(CLI::PositiveNumber);
    precomputeCmd->add_option("--size", precompute.size, "Depth map side in pixels")->default_val(512)
                 ->check(CLI::Range(16, 4096));

    // 'analyze' subcommand
    AnalyzeOptions analyze;
    auto* analyzeCmd = app.add_subcommand("analyze", "Print depth statistics and derived parameters");
    analyzeCmd->add_option("--depth-data", analyze.depthData, "Packed depth frames")->required();
    analyzeCmd->add_option("--depth-meta", analyze.depthMeta, "Depth metadata")->required();
    analyzeCmd->add_flag("--json", analyze.json, "Output as JSON");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (precomputeCmd->parsed()) {
        return runPrecompute(precompute);
    }
    if (analyzeCmd->parsed()) {
        return runAnalyze(analyze);
    }
    if (!viewCmd->parsed()) {
        return 1;
    }

    ViewerConfig config;
    try {
        if (!viewConfig.empty()) {
            config.effect = loadEffectConfigFile(viewConfig);
        }
        // Flags override the file
        if (!viewEffect.empty()) {
            auto kind = parseEffectKind(viewEffect);
            if (!kind) throw std::invalid_argument("Unknown effect '" + viewEffect + "'.");
            config.effect.effect = *kind;
        }
        if (!viewQuality.empty()) {
            if (viewQuality == "auto") {
                config.effect.quality.reset();
            } else {
                auto tier = parseQualityTier(viewQuality);
                if (!tier) throw std::invalid_argument("Unknown quality tier '" + viewQuality + "'.");
                config.effect.quality = *tier;
            }
        }
        if (!viewBackend.empty()) {
            auto pref = parseBackendPreference(viewBackend);
            if (!pref) throw std::invalid_argument("Unknown backend '" + viewBackend + "'.");
            config.effect.backend = *pref;
        }
        if (!parseWindowSize(viewWindow, config.windowWidth, config.windowHeight)) {
            throw std::invalid_argument("Window size must look like 1280x720, got '" + viewWindow + "'.");
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (viewCamera && viewImage) {
        std::cerr << "Error: --camera and --image are exclusive.\n";
        return 1;
    }
    if (viewSource.empty() && !viewCamera) {
        std::cerr << "Error: a source is required unless --camera is given.\n";
        return 1;
    }
    if (config.effect.effect == EffectKind::Portal && viewLogo.empty()) {
        std::cerr << "Error: the portal effect needs --logo.\n";
        return 1;
    }

    config.source = viewSource;
    if (viewCamera) config.sourceKind = MediaKind::Camera;
    if (viewImage) config.sourceKind = MediaKind::Image;
    config.depthData = viewDepthData;
    config.depthMeta = viewDepthMeta;
    config.model = viewModel;
    config.logo = viewLogo;
    config.logFrames = viewLogFrames;
    return runView(config);
}

} // namespace layershift::cli
