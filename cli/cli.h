// Layershift CLI Commands
// Handles: layershift view, layershift precompute, layershift analyze

#pragma once

#include "app.h"
#include <string>

namespace layershift::cli {

constexpr const char* VERSION = "1.0.0";

// Parse the command line and run the chosen subcommand; returns the exit code
int handleCommand(int argc, char** argv);

struct PrecomputeOptions {
    std::string video;
    std::string model;
    std::string outputDir;
    double fps = 5.0;
    int size = 512;
};

struct AnalyzeOptions {
    std::string depthData;
    std::string depthMeta;
    bool json = false;
};

int runView(const ViewerConfig& config);
int runPrecompute(const PrecomputeOptions& options);
int runAnalyze(const AnalyzeOptions& options);

// "1280x720" -> width/height; false on anything else
bool parseWindowSize(const std::string& text, int& width, int& height);

} // namespace layershift::cli
