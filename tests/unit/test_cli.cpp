/**
 * @file test_cli.cpp
 * @brief Command line parsing and the analyze command
 */

#include <catch2/catch_test_macros.hpp>

#include "cli.h"
#include <layershift/depth_frames.h>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <vector>

using namespace layershift;
using namespace layershift::cli;
namespace fs = std::filesystem;

namespace {

int run(std::initializer_list<std::string> args) {
    std::vector<std::string> storage = {"layershift"};
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (std::string& s : storage) argv.push_back(s.data());
    argv.push_back(nullptr);
    return handleCommand(static_cast<int>(storage.size()), argv.data());
}

} // namespace

TEST_CASE("Window size parsing", "[cli]") {
    int w = 0, h = 0;
    REQUIRE(parseWindowSize("1920x1080", w, h));
    REQUIRE(w == 1920);
    REQUIRE(h == 1080);

    for (const char* bad : {"1920", "x1080", "1920x", "0x100", "-5x10", "19a0x1080", "1920x10.5", "axb"}) {
        int bw = 7, bh = 7;
        REQUIRE_FALSE(parseWindowSize(bad, bw, bh));
        REQUIRE(bw == 7);
        REQUIRE(bh == 7);
    }
}

TEST_CASE("View arguments are validated before opening a window", "[cli]") {
    REQUIRE(run({"view", "clip.mp4", "--effect", "blur"}) == 1);
    REQUIRE(run({"view", "clip.mp4", "--quality", "ultra"}) == 1);
    REQUIRE(run({"view", "clip.mp4", "--backend", "vulkan"}) == 1);
    REQUIRE(run({"view", "clip.mp4", "--window", "big"}) == 1);
    REQUIRE(run({"view", "--camera", "--image", "x.png"}) == 1);
    REQUIRE(run({"view"}) == 1);
    REQUIRE(run({"view", "clip.mp4", "--effect", "portal"}) == 1);
}

TEST_CASE("Parse errors", "[cli]") {
    REQUIRE(run({}) != 0);
    REQUIRE(run({"render"}) != 0);
    REQUIRE(run({"analyze", "--depth-data", "a.bin"}) != 0);
    REQUIRE(run({"precompute", "/nonexistent/clip.mp4", "-m", "m.onnx", "-o", "out"}) != 0);
    REQUIRE(run({"--version"}) == 0);
}

TEST_CASE("Analyze", "[cli][analyze]") {
    const fs::path dir = fs::temp_directory_path() / "layershift_cli_analyze";
    fs::create_directories(dir);
    const fs::path data = dir / "depth-data.bin";
    const fs::path meta = dir / "depth-meta.json";

    std::vector<std::vector<uint8_t>> frames = {
        std::vector<uint8_t>(16, 40),
        std::vector<uint8_t>(16, 220)
    };
    {
        std::vector<uint8_t> packed = packDepthFrames(frames);
        std::ofstream file(data, std::ios::binary);
        file.write(reinterpret_cast<const char*>(packed.data()), static_cast<std::streamsize>(packed.size()));
    }
    {
        DepthMeta m;
        m.frameCount = 2;
        m.fps = 5.0;
        m.width = 4;
        m.height = 4;
        std::ofstream file(meta);
        file << serializeDepthMeta(m);
    }

    REQUIRE(run({"analyze", "--depth-data", data.string(), "--depth-meta", meta.string()}) == 0);
    REQUIRE(run({"analyze", "--depth-data", data.string(), "--depth-meta", meta.string(), "--json"}) == 0);
    REQUIRE(run({"analyze", "--depth-data", (dir / "missing.bin").string(), "--depth-meta", meta.string()}) == 1);

    fs::remove_all(dir);
}
