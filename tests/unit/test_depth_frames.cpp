/**
 * @file test_depth_frames.cpp
 * @brief Precomputed depth: metadata validation, packing and interpolation
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <layershift/depth_frames.h>
#include <cmath>
#include <filesystem>
#include <fstream>

using namespace layershift;
using Catch::Matchers::ContainsSubstring;

namespace {

std::shared_ptr<const DepthFrameSet> twoFrameSet(uint8_t a, uint8_t b, double fps = 1.0) {
    auto set = std::make_shared<DepthFrameSet>();
    set->meta = {2, fps, 2, 2, 30.0};
    set->frames.push_back(std::vector<uint8_t>(4, a));
    set->frames.push_back(std::vector<uint8_t>(4, b));
    return set;
}

} // namespace

TEST_CASE("Depth metadata parsing", "[depth][meta]") {
    SECTION("valid metadata") {
        DepthMeta meta = parseDepthMeta(R"({"frameCount": 3, "fps": 5, "width": 4, "height": 2, "sourceFps": 29.97})");
        REQUIRE(meta.frameCount == 3);
        REQUIRE(meta.fps == 5.0);
        REQUIRE(meta.width == 4);
        REQUIRE(meta.height == 2);
        REQUIRE(meta.sourceFps == 29.97);
    }

    SECTION("missing field") {
        REQUIRE_THROWS_WITH(parseDepthMeta(R"({"frameCount": 3, "fps": 5, "width": 4, "height": 2})"),
                            "Depth metadata is malformed.");
    }

    SECTION("non-numeric field") {
        REQUIRE_THROWS_WITH(parseDepthMeta(R"({"frameCount": "3", "fps": 5, "width": 4, "height": 2, "sourceFps": 30})"),
                            "Depth metadata is malformed.");
    }

    SECTION("not JSON") {
        REQUIRE_THROWS_WITH(parseDepthMeta("frameCount=3"), "Depth metadata is malformed.");
    }

    SECTION("zero or negative values") {
        REQUIRE_THROWS_WITH(parseDepthMeta(R"({"frameCount": 0, "fps": 5, "width": 4, "height": 2, "sourceFps": 30})"),
                            "Depth metadata contains invalid numeric values.");
        REQUIRE_THROWS_WITH(parseDepthMeta(R"({"frameCount": 3, "fps": -5, "width": 4, "height": 2, "sourceFps": 30})"),
                            "Depth metadata contains invalid numeric values.");
    }

    SECTION("serialized metadata parses back") {
        DepthMeta meta{12, 5.0, 512, 512, 24.0};
        DepthMeta parsed = parseDepthMeta(serializeDepthMeta(meta));
        REQUIRE(parsed.frameCount == 12);
        REQUIRE(parsed.width == 512);
        REQUIRE(parsed.sourceFps == 24.0);
    }
}

TEST_CASE("Depth binary unpacking", "[depth][binary]") {
    DepthMeta meta{2, 5.0, 2, 2, 30.0};
    std::vector<std::vector<uint8_t>> frames = {{0, 1, 2, 3}, {10, 11, 12, 13}};
    std::vector<uint8_t> packed = packDepthFrames(frames);

    SECTION("header is little-endian uint32") {
        REQUIRE(packed.size() == 4 + 8);
        REQUIRE(packed[0] == 2);
        REQUIRE(packed[1] == 0);
        REQUIRE(packed[2] == 0);
        REQUIRE(packed[3] == 0);
    }

    SECTION("frames split in order") {
        DepthFrameSet set = unpackDepthFrames(packed, meta);
        REQUIRE(set.frameCount() == 2);
        REQUIRE(set.frames[1] == frames[1]);
    }

    SECTION("length mismatch is reported with both sizes") {
        packed.pop_back();
        REQUIRE_THROWS_WITH(unpackDepthFrames(packed, meta),
                            ContainsSubstring("Expected 12 bytes, received 11"));
    }

    SECTION("header count must match metadata") {
        DepthMeta three = meta;
        three.frameCount = 3;
        REQUIRE_THROWS_WITH(unpackDepthFrames(packed, three), ContainsSubstring("frame count mismatch"));
    }

    SECTION("missing header") {
        REQUIRE_THROWS(unpackDepthFrames({1, 2}, meta));
    }
}

TEST_CASE("Depth frame set loading from disk", "[depth][io]") {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "layershift_depth_frames_test";
    fs::create_directories(dir);

    DepthMeta meta{2, 5.0, 2, 2, 30.0};
    {
        std::vector<uint8_t> packed = packDepthFrames({{1, 2, 3, 4}, {5, 6, 7, 8}});
        std::ofstream data(dir / "depth-data.bin", std::ios::binary);
        data.write(reinterpret_cast<const char*>(packed.data()), static_cast<std::streamsize>(packed.size()));
        std::ofstream metaFile(dir / "depth-meta.json");
        metaFile << serializeDepthMeta(meta);
    }

    std::vector<LoadProgress> progress;
    DepthFrameSet set = loadDepthFrameSet(dir / "depth-data.bin", dir / "depth-meta.json",
                                          [&](const LoadProgress& p) { progress.push_back(p); });

    REQUIRE(set.frameCount() == 2);
    REQUIRE(set.frames[0][3] == 4);
    REQUIRE_FALSE(progress.empty());
    REQUIRE(progress.back().receivedBytes == 12);
    REQUIRE(progress.back().totalBytes == 12u);
    REQUIRE(progress.back().fraction == 1.0);

    SECTION("missing data file") {
        REQUIRE_THROWS(loadDepthFrameSet(dir / "nope.bin", dir / "depth-meta.json"));
    }

    fs::remove_all(dir);
}

TEST_CASE("Depth frame interpolation", "[depth][interpolation]") {
    SECTION("exact at frame times") {
        DepthFrameInterpolator interp(twoFrameSet(0, 200));
        REQUIRE(interp.sample(0.0)[0] == 0);
        REQUIRE(interp.sample(1.0)[0] == 200);
    }

    SECTION("rounds the linear blend") {
        DepthFrameInterpolator interp(twoFrameSet(0, 101));
        // 101 * 0.5 = 50.5 rounds up
        REQUIRE(interp.sample(0.5)[0] == 51);
        // 101 * 0.25 = 25.25
        REQUIRE(interp.sample(0.25)[0] == 25);
    }

    SECTION("clamps out of range times") {
        DepthFrameInterpolator interp(twoFrameSet(10, 90));
        REQUIRE(interp.sample(-3.0)[0] == 10);
        REQUIRE(interp.sample(50.0)[0] == 90);
    }

    SECTION("time scales by fps") {
        DepthFrameInterpolator interp(twoFrameSet(0, 100, 5.0));
        REQUIRE(interp.sample(0.1)[3] == 50);
    }

    SECTION("tiny time steps reuse the cached blend") {
        DepthFrameInterpolator interp(twoFrameSet(0, 255));
        const uint8_t first = interp.sample(0.5)[0];
        const uint8_t* again = interp.sample(0.5004);
        REQUIRE(again[0] == first);
    }

    SECTION("single frame set") {
        auto set = std::make_shared<DepthFrameSet>();
        set->meta = {1, 5.0, 1, 1, 30.0};
        set->frames.push_back({77});
        DepthFrameInterpolator interp(set);
        REQUIRE(interp.sample(3.0)[0] == 77);
    }

    SECTION("empty set is rejected") {
        REQUIRE_THROWS_AS(DepthFrameInterpolator(std::make_shared<DepthFrameSet>()), std::invalid_argument);
    }
}

TEST_CASE("Flat depth", "[depth]") {
    std::vector<uint8_t> flat = createFlatDepth(3, 2);
    REQUIRE(flat.size() == 6);
    REQUIRE(flat[5] == 128);
    REQUIRE(createFlatDepth(2, 2, 7)[0] == 7);
}
