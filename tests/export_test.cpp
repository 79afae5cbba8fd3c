#include "cli_render.hpp"
#include "export.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static std::vector<uint8_t> read_file(const fs::path& p)
{
    std::ifstream in(p, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                                std::istreambuf_iterator<char>());
}

static uint32_t be32(const std::vector<uint8_t>& b, std::size_t off)
{
    return (uint32_t(b[off]) << 24) | (uint32_t(b[off + 1]) << 16) |
           (uint32_t(b[off + 2]) << 8) | uint32_t(b[off + 3]);
}

TEST(Export, WritesGrayscalePng)
{
    PixelBuffer buf;
    buf.resize(17, 9);
    for (std::size_t i = 0; i < buf.pixels.size(); i += 2)
        buf.pixels[i] = 0xFFFFFFFFu;

    const fs::path path = fs::temp_directory_path() / "fractal_cinema_export_test.png";
    ASSERT_EQ(export_png(path.string().c_str(), buf), "");

    const std::vector<uint8_t> bytes = read_file(path);
    ASSERT_GT(bytes.size(), 33u);
    const uint8_t sig[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    EXPECT_TRUE(std::equal(std::begin(sig), std::end(sig), bytes.begin()));
    // IHDR: width, height, bit depth, colour type 0 (gray)
    EXPECT_EQ(be32(bytes, 16), 17u);
    EXPECT_EQ(be32(bytes, 20), 9u);
    EXPECT_EQ(bytes[24], 8);
    EXPECT_EQ(bytes[25], 0);

    fs::remove(path);
}

TEST(Export, EmptyImageIsAnError)
{
    const PixelBuffer buf;
    const fs::path path = fs::temp_directory_path() / "fractal_cinema_empty.png";
    EXPECT_NE(export_png(path.string().c_str(), buf), "");
    EXPECT_FALSE(fs::exists(path));
}

TEST(Export, UnwritablePathIsAnError)
{
    PixelBuffer buf;
    buf.resize(4, 4);
    EXPECT_NE(export_png("/nonexistent-dir/x/out.png", buf), "");
}

TEST(Export, UnknownFiletypeIsAnError)
{
    PixelBuffer buf;
    buf.resize(4, 4);
    const std::string err = export_image("unused.bmp", buf, "bmp");
    EXPECT_NE(err.find("Unsupported"), std::string::npos) << err;
}

TEST(ExportRegion, HeightFollowsRegionAspect)
{
    ExportSettings e;   // 3 x 3 region
    e.image_size = 600;
    EXPECT_EQ(export_resolution(e), (Resolution{600, 600}));

    e.xmin = -2.0; e.xmax = 2.0;
    e.ymin = -1.0; e.ymax = 1.0;
    EXPECT_EQ(export_resolution(e), (Resolution{600, 300}));

    e.image_size = 1;
    EXPECT_EQ(export_resolution(e), (Resolution{1, 1}));
}

TEST(ExportRegion, TallRegionKeepsLongerSideAtImageSize)
{
    ExportSettings e;
    e.xmin = 0.0; e.xmax = 1e-6;
    e.ymin = 0.0; e.ymax = 1.0;
    e.image_size = 1024;
    EXPECT_EQ(export_resolution(e), (Resolution{1, 1024}));

    e.xmax = 0.5;
    EXPECT_EQ(export_resolution(e), (Resolution{512, 1024}));
}

TEST(ExportRegion, ExtremeAspectStaysWithinLimits)
{
    ExportSettings e;
    e.xmin = 0.0; e.xmax = 1.0;
    e.ymin = 0.0; e.ymax = 1e-9;
    e.image_size = SETTINGS_MAX_IMAGE_SIZE;
    EXPECT_EQ(export_resolution(e), (Resolution{SETTINGS_MAX_IMAGE_SIZE, 1}));

    // Unclamped settings still cannot exceed the maximum side
    e.image_size = 1 << 30;
    EXPECT_EQ(export_resolution(e).w, SETTINGS_MAX_IMAGE_SIZE);
}

TEST(ExportRegion, NarrowRegionRendersWithoutBlowingUp)
{
    Settings s;
    s.exports.xmin = 0.0; s.exports.xmax = 0.001;
    s.exports.ymin = 0.0; s.exports.ymax = 1.0;
    s.exports.image_size = 2048;
    s.mandelbrot.depth   = 8;

    DepthField depth;
    render_export_region(s, depth);
    EXPECT_EQ(depth.width, 2);
    EXPECT_EQ(depth.height, 2048);
}

TEST(ExportRegion, FileNameUsesTimestamp)
{
    EXPECT_EQ(export_file_path("", 1700000000, "png"), "1700000000_mandelbrot.png");
    EXPECT_EQ(export_file_path("renders", 42, "npy"),
              (fs::path("renders") / "42_mandelbrot.npy").string());
}

TEST(ExportRegion, DepthFieldMatchesEvaluator)
{
    Settings s;
    s.exports.image_size = 48;
    s.mandelbrot.depth   = 40;
    s.render.threads     = 3;

    DepthField depth;
    const double ms = render_export_region(s, depth);
    EXPECT_GE(ms, 0.0);
    ASSERT_EQ(depth.width, 48);
    ASSERT_EQ(depth.height, 48);

    const ExportSettings& e = s.exports;
    for (int y = 0; y < depth.height; ++y) {
        const double im = map_range(y + 0.5, 0.0, depth.height, e.ymax, e.ymin);
        for (int x = 0; x < depth.width; ++x) {
            const double re = map_range(x + 0.5, 0.0, depth.width, e.xmin, e.xmax);
            ASSERT_EQ(depth.at(x, y), escape_depth(re, im, 40)) << x << "," << y;
        }
    }
}

TEST(ExportRegion, ImageIsContinuousGray)
{
    Settings s;
    s.exports.image_size = 96;
    s.mandelbrot.depth   = 64;

    DepthField depth;
    render_export_region(s, depth);
    PixelBuffer image;
    depth_to_image(depth, false, image);

    bool has_mid_gray = false;
    for (uint32_t px : image.pixels) {
        const uint32_t r = px & 0xFFu;
        EXPECT_EQ((px >> 8) & 0xFFu, r);
        EXPECT_EQ((px >> 16) & 0xFFu, r);
        if (r != 0 && r != 255) has_mid_gray = true;
    }
    EXPECT_TRUE(has_mid_gray);
}

TEST(ExportRegion, DepthToImageScalesAndInverts)
{
    DepthField depth;
    depth.resize(3, 1);
    depth.values = {0.0, 0.5, 1.0};

    PixelBuffer plain, inverted;
    depth_to_image(depth, false, plain);
    depth_to_image(depth, true, inverted);

    EXPECT_EQ(plain.at(0, 0) & 0xFFu, 0u);
    EXPECT_EQ(plain.at(1, 0) & 0xFFu, 128u);
    EXPECT_EQ(plain.at(2, 0) & 0xFFu, 255u);
    EXPECT_EQ(inverted.at(0, 0) & 0xFFu, 255u);
    EXPECT_EQ(inverted.at(2, 0) & 0xFFu, 0u);
    EXPECT_EQ(plain.at(2, 0) >> 24, 0xFFu);
}

TEST(ExportRegion, RawDepthIsWrittenAsNpy)
{
    DepthField depth;
    depth.resize(5, 3);
    for (std::size_t i = 0; i < depth.values.size(); ++i)
        depth.values[i] = static_cast<double>(i) / 16.0;

    const fs::path path = fs::temp_directory_path() / "fractal_cinema_depth_test.npy";
    ASSERT_EQ(export_depth_npy(path.string().c_str(), depth), "");

    const std::vector<uint8_t> bytes = read_file(path);
    ASSERT_GT(bytes.size(), 10u);
    EXPECT_EQ(bytes[0], 0x93);
    EXPECT_EQ(std::string(bytes.begin() + 1, bytes.begin() + 6), "NUMPY");
    const std::size_t hlen = bytes[8] | (std::size_t(bytes[9]) << 8);
    EXPECT_EQ((10 + hlen) % 64, 0u);
    ASSERT_EQ(bytes.size(), 10 + hlen + 15 * sizeof(double));

    const std::string header(bytes.begin() + 10, bytes.begin() + 10 + hlen);
    EXPECT_NE(header.find("'shape': (3, 5)"), std::string::npos) << header;
    EXPECT_NE(header.find("'fortran_order': False"), std::string::npos);
    EXPECT_EQ(header.back(), '\n');

    double last = 0.0;
    std::memcpy(&last, bytes.data() + bytes.size() - sizeof(double), sizeof(double));
    EXPECT_DOUBLE_EQ(last, 14.0 / 16.0);

    fs::remove(path);
}

TEST(ExportRegion, HeadlessRenderWritesIntoFolder)
{
    const fs::path dir = fs::temp_directory_path() / "fractal_cinema_cli_render_test";
    fs::remove_all(dir);

    Settings s;
    s.exports.image_size    = 24;
    s.exports.output_folder = dir.string();
    s.mandelbrot.depth      = 32;

    EXPECT_EQ(run_cli_render(s), 0);

    int pngs = 0, npys = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().extension() == ".png") ++pngs;
        if (entry.path().extension() == ".npy") ++npys;
    }
    EXPECT_EQ(pngs, 1);
    EXPECT_EQ(npys, 0);

    fs::remove_all(dir);
}

TEST(ExportRegion, HeadlessRenderWritesRawOutputWhenAsked)
{
    const fs::path dir = fs::temp_directory_path() / "fractal_cinema_cli_raw_test";
    fs::remove_all(dir);

    Settings s;
    s.exports.image_size      = 16;
    s.exports.output_folder   = dir.string();
    s.exports.with_raw_output = true;
    s.mandelbrot.depth        = 16;

    EXPECT_EQ(run_cli_render(s), 0);

    fs::path png, npy;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.path().extension() == ".png") png = entry.path();
        if (entry.path().extension() == ".npy") npy = entry.path();
    }
    ASSERT_FALSE(png.empty());
    ASSERT_FALSE(npy.empty());
    EXPECT_EQ(png.stem(), npy.stem());
    // 16 x 16 doubles after the header
    EXPECT_GT(fs::file_size(npy), 16u * 16u * sizeof(double));

    fs::remove_all(dir);
}
