#include "cpu_renderer.hpp"
#include "escape_time.hpp"

#include <gtest/gtest.h>

static UniformSnapshot make_snapshot(int w, int h, Vec2 lo, Vec2 hi, bool invert)
{
    UniformSnapshot u;
    u.resolution = {w, h};
    u.view_min   = lo;
    u.view_max   = hi;
    u.max_iter   = 128;
    u.invert     = invert;
    return u;
}

TEST(CpuRenderer, OutputIsBinary)
{
    CpuRenderer r(2);
    PixelBuffer buf;
    buf.resize(97, 61);
    r.render(make_snapshot(97, 61, {-2.0, -1.25}, {0.75, 1.25}, true), buf);

    for (uint32_t px : buf.pixels)
        EXPECT_TRUE(px == PIXEL_INSIDE_WHITE || px == PIXEL_BLACK) << std::hex << px;
}

TEST(CpuRenderer, MatchesPerPixelShading)
{
    CpuRenderer r(3);
    PixelBuffer buf;
    const int W = 70, H = 45;
    buf.resize(W, H);
    const UniformSnapshot u = make_snapshot(W, H, {-2.0, -1.0}, {1.0, 1.0}, true);
    r.render(u, buf);

    const EscapeTimeParams params{u.max_iter, u.invert};
    for (int y = 0; y < H; ++y) {
        // Row 0 is the top of the view
        const double im = map_range(y + 0.5, 0.0, H, u.view_max.y, u.view_min.y);
        for (int x = 0; x < W; ++x) {
            const double re = map_range(x + 0.5, 0.0, W, u.view_min.x, u.view_max.x);
            ASSERT_EQ(buf.at(x, y), shade_point(re, im, params)) << x << "," << y;
        }
    }
}

TEST(CpuRenderer, AvxAndScalarPathsAgree)
{
    CpuRenderer r;
    const int W = 131, H = 67;
    const UniformSnapshot u = make_snapshot(W, H, {-0.8, 0.05}, {-0.7, 0.15}, false);

    PixelBuffer vec, scalar;
    vec.resize(W, H);
    scalar.resize(W, H);

    r.set_avx(true);
    r.render(u, vec);
    r.set_avx(false);
    EXPECT_FALSE(r.avx_active);
    r.render(u, scalar);

    EXPECT_EQ(vec.pixels, scalar.pixels);
}

TEST(CpuRenderer, InvertFlipsEveryPixel)
{
    CpuRenderer r(2);
    const int W = 40, H = 30;
    PixelBuffer a, b;
    a.resize(W, H);
    b.resize(W, H);

    // Entirely outside the set: every point escapes on the first step
    r.render(make_snapshot(W, H, {2.5, 2.5}, {3.5, 3.5}, true),  a);
    r.render(make_snapshot(W, H, {2.5, 2.5}, {3.5, 3.5}, false), b);
    for (std::size_t i = 0; i < a.pixels.size(); ++i) {
        EXPECT_EQ(a.pixels[i], PIXEL_INSIDE_WHITE);
        EXPECT_EQ(b.pixels[i], PIXEL_BLACK);
    }
}

TEST(CpuRenderer, InteriorIsBlackWhenInverted)
{
    CpuRenderer r(1);
    PixelBuffer buf;
    buf.resize(8, 8);
    // Small window inside the main cardioid
    r.render(make_snapshot(8, 8, {-0.2, -0.2}, {0.2, 0.2}, true), buf);
    for (uint32_t px : buf.pixels)
        EXPECT_EQ(px, PIXEL_BLACK);
}

TEST(CpuRenderer, ThreadCountDefaultsToHardware)
{
    CpuRenderer r(3);
    EXPECT_EQ(r.thread_count, 3);
    r.set_thread_count(0);
    EXPECT_EQ(r.thread_count, r.hw_concurrency);
    EXPECT_GE(r.hw_concurrency, 1);
}

TEST(CpuRenderer, EmptyBufferIsANoOp)
{
    CpuRenderer r(1);
    PixelBuffer buf;
    r.render(make_snapshot(0, 0, {-1, -1}, {1, 1}, true), buf);
    EXPECT_TRUE(buf.pixels.empty());
}

TEST(CpuRenderer, DepthPassKeepsRawDepth)
{
    CpuRenderer r(2);
    const int W = 67, H = 33;
    const UniformSnapshot u = make_snapshot(W, H, {-2.0, -1.0}, {1.0, 1.0}, true);

    DepthField vec, scalar;
    vec.resize(W, H);
    scalar.resize(W, H);
    r.set_avx(true);
    r.render_depth(u, vec);
    r.set_avx(false);
    r.render_depth(u, scalar);

    EXPECT_EQ(vec.values, scalar.values);

    bool fractional = false;
    for (double d : scalar.values) {
        EXPECT_GE(d, 0.0);
        EXPECT_LE(d, 1.0);
        if (d > 0.0 && d < 1.0) fractional = true;
    }
    EXPECT_TRUE(fractional);
}
