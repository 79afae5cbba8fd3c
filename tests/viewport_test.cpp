#include "viewport.hpp"

#include <gtest/gtest.h>

#include <cmath>

TEST(Viewport, DefaultsToUnitSquareAroundOrigin)
{
    Viewport vp;
    EXPECT_DOUBLE_EQ(vp.size(), 2.0);
    EXPECT_DOUBLE_EQ(vp.aspect_ratio(), 1.0);
    EXPECT_DOUBLE_EQ(vp.min().x, -1.0);
    EXPECT_DOUBLE_EQ(vp.min().y, -1.0);
    EXPECT_DOUBLE_EQ(vp.max().x,  1.0);
    EXPECT_DOUBLE_EQ(vp.max().y,  1.0);
}

TEST(Viewport, WideDisplayStretchesHorizontalAxis)
{
    Viewport vp;
    vp.set_display_size(800, 600);

    EXPECT_NEAR(vp.aspect_ratio(), 4.0 / 3.0, 1e-15);
    EXPECT_NEAR(vp.min().x, -4.0 / 3.0, 1e-12);
    EXPECT_NEAR(vp.max().x,  4.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(vp.min().y, -1.0);
    EXPECT_DOUBLE_EQ(vp.max().y,  1.0);
}

TEST(Viewport, TallDisplayStretchesVerticalAxis)
{
    Viewport vp;
    vp.set_display_size(300, 600);

    EXPECT_DOUBLE_EQ(vp.min().x, -1.0);
    EXPECT_DOUBLE_EQ(vp.max().x,  1.0);
    EXPECT_DOUBLE_EQ(vp.min().y, -2.0);
    EXPECT_DOUBLE_EQ(vp.max().y,  2.0);
}

TEST(Viewport, BoundsStayCenteredOnCenter)
{
    Viewport vp;
    vp.set_display_size(1920, 1080);
    vp.set_plane_center({-0.75, 0.1});
    vp.set_size(0.5, false);

    const double mid_x = 0.5 * (vp.min().x + vp.max().x);
    const double mid_y = 0.5 * (vp.min().y + vp.max().y);
    EXPECT_NEAR(mid_x, -0.75, 1e-12);
    EXPECT_NEAR(mid_y,  0.1,  1e-12);
    // Shorter axis spans exactly size
    EXPECT_NEAR(vp.height(), 0.5, 1e-12);
    EXPECT_NEAR(vp.width() / vp.height(), 1920.0 / 1080.0, 1e-12);
}

TEST(Viewport, RelativePanMovesAgainstDragAndFlipsY)
{
    Viewport vp;
    vp.set_display_size(800, 600);
    const double w = vp.width();
    const double h = vp.height();

    vp.set_center({0.1, 0.0}, true);
    EXPECT_NEAR(vp.center().x, -0.1 * w, 1e-12);
    EXPECT_NEAR(vp.center().y, 0.0, 1e-12);

    vp.set_center({0.0, 0.25}, true);
    EXPECT_NEAR(vp.center().y, 0.25 * h, 1e-12);
}

TEST(Viewport, RelativePanIsAdditive)
{
    Viewport a, b;
    a.set_center({0.05, -0.02}, true);
    a.set_center({0.05, -0.02}, true);
    b.set_center({0.10, -0.04}, true);

    EXPECT_NEAR(a.center().x, b.center().x, 1e-12);
    EXPECT_NEAR(a.center().y, b.center().y, 1e-12);
}

TEST(Viewport, AbsoluteCenterMapsScreenToPlane)
{
    Viewport vp;
    // Screen top-left is plane (min.x, max.y)
    vp.set_center({0.0, 0.0}, false);
    EXPECT_DOUBLE_EQ(vp.center().x, -1.0);
    EXPECT_DOUBLE_EQ(vp.center().y,  1.0);

    vp.reset();
    vp.set_center({0.5, 0.5}, false);
    EXPECT_DOUBLE_EQ(vp.center().x, 0.0);
    EXPECT_DOUBLE_EQ(vp.center().y, 0.0);
}

TEST(Viewport, SizeIsClampedToMinimum)
{
    Viewport vp;
    vp.set_size(-10.0, true);
    EXPECT_DOUBLE_EQ(vp.size(), VIEWPORT_MIN_SIZE);
    EXPECT_GT(vp.width(), 0.0);

    vp.set_size(0.0, false);
    EXPECT_DOUBLE_EQ(vp.size(), VIEWPORT_MIN_SIZE);

    vp.set_size(std::nan(""), false);
    EXPECT_DOUBLE_EQ(vp.size(), VIEWPORT_MIN_SIZE);
}

TEST(Viewport, RelativeSizeAddsToCurrent)
{
    Viewport vp;
    vp.set_size(0.4, true);
    EXPECT_DOUBLE_EQ(vp.size(), 2.4);
    vp.set_size(-1.4, true);
    EXPECT_NEAR(vp.size(), 1.0, 1e-15);
}

TEST(Viewport, DegenerateDisplayIsIgnored)
{
    Viewport vp;
    vp.set_display_size(800, 600);
    vp.set_display_size(0, 600);
    vp.set_display_size(800, -1);
    EXPECT_NEAR(vp.aspect_ratio(), 4.0 / 3.0, 1e-15);
}

TEST(Viewport, ResetRestoresDefaultsButKeepsAspect)
{
    Viewport vp;
    vp.set_display_size(400, 200);
    vp.set_plane_center({3.0, -2.0});
    vp.set_size(0.01, false);
    vp.reset();

    EXPECT_DOUBLE_EQ(vp.center().x, 0.0);
    EXPECT_DOUBLE_EQ(vp.center().y, 0.0);
    EXPECT_DOUBLE_EQ(vp.size(), VIEWPORT_DEFAULT_SIZE);
    EXPECT_DOUBLE_EQ(vp.aspect_ratio(), 2.0);
    EXPECT_DOUBLE_EQ(vp.max().x, 2.0);
}

TEST(MapRange, InverseMapRecoversInput)
{
    for (double x : {-2.0, -0.3, 0.0, 0.7, 1.0}) {
        const double y = map_range(x, -2.0, 1.0, 0.0, 800.0);
        EXPECT_NEAR(map_range(y, 0.0, 800.0, -2.0, 1.0), x, 1e-12);
    }
}

TEST(MapRange, ReversedDestinationFlipsAxis)
{
    EXPECT_DOUBLE_EQ(map_range(0.0, 0.0, 1.0, 1.0, -1.0),  1.0);
    EXPECT_DOUBLE_EQ(map_range(1.0, 0.0, 1.0, 1.0, -1.0), -1.0);
    EXPECT_DOUBLE_EQ(map_range(0.25, 0.0, 1.0, 1.0, -1.0), 0.5);
}
