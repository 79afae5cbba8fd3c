#include "viewport.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

Viewport::Viewport()
{
    recompute_bounds();
}

void Viewport::set_center(Vec2 point, bool relative)
{
    if (relative) {
        // Screen y grows downward, plane y grows upward.
        center_.x -= point.x * width();
        center_.y += point.y * height();
    } else {
        center_.x = map_range(point.x, 0.0, 1.0, min_.x, max_.x);
        center_.y = map_range(point.y, 0.0, 1.0, max_.y, min_.y);
    }
    recompute_bounds();
}

void Viewport::set_plane_center(Vec2 c)
{
    center_ = c;
    recompute_bounds();
}

void Viewport::set_size(double value, bool relative)
{
    const double next = relative ? size_ + value : value;
    // Also catches NaN.
    if (!(next > VIEWPORT_MIN_SIZE)) {
        spdlog::debug("viewport: size {} clamped to {}", next, VIEWPORT_MIN_SIZE);
        size_ = VIEWPORT_MIN_SIZE;
    } else {
        size_ = next;
    }
    recompute_bounds();
}

void Viewport::set_display_size(int width, int height)
{
    if (width <= 0 || height <= 0) return;
    set_aspect_ratio(static_cast<double>(width) / static_cast<double>(height));
}

void Viewport::set_aspect_ratio(double ratio)
{
    if (!(ratio > 0.0)) return;
    aspect_ = ratio;
    recompute_bounds();
}

void Viewport::reset()
{
    center_ = Vec2{};
    size_   = VIEWPORT_DEFAULT_SIZE;
    recompute_bounds();
}

void Viewport::recompute_bounds()
{
    const Vec2 axis_scale = (aspect_ > 1.0) ? Vec2{aspect_, 1.0}
                                            : Vec2{1.0, 1.0 / aspect_};
    const Vec2 half{0.5 * size_ * axis_scale.x, 0.5 * size_ * axis_scale.y};
    min_ = center_ - half;
    max_ = center_ + half;

    spdlog::debug("viewport: center=({:.17g}, {:.17g}) size={:.6g} ratio={:.4f} "
                  "min=({:.6g}, {:.6g}) max=({:.6g}, {:.6g})",
                  center_.x, center_.y, size_, aspect_,
                  min_.x, min_.y, max_.x, max_.y);
}
