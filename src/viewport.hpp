#pragma once

#include "math_utils.hpp"

// Smallest size the viewport may shrink to. Zooming past it clamps.
constexpr double VIEWPORT_MIN_SIZE = 1e-12;

constexpr double VIEWPORT_DEFAULT_SIZE = 2.0;

// Region of the complex plane mapped onto the display.
//
// The view is described by its center and the plane-space length of the
// shorter display axis. The longer axis is stretched by the aspect ratio so
// squares stay square. min/max are always derived; there is no way to set
// them directly.
class Viewport {
public:
    Viewport();

    // relative: point is a screen-space delta (fractions of display
    // width/height) and the center moves by delta * current extent, with
    // the y axis flipped. Otherwise point is a normalized [0,1]^2 screen
    // position that becomes the new center.
    void set_center(Vec2 point, bool relative);

    // Moves the center to a plane-space point (control panel edits).
    void set_plane_center(Vec2 c);

    // relative: value is added to the current size. The result is clamped
    // to VIEWPORT_MIN_SIZE.
    void set_size(double value, bool relative);

    // Aspect ratio is width / height. Non-positive dimensions are ignored.
    void set_display_size(int width, int height);
    void set_aspect_ratio(double ratio);

    void reset();

    // Derives min/max from center, size and aspect ratio. Every mutator
    // calls it.
    void recompute_bounds();

    Vec2   center()       const { return center_; }
    double size()         const { return size_; }
    double aspect_ratio() const { return aspect_; }
    Vec2   min()          const { return min_; }
    Vec2   max()          const { return max_; }
    double width()        const { return max_.x - min_.x; }
    double height()       const { return max_.y - min_.y; }

private:
    Vec2   center_;
    double size_   = VIEWPORT_DEFAULT_SIZE;
    double aspect_ = 1.0;
    Vec2   min_;
    Vec2   max_;
};
