#pragma once

#include "renderer.hpp"

#include <algorithm>
#include <cmath>

enum class FilterMode {
    Nearest = 0,
    Linear  = 1,
};

inline const char* filter_name(FilterMode f)
{
    return f == FilterMode::Linear ? "linear" : "nearest";
}

struct FramebufferConfig {
    bool enable    = false;
    int  size      = 256;    // longer axis of the offscreen buffer, pixels
    bool antialias = true;   // linear upsampling when true
};

inline bool operator==(const FramebufferConfig& a, const FramebufferConfig& b)
{
    return a.enable == b.enable && a.size == b.size && a.antialias == b.antialias;
}
inline bool operator!=(const FramebufferConfig& a, const FramebufferConfig& b) { return !(a == b); }

// Offscreen compute buffer. Never resized in place: a config or display
// change builds a new one.
struct RenderTarget {
    PixelBuffer pixels;
    FilterMode  filter     = FilterMode::Nearest;
    int         generation = 0;
};

// Offscreen size for a target dimension and a display aspect ratio. The
// longer display axis gets target_size; both sides are floored and
// clamped to at least one pixel.
inline Resolution offscreen_resolution(int target_size, double aspect)
{
    double w, h;
    if (aspect > 1.0) {
        w = target_size;
        h = target_size / aspect;
    } else {
        w = target_size * aspect;
        h = target_size;
    }
    return {std::max(1, static_cast<int>(std::floor(w))),
            std::max(1, static_cast<int>(std::floor(h)))};
}
