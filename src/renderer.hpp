#pragma once

#include "math_utils.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

// Pixel buffer: RGBA, little-endian packed as 0xAABBGGRR
struct PixelBuffer {
    std::vector<uint32_t> pixels;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        pixels.assign(static_cast<std::size_t>(w) * static_cast<std::size_t>(h), 0xFF000000u);
    }

    uint32_t at(int x, int y) const
    {
        return pixels[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)];
    }
};

// Unprocessed escape depths in [0, 1], row-major, row 0 at the top.
struct DepthField {
    std::vector<double> values;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        values.assign(static_cast<std::size_t>(w) * static_cast<std::size_t>(h), 0.0);
    }

    double at(int x, int y) const
    {
        return values[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)];
    }
};

struct Resolution {
    int w = 0;
    int h = 0;
};

inline bool operator==(Resolution a, Resolution b) { return a.w == b.w && a.h == b.h; }
inline bool operator!=(Resolution a, Resolution b) { return !(a == b); }

// Everything the compute pass reads for one frame. Built fresh every tick
// and never modified afterwards.
struct UniformSnapshot {
    float      time     = 0.0f;   // elapsed seconds
    Resolution resolution;        // compute-buffer size in pixels
    Vec2       pointer  = {0.5, 0.5};
    Vec2       view_min = {-1.0, -1.0};
    Vec2       view_max = { 1.0,  1.0};
    int        max_iter = 128;
    bool       invert   = true;
};

// Compute pass: fills buf with the escape-time field described by u.
class IFieldRenderer {
public:
    virtual ~IFieldRenderer() = default;
    virtual void render(const UniformSnapshot& u, PixelBuffer& buf) = 0;
};
