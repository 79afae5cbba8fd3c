#pragma once

#include <cmath>
#include <cstdint>

// Escape radius squared: |z| > 2.
constexpr double ESCAPE_RADIUS_SQ = 4.0;

constexpr uint32_t PIXEL_INSIDE_WHITE = 0xFFFFFFFFu;
constexpr uint32_t PIXEL_BLACK        = 0xFF000000u;

struct EscapeTimeParams {
    int  max_iter = 128;
    bool invert   = true;
};

// Normalized escape depth of c = (re, im) under z -> z^2 + c, z0 = 0.
// Returns n / max_iter where n is the step whose result first leaves the
// escape radius, or 1.0 if the orbit stays bounded for max_iter steps.
// A non-positive cap runs no iterations and classifies c as inside.
inline double escape_depth(double re, double im, int max_iter)
{
    double zr = 0.0;
    double zi = 0.0;
    for (int n = 0; n < max_iter; ++n) {
        const double zr2    = zr * zr;
        const double zi2    = zi * zi;
        const double new_zr = (zr2 - zi2) + re;
        const double new_zi = (zr + zr) * zi + im;
        zr = new_zr;
        zi = new_zi;
        if (zr * zr + zi * zi > ESCAPE_RADIUS_SQ)
            return static_cast<double>(n) / static_cast<double>(max_iter);
    }
    return 1.0;
}

// Post-processing applied by the compute pass: optional inversion, then
// round half up. The result is always 0.0 or 1.0.
inline double quantize_depth(double depth, bool invert)
{
    const double d = invert ? 1.0 - depth : depth;
    return std::floor(d + 0.5);
}

// Quantized value broadcast to RGB (0xAABBGGRR).
inline uint32_t depth_to_pixel(double quantized)
{
    return quantized >= 1.0 ? PIXEL_INSIDE_WHITE : PIXEL_BLACK;
}

// Continuous depth as an opaque gray pixel, for the offline renderer.
inline uint32_t depth_to_gray(double depth)
{
    const double   d = depth < 0.0 ? 0.0 : (depth > 1.0 ? 1.0 : depth);
    const uint32_t g = static_cast<uint32_t>(std::lround(d * 255.0));
    return 0xFF000000u | (g << 16) | (g << 8) | g;
}

inline uint32_t shade_point(double re, double im, const EscapeTimeParams& p)
{
    return depth_to_pixel(quantize_depth(escape_depth(re, im, p.max_iter), p.invert));
}
