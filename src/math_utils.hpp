#pragma once

// Plane-space / screen-space 2D vector.
struct Vec2 {
    double x = 0.0;
    double y = 0.0;
};

inline Vec2 operator+(Vec2 a, Vec2 b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(Vec2 a, Vec2 b) { return {a.x - b.x, a.y - b.y}; }
inline Vec2 operator*(Vec2 a, double s) { return {a.x * s, a.y * s}; }
inline Vec2 operator*(double s, Vec2 a) { return {a.x * s, a.y * s}; }

// Affine map of src from [src_min, src_max] onto [dst_min, dst_max].
// dst_min > dst_max is allowed (flips the axis).
inline double map_range(double src, double src_min, double src_max,
                        double dst_min, double dst_max)
{
    return (src - src_min) / (src_max - src_min) * (dst_max - dst_min) + dst_min;
}
