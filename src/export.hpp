#pragma once

#include "renderer.hpp"

#include <string>

// The compute field is grayscale (R == G == B), so images are written as
// 8-bit single-channel from the red byte.

// Returns empty string on success, or an error message on failure.
std::string export_png(const char* path, const PixelBuffer& buf);

#ifdef HAVE_JXL
std::string export_jxl(const char* path, const PixelBuffer& buf);
#endif

// True when compiled with JPEG XL support.
inline bool jxl_available()
{
#ifdef HAVE_JXL
    return true;
#else
    return false;
#endif
}

// Raw depth plane as a NumPy .npy file: float64, shape (height, width),
// C order. Returns empty string on success.
std::string export_depth_npy(const char* path, const DepthField& field);

// Writes buf as "png" or "jxl". Returns empty string on success.
std::string export_image(const char* path, const PixelBuffer& buf, const std::string& filetype);
