#pragma once

#include "escape_time.hpp"
#include "render_target.hpp"

#include <string>

struct MandelbrotSettings {
    int    depth       = 128;
    double zoom_factor = 1.4142;   // parsed and shown, not wired to any input
    bool   invert      = true;
};

struct DebugSettings {
    bool log = false;
};

struct GuiSettings {
    bool enable = false;
};

struct RenderSettings {
    int threads = 0;   // 0 = hardware concurrency
};

// Region and output for the headless --render mode
struct ExportSettings {
    double      xmin            = -2.0;
    double      xmax            =  1.0;
    double      ymin            = -1.5;
    double      ymax            =  1.5;
    int         image_size      = 1024;   // longer side of the image, pixels
    std::string output_folder;
    std::string filetype        = "png";
    bool        with_raw_output = false;  // also write the depth plane as .npy
};

struct Settings {
    FramebufferConfig  framebuffer;
    MandelbrotSettings mandelbrot;
    DebugSettings      debug;
    GuiSettings        gui;
    RenderSettings     render;
    ExportSettings     exports;
};

constexpr int SETTINGS_MAX_DEPTH       = 8192;
constexpr int SETTINGS_MAX_FB_SIZE     = 8192;
constexpr int SETTINGS_MAX_IMAGE_SIZE  = 16384;

inline EscapeTimeParams escape_params(const Settings& s)
{
    return {s.mandelbrot.depth, s.mandelbrot.invert};
}

// Clamp every numeric option into its valid range.
void clamp_settings(Settings& s);

// Load a YAML file over the defaults already in `out`.
// Returns empty string on success, or an error message on failure; `out` is
// left untouched on failure.
std::string load_settings(const char* path, Settings& out);

// Same, from YAML text.
std::string parse_settings(const std::string& yaml, Settings& out);

// Apply one "dotted.key=value" override (e.g. "framebuffer.size=512").
// Returns empty string on success, or an error message on failure.
std::string apply_setting_override(const std::string& assignment, Settings& out);
