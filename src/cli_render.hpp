#pragma once

#include "renderer.hpp"
#include "settings.hpp"

#include <ctime>
#include <string>

// Output size for the export region. The longer side is image_size and the
// other follows the region's aspect ratio. Both sides are clamped to
// [1, SETTINGS_MAX_IMAGE_SIZE].
Resolution export_resolution(const ExportSettings& e);

// "<folder>/<timestamp>_mandelbrot.<ext>" (no folder prefix when the folder
// is empty).
std::string export_file_path(const std::string& folder, std::time_t timestamp,
                             const std::string& ext);

// Raw escape depth of the configured export region. Returns the compute
// time in ms.
double render_export_region(const Settings& s, DepthField& depth);

// Continuous grayscale image of a depth field; invert maps d to 1 - d.
void depth_to_image(const DepthField& depth, bool invert, PixelBuffer& buf);

// Headless --render entry point. Returns the process exit code.
int run_cli_render(const Settings& s);
