#include "cli_render.hpp"
#include "cpu_renderer.hpp"
#include "escape_time.hpp"
#include "export.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <filesystem>
#include <system_error>

// Floors v and clamps it to [1, SETTINGS_MAX_IMAGE_SIZE] before the cast.
// NaN ends up at 1.
static int image_side(double v)
{
    const double f = std::floor(v);
    if (!(f >= 1.0)) return 1;
    if (f >= SETTINGS_MAX_IMAGE_SIZE) return SETTINGS_MAX_IMAGE_SIZE;
    return static_cast<int>(f);
}

Resolution export_resolution(const ExportSettings& e)
{
    const double aspect = (e.xmax - e.xmin) / (e.ymax - e.ymin);
    const double side   = image_side(e.image_size);
    if (aspect >= 1.0)
        return {image_side(side), image_side(side / aspect)};
    return {image_side(side * aspect), image_side(side)};
}

std::string export_file_path(const std::string& folder, std::time_t timestamp,
                             const std::string& ext)
{
    const std::string filename =
        std::to_string(static_cast<long long>(timestamp)) + "_mandelbrot." + ext;
    if (folder.empty())
        return filename;
    return (std::filesystem::path(folder) / filename).string();
}

double render_export_region(const Settings& s, DepthField& depth)
{
    const Resolution res = export_resolution(s.exports);
    depth.resize(res.w, res.h);

    UniformSnapshot u;
    u.resolution = res;
    u.view_min   = {s.exports.xmin, s.exports.ymin};
    u.view_max   = {s.exports.xmax, s.exports.ymax};
    u.max_iter   = s.mandelbrot.depth;
    u.invert     = s.mandelbrot.invert;

    CpuRenderer renderer(s.render.threads);
    renderer.render_depth(u, depth);
    return renderer.last_render_ms;
}

void depth_to_image(const DepthField& depth, bool invert, PixelBuffer& buf)
{
    buf.resize(depth.width, depth.height);
    for (std::size_t i = 0; i < depth.values.size(); ++i) {
        const double d = depth.values[i];
        buf.pixels[i]  = depth_to_gray(invert ? 1.0 - d : d);
    }
}

int run_cli_render(const Settings& s)
{
    const ExportSettings& e   = s.exports;
    const Resolution      res = export_resolution(e);

    spdlog::info("=== Fractal Cinema ===");
    spdlog::info("(xmin, ymin) - (xmax, ymax) = ({}, {}) - ({}, {})",
                 e.xmin, e.ymin, e.xmax, e.ymax);
    spdlog::info("depth: {}, invert: {}", s.mandelbrot.depth, s.mandelbrot.invert);
    spdlog::info("image size: {}x{}", res.w, res.h);

    if (!e.output_folder.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(e.output_folder, ec);
        if (ec) {
            spdlog::error("Cannot create output folder {}: {}", e.output_folder, ec.message());
            return 1;
        }
    }

    DepthField depth;
    const double ms = render_export_region(s, depth);

    PixelBuffer image;
    depth_to_image(depth, s.mandelbrot.invert, image);

    const std::time_t timestamp = std::time(nullptr);
    const std::string path      = export_file_path(e.output_folder, timestamp, e.filetype);
    spdlog::info("Writing image to {}", path);
    std::string err = export_image(path.c_str(), image, e.filetype);
    if (!err.empty()) {
        spdlog::error("{}", err);
        return 1;
    }

    if (e.with_raw_output) {
        const std::string raw_path = export_file_path(e.output_folder, timestamp, "npy");
        spdlog::info("Writing data to {}", raw_path);
        err = export_depth_npy(raw_path.c_str(), depth);
        if (!err.empty()) {
            spdlog::error("{}", err);
            return 1;
        }
    }

    spdlog::info("Computational time: {:.1f} ms", ms);
    return 0;
}
