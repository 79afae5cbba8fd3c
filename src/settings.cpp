#include "settings.hpp"

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

// ---------------------------------------------------------------------------
// Known keys, "section.key". Anything else in a file is warned about; an
// override naming anything else is rejected.
// ---------------------------------------------------------------------------
static const char* const KNOWN_KEYS[] = {
    "framebuffer.enable",
    "framebuffer.size",
    "framebuffer.antialias",
    "mandelbrot.depth",
    "mandelbrot.zoomFactor",
    "mandelbrot.zoom_factor",
    "mandelbrot.invert",
    "debug.log",
    "gui.enable",
    "render.threads",
    "export.xmin",
    "export.xmax",
    "export.ymin",
    "export.ymax",
    "export.image_size",
    "export.output_folder",
    "export.filetype",
    "export.with_raw_output",
};

static bool is_known_key(const std::string& dotted)
{
    return std::any_of(std::begin(KNOWN_KEYS), std::end(KNOWN_KEYS),
                       [&](const char* k) { return dotted == k; });
}

template<typename T>
static void read_key(const YAML::Node& section, const char* key, T& dst)
{
    if (const YAML::Node n = section[key])
        dst = n.as<T>();
}

// Throws YAML::Exception on type errors.
static std::string read_document(const YAML::Node& root, Settings& s)
{
    if (!root || root.IsNull()) return {};
    if (!root.IsMap()) return "top level of the settings file must be a mapping";

    for (const auto& sec : root) {
        const std::string sec_name = sec.first.as<std::string>();
        if (!sec.second.IsMap()) {
            spdlog::warn("settings: ignoring non-mapping section '{}'", sec_name);
            continue;
        }
        for (const auto& kv : sec.second) {
            const std::string dotted = sec_name + "." + kv.first.as<std::string>();
            if (!is_known_key(dotted))
                spdlog::warn("settings: unknown option '{}'", dotted);
        }
    }

    if (const YAML::Node fb = root["framebuffer"]; fb && fb.IsMap()) {
        read_key(fb, "enable",    s.framebuffer.enable);
        read_key(fb, "size",      s.framebuffer.size);
        read_key(fb, "antialias", s.framebuffer.antialias);
    }
    if (const YAML::Node m = root["mandelbrot"]; m && m.IsMap()) {
        read_key(m, "depth",       s.mandelbrot.depth);
        read_key(m, "zoom_factor", s.mandelbrot.zoom_factor);
        read_key(m, "zoomFactor",  s.mandelbrot.zoom_factor);
        read_key(m, "invert",      s.mandelbrot.invert);
    }
    if (const YAML::Node d = root["debug"]; d && d.IsMap())
        read_key(d, "log", s.debug.log);
    if (const YAML::Node g = root["gui"]; g && g.IsMap())
        read_key(g, "enable", s.gui.enable);
    if (const YAML::Node r = root["render"]; r && r.IsMap())
        read_key(r, "threads", s.render.threads);
    if (const YAML::Node e = root["export"]; e && e.IsMap()) {
        read_key(e, "xmin",            s.exports.xmin);
        read_key(e, "xmax",            s.exports.xmax);
        read_key(e, "ymin",            s.exports.ymin);
        read_key(e, "ymax",            s.exports.ymax);
        read_key(e, "image_size",      s.exports.image_size);
        read_key(e, "output_folder",   s.exports.output_folder);
        read_key(e, "filetype",        s.exports.filetype);
        read_key(e, "with_raw_output", s.exports.with_raw_output);
    }

    if (s.exports.filetype != "png" && s.exports.filetype != "jxl")
        return "export.filetype must be 'png' or 'jxl', got '" + s.exports.filetype + "'";
    if (!(s.exports.xmin < s.exports.xmax) || !(s.exports.ymin < s.exports.ymax))
        return "export region is empty (need xmin < xmax and ymin < ymax)";

    clamp_settings(s);
    return {};
}

void clamp_settings(Settings& s)
{
    s.framebuffer.size    = std::clamp(s.framebuffer.size, 1, SETTINGS_MAX_FB_SIZE);
    s.mandelbrot.depth    = std::clamp(s.mandelbrot.depth, 1, SETTINGS_MAX_DEPTH);
    s.render.threads      = std::max(0, s.render.threads);
    s.exports.image_size  = std::clamp(s.exports.image_size, 1, SETTINGS_MAX_IMAGE_SIZE);
}

std::string parse_settings(const std::string& yaml, Settings& out)
{
    Settings next = out;
    try {
        const std::string err = read_document(YAML::Load(yaml), next);
        if (!err.empty()) return err;
    } catch (const YAML::Exception& e) {
        return std::string("YAML error: ") + e.what();
    }
    out = next;
    return {};
}

std::string load_settings(const char* path, Settings& out)
{
    std::ifstream in(path);
    if (!in)
        return std::string("Cannot open settings file: ") + path;
    std::stringstream ss;
    ss << in.rdbuf();

    const std::string err = parse_settings(ss.str(), out);
    if (!err.empty())
        return std::string(path) + ": " + err;
    return {};
}

std::string apply_setting_override(const std::string& assignment, Settings& out)
{
    const std::size_t eq = assignment.find('=');
    if (eq == std::string::npos)
        return "override must look like section.key=value: '" + assignment + "'";

    const std::string dotted = assignment.substr(0, eq);
    const std::string value  = assignment.substr(eq + 1);
    const std::size_t dot = dotted.find('.');
    if (dot == std::string::npos || !is_known_key(dotted))
        return "unknown option '" + dotted + "'";

    Settings next = out;
    try {
        YAML::Node root;
        root[dotted.substr(0, dot)][dotted.substr(dot + 1)] = YAML::Load(value);
        const std::string err = read_document(root, next);
        if (!err.empty()) return err;
    } catch (const YAML::Exception& e) {
        return "bad value for '" + dotted + "': " + e.what();
    }
    out = next;
    return {};
}
