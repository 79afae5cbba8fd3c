#pragma once

#include "cpu_renderer.hpp"
#include "frame_driver.hpp"
#include "gl_surface.hpp"
#include "input_controller.hpp"
#include "render_pipeline.hpp"
#include "settings.hpp"
#include "viewport.hpp"

#include <string>

// ---------------------------------------------------------------------------
// All mutable application state. Members are declared in dependency order;
// the pipeline and driver hold references to the ones above them.
// ---------------------------------------------------------------------------
struct AppState {
    explicit AppState(const Settings& s)
        : renderer(s.render.threads),
          pipeline(renderer, surface, s.framebuffer),
          driver(viewport, input, pipeline, s, [this] { frame_requested = true; })
    {
    }

    Viewport        viewport;
    InputController input;
    CpuRenderer     renderer;
    GlSurface       surface;
    RenderPipeline  pipeline;
    FrameDriver     driver;

    bool frame_requested = true;   // set by the driver after each tick

    // Export feedback shown in the panel
    std::string export_msg;
};

// Writes the last compute buffer to fractal_cinema_<timestamp>.png and
// records the outcome in app.export_msg.
void export_current_frame(AppState& app);
