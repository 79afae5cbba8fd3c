#include "frame_driver.hpp"
#include "input_controller.hpp"
#include "log.hpp"
#include "render_pipeline.hpp"
#include "viewport.hpp"

#include <spdlog/spdlog.h>

FrameDriver::FrameDriver(Viewport& viewport, InputController& input, RenderPipeline& pipeline,
                         const Settings& settings, std::function<void()> request_next)
    : viewport(viewport), input(input), pipeline(pipeline), cfg(settings),
      request_next(std::move(request_next))
{
}

void FrameDriver::set_settings(const Settings& s)
{
    if (s.debug.log != cfg.debug.log)
        set_debug_logging(s.debug.log);
    cfg = s;
    clamp_settings(cfg);
    settings_dirty = true;
}

UniformSnapshot FrameDriver::build_snapshot(float time) const
{
    UniformSnapshot u;
    u.time       = time;
    u.resolution = pipeline.compute_resolution();
    u.pointer    = input.pointer();
    u.view_min   = viewport.min();
    u.view_max   = viewport.max();
    u.max_iter   = cfg.mandelbrot.depth;
    u.invert     = cfg.mandelbrot.invert;
    return u;
}

bool FrameDriver::tick(int display_w, int display_h)
{
    if (stopped) return false;
    // Teardown / minimized window: nothing sensible to divide by
    if (display_w <= 0 || display_h <= 0) return false;

    st = State::Running;

    if (display.w != display_w || display.h != display_h) {
        display = {display_w, display_h};
        viewport.set_display_size(display_w, display_h);
        pipeline.resize(display_w, display_h);
    }

    if (settings_dirty) {
        pipeline.configure(cfg.framebuffer);
        settings_dirty = false;
    }

    input.apply(viewport);

    snapshot = build_snapshot(clock.tick());
    pipeline.render(snapshot);
    ++frames;

    spdlog::debug("frame {}: display = ({}, {}), compute = ({}, {}), t = {:.3f}s",
                  frames, display_w, display_h,
                  snapshot.resolution.w, snapshot.resolution.h, snapshot.time);

    if (request_next) request_next();
    return true;
}
