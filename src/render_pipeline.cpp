#include "render_pipeline.hpp"

#include <spdlog/spdlog.h>

RenderPipeline::RenderPipeline(IFieldRenderer& field, IDisplaySurface& surface,
                               const FramebufferConfig& config)
    : field(field), surface(surface), cfg(config)
{
}

void RenderPipeline::resize(int display_w, int display_h)
{
    if (display_w <= 0 || display_h <= 0) return;
    display = {display_w, display_h};
    provision();
}

void RenderPipeline::configure(const FramebufferConfig& config)
{
    if (config == cfg) return;
    cfg = config;
    provision();
}

// -----------------------------------------------------------------------
// (Re)create the compute buffer for the current display + config
// -----------------------------------------------------------------------
void RenderPipeline::provision()
{
    if (display.w <= 0 || display.h <= 0) return;

    if (!cfg.enable) {
        offscreen.reset();
        direct.resize(display.w, display.h);
        spdlog::debug("pipeline: single pass at display resolution {}x{}",
                      display.w, display.h);
        return;
    }

    const double aspect = static_cast<double>(display.w) / static_cast<double>(display.h);
    const Resolution res = offscreen_resolution(cfg.size, aspect);

    auto next = std::make_unique<RenderTarget>();
    next->pixels.resize(res.w, res.h);
    next->filter     = cfg.antialias ? FilterMode::Linear : FilterMode::Nearest;
    next->generation = ++generation;
    offscreen = std::move(next);

    // The direct buffer is dead weight in two-pass mode
    direct = PixelBuffer{};

    spdlog::debug("pipeline: offscreen target #{} = ({}, {}), filter = {}, ratio = {:.4f}",
                  offscreen->generation, res.w, res.h,
                  filter_name(offscreen->filter), aspect);
}

Resolution RenderPipeline::compute_resolution() const
{
    if (cfg.enable)
        return offscreen ? Resolution{offscreen->pixels.width, offscreen->pixels.height}
                         : Resolution{};
    return display;
}

const PixelBuffer& RenderPipeline::last_output() const
{
    return offscreen ? offscreen->pixels : direct;
}

void RenderPipeline::render(const UniformSnapshot& u)
{
    if (display.w <= 0 || display.h <= 0) return;

    if (cfg.enable) {
        if (!offscreen) return;
        field.render(u, offscreen->pixels);
        surface.composite(*offscreen);
    } else {
        field.render(u, direct);
        surface.blit(direct);
    }
}
