#pragma once

#include "display_surface.hpp"
#include "render_target.hpp"
#include "renderer.hpp"

#include <memory>

// Two-pass frame renderer.
//
// With the offscreen buffer enabled, the compute pass fills a RenderTarget
// whose size follows FramebufferConfig::size and the display aspect, and
// the composite pass upsamples it onto the display. Disabled, the compute
// pass runs at display resolution and the result is blitted directly.
//
// The pipeline exclusively owns the RenderTarget and replaces it on every
// display resize or framebuffer config change.
class RenderPipeline {
public:
    RenderPipeline(IFieldRenderer& field, IDisplaySurface& surface,
                   const FramebufferConfig& config = FramebufferConfig{});

    // Non-positive sizes are ignored.
    void resize(int display_w, int display_h);

    // Reprovisions only if the config actually changed.
    void configure(const FramebufferConfig& config);

    // Size of the buffer the next compute pass will fill.
    Resolution compute_resolution() const;

    void render(const UniformSnapshot& u);

    const FramebufferConfig& config()       const { return cfg; }
    Resolution               display_size() const { return display; }
    // nullptr while the offscreen buffer is disabled
    const RenderTarget*      target()       const { return offscreen.get(); }
    // Buffer written by the most recent compute pass
    const PixelBuffer&       last_output()  const;

private:
    void provision();

    IFieldRenderer&               field;
    IDisplaySurface&              surface;
    FramebufferConfig             cfg;
    Resolution                    display;
    std::unique_ptr<RenderTarget> offscreen;
    PixelBuffer                   direct;   // single-pass buffer
    int                           generation = 0;
};
