#pragma once

#include "render_target.hpp"

// Final destination of a frame.
class IDisplaySurface {
public:
    virtual ~IDisplaySurface() = default;

    // Composite pass: stretch the offscreen target over the whole display
    // using its filter mode.
    virtual void composite(const RenderTarget& target) = 0;

    // Single-pass mode: buf already has display resolution, show it 1:1.
    virtual void blit(const PixelBuffer& buf) = 0;
};
