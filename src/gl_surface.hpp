#pragma once

#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "display_surface.hpp"

#include <cstdint>

// ---------------------------------------------------------------------------
// GL texture helper
// ---------------------------------------------------------------------------
struct GlTex {
    GLuint     id     = 0;
    int        w      = 0;
    int        h      = 0;
    FilterMode filter = FilterMode::Nearest;

    GlTex() = default;
    GlTex(const GlTex&)            = delete;
    GlTex& operator=(const GlTex&) = delete;

    // Recreates the texture when size or filter changed.
    void ensure(int nw, int nh, FilterMode nf);
    void upload(const PixelBuffer& buf);

    ImTextureID imgui_id() const {
        return reinterpret_cast<ImTextureID>(static_cast<uintptr_t>(id));
    }

    ~GlTex() { if (id) glDeleteTextures(1, &id); }
};

// OpenGL display surface. Both passes end in a full-window quad on the
// ImGui background draw list, so the UI is drawn over the fractal.
class GlSurface : public IDisplaySurface {
public:
    void composite(const RenderTarget& target) override;
    void blit(const PixelBuffer& buf) override;

    // Call once per frame before rendering with the drawable size.
    void set_display_size(float w, float h) { display_w = w; display_h = h; }

private:
    void draw_fullscreen();

    GlTex tex;
    float display_w = 0.0f;
    float display_h = 0.0f;
};
