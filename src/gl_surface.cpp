#include "gl_surface.hpp"

#include <spdlog/spdlog.h>

void GlTex::ensure(int nw, int nh, FilterMode nf)
{
    if (nw == w && nh == h && nf == filter && id != 0) return;
    if (id) glDeleteTextures(1, &id);

    const GLint gl_filter = (nf == FilterMode::Linear) ? GL_LINEAR : GL_NEAREST;
    glGenTextures(1, &id);
    glBindTexture(GL_TEXTURE_2D, id);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, gl_filter);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, gl_filter);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, nw, nh, 0,
                 GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
    w = nw; h = nh; filter = nf;

    spdlog::debug("gl: texture {} = ({}, {}), filter = {}", id, nw, nh, filter_name(nf));
}

void GlTex::upload(const PixelBuffer& buf)
{
    glBindTexture(GL_TEXTURE_2D, id);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, buf.width, buf.height,
                    GL_RGBA, GL_UNSIGNED_BYTE, buf.pixels.data());
}

void GlSurface::composite(const RenderTarget& target)
{
    tex.ensure(target.pixels.width, target.pixels.height, target.filter);
    tex.upload(target.pixels);
    draw_fullscreen();
}

void GlSurface::blit(const PixelBuffer& buf)
{
    tex.ensure(buf.width, buf.height, FilterMode::Nearest);
    tex.upload(buf);
    draw_fullscreen();
}

void GlSurface::draw_fullscreen()
{
    // uv (0,0) is the first uploaded row, which is the top of the field
    ImGui::GetBackgroundDrawList()->AddImage(
        tex.imgui_id(), ImVec2(0.0f, 0.0f), ImVec2(display_w, display_h),
        ImVec2(0.0f, 0.0f), ImVec2(1.0f, 1.0f));
}
