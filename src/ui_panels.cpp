#include "ui_panels.hpp"
#include "app_state.hpp"
#include "export.hpp"
#include "imgui.h"

#include <algorithm>

static const float PANEL_WIDTH   = 300.0f;
static const float STATUS_HEIGHT = 24.0f;

// ---------------------------------------------------------------------------
// Control panel: framebuffer, viewport, mandelbrot
// ---------------------------------------------------------------------------
void draw_control_panel(AppState& app)
{
    Settings s       = app.driver.settings();
    bool     changed = false;

    ImGui::SetNextWindowPos(ImVec2(8.0f, 8.0f), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(PANEL_WIDTH, 0.0f), ImGuiCond_FirstUseEver);
    bool open = true;
    ImGui::Begin("Controls", &open, ImGuiWindowFlags_AlwaysAutoResize);

    // --- Settings ---
    if (ImGui::CollapsingHeader("Settings")) {
        changed |= ImGui::Checkbox("Offscreen buffer", &s.framebuffer.enable);
        ImGui::SetNextItemWidth(-1.0f);
        changed |= ImGui::SliderInt("##fbsize", &s.framebuffer.size, 16, 2048, "size %d",
                                    ImGuiSliderFlags_Logarithmic);
        changed |= ImGui::Checkbox("Antialias", &s.framebuffer.antialias);
        changed |= ImGui::Checkbox("Debug output", &s.debug.log);
    }

    // --- Viewport ---
    if (ImGui::CollapsingHeader("Viewport", ImGuiTreeNodeFlags_DefaultOpen)) {
        Vec2 c = app.viewport.center();
        ImGui::SetNextItemWidth(-1.0f);
        bool moved = ImGui::DragScalar("##cx", ImGuiDataType_Double, &c.x, 0.01f,
                                       nullptr, nullptr, "x %.8f");
        ImGui::SetNextItemWidth(-1.0f);
        moved |= ImGui::DragScalar("##cy", ImGuiDataType_Double, &c.y, 0.01f,
                                   nullptr, nullptr, "y %.8f");
        if (moved)
            app.viewport.set_plane_center(c);

        static const double size_min = 0.0001, size_max = 2.0;
        double size = app.viewport.size();
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::SliderScalar("##size", ImGuiDataType_Double, &size,
                                &size_min, &size_max, "size %.6f",
                                ImGuiSliderFlags_Logarithmic))
            app.viewport.set_size(std::max(size, size_min), false);

        if (ImGui::Button("Reset view (R)"))
            app.input.reset_view();
    }

    // --- Mandelbrot ---
    if (ImGui::CollapsingHeader("Mandelbrot", ImGuiTreeNodeFlags_DefaultOpen)) {
        ImGui::SetNextItemWidth(-1.0f);
        changed |= ImGui::SliderInt("##depth", &s.mandelbrot.depth, 1, 1000, "depth %d");
        static const double zf_min = 0.0, zf_max = 2.0;
        ImGui::SetNextItemWidth(-1.0f);
        changed |= ImGui::SliderScalar("##zf", ImGuiDataType_Double, &s.mandelbrot.zoom_factor,
                                       &zf_min, &zf_max, "zoom factor %.4f");
        changed |= ImGui::Checkbox("Invert", &s.mandelbrot.invert);
    }

    ImGui::Spacing();
    if (ImGui::Button("Export PNG (Ctrl+S)"))
        export_current_frame(app);
    if (!app.export_msg.empty())
        ImGui::TextWrapped("%s", app.export_msg.c_str());

    ImGui::End();

    if (!open) {
        s.gui.enable = false;
        changed = true;
    }
    if (changed)
        app.driver.set_settings(s);
}

// ---------------------------------------------------------------------------
// Status bar
// ---------------------------------------------------------------------------
void draw_status_bar(AppState& app, float fw, float fh)
{
    const Settings&  s   = app.driver.settings();
    const Resolution res = app.pipeline.compute_resolution();

    ImGui::SetNextWindowPos(ImVec2(0.0f, fh - STATUS_HEIGHT));
    ImGui::SetNextWindowSize(ImVec2(fw, STATUS_HEIGHT));
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(6.0f, 4.0f));
    ImGui::Begin("##status", nullptr,
        ImGuiWindowFlags_NoTitleBar            |
        ImGuiWindowFlags_NoResize              |
        ImGuiWindowFlags_NoMove                |
        ImGuiWindowFlags_NoBringToFrontOnFocus |
        ImGuiWindowFlags_NoScrollbar           |
        ImGuiWindowFlags_NoInputs);
    ImGui::PopStyleVar();
    ImGui::Text("x: %.8f   y: %.8f   size: %.6g   depth: %d   %dx%d   %.1f ms  [%s  %dt]",
                app.viewport.center().x, app.viewport.center().y, app.viewport.size(),
                s.mandelbrot.depth, res.w, res.h,
                app.renderer.last_render_ms,
                app.renderer.avx_active ? "AVX" : "scalar",
                app.renderer.thread_count);
    ImGui::End();
}
