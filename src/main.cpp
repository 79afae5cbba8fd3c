#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "imgui_impl_sdl2.h"
#include "imgui_impl_opengl3.h"

#include "app_state.hpp"
#include "cli_options.hpp"
#include "cli_render.hpp"
#include "export.hpp"
#include "log.hpp"
#include "ui_panels.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <string>

// One SDL wheel notch in browser-style pixels of vertical scroll.
static const double WHEEL_NOTCH_PX = 120.0;

void export_current_frame(AppState& app)
{
    std::time_t t = std::time(nullptr);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y%m%d_%H%M%S", std::localtime(&t));
    const std::string filename = std::string("fractal_cinema_") + ts + ".png";

    const std::string err = export_png(filename.c_str(), app.pipeline.last_output());
    if (err.empty()) {
        app.export_msg = "Saved: " + filename;
        spdlog::info("Exported {}", filename);
    } else {
        app.export_msg = "Error: " + err;
        spdlog::error("Export failed: {}", err);
    }
}

// ---------------------------------------------------------------------------
// SDL event -> InputController
// ---------------------------------------------------------------------------
static void handle_event(AppState& app, const SDL_Event& event, const ImGuiIO& io,
                         int win_w, int win_h, bool& running)
{
    switch (event.type) {
        case SDL_QUIT:
            running = false;
            break;
        case SDL_WINDOWEVENT:
            if (event.window.event == SDL_WINDOWEVENT_LEAVE)
                app.input.pointer_leave();
            break;
        case SDL_MOUSEBUTTONDOWN:
            if (!io.WantCaptureMouse && event.button.button == SDL_BUTTON_LEFT)
                app.input.pointer_down(event.button.x, event.button.y, win_w, win_h);
            break;
        case SDL_MOUSEBUTTONUP:
            if (event.button.button == SDL_BUTTON_LEFT)
                app.input.pointer_up();
            break;
        case SDL_MOUSEMOTION:
            app.input.pointer_move(event.motion.x, event.motion.y, win_w, win_h);
            break;
        case SDL_MOUSEWHEEL:
            if (!io.WantCaptureMouse) {
                double notches = event.wheel.y;
                if (event.wheel.direction == SDL_MOUSEWHEEL_FLIPPED) notches = -notches;
                // Wheel toward the user (negative y) zooms out
                app.input.wheel(-notches * WHEEL_NOTCH_PX, win_h);
            }
            break;
        case SDL_KEYDOWN: {
            if (io.WantCaptureKeyboard) break;
            const SDL_Keycode key  = event.key.keysym.sym;
            const bool        ctrl = (event.key.keysym.mod & KMOD_CTRL) != 0;
            if (key == SDLK_s && ctrl) {
                export_current_frame(app);
            } else if (key == SDLK_r) {
                app.input.reset_view();
            } else if (key == SDLK_LEFT) {
                app.input.key_pan(-1, 0);
            } else if (key == SDLK_RIGHT) {
                app.input.key_pan(1, 0);
            } else if (key == SDLK_UP) {
                app.input.key_pan(0, -1);
            } else if (key == SDLK_DOWN) {
                app.input.key_pan(0, 1);
            } else if (key == SDLK_F1) {
                Settings s   = app.driver.settings();
                s.gui.enable = !s.gui.enable;
                app.driver.set_settings(s);
            } else if (key == SDLK_ESCAPE) {
                running = false;
            }
            break;
        }
        default:
            break;
    }
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    init_logging(false);

    // -----------------------------------------------------------------------
    // Command line + settings
    // -----------------------------------------------------------------------
    CliOptions opts;
    const std::string cli_err = parse_cli(argc, argv, opts);
    if (!cli_err.empty()) {
        spdlog::error("{}", cli_err);
        print_usage(argv[0]);
        return 1;
    }
    if (opts.help) {
        print_usage(argv[0]);
        return 0;
    }

    Settings settings;
    if (!resolve_settings(opts, opts.render, settings))
        return 1;
    set_debug_logging(settings.debug.log);

    if (opts.render)
        return run_cli_render(settings);

    // -----------------------------------------------------------------------
    // Window + GL context
    // -----------------------------------------------------------------------
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        spdlog::error("SDL_Init error: {}", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

    SDL_Window* window = SDL_CreateWindow(
        "Fractal Cinema",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        1280, 720,
        SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI
    );
    if (!window) {
        spdlog::error("SDL_CreateWindow error: {}", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        spdlog::error("SDL_GL_CreateContext error: {}", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDL_GL_MakeCurrent(window, gl_context);
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;

    ImGui::StyleColorsDark();
    ImGuiStyle& style      = ImGui::GetStyle();
    style.WindowBorderSize = 0.0f;
    style.WindowPadding    = ImVec2(8.0f, 6.0f);

    ImGui_ImplSDL2_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 330");

    {
        AppState app(settings);

        bool running = true;
        while (running && !app.driver.is_stopped()) {
            int win_w, win_h;
            SDL_GetWindowSize(window, &win_w, &win_h);

            // Nothing scheduled (minimized / zero-size window): block until
            // an SDL event arrives or 50 ms elapse instead of spinning.
            SDL_Event event;
            if (!app.frame_requested && SDL_WaitEventTimeout(&event, 50)) {
                ImGui_ImplSDL2_ProcessEvent(&event);
                handle_event(app, event, io, win_w, win_h, running);
            }
            while (SDL_PollEvent(&event)) {
                ImGui_ImplSDL2_ProcessEvent(&event);
                handle_event(app, event, io, win_w, win_h, running);
            }
            if (!running) break;

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplSDL2_NewFrame();
            ImGui::NewFrame();

            int draw_w, draw_h;
            SDL_GL_GetDrawableSize(window, &draw_w, &draw_h);
            app.surface.set_display_size(io.DisplaySize.x, io.DisplaySize.y);

            app.frame_requested = false;
            app.driver.tick(draw_w, draw_h);

            if (app.driver.settings().gui.enable)
                draw_control_panel(app);
            draw_status_bar(app, io.DisplaySize.x, io.DisplaySize.y);

            ImGui::Render();
            glViewport(0, 0, draw_w, draw_h);
            glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
            SDL_GL_SwapWindow(window);
        }
        app.driver.stop();
    }   // GL textures released while the context is still current

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DeleteContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
