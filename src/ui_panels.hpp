#pragma once

struct AppState;

// Developer control panel: framebuffer, viewport and Mandelbrot options.
void draw_control_panel(AppState& app);

// One-line status bar along the bottom edge.
void draw_status_bar(AppState& app, float fw, float fh);
