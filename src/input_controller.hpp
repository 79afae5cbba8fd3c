#pragma once

#include "math_utils.hpp"

#include <vector>

class Viewport;

// Viewport change requested by an input event. Queued by InputController
// and applied by the frame driver at the start of a tick.
struct ViewIntent {
    enum class Kind {
        Pan,     // value = screen-space delta (fractions of width/height)
        Zoom,    // value.x = wheel step as a fraction of display height
        Reset,
    };
    Kind kind  = Kind::Pan;
    Vec2 value = {};
};

// Fraction of the view panned by one arrow-key press.
constexpr double KEY_PAN_STEP = 0.1;

// Turns raw pointer / wheel / key events into ViewIntents.
class InputController {
public:
    // Positions are display pixels. Events with a non-positive display size
    // are dropped.
    void pointer_down(double x, double y, int display_w, int display_h);
    void pointer_move(double x, double y, int display_w, int display_h);
    void pointer_up();
    void pointer_leave();

    // delta_y > 0 zooms out. The size delta is
    // delta_y / display_h * current size, resolved when applied.
    void wheel(double delta_y, int display_h);

    // dx, dy in {-1, 0, 1}: arrow-key pan by KEY_PAN_STEP of the view.
    void key_pan(int dx, int dy);
    void reset_view();

    // Applies and clears every queued intent in arrival order.
    void apply(Viewport& vp);

    bool dragging() const { return pressed; }
    Vec2 pointer()  const { return pointer_pos; }
    const std::vector<ViewIntent>& pending() const { return queue; }

private:
    std::vector<ViewIntent> queue;
    Vec2 pointer_pos = {0.5, 0.5};
    Vec2 drag_start  = {};
    bool pressed     = false;
};
