#include "input_controller.hpp"
#include "viewport.hpp"

static Vec2 normalized(double x, double y, int w, int h)
{
    return {x / static_cast<double>(w), y / static_cast<double>(h)};
}

void InputController::pointer_down(double x, double y, int display_w, int display_h)
{
    if (display_w <= 0 || display_h <= 0) return;
    pointer_pos = normalized(x, y, display_w, display_h);
    if (!pressed)
        drag_start = pointer_pos;
    pressed = true;
}

void InputController::pointer_move(double x, double y, int display_w, int display_h)
{
    if (display_w <= 0 || display_h <= 0) return;
    pointer_pos = normalized(x, y, display_w, display_h);
    if (!pressed) return;

    // Differential: each move pans from the previous position
    queue.push_back({ViewIntent::Kind::Pan, pointer_pos - drag_start});
    drag_start = pointer_pos;
}

void InputController::pointer_up()
{
    pressed = false;
}

void InputController::pointer_leave()
{
    pressed = false;
}

void InputController::wheel(double delta_y, int display_h)
{
    if (display_h <= 0 || delta_y == 0.0) return;
    queue.push_back({ViewIntent::Kind::Zoom, {delta_y / static_cast<double>(display_h), 0.0}});
}

void InputController::key_pan(int dx, int dy)
{
    if (dx == 0 && dy == 0) return;
    // Relative pan moves the view opposite to the drag direction, so a
    // "move right" key is a leftward drag.
    queue.push_back({ViewIntent::Kind::Pan, {-dx * KEY_PAN_STEP, -dy * KEY_PAN_STEP}});
}

void InputController::reset_view()
{
    queue.push_back({ViewIntent::Kind::Reset, {}});
}

void InputController::apply(Viewport& vp)
{
    for (const ViewIntent& intent : queue) {
        switch (intent.kind) {
            case ViewIntent::Kind::Pan:
                vp.set_center(intent.value, true);
                break;
            case ViewIntent::Kind::Zoom:
                vp.set_size(intent.value.x * vp.size(), true);
                break;
            case ViewIntent::Kind::Reset:
                vp.reset();
                break;
        }
    }
    queue.clear();
}
