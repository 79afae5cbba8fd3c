#pragma once

#include "renderer.hpp"
#include "settings.hpp"

#include <chrono>
#include <functional>

class Viewport;
class InputController;
class RenderPipeline;

// Monotonic elapsed-time source. Each tick() adds the steady-clock delta
// since the previous call.
class FrameClock {
public:
    FrameClock() : last(std::chrono::steady_clock::now()) {}

    // Returns the new elapsed time in seconds
    float tick()
    {
        const auto now = std::chrono::steady_clock::now();
        elapsed += std::chrono::duration<double>(now - last).count();
        last = now;
        return static_cast<float>(elapsed);
    }

    float seconds() const { return static_cast<float>(elapsed); }

private:
    std::chrono::steady_clock::time_point last;
    double elapsed = 0.0;
};

// Per-frame orchestration: input -> viewport -> uniform snapshot ->
// render pipeline -> request next frame.
class FrameDriver {
public:
    enum class State {
        Idle,
        Running,
    };

    // request_next: host hook asking for another tick on the next display
    // refresh. May be empty.
    FrameDriver(Viewport& viewport, InputController& input, RenderPipeline& pipeline,
                const Settings& settings, std::function<void()> request_next = {});

    // Runs one frame for a display of the given size. Returns false when the
    // frame was skipped (degenerate display or driver stopped).
    bool tick(int display_w, int display_h);

    // Replaces the whole configuration. Framebuffer changes take effect at
    // the start of the next tick.
    void set_settings(const Settings& s);
    const Settings& settings() const { return cfg; }

    // Ends the loop: later ticks are no-ops and no further frame is requested.
    void stop() { stopped = true; }
    bool is_stopped() const { return stopped; }

    State                  state()         const { return st; }
    long                   frame_count()   const { return frames; }
    const UniformSnapshot& last_snapshot() const { return snapshot; }

private:
    UniformSnapshot build_snapshot(float time) const;

    Viewport&             viewport;
    InputController&      input;
    RenderPipeline&       pipeline;
    Settings              cfg;
    bool                  settings_dirty = true;
    std::function<void()> request_next;
    FrameClock            clock;
    UniformSnapshot       snapshot;
    Resolution            display;
    State                 st      = State::Idle;
    bool                  stopped = false;
    long                  frames  = 0;
};
