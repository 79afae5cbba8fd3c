#pragma once

#include "renderer.hpp"
#include "thread_pool.hpp"

#include <functional>
#include <memory>

// Tiled multi-threaded compute pass.
class CpuRenderer : public IFieldRenderer {
public:
    // n_threads <= 0 uses the hardware concurrency
    explicit CpuRenderer(int n_threads = 0);
    void render(const UniformSnapshot& u, PixelBuffer& buf) override;

    // Same sampling as render(), but keeps the raw escape depth of every
    // pixel (no invert, no quantization). out must already be sized.
    void render_depth(const UniformSnapshot& u, DepthField& out);

    double last_render_ms = 0.0;
    bool   avx_active     = false;   // true if AVX path is in use
    int    thread_count   = 0;
    int    hw_concurrency = 0;       // logical CPU count detected at startup

    // n=0 restores hw_concurrency
    void set_thread_count(int n);

    // Override AVX flag (e.g. to test the scalar path). Ignored when the CPU
    // lacks AVX.
    void set_avx(bool b) { avx_active = b && avx_capable; }

private:
    void render_tile(const UniformSnapshot& u, PixelBuffer& buf,
                     int tx, int ty, int tw, int th) const;
    void depth_tile(const UniformSnapshot& u, DepthField& out,
                    int tx, int ty, int tw, int th) const;

    // Splits W x H into 64x64 tiles, runs fn(tx, ty, tw, th) on the pool and
    // waits. Returns the elapsed ms.
    double run_tiles(int W, int H, const std::function<void(int, int, int, int)>& fn);

    std::unique_ptr<ThreadPool> pool;
    bool avx_capable = false;
};
