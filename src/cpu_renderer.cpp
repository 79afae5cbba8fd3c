#include "cpu_renderer.hpp"
#include "escape_time.hpp"
#include "escape_time_avx.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <thread>

// -----------------------------------------------------------------------
// Constructor - detect AVX, build thread pool
// -----------------------------------------------------------------------
CpuRenderer::CpuRenderer(int n_threads)
{
#if defined(__x86_64__) || defined(__i386__)
    avx_capable = __builtin_cpu_supports("avx");
#endif
    avx_active = avx_capable;

    int n = static_cast<int>(std::thread::hardware_concurrency());
    if (n < 1) n = 4;
    hw_concurrency = n;
    set_thread_count(n_threads);
}

void CpuRenderer::set_thread_count(int n)
{
    if (n < 1) n = hw_concurrency;
    if (pool && pool->size() == n) return;
    pool = std::make_unique<ThreadPool>(n);
    thread_count = n;
    spdlog::debug("compute pass: {} worker thread(s), {}", n, avx_active ? "AVX" : "scalar");
}

// -----------------------------------------------------------------------
// Tile renderer - called from thread pool workers
// -----------------------------------------------------------------------
void CpuRenderer::render_tile(const UniformSnapshot& u, PixelBuffer& buf,
                              int tx, int ty, int tw, int th) const
{
    const int    W  = buf.width;
    const int    H  = buf.height;
    const double fw = static_cast<double>(W);
    const double fh = static_cast<double>(H);

    const EscapeTimeParams params{u.max_iter, u.invert};

    for (int py = ty; py < ty + th && py < H; ++py) {
        // Row 0 is the top of the display: v = 0 maps to view_max.y
        const double im  = map_range(py + 0.5, 0.0, fh, u.view_max.y, u.view_min.y);
        uint32_t*    row = buf.pixels.data() + static_cast<std::size_t>(py) * W;
        int          px  = tx;
        const int    end = std::min(tx + tw, W);

        // --- AVX path: 4 pixels per iteration ---
        if (avx_active) {
            for (; px + 4 <= end; px += 4) {
                double re4[4];
                double depth4[4];
                for (int k = 0; k < 4; ++k)
                    re4[k] = map_range(px + k + 0.5, 0.0, fw, u.view_min.x, u.view_max.x);
                avx_escape_depth_4(re4, im, params.max_iter, depth4);
                for (int k = 0; k < 4; ++k)
                    row[px + k] = depth_to_pixel(quantize_depth(depth4[k], params.invert));
            }
        }

        // --- Scalar path: remainder pixels (or full row if no AVX) ---
        for (; px < end; ++px) {
            const double re = map_range(px + 0.5, 0.0, fw, u.view_min.x, u.view_max.x);
            row[px] = shade_point(re, im, params);
        }
    }
}

// -----------------------------------------------------------------------
// Depth tile - same sampling as render_tile, raw depth out
// -----------------------------------------------------------------------
void CpuRenderer::depth_tile(const UniformSnapshot& u, DepthField& out,
                             int tx, int ty, int tw, int th) const
{
    const int    W  = out.width;
    const int    H  = out.height;
    const double fw = static_cast<double>(W);
    const double fh = static_cast<double>(H);

    for (int py = ty; py < ty + th && py < H; ++py) {
        const double im  = map_range(py + 0.5, 0.0, fh, u.view_max.y, u.view_min.y);
        double*      row = out.values.data() + static_cast<std::size_t>(py) * W;
        int          px  = tx;
        const int    end = std::min(tx + tw, W);

        if (avx_active) {
            for (; px + 4 <= end; px += 4) {
                double re4[4];
                for (int k = 0; k < 4; ++k)
                    re4[k] = map_range(px + k + 0.5, 0.0, fw, u.view_min.x, u.view_max.x);
                avx_escape_depth_4(re4, im, u.max_iter, row + px);
            }
        }

        for (; px < end; ++px) {
            const double re = map_range(px + 0.5, 0.0, fw, u.view_min.x, u.view_max.x);
            row[px] = escape_depth(re, im, u.max_iter);
        }
    }
}

// -----------------------------------------------------------------------
// Splits the image into tiles and dispatches them to the thread pool
// -----------------------------------------------------------------------
double CpuRenderer::run_tiles(int W, int H, const std::function<void(int, int, int, int)>& fn)
{
    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    constexpr int TILE_W = 64;
    constexpr int TILE_H = 64;

    for (int ty = 0; ty < H; ty += TILE_H) {
        for (int tx = 0; tx < W; tx += TILE_W) {
            const int tw = std::min(TILE_W, W - tx);
            const int th = std::min(TILE_H, H - ty);
            pool->submit([&fn, tx, ty, tw, th] { fn(tx, ty, tw, th); });
        }
    }
    pool->wait();

    return std::chrono::duration<double, std::milli>(clock::now() - t0).count();
}

void CpuRenderer::render(const UniformSnapshot& u, PixelBuffer& buf)
{
    const int W = buf.width, H = buf.height;
    if (W <= 0 || H <= 0) return;

    if (u.resolution.w != W || u.resolution.h != H)
        spdlog::debug("compute pass: snapshot resolution {}x{} differs from buffer {}x{}",
                      u.resolution.w, u.resolution.h, W, H);

    last_render_ms = run_tiles(W, H, [this, &u, &buf](int tx, int ty, int tw, int th) {
        render_tile(u, buf, tx, ty, tw, th);
    });
    spdlog::debug("compute pass: {}x{} in {:.2f} ms", W, H, last_render_ms);
}

void CpuRenderer::render_depth(const UniformSnapshot& u, DepthField& out)
{
    const int W = out.width, H = out.height;
    if (W <= 0 || H <= 0) return;

    last_render_ms = run_tiles(W, H, [this, &u, &out](int tx, int ty, int tw, int th) {
        depth_tile(u, out, tx, ty, tw, th);
    });
    spdlog::debug("depth pass: {}x{} in {:.2f} ms", W, H, last_render_ms);
}
