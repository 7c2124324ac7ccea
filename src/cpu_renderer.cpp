#include "cpu_renderer.hpp"
#include "fractal.hpp"
#include "thread_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <mutex>

// -----------------------------------------------------------------------
// Constructor: detect hardware threads
// -----------------------------------------------------------------------
CpuRenderer::CpuRenderer()
{
    hw_concurrency = ThreadPool::hardware_threads();
    thread_count   = hw_concurrency;
}

void CpuRenderer::set_thread_count(int n)
{
    thread_count = (n < 1) ? hw_concurrency : n;
}

int CpuRenderer::partition_count_for(int height) const
{
    const int n = (partitions > 0) ? partitions : thread_count * PARTITIONS_PER_THREAD;
    return std::max(1, std::min(n, height));
}

// -----------------------------------------------------------------------
// Band renderer, called from the worker group, writes rows [y0, y1) only
// -----------------------------------------------------------------------
// Same mapping, kernel and shading as compute_pixel, so every buffer pixel
// equals compute_pixel bit for bit (the build disables FP contraction).
template<bool IsJulia>
static void render_band(const Viewport& grid, ComplexPoint julia_c, const Palette& palette,
                        int max_iter, PixelBuffer& buf, int y0, int y1)
{
    const int W = buf.width;
    for (int py = y0; py < y1; ++py) {
        Rgb* row = buf.row(py);
        for (int px = 0; px < W; ++px) {
            const ComplexPoint p = grid.pixel_to_complex_unchecked(px, py);
            const IterationResult r =
                escape_time<IsJulia>(p.re, p.im, julia_c.re, julia_c.im, max_iter);
            row[px] = shade(r, palette, max_iter);
        }
    }
}

void CpuRenderer::render_rows(const RenderRequest& request, const Viewport& grid,
                              PixelBuffer& buf, int y0, int y1)
{
    // Dispatch once per band so the inner loop has no branch on the kind.
    switch (request.fractal.type) {
        case FractalType::Julia:
            render_band<true>(grid, request.fractal.julia_c, request.palette,
                              request.max_iterations, buf, y0, y1);
            break;
        case FractalType::Mandelbrot:
        default:
            render_band<false>(grid, request.fractal.julia_c, request.palette,
                               request.max_iterations, buf, y0, y1);
            break;
    }
}

// -----------------------------------------------------------------------
// Top-level render: splits the image into row bands and forks one worker
// group per call
// -----------------------------------------------------------------------
void CpuRenderer::render_into(const RenderRequest& request, PixelBuffer& buf,
                              const ProgressFn& progress)
{
    validate(request);

    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    const Viewport grid = render_grid(request);
    buf.resize(request.width, request.height);

    const int H      = request.height;
    const int n_part = partition_count_for(H);

    std::mutex progress_mtx;
    int        done = 0;

    ThreadPool pool(thread_count);
    pool.run(n_part, [&](int idx) {
        // Band idx covers rows [idx*H/n, (idx+1)*H/n): disjoint and exhaustive.
        const int y0 = static_cast<int>(static_cast<long long>(idx)     * H / n_part);
        const int y1 = static_cast<int>(static_cast<long long>(idx + 1) * H / n_part);
        render_rows(request, grid, buf, y0, y1);

        if (progress) {
            std::lock_guard<std::mutex> lock(progress_mtx);
            ++done;
            if (done < n_part)
                progress(static_cast<double>(done) / n_part);
        }
    });

    last_render_ms = std::chrono::duration<double, std::milli>(
                         clock::now() - t0).count();
    spdlog::debug("rendered {} {}x{} ({} iter) in {:.1f} ms: {} partitions, {} threads",
                  fractal_name(request.fractal), request.width, request.height,
                  request.max_iterations, last_render_ms, n_part,
                  std::min(thread_count, n_part));

    if (progress)
        progress(1.0);
}

PixelBuffer CpuRenderer::render(const RenderRequest& request, const ProgressFn& progress)
{
    PixelBuffer buf;
    render_into(request, buf, progress);
    return buf;
}
