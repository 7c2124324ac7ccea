#pragma once

#include "cpu_renderer.hpp"
#include "view_state.hpp"
#include <cstdio>
#include <algorithm>
#include <vector>

// Mpix/s table for both fractal families, single thread and all threads.
inline int run_cli_benchmark()
{
    CpuRenderer renderer;
    const int hw = renderer.hw_concurrency;

    constexpr int W = 1920, H = 1080, RUNS = 4, BEST_N = 2;
    PixelBuffer buf;

    struct TestCase {
        const char* label;
        FractalKind kind;
        int         threads;
    };

    const TestCase tests[] = {
        {"Mandelbrot", FractalKind::mandelbrot(),              1 },
        {"Julia",      FractalKind::julia(DEFAULT_JULIA_C),    1 },
        {"Mandelbrot", FractalKind::mandelbrot(),              hw},
        {"Julia",      FractalKind::julia(DEFAULT_JULIA_C),    hw},
    };

    printf("fracview CLI Benchmark\n");
    printf("%dx%d, %d iter, %d runs (avg best %d)\n", W, H, DEFAULT_MAX_ITER, RUNS, BEST_N);
    printf("Hardware threads: %d\n\n", hw);
    printf("%-30s %-10s %s\n", "Label", "Threads", "Mpix/s");
    printf("------------------------------------------------\n");

    for (const auto& t : tests) {
        RenderRequest req;
        req.viewport       = Viewport::default_view(W, H);
        req.fractal        = t.kind;
        req.max_iterations = DEFAULT_MAX_ITER;
        req.width          = W;
        req.height         = H;
        if (t.kind.is_julia())
            req.viewport = Viewport::for_grid({0.0, 0.0}, 1.25, W, H);

        renderer.set_thread_count(t.threads);

        // Warm-up
        renderer.render_into(req, buf);

        std::vector<double> times(RUNS);
        for (int r = 0; r < RUNS; ++r) {
            renderer.render_into(req, buf);
            times[r] = renderer.last_render_ms;
        }
        std::sort(times.begin(), times.end());
        double avg_ms = 0.0;
        for (int i = 0; i < BEST_N; ++i) avg_ms += times[i];
        avg_ms /= BEST_N;
        double mpixs = (W * H) / (avg_ms * 1000.0);

        printf("%-30s %-10d %6.2f\n", t.label, t.threads, mpixs);
    }
    return 0;
}
