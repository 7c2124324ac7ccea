#pragma once

#include "renderer.hpp"
#include "view_state.hpp"

#include <functional>

// Receives the fraction of partitions completed, in non-decreasing order,
// from whichever worker finished a partition. 1.0 arrives exactly once,
// after the whole buffer is written.
// Calls are serialized under the renderer's progress lock: other workers
// wait for the callback to return, so it must be short and must not
// block on or re-enter the renderer.
using ProgressFn = std::function<void(double)>;

class CpuRenderer {
public:
    CpuRenderer();

    // Validates the request (FractalError on failure, before any work),
    // then renders it on a worker group created for this call.
    PixelBuffer render(const RenderRequest& request, const ProgressFn& progress = {});

    // Same, reusing buf's storage. buf is resized to the request resolution.
    void render_into(const RenderRequest& request, PixelBuffer& buf,
                     const ProgressFn& progress = {});

    double last_render_ms = 0.0;
    int    thread_count   = 0;
    int    hw_concurrency = 0;       // logical CPU count detected at startup

    // n=0 restores hw_concurrency
    void set_thread_count(int n);

    // Number of row bands per render; n=0 picks PARTITIONS_PER_THREAD per thread.
    void set_partition_count(int n) { partitions = (n < 0) ? 0 : n; }

    // Bands actually used for an image of the given height.
    int partition_count_for(int height) const;

    static constexpr int PARTITIONS_PER_THREAD = 4;

private:
    static void render_rows(const RenderRequest& request, const Viewport& grid,
                            PixelBuffer& buf, int y0, int y1);

    int partitions = 0;
};
