// fracview-render: headless renderer and benchmark.

#include "view_state.hpp"
#include "cpu_renderer.hpp"
#include "fractal_error.hpp"
#include "export.hpp"
#include "cli_benchmark.hpp"
#include "cli_options.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <ctime>
#include <optional>
#include <string>

namespace {

void print_usage(const char* argv0)
{
    std::fprintf(stderr,
        "usage: %s [options]\n"
        "  --width W              output width in pixels (default %d)\n"
        "  --height H             output height in pixels (default %d)\n"
        "  --center RE IM         view center (default %.2f %.2f)\n"
        "  --half-height H        vertical half-extent of the view (default %.2f)\n"
        "  --julia RE IM          render the Julia set for c = RE + IM i\n"
        "  --iter N               maximum iterations (default %d)\n"
        "  --palette NAME         classic fire ocean forest rainbow pastel sunset\n"
        "                         ice neon grayscale userdefined\n"
        "  --user-colors A B      gradient end colours as RRGGBB hex (implies userdefined)\n"
        "  --threads N            worker threads (default: all)\n"
        "  --partitions N         row bands per render (default: 4 per thread)\n"
        "  --out FILE             output file (.png%s)\n"
        "  --benchmark            print the Mpix/s table and exit\n"
        "  --verbose              debug logging\n",
        argv0, DEFAULT_WIDTH, DEFAULT_HEIGHT, DEFAULT_CENTER_RE, DEFAULT_CENTER_IM,
        DEFAULT_HALF_HEIGHT, DEFAULT_MAX_ITER, jxl_available() ? " or .jxl" : "");
}

}  // namespace

int main(int argc, char* argv[])
{
    auto stderr_logger = spdlog::stderr_color_mt("stderr_logger");
    spdlog::set_default_logger(stderr_logger);
    spdlog::set_pattern("[%^%l%$ +%o] %v");

    CliOptions opt;
    if (!parse_args(argc, argv, opt)) {
        print_usage(argv[0]);
        return 2;
    }
    spdlog::set_level(opt.verbose ? spdlog::level::debug : spdlog::level::info);

    if (opt.benchmark)
        return run_cli_benchmark();

    RenderRequest req;
    try {
        req.viewport = Viewport::for_grid(opt.center, opt.half_height, opt.width, opt.height);
        req.fractal        = opt.fractal;
        req.palette        = opt.palette;
        req.max_iterations = opt.max_iter;
        req.width          = opt.width;
        req.height         = opt.height;
        validate(req);
    } catch (const FractalError& e) {
        spdlog::error("{}", e.what());
        print_usage(argv[0]);
        return 2;
    }

    CpuRenderer renderer;
    renderer.set_thread_count(opt.threads);
    renderer.set_partition_count(opt.partitions);

    PixelBuffer buf;
    try {
        buf = renderer.render(req);
    } catch (const FractalError& e) {
        spdlog::error("render failed: {}", e.what());
        return 1;
    }
    spdlog::info("{} {}x{} rendered in {:.1f} ms on {} threads",
                 fractal_name(req.fractal), req.width, req.height,
                 renderer.last_render_ms, renderer.thread_count);

    std::string path = opt.out;
    if (path.empty()) {
        const std::string err = ensure_directory(DEFAULT_EXPORT_DIR);
        if (!err.empty()) {
            spdlog::error("{}", err);
            return 1;
        }
        path = export_file_name(DEFAULT_EXPORT_DIR, req.palette.id, req.width, req.height,
                                false, "png", std::time(nullptr));
    }

    const std::optional<ImageFormat> fmt = image_format_for_path(path);
    if (!fmt || (*fmt == ImageFormat::Jxl && !jxl_available())) {
        spdlog::error("unsupported output extension: {}", path);
        return 1;
    }
    const std::string err = export_image(path.c_str(), buf, *fmt);
    if (!err.empty()) {
        spdlog::error("{}", err);
        return 1;
    }
    spdlog::info("saved {}", path);
    return 0;
}
