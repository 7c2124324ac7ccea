#include "fractal.hpp"
#include "fractal_error.hpp"

#include <spdlog/spdlog.h>

#include <string>

// Upper bound per side; keeps width * height well inside int range.
static constexpr int MAX_DIMENSION = 32768;

void validate(const RenderRequest& request)
{
    if (request.max_iterations <= 0) {
        spdlog::warn("rejecting render request: max_iterations = {}", request.max_iterations);
        throw FractalError(FractalErrc::InvalidRequest,
                           "max_iterations must be positive, got " +
                           std::to_string(request.max_iterations));
    }
    if (request.width <= 0 || request.height <= 0 ||
        request.width > MAX_DIMENSION || request.height > MAX_DIMENSION) {
        spdlog::warn("rejecting render request: resolution {}x{}",
                     request.width, request.height);
        throw FractalError(FractalErrc::InvalidRequest,
                           "resolution must be 1.." + std::to_string(MAX_DIMENSION) +
                           " per side, got " + std::to_string(request.width) + "x" +
                           std::to_string(request.height));
    }
}

IterationResult compute_iteration(int px, int py, const RenderRequest& request)
{
    validate(request);
    const Viewport grid = render_grid(request);
    const ComplexPoint p = grid.pixel_to_complex(px, py);
    return iterate(p, request.fractal, request.max_iterations);
}

Rgb compute_pixel(int px, int py, const RenderRequest& request)
{
    return shade(compute_iteration(px, py, request), request.palette, request.max_iterations);
}
