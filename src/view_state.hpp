#pragma once

#include "palette.hpp"
#include "viewport.hpp"

enum class FractalType {
    Mandelbrot = 0,  // z0 = 0, c = pixel
    Julia      = 1,  // z0 = pixel, c fixed
};

// Documented Julia parameter used when switching to Julia mode.
constexpr ComplexPoint DEFAULT_JULIA_C = {-0.8, 0.156};

struct FractalKind {
    FractalType  type    = FractalType::Mandelbrot;
    ComplexPoint julia_c = DEFAULT_JULIA_C;  // only read when type == Julia

    static FractalKind mandelbrot() { return {FractalType::Mandelbrot, DEFAULT_JULIA_C}; }
    static FractalKind julia(ComplexPoint c) { return {FractalType::Julia, c}; }

    bool is_julia() const { return type == FractalType::Julia; }
};

inline bool operator==(const FractalKind& a, const FractalKind& b)
{
    return a.type == b.type && a.julia_c == b.julia_c;
}
inline bool operator!=(const FractalKind& a, const FractalKind& b) { return !(a == b); }

struct IterationResult {
    bool   escaped         = false;
    int    iteration_count = 0;
    double smoothed_value  = 0.0;  // meaningless when !escaped
};

constexpr int DEFAULT_WIDTH    = 800;
constexpr int DEFAULT_HEIGHT   = 600;
constexpr int DEFAULT_MAX_ITER = 256;

// Everything a render needs. Passed by value into a render so the UI can
// keep navigating while a render is in flight.
// width/height may differ from the viewport's grid (high-resolution export):
// the complex-plane bounds are kept, only the pixel density changes.
struct RenderRequest {
    Viewport    viewport       = Viewport::default_view(DEFAULT_WIDTH, DEFAULT_HEIGHT);
    FractalKind fractal        = FractalKind::mandelbrot();
    Palette     palette        = {};
    int         max_iterations = DEFAULT_MAX_ITER;
    int         width          = DEFAULT_WIDTH;
    int         height         = DEFAULT_HEIGHT;
};

// Throws FractalError(InvalidRequest) when max_iterations or either
// dimension is not positive.
void validate(const RenderRequest& request);

inline const char* fractal_name(const FractalKind& kind)
{
    switch (kind.type) {
        case FractalType::Mandelbrot: return "Mandelbrot";
        case FractalType::Julia:      return "Julia";
    }
    return "Unknown";
}
