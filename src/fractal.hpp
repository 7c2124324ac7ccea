#pragma once

#include <cmath>
#include "view_state.hpp"

// Escape-time iteration of z -> z^2 + c.
//   Mandelbrot: z0 = 0,     c = (re, im)
//   Julia:      z0 = (re, im), c = (cr, ci)
// Escape is tested before each step with |z|^2 > 4. On escape at step n the
// smoothed value is n + 1 - log2(log2|z_n|) (normalized iteration count).
// Reaching max_iter reports escaped = false.
template<bool IsJulia>
inline IterationResult escape_time(double re, double im, double cr, double ci, int max_iter)
{
    double zr = IsJulia ? re : 0.0;
    double zi = IsJulia ? im : 0.0;
    const double c_re = IsJulia ? cr : re;
    const double c_im = IsJulia ? ci : im;
    int i = 0;
    while (i < max_iter) {
        const double zr2 = zr*zr, zi2 = zi*zi;
        if (zr2 + zi2 > 4.0) {
            // log2|z| = 0.5 * log2(|z|^2); |z| > 2 keeps the inner log positive.
            const double nu = std::log2(0.5 * std::log2(zr2 + zi2));
            return {true, i, static_cast<double>(i) + 1.0 - nu};
        }
        const double new_zr = zr2 - zi2 + c_re;
        zi = 2.0*zr*zi + c_im;
        zr = new_zr;
        ++i;
    }
    return {false, max_iter, static_cast<double>(max_iter)};
}

inline IterationResult mandelbrot_iter(ComplexPoint c, int max_iter)
    { return escape_time<false>(c.re, c.im, 0.0, 0.0, max_iter); }

inline IterationResult julia_iter(ComplexPoint z0, ComplexPoint c, int max_iter)
    { return escape_time<true>(z0.re, z0.im, c.re, c.im, max_iter); }

// Single dispatch on the fractal family.
inline IterationResult iterate(ComplexPoint point, const FractalKind& kind, int max_iter)
{
    switch (kind.type) {
        case FractalType::Julia:
            return julia_iter(point, kind.julia_c, max_iter);
        case FractalType::Mandelbrot:
        default:
            return mandelbrot_iter(point, max_iter);
    }
}

// Iteration result -> colour. Non-escaped points are INTERIOR_COLOR.
inline Rgb shade(const IterationResult& r, const Palette& palette, int max_iter)
{
    return escape_color(palette, r.escaped, r.smoothed_value / max_iter);
}

// The grid a request is rendered on: the viewport's bounds at the request's
// resolution.
inline Viewport render_grid(const RenderRequest& request)
{
    return request.viewport.with_pixel_grid(request.width, request.height);
}

// Pure per-pixel entry point. Throws FractalError(InvalidRequest) for an
// invalid request and FractalError(OutOfBounds) for a pixel outside
// request.width x request.height.
Rgb compute_pixel(int px, int py, const RenderRequest& request);

// Iteration result for one pixel, same validation as compute_pixel.
IterationResult compute_iteration(int px, int py, const RenderRequest& request);
