#include "viewport.hpp"
#include "fractal_error.hpp"

#include <algorithm>
#include <cfloat>
#include <cmath>
#include <string>

Viewport::Viewport(ComplexPoint center, double half_width, double half_height,
                   int pixel_width, int pixel_height)
    : center_(center)
    , half_width_(half_width)
    , half_height_(half_height)
    , pixel_width_(pixel_width)
    , pixel_height_(pixel_height)
{
    if (!std::isfinite(center.re) || !std::isfinite(center.im))
        throw FractalError(FractalErrc::InvalidRequest,
                           "viewport center must be finite");
    // Written as !(x > 0) so that NaN extents are rejected too.
    if (!(half_width > 0.0) || !(half_height > 0.0))
        throw FractalError(FractalErrc::InvalidRequest,
                           "viewport half-extents must be positive");
    if (pixel_width <= 0 || pixel_height <= 0)
        throw FractalError(FractalErrc::InvalidRequest,
                           "viewport pixel grid must be non-empty (" +
                           std::to_string(pixel_width) + "x" +
                           std::to_string(pixel_height) + ")");
}

Viewport Viewport::for_grid(ComplexPoint center, double half_height,
                            int pixel_width, int pixel_height)
{
    if (pixel_width <= 0 || pixel_height <= 0)
        throw FractalError(FractalErrc::InvalidRequest,
                           "viewport pixel grid must be non-empty (" +
                           std::to_string(pixel_width) + "x" +
                           std::to_string(pixel_height) + ")");
    const double aspect = static_cast<double>(pixel_width) / pixel_height;
    return Viewport(center, half_height * aspect, half_height,
                    pixel_width, pixel_height);
}

Viewport Viewport::default_view(int pixel_width, int pixel_height)
{
    return for_grid({DEFAULT_CENTER_RE, DEFAULT_CENTER_IM}, DEFAULT_HALF_HEIGHT,
                    pixel_width, pixel_height);
}

// -----------------------------------------------------------------------
// Pixel <-> complex mapping
// -----------------------------------------------------------------------
ComplexPoint Viewport::pixel_to_complex_unchecked(double px, double py) const
{
    // Screen y grows downward, the imaginary axis grows upward.
    return {
        center_.re + (px / pixel_width_  - 0.5) * 2.0 * half_width_,
        center_.im - (py / pixel_height_ - 0.5) * 2.0 * half_height_,
    };
}

ComplexPoint Viewport::pixel_to_complex(double px, double py) const
{
    if (!(px >= 0.0 && px < pixel_width_ && py >= 0.0 && py < pixel_height_))
        throw FractalError(FractalErrc::OutOfBounds,
                           "pixel (" + std::to_string(px) + ", " +
                           std::to_string(py) + ") outside " +
                           std::to_string(pixel_width_) + "x" +
                           std::to_string(pixel_height_) + " grid");
    return pixel_to_complex_unchecked(px, py);
}

PixelPoint Viewport::complex_to_pixel(ComplexPoint z) const
{
    return {
        ((z.re - center_.re) / (2.0 * half_width_)  + 0.5) * pixel_width_,
        ((center_.im - z.im) / (2.0 * half_height_) + 0.5) * pixel_height_,
    };
}

// -----------------------------------------------------------------------
// Navigation
// -----------------------------------------------------------------------

// Smallest half-extent around coordinate c that still gives `pixels`
// distinct sample positions. Deep zooms stop here instead of collapsing.
static double min_half_extent(double c, int pixels)
{
    return std::max(std::abs(c) * DBL_EPSILON * pixels, DBL_MIN);
}

Viewport Viewport::zoom_to_rect(PixelPoint p0, PixelPoint p1) const
{
    if (p0.x == p1.x || p0.y == p1.y)
        throw FractalError(FractalErrc::DegenerateSelection,
                           "zoom rectangle has zero width or height");

    const ComplexPoint a = pixel_to_complex(p0.x, p0.y);
    const ComplexPoint b = pixel_to_complex(p1.x, p1.y);

    const ComplexPoint mid = {(a.re + b.re) * 0.5, (a.im + b.im) * 0.5};
    double hw = std::abs(b.re - a.re) * 0.5;
    double hh = std::abs(b.im - a.im) * 0.5;
    hw = std::max(hw, min_half_extent(mid.re, pixel_width_));
    hh = std::max(hh, min_half_extent(mid.im, pixel_height_));

    // Grow the shorter side to the grid's aspect ratio; the selection is
    // always fully visible afterwards.
    const double aspect = static_cast<double>(pixel_width_) / pixel_height_;
    if (hw < hh * aspect)
        hw = hh * aspect;
    else
        hh = hw / aspect;

    return Viewport(mid, hw, hh, pixel_width_, pixel_height_);
}

Viewport Viewport::zoom_out() const
{
    return Viewport(center_, half_width_ * 2.0, half_height_ * 2.0,
                    pixel_width_, pixel_height_);
}

Viewport Viewport::reset() const
{
    return default_view(pixel_width_, pixel_height_);
}

Viewport Viewport::zoom_about(double px, double py, double factor) const
{
    if (!(factor > 0.0))
        throw FractalError(FractalErrc::InvalidRequest, "zoom factor must be positive");

    // Zooming in past the precision floor is clamped, not an error.
    if (factor > 1.0) {
        const double limit = std::min(half_width_  / min_half_extent(center_.re, pixel_width_),
                                      half_height_ / min_half_extent(center_.im, pixel_height_));
        factor = std::max(1.0, std::min(factor, limit));
    }

    const ComplexPoint anchor = pixel_to_complex_unchecked(px, py);
    const double hw = half_width_  / factor;
    const double hh = half_height_ / factor;
    const ComplexPoint c = {
        anchor.re - (px / pixel_width_  - 0.5) * 2.0 * hw,
        anchor.im + (py / pixel_height_ - 0.5) * 2.0 * hh,
    };
    return Viewport(c, hw, hh, pixel_width_, pixel_height_);
}

Viewport Viewport::pan_pixels(double dx, double dy) const
{
    // Content follows the mouse: dragging right moves the center left.
    const ComplexPoint c = {
        center_.re - dx * 2.0 * half_width_  / pixel_width_,
        center_.im + dy * 2.0 * half_height_ / pixel_height_,
    };
    return Viewport(c, half_width_, half_height_, pixel_width_, pixel_height_);
}

Viewport Viewport::with_resolution(int pixel_width, int pixel_height) const
{
    if (pixel_width == pixel_width_ && pixel_height == pixel_height_)
        return *this;
    return for_grid(center_, half_height_, pixel_width, pixel_height);
}

Viewport Viewport::with_pixel_grid(int pixel_width, int pixel_height) const
{
    return Viewport(center_, half_width_, half_height_, pixel_width, pixel_height);
}

bool Viewport::operator==(const Viewport& o) const
{
    return center_       == o.center_       &&
           half_width_   == o.half_width_   &&
           half_height_  == o.half_height_  &&
           pixel_width_  == o.pixel_width_  &&
           pixel_height_ == o.pixel_height_;
}
