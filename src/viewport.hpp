#pragma once

// Complex-plane rectangle mapped onto a pixel grid.
// Every transform returns a new Viewport; a Viewport is never modified in place.

struct ComplexPoint {
    double re = 0.0;
    double im = 0.0;
};

inline bool operator==(const ComplexPoint& a, const ComplexPoint& b)
{
    return a.re == b.re && a.im == b.im;
}
inline bool operator!=(const ComplexPoint& a, const ComplexPoint& b) { return !(a == b); }

struct PixelPoint {
    double x = 0.0;
    double y = 0.0;
};

// Default framing: the whole Mandelbrot set with some margin.
constexpr double DEFAULT_CENTER_RE   = -0.5;
constexpr double DEFAULT_CENTER_IM   =  0.0;
constexpr double DEFAULT_HALF_HEIGHT =  1.25;

class Viewport {
public:
    // Throws FractalError(InvalidRequest) on a non-finite center or on
    // non-positive extents or sizes.
    // Does NOT correct the aspect ratio; use for_grid() for that.
    Viewport(ComplexPoint center, double half_width, double half_height,
             int pixel_width, int pixel_height);

    // Default view for a pixel grid.
    static Viewport default_view(int pixel_width, int pixel_height);

    // View centered on `center` whose vertical half-extent is `half_height`;
    // half_width follows the grid's aspect ratio.
    static Viewport for_grid(ComplexPoint center, double half_height,
                             int pixel_width, int pixel_height);

    // Throws FractalError(OutOfBounds) unless 0 <= px < pixel_width
    // and 0 <= py < pixel_height.
    ComplexPoint pixel_to_complex(double px, double py) const;

    // Same map without the range check; for callers iterating the grid.
    ComplexPoint pixel_to_complex_unchecked(double px, double py) const;

    // Inverse map, unchecked (the result may lie outside the grid).
    PixelPoint complex_to_pixel(ComplexPoint z) const;

    // Drag-rectangle zoom. Throws DegenerateSelection for a zero-area
    // rectangle and OutOfBounds for a corner outside the grid. Once double
    // precision runs out the extents stop shrinking; that is not an error.
    Viewport zoom_to_rect(PixelPoint p0, PixelPoint p1) const;

    Viewport zoom_out() const;
    Viewport reset() const;

    // Wheel zoom: the point under (px, py) stays put. factor > 1 zooms in,
    // clamped at the same precision floor as zoom_to_rect.
    Viewport zoom_about(double px, double py, double factor) const;
    Viewport pan_pixels(double dx, double dy) const;

    // New grid, same center and vertical extent, aspect-corrected (resize).
    Viewport with_resolution(int pixel_width, int pixel_height) const;

    // New grid, same complex-plane bounds (high-resolution export).
    Viewport with_pixel_grid(int pixel_width, int pixel_height) const;

    ComplexPoint center()       const { return center_; }
    double       half_width()   const { return half_width_; }
    double       half_height()  const { return half_height_; }
    int          pixel_width()  const { return pixel_width_; }
    int          pixel_height() const { return pixel_height_; }

    // Complex units per pixel along the real axis.
    double pixel_size() const { return 2.0 * half_width_ / pixel_width_; }

    // Magnification relative to the default view.
    double zoom_factor() const { return DEFAULT_HALF_HEIGHT / half_height_; }

    // Bit-exact comparison of all fields.
    bool operator==(const Viewport& o) const;
    bool operator!=(const Viewport& o) const { return !(*this == o); }

private:
    ComplexPoint center_;
    double       half_width_;
    double       half_height_;
    int          pixel_width_;
    int          pixel_height_;
};
