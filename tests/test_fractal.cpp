#include "fractal.hpp"
#include "fractal_error.hpp"

#include <gtest/gtest.h>

#include <cmath>

namespace {

RenderRequest small_request(FractalKind kind = FractalKind::mandelbrot())
{
    RenderRequest r;
    r.viewport       = Viewport::default_view(64, 48);
    r.fractal        = kind;
    r.max_iterations = 200;
    r.width          = 64;
    r.height         = 48;
    return r;
}

}  // namespace

TEST(Fractal, ComputePixelIsDeterministic)
{
    const RenderRequest req = small_request();
    for (int y = 0; y < req.height; y += 7) {
        for (int x = 0; x < req.width; x += 5) {
            const Rgb first = compute_pixel(x, y, req);
            EXPECT_EQ(compute_pixel(x, y, req), first) << "pixel " << x << "," << y;
        }
    }
}

TEST(Fractal, MandelbrotOriginNeverEscapes)
{
    for (int max_iter : {1, 10, 256, 5000}) {
        const IterationResult r = mandelbrot_iter({0.0, 0.0}, max_iter);
        EXPECT_FALSE(r.escaped);
        EXPECT_EQ(r.iteration_count, max_iter);
    }
}

TEST(Fractal, MandelbrotOriginPixelIsInteriorColor)
{
    // 2x2 grid centred on the origin: pixel (1, 1) maps to c = 0.
    RenderRequest req;
    req.viewport = Viewport({0.0, 0.0}, 0.5, 0.5, 2, 2);
    req.width    = 2;
    req.height   = 2;
    for (PaletteId id : {PaletteId::Classic, PaletteId::Fire, PaletteId::UserDefined}) {
        req.palette.id = id;
        EXPECT_EQ(compute_pixel(1, 1, req), INTERIOR_COLOR);
    }
}

TEST(Fractal, EscapesBeforeTheFirstStepOutsideRadiusTwo)
{
    const IterationResult r = julia_iter({10.0, 10.0}, DEFAULT_JULIA_C, 1000);
    EXPECT_TRUE(r.escaped);
    EXPECT_LE(r.iteration_count, 2);
}

TEST(Fractal, DefaultJuliaOriginIsInteriorAtModerateBudgets)
{
    const IterationResult r = julia_iter({0.0, 0.0}, DEFAULT_JULIA_C, 200);
    EXPECT_FALSE(r.escaped);
}

TEST(Fractal, JuliaPointsNearOriginStayBoundedForConnectedSets)
{
    // Douady rabbit and the basilica: the critical orbit is periodic.
    const ComplexPoint rabbit   = {-0.123, 0.745};
    const ComplexPoint basilica = {-1.0, 0.0};
    EXPECT_FALSE(julia_iter({0.0, 0.0}, rabbit, 1000).escaped);
    EXPECT_FALSE(julia_iter({0.001, 0.001}, rabbit, 1000).escaped);
    EXPECT_FALSE(julia_iter({0.0, 0.0}, basilica, 5000).escaped);
}

TEST(Fractal, SmoothedValueFollowsNormalizedIterationCount)
{
    // c = 1: z = 0, 1, 2, 5; |z|^2 = 25 > 4 is seen at step 3.
    const IterationResult r = mandelbrot_iter({1.0, 0.0}, 100);
    ASSERT_TRUE(r.escaped);
    EXPECT_EQ(r.iteration_count, 3);
    EXPECT_NEAR(r.smoothed_value, 3.0 + 1.0 - std::log2(std::log2(5.0)), 1e-12);
}

TEST(Fractal, IterateDispatchesOnKind)
{
    const ComplexPoint p = {0.3, 0.5};
    const IterationResult m = iterate(p, FractalKind::mandelbrot(), 300);
    const IterationResult j = iterate(p, FractalKind::julia({-0.4, 0.6}), 300);
    EXPECT_EQ(m.iteration_count, mandelbrot_iter(p, 300).iteration_count);
    EXPECT_EQ(j.iteration_count, julia_iter(p, {-0.4, 0.6}, 300).iteration_count);
}

TEST(Fractal, ComputePixelUsesTheRequestResolution)
{
    // Same bounds at twice the resolution: pixel (2x, 2y) samples the same point.
    RenderRequest lo = small_request();
    RenderRequest hi = lo;
    hi.width  = lo.width * 2;
    hi.height = lo.height * 2;
    EXPECT_EQ(compute_pixel(10, 12, lo), compute_pixel(20, 24, hi));
}

TEST(Fractal, ComputePixelRejectsOutOfRangePixels)
{
    const RenderRequest req = small_request();
    try {
        compute_pixel(req.width, 0, req);
        FAIL() << "expected OutOfBounds";
    } catch (const FractalError& e) {
        EXPECT_EQ(e.code(), FractalErrc::OutOfBounds);
    }
    EXPECT_THROW(compute_pixel(0, -1, req), FractalError);
}

TEST(Fractal, ComputePixelRejectsInvalidRequests)
{
    RenderRequest req = small_request();
    req.max_iterations = 0;
    try {
        compute_pixel(0, 0, req);
        FAIL() << "expected InvalidRequest";
    } catch (const FractalError& e) {
        EXPECT_EQ(e.code(), FractalErrc::InvalidRequest);
    }

    req = small_request();
    req.width = 0;
    EXPECT_THROW(validate(req), FractalError);
    req = small_request();
    req.height = -3;
    EXPECT_THROW(validate(req), FractalError);
    EXPECT_NO_THROW(validate(small_request()));
}
