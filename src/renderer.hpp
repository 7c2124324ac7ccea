#pragma once

#include <cstddef>
#include <vector>
#include "palette.hpp"

static_assert(sizeof(Rgb) == 3, "Rgb must be tightly packed for GL/PNG upload");

// Pixel buffer: RGB, 8 bits per channel, row-major.
struct PixelBuffer {
    std::vector<Rgb> pixels;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        pixels.assign(static_cast<size_t>(w) * static_cast<size_t>(h), INTERIOR_COLOR);
    }

    Rgb*       row(int y)       { return pixels.data() + static_cast<size_t>(y) * width; }
    const Rgb* row(int y) const { return pixels.data() + static_cast<size_t>(y) * width; }

    const Rgb& at(int x, int y) const { return row(y)[x]; }

    bool empty() const { return pixels.empty(); }

    // Raw bytes, 3 per pixel.
    const unsigned char* bytes() const
    {
        return reinterpret_cast<const unsigned char*>(pixels.data());
    }
};
