#include "favorite.hpp"

#include <algorithm>
#include <cstdio>

RenderRequest FavoriteView::to_request() const
{
    return to_request(view.pixel_width(), view.pixel_height());
}

RenderRequest FavoriteView::to_request(int width, int height) const
{
    RenderRequest r;
    r.viewport       = view;
    r.fractal        = fractal;
    r.palette        = palette;
    r.max_iterations = max_iterations;
    r.width          = width;
    r.height         = height;
    return r;
}

std::string FavoriteView::label() const
{
    char buf[160];
    const ComplexPoint c = view.center();
    if (fractal.is_julia()) {
        std::snprintf(buf, sizeof(buf), "Julia %.4f%+.4fi  x%.4g  %s",
                      fractal.julia_c.re, fractal.julia_c.im,
                      view.zoom_factor(), palette_name(palette.id));
    } else {
        std::snprintf(buf, sizeof(buf), "Mandelbrot %.4f%+.4fi  x%.4g  %s",
                      c.re, c.im, view.zoom_factor(), palette_name(palette.id));
    }
    return buf;
}

FavoriteView favorite_from_request(const RenderRequest& request)
{
    FavoriteView f;
    f.view           = request.viewport;
    f.fractal        = request.fractal;
    f.palette        = request.palette;
    f.max_iterations = request.max_iterations;
    return f;
}

bool operator==(const FavoriteView& a, const FavoriteView& b)
{
    return a.view == b.view && a.fractal == b.fractal &&
           a.palette == b.palette && a.max_iterations == b.max_iterations;
}

int FavoriteList::add(const FavoriteView& fav)
{
    const auto it = std::find(items.begin(), items.end(), fav);
    if (it != items.end())
        return static_cast<int>(it - items.begin());
    items.push_back(fav);
    return static_cast<int>(items.size()) - 1;
}

void FavoriteList::remove(int index)
{
    if (index < 0 || index >= size()) return;
    items.erase(items.begin() + index);
}
