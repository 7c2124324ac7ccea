#pragma once

#include "view_state.hpp"

#include <string>
#include <vector>

// A saved view: everything needed to rebuild a RenderRequest except the
// output resolution.
struct FavoriteView {
    Viewport    view           = Viewport::default_view(DEFAULT_WIDTH, DEFAULT_HEIGHT);
    FractalKind fractal        = FractalKind::mandelbrot();
    Palette     palette        = {};
    int         max_iterations = DEFAULT_MAX_ITER;

    // Request at the saved view's own grid.
    RenderRequest to_request() const;

    // Request at another resolution; the view keeps its complex-plane bounds.
    RenderRequest to_request(int width, int height) const;

    // "Julia -0.8000+0.1560i  x12.5  Fire"
    std::string label() const;
};

FavoriteView favorite_from_request(const RenderRequest& request);

bool operator==(const FavoriteView& a, const FavoriteView& b);
inline bool operator!=(const FavoriteView& a, const FavoriteView& b) { return !(a == b); }

// Favorites kept by the viewer for the session.
class FavoriteList {
public:
    // Adds unless an identical favorite is already stored; returns its index.
    int add(const FavoriteView& fav);

    // Out-of-range indices are ignored.
    void remove(int index);

    const FavoriteView& at(int index) const { return items.at(static_cast<size_t>(index)); }
    int  size()  const { return static_cast<int>(items.size()); }
    bool empty() const { return items.empty(); }

private:
    std::vector<FavoriteView> items;
};
