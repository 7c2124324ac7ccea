#pragma once

#include "view_state.hpp"

#include <string>

// Command line of fracview-render.
struct CliOptions {
    int          width       = DEFAULT_WIDTH;
    int          height      = DEFAULT_HEIGHT;
    ComplexPoint center      = {DEFAULT_CENTER_RE, DEFAULT_CENTER_IM};
    double       half_height = DEFAULT_HALF_HEIGHT;
    FractalKind  fractal     = FractalKind::mandelbrot();
    Palette      palette     = {};
    int          max_iter    = DEFAULT_MAX_ITER;
    int          threads     = 0;
    int          partitions  = 0;
    std::string  out;
    bool         benchmark   = false;
    bool         verbose     = false;
};

// Whole-string integer in int range.
bool parse_int(const char* s, int& out);

// Whole-string finite double; nan and inf are rejected.
bool parse_double(const char* s, double& out);

// Returns false on a malformed command line; the error is already logged.
bool parse_args(int argc, const char* const argv[], CliOptions& o);
