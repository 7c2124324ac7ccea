#pragma once

#include <stdexcept>
#include <string>

enum class FractalErrc {
    OutOfBounds,          // pixel coordinate outside the addressed grid
    DegenerateSelection,  // zoom rectangle with zero width or height
    InvalidRequest,       // zero iterations, zero-sized resolution, bad extents
};

inline const char* errc_name(FractalErrc code)
{
    switch (code) {
        case FractalErrc::OutOfBounds:         return "OutOfBounds";
        case FractalErrc::DegenerateSelection: return "DegenerateSelection";
        case FractalErrc::InvalidRequest:      return "InvalidRequest";
    }
    return "Unknown";
}

class FractalError : public std::runtime_error {
public:
    FractalError(FractalErrc code, const std::string& what)
        : std::runtime_error(std::string(errc_name(code)) + ": " + what)
        , code_(code)
    {}

    FractalErrc code() const noexcept { return code_; }

private:
    FractalErrc code_;
};
