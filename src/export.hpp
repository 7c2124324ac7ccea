#pragma once

#include "renderer.hpp"
#include "palette.hpp"

#include <ctime>
#include <optional>
#include <string>

// Default output directory, relative to the working directory.
constexpr const char* DEFAULT_EXPORT_DIR = "fractals";

// Fixed target of "Save High-Res PNG".
constexpr int HIGHRES_WIDTH  = 3200;
constexpr int HIGHRES_HEIGHT = 2400;

// Returns empty string on success, or an error message on failure.
std::string export_png(const char* path, const PixelBuffer& buf);

#ifdef HAVE_JXL
std::string export_jxl(const char* path, const PixelBuffer& buf);
#endif

// True when compiled with JPEG XL support.
inline bool jxl_available()
{
#ifdef HAVE_JXL
    return true;
#else
    return false;
#endif
}

enum class ImageFormat { Png, Jxl };

// "png" or "jxl", without the dot.
const char* image_format_ext(ImageFormat fmt);

// Format named by the path's extension (.png or .jxl, any case).
std::optional<ImageFormat> image_format_for_path(const std::string& path);

// Writes buf in exactly the format given. Jxl without JPEG XL support is
// an error, never a silent fallback to PNG.
std::string export_image(const char* path, const PixelBuffer& buf, ImageFormat fmt);

// Creates dir (and parents) if needed. Empty string on success.
std::string ensure_directory(const std::string& dir);

// "<dir>/fractal_<palette>_<YYYYmmdd_HHMMSS>_<W>x<H>_<std|highres>.<ext>"
std::string export_file_name(const std::string& dir, PaletteId palette,
                             int width, int height, bool high_res,
                             const char* ext, std::time_t when);
