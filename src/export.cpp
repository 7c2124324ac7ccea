#include "export.hpp"

#include <png.h>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <system_error>

#ifdef HAVE_JXL
#include <jxl/encode.h>
#include <jxl/color_encoding.h>
#include <vector>
#endif

// ---------------------------------------------------------------------------
// PNG export
//
// Pixel layout: Rgb is three packed bytes [R, G, B], which is exactly what
// PNG_COLOR_TYPE_RGB expects; rows are written straight from the buffer.
// ---------------------------------------------------------------------------
std::string export_png(const char* path, const PixelBuffer& buf)
{
    if (buf.width <= 0 || buf.height <= 0 || buf.empty())
        return "Nothing to export: empty pixel buffer";

    FILE* fp = std::fopen(path, "wb");
    if (!fp)
        return std::string("Cannot open file for writing: ") + path;

    png_structp png = png_create_write_struct(
        PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        std::fclose(fp);
        return "png_create_write_struct failed";
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        std::fclose(fp);
        return "png_create_info_struct failed";
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        std::fclose(fp);
        return "PNG write error (libpng longjmp)";
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(buf.width),
                 static_cast<png_uint_32>(buf.height),
                 8, PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);

    for (int y = 0; y < buf.height; ++y) {
        const png_const_bytep row = reinterpret_cast<png_const_bytep>(buf.row(y));
        png_write_row(png, row);
    }

    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    if (std::fclose(fp) != 0)
        return std::string("Error closing ") + path;
    return {};  // success
}

// ---------------------------------------------------------------------------
// JPEG XL export (lossless RGB, 8-bit)
// ---------------------------------------------------------------------------
#ifdef HAVE_JXL
std::string export_jxl(const char* path, const PixelBuffer& buf)
{
    if (buf.width <= 0 || buf.height <= 0 || buf.empty())
        return "Nothing to export: empty pixel buffer";

    JxlEncoder* enc = JxlEncoderCreate(nullptr);
    if (!enc) return "JxlEncoderCreate failed";

    // Basic image info
    JxlBasicInfo bi;
    JxlEncoderInitBasicInfo(&bi);
    bi.xsize                     = static_cast<uint32_t>(buf.width);
    bi.ysize                     = static_cast<uint32_t>(buf.height);
    bi.bits_per_sample           = 8;
    bi.exponent_bits_per_sample  = 0;
    bi.alpha_bits                = 0;
    bi.num_color_channels        = 3;
    bi.num_extra_channels        = 0;
    bi.uses_original_profile     = JXL_TRUE;

    if (JxlEncoderSetBasicInfo(enc, &bi) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetBasicInfo failed";
    }

    // sRGB colour encoding
    JxlColorEncoding color;
    JxlColorEncodingSetToSRGB(&color, /*is_gray=*/JXL_FALSE);
    if (JxlEncoderSetColorEncoding(enc, &color) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetColorEncoding failed";
    }

    // Frame settings: lossless
    JxlEncoderFrameSettings* opts = JxlEncoderFrameSettingsCreate(enc, nullptr);
    if (JxlEncoderSetFrameLossless(opts, JXL_TRUE) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetFrameLossless failed";
    }

    JxlPixelFormat fmt = {3, JXL_TYPE_UINT8, JXL_NATIVE_ENDIAN, 0};
    const size_t data_size = static_cast<size_t>(buf.width) * buf.height * 3;
    if (JxlEncoderAddImageFrame(opts, &fmt, buf.bytes(), data_size)
            != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderAddImageFrame failed";
    }
    JxlEncoderCloseInput(enc);

    // Collect compressed output
    std::vector<uint8_t> output(65536);
    uint8_t* next_out  = output.data();
    size_t   avail_out = output.size();
    JxlEncoderStatus status;
    while ((status = JxlEncoderProcessOutput(enc, &next_out, &avail_out))
               == JXL_ENC_NEED_MORE_OUTPUT) {
        const size_t used = next_out - output.data();
        output.resize(output.size() * 2);
        next_out  = output.data() + used;
        avail_out = output.size() - used;
    }
    JxlEncoderDestroy(enc);

    if (status != JXL_ENC_SUCCESS)
        return "JxlEncoderProcessOutput failed";

    output.resize(static_cast<size_t>(next_out - output.data()));

    FILE* fp = std::fopen(path, "wb");
    if (!fp) return std::string("Cannot open file for writing: ") + path;
    const size_t written = std::fwrite(output.data(), 1, output.size(), fp);
    const bool   closed  = std::fclose(fp) == 0;
    if (written != output.size() || !closed)
        return std::string("Short write to ") + path;
    return {};  // success
}
#endif  // HAVE_JXL

// ---------------------------------------------------------------------------
// Format selection
// ---------------------------------------------------------------------------
const char* image_format_ext(ImageFormat fmt)
{
    return fmt == ImageFormat::Jxl ? "jxl" : "png";
}

std::optional<ImageFormat> image_format_for_path(const std::string& path)
{
    std::string ext = std::filesystem::path(path).extension().string();
    for (char& c : ext)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (ext == ".png") return ImageFormat::Png;
    if (ext == ".jxl") return ImageFormat::Jxl;
    return std::nullopt;
}

std::string export_image(const char* path, const PixelBuffer& buf, ImageFormat fmt)
{
    switch (fmt) {
        case ImageFormat::Jxl:
#ifdef HAVE_JXL
            return export_jxl(path, buf);
#else
            return "JPEG XL export is not available in this build";
#endif
        case ImageFormat::Png:
        default:
            return export_png(path, buf);
    }
}

// ---------------------------------------------------------------------------
// Output location
// ---------------------------------------------------------------------------
std::string ensure_directory(const std::string& dir)
{
    if (dir.empty()) return {};
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
        return "Failed to create directory " + dir + ": " + ec.message();
    return {};
}

std::string export_file_name(const std::string& dir, PaletteId palette,
                             int width, int height, bool high_res,
                             const char* ext, std::time_t when)
{
    char ts[32] = "00000000_000000";
    if (const std::tm* tm = std::localtime(&when))
        std::strftime(ts, sizeof(ts), "%Y%m%d_%H%M%S", tm);

    char name[256];
    std::snprintf(name, sizeof(name), "fractal_%s_%s_%dx%d_%s.%s",
                  palette_slug(palette), ts, width, height,
                  high_res ? "highres" : "std", ext);

    if (dir.empty()) return name;
    return (std::filesystem::path(dir) / name).string();
}
