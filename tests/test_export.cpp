#include "export.hpp"
#include "cpu_renderer.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

class ExportTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / (std::string("fracview_") + info->name());
        fs::remove_all(dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
};

std::vector<unsigned char> read_file(const fs::path& p)
{
    std::ifstream in(p, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

uint32_t be32(const std::vector<unsigned char>& b, size_t off)
{
    return (uint32_t(b[off]) << 24) | (uint32_t(b[off + 1]) << 16) |
           (uint32_t(b[off + 2]) << 8) | uint32_t(b[off + 3]);
}

}  // namespace

TEST_F(ExportTest, WritesPngWithImageSize)
{
    RenderRequest req;
    req.viewport = Viewport::default_view(37, 21);
    req.width    = 37;
    req.height   = 21;
    const PixelBuffer buf = CpuRenderer().render(req);

    ASSERT_EQ(ensure_directory(dir.string()), "");
    const fs::path out = dir / "frame.png";
    ASSERT_EQ(export_png(out.string().c_str(), buf), "");

    const std::vector<unsigned char> bytes = read_file(out);
    ASSERT_GT(bytes.size(), 33u);
    const unsigned char sig[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
    for (int i = 0; i < 8; ++i)
        EXPECT_EQ(bytes[i], sig[i]);
    // IHDR: width, height, bit depth 8, colour type 2 (RGB).
    EXPECT_EQ(std::string(bytes.begin() + 12, bytes.begin() + 16), "IHDR");
    EXPECT_EQ(be32(bytes, 16), 37u);
    EXPECT_EQ(be32(bytes, 20), 21u);
    EXPECT_EQ(bytes[24], 8);
    EXPECT_EQ(bytes[25], 2);
}

TEST_F(ExportTest, RejectsEmptyBufferAndBadPath)
{
    EXPECT_NE(export_png((dir / "empty.png").string().c_str(), PixelBuffer{}), "");

    PixelBuffer buf;
    buf.resize(4, 4);
    EXPECT_NE(export_png((dir / "missing" / "x.png").string().c_str(), buf), "");
}

TEST_F(ExportTest, EnsureDirectoryCreatesNestedPath)
{
    const fs::path nested = dir / "a" / "b";
    EXPECT_EQ(ensure_directory(nested.string()), "");
    EXPECT_TRUE(fs::is_directory(nested));
    // Already there: still fine.
    EXPECT_EQ(ensure_directory(nested.string()), "");
}

TEST_F(ExportTest, ExportImageWritesTheRequestedFormat)
{
    PixelBuffer buf;
    buf.resize(6, 4);
    ASSERT_EQ(ensure_directory(dir.string()), "");

    const fs::path png = dir / "a.png";
    ASSERT_EQ(export_image(png.string().c_str(), buf, ImageFormat::Png), "");
    const std::vector<unsigned char> png_bytes = read_file(png);
    ASSERT_GT(png_bytes.size(), 8u);
    EXPECT_EQ(png_bytes[0], 0x89);
    EXPECT_EQ(png_bytes[1], 'P');

    // The format argument wins over the file name; with no JPEG XL support
    // the write fails instead of falling back to PNG.
    const fs::path jxl = dir / "b.jxl";
    const std::string err = export_image(jxl.string().c_str(), buf, ImageFormat::Jxl);
    if (jxl_available()) {
        ASSERT_EQ(err, "");
        const std::vector<unsigned char> jxl_bytes = read_file(jxl);
        ASSERT_GT(jxl_bytes.size(), 2u);
        EXPECT_NE(jxl_bytes[0], 0x89);
    } else {
        EXPECT_NE(err, "");
        EXPECT_FALSE(fs::exists(jxl));
    }
}

TEST(ImageFormat, ChosenFromPathExtension)
{
    EXPECT_EQ(image_format_for_path("out/frame.png"), ImageFormat::Png);
    EXPECT_EQ(image_format_for_path("FRAME.PNG"), ImageFormat::Png);
    EXPECT_EQ(image_format_for_path("deep.zoom.jxl"), ImageFormat::Jxl);
    EXPECT_FALSE(image_format_for_path("frame.bmp").has_value());
    EXPECT_FALSE(image_format_for_path("png").has_value());
    EXPECT_FALSE(image_format_for_path("").has_value());

    EXPECT_STREQ(image_format_ext(ImageFormat::Png), "png");
    EXPECT_STREQ(image_format_ext(ImageFormat::Jxl), "jxl");
}

TEST(ImageFormat, ExtensionAndFormatStayTogether)
{
    // A file name built from a format maps back to that same format.
    for (ImageFormat fmt : {ImageFormat::Png, ImageFormat::Jxl}) {
        const std::string name = export_file_name(DEFAULT_EXPORT_DIR, PaletteId::Classic,
                                                  3200, 2400, true, image_format_ext(fmt), 0);
        EXPECT_EQ(image_format_for_path(name), fmt) << name;
    }
}

TEST(ExportFileName, EncodesPaletteTimeSizeAndKind)
{
    std::tm tm = {};
    tm.tm_year  = 2026 - 1900;
    tm.tm_mon   = 2;
    tm.tm_mday  = 14;
    tm.tm_hour  = 9;
    tm.tm_min   = 5;
    tm.tm_sec   = 7;
    tm.tm_isdst = -1;
    const std::time_t when = std::mktime(&tm);

    const std::string std_name = export_file_name("", PaletteId::UserDefined, 800, 600,
                                                  false, "png", when);
    EXPECT_EQ(std_name, "fractal_userdefined_20260314_090507_800x600_std.png");

    const std::string hi_name = export_file_name("out", PaletteId::Fire, 3200, 2400,
                                                 true, "jxl", when);
    EXPECT_EQ(fs::path(hi_name).filename().string(),
              "fractal_fire_20260314_090507_3200x2400_highres.jxl");
    EXPECT_EQ(fs::path(hi_name).parent_path().string(), "out");
}
