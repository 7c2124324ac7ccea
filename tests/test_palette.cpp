#include "palette.hpp"
#include "fractal.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <optional>

namespace {

Palette gray_gradient()
{
    Palette p;
    p.id     = PaletteId::UserDefined;
    p.user_a = {0, 0, 0};
    p.user_b = {255, 255, 255};
    return p;
}

int channel_distance(const Rgb& a, const Rgb& b)
{
    return std::max({std::abs(a.r - b.r), std::abs(a.g - b.g), std::abs(a.b - b.b)});
}

}  // namespace

TEST(Palette, UserGradientEndpointsAndMidpoint)
{
    const Palette p = gray_gradient();
    EXPECT_EQ(palette_color(p, 0.0), (Rgb{0, 0, 0}));
    EXPECT_EQ(palette_color(p, 1.0), (Rgb{255, 255, 255}));

    const Rgb mid = palette_color(p, 0.5);
    EXPECT_LE(channel_distance(mid, Rgb{128, 128, 128}), 1);
    EXPECT_EQ(mid.r, mid.g);
    EXPECT_EQ(mid.g, mid.b);
}

TEST(Palette, UserGradientRunsFromFirstToSecondColour)
{
    Palette p;
    p.id     = PaletteId::UserDefined;
    p.user_a = {255, 0, 10};
    p.user_b = {0, 200, 10};
    EXPECT_EQ(palette_color(p, 0.0), p.user_a);
    EXPECT_EQ(palette_color(p, 1.0), p.user_b);
    const Rgb q = palette_color(p, 0.25);
    EXPECT_LE(channel_distance(q, Rgb{191, 50, 10}), 1);
}

TEST(Palette, InputIsClampedToUnitRange)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    for (int i = 0; i < PALETTE_COUNT; ++i) {
        Palette p = gray_gradient();
        p.id = static_cast<PaletteId>(i);
        EXPECT_EQ(palette_color(p, -3.0), palette_color(p, 0.0)) << palette_name(p.id);
        EXPECT_EQ(palette_color(p, 42.0), palette_color(p, 1.0)) << palette_name(p.id);
        EXPECT_EQ(palette_color(p, nan),  palette_color(p, 0.0)) << palette_name(p.id);
    }
}

TEST(Palette, GradientsAreContinuous)
{
    // Neighbouring samples never jump by more than a few levels.
    for (int i = 0; i < PALETTE_COUNT; ++i) {
        Palette p = gray_gradient();
        p.id = static_cast<PaletteId>(i);
        Rgb prev = palette_color(p, 0.0);
        for (int k = 1; k <= 1000; ++k) {
            const Rgb c = palette_color(p, k / 1000.0);
            EXPECT_LE(channel_distance(prev, c), 8) << palette_name(p.id) << " at " << k;
            prev = c;
        }
    }
}

TEST(Palette, InteriorPointsAreBlackForEveryPalette)
{
    IterationResult interior;
    interior.escaped         = false;
    interior.iteration_count = 100;
    interior.smoothed_value  = 100.0;
    for (int i = 0; i < PALETTE_COUNT; ++i) {
        Palette p;
        p.id = static_cast<PaletteId>(i);
        EXPECT_EQ(shade(interior, p, 100), INTERIOR_COLOR) << palette_name(p.id);
    }
}

TEST(Palette, EscapedPointsUseNormalizedSmoothedValue)
{
    const Palette p = gray_gradient();
    IterationResult r;
    r.escaped         = true;
    r.iteration_count = 49;
    r.smoothed_value  = 50.0;
    EXPECT_EQ(shade(r, p, 100), palette_color(p, 0.5));
}

TEST(Palette, NamesAndSlugsRoundTrip)
{
    for (int i = 0; i < PALETTE_COUNT; ++i) {
        const PaletteId id = static_cast<PaletteId>(i);
        EXPECT_EQ(palette_from_name(palette_name(id)), id);
        EXPECT_EQ(palette_from_name(palette_slug(id)), id);
    }
    EXPECT_EQ(palette_from_name("FIRE"), PaletteId::Fire);
    EXPECT_EQ(palette_from_name("user defined"), PaletteId::UserDefined);
    EXPECT_FALSE(palette_from_name("plasma").has_value());
    EXPECT_STREQ(palette_slug(PaletteId::UserDefined), "userdefined");
}

TEST(Palette, NextPaletteWrapsAround)
{
    EXPECT_EQ(next_palette(PaletteId::Classic, 1), PaletteId::Fire);
    EXPECT_EQ(next_palette(PaletteId::Classic, -1), PaletteId::UserDefined);
    EXPECT_EQ(next_palette(PaletteId::UserDefined, 1), PaletteId::Classic);

    PaletteId id = PaletteId::Ocean;
    for (int i = 0; i < PALETTE_COUNT; ++i) id = next_palette(id, 1);
    EXPECT_EQ(id, PaletteId::Ocean);
}

TEST(Palette, HexColorAcceptsSixDigitsWithOptionalHash)
{
    const std::optional<Rgb> orange = parse_hex_color("ff8000");
    ASSERT_TRUE(orange.has_value());
    EXPECT_EQ(*orange, (Rgb{255, 128, 0}));

    const std::optional<Rgb> upper = parse_hex_color("#0A1B2C");
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(*upper, (Rgb{0x0A, 0x1B, 0x2C}));
}

TEST(Palette, HexColorRejectsAnythingButHexDigits)
{
    // strtoul would take the sign, the blank or the 0x prefix.
    for (const char* bad : {"-00001", "+00001", " 12345", "12345 ", "0x1234",
                            "12345g", "1234567", "12345", "#", "", "##123456"}) {
        EXPECT_FALSE(parse_hex_color(bad).has_value()) << "'" << bad << "'";
    }
}
