#include "cli_options.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace {

// argv[0] is filled in; args are the flags after it.
bool parse(std::vector<const char*> args, CliOptions& o)
{
    args.insert(args.begin(), "fracview-render");
    return parse_args(static_cast<int>(args.size()), args.data(), o);
}

}  // namespace

TEST(CliOptions, DefaultsWithoutArguments)
{
    CliOptions o;
    ASSERT_TRUE(parse({}, o));
    EXPECT_EQ(o.width, DEFAULT_WIDTH);
    EXPECT_EQ(o.center, (ComplexPoint{DEFAULT_CENTER_RE, DEFAULT_CENTER_IM}));
    EXPECT_FALSE(o.fractal.is_julia());
    EXPECT_TRUE(o.out.empty());
}

TEST(CliOptions, ParsesViewAndJulia)
{
    CliOptions o;
    ASSERT_TRUE(parse({"--width", "320", "--height", "240", "--center", "-0.75", "0.1",
                       "--half-height", "1e-3", "--julia", "-0.8", "0.156",
                       "--iter", "500", "--palette", "Ocean", "--out", "x.png"}, o));
    EXPECT_EQ(o.width, 320);
    EXPECT_EQ(o.height, 240);
    EXPECT_EQ(o.center, (ComplexPoint{-0.75, 0.1}));
    EXPECT_EQ(o.half_height, 1e-3);
    ASSERT_TRUE(o.fractal.is_julia());
    EXPECT_EQ(o.fractal.julia_c, (ComplexPoint{-0.8, 0.156}));
    EXPECT_EQ(o.max_iter, 500);
    EXPECT_EQ(o.palette.id, PaletteId::Ocean);
    EXPECT_EQ(o.out, "x.png");
}

TEST(CliOptions, NonFiniteNumbersAreRejected)
{
    for (const char* bad : {"nan", "NaN", "inf", "-inf", "infinity", "1e999"}) {
        CliOptions o;
        EXPECT_FALSE(parse({"--center", bad, "0"}, o)) << bad;
        EXPECT_FALSE(parse({"--center", "0", bad}, o)) << bad;
        EXPECT_FALSE(parse({"--half-height", bad}, o)) << bad;
        EXPECT_FALSE(parse({"--julia", bad, "0"}, o)) << bad;
    }
    double v = 0.0;
    EXPECT_FALSE(parse_double("nan", v));
    EXPECT_TRUE(parse_double("-1.5e-12", v));
    EXPECT_EQ(v, -1.5e-12);
}

TEST(CliOptions, UserColorsMustBeSixHexDigits)
{
    CliOptions o;
    ASSERT_TRUE(parse({"--user-colors", "#102030", "FFffFF"}, o));
    EXPECT_EQ(o.palette.id, PaletteId::UserDefined);
    EXPECT_EQ(o.palette.user_a, (Rgb{0x10, 0x20, 0x30}));
    EXPECT_EQ(o.palette.user_b, (Rgb{255, 255, 255}));

    CliOptions neg;
    EXPECT_FALSE(parse({"--user-colors", "-00001", "000000"}, neg));
    CliOptions blank;
    EXPECT_FALSE(parse({"--user-colors", "000000", " 12345"}, blank));
}

TEST(CliOptions, MalformedCommandLines)
{
    CliOptions o;
    EXPECT_FALSE(parse({"--width"}, o));
    EXPECT_FALSE(parse({"--width", "12px"}, o));
    EXPECT_FALSE(parse({"--center", "0.5"}, o));
    EXPECT_FALSE(parse({"--palette", "mauve"}, o));
    EXPECT_FALSE(parse({"--frobnicate"}, o));
}
