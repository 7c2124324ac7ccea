#include "palette.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace {

struct PaletteInfo {
    const char* name;
    const char* slug;
};

const PaletteInfo g_palette_info[PALETTE_COUNT] = {
    {"Classic",      "classic"},
    {"Fire",         "fire"},
    {"Ocean",        "ocean"},
    {"Forest",       "forest"},
    {"Rainbow",      "rainbow"},
    {"Pastel",       "pastel"},
    {"Sunset",       "sunset"},
    {"Ice",          "ice"},
    {"Neon",         "neon"},
    {"Grayscale",    "grayscale"},
    {"User Defined", "userdefined"},
};

// ---------------------------------------------------------------------------
// Color-stop gradients. Stops are sorted by t, first at 0 and last at 1.
// ---------------------------------------------------------------------------
struct ColorStop { double t; uint8_t r, g, b; };

// Classic  (blue → violet → red)
const ColorStop s_classic[] = {
    {0.0,   0,   0, 255},
    {0.5, 128,   0, 128},
    {1.0, 255,   0,   0},
};

// Fire  (black → dark-red → red → orange → yellow → white)
const ColorStop s_fire[] = {
    {0.000,   0,   0,   0},
    {0.250, 128,   0,   0},
    {0.500, 255,   0,   0},
    {0.750, 255, 128,   0},
    {0.875, 255, 255,   0},
    {1.000, 255, 255, 255},
};

// Ocean  (black → navy → teal → foam)
const ColorStop s_ocean[] = {
    {0.00,   0,   0,   0},
    {0.35,   0,  64, 128},
    {0.70,   0, 128, 230},
    {1.00, 180, 240, 255},
};

// Forest  (black → dark-green → green → lime → pale-green)
const ColorStop s_forest[] = {
    {0.00,   0,   0,   0},
    {0.25,   0,  64,   0},
    {0.50,   0, 160,   0},
    {0.75, 100, 220,   0},
    {1.00, 200, 255, 180},
};

// Rainbow  (hue ramp red → yellow → green → cyan → blue → magenta)
const ColorStop s_rainbow[] = {
    {0.0, 255,   0,   0},
    {0.2, 255, 255,   0},
    {0.4,   0, 255,   0},
    {0.6,   0, 255, 255},
    {0.8,   0,   0, 255},
    {1.0, 255,   0, 255},
};

// Pastel  (lavender → blush → mint)
const ColorStop s_pastel[] = {
    {0.0, 200, 200, 255},
    {0.5, 255, 210, 230},
    {1.0, 200, 255, 210},
};

// Sunset  (black → deep-red → orange → yellow → pale-yellow)
const ColorStop s_sunset[] = {
    {0.00,   0,   0,   0},
    {0.30, 128,   0,  32},
    {0.55, 255,  64,   0},
    {0.80, 255, 200,   0},
    {1.00, 255, 255, 180},
};

// Ice  (black → dark-blue → blue → cyan → white)
const ColorStop s_ice[] = {
    {0.00,   0,   0,   0},
    {0.25,   0,   0, 128},
    {0.50,   0,  64, 255},
    {0.75,   0, 200, 255},
    {1.00, 255, 255, 255},
};

// Neon  (deep purple → hot pink → acid green → white)
const ColorStop s_neon[] = {
    {0.00,  20,   0,  40},
    {0.33, 255,   0, 200},
    {0.66,  57, 255,  20},
    {1.00, 255, 255, 255},
};

const ColorStop s_grayscale[] = {
    {0.0,   0,   0,   0},
    {1.0, 255, 255, 255},
};

struct Gradient {
    const ColorStop* stops;
    int              n;
};

template<int N>
constexpr Gradient gradient(const ColorStop (&s)[N]) { return {s, N}; }

// Indexed by PaletteId; UserDefined has no table.
const Gradient g_gradients[PALETTE_COUNT - 1] = {
    gradient(s_classic),
    gradient(s_fire),
    gradient(s_ocean),
    gradient(s_forest),
    gradient(s_rainbow),
    gradient(s_pastel),
    gradient(s_sunset),
    gradient(s_ice),
    gradient(s_neon),
    gradient(s_grayscale),
};

uint8_t channel(double a, double b, double f)
{
    const double v = a + (b - a) * f;
    return static_cast<uint8_t>(std::lround(std::max(0.0, std::min(255.0, v))));
}

Rgb lerp(const Rgb& a, const Rgb& b, double f)
{
    return {channel(a.r, b.r, f), channel(a.g, b.g, f), channel(a.b, b.b, f)};
}

Rgb sample(const Gradient& g, double t)
{
    // Find the segment [stops[seg], stops[seg+1]] that contains t.
    int seg = g.n - 2;
    for (int s = 0; s < g.n - 1; ++s) {
        if (t <= g.stops[s + 1].t) { seg = s; break; }
    }
    const ColorStop& a = g.stops[seg];
    const ColorStop& b = g.stops[seg + 1];
    const double span = b.t - a.t;
    const double f    = (span > 0.0) ? (t - a.t) / span : 0.0;
    return lerp({a.r, a.g, a.b}, {b.r, b.g, b.b}, std::max(0.0, std::min(1.0, f)));
}

std::string lower(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char ch : s)
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return out;
}

}  // namespace

Rgb palette_color(const Palette& palette, double t)
{
    // NaN maps to 0 along with negatives.
    t = (t > 0.0) ? std::min(t, 1.0) : 0.0;

    if (palette.id == PaletteId::UserDefined)
        return lerp(palette.user_a, palette.user_b, t);

    const int idx = static_cast<int>(palette.id);
    if (idx < 0 || idx >= PALETTE_COUNT - 1)
        return sample(g_gradients[0], t);
    return sample(g_gradients[idx], t);
}

const char* palette_name(PaletteId id)
{
    const int idx = static_cast<int>(id);
    return (idx >= 0 && idx < PALETTE_COUNT) ? g_palette_info[idx].name : "Unknown";
}

const char* palette_slug(PaletteId id)
{
    const int idx = static_cast<int>(id);
    return (idx >= 0 && idx < PALETTE_COUNT) ? g_palette_info[idx].slug : "unknown";
}

std::optional<PaletteId> palette_from_name(const std::string& name)
{
    const std::string key = lower(name);
    for (int i = 0; i < PALETTE_COUNT; ++i) {
        if (key == g_palette_info[i].slug || key == lower(g_palette_info[i].name))
            return static_cast<PaletteId>(i);
    }
    return std::nullopt;
}

PaletteId next_palette(PaletteId id, int dir)
{
    const int step = (dir < 0) ? -1 : 1;
    return static_cast<PaletteId>((static_cast<int>(id) + step + PALETTE_COUNT) % PALETTE_COUNT);
}

std::optional<Rgb> parse_hex_color(const std::string& text)
{
    const size_t start = (!text.empty() && text[0] == '#') ? 1 : 0;
    if (text.size() - start != 6) return std::nullopt;

    uint32_t v = 0;
    for (size_t i = start; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isxdigit(c)) return std::nullopt;
        const int digit = std::isdigit(c) ? c - '0' : std::tolower(c) - 'a' + 10;
        v = (v << 4) | static_cast<uint32_t>(digit);
    }
    return Rgb{static_cast<uint8_t>((v >> 16) & 0xFF),
               static_cast<uint8_t>((v >>  8) & 0xFF),
               static_cast<uint8_t>( v        & 0xFF)};
}
