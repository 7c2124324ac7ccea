#pragma once

#include <cstdint>
#include <optional>
#include <string>

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

inline bool operator==(const Rgb& a, const Rgb& b) { return a.r == b.r && a.g == b.g && a.b == b.b; }
inline bool operator!=(const Rgb& a, const Rgb& b) { return !(a == b); }

enum class PaletteId {
    Classic     = 0,
    Fire        = 1,
    Ocean       = 2,
    Forest      = 3,
    Rainbow     = 4,
    Pastel      = 5,
    Sunset      = 6,
    Ice         = 7,
    Neon        = 8,
    Grayscale   = 9,
    UserDefined = 10,  // two-colour gradient between Palette::user_a and user_b
};
constexpr int PALETTE_COUNT = 11;

// Points that never escape are drawn in this colour whatever the palette.
constexpr Rgb INTERIOR_COLOR = {0, 0, 0};

struct Palette {
    PaletteId id     = PaletteId::Classic;
    Rgb       user_a = {0, 255, 255};
    Rgb       user_b = {255, 0, 255};
};

inline bool operator==(const Palette& a, const Palette& b)
{
    return a.id == b.id && a.user_a == b.user_a && a.user_b == b.user_b;
}
inline bool operator!=(const Palette& a, const Palette& b) { return !(a == b); }

// Map a normalized escape value to a colour. t is clamped to [0, 1].
Rgb palette_color(const Palette& palette, double t);

// As palette_color, but non-escaped points get INTERIOR_COLOR.
inline Rgb escape_color(const Palette& palette, bool escaped, double t)
{
    return escaped ? palette_color(palette, t) : INTERIOR_COLOR;
}

// "Classic", "User Defined", ...
const char* palette_name(PaletteId id);

// Lower-case, space-free form for file names: "classic", "userdefined", ...
const char* palette_slug(PaletteId id);

// Accepts either the display name or the slug, case-insensitively.
std::optional<PaletteId> palette_from_name(const std::string& name);

// Step through the palette list, wrapping at both ends. dir is +1 or -1.
PaletteId next_palette(PaletteId id, int dir);

// "RRGGBB" or "#RRGGBB", exactly six hex digits, either case.
std::optional<Rgb> parse_hex_color(const std::string& text);
