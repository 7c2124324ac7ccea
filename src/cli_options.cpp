#include "cli_options.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdlib>
#include <optional>

bool parse_int(const char* s, int& out)
{
    char* end = nullptr;
    const long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0' || v < -2147483647L || v > 2147483647L) return false;
    out = static_cast<int>(v);
    return true;
}

bool parse_double(const char* s, double& out)
{
    char* end = nullptr;
    const double v = std::strtod(s, &end);
    if (end == s || *end != '\0' || !std::isfinite(v)) return false;
    out = v;
    return true;
}

static bool parse_color(const char* s, Rgb& out)
{
    const std::optional<Rgb> c = parse_hex_color(s);
    if (!c) return false;
    out = *c;
    return true;
}

bool parse_args(int argc, const char* const argv[], CliOptions& o)
{
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto need = [&](int n) {
            if (i + n >= argc) {
                spdlog::error("{} expects {} argument{}", a, n, n > 1 ? "s" : "");
                return false;
            }
            return true;
        };
        bool ok = true;
        if (a == "--width")            ok = need(1) && parse_int(argv[++i], o.width);
        else if (a == "--height")      ok = need(1) && parse_int(argv[++i], o.height);
        else if (a == "--center") {
            ok = need(2) && parse_double(argv[i + 1], o.center.re) &&
                 parse_double(argv[i + 2], o.center.im);
            if (ok) i += 2;
        }
        else if (a == "--half-height") ok = need(1) && parse_double(argv[++i], o.half_height);
        else if (a == "--julia") {
            ComplexPoint c;
            ok = need(2) && parse_double(argv[i + 1], c.re) && parse_double(argv[i + 2], c.im);
            if (ok) { o.fractal = FractalKind::julia(c); i += 2; }
        }
        else if (a == "--iter")        ok = need(1) && parse_int(argv[++i], o.max_iter);
        else if (a == "--palette") {
            ok = need(1);
            if (ok) {
                const auto id = palette_from_name(argv[++i]);
                ok = id.has_value();
                if (ok) o.palette.id = *id;
                else spdlog::error("unknown palette '{}'", argv[i]);
            }
        }
        else if (a == "--user-colors") {
            ok = need(2) && parse_color(argv[i + 1], o.palette.user_a) &&
                 parse_color(argv[i + 2], o.palette.user_b);
            if (ok) { o.palette.id = PaletteId::UserDefined; i += 2; }
        }
        else if (a == "--threads")     ok = need(1) && parse_int(argv[++i], o.threads);
        else if (a == "--partitions")  ok = need(1) && parse_int(argv[++i], o.partitions);
        else if (a == "--out") {
            ok = need(1);
            if (ok) o.out = argv[++i];
        }
        else if (a == "--benchmark")   o.benchmark = true;
        else if (a == "--verbose")     o.verbose = true;
        else {
            spdlog::error("unknown option '{}'", a);
            ok = false;
        }
        if (!ok) {
            spdlog::error("bad value for {}", a);
            return false;
        }
    }
    return true;
}
