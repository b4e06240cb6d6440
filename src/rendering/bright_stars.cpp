/// @file bright_stars.cpp
/// @brief Built-in bright star table and blackbody colours.

#include "rendering/bright_stars.hpp"

#include <glm/trigonometric.hpp>

#include <algorithm>
#include <array>
#include <cmath>

namespace skychart::rendering
{

namespace
{

struct Entry
{
    std::string_view name;
    f64 ra_deg;
    f64 dec_deg;
    f64 dist_pc;
    f32 v_mag;
    SpectralClass sc;
};

// Hipparcos positions (J2000), distances in parsecs
constexpr std::array kEntries{
    Entry{"Sirius",            101.287, -16.716,   2.64, -1.46f, SpectralClass::A},
    Entry{"Canopus",            95.988, -52.696, 310.0,  -0.72f, SpectralClass::A},
    Entry{"Alpha Centauri A",  219.902, -60.834,   1.34, -0.01f, SpectralClass::G},
    Entry{"Arcturus",          213.915,  19.182,  11.3,  -0.05f, SpectralClass::K},
    Entry{"Vega",              279.235,  38.784,   7.68,  0.03f, SpectralClass::A},
    Entry{"Rigel",              78.634,  -8.202, 264.0,   0.18f, SpectralClass::B},
    Entry{"Procyon",           114.827,   5.225,   3.51,  0.34f, SpectralClass::F},
    Entry{"Betelgeuse",         88.793,   7.407, 197.0,   0.42f, SpectralClass::M},
    Entry{"Achernar",           24.429, -57.237,  44.0,   0.46f, SpectralClass::B},
    Entry{"Hadar",             210.956, -60.373, 161.0,   0.61f, SpectralClass::B},
    Entry{"Altair",            297.696,   8.868,   5.13,  0.76f, SpectralClass::A},
    Entry{"Acrux",             186.650, -63.099, 321.0,   0.76f, SpectralClass::B},
    Entry{"Aldebaran",          68.980,  16.509,  20.0,   0.87f, SpectralClass::K},
    Entry{"Spica",             201.298, -11.161, 250.0,   0.97f, SpectralClass::B},
    Entry{"Antares",           247.352, -26.432, 170.0,   1.06f, SpectralClass::M},
    Entry{"Pollux",            116.329,  28.026,  10.3,   1.14f, SpectralClass::K},
    Entry{"Fomalhaut",         344.413, -29.622,   7.69,  1.16f, SpectralClass::A},
    Entry{"Deneb",             310.358,  45.280, 802.0,   1.25f, SpectralClass::A},
    Entry{"Regulus",           152.093,  11.967,  77.5,   1.35f, SpectralClass::B},
    Entry{"Castor",            113.650,  31.889,  15.6,   1.58f, SpectralClass::A},
    Entry{"Polaris",            37.954,  89.264, 133.0,   1.97f, SpectralClass::F},
    Entry{"Alpha Centauri B",  219.902, -60.834,   1.34,  1.33f, SpectralClass::K},
    Entry{"Barnard's Star",    269.452,   4.693,   1.83,  9.54f, SpectralClass::M},
    Entry{"Proxima Centauri",  217.429, -62.679,   1.30, 11.13f, SpectralClass::M},
};

std::array<BrightStar, kEntries.size()> build_table()
{
    std::array<BrightStar, kEntries.size()> stars{};
    for (std::size_t i = 0; i < kEntries.size(); ++i)
    {
        const Entry& e = kEntries[i];
        stars[i] = BrightStar{
            .name = e.name,
            .ra_rad = glm::radians(e.ra_deg),
            .dec_rad = glm::radians(e.dec_deg),
            .distance_pc = e.dist_pc,
            .v_magnitude = e.v_mag,
            .spectral_class = e.sc,
        };
    }
    return stars;
}

constexpr f64 kMinTemperature = 1000.0;
constexpr f64 kMaxTemperature = 40000.0;
constexpr f32 kMaxStereoDepth = 200.0f;
constexpr f32 kScreenPlaneDepth = 100.0f;

} // anonymous namespace

std::span<const BrightStar> builtin_bright_stars()
{
    static const auto table = build_table();
    return table;
}

f64 effective_temperature(SpectralClass sc)
{
    switch (sc)
    {
        case SpectralClass::O: return 40000.0;
        case SpectralClass::B: return 20000.0;
        case SpectralClass::A: return 8500.0;
        case SpectralClass::F: return 6500.0;
        case SpectralClass::G: return 5500.0;
        case SpectralClass::K: return 4000.0;
        case SpectralClass::M: return 3000.0;
        case SpectralClass::Unknown: break;
    }
    return 5778.0;
}

// -----------------------------------------------------------------
// Blackbody colour
//
// Piecewise fit in T/100 with the break at 6600 K:
//   red:   255 below, 329.70·(t-60)^-0.1332 above
//   green: 99.47·ln(t) - 161.12 below, 288.12·(t-60)^-0.0755 above
//   blue:  255 above, 0 under 1900 K, 138.52·ln(t-10) - 305.04 between
// -----------------------------------------------------------------

raster::Color blackbody_color(f64 temperature_k)
{
    const f64 t = std::clamp(temperature_k, kMinTemperature, kMaxTemperature) / 100.0;

    f64 r = 255.0;
    f64 g = 0.0;
    f64 b = 255.0;

    if (t <= 66.0)
    {
        g = 99.4708025861 * std::log(t) - 161.1195681661;
        b = (t <= 19.0) ? 0.0 : 138.5177312231 * std::log(t - 10.0) - 305.0447927307;
    }
    else
    {
        r = 329.698727446 * std::pow(t - 60.0, -0.1332047592);
        g = 288.1221695283 * std::pow(t - 60.0, -0.0755148492);
    }

    auto channel = [](f64 v) { return static_cast<u8>(std::clamp(v, 0.0, 255.0)); };
    return raster::Color{.r = channel(r), .g = channel(g), .b = channel(b), .a = 255};
}

f32 stereo_depth(f64 distance_pc)
{
    if (!(distance_pc > 0.0) || !std::isfinite(distance_pc))
    {
        return kScreenPlaneDepth;
    }
    const f32 depth = static_cast<f32>(50.0 * std::log10(distance_pc));
    return std::clamp(depth, 0.0f, kMaxStereoDepth);
}

} // namespace skychart::rendering
