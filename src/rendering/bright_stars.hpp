#pragma once

/// @file bright_stars.hpp
/// @brief Built-in list of bright stars and their chart colour and stereo depth.

#include "astro/coordinates.hpp"
#include "core/types.hpp"
#include "raster/color.hpp"

#include <span>
#include <string_view>

namespace skychart::rendering
{
    enum class SpectralClass : u8
    {
        O, B, A, F, G, K, M,
        Unknown,
    };

    /// @brief One catalogued star, equatorial J2000.
    struct BrightStar
    {
        std::string_view name;
        f64 ra_rad;
        f64 dec_rad;
        f64 distance_pc;        ///< 0 = unknown
        f32 v_magnitude;
        SpectralClass spectral_class;

        [[nodiscard]] astro::SkyPosition position() const
        {
            return astro::SkyPosition{.lon = ra_rad, .lat = dec_rad};
        }
    };

    /// @brief The two dozen brightest and nearest naked-eye stars.
    [[nodiscard]] std::span<const BrightStar> builtin_bright_stars();

    /// @brief Approximate effective temperature (K) of a spectral class.
    [[nodiscard]] f64 effective_temperature(SpectralClass sc);

    /// @brief Blackbody colour for a temperature (Tanner Helland fit), opaque.
    [[nodiscard]] raster::Color blackbody_color(f64 temperature_k);

    /// @brief Stereo depth for a distance: 50·log10(d) clamped to [0, 200].
    ///
    /// 100 pc lands on the screen plane (reference depth 100); unknown
    /// distances are drawn there too.
    [[nodiscard]] f32 stereo_depth(f64 distance_pc);

} // namespace skychart::rendering
