#pragma once

/// @file coordinates.hpp
/// @brief Celestial coordinate systems and the transforms between them.

#include "core/types.hpp"

#include <string_view>

namespace skychart::astro
{
    /// @brief Spherical coordinate system a sky position is expressed in.
    enum class CoordinateSystem
    {
        Equatorial,
        Ecliptic,
        Galactic,
        Horizontal,
    };

    [[nodiscard]] std::string_view to_string(CoordinateSystem system);

    /// @brief Generic position on the celestial sphere.
    ///
    /// Meaning of the two angles depends on the coordinate system:
    /// RA/Dec, ecliptic lon/lat, galactic l/b, or azimuth/altitude.
    struct SkyPosition
    {
        f64 lon;    ///< Longitude-like angle (radians)
        f64 lat;    ///< Latitude-like angle (radians, -π/2..+π/2)
    };

    /// @brief Equatorial coordinate (J2000 epoch).
    struct EquatorialCoord
    {
        f64 ra;     ///< Right ascension (radians, 0..2π)
        f64 dec;    ///< Declination (radians, -π/2..+π/2)
    };

    /// @brief Horizontal (topocentric) coordinate.
    struct HorizontalCoord
    {
        f64 alt;    ///< Altitude (radians, -π/2..+π/2, negative = below horizon)
        f64 az;     ///< Azimuth (radians, 0..2π, 0=North, π/2=East)
    };

    /// @brief Observer geographic location.
    struct ObserverLocation
    {
        f64 latitude_rad;   ///< Geographic latitude (radians, north positive)
        f64 longitude_rad;  ///< Geographic longitude (radians, east positive)
    };

    /// @brief Everything needed to move a position between coordinate systems.
    ///
    /// Computed once per chart from the time and observer context (see
    /// TimeSystem::sky_frame). The equatorial system is the pivot.
    struct SkyFrame
    {
        ObserverLocation observer{};
        f64 local_sidereal_time_rad = 0.0;
        f64 obliquity_rad = 0.0;
    };

    /// @brief Static utility class for astronomical coordinate transformations.
    ///
    /// All angular inputs and outputs are in radians.
    class Coordinates
    {
    public:
        Coordinates() = delete;

        /// @brief Equatorial (RA/Dec) → Horizontal (Alt/Az).
        [[nodiscard]] static HorizontalCoord equatorial_to_horizontal(
            const EquatorialCoord& eq,
            const ObserverLocation& observer,
            f64 local_sidereal_time_rad
        );

        /// @brief Horizontal (Alt/Az) → Equatorial (RA/Dec).
        [[nodiscard]] static EquatorialCoord horizontal_to_equatorial(
            const HorizontalCoord& hz,
            const ObserverLocation& observer,
            f64 local_sidereal_time_rad
        );

        /// @brief Equatorial → ecliptic longitude/latitude for the given obliquity.
        [[nodiscard]] static SkyPosition equatorial_to_ecliptic(const EquatorialCoord& eq, f64 obliquity_rad);

        /// @brief Ecliptic → equatorial for the given obliquity.
        [[nodiscard]] static EquatorialCoord ecliptic_to_equatorial(const SkyPosition& ecl, f64 obliquity_rad);

        /// @brief Equatorial J2000 → galactic (l, b).
        [[nodiscard]] static SkyPosition equatorial_to_galactic(const EquatorialCoord& eq);

        /// @brief Galactic (l, b) → equatorial J2000.
        [[nodiscard]] static EquatorialCoord galactic_to_equatorial(const SkyPosition& gal);

        /// @brief Move a position from one coordinate system to another.
        ///
        /// Horizontal positions are stored as lon = azimuth, lat = altitude.
        [[nodiscard]] static SkyPosition convert(
            const SkyPosition& pos,
            CoordinateSystem from,
            CoordinateSystem to,
            const SkyFrame& frame
        );

        /// @brief Great-circle distance between two positions (radians, 0..π).
        [[nodiscard]] static f64 angular_distance(const SkyPosition& a, const SkyPosition& b);

        /// @brief Position angle of b as seen from a, measured from north through east.
        [[nodiscard]] static f64 position_angle(const SkyPosition& a, const SkyPosition& b);

        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);

        /// @brief Wrap an angle to the range [-π, π].
        [[nodiscard]] static f64 wrap_pi(f64 angle);

        // J2000 galactic north pole and node (Liu et al. 2010)
        static constexpr f64 kGalacticPoleRa  = (12.0 + 51.0 / 60.0 + 26.27549 / 3600.0) * astro_constants::kHourToRad;
        static constexpr f64 kGalacticPoleDec = (27.0 + 7.0 / 60.0 + 41.7043 / 3600.0) * astro_constants::kDegToRad;
        static constexpr f64 kGalacticNode    = 32.93191857 * astro_constants::kDegToRad;
    };

} // namespace skychart::astro
