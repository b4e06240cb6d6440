#pragma once

/// @file time_system.hpp
/// @brief Time-dependent context for charts: Julian Date, sidereal time, obliquity.

#include "astro/coordinates.hpp"
#include "core/types.hpp"

namespace skychart::astro
{
    /// @brief Civil date/time representation (UTC).
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Static utility class turning a date and an observer into a SkyFrame.
    ///
    /// Julian Date conversion follows Meeus (Astronomical Algorithms, Ch. 7),
    /// sidereal time the IAU 1982 expression and obliquity the IAU 1980 series.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert civil date/time (UTC) to Julian Date.
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Greenwich Mean Sidereal Time, radians in [0, 2π).
        [[nodiscard]] static f64 gmst(f64 jd);

        /// @brief Local Mean Sidereal Time, radians in [0, 2π).
        /// @param longitude_rad Observer longitude in radians (east positive).
        [[nodiscard]] static f64 lmst(f64 jd, f64 longitude_rad);

        /// @brief Mean obliquity of the ecliptic (radians).
        [[nodiscard]] static f64 mean_obliquity(f64 jd);

        /// @brief Frame for coordinate conversions at a given instant and place.
        [[nodiscard]] static SkyFrame sky_frame(f64 jd, const ObserverLocation& observer);

        /// @brief Current system time as a Julian Date.
        [[nodiscard]] static f64 now_as_jd();
    };

} // namespace skychart::astro
