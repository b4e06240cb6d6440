/// @file time_system.cpp
/// @brief Implementation of the chart time context.

#include "astro/time_system.hpp"

#include <chrono>
#include <cmath>

namespace skychart::astro
{

// -----------------------------------------------------------------
// Julian Date (Meeus, Ch. 7)
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_date(const DateTime& dt)
{
    i32 y = dt.year;
    i32 m = dt.month;

    // Jan and Feb count as months 13 and 14 of the previous year
    if (m <= 2)
    {
        y -= 1;
        m += 12;
    }

    const i32 a = y / 100;
    const i32 b = 2 - a + (a / 4);

    const f64 day_fraction = (static_cast<f64>(dt.hour)
                            + static_cast<f64>(dt.minute) / 60.0
                            + dt.second / 3600.0) / 24.0;

    return std::floor(365.25 * static_cast<f64>(y + 4716))
         + std::floor(30.6001 * static_cast<f64>(m + 1))
         + static_cast<f64>(dt.day)
         + day_fraction
         + static_cast<f64>(b)
         - 1524.5;
}

f64 TimeSystem::julian_centuries(f64 jd)
{
    return (jd - astro_constants::kJ2000) / 36525.0;
}

// -----------------------------------------------------------------
// GMST (degrees) = 280.46061837 + 360.98564736629 × d
//                + 0.000387933 × T² − T³ / 38710000
// -----------------------------------------------------------------

f64 TimeSystem::gmst(f64 jd)
{
    const f64 t = julian_centuries(jd);
    const f64 d = jd - astro_constants::kJ2000;

    const f64 gmst_deg = 280.46061837
                       + 360.98564736629 * d
                       + 0.000387933 * t * t
                       - (t * t * t) / 38710000.0;

    return Coordinates::normalize_radians(gmst_deg * astro_constants::kDegToRad);
}

f64 TimeSystem::lmst(f64 jd, f64 longitude_rad)
{
    return Coordinates::normalize_radians(gmst(jd) + longitude_rad);
}

// -----------------------------------------------------------------
// ε0 = 23°26'21.448" − 46.8150"T − 0.00059"T² + 0.001813"T³
// -----------------------------------------------------------------

f64 TimeSystem::mean_obliquity(f64 jd)
{
    const f64 t = julian_centuries(jd);
    const f64 arcsec = 84381.448 - 46.8150 * t - 0.00059 * t * t + 0.001813 * t * t * t;
    return arcsec * astro_constants::kArcSecToRad;
}

SkyFrame TimeSystem::sky_frame(f64 jd, const ObserverLocation& observer)
{
    return SkyFrame{
        .observer = observer,
        .local_sidereal_time_rad = lmst(jd, observer.longitude_rad),
        .obliquity_rad = mean_obliquity(jd),
    };
}

f64 TimeSystem::now_as_jd()
{
    using namespace std::chrono;

    const auto since_epoch = system_clock::now().time_since_epoch();
    const auto total_seconds = duration_cast<duration<f64>>(since_epoch).count();

    // Unix epoch (1970-01-01 00:00 UTC) as Julian Date
    constexpr f64 kUnixEpochJd = 2440587.5;

    return kUnixEpochJd + total_seconds / 86400.0;
}

} // namespace skychart::astro
