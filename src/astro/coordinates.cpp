/// @file coordinates.cpp
/// @brief Implementation of astronomical coordinate transformations.

#include "astro/coordinates.hpp"

#include <algorithm>
#include <cmath>

namespace skychart::astro
{

std::string_view to_string(CoordinateSystem system)
{
    switch (system)
    {
        case CoordinateSystem::Equatorial: return "equatorial";
        case CoordinateSystem::Ecliptic:   return "ecliptic";
        case CoordinateSystem::Galactic:   return "galactic";
        case CoordinateSystem::Horizontal: return "horizontal";
    }
    return "unknown";
}

// -----------------------------------------------------------------
// Equatorial (RA/Dec) → Horizontal (Alt/Az)
//
// Hour angle: H = LST - RA
//
// sin(alt) = sin(dec) × sin(lat) + cos(dec) × cos(lat) × cos(H)
// az = atan2(-cos(dec)×sin(H), sin(dec)×cos(lat) - cos(dec)×sin(lat)×cos(H))
// -----------------------------------------------------------------

HorizontalCoord Coordinates::equatorial_to_horizontal(
    const EquatorialCoord& eq,
    const ObserverLocation& observer,
    f64 local_sidereal_time_rad)
{
    const f64 hour_angle = local_sidereal_time_rad - eq.ra;

    const f64 sin_dec = std::sin(eq.dec);
    const f64 cos_dec = std::cos(eq.dec);
    const f64 sin_lat = std::sin(observer.latitude_rad);
    const f64 cos_lat = std::cos(observer.latitude_rad);
    const f64 cos_ha  = std::cos(hour_angle);

    const f64 sin_alt = sin_dec * sin_lat + cos_dec * cos_lat * cos_ha;
    const f64 az = std::atan2(-cos_dec * std::sin(hour_angle),
                              sin_dec * cos_lat - cos_dec * sin_lat * cos_ha);

    return HorizontalCoord{
        .alt = std::asin(std::clamp(sin_alt, -1.0, 1.0)),
        .az  = normalize_radians(az),
    };
}

// -----------------------------------------------------------------
// Horizontal (Alt/Az) → Equatorial (RA/Dec)
//
//   sin(dec) = sin(alt) × sin(lat) + cos(alt) × cos(lat) × cos(az)
//   H = atan2(-cos(alt)×sin(az), sin(alt)×cos(lat) - cos(alt)×sin(lat)×cos(az))
//   RA = LST - H
// -----------------------------------------------------------------

EquatorialCoord Coordinates::horizontal_to_equatorial(
    const HorizontalCoord& hz,
    const ObserverLocation& observer,
    f64 local_sidereal_time_rad)
{
    const f64 sin_alt = std::sin(hz.alt);
    const f64 cos_alt = std::cos(hz.alt);
    const f64 cos_az  = std::cos(hz.az);
    const f64 sin_lat = std::sin(observer.latitude_rad);
    const f64 cos_lat = std::cos(observer.latitude_rad);

    const f64 sin_dec = sin_alt * sin_lat + cos_alt * cos_lat * cos_az;
    const f64 hour_angle = std::atan2(-cos_alt * std::sin(hz.az),
                                      sin_alt * cos_lat - cos_alt * sin_lat * cos_az);

    return EquatorialCoord{
        .ra  = normalize_radians(local_sidereal_time_rad - hour_angle),
        .dec = std::asin(std::clamp(sin_dec, -1.0, 1.0)),
    };
}

// -----------------------------------------------------------------
// Equatorial ↔ Ecliptic: rotation about the equinox direction by ε
//
//   sin(β) = sin(δ)cos(ε) - cos(δ)sin(ε)sin(α)
//   λ = atan2(sin(α)cos(δ)cos(ε) + sin(δ)sin(ε), cos(α)cos(δ))
// -----------------------------------------------------------------

SkyPosition Coordinates::equatorial_to_ecliptic(const EquatorialCoord& eq, f64 obliquity_rad)
{
    const f64 sin_eps = std::sin(obliquity_rad);
    const f64 cos_eps = std::cos(obliquity_rad);
    const f64 sin_dec = std::sin(eq.dec);
    const f64 cos_dec = std::cos(eq.dec);
    const f64 sin_ra  = std::sin(eq.ra);

    const f64 sin_beta = sin_dec * cos_eps - cos_dec * sin_eps * sin_ra;
    const f64 lambda = std::atan2(sin_ra * cos_dec * cos_eps + sin_dec * sin_eps,
                                  std::cos(eq.ra) * cos_dec);

    return SkyPosition{
        .lon = normalize_radians(lambda),
        .lat = std::asin(std::clamp(sin_beta, -1.0, 1.0)),
    };
}

EquatorialCoord Coordinates::ecliptic_to_equatorial(const SkyPosition& ecl, f64 obliquity_rad)
{
    const f64 sin_eps  = std::sin(obliquity_rad);
    const f64 cos_eps  = std::cos(obliquity_rad);
    const f64 sin_beta = std::sin(ecl.lat);
    const f64 cos_beta = std::cos(ecl.lat);
    const f64 sin_lam  = std::sin(ecl.lon);

    const f64 sin_dec = sin_beta * cos_eps + cos_beta * sin_eps * sin_lam;
    const f64 ra = std::atan2(sin_lam * cos_beta * cos_eps - sin_beta * sin_eps,
                              std::cos(ecl.lon) * cos_beta);

    return EquatorialCoord{
        .ra  = normalize_radians(ra),
        .dec = std::asin(std::clamp(sin_dec, -1.0, 1.0)),
    };
}

// -----------------------------------------------------------------
// Equatorial ↔ Galactic
//
// With pole (αp, δp) and l_NCP = 90° + node:
//   sin(b) = sin(δ)sin(δp) + cos(δ)cos(δp)cos(α - αp)
//   l = l_NCP - atan2(cos(δ)sin(α - αp), sin(δ)cos(δp) - cos(δ)sin(δp)cos(α - αp))
// -----------------------------------------------------------------

SkyPosition Coordinates::equatorial_to_galactic(const EquatorialCoord& eq)
{
    const f64 l_ncp = astro_constants::kHalfPi + kGalacticNode;
    const f64 sin_pole = std::sin(kGalacticPoleDec);
    const f64 cos_pole = std::cos(kGalacticPoleDec);
    const f64 sin_dec = std::sin(eq.dec);
    const f64 cos_dec = std::cos(eq.dec);
    const f64 dra = eq.ra - kGalacticPoleRa;

    const f64 sin_b = sin_dec * sin_pole + cos_dec * cos_pole * std::cos(dra);
    const f64 l = l_ncp - std::atan2(cos_dec * std::sin(dra),
                                     sin_dec * cos_pole - cos_dec * sin_pole * std::cos(dra));

    return SkyPosition{
        .lon = normalize_radians(l),
        .lat = std::asin(std::clamp(sin_b, -1.0, 1.0)),
    };
}

EquatorialCoord Coordinates::galactic_to_equatorial(const SkyPosition& gal)
{
    const f64 l_ncp = astro_constants::kHalfPi + kGalacticNode;
    const f64 sin_pole = std::sin(kGalacticPoleDec);
    const f64 cos_pole = std::cos(kGalacticPoleDec);
    const f64 sin_b = std::sin(gal.lat);
    const f64 cos_b = std::cos(gal.lat);
    const f64 dl = l_ncp - gal.lon;

    const f64 sin_dec = sin_b * sin_pole + cos_b * cos_pole * std::cos(dl);
    const f64 ra = kGalacticPoleRa + std::atan2(cos_b * std::sin(dl),
                                                sin_b * cos_pole - cos_b * sin_pole * std::cos(dl));

    return EquatorialCoord{
        .ra  = normalize_radians(ra),
        .dec = std::asin(std::clamp(sin_dec, -1.0, 1.0)),
    };
}

// -----------------------------------------------------------------
// Generic conversion through the equatorial pivot
// -----------------------------------------------------------------

SkyPosition Coordinates::convert(
    const SkyPosition& pos,
    CoordinateSystem from,
    CoordinateSystem to,
    const SkyFrame& frame)
{
    if (from == to)
    {
        return pos;
    }

    EquatorialCoord eq{};
    switch (from)
    {
        case CoordinateSystem::Equatorial:
            eq = EquatorialCoord{.ra = pos.lon, .dec = pos.lat};
            break;
        case CoordinateSystem::Ecliptic:
            eq = ecliptic_to_equatorial(pos, frame.obliquity_rad);
            break;
        case CoordinateSystem::Galactic:
            eq = galactic_to_equatorial(pos);
            break;
        case CoordinateSystem::Horizontal:
            eq = horizontal_to_equatorial(HorizontalCoord{.alt = pos.lat, .az = pos.lon},
                                          frame.observer, frame.local_sidereal_time_rad);
            break;
    }

    switch (to)
    {
        case CoordinateSystem::Equatorial:
            return SkyPosition{.lon = normalize_radians(eq.ra), .lat = eq.dec};
        case CoordinateSystem::Ecliptic:
            return equatorial_to_ecliptic(eq, frame.obliquity_rad);
        case CoordinateSystem::Galactic:
            return equatorial_to_galactic(eq);
        case CoordinateSystem::Horizontal:
        {
            const auto hz = equatorial_to_horizontal(eq, frame.observer, frame.local_sidereal_time_rad);
            return SkyPosition{.lon = hz.az, .lat = hz.alt};
        }
    }
    return pos;
}

// -----------------------------------------------------------------
// Angular distance (Vincenty form, stable at 0 and π)
// -----------------------------------------------------------------

f64 Coordinates::angular_distance(const SkyPosition& a, const SkyPosition& b)
{
    const f64 dlon = b.lon - a.lon;
    const f64 sin_a = std::sin(a.lat);
    const f64 cos_a = std::cos(a.lat);
    const f64 sin_b = std::sin(b.lat);
    const f64 cos_b = std::cos(b.lat);

    const f64 x = cos_b * std::sin(dlon);
    const f64 y = cos_a * sin_b - sin_a * cos_b * std::cos(dlon);
    const f64 z = sin_a * sin_b + cos_a * cos_b * std::cos(dlon);

    return std::atan2(std::hypot(x, y), z);
}

f64 Coordinates::position_angle(const SkyPosition& a, const SkyPosition& b)
{
    const f64 dlon = b.lon - a.lon;
    const f64 pa = std::atan2(std::sin(dlon),
                              std::cos(a.lat) * std::tan(b.lat) - std::sin(a.lat) * std::cos(dlon));
    return normalize_radians(pa);
}

// -----------------------------------------------------------------
// Angle normalization
// -----------------------------------------------------------------

f64 Coordinates::normalize_radians(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kTwoPi);
    if (angle < 0.0)
    {
        angle += astro_constants::kTwoPi;
    }
    return angle;
}

f64 Coordinates::wrap_pi(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kTwoPi);
    if (angle > astro_constants::kPi)
    {
        angle -= astro_constants::kTwoPi;
    }
    else if (angle < -astro_constants::kPi)
    {
        angle += astro_constants::kTwoPi;
    }
    return angle;
}

} // namespace skychart::astro
