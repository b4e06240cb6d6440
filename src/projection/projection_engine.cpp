/// @file projection_engine.cpp
/// @brief Implementation of the chart projection engine.

#include "projection/projection_engine.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <cmath>

namespace skychart::projection
{

using astro::Coordinates;
using astro::CoordinateSystem;
using astro::SkyPosition;

namespace
{

/// Mean obliquity at J2000.0, used for ecliptic conversions when no frame is set.
constexpr f64 kJ2000Obliquity = 84381.448 * astro_constants::kArcSecToRad;

bool is_finite(const SkyPosition& loc)
{
    return std::isfinite(loc.lon) && std::isfinite(loc.lat);
}

bool is_valid_field(f64 field_rad)
{
    return std::isfinite(field_rad) && field_rad > 0.0 && field_rad <= astro_constants::kTwoPi;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Construction
// -----------------------------------------------------------------

ProjectionEngine::ProjectionEngine(const ProjectionState& state)
    : m_state(state)
{
    const ProjectionState defaults{};

    if (!is_valid_field(m_state.field))
    {
        SKC_CORE_ERROR("Invalid field of view {} rad, using {} rad", m_state.field, defaults.field);
        m_state.field = defaults.field;
    }

    if (m_state.width <= 0 || m_state.height <= 0)
    {
        SKC_CORE_ERROR("Invalid viewport {}x{}, using {}x{}",
                       m_state.width, m_state.height, defaults.width, defaults.height);
        m_state.width = defaults.width;
        m_state.height = defaults.height;
    }

    if (!is_finite(SkyPosition{.lon = m_state.center_lon, .lat = m_state.center_lat}))
    {
        SKC_CORE_ERROR("Non-finite chart centre, using (0, 0)");
        m_state.center_lon = 0.0;
        m_state.center_lat = 0.0;
    }

    m_state.center_lat = std::clamp(m_state.center_lat, -astro_constants::kHalfPi, astro_constants::kHalfPi);

    update_derived();
}

// -----------------------------------------------------------------
// Derived scale factors
//
//   linear  (cylindrical, polar): width / field pixels per radian
//   sphere  (orthographic):       cx·π / field, the hemisphere fills the
//                                 width at field = π
//   stereo:                       cx / tan(field/4), so a point field/2
//                                 from the centre lands on the image edge
// -----------------------------------------------------------------

void ProjectionEngine::update_derived()
{
    m_effective = projection::effective_projection(m_state);

    m_cx = static_cast<f64>(m_state.width) * 0.5;
    m_cy = static_cast<f64>(m_state.height) * 0.5;
    m_sx = (m_state.coordinate_system == CoordinateSystem::Horizontal) ? -1.0 : 1.0;

    m_linear_scale = static_cast<f64>(m_state.width) / m_state.field;
    m_sphere_scale = m_cx * astro_constants::kPi / m_state.field;
    m_stereo_scale = m_cx / std::tan(std::min(m_state.field * 0.25, kMaxStereoQuarterField));

    m_sin_lat0 = std::sin(m_state.center_lat);
    m_cos_lat0 = std::cos(m_state.center_lat);
    m_cos_pole = std::cos(m_state.pole_angle);
    m_sin_pole = std::sin(m_state.pole_angle);

    m_warned_missing_frame = false;

    if (m_effective != m_state.projection)
    {
        SKC_CORE_TRACE("Field {:.4f} deg at lat {:.3f} deg: {} drawn as {}",
                       m_state.field * astro_constants::kRadToDeg,
                       m_state.center_lat * astro_constants::kRadToDeg,
                       to_string(m_state.projection),
                       to_string(m_effective));
    }

    if (!m_state.draw_sky_below_horizon && !m_frame
        && m_state.coordinate_system != CoordinateSystem::Horizontal)
    {
        SKC_CORE_WARN("Horizon culling on a {} chart needs a sky frame; culling disabled until set_frame()",
                      astro::to_string(m_state.coordinate_system));
    }
}

// =================================================================
// Forward projection
// =================================================================

ScreenPoint ProjectionEngine::project(const SkyPosition& loc, const ProjectOptions& options) const
{
    return project_checked(loc, !m_state.draw_sky_below_horizon, options);
}

ScreenPoint ProjectionEngine::project(
    const SkyPosition& loc,
    CoordinateSystem system,
    const ProjectOptions& options) const
{
    if (system == m_state.coordinate_system)
    {
        return project(loc, options);
    }

    if (!is_finite(loc))
    {
        SKC_CORE_WARN("Rejected non-finite sky position ({}, {})", loc.lon, loc.lat);
        return ScreenPoint::rejected(ProjectionStatus::InvalidInput);
    }

    const bool needs_observer = system == CoordinateSystem::Horizontal
                             || m_state.coordinate_system == CoordinateSystem::Horizontal;

    if (needs_observer && !m_frame)
    {
        if (!m_warned_missing_frame)
        {
            SKC_CORE_WARN("Cannot convert {} to {} without a sky frame",
                          astro::to_string(system), astro::to_string(m_state.coordinate_system));
            m_warned_missing_frame = true;
        }
        return ScreenPoint::rejected(ProjectionStatus::Invalid);
    }

    const astro::SkyFrame frame = m_frame.value_or(astro::SkyFrame{.obliquity_rad = kJ2000Obliquity});
    return project(Coordinates::convert(loc, system, m_state.coordinate_system, frame), options);
}

ScreenPoint ProjectionEngine::project_ignoring_horizon(const SkyPosition& loc) const
{
    return project_checked(loc, false, ProjectOptions{});
}

ScreenPoint ProjectionEngine::project_checked(
    const SkyPosition& loc,
    bool cull_horizon,
    const ProjectOptions& options) const
{
    if (!is_finite(loc))
    {
        SKC_CORE_WARN("Rejected non-finite sky position ({}, {})", loc.lon, loc.lat);
        return ScreenPoint::rejected(ProjectionStatus::InvalidInput);
    }

    if (cull_horizon)
    {
        const auto elevation = elevation_of(loc);
        if (elevation && *elevation < -m_state.horizon_depression - options.angular_radius)
        {
            return ScreenPoint::rejected(ProjectionStatus::Invalid);
        }
    }

    const RawPoint raw = forward(loc);
    if (raw.status != ProjectionStatus::Visible)
    {
        return ScreenPoint::rejected(raw.status);
    }

    if (!std::isfinite(raw.x) || !std::isfinite(raw.y))
    {
        return ScreenPoint::rejected(ProjectionStatus::Degenerate);
    }

    const Vec2d screen = to_screen(raw.x, raw.y);

    if (options.check_limits)
    {
        f64 margin = options.margin;
        if (margin <= 0.0 && m_effective == Projection::Stereographic)
        {
            margin = kStereographicDefaultMargin;
        }

        if (screen.x < -margin || screen.x > static_cast<f64>(m_state.width) + margin
            || screen.y < -margin || screen.y > static_cast<f64>(m_state.height) + margin)
        {
            return ScreenPoint::rejected(ProjectionStatus::Invalid);
        }
    }

    return ScreenPoint::visible(screen.x, screen.y);
}

ProjectionEngine::RawPoint ProjectionEngine::forward(const SkyPosition& loc) const
{
    switch (m_effective)
    {
        case Projection::Stereographic:          return forward_stereographic(loc);
        case Projection::Spherical:              return forward_spherical(loc);
        case Projection::Cylindrical:            return forward_cylindrical(loc, false);
        case Projection::CylindricalEquidistant: return forward_cylindrical(loc, true);
        case Projection::Polar:                  return forward_polar(loc);
    }
    return RawPoint{0.0, 0.0, ProjectionStatus::Degenerate};
}

// -----------------------------------------------------------------
// Stereographic
//
//   cos(c) = sin(φ0)sin(φ) + cos(φ0)cos(φ)cos(Δλ)
//   x = cx - K × cos(φ)sin(Δλ) / (1 + cos(c))
//   y = cy - K × (cos(φ0)sin(φ) - sin(φ0)cos(φ)cos(Δλ)) / (1 + cos(c))
//
// Only the hemisphere around the centre (c ≤ 90°) is drawn.
// -----------------------------------------------------------------

ProjectionEngine::RawPoint ProjectionEngine::forward_stereographic(const SkyPosition& loc) const
{
    const f64 dlon = loc.lon - m_state.center_lon;
    const f64 sin_lat = std::sin(loc.lat);
    const f64 cos_lat = std::cos(loc.lat);
    const f64 h = cos_lat * std::cos(dlon);

    const f64 cos_c = m_sin_lat0 * sin_lat + m_cos_lat0 * h;
    const f64 div = 1.0 + cos_c;

    if (std::abs(div) < kDenominatorEpsilon)
    {
        return RawPoint{0.0, 0.0, ProjectionStatus::Degenerate};
    }

    if (cos_c < 0.0)
    {
        return RawPoint{0.0, 0.0, ProjectionStatus::Invalid};
    }

    return RawPoint{
        m_cx - m_sx * m_stereo_scale * (cos_lat * std::sin(dlon) / div),
        m_cy - m_stereo_scale * (m_cos_lat0 * sin_lat - m_sin_lat0 * h) / div,
        ProjectionStatus::Visible,
    };
}

// -----------------------------------------------------------------
// Spherical (orthographic): same numerators, no perspective division
// -----------------------------------------------------------------

ProjectionEngine::RawPoint ProjectionEngine::forward_spherical(const SkyPosition& loc) const
{
    const f64 dlon = loc.lon - m_state.center_lon;
    const f64 sin_lat = std::sin(loc.lat);
    const f64 cos_lat = std::cos(loc.lat);
    const f64 h = cos_lat * std::cos(dlon);

    if (m_sin_lat0 * sin_lat + m_cos_lat0 * h < 0.0)
    {
        return RawPoint{0.0, 0.0, ProjectionStatus::Invalid};
    }

    return RawPoint{
        m_cx - m_sx * m_sphere_scale * cos_lat * std::sin(dlon),
        m_cy - m_sphere_scale * (m_cos_lat0 * sin_lat - m_sin_lat0 * h),
        ProjectionStatus::Visible,
    };
}

// -----------------------------------------------------------------
// Cylindrical: x ∝ Δλ wrapped to [-π, π], y ∝ Δφ
// Equidistant variant scales Δλ by cos(φ)
// -----------------------------------------------------------------

ProjectionEngine::RawPoint ProjectionEngine::forward_cylindrical(const SkyPosition& loc, bool equidistant) const
{
    f64 x = Coordinates::wrap_pi(loc.lon - m_state.center_lon);
    const f64 y = loc.lat - m_state.center_lat;

    if (equidistant)
    {
        x *= std::cos(loc.lat);
    }

    return RawPoint{
        m_cx - m_sx * m_linear_scale * x,
        m_cy - m_linear_scale * y,
        ProjectionStatus::Visible,
    };
}

// -----------------------------------------------------------------
// Polar (azimuthal equidistant about the nearer celestial pole)
//
//   r  = scale × colatitude,  r0 = scale × colatitude of the centre
//   d  = λ - λ0 + π
//   north: x = cx + r sin(d),  y = cy - r0 - r cos(d)
//   south: x = cx + r sin(d),  y = cy + r0 + r cos(d)
//
// The pole sits r0 above (north) or below (south) the centre pixel.
// -----------------------------------------------------------------

ProjectionEngine::RawPoint ProjectionEngine::forward_polar(const SkyPosition& loc) const
{
    const bool north = m_state.center_lat >= 0.0;
    const f64 depression = m_state.horizon_depression;

    if (north ? loc.lat < -depression : loc.lat > depression)
    {
        return RawPoint{0.0, 0.0, ProjectionStatus::Invalid};
    }

    const f64 colat  = north ? astro_constants::kHalfPi - loc.lat : astro_constants::kHalfPi + loc.lat;
    const f64 colat0 = north ? astro_constants::kHalfPi - m_state.center_lat
                             : astro_constants::kHalfPi + m_state.center_lat;

    const f64 r  = m_linear_scale * colat;
    const f64 r0 = m_linear_scale * colat0;
    const f64 d  = loc.lon - m_state.center_lon + astro_constants::kPi;

    const f64 x = m_cx + m_sx * r * std::sin(d);
    const f64 y = north ? m_cy - r0 - r * std::cos(d)
                        : m_cy + r0 + r * std::cos(d);

    return RawPoint{x, y, ProjectionStatus::Visible};
}

// =================================================================
// Inverse projection
// =================================================================

std::optional<SkyPosition> ProjectionEngine::invert(f64 px, f64 py) const
{
    if (!std::isfinite(px) || !std::isfinite(py))
    {
        SKC_CORE_WARN("Rejected non-finite pixel ({}, {})", px, py);
        return std::nullopt;
    }

    const Vec2d raw = from_screen(px, py);
    return inverse(raw.x, raw.y);
}

std::optional<SkyPosition> ProjectionEngine::invert(f64 px, f64 py, CoordinateSystem system) const
{
    const auto loc = invert(px, py);
    if (!loc || system == m_state.coordinate_system)
    {
        return loc;
    }

    const bool needs_observer = system == CoordinateSystem::Horizontal
                             || m_state.coordinate_system == CoordinateSystem::Horizontal;
    if (needs_observer && !m_frame)
    {
        return std::nullopt;
    }

    const astro::SkyFrame frame = m_frame.value_or(astro::SkyFrame{.obliquity_rad = kJ2000Obliquity});
    return Coordinates::convert(*loc, m_state.coordinate_system, system, frame);
}

std::optional<SkyPosition> ProjectionEngine::inverse(f64 x, f64 y) const
{
    switch (m_effective)
    {
        case Projection::Stereographic:          return inverse_azimuthal(x, y, true);
        case Projection::Spherical:              return inverse_azimuthal(x, y, false);
        case Projection::Cylindrical:            return inverse_cylindrical(x, y, false);
        case Projection::CylindricalEquidistant: return inverse_cylindrical(x, y, true);
        case Projection::Polar:                  return inverse_polar(x, y);
    }
    return std::nullopt;
}

// -----------------------------------------------------------------
// Azimuthal inverse (Snyder)
//
//   ρ = hypot(u, v) in units of the projection scale
//   stereographic: c = 2 atan(ρ)      orthographic: c = asin(ρ)
//   φ = asin(cos(c)sin(φ0) + v sin(c)cos(φ0) / ρ)
//   λ = λ0 + atan2(u sin(c), ρ cos(φ0)cos(c) - v sin(φ0)sin(c))
// -----------------------------------------------------------------

std::optional<SkyPosition> ProjectionEngine::inverse_azimuthal(f64 x, f64 y, bool stereographic) const
{
    const f64 scale = stereographic ? m_stereo_scale : m_sphere_scale;
    const f64 u = m_sx * (m_cx - x) / scale;
    const f64 v = (m_cy - y) / scale;
    const f64 rho = std::hypot(u, v);

    if (rho < 1e-15)
    {
        return SkyPosition{
            .lon = Coordinates::normalize_radians(m_state.center_lon),
            .lat = m_state.center_lat,
        };
    }

    // The visible hemisphere is the unit disk for both models
    if (rho > 1.0 + 1e-12)
    {
        return std::nullopt;
    }

    const f64 c = stereographic ? 2.0 * std::atan(rho) : std::asin(std::min(rho, 1.0));
    const f64 sin_c = std::sin(c);
    const f64 cos_c = std::cos(c);

    const f64 sin_lat = cos_c * m_sin_lat0 + v * sin_c * m_cos_lat0 / rho;
    const f64 lon = m_state.center_lon
                  + std::atan2(u * sin_c, rho * m_cos_lat0 * cos_c - v * m_sin_lat0 * sin_c);

    return SkyPosition{
        .lon = Coordinates::normalize_radians(lon),
        .lat = std::asin(std::clamp(sin_lat, -1.0, 1.0)),
    };
}

std::optional<SkyPosition> ProjectionEngine::inverse_cylindrical(f64 x, f64 y, bool equidistant) const
{
    f64 dlon = m_sx * (m_cx - x) / m_linear_scale;
    const f64 lat = (m_cy - y) / m_linear_scale + m_state.center_lat;

    if (std::abs(lat) > astro_constants::kHalfPi + 1e-12)
    {
        return std::nullopt;
    }

    if (equidistant)
    {
        const f64 cos_lat = std::cos(lat);
        dlon = (cos_lat > 1e-12) ? dlon / cos_lat : 0.0;
    }

    if (std::abs(dlon) > astro_constants::kPi + 1e-9)
    {
        return std::nullopt;
    }

    return SkyPosition{
        .lon = Coordinates::normalize_radians(m_state.center_lon + dlon),
        .lat = std::clamp(lat, -astro_constants::kHalfPi, astro_constants::kHalfPi),
    };
}

std::optional<SkyPosition> ProjectionEngine::inverse_polar(f64 x, f64 y) const
{
    const bool north = m_state.center_lat >= 0.0;
    const f64 colat0 = north ? astro_constants::kHalfPi - m_state.center_lat
                             : astro_constants::kHalfPi + m_state.center_lat;
    const f64 r0 = m_linear_scale * colat0;

    const f64 u = m_sx * (x - m_cx);
    const f64 v = north ? (m_cy - r0 - y) : (y - m_cy - r0);

    const f64 colat = std::hypot(u, v) / m_linear_scale;
    if (colat > astro_constants::kPi + 1e-12)
    {
        return std::nullopt;
    }

    // The forward projection only covers the hemisphere of the chart's pole
    const f64 lat = north ? astro_constants::kHalfPi - colat : colat - astro_constants::kHalfPi;
    const f64 depression = m_state.horizon_depression;
    if (north ? lat < -depression : lat > depression)
    {
        return std::nullopt;
    }

    const f64 d = std::atan2(u, v);

    return SkyPosition{
        .lon = Coordinates::normalize_radians(d - astro_constants::kPi + m_state.center_lon),
        .lat = lat,
    };
}

// -----------------------------------------------------------------
// Pixel post-processing: pole rotation, then mirroring
// -----------------------------------------------------------------

Vec2d ProjectionEngine::to_screen(f64 x, f64 y) const
{
    const f64 dx = x - m_cx;
    const f64 dy = y - m_cy;

    f64 px = m_cx + dx * m_cos_pole + dy * m_sin_pole;
    f64 py = m_cy - dx * m_sin_pole + dy * m_cos_pole;

    if (m_state.invert_horizontal)
    {
        px = static_cast<f64>(m_state.width - 1) - px;
    }
    if (m_state.invert_vertical)
    {
        py = static_cast<f64>(m_state.height - 1) - py;
    }

    return Vec2d{px, py};
}

Vec2d ProjectionEngine::from_screen(f64 px, f64 py) const
{
    if (m_state.invert_horizontal)
    {
        px = static_cast<f64>(m_state.width - 1) - px;
    }
    if (m_state.invert_vertical)
    {
        py = static_cast<f64>(m_state.height - 1) - py;
    }

    const f64 dx = px - m_cx;
    const f64 dy = py - m_cy;

    return Vec2d{
        m_cx + dx * m_cos_pole - dy * m_sin_pole,
        m_cy + dx * m_sin_pole + dy * m_cos_pole,
    };
}

// =================================================================
// Queries
// =================================================================

const ProjectionState& ProjectionEngine::get_state() const
{
    return m_state;
}

Projection ProjectionEngine::effective_projection() const
{
    return m_effective;
}

bool ProjectionEngine::is_cylindrical_forced() const
{
    return m_effective != m_state.projection;
}

Vec2d ProjectionEngine::center_pixel() const
{
    return Vec2d{m_cx, m_cy};
}

f64 ProjectionEngine::pixels_per_radian() const
{
    return m_linear_scale;
}

f64 ProjectionEngine::angular_distance_to_center(const SkyPosition& loc) const
{
    return Coordinates::angular_distance(
        SkyPosition{.lon = m_state.center_lon, .lat = m_state.center_lat}, loc);
}

bool ProjectionEngine::is_in_visible_hemisphere(const SkyPosition& loc) const
{
    return angular_distance_to_center(loc) <= astro_constants::kHalfPi;
}

std::optional<f64> ProjectionEngine::elevation_of(const SkyPosition& loc) const
{
    if (m_state.coordinate_system == CoordinateSystem::Horizontal)
    {
        return loc.lat;
    }

    if (!m_frame)
    {
        return std::nullopt;
    }

    return Coordinates::convert(loc, m_state.coordinate_system, CoordinateSystem::Horizontal, *m_frame).lat;
}

const std::optional<astro::SkyFrame>& ProjectionEngine::get_frame() const
{
    return m_frame;
}

// -----------------------------------------------------------------
// Screen directions: project a point and a neighbour a small step away
// along the wanted direction, then take the angle of the pixel offset
// (y flipped so that π/2 means "up").
// -----------------------------------------------------------------

std::optional<f64> ProjectionEngine::screen_angle_between(const SkyPosition& from, const SkyPosition& to) const
{
    const RawPoint a = forward(from);
    const RawPoint b = forward(to);

    if (a.status != ProjectionStatus::Visible || b.status != ProjectionStatus::Visible)
    {
        return std::nullopt;
    }

    const Vec2d pa = to_screen(a.x, a.y);
    const Vec2d pb = to_screen(b.x, b.y);
    const f64 dx = pb.x - pa.x;
    const f64 dy = pb.y - pa.y;

    if (!std::isfinite(dx) || !std::isfinite(dy) || (dx == 0.0 && dy == 0.0))
    {
        return std::nullopt;
    }

    return std::atan2(-dy, dx);
}

std::optional<f64> ProjectionEngine::north_angle_at(const SkyPosition& loc) const
{
    if (!is_finite(loc))
    {
        return std::nullopt;
    }

    if (loc.lat + kDirectionStep > astro_constants::kHalfPi)
    {
        return screen_angle_between(SkyPosition{.lon = loc.lon, .lat = loc.lat - kDirectionStep}, loc);
    }

    return screen_angle_between(loc, SkyPosition{.lon = loc.lon, .lat = loc.lat + kDirectionStep});
}

std::optional<f64> ProjectionEngine::zenith_angle_at(const SkyPosition& loc) const
{
    if (m_state.coordinate_system == CoordinateSystem::Horizontal)
    {
        return north_angle_at(loc);
    }

    if (!m_frame || !is_finite(loc))
    {
        return std::nullopt;
    }

    const CoordinateSystem chart = m_state.coordinate_system;
    SkyPosition hz = Coordinates::convert(loc, chart, CoordinateSystem::Horizontal, *m_frame);

    if (hz.lat + kDirectionStep > astro_constants::kHalfPi)
    {
        hz.lat -= kDirectionStep;
        return screen_angle_between(
            Coordinates::convert(hz, CoordinateSystem::Horizontal, chart, *m_frame), loc);
    }

    hz.lat += kDirectionStep;
    return screen_angle_between(
        loc, Coordinates::convert(hz, CoordinateSystem::Horizontal, chart, *m_frame));
}

// =================================================================
// Reconfiguration
// =================================================================

bool ProjectionEngine::set_field(f64 field_rad)
{
    if (!is_valid_field(field_rad))
    {
        SKC_CORE_ERROR("Rejected field of view {} rad, keeping {} rad", field_rad, m_state.field);
        return false;
    }

    m_state.field = field_rad;
    update_derived();
    return true;
}

bool ProjectionEngine::set_center(f64 lon_rad, f64 lat_rad)
{
    if (!std::isfinite(lon_rad) || !std::isfinite(lat_rad) || std::abs(lat_rad) > astro_constants::kHalfPi)
    {
        SKC_CORE_ERROR("Rejected chart centre ({}, {})", lon_rad, lat_rad);
        return false;
    }

    m_state.center_lon = Coordinates::normalize_radians(lon_rad);
    m_state.center_lat = lat_rad;
    update_derived();
    return true;
}

bool ProjectionEngine::set_viewport(i32 width, i32 height)
{
    if (width <= 0 || height <= 0)
    {
        SKC_CORE_ERROR("Rejected viewport {}x{}", width, height);
        return false;
    }

    m_state.width = width;
    m_state.height = height;
    update_derived();
    return true;
}

void ProjectionEngine::set_pole_angle(f64 angle_rad)
{
    m_state.pole_angle = angle_rad;
    update_derived();
}

void ProjectionEngine::set_projection(Projection projection)
{
    m_state.projection = projection;
    update_derived();
    SKC_CORE_INFO("Projection set to {}", to_string(projection));
}

void ProjectionEngine::set_coordinate_system(CoordinateSystem system)
{
    m_state.coordinate_system = system;
    update_derived();
    SKC_CORE_INFO("Chart coordinate system set to {}", astro::to_string(system));
}

void ProjectionEngine::set_inversion(bool horizontal, bool vertical)
{
    m_state.invert_horizontal = horizontal;
    m_state.invert_vertical = vertical;
    update_derived();
}

void ProjectionEngine::set_draw_sky_below_horizon(bool enabled)
{
    m_state.draw_sky_below_horizon = enabled;
    update_derived();
}

void ProjectionEngine::set_frame(const astro::SkyFrame& frame)
{
    m_frame = frame;
    update_derived();
}

void ProjectionEngine::clear_frame()
{
    m_frame.reset();
    update_derived();
}

} // namespace skychart::projection
