/// @file camera.cpp
/// @brief Chart camera pan/zoom and projection state.

#include "rendering/camera.hpp"

#include "astro/coordinates.hpp"

#include <algorithm>
#include <cmath>

namespace skychart::rendering
{

Camera::Camera()
    : m_lon(kDefaultLon)
    , m_lat(kDefaultLat)
    , m_fov(kDefaultFov)
{
}

void Camera::set_center(f64 lon_rad, f64 lat_rad)
{
    if (!std::isfinite(lon_rad) || !std::isfinite(lat_rad))
    {
        return;
    }

    m_lon = lon_rad;
    m_lat = lat_rad;

    clamp_latitude();
    normalize_longitude();
}

void Camera::set_fov(f64 fov_deg)
{
    if (!std::isfinite(fov_deg))
    {
        return;
    }

    m_fov = glm::radians(fov_deg);
    clamp_fov();
}

// -----------------------------------------------------------------
// pan / zoom
// -----------------------------------------------------------------

void Camera::pan(f64 delta_lon_rad, f64 delta_lat_rad)
{
    set_center(m_lon + delta_lon_rad, m_lat + delta_lat_rad);
}

void Camera::zoom(f64 factor)
{
    if (!(factor > 0.0) || !std::isfinite(factor))
    {
        return;
    }

    m_fov *= factor;
    clamp_fov();
}

void Camera::reset()
{
    m_lon = kDefaultLon;
    m_lat = kDefaultLat;
    m_fov = kDefaultFov;
}

// -----------------------------------------------------------------
// Getters
// -----------------------------------------------------------------

astro::SkyPosition Camera::get_center() const
{
    return astro::SkyPosition{.lon = m_lon, .lat = m_lat};
}

f64 Camera::get_fov_rad() const
{
    return m_fov;
}

f64 Camera::get_fov_deg() const
{
    return glm::degrees(m_fov);
}

f32 Camera::get_magnitude_limit() const
{
    const f64 mag_limit = kBaseMagLimit + 5.0 * std::log10(kReferenceFovDeg / glm::degrees(m_fov));
    return static_cast<f32>(std::min(mag_limit, static_cast<f64>(kMaxMagLimit)));
}

projection::ProjectionState Camera::apply_to(const projection::ProjectionState& base) const
{
    projection::ProjectionState state = base;
    state.center_lon = m_lon;
    state.center_lat = m_lat;
    state.field = m_fov;
    return state;
}

// -----------------------------------------------------------------
// Internal helpers
// -----------------------------------------------------------------

void Camera::clamp_latitude()
{
    m_lat = std::clamp(m_lat, -astro_constants::kHalfPi, astro_constants::kHalfPi);
}

void Camera::normalize_longitude()
{
    m_lon = astro::Coordinates::normalize_radians(m_lon);
}

void Camera::clamp_fov()
{
    m_fov = std::clamp(m_fov, kMinFov, kMaxFov);
}

} // namespace skychart::rendering
