#pragma once

/// @file camera.hpp
/// @brief Chart camera: centre, field of view, pan/zoom, and the ProjectionState it implies.

#include "astro/coordinates.hpp"
#include "core/types.hpp"
#include "projection/projection_state.hpp"

#include <glm/trigonometric.hpp>

namespace skychart::rendering
{
    /// @brief Where the chart looks and how wide.
    ///
    /// Stores the chart centre in the chart's own coordinate system and a
    /// symmetric field of view. Provides pan (mouse drag) and zoom (scroll)
    /// with clamping, and a limiting magnitude heuristic based on the field.
    class Camera
    {
    public:
        /// @brief Default pointing: lon 0, lat +30°, 90° field.
        Camera();

        /// @brief Set the chart centre. Latitude is clamped to [-π/2, π/2], longitude normalized.
        void set_center(f64 lon_rad, f64 lat_rad);

        /// @brief Set field of view in degrees, clamped to [kMinFovDeg, kMaxFovDeg].
        void set_fov(f64 fov_deg);

        /// @brief Move the centre by a delta (mouse drag).
        /// @param delta_lon_rad Longitude offset in radians.
        /// @param delta_lat_rad Latitude offset in radians (positive = up).
        void pan(f64 delta_lon_rad, f64 delta_lat_rad);

        /// @brief Multiply the field of view by factor. <1.0 zooms in.
        void zoom(f64 factor);

        void reset();

        [[nodiscard]] astro::SkyPosition get_center() const;
        [[nodiscard]] f64 get_fov_rad() const;
        [[nodiscard]] f64 get_fov_deg() const;

        /// @brief Limiting magnitude for the current field.
        ///
        /// mag_limit = 6.5 + 5 × log10(60 / fov_degrees), capped at 20.
        [[nodiscard]] f32 get_magnitude_limit() const;

        /// @brief Copy of base with this camera's centre and field applied.
        [[nodiscard]] projection::ProjectionState apply_to(const projection::ProjectionState& base) const;

    private:
        void clamp_latitude();
        void normalize_longitude();
        void clamp_fov();

        f64 m_lon;      ///< Chart centre longitude (radians)
        f64 m_lat;      ///< Chart centre latitude (radians)
        f64 m_fov;      ///< Field of view (radians)

        // -----------------------------------------------------------------
        // FOV limits
        // -----------------------------------------------------------------
        static constexpr f64 kMinFovDeg = 0.5;
        static constexpr f64 kMaxFovDeg = 270.0;
        static constexpr f64 kMinFov = glm::radians(kMinFovDeg);
        static constexpr f64 kMaxFov = glm::radians(kMaxFovDeg);

        // -----------------------------------------------------------------
        // Default values
        // -----------------------------------------------------------------
        static constexpr f64 kDefaultLon = 0.0;
        static constexpr f64 kDefaultLat = glm::radians(30.0);
        static constexpr f64 kDefaultFov = glm::radians(90.0);

        // -----------------------------------------------------------------
        // Magnitude limit constants
        // -----------------------------------------------------------------
        static constexpr f64 kBaseMagLimit    = 6.5;    ///< Naked-eye limit at 60° FOV
        static constexpr f64 kReferenceFovDeg = 60.0;
        static constexpr f32 kMaxMagLimit     = 20.0f;
    };

} // namespace skychart::rendering
