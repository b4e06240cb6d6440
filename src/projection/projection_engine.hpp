#pragma once

/// @file projection_engine.hpp
/// @brief Forward and inverse sky-to-pixel mapping for the five chart projections.

#include "astro/coordinates.hpp"
#include "core/types.hpp"
#include "projection/projection_state.hpp"

#include <optional>

namespace skychart::projection
{
    /// @brief Maps sky positions to chart pixels and back.
    ///
    /// Owns one ProjectionState plus the scale factors derived from it. Every
    /// setter recomputes the derived values, so ScreenPoints produced before a
    /// reconfiguration must not be mixed with those produced after it.
    ///
    /// Pixel pipeline for a forward projection:
    ///   1. model formula (one dispatch point on the effective projection)
    ///   2. pole-angle rotation about the pixel centre
    ///   3. left-right / top-bottom mirroring for inverted optics
    /// The inverse runs the same steps backwards.
    ///
    /// Not thread-safe: each concurrently rendered view owns its own engine.
    class ProjectionEngine
    {
    public:
        /// @brief Build an engine. An invalid field or viewport is replaced by the default and logged.
        explicit ProjectionEngine(const ProjectionState& state = {});

        // -----------------------------------------------------------------
        // Forward
        // -----------------------------------------------------------------

        /// @brief Project a position given in the chart's own coordinate system.
        [[nodiscard]] ScreenPoint project(const astro::SkyPosition& loc, const ProjectOptions& options = {}) const;

        /// @brief Project a position given in another coordinate system.
        ///
        /// The position is moved into the chart system through the sky frame.
        /// Conversions involving horizontal coordinates need set_frame() first;
        /// without a frame they report Invalid.
        [[nodiscard]] ScreenPoint project(
            const astro::SkyPosition& loc,
            astro::CoordinateSystem system,
            const ProjectOptions& options = {}
        ) const;

        /// @brief Forward projection that skips horizon culling (overlays, shadows, grids).
        [[nodiscard]] ScreenPoint project_ignoring_horizon(const astro::SkyPosition& loc) const;

        // -----------------------------------------------------------------
        // Inverse
        // -----------------------------------------------------------------

        /// @brief Sky position (chart system) under a pixel, or nullopt outside the projected domain.
        [[nodiscard]] std::optional<astro::SkyPosition> invert(f64 px, f64 py) const;

        /// @brief Sky position under a pixel, expressed in another coordinate system.
        [[nodiscard]] std::optional<astro::SkyPosition> invert(f64 px, f64 py, astro::CoordinateSystem system) const;

        // -----------------------------------------------------------------
        // Queries
        // -----------------------------------------------------------------

        [[nodiscard]] const ProjectionState& get_state() const;

        /// @brief Projection actually in use after the small-field substitution.
        [[nodiscard]] Projection effective_projection() const;

        [[nodiscard]] bool is_cylindrical_forced() const;

        /// @brief Pixel the chart centre maps to (before rotation and mirroring).
        [[nodiscard]] Vec2d center_pixel() const;

        /// @brief Linear scale used by the cylindrical and polar models.
        [[nodiscard]] f64 pixels_per_radian() const;

        [[nodiscard]] f64 angular_distance_to_center(const astro::SkyPosition& loc) const;

        /// @brief True when loc lies within 90° of the chart centre.
        [[nodiscard]] bool is_in_visible_hemisphere(const astro::SkyPosition& loc) const;

        /// @brief Screen angle of the local north direction at loc.
        ///
        /// Measured in radians from the +x axis towards screen up; π/2 means
        /// north points straight up. nullopt when loc does not project.
        [[nodiscard]] std::optional<f64> north_angle_at(const astro::SkyPosition& loc) const;

        /// @brief Screen angle (same convention) of the direction towards the zenith at loc.
        [[nodiscard]] std::optional<f64> zenith_angle_at(const astro::SkyPosition& loc) const;

        /// @brief Horizontal elevation of loc, when it can be computed.
        [[nodiscard]] std::optional<f64> elevation_of(const astro::SkyPosition& loc) const;

        [[nodiscard]] const std::optional<astro::SkyFrame>& get_frame() const;

        // -----------------------------------------------------------------
        // Reconfiguration (each returns false and keeps the old value on bad input)
        // -----------------------------------------------------------------

        bool set_field(f64 field_rad);
        bool set_center(f64 lon_rad, f64 lat_rad);
        bool set_viewport(i32 width, i32 height);
        void set_pole_angle(f64 angle_rad);
        void set_projection(Projection projection);
        void set_coordinate_system(astro::CoordinateSystem system);
        void set_inversion(bool horizontal, bool vertical);
        void set_draw_sky_below_horizon(bool enabled);
        void set_frame(const astro::SkyFrame& frame);
        void clear_frame();

    private:
        /// @brief Model coordinates before rotation and mirroring.
        struct RawPoint
        {
            f64 x;
            f64 y;
            ProjectionStatus status;
        };

        void update_derived();

        [[nodiscard]] ScreenPoint project_checked(
            const astro::SkyPosition& loc,
            bool cull_horizon,
            const ProjectOptions& options
        ) const;

        [[nodiscard]] RawPoint forward(const astro::SkyPosition& loc) const;
        [[nodiscard]] std::optional<astro::SkyPosition> inverse(f64 x, f64 y) const;

        [[nodiscard]] RawPoint forward_stereographic(const astro::SkyPosition& loc) const;
        [[nodiscard]] RawPoint forward_spherical(const astro::SkyPosition& loc) const;
        [[nodiscard]] RawPoint forward_cylindrical(const astro::SkyPosition& loc, bool equidistant) const;
        [[nodiscard]] RawPoint forward_polar(const astro::SkyPosition& loc) const;

        [[nodiscard]] std::optional<astro::SkyPosition> inverse_azimuthal(f64 x, f64 y, bool stereographic) const;
        [[nodiscard]] std::optional<astro::SkyPosition> inverse_cylindrical(f64 x, f64 y, bool equidistant) const;
        [[nodiscard]] std::optional<astro::SkyPosition> inverse_polar(f64 x, f64 y) const;

        [[nodiscard]] Vec2d to_screen(f64 x, f64 y) const;
        [[nodiscard]] Vec2d from_screen(f64 px, f64 py) const;

        [[nodiscard]] std::optional<f64> screen_angle_between(
            const astro::SkyPosition& from,
            const astro::SkyPosition& to
        ) const;

        ProjectionState m_state;
        std::optional<astro::SkyFrame> m_frame;

        // -----------------------------------------------------------------
        // Derived (recomputed by update_derived)
        // -----------------------------------------------------------------
        Projection m_effective = Projection::Stereographic;
        f64 m_cx = 0.0;                 ///< Pixel centre x
        f64 m_cy = 0.0;                 ///< Pixel centre y
        f64 m_sx = 1.0;                 ///< -1 mirrors longitude (horizontal charts: azimuth grows to the right)
        f64 m_linear_scale = 0.0;       ///< width / field
        f64 m_sphere_scale = 0.0;       ///< Orthographic radius factor: cx·π / field
        f64 m_stereo_scale = 0.0;       ///< cx / tan(field / 4)
        f64 m_sin_lat0 = 0.0;
        f64 m_cos_lat0 = 1.0;
        f64 m_cos_pole = 1.0;
        f64 m_sin_pole = 0.0;

        mutable bool m_warned_missing_frame = false;

        // -----------------------------------------------------------------
        // Limits
        // -----------------------------------------------------------------
        static constexpr f64 kDenominatorEpsilon = 1e-12;
        static constexpr f64 kMaxStereoQuarterField = 89.9 * astro_constants::kDegToRad;
        static constexpr f32 kStereographicDefaultMargin = 100.0f;
        static constexpr f64 kDirectionStep = 1e-4;     ///< Step along a direction for screen angles (radians)
    };

} // namespace skychart::projection
