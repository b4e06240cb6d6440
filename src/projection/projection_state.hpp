#pragma once

/// @file projection_state.hpp
/// @brief Value types describing a chart projection and its results.

#include "astro/coordinates.hpp"
#include "core/types.hpp"

#include <string_view>

namespace skychart::projection
{
    /// @brief The five supported projection models.
    enum class Projection
    {
        Stereographic,
        Spherical,
        Cylindrical,
        CylindricalEquidistant,
        Polar,
    };

    [[nodiscard]] std::string_view to_string(Projection projection);

    /// @brief Outcome of a forward projection.
    enum class ProjectionStatus
    {
        Visible,        ///< Pixel position is meaningful
        Invalid,        ///< Behind the hemisphere, below the horizon or beyond the soft limits
        Degenerate,     ///< Formula hit a zero denominator or produced a non-finite value
        InvalidInput,   ///< Longitude or latitude was NaN or infinite
    };

    [[nodiscard]] std::string_view to_string(ProjectionStatus status);

    /// @brief Pixel position produced by a projection, or a non-visible status.
    struct ScreenPoint
    {
        f32 x = 0.0f;
        f32 y = 0.0f;
        ProjectionStatus status = ProjectionStatus::Invalid;

        [[nodiscard]] bool is_valid() const { return status == ProjectionStatus::Visible; }

        [[nodiscard]] static ScreenPoint visible(f64 px, f64 py)
        {
            return ScreenPoint{
                .x = static_cast<f32>(px),
                .y = static_cast<f32>(py),
                .status = ProjectionStatus::Visible,
            };
        }

        [[nodiscard]] static ScreenPoint rejected(ProjectionStatus status)
        {
            return ScreenPoint{.status = status};
        }
    };

    /// @brief Thresholds of the small-field cylindrical substitution.
    ///
    /// A stereographic or spherical chart is drawn as cylindrical-equidistant when
    ///   field < tiny_field  and |lat0| < 90° - tiny_field_pole_margin, or
    ///   field < small_field and |lat0| < 90° - field.
    struct CylindricalForcing
    {
        bool enabled = true;
        f64 tiny_field = 1.0 * astro_constants::kDegToRad;
        f64 tiny_field_pole_margin = 1.0 * astro_constants::kDegToRad;
        f64 small_field = 30.0 * astro_constants::kDegToRad;
    };

    /// @brief Everything that defines where a sky position lands on the chart.
    ///
    /// Build with designated initializers:
    ///   ProjectionState{.projection = Projection::Polar, .field = 1.2, .width = 1024};
    struct ProjectionState
    {
        Projection projection = Projection::Stereographic;
        astro::CoordinateSystem coordinate_system = astro::CoordinateSystem::Equatorial;

        f64 center_lon = 0.0;                               ///< Chart centre longitude (radians)
        f64 center_lat = 0.0;                               ///< Chart centre latitude (radians)
        f64 field = astro_constants::kHalfPi;               ///< Field of view across the width (radians)

        i32 width = 800;
        i32 height = 600;

        f64 pole_angle = 0.0;                               ///< Extra rotation about the pixel centre (radians)
        f64 horizon_depression = 0.0;                       ///< Horizon lowered by this angle (radians)

        bool invert_horizontal = false;                     ///< Mirrored optics, left-right
        bool invert_vertical = false;                       ///< Mirrored optics, top-bottom
        bool draw_sky_below_horizon = true;

        CylindricalForcing forcing{};
    };

    /// @brief Per-call switches of ProjectionEngine::project.
    struct ProjectOptions
    {
        bool check_limits = false;  ///< Reject points farther than margin pixels outside the image
        f32 margin = 0.0f;          ///< Soft limit in pixels (0 means 100 px for stereographic)
        f64 angular_radius = 0.0;   ///< Object radius for horizon culling of extended objects
    };

    /// @brief True when the small-field substitution applies to this state.
    [[nodiscard]] bool is_cylindrical_forced(const ProjectionState& state);

    /// @brief Projection actually used for a state, after the small-field substitution.
    [[nodiscard]] Projection effective_projection(const ProjectionState& state);

} // namespace skychart::projection
