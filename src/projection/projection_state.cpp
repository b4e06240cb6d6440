/// @file projection_state.cpp
/// @brief Names and the small-field substitution rule.

#include "projection/projection_state.hpp"

#include <cmath>

namespace skychart::projection
{

std::string_view to_string(Projection projection)
{
    switch (projection)
    {
        case Projection::Stereographic:          return "stereographic";
        case Projection::Spherical:              return "spherical";
        case Projection::Cylindrical:            return "cylindrical";
        case Projection::CylindricalEquidistant: return "cylindrical-equidistant";
        case Projection::Polar:                  return "polar";
    }
    return "unknown";
}

std::string_view to_string(ProjectionStatus status)
{
    switch (status)
    {
        case ProjectionStatus::Visible:      return "visible";
        case ProjectionStatus::Invalid:      return "invalid";
        case ProjectionStatus::Degenerate:   return "degenerate";
        case ProjectionStatus::InvalidInput: return "invalid input";
    }
    return "unknown";
}

// -----------------------------------------------------------------
// Small-field substitution
//
// Azimuthal projections show seams around planetary and lunar disks at
// tiny fields; an equidistant cylinder is indistinguishable there.
// -----------------------------------------------------------------

bool is_cylindrical_forced(const ProjectionState& state)
{
    const auto& forcing = state.forcing;
    if (!forcing.enabled)
    {
        return false;
    }

    if (state.projection != Projection::Stereographic && state.projection != Projection::Spherical)
    {
        return false;
    }

    const f64 abs_lat = std::abs(state.center_lat);

    if (state.field < forcing.tiny_field
        && abs_lat < astro_constants::kHalfPi - forcing.tiny_field_pole_margin)
    {
        return true;
    }

    return state.field < forcing.small_field
        && abs_lat < astro_constants::kHalfPi - state.field;
}

Projection effective_projection(const ProjectionState& state)
{
    return is_cylindrical_forced(state) ? Projection::CylindricalEquidistant : state.projection;
}

} // namespace skychart::projection
