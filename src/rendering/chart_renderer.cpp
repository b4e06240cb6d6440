/// @file chart_renderer.cpp
/// @brief Chart layers: coordinate grid, horizon line and depth-coded stars.

#include "rendering/chart_renderer.hpp"

#include "astro/coordinates.hpp"
#include "rendering/canvas.hpp"

#include <glm/trigonometric.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace skychart::rendering
{

namespace
{

constexpr f32 kGridMargin = 400.0f;

/// Invalidate points that jump across the cylindrical seam so the line breaks there.
void break_at_seams(std::vector<projection::ScreenPoint>& points, f32 max_jump)
{
    for (std::size_t i = points.size(); i-- > 1;)
    {
        const auto& a = points[i - 1];
        const auto& b = points[i];
        if (a.is_valid() && b.is_valid() && std::hypot(b.x - a.x, b.y - a.y) > max_jump)
        {
            points.insert(points.begin() + static_cast<std::ptrdiff_t>(i),
                          projection::ScreenPoint::rejected(projection::ProjectionStatus::Invalid));
        }
    }
}

} // anonymous namespace

ChartRenderer::ChartRenderer(const ChartStyle& style)
    : m_style(style)
{
}

raster::Image ChartRenderer::render(
    const projection::ProjectionEngine& engine,
    const raster::AnaglyphCompositor& stereo,
    std::span<const BrightStar> stars,
    f32 magnitude_limit)
{
    m_stats = {};

    const auto& state = engine.get_state();
    raster::RasterBuffer buffer = stereo.make_buffer(state.width, state.height, m_style.background);
    Canvas canvas(buffer, m_style.antialiased);

    if (m_style.draw_grid)
    {
        draw_grid(canvas, engine);
    }
    if (m_style.draw_horizon)
    {
        draw_horizon(canvas, engine);
    }
    if (m_style.draw_stars)
    {
        draw_stars(canvas, engine, stereo, stars, magnitude_limit);
    }
    if (m_style.draw_reticle)
    {
        draw_reticle(canvas, engine);
    }

    return stereo.compose(buffer);
}

f32 ChartRenderer::star_size(f32 mag, f32 magnitude_limit) const
{
    if (mag > magnitude_limit)
    {
        return 0.0f;
    }

    // Linear in magnitude: the limit is one pixel, magnitude -1.5 the maximum
    const f32 span = std::max(magnitude_limit - kBrightestMagnitude, 1.0f);
    const f32 t = std::clamp((magnitude_limit - mag) / span, 0.0f, 1.0f);
    return 1.0f + t * (m_style.max_star_size - 1.0f);
}

// -----------------------------------------------------------------
// Grid: meridians and parallels of the chart coordinate system
// -----------------------------------------------------------------

void ChartRenderer::draw_grid(Canvas& canvas, const projection::ProjectionEngine& engine)
{
    const f64 step = glm::radians(std::max(m_style.grid_step_deg, 1.0));
    const f64 sample = glm::radians(std::clamp(m_style.grid_sample_deg, 0.1, m_style.grid_step_deg));
    const projection::ProjectOptions options{.check_limits = true, .margin = kGridMargin};
    const f32 max_jump = 0.5f * static_cast<f32>(engine.get_state().width);
    const raster::ClipRect clip = canvas.bounds();

    std::vector<projection::ScreenPoint> points;

    // Meridians, pole to pole
    for (f64 lon = 0.0; lon < astro_constants::kTwoPi - 1e-9; lon += step)
    {
        points.clear();
        for (f64 lat = -astro_constants::kHalfPi; lat <= astro_constants::kHalfPi + 1e-9; lat += sample)
        {
            const f64 clamped = std::min(lat, astro_constants::kHalfPi);
            points.push_back(engine.project(astro::SkyPosition{.lon = lon, .lat = clamped}, options));
        }
        break_at_seams(points, max_jump);
        canvas.draw_polyline(points, m_style.grid_color, m_style.grid_stroke, clip);
        ++m_stats.grid_lines;
    }

    // Parallels, closed around the sphere
    for (f64 lat = -astro_constants::kHalfPi + step; lat < astro_constants::kHalfPi - 1e-9; lat += step)
    {
        points.clear();
        for (f64 lon = 0.0; lon <= astro_constants::kTwoPi + 1e-9; lon += sample)
        {
            points.push_back(engine.project(astro::SkyPosition{.lon = lon, .lat = lat}, options));
        }
        break_at_seams(points, max_jump);
        canvas.draw_polyline(points, m_style.grid_color, m_style.grid_stroke, clip);
        ++m_stats.grid_lines;
    }
}

// -----------------------------------------------------------------
// Horizon: altitude 0 mapped into the chart system
// -----------------------------------------------------------------

void ChartRenderer::draw_horizon(Canvas& canvas, const projection::ProjectionEngine& engine)
{
    const auto system = engine.get_state().coordinate_system;
    const auto& frame = engine.get_frame();
    if (system != astro::CoordinateSystem::Horizontal && !frame)
    {
        return;
    }

    const f64 sample = glm::radians(std::max(m_style.grid_sample_deg, 0.1));
    std::vector<projection::ScreenPoint> points;

    for (f64 az = 0.0; az <= astro_constants::kTwoPi + 1e-9; az += sample)
    {
        astro::SkyPosition pos{.lon = az, .lat = 0.0};
        if (system != astro::CoordinateSystem::Horizontal)
        {
            pos = astro::Coordinates::convert(pos, astro::CoordinateSystem::Horizontal, system, *frame);
        }
        points.push_back(engine.project_ignoring_horizon(pos));
    }
    break_at_seams(points, 0.5f * static_cast<f32>(engine.get_state().width));

    canvas.draw_polyline(points, m_style.horizon_color, m_style.horizon_stroke, canvas.bounds());
}

// -----------------------------------------------------------------
// Reticle: circle of fixed angular radius plus a crosshair gap
// -----------------------------------------------------------------

void ChartRenderer::draw_reticle(Canvas& canvas, const projection::ProjectionEngine& engine)
{
    const auto centre = engine.center_pixel();
    const f32 cx = static_cast<f32>(centre.x);
    const f32 cy = static_cast<f32>(centre.y);
    const f32 radius = static_cast<f32>(engine.pixels_per_radian() * glm::radians(std::max(m_style.reticle_deg, 0.0)));
    if (!(radius >= 2.0f))
    {
        return;
    }

    const raster::ClipRect clip = canvas.bounds();
    canvas.draw_ellipse(cx, cy, radius, radius, m_style.reticle_color, m_style.horizon_stroke, clip);

    // Four ticks from half radius to 1.5 radius
    raster::Path ticks;
    const f32 inner = 0.5f * radius;
    const f32 outer = 1.5f * radius;
    ticks.move_to(cx - outer, cy).line_to(cx - inner, cy);
    ticks.move_to(cx + inner, cy).line_to(cx + outer, cy);
    ticks.move_to(cx, cy - outer).line_to(cx, cy - inner);
    ticks.move_to(cx, cy + inner).line_to(cx, cy + outer);
    canvas.draw_path(ticks, m_style.reticle_color, m_style.horizon_stroke, clip);
}

// -----------------------------------------------------------------
// Stars: faintest first so bright disks stay on top
// -----------------------------------------------------------------

void ChartRenderer::draw_stars(
    Canvas& canvas,
    const projection::ProjectionEngine& engine,
    const raster::AnaglyphCompositor& stereo,
    std::span<const BrightStar> stars,
    f32 magnitude_limit)
{
    std::vector<const BrightStar*> order;
    order.reserve(stars.size());
    for (const BrightStar& star : stars)
    {
        order.push_back(&star);
    }
    std::sort(order.begin(), order.end(),
              [](const BrightStar* a, const BrightStar* b) { return a->v_magnitude > b->v_magnitude; });

    const raster::ClipRect clip = canvas.bounds();

    for (const BrightStar* star : order)
    {
        const f32 size = star_size(star->v_magnitude, magnitude_limit);
        if (size <= 0.0f)
        {
            ++m_stats.stars_hidden;
            continue;
        }

        const auto p = engine.project(
            star->position(),
            astro::CoordinateSystem::Equatorial,
            projection::ProjectOptions{.check_limits = true});
        if (!p.is_valid())
        {
            ++m_stats.stars_hidden;
            continue;
        }

        const raster::Color color = blackbody_color(effective_temperature(star->spectral_class));
        stereo.draw(stereo_depth(star->distance_pc), color,
                    [&](raster::DrawEye eye, f32 dx, raster::Color eye_color)
                    {
                        canvas.draw_star(p.x + dx, p.y, size, eye_color, clip, eye);
                    });
        ++m_stats.stars_drawn;
    }
}

} // namespace skychart::rendering
