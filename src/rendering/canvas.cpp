/// @file canvas.cpp
/// @brief Canvas rounding and dispatch to the raster primitives.

#include "rendering/canvas.hpp"

#include "raster/ellipse_rasterizer.hpp"
#include "raster/line_rasterizer.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace skychart::rendering
{

namespace
{

bool finite(f32 a, f32 b)
{
    return std::isfinite(a) && std::isfinite(b);
}

i32 to_pixel(f32 v, f32 limit)
{
    return static_cast<i32>(std::lround(std::clamp(v, -limit, limit)));
}

} // anonymous namespace

Canvas::Canvas(raster::RasterBuffer& target, bool antialiased)
    : m_target(target)
    , m_antialiased(antialiased)
{
}

void Canvas::clear(raster::Color color)
{
    m_target.clear(color);
}

// -----------------------------------------------------------------
// Points and stars
// -----------------------------------------------------------------

void Canvas::draw_point(f32 x, f32 y, raster::Color color, const raster::ClipRect& clip, raster::DrawEye eye)
{
    if (!finite(x, y))
    {
        return;
    }

    const i32 px = to_pixel(x, kMaxCoordinate);
    const i32 py = to_pixel(y, kMaxCoordinate);
    if (clip.intersect(m_target.bounds()).contains(px, py))
    {
        m_target.plot(px, py, color, eye);
    }
}

void Canvas::draw_star(f32 x, f32 y, f32 size, raster::Color color, const raster::ClipRect& clip,
                       raster::DrawEye eye)
{
    if (!finite(x, y) || !std::isfinite(size) || size <= 0.0f)
    {
        return;
    }

    const i32 diameter = static_cast<i32>(std::lround(size));
    if (diameter <= 1)
    {
        draw_point(x, y, color, clip, eye);
        return;
    }

    const i32 px = to_pixel(x, kMaxCoordinate);
    const i32 py = to_pixel(y, kMaxCoordinate);

    if (diameter == 2)
    {
        const raster::ClipRect area = clip.intersect(m_target.bounds());
        const raster::ClipRect quad{.x = px, .y = py, .width = 2, .height = 2};
        const raster::ClipRect visible = area.intersect(quad);
        if (!visible.is_empty())
        {
            for (i32 row = visible.y; row <= visible.bottom(); ++row)
            {
                m_target.plot_span(visible.x, visible.right(), row, color, eye);
            }
        }
        return;
    }

    const i32 radius = diameter / 2;
    raster::EllipseRasterizer::fill_ellipse(m_target, px, py, radius, radius, color, clip, eye);
}

// -----------------------------------------------------------------
// Lines
// -----------------------------------------------------------------

void Canvas::draw_line(f32 x0, f32 y0, f32 x1, f32 y1,
                       raster::Color color, const raster::StrokeDescriptor& stroke,
                       const raster::ClipRect& clip, raster::DrawEye eye)
{
    if (!finite(x0, y0) || !finite(x1, y1))
    {
        return;
    }

    raster::LineRasterizer::draw_line(
        m_target,
        to_pixel(x0, kMaxCoordinate), to_pixel(y0, kMaxCoordinate),
        to_pixel(x1, kMaxCoordinate), to_pixel(y1, kMaxCoordinate),
        color, stroke, clip, eye, m_antialiased);
}

void Canvas::draw_polyline(std::span<const projection::ScreenPoint> points,
                           raster::Color color, const raster::StrokeDescriptor& stroke,
                           const raster::ClipRect& clip, raster::DrawEye eye, f32 dx)
{
    std::vector<i32> xs;
    std::vector<i32> ys;
    xs.reserve(points.size());
    ys.reserve(points.size());

    auto push_break = [&]()
    {
        if (!xs.empty() && xs.back() != raster::LineRasterizer::kBreakMarker)
        {
            xs.push_back(raster::LineRasterizer::kBreakMarker);
            ys.push_back(raster::LineRasterizer::kBreakMarker);
        }
    };

    for (const projection::ScreenPoint& p : points)
    {
        if (!p.is_valid() || !finite(p.x + dx, p.y))
        {
            push_break();
            continue;
        }

        const i32 x = to_pixel(p.x + dx, kMaxCoordinate);
        const i32 y = to_pixel(p.y, kMaxCoordinate);

        // A real vertex at the marker position would read as a break
        if (x == raster::LineRasterizer::kBreakMarker && y == raster::LineRasterizer::kBreakMarker)
        {
            push_break();
            continue;
        }

        xs.push_back(x);
        ys.push_back(y);
    }

    if (!xs.empty())
    {
        raster::LineRasterizer::draw_polyline(m_target, xs, ys, color, stroke, clip, eye, m_antialiased);
    }
}

// -----------------------------------------------------------------
// Rectangles
// -----------------------------------------------------------------

void Canvas::draw_rect(f32 x, f32 y, f32 w, f32 h,
                       raster::Color color, const raster::StrokeDescriptor& stroke,
                       const raster::ClipRect& clip, raster::DrawEye eye)
{
    if (!finite(x, y) || !finite(w, h) || w < 0.0f || h < 0.0f)
    {
        return;
    }

    const i32 left = to_pixel(x, kMaxCoordinate);
    const i32 top = to_pixel(y, kMaxCoordinate);
    const i32 right = to_pixel(x + w, kMaxCoordinate);
    const i32 bottom = to_pixel(y + h, kMaxCoordinate);

    const std::vector<i32> xs{left, right, right, left, left};
    const std::vector<i32> ys{top, top, bottom, bottom, top};
    raster::LineRasterizer::draw_polyline(m_target, xs, ys, color, stroke, clip, eye, false);
}

void Canvas::fill_rect(f32 x, f32 y, f32 w, f32 h, raster::Color color,
                       const raster::ClipRect& clip, raster::DrawEye eye)
{
    if (!finite(x, y) || !finite(w, h) || w <= 0.0f || h <= 0.0f)
    {
        return;
    }

    const raster::ClipRect rect{
        .x = to_pixel(x, kMaxCoordinate),
        .y = to_pixel(y, kMaxCoordinate),
        .width = to_pixel(w, kMaxCoordinate),
        .height = to_pixel(h, kMaxCoordinate),
    };
    const raster::ClipRect visible = rect.intersect(clip).intersect(m_target.bounds());
    if (visible.is_empty())
    {
        return;
    }

    for (i32 row = visible.y; row <= visible.bottom(); ++row)
    {
        m_target.plot_span(visible.x, visible.right(), row, color, eye);
    }
}

// -----------------------------------------------------------------
// Ellipses
// -----------------------------------------------------------------

void Canvas::draw_ellipse(f32 cx, f32 cy, f32 rx, f32 ry,
                          raster::Color color, const raster::StrokeDescriptor& stroke,
                          const raster::ClipRect& clip, raster::DrawEye eye)
{
    if (!finite(cx, cy) || !finite(rx, ry))
    {
        return;
    }

    raster::EllipseRasterizer::draw_ellipse(
        m_target,
        to_pixel(cx, kMaxCoordinate), to_pixel(cy, kMaxCoordinate),
        to_pixel(rx, kMaxCoordinate), to_pixel(ry, kMaxCoordinate),
        color, stroke, clip, eye);
}

void Canvas::fill_ellipse(f32 cx, f32 cy, f32 rx, f32 ry, raster::Color color,
                          const raster::ClipRect& clip, raster::DrawEye eye)
{
    if (!finite(cx, cy) || !finite(rx, ry))
    {
        return;
    }

    raster::EllipseRasterizer::fill_ellipse(
        m_target,
        to_pixel(cx, kMaxCoordinate), to_pixel(cy, kMaxCoordinate),
        to_pixel(rx, kMaxCoordinate), to_pixel(ry, kMaxCoordinate),
        color, clip, eye);
}

// -----------------------------------------------------------------
// Paths and images
// -----------------------------------------------------------------

void Canvas::draw_path(const raster::Path& path, raster::Color color, const raster::StrokeDescriptor& stroke,
                       const raster::ClipRect& clip, raster::DrawEye eye)
{
    raster::PathCompositor::stroke_path(m_target, path, color, stroke, clip, eye, m_antialiased);
}

void Canvas::fill_path(const raster::Path& path, raster::Color color, raster::FillRule rule,
                       const raster::ClipRect& clip, raster::DrawEye eye)
{
    raster::PathCompositor::fill_path(m_target, path, color, rule, clip, eye);
}

void Canvas::draw_image(const raster::Image& image, f32 x, f32 y, const raster::ClipRect& clip,
                        raster::DrawEye eye)
{
    if (image.empty() || !finite(x, y))
    {
        return;
    }

    const i32 left = to_pixel(x, kMaxCoordinate);
    const i32 top = to_pixel(y, kMaxCoordinate);
    const raster::ClipRect placed{.x = left, .y = top, .width = image.width(), .height = image.height()};
    const raster::ClipRect visible = placed.intersect(clip).intersect(m_target.bounds());
    if (visible.is_empty())
    {
        return;
    }

    for (i32 row = visible.y; row <= visible.bottom(); ++row)
    {
        for (i32 col = visible.x; col <= visible.right(); ++col)
        {
            const raster::Color src = image.pixel(col - left, row - top);
            if (src.a != 0)
            {
                m_target.plot(col, row, src, eye);
            }
        }
    }
}

} // namespace skychart::rendering
