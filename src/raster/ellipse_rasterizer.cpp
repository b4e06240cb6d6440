/// @file ellipse_rasterizer.cpp
/// @brief Ellipse interpolator and the quadrant-mirrored outline and fill.

#include "raster/ellipse_rasterizer.hpp"

#include <algorithm>

namespace skychart::raster
{

namespace
{

void plot_clipped(RasterBuffer& target, i32 x, i32 y, Color color, const ClipRect& clip, DrawEye eye)
{
    if (clip.contains(x, y))
    {
        target.plot(x, y, color, eye);
    }
}

void span_clipped(RasterBuffer& target, i32 x0, i32 x1, i32 y, Color color, const ClipRect& clip, DrawEye eye)
{
    if (y < clip.y || y > clip.bottom())
    {
        return;
    }
    x0 = std::max(x0, clip.x);
    x1 = std::min(x1, clip.right());
    if (x0 <= x1)
    {
        target.plot_span(x0, x1, y, color, eye);
    }
}

} // anonymous namespace

// -----------------------------------------------------------------
// EllipseInterpolator
// -----------------------------------------------------------------

EllipseInterpolator::EllipseInterpolator(i32 rx, i32 ry)
    : m_rx2(static_cast<i64>(rx) * rx)
    , m_ry2(static_cast<i64>(ry) * ry)
    , m_two_rx2(m_rx2 * 2)
    , m_two_ry2(m_ry2 * 2)
    , m_inc_y(-static_cast<i64>(ry) * m_two_rx2)
{
}

void EllipseInterpolator::step()
{
    const i64 fx = m_cur_f + m_inc_x + m_ry2;
    const i64 fy = m_cur_f + m_inc_y + m_rx2;
    const i64 fxy = m_cur_f + m_inc_x + m_ry2 + m_inc_y + m_rx2;

    const i64 mx = fx < 0 ? -fx : fx;
    const i64 my = fy < 0 ? -fy : fy;
    const i64 mxy = fxy < 0 ? -fxy : fxy;

    i64 min_m = mx;
    bool move_x = true;
    if (min_m > my)
    {
        min_m = my;
        move_x = false;
    }

    m_dx = 0;
    m_dy = 0;

    if (min_m > mxy)
    {
        m_inc_x += m_two_ry2;
        m_inc_y += m_two_rx2;
        m_cur_f = fxy;
        m_dx = 1;
        m_dy = 1;
        return;
    }

    if (move_x)
    {
        m_inc_x += m_two_ry2;
        m_cur_f = fx;
        m_dx = 1;
        return;
    }

    m_inc_y += m_two_rx2;
    m_cur_f = fy;
    m_dy = 1;
}

// -----------------------------------------------------------------
// Quadrant walkers
// -----------------------------------------------------------------

void EllipseRasterizer::outline(
    RasterBuffer& target,
    const Centres& c,
    i32 rx, i32 ry,
    Color color,
    DashCounter& dash,
    const ClipRect& clip,
    DrawEye eye)
{
    EllipseInterpolator ei(rx, ry);
    i32 dx = 0;
    i32 dy = -ry;

    auto plot_quadrants = [&](i32 ox, i32 oy)
    {
        // oy <= 0: north half uses the north centre, its mirror the south one
        plot_clipped(target, c.east + ox, c.north + oy, color, clip, eye);
        if (ox != 0 || c.west != c.east)
        {
            plot_clipped(target, c.west - ox, c.north + oy, color, clip, eye);
        }
        if (oy != 0 || c.north != c.south)
        {
            plot_clipped(target, c.east + ox, c.south - oy, color, clip, eye);
            if (ox != 0 || c.west != c.east)
            {
                plot_clipped(target, c.west - ox, c.south - oy, color, clip, eye);
            }
        }
    };

    // Every step advances dx or dy, so rx + ry steps reach the end of the quadrant
    const i32 guard = rx + ry;
    for (i32 steps = 0; steps <= guard; ++steps)
    {
        dx += ei.dx();
        dy += ei.dy();

        if (dash.next())
        {
            plot_quadrants(dx, dy);
        }

        if (dy >= 0)
        {
            break;
        }
        ei.step();
    }

    // Flat ellipses can reach the equator before the horizontal radius
    for (++dx; dx <= rx; ++dx)
    {
        if (dash.next())
        {
            plot_quadrants(dx, 0);
        }
    }
}

void EllipseRasterizer::fill(
    RasterBuffer& target,
    const Centres& c,
    i32 rx, i32 ry,
    Color color,
    const ClipRect& clip,
    DrawEye eye)
{
    EllipseInterpolator ei(rx, ry);
    i32 dx = 0;
    i32 dy = -ry;
    i32 dx0 = dx;
    i32 dy0 = dy;

    auto emit_rows = [&](i32 half_width, i32 oy)
    {
        span_clipped(target, c.west - half_width, c.east + half_width, c.north + oy, color, clip, eye);
        if (oy != 0 || c.north != c.south)
        {
            span_clipped(target, c.west - half_width, c.east + half_width, c.south - oy, color, clip, eye);
        }
    };

    const i32 guard = rx + ry;
    for (i32 steps = 0; steps <= guard; ++steps)
    {
        dx += ei.dx();
        dy += ei.dy();

        // A row is complete once the walker leaves it; its last dx is the widest
        if (dy != dy0)
        {
            emit_rows(dx0, dy0);
        }
        dx0 = dx;
        dy0 = dy;

        if (dy >= 0)
        {
            break;
        }
        ei.step();
    }

    emit_rows(dy0 == 0 ? std::max(dx0, rx) : dx0, dy0);
}

// -----------------------------------------------------------------
// Public entry points
// -----------------------------------------------------------------

void EllipseRasterizer::draw_ellipse(
    RasterBuffer& target,
    i32 cx, i32 cy, i32 rx, i32 ry,
    Color color,
    const StrokeDescriptor& stroke,
    const ClipRect& clip,
    DrawEye eye)
{
    if (rx <= 0 || ry <= 0 || !stroke.is_valid())
    {
        return;
    }

    const ClipRect area = clip.intersect(target.bounds());
    if (area.is_empty())
    {
        return;
    }

    if (rx <= 1 && ry <= 1)
    {
        plot_clipped(target, cx - 1, cy, color, area, eye);
        plot_clipped(target, cx + 1, cy, color, area, eye);
        plot_clipped(target, cx, cy - 1, color, area, eye);
        plot_clipped(target, cx, cy + 1, color, area, eye);
        return;
    }

    const Centres centres{.west = cx, .east = cx, .north = cy, .south = cy};
    DashCounter dash(stroke);

    const i32 rings = std::min({stroke.pixel_width(), rx, ry});
    for (i32 k = 0; k < rings; ++k)
    {
        dash.reset();
        outline(target, centres, rx - k, ry - k, color, dash, area, eye);
    }
}

void EllipseRasterizer::fill_ellipse(
    RasterBuffer& target,
    i32 cx, i32 cy, i32 rx, i32 ry,
    Color color,
    const ClipRect& clip,
    DrawEye eye)
{
    if (rx <= 0 || ry <= 0)
    {
        return;
    }

    const ClipRect area = clip.intersect(target.bounds());
    if (area.is_empty())
    {
        return;
    }

    if (rx <= 1 && ry <= 1)
    {
        span_clipped(target, cx - 1, cx + 1, cy, color, area, eye);
        plot_clipped(target, cx, cy - 1, color, area, eye);
        plot_clipped(target, cx, cy + 1, color, area, eye);
        return;
    }

    fill(target, Centres{.west = cx, .east = cx, .north = cy, .south = cy}, rx, ry, color, area, eye);
}

void EllipseRasterizer::draw_oval(
    RasterBuffer& target,
    i32 x, i32 y, i32 w, i32 h,
    Color color,
    const StrokeDescriptor& stroke,
    const ClipRect& clip,
    bool filled,
    DrawEye eye)
{
    if (w < 0 || h < 0 || (!filled && !stroke.is_valid()))
    {
        return;
    }

    const ClipRect area = clip.intersect(target.bounds());
    if (area.is_empty())
    {
        return;
    }

    const i32 rx = w / 2;
    const i32 ry = h / 2;

    // Boxes thinner than two pixels collapse to a solid bar
    if (rx == 0 || ry == 0)
    {
        for (i32 row = y; row <= y + h; ++row)
        {
            span_clipped(target, x, x + w, row, color, area, eye);
        }
        return;
    }

    const Centres centres{
        .west = x + rx,
        .east = x + rx + w % 2,
        .north = y + ry,
        .south = y + ry + h % 2,
    };

    if (filled)
    {
        fill(target, centres, rx, ry, color, area, eye);
        return;
    }

    DashCounter dash(stroke);
    const i32 rings = std::min({stroke.pixel_width(), rx, ry});
    for (i32 k = 0; k < rings; ++k)
    {
        dash.reset();
        outline(target, centres, rx - k, ry - k, color, dash, area, eye);
    }
}

} // namespace skychart::raster
