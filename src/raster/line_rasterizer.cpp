/// @file line_rasterizer.cpp
/// @brief Bresenham, thick-span and Wu line rasterization.

#include "raster/line_rasterizer.hpp"

#include <algorithm>
#include <cstdlib>

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

/// Pixel run perpendicular to the major axis, centred on (x, y).
void plot_cross_span(
    RasterBuffer& target,
    i32 x, i32 y,
    bool x_major,
    i32 thickness,
    Color color,
    const ClipRect& clip,
    DrawEye eye)
{
    if (thickness <= 1)
    {
        plot_clipped(target, x, y, color, clip, eye);
        return;
    }

    const i32 before = (thickness - 1) / 2;
    const i32 after = thickness / 2;

    if (x_major)
    {
        if (x < clip.x || x > clip.right())
        {
            return;
        }
        const i32 top = std::max(y - before, clip.y);
        const i32 bottom = std::min(y + after, clip.bottom());
        for (i32 py = top; py <= bottom; ++py)
        {
            target.plot(x, py, color, eye);
        }
    }
    else
    {
        if (y < clip.y || y > clip.bottom())
        {
            return;
        }
        const i32 left = std::max(x - before, clip.x);
        const i32 right = std::min(x + after, clip.right());
        if (left <= right)
        {
            target.plot_span(left, right, y, color, eye);
        }
    }
}

} // anonymous namespace

// -----------------------------------------------------------------
// Public entry points
// -----------------------------------------------------------------

void LineRasterizer::draw_line(
    RasterBuffer& target,
    i32 x0, i32 y0, i32 x1, i32 y1,
    Color color,
    const StrokeDescriptor& stroke,
    const ClipRect& clip,
    DrawEye eye,
    bool antialiased)
{
    if (!stroke.is_valid())
    {
        return;
    }

    DashCounter dash(stroke);
    draw_segment(target, x0, y0, x1, y1, color, stroke, dash, clip, eye, antialiased, false);
}

void LineRasterizer::draw_polyline(
    RasterBuffer& target,
    std::span<const i32> xs,
    std::span<const i32> ys,
    Color color,
    const StrokeDescriptor& stroke,
    const ClipRect& clip,
    DrawEye eye,
    bool antialiased)
{
    if (!stroke.is_valid())
    {
        return;
    }

    const std::size_t count = std::min(xs.size(), ys.size());
    DashCounter dash(stroke);

    auto is_break = [&](std::size_t i) { return xs[i] == kBreakMarker && ys[i] == kBreakMarker; };

    std::size_t run_start = 0;
    while (run_start < count)
    {
        if (is_break(run_start))
        {
            ++run_start;
            continue;
        }

        std::size_t run_end = run_start;
        while (run_end + 1 < count && !is_break(run_end + 1))
        {
            ++run_end;
        }

        dash.reset();
        if (run_end == run_start)
        {
            draw_segment(target, xs[run_start], ys[run_start], xs[run_start], ys[run_start],
                         color, stroke, dash, clip, eye, antialiased, false);
        }
        else
        {
            for (std::size_t i = run_start; i < run_end; ++i)
            {
                draw_segment(target, xs[i], ys[i], xs[i + 1], ys[i + 1],
                             color, stroke, dash, clip, eye, antialiased, i > run_start);
            }
        }

        run_start = run_end + 1;
    }
}

// -----------------------------------------------------------------
// Segment dispatch
// -----------------------------------------------------------------

void LineRasterizer::draw_segment(
    RasterBuffer& target,
    i32 x0, i32 y0, i32 x1, i32 y1,
    Color color,
    const StrokeDescriptor& stroke,
    DashCounter& dash,
    const ClipRect& clip,
    DrawEye eye,
    bool antialiased,
    bool skip_first)
{
    const ClipRect area = clip.intersect(target.bounds());
    if (area.is_empty())
    {
        return;
    }

    const i32 thickness = stroke.pixel_width();

    // Thick lines are trimmed against the clip grown by the pen size so the
    // cross spans still reach the clip edge; each span is clamped afterwards.
    ClipRect trim = area;
    if (thickness > 1)
    {
        trim = ClipRect{
            .x = area.x - thickness,
            .y = area.y - thickness,
            .width = area.width + 2 * thickness,
            .height = area.height + 2 * thickness,
        };
    }

    const i32 original_x0 = x0;
    const i32 original_y0 = y0;
    if (!clip_line(x0, y0, x1, y1, trim))
    {
        return;
    }

    // The shared vertex was only plotted by the previous segment if it survived clipping
    skip_first = skip_first && x0 == original_x0 && y0 == original_y0;

    if (x0 == x1 && y0 == y1)
    {
        if (!skip_first && dash.next())
        {
            plot_cross_span(target, x0, y0, true, thickness, color, area, eye);
        }
        return;
    }

    if (antialiased && thickness == 1)
    {
        wu(target, x0, y0, x1, y1, color, dash, area, eye, skip_first);
        return;
    }

    bresenham(target, x0, y0, x1, y1, color, thickness, dash, area, eye, skip_first);
}

// -----------------------------------------------------------------
// Bresenham
// -----------------------------------------------------------------

void LineRasterizer::bresenham(
    RasterBuffer& target,
    i32 x0, i32 y0, i32 x1, i32 y1,
    Color color,
    i32 thickness,
    DashCounter& dash,
    const ClipRect& clip,
    DrawEye eye,
    bool skip_first)
{
    // Continuous horizontal hairline: one span write
    if (y0 == y1 && thickness == 1 && dash.is_solid())
    {
        i32 left = std::min(x0, x1);
        i32 right = std::max(x0, x1);
        if (skip_first)
        {
            (x0 < x1) ? ++left : --right;
        }
        if (left <= right)
        {
            target.plot_span(left, right, y0, color, eye);
        }
        return;
    }

    const i32 dx = std::abs(x1 - x0);
    const i32 dy = -std::abs(y1 - y0);
    const i32 sx = x0 < x1 ? 1 : -1;
    const i32 sy = y0 < y1 ? 1 : -1;
    const bool x_major = dx >= -dy;

    i32 err = dx + dy;
    i32 x = x0;
    i32 y = y0;
    bool first = true;

    while (true)
    {
        if (!(first && skip_first) && dash.next())
        {
            plot_cross_span(target, x, y, x_major, thickness, color, clip, eye);
        }
        first = false;

        if (x == x1 && y == y1)
        {
            break;
        }

        const i32 e2 = 2 * err;
        if (e2 >= dy)
        {
            err += dy;
            x += sx;
        }
        if (e2 <= dx)
        {
            err += dx;
            y += sy;
        }
    }
}

// -----------------------------------------------------------------
// Wu
//
// 16-bit error accumulator along the major axis; the top 8 bits give the
// coverage split between the pixel on the line and its neighbour.
// -----------------------------------------------------------------

void LineRasterizer::wu(
    RasterBuffer& target,
    i32 x0, i32 y0, i32 x1, i32 y1,
    Color color,
    DashCounter& dash,
    const ClipRect& clip,
    DrawEye eye,
    bool skip_first)
{
    // Walk from (x0, y0) so the dash phase and the shared polyline vertex stay at the start
    const i32 xdir = x1 >= x0 ? 1 : -1;
    const i32 ydir = y1 >= y0 ? 1 : -1;
    i32 dx = std::abs(x1 - x0);
    i32 dy = std::abs(y1 - y0);

    // Horizontal, vertical and diagonal runs have full coverage
    if (dy == 0 || dx == 0 || dx == dy)
    {
        const i32 steps = std::max(dx, dy);
        const i32 step_x = dx == 0 ? 0 : xdir;
        const i32 step_y = dy == 0 ? 0 : ydir;
        for (i32 i = skip_first ? 1 : 0; i <= steps; ++i)
        {
            if (dash.next())
            {
                plot_clipped(target, x0 + i * step_x, y0 + i * step_y, color, clip, eye);
            }
        }
        return;
    }

    if (!skip_first && dash.next())
    {
        plot_clipped(target, x0, y0, color, clip, eye);
    }

    u16 error_acc = 0;

    if (dy > dx)
    {
        const u16 error_adj = static_cast<u16>((static_cast<u32>(dx) << 16) / static_cast<u32>(dy));
        while (--dy > 0)
        {
            const u16 previous = error_acc;
            error_acc = static_cast<u16>(error_acc + error_adj);
            if (error_acc <= previous)
            {
                x0 += xdir;
            }
            y0 += ydir;

            const u8 weight = static_cast<u8>(error_acc >> 8);
            if (dash.next())
            {
                plot_clipped(target, x0, y0, scale_alpha(color, static_cast<u8>(255 - weight)), clip, eye);
                plot_clipped(target, x0 + xdir, y0, scale_alpha(color, weight), clip, eye);
            }
        }
    }
    else
    {
        const u16 error_adj = static_cast<u16>((static_cast<u32>(dy) << 16) / static_cast<u32>(dx));
        while (--dx > 0)
        {
            const u16 previous = error_acc;
            error_acc = static_cast<u16>(error_acc + error_adj);
            if (error_acc <= previous)
            {
                y0 += ydir;
            }
            x0 += xdir;

            const u8 weight = static_cast<u8>(error_acc >> 8);
            if (dash.next())
            {
                plot_clipped(target, x0, y0, scale_alpha(color, static_cast<u8>(255 - weight)), clip, eye);
                plot_clipped(target, x0, y0 + ydir, scale_alpha(color, weight), clip, eye);
            }
        }
    }

    if (dash.next())
    {
        plot_clipped(target, x1, y1, color, clip, eye);
    }
}

} // namespace skychart::raster
