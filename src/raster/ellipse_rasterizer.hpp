#pragma once

/// @file ellipse_rasterizer.hpp
/// @brief Integer midpoint ellipse interpolation, outlined and filled.

#include "core/types.hpp"
#include "raster/clip.hpp"
#include "raster/color.hpp"
#include "raster/raster_buffer.hpp"
#include "raster/stroke.hpp"

namespace skychart::raster
{
    /// @brief Bresenham-style walker over one quadrant of an axis-aligned ellipse.
    ///
    /// Starts at (0, -ry). Each step() moves the offset by (dx, dy) with dx,dy in
    /// {0, 1}, choosing the move whose implicit-function error is smallest.
    class EllipseInterpolator
    {
    public:
        EllipseInterpolator(i32 rx, i32 ry);

        [[nodiscard]] i32 dx() const { return m_dx; }
        [[nodiscard]] i32 dy() const { return m_dy; }

        void step();

    private:
        i64 m_rx2;
        i64 m_ry2;
        i64 m_two_rx2;
        i64 m_two_ry2;
        i32 m_dx = 0;
        i32 m_dy = 0;
        i64 m_inc_x = 0;
        i64 m_inc_y;
        i64 m_cur_f = 0;
    };

    /// @brief Static ellipse primitives. Radii <= 0 draw nothing.
    class EllipseRasterizer
    {
    public:
        EllipseRasterizer() = delete;

        /// @brief Outline centred on (cx, cy). Stroke width draws concentric rings inwards.
        static void draw_ellipse(
            RasterBuffer& target,
            i32 cx, i32 cy, i32 rx, i32 ry,
            Color color,
            const StrokeDescriptor& stroke,
            const ClipRect& clip,
            DrawEye eye = DrawEye::Mono
        );

        /// @brief Filled ellipse, one clipped span per row.
        static void fill_ellipse(
            RasterBuffer& target,
            i32 cx, i32 cy, i32 rx, i32 ry,
            Color color,
            const ClipRect& clip,
            DrawEye eye = DrawEye::Mono
        );

        /// @brief Ellipse inscribed in the box (x, y, w, h), covering w + 1 by h + 1 pixels.
        static void draw_oval(
            RasterBuffer& target,
            i32 x, i32 y, i32 w, i32 h,
            Color color,
            const StrokeDescriptor& stroke,
            const ClipRect& clip,
            bool filled,
            DrawEye eye = DrawEye::Mono
        );

    private:
        /// @brief Quadrant centres: the left half mirrors about west, the right about east.
        struct Centres
        {
            i32 west;
            i32 east;
            i32 north;
            i32 south;
        };

        static void outline(
            RasterBuffer& target,
            const Centres& c,
            i32 rx, i32 ry,
            Color color,
            DashCounter& dash,
            const ClipRect& clip,
            DrawEye eye
        );

        static void fill(
            RasterBuffer& target,
            const Centres& c,
            i32 rx, i32 ry,
            Color color,
            const ClipRect& clip,
            DrawEye eye
        );
    };

} // namespace skychart::raster
