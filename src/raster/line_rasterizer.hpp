#pragma once

/// @file line_rasterizer.hpp
/// @brief Clipped Bresenham and Wu-antialiased line drawing.

#include "core/types.hpp"
#include "raster/clip.hpp"
#include "raster/color.hpp"
#include "raster/raster_buffer.hpp"
#include "raster/stroke.hpp"

#include <span>

namespace skychart::raster
{
    /// @brief Static line primitives writing into a RasterBuffer.
    ///
    /// Segments are trimmed to the clip rectangle (intersected with the buffer
    /// bounds) before rasterization; no pixel outside the clip is ever written.
    /// The dash counter restarts at every draw_line call and runs on across the
    /// connected segments of one draw_polyline call.
    class LineRasterizer
    {
    public:
        LineRasterizer() = delete;

        /// @brief Coordinate pair that splits a polyline into separate runs.
        static constexpr i32 kBreakMarker = -1;

        /// @brief Draw the segment (x0,y0)-(x1,y1), endpoints inclusive.
        ///
        /// Antialiasing applies to hairlines; wider strokes use thick Bresenham spans.
        static void draw_line(
            RasterBuffer& target,
            i32 x0, i32 y0, i32 x1, i32 y1,
            Color color,
            const StrokeDescriptor& stroke,
            const ClipRect& clip,
            DrawEye eye = DrawEye::Mono,
            bool antialiased = false
        );

        /// @brief Draw consecutive segments through (xs[i], ys[i]).
        ///
        /// A (kBreakMarker, kBreakMarker) vertex ends the current run. Shared
        /// vertices of connected segments are plotted once.
        static void draw_polyline(
            RasterBuffer& target,
            std::span<const i32> xs,
            std::span<const i32> ys,
            Color color,
            const StrokeDescriptor& stroke,
            const ClipRect& clip,
            DrawEye eye = DrawEye::Mono,
            bool antialiased = false
        );

    private:
        /// @brief One segment with an externally owned dash counter.
        static void draw_segment(
            RasterBuffer& target,
            i32 x0, i32 y0, i32 x1, i32 y1,
            Color color,
            const StrokeDescriptor& stroke,
            DashCounter& dash,
            const ClipRect& clip,
            DrawEye eye,
            bool antialiased,
            bool skip_first
        );

        static void bresenham(
            RasterBuffer& target,
            i32 x0, i32 y0, i32 x1, i32 y1,
            Color color,
            i32 thickness,
            DashCounter& dash,
            const ClipRect& clip,
            DrawEye eye,
            bool skip_first
        );

        static void wu(
            RasterBuffer& target,
            i32 x0, i32 y0, i32 x1, i32 y1,
            Color color,
            DashCounter& dash,
            const ClipRect& clip,
            DrawEye eye,
            bool skip_first
        );
    };

} // namespace skychart::raster
