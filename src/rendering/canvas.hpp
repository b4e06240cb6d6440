#pragma once

/// @file canvas.hpp
/// @brief Float-coordinate drawing facade over the raster primitives.

#include "core/types.hpp"
#include "projection/projection_state.hpp"
#include "raster/clip.hpp"
#include "raster/color.hpp"
#include "raster/path_compositor.hpp"
#include "raster/raster_buffer.hpp"
#include "raster/stroke.hpp"

#include <span>

namespace skychart::rendering
{
    /// @brief Chart-level drawing calls on one RasterBuffer.
    ///
    /// Takes projected (sub-pixel) coordinates, rounds them to the pixel grid
    /// and forwards to the line, ellipse and path rasterizers. Every call takes
    /// its colour, stroke, clip and eye explicitly; the only state kept is the
    /// target and the antialiasing switch. Non-finite coordinates draw nothing.
    class Canvas
    {
    public:
        explicit Canvas(raster::RasterBuffer& target, bool antialiased = false);

        [[nodiscard]] raster::RasterBuffer& get_target() { return m_target; }
        [[nodiscard]] raster::ClipRect bounds() const { return m_target.bounds(); }

        void set_antialiasing(bool enabled) { m_antialiased = enabled; }
        [[nodiscard]] bool is_antialiased() const { return m_antialiased; }

        void clear(raster::Color color);

        void draw_point(f32 x, f32 y, raster::Color color, const raster::ClipRect& clip,
                        raster::DrawEye eye = raster::DrawEye::Mono);

        /// @brief Star disk: size <= 1 one pixel, size 2 a 2×2 quad, larger a filled disk of that diameter.
        void draw_star(f32 x, f32 y, f32 size, raster::Color color, const raster::ClipRect& clip,
                       raster::DrawEye eye = raster::DrawEye::Mono);

        void draw_line(f32 x0, f32 y0, f32 x1, f32 y1,
                       raster::Color color, const raster::StrokeDescriptor& stroke,
                       const raster::ClipRect& clip, raster::DrawEye eye = raster::DrawEye::Mono);

        /// @brief Connect projected points, breaking the line at every non-visible point.
        /// @param dx Horizontal shift applied to every point (stereo parallax).
        void draw_polyline(std::span<const projection::ScreenPoint> points,
                           raster::Color color, const raster::StrokeDescriptor& stroke,
                           const raster::ClipRect& clip, raster::DrawEye eye = raster::DrawEye::Mono,
                           f32 dx = 0.0f);

        void draw_rect(f32 x, f32 y, f32 w, f32 h,
                       raster::Color color, const raster::StrokeDescriptor& stroke,
                       const raster::ClipRect& clip, raster::DrawEye eye = raster::DrawEye::Mono);

        void fill_rect(f32 x, f32 y, f32 w, f32 h, raster::Color color,
                       const raster::ClipRect& clip, raster::DrawEye eye = raster::DrawEye::Mono);

        void draw_ellipse(f32 cx, f32 cy, f32 rx, f32 ry,
                          raster::Color color, const raster::StrokeDescriptor& stroke,
                          const raster::ClipRect& clip, raster::DrawEye eye = raster::DrawEye::Mono);

        void fill_ellipse(f32 cx, f32 cy, f32 rx, f32 ry, raster::Color color,
                          const raster::ClipRect& clip, raster::DrawEye eye = raster::DrawEye::Mono);

        void draw_path(const raster::Path& path, raster::Color color, const raster::StrokeDescriptor& stroke,
                       const raster::ClipRect& clip, raster::DrawEye eye = raster::DrawEye::Mono);

        void fill_path(const raster::Path& path, raster::Color color, raster::FillRule rule,
                       const raster::ClipRect& clip, raster::DrawEye eye = raster::DrawEye::Mono);

        /// @brief Alpha-blend image with its top-left corner at (x, y).
        void draw_image(const raster::Image& image, f32 x, f32 y, const raster::ClipRect& clip,
                        raster::DrawEye eye = raster::DrawEye::Mono);

    private:
        raster::RasterBuffer& m_target;
        bool m_antialiased;

        /// Coordinates beyond this are clamped before rounding to int.
        static constexpr f32 kMaxCoordinate = 1.0e7f;
    };

} // namespace skychart::rendering
