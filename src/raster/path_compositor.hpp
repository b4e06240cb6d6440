#pragma once

/// @file path_compositor.hpp
/// @brief Vector paths (lines, quadratic and cubic curves), flattening, scanline fill and stroke.

#include "core/types.hpp"
#include "raster/clip.hpp"
#include "raster/color.hpp"
#include "raster/raster_buffer.hpp"
#include "raster/stroke.hpp"

#include <vector>

namespace skychart::raster
{
    enum class PathVerb
    {
        MoveTo,
        LineTo,
        QuadTo,
        CurveTo,
        Close,
    };

    enum class FillRule
    {
        EvenOdd,
        NonZero,
    };

    /// @brief One flattened subpath in pixel coordinates.
    struct FlatSubpath
    {
        std::vector<Vec2f> points;
        bool closed = false;
    };

    /// @brief Sequence of drawing verbs in pixel space.
    ///
    /// A segment verb without a current point starts a new subpath at its end
    /// point. Builders return *this for chaining.
    class Path
    {
    public:
        static constexpr f32 kDefaultFlatness = 0.333f;

        Path& move_to(f32 x, f32 y);
        Path& line_to(f32 x, f32 y);
        Path& quad_to(f32 cx, f32 cy, f32 x, f32 y);
        Path& curve_to(f32 c1x, f32 c1y, f32 c2x, f32 c2y, f32 x, f32 y);
        Path& close();

        void clear();

        [[nodiscard]] bool empty() const { return m_verbs.empty(); }
        [[nodiscard]] const std::vector<PathVerb>& verbs() const { return m_verbs; }
        [[nodiscard]] const std::vector<Vec2f>& points() const { return m_points; }

        /// @brief Replace curves by chords no farther than flatness pixels from the curve.
        [[nodiscard]] std::vector<FlatSubpath> flatten(f32 flatness = kDefaultFlatness) const;

    private:
        std::vector<PathVerb> m_verbs;
        std::vector<Vec2f> m_points;
        bool m_has_current = false;
    };

    /// @brief Static fill and stroke of Paths into a RasterBuffer.
    class PathCompositor
    {
    public:
        PathCompositor() = delete;

        /// @brief Scanline fill sampling pixel centres. Open subpaths are closed implicitly.
        static void fill_path(
            RasterBuffer& target,
            const Path& path,
            Color color,
            FillRule rule,
            const ClipRect& clip,
            DrawEye eye = DrawEye::Mono
        );

        /// @brief Stroke each subpath as one polyline, the dash phase running along it.
        static void stroke_path(
            RasterBuffer& target,
            const Path& path,
            Color color,
            const StrokeDescriptor& stroke,
            const ClipRect& clip,
            DrawEye eye = DrawEye::Mono,
            bool antialiased = false
        );
    };

} // namespace skychart::raster
