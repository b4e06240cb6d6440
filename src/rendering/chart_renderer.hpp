#pragma once

/// @file chart_renderer.hpp
/// @brief Draws a sky chart (grid, horizon, stars) and composes the stereo result.

#include "core/types.hpp"
#include "projection/projection_engine.hpp"
#include "raster/anaglyph_compositor.hpp"
#include "raster/color.hpp"
#include "raster/raster_buffer.hpp"
#include "raster/stroke.hpp"
#include "rendering/bright_stars.hpp"

#include <span>

namespace skychart::rendering
{
    class Canvas;

    struct ChartStyle
    {
        raster::Color background = raster::colors::kBlack;
        raster::Color grid_color{.r = 60, .g = 90, .b = 140, .a = 200};
        raster::Color horizon_color{.r = 40, .g = 160, .b = 60, .a = 255};
        raster::Color reticle_color{.r = 200, .g = 60, .b = 60, .a = 160};
        raster::StrokeDescriptor grid_stroke =
            raster::StrokeDescriptor::preset(raster::StrokeStyle::LinesShort, raster::StrokeWeight::Thin);
        raster::StrokeDescriptor horizon_stroke =
            raster::StrokeDescriptor::preset(raster::StrokeStyle::DefaultLine, raster::StrokeWeight::Normal);
        f64 grid_step_deg = 15.0;       ///< Spacing of meridians and parallels
        f64 grid_sample_deg = 2.0;      ///< Sampling step along each grid line
        f32 max_star_size = 7.0f;       ///< Diameter (px) of a magnitude -1.5 star
        f64 reticle_deg = 1.0;          ///< Angular radius of the centre reticle
        bool draw_grid = true;
        bool draw_horizon = true;
        bool draw_stars = true;
        bool draw_reticle = false;
        bool antialiased = true;
    };

    struct ChartStats
    {
        u32 stars_drawn = 0;
        u32 stars_hidden = 0;       ///< Fainter than the limit or not projectable
        u32 grid_lines = 0;
    };

    /// @brief Renders one chart frame for a configured ProjectionEngine.
    class ChartRenderer
    {
    public:
        explicit ChartRenderer(const ChartStyle& style = {});

        [[nodiscard]] const ChartStyle& get_style() const { return m_style; }
        void set_style(const ChartStyle& style) { m_style = style; }

        /// @brief Draw the chart into a buffer made for the stereo mode and compose it.
        [[nodiscard]] raster::Image render(
            const projection::ProjectionEngine& engine,
            const raster::AnaglyphCompositor& stereo,
            std::span<const BrightStar> stars,
            f32 magnitude_limit
        );

        /// @brief Counters of the last render().
        [[nodiscard]] const ChartStats& get_stats() const { return m_stats; }

        /// @brief Diameter in pixels of a star of magnitude mag under the given limit.
        [[nodiscard]] f32 star_size(f32 mag, f32 magnitude_limit) const;

    private:
        void draw_grid(Canvas& canvas, const projection::ProjectionEngine& engine);
        void draw_horizon(Canvas& canvas, const projection::ProjectionEngine& engine);
        void draw_reticle(Canvas& canvas, const projection::ProjectionEngine& engine);
        void draw_stars(
            Canvas& canvas,
            const projection::ProjectionEngine& engine,
            const raster::AnaglyphCompositor& stereo,
            std::span<const BrightStar> stars,
            f32 magnitude_limit
        );

        ChartStyle m_style;
        ChartStats m_stats;

        static constexpr f32 kBrightestMagnitude = -1.5f;
    };

} // namespace skychart::rendering
