#pragma once

/// @file stroke.hpp
/// @brief Stroke description (width, dash pattern, caps) and the per-primitive dash counter.

#include "core/types.hpp"

#include <cstddef>
#include <vector>

namespace skychart::raster
{
    enum class LineCap
    {
        Butt,
        Round,
        Square,
    };

    enum class LineJoin
    {
        Miter,
        Round,
        Bevel,
    };

    /// @brief Named stroke patterns used by chart elements.
    enum class StrokeStyle
    {
        DefaultLine,        ///< Continuous
        PointsHighSpace,    ///< Dots, 12 px apart
        PointsMediumSpace,  ///< Dots, 6 px apart
        PointsLowSpace,     ///< Dots, 4 px apart
        LinesShort,         ///< 2 on, 6 off
        LinesMedium,        ///< 6 on, 6 off
        LinesLarge,         ///< 10 on, 6 off
    };

    enum class StrokeWeight
    {
        Thin,       ///< 0.5 px
        Normal,     ///< 1.5 px
        Thick,      ///< 4 px
    };

    /// @brief Immutable description of how a line is stroked.
    ///
    /// Dash lengths are pixel run lengths, alternating on/off starting with on.
    /// An empty dash vector (or one whose off runs are all zero) is continuous.
    struct StrokeDescriptor
    {
        static constexpr f32 kMaxWidth = 4096.0f;       ///< Wider pens are rejected by is_valid()
        static constexpr f32 kMaxDashRun = 1.0e6f;      ///< Longer runs are clamped by DashCounter

        f32 width = 1.0f;
        std::vector<f32> dash;
        f32 dash_phase = 0.0f;
        LineCap cap = LineCap::Butt;
        LineJoin join = LineJoin::Round;
        f32 miter_limit = 1.0f;

        /// @brief False for non-positive, non-finite or oversized widths and for dash patterns of zero total length.
        [[nodiscard]] bool is_valid() const;

        /// @brief True when some off run (of the pattern repeated to even length) is at least half a pixel.
        [[nodiscard]] bool is_dashed() const;

        /// @brief Hairline without dashes: eligible for the direct run fast path.
        [[nodiscard]] bool is_continuous() const;

        /// @brief Width in whole pixels used by the rasterizers (at least 1).
        [[nodiscard]] i32 pixel_width() const;

        [[nodiscard]] static StrokeDescriptor solid(f32 width = 1.0f);
        [[nodiscard]] static StrokeDescriptor dashed(f32 on, f32 off, f32 width = 1.0f);
        [[nodiscard]] static StrokeDescriptor preset(StrokeStyle style, StrokeWeight weight = StrokeWeight::Normal);
    };

    /// @brief On/off pixel counter for one primitive.
    ///
    /// Construct (or reset()) at the start of every primitive; call next()
    /// once per candidate pixel. Runs are rounded to whole pixels, every on
    /// run lasts at least one pixel, and an odd-length pattern is repeated
    /// to make it even. The phase is reduced modulo the pattern period.
    class DashCounter
    {
    public:
        explicit DashCounter(const StrokeDescriptor& stroke);

        /// @brief Whether the current pixel is drawn; advances by one pixel.
        [[nodiscard]] bool next();

        /// @brief Return to the stroke's dash phase.
        void reset();

        [[nodiscard]] bool is_solid() const { return m_solid; }

    private:
        void advance_run();

        std::vector<i32> m_runs;
        i64 m_phase = 0;    ///< Already reduced modulo the pattern period
        std::size_t m_index = 0;
        i32 m_remaining = 0;
        bool m_solid = true;
    };

} // namespace skychart::raster
