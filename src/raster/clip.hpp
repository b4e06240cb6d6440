#pragma once

/// @file clip.hpp
/// @brief Axis-aligned clip rectangle and Liang–Barsky segment clipping.

#include "core/types.hpp"

namespace skychart::raster
{
    /// @brief Pixel-space clip rectangle. Inclusive on [x, x + width - 1].
    struct ClipRect
    {
        i32 x = 0;
        i32 y = 0;
        i32 width = 0;
        i32 height = 0;

        [[nodiscard]] static constexpr ClipRect from_size(i32 w, i32 h)
        {
            return ClipRect{.x = 0, .y = 0, .width = w, .height = h};
        }

        [[nodiscard]] constexpr bool is_empty() const { return width <= 0 || height <= 0; }
        [[nodiscard]] constexpr i32 right() const { return x + width - 1; }
        [[nodiscard]] constexpr i32 bottom() const { return y + height - 1; }

        [[nodiscard]] constexpr bool contains(i32 px, i32 py) const
        {
            return px >= x && px <= right() && py >= y && py <= bottom();
        }

        /// @brief Overlap of two rectangles (empty when disjoint).
        [[nodiscard]] ClipRect intersect(const ClipRect& other) const;

        bool operator==(const ClipRect&) const = default;
    };

    /// @brief One Liang–Barsky parameter test.
    ///
    /// Narrows [u1, u2] for the boundary with direction p and distance q.
    /// Returns false when the segment lies entirely outside that boundary.
    [[nodiscard]] bool clip_test(f64 p, f64 q, f64& u1, f64& u2);

    /// @brief Trim segment (x0,y0)-(x1,y1) to clip in place.
    ///
    /// Returns false (segment untouched) when nothing of it is inside. The
    /// trimmed endpoints always lie inside clip.
    [[nodiscard]] bool clip_line(i32& x0, i32& y0, i32& x1, i32& y1, const ClipRect& clip);

} // namespace skychart::raster
