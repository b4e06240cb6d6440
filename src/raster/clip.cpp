/// @file clip.cpp
/// @brief Liang–Barsky clipping.

#include "raster/clip.hpp"

#include <algorithm>
#include <cmath>

namespace skychart::raster
{

ClipRect ClipRect::intersect(const ClipRect& other) const
{
    const i32 left = std::max(x, other.x);
    const i32 top = std::max(y, other.y);
    const i32 r = std::min(right(), other.right());
    const i32 b = std::min(bottom(), other.bottom());

    if (r < left || b < top)
    {
        return ClipRect{.x = left, .y = top, .width = 0, .height = 0};
    }

    return ClipRect{.x = left, .y = top, .width = r - left + 1, .height = b - top + 1};
}

bool clip_test(f64 p, f64 q, f64& u1, f64& u2)
{
    if (p < 0.0)
    {
        const f64 r = q / p;
        if (r > u2)
        {
            return false;
        }
        u1 = std::max(u1, r);
    }
    else if (p > 0.0)
    {
        const f64 r = q / p;
        if (r < u1)
        {
            return false;
        }
        u2 = std::min(u2, r);
    }
    else if (q < 0.0)
    {
        // Parallel to this boundary and outside it
        return false;
    }
    return true;
}

// -----------------------------------------------------------------
// Liang–Barsky
//
// P(u) = P0 + u × (P1 - P0), u in [0, 1]
// Boundaries tested in order: left, right, top, bottom.
// -----------------------------------------------------------------

bool clip_line(i32& x0, i32& y0, i32& x1, i32& y1, const ClipRect& clip)
{
    if (clip.is_empty())
    {
        return false;
    }

    const f64 dx = static_cast<f64>(x1) - static_cast<f64>(x0);
    const f64 dy = static_cast<f64>(y1) - static_cast<f64>(y0);
    f64 u1 = 0.0;
    f64 u2 = 1.0;

    if (!clip_test(-dx, static_cast<f64>(x0 - clip.x), u1, u2)
        || !clip_test(dx, static_cast<f64>(clip.right() - x0), u1, u2)
        || !clip_test(-dy, static_cast<f64>(y0 - clip.y), u1, u2)
        || !clip_test(dy, static_cast<f64>(clip.bottom() - y0), u1, u2))
    {
        return false;
    }

    const i32 ox = x0;
    const i32 oy = y0;

    if (u2 < 1.0)
    {
        x1 = ox + static_cast<i32>(std::lround(u2 * dx));
        y1 = oy + static_cast<i32>(std::lround(u2 * dy));
    }
    if (u1 > 0.0)
    {
        x0 = ox + static_cast<i32>(std::lround(u1 * dx));
        y0 = oy + static_cast<i32>(std::lround(u1 * dy));
    }

    // Rounding may land one pixel outside
    x0 = std::clamp(x0, clip.x, clip.right());
    x1 = std::clamp(x1, clip.x, clip.right());
    y0 = std::clamp(y0, clip.y, clip.bottom());
    y1 = std::clamp(y1, clip.y, clip.bottom());

    return true;
}

} // namespace skychart::raster
