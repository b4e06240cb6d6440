/// @file path_compositor.cpp
/// @brief Curve flattening, edge-table scanline fill and path stroking.

#include "raster/path_compositor.hpp"

#include "raster/line_rasterizer.hpp"

#include <algorithm>
#include <cmath>

namespace skychart::raster
{

namespace
{

constexpr i32 kMaxCurveSegments = 256;

/// Coordinates are clamped to this magnitude before conversion to pixels.
constexpr f32 kMaxCoordinate = 1.0e7f;

f32 clamp_coordinate(f32 v)
{
    return std::clamp(v, -kMaxCoordinate, kMaxCoordinate);
}

/// Chord count keeping a curve with control deviation d within flatness.
i32 segments_for(f32 deviation, f32 flatness)
{
    if (!(deviation > 0.0f) || !std::isfinite(deviation))
    {
        return 1;
    }
    const f32 n = std::ceil(std::sqrt(deviation / flatness));
    return std::clamp(static_cast<i32>(n), 1, kMaxCurveSegments);
}

/// Non-horizontal polygon edge, stored top to bottom.
struct Edge
{
    f32 y_top;
    f32 y_bottom;
    f32 x_at_top;
    f32 slope;      ///< dx / dy
    i32 winding;    ///< +1 downwards in the source path, -1 upwards
};

struct Crossing
{
    f32 x;
    i32 winding;
};

} // anonymous namespace

// -----------------------------------------------------------------
// Path building
// -----------------------------------------------------------------

Path& Path::move_to(f32 x, f32 y)
{
    m_verbs.push_back(PathVerb::MoveTo);
    m_points.emplace_back(x, y);
    m_has_current = true;
    return *this;
}

Path& Path::line_to(f32 x, f32 y)
{
    if (!m_has_current)
    {
        return move_to(x, y);
    }
    m_verbs.push_back(PathVerb::LineTo);
    m_points.emplace_back(x, y);
    return *this;
}

Path& Path::quad_to(f32 cx, f32 cy, f32 x, f32 y)
{
    if (!m_has_current)
    {
        return move_to(x, y);
    }
    m_verbs.push_back(PathVerb::QuadTo);
    m_points.emplace_back(cx, cy);
    m_points.emplace_back(x, y);
    return *this;
}

Path& Path::curve_to(f32 c1x, f32 c1y, f32 c2x, f32 c2y, f32 x, f32 y)
{
    if (!m_has_current)
    {
        return move_to(x, y);
    }
    m_verbs.push_back(PathVerb::CurveTo);
    m_points.emplace_back(c1x, c1y);
    m_points.emplace_back(c2x, c2y);
    m_points.emplace_back(x, y);
    return *this;
}

Path& Path::close()
{
    if (m_has_current)
    {
        m_verbs.push_back(PathVerb::Close);
        m_has_current = false;
    }
    return *this;
}

void Path::clear()
{
    m_verbs.clear();
    m_points.clear();
    m_has_current = false;
}

// -----------------------------------------------------------------
// Flattening
//
// Chord count n = ceil(sqrt(d / flatness)) where d bounds the distance
// between the curve and its control polygon:
//   quadratic: |p0 - 2 p1 + p2| / 4
//   cubic:     3/4 × max(|p0 - 2 p1 + p2|, |p1 - 2 p2 + p3|)
// -----------------------------------------------------------------

std::vector<FlatSubpath> Path::flatten(f32 flatness) const
{
    if (!(flatness > 0.0f))
    {
        flatness = kDefaultFlatness;
    }

    std::vector<FlatSubpath> result;
    std::size_t p = 0;

    for (const PathVerb verb : m_verbs)
    {
        switch (verb)
        {
            case PathVerb::MoveTo:
                result.push_back(FlatSubpath{.points = {m_points[p]}, .closed = false});
                p += 1;
                break;

            case PathVerb::LineTo:
                result.back().points.push_back(m_points[p]);
                p += 1;
                break;

            case PathVerb::QuadTo:
            {
                auto& out = result.back().points;
                const Vec2f p0 = out.back();
                const Vec2f p1 = m_points[p];
                const Vec2f p2 = m_points[p + 1];

                const i32 n = segments_for(glm::length(p0 - 2.0f * p1 + p2) / 4.0f, flatness);
                for (i32 i = 1; i <= n; ++i)
                {
                    const f32 t = static_cast<f32>(i) / static_cast<f32>(n);
                    const f32 u = 1.0f - t;
                    out.push_back(u * u * p0 + 2.0f * u * t * p1 + t * t * p2);
                }
                p += 2;
                break;
            }

            case PathVerb::CurveTo:
            {
                auto& out = result.back().points;
                const Vec2f p0 = out.back();
                const Vec2f p1 = m_points[p];
                const Vec2f p2 = m_points[p + 1];
                const Vec2f p3 = m_points[p + 2];

                const f32 d = 0.75f * std::max(glm::length(p0 - 2.0f * p1 + p2),
                                               glm::length(p1 - 2.0f * p2 + p3));
                const i32 n = segments_for(d, flatness);
                for (i32 i = 1; i <= n; ++i)
                {
                    const f32 t = static_cast<f32>(i) / static_cast<f32>(n);
                    const f32 u = 1.0f - t;
                    out.push_back(u * u * u * p0 + 3.0f * u * u * t * p1 + 3.0f * u * t * t * p2 + t * t * t * p3);
                }
                p += 3;
                break;
            }

            case PathVerb::Close:
                result.back().closed = true;
                break;
        }
    }

    return result;
}

// -----------------------------------------------------------------
// Fill
// -----------------------------------------------------------------

void PathCompositor::fill_path(
    RasterBuffer& target,
    const Path& path,
    Color color,
    FillRule rule,
    const ClipRect& clip,
    DrawEye eye)
{
    const ClipRect area = clip.intersect(target.bounds());
    if (area.is_empty() || path.empty())
    {
        return;
    }

    // Edge table, sorted by top y
    std::vector<Edge> edges;
    for (const FlatSubpath& sub : path.flatten())
    {
        const std::size_t n = sub.points.size();
        for (std::size_t i = 0; i < n; ++i)
        {
            const Vec2f a = sub.points[i];
            const Vec2f b = sub.points[(i + 1) % n];
            if (a.y == b.y || !std::isfinite(a.x) || !std::isfinite(a.y)
                || !std::isfinite(b.x) || !std::isfinite(b.y))
            {
                continue;
            }

            const bool down = a.y < b.y;
            const Vec2f top = down ? a : b;
            const Vec2f bottom = down ? b : a;
            edges.push_back(Edge{
                .y_top = top.y,
                .y_bottom = bottom.y,
                .x_at_top = top.x,
                .slope = (bottom.x - top.x) / (bottom.y - top.y),
                .winding = down ? 1 : -1,
            });
        }
    }

    if (edges.empty())
    {
        return;
    }

    std::sort(edges.begin(), edges.end(), [](const Edge& l, const Edge& r) { return l.y_top < r.y_top; });

    f32 y_min = edges.front().y_top;
    f32 y_max = edges.front().y_bottom;
    for (const Edge& e : edges)
    {
        y_max = std::max(y_max, e.y_bottom);
    }

    const i32 first_row = std::max(area.y, static_cast<i32>(std::ceil(clamp_coordinate(y_min) - 0.5f)));
    const i32 last_row = std::min(area.bottom(), static_cast<i32>(std::floor(clamp_coordinate(y_max) - 0.5f)));

    std::vector<const Edge*> active;
    std::vector<Crossing> crossings;
    std::size_t next_edge = 0;

    for (i32 row = first_row; row <= last_row; ++row)
    {
        const f32 sample_y = static_cast<f32>(row) + 0.5f;

        // Activate edges starting at or above the sample line, drop finished ones
        while (next_edge < edges.size() && edges[next_edge].y_top <= sample_y)
        {
            active.push_back(&edges[next_edge]);
            ++next_edge;
        }
        std::erase_if(active, [sample_y](const Edge* e) { return e->y_bottom <= sample_y; });

        crossings.clear();
        for (const Edge* e : active)
        {
            if (e->y_top <= sample_y)
            {
                crossings.push_back(Crossing{
                    .x = e->x_at_top + (sample_y - e->y_top) * e->slope,
                    .winding = e->winding,
                });
            }
        }

        std::sort(crossings.begin(), crossings.end(),
                  [](const Crossing& l, const Crossing& r) { return l.x < r.x; });

        auto emit = [&](f32 xa, f32 xb)
        {
            const i32 x0 = std::max(area.x, static_cast<i32>(std::ceil(clamp_coordinate(xa) - 0.5f)));
            const i32 x1 = std::min(area.right(), static_cast<i32>(std::floor(clamp_coordinate(xb) - 0.5f)));
            if (x0 <= x1)
            {
                target.plot_span(x0, x1, row, color, eye);
            }
        };

        if (rule == FillRule::EvenOdd)
        {
            for (std::size_t i = 0; i + 1 < crossings.size(); i += 2)
            {
                emit(crossings[i].x, crossings[i + 1].x);
            }
        }
        else
        {
            i32 winding = 0;
            for (std::size_t i = 0; i + 1 < crossings.size(); ++i)
            {
                winding += crossings[i].winding;
                if (winding != 0)
                {
                    emit(crossings[i].x, crossings[i + 1].x);
                }
            }
        }
    }
}

// -----------------------------------------------------------------
// Stroke
// -----------------------------------------------------------------

void PathCompositor::stroke_path(
    RasterBuffer& target,
    const Path& path,
    Color color,
    const StrokeDescriptor& stroke,
    const ClipRect& clip,
    DrawEye eye,
    bool antialiased)
{
    if (path.empty() || !stroke.is_valid())
    {
        return;
    }

    std::vector<i32> xs;
    std::vector<i32> ys;

    for (const FlatSubpath& sub : path.flatten())
    {
        xs.clear();
        ys.clear();

        auto append = [&](const Vec2f& v)
        {
            if (!std::isfinite(v.x) || !std::isfinite(v.y))
            {
                return;
            }
            const i32 x = static_cast<i32>(std::lround(clamp_coordinate(v.x)));
            const i32 y = static_cast<i32>(std::lround(clamp_coordinate(v.y)));
            if (!xs.empty() && xs.back() == x && ys.back() == y)
            {
                return;
            }
            xs.push_back(x);
            ys.push_back(y);
        };

        for (const Vec2f& v : sub.points)
        {
            append(v);
        }
        if (sub.closed && sub.points.size() > 2)
        {
            append(sub.points.front());
        }

        if (!xs.empty())
        {
            LineRasterizer::draw_polyline(target, xs, ys, color, stroke, clip, eye, antialiased);
        }
    }
}

} // namespace skychart::raster
