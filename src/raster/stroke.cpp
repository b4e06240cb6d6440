/// @file stroke.cpp
/// @brief Stroke presets and the dash counter.

#include "raster/stroke.hpp"

#include <algorithm>
#include <cmath>

namespace skychart::raster
{

namespace
{

constexpr f32 kThinWidth = 0.5f;
constexpr f32 kNormalWidth = 1.5f;
constexpr f32 kThickWidth = 4.0f;

f32 width_of(StrokeWeight weight)
{
    switch (weight)
    {
        case StrokeWeight::Thin:   return kThinWidth;
        case StrokeWeight::Normal: return kNormalWidth;
        case StrokeWeight::Thick:  return kThickWidth;
    }
    return kNormalWidth;
}

} // anonymous namespace

// -----------------------------------------------------------------
// StrokeDescriptor
// -----------------------------------------------------------------

bool StrokeDescriptor::is_valid() const
{
    if (!std::isfinite(width) || width <= 0.0f || width > kMaxWidth)
    {
        return false;
    }

    f32 total = 0.0f;
    for (const f32 length : dash)
    {
        if (!std::isfinite(length) || length < 0.0f)
        {
            return false;
        }
        total += length;
    }
    return dash.empty() || total > 0.0f;
}

bool StrokeDescriptor::is_dashed() const
{
    // An odd-length pattern is walked twice, so every entry serves as an off run once
    const std::size_t period = (dash.size() % 2 == 0) ? dash.size() : 2 * dash.size();
    for (std::size_t i = 1; i < period; i += 2)
    {
        if (dash[i % dash.size()] >= 0.5f)
        {
            return true;
        }
    }
    return false;
}

bool StrokeDescriptor::is_continuous() const
{
    return pixel_width() == 1 && !is_dashed();
}

i32 StrokeDescriptor::pixel_width() const
{
    if (!std::isfinite(width))
    {
        return 1;
    }
    return std::max(1, static_cast<i32>(std::clamp(width, 0.0f, kMaxWidth)));
}

StrokeDescriptor StrokeDescriptor::solid(f32 width)
{
    return StrokeDescriptor{.width = width};
}

StrokeDescriptor StrokeDescriptor::dashed(f32 on, f32 off, f32 width)
{
    return StrokeDescriptor{.width = width, .dash = {on, off}};
}

StrokeDescriptor StrokeDescriptor::preset(StrokeStyle style, StrokeWeight weight)
{
    const f32 w = width_of(weight);

    switch (style)
    {
        case StrokeStyle::DefaultLine:       return solid(w);
        case StrokeStyle::PointsHighSpace:   return dashed(w, 12.0f, w);
        case StrokeStyle::PointsMediumSpace: return dashed(w, 6.0f, w);
        case StrokeStyle::PointsLowSpace:    return dashed(w, 4.0f, w);
        case StrokeStyle::LinesShort:        return dashed(2.0f, 6.0f, w);
        case StrokeStyle::LinesMedium:       return dashed(6.0f, 6.0f, w);
        case StrokeStyle::LinesLarge:        return dashed(10.0f, 6.0f, w);
    }
    return solid(w);
}

// -----------------------------------------------------------------
// DashCounter
// -----------------------------------------------------------------

DashCounter::DashCounter(const StrokeDescriptor& stroke)
    : m_solid(!stroke.is_dashed())
{
    if (m_solid)
    {
        return;
    }

    // An odd-length pattern is walked twice so on and off alternate
    const std::size_t size = stroke.dash.size();
    const std::size_t count = (size % 2 == 0) ? size : 2 * size;
    for (std::size_t i = 0; i < count; ++i)
    {
        const f32 raw = stroke.dash[i % size];
        const f32 length = std::isfinite(raw) ? raw : 0.0f;
        const i32 px = static_cast<i32>(std::lround(std::clamp(length, 0.0f, StrokeDescriptor::kMaxDashRun)));
        // On runs (even index) never vanish
        m_runs.push_back((i % 2 == 0) ? std::max(px, 1) : px);
    }

    i64 period = 0;
    for (const i32 run : m_runs)
    {
        period += run;
    }

    if (std::isfinite(stroke.dash_phase) && stroke.dash_phase > 0.0f)
    {
        const f64 wrapped = std::fmod(static_cast<f64>(stroke.dash_phase), static_cast<f64>(period));
        m_phase = std::llround(wrapped) % period;
    }

    reset();
}

void DashCounter::reset()
{
    if (m_solid)
    {
        return;
    }

    // Skip whole runs; the phase is shorter than one period
    i64 phase = m_phase;
    m_index = 0;
    while (phase >= m_runs[m_index])
    {
        phase -= m_runs[m_index];
        m_index = (m_index + 1) % m_runs.size();
    }
    m_remaining = static_cast<i32>(m_runs[m_index] - phase);
}

bool DashCounter::next()
{
    if (m_solid)
    {
        return true;
    }

    const bool on = (m_index % 2) == 0;

    --m_remaining;
    if (m_remaining <= 0)
    {
        advance_run();
    }

    return on;
}

void DashCounter::advance_run()
{
    // Skip zero-length off runs; every on run is at least one pixel
    do
    {
        m_index = (m_index + 1) % m_runs.size();
        m_remaining = m_runs[m_index];
    } while (m_remaining <= 0);
}

} // namespace skychart::raster
