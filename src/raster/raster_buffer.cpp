/// @file raster_buffer.cpp
/// @brief Pixel plane storage and eye routing.

#include "raster/raster_buffer.hpp"

#include <algorithm>
#include <utility>

namespace skychart::raster
{

// -----------------------------------------------------------------
// Image
// -----------------------------------------------------------------

Image::Image(i32 width, i32 height, Color background)
    : m_width(std::max(width, 0))
    , m_height(std::max(height, 0))
    , m_pixels(static_cast<std::size_t>(m_width) * static_cast<std::size_t>(m_height), background.to_argb())
{
}

Color Image::pixel(i32 x, i32 y) const
{
    if (!contains(x, y))
    {
        return colors::kTransparent;
    }
    return Color::from_argb(m_pixels[static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width)
                                     + static_cast<std::size_t>(x)]);
}

void Image::set_pixel(i32 x, i32 y, Color color)
{
    if (!contains(x, y))
    {
        return;
    }
    m_pixels[static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width) + static_cast<std::size_t>(x)] =
        color.to_argb();
}

void Image::blend_pixel(i32 x, i32 y, Color color)
{
    if (!contains(x, y))
    {
        return;
    }

    u32& dst = m_pixels[static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width)
                        + static_cast<std::size_t>(x)];
    dst = color.is_opaque() ? color.to_argb() : blend(color, Color::from_argb(dst)).to_argb();
}

void Image::blend_span(i32 x0, i32 x1, i32 y, Color color)
{
    if (y < 0 || y >= m_height)
    {
        return;
    }

    if (x0 > x1)
    {
        std::swap(x0, x1);
    }
    x0 = std::max(x0, 0);
    x1 = std::min(x1, m_width - 1);

    const std::size_t row = static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width);
    for (i32 x = x0; x <= x1; ++x)
    {
        u32& dst = m_pixels[row + static_cast<std::size_t>(x)];
        dst = color.is_opaque() ? color.to_argb() : blend(color, Color::from_argb(dst)).to_argb();
    }
}

void Image::fill(Color color)
{
    std::fill(m_pixels.begin(), m_pixels.end(), color.to_argb());
}

std::size_t Image::count_not_equal(Color color) const
{
    const u32 packed = color.to_argb();
    return static_cast<std::size_t>(std::count_if(m_pixels.begin(), m_pixels.end(),
                                                  [packed](u32 p) { return p != packed; }));
}

// -----------------------------------------------------------------
// RasterBuffer
// -----------------------------------------------------------------

RasterBuffer::RasterBuffer(i32 width, i32 height, bool stereo, Color background)
    : m_left(width, height, background)
{
    if (stereo)
    {
        m_right.emplace(width, height, background);
    }
}

void RasterBuffer::plot(i32 x, i32 y, Color color, DrawEye eye)
{
    switch (eye)
    {
        case DrawEye::Mono:
            m_left.blend_pixel(x, y, color);
            if (m_right)
            {
                m_right->blend_pixel(x, y, color);
            }
            break;
        case DrawEye::LeftEye:
            m_left.blend_pixel(x, y, color);
            break;
        case DrawEye::RightEye:
            right().blend_pixel(x, y, color);
            break;
    }
}

void RasterBuffer::plot_span(i32 x0, i32 x1, i32 y, Color color, DrawEye eye)
{
    switch (eye)
    {
        case DrawEye::Mono:
            m_left.blend_span(x0, x1, y, color);
            if (m_right)
            {
                m_right->blend_span(x0, x1, y, color);
            }
            break;
        case DrawEye::LeftEye:
            m_left.blend_span(x0, x1, y, color);
            break;
        case DrawEye::RightEye:
            right().blend_span(x0, x1, y, color);
            break;
    }
}

void RasterBuffer::clear(Color color)
{
    m_left.fill(color);
    if (m_right)
    {
        m_right->fill(color);
    }
}

} // namespace skychart::raster
