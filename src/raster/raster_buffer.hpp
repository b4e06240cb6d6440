#pragma once

/// @file raster_buffer.hpp
/// @brief Pixel planes: a single Image and the mono/stereo RasterBuffer drawn into.

#include "core/types.hpp"
#include "raster/clip.hpp"
#include "raster/color.hpp"

#include <optional>
#include <span>
#include <vector>

namespace skychart::raster
{
    /// @brief Which plane(s) of a RasterBuffer a draw call writes.
    enum class DrawEye
    {
        Mono,       ///< Every plane (screen-plane content)
        LeftEye,
        RightEye,
    };

    /// @brief One plane of packed 0xAARRGGBB pixels, row-major.
    class Image
    {
    public:
        Image() = default;

        /// @brief Allocate width × height pixels filled with background.
        Image(i32 width, i32 height, Color background = colors::kBlack);

        [[nodiscard]] i32 width() const { return m_width; }
        [[nodiscard]] i32 height() const { return m_height; }
        [[nodiscard]] bool empty() const { return m_pixels.empty(); }
        [[nodiscard]] ClipRect bounds() const { return ClipRect::from_size(m_width, m_height); }

        [[nodiscard]] bool contains(i32 x, i32 y) const
        {
            return x >= 0 && y >= 0 && x < m_width && y < m_height;
        }

        /// @brief Pixel at (x, y); transparent black when out of range.
        [[nodiscard]] Color pixel(i32 x, i32 y) const;

        /// @brief Overwrite a pixel. Out-of-range writes are ignored.
        void set_pixel(i32 x, i32 y, Color color);

        /// @brief Blend color over the existing pixel. Out-of-range writes are ignored.
        void blend_pixel(i32 x, i32 y, Color color);

        /// @brief Blend a horizontal run [x0, x1] on row y, clamped to the image.
        void blend_span(i32 x0, i32 x1, i32 y, Color color);

        void fill(Color color);

        /// @brief Raw pixel storage for direct indexed access.
        [[nodiscard]] std::span<u32> pixels() { return m_pixels; }
        [[nodiscard]] std::span<const u32> pixels() const { return m_pixels; }

        /// @brief Number of pixels that differ from color.
        [[nodiscard]] std::size_t count_not_equal(Color color) const;

        bool operator==(const Image&) const = default;

    private:
        i32 m_width = 0;
        i32 m_height = 0;
        std::vector<u32> m_pixels;
    };

    /// @brief Drawing target: a left plane plus, in stereo, a right plane.
    ///
    /// Mono buffers route every DrawEye to the single plane, so simple
    /// two-colour anaglyphs can draw both eyes into one image.
    class RasterBuffer
    {
    public:
        RasterBuffer(i32 width, i32 height, bool stereo = false, Color background = colors::kBlack);

        [[nodiscard]] i32 width() const { return m_left.width(); }
        [[nodiscard]] i32 height() const { return m_left.height(); }
        [[nodiscard]] bool is_stereo() const { return m_right.has_value(); }
        [[nodiscard]] ClipRect bounds() const { return m_left.bounds(); }

        [[nodiscard]] Image& left() { return m_left; }
        [[nodiscard]] const Image& left() const { return m_left; }

        /// @brief Right plane; the left plane for mono buffers.
        [[nodiscard]] Image& right() { return m_right ? *m_right : m_left; }
        [[nodiscard]] const Image& right() const { return m_right ? *m_right : m_left; }

        /// @brief Blend one pixel into the plane(s) selected by eye.
        void plot(i32 x, i32 y, Color color, DrawEye eye);

        /// @brief Blend a horizontal run into the plane(s) selected by eye.
        void plot_span(i32 x0, i32 x1, i32 y, Color color, DrawEye eye);

        void clear(Color color);

    private:
        Image m_left;
        std::optional<Image> m_right;
    };

} // namespace skychart::raster
