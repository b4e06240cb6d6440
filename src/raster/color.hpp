#pragma once

/// @file color.hpp
/// @brief RGBA colour value and the integer alpha blend used by every draw call.

#include "core/types.hpp"

namespace skychart::raster
{
    /// @brief 8-bit RGBA colour. Alpha 255 is opaque.
    struct Color
    {
        u8 r = 0;
        u8 g = 0;
        u8 b = 0;
        u8 a = 255;

        /// @brief Unpack 0xAARRGGBB.
        [[nodiscard]] static constexpr Color from_argb(u32 argb)
        {
            return Color{
                .r = static_cast<u8>((argb >> 16) & 0xffu),
                .g = static_cast<u8>((argb >> 8) & 0xffu),
                .b = static_cast<u8>(argb & 0xffu),
                .a = static_cast<u8>((argb >> 24) & 0xffu),
            };
        }

        /// @brief Pack as 0xAARRGGBB.
        [[nodiscard]] constexpr u32 to_argb() const
        {
            return (static_cast<u32>(a) << 24) | (static_cast<u32>(r) << 16)
                 | (static_cast<u32>(g) << 8) | static_cast<u32>(b);
        }

        [[nodiscard]] constexpr Color with_alpha(u8 alpha) const
        {
            return Color{.r = r, .g = g, .b = b, .a = alpha};
        }

        [[nodiscard]] constexpr bool is_opaque() const { return a == 255; }

        bool operator==(const Color&) const = default;
    };

    /// @brief Composite src over dst using src.a as the weight.
    ///
    /// out = (dst × (255 - a) + src × a) / 255 per channel, integer arithmetic.
    [[nodiscard]] Color blend(Color src, Color dst);

    /// @brief Multiply the alpha of c by coverage / 255 (antialiasing weight).
    [[nodiscard]] Color scale_alpha(Color c, u8 coverage);

    namespace colors
    {
        inline constexpr Color kTransparent{.r = 0,   .g = 0,   .b = 0,   .a = 0};
        inline constexpr Color kBlack      {.r = 0,   .g = 0,   .b = 0,   .a = 255};
        inline constexpr Color kWhite      {.r = 255, .g = 255, .b = 255, .a = 255};
        inline constexpr Color kRed        {.r = 255, .g = 0,   .b = 0,   .a = 255};
        inline constexpr Color kGreen      {.r = 0,   .g = 255, .b = 0,   .a = 255};
        inline constexpr Color kBlue       {.r = 0,   .g = 0,   .b = 255, .a = 255};
        inline constexpr Color kCyan       {.r = 0,   .g = 255, .b = 255, .a = 255};
    }

} // namespace skychart::raster
