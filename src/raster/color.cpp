/// @file color.cpp
/// @brief Integer alpha blending.

#include "raster/color.hpp"

namespace skychart::raster
{

namespace
{

u8 mix(u8 src, u8 dst, u32 alpha)
{
    return static_cast<u8>((static_cast<u32>(dst) * (255u - alpha) + static_cast<u32>(src) * alpha) / 255u);
}

} // anonymous namespace

Color blend(Color src, Color dst)
{
    if (src.a == 255)
    {
        return src;
    }
    if (src.a == 0)
    {
        return dst;
    }

    const u32 alpha = src.a;
    return Color{
        .r = mix(src.r, dst.r, alpha),
        .g = mix(src.g, dst.g, alpha),
        .b = mix(src.b, dst.b, alpha),
        .a = static_cast<u8>(alpha + static_cast<u32>(dst.a) * (255u - alpha) / 255u),
    };
}

Color scale_alpha(Color c, u8 coverage)
{
    return c.with_alpha(static_cast<u8>(static_cast<u32>(c.a) * coverage / 255u));
}

} // namespace skychart::raster
