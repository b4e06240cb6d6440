/// @file test_color.cpp
/// @brief Unit tests for Color packing and the integer alpha blend.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "raster/color.hpp"

using namespace skychart;
using namespace skychart::raster;

TEST_CASE("ARGB packing")
{
    const Color c = Color::from_argb(0x80112233u);

    CHECK(c.a == 0x80);
    CHECK(c.r == 0x11);
    CHECK(c.g == 0x22);
    CHECK(c.b == 0x33);
    CHECK(c.to_argb() == 0x80112233u);
    CHECK(colors::kWhite.to_argb() == 0xffffffffu);
    CHECK(colors::kTransparent.to_argb() == 0u);
}

TEST_CASE("Opaque source replaces the destination")
{
    CHECK(blend(colors::kRed, colors::kBlue) == colors::kRed);
}

TEST_CASE("Transparent source keeps the destination")
{
    const Color dst{.r = 10, .g = 20, .b = 30, .a = 200};
    CHECK(blend(colors::kWhite.with_alpha(0), dst) == dst);
}

TEST_CASE("Half alpha mixes channel by channel")
{
    const Color out = blend(colors::kWhite.with_alpha(128), colors::kBlack);

    // (0 × 127 + 255 × 128) / 255
    CHECK(out.r == 128);
    CHECK(out.g == 128);
    CHECK(out.b == 128);
    CHECK(out.a == 255);
}

TEST_CASE("Blending over a transparent destination accumulates alpha")
{
    const Color out = blend(colors::kGreen.with_alpha(100), colors::kTransparent);

    CHECK(out.a == 100);
    CHECK(out.g == 100);
    CHECK(out.r == 0);
}

TEST_CASE("Blend never leaves the channel range")
{
    for (u32 alpha = 0; alpha <= 255; alpha += 17)
    {
        const Color out = blend(colors::kWhite.with_alpha(static_cast<u8>(alpha)), colors::kWhite);
        CHECK(out.r == 255);
        CHECK(out.a == 255);
    }
}

TEST_CASE("scale_alpha multiplies by coverage")
{
    CHECK(scale_alpha(colors::kRed, 255).a == 255);
    CHECK(scale_alpha(colors::kRed, 0).a == 0);
    CHECK(scale_alpha(colors::kRed, 128).a == 128);
    CHECK(scale_alpha(colors::kRed.with_alpha(128), 128).a == 64);
    CHECK(scale_alpha(colors::kRed, 128).r == 255);
}
