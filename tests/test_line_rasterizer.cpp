/// @file test_line_rasterizer.cpp
/// @brief Unit tests for LineRasterizer and the stroke/dash model it consumes.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "raster/line_rasterizer.hpp"
#include "raster/raster_buffer.hpp"
#include "raster/stroke.hpp"

#include <array>
#include <limits>
#include <random>
#include <vector>

using namespace skychart;
using namespace skychart::raster;

// =================================================================
// Helpers
// =================================================================

static const StrokeDescriptor kHairline = StrokeDescriptor::solid();

static std::vector<i32> lit_columns(const Image& image, i32 row)
{
    std::vector<i32> xs;
    for (i32 x = 0; x < image.width(); ++x)
    {
        if (image.pixel(x, row) != colors::kBlack)
        {
            xs.push_back(x);
        }
    }
    return xs;
}

// =================================================================
// Stroke descriptor
// =================================================================

TEST_CASE("Stroke validity")
{
    CHECK(StrokeDescriptor::solid().is_valid());
    CHECK(StrokeDescriptor::dashed(2.0f, 6.0f).is_valid());
    CHECK_FALSE(StrokeDescriptor::solid(-1.0f).is_valid());
    CHECK_FALSE(StrokeDescriptor::solid(0.0f).is_valid());
    CHECK_FALSE(StrokeDescriptor::solid(std::numeric_limits<f32>::quiet_NaN()).is_valid());
    CHECK_FALSE(StrokeDescriptor::dashed(0.0f, 0.0f).is_valid());
    CHECK_FALSE(StrokeDescriptor::dashed(-2.0f, 6.0f).is_valid());
}

TEST_CASE("Stroke presets")
{
    const auto dots = StrokeDescriptor::preset(StrokeStyle::PointsHighSpace, StrokeWeight::Normal);
    CHECK(dots.width == doctest::Approx(1.5f));
    REQUIRE(dots.dash.size() == 2);
    CHECK(dots.dash[1] == doctest::Approx(12.0f));

    const auto large = StrokeDescriptor::preset(StrokeStyle::LinesLarge, StrokeWeight::Thick);
    CHECK(large.pixel_width() == 4);
    CHECK(large.dash[0] == doctest::Approx(10.0f));

    const auto plain = StrokeDescriptor::preset(StrokeStyle::DefaultLine, StrokeWeight::Thin);
    CHECK(plain.pixel_width() == 1);
    CHECK(plain.is_continuous());
    CHECK_FALSE(plain.is_dashed());
}

TEST_CASE("Dash pattern with zero off runs is continuous")
{
    const StrokeDescriptor stroke{.dash = {3.0f, 0.0f}};
    CHECK_FALSE(stroke.is_dashed());
    CHECK(DashCounter(stroke).is_solid());
}

TEST_CASE("Oversized pens are rejected")
{
    CHECK(StrokeDescriptor::solid(StrokeDescriptor::kMaxWidth).is_valid());
    CHECK_FALSE(StrokeDescriptor::solid(3.0e9f).is_valid());
    CHECK_FALSE(StrokeDescriptor::solid(std::numeric_limits<f32>::max()).is_valid());
    CHECK(StrokeDescriptor::solid(3.0e9f).pixel_width() == static_cast<i32>(StrokeDescriptor::kMaxWidth));

    RasterBuffer buffer(16, 16);
    LineRasterizer::draw_line(buffer, 0, 8, 15, 8, colors::kWhite, StrokeDescriptor::solid(3.0e9f), buffer.bounds());
    CHECK(buffer.left().count_not_equal(colors::kBlack) == 0);
}

TEST_CASE("Odd-length patterns are dashed")
{
    CHECK(StrokeDescriptor{.dash = {3.0f}}.is_dashed());
    CHECK(StrokeDescriptor{.dash = {3.0f, 0.2f, 1.0f}}.is_dashed());
    CHECK_FALSE(StrokeDescriptor{.dash = {0.2f}}.is_dashed());
}

// =================================================================
// Dash counter
// =================================================================

TEST_CASE("DashCounter walks the on/off runs")
{
    DashCounter dash(StrokeDescriptor::dashed(2.0f, 3.0f));

    const std::array<bool, 10> expected = {true, true, false, false, false, true, true, false, false, false};
    for (const bool on : expected)
    {
        CHECK(dash.next() == on);
    }

    dash.reset();
    CHECK(dash.next());
    CHECK(dash.next());
    CHECK_FALSE(dash.next());
}

TEST_CASE("DashCounter repeats an odd-length pattern")
{
    // {3, 2, 1} behaves as {3, 2, 1, 3, 2, 1}: on 3, off 2, on 1, off 3, on 2, off 1
    DashCounter dash(StrokeDescriptor{.dash = {3.0f, 2.0f, 1.0f}});

    const std::array<bool, 12> expected = {
        true, true, true, false, false, true,
        false, false, false, true, true, false,
    };
    for (const bool on : expected)
    {
        CHECK(dash.next() == on);
    }
}

TEST_CASE("DashCounter repeats a single-entry pattern as on and off")
{
    DashCounter dash(StrokeDescriptor{.dash = {3.0f}});

    const std::array<bool, 12> expected = {
        true, true, true, false, false, false,
        true, true, true, false, false, false,
    };
    for (const bool on : expected)
    {
        CHECK(dash.next() == on);
    }
}

TEST_CASE("DashCounter keeps the on runs of the repeated half")
{
    // {3, 0.2, 1} repeats as on 3, off 0.2, on 1, off 3, on 0.2, off 1
    DashCounter dash(StrokeDescriptor{.dash = {3.0f, 0.2f, 1.0f}});

    const std::array<bool, 9> expected = {true, true, true, true, false, false, false, true, false};
    for (const bool on : expected)
    {
        CHECK(dash.next() == on);
    }
}

TEST_CASE("DashCounter honours the phase")
{
    StrokeDescriptor stroke = StrokeDescriptor::dashed(2.0f, 6.0f);
    stroke.dash_phase = 1.0f;
    DashCounter dash(stroke);

    CHECK(dash.next());         // second pixel of the first on run
    CHECK_FALSE(dash.next());
}

TEST_CASE("DashCounter wraps a long phase into one period")
{
    StrokeDescriptor near = StrokeDescriptor::dashed(2.0f, 6.0f);
    near.dash_phase = 1.0f;
    StrokeDescriptor far = StrokeDescriptor::dashed(2.0f, 6.0f);
    far.dash_phase = 8000001.0f;

    DashCounter a(near);
    DashCounter b(far);
    for (int i = 0; i < 24; ++i)
    {
        CHECK(a.next() == b.next());
    }

    SUBCASE("huge phases still give the pattern")
    {
        StrokeDescriptor huge = StrokeDescriptor::dashed(2.0f, 6.0f);
        huge.dash_phase = 1.0e30f;
        DashCounter dash(huge);

        int lit = 0;
        for (int i = 0; i < 80; ++i)
        {
            lit += dash.next() ? 1 : 0;
        }
        CHECK(lit == 20);
    }
}

TEST_CASE("DashCounter keeps sub-pixel on runs visible")
{
    DashCounter dash(StrokeDescriptor::dashed(0.2f, 4.0f));

    CHECK(dash.next());
    for (int i = 0; i < 4; ++i)
    {
        CHECK_FALSE(dash.next());
    }
    CHECK(dash.next());
}

// =================================================================
// Single segments
// =================================================================

TEST_CASE("Degenerate segment writes exactly one pixel")
{
    RasterBuffer buffer(16, 16);
    LineRasterizer::draw_line(buffer, 5, 5, 5, 5, colors::kWhite, kHairline, buffer.bounds());

    CHECK(buffer.left().count_not_equal(colors::kBlack) == 1);
    CHECK(buffer.left().pixel(5, 5) == colors::kWhite);
}

TEST_CASE("Endpoints are inclusive")
{
    RasterBuffer buffer(32, 32);

    SUBCASE("horizontal")
    {
        LineRasterizer::draw_line(buffer, 3, 4, 12, 4, colors::kWhite, kHairline, buffer.bounds());
        CHECK(buffer.left().count_not_equal(colors::kBlack) == 10);
        CHECK(buffer.left().pixel(3, 4) == colors::kWhite);
        CHECK(buffer.left().pixel(12, 4) == colors::kWhite);
    }

    SUBCASE("diagonal")
    {
        LineRasterizer::draw_line(buffer, 0, 0, 9, 9, colors::kWhite, kHairline, buffer.bounds());
        CHECK(buffer.left().count_not_equal(colors::kBlack) == 10);
        for (i32 i = 0; i < 10; ++i)
        {
            CHECK(buffer.left().pixel(i, i) == colors::kWhite);
        }
    }

    SUBCASE("steep, drawn backwards")
    {
        LineRasterizer::draw_line(buffer, 7, 25, 2, 3, colors::kWhite, kHairline, buffer.bounds());
        CHECK(buffer.left().count_not_equal(colors::kBlack) == 23);
        CHECK(buffer.left().pixel(7, 25) == colors::kWhite);
        CHECK(buffer.left().pixel(2, 3) == colors::kWhite);
    }
}

TEST_CASE("Dashed line: 2 on, 6 off")
{
    RasterBuffer buffer(16, 4);
    LineRasterizer::draw_line(buffer, 0, 1, 15, 1, colors::kWhite, StrokeDescriptor::dashed(2.0f, 6.0f),
                              buffer.bounds());

    CHECK(lit_columns(buffer.left(), 1) == std::vector<i32>{0, 1, 8, 9});
}

TEST_CASE("Dash phase shifts the pattern along the line")
{
    RasterBuffer buffer(16, 4);
    StrokeDescriptor stroke = StrokeDescriptor::dashed(2.0f, 6.0f);
    stroke.dash_phase = 1.0f;

    LineRasterizer::draw_line(buffer, 0, 1, 15, 1, colors::kWhite, stroke, buffer.bounds());

    CHECK(lit_columns(buffer.left(), 1) == std::vector<i32>{0, 7, 8, 15});
}

TEST_CASE("Single-entry dash pattern alternates on and off")
{
    RasterBuffer buffer(32, 4);
    LineRasterizer::draw_line(buffer, 0, 1, 29, 1, colors::kWhite, StrokeDescriptor{.dash = {3.0f}}, buffer.bounds());

    CHECK(buffer.left().count_not_equal(colors::kBlack) == 15);
    const std::vector<i32> expected = {0, 1, 2, 6, 7, 8, 12, 13, 14, 18, 19, 20, 24, 25, 26};
    CHECK(lit_columns(buffer.left(), 1) == expected);
}

TEST_CASE("Lit fraction of a long dashed line matches on / (on + off)")
{
    struct Pattern
    {
        std::vector<f32> dash;
        f64 fraction;
    };
    const Pattern patterns[] = {
        {{2.0f, 6.0f}, 2.0 / 8.0},
        {{6.0f, 6.0f}, 0.5},
        {{10.0f, 6.0f}, 10.0 / 16.0},
        {{1.0f, 2.0f}, 1.0 / 3.0},
        {{3.0f}, 0.5},
        {{4.0f, 1.0f, 2.0f}, 7.0 / 14.0},
    };

    for (const Pattern& pattern : patterns)
    {
        for (const bool aa : {false, true})
        {
            CAPTURE(pattern.fraction);
            CAPTURE(aa);

            // Shallow slope: one pixel per column without antialiasing
            RasterBuffer buffer(4000, 64);
            const StrokeDescriptor stroke{.dash = pattern.dash};
            LineRasterizer::draw_line(buffer, 0, 0, 3999, aa ? 0 : 50, colors::kWhite, stroke, buffer.bounds(),
                                      DrawEye::Mono, aa);

            const f64 lit = static_cast<f64>(buffer.left().count_not_equal(colors::kBlack));
            CHECK(lit / 4000.0 == doctest::Approx(pattern.fraction).epsilon(0.01));
        }
    }
}

TEST_CASE("Invalid strokes draw nothing")
{
    RasterBuffer buffer(16, 16);

    LineRasterizer::draw_line(buffer, 0, 0, 15, 15, colors::kWhite, StrokeDescriptor::solid(-2.0f), buffer.bounds());
    LineRasterizer::draw_line(buffer, 0, 0, 15, 15, colors::kWhite, StrokeDescriptor::dashed(0.0f, 0.0f),
                              buffer.bounds());

    CHECK(buffer.left().count_not_equal(colors::kBlack) == 0);
}

TEST_CASE("Wide lines are spread across the minor axis")
{
    RasterBuffer buffer(32, 32);

    SUBCASE("odd width is centred")
    {
        LineRasterizer::draw_line(buffer, 2, 10, 20, 10, colors::kWhite, StrokeDescriptor::solid(3.0f),
                                  buffer.bounds());
        CHECK(buffer.left().count_not_equal(colors::kBlack) == 19 * 3);
        CHECK(buffer.left().pixel(2, 9) == colors::kWhite);
        CHECK(buffer.left().pixel(2, 11) == colors::kWhite);
        CHECK(buffer.left().pixel(2, 12) == colors::kBlack);
    }

    SUBCASE("even width leans down")
    {
        LineRasterizer::draw_line(buffer, 2, 10, 20, 10, colors::kWhite, StrokeDescriptor::solid(4.0f),
                                  buffer.bounds());
        CHECK(buffer.left().count_not_equal(colors::kBlack) == 19 * 4);
        CHECK(buffer.left().pixel(5, 9) == colors::kWhite);
        CHECK(buffer.left().pixel(5, 12) == colors::kWhite);
    }

    SUBCASE("vertical wide line uses horizontal spans")
    {
        LineRasterizer::draw_line(buffer, 10, 0, 10, 31, colors::kWhite, StrokeDescriptor::solid(3.0f),
                                  buffer.bounds());
        CHECK(buffer.left().count_not_equal(colors::kBlack) == 32 * 3);
    }
}

// =================================================================
// Clipping
// =================================================================

TEST_CASE("Nothing is written outside the clip rectangle")
{
    std::mt19937 rng(7);
    std::uniform_int_distribution<i32> coord(-100, 160);

    const ClipRect clip{.x = 10, .y = 12, .width = 30, .height = 20};
    const StrokeDescriptor strokes[] = {
        StrokeDescriptor::solid(),
        StrokeDescriptor::solid(5.0f),
        StrokeDescriptor::dashed(3.0f, 2.0f, 2.0f),
    };

    for (const auto& stroke : strokes)
    {
        for (const bool aa : {false, true})
        {
            RasterBuffer buffer(64, 64);
            for (int i = 0; i < 200; ++i)
            {
                LineRasterizer::draw_line(buffer, coord(rng), coord(rng), coord(rng), coord(rng),
                                          colors::kWhite, stroke, clip, DrawEye::Mono, aa);
            }

            for (i32 y = 0; y < 64; ++y)
            {
                for (i32 x = 0; x < 64; ++x)
                {
                    if (!clip.contains(x, y))
                    {
                        CHECK(buffer.left().pixel(x, y) == colors::kBlack);
                    }
                }
            }
        }
    }
}

TEST_CASE("Far endpoints are clipped, not wrapped")
{
    RasterBuffer buffer(64, 8);
    LineRasterizer::draw_line(buffer, -1000000, 3, 1000000, 3, colors::kWhite, kHairline, buffer.bounds());

    CHECK(buffer.left().count_not_equal(colors::kBlack) == 64);
}

TEST_CASE("Wide line reaches the clip edge")
{
    RasterBuffer buffer(32, 32);
    const ClipRect clip{.x = 0, .y = 0, .width = 32, .height = 10};

    // Centre row is just outside the clip; the lower half of the pen is not
    LineRasterizer::draw_line(buffer, 0, 11, 31, 11, colors::kWhite, StrokeDescriptor::solid(5.0f), clip);

    CHECK(buffer.left().pixel(16, 9) == colors::kWhite);
    CHECK(buffer.left().pixel(16, 10) == colors::kBlack);
}

// =================================================================
// Polylines
// =================================================================

TEST_CASE("Break marker splits a polyline")
{
    RasterBuffer buffer(40, 10);
    const std::array<i32, 5> xs = {0, 10, LineRasterizer::kBreakMarker, 20, 30};
    const std::array<i32, 5> ys = {0, 0, LineRasterizer::kBreakMarker, 5, 5};

    LineRasterizer::draw_polyline(buffer, xs, ys, colors::kWhite, kHairline, buffer.bounds());

    CHECK(buffer.left().count_not_equal(colors::kBlack) == 22);
    CHECK(buffer.left().pixel(15, 2) == colors::kBlack);
    CHECK(buffer.left().pixel(15, 3) == colors::kBlack);
}

TEST_CASE("Shared vertices are plotted once")
{
    RasterBuffer buffer(16, 16);
    const Color translucent = colors::kWhite.with_alpha(128);

    const std::array<i32, 3> xs = {0, 5, 5};
    const std::array<i32, 3> ys = {0, 0, 5};
    LineRasterizer::draw_polyline(buffer, xs, ys, translucent, kHairline, buffer.bounds());

    CHECK(buffer.left().count_not_equal(colors::kBlack) == 11);
    CHECK(buffer.left().pixel(5, 0) == buffer.left().pixel(2, 0));
    CHECK(buffer.left().pixel(5, 0) == buffer.left().pixel(5, 3));
}

TEST_CASE("Antialiased polylines plot shared vertices once")
{
    const Color translucent = colors::kWhite.with_alpha(128);

    SUBCASE("sloped segments")
    {
        RasterBuffer buffer(32, 16);
        const std::array<i32, 3> xs = {0, 10, 19};
        const std::array<i32, 3> ys = {0, 3, 10};
        LineRasterizer::draw_polyline(buffer, xs, ys, translucent, kHairline, buffer.bounds(), DrawEye::Mono, true);

        CHECK(buffer.left().pixel(10, 3) == buffer.left().pixel(0, 0));
        CHECK(buffer.left().pixel(19, 10) == buffer.left().pixel(0, 0));
    }

    SUBCASE("axis-aligned segments")
    {
        RasterBuffer buffer(16, 16);
        const std::array<i32, 3> xs = {0, 5, 5};
        const std::array<i32, 3> ys = {0, 0, 5};
        LineRasterizer::draw_polyline(buffer, xs, ys, translucent, kHairline, buffer.bounds(), DrawEye::Mono, true);

        CHECK(buffer.left().count_not_equal(colors::kBlack) == 11);
        CHECK(buffer.left().pixel(5, 0) == buffer.left().pixel(2, 0));
    }

    SUBCASE("dash phase carries across the vertex")
    {
        RasterBuffer buffer(32, 32);
        const std::array<i32, 3> xs = {0, 3, 3};
        const std::array<i32, 3> ys = {0, 0, 8};
        LineRasterizer::draw_polyline(buffer, xs, ys, colors::kWhite, StrokeDescriptor::dashed(6.0f, 3.0f),
                                      buffer.bounds(), DrawEye::Mono, true);

        CHECK(buffer.left().pixel(3, 2) == colors::kWhite);
        CHECK(buffer.left().pixel(3, 3) == colors::kBlack);
        CHECK(buffer.left().pixel(3, 6) == colors::kWhite);
    }
}

TEST_CASE("Antialiased lines run from their first endpoint")
{
    // Drawn upwards: the dash must start at (0, 9), not at the top
    RasterBuffer buffer(16, 16);
    LineRasterizer::draw_line(buffer, 0, 9, 0, 0, colors::kWhite, StrokeDescriptor::dashed(2.0f, 3.0f),
                              buffer.bounds(), DrawEye::Mono, true);

    CHECK(buffer.left().pixel(0, 9) == colors::kWhite);
    CHECK(buffer.left().pixel(0, 8) == colors::kWhite);
    CHECK(buffer.left().pixel(0, 7) == colors::kBlack);
    CHECK(buffer.left().pixel(0, 4) == colors::kWhite);
}

TEST_CASE("Dash counter runs on across polyline segments")
{
    RasterBuffer buffer(32, 32);
    const std::array<i32, 3> xs = {0, 3, 3};
    const std::array<i32, 3> ys = {0, 0, 8};

    LineRasterizer::draw_polyline(buffer, xs, ys, colors::kWhite, StrokeDescriptor::dashed(6.0f, 3.0f),
                                  buffer.bounds());

    // Pixels (0..3, 0) then (3, 1..8): on 6, off 3, on 3
    CHECK(buffer.left().pixel(3, 2) == colors::kWhite);
    CHECK(buffer.left().pixel(3, 3) == colors::kBlack);
    CHECK(buffer.left().pixel(3, 5) == colors::kBlack);
    CHECK(buffer.left().pixel(3, 6) == colors::kWhite);
    CHECK(buffer.left().pixel(3, 8) == colors::kWhite);
}

TEST_CASE("Single-vertex polyline draws a dot")
{
    RasterBuffer buffer(8, 8);
    const std::array<i32, 1> xs = {4};
    const std::array<i32, 1> ys = {6};

    LineRasterizer::draw_polyline(buffer, xs, ys, colors::kWhite, kHairline, buffer.bounds());

    CHECK(buffer.left().count_not_equal(colors::kBlack) == 1);
    CHECK(buffer.left().pixel(4, 6) == colors::kWhite);
}

// =================================================================
// Antialiasing and eyes
// =================================================================

TEST_CASE("Antialiased line keeps full-coverage endpoints and blends in between")
{
    RasterBuffer buffer(32, 16);
    LineRasterizer::draw_line(buffer, 0, 0, 20, 7, colors::kWhite, kHairline, buffer.bounds(), DrawEye::Mono, true);

    CHECK(buffer.left().pixel(0, 0) == colors::kWhite);
    CHECK(buffer.left().pixel(20, 7) == colors::kWhite);

    std::size_t partial = 0;
    for (const u32 packed : buffer.left().pixels())
    {
        const Color c = Color::from_argb(packed);
        if (c.r > 0 && c.r < 255)
        {
            ++partial;
        }
    }
    CHECK(partial > 0);
}

TEST_CASE("Antialiased axis-aligned lines are solid")
{
    RasterBuffer buffer(16, 16);
    LineRasterizer::draw_line(buffer, 2, 3, 2, 12, colors::kWhite, kHairline, buffer.bounds(), DrawEye::Mono, true);

    CHECK(buffer.left().count_not_equal(colors::kBlack) == 10);
}

TEST_CASE("Eye selection routes to one plane of a stereo buffer")
{
    RasterBuffer buffer(16, 16, true);

    LineRasterizer::draw_line(buffer, 0, 2, 15, 2, colors::kRed, kHairline, buffer.bounds(), DrawEye::LeftEye);
    LineRasterizer::draw_line(buffer, 0, 4, 15, 4, colors::kCyan, kHairline, buffer.bounds(), DrawEye::RightEye);
    LineRasterizer::draw_line(buffer, 0, 6, 15, 6, colors::kWhite, kHairline, buffer.bounds(), DrawEye::Mono);

    CHECK(buffer.left().pixel(5, 2) == colors::kRed);
    CHECK(buffer.right().pixel(5, 2) == colors::kBlack);
    CHECK(buffer.right().pixel(5, 4) == colors::kCyan);
    CHECK(buffer.left().pixel(5, 4) == colors::kBlack);
    CHECK(buffer.left().pixel(5, 6) == colors::kWhite);
    CHECK(buffer.right().pixel(5, 6) == colors::kWhite);
}
