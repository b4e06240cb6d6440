/// @file test_canvas.cpp
/// @brief Unit tests for the Canvas drawing facade.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "rendering/canvas.hpp"

#include <limits>
#include <vector>

using namespace skychart;
using namespace skychart::rendering;
using raster::Color;
using raster::RasterBuffer;
namespace colors = raster::colors;

static constexpr f32 kNaN = std::numeric_limits<f32>::quiet_NaN();
static constexpr f32 kInf = std::numeric_limits<f32>::infinity();

static std::size_t lit(const RasterBuffer& buffer)
{
    return buffer.left().count_not_equal(colors::kBlack);
}

// =================================================================
// Stars
// =================================================================

TEST_CASE("Star sizes")
{
    RasterBuffer buffer(41, 41);
    Canvas canvas(buffer);

    SUBCASE("faint star is one pixel")
    {
        canvas.draw_star(20.3f, 19.6f, 0.4f, colors::kWhite, buffer.bounds());
        CHECK(lit(buffer) == 1);
        CHECK(buffer.left().pixel(20, 20) == colors::kWhite);
    }

    SUBCASE("size two is a quad")
    {
        canvas.draw_star(20.0f, 20.0f, 2.0f, colors::kWhite, buffer.bounds());
        CHECK(lit(buffer) == 4);
        CHECK(buffer.left().pixel(21, 21) == colors::kWhite);
    }

    SUBCASE("bright star is a filled disk of that diameter")
    {
        canvas.draw_star(20.0f, 20.0f, 10.0f, colors::kWhite, buffer.bounds());
        CHECK(lit(buffer) == 97);
        CHECK(buffer.left().pixel(15, 20) == colors::kWhite);
        CHECK(buffer.left().pixel(14, 20) == colors::kBlack);
    }

    SUBCASE("non-positive or non-finite input draws nothing")
    {
        canvas.draw_star(20.0f, 20.0f, 0.0f, colors::kWhite, buffer.bounds());
        canvas.draw_star(20.0f, 20.0f, kNaN, colors::kWhite, buffer.bounds());
        canvas.draw_star(kNaN, 20.0f, 3.0f, colors::kWhite, buffer.bounds());
        canvas.draw_star(20.0f, kInf, 3.0f, colors::kWhite, buffer.bounds());
        CHECK(lit(buffer) == 0);
    }
}

TEST_CASE("Quad star straddling the clip edge is trimmed")
{
    RasterBuffer buffer(10, 10);
    Canvas canvas(buffer);

    canvas.draw_star(9.0f, 9.0f, 2.0f, colors::kWhite, buffer.bounds());
    CHECK(lit(buffer) == 1);
}

// =================================================================
// Lines and polylines
// =================================================================

TEST_CASE("Line endpoints are rounded to the pixel grid")
{
    RasterBuffer buffer(32, 8);
    Canvas canvas(buffer);

    canvas.draw_line(2.4f, 3.6f, 11.6f, 3.6f, colors::kWhite, raster::StrokeDescriptor::solid(), buffer.bounds());

    CHECK(lit(buffer) == 11);
    CHECK(buffer.left().pixel(2, 4) == colors::kWhite);
    CHECK(buffer.left().pixel(12, 4) == colors::kWhite);
}

TEST_CASE("Polyline breaks at points that did not project")
{
    RasterBuffer buffer(64, 16);
    Canvas canvas(buffer);

    const std::vector<projection::ScreenPoint> points = {
        projection::ScreenPoint::visible(0.0, 5.0),
        projection::ScreenPoint::visible(10.0, 5.0),
        projection::ScreenPoint{},
        projection::ScreenPoint::visible(30.0, 5.0),
        projection::ScreenPoint::visible(40.0, 5.0),
    };

    canvas.draw_polyline(points, colors::kWhite, raster::StrokeDescriptor::solid(), buffer.bounds());

    CHECK(lit(buffer) == 22);
    CHECK(buffer.left().pixel(20, 5) == colors::kBlack);
}

TEST_CASE("Polyline shift moves every vertex")
{
    RasterBuffer buffer(64, 16);
    Canvas canvas(buffer);

    const std::vector<projection::ScreenPoint> points = {
        projection::ScreenPoint::visible(10.0, 8.0),
        projection::ScreenPoint::visible(20.0, 8.0),
    };

    canvas.draw_polyline(points, colors::kWhite, raster::StrokeDescriptor::solid(), buffer.bounds(),
                         raster::DrawEye::Mono, 5.0f);

    CHECK(buffer.left().pixel(14, 8) == colors::kBlack);
    CHECK(buffer.left().pixel(15, 8) == colors::kWhite);
    CHECK(buffer.left().pixel(25, 8) == colors::kWhite);
}

TEST_CASE("Polyline of only invalid points draws nothing")
{
    RasterBuffer buffer(16, 16);
    Canvas canvas(buffer);

    const std::vector<projection::ScreenPoint> points(4);
    canvas.draw_polyline(points, colors::kWhite, raster::StrokeDescriptor::solid(), buffer.bounds());

    CHECK(lit(buffer) == 0);
}

TEST_CASE("Far-away coordinates are clamped instead of overflowing")
{
    RasterBuffer buffer(32, 32);
    Canvas canvas(buffer);

    canvas.draw_line(-1.0e30f, 16.0f, 1.0e30f, 16.0f, colors::kWhite, raster::StrokeDescriptor::solid(),
                     buffer.bounds());

    CHECK(lit(buffer) == 32);
}

// =================================================================
// Rectangles and images
// =================================================================

TEST_CASE("fill_rect is clipped")
{
    RasterBuffer buffer(20, 20);
    Canvas canvas(buffer);

    canvas.fill_rect(15.0f, 15.0f, 10.0f, 10.0f, colors::kWhite, buffer.bounds());
    CHECK(lit(buffer) == 25);

    canvas.clear(colors::kBlack);
    canvas.fill_rect(2.0f, 2.0f, -3.0f, 4.0f, colors::kWhite, buffer.bounds());
    CHECK(lit(buffer) == 0);
}

TEST_CASE("draw_image blends and skips transparent pixels")
{
    RasterBuffer buffer(16, 16, false, colors::kBlue);
    Canvas canvas(buffer);

    raster::Image sprite(2, 2, colors::kTransparent);
    sprite.set_pixel(0, 0, colors::kRed);
    sprite.set_pixel(1, 1, colors::kWhite.with_alpha(0));

    canvas.draw_image(sprite, 4.0f, 5.0f, buffer.bounds());

    CHECK(buffer.left().pixel(4, 5) == colors::kRed);
    CHECK(buffer.left().pixel(5, 6) == colors::kBlue);
    CHECK(buffer.left().count_not_equal(colors::kBlue) == 1);
}

TEST_CASE("draw_image partly off the target")
{
    RasterBuffer buffer(8, 8);
    Canvas canvas(buffer);

    const raster::Image sprite(4, 4, colors::kWhite);
    canvas.draw_image(sprite, -2.0f, 6.0f, buffer.bounds());

    CHECK(lit(buffer) == 4);
    CHECK(buffer.left().pixel(0, 7) == colors::kWhite);
}

// =================================================================
// Stereo
// =================================================================

TEST_CASE("Eye selection writes one plane of a stereo buffer")
{
    RasterBuffer buffer(16, 16, true);
    Canvas canvas(buffer);

    canvas.draw_point(3.0f, 3.0f, colors::kWhite, buffer.bounds(), raster::DrawEye::RightEye);
    canvas.draw_point(8.0f, 8.0f, colors::kWhite, buffer.bounds());

    CHECK(buffer.left().count_not_equal(colors::kBlack) == 1);
    CHECK(buffer.right().count_not_equal(colors::kBlack) == 2);
}
