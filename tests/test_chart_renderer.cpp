/// @file test_chart_renderer.cpp
/// @brief Unit tests for star sizing, star colours, stereo depth and full chart renders.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/logger.hpp"
#include "rendering/bright_stars.hpp"
#include "rendering/chart_renderer.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace skychart;
using namespace skychart::rendering;
namespace colors = raster::colors;

int main(int argc, char** argv)
{
    skychart::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    skychart::core::Logger::shutdown();
    return result;
}

// =================================================================
// Star appearance
// =================================================================

TEST_CASE("Star size scales linearly from the limit to the brightest stars")
{
    const ChartRenderer renderer;
    const f32 max_size = renderer.get_style().max_star_size;

    CHECK(renderer.star_size(6.0f, 6.0f) == doctest::Approx(1.0f));
    CHECK(renderer.star_size(-1.5f, 6.0f) == doctest::Approx(max_size));
    CHECK(renderer.star_size(-4.0f, 6.0f) == doctest::Approx(max_size));
    CHECK(renderer.star_size(6.1f, 6.0f) == 0.0f);

    const f32 mid = renderer.star_size(2.25f, 6.0f);
    CHECK(mid == doctest::Approx(1.0f + 0.5f * (max_size - 1.0f)));
}

TEST_CASE("Stereo depth follows the distance modulus")
{
    CHECK(stereo_depth(100.0) == doctest::Approx(100.0f));
    CHECK(stereo_depth(10.0) == doctest::Approx(50.0f));
    CHECK(stereo_depth(1.0) == doctest::Approx(0.0f));
    CHECK(stereo_depth(0.5) == doctest::Approx(0.0f));
    CHECK(stereo_depth(1.0e5) == doctest::Approx(200.0f));

    SUBCASE("unknown distances sit on the screen plane")
    {
        CHECK(stereo_depth(0.0) == doctest::Approx(100.0f));
        CHECK(stereo_depth(-3.0) == doctest::Approx(100.0f));
        CHECK(stereo_depth(std::numeric_limits<f64>::quiet_NaN()) == doctest::Approx(100.0f));
    }
}

TEST_CASE("Blackbody colours run from red to blue")
{
    const raster::Color cool = blackbody_color(effective_temperature(SpectralClass::M));
    const raster::Color hot = blackbody_color(effective_temperature(SpectralClass::O));

    CHECK(cool.r == 255);
    CHECK(cool.r > cool.g);
    CHECK(cool.g > cool.b);
    CHECK(hot.b == 255);
    CHECK(hot.b > hot.r);
    CHECK(cool.a == 255);

    CHECK(effective_temperature(SpectralClass::G) < effective_temperature(SpectralClass::F));
}

TEST_CASE("Built-in star list is usable")
{
    const auto stars = builtin_bright_stars();
    REQUIRE(stars.size() >= 20);

    for (const BrightStar& star : stars)
    {
        CAPTURE(star.name);
        CHECK_FALSE(star.name.empty());
        CHECK(star.ra_rad >= 0.0);
        CHECK(star.ra_rad < astro_constants::kTwoPi);
        CHECK(std::abs(star.dec_rad) <= astro_constants::kHalfPi);
        CHECK(std::isfinite(star.v_magnitude));
    }
}

// =================================================================
// Rendering
// =================================================================

static const std::vector<BrightStar> kTestStars = {
    {.name = "centre", .ra_rad = 0.0, .dec_rad = 0.0, .distance_pc = 10.0, .v_magnitude = 0.0f,
     .spectral_class = SpectralClass::A},
    {.name = "faint", .ra_rad = 0.1, .dec_rad = 0.1, .distance_pc = 10.0, .v_magnitude = 10.0f,
     .spectral_class = SpectralClass::K},
    {.name = "behind", .ra_rad = astro_constants::kPi, .dec_rad = 0.0, .distance_pc = 10.0, .v_magnitude = 1.0f,
     .spectral_class = SpectralClass::G},
};

static projection::ProjectionEngine make_engine()
{
    return projection::ProjectionEngine(projection::ProjectionState{
        .projection = projection::Projection::Stereographic,
        .coordinate_system = astro::CoordinateSystem::Equatorial,
        .field = astro_constants::kHalfPi,
        .width = 200,
        .height = 100,
    });
}

TEST_CASE("Mono render draws the grid and the visible stars")
{
    const auto engine = make_engine();
    const raster::AnaglyphCompositor mono;
    ChartRenderer renderer;

    const raster::Image image = renderer.render(engine, mono, kTestStars, 6.0f);

    REQUIRE(image.width() == 200);
    REQUIRE(image.height() == 100);

    const ChartStats& stats = renderer.get_stats();
    CHECK(stats.stars_drawn == 1);
    CHECK(stats.stars_hidden == 2);
    CHECK(stats.grid_lines == 24 + 11);

    CHECK(image.pixel(100, 50) == blackbody_color(effective_temperature(SpectralClass::A)));
    CHECK(image.count_not_equal(colors::kBlack) > 200);
}

TEST_CASE("Disabled layers leave the background")
{
    const auto engine = make_engine();
    const raster::AnaglyphCompositor mono;

    ChartStyle style;
    style.draw_grid = false;
    style.draw_stars = false;
    style.background = colors::kBlue;
    ChartRenderer renderer(style);

    const raster::Image image = renderer.render(engine, mono, kTestStars, 6.0f);

    CHECK(image.count_not_equal(colors::kBlue) == 0);
    CHECK(renderer.get_stats().grid_lines == 0);
}

TEST_CASE("Side-by-side render shifts a near star in opposite directions")
{
    const auto engine = make_engine();
    const raster::AnaglyphCompositor stereo({.mode = raster::AnaglyphMode::SideBySide, .eye_separation = 1.0f});

    ChartStyle style;
    style.draw_grid = false;
    ChartRenderer renderer(style);

    const raster::Image image = renderer.render(engine, stereo, kTestStars, 6.0f);
    REQUIRE(image.width() == 400);

    // Depth 50: each eye moves 25 px from the centre column
    const raster::Color star = blackbody_color(effective_temperature(SpectralClass::A));
    CHECK(image.pixel(125, 50) == star);
    CHECK(image.pixel(200 + 75, 50) == star);
    CHECK(image.pixel(100, 50) == colors::kBlack);
}

TEST_CASE("Reticle is drawn around the chart centre")
{
    const auto engine = make_engine();
    const raster::AnaglyphCompositor mono;

    ChartStyle style;
    style.draw_grid = false;
    style.draw_stars = false;
    style.draw_reticle = true;
    style.reticle_deg = 10.0;
    ChartRenderer renderer(style);

    const raster::Image image = renderer.render(engine, mono, kTestStars, 6.0f);

    CHECK(image.count_not_equal(colors::kBlack) > 0);
    CHECK(image.pixel(100, 50) == colors::kBlack);
    CHECK(image.pixel(0, 0) == colors::kBlack);
}
