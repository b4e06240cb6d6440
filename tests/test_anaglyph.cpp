/// @file test_anaglyph.cpp
/// @brief Unit tests for AnaglyphCompositor: depth offsets, per-eye dispatch and composition.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/logger.hpp"
#include "raster/anaglyph_compositor.hpp"
#include "raster/raster_buffer.hpp"

#include <limits>
#include <vector>

using namespace skychart;
using namespace skychart::raster;

int main(int argc, char** argv)
{
    skychart::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    skychart::core::Logger::shutdown();
    return result;
}

// =================================================================
// Helpers
// =================================================================

struct Pass
{
    DrawEye eye;
    f32 dx;
    Color color;
};

static std::vector<Pass> record(const AnaglyphCompositor& compositor, f32 depth, Color color)
{
    std::vector<Pass> passes;
    compositor.draw(depth, color, [&](DrawEye eye, f32 dx, Color c) { passes.push_back(Pass{eye, dx, c}); });
    return passes;
}

// =================================================================
// Configuration
// =================================================================

TEST_CASE("Mode classification")
{
    CHECK(is_two_color(AnaglyphMode::GreenRed));
    CHECK(is_two_color(AnaglyphMode::RedCyan));
    CHECK_FALSE(is_two_color(AnaglyphMode::DuboisRedCyan));

    CHECK_FALSE(needs_stereo_buffer(AnaglyphMode::None));
    CHECK_FALSE(needs_stereo_buffer(AnaglyphMode::RedCyan));
    CHECK(needs_stereo_buffer(AnaglyphMode::DuboisAmberBlue));
    CHECK(needs_stereo_buffer(AnaglyphMode::SideBySide));

    CHECK(to_string(AnaglyphMode::DuboisGreenMagenta) == "DuboisGreenMagenta");
}

TEST_CASE("Eye separation is clamped, and fixed for two-colour modes")
{
    CHECK(AnaglyphCompositor({.mode = AnaglyphMode::DuboisRedCyan, .eye_separation = 10.0f}).eye_separation()
          == doctest::Approx(5.0f));
    CHECK(AnaglyphCompositor({.mode = AnaglyphMode::DuboisRedCyan, .eye_separation = -1.0f}).eye_separation()
          == doctest::Approx(0.0f));
    CHECK(AnaglyphCompositor({.mode = AnaglyphMode::RedCyan, .eye_separation = 3.0f}).eye_separation()
          == doctest::Approx(0.08f));
}

TEST_CASE("Buffers match the mode")
{
    CHECK_FALSE(AnaglyphCompositor({.mode = AnaglyphMode::None}).make_buffer(8, 8).is_stereo());
    CHECK_FALSE(AnaglyphCompositor({.mode = AnaglyphMode::GreenRed}).make_buffer(8, 8).is_stereo());
    CHECK(AnaglyphCompositor({.mode = AnaglyphMode::SideBySide}).make_buffer(8, 8).is_stereo());
}

// =================================================================
// Depth offsets
// =================================================================

TEST_CASE("Offsets are opposite for the two eyes and proportional to depth")
{
    const AnaglyphCompositor compositor({.mode = AnaglyphMode::DuboisRedCyan, .eye_separation = 0.5f});

    // (150 - 100) × 0.5 / 2 = 12.5
    CHECK(compositor.offset_for_depth(200.0f, 150.0f, DrawEye::LeftEye) == doctest::Approx(187.5f));
    CHECK(compositor.offset_for_depth(200.0f, 150.0f, DrawEye::RightEye) == doctest::Approx(212.5f));
    CHECK(compositor.offset_for_depth(200.0f, 100.0f, DrawEye::LeftEye) == doctest::Approx(200.0f));
    CHECK(compositor.offset_for_depth(200.0f, 50.0f, DrawEye::LeftEye) == doctest::Approx(212.5f));
    CHECK(compositor.offset_for_depth(200.0f, 150.0f, DrawEye::Mono) == doctest::Approx(200.0f));
}

TEST_CASE("Depth is clamped to twice the reference")
{
    const AnaglyphCompositor compositor({.mode = AnaglyphMode::SideBySide, .eye_separation = 0.5f});

    CHECK(compositor.offset_for_depth(0.0f, 1000.0f, DrawEye::RightEye) == doctest::Approx(25.0f));
    CHECK(compositor.offset_for_depth(0.0f, -50.0f, DrawEye::RightEye) == doctest::Approx(-25.0f));
}

TEST_CASE("Mirrored optics swap the eyes")
{
    const AnaglyphCompositor plain({.mode = AnaglyphMode::DuboisRedCyan, .eye_separation = 1.0f});
    const AnaglyphCompositor mirrored(
        {.mode = AnaglyphMode::DuboisRedCyan, .eye_separation = 1.0f, .invert_horizontal = true});

    CHECK(mirrored.offset_for_depth(0.0f, 140.0f, DrawEye::LeftEye)
          == doctest::Approx(plain.offset_for_depth(0.0f, 140.0f, DrawEye::RightEye)));
}

TEST_CASE("No offset without stereo")
{
    const AnaglyphCompositor compositor;
    CHECK(compositor.offset_for_depth(42.0f, 180.0f, DrawEye::LeftEye) == doctest::Approx(42.0f));
}

// =================================================================
// Draw dispatch
// =================================================================

TEST_CASE("Screen-plane and mono primitives are drawn once")
{
    const AnaglyphCompositor none;
    const auto mono = record(none, 180.0f, colors::kWhite);
    REQUIRE(mono.size() == 1);
    CHECK(mono[0].eye == DrawEye::Mono);
    CHECK(mono[0].dx == 0.0f);
    CHECK(mono[0].color == colors::kWhite);

    const AnaglyphCompositor stereo({.mode = AnaglyphMode::DuboisRedCyan});
    CHECK(record(stereo, 100.0f, colors::kWhite).size() == 1);
    CHECK(record(stereo, std::numeric_limits<f32>::quiet_NaN(), colors::kWhite).size() == 1);
}

TEST_CASE("Primitives off the screen plane are drawn once per eye")
{
    const AnaglyphCompositor compositor({.mode = AnaglyphMode::DuboisRedCyan, .eye_separation = 0.5f});
    const auto passes = record(compositor, 150.0f, colors::kWhite);

    REQUIRE(passes.size() == 2);
    CHECK(passes[0].eye == DrawEye::LeftEye);
    CHECK(passes[1].eye == DrawEye::RightEye);
    CHECK(passes[0].dx == doctest::Approx(-12.5f));
    CHECK(passes[1].dx == doctest::Approx(12.5f));
    CHECK(passes[0].color == colors::kWhite);
}

TEST_CASE("Two-colour modes tint each eye")
{
    const AnaglyphCompositor red_cyan({.mode = AnaglyphMode::RedCyan});
    const auto passes = record(red_cyan, 20.0f, colors::kWhite);

    REQUIRE(passes.size() == 2);
    CHECK(passes[0].color == Color{.r = 0, .g = 255, .b = 255, .a = 128});
    CHECK(passes[1].color == Color{.r = 255, .g = 0, .b = 0, .a = 128});

    const AnaglyphCompositor green_red({.mode = AnaglyphMode::GreenRed});
    CHECK(green_red.eye_color(colors::kWhite, DrawEye::RightEye) == Color{.r = 0, .g = 239, .b = 0, .a = 128});
    CHECK(green_red.eye_color(colors::kBlue, DrawEye::Mono) == colors::kBlue);
}

// =================================================================
// Composition
// =================================================================

TEST_CASE("Non-stereo modes return the left plane")
{
    const Image left(4, 4, colors::kRed);
    const Image right(4, 4, colors::kBlue);

    CHECK(AnaglyphCompositor::compose(left, right, AnaglyphMode::None) == left);
    CHECK(AnaglyphCompositor::compose(left, right, AnaglyphMode::RedCyan) == left);
}

TEST_CASE("Dubois red-cyan keeps white and black")
{
    const Image white_left(3, 2, colors::kWhite);
    const Image white_right(3, 2, colors::kWhite);
    const Image black_left(3, 2, colors::kBlack);
    const Image black_right(3, 2, colors::kBlack);

    const Image out_white = AnaglyphCompositor::compose(white_left, white_right, AnaglyphMode::DuboisRedCyan);
    const Image out_black = AnaglyphCompositor::compose(black_left, black_right, AnaglyphMode::DuboisRedCyan);

    CHECK(out_white.count_not_equal(colors::kWhite) == 0);
    CHECK(out_black.count_not_equal(colors::kBlack) == 0);
}

TEST_CASE("Dubois red-cyan routes the left eye to red")
{
    const Image left(2, 2, colors::kWhite);
    const Image right(2, 2, colors::kBlack);

    const Color out = AnaglyphCompositor::compose(left, right, AnaglyphMode::DuboisRedCyan).pixel(0, 0);

    CHECK(out.r == 255);
    CHECK(out.g == 0);
    CHECK(out.b == 0);
}

TEST_CASE("Every Dubois output channel stays in range")
{
    const AnaglyphMode modes[] = {
        AnaglyphMode::DuboisRedCyan,
        AnaglyphMode::DuboisGreenMagenta,
        AnaglyphMode::DuboisAmberBlue,
    };
    const Color samples[] = {colors::kRed, colors::kGreen, colors::kBlue, colors::kWhite, colors::kCyan};

    for (const AnaglyphMode mode : modes)
    {
        for (const Color l : samples)
        {
            for (const Color r : samples)
            {
                const Image out = AnaglyphCompositor::compose(Image(1, 1, l), Image(1, 1, r), mode);
                CHECK(out.width() == 1);
                CHECK(out.pixel(0, 0).a == 255);
            }
        }
    }
}

TEST_CASE("Side by side doubles the width")
{
    const Image left(4, 3, colors::kRed);
    const Image right(4, 3, colors::kBlue);

    const Image out = AnaglyphCompositor::compose(left, right, AnaglyphMode::SideBySide);

    CHECK(out.width() == 8);
    CHECK(out.height() == 3);
    CHECK(out.pixel(3, 1) == colors::kRed);
    CHECK(out.pixel(4, 1) == colors::kBlue);
}

TEST_CASE("Half-width side by side averages pixel pairs")
{
    Image left(4, 1, colors::kBlack);
    left.set_pixel(0, 0, colors::kWhite);
    const Image right(4, 1, colors::kBlue);

    const Image out = AnaglyphCompositor::compose(left, right, AnaglyphMode::SideBySideHalfWidth);

    CHECK(out.width() == 4);
    CHECK(out.pixel(0, 0).r == 127);
    CHECK(out.pixel(1, 0) == colors::kBlack);
    CHECK(out.pixel(2, 0) == colors::kBlue);
}

TEST_CASE("Missing or mismatched right plane falls back to the left image")
{
    const Image left(4, 4, colors::kRed);
    const Image small(2, 2, colors::kBlue);

    CHECK(AnaglyphCompositor::compose(left, small, AnaglyphMode::DuboisRedCyan) == left);
    CHECK(AnaglyphCompositor::compose(left, left, AnaglyphMode::SideBySide) == left);

    // A mono buffer has no right plane of its own
    const AnaglyphCompositor compositor({.mode = AnaglyphMode::SideBySide});
    const RasterBuffer mono(4, 4, false, colors::kRed);
    CHECK(compositor.compose(mono).width() == 4);
}

TEST_CASE("Full pipeline: draw both eyes, then compose")
{
    const AnaglyphCompositor compositor({.mode = AnaglyphMode::SideBySide, .eye_separation = 1.0f});
    RasterBuffer buffer = compositor.make_buffer(20, 4);

    compositor.draw(110.0f, colors::kWhite, [&](DrawEye eye, f32 dx, Color c)
    {
        buffer.plot(10 + static_cast<i32>(dx), 1, c, eye);
    });

    const Image out = compositor.compose(buffer);
    REQUIRE(out.width() == 40);
    CHECK(out.pixel(5, 1) == colors::kWhite);          // left eye at 10 - 5
    CHECK(out.pixel(20 + 15, 1) == colors::kWhite);    // right eye at 10 + 5
}
