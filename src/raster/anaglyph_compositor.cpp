/// @file anaglyph_compositor.cpp
/// @brief Depth offsets and the Dubois least-squares colour matrices.

#include "raster/anaglyph_compositor.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <cmath>

namespace skychart::raster
{

namespace
{

using Matrix = std::array<f32, 9>;

/// Column-major 3×3 (out channel c = m[c]·r + m[c+3]·g + m[c+6]·b).
struct DuboisPair
{
    Matrix left;
    Matrix right;
};

// Eric Dubois, "A projection method to generate anaglyph stereo images" (2001)
constexpr DuboisPair kRedCyan{
    .left  = {0.437f, -0.062f, -0.048f, 0.449f, -0.062f, -0.050f, 0.164f, -0.024f, -0.017f},
    .right = {-0.011f, 0.377f, -0.026f, -0.032f, 0.761f, -0.093f, -0.007f, 0.009f, 1.234f},
};

constexpr DuboisPair kGreenMagenta{
    .left  = {-0.062f, 0.284f, -0.015f, -0.158f, 0.668f, -0.027f, -0.039f, 0.143f, 0.021f},
    .right = {0.529f, -0.016f, 0.009f, 0.705f, -0.015f, 0.075f, 0.024f, -0.065f, 0.937f},
};

constexpr DuboisPair kAmberBlue{
    .left  = {1.062f, -0.026f, -0.038f, -0.205f, 0.908f, -0.173f, 0.299f, 0.068f, 0.022f},
    .right = {-0.016f, 0.006f, 0.094f, -0.123f, 0.062f, 0.185f, -0.017f, -0.017f, 0.911f},
};

constexpr Color kGreenRedLeft{.r = 255, .g = 0, .b = 0, .a = 128};
constexpr Color kGreenRedRight{.r = 0, .g = 239, .b = 0, .a = 128};
constexpr Color kRedCyanLeft{.r = 0, .g = 255, .b = 255, .a = 128};
constexpr Color kRedCyanRight{.r = 255, .g = 0, .b = 0, .a = 128};

f32 clamp_channel(f32 v)
{
    return std::clamp(v, 0.0f, 255.0f);
}

f32 apply_row(const Matrix& m, i32 channel, Color c)
{
    return clamp_channel(m[channel] * c.r + m[channel + 3] * c.g + m[channel + 6] * c.b);
}

Image dubois(const Image& left, const Image& right, const DuboisPair& pair)
{
    Image out(left.width(), left.height());
    const auto lp = left.pixels();
    const auto rp = right.pixels();
    auto op = out.pixels();

    for (std::size_t i = 0; i < op.size(); ++i)
    {
        const Color l = Color::from_argb(lp[i]);
        const Color r = Color::from_argb(rp[i]);
        std::array<u8, 3> rgb{};
        for (i32 c = 0; c < 3; ++c)
        {
            const f32 sum = apply_row(pair.left, c, l) + apply_row(pair.right, c, r);
            rgb[c] = static_cast<u8>(std::clamp(static_cast<i32>(sum + 0.5f), 0, 255));
        }
        op[i] = Color{.r = rgb[0], .g = rgb[1], .b = rgb[2], .a = 255}.to_argb();
    }
    return out;
}

Image side_by_side(const Image& left, const Image& right)
{
    const i32 w = left.width();
    Image out(w * 2, left.height());
    for (i32 y = 0; y < left.height(); ++y)
    {
        for (i32 x = 0; x < w; ++x)
        {
            out.set_pixel(x, y, left.pixel(x, y));
            out.set_pixel(x + w, y, right.pixel(x, y));
        }
    }
    return out;
}

Color average(Color a, Color b)
{
    return Color{
        .r = static_cast<u8>((a.r + b.r) / 2),
        .g = static_cast<u8>((a.g + b.g) / 2),
        .b = static_cast<u8>((a.b + b.b) / 2),
        .a = static_cast<u8>((a.a + b.a) / 2),
    };
}

Image side_by_side_half(const Image& left, const Image& right)
{
    const i32 w = left.width();
    const i32 half = w / 2;
    Image out(w, left.height());
    for (i32 y = 0; y < left.height(); ++y)
    {
        for (i32 x = 0; x < half; ++x)
        {
            out.set_pixel(x, y, average(left.pixel(2 * x, y), left.pixel(2 * x + 1, y)));
            out.set_pixel(x + half, y, average(right.pixel(2 * x, y), right.pixel(2 * x + 1, y)));
        }
    }
    return out;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Mode helpers
// -----------------------------------------------------------------

std::string_view to_string(AnaglyphMode mode)
{
    switch (mode)
    {
        case AnaglyphMode::None:                return "None";
        case AnaglyphMode::GreenRed:            return "GreenRed";
        case AnaglyphMode::RedCyan:             return "RedCyan";
        case AnaglyphMode::DuboisRedCyan:       return "DuboisRedCyan";
        case AnaglyphMode::DuboisGreenMagenta:  return "DuboisGreenMagenta";
        case AnaglyphMode::DuboisAmberBlue:     return "DuboisAmberBlue";
        case AnaglyphMode::SideBySide:          return "SideBySide";
        case AnaglyphMode::SideBySideHalfWidth: return "SideBySideHalfWidth";
    }
    return "Unknown";
}

bool is_two_color(AnaglyphMode mode)
{
    return mode == AnaglyphMode::GreenRed || mode == AnaglyphMode::RedCyan;
}

bool needs_stereo_buffer(AnaglyphMode mode)
{
    return mode != AnaglyphMode::None && !is_two_color(mode);
}

// -----------------------------------------------------------------
// AnaglyphCompositor
// -----------------------------------------------------------------

AnaglyphCompositor::AnaglyphCompositor(const StereoConfig& config)
    : m_config(config)
{
    if (!(m_config.reference_depth > 0.0f) || !std::isfinite(m_config.reference_depth))
    {
        SKC_CORE_WARN("Stereo reference depth {} rejected, using 100", m_config.reference_depth);
        m_config.reference_depth = 100.0f;
    }

    if (is_two_color(m_config.mode))
    {
        m_separation = kTwoColorParallax / m_config.reference_depth;
    }
    else if (std::isfinite(m_config.eye_separation))
    {
        m_separation = std::clamp(m_config.eye_separation, 0.0f, kMaxEyeSeparation);
    }
    else
    {
        m_separation = StereoConfig{}.eye_separation;
    }
}

RasterBuffer AnaglyphCompositor::make_buffer(i32 width, i32 height, Color background) const
{
    return RasterBuffer(width, height, needs_stereo_buffer(m_config.mode), background);
}

f32 AnaglyphCompositor::offset_for_depth(f32 base_x, f32 depth, DrawEye eye) const
{
    if (m_config.mode == AnaglyphMode::None || eye == DrawEye::Mono || !std::isfinite(depth))
    {
        return base_x;
    }

    const f32 ref = m_config.reference_depth;
    const f32 dx = (std::clamp(depth, 0.0f, 2.0f * ref) - ref) * m_separation * 0.5f;

    bool left = eye == DrawEye::LeftEye;
    if (m_config.invert_horizontal)
    {
        left = !left;
    }
    return left ? base_x - dx : base_x + dx;
}

Color AnaglyphCompositor::eye_color(Color color, DrawEye eye) const
{
    if (!is_two_color(m_config.mode) || eye == DrawEye::Mono)
    {
        return color;
    }

    const bool green_red = m_config.mode == AnaglyphMode::GreenRed;
    if (eye == DrawEye::LeftEye)
    {
        return green_red ? kGreenRedLeft : kRedCyanLeft;
    }
    return green_red ? kGreenRedRight : kRedCyanRight;
}

void AnaglyphCompositor::draw(f32 depth, Color color, const DrawFn& fn) const
{
    if (m_config.mode == AnaglyphMode::None || depth == m_config.reference_depth || !std::isfinite(depth))
    {
        fn(DrawEye::Mono, 0.0f, color);
        return;
    }

    const f32 left_dx = offset_for_depth(0.0f, depth, DrawEye::LeftEye);
    const f32 right_dx = offset_for_depth(0.0f, depth, DrawEye::RightEye);

    fn(DrawEye::LeftEye, left_dx, eye_color(color, DrawEye::LeftEye));
    fn(DrawEye::RightEye, right_dx, eye_color(color, DrawEye::RightEye));
}

Image AnaglyphCompositor::compose(const RasterBuffer& buffer) const
{
    return compose(buffer.left(), buffer.right(), m_config.mode);
}

Image AnaglyphCompositor::compose(const Image& left, const Image& right, AnaglyphMode mode)
{
    if (!needs_stereo_buffer(mode))
    {
        return left;
    }

    if (&left == &right || right.width() != left.width() || right.height() != left.height())
    {
        SKC_CORE_WARN("Anaglyph mode {} needs a matching right plane, returning the left image",
                      to_string(mode));
        return left;
    }

    switch (mode)
    {
        case AnaglyphMode::DuboisRedCyan:       return dubois(left, right, kRedCyan);
        case AnaglyphMode::DuboisGreenMagenta:  return dubois(left, right, kGreenMagenta);
        case AnaglyphMode::DuboisAmberBlue:     return dubois(left, right, kAmberBlue);
        case AnaglyphMode::SideBySide:          return side_by_side(left, right);
        case AnaglyphMode::SideBySideHalfWidth: return side_by_side_half(left, right);
        default:                                return left;
    }
}

} // namespace skychart::raster
