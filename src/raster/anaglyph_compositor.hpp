#pragma once

/// @file anaglyph_compositor.hpp
/// @brief Stereo depth offsets, per-eye draw dispatch and anaglyph / side-by-side composition.

#include "core/types.hpp"
#include "raster/color.hpp"
#include "raster/raster_buffer.hpp"

#include <array>
#include <functional>
#include <string_view>

namespace skychart::raster
{
    enum class AnaglyphMode
    {
        None,
        GreenRed,               ///< Two-colour, drawn into one buffer
        RedCyan,                ///< Two-colour, drawn into one buffer
        DuboisRedCyan,
        DuboisGreenMagenta,
        DuboisAmberBlue,
        SideBySide,             ///< Output twice as wide
        SideBySideHalfWidth,    ///< Each eye squeezed to half width
    };

    [[nodiscard]] std::string_view to_string(AnaglyphMode mode);

    /// @brief True for the modes drawn with fixed eye colours into a mono buffer.
    [[nodiscard]] bool is_two_color(AnaglyphMode mode);

    /// @brief True for the modes that need separate left and right planes.
    [[nodiscard]] bool needs_stereo_buffer(AnaglyphMode mode);

    struct StereoConfig
    {
        AnaglyphMode mode = AnaglyphMode::None;
        f32 eye_separation = 0.5f;      ///< Pixels of parallax per unit of depth difference
        f32 reference_depth = 100.0f;   ///< Depth drawn at the screen plane
        bool invert_horizontal = false; ///< Mirrored optics swap the eyes
    };

    /// @brief Owns the stereo decisions for one chart render.
    ///
    /// Callers describe each primitive once with draw(); the compositor invokes
    /// the callback once (screen plane or no stereo) or once per eye with the
    /// matching horizontal offset. compose() merges the planes afterwards.
    class AnaglyphCompositor
    {
    public:
        /// @brief Per-eye draw callback: plane selector, horizontal shift in pixels, colour to use.
        using DrawFn = std::function<void(DrawEye eye, f32 dx, Color color)>;

        static constexpr f32 kMaxEyeSeparation = 5.0f;
        static constexpr f32 kTwoColorParallax = 8.0f;

        explicit AnaglyphCompositor(const StereoConfig& config = {});

        [[nodiscard]] const StereoConfig& get_config() const { return m_config; }
        [[nodiscard]] AnaglyphMode get_mode() const { return m_config.mode; }

        /// @brief Effective separation: clamped to [0, 5], fixed for the two-colour modes.
        [[nodiscard]] f32 eye_separation() const { return m_separation; }

        /// @brief Raster target sized and planed for the current mode.
        [[nodiscard]] RasterBuffer make_buffer(i32 width, i32 height, Color background = colors::kBlack) const;

        /// @brief Horizontal position of base_x for one eye at the given depth.
        [[nodiscard]] f32 offset_for_depth(f32 base_x, f32 depth, DrawEye eye) const;

        /// @brief Colour a primitive takes in one eye (two-colour modes tint it).
        [[nodiscard]] Color eye_color(Color color, DrawEye eye) const;

        /// @brief Invoke fn once per required pass for a primitive at depth.
        void draw(f32 depth, Color color, const DrawFn& fn) const;

        /// @brief Final image for the current mode.
        [[nodiscard]] Image compose(const RasterBuffer& buffer) const;

        /// @brief Merge a left and right plane. Non-stereo modes return a copy of left.
        [[nodiscard]] static Image compose(const Image& left, const Image& right, AnaglyphMode mode);

    private:
        StereoConfig m_config;
        f32 m_separation = 0.0f;
    };

} // namespace skychart::raster
