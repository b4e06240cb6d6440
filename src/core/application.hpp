#pragma once

/// @file application.hpp
/// @brief Interactive chart viewer: lifecycle, main loop, frame rendering.

#include "astro/coordinates.hpp"
#include "core/input.hpp"
#include "core/types.hpp"
#include "core/window.hpp"
#include "projection/projection_engine.hpp"
#include "projection/projection_state.hpp"
#include "raster/anaglyph_compositor.hpp"
#include "rendering/camera.hpp"
#include "rendering/chart_renderer.hpp"

#include <glm/trigonometric.hpp>

#include <chrono>
#include <memory>

namespace skychart::core
{
    /// @brief Everything the viewer starts from. Designated initializers welcome.
    struct ViewerConfig
    {
        WindowConfig window{};

        /// La Palma, Canary Islands (28.76°N, 17.89°W)
        astro::ObserverLocation observer{
            .latitude_rad  = glm::radians(28.76),
            .longitude_rad = glm::radians(-17.89),
        };

        projection::ProjectionState chart{
            .projection = projection::Projection::Stereographic,
            .coordinate_system = astro::CoordinateSystem::Horizontal,
            .draw_sky_below_horizon = false,
        };

        raster::StereoConfig stereo{};
        rendering::ChartStyle style{.draw_reticle = true};
    };

    /// @brief Owns the viewer subsystems and drives the main loop.
    ///
    /// Lifecycle: init() in constructor, run() drives main_loop(), shutdown()
    /// in destructor. Each frame rebuilds the chart in software and presents it.
    class Application
    {
    public:
        explicit Application(const ViewerConfig& config = {});
        ~Application();

        Application(const Application&) = delete;
        Application& operator=(const Application&) = delete;
        Application(Application&&) = delete;
        Application& operator=(Application&&) = delete;

        /// @brief Enter the main loop. Returns when the window is closed.
        void run();

    private:
        void init();
        void main_loop();
        void shutdown();

        void process_input();
        void update_simulation(f64 delta_time_sec);
        void draw_frame();
        void update_title();

        void cycle_projection();
        void cycle_coordinate_system();
        void cycle_anaglyph();

        ViewerConfig m_config;

        // -----------------------------------------------------------------
        // Subsystems (created in init order, destroyed in reverse)
        // -----------------------------------------------------------------
        std::unique_ptr<Window> m_window;
        std::unique_ptr<Input> m_input;
        std::unique_ptr<rendering::Camera> m_camera;
        std::unique_ptr<projection::ProjectionEngine> m_engine;
        std::unique_ptr<raster::AnaglyphCompositor> m_stereo;
        std::unique_ptr<rendering::ChartRenderer> m_renderer;

        // -----------------------------------------------------------------
        // Simulation state
        // -----------------------------------------------------------------
        f64 m_julian_date = 0.0;
        astro::SkyFrame m_frame{};
        std::chrono::steady_clock::time_point m_last_frame_time;
        f64 m_title_timer = 0.0;

        static constexpr f64 kZoomStep = 0.1;           ///< FOV change per wheel click
        static constexpr f64 kTitleInterval = 0.25;     ///< Seconds between title refreshes
    };

} // namespace skychart::core
