/// @file application.cpp
/// @brief Application implementation: init, main loop, input, chart rendering, shutdown.

#include "core/application.hpp"

#include "astro/time_system.hpp"
#include "rendering/bright_stars.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <string>

namespace skychart::core
{

namespace
{

constexpr std::array kProjectionCycle{
    projection::Projection::Stereographic,
    projection::Projection::Spherical,
    projection::Projection::Cylindrical,
    projection::Projection::CylindricalEquidistant,
    projection::Projection::Polar,
};

constexpr std::array kSystemCycle{
    astro::CoordinateSystem::Horizontal,
    astro::CoordinateSystem::Equatorial,
    astro::CoordinateSystem::Ecliptic,
    astro::CoordinateSystem::Galactic,
};

constexpr std::array kAnaglyphCycle{
    raster::AnaglyphMode::None,
    raster::AnaglyphMode::RedCyan,
    raster::AnaglyphMode::GreenRed,
    raster::AnaglyphMode::DuboisRedCyan,
    raster::AnaglyphMode::DuboisGreenMagenta,
    raster::AnaglyphMode::DuboisAmberBlue,
    raster::AnaglyphMode::SideBySideHalfWidth,
};

template <typename T, std::size_t N>
T next_in(const std::array<T, N>& cycle, T current)
{
    const auto it = std::find(cycle.begin(), cycle.end(), current);
    if (it == cycle.end() || std::next(it) == cycle.end())
    {
        return cycle.front();
    }
    return *std::next(it);
}

} // anonymous namespace

Application::Application(const ViewerConfig& config)
    : m_config(config)
{
    init();
}

Application::~Application()
{
    shutdown();
}

void Application::run()
{
    if (!m_window || !m_window->is_valid())
    {
        SKC_CORE_CRITICAL("Viewer window unavailable, nothing to run");
        return;
    }

    SKC_CORE_INFO("Entering main loop...");
    main_loop();
    SKC_CORE_INFO("Main loop exited");
}

// =================================================================
// Initialization
// =================================================================

void Application::init()
{
    // 1. Window
    m_window = std::make_unique<Window>(m_config.window);

    // 2. Input, wired to the window's event stream
    m_input = std::make_unique<Input>();
    m_window->set_event_callback([this](const SDL_Event& event) {
        m_input->process_event(event);
    });

    // 3. Camera
    m_camera = std::make_unique<rendering::Camera>();

    // 4. Time and sky frame: current system UTC
    m_julian_date = astro::TimeSystem::now_as_jd();
    m_frame = astro::TimeSystem::sky_frame(m_julian_date, m_config.observer);

    // 5. Projection engine sized to the window
    projection::ProjectionState state = m_camera->apply_to(m_config.chart);
    state.width = static_cast<i32>(m_window->get_width());
    state.height = static_cast<i32>(m_window->get_height());
    m_engine = std::make_unique<projection::ProjectionEngine>(state);
    m_engine->set_frame(m_frame);

    // 6. Stereo and chart renderer
    m_stereo = std::make_unique<raster::AnaglyphCompositor>(m_config.stereo);
    m_renderer = std::make_unique<rendering::ChartRenderer>(m_config.style);

    m_last_frame_time = std::chrono::steady_clock::now();

    SKC_CORE_INFO("Observer: ({:.2f}, {:.2f}) deg, JD {:.6f}",
                  glm::degrees(m_config.observer.latitude_rad),
                  glm::degrees(m_config.observer.longitude_rad),
                  m_julian_date);
    SKC_CORE_INFO("Application initialized: {} built-in stars", rendering::builtin_bright_stars().size());
}

// =================================================================
// Shutdown
// =================================================================

void Application::shutdown()
{
    m_renderer.reset();
    m_stereo.reset();
    m_engine.reset();
    m_camera.reset();

    // The callback captures this and references m_input
    if (m_window)
    {
        m_window->set_event_callback(nullptr);
    }
    m_input.reset();
    m_window.reset();
}

// =================================================================
// Main loop
// =================================================================

void Application::main_loop()
{
    while (!m_window->should_close())
    {
        m_input->new_frame();
        m_window->poll_events();

        // Skip drawing when minimized (zero extent)
        if (m_window->get_width() == 0 || m_window->get_height() == 0)
        {
            SDL_Delay(16);
            continue;
        }

        if (m_window->was_resized())
        {
            const bool accepted = m_engine->set_viewport(static_cast<i32>(m_window->get_width()),
                                                         static_cast<i32>(m_window->get_height()));
            if (!accepted)
            {
                SKC_CORE_WARN("Keeping previous chart size after resize");
            }
        }

        const auto now = std::chrono::steady_clock::now();
        const f64 delta_time_sec = std::chrono::duration<f64>(now - m_last_frame_time).count();
        m_last_frame_time = now;

        // Clamp delta to avoid huge jumps (e.g., after a breakpoint)
        const f64 clamped_dt = std::min(delta_time_sec, 0.1);

        process_input();
        update_simulation(clamped_dt);
        draw_frame();

        m_title_timer += clamped_dt;
        if (m_title_timer >= kTitleInterval)
        {
            m_title_timer = 0.0;
            update_title();
        }
    }
}

// =================================================================
// Input processing: translates Input state to camera and chart options
// =================================================================

void Application::process_input()
{
    const auto& state = m_engine->get_state();

    // -----------------------------------------------------------------
    // Mouse drag → camera pan
    //
    // Pixels to radians at the chart centre: fov / width. Equatorial-type
    // charts grow longitude to the left, horizontal charts to the right;
    // inverted optics flip the sense again.
    // -----------------------------------------------------------------
    if (m_input->is_mouse_dragging())
    {
        const auto drag = m_input->get_mouse_drag_delta();
        const f64 sensitivity = m_camera->get_fov_rad() / static_cast<f64>(state.width);

        f64 lon_sign = (state.coordinate_system == astro::CoordinateSystem::Horizontal) ? -1.0 : 1.0;
        f64 lat_sign = 1.0;
        if (state.invert_horizontal)
        {
            lon_sign = -lon_sign;
        }
        if (state.invert_vertical)
        {
            lat_sign = -lat_sign;
        }

        m_camera->pan(lon_sign * static_cast<f64>(drag.x) * sensitivity,
                      lat_sign * static_cast<f64>(drag.y) * sensitivity);
    }

    // -----------------------------------------------------------------
    // Scroll wheel → zoom (scroll up narrows the field)
    // -----------------------------------------------------------------
    const f32 scroll = m_input->get_scroll_delta();
    if (scroll != 0.0f)
    {
        m_camera->zoom(1.0 - static_cast<f64>(scroll) * kZoomStep);
    }

    // -----------------------------------------------------------------
    // Toggles
    // -----------------------------------------------------------------
    if (m_input->is_key_pressed(SDL_SCANCODE_P))
    {
        cycle_projection();
    }

    if (m_input->is_key_pressed(SDL_SCANCODE_C))
    {
        cycle_coordinate_system();
    }

    if (m_input->is_key_pressed(SDL_SCANCODE_A))
    {
        cycle_anaglyph();
    }

    if (m_input->is_key_pressed(SDL_SCANCODE_H))
    {
        m_engine->set_inversion(!state.invert_horizontal, state.invert_vertical);

        // Mirrored optics swap the stereo eyes
        raster::StereoConfig stereo = m_stereo->get_config();
        stereo.invert_horizontal = m_engine->get_state().invert_horizontal;
        m_stereo = std::make_unique<raster::AnaglyphCompositor>(stereo);
        SKC_INFO("Horizontal inversion {}", m_engine->get_state().invert_horizontal ? "on" : "off");
    }

    if (m_input->is_key_pressed(SDL_SCANCODE_V))
    {
        m_engine->set_inversion(state.invert_horizontal, !state.invert_vertical);
        SKC_INFO("Vertical inversion {}", m_engine->get_state().invert_vertical ? "on" : "off");
    }

    if (m_input->is_key_pressed(SDL_SCANCODE_B))
    {
        m_engine->set_draw_sky_below_horizon(!state.draw_sky_below_horizon);
        SKC_INFO("Sky below horizon {}", m_engine->get_state().draw_sky_below_horizon ? "shown" : "hidden");
    }

    if (m_input->is_key_pressed(SDL_SCANCODE_R))
    {
        m_camera->reset();
        SKC_INFO("Camera reset to defaults");
    }

    if (m_input->is_key_pressed(SDL_SCANCODE_ESCAPE))
    {
        m_window->request_close();
    }
}

void Application::cycle_projection()
{
    const auto next = next_in(kProjectionCycle, m_engine->get_state().projection);
    m_engine->set_projection(next);
    SKC_INFO("Projection: {}", projection::to_string(next));
}

void Application::cycle_coordinate_system()
{
    const auto current = m_engine->get_state().coordinate_system;
    const auto next = next_in(kSystemCycle, current);

    // Keep looking at the same patch of sky
    const auto centre = astro::Coordinates::convert(m_camera->get_center(), current, next, m_frame);
    m_camera->set_center(centre.lon, centre.lat);
    m_engine->set_coordinate_system(next);
    SKC_INFO("Coordinate system: {}", astro::to_string(next));
}

void Application::cycle_anaglyph()
{
    raster::StereoConfig stereo = m_stereo->get_config();
    stereo.mode = next_in(kAnaglyphCycle, stereo.mode);
    stereo.invert_horizontal = m_engine->get_state().invert_horizontal;
    m_stereo = std::make_unique<raster::AnaglyphCompositor>(stereo);
    SKC_INFO("Anaglyph mode: {}", raster::to_string(stereo.mode));
}

// =================================================================
// Simulation update: advance time, refresh the sky frame and camera
// =================================================================

void Application::update_simulation(f64 delta_time_sec)
{
    // JD is in days, delta_time in seconds
    m_julian_date += delta_time_sec / 86400.0;
    m_frame = astro::TimeSystem::sky_frame(m_julian_date, m_config.observer);
    m_engine->set_frame(m_frame);

    const auto centre = m_camera->get_center();
    if (!m_engine->set_center(centre.lon, centre.lat) || !m_engine->set_field(m_camera->get_fov_rad()))
    {
        SKC_CORE_WARN("Camera state rejected by the projection engine");
    }
}

// =================================================================
// Frame rendering
// =================================================================

void Application::draw_frame()
{
    const raster::Image image = m_renderer->render(
        *m_engine, *m_stereo, rendering::builtin_bright_stars(), m_camera->get_magnitude_limit());

    if (!m_window->present(image))
    {
        SKC_CORE_WARN("Frame could not be presented");
    }
}

void Application::update_title()
{
    const auto& state = m_engine->get_state();
    std::string title = fmt::format("skychart | {} ({}) | fov {:.1f} deg | {} | {} stars",
                                    projection::to_string(m_engine->effective_projection()),
                                    astro::to_string(state.coordinate_system),
                                    m_camera->get_fov_deg(),
                                    raster::to_string(m_stereo->get_mode()),
                                    m_renderer->get_stats().stars_drawn);

    const auto cursor = m_input->get_mouse_position();
    if (const auto sky = m_engine->invert(cursor.x, cursor.y))
    {
        title += fmt::format(" | cursor {:.2f}, {:.2f} deg",
                             glm::degrees(sky->lon), glm::degrees(sky->lat));
    }

    m_window->set_title(title);
}

} // namespace skychart::core
